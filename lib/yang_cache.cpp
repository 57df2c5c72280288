/*
 * 
 *   Copyright 2016 RIFT.IO Inc
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 *
 */



/*!
 * @file yang_cache.cpp
 *
 * Schema cache files.  The blob is a yangc.CachedSchema protobuf-c
 * message, see yang_cache.proto.
 */

#include <stdio.h>
#include <algorithm>
#include <deque>
#include <fstream>
#include <iterator>
#include <memory>
#include <set>
#include <sstream>
#include <utility>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/scope_exit.hpp>
#include <boost/uuid/detail/sha1.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "yang_cache.hpp"
#include "yang_cache.pb-c.h"
#include "yangc_config.h"

using namespace yangc;

namespace fs = boost::filesystem;

namespace {

const unsigned YANGC_CACHE_MAX_TYPE_DEPTH = 32;

/*!
 * Storage of the protobuf-c structures of one encode.  The messages
 * point into each other and into the strings kept here, so the pools
 * never move their elements.
 */
template <typename T>
struct MessagePool
{
  std::deque<T> items;
  std::deque<std::vector<T*>> arrays;

  T* add(const T& item)
  {
    items.push_back(item);
    return &items.back();
  }

  T** array(std::vector<T*>&& elements)
  {
    arrays.push_back(std::move(elements));
    return arrays.back().data();
  }
};

class CacheEncoder
{
 public:
  CacheEncoder()
  : ok_(true)
  {}

  // Cannot copy
  CacheEncoder(const CacheEncoder&) = delete;
  CacheEncoder& operator=(const CacheEncoder&) = delete;

 public:
  Yangc__CachedSchema* encode(const CompiledSchema& schema, const std::string& digest);
  bool ok() const { return ok_; }

 private:
  char* str(const std::string& value)
  {
    strings_.push_back(value);
    return const_cast<char*>(strings_.back().c_str());
  }

  char** str_array(const std::vector<std::string>& values, size_t* count);
  Yangc__CachedIdentifier* identifier(const Identifier& id);
  Yangc__CachedIdentifier** identifier_array(const std::vector<Identifier>& ids);
  Yangc__CachedType* type(const YangType& type);
  Yangc__CachedPath* path(const YangPath& path);
  Yangc__CachedNode* node(const CompactNode& node);

 private:
  bool ok_;
  std::deque<std::string> strings_;
  std::deque<std::vector<char*>> string_arrays_;
  std::deque<std::vector<uint32_t>> index_arrays_;
  MessagePool<Yangc__CachedIdentifier> identifiers_;
  MessagePool<Yangc__CachedEnum> enums_;
  MessagePool<Yangc__CachedBit> bits_;
  MessagePool<Yangc__CachedType> types_;
  MessagePool<Yangc__CachedPath> paths_;
  MessagePool<Yangc__CachedNode> nodes_;
  MessagePool<Yangc__CachedAnnotation> annotations_;
  MessagePool<Yangc__CachedSubmodule> submodules_;
  MessagePool<Yangc__CachedModule> modules_;
  MessagePool<Yangc__CachedSchema> schemas_;
};

char** CacheEncoder::str_array(const std::vector<std::string>& values, size_t* count)
{
  std::vector<char*> array;
  for (const std::string& value : values) {
    array.push_back(str(value));
  }
  *count = array.size();
  string_arrays_.push_back(std::move(array));
  return string_arrays_.back().data();
}

Yangc__CachedIdentifier* CacheEncoder::identifier(const Identifier& id)
{
  Yangc__CachedIdentifier msg = YANGC__CACHED_IDENTIFIER__INIT;
  msg.kind = static_cast<uint32_t>(id.module_ref().kind());
  if (id.is_explicit()) {
    msg.module = str(id.module());
  }
  msg.name = str(id.name());
  return identifiers_.add(msg);
}

Yangc__CachedIdentifier** CacheEncoder::identifier_array(const std::vector<Identifier>& ids)
{
  std::vector<Yangc__CachedIdentifier*> array;
  for (const Identifier& id : ids) {
    array.push_back(identifier(id));
  }
  return identifiers_.array(std::move(array));
}

Yangc__CachedType* CacheEncoder::type(const YangType& type)
{
  Yangc__CachedType msg = YANGC__CACHED_TYPE__INIT;
  msg.kind = static_cast<uint32_t>(type.kind());

  switch (type.kind()) {
    case yang_type_kind_t::PRIMITIVE: {
      const PrimitiveType& primitive = static_cast<const PrimitiveType&>(type);
      const YangTypeRestrictions& restrictions = primitive.restrictions();
      msg.has_primitive = 1;
      msg.primitive = static_cast<uint32_t>(primitive.primitive());
      if (!restrictions.range.empty()) {
        msg.range = str(restrictions.range);
      }
      if (!restrictions.length.empty()) {
        msg.length = str(restrictions.length);
      }
      if (restrictions.fraction_digits) {
        msg.has_fraction_digits = 1;
        msg.fraction_digits = restrictions.fraction_digits;
      }
      msg.patterns = str_array(restrictions.patterns, &msg.n_patterns);
      break;
    }

    case yang_type_kind_t::UNION: {
      std::vector<Yangc__CachedType*> members;
      for (const YangType::ptr_t& member : static_cast<const UnionType&>(type).members()) {
        members.push_back(this->type(*member));
      }
      msg.n_members = members.size();
      msg.members = types_.array(std::move(members));
      break;
    }

    case yang_type_kind_t::ENUMERATION: {
      std::vector<Yangc__CachedEnum*> enums;
      for (const EnumMember& member : static_cast<const EnumerationType&>(type).members()) {
        Yangc__CachedEnum e = YANGC__CACHED_ENUM__INIT;
        e.name = str(member.name);
        e.value = member.value;
        enums.push_back(enums_.add(e));
      }
      msg.n_enums = enums.size();
      msg.enums = enums_.array(std::move(enums));
      break;
    }

    case yang_type_kind_t::BITS: {
      std::vector<Yangc__CachedBit*> bits;
      for (const BitMember& member : static_cast<const BitsType&>(type).members()) {
        Yangc__CachedBit b = YANGC__CACHED_BIT__INIT;
        b.name = str(member.name);
        b.position = member.position;
        bits.push_back(bits_.add(b));
      }
      msg.n_bits = bits.size();
      msg.bits = bits_.array(std::move(bits));
      break;
    }

    case yang_type_kind_t::IDENTITYREF: {
      const IdentityRefType& ref = static_cast<const IdentityRefType&>(type);
      std::vector<Identifier> values(ref.values().begin(), ref.values().end());
      msg.n_bases = ref.bases().size();
      msg.bases = identifier_array(ref.bases());
      msg.n_values = values.size();
      msg.values = identifier_array(values);
      break;
    }

    default:
      // Placeholders never reach a compiled schema.
      ok_ = false;
      break;
  }

  return types_.add(msg);
}

Yangc__CachedPath* CacheEncoder::path(const YangPath& path)
{
  Yangc__CachedPath msg = YANGC__CACHED_PATH__INIT;
  msg.absolute = path.is_absolute();
  msg.n_parts = path.size();
  msg.parts = identifier_array(path.parts());
  return paths_.add(msg);
}

Yangc__CachedNode* CacheEncoder::node(const CompactNode& node)
{
  Yangc__CachedNode msg = YANGC__CACHED_NODE__INIT;
  msg.name = identifier(node.name);
  msg.flags = node.flags;
  msg.parent = node.parent;

  index_arrays_.push_back(node.children);
  msg.n_children = index_arrays_.back().size();
  msg.children = index_arrays_.back().data();

  if (node.type) {
    msg.type = type(*node.type);
  }
  if (node.units) {
    msg.units = str(*node.units);
  }
  if (node.ns) {
    msg.ns = str(*node.ns);
  }
  if (node.default_value) {
    msg.default_value = str(*node.default_value);
  }
  msg.keys = str_array(node.keys, &msg.n_keys);
  if (!node.target_path.empty()) {
    msg.target_path = path(node.target_path);
  }
  msg.n_identity_bases = node.identity_bases.size();
  msg.identity_bases = identifier_array(node.identity_bases);
  if (!node.argument.empty()) {
    msg.argument = str(node.argument);
  }
  return nodes_.add(msg);
}

Yangc__CachedSchema* CacheEncoder::encode(const CompiledSchema& schema, const std::string& digest)
{
  Yangc__CachedSchema msg = YANGC__CACHED_SCHEMA__INIT;
  msg.version = YANGC_CACHE_FORMAT_VERSION;
  msg.digest = str(digest);

  std::vector<Yangc__CachedModule*> modules;
  for (const ModuleIdentity& identity : schema.modules()) {
    Yangc__CachedModule module = YANGC__CACHED_MODULE__INIT;
    module.name = str(identity.name);
    module.revision = str(identity.revision);

    std::vector<Yangc__CachedSubmodule*> submodules;
    for (const auto& entry : identity.submodules) {
      Yangc__CachedSubmodule submodule = YANGC__CACHED_SUBMODULE__INIT;
      submodule.name = str(entry.first);
      submodule.revision = str(entry.second);
      submodules.push_back(submodules_.add(submodule));
    }
    module.n_submodules = submodules.size();
    module.submodules = submodules_.array(std::move(submodules));
    modules.push_back(modules_.add(module));
  }
  msg.n_modules = modules.size();
  msg.modules = modules_.array(std::move(modules));

  std::vector<Yangc__CachedNode*> nodes;
  for (schema_index_t i = 0; i < schema.size(); ++i) {
    nodes.push_back(node(schema.node(i)));
  }
  msg.n_nodes = nodes.size();
  msg.nodes = nodes_.array(std::move(nodes));

  std::vector<Yangc__CachedAnnotation*> annotations;
  for (const MetadataAnnotation& metadata : schema.metadata()) {
    Yangc__CachedAnnotation annotation = YANGC__CACHED_ANNOTATION__INIT;
    annotation.name = identifier(metadata.name);
    if (!metadata.type) {
      ok_ = false;
      break;
    }
    annotation.type = type(*metadata.type);
    if (metadata.units) {
      annotation.units = str(*metadata.units);
    }
    annotation.builtin = metadata.builtin;
    annotations.push_back(annotations_.add(annotation));
  }
  msg.n_metadata = annotations.size();
  msg.metadata = annotations_.array(std::move(annotations));

  return schemas_.add(msg);
}


/*****************************************************************************/
// Decoding

bool decode_identifier(const Yangc__CachedIdentifier* msg, Identifier* id)
{
  if (!msg || !msg->name) {
    return false;
  }
  switch (static_cast<module_kind_t>(msg->kind)) {
    case module_kind_t::BUILTIN:
      *id = Identifier::builtin(msg->name);
      return true;
    case module_kind_t::LAZY_BOUND:
      *id = Identifier::lazy_bound(msg->name);
      return true;
    case module_kind_t::EXPLICIT:
      if (!msg->module) {
        return false;
      }
      *id = Identifier(msg->module, msg->name);
      return true;
  }
  return false;
}

bool decode_identifiers(size_t count,
                        Yangc__CachedIdentifier* const* msgs,
                        std::vector<Identifier>* ids)
{
  for (size_t i = 0; i < count; ++i) {
    Identifier id;
    if (!decode_identifier(msgs[i], &id)) {
      return false;
    }
    ids->push_back(id);
  }
  return true;
}

std::vector<std::string> decode_strings(size_t count, char* const* values)
{
  std::vector<std::string> strings;
  for (size_t i = 0; i < count; ++i) {
    strings.push_back(values[i] ? values[i] : "");
  }
  return strings;
}

YangType::ptr_t decode_type(const Yangc__CachedType* msg, unsigned depth)
{
  if (!msg || depth > YANGC_CACHE_MAX_TYPE_DEPTH) {
    return YangType::ptr_t();
  }

  switch (static_cast<yang_type_kind_t>(msg->kind)) {
    case yang_type_kind_t::PRIMITIVE: {
      if (!msg->has_primitive
          || msg->primitive > static_cast<uint32_t>(yang_primitive_t::INSTANCE_IDENTIFIER)) {
        return YangType::ptr_t();
      }
      std::unique_ptr<PrimitiveType> type(
          new PrimitiveType(static_cast<yang_primitive_t>(msg->primitive)));
      YangTypeRestrictions& restrictions = type->restrictions();
      if (msg->range) {
        restrictions.range = msg->range;
      }
      if (msg->length) {
        restrictions.length = msg->length;
      }
      if (msg->has_fraction_digits) {
        restrictions.fraction_digits = msg->fraction_digits;
      }
      restrictions.patterns = decode_strings(msg->n_patterns, msg->patterns);
      return YangType::ptr_t(type.release());
    }

    case yang_type_kind_t::UNION: {
      std::unique_ptr<UnionType> type(new UnionType());
      for (size_t i = 0; i < msg->n_members; ++i) {
        YangType::ptr_t member = decode_type(msg->members[i], depth + 1);
        if (!member) {
          return YangType::ptr_t();
        }
        type->append(std::move(member));
      }
      return YangType::ptr_t(type.release());
    }

    case yang_type_kind_t::ENUMERATION: {
      std::unique_ptr<EnumerationType> type(new EnumerationType());
      for (size_t i = 0; i < msg->n_enums; ++i) {
        if (!msg->enums[i] || !msg->enums[i]->name) {
          return YangType::ptr_t();
        }
        type->add_enum(msg->enums[i]->name);
        type->set_last_value(msg->enums[i]->value);
      }
      return YangType::ptr_t(type.release());
    }

    case yang_type_kind_t::BITS: {
      std::unique_ptr<BitsType> type(new BitsType());
      for (size_t i = 0; i < msg->n_bits; ++i) {
        if (!msg->bits[i] || !msg->bits[i]->name) {
          return YangType::ptr_t();
        }
        type->add_bit(msg->bits[i]->name);
        type->set_last_position(msg->bits[i]->position);
      }
      return YangType::ptr_t(type.release());
    }

    case yang_type_kind_t::IDENTITYREF: {
      std::unique_ptr<IdentityRefType> type(new IdentityRefType());
      std::vector<Identifier> bases;
      std::vector<Identifier> values;
      if (!decode_identifiers(msg->n_bases, msg->bases, &bases)
          || !decode_identifiers(msg->n_values, msg->values, &values)) {
        return YangType::ptr_t();
      }
      for (const Identifier& base : bases) {
        type->add_base(base);
      }
      type->set_values(std::set<Identifier>(values.begin(), values.end()));
      return YangType::ptr_t(type.release());
    }

    default:
      break;
  }
  return YangType::ptr_t();
}

}


/*****************************************************************************/
// SchemaCache

SchemaCache::SchemaCache(const std::string& cache_dir,
                         yangc_trace_ctx_t* trace)
: cache_dir_(cache_dir),
  trace_(trace)
{
}

std::string SchemaCache::compute_digest(const module_set_t& modules)
{
  module_set_t sorted(modules);
  std::sort(sorted.begin(), sorted.end(),
            [](const ModuleIdentity& a, const ModuleIdentity& b) {
              return a.name < b.name;
            });

  std::ostringstream text;
  text << "yangc-cache-v" << YANGC_CACHE_FORMAT_VERSION << ";";
  for (const ModuleIdentity& module : sorted) {
    text << "mod:" << module.name << ";rev:" << module.revision << ";";
    for (const auto& submodule : module.submodules) {
      text << " smod:" << submodule.first << ";srev:" << submodule.second << ";";
    }
  }

  std::string data = text.str();
  boost::uuids::detail::sha1 sha;
  sha.process_bytes(data.data(), data.size());
  unsigned int digest[5];
  sha.get_digest(digest);

  char hex[41];
  for (unsigned i = 0; i < 5; ++i) {
    snprintf(hex + i * 8, 9, "%08x", digest[i]);
  }
  return std::string(hex, 40);
}

std::string SchemaCache::file_path(const std::string& digest) const
{
  return (fs::path(cache_dir_) / ("model_" + digest + ".bin")).string();
}

yangc_status_t SchemaCache::encode(const CompiledSchema& schema,
                                   const std::string& digest,
                                   std::string* blob)
{
  CacheEncoder encoder;
  Yangc__CachedSchema* msg = encoder.encode(schema, digest);
  if (!encoder.ok()) {
    return YANGC_STATUS_FAILURE;
  }

  size_t size = yangc__cached_schema__get_packed_size(msg);
  std::vector<uint8_t> buffer(size);
  size_t packed = yangc__cached_schema__pack(msg, buffer.data());
  if (packed != size) {
    return YANGC_STATUS_FAILURE;
  }
  blob->assign(reinterpret_cast<const char*>(buffer.data()), size);
  return YANGC_STATUS_SUCCESS;
}

yangc_status_t SchemaCache::decode(const std::string& blob,
                                   const std::string& digest,
                                   CompiledSchema::ptr_t* schema)
{
  Yangc__CachedSchema* msg = yangc__cached_schema__unpack(
      nullptr, blob.size(), reinterpret_cast<const uint8_t*>(blob.data()));
  if (!msg) {
    return YANGC_STATUS_FAILURE;
  }
  BOOST_SCOPE_EXIT(msg) {
    yangc__cached_schema__free_unpacked(msg, nullptr);
  } BOOST_SCOPE_EXIT_END

  if (msg->version != YANGC_CACHE_FORMAT_VERSION || !msg->digest || digest != msg->digest) {
    return YANGC_STATUS_FAILURE;
  }

  CompiledSchema::ptr_t result(new CompiledSchema());

  module_set_t modules;
  for (size_t i = 0; i < msg->n_modules; ++i) {
    const Yangc__CachedModule* module = msg->modules[i];
    if (!module || !module->name || !module->revision) {
      return YANGC_STATUS_FAILURE;
    }
    ModuleIdentity identity;
    identity.name = module->name;
    identity.revision = module->revision;
    for (size_t j = 0; j < module->n_submodules; ++j) {
      const Yangc__CachedSubmodule* submodule = module->submodules[j];
      if (!submodule || !submodule->name || !submodule->revision) {
        return YANGC_STATUS_FAILURE;
      }
      identity.submodules[submodule->name] = submodule->revision;
    }
    modules.push_back(identity);
  }
  if (compute_digest(modules) != digest) {
    return YANGC_STATUS_FAILURE;
  }
  result->set_modules(modules);

  for (size_t i = 0; i < msg->n_nodes; ++i) {
    const Yangc__CachedNode* node = msg->nodes[i];
    if (!node) {
      return YANGC_STATUS_FAILURE;
    }
    if (i == 0 ? node->parent != YANGC_SCHEMA_INDEX_NONE : node->parent >= i) {
      return YANGC_STATUS_FAILURE;
    }

    CompactNode compact;
    if (!decode_identifier(node->name, &compact.name)) {
      return YANGC_STATUS_FAILURE;
    }
    compact.flags = node->flags;
    compact.parent = node->parent;
    if (node->type) {
      compact.type = decode_type(node->type, 0);
      if (!compact.type) {
        return YANGC_STATUS_FAILURE;
      }
    }
    if (node->units) {
      compact.units = std::string(node->units);
    }
    if (node->ns) {
      compact.ns = std::string(node->ns);
    }
    if (node->default_value) {
      compact.default_value = std::string(node->default_value);
    }
    compact.keys = decode_strings(node->n_keys, node->keys);
    if (node->target_path) {
      std::vector<Identifier> parts;
      if (!decode_identifiers(node->target_path->n_parts, node->target_path->parts, &parts)) {
        return YANGC_STATUS_FAILURE;
      }
      compact.target_path = YangPath(parts, node->target_path->absolute);
    }
    if (!decode_identifiers(node->n_identity_bases, node->identity_bases,
                            &compact.identity_bases)) {
      return YANGC_STATUS_FAILURE;
    }
    if (node->argument) {
      compact.argument = node->argument;
    }
    result->append_node(std::move(compact));
  }

  // append_node() rebuilt the children lists from the parent links;
  // they must agree with the stored ones.
  for (size_t i = 0; i < msg->n_nodes; ++i) {
    const Yangc__CachedNode* node = msg->nodes[i];
    const std::vector<schema_index_t>& children = result->children(i);
    if (children.size() != node->n_children
        || !std::equal(children.begin(), children.end(), node->children)) {
      return YANGC_STATUS_FAILURE;
    }
  }

  for (size_t i = 0; i < msg->n_metadata; ++i) {
    const Yangc__CachedAnnotation* annotation = msg->metadata[i];
    if (!annotation) {
      return YANGC_STATUS_FAILURE;
    }
    MetadataAnnotation metadata;
    if (!decode_identifier(annotation->name, &metadata.name)) {
      return YANGC_STATUS_FAILURE;
    }
    metadata.type = decode_type(annotation->type, 0);
    if (!metadata.type) {
      return YANGC_STATUS_FAILURE;
    }
    if (annotation->units) {
      metadata.units = std::string(annotation->units);
    }
    metadata.builtin = annotation->builtin;
    result->add_metadata(std::move(metadata));
  }

  if (result->validate() != YANGC_STATUS_SUCCESS) {
    return YANGC_STATUS_FAILURE;
  }

  *schema = std::move(result);
  return YANGC_STATUS_SUCCESS;
}

yangc_status_t SchemaCache::store(const CompiledSchema& schema)
{
  std::string digest = compute_digest(schema.modules());
  std::string blob;
  yangc_status_t status = encode(schema, digest, &blob);
  if (status != YANGC_STATUS_SUCCESS) {
    YANGC_TRACE_WARN(trace_, YANGC_TRACE_CATEGORY_CACHE,
                     "Cannot encode schema %s", digest.c_str());
    return status;
  }

  status = yangc_util_create_cache_dir(cache_dir_.c_str());
  if (status != YANGC_STATUS_SUCCESS) {
    YANGC_TRACE_WARN(trace_, YANGC_TRACE_CATEGORY_CACHE,
                     "Cannot create cache directory %s", cache_dir_.c_str());
    return status;
  }

  fs::path final_path(file_path(digest));
  fs::path temp_path(fs::path(cache_dir_)
                     / ("model_" + digest + "."
                        + boost::uuids::to_string(boost::uuids::random_generator()())
                        + ".tmp"));
  bool committed = false;
  BOOST_SCOPE_EXIT(&temp_path, &committed) {
    if (!committed) {
      boost::system::error_code ec;
      fs::remove(temp_path, ec);
    }
  } BOOST_SCOPE_EXIT_END

  {
    std::ofstream out(temp_path.string(), std::ios::binary | std::ios::trunc);
    out.write(blob.data(), blob.size());
    out.close();
    if (!out) {
      YANGC_TRACE_WARN(trace_, YANGC_TRACE_CATEGORY_CACHE,
                       "Cannot write %s", temp_path.string().c_str());
      return YANGC_STATUS_FAILURE;
    }
  }

  boost::system::error_code ec;
  fs::rename(temp_path, final_path, ec);
  if (ec) {
    YANGC_TRACE_WARN(trace_, YANGC_TRACE_CATEGORY_CACHE, "Cannot rename %s: %s",
                     temp_path.string().c_str(), ec.message().c_str());
    return YANGC_STATUS_FAILURE;
  }
  committed = true;

  YANGC_TRACE_INFO(trace_, YANGC_TRACE_CATEGORY_CACHE, "Stored %s (%zu bytes)",
                   final_path.string().c_str(), blob.size());
  return YANGC_STATUS_SUCCESS;
}

yangc_status_t SchemaCache::load(const std::string& digest,
                                 CompiledSchema::ptr_t* schema) const
{
  std::string path = file_path(digest);
  boost::system::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    YANGC_TRACE_INFO(trace_, YANGC_TRACE_CATEGORY_CACHE, "Cache miss %s", digest.c_str());
    return YANGC_STATUS_NOTFOUND;
  }

  std::ifstream in(path, std::ios::binary);
  std::string blob((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    YANGC_TRACE_WARN(trace_, YANGC_TRACE_CATEGORY_CACHE, "Cannot read %s", path.c_str());
    return YANGC_STATUS_FAILURE;
  }

  yangc_status_t status = decode(blob, digest, schema);
  if (status != YANGC_STATUS_SUCCESS) {
    YANGC_TRACE_WARN(trace_, YANGC_TRACE_CATEGORY_CACHE,
                     "Ignoring corrupt cache file %s", path.c_str());
    return status;
  }

  YANGC_TRACE_INFO(trace_, YANGC_TRACE_CATEGORY_CACHE, "Cache hit %s", digest.c_str());
  return YANGC_STATUS_SUCCESS;
}

CompiledSchema::ptr_t SchemaCache::get_or_compile(const module_set_t& modules,
                                                  const compile_fn_t& compile,
                                                  bool* hit)
{
  std::string digest = compute_digest(modules);
  CompiledSchema::ptr_t schema;
  if (load(digest, &schema) == YANGC_STATUS_SUCCESS) {
    if (hit) {
      *hit = true;
    }
    return schema;
  }

  if (hit) {
    *hit = false;
  }
  schema = compile();
  YANGC_ASSERT(schema);
  if (store(*schema) != YANGC_STATUS_SUCCESS) {
    YANGC_TRACE_WARN(trace_, YANGC_TRACE_CATEGORY_CACHE,
                     "Schema %s not cached", digest.c_str());
  }
  return schema;
}
