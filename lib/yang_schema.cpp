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
 * @file yang_schema.cpp
 *
 * Compiled schema reader, copies and dump.
 */

#include <utility>

#include "yang_schema.hpp"

using namespace yangc;

const schema_index_t CompiledSchema::ROOT;

namespace {

const char* status_names[] = { "current", "deprecated", "obsolete" };

bool same_type(const YangType::ptr_t& a, const YangType::ptr_t& b)
{
  if (!a || !b) {
    return !a && !b;
  }
  return a->equals(*b);
}

YangType::ptr_t clone_type(const YangType::ptr_t& type)
{
  return type ? type->clone() : YangType::ptr_t();
}

MetadataAnnotation copy_annotation(const MetadataAnnotation& annotation)
{
  MetadataAnnotation copy;
  copy.name = annotation.name;
  copy.type = clone_type(annotation.type);
  copy.units = annotation.units;
  copy.builtin = annotation.builtin;
  return copy;
}

}

const char* yangc::yang_status_name(yang_status_t status)
{
  return status_names[static_cast<unsigned>(status)];
}

bool yangc::yang_status_from_name(const std::string& name, yang_status_t* status)
{
  for (unsigned i = 0; i < sizeof(status_names) / sizeof(status_names[0]); ++i) {
    if (name == status_names[i]) {
      *status = static_cast<yang_status_t>(i);
      return true;
    }
  }
  return false;
}

bool ModuleIdentity::operator==(const ModuleIdentity& other) const
{
  return name == other.name
         && revision == other.revision
         && submodules == other.submodules;
}


/*****************************************************************************/
// CompiledSchema

const CompactNode& CompiledSchema::node(schema_index_t index) const
{
  YANGC_ASSERT_MESSAGE(index < nodes_.size(), "index %u out of %zu",
                       index, nodes_.size());
  return nodes_[index];
}

const std::vector<schema_index_t>& CompiledSchema::children(schema_index_t index) const
{
  return node(index).children;
}

schema_index_t CompiledSchema::parent(schema_index_t index) const
{
  return node(index).parent;
}

schema_index_t CompiledSchema::find_child(schema_index_t parent,
                                          const std::string& module,
                                          const std::string& name) const
{
  for (schema_index_t child : children(parent)) {
    const CompactNode& candidate = nodes_[child];
    switch (candidate.stmt()) {
      case yang_stmt_t::MODULE:
      case yang_stmt_t::SUBMODULE: {
        schema_index_t found = find_child(child, module, name);
        if (found != YANGC_SCHEMA_INDEX_NONE) {
          return found;
        }
        break;
      }
      default:
        if (yang_stmt_is_schema_node(candidate.stmt())
            && candidate.name.name() == name
            && (module.empty() || candidate.name.module() == module)) {
          return child;
        }
        break;
    }
  }
  return YANGC_SCHEMA_INDEX_NONE;
}

schema_index_t CompiledSchema::find_path(const std::string& path) const
{
  if (path.empty() || path[0] != '/' || nodes_.empty()) {
    return YANGC_SCHEMA_INDEX_NONE;
  }

  schema_index_t current = ROOT;
  std::string module;
  size_t pos = 1;
  while (pos <= path.size()) {
    size_t next = path.find('/', pos);
    if (next == std::string::npos) {
      next = path.size();
    }
    std::string step = path.substr(pos, next - pos);
    size_t colon = step.find(':');
    if (colon != std::string::npos) {
      module = step.substr(0, colon);
      step = step.substr(colon + 1);
      if (module.empty() || step.find(':') != std::string::npos) {
        return YANGC_SCHEMA_INDEX_NONE;
      }
    }
    if (step.empty()) {
      return YANGC_SCHEMA_INDEX_NONE;
    }

    current = find_child(current, module, step);
    if (current == YANGC_SCHEMA_INDEX_NONE) {
      return YANGC_SCHEMA_INDEX_NONE;
    }
    pos = next + 1;
  }
  return current;
}

const MetadataAnnotation* CompiledSchema::find_metadata(const std::string& module,
                                                        const std::string& name) const
{
  for (const MetadataAnnotation& annotation : metadata_) {
    if (annotation.name.module() == module && annotation.name.name() == name) {
      return &annotation;
    }
  }
  return nullptr;
}

schema_index_t CompiledSchema::append_node(CompactNode&& node)
{
  schema_index_t index = static_cast<schema_index_t>(nodes_.size());
  YANGC_ASSERT(index != YANGC_SCHEMA_INDEX_NONE);
  schema_index_t parent = node.parent;
  nodes_.push_back(std::move(node));
  if (parent != YANGC_SCHEMA_INDEX_NONE) {
    YANGC_ASSERT(parent < index);
    nodes_[parent].children.push_back(index);
  }
  return index;
}

void CompiledSchema::add_metadata(MetadataAnnotation&& annotation)
{
  metadata_.push_back(std::move(annotation));
}

schema_index_t CompiledSchema::copy_node(const CompiledSchema& from,
                                         schema_index_t index,
                                         schema_index_t parent)
{
  const CompactNode& source = from.node(index);
  CompactNode copy;
  copy.name = source.name;
  copy.flags = source.flags;
  copy.parent = parent;
  copy.type = clone_type(source.type);
  copy.units = source.units;
  copy.ns = source.ns;
  copy.default_value = source.default_value;
  copy.keys = source.keys;
  copy.target_path = source.target_path;
  copy.identity_bases = source.identity_bases;
  copy.argument = source.argument;

  schema_index_t copied = append_node(std::move(copy));
  for (schema_index_t child : source.children) {
    copy_node(from, child, copied);
  }
  return copied;
}

CompiledSchema::ptr_t CompiledSchema::deep_copy() const
{
  return copy_subtree(ROOT);
}

CompiledSchema::ptr_t CompiledSchema::copy_subtree(schema_index_t index) const
{
  ptr_t copy(new CompiledSchema());
  copy->copy_node(*this, index, YANGC_SCHEMA_INDEX_NONE);
  for (const MetadataAnnotation& annotation : metadata_) {
    copy->metadata_.push_back(copy_annotation(annotation));
  }
  copy->modules_ = modules_;
  return copy;
}

yangc_status_t CompiledSchema::validate() const
{
  if (nodes_.empty() || nodes_[ROOT].parent != YANGC_SCHEMA_INDEX_NONE) {
    return YANGC_STATUS_FAILURE;
  }

  for (schema_index_t i = 0; i < nodes_.size(); ++i) {
    const CompactNode& node = nodes_[i];
    if (node.flags & ~static_cast<uint32_t>(YANGC_SCHEMA_FLAG_ALL)) {
      return YANGC_STATUS_FAILURE;
    }
    if (!yang_stmt_is_valid(node.flags & YANGC_SCHEMA_FLAG_STMT_MASK)) {
      return YANGC_STATUS_FAILURE;
    }
    if (static_cast<unsigned>(node.status()) > static_cast<unsigned>(yang_status_t::OBSOLETE)) {
      return YANGC_STATUS_FAILURE;
    }
    if (node.type && !node.type->is_resolved()) {
      return YANGC_STATUS_FAILURE;
    }

    if (i != ROOT) {
      // Parents precede children, so the links cannot form a cycle.
      if (node.parent >= i) {
        return YANGC_STATUS_FAILURE;
      }
      unsigned seen = 0;
      for (schema_index_t sibling : nodes_[node.parent].children) {
        if (sibling == i) {
          ++seen;
        }
      }
      if (seen != 1) {
        return YANGC_STATUS_FAILURE;
      }
    }

    for (schema_index_t child : node.children) {
      if (child >= nodes_.size() || nodes_[child].parent != i) {
        return YANGC_STATUS_FAILURE;
      }
    }
  }
  return YANGC_STATUS_SUCCESS;
}

bool CompiledSchema::equals(const CompiledSchema& other) const
{
  if (nodes_.size() != other.nodes_.size()
      || metadata_.size() != other.metadata_.size()
      || !(modules_ == other.modules_)) {
    return false;
  }

  for (size_t i = 0; i < nodes_.size(); ++i) {
    const CompactNode& a = nodes_[i];
    const CompactNode& b = other.nodes_[i];
    if (a.name != b.name
        || a.flags != b.flags
        || a.parent != b.parent
        || a.children != b.children
        || !same_type(a.type, b.type)
        || a.units != b.units
        || a.ns != b.ns
        || a.default_value != b.default_value
        || a.keys != b.keys
        || a.target_path != b.target_path
        || a.identity_bases != b.identity_bases
        || a.argument != b.argument) {
      return false;
    }
  }

  for (size_t i = 0; i < metadata_.size(); ++i) {
    const MetadataAnnotation& a = metadata_[i];
    const MetadataAnnotation& b = other.metadata_[i];
    if (a.name != b.name
        || !same_type(a.type, b.type)
        || a.units != b.units
        || a.builtin != b.builtin) {
      return false;
    }
  }
  return true;
}


/*****************************************************************************/
// Dump

void yangc::yangc_schema_dump(const CompiledSchema& schema,
                              schema_index_t index,
                              unsigned indent,
                              std::ostream& os)
{
  const CompactNode& node = schema.node(index);
  os << std::string(indent * 2, ' ')
     << yang_stmt_keyword(node.stmt()) << " " << node.name.to_string();

  if (node.type) {
    os << " : " << node.type->display_name();
  }
  if (!node.keys.empty()) {
    os << " key[";
    for (size_t i = 0; i < node.keys.size(); ++i) {
      os << (i ? " " : "") << node.keys[i];
    }
    os << "]";
  }
  if (node.default_value) {
    os << " default=" << *node.default_value;
  }
  if (node.units) {
    os << " units=" << *node.units;
  }
  os << (node.is_config() ? " rw" : " ro");
  if (node.is_presence()) {
    os << " presence";
  }
  if (node.is_mandatory()) {
    os << " mandatory";
  }
  if (node.is_user_ordered()) {
    os << " user-ordered";
  }
  if (node.status() != yang_status_t::CURRENT) {
    os << " " << yang_status_name(node.status());
  }
  os << "\n";

  for (schema_index_t child : node.children) {
    yangc_schema_dump(schema, child, indent + 1, os);
  }
}
