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
 * @file yang_resolve.cpp
 *
 * The passes that give the final tree its meaning: blueprint replay,
 * typedef resolution, range normalization, identity closure and
 * leafref resolution.
 */

#include <limits>
#include <sstream>
#include <utility>

#include "yang_compiler.hpp"
#include "yangc_status.h"

using namespace yangc;

namespace {

/*!
 * Replays the blueprint of one node.  Types are built on a stack so
 * that union members and their restrictions land on the right type.
 */
class BlueprintReplayer
{
 public:
  explicit BlueprintReplayer(BuildNode* node)
  : node_(node)
  {}

  // Cannot copy
  BlueprintReplayer(const BlueprintReplayer&) = delete;
  BlueprintReplayer& operator=(const BlueprintReplayer&) = delete;

 public:
  void replay();

 private:
  void apply(const BlueprintInstruction& instruction);
  void apply_type(const BlueprintInstruction& instruction);
  void apply_restriction(const BlueprintInstruction& instruction);
  void apply_node_attribute(const BlueprintInstruction& instruction);

  bool at_top() const { return keywords_.size() == 1; }
  bool in_type() const
  {
    return !types_.empty() && keywords_.size() >= 2
           && keywords_[keywords_.size() - 2] == "type";
  }
  const std::string& enclosing() const
  {
    static const std::string none;
    return keywords_.size() >= 2 ? keywords_[keywords_.size() - 2] : none;
  }
  YangType* type() const { return types_.empty() ? nullptr : types_.back(); }

  static bool parse_bool(const BlueprintInstruction& instruction);
  static range_value_t parse_number(const BlueprintInstruction& instruction,
                                    range_value_t min,
                                    range_value_t max);

 private:
  BuildNode* node_;
  std::vector<std::string> keywords_;
  std::vector<bool> pushed_type_;
  std::vector<YangType*> types_;
};

void BlueprintReplayer::replay()
{
  for (const BlueprintInstruction& instruction : node_->blueprint) {
    if (instruction.enter) {
      keywords_.push_back(instruction.keyword);
      pushed_type_.push_back(false);
      apply(instruction);
    } else {
      YANGC_ASSERT(!keywords_.empty());
      if (pushed_type_.back()) {
        types_.pop_back();
      }
      keywords_.pop_back();
      pushed_type_.pop_back();
    }
  }
}

bool BlueprintReplayer::parse_bool(const BlueprintInstruction& instruction)
{
  if (instruction.argument == "true") {
    return true;
  }
  if (instruction.argument == "false") {
    return false;
  }
  throw ModelProcessingError("Invalid " + instruction.keyword + " statement '"
                             + instruction.argument + "'", instruction.location);
}

range_value_t BlueprintReplayer::parse_number(const BlueprintInstruction& instruction,
                                              range_value_t min,
                                              range_value_t max)
{
  range_value_t value = 0;
  if (!parse_range_number(instruction.argument, 0, &value) || value < min || value > max) {
    throw ModelProcessingError("Invalid " + instruction.keyword + " statement '"
                               + instruction.argument + "'", instruction.location);
  }
  return value;
}

void BlueprintReplayer::apply(const BlueprintInstruction& instruction)
{
  switch (instruction.attr) {
    case yang_attr_t::TYPE:
      apply_type(instruction);
      break;

    case yang_attr_t::RANGE:
    case yang_attr_t::LENGTH:
    case yang_attr_t::FRACTION_DIGITS:
    case yang_attr_t::PATTERN:
    case yang_attr_t::ENUM:
    case yang_attr_t::BIT:
    case yang_attr_t::PATH:
    case yang_attr_t::REQUIRE_INSTANCE:
      if (in_type()) {
        apply_restriction(instruction);
      }
      break;

    case yang_attr_t::VALUE:
      if (enclosing() == "enum" && type()) {
        range_value_t value = parse_number(instruction,
                                           std::numeric_limits<int64_t>::min(),
                                           std::numeric_limits<int64_t>::max());
        if (type()->kind() == yang_type_kind_t::ENUMERATION) {
          static_cast<EnumerationType*>(type())->set_last_value(static_cast<int64_t>(value));
        } else if (type()->kind() == yang_type_kind_t::UNRESOLVED) {
          auto& enums = static_cast<UnresolvedType*>(type())->restrictions().enums;
          if (!enums.empty()) {
            enums.back().value = static_cast<int64_t>(value);
          }
        }
      }
      break;

    case yang_attr_t::POSITION:
      if (enclosing() == "bit" && type()) {
        range_value_t position = parse_number(instruction, 0,
                                              std::numeric_limits<uint32_t>::max());
        if (type()->kind() == yang_type_kind_t::BITS) {
          static_cast<BitsType*>(type())->set_last_position(static_cast<uint32_t>(position));
        } else if (type()->kind() == yang_type_kind_t::UNRESOLVED) {
          auto& bits = static_cast<UnresolvedType*>(type())->restrictions().bits;
          if (!bits.empty()) {
            bits.back().position = static_cast<uint32_t>(position);
          }
        }
      }
      break;

    case yang_attr_t::BASE:
      if (in_type()) {
        if (type()->kind() != yang_type_kind_t::IDENTITYREF) {
          throw ModelProcessingError("Unexpected base statement for type "
                                     + type()->display_name(), instruction.location);
        }
        static_cast<IdentityRefType*>(type())->add_base(instruction.identifier);
      } else if (at_top() && node_->stmt() == yang_stmt_t::IDENTITY) {
        node_->identity_bases.push_back(instruction.identifier);
      }
      break;

    default:
      if (at_top()) {
        apply_node_attribute(instruction);
      }
      break;
  }
}

void BlueprintReplayer::apply_type(const BlueprintInstruction& instruction)
{
  YangType::ptr_t type = yang_type_from_identifier(instruction.identifier,
                                                   instruction.scope);
  YangType* raw = type.get();

  if (types_.empty()) {
    if (!at_top()) {
      return;
    }
    node_->set_type(std::move(type));
  } else if (in_type() && types_.back()->kind() == yang_type_kind_t::UNION) {
    static_cast<UnionType*>(types_.back())->append(std::move(type));
  } else {
    throw ModelProcessingError("Unexpected type statement '" + instruction.argument
                               + "'", instruction.location);
  }

  types_.push_back(raw);
  pushed_type_.back() = true;
}

void BlueprintReplayer::apply_restriction(const BlueprintInstruction& instruction)
{
  YangType* current = type();
  YangTypeRestrictions* restrictions = nullptr;
  if (current->kind() == yang_type_kind_t::PRIMITIVE) {
    restrictions = &static_cast<PrimitiveType*>(current)->restrictions();
  } else if (current->kind() == yang_type_kind_t::UNRESOLVED) {
    restrictions = &static_cast<UnresolvedType*>(current)->restrictions();
  }

  switch (instruction.attr) {
    case yang_attr_t::ENUM:
      if (current->kind() == yang_type_kind_t::ENUMERATION) {
        static_cast<EnumerationType*>(current)->add_enum(instruction.argument);
        return;
      }
      if (restrictions) {
        restrictions->enums.push_back(EnumMember{ instruction.argument, 0 });
        return;
      }
      break;

    case yang_attr_t::BIT:
      if (current->kind() == yang_type_kind_t::BITS) {
        static_cast<BitsType*>(current)->add_bit(instruction.argument);
        return;
      }
      if (restrictions) {
        restrictions->bits.push_back(BitMember{ instruction.argument, 0 });
        return;
      }
      break;

    case yang_attr_t::PATH:
      if (current->kind() == yang_type_kind_t::LEAFREF) {
        static_cast<LeafRefType*>(current)->set_path(instruction.path);
        return;
      }
      break;

    case yang_attr_t::REQUIRE_INSTANCE:
      if (current->kind() == yang_type_kind_t::LEAFREF) {
        static_cast<LeafRefType*>(current)->set_require_instance(parse_bool(instruction));
      }
      return;

    case yang_attr_t::RANGE:
      if (restrictions) {
        restrictions->range = instruction.argument;
        return;
      }
      break;

    case yang_attr_t::LENGTH:
      if (restrictions) {
        restrictions->length = instruction.argument;
        return;
      }
      break;

    case yang_attr_t::PATTERN:
      if (restrictions) {
        restrictions->patterns.push_back(instruction.argument);
        return;
      }
      break;

    case yang_attr_t::FRACTION_DIGITS:
      if (restrictions) {
        restrictions->fraction_digits = static_cast<unsigned>(parse_number(instruction, 1, 18));
        return;
      }
      break;

    default:
      YANGC_ASSERT_NOT_REACHED();
  }

  throw ModelProcessingError("Unexpected " + instruction.keyword + " statement for type "
                             + current->display_name(), instruction.location);
}

void BlueprintReplayer::apply_node_attribute(const BlueprintInstruction& instruction)
{
  const std::string& argument = instruction.argument;
  switch (instruction.attr) {
    case yang_attr_t::DEFAULT:
      node_->default_value = argument;
      break;

    case yang_attr_t::CONFIG:
      if (argument != "true" && argument != "false") {
        throw ModelProcessingError("Invalid config statement '" + argument + "'",
                                   instruction.location);
      }
      node_->config = argument == "true";
      break;

    case yang_attr_t::MANDATORY:
      node_->mandatory = parse_bool(instruction);
      break;

    case yang_attr_t::UNITS:
      node_->units = argument;
      break;

    case yang_attr_t::PRESENCE:
      node_->presence = true;
      break;

    case yang_attr_t::KEY: {
      node_->keys.clear();
      std::istringstream words(argument);
      std::string key;
      while (words >> key) {
        node_->keys.push_back(key);
      }
      break;
    }

    case yang_attr_t::STATUS: {
      yang_status_t status;
      if (!yang_status_from_name(argument, &status)) {
        throw ModelProcessingError("Invalid status statement '" + argument + "'",
                                   instruction.location);
      }
      node_->status = argument;
      break;
    }

    case yang_attr_t::ORDERED_BY:
      if (argument != "user" && argument != "system") {
        throw ModelProcessingError("Invalid ordered-by statement '" + argument + "'",
                                   instruction.location);
      }
      node_->user_ordered = argument == "user";
      break;

    case yang_attr_t::NAMESPACE:
      node_->ns = argument;
      break;

    default:
      break;
  }
}

void normalize_type(YangType* type)
{
  switch (type->kind()) {
    case yang_type_kind_t::PRIMITIVE:
      static_cast<PrimitiveType*>(type)->normalize();
      break;
    case yang_type_kind_t::UNION:
      for (YangType::ptr_t& member : static_cast<UnionType*>(type)->mutable_members()) {
        normalize_type(member.get());
      }
      break;
    default:
      break;
  }
}

void apply_use_site_restrictions(YangType* type,
                                 const YangTypeRestrictions& use_site)
{
  switch (type->kind()) {
    case yang_type_kind_t::PRIMITIVE: {
      YangTypeRestrictions& base = static_cast<PrimitiveType*>(type)->restrictions();
      if (!use_site.range.empty()) {
        base.range = merge_ranges(base.range, use_site.range);
      }
      if (!use_site.length.empty()) {
        base.length = merge_ranges(base.length, use_site.length);
      }
      if (use_site.fraction_digits) {
        base.fraction_digits = use_site.fraction_digits;
      }
      base.patterns.insert(base.patterns.end(),
                           use_site.patterns.begin(), use_site.patterns.end());
      break;
    }
    case yang_type_kind_t::ENUMERATION:
      if (!use_site.enums.empty()) {
        static_cast<EnumerationType*>(type)->restrict_to(use_site.enums);
      }
      break;
    case yang_type_kind_t::BITS:
      if (!use_site.bits.empty()) {
        static_cast<BitsType*>(type)->restrict_to(use_site.bits);
      }
      break;
    default:
      break;
  }
}

typedef std::map<Identifier, std::vector<Identifier>> derivation_map_t;

std::set<Identifier> identity_closure(const derivation_map_t& derived,
                                      const Identifier& base)
{
  std::set<Identifier> closure;
  std::vector<Identifier> stack(1, base);
  while (!stack.empty()) {
    Identifier current = stack.back();
    stack.pop_back();
    auto it = derived.find(current);
    if (it == derived.end()) {
      continue;
    }
    for (const Identifier& identity : it->second) {
      if (closure.insert(identity).second) {
        stack.push_back(identity);
      }
    }
  }
  return closure;
}

void assign_identity_values(YangType* type, const derivation_map_t& derived)
{
  if (type->kind() == yang_type_kind_t::IDENTITYREF) {
    IdentityRefType* ref = static_cast<IdentityRefType*>(type);
    std::set<Identifier> values;
    for (const Identifier& base : ref->bases()) {
      std::set<Identifier> closure = identity_closure(derived, base);
      values.insert(closure.begin(), closure.end());
    }
    ref->set_values(values);
  } else if (type->kind() == yang_type_kind_t::UNION) {
    for (YangType::ptr_t& member : static_cast<UnionType*>(type)->mutable_members()) {
      assign_identity_values(member.get(), derived);
    }
  }
}

// The data tree parent: choice and case are not instantiated, and the
// modules sit directly below the root.
BuildNode* data_parent(const BuildNode* node)
{
  BuildNode* parent = node->parent();
  while (parent && (parent->stmt() == yang_stmt_t::CHOICE
                    || parent->stmt() == yang_stmt_t::CASE)) {
    parent = parent->parent();
  }
  if (parent && (parent->stmt() == yang_stmt_t::MODULE
                 || parent->stmt() == yang_stmt_t::SUBMODULE)) {
    parent = parent->parent();
  }
  return parent;
}

BuildNode* find_data_child(const BuildNode* node, const Identifier& name)
{
  for (const BuildNode::ptr_t& child : node->children()) {
    switch (child->stmt()) {
      case yang_stmt_t::MODULE:
      case yang_stmt_t::SUBMODULE:
      case yang_stmt_t::CHOICE:
      case yang_stmt_t::CASE: {
        BuildNode* found = find_data_child(child.get(), name);
        if (found) {
          return found;
        }
        break;
      }
      default:
        if (yang_stmt_is_data_node(child->stmt()) && child->name() == name) {
          return child.get();
        }
        break;
    }
  }
  return nullptr;
}

}


/*****************************************************************************/
// Pass 4: blueprint replay

void YangCompiler::replay_blueprints()
{
  auto replay = [](BuildNode* node) {
    BlueprintReplayer replayer(node);
    replayer.replay();
  };
  visit_build_tree(builder_->root(), replay);
  for (const BuildNode::ptr_t& type_def : builder_->typedefs()) {
    replay(type_def.get());
  }
}


/*****************************************************************************/
// Pass 5: typedefs

void YangCompiler::resolve_typedefs()
{
  visit_build_tree(builder_->root(), [this](BuildNode* node) {
    YangType* type = node->type();
    if (!type || type->is_resolved()) {
      return;
    }
    if (type->kind() == yang_type_kind_t::UNRESOLVED) {
      inherit_typedef_attributes(node, *static_cast<UnresolvedType*>(type));
    }
    YangType::ptr_t resolved = resolve_type(*type, node->location());
    node->set_type(std::move(resolved));
  });
}

const YangType* YangCompiler::resolve_typedef(const Identifier& name,
                                              yang_scope_t scope,
                                              const SourceLocation& location)
{
  const BuildNode* type_def = builder_->find_typedef(name, scope);
  if (!type_def) {
    throw InternalError("Unresolved type in schema: " + name.to_string()
                        + (location.is_known() ? " at " + location.to_string() : ""));
  }

  auto it = resolved_typedefs_.find(type_def);
  if (it != resolved_typedefs_.end()) {
    return it->second.get();
  }
  if (!type_def->type()) {
    throw ModelProcessingError("Typedef '" + name.to_string() + "' has no type",
                               type_def->location());
  }
  if (!typedefs_in_progress_.insert(type_def).second) {
    throw ModelProcessingError("Circular typedef '" + name.to_string() + "'",
                               type_def->location());
  }

  YangType::ptr_t resolved = resolve_type(*type_def->type(), type_def->location());
  typedefs_in_progress_.erase(type_def);

  const YangType* result = resolved.get();
  resolved_typedefs_[type_def] = std::move(resolved);
  return result;
}

YangType::ptr_t YangCompiler::resolve_type(const YangType& type,
                                           const SourceLocation& location)
{
  switch (type.kind()) {
    case yang_type_kind_t::UNRESOLVED: {
      const UnresolvedType& unresolved = static_cast<const UnresolvedType&>(type);
      YangType::ptr_t resolved
          = resolve_typedef(unresolved.name(), unresolved.scope(), location)->clone();
      apply_use_site_restrictions(resolved.get(), unresolved.restrictions());
      return resolved;
    }
    case yang_type_kind_t::UNION: {
      std::unique_ptr<UnionType> resolved(new UnionType());
      for (const YangType::ptr_t& member : static_cast<const UnionType&>(type).members()) {
        resolved->append(resolve_type(*member, location));
      }
      resolved->deduplicate();
      return YangType::ptr_t(resolved.release());
    }
    default:
      break;
  }
  return type.clone();
}

void YangCompiler::inherit_typedef_attributes(BuildNode* node, const UnresolvedType& ref)
{
  std::set<const BuildNode*> seen;
  const BuildNode* type_def = builder_->find_typedef(ref.name(), ref.scope());
  while (type_def && seen.insert(type_def).second) {
    if (!node->units && type_def->units) {
      node->units = type_def->units;
    }
    if (!node->default_value && type_def->default_value) {
      node->default_value = type_def->default_value;
    }
    const YangType* base = type_def->type();
    if (!base || base->kind() != yang_type_kind_t::UNRESOLVED) {
      break;
    }
    const UnresolvedType* next = static_cast<const UnresolvedType*>(base);
    type_def = builder_->find_typedef(next->name(), next->scope());
  }
}


/*****************************************************************************/
// Pass 6: range normalization

void YangCompiler::normalize_ranges()
{
  visit_build_tree(builder_->root(), [](BuildNode* node) {
    if (!node->type()) {
      return;
    }
    try {
      normalize_type(node->type());
    } catch (const ModelProcessingError& e) {
      throw ModelProcessingError(e.what(), node->location());
    }
  });
}


/*****************************************************************************/
// Pass 7: identities

void YangCompiler::resolve_identities()
{
  derivation_map_t derived;
  visit_build_tree(builder_->root(), [&derived](BuildNode* node) {
    if (node->stmt() != yang_stmt_t::IDENTITY) {
      return;
    }
    for (const Identifier& base : node->identity_bases) {
      derived[base].push_back(node->name());
    }
  });

  visit_build_tree(builder_->root(), [&derived](BuildNode* node) {
    if (node->type()) {
      assign_identity_values(node->type(), derived);
    }
  });
}


/*****************************************************************************/
// Pass 8: leafrefs

void YangCompiler::resolve_leafrefs()
{
  visit_build_tree(builder_->root(), [this](BuildNode* node) {
    resolve_node_leafrefs(node);
  });
}

// A node is resolved at most once, and the nodes its leafrefs point at
// are resolved before their types are copied.
void YangCompiler::resolve_node_leafrefs(BuildNode* node)
{
  if (!node->type() || leafrefs_resolved_.count(node)) {
    return;
  }
  bool inserted = leafrefs_in_progress_.insert(node).second;
  YANGC_ASSERT(inserted);

  YangType::ptr_t type = node->release_type();
  substitute_leafrefs(node, &type);
  node->set_type(std::move(type));

  leafrefs_in_progress_.erase(node);
  leafrefs_resolved_.insert(node);
}

void YangCompiler::substitute_leafrefs(BuildNode* node, YangType::ptr_t* type)
{
  switch ((*type)->kind()) {
    case yang_type_kind_t::LEAFREF: {
      const LeafRefType* leafref = static_cast<const LeafRefType*>(type->get());
      BuildNode* target = walk_leafref_path(node, leafref->path());
      if (!target) {
        throw InternalError("Unresolved leafref " + leafref->display_name()
                            + " at " + node->location().to_string());
      }
      if (leafrefs_in_progress_.count(target)) {
        throw ModelProcessingError("Circular leafref " + leafref->display_name(),
                                   node->location());
      }
      resolve_node_leafrefs(target);
      if (!target->type()) {
        throw InternalError("Unresolved leafref " + leafref->display_name()
                            + " at " + node->location().to_string());
      }
      *type = target->type()->clone();
      break;
    }
    case yang_type_kind_t::UNION:
      for (YangType::ptr_t& member : static_cast<UnionType*>(type->get())->mutable_members()) {
        substitute_leafrefs(node, &member);
      }
      break;
    default:
      break;
  }
}

BuildNode* YangCompiler::walk_leafref_path(BuildNode* node, const YangPath& path)
{
  BuildNode* root = builder_->root();
  BuildNode* current = path.is_absolute() ? root : node;

  for (const Identifier& step : path.parts()) {
    if (YangPath::is_parent_step(step)) {
      current = data_parent(current);
      if (!current) {
        return nullptr;
      }
      continue;
    }

    Identifier name = step;
    if (name.is_lazy_bound()) {
      name.bind_module(current == root ? node->name().module() : current->name().module());
    }
    current = find_data_child(current, name);
    if (!current) {
      return nullptr;
    }
  }
  return current;
}
