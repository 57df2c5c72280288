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
 * @file yang_builder.cpp
 *
 * Statement tree construction.
 */

#include <algorithm>
#include <utility>

#include "yang_builder.hpp"
#include "yangc_status.h"

using namespace yangc;

/*****************************************************************************/
// BuildNode

BuildNode::BuildNode(yang_stmt_t stmt,
                     const Identifier& name,
                     const SourceLocation& location)
: presence(false),
  user_ordered(false),
  scope(YANGC_SCOPE_MODULE),
  stmt_(stmt),
  name_(name),
  location_(location),
  parent_(nullptr)
{
}

BuildNode* BuildNode::add_child(ptr_t child)
{
  return insert_child(children_.size(), std::move(child));
}

BuildNode* BuildNode::insert_child(size_t index, ptr_t child)
{
  YANGC_ASSERT(child);
  YANGC_ASSERT(child->parent_ == nullptr);
  YANGC_ASSERT(index <= children_.size());
  BuildNode* raw = child.get();
  raw->parent_ = this;
  children_.insert(children_.begin() + index, std::move(child));
  return raw;
}

BuildNode::ptr_t BuildNode::remove_child(const BuildNode* child)
{
  size_t index = child_index(child);
  YANGC_ASSERT_MESSAGE(index < children_.size(), "not a child of %s",
                       name_.to_string().c_str());
  ptr_t removed = std::move(children_[index]);
  children_.erase(children_.begin() + index);
  removed->parent_ = nullptr;
  return removed;
}

std::vector<BuildNode::ptr_t> BuildNode::release_children()
{
  std::vector<ptr_t> released;
  released.swap(children_);
  for (ptr_t& child : released) {
    child->parent_ = nullptr;
  }
  return released;
}

size_t BuildNode::child_index(const BuildNode* child) const
{
  size_t index = 0;
  for (; index < children_.size(); ++index) {
    if (children_[index].get() == child) {
      break;
    }
  }
  return index;
}

BuildNode* BuildNode::find_child(yang_stmt_t stmt) const
{
  for (const ptr_t& child : children_) {
    if (child->stmt() == stmt) {
      return child.get();
    }
  }
  return nullptr;
}

BuildNode::ptr_t BuildNode::deep_copy() const
{
  ptr_t copy(new BuildNode(stmt_, name_, location_));
  copy->blueprint = blueprint;
  copy->units = units;
  copy->ns = ns;
  copy->default_value = default_value;
  copy->mandatory = mandatory;
  copy->config = config;
  copy->status = status;
  copy->presence = presence;
  copy->user_ordered = user_ordered;
  copy->keys = keys;
  copy->identity_bases = identity_bases;
  copy->target_path = target_path;
  copy->argument = argument;
  copy->scope = scope;
  if (type_) {
    copy->type_ = type_->clone();
  }
  for (const ptr_t& child : children_) {
    copy->add_child(child->deep_copy());
  }
  return copy;
}

void BuildNode::bind_lazy(const std::string& module)
{
  name_.bind_module(module);
  target_path.bind_lazy(module);
  for (ptr_t& child : children_) {
    child->bind_lazy(module);
  }
}


/*****************************************************************************/
// SchemaBuilder

SchemaBuilder::SchemaBuilder(const yang_fetch_fn_t& fetch,
                             yangc_trace_ctx_t* trace)
: fetch_(fetch),
  trace_(trace),
  root_(new BuildNode(yang_stmt_t::CONTAINER,
                      Identifier::builtin("root"),
                      SourceLocation())),
  scope_parents_(1, YANGC_SCOPE_MODULE)
{
}

SchemaBuilder::~SchemaBuilder()
{
}

void SchemaBuilder::add_module_text(const std::string& name, const std::string& text)
{
  texts_[name] = text;
}

void SchemaBuilder::register_module(const std::string& name)
{
  if (registered_.insert(name).second) {
    YANGC_TRACE_INFO(trace_, YANGC_TRACE_CATEGORY_BUILD,
                     "Registered module '%s'", name.c_str());
    queue_.push_back(name);
  }
}

std::string SchemaBuilder::fetch_text(const std::string& name)
{
  auto it = texts_.find(name);
  if (it != texts_.end()) {
    return it->second;
  }
  if (!fetch_) {
    throw ModelProcessingError("Cannot find yang '" + name + "'");
  }
  YANGC_TRACE_INFO(trace_, YANGC_TRACE_CATEGORY_FETCH,
                   "Fetching yang '%s'", name.c_str());
  return fetch_(name);
}

void SchemaBuilder::parse_text(const std::string& name,
                               const std::string& text,
                               YangStatementHandler* handler)
{
  YANGC_TRACE_DEBUG(trace_, YANGC_TRACE_CATEGORY_PARSE,
                    "Parsing '%s' (%zu bytes)", name.c_str(), text.size());
  yang_parse(text, name + ".yang", handler);
}

void SchemaBuilder::parse_all()
{
  while (!queue_.empty()) {
    std::string name = queue_.front();
    queue_.pop_front();

    StatementBuilder handler(this);
    parse_text(name, fetch_text(name), &handler);
    if (handler.module() != name) {
      throw ModelProcessingError("Expected module '" + name + "' in '"
                                 + name + ".yang', found '"
                                 + handler.module() + "'");
    }
  }
}

bool SchemaBuilder::parse_submodule(const std::string& name,
                                    YangStatementHandler* handler)
{
  if (!parsed_submodules_.insert(name).second) {
    return false;
  }
  parse_text(name, fetch_text(name), handler);
  return true;
}

yang_scope_t SchemaBuilder::open_scope(yang_scope_t parent)
{
  YANGC_ASSERT(parent < scope_parents_.size());
  scope_parents_.push_back(parent);
  return static_cast<yang_scope_t>(scope_parents_.size() - 1);
}

void SchemaBuilder::register_grouping(BuildNode::ptr_t grouping, yang_scope_t scope)
{
  auto inserted = grouping_index_.insert(
      std::make_pair(std::make_pair(scope, grouping->name()), grouping.get()));
  if (!inserted.second) {
    throw ModelProcessingError("Duplicate grouping '"
                               + grouping->name().to_string() + "'",
                               grouping->location());
  }
  groupings_.push_back(std::move(grouping));
}

void SchemaBuilder::register_typedef(BuildNode::ptr_t type_def, yang_scope_t scope)
{
  auto inserted = typedef_index_.insert(
      std::make_pair(std::make_pair(scope, type_def->name()), type_def.get()));
  if (!inserted.second) {
    throw ModelProcessingError("Duplicate typedef '"
                               + type_def->name().to_string() + "'",
                               type_def->location());
  }
  typedefs_.push_back(std::move(type_def));
}

void SchemaBuilder::register_augment(BuildNode::ptr_t augment)
{
  augments_.push_back(std::move(augment));
}

void SchemaBuilder::register_deviation(BuildNode::ptr_t deviation)
{
  deviations_.push_back(std::move(deviation));
}

BuildNode* SchemaBuilder::find_scoped(const scoped_index_t& index,
                                      const Identifier& name,
                                      yang_scope_t scope) const
{
  YANGC_ASSERT(scope < scope_parents_.size());
  while (true) {
    auto it = index.find(std::make_pair(scope, name));
    if (it != index.end()) {
      return it->second;
    }
    if (scope == YANGC_SCOPE_MODULE) {
      return nullptr;
    }
    scope = scope_parents_[scope];
  }
}

BuildNode* SchemaBuilder::find_grouping(const Identifier& name, yang_scope_t scope) const
{
  return find_scoped(grouping_index_, name, scope);
}

BuildNode* SchemaBuilder::find_typedef(const Identifier& name, yang_scope_t scope) const
{
  return find_scoped(typedef_index_, name, scope);
}

void SchemaBuilder::record_revision(const std::string& module,
                                    const std::string& submodule,
                                    const std::string& revision)
{
  ModuleIdentity& identity = identities_[module];
  identity.name = module;
  if (submodule.empty()) {
    identity.revision = std::max(identity.revision, revision);
  } else {
    std::string& latest = identity.submodules[submodule];
    latest = std::max(latest, revision);
  }
}

module_set_t SchemaBuilder::module_set() const
{
  module_set_t modules;
  for (const auto& entry : identities_) {
    modules.push_back(entry.second);
  }
  return modules;
}


/*****************************************************************************/
// StatementBuilder

StatementBuilder::StatementBuilder(SchemaBuilder* schema)
: schema_(schema),
  prefix_stack_(1),
  grouping_depth_(0),
  skip_depth_(0)
{
  YANGC_ASSERT(schema_);
}

BuildNode* StatementBuilder::top() const
{
  YANGC_ASSERT(!path_.empty());
  return path_.back();
}

yang_scope_t StatementBuilder::scope() const
{
  return scopes_.empty() ? YANGC_SCOPE_MODULE : scopes_.back();
}

Identifier StatementBuilder::identifier(const std::string& text,
                                        bool force_module,
                                        const SourceLocation& location) const
{
  ModuleRef module;
  if (module_.empty()) {
    module = ModuleRef::builtin();
  } else if (grouping_depth_ && !force_module) {
    module = ModuleRef::lazy_bound();
  } else {
    module = ModuleRef::named(module_);
  }

  try {
    return Identifier::from_yang_string(text, module, prefixes());
  } catch (const ModelProcessingError& e) {
    throw ModelProcessingError(e.what(), location);
  }
}

YangPath StatementBuilder::parse_path(const std::string& text,
                                      yang_path_form_t form,
                                      const ModuleRef& default_module,
                                      const SourceLocation& location) const
{
  try {
    return YangPath::parse(text, form, default_module, prefixes());
  } catch (const ModelProcessingError& e) {
    throw ModelProcessingError(e.what(), location);
  }
}

void StatementBuilder::attach(BuildNode::ptr_t node)
{
  BuildNode* parent = path_.empty() ? schema_->root() : path_.back();
  path_.push_back(parent->add_child(std::move(node)));
}

void StatementBuilder::enter(const std::string& keyword,
                             const std::string& argument,
                             bool has_argument,
                             const SourceLocation& location)
{
  if (skip_depth_) {
    ++skip_depth_;
    return;
  }

  if (keyword.find(':') != std::string::npos) {
    if (!enter_extension(keyword, argument, location)) {
      ++skip_depth_;
    }
    return;
  }

  yang_stmt_t stmt;
  yang_attr_t attr;
  if (yang_stmt_from_keyword(keyword, &stmt)) {
    if (stmt == yang_stmt_t::CASE && !has_argument) {
      enter_structural(stmt, keyword, "unnamed", location);
    } else {
      enter_structural(stmt, keyword, argument, location);
    }
  } else if (yang_attr_from_keyword(keyword, &attr)) {
    enter_attribute(attr, keyword, argument, location);
  } else {
    YANGC_TRACE_DEBUG(schema_->trace(), YANGC_TRACE_CATEGORY_BUILD,
                      "Skipping statement '%s' at %s",
                      keyword.c_str(), location.to_string().c_str());
    ++skip_depth_;
  }
}

void StatementBuilder::enter_structural(yang_stmt_t stmt,
                                        const std::string& keyword,
                                        const std::string& argument,
                                        const SourceLocation& location)
{
  if (path_.empty() && stmt != yang_stmt_t::MODULE && stmt != yang_stmt_t::SUBMODULE) {
    throw ModelProcessingError("Unexpected statement '" + keyword
                               + "' outside of a module", location);
  }

  BuildNode::ptr_t node;
  BuildNode* raw = nullptr;
  yang_scope_t enclosing = scope();
  ModuleRef relative = grouping_depth_ ? ModuleRef::lazy_bound()
                                       : ModuleRef::named(module_);

  switch (stmt) {
    case yang_stmt_t::MODULE:
      if (!path_.empty()) {
        throw ModelProcessingError("Nested module '" + argument + "'", location);
      }
      module_ = argument;
      schema_->record_revision(module_, "", "");
      node.reset(new BuildNode(stmt, Identifier(argument, argument), location));
      attach(std::move(node));
      break;

    case yang_stmt_t::SUBMODULE:
      if (module_.empty()) {
        throw ModelProcessingError("Submodule '" + argument
                                   + "' is not included by a module", location);
      }
      schema_->record_revision(module_, argument, "");
      node.reset(new BuildNode(stmt, Identifier(module_, argument), location));
      attach(std::move(node));
      break;

    case yang_stmt_t::IMPORT:
      schema_->register_module(argument);
      node.reset(new BuildNode(stmt, Identifier(argument, argument), location));
      attach(std::move(node));
      break;

    case yang_stmt_t::BELONGS_TO:
      if (argument != module_) {
        throw ModelProcessingError("Submodule belongs to '" + argument
                                   + "', included by '" + module_ + "'", location);
      }
      node.reset(new BuildNode(stmt, Identifier(argument, argument), location));
      attach(std::move(node));
      break;

    case yang_stmt_t::GROUPING:
      node.reset(new BuildNode(stmt, identifier(argument, true, location), location));
      raw = node.get();
      schema_->register_grouping(std::move(node), enclosing);
      path_.push_back(raw);
      ++grouping_depth_;
      break;

    case yang_stmt_t::TYPEDEF:
      node.reset(new BuildNode(stmt, identifier(argument, true, location), location));
      raw = node.get();
      schema_->register_typedef(std::move(node), enclosing);
      path_.push_back(raw);
      break;

    case yang_stmt_t::AUGMENT:
      if (top()->stmt() == yang_stmt_t::USES) {
        node.reset(new BuildNode(stmt, identifier(keyword, false, location), location));
        node->target_path = parse_path(argument, yang_path_form_t::DESCENDANT_SCHEMA,
                                       relative, location);
        attach(std::move(node));
      } else {
        node.reset(new BuildNode(stmt, identifier(keyword, true, location), location));
        node->target_path = parse_path(argument, yang_path_form_t::ABSOLUTE_SCHEMA,
                                       ModuleRef::named(module_), location);
        raw = node.get();
        schema_->register_augment(std::move(node));
        path_.push_back(raw);
      }
      break;

    case yang_stmt_t::DEVIATION:
      node.reset(new BuildNode(stmt, identifier(keyword, true, location), location));
      node->target_path = parse_path(argument, yang_path_form_t::ABSOLUTE_SCHEMA,
                                     ModuleRef::named(module_), location);
      raw = node.get();
      schema_->register_deviation(std::move(node));
      path_.push_back(raw);
      break;

    case yang_stmt_t::REFINE:
      node.reset(new BuildNode(stmt, identifier(keyword, false, location), location));
      node->target_path = parse_path(argument, yang_path_form_t::DESCENDANT_SCHEMA,
                                     relative, location);
      attach(std::move(node));
      break;

    case yang_stmt_t::DEVIATE:
      if (argument != "add" && argument != "delete"
          && argument != "replace" && argument != "not-supported") {
        throw ModelProcessingError("Unknown deviate statement '" + argument + "'",
                                   location);
      }
      node.reset(new BuildNode(stmt, Identifier::builtin(argument), location));
      attach(std::move(node));
      break;

    case yang_stmt_t::USES:
    case yang_stmt_t::IDENTITY:
      node.reset(new BuildNode(stmt, identifier(argument, true, location), location));
      attach(std::move(node));
      break;

    case yang_stmt_t::INPUT:
    case yang_stmt_t::OUTPUT:
      node.reset(new BuildNode(stmt, identifier(keyword, false, location), location));
      attach(std::move(node));
      break;

    default:
      node.reset(new BuildNode(stmt, identifier(argument, false, location), location));
      attach(std::move(node));
      break;
  }

  top()->scope = enclosing;
  // Submodule definitions share the module scope.
  if (stmt == yang_stmt_t::MODULE || stmt == yang_stmt_t::SUBMODULE) {
    scopes_.push_back(YANGC_SCOPE_MODULE);
  } else {
    scopes_.push_back(schema_->open_scope(enclosing));
  }
  keywords_.push_back(keyword);
  structural_.push_back(true);
}

void StatementBuilder::enter_attribute(yang_attr_t attr,
                                       const std::string& keyword,
                                       const std::string& argument,
                                       const SourceLocation& location)
{
  if (path_.empty()) {
    throw ModelProcessingError("Unexpected statement '" + keyword
                               + "' outside of a module", location);
  }

  BlueprintInstruction instruction;
  instruction.attr = attr;
  instruction.keyword = keyword;
  instruction.argument = argument;
  instruction.location = location;
  instruction.scope = scope();

  const std::string& parent = keywords_.back();
  switch (attr) {
    case yang_attr_t::TYPE:
      if (is_builtin_type_name(argument)) {
        instruction.identifier = Identifier::builtin(argument);
      } else {
        instruction.identifier = identifier(argument, true, location);
      }
      break;

    case yang_attr_t::BASE:
      instruction.identifier = identifier(argument, true, location);
      break;

    case yang_attr_t::PATH:
      instruction.path = parse_path(argument, yang_path_form_t::LEAFREF,
                                    ModuleRef::lazy_bound(), location);
      break;

    case yang_attr_t::PREFIX:
      if (parent == "module") {
        prefix_stack_.back()[argument] = module_;
      } else if (parent == "import" || parent == "belongs-to") {
        prefix_stack_.back()[argument] = top()->name().name();
      }
      break;

    case yang_attr_t::REVISION:
      if (parent == "module") {
        schema_->record_revision(module_, "", argument);
      } else if (parent == "submodule") {
        schema_->record_revision(module_, top()->name().name(), argument);
      }
      break;

    default:
      break;
  }

  top()->blueprint.push_back(instruction);
  keywords_.push_back(keyword);
  structural_.push_back(false);

  if (attr == yang_attr_t::INCLUDE) {
    prefix_stack_.push_back(prefix_map_t());
    if (!schema_->parse_submodule(argument, this)) {
      YANGC_TRACE_DEBUG(schema_->trace(), YANGC_TRACE_CATEGORY_BUILD,
                        "Submodule '%s' already included", argument.c_str());
    }
    prefix_stack_.pop_back();
  }
}

bool StatementBuilder::enter_extension(const std::string& keyword,
                                       const std::string& argument,
                                       const SourceLocation& location)
{
  if (path_.empty() || !structural_.back()) {
    return false;
  }

  size_t colon = keyword.find(':');
  auto it = prefixes().find(keyword.substr(0, colon));
  if (it == prefixes().end()) {
    YANGC_TRACE_WARN(schema_->trace(), YANGC_TRACE_CATEGORY_BUILD,
                     "Unknown extension prefix in '%s' at %s",
                     keyword.c_str(), location.to_string().c_str());
    return false;
  }
  const std::string& module = it->second;
  std::string local = keyword.substr(colon + 1);

  BuildNode::ptr_t node;
  if (module == "ietf-yang-metadata" && local == "annotation") {
    yang_stmt_t parent = top()->stmt();
    if (parent != yang_stmt_t::MODULE && parent != yang_stmt_t::SUBMODULE) {
      return false;
    }
    node.reset(new BuildNode(yang_stmt_t::ANNOTATE,
                             identifier(argument, true, location),
                             location));
  } else {
    node.reset(new BuildNode(yang_stmt_t::EXTENDED, Identifier(module, local), location));
    node->argument = argument;
  }

  yang_scope_t enclosing = scope();
  attach(std::move(node));
  top()->scope = enclosing;
  scopes_.push_back(schema_->open_scope(enclosing));
  keywords_.push_back(keyword);
  structural_.push_back(true);
  return true;
}

void StatementBuilder::leave(const std::string& keyword)
{
  if (skip_depth_) {
    --skip_depth_;
    return;
  }

  YANGC_ASSERT(!keywords_.empty());
  YANGC_ASSERT(keywords_.back() == keyword);
  bool structural = structural_.back();
  keywords_.pop_back();
  structural_.pop_back();

  if (!structural) {
    BlueprintInstruction instruction;
    instruction.enter = false;
    instruction.keyword = keyword;
    yang_attr_from_keyword(keyword, &instruction.attr);
    top()->blueprint.push_back(instruction);
    return;
  }

  leave_structural(keyword);
}

void StatementBuilder::leave_structural(const std::string& keyword)
{
  BuildNode* node = top();
  switch (node->stmt()) {
    case yang_stmt_t::GROUPING:
      YANGC_ASSERT(grouping_depth_);
      --grouping_depth_;
      break;

    case yang_stmt_t::RPC:
    case yang_stmt_t::ACTION:
      add_implicit_io(node, "input");
      add_implicit_io(node, "output");
      break;

    default:
      break;
  }

  YANGC_TRACE_DEBUG(schema_->trace(), YANGC_TRACE_CATEGORY_BUILD,
                    "Built %s %s", keyword.c_str(),
                    node->name().to_string().c_str());
  path_.pop_back();
  scopes_.pop_back();
}

void StatementBuilder::add_implicit_io(BuildNode* node, const char* keyword)
{
  yang_stmt_t stmt;
  bool found = yang_stmt_from_keyword(keyword, &stmt);
  YANGC_ASSERT(found);
  if (node->find_child(stmt)) {
    return;
  }
  node->add_child(BuildNode::ptr_t(
      new BuildNode(stmt, identifier(keyword, false, node->location()), node->location())));
}
