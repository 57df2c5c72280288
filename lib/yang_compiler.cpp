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
 * @file yang_compiler.cpp
 *
 * Compiler driver and the passes that change the shape of the tree:
 * grouping expansion, augments, deviations, and the final passes that
 * produce the compiled schema.
 */

#include <initializer_list>
#include <utility>

#include <boost/scope_exit.hpp>

#include "yang_compiler.hpp"
#include "yangc_status.h"

using namespace yangc;

namespace {

enum grouping_state_t
{
  GROUPING_PENDING = 0,
  GROUPING_EXPANDING,
  GROUPING_EXPANDED,
};

bool names_match(const Identifier& node, const Identifier& step)
{
  if (node.name() != step.name()) {
    return false;
  }
  if (node.is_lazy_bound() || step.is_lazy_bound()) {
    return true;
  }
  return node.module() == step.module();
}

BuildNode* find_schema_child(const BuildNode* node, const Identifier& step)
{
  for (const BuildNode::ptr_t& child : node->children()) {
    switch (child->stmt()) {
      case yang_stmt_t::MODULE:
      case yang_stmt_t::SUBMODULE: {
        BuildNode* found = find_schema_child(child.get(), step);
        if (found) {
          return found;
        }
        break;
      }
      default:
        if (yang_stmt_is_schema_node(child->stmt()) && names_match(child->name(), step)) {
          return child.get();
        }
        break;
    }
  }
  return nullptr;
}

BuildNode* find_descendant(BuildNode* node, const YangPath& path)
{
  for (const Identifier& step : path.parts()) {
    node = find_schema_child(node, step);
    if (!node) {
      return nullptr;
    }
  }
  return node;
}

// The module a grouping copy at node belongs to.  False inside a
// grouping, where the copy stays lazy-bound.
bool enclosing_module(const BuildNode* node, std::string* module)
{
  for (const BuildNode* n = node->parent(); n; n = n->parent()) {
    switch (n->stmt()) {
      case yang_stmt_t::GROUPING:
        return false;
      case yang_stmt_t::MODULE:
      case yang_stmt_t::SUBMODULE:
        *module = n->name().module();
        return true;
      case yang_stmt_t::AUGMENT:
        if (!n->parent()) {
          *module = n->name().module();
          return true;
        }
        break;
      default:
        break;
    }
  }
  return false;
}

bool is_case_shorthand(yang_stmt_t stmt)
{
  switch (stmt) {
    case yang_stmt_t::CONTAINER:
    case yang_stmt_t::LIST:
    case yang_stmt_t::LEAF:
    case yang_stmt_t::LEAF_LIST:
    case yang_stmt_t::ANYDATA:
    case yang_stmt_t::ANYXML:
    case yang_stmt_t::CHOICE:
      return true;
    default:
      break;
  }
  return false;
}

BuildNode::ptr_t wrap_in_case(BuildNode::ptr_t node)
{
  BuildNode::ptr_t wrapper(new BuildNode(yang_stmt_t::CASE, node->name(), node->location()));
  wrapper->add_child(std::move(node));
  return wrapper;
}

// Remove the top level statements named keyword, with their substatements.
Blueprint filter_blueprint(const Blueprint& blueprint, const std::string& keyword)
{
  Blueprint filtered;
  unsigned depth = 0;
  unsigned skip = 0;
  for (const BlueprintInstruction& instruction : blueprint) {
    if (instruction.enter) {
      if (skip) {
        ++skip;
      } else if (depth == 0 && instruction.keyword == keyword) {
        skip = 1;
      } else {
        ++depth;
        filtered.push_back(instruction);
      }
    } else {
      if (skip) {
        --skip;
      } else {
        YANGC_ASSERT(depth);
        --depth;
        filtered.push_back(instruction);
      }
    }
  }
  return filtered;
}

std::vector<std::string> top_level_keywords(const Blueprint& blueprint)
{
  std::vector<std::string> keywords;
  unsigned depth = 0;
  for (const BlueprintInstruction& instruction : blueprint) {
    if (instruction.enter) {
      if (depth == 0) {
        keywords.push_back(instruction.keyword);
      }
      ++depth;
    } else {
      --depth;
    }
  }
  return keywords;
}

}


/*****************************************************************************/
// Driver

YangCompiler::YangCompiler(const yang_fetch_fn_t& fetch,
                           yangc_trace_ctx_t* trace)
: fetch_(fetch),
  trace_(trace),
  own_trace_(false),
  log_level_(YANGC_LOG_LEVEL_ERROR)
{
  if (!trace_) {
    trace_ = yangc_trace_init();
    own_trace_ = true;
    set_log_level(YANGC_LOG_LEVEL_NONE);
  }
}

YangCompiler::~YangCompiler()
{
  if (own_trace_) {
    yangc_trace_ctx_close(trace_);
  }
}

void YangCompiler::set_log_level(yangc_log_level_t level)
{
  log_level_ = level;
  yangc_status_t status = yangc_trace_ctx_severity_set_all(
      trace_, yangc_trace_severity_for_log_level(level));
  YANGC_ASSERT(status == YANGC_STATUS_SUCCESS);
}

void YangCompiler::add_module(const std::string& name)
{
  for (const std::string& module : modules_) {
    if (module == name) {
      return;
    }
  }
  modules_.push_back(name);
}

void YangCompiler::add_module_text(const std::string& name, const std::string& text)
{
  texts_[name] = text;
}

void YangCompiler::reset_state()
{
  builder_.reset();
  grouping_state_.clear();
  resolved_typedefs_.clear();
  typedefs_in_progress_.clear();
  metadata_nodes_.clear();
  leafrefs_resolved_.clear();
  leafrefs_in_progress_.clear();
}

void YangCompiler::run_pass(const char* name, void (YangCompiler::*pass)())
{
  YANGC_TRACE_DEBUG(trace_, YANGC_TRACE_CATEGORY_RESOLVE, "Pass %s start", name);
  (this->*pass)();
  YANGC_TRACE_DEBUG(trace_, YANGC_TRACE_CATEGORY_RESOLVE, "Pass %s done", name);
}

void YangCompiler::parse_modules()
{
  builder_.reset(new SchemaBuilder(fetch_, trace_));
  for (const auto& text : texts_) {
    builder_->add_module_text(text.first, text.second);
  }
  for (const std::string& module : modules_) {
    builder_->register_module(module);
  }
  builder_->parse_all();
}

module_set_t YangCompiler::scan()
{
  if (modules_.empty()) {
    throw ModelProcessingError("No modules to compile");
  }

  BOOST_SCOPE_EXIT(this_) {
    this_->reset_state();
  } BOOST_SCOPE_EXIT_END

  try {
    parse_modules();
  } catch (const Error& e) {
    YANGC_TRACE_ERROR(trace_, YANGC_TRACE_CATEGORY_PARSE,
                      "Scan failed: %s", e.what());
    throw;
  }
  return builder_->module_set();
}

CompiledSchema::ptr_t YangCompiler::compile()
{
  if (modules_.empty()) {
    throw ModelProcessingError("No modules to compile");
  }

  BOOST_SCOPE_EXIT(this_) {
    this_->reset_state();
  } BOOST_SCOPE_EXIT_END

  try {
    parse_modules();

    run_pass("grouping expansion", &YangCompiler::expand_groupings);
    run_pass("augment", &YangCompiler::apply_augments);
    run_pass("deviation", &YangCompiler::apply_deviations);
    run_pass("replay", &YangCompiler::replay_blueprints);
    run_pass("typedef", &YangCompiler::resolve_typedefs);
    run_pass("range normalization", &YangCompiler::normalize_ranges);
    run_pass("identity", &YangCompiler::resolve_identities);
    run_pass("leafref", &YangCompiler::resolve_leafrefs);
    run_pass("config", &YangCompiler::inherit_config);
    run_pass("namespace", &YangCompiler::assign_namespaces);
    run_pass("cleanup", &YangCompiler::clear_blueprints);
    run_pass("metadata", &YangCompiler::extract_metadata);

    CompiledSchema::ptr_t schema = flatten();
    YANGC_TRACE_INFO(trace_, YANGC_TRACE_CATEGORY_RESOLVE,
                     "Compiled %zu modules into %zu nodes",
                     schema->modules().size(), schema->size());
    return schema;

  } catch (const Error& e) {
    YANGC_TRACE_ERROR(trace_, YANGC_TRACE_CATEGORY_RESOLVE,
                      "Compilation failed: %s", e.what());
    throw;
  }
}


/*****************************************************************************/
// Pass 1: grouping expansion

void YangCompiler::expand_groupings()
{
  expand_uses_in(builder_->root());
  for (BuildNode::ptr_t& augment : builder_->augments()) {
    expand_uses_in(augment.get());
  }

  insert_implicit_cases(builder_->root());
  for (BuildNode::ptr_t& augment : builder_->augments()) {
    insert_implicit_cases(augment.get());
  }
}

void YangCompiler::expand_grouping(BuildNode* grouping)
{
  int& state = grouping_state_[grouping];
  if (state == GROUPING_EXPANDED) {
    return;
  }
  if (state == GROUPING_EXPANDING) {
    throw ModelProcessingError("Grouping '" + grouping->name().to_string()
                               + "' uses itself", grouping->location());
  }

  state = GROUPING_EXPANDING;
  expand_uses_in(grouping);
  insert_implicit_cases(grouping);
  grouping_state_[grouping] = GROUPING_EXPANDED;
}

void YangCompiler::expand_uses_in(BuildNode* node)
{
  size_t i = 0;
  while (i < node->children().size()) {
    BuildNode* child = node->children()[i].get();
    if (child->stmt() == yang_stmt_t::USES) {
      i += expand_uses(node, i);
    } else {
      expand_uses_in(child);
      ++i;
    }
  }
}

size_t YangCompiler::expand_uses(BuildNode* parent, size_t index)
{
  BuildNode* uses = parent->children()[index].get();
  BuildNode* grouping = builder_->find_grouping(uses->name(), uses->scope);
  if (!grouping) {
    throw ModelProcessingError("Unknown grouping '" + uses->name().to_string() + "'",
                               uses->location());
  }
  expand_grouping(grouping);

  YANGC_TRACE_DEBUG(trace_, YANGC_TRACE_CATEGORY_RESOLVE, "Expanding uses %s",
                    uses->name().to_string().c_str());

  // The augments of this uses may themselves contain uses.
  for (const BuildNode::ptr_t& edit : uses->children()) {
    if (edit->stmt() == yang_stmt_t::AUGMENT) {
      expand_uses_in(edit.get());
      insert_implicit_cases(edit.get());
    }
  }

  std::string module;
  bool bind = enclosing_module(uses, &module);

  std::vector<BuildNode::ptr_t> edits = uses->release_children();
  for (const BuildNode::ptr_t& child : grouping->children()) {
    BuildNode::ptr_t copy = child->deep_copy();
    if (bind) {
      copy->bind_lazy(module);
    }
    uses->add_child(std::move(copy));
  }

  for (BuildNode::ptr_t& edit : edits) {
    if (bind) {
      edit->target_path.bind_lazy(module);
    }

    switch (edit->stmt()) {
      case yang_stmt_t::REFINE: {
        BuildNode* target = find_descendant(uses, edit->target_path);
        if (!target) {
          throw ModelProcessingError("Cannot find refine target '"
                                     + edit->target_path.to_string() + "'",
                                     edit->location());
        }
        target->blueprint.insert(target->blueprint.end(),
                                 edit->blueprint.begin(), edit->blueprint.end());
        break;
      }
      case yang_stmt_t::AUGMENT: {
        BuildNode* target = find_descendant(uses, edit->target_path);
        if (!target) {
          throw ModelProcessingError("Cannot find augment target '"
                                     + edit->target_path.to_string() + "'",
                                     edit->location());
        }
        graft(target, edit.get(), bind ? &module : nullptr);
        break;
      }
      default:
        break;
    }
  }

  BuildNode::ptr_t wrapper = parent->remove_child(uses);
  std::vector<BuildNode::ptr_t> expanded = wrapper->release_children();
  for (size_t i = 0; i < expanded.size(); ++i) {
    parent->insert_child(index + i, std::move(expanded[i]));
  }
  return expanded.size();
}

void YangCompiler::insert_implicit_cases(BuildNode* node)
{
  if (node->stmt() == yang_stmt_t::CHOICE) {
    for (size_t i = 0; i < node->children().size(); ++i) {
      BuildNode* child = node->children()[i].get();
      if (is_case_shorthand(child->stmt())) {
        BuildNode::ptr_t owned = node->remove_child(child);
        node->insert_child(i, wrap_in_case(std::move(owned)));
      }
    }
  }
  for (const BuildNode::ptr_t& child : node->children()) {
    insert_implicit_cases(child.get());
  }
}


/*****************************************************************************/
// Pass 2: augments

void YangCompiler::graft(BuildNode* target, const BuildNode* source, const std::string* module)
{
  for (const BuildNode::ptr_t& child : source->children()) {
    BuildNode::ptr_t copy = child->deep_copy();
    if (module) {
      copy->bind_lazy(*module);
    }
    if (target->stmt() == yang_stmt_t::CHOICE && is_case_shorthand(copy->stmt())) {
      copy = wrap_in_case(std::move(copy));
    }
    target->add_child(std::move(copy));
  }
}

void YangCompiler::apply_augments()
{
  std::vector<BuildNode::ptr_t> pending;
  pending.swap(builder_->augments());

  while (!pending.empty()) {
    std::vector<BuildNode::ptr_t> unresolved;
    bool progress = false;

    for (BuildNode::ptr_t& augment : pending) {
      BuildNode* target = find_descendant(builder_->root(), augment->target_path);
      if (!target) {
        unresolved.push_back(std::move(augment));
        continue;
      }
      YANGC_TRACE_DEBUG(trace_, YANGC_TRACE_CATEGORY_RESOLVE, "Augmenting %s",
                        augment->target_path.to_string().c_str());
      graft(target, augment.get(), nullptr);
      progress = true;
    }

    if (!progress) {
      const BuildNode* first = unresolved.front().get();
      throw ModelProcessingError("Augments cannot be resolved: "
                                 + first->target_path.to_string(),
                                 first->location());
    }
    pending.swap(unresolved);
  }
}


/*****************************************************************************/
// Pass 3: deviations

void YangCompiler::apply_deviations()
{
  for (const BuildNode::ptr_t& deviation : builder_->deviations()) {
    BuildNode* target = find_descendant(builder_->root(), deviation->target_path);
    if (!target) {
      throw ModelProcessingError("Cannot find deviation target '"
                                 + deviation->target_path.to_string() + "'",
                                 deviation->location());
    }

    for (const BuildNode::ptr_t& deviate : deviation->children()) {
      if (deviate->stmt() != yang_stmt_t::DEVIATE) {
        continue;
      }
      const std::string& kind = deviate->name().name();
      YANGC_TRACE_DEBUG(trace_, YANGC_TRACE_CATEGORY_RESOLVE, "Deviate %s %s",
                        kind.c_str(), deviation->target_path.to_string().c_str());

      if (kind == "not-supported") {
        BuildNode* parent = target->parent();
        YANGC_ASSERT(parent);
        parent->remove_child(target);
        target = nullptr;
        break;
      }

      if (kind == "add") {
        target->blueprint.insert(target->blueprint.end(),
                                 deviate->blueprint.begin(), deviate->blueprint.end());
      } else if (kind == "delete" || kind == "replace") {
        for (const std::string& keyword : top_level_keywords(deviate->blueprint)) {
          target->blueprint = filter_blueprint(target->blueprint, keyword);
        }
        if (kind == "replace") {
          target->blueprint.insert(target->blueprint.end(),
                                   deviate->blueprint.begin(), deviate->blueprint.end());
        }
      } else {
        throw ModelProcessingError("Unknown deviate statement '" + kind + "'",
                                   deviate->location());
      }
    }
  }
  builder_->deviations().clear();
}


/*****************************************************************************/
// Passes 9 to 12

namespace {

void set_config(BuildNode* node, bool parent_config)
{
  bool config = parent_config && (node->config ? *node->config : true);
  node->config = config;
  for (const BuildNode::ptr_t& child : node->children()) {
    set_config(child.get(), config);
  }
}

}

void YangCompiler::inherit_config()
{
  set_config(builder_->root(), true);
}

void YangCompiler::assign_namespaces()
{
  std::map<std::string, std::string> namespaces;
  for (const BuildNode::ptr_t& module : builder_->root()->children()) {
    if (module->stmt() == yang_stmt_t::MODULE && module->ns) {
      namespaces[module->name().module()] = *module->ns;
    }
  }

  visit_build_tree(builder_->root(), [&namespaces](BuildNode* node) {
    if (node->ns || !node->name().is_explicit()) {
      return;
    }
    auto it = namespaces.find(node->name().module());
    if (it != namespaces.end()) {
      node->ns = it->second;
    }
  });
}

void YangCompiler::clear_blueprints()
{
  visit_build_tree(builder_->root(), [](BuildNode* node) {
    Blueprint().swap(node->blueprint);
  });
}

void YangCompiler::extract_metadata()
{
  visit_build_tree(builder_->root(), [this](BuildNode* node) {
    size_t i = 0;
    while (i < node->children().size()) {
      BuildNode* child = node->children()[i].get();
      if (child->stmt() == yang_stmt_t::ANNOTATE) {
        metadata_nodes_.push_back(node->remove_child(child));
      } else {
        ++i;
      }
    }
  });
}


/*****************************************************************************/
// Pass 13: flattening

CompiledSchema::ptr_t YangCompiler::flatten()
{
  CompiledSchema::ptr_t schema(new CompiledSchema());
  flatten_node(schema.get(), builder_->root(), YANGC_SCHEMA_INDEX_NONE);

  for (BuildNode::ptr_t& node : metadata_nodes_) {
    MetadataAnnotation annotation;
    annotation.name = node->name();
    annotation.type = node->release_type();
    annotation.units = node->units;
    if (!annotation.type) {
      throw ModelProcessingError("Annotation '" + node->name().to_string()
                                 + "' has no type", node->location());
    }
    if (!annotation.type->is_resolved()) {
      throw InternalError("Unresolved type in schema: "
                          + annotation.type->display_name());
    }
    schema->add_metadata(std::move(annotation));
  }

  if (!schema->find_metadata("ietf-netconf", "operation")) {
    std::unique_ptr<EnumerationType> operation(new EnumerationType());
    for (const char* name : { "merge", "replace", "create", "delete", "remove" }) {
      operation->add_enum(name);
    }
    MetadataAnnotation annotation;
    annotation.name = Identifier("ietf-netconf", "operation");
    annotation.type.reset(operation.release());
    annotation.builtin = true;
    schema->add_metadata(std::move(annotation));
  }

  schema->set_modules(builder_->module_set());
  return schema;
}

void YangCompiler::flatten_node(CompiledSchema* schema, BuildNode* node, schema_index_t parent)
{
  CompactNode compact;
  compact.name = node->name();
  compact.flags = static_cast<uint32_t>(node->stmt());
  compact.parent = parent;

  if (node->presence) {
    compact.flags |= YANGC_SCHEMA_FLAG_PRESENCE;
  }
  if (node->user_ordered) {
    compact.flags |= YANGC_SCHEMA_FLAG_USER_ORDERED;
  }
  if (!node->config || *node->config) {
    compact.flags |= YANGC_SCHEMA_FLAG_CONFIG;
  }
  if (node->mandatory && *node->mandatory) {
    compact.flags |= YANGC_SCHEMA_FLAG_MANDATORY;
  }
  if (node->status) {
    yang_status_t status = yang_status_t::CURRENT;
    if (!yang_status_from_name(*node->status, &status)) {
      throw InternalError("Unchecked status '" + *node->status + "'");
    }
    compact.flags |= static_cast<uint32_t>(status) << YANGC_SCHEMA_FLAG_STATUS_SHIFT;
  }

  compact.type = node->release_type();
  if (compact.type && !compact.type->is_resolved()) {
    if (compact.type->kind() == yang_type_kind_t::LEAFREF) {
      throw InternalError("Unresolved leafref " + compact.type->display_name());
    }
    throw InternalError("Unresolved type in schema: " + compact.type->display_name());
  }
  compact.units = node->units;
  compact.ns = node->ns;
  compact.default_value = node->default_value;
  compact.keys = node->keys;
  compact.target_path = node->target_path;
  compact.identity_bases = node->identity_bases;
  compact.argument = node->argument;

  schema_index_t index = schema->append_node(std::move(compact));
  for (const BuildNode::ptr_t& child : node->children()) {
    flatten_node(schema, child.get(), index);
  }
}
