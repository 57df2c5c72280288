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
 * @file yang_builder.hpp
 *
 * The mutable statement tree built while parsing YANG source.
 * Structural statements become BuildNode objects; attribute statements
 * are recorded on the enclosing node as a blueprint and replayed once
 * the tree has its final shape.
 */

#ifndef YANGC_YANG_BUILDER_HPP_
#define YANGC_YANG_BUILDER_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "yang_errors.hpp"
#include "yang_identifier.hpp"
#include "yang_path.hpp"
#include "yang_schema.hpp"
#include "yang_stmt.hpp"
#include "yang_tokenizer.hpp"
#include "yang_type.hpp"
#include "yangc_trace.h"

namespace yangc {

/*!
 * Retrieve the source text of a module or submodule by name.  Throws
 * ModelProcessingError when the module cannot be found.
 */
typedef std::function<std::string(const std::string& name)> yang_fetch_fn_t;

/*!
 * One recorded attribute statement event.  Names and paths are parsed
 * when recorded, because the prefix map is only known at that time.
 */
struct BlueprintInstruction
{
  BlueprintInstruction()
  : enter(true),
    attr(yang_attr_t::OTHER),
    scope(YANGC_SCOPE_MODULE)
  {}

  bool enter;             //!< false for the leave event
  yang_attr_t attr;
  std::string keyword;
  std::string argument;
  Identifier identifier;  //!< type and base
  YangPath path;          //!< leafref path
  SourceLocation location;
  yang_scope_t scope;     //!< Innermost scope of the statement
};

typedef std::vector<BlueprintInstruction> Blueprint;

/*!
 * A node of the mutable statement tree.  A node is owned by exactly one
 * parent; detached nodes (groupings, typedefs, module level augments
 * and deviations) are owned by the SchemaBuilder.
 */
class BuildNode
{
 public:
  typedef std::unique_ptr<BuildNode> ptr_t;

  BuildNode(yang_stmt_t stmt,
            const Identifier& name,
            const SourceLocation& location);

  // Cannot copy
  BuildNode(const BuildNode&) = delete;
  BuildNode& operator=(const BuildNode&) = delete;

 public:
  yang_stmt_t stmt() const { return stmt_; }
  const Identifier& name() const { return name_; }
  Identifier& mutable_name() { return name_; }
  const SourceLocation& location() const { return location_; }

  BuildNode* parent() const { return parent_; }
  const std::vector<ptr_t>& children() const { return children_; }

  //! Append a child, taking ownership.
  BuildNode* add_child(ptr_t child);

  //! Insert a child before position index.
  BuildNode* insert_child(size_t index, ptr_t child);

  //! Detach a child, returning ownership to the caller.
  ptr_t remove_child(const BuildNode* child);

  //! Detach all children.
  std::vector<ptr_t> release_children();

  //! Position of child in children(), or children().size().
  size_t child_index(const BuildNode* child) const;

  //! First child of the given kind, or nullptr.
  BuildNode* find_child(yang_stmt_t stmt) const;

  /*!
   * Copy this node and its subtree.  The copy shares nothing with the
   * original and has no parent.
   */
  ptr_t deep_copy() const;

  //! Bind the lazy-bound names of this subtree to module.
  void bind_lazy(const std::string& module);

  YangType* type() const { return type_.get(); }
  void set_type(YangType::ptr_t type) { type_ = std::move(type); }
  YangType::ptr_t release_type() { return std::move(type_); }

 public:
  Blueprint blueprint;

  boost::optional<std::string> units;
  boost::optional<std::string> ns;
  boost::optional<std::string> default_value;
  boost::optional<bool> mandatory;
  boost::optional<bool> config;
  boost::optional<std::string> status;
  bool presence;
  bool user_ordered;
  std::vector<std::string> keys;
  std::vector<Identifier> identity_bases;
  YangPath target_path;  //!< augment, deviation and refine
  std::string argument;  //!< Extension statement argument
  yang_scope_t scope;    //!< Scope the statement appears in

 private:
  yang_stmt_t stmt_;
  Identifier name_;
  SourceLocation location_;
  BuildNode* parent_;
  std::vector<ptr_t> children_;
  YangType::ptr_t type_;
};

/*!
 * Call fn on node and every descendant, parents first.  fn may change
 * the children of the node it is called on.
 */
template <typename Fn>
void visit_build_tree(BuildNode* node, const Fn& fn)
{
  fn(node);
  for (size_t i = 0; i < node->children().size(); ++i) {
    visit_build_tree(node->children()[i].get(), fn);
  }
}


/*!
 * Holds everything parsed from a module set: the tree below the root,
 * the detached definitions and the module identities.  Modules named by
 * import statements are queued and parsed in turn, never recursively.
 */
class SchemaBuilder
{
 public:
  SchemaBuilder(const yang_fetch_fn_t& fetch,
                yangc_trace_ctx_t* trace);
  ~SchemaBuilder();

  // Cannot copy
  SchemaBuilder(const SchemaBuilder&) = delete;
  SchemaBuilder& operator=(const SchemaBuilder&) = delete;

 public:
  //! Source text used instead of the fetch function.
  void add_module_text(const std::string& name, const std::string& text);

  //! Queue a module for parsing, once.
  void register_module(const std::string& name);

  //! Parse queued modules until the queue is empty.
  void parse_all();

  /*!
   * Parse a submodule through an already active statement handler.
   * Returns false when the submodule was parsed before.
   */
  bool parse_submodule(const std::string& name, YangStatementHandler* handler);

  std::string fetch_text(const std::string& name);

  //! Open a new lexical scope nested in parent.
  yang_scope_t open_scope(yang_scope_t parent);

  /*!
   * Register a grouping or typedef defined in scope.  Names must be
   * unique within one scope; an inner definition hides an outer one.
   */
  void register_grouping(BuildNode::ptr_t grouping, yang_scope_t scope);
  void register_typedef(BuildNode::ptr_t type_def, yang_scope_t scope);
  void register_augment(BuildNode::ptr_t augment);
  void register_deviation(BuildNode::ptr_t deviation);

  //! Record a revision statement; the latest one is kept.
  void record_revision(const std::string& module,
                       const std::string& submodule,
                       const std::string& revision);

  BuildNode* root() const { return root_.get(); }

  //! Innermost definition visible from scope, or nullptr.
  BuildNode* find_grouping(const Identifier& name,
                           yang_scope_t scope = YANGC_SCOPE_MODULE) const;
  BuildNode* find_typedef(const Identifier& name,
                          yang_scope_t scope = YANGC_SCOPE_MODULE) const;
  const std::vector<BuildNode::ptr_t>& groupings() const { return groupings_; }
  const std::vector<BuildNode::ptr_t>& typedefs() const { return typedefs_; }
  std::vector<BuildNode::ptr_t>& augments() { return augments_; }
  std::vector<BuildNode::ptr_t>& deviations() { return deviations_; }

  //! Identities of the parsed modules, sorted by name.
  module_set_t module_set() const;

  yangc_trace_ctx_t* trace() const { return trace_; }

 private:
  typedef std::map<std::pair<yang_scope_t, Identifier>, BuildNode*> scoped_index_t;

  void parse_text(const std::string& name,
                  const std::string& text,
                  YangStatementHandler* handler);
  BuildNode* find_scoped(const scoped_index_t& index,
                         const Identifier& name,
                         yang_scope_t scope) const;

 private:
  yang_fetch_fn_t fetch_;
  yangc_trace_ctx_t* trace_;
  std::map<std::string, std::string> texts_;

  std::deque<std::string> queue_;
  std::set<std::string> registered_;
  std::set<std::string> parsed_submodules_;

  BuildNode::ptr_t root_;
  std::vector<BuildNode::ptr_t> groupings_;
  std::vector<BuildNode::ptr_t> typedefs_;
  std::vector<BuildNode::ptr_t> augments_;
  std::vector<BuildNode::ptr_t> deviations_;
  std::vector<yang_scope_t> scope_parents_;  //!< Indexed by scope
  scoped_index_t grouping_index_;
  scoped_index_t typedef_index_;
  std::map<std::string, ModuleIdentity> identities_;
};


/*!
 * Statement handler building one module, and the submodules it
 * includes, into a SchemaBuilder.
 */
class StatementBuilder
: public YangStatementHandler
{
 public:
  explicit StatementBuilder(SchemaBuilder* schema);

  // Cannot copy
  StatementBuilder(const StatementBuilder&) = delete;
  StatementBuilder& operator=(const StatementBuilder&) = delete;

 public:
  void enter(const std::string& keyword,
             const std::string& argument,
             bool has_argument,
             const SourceLocation& location) override;

  void leave(const std::string& keyword) override;

  const std::string& module() const { return module_; }

 private:
  void enter_structural(yang_stmt_t stmt,
                        const std::string& keyword,
                        const std::string& argument,
                        const SourceLocation& location);
  void enter_attribute(yang_attr_t attr,
                       const std::string& keyword,
                       const std::string& argument,
                       const SourceLocation& location);
  bool enter_extension(const std::string& keyword,
                       const std::string& argument,
                       const SourceLocation& location);

  void leave_structural(const std::string& keyword);
  void add_implicit_io(BuildNode* node, const char* keyword);

  Identifier identifier(const std::string& text,
                        bool force_module,
                        const SourceLocation& location) const;
  YangPath parse_path(const std::string& text,
                      yang_path_form_t form,
                      const ModuleRef& default_module,
                      const SourceLocation& location) const;
  void attach(BuildNode::ptr_t node);
  const prefix_map_t& prefixes() const { return prefix_stack_.back(); }
  BuildNode* top() const;
  yang_scope_t scope() const;

 private:
  SchemaBuilder* schema_;
  std::string module_;
  std::vector<prefix_map_t> prefix_stack_;
  std::vector<BuildNode*> path_;
  std::vector<yang_scope_t> scopes_;   //!< Parallel to path_
  std::vector<std::string> keywords_;  //!< Open statements, both kinds
  std::vector<bool> structural_;       //!< Parallel to keywords_
  unsigned grouping_depth_;
  unsigned skip_depth_;
};

} // namespace yangc

#endif // YANGC_YANG_BUILDER_HPP_
