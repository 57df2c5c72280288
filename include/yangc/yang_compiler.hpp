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
 * @file yang_compiler.hpp
 *
 * Compile a set of YANG modules into a CompiledSchema.
 */

#ifndef YANGC_YANG_COMPILER_HPP_
#define YANGC_YANG_COMPILER_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "yang_builder.hpp"
#include "yang_schema.hpp"
#include "yangc_trace.h"

namespace yangc {

/*!
 * The compiler.  Modules are registered by name, and the source of
 * every module and submodule is obtained through the fetch function.
 * compile() either returns a fully resolved schema or throws; nothing
 * partially resolved is ever returned.
 *
 * @code
 * YangCompiler compiler(yangc_directory_fetcher({"/usr/share/yang"}));
 * compiler.add_module("ietf-interfaces");
 * CompiledSchema::ptr_t schema = compiler.compile();
 * @endcode
 */
class YangCompiler
{
 public:
  /*!
   * @param fetch Source retrieval.  May be empty if every module is
   *   added with add_module_text().
   * @param trace Trace context, not owned.  When nullptr the compiler
   *   owns a context whose level is set by set_log_level().
   */
  explicit YangCompiler(const yang_fetch_fn_t& fetch,
                        yangc_trace_ctx_t* trace = nullptr);
  ~YangCompiler();

  // Cannot copy
  YangCompiler(const YangCompiler&) = delete;
  YangCompiler& operator=(const YangCompiler&) = delete;

 public:
  void add_module(const std::string& name);

  //! Register source text for a module or submodule.
  void add_module_text(const std::string& name, const std::string& text);

  //! The registered module names, in registration order.
  const std::vector<std::string>& module_names() const { return modules_; }

  /*!
   * Run the pipeline over the registered modules.  Throws
   * ModelProcessingError or InternalError.
   */
  CompiledSchema::ptr_t compile();

  /*!
   * Parse the registered modules and everything they import or
   * include, without compiling.  The result is the module set a
   * compile() would report, which keys the schema cache.
   */
  module_set_t scan();

  void set_log_level(yangc_log_level_t level);
  yangc_log_level_t log_level() const { return log_level_; }

  yangc_trace_ctx_t* trace() const { return trace_; }

 private:
  void run_pass(const char* name, void (YangCompiler::*pass)());
  void parse_modules();
  void reset_state();

  // Pass 1
  void expand_groupings();
  void expand_grouping(BuildNode* grouping);
  void expand_uses_in(BuildNode* node);
  size_t expand_uses(BuildNode* parent, size_t index);
  void insert_implicit_cases(BuildNode* node);

  // Passes 2 and 3
  void apply_augments();
  void graft(BuildNode* target, const BuildNode* source, const std::string* module);
  void apply_deviations();

  // Pass 4
  void replay_blueprints();

  // Pass 5
  void resolve_typedefs();
  const YangType* resolve_typedef(const Identifier& name,
                                  yang_scope_t scope,
                                  const SourceLocation& location);
  YangType::ptr_t resolve_type(const YangType& type, const SourceLocation& location);
  void inherit_typedef_attributes(BuildNode* node, const UnresolvedType& ref);

  // Pass 6
  void normalize_ranges();

  // Pass 7
  void resolve_identities();

  // Pass 8
  void resolve_leafrefs();
  void resolve_node_leafrefs(BuildNode* node);
  void substitute_leafrefs(BuildNode* node, YangType::ptr_t* type);
  BuildNode* walk_leafref_path(BuildNode* node, const YangPath& path);

  // Passes 9 to 12
  void inherit_config();
  void assign_namespaces();
  void clear_blueprints();
  void extract_metadata();

  // Pass 13
  CompiledSchema::ptr_t flatten();
  void flatten_node(CompiledSchema* schema, BuildNode* node, schema_index_t parent);

 private:
  yang_fetch_fn_t fetch_;
  yangc_trace_ctx_t* trace_;
  bool own_trace_;
  yangc_log_level_t log_level_;
  std::vector<std::string> modules_;
  std::map<std::string, std::string> texts_;

  // Valid during compile()
  std::unique_ptr<SchemaBuilder> builder_;
  std::map<const BuildNode*, int> grouping_state_;
  std::map<const BuildNode*, YangType::ptr_t> resolved_typedefs_;
  std::set<const BuildNode*> typedefs_in_progress_;
  std::vector<BuildNode::ptr_t> metadata_nodes_;
  std::set<const BuildNode*> leafrefs_resolved_;
  std::set<const BuildNode*> leafrefs_in_progress_;
};

} // namespace yangc

#endif // YANGC_YANG_COMPILER_HPP_
