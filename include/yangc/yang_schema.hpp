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
 * @file yang_schema.hpp
 *
 * The compiled schema: one array of compact nodes linked by index.
 * A compiled schema is immutable once returned by the compiler and may
 * be read from any number of threads.
 */

#ifndef YANGC_YANG_SCHEMA_HPP_
#define YANGC_YANG_SCHEMA_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <cstdint>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "yang_identifier.hpp"
#include "yang_path.hpp"
#include "yang_stmt.hpp"
#include "yang_type.hpp"
#include "yangc_status.h"

namespace yangc {

typedef uint32_t schema_index_t;

//! No node.
static const schema_index_t YANGC_SCHEMA_INDEX_NONE = 0xffffffff;

/*!
 * Compact node flag word.
 */
enum yang_schema_flag_t : uint32_t
{
  YANGC_SCHEMA_FLAG_STMT_MASK    = 0x000000ff, //!< yang_stmt_t
  YANGC_SCHEMA_FLAG_PRESENCE     = 1u << 8,
  YANGC_SCHEMA_FLAG_USER_ORDERED = 1u << 9,
  YANGC_SCHEMA_FLAG_CONFIG       = 1u << 10,
  YANGC_SCHEMA_FLAG_MANDATORY    = 1u << 11,
  YANGC_SCHEMA_FLAG_STATUS_MASK  = 3u << 12,   //!< yang_status_t
  YANGC_SCHEMA_FLAG_ALL          = 0x00003fff,
};

static const unsigned YANGC_SCHEMA_FLAG_STATUS_SHIFT = 12;

enum class yang_status_t
{
  CURRENT = 0,
  DEPRECATED = 1,
  OBSOLETE = 2,
};

const char* yang_status_name(yang_status_t status);
bool yang_status_from_name(const std::string& name, yang_status_t* status);

/*!
 * Identity of a compiled module: the latest revision of the module and
 * of each of its submodules.  The cache digest is computed from these.
 */
struct ModuleIdentity
{
  std::string name;
  std::string revision;
  std::map<std::string, std::string> submodules; //!< name to revision

  bool operator==(const ModuleIdentity& other) const;
};

typedef std::vector<ModuleIdentity> module_set_t;

/*!
 * One node of the compiled schema.
 */
struct CompactNode
{
  CompactNode()
  : flags(0),
    parent(YANGC_SCHEMA_INDEX_NONE)
  {}

  yang_stmt_t stmt() const
  {
    return static_cast<yang_stmt_t>(flags & YANGC_SCHEMA_FLAG_STMT_MASK);
  }
  bool is_presence() const { return flags & YANGC_SCHEMA_FLAG_PRESENCE; }
  bool is_user_ordered() const { return flags & YANGC_SCHEMA_FLAG_USER_ORDERED; }
  bool is_config() const { return flags & YANGC_SCHEMA_FLAG_CONFIG; }
  bool is_mandatory() const { return flags & YANGC_SCHEMA_FLAG_MANDATORY; }
  yang_status_t status() const
  {
    return static_cast<yang_status_t>(
        (flags & YANGC_SCHEMA_FLAG_STATUS_MASK) >> YANGC_SCHEMA_FLAG_STATUS_SHIFT);
  }

  Identifier name;
  uint32_t flags;
  schema_index_t parent;
  std::vector<schema_index_t> children;

  YangType::ptr_t type;  //!< Leaf and leaf-list only
  boost::optional<std::string> units;
  boost::optional<std::string> ns;
  boost::optional<std::string> default_value;
  std::vector<std::string> keys;
  YangPath target_path;
  std::vector<Identifier> identity_bases;
  std::string argument;  //!< Extension statement argument
};

/*!
 * A metadata annotation definition lifted out of the data tree.
 */
struct MetadataAnnotation
{
  MetadataAnnotation()
  : builtin(false)
  {}

  Identifier name;
  YangType::ptr_t type;
  boost::optional<std::string> units;
  bool builtin; //!< Registered by the compiler rather than declared
};

class YangCompiler;
class SchemaCache;

/*!
 * The compiled schema.  Node 0 is the root; every other node has a
 * parent index and appears once in its parent's children.  Derived
 * schemas are produced by explicit deep copies.
 */
class CompiledSchema
{
 public:
  typedef std::unique_ptr<CompiledSchema> ptr_t;

  static const schema_index_t ROOT = 0;

  CompiledSchema() {}

  // Cannot copy
  CompiledSchema(const CompiledSchema&) = delete;
  CompiledSchema& operator=(const CompiledSchema&) = delete;

 public:
  schema_index_t root() const { return ROOT; }
  size_t size() const { return nodes_.size(); }
  const CompactNode& node(schema_index_t index) const;
  const std::vector<schema_index_t>& children(schema_index_t index) const;
  schema_index_t parent(schema_index_t index) const;

  /*!
   * Find a schema child of parent by name, looking through module and
   * submodule nodes.  An empty module matches any module.
   */
  schema_index_t find_child(schema_index_t parent,
                            const std::string& module,
                            const std::string& name) const;

  /*!
   * Find a node by "/module:name/name".  A step without a module takes
   * the module of the previous step; the first may match any module.
   * Returns YANGC_SCHEMA_INDEX_NONE for unknown or malformed paths.
   */
  schema_index_t find_path(const std::string& path) const;

  const std::vector<MetadataAnnotation>& metadata() const { return metadata_; }
  const MetadataAnnotation* find_metadata(const std::string& module,
                                          const std::string& name) const;

  const module_set_t& modules() const { return modules_; }

  //! An independent copy of the whole schema.
  ptr_t deep_copy() const;

  /*!
   * An independent schema whose root is a copy of the subtree at index.
   * The metadata table and module set are copied along.
   */
  ptr_t copy_subtree(schema_index_t index) const;

  //! Check the index links.  Used on data read back from the cache.
  yangc_status_t validate() const;

  bool equals(const CompiledSchema& other) const;

 private:
  friend class YangCompiler;
  friend class SchemaCache;

  schema_index_t append_node(CompactNode&& node);
  CompactNode& mutable_node(schema_index_t index) { return nodes_[index]; }
  void add_metadata(MetadataAnnotation&& annotation);
  void set_modules(const module_set_t& modules) { modules_ = modules; }
  schema_index_t copy_node(const CompiledSchema& from,
                           schema_index_t index,
                           schema_index_t parent);

 private:
  std::vector<CompactNode> nodes_;
  std::vector<MetadataAnnotation> metadata_;
  module_set_t modules_;
};

/*!
 * Write an indented text rendering of the tree below index.
 */
void yangc_schema_dump(const CompiledSchema& schema,
                       schema_index_t index,
                       unsigned indent,
                       std::ostream& os);

} // namespace yangc

#endif // YANGC_YANG_SCHEMA_HPP_
