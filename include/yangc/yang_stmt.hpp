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
 * @file yang_stmt.hpp
 *
 * Statement kinds of the schema tree and the attribute statements that
 * are recorded for later replay.
 */

#ifndef YANGC_YANG_STMT_HPP_
#define YANGC_YANG_STMT_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <cstdint>
#include <string>

namespace yangc {

/*!
 * Kind of a schema tree node.  The values are packed into the low
 * byte of the compact node flags and are stored in the cache, so they
 * must not be renumbered.
 */
enum class yang_stmt_t : uint8_t
{
  CONTAINER = 1,
  LIST,
  LEAF,
  LEAF_LIST,
  CHOICE,
  CASE,
  AUGMENT,
  USES,
  TYPEDEF,
  MODULE,
  SUBMODULE,
  GROUPING,
  IMPORT,
  IDENTITY,
  ACTION,
  ANYDATA,
  ANYXML,
  NOTIFICATION,
  RPC,
  INPUT,
  OUTPUT,
  DEVIATION,
  DEVIATE,
  ANNOTATE,    //!< md:annotation metadata definition
  BELONGS_TO,
  REFINE,
  EXTENDED,    //!< Vendor or foreign extension statement

  last_ = EXTENDED,
};

/*!
 * Attribute statements.  They do not create nodes; they are recorded
 * on the enclosing node and replayed once the tree shape is final.
 */
enum class yang_attr_t
{
  OTHER = 0,  //!< Recorded, no effect on replay
  TYPE,
  DEFAULT,
  CONFIG,
  MANDATORY,
  UNITS,
  PRESENCE,
  KEY,
  STATUS,
  ORDERED_BY,
  NAMESPACE,
  PREFIX,
  REVISION,
  INCLUDE,
  RANGE,
  LENGTH,
  FRACTION_DIGITS,
  PATTERN,
  ENUM,
  VALUE,
  BIT,
  POSITION,
  BASE,
  PATH,
  REQUIRE_INSTANCE,
  DESCRIPTION,
};

//! The YANG keyword of a statement kind.
const char* yang_stmt_keyword(yang_stmt_t stmt);

/*!
 * Look up the statement kind of a node creating keyword.  Returns
 * false for attribute statements and unknown keywords.  ANNOTATE and
 * EXTENDED are never returned: they come from extension keywords.
 */
bool yang_stmt_from_keyword(const std::string& keyword, yang_stmt_t* stmt);

/*!
 * Look up an attribute statement.  Returns false for keywords that are
 * neither attributes nor node creating statements; those are skipped
 * with their substatements.
 */
bool yang_attr_from_keyword(const std::string& keyword, yang_attr_t* attr);

//! Check for a valid stored statement kind value.
bool yang_stmt_is_valid(unsigned value);

//! Nodes that appear in a schema node path.
bool yang_stmt_is_schema_node(yang_stmt_t stmt);

//! Schema nodes that are instantiated in data trees.
bool yang_stmt_is_data_node(yang_stmt_t stmt);

} // namespace yangc

#endif // YANGC_YANG_STMT_HPP_
