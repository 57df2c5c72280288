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
 * @file yang_stmt.cpp
 */

#include "yang_stmt.hpp"

using namespace yangc;

namespace {

struct StmtKeyword
{
  yang_stmt_t stmt;
  const char* keyword;
  bool from_keyword;
};

const StmtKeyword stmt_table[] = {
  { yang_stmt_t::CONTAINER,    "container",    true },
  { yang_stmt_t::LIST,         "list",         true },
  { yang_stmt_t::LEAF,         "leaf",         true },
  { yang_stmt_t::LEAF_LIST,    "leaf-list",    true },
  { yang_stmt_t::CHOICE,       "choice",       true },
  { yang_stmt_t::CASE,         "case",         true },
  { yang_stmt_t::AUGMENT,      "augment",      true },
  { yang_stmt_t::USES,         "uses",         true },
  { yang_stmt_t::TYPEDEF,      "typedef",      true },
  { yang_stmt_t::MODULE,       "module",       true },
  { yang_stmt_t::SUBMODULE,    "submodule",    true },
  { yang_stmt_t::GROUPING,     "grouping",     true },
  { yang_stmt_t::IMPORT,       "import",       true },
  { yang_stmt_t::IDENTITY,     "identity",     true },
  { yang_stmt_t::ACTION,       "action",       true },
  { yang_stmt_t::ANYDATA,      "anydata",      true },
  { yang_stmt_t::ANYXML,       "anyxml",       true },
  { yang_stmt_t::NOTIFICATION, "notification", true },
  { yang_stmt_t::RPC,          "rpc",          true },
  { yang_stmt_t::INPUT,        "input",        true },
  { yang_stmt_t::OUTPUT,       "output",       true },
  { yang_stmt_t::DEVIATION,    "deviation",    true },
  { yang_stmt_t::DEVIATE,      "deviate",      true },
  { yang_stmt_t::ANNOTATE,     "annotation",   false },
  { yang_stmt_t::BELONGS_TO,   "belongs-to",   true },
  { yang_stmt_t::REFINE,       "refine",       true },
  { yang_stmt_t::EXTENDED,     "extension",    false },
};

struct AttrKeyword
{
  yang_attr_t attr;
  const char* keyword;
};

const AttrKeyword attr_table[] = {
  { yang_attr_t::TYPE,             "type" },
  { yang_attr_t::DEFAULT,          "default" },
  { yang_attr_t::CONFIG,           "config" },
  { yang_attr_t::MANDATORY,        "mandatory" },
  { yang_attr_t::UNITS,            "units" },
  { yang_attr_t::PRESENCE,         "presence" },
  { yang_attr_t::KEY,              "key" },
  { yang_attr_t::STATUS,           "status" },
  { yang_attr_t::ORDERED_BY,       "ordered-by" },
  { yang_attr_t::NAMESPACE,        "namespace" },
  { yang_attr_t::PREFIX,           "prefix" },
  { yang_attr_t::REVISION,         "revision" },
  { yang_attr_t::INCLUDE,          "include" },
  { yang_attr_t::RANGE,            "range" },
  { yang_attr_t::LENGTH,           "length" },
  { yang_attr_t::FRACTION_DIGITS,  "fraction-digits" },
  { yang_attr_t::PATTERN,          "pattern" },
  { yang_attr_t::ENUM,             "enum" },
  { yang_attr_t::VALUE,            "value" },
  { yang_attr_t::BIT,              "bit" },
  { yang_attr_t::POSITION,         "position" },
  { yang_attr_t::BASE,             "base" },
  { yang_attr_t::PATH,             "path" },
  { yang_attr_t::REQUIRE_INSTANCE, "require-instance" },
  { yang_attr_t::DESCRIPTION,      "description" },
  { yang_attr_t::OTHER,            "argument" },
  { yang_attr_t::OTHER,            "contact" },
  { yang_attr_t::OTHER,            "feature" },
  { yang_attr_t::OTHER,            "if-feature" },
  { yang_attr_t::OTHER,            "max-elements" },
  { yang_attr_t::OTHER,            "min-elements" },
  { yang_attr_t::OTHER,            "modifier" },
  { yang_attr_t::OTHER,            "must" },
  { yang_attr_t::OTHER,            "organization" },
  { yang_attr_t::OTHER,            "reference" },
  { yang_attr_t::OTHER,            "revision-date" },
  { yang_attr_t::OTHER,            "unique" },
  { yang_attr_t::OTHER,            "yang-version" },
  { yang_attr_t::OTHER,            "yin-element" },
};

}

const char* yangc::yang_stmt_keyword(yang_stmt_t stmt)
{
  for (const StmtKeyword& entry : stmt_table) {
    if (entry.stmt == stmt) {
      return entry.keyword;
    }
  }
  return "unknown";
}

bool yangc::yang_stmt_from_keyword(const std::string& keyword, yang_stmt_t* stmt)
{
  for (const StmtKeyword& entry : stmt_table) {
    if (entry.from_keyword && keyword == entry.keyword) {
      *stmt = entry.stmt;
      return true;
    }
  }
  return false;
}

bool yangc::yang_attr_from_keyword(const std::string& keyword, yang_attr_t* attr)
{
  for (const AttrKeyword& entry : attr_table) {
    if (keyword == entry.keyword) {
      *attr = entry.attr;
      return true;
    }
  }
  return false;
}

bool yangc::yang_stmt_is_valid(unsigned value)
{
  return value >= static_cast<unsigned>(yang_stmt_t::CONTAINER)
         && value <= static_cast<unsigned>(yang_stmt_t::last_);
}

bool yangc::yang_stmt_is_schema_node(yang_stmt_t stmt)
{
  switch (stmt) {
    case yang_stmt_t::CONTAINER:
    case yang_stmt_t::LIST:
    case yang_stmt_t::LEAF:
    case yang_stmt_t::LEAF_LIST:
    case yang_stmt_t::CHOICE:
    case yang_stmt_t::CASE:
    case yang_stmt_t::ACTION:
    case yang_stmt_t::ANYDATA:
    case yang_stmt_t::ANYXML:
    case yang_stmt_t::NOTIFICATION:
    case yang_stmt_t::RPC:
    case yang_stmt_t::INPUT:
    case yang_stmt_t::OUTPUT:
      return true;
    default:
      break;
  }
  return false;
}

bool yangc::yang_stmt_is_data_node(yang_stmt_t stmt)
{
  return yang_stmt_is_schema_node(stmt)
         && stmt != yang_stmt_t::CHOICE
         && stmt != yang_stmt_t::CASE;
}
