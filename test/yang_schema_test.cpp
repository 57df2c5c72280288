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



/**
 * @file yang_schema_test.cpp
 * @brief Tests of the compiled schema reader
 */

#include <sstream>
#include <string>

#include "yangc_ut.h"
#include "yang_compiler.hpp"
#include "yang_schema.hpp"

using namespace yangc;

static const char* const USERS =
  "module users {\n"
  "  namespace \"urn:users\";\n"
  "  prefix u;\n"
  "  container sys {\n"
  "    presence \"enables user management\";\n"
  "    list user {\n"
  "      key \"name\";\n"
  "      ordered-by user;\n"
  "      leaf name { type string; mandatory true; }\n"
  "      leaf role {\n"
  "        type enumeration { enum admin; enum guest; }\n"
  "        default guest;\n"
  "        status deprecated;\n"
  "      }\n"
  "      leaf-list tags { type string; units chars; config false; }\n"
  "    }\n"
  "  }\n"
  "}\n";

class CompiledSchemaTest
: public ::testing::Test
{
 protected:
  void SetUp() override
  {
    fetcher_.add("users", USERS);
    YangCompiler compiler(fetcher_.fetch_fn());
    compiler.add_module("users");
    schema_ = compiler.compile();
  }

  MemoryFetcher fetcher_;
  CompiledSchema::ptr_t schema_;
};

TEST_F(CompiledSchemaTest, FindPath)
{
  TEST_DESCRIPTION("Paths resolve through modules and carry the module forward");

  schema_index_t sys = schema_->find_path("/users:sys");
  ASSERT_NE(YANGC_SCHEMA_INDEX_NONE, sys);
  EXPECT_EQ(Identifier("users", "sys"), schema_->node(sys).name);
  EXPECT_EQ(sys, schema_->find_child(schema_->root(), "", "sys"));
  EXPECT_EQ(sys, schema_->find_child(schema_->root(), "users", "sys"));
  EXPECT_EQ(YANGC_SCHEMA_INDEX_NONE, schema_->find_child(schema_->root(), "other", "sys"));

  schema_index_t name = schema_->find_path("/users:sys/user/name");
  ASSERT_NE(YANGC_SCHEMA_INDEX_NONE, name);
  EXPECT_EQ(name, schema_->find_path("/sys/user/users:name"));
  EXPECT_EQ(schema_->find_path("/users:sys/user"), schema_->parent(name));
  EXPECT_EQ(YANGC_SCHEMA_INDEX_NONE, schema_->parent(schema_->root()));

  for (const char* bad : { "", "users:sys", "/users:sys//user", "/:sys",
                           "/users:a:b", "/users:sys/nobody", "/other:sys" }) {
    EXPECT_EQ(YANGC_SCHEMA_INDEX_NONE, schema_->find_path(bad)) << bad;
  }
}

TEST_F(CompiledSchemaTest, Flags)
{
  const CompactNode& sys = schema_->node(schema_->find_path("/users:sys"));
  EXPECT_EQ(yang_stmt_t::CONTAINER, sys.stmt());
  EXPECT_TRUE(sys.is_presence());
  EXPECT_TRUE(sys.is_config());

  const CompactNode& user = schema_->node(schema_->find_path("/users:sys/user"));
  EXPECT_TRUE(user.is_user_ordered());
  EXPECT_FALSE(user.is_presence());

  const CompactNode& role = schema_->node(schema_->find_path("/users:sys/user/role"));
  EXPECT_EQ(yang_status_t::DEPRECATED, role.status());
  EXPECT_FALSE(role.is_mandatory());

  const CompactNode& name = schema_->node(schema_->find_path("/users:sys/user/name"));
  EXPECT_TRUE(name.is_mandatory());
  EXPECT_EQ(yang_status_t::CURRENT, name.status());
}

TEST_F(CompiledSchemaTest, Dump)
{
  TEST_DESCRIPTION("The dump shows one line per node with its attributes");

  std::ostringstream os;
  yangc_schema_dump(*schema_, schema_->find_path("/users:sys"), 0, os);
  EXPECT_EQ("container users:sys rw presence\n"
            "  list users:user key[name] rw user-ordered\n"
            "    leaf users:name : string rw mandatory\n"
            "    leaf users:role : enumeration[admin|guest] default=guest rw deprecated\n"
            "    leaf-list users:tags : string units=chars ro\n",
            os.str());
}

TEST_F(CompiledSchemaTest, Copies)
{
  TEST_DESCRIPTION("Copies are independent and structurally equal");

  ASSERT_EQ(YANGC_STATUS_SUCCESS, schema_->validate());

  CompiledSchema::ptr_t copy = schema_->deep_copy();
  EXPECT_TRUE(copy->equals(*schema_));
  EXPECT_EQ(YANGC_STATUS_SUCCESS, copy->validate());

  schema_index_t role = schema_->find_path("/users:sys/user/role");
  EXPECT_NE(schema_->node(role).type.get(), copy->node(role).type.get());

  CompiledSchema::ptr_t subtree = schema_->copy_subtree(schema_->find_path("/users:sys/user"));
  EXPECT_EQ(YANGC_STATUS_SUCCESS, subtree->validate());
  EXPECT_EQ(4u, subtree->size());
  EXPECT_EQ(Identifier("users", "user"), subtree->node(subtree->root()).name);
  EXPECT_EQ(YANGC_SCHEMA_INDEX_NONE, subtree->parent(subtree->root()));
  EXPECT_NE(YANGC_SCHEMA_INDEX_NONE, subtree->find_path("/users:tags"));
  EXPECT_EQ(schema_->metadata().size(), subtree->metadata().size());
  EXPECT_EQ(schema_->modules(), subtree->modules());
  EXPECT_FALSE(subtree->equals(*schema_));
}

TEST(CompiledSchema, Empty)
{
  CompiledSchema schema;
  EXPECT_EQ(0u, schema.size());
  EXPECT_EQ(YANGC_STATUS_FAILURE, schema.validate());
  EXPECT_EQ(YANGC_SCHEMA_INDEX_NONE, schema.find_path("/a"));
  EXPECT_TRUE(schema.find_metadata("ietf-netconf", "operation") == nullptr);
}

TEST(YangStmt, Keywords)
{
  yang_stmt_t stmt;
  ASSERT_TRUE(yang_stmt_from_keyword("leaf-list", &stmt));
  EXPECT_EQ(yang_stmt_t::LEAF_LIST, stmt);
  EXPECT_STREQ("leaf-list", yang_stmt_keyword(stmt));
  EXPECT_FALSE(yang_stmt_from_keyword("annotation", &stmt));
  EXPECT_FALSE(yang_stmt_from_keyword("type", &stmt));

  yang_attr_t attr;
  ASSERT_TRUE(yang_attr_from_keyword("must", &attr));
  EXPECT_EQ(yang_attr_t::OTHER, attr);
  ASSERT_TRUE(yang_attr_from_keyword("fraction-digits", &attr));
  EXPECT_EQ(yang_attr_t::FRACTION_DIGITS, attr);
  EXPECT_FALSE(yang_attr_from_keyword("when", &attr));

  EXPECT_FALSE(yang_stmt_is_valid(0));
  EXPECT_TRUE(yang_stmt_is_valid(static_cast<unsigned>(yang_stmt_t::EXTENDED)));
  EXPECT_FALSE(yang_stmt_is_valid(static_cast<unsigned>(yang_stmt_t::last_) + 1));

  EXPECT_TRUE(yang_stmt_is_schema_node(yang_stmt_t::CASE));
  EXPECT_FALSE(yang_stmt_is_data_node(yang_stmt_t::CASE));
  EXPECT_FALSE(yang_stmt_is_schema_node(yang_stmt_t::GROUPING));

  yang_status_t status;
  ASSERT_TRUE(yang_status_from_name("obsolete", &status));
  EXPECT_EQ(yang_status_t::OBSOLETE, status);
  EXPECT_STREQ("deprecated", yang_status_name(yang_status_t::DEPRECATED));
  EXPECT_FALSE(yang_status_from_name("retired", &status));
}
