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
 * @file yang_builder_test.cpp
 * @brief Tests of the statement tree builder
 */

#include <string>

#include "yangc_ut.h"

using namespace yangc;
using ::testing::ElementsAre;

static const char* const MODULE_M =
  "module m {\n"
  "  namespace \"urn:m\";\n"
  "  prefix m;\n"
  "  import n { prefix n; }\n"
  "  revision 2020-01-01;\n"
  "  revision 2021-02-02 { description \"second\"; }\n"
  "  container c {\n"
  "    leaf l { type string; default \"a\"; }\n"
  "  }\n"
  "  grouping g {\n"
  "    leaf x { type n:counter; }\n"
  "  }\n"
  "  augment \"/n:top\" {\n"
  "    leaf extra { type int8; }\n"
  "  }\n"
  "  deviation \"/m:c/m:l\" { deviate not-supported; }\n"
  "}\n";

static const char* const MODULE_N =
  "module n {\n"
  "  namespace \"urn:n\";\n"
  "  prefix n;\n"
  "  typedef counter { type uint32; }\n"
  "  container top;\n"
  "}\n";

static std::vector<std::string> child_names(const BuildNode* node)
{
  std::vector<std::string> names;
  for (const BuildNode::ptr_t& child : node->children()) {
    names.push_back(std::string(yang_stmt_keyword(child->stmt())) + " "
                    + child->name().to_string());
  }
  return names;
}

TEST(YangBuilder, ModuleTree)
{
  TEST_DESCRIPTION("Modules and their imports hang below the root");

  MemoryFetcher fetcher;
  fetcher.add("m", MODULE_M);
  fetcher.add("n", MODULE_N);

  SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
  builder.register_module("m");
  builder.register_module("m");
  builder.parse_all();

  EXPECT_THAT(fetcher.fetched(), ElementsAre("m", "n"));
  EXPECT_THAT(child_names(builder.root()), ElementsAre("module m:m", "module n:n"));

  const BuildNode* m = builder.root()->children()[0].get();
  EXPECT_THAT(child_names(m), ElementsAre("import n:n", "container m:c"));

  const BuildNode* c = m->children()[1].get();
  ASSERT_EQ(1u, c->children().size());
  const BuildNode* l = c->children()[0].get();
  EXPECT_EQ(Identifier("m", "l"), l->name());
  EXPECT_EQ(8, l->location().line);
  EXPECT_EQ("m.yang", l->location().filename);
}

TEST(YangBuilder, Blueprint)
{
  TEST_DESCRIPTION("Attribute statements are recorded as enter and leave events");

  MemoryFetcher fetcher;
  fetcher.add("m", MODULE_M);
  fetcher.add("n", MODULE_N);

  SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
  builder.register_module("m");
  builder.parse_all();

  const BuildNode* l = builder.root()->children()[0]->children()[1]->children()[0].get();
  const Blueprint& blueprint = l->blueprint;
  ASSERT_EQ(4u, blueprint.size());
  EXPECT_TRUE(blueprint[0].enter);
  EXPECT_EQ(yang_attr_t::TYPE, blueprint[0].attr);
  EXPECT_EQ(Identifier::builtin("string"), blueprint[0].identifier);
  EXPECT_FALSE(blueprint[1].enter);
  EXPECT_EQ("type", blueprint[1].keyword);
  EXPECT_EQ(yang_attr_t::DEFAULT, blueprint[2].attr);
  EXPECT_EQ("a", blueprint[2].argument);
  EXPECT_FALSE(blueprint[3].enter);
}

TEST(YangBuilder, DetachedDefinitions)
{
  TEST_DESCRIPTION("Groupings, typedefs, augments and deviations are kept apart");

  MemoryFetcher fetcher;
  fetcher.add("m", MODULE_M);
  fetcher.add("n", MODULE_N);

  SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
  builder.register_module("m");
  builder.parse_all();

  const BuildNode* g = builder.find_grouping(Identifier("m", "g"));
  ASSERT_NE(nullptr, g);
  ASSERT_EQ(1u, g->children().size());
  EXPECT_EQ(Identifier::lazy_bound("x"), g->children()[0]->name());
  EXPECT_EQ(Identifier("n", "counter"), g->children()[0]->blueprint[0].identifier);
  EXPECT_TRUE(builder.find_grouping(Identifier("n", "g")) == nullptr);

  EXPECT_NE(nullptr, builder.find_typedef(Identifier("n", "counter")));
  EXPECT_EQ(1u, builder.typedefs().size());

  ASSERT_EQ(1u, builder.augments().size());
  EXPECT_EQ("/n:top", builder.augments()[0]->target_path.to_string());
  EXPECT_EQ(1u, builder.augments()[0]->children().size());

  ASSERT_EQ(1u, builder.deviations().size());
  const BuildNode* deviation = builder.deviations()[0].get();
  EXPECT_EQ("/m:c/m:l", deviation->target_path.to_string());
  ASSERT_EQ(1u, deviation->children().size());
  EXPECT_EQ(Identifier::builtin("not-supported"), deviation->children()[0]->name());
}

TEST(YangBuilder, DefinitionScopes)
{
  TEST_DESCRIPTION("Nested typedefs and groupings are indexed by their scope");

  MemoryFetcher fetcher;
  fetcher.add("m",
    "module m {\n"
    "  prefix m;\n"
    "  typedef t { type uint8; }\n"
    "  container a {\n"
    "    typedef t { type string; }\n"
    "    leaf x { type t; }\n"
    "  }\n"
    "  container b {\n"
    "    typedef t { type int8; }\n"
    "    grouping g { leaf y { type t; } }\n"
    "    uses g;\n"
    "  }\n"
    "  leaf z { type t; }\n"
    "}\n");

  SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
  builder.register_module("m");
  builder.parse_all();
  EXPECT_EQ(3u, builder.typedefs().size());

  const Identifier t("m", "t");
  const BuildNode* module = builder.root()->children()[0].get();
  ASSERT_EQ(3u, module->children().size());

  const BuildNode* x = module->children()[0]->children()[0].get();
  EXPECT_EQ(5, builder.find_typedef(t, x->blueprint[0].scope)->location().line);

  const BuildNode* uses = module->children()[1]->children()[0].get();
  ASSERT_EQ(yang_stmt_t::USES, uses->stmt());
  const BuildNode* g = builder.find_grouping(Identifier("m", "g"), uses->scope);
  ASSERT_NE(nullptr, g);
  EXPECT_EQ(9, builder.find_typedef(t, g->children()[0]->blueprint[0].scope)->location().line);
  EXPECT_TRUE(builder.find_grouping(Identifier("m", "g")) == nullptr);
  EXPECT_TRUE(builder.find_grouping(Identifier("m", "g"), x->scope) == nullptr);

  const BuildNode* z = module->children()[2].get();
  EXPECT_EQ(YANGC_SCOPE_MODULE, z->scope);
  EXPECT_EQ(3, builder.find_typedef(t, z->blueprint[0].scope)->location().line);
  EXPECT_EQ(3, builder.find_typedef(t)->location().line);

  BuildNode::ptr_t copy = uses->deep_copy();
  EXPECT_EQ(uses->scope, copy->scope);
}

TEST(YangBuilder, ModuleSet)
{
  TEST_DESCRIPTION("Module identities carry the latest revision");

  MemoryFetcher fetcher;
  fetcher.add("m", MODULE_M);
  fetcher.add("n", MODULE_N);

  SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
  builder.register_module("m");
  builder.parse_all();

  module_set_t modules = builder.module_set();
  ASSERT_EQ(2u, modules.size());
  EXPECT_EQ("m", modules[0].name);
  EXPECT_EQ("2021-02-02", modules[0].revision);
  EXPECT_EQ("n", modules[1].name);
  EXPECT_EQ("", modules[1].revision);
}

TEST(YangBuilder, Submodule)
{
  TEST_DESCRIPTION("Included submodules are parsed into their module");

  MemoryFetcher fetcher;
  fetcher.add("m",
              "module m { prefix m; include s; include s; container mc; }");
  fetcher.add("s",
              "submodule s {\n"
              "  belongs-to m { prefix mm; }\n"
              "  revision 2019-05-05;\n"
              "  container sc { uses mm:sg; }\n"
              "  grouping sg { leaf y { type string; } }\n"
              "}\n");

  SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
  builder.register_module("m");
  builder.parse_all();

  EXPECT_THAT(fetcher.fetched(), ElementsAre("m", "s"));
  const BuildNode* m = builder.root()->children()[0].get();
  EXPECT_THAT(child_names(m), ElementsAre("submodule m:s", "container m:mc"));
  EXPECT_THAT(child_names(m->children()[0].get()),
              ElementsAre("belongs-to m:m", "container m:sc"));

  const BuildNode* sc = m->children()[0]->children()[1].get();
  EXPECT_EQ(Identifier("m", "sg"), sc->children()[0]->name());
  EXPECT_NE(nullptr, builder.find_grouping(Identifier("m", "sg")));

  module_set_t modules = builder.module_set();
  ASSERT_EQ(1u, modules.size());
  EXPECT_EQ("2019-05-05", modules[0].submodules["s"]);
}

TEST(YangBuilder, RpcInputOutput)
{
  TEST_DESCRIPTION("Operations always carry input and output");

  MemoryFetcher fetcher;
  fetcher.add("m",
              "module m { prefix m;\n"
              "  rpc reset { input { leaf force { type boolean; } } }\n"
              "  container c { action ping; }\n"
              "}\n");

  SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
  builder.register_module("m");
  builder.parse_all();

  const BuildNode* m = builder.root()->children()[0].get();
  const BuildNode* rpc = m->children()[0].get();
  EXPECT_THAT(child_names(rpc), ElementsAre("input m:input", "output m:output"));
  EXPECT_EQ(1u, rpc->children()[0]->children().size());
  EXPECT_EQ(0u, rpc->children()[1]->children().size());

  const BuildNode* action = m->children()[1]->children()[0].get();
  EXPECT_THAT(child_names(action), ElementsAre("input m:input", "output m:output"));
}

TEST(YangBuilder, Extensions)
{
  TEST_DESCRIPTION("Known extensions become nodes, unknown ones are skipped");

  MemoryFetcher fetcher;
  fetcher.add("m",
              "module m { prefix m;\n"
              "  import ext { prefix e; }\n"
              "  import ietf-yang-metadata { prefix md; }\n"
              "  md:annotation flag { type string; }\n"
              "  container c {\n"
              "    e:hint \"fast\";\n"
              "    x:unknown { leaf hidden; }\n"
              "    must \"a\" { error-message \"b\"; }\n"
              "  }\n"
              "}\n");
  fetcher.add("ext", "module ext { prefix e; extension hint { argument value; } }");
  fetcher.add("ietf-yang-metadata", "module ietf-yang-metadata { prefix md; }");

  SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
  builder.register_module("m");
  builder.parse_all();

  const BuildNode* m = builder.root()->children()[0].get();
  EXPECT_THAT(child_names(m), ElementsAre("import ext:ext",
                                          "import ietf-yang-metadata:ietf-yang-metadata",
                                          "annotation m:flag",
                                          "container m:c"));
  const BuildNode* c = m->children()[3].get();
  ASSERT_EQ(1u, c->children().size());
  EXPECT_EQ(yang_stmt_t::EXTENDED, c->children()[0]->stmt());
  EXPECT_EQ(Identifier("ext", "hint"), c->children()[0]->name());
  EXPECT_EQ("fast", c->children()[0]->argument);

  const BuildNode* ext = builder.root()->children()[1].get();
  EXPECT_TRUE(ext->children().empty());
}

TEST(YangBuilder, DeepCopy)
{
  MemoryFetcher fetcher;
  fetcher.add("m", MODULE_M);
  fetcher.add("n", MODULE_N);

  SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
  builder.register_module("m");
  builder.parse_all();

  BuildNode::ptr_t copy = builder.find_grouping(Identifier("m", "g"))->deep_copy();
  EXPECT_EQ(nullptr, copy->parent());
  copy->bind_lazy("other");
  EXPECT_EQ(Identifier("other", "x"), copy->children()[0]->name());
  EXPECT_EQ(Identifier::lazy_bound("x"),
            builder.find_grouping(Identifier("m", "g"))->children()[0]->name());
}

TEST(YangBuilder, Errors)
{
  TEST_DESCRIPTION("Structural mistakes are reported with their location");

  struct Case {
    const char* text;
    const char* message;
  };
  const Case cases[] = {
    { "module other { prefix o; }",
      "Expected module 'm' in 'm.yang', found 'other'" },
    { "leaf x { type string; }",
      "m.yang:1: Unexpected statement 'leaf' outside of a module" },
    { "module m { prefix m;\n grouping g;\n grouping g; }",
      "m.yang:3: Duplicate grouping 'm:g'" },
    { "module m { prefix m;\n typedef t { type int8; }\n typedef t { type int8; } }",
      "m.yang:3: Duplicate typedef 'm:t'" },
    { "module m { prefix m;\n container c {\n  typedef t { type int8; }\n  typedef t { type int8; } } }",
      "m.yang:4: Duplicate typedef 'm:t'" },
    { "module m { prefix m;\n deviation /m:x { deviate remove; } }",
      "m.yang:2: Unknown deviate statement 'remove'" },
    { "module m { prefix m; leaf x { type q:t; } }",
      "m.yang:1: Unknown prefix 'q' in 'q:t'" },
    { "module m { prefix m; augment \"m:x\"; }",
      "m.yang:1: Invalid path 'm:x'" },
    { "module m { prefix m; import gone { prefix g; } }",
      "Cannot find yang 'gone'" },
  };

  for (const Case& c : cases) {
    MemoryFetcher fetcher;
    fetcher.add("m", c.text);
    SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
    builder.register_module("m");
    EXPECT_EQ(c.message, error_message<ModelProcessingError>([&builder] {
                builder.parse_all();
              })) << c.text;
  }
}

TEST(YangBuilder, SubmoduleOwnership)
{
  MemoryFetcher fetcher;
  fetcher.add("m", "module m { prefix m; include s; }");
  fetcher.add("s", "submodule s { belongs-to other { prefix o; } }");

  SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
  builder.register_module("m");
  EXPECT_EQ("s.yang:1: Submodule belongs to 'other', included by 'm'",
            error_message<ModelProcessingError>([&builder] { builder.parse_all(); }));
}

TEST(YangBuilder, ModuleText)
{
  TEST_DESCRIPTION("Registered text takes precedence over fetching");

  MemoryFetcher fetcher;
  SchemaBuilder builder(fetcher.fetch_fn(), nullptr);
  builder.add_module_text("m", "module m { prefix m; leaf x { type string; } }");
  builder.register_module("m");
  builder.parse_all();

  EXPECT_TRUE(fetcher.fetched().empty());
  EXPECT_EQ(1u, builder.root()->children().size());
}
