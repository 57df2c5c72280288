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
 * @file yang_compiler_test.cpp
 * @brief Tests of the compilation pipeline
 */

#include <sstream>
#include <string>

#include "yangc_ut.h"
#include "yang_cache.hpp"
#include "yang_compiler.hpp"

using namespace yangc;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

static CompiledSchema::ptr_t compile_text(const std::string& text)
{
  yang_fetch_fn_t no_fetch;
  YangCompiler compiler(no_fetch);
  compiler.add_module_text("m", text);
  compiler.add_module("m");
  return compiler.compile();
}

static std::string compile_error(const std::string& text)
{
  return error_message<Error>([&text] { compile_text(text); });
}

static std::string dump(const CompiledSchema& schema, schema_index_t index)
{
  std::ostringstream os;
  yangc_schema_dump(schema, index, 0, os);
  return os.str();
}

static const CompactNode& node_at(const CompiledSchema& schema, const std::string& path)
{
  schema_index_t index = schema.find_path(path);
  EXPECT_NE(YANGC_SCHEMA_INDEX_NONE, index) << path;
  return schema.node(index == YANGC_SCHEMA_INDEX_NONE ? schema.root() : index);
}

static const char* const INTERFACES =
  "module interfaces {\n"
  "  namespace \"urn:example:interfaces\";\n"
  "  prefix if;\n"
  "  import types { prefix t; }\n"
  "  revision 2022-03-01;\n"
  "  grouping counters {\n"
  "    leaf in-octets { type t:counter64; }\n"
  "    leaf out-octets { type t:counter64; }\n"
  "  }\n"
  "  container interfaces {\n"
  "    list interface {\n"
  "      key \"name\";\n"
  "      leaf name { type string { length \"1..64\"; } }\n"
  "      leaf mtu { type uint16 { range \"68..max\"; } default 1500; units bytes; }\n"
  "      container statistics { config false; uses counters; }\n"
  "    }\n"
  "  }\n"
  "}\n";

static const char* const TYPES =
  "module types {\n"
  "  namespace \"urn:example:types\";\n"
  "  prefix t;\n"
  "  typedef counter64 { type uint64; units packets; }\n"
  "}\n";

TEST(YangCompiler, Determinism)
{
  TEST_DESCRIPTION("Compiling the same module set twice gives identical results");

  MemoryFetcher fetcher;
  fetcher.add("interfaces", INTERFACES);
  fetcher.add("types", TYPES);

  YangCompiler first(fetcher.fetch_fn());
  first.add_module("interfaces");
  CompiledSchema::ptr_t a = first.compile();

  YangCompiler second(fetcher.fetch_fn());
  second.add_module("interfaces");
  CompiledSchema::ptr_t b = second.compile();

  EXPECT_TRUE(a->equals(*b));
  EXPECT_EQ(dump(*a, a->root()), dump(*b, b->root()));
  EXPECT_EQ(SchemaCache::compute_digest(a->modules()),
            SchemaCache::compute_digest(b->modules()));

  CompiledSchema::ptr_t again = first.compile();
  EXPECT_TRUE(a->equals(*again));
}

TEST(YangCompiler, ResolvedTree)
{
  TEST_DESCRIPTION("A compiled module exposes resolved types and attributes");

  MemoryFetcher fetcher;
  fetcher.add("interfaces", INTERFACES);
  fetcher.add("types", TYPES);

  YangCompiler compiler(fetcher.fetch_fn());
  compiler.add_module("interfaces");
  CompiledSchema::ptr_t schema = compiler.compile();

  const CompactNode& list = node_at(*schema, "/interfaces:interfaces/interface");
  EXPECT_EQ(yang_stmt_t::LIST, list.stmt());
  EXPECT_THAT(list.keys, ElementsAre("name"));
  EXPECT_EQ("urn:example:interfaces", *list.ns);

  const CompactNode& mtu = node_at(*schema, "/interfaces:interfaces/interface/mtu");
  ASSERT_TRUE(mtu.type != nullptr);
  EXPECT_EQ("uint16", mtu.type->display_name());
  EXPECT_EQ("68..65535", static_cast<const PrimitiveType&>(*mtu.type).restrictions().range);
  EXPECT_EQ("1500", *mtu.default_value);
  EXPECT_EQ("bytes", *mtu.units);
  EXPECT_TRUE(mtu.is_config());

  const CompactNode& octets =
    node_at(*schema, "/interfaces:interfaces/interface/statistics/in-octets");
  EXPECT_EQ(Identifier("interfaces", "in-octets"), octets.name);
  EXPECT_EQ("uint64", octets.type->display_name());
  EXPECT_EQ("packets", *octets.units);
  EXPECT_FALSE(octets.is_config());

  module_set_t modules = schema->modules();
  ASSERT_EQ(2u, modules.size());
  EXPECT_EQ("interfaces", modules[0].name);
  EXPECT_EQ("2022-03-01", modules[0].revision);
  EXPECT_EQ("types", modules[1].name);
}

TEST(YangCompiler, GroupingIsolation)
{
  TEST_DESCRIPTION("Each use of a grouping is an independent copy");

  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  grouping endpoint {\n"
    "    leaf port { type uint16; default 80; }\n"
    "  }\n"
    "  container a { uses endpoint { refine port { default 8080; } } }\n"
    "  container b { uses endpoint; }\n"
    "}\n");

  const CompactNode& a = node_at(*schema, "/m:a/port");
  const CompactNode& b = node_at(*schema, "/m:b/port");
  EXPECT_EQ("8080", *a.default_value);
  EXPECT_EQ("80", *b.default_value);
  EXPECT_NE(a.type.get(), b.type.get());
  EXPECT_TRUE(a.type->equals(*b.type));
  EXPECT_EQ(Identifier("m", "port"), a.name);

  EXPECT_EQ(YANGC_SCHEMA_INDEX_NONE, schema->find_path("/m:endpoint"));
}

TEST(YangCompiler, NestedGroupings)
{
  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  grouping inner { leaf x { type int8; } }\n"
    "  grouping outer {\n"
    "    container box {\n"
    "      uses inner { refine x { mandatory true; } }\n"
    "    }\n"
    "  }\n"
    "  container top {\n"
    "    uses outer {\n"
    "      augment box { leaf y { type string; } }\n"
    "    }\n"
    "  }\n"
    "}\n");

  const CompactNode& x = node_at(*schema, "/m:top/box/x");
  EXPECT_TRUE(x.is_mandatory());
  EXPECT_EQ(Identifier("m", "x"), x.name);
  const CompactNode& y = node_at(*schema, "/m:top/box/y");
  EXPECT_EQ("string", y.type->display_name());
}

TEST(YangCompiler, AugmentOrder)
{
  TEST_DESCRIPTION("Augments resolve regardless of declaration order");

  const char* before =
    "module m {\n"
    "  prefix m;\n"
    "  container top;\n"
    "  augment /m:top/m:inner { leaf deep { type string; } }\n"
    "  augment /m:top { container inner; }\n"
    "}\n";
  const char* after =
    "module m {\n"
    "  prefix m;\n"
    "  container top;\n"
    "  augment /m:top { container inner; }\n"
    "  augment /m:top/m:inner { leaf deep { type string; } }\n"
    "}\n";

  CompiledSchema::ptr_t a = compile_text(before);
  CompiledSchema::ptr_t b = compile_text(after);
  EXPECT_TRUE(a->equals(*b));
  EXPECT_NE(YANGC_SCHEMA_INDEX_NONE, a->find_path("/m:top/inner/deep"));
}

TEST(YangCompiler, AugmentOtherModule)
{
  MemoryFetcher fetcher;
  fetcher.add("base", "module base { namespace \"urn:base\"; prefix b; container system; }");
  fetcher.add("ext",
              "module ext {\n"
              "  namespace \"urn:ext\";\n"
              "  prefix e;\n"
              "  import base { prefix b; }\n"
              "  augment /b:system { leaf hostname { type string; } }\n"
              "}\n");

  YangCompiler compiler(fetcher.fetch_fn());
  compiler.add_module("ext");
  CompiledSchema::ptr_t schema = compiler.compile();

  const CompactNode& hostname = node_at(*schema, "/base:system/ext:hostname");
  EXPECT_EQ("urn:ext", *hostname.ns);
  EXPECT_EQ("urn:base", *node_at(*schema, "/base:system").ns);
  EXPECT_EQ(YANGC_SCHEMA_INDEX_NONE, schema->find_path("/base:system/base:hostname"));
}

TEST(YangCompiler, UnresolvedAugment)
{
  TEST_DESCRIPTION("An augment whose target never appears fails the compile");

  EXPECT_EQ("m.yang:5: Augments cannot be resolved: /m:nowhere",
            compile_error("module m {\n"
                          "  prefix m;\n"
                          "  container top;\n"
                          "  augment /m:top { container inner; }\n"
                          "  augment /m:nowhere { leaf x { type string; } }\n"
                          "}\n"));
}

TEST(YangCompiler, DeviationNotSupported)
{
  TEST_DESCRIPTION("A not-supported deviation removes the node and its subtree");

  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  container c {\n"
    "    container x { leaf inner { type string; } }\n"
    "    leaf y { type string; }\n"
    "  }\n"
    "  deviation /m:c/m:x { deviate not-supported; }\n"
    "}\n");

  EXPECT_EQ(YANGC_SCHEMA_INDEX_NONE, schema->find_path("/m:c/x"));
  EXPECT_EQ(YANGC_SCHEMA_INDEX_NONE, schema->find_path("/m:c/x/inner"));
  EXPECT_NE(YANGC_SCHEMA_INDEX_NONE, schema->find_path("/m:c/y"));
  EXPECT_EQ(1u, schema->children(schema->find_path("/m:c")).size());
}

TEST(YangCompiler, DeviationReplace)
{
  TEST_DESCRIPTION("Replacing a default leaves the other statements as declared");

  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  container c {\n"
    "    leaf speed { type uint8 { range \"1..100\"; } default 10; }\n"
    "    leaf mode { type string; default auto; }\n"
    "    leaf rate { type uint32; units bps; }\n"
    "  }\n"
    "  deviation /m:c/m:speed { deviate replace { default 20; } }\n"
    "  deviation /m:c/m:mode { deviate delete { default auto; } }\n"
    "  deviation /m:c/m:rate { deviate add { units kbps; } }\n"
    "}\n");

  const CompactNode& speed = node_at(*schema, "/m:c/speed");
  EXPECT_EQ("20", *speed.default_value);
  EXPECT_EQ("uint8", speed.type->display_name());
  EXPECT_EQ("1..100", static_cast<const PrimitiveType&>(*speed.type).restrictions().range);

  EXPECT_FALSE(node_at(*schema, "/m:c/mode").default_value.is_initialized());
  EXPECT_EQ("kbps", *node_at(*schema, "/m:c/rate").units);
}

TEST(YangCompiler, ConfigInheritance)
{
  TEST_DESCRIPTION("config false applies to every descendant");

  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  container state {\n"
    "    config false;\n"
    "    container inner { leaf counter { config true; type uint32; } }\n"
    "  }\n"
    "  container settings { leaf name { type string; } }\n"
    "}\n");

  EXPECT_FALSE(node_at(*schema, "/m:state").is_config());
  EXPECT_FALSE(node_at(*schema, "/m:state/inner/counter").is_config());
  EXPECT_TRUE(node_at(*schema, "/m:settings/name").is_config());
}

TEST(YangCompiler, IdentityClosure)
{
  TEST_DESCRIPTION("An identityref accepts every identity derived from its base");

  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  identity A;\n"
    "  identity B { base A; }\n"
    "  identity C { base B; }\n"
    "  identity D;\n"
    "  leaf kind { type identityref { base A; } }\n"
    "}\n");

  const CompactNode& kind = node_at(*schema, "/m:kind");
  ASSERT_EQ(yang_type_kind_t::IDENTITYREF, kind.type->kind());
  const IdentityRefType& type = static_cast<const IdentityRefType&>(*kind.type);
  EXPECT_THAT(type.values(), ElementsAre(Identifier("m", "B"), Identifier("m", "C")));
  EXPECT_TRUE(type.is_legal_value("B"));
  EXPECT_TRUE(type.is_legal_value("m:C"));
  EXPECT_FALSE(type.is_legal_value("A"));
  EXPECT_FALSE(type.is_legal_value("D"));
}

TEST(YangCompiler, LeafrefSubstitution)
{
  TEST_DESCRIPTION("A leafref takes the type of the leaf it points to");

  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  container c {\n"
    "    leaf y { type uint8; }\n"
    "    leaf x { type leafref { path \"../y\"; } }\n"
    "    leaf z { type leafref { path \"/m:c/m:x\"; } }\n"
    "  }\n"
    "}\n");

  const CompactNode& x = node_at(*schema, "/m:c/x");
  const CompactNode& y = node_at(*schema, "/m:c/y");
  const CompactNode& z = node_at(*schema, "/m:c/z");
  ASSERT_EQ(yang_type_kind_t::PRIMITIVE, x.type->kind());
  EXPECT_EQ(yang_primitive_t::UINT8, static_cast<const PrimitiveType&>(*x.type).primitive());
  EXPECT_TRUE(x.type->equals(*y.type));
  EXPECT_TRUE(z.type->equals(*y.type));

  for (const char* text : { "0", "255", "256", "-1", "x" }) {
    std::string from_x = error_message<InvalidValueError>([&x, text] { x.type->to_value(text); });
    std::string from_y = error_message<InvalidValueError>([&y, text] { y.type->to_value(text); });
    EXPECT_EQ(from_y, from_x) << text;
  }
  EXPECT_EQ(y.type->check_field_value(LeafValue::unsigned_integer(300)),
            x.type->check_field_value(LeafValue::unsigned_integer(300)));
}

TEST(YangCompiler, LeafrefDeclarationOrder)
{
  TEST_DESCRIPTION("Leafref targets are resolved before their type is copied");

  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  typedef either { type union { type leafref { path \"../z\"; } type string; } }\n"
    "  container c {\n"
    "    leaf x { type leafref { path \"../y\"; } }\n"
    "    leaf y { type union { type leafref { path \"../z\"; } type string; } }\n"
    "    leaf w { type union { type either; type int8; } }\n"
    "    leaf v { type leafref { path \"../w\"; } }\n"
    "    leaf z { type uint8; }\n"
    "  }\n"
    "}\n");

  EXPECT_EQ("union[uint8,string]", node_at(*schema, "/m:c/y").type->display_name());
  EXPECT_EQ("union[uint8,string]", node_at(*schema, "/m:c/x").type->display_name());
  EXPECT_TRUE(node_at(*schema, "/m:c/x").type->is_resolved());

  const CompactNode& w = node_at(*schema, "/m:c/w");
  EXPECT_EQ("union[union[uint8,string],int8]", w.type->display_name());
  EXPECT_TRUE(w.type->is_resolved());
  EXPECT_TRUE(node_at(*schema, "/m:c/v").type->equals(*w.type));

  EXPECT_THAT(compile_error("module m { prefix m;\n"
                            "  container c {\n"
                            "    leaf a { type leafref { path \"../b\"; } }\n"
                            "    leaf b { type union { type leafref { path \"../a\"; } type string; } } } }"),
              HasSubstr("Circular leafref"));
}

TEST(YangCompiler, Typedefs)
{
  TEST_DESCRIPTION("Typedef restrictions merge with those at the use site");

  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  typedef percent { type uint8 { range \"0..100\"; } units \"%\"; }\n"
    "  typedef small-percent { type percent { range \"min..50\"; } default 5; }\n"
    "  typedef color {\n"
    "    type enumeration { enum red; enum green { value 10; } enum blue; }\n"
    "  }\n"
    "  leaf load { type small-percent; }\n"
    "  leaf limit { type percent { range \"10..max\"; } units ratio; }\n"
    "  leaf shade { type color { enum blue; enum red; } }\n"
    "  leaf either { type union { type percent; type string; type m:percent; } }\n"
    "}\n");

  const CompactNode& load = node_at(*schema, "/m:load");
  EXPECT_EQ("0..50", static_cast<const PrimitiveType&>(*load.type).restrictions().range);
  EXPECT_EQ("%", *load.units);
  EXPECT_EQ("5", *load.default_value);

  const CompactNode& limit = node_at(*schema, "/m:limit");
  EXPECT_EQ("10..100", static_cast<const PrimitiveType&>(*limit.type).restrictions().range);
  EXPECT_EQ("ratio", *limit.units);

  const CompactNode& shade = node_at(*schema, "/m:shade");
  EXPECT_EQ("enumeration[red|blue]", shade.type->display_name());
  EXPECT_EQ(11, static_cast<const EnumerationType&>(*shade.type).find("blue")->value);

  EXPECT_EQ("union[uint8,string]", node_at(*schema, "/m:either").type->display_name());
}

TEST(YangCompiler, ScopedDefinitions)
{
  TEST_DESCRIPTION("Typedefs and groupings are visible in the scope that defines them");

  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  typedef t { type uint8; }\n"
    "  grouping outer {\n"
    "    typedef local { type uint16; units seconds; }\n"
    "    leaf timeout { type local; }\n"
    "  }\n"
    "  container a {\n"
    "    typedef t { type string; }\n"
    "    grouping g { leaf p { type t; } }\n"
    "    leaf x { type t; }\n"
    "    uses g;\n"
    "  }\n"
    "  container b {\n"
    "    typedef t { type int8; }\n"
    "    grouping g { leaf q { type t; } }\n"
    "    container inner { leaf y { type t; } }\n"
    "    uses g;\n"
    "  }\n"
    "  container e { uses outer; }\n"
    "  leaf z { type t; }\n"
    "}\n");

  EXPECT_EQ("string", node_at(*schema, "/m:a/x").type->display_name());
  EXPECT_EQ("string", node_at(*schema, "/m:a/p").type->display_name());
  EXPECT_EQ("int8", node_at(*schema, "/m:b/inner/y").type->display_name());
  EXPECT_EQ("int8", node_at(*schema, "/m:b/q").type->display_name());
  EXPECT_EQ(YANGC_SCHEMA_INDEX_NONE, schema->find_path("/m:b/p"));
  EXPECT_EQ("uint8", node_at(*schema, "/m:z").type->display_name());

  const CompactNode& timeout = node_at(*schema, "/m:e/timeout");
  EXPECT_EQ("uint16", timeout.type->display_name());
  EXPECT_EQ("seconds", *timeout.units);

  EXPECT_EQ("m.yang:3: Unknown grouping 'm:g'",
            compile_error("module m { prefix m;\n"
                          "  container a { grouping g { leaf p { type string; } } }\n"
                          "  container b { uses g; } }"));
  EXPECT_THAT(compile_error("module m { prefix m;\n"
                            "  container a { typedef t { type string; } }\n"
                            "  leaf x { type t; } }"),
              HasSubstr("Unresolved type in schema: m:t"));
}

TEST(YangCompiler, ChoiceShorthand)
{
  TEST_DESCRIPTION("Choice members without a case get an implicit one");

  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  choice transport {\n"
    "    leaf tcp { type empty; }\n"
    "    case udp { leaf port { type uint16; } }\n"
    "  }\n"
    "}\n");

  const CompactNode& tcp_case = node_at(*schema, "/m:transport/tcp");
  EXPECT_EQ(yang_stmt_t::CASE, tcp_case.stmt());
  EXPECT_EQ(yang_stmt_t::LEAF, node_at(*schema, "/m:transport/tcp/tcp").stmt());
  EXPECT_EQ(yang_stmt_t::CASE, node_at(*schema, "/m:transport/udp").stmt());
  EXPECT_EQ(2u, schema->children(schema->find_path("/m:transport")).size());
}

TEST(YangCompiler, Operations)
{
  CompiledSchema::ptr_t schema = compile_text(
    "module m {\n"
    "  prefix m;\n"
    "  rpc reset { input { leaf force { type boolean; } } }\n"
    "  notification alarm { leaf severity { type uint8; } }\n"
    "}\n");

  EXPECT_EQ(yang_stmt_t::INPUT, node_at(*schema, "/m:reset/input").stmt());
  EXPECT_EQ(yang_stmt_t::OUTPUT, node_at(*schema, "/m:reset/output").stmt());
  EXPECT_EQ("boolean", node_at(*schema, "/m:reset/input/force").type->display_name());
  EXPECT_EQ(yang_stmt_t::NOTIFICATION, node_at(*schema, "/m:alarm").stmt());
}

TEST(YangCompiler, Submodules)
{
  MemoryFetcher fetcher;
  fetcher.add("m", "module m { namespace \"urn:m\"; prefix m; include s; leaf a { type m:t; } }");
  fetcher.add("s",
              "submodule s {\n"
              "  belongs-to m { prefix m; }\n"
              "  revision 2018-01-01;\n"
              "  typedef t { type int32; }\n"
              "  container sc { leaf b { type t; } }\n"
              "}\n");

  YangCompiler compiler(fetcher.fetch_fn());
  compiler.add_module("m");
  CompiledSchema::ptr_t schema = compiler.compile();

  EXPECT_EQ("int32", node_at(*schema, "/m:a").type->display_name());
  const CompactNode& b = node_at(*schema, "/m:sc/b");
  EXPECT_EQ("int32", b.type->display_name());
  EXPECT_EQ("urn:m", *b.ns);
  ASSERT_EQ(1u, schema->modules().size());
  EXPECT_EQ("2018-01-01", schema->modules()[0].submodules.at("s"));
}

TEST(YangCompiler, Metadata)
{
  TEST_DESCRIPTION("Annotations are lifted into the metadata table");

  MemoryFetcher fetcher;
  fetcher.add("m",
              "module m {\n"
              "  prefix m;\n"
              "  import ietf-yang-metadata { prefix md; }\n"
              "  md:annotation flag { type string; units marks; }\n"
              "  container c;\n"
              "}\n");
  fetcher.add("ietf-yang-metadata", "module ietf-yang-metadata { prefix md; }");

  YangCompiler compiler(fetcher.fetch_fn());
  compiler.add_module("m");
  CompiledSchema::ptr_t schema = compiler.compile();

  ASSERT_EQ(2u, schema->metadata().size());
  const MetadataAnnotation* flag = schema->find_metadata("m", "flag");
  ASSERT_TRUE(flag != nullptr);
  EXPECT_EQ("string", flag->type->display_name());
  EXPECT_EQ("marks", *flag->units);
  EXPECT_FALSE(flag->builtin);

  const MetadataAnnotation* operation = schema->find_metadata("ietf-netconf", "operation");
  ASSERT_TRUE(operation != nullptr);
  EXPECT_TRUE(operation->builtin);
  EXPECT_EQ("enumeration[merge|replace|create|delete|remove]",
            operation->type->display_name());

  const std::vector<schema_index_t>& modules = schema->children(schema->root());
  for (schema_index_t module : modules) {
    for (schema_index_t child : schema->children(module)) {
      EXPECT_NE(yang_stmt_t::ANNOTATE, schema->node(child).stmt());
    }
  }
}

TEST(YangCompiler, Errors)
{
  TEST_DESCRIPTION("Resolution failures abort the compile with a located message");

  EXPECT_EQ("m.yang:2: Invalid config statement 'maybe'",
            compile_error("module m { prefix m;\n"
                          "  container c { config maybe; } }"));
  EXPECT_EQ("m.yang:2: Unknown grouping 'm:nothing'",
            compile_error("module m { prefix m;\n"
                          "  container c { uses nothing; } }"));
  EXPECT_EQ("m.yang:2: Grouping 'm:g' uses itself",
            compile_error("module m { prefix m;\n"
                          "  grouping g { container x { uses g; } }\n"
                          "  container c { uses g; } }"));
  EXPECT_EQ("m.yang:3: Cannot find refine target 'm:nope'",
            compile_error("module m { prefix m;\n"
                          "  grouping g { leaf x { type string; } }\n"
                          "  container c { uses g { refine nope { default 1; } } } }"));
  EXPECT_EQ("m.yang:2: Cannot find deviation target '/m:zz'",
            compile_error("module m { prefix m;\n"
                          "  deviation /m:zz { deviate not-supported; } }"));
  EXPECT_EQ("m.yang:2: Invalid mandatory statement 'yes'",
            compile_error("module m { prefix m;\n"
                          "  leaf x { type string; mandatory yes; } }"));
  EXPECT_EQ("m.yang:2: Unexpected base statement for type string",
            compile_error("module m { prefix m;\n"
                          "  leaf x { type string { base y; } } }"));
  EXPECT_EQ("m.yang:2: Unexpected range statement for type enumeration[a]",
            compile_error("module m { prefix m;\n"
                          "  leaf x { type enumeration { enum a; range 1..2; } } }"));
  EXPECT_EQ("m.yang:2: Range bound '300' out of type range in '1..300'",
            compile_error("module m { prefix m;\n"
                          "  leaf x { type uint8 { range 1..300; } } }"));
  EXPECT_THAT(compile_error("module m { prefix m;\n"
                            "  typedef a { type b; }\n"
                            "  typedef b { type a; }\n"
                            "  leaf x { type a; } }"),
              HasSubstr("Circular typedef"));
}

TEST(YangCompiler, InternalErrors)
{
  TEST_DESCRIPTION("Placeholders that cannot be resolved are internal errors");

  EXPECT_EQ("Unresolved type in schema: m:nothere at m.yang:2",
            error_message<InternalError>([] {
              compile_text("module m { prefix m;\n"
                           "  leaf x { type nothere; } }");
            }));
  EXPECT_EQ("Unresolved leafref leafref(../?:missing) at m.yang:3",
            error_message<InternalError>([] {
              compile_text("module m { prefix m;\n"
                           "  container c {\n"
                           "    leaf x { type leafref { path ../missing; } } } }");
            }));
}

TEST(YangCompiler, FatalOnPartial)
{
  TEST_DESCRIPTION("A failed compile returns nothing and leaves the compiler reusable");

  MemoryFetcher fetcher;
  YangCompiler compiler(fetcher.fetch_fn());
  compiler.add_module_text("m", "module m { prefix m; augment /m:none { leaf x { type string; } } }");
  compiler.add_module("m");

  CompiledSchema::ptr_t schema;
  EXPECT_THROW(schema = compiler.compile(), ModelProcessingError);
  EXPECT_TRUE(schema == nullptr);

  compiler.add_module_text("m", "module m { prefix m; container none; }");
  schema = compiler.compile();
  ASSERT_TRUE(schema != nullptr);
  EXPECT_NE(YANGC_SCHEMA_INDEX_NONE, schema->find_path("/m:none"));
}

TEST(YangCompiler, MissingModule)
{
  MemoryFetcher fetcher;
  YangCompiler compiler(fetcher.fetch_fn());
  EXPECT_EQ("No modules to compile",
            error_message<ModelProcessingError>([&compiler] { compiler.compile(); }));

  compiler.add_module("absent");
  EXPECT_EQ("Cannot find yang 'absent'",
            error_message<ModelProcessingError>([&compiler] { compiler.compile(); }));
}

TEST(YangCompiler, Scan)
{
  TEST_DESCRIPTION("Scanning reports the module set without resolving anything");

  MemoryFetcher fetcher;
  fetcher.add("interfaces", INTERFACES);
  fetcher.add("types", TYPES);

  YangCompiler compiler(fetcher.fetch_fn());
  compiler.add_module("interfaces");
  compiler.add_module("interfaces");
  EXPECT_THAT(compiler.module_names(), ElementsAre("interfaces"));

  module_set_t modules = compiler.scan();
  ASSERT_EQ(2u, modules.size());
  EXPECT_EQ("interfaces", modules[0].name);
  EXPECT_EQ("types", modules[1].name);
  EXPECT_EQ(modules, compiler.compile()->modules());

  compiler.add_module_text("broken", "module broken { prefix b; augment /b:x; }");
  compiler.add_module("broken");
  EXPECT_EQ(3u, compiler.scan().size());
}

TEST(YangCompiler, LogLevel)
{
  MemoryFetcher fetcher;
  YangCompiler compiler(fetcher.fetch_fn());
  EXPECT_EQ(YANGC_LOG_LEVEL_NONE, compiler.log_level());
  ASSERT_TRUE(compiler.trace() != nullptr);

  compiler.set_log_level(YANGC_LOG_LEVEL_DEBUG);
  EXPECT_EQ(YANGC_LOG_LEVEL_DEBUG, compiler.log_level());
  EXPECT_EQ(YANGC_TRACE_SEVERITY_DEBUG,
            compiler.trace()->category[YANGC_TRACE_CATEGORY_RESOLVE].severity);
}
