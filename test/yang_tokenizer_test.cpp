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
 * @file yang_tokenizer_test.cpp
 * @brief Tests of the YANG lexer and statement parser
 */

#include <string>
#include <vector>

#include "yangc_ut.h"
#include "yang_tokenizer.hpp"

using namespace yangc;
using ::testing::HasSubstr;

namespace {

std::vector<std::string> token_texts(const std::vector<YangToken>& tokens)
{
  std::vector<std::string> texts;
  for (const YangToken& token : tokens) {
    texts.push_back(token.text);
  }
  return texts;
}

std::vector<YangToken> tokenize(const std::string& text)
{
  return YangTokenizer(text, "test.yang").tokenize();
}

class RecordingHandler
: public YangStatementHandler
{
 public:
  void enter(const std::string& keyword,
             const std::string& argument,
             bool has_argument,
             const SourceLocation& location) override
  {
    events.push_back("enter " + keyword + (has_argument ? " " + argument : ""));
    lines.push_back(location.line);
  }

  void leave(const std::string& keyword) override
  {
    events.push_back("leave " + keyword);
  }

  std::vector<std::string> events;
  std::vector<int> lines;
};

}

TEST(YangTokenizer, Statements)
{
  TEST_DESCRIPTION("Keywords, arguments, blocks and terminators become tokens");

  std::vector<YangToken> tokens = tokenize("module m {\n  leaf x { type string; }\n}\n");
  ASSERT_EQ(11u, tokens.size());

  EXPECT_EQ(std::vector<std::string>({ "module", "m", "{", "leaf", "x", "{",
                                       "type", "string", ";", "}", "}" }),
            token_texts(tokens));
  EXPECT_EQ(yang_token_kind_t::UNQUOTED_STRING, tokens[0].kind);
  EXPECT_EQ(yang_token_kind_t::BLOCK_BEGIN, tokens[2].kind);
  EXPECT_EQ(yang_token_kind_t::STMT_END, tokens[8].kind);
  EXPECT_EQ(yang_token_kind_t::BLOCK_END, tokens[10].kind);

  EXPECT_EQ(1, tokens[0].line);
  EXPECT_EQ(2, tokens[3].line);
  EXPECT_EQ(3, tokens[10].line);
}

TEST(YangTokenizer, Comments)
{
  TEST_DESCRIPTION("Line and block comments separate tokens and are dropped");

  std::vector<YangToken> tokens = tokenize("// header\nmodule m { /* empty\n body */ }");
  EXPECT_EQ(std::vector<std::string>({ "module", "m", "{", "}" }), token_texts(tokens));
  EXPECT_EQ(3, tokens[3].line);
}

TEST(YangTokenizer, Concatenation)
{
  TEST_DESCRIPTION("Quoted strings joined by + fold into one argument");

  const std::string text = "description \"a\" + 'b' +\n  \"c\";";

  std::vector<YangToken> raw = YangTokenizer(text, "test.yang").tokenize_raw();
  ASSERT_EQ(7u, raw.size());
  EXPECT_EQ(yang_token_kind_t::CONCAT, raw[2].kind);
  EXPECT_EQ(yang_token_kind_t::CONCAT, raw[4].kind);

  std::vector<YangToken> tokens = tokenize(text);
  ASSERT_EQ(3u, tokens.size());
  EXPECT_EQ(yang_token_kind_t::QUOTED_STRING, tokens[1].kind);
  EXPECT_EQ("abc", tokens[1].text);
}

TEST(YangTokenizer, Escapes)
{
  TEST_DESCRIPTION("Double quoted strings process escapes, single quoted do not");

  std::vector<YangToken> tokens = tokenize(R"(d "a\nb\t\"q\"\\";)");
  ASSERT_EQ(3u, tokens.size());
  EXPECT_EQ("a\nb\t\"q\"\\", tokens[1].text);

  tokens = tokenize(R"(d 'a\nb';)");
  ASSERT_EQ(3u, tokens.size());
  EXPECT_EQ("a\\nb", tokens[1].text);
}

TEST(YangTokenizer, Indentation)
{
  TEST_DESCRIPTION("Continuation lines lose the indentation up to the opening quote");

  // The quote is in column 14, so 15 columns of indentation are removed.
  std::string text = "leaf x {\n  description \"first   \n"
                     + std::string(15, ' ') + "second\";\n}\n";
  std::vector<YangToken> tokens = tokenize(text);
  ASSERT_EQ(7u, tokens.size());
  EXPECT_EQ("first\nsecond", tokens[4].text);

  text = "leaf x {\n  description \"first\n"
         + std::string(17, ' ') + "second\";\n}\n";
  tokens = tokenize(text);
  ASSERT_EQ(7u, tokens.size());
  EXPECT_EQ("first\n  second", tokens[4].text);
}

TEST(YangTokenizer, Errors)
{
  TEST_DESCRIPTION("Malformed input fails with a located message");

  EXPECT_EQ("test.yang:1: Unexpected end of YANG",
            error_message<ModelProcessingError>([] { tokenize("module m {"); }));
  EXPECT_THAT(error_message<ModelProcessingError>([] { tokenize("module m { /* open"); }),
              HasSubstr("Unexpected end of YANG"));
  EXPECT_THAT(error_message<ModelProcessingError>([] { tokenize("d \"abc;\n"); }),
              HasSubstr("Unterminated quoted string"));
  EXPECT_THAT(error_message<ModelProcessingError>([] { tokenize("d 'abc;"); }),
              HasSubstr("Unterminated quoted string"));
  EXPECT_THAT(error_message<ModelProcessingError>([] { tokenize("d \"a\" + ;"); }),
              HasSubstr("Invalid argument to the right of the plus symbol"));
  EXPECT_THAT(error_message<ModelProcessingError>([] { tokenize("d \"a\" +"); }),
              HasSubstr("Invalid argument to the right of the plus symbol"));
  EXPECT_THAT(error_message<ModelProcessingError>([] { tokenize("module m { }\n}"); }),
              HasSubstr("test.yang:2: Unexpected token }"));
  EXPECT_THAT(error_message<ModelProcessingError>([] { tokenize("d a b;"); }),
              HasSubstr("Unexpected token b"));
  EXPECT_THAT(error_message<ModelProcessingError>([] { tokenize("{ }"); }),
              HasSubstr("Unexpected token {"));
}

TEST(YangParse, Events)
{
  TEST_DESCRIPTION("The parser drives the handler in document order");

  RecordingHandler handler;
  yang_parse("module m {\n"
             "  leaf x { type string; }\n"
             "  rpc r { input { } }\n"
             "}\n",
             "m.yang", &handler);

  EXPECT_EQ(std::vector<std::string>({
              "enter module m",
              "enter leaf x",
              "enter type string",
              "leave type",
              "leave leaf",
              "enter rpc r",
              "enter input",
              "leave input",
              "leave rpc",
              "leave module",
            }),
            handler.events);
  EXPECT_EQ(std::vector<int>({ 1, 2, 2, 3, 3 }), handler.lines);
}

TEST(YangParse, NoPartialEvents)
{
  TEST_DESCRIPTION("A lexical error is raised before any statement is reported");

  RecordingHandler handler;
  EXPECT_THROW(yang_parse("module m { leaf x { type \"string; } }", "m.yang", &handler),
               ModelProcessingError);
  EXPECT_TRUE(handler.events.empty());
}
