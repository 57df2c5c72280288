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
 * @file yang_tokenizer.cpp
 *
 * YANG lexer and statement parser.
 */

#include <stack>

#include "yang_tokenizer.hpp"
#include "yangc_status.h"

using namespace yangc;

static const unsigned TAB_WIDTH = 8;

static bool is_yang_space(char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

YangTokenizer::YangTokenizer(const std::string& text, const std::string& filename)
: text_(text),
  filename_(filename),
  pos_(0),
  line_(1)
{
}

char YangTokenizer::peek(size_t offset) const
{
  size_t at = pos_ + offset;
  return at < text_.size() ? text_[at] : '\0';
}

void YangTokenizer::advance()
{
  if (text_[pos_] == '\n') {
    ++line_;
  }
  ++pos_;
}

unsigned YangTokenizer::column_of(size_t pos) const
{
  size_t start = text_.rfind('\n', pos ? pos - 1 : 0);
  start = (start == std::string::npos || start >= pos) ? 0 : start + 1;

  unsigned column = 0;
  for (size_t i = start; i < pos; ++i) {
    column = (text_[i] == '\t') ? (column / TAB_WIDTH + 1) * TAB_WIDTH : column + 1;
  }
  return column;
}

SourceLocation YangTokenizer::location() const
{
  return SourceLocation(filename_, line_);
}

void YangTokenizer::fail(const std::string& what) const
{
  throw ModelProcessingError(what, location());
}

void YangTokenizer::skip_separators()
{
  while (!at_end()) {
    char c = peek();
    if (is_yang_space(c)) {
      advance();
      continue;
    }
    if (c == '/' && peek(1) == '/') {
      while (!at_end() && peek() != '\n') {
        advance();
      }
      continue;
    }
    if (c == '/' && peek(1) == '*') {
      advance();
      advance();
      while (!(peek() == '*' && peek(1) == '/')) {
        if (at_end()) {
          fail("Unexpected end of YANG");
        }
        advance();
      }
      advance();
      advance();
      continue;
    }
    break;
  }
}

std::string YangTokenizer::read_unquoted()
{
  std::string result;
  while (!at_end()) {
    char c = peek();
    if (is_yang_space(c) || c == ';' || c == '{' || c == '}') {
      break;
    }
    if (c == '/' && (peek(1) == '/' || peek(1) == '*')) {
      break;
    }
    result += c;
    advance();
  }
  return result;
}

std::string YangTokenizer::read_double_quoted()
{
  unsigned quote_column = column_of(pos_);
  int start_line = line_;
  advance();

  std::string result;
  while (true) {
    if (at_end()) {
      throw ModelProcessingError("Unterminated quoted string",
                                 SourceLocation(filename_, start_line));
    }
    char c = peek();
    if (c == '"') {
      advance();
      break;
    }
    if (c == '\\') {
      char next = peek(1);
      switch (next) {
        case 'n':  result += '\n'; break;
        case 't':  result += '\t'; break;
        case '"':  result += '"';  break;
        case '\\': result += '\\'; break;
        default:   result += '\\'; result += next; break;
      }
      advance();
      if (!at_end()) {
        advance();
      }
      continue;
    }
    if (c == '\n') {
      // Trailing whitespace before a line break is dropped, and so is
      // indentation up to the column after the opening quote.
      size_t keep = result.find_last_not_of(" \t");
      result.erase(keep == std::string::npos ? 0 : keep + 1);
      if (!result.empty() && result.back() == '\r') {
        result.pop_back();
      }
      result += '\n';
      advance();

      unsigned column = 0;
      while (!at_end() && (peek() == ' ' || peek() == '\t')
             && column <= quote_column) {
        column = (peek() == '\t') ? (column / TAB_WIDTH + 1) * TAB_WIDTH : column + 1;
        if (column > quote_column + 1) {
          break;
        }
        advance();
      }
      continue;
    }
    result += c;
    advance();
  }
  return result;
}

std::string YangTokenizer::read_single_quoted()
{
  int start_line = line_;
  advance();

  std::string result;
  while (true) {
    if (at_end()) {
      throw ModelProcessingError("Unterminated quoted string",
                                 SourceLocation(filename_, start_line));
    }
    char c = peek();
    if (c == '\'') {
      advance();
      break;
    }
    result += c;
    advance();
  }
  return result;
}

std::string YangTokenizer::describe_next()
{
  char c = peek();
  if (c == ';' || c == '{' || c == '}' || c == '+') {
    return std::string(1, c);
  }
  std::string word = read_unquoted();
  return word.empty() ? std::string(1, c) : word;
}

std::vector<YangToken> YangTokenizer::tokenize_raw()
{
  std::vector<YangToken> tokens;
  lex_state_t state = LEX_STMT_START;
  bool last_quoted = false;
  unsigned depth = 0;

  while (true) {
    skip_separators();

    if (at_end()) {
      if (state == LEX_AFTER_CONCAT) {
        fail("Invalid argument to the right of the plus symbol");
      }
      if (state != LEX_STMT_START || depth) {
        fail("Unexpected end of YANG");
      }
      break;
    }

    char c = peek();
    int line = line_;

    switch (state) {
      case LEX_STMT_START:
        if (c == '}') {
          if (!depth) {
            fail("Unexpected token }");
          }
          --depth;
          advance();
          tokens.emplace_back(yang_token_kind_t::BLOCK_END, "}", line);
          break;
        }
        if (c == ';' || c == '{' || c == '"' || c == '\'') {
          fail("Unexpected token " + describe_next());
        }
        tokens.emplace_back(yang_token_kind_t::UNQUOTED_STRING, read_unquoted(), line);
        state = LEX_AFTER_KEYWORD;
        break;

      case LEX_AFTER_KEYWORD:
      case LEX_AFTER_ARGUMENT:
        if (c == ';') {
          advance();
          tokens.emplace_back(yang_token_kind_t::STMT_END, ";", line);
          state = LEX_STMT_START;
          break;
        }
        if (c == '{') {
          advance();
          ++depth;
          tokens.emplace_back(yang_token_kind_t::BLOCK_BEGIN, "{", line);
          state = LEX_STMT_START;
          break;
        }
        if (state == LEX_AFTER_ARGUMENT) {
          if (c == '+' && last_quoted) {
            advance();
            tokens.emplace_back(yang_token_kind_t::CONCAT, "+", line);
            state = LEX_AFTER_CONCAT;
            break;
          }
          fail("Unexpected token " + describe_next());
        }
        if (c == '}') {
          fail("Unexpected token }");
        }
        if (c == '"' || c == '\'') {
          std::string text = (c == '"') ? read_double_quoted() : read_single_quoted();
          tokens.emplace_back(yang_token_kind_t::QUOTED_STRING, text, line);
          last_quoted = true;
        } else {
          tokens.emplace_back(yang_token_kind_t::UNQUOTED_STRING, read_unquoted(), line);
          last_quoted = false;
        }
        state = LEX_AFTER_ARGUMENT;
        break;

      case LEX_AFTER_CONCAT:
        if (c != '"' && c != '\'') {
          fail("Invalid argument to the right of the plus symbol");
        }
        tokens.emplace_back(yang_token_kind_t::QUOTED_STRING,
                            (c == '"') ? read_double_quoted() : read_single_quoted(),
                            line);
        state = LEX_AFTER_ARGUMENT;
        break;
    }
  }

  return tokens;
}

std::vector<YangToken> YangTokenizer::tokenize()
{
  std::vector<YangToken> raw = tokenize_raw();
  std::vector<YangToken> tokens;
  tokens.reserve(raw.size());

  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i].kind == yang_token_kind_t::CONCAT) {
      // The lexer only emits CONCAT between two quoted strings.
      YANGC_ASSERT(!tokens.empty() && i + 1 < raw.size());
      tokens.back().text += raw[i + 1].text;
      ++i;
      continue;
    }
    tokens.push_back(raw[i]);
  }
  return tokens;
}

void yangc::yang_parse(const std::string& text,
                       const std::string& filename,
                       YangStatementHandler* handler)
{
  YANGC_ASSERT(handler);

  std::vector<YangToken> tokens = YangTokenizer(text, filename).tokenize();
  std::stack<std::string> open;

  size_t i = 0;
  while (i < tokens.size()) {
    const YangToken& keyword = tokens[i++];
    if (keyword.kind == yang_token_kind_t::BLOCK_END) {
      YANGC_ASSERT(!open.empty());
      handler->leave(open.top());
      open.pop();
      continue;
    }
    YANGC_ASSERT(keyword.kind == yang_token_kind_t::UNQUOTED_STRING);

    std::string argument;
    bool has_argument = false;
    if (i < tokens.size() && tokens[i].is_string()) {
      argument = tokens[i++].text;
      has_argument = true;
    }
    YANGC_ASSERT(i < tokens.size());

    SourceLocation location(filename, keyword.line);
    const YangToken& terminator = tokens[i++];
    handler->enter(keyword.text, argument, has_argument, location);
    if (terminator.kind == yang_token_kind_t::STMT_END) {
      handler->leave(keyword.text);
    } else {
      YANGC_ASSERT(terminator.kind == yang_token_kind_t::BLOCK_BEGIN);
      open.push(keyword.text);
    }
  }
}
