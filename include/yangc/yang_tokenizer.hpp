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
 * @file yang_tokenizer.hpp
 *
 * Lexical analysis and statement grammar of YANG source text.
 */

#ifndef YANGC_YANG_TOKENIZER_HPP_
#define YANGC_YANG_TOKENIZER_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <string>
#include <vector>

#include "yang_errors.hpp"

namespace yangc {

enum class yang_token_kind_t
{
  QUOTED_STRING,
  UNQUOTED_STRING,
  STMT_END,     //!< ';'
  BLOCK_BEGIN,  //!< '{'
  BLOCK_END,    //!< '}'
  CONCAT,       //!< '+' between quoted strings
};

struct YangToken
{
  YangToken(yang_token_kind_t k, const std::string& t, int l)
  : kind(k),
    text(t),
    line(l)
  {}

  bool is_string() const
  {
    return kind == yang_token_kind_t::QUOTED_STRING
           || kind == yang_token_kind_t::UNQUOTED_STRING;
  }

  yang_token_kind_t kind;
  std::string text;
  int line;
};

/*!
 * Hand written lexer.  The meaning of a character depends on the
 * position within the current statement, so the lexer tracks it
 * explicitly.  Errors throw ModelProcessingError; no partial token
 * stream is ever returned.
 */
class YangTokenizer
{
 public:
  YangTokenizer(const std::string& text, const std::string& filename);

  // Cannot copy
  YangTokenizer(const YangTokenizer&) = delete;
  YangTokenizer& operator=(const YangTokenizer&) = delete;

 public:
  //! Tokens with CONCAT tokens still present.
  std::vector<YangToken> tokenize_raw();

  //! Tokens with each concatenation folded into one quoted string.
  std::vector<YangToken> tokenize();

 private:
  enum lex_state_t
  {
    LEX_STMT_START,      //!< First token of a statement, or after one
    LEX_AFTER_KEYWORD,   //!< After the first token
    LEX_AFTER_ARGUMENT,  //!< After the second token
    LEX_AFTER_CONCAT,
  };

  bool at_end() const { return pos_ >= text_.size(); }
  char peek(size_t offset = 0) const;
  void advance();
  unsigned column_of(size_t pos) const;
  SourceLocation location() const;
  [[noreturn]] void fail(const std::string& what) const;

  void skip_separators();
  std::string read_unquoted();
  std::string read_double_quoted();
  std::string read_single_quoted();
  std::string describe_next();

  const std::string& text_;
  std::string filename_;
  size_t pos_;
  int line_;
};

/*!
 * Receives the statements of a YANG file in document order.
 */
class YangStatementHandler
{
 public:
  virtual ~YangStatementHandler() {}

  /*!
   * A statement starts.  Statements terminated by ';' get an immediate
   * leave().
   */
  virtual void enter(const std::string& keyword,
                     const std::string& argument,
                     bool has_argument,
                     const SourceLocation& location) = 0;

  virtual void leave(const std::string& keyword) = 0;
};

/*!
 * Tokenize text and drive handler with its statements.
 */
void yang_parse(const std::string& text,
                const std::string& filename,
                YangStatementHandler* handler);

} // namespace yangc

#endif // YANGC_YANG_TOKENIZER_HPP_
