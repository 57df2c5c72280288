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
 * @file yang_errors.hpp
 *
 * Exceptions raised by schema compilation.
 */

#ifndef YANGC_YANG_ERRORS_HPP_
#define YANGC_YANG_ERRORS_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <stdexcept>
#include <string>

namespace yangc {

/*!
 * Position of a statement in the schema source.  A default constructed
 * location is unknown and formats as an empty string.
 */
struct SourceLocation
{
  SourceLocation()
  : line(0)
  {}

  SourceLocation(const std::string& f, int l)
  : filename(f),
    line(l)
  {}

  bool is_known() const
  {
    return !filename.empty();
  }

  std::string to_string() const;

  std::string filename;
  int line;
};

/*!
 * Base of every exception thrown by yangc.
 */
class Error
: public std::runtime_error
{
 public:
  explicit Error(const std::string& what)
  : std::runtime_error(what)
  {}
};

/*!
 * Retrieval, grammar and resolution failures.  The whole compilation is
 * abandoned when one of these is thrown.
 */
class ModelProcessingError
: public Error
{
 public:
  explicit ModelProcessingError(const std::string& what)
  : Error(what)
  {}

  ModelProcessingError(const std::string& what, const SourceLocation& location);
};

/*!
 * Invariants that cannot fail when every earlier pass succeeded.
 */
class InternalError
: public Error
{
 public:
  explicit InternalError(const std::string& what)
  : Error(what)
  {}
};

/*!
 * A wire value does not have the shape required by its type.
 */
class InvalidValueError
: public Error
{
 public:
  explicit InvalidValueError(const std::string& what)
  : Error(what)
  {}
};

} // namespace yangc

#endif // YANGC_YANG_ERRORS_HPP_
