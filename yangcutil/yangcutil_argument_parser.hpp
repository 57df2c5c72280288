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
 * @file yangcutil_argument_parser.hpp
 */

#ifndef YANGC_YANGCUTIL_ARGUMENT_PARSER_HPP_
#define YANGC_YANGCUTIL_ARGUMENT_PARSER_HPP_

#include <map>
#include <string>
#include <vector>

namespace yangcutil {

/*!
 * ArgumentParser
 * Parser for command line options and their arguments.  Every word
 * following an option, up to the next option, is an argument of it.
 */
class ArgumentParser
{
 private:
  std::map<std::string, std::vector<std::string>> arguments_;
  std::vector<std::string> ordered_arguments_;
  std::vector<std::string> stray_arguments_;

  void parse_arguments(const char* const* argv, size_t argc);

 public:
  /*
   * Takes argv and argc as given to main(); argv[0] is skipped.
   */
  ArgumentParser(const char* const* argv, size_t argc);

  ArgumentParser(const ArgumentParser& other) = delete;
  void operator=(const ArgumentParser& other) = delete;

 public:
  typedef std::vector<std::string>::const_iterator const_iterator;

  static void print_help();

  /*!
   * The options, in command line order.
   */
  const_iterator begin() const;
  const_iterator end() const;

  /*
   * Gets all the arguments of an option.
   * Throws std::out_of_range if the option was not given.
   */
  const std::vector<std::string>& get_params_list(const std::string& option) const;

  /*
   * Gets the single argument of an option.
   * Throws std::out_of_range if the option was not given, and
   * std::range_error unless it has exactly one argument.
   */
  const std::string& get_param(const std::string& option) const;

  /*!
   * Words before the first option.
   */
  const std::vector<std::string>& stray_arguments() const { return stray_arguments_; }

  /*!
   * Checks if an option was given
   */
  bool exists(const std::string& option) const;
};

}

#endif // YANGC_YANGCUTIL_ARGUMENT_PARSER_HPP_
