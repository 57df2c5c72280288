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
 * @file yangcutil_argument_parser.cpp
 */

#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/algorithm/string/predicate.hpp>

#include "yangcutil_argument_parser.hpp"

namespace yangcutil {

ArgumentParser::ArgumentParser(const char* const* argv, size_t argc)
{
  parse_arguments(argv, argc);
}

void ArgumentParser::parse_arguments(const char* const* argv, size_t argc)
{
  std::string current_option;
  for (size_t i = 1; i < argc; ++i) {
    std::string argument(argv[i]);

    if (boost::starts_with(argument, "--") || argument == "-h") {
      current_option = argument;
      if (!arguments_.count(current_option)) {
        arguments_[current_option] = std::vector<std::string>();
        ordered_arguments_.emplace_back(current_option);
      }
      continue;
    }

    if (current_option.empty()) {
      stray_arguments_.emplace_back(argument);
    } else {
      arguments_[current_option].emplace_back(argument);
    }
  }
}

void ArgumentParser::print_help()
{
  std::cout << "Usage: yangcutil --module <name>... [options]" << "\n";
  std::cout << "Compile YANG modules into a compact schema." << "\n";
  std::cout << "Options:" << "\n";
  std::cout << "  --module <name>...      Modules to compile\n";
  std::cout << "  --yang-dir <dir>...     Directories searched for <name>.yang,"
               " before those of YANGC_YANG_PATH\n";
  std::cout << "  --dump                  Print the compiled schema tree\n";
  std::cout << "  --cache                 Load the schema from the cache, or"
               " compile and store it\n";
  std::cout << "  --digest                Print the cache digest of the module set\n";
  std::cout << "  --log-level <level>     none, error, warn, info or debug;"
               " overrides YANGC_LOG_LEVEL\n";
  std::cout << "  --help, -h              Print this help\n";
  std::cout << std::endl;
}

ArgumentParser::const_iterator ArgumentParser::begin() const
{
  return ordered_arguments_.begin();
}

ArgumentParser::const_iterator ArgumentParser::end() const
{
  return ordered_arguments_.end();
}

bool ArgumentParser::exists(const std::string& option) const
{
  return arguments_.count(option) > 0;
}

const std::vector<std::string>& ArgumentParser::get_params_list(const std::string& option) const
{
  return arguments_.at(option);
}

const std::string& ArgumentParser::get_param(const std::string& option) const
{
  auto& vec = get_params_list(option);
  if (vec.size() != 1) throw std::range_error("Option " + option + " takes one argument");
  return vec[0];
}

}
