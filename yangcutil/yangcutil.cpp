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
 * @file yangcutil.cpp
 *
 * Command line front end of the yangc compiler.
 */

#include <limits.h>
#include <stdio.h>
#include <stdlib.h>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/scope_exit.hpp>

#include "yang_cache.hpp"
#include "yang_compiler.hpp"
#include "yang_fetch.hpp"
#include "yangc_config.h"
#include "yangc_trace.h"
#include "yangcutil_argument_parser.hpp"

using namespace yangc;

namespace {

const std::set<std::string> valid_options = {
  "--module",
  "--yang-dir",
  "--dump",
  "--cache",
  "--digest",
  "--log-level",
  "--help",
  "-h",
};

const std::set<std::string> flag_options = {
  "--dump",
  "--cache",
  "--digest",
  "--help",
  "-h",
};

bool validate_arguments(const yangcutil::ArgumentParser& arguments)
{
  if (!arguments.stray_arguments().empty()) {
    std::cerr << "ERROR: unexpected argument: " << arguments.stray_arguments().front() << "\n";
    return false;
  }

  for (const std::string& option : arguments) {
    if (!valid_options.count(option)) {
      std::cerr << "ERROR: invalid option provided: " << option << "\n";
      return false;
    }
    if (flag_options.count(option) && !arguments.get_params_list(option).empty()) {
      std::cerr << "ERROR: " << option << " takes no arguments\n";
      return false;
    }
  }

  if (!arguments.exists("--module") || arguments.get_params_list("--module").empty()) {
    std::cerr << "ERROR: no modules given\n";
    return false;
  }
  return true;
}

bool get_log_level(const yangcutil::ArgumentParser& arguments,
                   yangc_log_level_t* level)
{
  *level = YANGC_LOG_LEVEL_NONE;
  if (arguments.exists("--log-level")) {
    const std::string& name = arguments.get_param("--log-level");
    if (yangc_util_parse_log_level(name.c_str(), level) != YANGC_STATUS_SUCCESS) {
      std::cerr << "ERROR: invalid log level: " << name << "\n";
      return false;
    }
    return true;
  }

  yangc_status_t status = yangc_util_get_log_level(level);
  if (status == YANGC_STATUS_BADARG) {
    std::cerr << "ERROR: invalid YANGC_LOG_LEVEL\n";
    return false;
  }
  if (status != YANGC_STATUS_SUCCESS) {
    *level = YANGC_LOG_LEVEL_NONE;
  }
  return true;
}

}

int main(int argc, char** argv)
{
  bool success = true;

  yangc_trace_ctx_t* trace = yangc_trace_init();
  yangc_trace_ctx_set_output(trace, stderr);
  BOOST_SCOPE_EXIT(trace) {
    yangc_trace_ctx_close(trace);
  } BOOST_SCOPE_EXIT_END

  try {
    if (argc < 2) {
      std::cerr << "Insufficient number of arguments provided" << std::endl;
      yangcutil::ArgumentParser::print_help();
      return EXIT_FAILURE;
    }

    const yangcutil::ArgumentParser arguments(argv, argc);

    if (arguments.exists("-h") || arguments.exists("--help")) {
      yangcutil::ArgumentParser::print_help();
      return EXIT_SUCCESS;
    }

    if (!validate_arguments(arguments)) {
      return EXIT_FAILURE;
    }

    yangc_log_level_t level;
    if (!get_log_level(arguments, &level)) {
      return EXIT_FAILURE;
    }

    std::vector<std::string> dirs;
    if (arguments.exists("--yang-dir")) {
      dirs = arguments.get_params_list("--yang-dir");
    }
    for (const std::string& dir : yangc_yang_search_path()) {
      dirs.push_back(dir);
    }

    YangCompiler compiler(yangc_directory_fetcher(dirs, trace), trace);
    compiler.set_log_level(level);
    for (const std::string& module : arguments.get_params_list("--module")) {
      compiler.add_module(module);
    }

    CompiledSchema::ptr_t schema;
    if (arguments.exists("--digest") || arguments.exists("--cache")) {
      module_set_t modules = compiler.scan();
      if (arguments.exists("--digest")) {
        std::cout << SchemaCache::compute_digest(modules) << std::endl;
      }

      if (arguments.exists("--cache")) {
        char cache_dir[PATH_MAX];
        if (yangc_util_get_cache_dir(cache_dir, sizeof(cache_dir)) != YANGC_STATUS_SUCCESS) {
          std::cerr << "ERROR: cannot determine the cache directory\n";
          return EXIT_FAILURE;
        }
        SchemaCache cache(cache_dir, trace);
        bool hit = false;
        schema = cache.get_or_compile(modules, [&compiler]() { return compiler.compile(); }, &hit);
        YANGC_TRACE_INFO(trace, YANGC_TRACE_CATEGORY_UTIL, "Schema %s from %s",
                         hit ? "loaded" : "compiled", cache_dir);
      }
    }

    if (!schema && (!arguments.exists("--digest") || arguments.exists("--dump"))) {
      schema = compiler.compile();
    }

    if (schema) {
      if (arguments.exists("--dump")) {
        yangc_schema_dump(*schema, schema->root(), 0, std::cout);
      } else {
        std::cout << "Compiled " << schema->modules().size() << " modules into "
                  << schema->size() << " nodes" << std::endl;
      }
    }

  } catch (const Error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    success = false;
  } catch (const std::range_error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    success = false;
  }

  return success ? EXIT_SUCCESS : EXIT_FAILURE;
}
