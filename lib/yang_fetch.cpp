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
 * @file yang_fetch.cpp
 */

#include <limits.h>
#include <string.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>

#include "yang_errors.hpp"
#include "yang_fetch.hpp"
#include "yangc_config.h"

namespace fs = boost::filesystem;

namespace yangc {

static const char* YANGC_YANG_EXTENSION = ".yang";

// Match <name>.yang or <name>@YYYY-MM-DD.yang
static bool yangc_is_module_file(const std::string& filename,
                                 const std::string& name)
{
  if (filename.size() < name.size() + strlen(YANGC_YANG_EXTENSION)
      || !boost::starts_with(filename, name)
      || !boost::ends_with(filename, YANGC_YANG_EXTENSION)) {
    return false;
  }
  std::string middle = filename.substr(name.size(),
                                       filename.size() - name.size() - strlen(YANGC_YANG_EXTENSION));
  if (middle.empty()) {
    return true;
  }
  static const char* date_shape = "@dddd-dd-dd";
  if (middle.size() != strlen(date_shape)) {
    return false;
  }
  for (size_t i = 0; i < middle.size(); ++i) {
    if (date_shape[i] == 'd') {
      if (!isdigit(static_cast<unsigned char>(middle[i]))) {
        return false;
      }
    } else if (middle[i] != date_shape[i]) {
      return false;
    }
  }
  return true;
}

std::string yangc_find_yang_file(const std::string& dir,
                                 const std::string& name)
{
  boost::system::error_code ec;
  fs::path direct = fs::path(dir) / (name + YANGC_YANG_EXTENSION);
  if (fs::is_regular_file(direct, ec)) {
    return direct.string();
  }
  if (!fs::is_directory(dir, ec)) {
    return std::string();
  }

  // "name.yang" sorts before "name@...", and revisions sort by date.
  std::string best_name;
  std::string best_path;
  fs::recursive_directory_iterator it(dir, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!fs::is_regular_file(it->path(), ec)) {
      continue;
    }
    const std::string filename = it->path().filename().string();
    if (!yangc_is_module_file(filename, name)) {
      continue;
    }
    const std::string path = it->path().string();
    if (filename > best_name || (filename == best_name && path < best_path)) {
      best_name = filename;
      best_path = path;
    }
  }
  return best_path;
}

yang_fetch_fn_t yangc_directory_fetcher(const std::vector<std::string>& dirs,
                                        yangc_trace_ctx_t* trace)
{
  return [dirs, trace](const std::string& name) -> std::string {
    for (const std::string& dir : dirs) {
      std::string path = yangc_find_yang_file(dir, name);
      if (path.empty()) {
        continue;
      }

      std::ifstream in(path);
      if (!in) {
        throw ModelProcessingError("Cannot read yang '" + name + "' from " + path);
      }
      std::ostringstream text;
      text << in.rdbuf();
      if (in.bad()) {
        throw ModelProcessingError("Cannot read yang '" + name + "' from " + path);
      }
      YANGC_TRACE_INFO(trace, YANGC_TRACE_CATEGORY_FETCH, "Fetched %s from %s",
                       name.c_str(), path.c_str());
      return text.str();
    }

    YANGC_TRACE_WARN(trace, YANGC_TRACE_CATEGORY_FETCH, "Cannot find yang '%s'",
                     name.c_str());
    throw ModelProcessingError("Cannot find yang '" + name + "'");
  };
}

std::vector<std::string> yangc_yang_search_path()
{
  std::vector<std::string> dirs;
  char buf[PATH_MAX * 4];
  if (yangc_util_get_yang_path(buf, sizeof(buf)) != YANGC_STATUS_SUCCESS) {
    return dirs;
  }

  std::string value(buf);
  boost::split(dirs, value, boost::is_any_of(":"));
  dirs.erase(std::remove(dirs.begin(), dirs.end(), std::string()), dirs.end());
  return dirs;
}

} // namespace yangc
