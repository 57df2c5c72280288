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
 * @file yangc_config.cpp
 */

#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <string>

#include <boost/filesystem.hpp>

#include "yangc_config.h"

namespace fs = boost::filesystem;

static const char* YANGC_CACHE_SUBDIR = ".yangc/cache";
static const char* YANGC_CACHE_DIR_FALLBACK = "/tmp/yangc/cache";

static yangc_status_t yangc_util_copy_out(const char* value,
                                          char* buf_out,
                                          int buf_len)
{
  int ret_len = snprintf(buf_out, buf_len, "%s", value);
  if (ret_len < 0 || ret_len >= buf_len) {
    return YANGC_STATUS_FAILURE;
  }
  return YANGC_STATUS_SUCCESS;
}

yangc_status_t yangc_util_get_cache_dir(char* buf_out,
                                        int buf_len)
{
  const char* cache_dir = nullptr;
  std::string path;

  do {
    cache_dir = getenv("YANGC_CACHE_DIR");
    if (cache_dir && *cache_dir) {
      break;
    }

    const char* home = getenv("HOME");
    if (home && *home) {
      path = (fs::path(home) / YANGC_CACHE_SUBDIR).string();
      cache_dir = path.c_str();
      break;
    }

    cache_dir = YANGC_CACHE_DIR_FALLBACK;

  } while (0);

  return yangc_util_copy_out(cache_dir, buf_out, buf_len);
}

yangc_status_t yangc_util_create_cache_dir(const char* cache_dir)
{
  fs::path dir(cache_dir);
  boost::system::error_code ec;

  if (fs::is_directory(dir, ec)) {
    return YANGC_STATUS_SUCCESS;
  }

  fs::create_directories(dir, ec);
  if (ec) {
    return YANGC_STATUS_FAILURE;
  }

  return fs::is_directory(dir, ec) ? YANGC_STATUS_SUCCESS : YANGC_STATUS_FAILURE;
}

yangc_status_t yangc_util_remove_cache_dir(const char* cache_dir)
{
  fs::path dir(cache_dir);
  boost::system::error_code ec;

  if (!fs::exists(dir, ec)) {
    return YANGC_STATUS_SUCCESS;
  }

  fs::remove_all(dir, ec);
  return ec ? YANGC_STATUS_FAILURE : YANGC_STATUS_SUCCESS;
}

yangc_status_t yangc_util_get_yang_path(char* buf_out,
                                        int buf_len)
{
  const char* yang_path = getenv("YANGC_YANG_PATH");
  if (!yang_path) {
    return YANGC_STATUS_NOTFOUND;
  }
  return yangc_util_copy_out(yang_path, buf_out, buf_len);
}

yangc_status_t yangc_util_parse_log_level(const char* name,
                                          yangc_log_level_t* level)
{
  static const struct {
    const char* name;
    yangc_log_level_t level;
  } levels[] = {
    { "none",  YANGC_LOG_LEVEL_NONE },
    { "error", YANGC_LOG_LEVEL_ERROR },
    { "warn",  YANGC_LOG_LEVEL_WARN },
    { "info",  YANGC_LOG_LEVEL_INFO },
    { "debug", YANGC_LOG_LEVEL_DEBUG },
  };

  if (!name || !level) {
    return YANGC_STATUS_BADARG;
  }
  for (const auto& entry : levels) {
    if (!strcasecmp(name, entry.name)) {
      *level = entry.level;
      return YANGC_STATUS_SUCCESS;
    }
  }
  return YANGC_STATUS_BADARG;
}

yangc_status_t yangc_util_get_log_level(yangc_log_level_t* level)
{
  const char* name = getenv("YANGC_LOG_LEVEL");
  if (!name) {
    return YANGC_STATUS_NOTFOUND;
  }
  return yangc_util_parse_log_level(name, level);
}
