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
 * @file yangc_config.h
 *
 * Environment driven configuration of the yangc tools and cache.
 *
 * - YANGC_CACHE_DIR: directory of the compiled schema cache
 * - YANGC_YANG_PATH: ':' separated YANG search directories
 * - YANGC_LOG_LEVEL: none, error, warn, info or debug
 */

#ifndef YANGC_CONFIG_H_
#define YANGC_CONFIG_H_

#include <sys/cdefs.h>

#include "yangc_status.h"
#include "yangc_trace.h"

#if __cplusplus
#if __cplusplus < 201103L
#error "Requires C++11"
#endif
#endif

__BEGIN_DECLS

/*!
 * Get the cache directory: YANGC_CACHE_DIR if set, otherwise
 * $HOME/.yangc/cache, otherwise /tmp/yangc/cache.
 *
 * @param[out] buf_out The directory
 * @param[in] buf_len Size of buf_out
 * @return YANGC_STATUS_FAILURE if the directory does not fit
 */
yangc_status_t yangc_util_get_cache_dir(char* buf_out,
                                        int buf_len);

/*!
 * Create the cache directory and its parents.
 */
yangc_status_t yangc_util_create_cache_dir(const char* cache_dir);

/*!
 * Remove the cache directory and everything in it.
 */
yangc_status_t yangc_util_remove_cache_dir(const char* cache_dir);

/*!
 * Get the raw YANG search path from YANGC_YANG_PATH.
 *
 * @return YANGC_STATUS_NOTFOUND if the variable is not set
 */
yangc_status_t yangc_util_get_yang_path(char* buf_out,
                                        int buf_len);

/*!
 * Get the log level from YANGC_LOG_LEVEL.
 *
 * @return YANGC_STATUS_NOTFOUND if the variable is not set,
 *   YANGC_STATUS_BADARG if it is not a known level
 */
yangc_status_t yangc_util_get_log_level(yangc_log_level_t* level);

/*!
 * Parse a log level name.
 */
yangc_status_t yangc_util_parse_log_level(const char* name,
                                          yangc_log_level_t* level);

__END_DECLS

#endif // YANGC_CONFIG_H_
