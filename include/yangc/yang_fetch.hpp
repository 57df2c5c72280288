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
 * @file yang_fetch.hpp
 *
 * Fetch functions that read YANG source from local directories.
 */

#ifndef YANGC_YANG_FETCH_HPP_
#define YANGC_YANG_FETCH_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <string>
#include <vector>

#include "yang_builder.hpp"
#include "yangc_trace.h"

namespace yangc {

/*!
 * Find the file of a module in one search directory.  <dir>/<name>.yang
 * is preferred.  Otherwise the directory tree is searched for
 * <name>.yang and <name>@YYYY-MM-DD.yang, and the latest revision wins.
 *
 * @return The path, or an empty string when nothing matches
 */
std::string yangc_find_yang_file(const std::string& dir,
                                 const std::string& name);

/*!
 * Build a fetch function over the search directories, tried in order.
 * The function throws ModelProcessingError "Cannot find yang '<name>'"
 * when no directory has the module.
 *
 * @param trace Trace context, not owned; must outlive the function
 */
yang_fetch_fn_t yangc_directory_fetcher(const std::vector<std::string>& dirs,
                                        yangc_trace_ctx_t* trace = nullptr);

/*!
 * The directories of YANGC_YANG_PATH, a ':' separated list.  Empty
 * entries are dropped; an unset variable gives an empty list.
 */
std::vector<std::string> yangc_yang_search_path();

} // namespace yangc

#endif // YANGC_YANG_FETCH_HPP_
