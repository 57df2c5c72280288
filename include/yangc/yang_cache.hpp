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
 * @file yang_cache.hpp
 *
 * Content addressed cache of compiled schemas.  Entries are keyed by a
 * digest of the module set, so a schema compiled from other module
 * revisions, or by an incompatible version of the cache format, is
 * never reused.
 */

#ifndef YANGC_YANG_CACHE_HPP_
#define YANGC_YANG_CACHE_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <cstdint>
#include <functional>
#include <string>

#include "yang_schema.hpp"
#include "yangc_status.h"
#include "yangc_trace.h"

namespace yangc {

//! Version of the cache blob layout, mixed into every digest.
static const uint32_t YANGC_CACHE_FORMAT_VERSION = 1;

class SchemaCache
{
 public:
  typedef std::function<CompiledSchema::ptr_t()> compile_fn_t;

  /*!
   * @param cache_dir Directory of the cache files, created on first store
   * @param trace Trace context, not owned; may be nullptr
   */
  explicit SchemaCache(const std::string& cache_dir,
                       yangc_trace_ctx_t* trace = nullptr);

  // Cannot copy
  SchemaCache(const SchemaCache&) = delete;
  SchemaCache& operator=(const SchemaCache&) = delete;

 public:
  /*!
   * SHA-1 of the versioned, sorted module identities, in lower case hex.
   */
  static std::string compute_digest(const module_set_t& modules);

  const std::string& cache_dir() const { return cache_dir_; }

  //! The cache file of a digest: <cache_dir>/model_<digest>.bin
  std::string file_path(const std::string& digest) const;

  /*!
   * Store a schema under the digest of its module set.  The file is
   * written under a temporary name and renamed into place.  Never
   * throws; a failure leaves no file behind.
   */
  yangc_status_t store(const CompiledSchema& schema);

  /*!
   * Load the schema of a digest.  A missing file is
   * YANGC_STATUS_NOTFOUND; an unreadable, corrupt or foreign file is
   * YANGC_STATUS_FAILURE.  Either way the caller recompiles.
   */
  yangc_status_t load(const std::string& digest, CompiledSchema::ptr_t* schema) const;

  /*!
   * Return the cached schema of modules, or compile and store it.
   * Exceptions from compile propagate and nothing is stored.
   *
   * @param[out] hit Set when the schema came from the cache
   */
  CompiledSchema::ptr_t get_or_compile(const module_set_t& modules,
                                       const compile_fn_t& compile,
                                       bool* hit = nullptr);

  //! Serialize a schema into a cache blob.
  static yangc_status_t encode(const CompiledSchema& schema,
                               const std::string& digest,
                               std::string* blob);

  /*!
   * Rebuild a schema from a cache blob.  The blob must carry the
   * current format version and the expected digest.
   */
  static yangc_status_t decode(const std::string& blob,
                               const std::string& digest,
                               CompiledSchema::ptr_t* schema);

 private:
  std::string cache_dir_;
  yangc_trace_ctx_t* trace_;
};

} // namespace yangc

#endif // YANGC_YANG_CACHE_HPP_
