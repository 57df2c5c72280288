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
 * @file yang_path.hpp
 *
 * Schema node paths as used by augment, deviation, refine and leafref.
 */

#ifndef YANGC_YANG_PATH_HPP_
#define YANGC_YANG_PATH_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <string>
#include <vector>

#include "yang_identifier.hpp"

namespace yangc {

/*!
 * The grammar a path argument is parsed with.
 */
enum class yang_path_form_t
{
  ABSOLUTE_SCHEMA,   //!< "/p:a/p:b", module-level augment and deviation
  DESCENDANT_SCHEMA, //!< "a/b", refine and augment inside uses
  LEAFREF,           //!< "/a/b" or "../b", predicates and ".." allowed
};

/*!
 * A parsed path: a sequence of identifiers.  A ".." step is kept as a
 * lazy-bound identifier named "..".  Predicates are dropped.
 */
class YangPath
{
 public:
  YangPath()
  : absolute_(false)
  {}

  YangPath(const std::vector<Identifier>& parts, bool absolute)
  : parts_(parts),
    absolute_(absolute)
  {}

  /*!
   * Parse a path argument.  Bare names take default_module, prefixed
   * names are resolved through prefixes.  Throws ModelProcessingError
   * when the text does not match the grammar of the form.
   */
  static YangPath parse(const std::string& text,
                        yang_path_form_t form,
                        const ModuleRef& default_module,
                        const prefix_map_t& prefixes);

  //! Check for a ".." step.
  static bool is_parent_step(const Identifier& id);

 public:
  bool is_absolute() const { return absolute_; }
  bool empty() const { return parts_.empty(); }
  size_t size() const { return parts_.size(); }
  const std::vector<Identifier>& parts() const { return parts_; }

  //! Bind every lazy-bound step, except "..", to module.
  void bind_lazy(const std::string& module);

  std::string to_string() const;

  bool operator==(const YangPath& other) const;
  bool operator!=(const YangPath& other) const { return !(*this == other); }

 private:
  std::vector<Identifier> parts_;
  bool absolute_;
};

} // namespace yangc

#endif // YANGC_YANG_PATH_HPP_
