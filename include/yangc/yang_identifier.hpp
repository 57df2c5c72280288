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
 * @file yang_identifier.hpp
 *
 * Module qualified YANG names.
 */

#ifndef YANGC_YANG_IDENTIFIER_HPP_
#define YANGC_YANG_IDENTIFIER_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <cstddef>
#include <map>
#include <ostream>
#include <string>

namespace yangc {

//! Maps a prefix, as declared by prefix/import/belongs-to, to a module name.
typedef std::map<std::string, std::string> prefix_map_t;

/*!
 * The three disjoint kinds of module binding a name may have.
 */
enum class module_kind_t
{
  BUILTIN,    //!< No module: YANG builtin types and keywords
  LAZY_BOUND, //!< Module inferred later from the using context
  EXPLICIT,   //!< Module known
};

/*!
 * The module half of an Identifier.  A tagged value: only EXPLICIT
 * references carry a module name.
 */
class ModuleRef
{
 public:
  ModuleRef()
  : kind_(module_kind_t::BUILTIN)
  {}

  static ModuleRef builtin();
  static ModuleRef lazy_bound();
  static ModuleRef named(const std::string& module);

 public:
  module_kind_t kind() const { return kind_; }
  bool is_builtin() const { return kind_ == module_kind_t::BUILTIN; }
  bool is_lazy_bound() const { return kind_ == module_kind_t::LAZY_BOUND; }
  bool is_explicit() const { return kind_ == module_kind_t::EXPLICIT; }

  //! The module name; empty unless explicit.
  const std::string& name() const { return name_; }

  bool operator==(const ModuleRef& other) const;
  bool operator!=(const ModuleRef& other) const { return !(*this == other); }
  bool operator<(const ModuleRef& other) const;

 private:
  ModuleRef(module_kind_t kind, const std::string& name)
  : kind_(kind),
    name_(name)
  {}

  module_kind_t kind_;
  std::string name_;
};

/*!
 * A (module, name) pair naming one YANG entity.  Equality, ordering
 * and hashing cover both halves.  Identifiers are immutable, except
 * that a lazy-bound identifier may be bound to a module once the
 * destination of a grouping copy is known.
 */
class Identifier
{
 public:
  Identifier() {}
  Identifier(const ModuleRef& module, const std::string& name);
  Identifier(const std::string& module, const std::string& name);

  static Identifier builtin(const std::string& name);
  static Identifier lazy_bound(const std::string& name);

  /*!
   * Parse a name as written in YANG source.  "p:name" resolves the
   * prefix through the prefix map; a bare name takes the default module.
   * Throws ModelProcessingError for an unknown prefix or more than one
   * colon.
   */
  static Identifier from_yang_string(const std::string& text,
                                     const ModuleRef& default_module,
                                     const prefix_map_t& prefixes);

  /*!
   * Parse "module:name"; a bare name is lazy-bound.
   */
  static Identifier from_model_string(const std::string& text);

 public:
  const ModuleRef& module_ref() const { return module_; }
  const std::string& module() const { return module_.name(); }
  const std::string& name() const { return name_; }

  bool is_builtin() const { return module_.is_builtin(); }
  bool is_lazy_bound() const { return module_.is_lazy_bound(); }
  bool is_explicit() const { return module_.is_explicit(); }

  //! Check the name, and the module if explicit, are YANG identifiers.
  bool is_valid() const;

  //! Bind a lazy-bound identifier to a module.  No-op otherwise.
  void bind_module(const std::string& module);

  //! "module:name", "name" for builtin, "?:name" for lazy-bound.
  std::string to_string() const;

  bool operator==(const Identifier& other) const;
  bool operator!=(const Identifier& other) const { return !(*this == other); }
  bool operator<(const Identifier& other) const;

 private:
  ModuleRef module_;
  std::string name_;
};

struct IdentifierHash
{
  size_t operator()(const Identifier& id) const;
};

//! Check a string against the YANG identifier grammar.
bool is_yang_identifier(const std::string& text);

std::ostream& operator<<(std::ostream& os, const Identifier& id);

} // namespace yangc

#endif // YANGC_YANG_IDENTIFIER_HPP_
