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
 * @file yang_identifier.cpp
 */

#include <functional>

#include "yang_errors.hpp"
#include "yang_identifier.hpp"

using namespace yangc;

ModuleRef ModuleRef::builtin()
{
  return ModuleRef(module_kind_t::BUILTIN, std::string());
}

ModuleRef ModuleRef::lazy_bound()
{
  return ModuleRef(module_kind_t::LAZY_BOUND, std::string());
}

ModuleRef ModuleRef::named(const std::string& module)
{
  return ModuleRef(module_kind_t::EXPLICIT, module);
}

bool ModuleRef::operator==(const ModuleRef& other) const
{
  return kind_ == other.kind_ && name_ == other.name_;
}

bool ModuleRef::operator<(const ModuleRef& other) const
{
  if (kind_ != other.kind_) {
    return kind_ < other.kind_;
  }
  return name_ < other.name_;
}

Identifier::Identifier(const ModuleRef& module, const std::string& name)
: module_(module),
  name_(name)
{
}

Identifier::Identifier(const std::string& module, const std::string& name)
: module_(ModuleRef::named(module)),
  name_(name)
{
}

Identifier Identifier::builtin(const std::string& name)
{
  return Identifier(ModuleRef::builtin(), name);
}

Identifier Identifier::lazy_bound(const std::string& name)
{
  return Identifier(ModuleRef::lazy_bound(), name);
}

Identifier Identifier::from_yang_string(const std::string& text,
                                        const ModuleRef& default_module,
                                        const prefix_map_t& prefixes)
{
  size_t colon = text.find(':');
  if (colon == std::string::npos) {
    return Identifier(default_module, text);
  }
  if (text.find(':', colon + 1) != std::string::npos) {
    throw ModelProcessingError("Identifier can have only one colon: '" + text + "'");
  }

  std::string prefix = text.substr(0, colon);
  std::string name = text.substr(colon + 1);
  auto it = prefixes.find(prefix);
  if (it == prefixes.end()) {
    throw ModelProcessingError("Unknown prefix '" + prefix + "' in '" + text + "'");
  }
  return Identifier(it->second, name);
}

Identifier Identifier::from_model_string(const std::string& text)
{
  size_t colon = text.find(':');
  if (colon == std::string::npos) {
    return lazy_bound(text);
  }
  if (text.find(':', colon + 1) != std::string::npos) {
    throw ModelProcessingError("Identifier can have only one colon: '" + text + "'");
  }
  return Identifier(text.substr(0, colon), text.substr(colon + 1));
}

bool yangc::is_yang_identifier(const std::string& text)
{
  if (text.empty()) {
    return false;
  }
  char c = text[0];
  if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_')) {
    return false;
  }
  for (size_t i = 1; i < text.size(); ++i) {
    c = text[i];
    if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
          || c == '_' || c == '-' || c == '.')) {
      return false;
    }
  }
  return true;
}

bool Identifier::is_valid() const
{
  if (!is_yang_identifier(name_)) {
    return false;
  }
  return !module_.is_explicit() || is_yang_identifier(module_.name());
}

void Identifier::bind_module(const std::string& module)
{
  if (module_.is_lazy_bound()) {
    module_ = ModuleRef::named(module);
  }
}

std::string Identifier::to_string() const
{
  switch (module_.kind()) {
    case module_kind_t::BUILTIN:
      return name_;
    case module_kind_t::LAZY_BOUND:
      return "?:" + name_;
    case module_kind_t::EXPLICIT:
      return module_.name() + ":" + name_;
  }
  return name_;
}

bool Identifier::operator==(const Identifier& other) const
{
  return name_ == other.name_ && module_ == other.module_;
}

bool Identifier::operator<(const Identifier& other) const
{
  if (module_ != other.module_) {
    return module_ < other.module_;
  }
  return name_ < other.name_;
}

size_t IdentifierHash::operator()(const Identifier& id) const
{
  std::hash<std::string> hasher;
  size_t h = hasher(id.name());
  h ^= hasher(id.module()) + 0x9e3779b9 + (h << 6) + (h >> 2);
  return h ^ static_cast<size_t>(id.module_ref().kind());
}

std::ostream& yangc::operator<<(std::ostream& os, const Identifier& id)
{
  return os << id.to_string();
}
