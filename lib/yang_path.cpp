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
 * @file yang_path.cpp
 */

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "yang_errors.hpp"
#include "yang_path.hpp"

using namespace yangc;

static const char* const PARENT_STEP = "..";

namespace {

/*!
 * Splits a path into its steps, honouring brackets and quotes inside
 * predicates.
 */
class PathScanner
{
 public:
  explicit PathScanner(const std::string& text)
  : text_(text)
  {}

  bool split(std::vector<std::string>* steps) const
  {
    std::string current;
    int depth = 0;
    char quote = 0;

    for (char c : text_) {
      if (quote) {
        if (c == quote) {
          quote = 0;
        }
        current += c;
        continue;
      }
      switch (c) {
        case '\'':
        case '"':
          if (!depth) {
            return false;
          }
          quote = c;
          break;
        case '[':
          ++depth;
          break;
        case ']':
          if (!depth) {
            return false;
          }
          --depth;
          break;
        case '/':
          if (!depth) {
            steps->push_back(current);
            current.clear();
            continue;
          }
          break;
        default:
          break;
      }
      current += c;
    }

    if (depth || quote) {
      return false;
    }
    steps->push_back(current);
    return true;
  }

 private:
  const std::string& text_;
};

}

/*!
 * Split a step into its node identifier and predicate text.  Returns
 * false when something other than predicates follows the identifier.
 */
static bool split_predicates(const std::string& step, std::string* node, bool* has_predicates)
{
  size_t bracket = step.find('[');
  *has_predicates = (bracket != std::string::npos);
  *node = boost::algorithm::trim_copy(step.substr(0, bracket));
  if (!*has_predicates) {
    return true;
  }

  std::string rest = boost::algorithm::trim_copy(step.substr(bracket));
  return !rest.empty() && rest.front() == '[' && rest.back() == ']';
}

YangPath YangPath::parse(const std::string& text,
                         yang_path_form_t form,
                         const ModuleRef& default_module,
                         const prefix_map_t& prefixes)
{
  std::string trimmed = boost::algorithm::trim_copy(text);
  bool absolute = boost::starts_with(trimmed, "/");

  bool form_ok = false;
  switch (form) {
    case yang_path_form_t::ABSOLUTE_SCHEMA:
      form_ok = absolute;
      break;
    case yang_path_form_t::DESCENDANT_SCHEMA:
      form_ok = !absolute && !trimmed.empty();
      break;
    case yang_path_form_t::LEAFREF:
      form_ok = absolute || boost::starts_with(trimmed, PARENT_STEP);
      break;
  }
  if (!form_ok) {
    throw ModelProcessingError("Invalid path '" + text + "'");
  }

  std::vector<std::string> steps;
  if (!PathScanner(absolute ? trimmed.substr(1) : trimmed).split(&steps)) {
    throw ModelProcessingError("Invalid path '" + text + "'");
  }

  std::vector<Identifier> parts;
  for (const std::string& step : steps) {
    std::string node;
    bool has_predicates = false;
    if (!split_predicates(step, &node, &has_predicates)) {
      throw ModelProcessingError("Invalid path '" + text + "'");
    }
    if (has_predicates && form != yang_path_form_t::LEAFREF) {
      throw ModelProcessingError("Invalid path '" + text + "'");
    }

    if (node == PARENT_STEP) {
      if (form != yang_path_form_t::LEAFREF || has_predicates) {
        throw ModelProcessingError("Invalid path '" + text + "'");
      }
      parts.push_back(Identifier::lazy_bound(PARENT_STEP));
      continue;
    }

    Identifier id = Identifier::from_yang_string(node, default_module, prefixes);
    if (!id.is_valid()) {
      throw ModelProcessingError("Invalid path '" + text + "'");
    }
    parts.push_back(id);
  }

  if (parts.empty()) {
    throw ModelProcessingError("Invalid path '" + text + "'");
  }
  return YangPath(parts, absolute);
}

bool YangPath::is_parent_step(const Identifier& id)
{
  return id.is_lazy_bound() && id.name() == PARENT_STEP;
}

void YangPath::bind_lazy(const std::string& module)
{
  for (Identifier& part : parts_) {
    if (!is_parent_step(part)) {
      part.bind_module(module);
    }
  }
}

std::string YangPath::to_string() const
{
  std::string result;
  for (size_t i = 0; i < parts_.size(); ++i) {
    if (i || absolute_) {
      result += "/";
    }
    if (is_parent_step(parts_[i])) {
      result += PARENT_STEP;
    } else {
      result += parts_[i].to_string();
    }
  }
  return result;
}

bool YangPath::operator==(const YangPath& other) const
{
  return absolute_ == other.absolute_ && parts_ == other.parts_;
}
