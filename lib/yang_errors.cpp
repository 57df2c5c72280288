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
 * @file yang_errors.cpp
 */

#include <sstream>

#include "yang_errors.hpp"

using namespace yangc;

std::string SourceLocation::to_string() const
{
  if (!is_known()) {
    return std::string();
  }
  std::ostringstream oss;
  oss << filename << ":" << line;
  return oss.str();
}

static std::string format_with_location(const std::string& what, const SourceLocation& location)
{
  if (!location.is_known()) {
    return what;
  }
  return location.to_string() + ": " + what;
}

ModelProcessingError::ModelProcessingError(const std::string& what, const SourceLocation& location)
: Error(format_with_location(what, location))
{
}
