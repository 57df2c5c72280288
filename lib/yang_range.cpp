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
 * @file yang_range.cpp
 */

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <limits>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>

#include "yang_errors.hpp"
#include "yang_range.hpp"

using namespace yangc;

static const char* const RANGE_SEPARATOR = "..";
static const unsigned MAX_RANGE_DIGITS = 38;

namespace {

struct RangePart
{
  std::string low;
  std::string high;
};

}

static std::vector<RangePart> split_range(const std::string& text)
{
  std::vector<std::string> alternatives;
  boost::algorithm::split(alternatives, text, boost::algorithm::is_any_of("|"));

  std::vector<RangePart> parts;
  for (const std::string& alt : alternatives) {
    RangePart part;
    size_t sep = alt.find(RANGE_SEPARATOR);
    if (sep == std::string::npos) {
      part.low = boost::algorithm::trim_copy(alt);
      part.high = part.low;
    } else {
      part.low = boost::algorithm::trim_copy(alt.substr(0, sep));
      part.high = boost::algorithm::trim_copy(alt.substr(sep + 2));
    }
    if (part.low.empty() || part.high.empty()) {
      throw ModelProcessingError("Invalid range '" + text + "'");
    }
    parts.push_back(part);
  }
  return parts;
}

static std::string join_range(const std::vector<RangePart>& parts)
{
  std::string result;
  for (const RangePart& part : parts) {
    if (!result.empty()) {
      result += "|";
    }
    result += part.low;
    if (part.high != part.low) {
      result += RANGE_SEPARATOR;
      result += part.high;
    }
  }
  return result;
}

std::string yangc::merge_ranges(const std::string& parent, const std::string& child)
{
  if (boost::algorithm::trim_copy(parent).empty()) {
    return child;
  }
  if (boost::algorithm::trim_copy(child).empty()) {
    return parent;
  }

  std::vector<RangePart> parent_parts = split_range(parent);
  const std::string& parent_min = parent_parts.front().low;
  const std::string& parent_max = parent_parts.back().high;

  std::vector<RangePart> child_parts = split_range(child);
  for (RangePart& part : child_parts) {
    for (std::string* bound : { &part.low, &part.high }) {
      if (*bound == "min") {
        *bound = parent_min;
      } else if (*bound == "max") {
        *bound = parent_max;
      }
    }
  }
  return join_range(child_parts);
}

bool yangc::parse_range_number(const std::string& text, unsigned fraction_digits, range_value_t* value)
{
  size_t pos = 0;
  bool negative = false;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    negative = (text[pos] == '-');
    ++pos;
  }

  range_value_t result = 0;
  unsigned digits = 0;
  unsigned frac_digits = 0;
  bool in_fraction = false;
  for (; pos < text.size(); ++pos) {
    char c = text[pos];
    if (c == '.') {
      if (in_fraction || !digits) {
        return false;
      }
      in_fraction = true;
      continue;
    }
    if (c < '0' || c > '9') {
      return false;
    }
    if (in_fraction) {
      if (++frac_digits > fraction_digits) {
        if (c != '0') {
          return false;
        }
        continue;
      }
    }
    if (++digits > MAX_RANGE_DIGITS) {
      return false;
    }
    result = result * 10 + (c - '0');
  }

  if (!digits || (in_fraction && !frac_digits)) {
    return false;
  }
  for (unsigned i = std::min(frac_digits, fraction_digits); i < fraction_digits; ++i) {
    result *= 10;
  }

  *value = negative ? -result : result;
  return true;
}

std::string yangc::format_range_number(range_value_t value, unsigned fraction_digits)
{
  bool negative = value < 0;
  unsigned __int128 magnitude = negative
    ? static_cast<unsigned __int128>(-(value + 1)) + 1
    : static_cast<unsigned __int128>(value);

  std::string digits;
  do {
    digits.insert(digits.begin(), static_cast<char>('0' + static_cast<int>(magnitude % 10)));
    magnitude /= 10;
  } while (magnitude);

  if (fraction_digits) {
    if (digits.size() <= fraction_digits) {
      digits.insert(0, fraction_digits - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - fraction_digits, ".");
  }
  return negative ? "-" + digits : digits;
}

static range_value_t parse_bound(const std::string& bound, const std::string& text, const RangeDomain& domain)
{
  if (bound == "min") {
    return domain.min;
  }
  if (bound == "max") {
    return domain.max;
  }

  range_value_t value = 0;
  if (!parse_range_number(bound, domain.fraction_digits, &value)) {
    throw ModelProcessingError("Invalid range bound '" + bound + "' in '" + text + "'");
  }
  if (value < domain.min || value > domain.max) {
    throw ModelProcessingError("Range bound '" + bound + "' out of type range in '" + text + "'");
  }
  return value;
}

std::vector<RangeInterval> yangc::parse_range(const std::string& text, const RangeDomain& domain)
{
  std::vector<RangeInterval> intervals;
  for (const RangePart& part : split_range(text)) {
    RangeInterval interval;
    interval.low = parse_bound(part.low, text, domain);
    interval.high = parse_bound(part.high, text, domain);
    if (interval.low > interval.high) {
      throw ModelProcessingError("Invalid range '" + text + "'");
    }
    intervals.push_back(interval);
  }
  return intervals;
}

std::string yangc::normalize_range(const std::string& text, const RangeDomain& domain)
{
  std::vector<RangeInterval> intervals = parse_range(text, domain);
  std::sort(intervals.begin(), intervals.end(),
            [](const RangeInterval& a, const RangeInterval& b) { return a.low < b.low; });

  std::vector<RangeInterval> merged;
  for (const RangeInterval& interval : intervals) {
    // Scaled bounds are integers, so high + 1 is the adjacent value.
    if (!merged.empty() && interval.low <= merged.back().high + 1) {
      merged.back().high = std::max(merged.back().high, interval.high);
      continue;
    }
    merged.push_back(interval);
  }

  std::vector<RangePart> parts;
  for (const RangeInterval& interval : merged) {
    RangePart part;
    part.low = format_range_number(interval.low, domain.fraction_digits);
    part.high = format_range_number(interval.high, domain.fraction_digits);
    parts.push_back(part);
  }
  return join_range(parts);
}

bool yangc::range_contains(const std::vector<RangeInterval>& intervals, range_value_t value)
{
  for (const RangeInterval& interval : intervals) {
    if (value >= interval.low && value <= interval.high) {
      return true;
    }
  }
  return false;
}

RangeDomain yangc::length_domain()
{
  return RangeDomain(0, static_cast<range_value_t>(std::numeric_limits<uint64_t>::max()), 0);
}
