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
 * @file yang_range.hpp
 *
 * Range and length restriction arithmetic.
 */

#ifndef YANGC_YANG_RANGE_HPP_
#define YANGC_YANG_RANGE_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <string>
#include <vector>

namespace yangc {

/*!
 * Numeric range bound.  Decimal64 values are stored scaled by
 * 10^fraction-digits.  128 bits hold every int64, uint64 and scaled
 * decimal64 bound without overflow.
 */
typedef __int128 range_value_t;

/*!
 * The value space a range restriction applies to: the extremes that
 * replace "min" and "max", and the decimal scale.
 */
struct RangeDomain
{
  RangeDomain()
  : min(0),
    max(0),
    fraction_digits(0)
  {}

  RangeDomain(range_value_t mn, range_value_t mx, unsigned fd)
  : min(mn),
    max(mx),
    fraction_digits(fd)
  {}

  range_value_t min;
  range_value_t max;
  unsigned fraction_digits;
};

struct RangeInterval
{
  range_value_t low;
  range_value_t high;
};

/*!
 * Merge a restriction declared at a use site over the restriction of
 * the type it derives from.  "min" and "max" in the child are replaced
 * by the lowest and highest bound of the parent.  An empty parent
 * returns the child verbatim.
 */
std::string merge_ranges(const std::string& parent, const std::string& child);

/*!
 * Parse a range argument.  "min" and "max" become the domain extremes.
 * Throws ModelProcessingError for malformed text, reversed bounds or
 * bounds outside the domain.
 */
std::vector<RangeInterval> parse_range(const std::string& text, const RangeDomain& domain);

/*!
 * Canonical text of a range: symbolic bounds replaced, intervals sorted
 * and overlapping or adjacent intervals collapsed.
 */
std::string normalize_range(const std::string& text, const RangeDomain& domain);

bool range_contains(const std::vector<RangeInterval>& intervals, range_value_t value);

/*!
 * Parse a decimal number scaled by 10^fraction_digits.  Returns false
 * when the text is not a number or needs more fraction digits.
 */
bool parse_range_number(const std::string& text, unsigned fraction_digits, range_value_t* value);

std::string format_range_number(range_value_t value, unsigned fraction_digits);

//! Domain of length restrictions: 0..18446744073709551615.
RangeDomain length_domain();

} // namespace yangc

#endif // YANGC_YANG_RANGE_HPP_
