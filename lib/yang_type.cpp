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
 * @file yang_type.cpp
 *
 * YANG type variants.
 */

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <sstream>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include "yang_errors.hpp"
#include "yang_type.hpp"
#include "yangc_status.h"

using namespace yangc;

namespace {

struct PrimitiveInfo
{
  yang_primitive_t primitive;
  const char* name;
  bool integral;
  bool is_signed;
  range_value_t min;
  range_value_t max;
};

const PrimitiveInfo primitive_table[] = {
  { yang_primitive_t::INT8,    "int8",    true, true,
    std::numeric_limits<int8_t>::min(),  std::numeric_limits<int8_t>::max() },
  { yang_primitive_t::INT16,   "int16",   true, true,
    std::numeric_limits<int16_t>::min(), std::numeric_limits<int16_t>::max() },
  { yang_primitive_t::INT32,   "int32",   true, true,
    std::numeric_limits<int32_t>::min(), std::numeric_limits<int32_t>::max() },
  { yang_primitive_t::INT64,   "int64",   true, true,
    std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max() },
  { yang_primitive_t::UINT8,   "uint8",   true, false,
    0, std::numeric_limits<uint8_t>::max() },
  { yang_primitive_t::UINT16,  "uint16",  true, false,
    0, std::numeric_limits<uint16_t>::max() },
  { yang_primitive_t::UINT32,  "uint32",  true, false,
    0, std::numeric_limits<uint32_t>::max() },
  { yang_primitive_t::UINT64,  "uint64",  true, false,
    0, static_cast<range_value_t>(std::numeric_limits<uint64_t>::max()) },
  { yang_primitive_t::DECIMAL64, "decimal64", false, true,
    std::numeric_limits<int64_t>::min(), std::numeric_limits<int64_t>::max() },
  { yang_primitive_t::STRING,  "string",  false, false, 0, 0 },
  { yang_primitive_t::BOOLEAN, "boolean", false, false, 0, 0 },
  { yang_primitive_t::EMPTY,   "empty",   false, false, 0, 0 },
  { yang_primitive_t::BINARY,  "binary",  false, false, 0, 0 },
  { yang_primitive_t::INSTANCE_IDENTIFIER, "instance-identifier", false, false, 0, 0 },
};

const char* const derived_builtin_names[] = {
  "union",
  "enumeration",
  "bits",
  "identityref",
  "leafref",
};

const PrimitiveInfo& primitive_info(yang_primitive_t primitive)
{
  for (const PrimitiveInfo& info : primitive_table) {
    if (info.primitive == primitive) {
      return info;
    }
  }
  YANGC_ASSERT_NOT_REACHED();
}

size_t utf8_length(const std::string& text)
{
  size_t length = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++length;
    }
  }
  return length;
}

std::string base64_encode(const std::vector<uint8_t>& data)
{
  typedef boost::archive::iterators::base64_from_binary<
    boost::archive::iterators::transform_width<
      std::vector<uint8_t>::const_iterator, 6, 8>> encoder_t;

  std::string encoded(encoder_t(data.begin()), encoder_t(data.end()));
  encoded.append((3 - data.size() % 3) % 3, '=');
  return encoded;
}

bool base64_decode(const std::string& text, std::vector<uint8_t>* data)
{
  typedef boost::archive::iterators::transform_width<
    boost::archive::iterators::binary_from_base64<
      std::string::const_iterator>, 8, 6> decoder_t;

  if (text.size() % 4) {
    return false;
  }
  size_t padding = 0;
  std::string work(text);
  for (size_t i = 0; i < work.size(); ++i) {
    char c = work[i];
    if (c == '=') {
      if (i < work.size() - 2) {
        return false;
      }
      work[i] = 'A';
      ++padding;
      continue;
    }
    if (padding || !(isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/')) {
      return false;
    }
  }

  data->assign(decoder_t(work.begin()), decoder_t(work.end()));
  data->resize(data->size() - padding);
  return true;
}

std::string invalid_value(const YangType& type, const std::string& text)
{
  return "Invalid value for " + type.display_name() + ": " + text;
}

/*!
 * Text of a value for the types whose wire form is the value itself.
 */
std::string plain_to_string(const YangType& type, const LeafValue& value)
{
  switch (value.kind()) {
    case LeafValue::kind_t::EMPTY:
      return std::string();
    case LeafValue::kind_t::BOOLEAN:
      return value.as_bool() ? "true" : "false";
    case LeafValue::kind_t::INTEGER:
      return std::to_string(value.as_int());
    case LeafValue::kind_t::UNSIGNED:
      return std::to_string(value.as_uint());
    case LeafValue::kind_t::STRING:
      return value.as_string();
    case LeafValue::kind_t::BINARY:
      return base64_encode(value.as_binary());
  }
  throw InvalidValueError(invalid_value(type, "<unknown>"));
}

}

const char* yangc::yang_primitive_name(yang_primitive_t primitive)
{
  return primitive_info(primitive).name;
}

bool yangc::yang_primitive_from_name(const std::string& name, yang_primitive_t* primitive)
{
  for (const PrimitiveInfo& info : primitive_table) {
    if (name == info.name) {
      *primitive = info.primitive;
      return true;
    }
  }
  return false;
}

bool yangc::yang_primitive_is_integral(yang_primitive_t primitive)
{
  return primitive_info(primitive).integral;
}

bool yangc::yang_primitive_is_signed(yang_primitive_t primitive)
{
  return primitive_info(primitive).is_signed;
}

RangeDomain yangc::yang_primitive_domain(yang_primitive_t primitive, unsigned fraction_digits)
{
  const PrimitiveInfo& info = primitive_info(primitive);
  return RangeDomain(info.min, info.max,
                     primitive == yang_primitive_t::DECIMAL64 ? fraction_digits : 0);
}

bool yangc::is_builtin_type_name(const std::string& name)
{
  yang_primitive_t primitive;
  if (yang_primitive_from_name(name, &primitive)) {
    return true;
  }
  for (const char* builtin : derived_builtin_names) {
    if (name == builtin) {
      return true;
    }
  }
  return false;
}

LeafValue LeafValue::empty()
{
  return LeafValue();
}

LeafValue LeafValue::boolean(bool value)
{
  LeafValue v;
  v.kind_ = kind_t::BOOLEAN;
  v.bool_ = value;
  return v;
}

LeafValue LeafValue::integer(int64_t value)
{
  LeafValue v;
  v.kind_ = kind_t::INTEGER;
  v.int_ = value;
  return v;
}

LeafValue LeafValue::unsigned_integer(uint64_t value)
{
  LeafValue v;
  v.kind_ = kind_t::UNSIGNED;
  v.uint_ = value;
  return v;
}

LeafValue LeafValue::string(const std::string& value)
{
  LeafValue v;
  v.kind_ = kind_t::STRING;
  v.string_ = value;
  return v;
}

LeafValue LeafValue::binary(const std::vector<uint8_t>& value)
{
  LeafValue v;
  v.kind_ = kind_t::BINARY;
  v.binary_ = value;
  return v;
}

bool LeafValue::operator==(const LeafValue& other) const
{
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
    case kind_t::EMPTY:    return true;
    case kind_t::BOOLEAN:  return bool_ == other.bool_;
    case kind_t::INTEGER:  return int_ == other.int_;
    case kind_t::UNSIGNED: return uint_ == other.uint_;
    case kind_t::STRING:   return string_ == other.string_;
    case kind_t::BINARY:   return binary_ == other.binary_;
  }
  return false;
}

bool YangTypeRestrictions::operator==(const YangTypeRestrictions& other) const
{
  if (range != other.range
      || length != other.length
      || fraction_digits != other.fraction_digits
      || patterns != other.patterns
      || enums.size() != other.enums.size()
      || bits.size() != other.bits.size()) {
    return false;
  }
  for (size_t i = 0; i < enums.size(); ++i) {
    if (enums[i].name != other.enums[i].name || enums[i].value != other.enums[i].value) {
      return false;
    }
  }
  for (size_t i = 0; i < bits.size(); ++i) {
    if (bits[i].name != other.bits[i].name || bits[i].position != other.bits[i].position) {
      return false;
    }
  }
  return true;
}

/*****************************************************************************/
// PrimitiveType

PrimitiveType::PrimitiveType(yang_primitive_t primitive)
: primitive_(primitive)
{
}

RangeDomain PrimitiveType::range_domain() const
{
  return yang_primitive_domain(primitive_, restrictions_.fraction_digits);
}

void PrimitiveType::normalize()
{
  if (!restrictions_.range.empty()) {
    restrictions_.range = normalize_range(restrictions_.range, range_domain());
  }
  if (!restrictions_.length.empty()) {
    restrictions_.length = normalize_range(restrictions_.length, length_domain());
  }
}

YangType::ptr_t PrimitiveType::clone() const
{
  PrimitiveType* copy = new PrimitiveType(primitive_);
  copy->restrictions_ = restrictions_;
  return ptr_t(copy);
}

std::string PrimitiveType::to_string(const LeafValue& value) const
{
  if (value.kind() == LeafValue::kind_t::BOOLEAN && yang_primitive_is_integral(primitive_)) {
    // Booleans were historically accepted for integral leaves.
    return value.as_bool() ? "1" : "0";
  }
  return plain_to_string(*this, value);
}

LeafValue PrimitiveType::to_value(const std::string& text) const
{
  if (yang_primitive_is_integral(primitive_)) {
    const PrimitiveInfo& info = primitive_info(primitive_);
    if (text.empty() || isspace(static_cast<unsigned char>(text[0]))) {
      throw InvalidValueError(invalid_value(*this, text));
    }

    char* end = nullptr;
    errno = 0;
    if (info.is_signed) {
      long long parsed = strtoll(text.c_str(), &end, 10);
      if (errno || *end || parsed < info.min || parsed > info.max) {
        throw InvalidValueError(invalid_value(*this, text));
      }
      return LeafValue::integer(parsed);
    }

    if (text[0] == '-') {
      throw InvalidValueError(invalid_value(*this, text));
    }
    unsigned long long parsed = strtoull(text.c_str(), &end, 10);
    if (errno || *end || static_cast<range_value_t>(parsed) > info.max) {
      throw InvalidValueError(invalid_value(*this, text));
    }
    return LeafValue::unsigned_integer(parsed);
  }

  switch (primitive_) {
    case yang_primitive_t::BOOLEAN: {
      std::string lower = boost::algorithm::to_lower_copy(text);
      if (lower == "true") {
        return LeafValue::boolean(true);
      }
      if (lower == "false") {
        return LeafValue::boolean(false);
      }
      throw InvalidValueError(invalid_value(*this, text));
    }
    case yang_primitive_t::EMPTY:
      if (!text.empty()) {
        throw InvalidValueError(invalid_value(*this, text));
      }
      return LeafValue::empty();
    case yang_primitive_t::BINARY: {
      std::vector<uint8_t> data;
      if (!base64_decode(text, &data)) {
        throw InvalidValueError(invalid_value(*this, text));
      }
      return LeafValue::binary(data);
    }
    case yang_primitive_t::DECIMAL64: {
      range_value_t scaled = 0;
      if (!parse_range_number(text, restrictions_.fraction_digits, &scaled)) {
        throw InvalidValueError(invalid_value(*this, text));
      }
      return LeafValue::string(text);
    }
    default:
      break;
  }
  return LeafValue::string(text);
}

bool PrimitiveType::check_length(size_t length) const
{
  if (restrictions_.length.empty()) {
    return true;
  }
  return range_contains(parse_range(restrictions_.length, length_domain()),
                        static_cast<range_value_t>(length));
}

bool PrimitiveType::check_integral(const LeafValue& value) const
{
  range_value_t number = 0;
  switch (value.kind()) {
    case LeafValue::kind_t::INTEGER:
      number = value.as_int();
      break;
    case LeafValue::kind_t::UNSIGNED:
      number = static_cast<range_value_t>(value.as_uint());
      break;
    default:
      return false;
  }

  RangeDomain domain = range_domain();
  if (number < domain.min || number > domain.max) {
    return false;
  }
  if (restrictions_.range.empty()) {
    return true;
  }
  return range_contains(parse_range(restrictions_.range, domain), number);
}

bool PrimitiveType::check_decimal(const LeafValue& value) const
{
  RangeDomain domain = range_domain();
  range_value_t number = 0;
  switch (value.kind()) {
    case LeafValue::kind_t::STRING:
      if (!parse_range_number(value.as_string(), domain.fraction_digits, &number)) {
        return false;
      }
      break;
    case LeafValue::kind_t::INTEGER:
      number = value.as_int();
      for (unsigned i = 0; i < domain.fraction_digits; ++i) {
        number *= 10;
      }
      break;
    default:
      return false;
  }

  if (number < domain.min || number > domain.max) {
    return false;
  }
  if (restrictions_.range.empty()) {
    return true;
  }
  return range_contains(parse_range(restrictions_.range, domain), number);
}

bool PrimitiveType::check_field_value(const LeafValue& value) const
{
  if (yang_primitive_is_integral(primitive_)) {
    return check_integral(value);
  }

  switch (primitive_) {
    case yang_primitive_t::DECIMAL64:
      return check_decimal(value);
    case yang_primitive_t::STRING:
      return value.kind() == LeafValue::kind_t::STRING
             && check_length(utf8_length(value.as_string()));
    case yang_primitive_t::BOOLEAN:
      return value.kind() == LeafValue::kind_t::BOOLEAN;
    case yang_primitive_t::EMPTY:
      return value.kind() == LeafValue::kind_t::EMPTY;
    case yang_primitive_t::BINARY:
      return value.kind() == LeafValue::kind_t::BINARY
             && check_length(value.as_binary().size());
    case yang_primitive_t::INSTANCE_IDENTIFIER:
      return value.kind() == LeafValue::kind_t::STRING;
    default:
      break;
  }
  YANGC_ASSERT_NOT_REACHED();
}

std::string PrimitiveType::wire_name() const
{
  return yang_primitive_name(primitive_);
}

std::string PrimitiveType::display_name() const
{
  return yang_primitive_name(primitive_);
}

bool PrimitiveType::equals(const YangType& other) const
{
  if (other.kind() != yang_type_kind_t::PRIMITIVE) {
    return false;
  }
  const PrimitiveType& o = static_cast<const PrimitiveType&>(other);
  return primitive_ == o.primitive_ && restrictions_ == o.restrictions_;
}

/*****************************************************************************/
// UnionType

void UnionType::append(ptr_t member)
{
  YANGC_ASSERT(member);
  members_.push_back(std::move(member));
}

void UnionType::deduplicate()
{
  std::vector<ptr_t> unique;
  for (ptr_t& member : members_) {
    bool seen = false;
    for (const ptr_t& kept : unique) {
      if (kept->equals(*member)) {
        seen = true;
        break;
      }
    }
    if (!seen) {
      unique.push_back(std::move(member));
    }
  }
  members_ = std::move(unique);
}

YangType::ptr_t UnionType::clone() const
{
  UnionType* copy = new UnionType();
  for (const ptr_t& member : members_) {
    copy->members_.push_back(member->clone());
  }
  return ptr_t(copy);
}

std::string UnionType::to_string(const LeafValue& value) const
{
  switch (value.kind()) {
    case LeafValue::kind_t::STRING:
      return value.as_string();
    case LeafValue::kind_t::BOOLEAN:
      return value.as_bool() ? "true" : "false";
    default:
      break;
  }
  for (const ptr_t& member : members_) {
    if (member->check_field_value(value)) {
      return member->to_string(value);
    }
  }
  throw InvalidValueError(invalid_value(*this, plain_to_string(*this, value)));
}

LeafValue UnionType::to_value(const std::string& text) const
{
  for (const ptr_t& member : members_) {
    try {
      LeafValue value = member->to_value(text);
      if (member->check_field_value(value)) {
        return value;
      }
    } catch (const InvalidValueError&) {
      // Not this member; try the next one.
    }
  }
  return LeafValue::string(text);
}

bool UnionType::check_field_value(const LeafValue& value) const
{
  if (value.kind() == LeafValue::kind_t::STRING) {
    return true;
  }
  for (const ptr_t& member : members_) {
    if (member->check_field_value(value)) {
      return true;
    }
  }
  return false;
}

std::string UnionType::wire_name() const
{
  return "union";
}

std::string UnionType::display_name() const
{
  std::string name = "union[";
  for (size_t i = 0; i < members_.size(); ++i) {
    if (i) {
      name += ",";
    }
    name += members_[i]->display_name();
  }
  return name + "]";
}

bool UnionType::equals(const YangType& other) const
{
  if (other.kind() != yang_type_kind_t::UNION) {
    return false;
  }
  const UnionType& o = static_cast<const UnionType&>(other);
  if (members_.size() != o.members_.size()) {
    return false;
  }
  for (size_t i = 0; i < members_.size(); ++i) {
    if (!members_[i]->equals(*o.members_[i])) {
      return false;
    }
  }
  return true;
}

bool UnionType::is_resolved() const
{
  for (const ptr_t& member : members_) {
    if (!member->is_resolved()) {
      return false;
    }
  }
  return true;
}

/*****************************************************************************/
// EnumerationType

void EnumerationType::add_enum(const std::string& name)
{
  int64_t value = 0;
  for (const EnumMember& member : members_) {
    if (member.value >= value) {
      value = member.value + 1;
    }
  }
  EnumMember member;
  member.name = name;
  member.value = value;
  members_.push_back(member);
}

void EnumerationType::set_last_value(int64_t value)
{
  if (!members_.empty()) {
    members_.back().value = value;
  }
}

const EnumMember* EnumerationType::find(const std::string& name) const
{
  for (const EnumMember& member : members_) {
    if (member.name == name) {
      return &member;
    }
  }
  return nullptr;
}

void EnumerationType::restrict_to(const std::vector<EnumMember>& subset)
{
  std::vector<EnumMember> kept;
  for (const EnumMember& member : members_) {
    for (const EnumMember& wanted : subset) {
      if (wanted.name == member.name) {
        kept.push_back(member);
        break;
      }
    }
  }
  members_ = kept;
}

YangType::ptr_t EnumerationType::clone() const
{
  EnumerationType* copy = new EnumerationType();
  copy->members_ = members_;
  return ptr_t(copy);
}

std::string EnumerationType::to_string(const LeafValue& value) const
{
  if (value.kind() == LeafValue::kind_t::INTEGER) {
    for (const EnumMember& member : members_) {
      if (member.value == value.as_int()) {
        return member.name;
      }
    }
    throw InvalidValueError(invalid_value(*this, std::to_string(value.as_int())));
  }
  return plain_to_string(*this, value);
}

LeafValue EnumerationType::to_value(const std::string& text) const
{
  return LeafValue::string(text);
}

bool EnumerationType::check_field_value(const LeafValue& value) const
{
  return value.kind() == LeafValue::kind_t::STRING && find(value.as_string());
}

std::string EnumerationType::wire_name() const
{
  return "enumeration";
}

std::string EnumerationType::display_name() const
{
  std::string name = "enumeration[";
  for (size_t i = 0; i < members_.size(); ++i) {
    if (i) {
      name += "|";
    }
    name += members_[i].name;
  }
  return name + "]";
}

bool EnumerationType::equals(const YangType& other) const
{
  if (other.kind() != yang_type_kind_t::ENUMERATION) {
    return false;
  }
  const EnumerationType& o = static_cast<const EnumerationType&>(other);
  if (members_.size() != o.members_.size()) {
    return false;
  }
  for (size_t i = 0; i < members_.size(); ++i) {
    if (members_[i].name != o.members_[i].name || members_[i].value != o.members_[i].value) {
      return false;
    }
  }
  return true;
}

/*****************************************************************************/
// BitsType

void BitsType::add_bit(const std::string& name)
{
  uint32_t position = 0;
  for (const BitMember& member : members_) {
    if (member.position >= position) {
      position = member.position + 1;
    }
  }
  BitMember member;
  member.name = name;
  member.position = position;
  members_.push_back(member);
}

void BitsType::set_last_position(uint32_t position)
{
  if (!members_.empty()) {
    members_.back().position = position;
  }
}

bool BitsType::has_member(const std::string& name) const
{
  for (const BitMember& member : members_) {
    if (member.name == name) {
      return true;
    }
  }
  return false;
}

void BitsType::restrict_to(const std::vector<BitMember>& subset)
{
  std::vector<BitMember> kept;
  for (const BitMember& member : members_) {
    for (const BitMember& wanted : subset) {
      if (wanted.name == member.name) {
        kept.push_back(member);
        break;
      }
    }
  }
  members_ = kept;
}

YangType::ptr_t BitsType::clone() const
{
  BitsType* copy = new BitsType();
  copy->members_ = members_;
  return ptr_t(copy);
}

std::string BitsType::to_string(const LeafValue& value) const
{
  return plain_to_string(*this, value);
}

LeafValue BitsType::to_value(const std::string& text) const
{
  return LeafValue::string(text);
}

bool BitsType::check_field_value(const LeafValue& value) const
{
  if (value.kind() != LeafValue::kind_t::STRING) {
    return false;
  }
  std::vector<std::string> names;
  boost::algorithm::split(names, value.as_string(), boost::algorithm::is_space(),
                          boost::algorithm::token_compress_on);
  for (const std::string& name : names) {
    if (!name.empty() && !has_member(name)) {
      return false;
    }
  }
  return true;
}

std::string BitsType::wire_name() const
{
  return "bits";
}

std::string BitsType::display_name() const
{
  std::string name = "bits[";
  for (size_t i = 0; i < members_.size(); ++i) {
    if (i) {
      name += " ";
    }
    name += members_[i].name;
  }
  return name + "]";
}

bool BitsType::equals(const YangType& other) const
{
  if (other.kind() != yang_type_kind_t::BITS) {
    return false;
  }
  const BitsType& o = static_cast<const BitsType&>(other);
  if (members_.size() != o.members_.size()) {
    return false;
  }
  for (size_t i = 0; i < members_.size(); ++i) {
    if (members_[i].name != o.members_[i].name || members_[i].position != o.members_[i].position) {
      return false;
    }
  }
  return true;
}

/*****************************************************************************/
// IdentityRefType

void IdentityRefType::add_base(const Identifier& base)
{
  bases_.push_back(base);
}

bool IdentityRefType::is_legal_value(const std::string& text) const
{
  size_t colon = text.find(':');
  if (colon != std::string::npos) {
    return values_.count(Identifier(text.substr(0, colon), text.substr(colon + 1))) > 0;
  }
  for (const Identifier& value : values_) {
    if (value.name() == text) {
      return true;
    }
  }
  return false;
}

YangType::ptr_t IdentityRefType::clone() const
{
  IdentityRefType* copy = new IdentityRefType();
  copy->bases_ = bases_;
  copy->values_ = values_;
  return ptr_t(copy);
}

std::string IdentityRefType::to_string(const LeafValue& value) const
{
  return plain_to_string(*this, value);
}

LeafValue IdentityRefType::to_value(const std::string& text) const
{
  return LeafValue::string(text);
}

bool IdentityRefType::check_field_value(const LeafValue& value) const
{
  return value.kind() == LeafValue::kind_t::STRING && is_legal_value(value.as_string());
}

std::string IdentityRefType::wire_name() const
{
  return "identityref";
}

std::string IdentityRefType::display_name() const
{
  std::string name = "identityref[";
  for (size_t i = 0; i < bases_.size(); ++i) {
    if (i) {
      name += ",";
    }
    name += bases_[i].to_string();
  }
  return name + "]";
}

bool IdentityRefType::equals(const YangType& other) const
{
  if (other.kind() != yang_type_kind_t::IDENTITYREF) {
    return false;
  }
  const IdentityRefType& o = static_cast<const IdentityRefType&>(other);
  return bases_ == o.bases_ && values_ == o.values_;
}

/*****************************************************************************/
// LeafRefType

YangType::ptr_t LeafRefType::clone() const
{
  LeafRefType* copy = new LeafRefType();
  copy->path_ = path_;
  copy->require_instance_ = require_instance_;
  return ptr_t(copy);
}

std::string LeafRefType::to_string(const LeafValue&) const
{
  throw InternalError("Unresolved leafref " + display_name());
}

LeafValue LeafRefType::to_value(const std::string&) const
{
  throw InternalError("Unresolved leafref " + display_name());
}

bool LeafRefType::check_field_value(const LeafValue&) const
{
  throw InternalError("Unresolved leafref " + display_name());
}

std::string LeafRefType::wire_name() const
{
  return "leafref";
}

std::string LeafRefType::display_name() const
{
  return "leafref(" + path_.to_string() + ")";
}

bool LeafRefType::equals(const YangType& other) const
{
  if (other.kind() != yang_type_kind_t::LEAFREF) {
    return false;
  }
  const LeafRefType& o = static_cast<const LeafRefType&>(other);
  return path_ == o.path_ && require_instance_ == o.require_instance_;
}

/*****************************************************************************/
// UnresolvedType

UnresolvedType::UnresolvedType(const Identifier& name, yang_scope_t scope)
: name_(name),
  scope_(scope)
{
}

YangType::ptr_t UnresolvedType::clone() const
{
  UnresolvedType* copy = new UnresolvedType(name_, scope_);
  copy->restrictions_ = restrictions_;
  return ptr_t(copy);
}

std::string UnresolvedType::to_string(const LeafValue&) const
{
  throw InternalError("Unresolved type in schema: " + display_name());
}

LeafValue UnresolvedType::to_value(const std::string&) const
{
  throw InternalError("Unresolved type in schema: " + display_name());
}

bool UnresolvedType::check_field_value(const LeafValue&) const
{
  throw InternalError("Unresolved type in schema: " + display_name());
}

std::string UnresolvedType::wire_name() const
{
  return name_.to_string();
}

std::string UnresolvedType::display_name() const
{
  return name_.to_string();
}

bool UnresolvedType::equals(const YangType& other) const
{
  if (other.kind() != yang_type_kind_t::UNRESOLVED) {
    return false;
  }
  const UnresolvedType& o = static_cast<const UnresolvedType&>(other);
  return name_ == o.name_ && scope_ == o.scope_ && restrictions_ == o.restrictions_;
}

/*****************************************************************************/

YangType::ptr_t yangc::yang_type_from_identifier(const Identifier& name,
                                                 yang_scope_t scope)
{
  if (name.is_builtin()) {
    const std::string& n = name.name();
    yang_primitive_t primitive;
    if (yang_primitive_from_name(n, &primitive)) {
      return YangType::ptr_t(new PrimitiveType(primitive));
    }
    if (n == "union") {
      return YangType::ptr_t(new UnionType());
    }
    if (n == "enumeration") {
      return YangType::ptr_t(new EnumerationType());
    }
    if (n == "bits") {
      return YangType::ptr_t(new BitsType());
    }
    if (n == "identityref") {
      return YangType::ptr_t(new IdentityRefType());
    }
    if (n == "leafref") {
      return YangType::ptr_t(new LeafRefType());
    }
  }
  return YangType::ptr_t(new UnresolvedType(name, scope));
}
