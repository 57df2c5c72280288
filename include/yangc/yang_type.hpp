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
 * @file yang_type.hpp
 *
 * The closed set of YANG leaf types and the native leaf value.
 */

#ifndef YANGC_YANG_TYPE_HPP_
#define YANGC_YANG_TYPE_HPP_

#if __cplusplus < 201103L
#error "Requires C++11"
#endif

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "yang_identifier.hpp"
#include "yang_path.hpp"
#include "yang_range.hpp"

namespace yangc {

/*!
 * Type variants.
 */
enum class yang_type_kind_t
{
  PRIMITIVE,
  UNION,
  ENUMERATION,
  BITS,
  IDENTITYREF,
  LEAFREF,     //!< Placeholder until leafref resolution
  UNRESOLVED,  //!< Placeholder until typedef resolution
};

/*!
 * Builtin scalar types.
 */
enum class yang_primitive_t
{
  INT8,
  INT16,
  INT32,
  INT64,
  UINT8,
  UINT16,
  UINT32,
  UINT64,
  DECIMAL64,
  STRING,
  BOOLEAN,
  EMPTY,
  BINARY,
  INSTANCE_IDENTIFIER,
};

const char* yang_primitive_name(yang_primitive_t primitive);
bool yang_primitive_from_name(const std::string& name, yang_primitive_t* primitive);
bool yang_primitive_is_integral(yang_primitive_t primitive);
bool yang_primitive_is_signed(yang_primitive_t primitive);

/*!
 * Value space of a numeric primitive.  Decimal64 bounds are scaled by
 * the fraction digits.
 */
RangeDomain yang_primitive_domain(yang_primitive_t primitive, unsigned fraction_digits);

//! Check if a type name is a YANG builtin type.
bool is_builtin_type_name(const std::string& name);

/*!
 * Native representation of a leaf value.
 */
class LeafValue
{
 public:
  enum class kind_t
  {
    EMPTY,
    BOOLEAN,
    INTEGER,
    UNSIGNED,
    STRING,
    BINARY,
  };

  LeafValue()
  : kind_(kind_t::EMPTY),
    bool_(false),
    int_(0),
    uint_(0)
  {}

  static LeafValue empty();
  static LeafValue boolean(bool value);
  static LeafValue integer(int64_t value);
  static LeafValue unsigned_integer(uint64_t value);
  static LeafValue string(const std::string& value);
  static LeafValue binary(const std::vector<uint8_t>& value);

 public:
  kind_t kind() const { return kind_; }
  bool as_bool() const { return bool_; }
  int64_t as_int() const { return int_; }
  uint64_t as_uint() const { return uint_; }
  const std::string& as_string() const { return string_; }
  const std::vector<uint8_t>& as_binary() const { return binary_; }

  bool operator==(const LeafValue& other) const;
  bool operator!=(const LeafValue& other) const { return !(*this == other); }

 private:
  kind_t kind_;
  bool bool_;
  int64_t int_;
  uint64_t uint_;
  std::string string_;
  std::vector<uint8_t> binary_;
};

struct EnumMember
{
  std::string name;
  int64_t value;
};

struct BitMember
{
  std::string name;
  uint32_t position;
};

/*!
 * Restrictions carried by primitive types, and by unresolved types
 * until they are merged over the typedef they name.
 */
struct YangTypeRestrictions
{
  YangTypeRestrictions()
  : fraction_digits(0)
  {}

  bool operator==(const YangTypeRestrictions& other) const;

  std::string range;
  std::string length;
  unsigned fraction_digits;
  std::vector<std::string> patterns;
  std::vector<EnumMember> enums;  //!< Enum subset at a typedef use site
  std::vector<BitMember> bits;    //!< Bit subset at a typedef use site
};

/*!
 * Abstract YANG type.
 */
class YangType
{
 public:
  typedef std::unique_ptr<YangType> ptr_t;

  YangType() {}
  virtual ~YangType() {}

  // Cannot copy
  YangType(const YangType&) = delete;
  YangType& operator=(const YangType&) = delete;

 public:
  virtual yang_type_kind_t kind() const = 0;

  //! Deep copy.
  virtual ptr_t clone() const = 0;

  /*!
   * Native value to wire text.  Throws InvalidValueError when the value
   * cannot be represented, InternalError for placeholder types.
   */
  virtual std::string to_string(const LeafValue& value) const = 0;

  /*!
   * Wire text to native value.  Throws InvalidValueError on shape
   * mismatch, InternalError for placeholder types.
   */
  virtual LeafValue to_value(const std::string& text) const = 0;

  /*!
   * Structural acceptance test of a native value.  Throws InternalError
   * for placeholder types.
   */
  virtual bool check_field_value(const LeafValue& value) const = 0;

  //! The YANG builtin type keyword.
  virtual std::string wire_name() const = 0;

  //! Human readable description, e.g. "union[int8,string]".
  virtual std::string display_name() const = 0;

  virtual bool equals(const YangType& other) const = 0;

  //! Check that no leafref or unresolved placeholder remains.
  virtual bool is_resolved() const { return true; }
};

class PrimitiveType
: public YangType
{
 public:
  explicit PrimitiveType(yang_primitive_t primitive);

  yang_primitive_t primitive() const { return primitive_; }
  YangTypeRestrictions& restrictions() { return restrictions_; }
  const YangTypeRestrictions& restrictions() const { return restrictions_; }

  //! Domain of range restrictions, honouring fraction-digits.
  RangeDomain range_domain() const;

  //! Replace symbolic bounds and collapse the range and length.
  void normalize();

 public:
  yang_type_kind_t kind() const override { return yang_type_kind_t::PRIMITIVE; }
  ptr_t clone() const override;
  std::string to_string(const LeafValue& value) const override;
  LeafValue to_value(const std::string& text) const override;
  bool check_field_value(const LeafValue& value) const override;
  std::string wire_name() const override;
  std::string display_name() const override;
  bool equals(const YangType& other) const override;

 private:
  bool check_integral(const LeafValue& value) const;
  bool check_decimal(const LeafValue& value) const;
  bool check_length(size_t length) const;

  yang_primitive_t primitive_;
  YangTypeRestrictions restrictions_;
};

class UnionType
: public YangType
{
 public:
  UnionType() {}

  //! Append a member; duplicates are removed by deduplicate().
  void append(ptr_t member);
  const std::vector<ptr_t>& members() const { return members_; }
  std::vector<ptr_t>& mutable_members() { return members_; }

  //! Remove later members equal to an earlier one, keeping order.
  void deduplicate();

 public:
  yang_type_kind_t kind() const override { return yang_type_kind_t::UNION; }
  ptr_t clone() const override;
  std::string to_string(const LeafValue& value) const override;
  LeafValue to_value(const std::string& text) const override;
  bool check_field_value(const LeafValue& value) const override;
  std::string wire_name() const override;
  std::string display_name() const override;
  bool equals(const YangType& other) const override;
  bool is_resolved() const override;

 private:
  std::vector<ptr_t> members_;
};

class EnumerationType
: public YangType
{
 public:
  EnumerationType() {}

  //! Add a member numbered one above the highest value, from 0.
  void add_enum(const std::string& name);
  void set_last_value(int64_t value);
  const std::vector<EnumMember>& members() const { return members_; }
  const EnumMember* find(const std::string& name) const;

  //! Keep only the named members, in declaration order.
  void restrict_to(const std::vector<EnumMember>& subset);

 public:
  yang_type_kind_t kind() const override { return yang_type_kind_t::ENUMERATION; }
  ptr_t clone() const override;
  std::string to_string(const LeafValue& value) const override;
  LeafValue to_value(const std::string& text) const override;
  bool check_field_value(const LeafValue& value) const override;
  std::string wire_name() const override;
  std::string display_name() const override;
  bool equals(const YangType& other) const override;

 private:
  std::vector<EnumMember> members_;
};

class BitsType
: public YangType
{
 public:
  BitsType() {}

  //! Add a bit positioned one above the highest position, from 0.
  void add_bit(const std::string& name);
  void set_last_position(uint32_t position);
  const std::vector<BitMember>& members() const { return members_; }
  bool has_member(const std::string& name) const;
  void restrict_to(const std::vector<BitMember>& subset);

 public:
  yang_type_kind_t kind() const override { return yang_type_kind_t::BITS; }
  ptr_t clone() const override;
  std::string to_string(const LeafValue& value) const override;
  LeafValue to_value(const std::string& text) const override;
  bool check_field_value(const LeafValue& value) const override;
  std::string wire_name() const override;
  std::string display_name() const override;
  bool equals(const YangType& other) const override;

 private:
  std::vector<BitMember> members_;
};

class IdentityRefType
: public YangType
{
 public:
  IdentityRefType() {}

  void add_base(const Identifier& base);
  const std::vector<Identifier>& bases() const { return bases_; }

  //! Legal values: the derivation closure of the bases.
  void set_values(const std::set<Identifier>& values) { values_ = values; }
  const std::set<Identifier>& values() const { return values_; }

  //! Accepts "module:name" or a bare name.
  bool is_legal_value(const std::string& text) const;

 public:
  yang_type_kind_t kind() const override { return yang_type_kind_t::IDENTITYREF; }
  ptr_t clone() const override;
  std::string to_string(const LeafValue& value) const override;
  LeafValue to_value(const std::string& text) const override;
  bool check_field_value(const LeafValue& value) const override;
  std::string wire_name() const override;
  std::string display_name() const override;
  bool equals(const YangType& other) const override;

 private:
  std::vector<Identifier> bases_;
  std::set<Identifier> values_;
};

class LeafRefType
: public YangType
{
 public:
  LeafRefType()
  : require_instance_(true)
  {}

  void set_path(const YangPath& path) { path_ = path; }
  const YangPath& path() const { return path_; }
  void set_require_instance(bool require) { require_instance_ = require; }
  bool require_instance() const { return require_instance_; }

 public:
  yang_type_kind_t kind() const override { return yang_type_kind_t::LEAFREF; }
  ptr_t clone() const override;
  std::string to_string(const LeafValue& value) const override;
  LeafValue to_value(const std::string& text) const override;
  bool check_field_value(const LeafValue& value) const override;
  std::string wire_name() const override;
  std::string display_name() const override;
  bool equals(const YangType& other) const override;
  bool is_resolved() const override { return false; }

 private:
  YangPath path_;
  bool require_instance_;
};

/*!
 * Lexical scope of a typedef or grouping definition and of the
 * references to it.  Scope 0 is module level; every other scope is
 * opened by a structural statement.
 */
typedef unsigned yang_scope_t;

const yang_scope_t YANGC_SCOPE_MODULE = 0;

/*!
 * Reference to a typedef, with the restrictions declared where it is
 * used.  The scope is the innermost scope of the use site; lookup
 * continues through the enclosing scopes.
 */
class UnresolvedType
: public YangType
{
 public:
  explicit UnresolvedType(const Identifier& name,
                          yang_scope_t scope = YANGC_SCOPE_MODULE);

  const Identifier& name() const { return name_; }
  yang_scope_t scope() const { return scope_; }
  YangTypeRestrictions& restrictions() { return restrictions_; }
  const YangTypeRestrictions& restrictions() const { return restrictions_; }

 public:
  yang_type_kind_t kind() const override { return yang_type_kind_t::UNRESOLVED; }
  ptr_t clone() const override;
  std::string to_string(const LeafValue& value) const override;
  LeafValue to_value(const std::string& text) const override;
  bool check_field_value(const LeafValue& value) const override;
  std::string wire_name() const override;
  std::string display_name() const override;
  bool equals(const YangType& other) const override;
  bool is_resolved() const override { return false; }

 private:
  Identifier name_;
  yang_scope_t scope_;
  YangTypeRestrictions restrictions_;
};

/*!
 * Create the type named by a "type" statement: a builtin variant, or
 * an UnresolvedType for a typedef reference made from scope.
 */
YangType::ptr_t yang_type_from_identifier(const Identifier& name,
                                          yang_scope_t scope = YANGC_SCOPE_MODULE);

} // namespace yangc

#endif // YANGC_YANG_TYPE_HPP_
