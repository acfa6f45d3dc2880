/*
    This file is part of TON Blockchain Library.

    TON Blockchain Library is free software: you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation, either version 2 of the License, or
    (at your option) any later version.

    TON Blockchain Library is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with TON Blockchain Library.  If not, see <http://www.gnu.org/licenses/>.
*/
#pragma once
#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "tolk/cells/CellSlice.h"
#include "tolk/dict/Dictionary.h"
#include "tolk/layout/TypeLayout.h"

namespace tolk {

// addr_std$10 anycast:(Maybe Anycast) workchain_id:int8 address:bits256, anycast always absent
struct Address {
  int workchain{0};
  BitString hash{256};

  // "0:83DF...": workchain, colon, 64 hex digits
  std::string to_string() const;
  // throws std::invalid_argument
  static Address parse(const std::string& str);
  bool operator==(const Address& other) const {
    return workchain == other.workchain && hash == other.hash;
  }
};

struct Record;
struct UnmatchedValue;

// Dynamically typed value flowing through the codec.
class Value {
 public:
  enum class Type { Null, Bool, Int, Uint, Bits, Cell, Record, Address, Dict, Slice, Unmatched };

  Value() = default;

  static Value null() {
    return Value{};
  }
  static Value boolean(bool value);
  static Value integer(long long value);
  static Value uint(unsigned long long value);
  static Value bits(BitString value);
  static Value cell(Ref<Cell> value);
  // fields in declaration order; throws CodecError(type_check) on a count mismatch
  static Value record(const TypeLayout& layout, std::vector<Value> fields);
  // fields by name; absent nullable fields become null
  static Value record_of(const TypeLayout& layout, std::vector<std::pair<std::string, Value>> fields);
  static Value address(Address value);
  static Value dict(Dictionary value);
  static Value slice(CellSlice value);
  // union value whose discriminant matched no variant, kept as raw data
  static Value unmatched(const TypeLayout& union_layout, CellSlice raw);

  Type type() const {
    return (Type)storage_.index();
  }
  bool is_null() const {
    return type() == Type::Null;
  }
  bool is_integer() const {
    return type() == Type::Int || type() == Type::Uint;
  }

  // accessors throw CodecError(type_check) on a kind mismatch
  bool as_bool() const;
  long long as_int() const;
  unsigned long long as_uint() const;
  const BitString& as_bits() const;
  const Ref<Cell>& as_cell() const;
  const Record& as_record() const;
  const Address& as_address() const;
  const Dictionary& as_dict() const;
  const CellSlice& as_slice() const;
  const UnmatchedValue& as_unmatched() const;

  // field of a record value
  const Value& operator[](const std::string& field) const;

  // integers compare by numeric value regardless of signedness
  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const {
    return !(*this == other);
  }

  std::string to_string() const;
  void show(std::ostream& os) const;

  static const char* type_name(Type type);

 private:
  std::variant<std::monostate, bool, long long, unsigned long long, BitString, Ref<Cell>, std::shared_ptr<const Record>,
               Address, Dictionary, CellSlice, std::shared_ptr<const UnmatchedValue>>
      storage_;

  [[noreturn]] void type_mismatch(const char* expected) const;
};

struct Record {
  const TypeLayout* layout{nullptr};
  std::vector<Value> fields;

  // throws CodecError(type_check) for an unknown field
  const Value& get(const std::string& name) const;
};

struct UnmatchedValue {
  const TypeLayout* layout{nullptr};
  CellSlice raw;
};

std::ostream& operator<<(std::ostream& os, const Value& value);

}  // namespace tolk
