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

namespace tolk {

struct TypeLayout;

enum class FieldKind {
  Int,        // intN, N = width
  Uint,       // uintN
  Bool,
  VarInt,     // varint16 / varint32, width = length prefix bits
  VarUint,    // varuint16 (coins) / varuint32
  Bits,       // bitsN
  UintOf,     // uint(f): width is the value of an earlier unsigned field
  BitsOf,     // bits(f)
  Cell,       // untyped ref
  CellOf,     // Cell<T>: T stored in a ref
  Named,      // reference by name, resolved by the registry into one of the three kinds below
  Struct,     // inline record
  Union,      // inline union
  Enum,
  Address,    // internal standard address, 267 bits
  Map,        // dictionary: presence bit + root ref
  Remaining,  // rest of the node's bits and refs
  Snake       // rest of the data bits, continued through chained refs
};

// Declared type of a record field. Widths are validated by the registry, not here.
struct FieldType {
  static constexpr unsigned address_bits = 267;
  static constexpr unsigned coins_len_bits = 4;

  FieldKind kind{FieldKind::Bool};
  unsigned width{0};
  // width field of uint(f)/bits(f), or the referenced type name
  std::string ref_name;
  bool nullable{false};
  // filled in by the registry
  int width_field_idx{-1};
  const TypeLayout* layout{nullptr};
  std::shared_ptr<const FieldType> key;
  std::shared_ptr<const FieldType> value;

  static FieldType int_type(unsigned bits);
  static FieldType uint_type(unsigned bits);
  static FieldType bool_type();
  static FieldType varint(unsigned len_bits);
  static FieldType varuint(unsigned len_bits);
  static FieldType coins();
  static FieldType bits(unsigned bits);
  static FieldType uint_of(std::string field);
  static FieldType bits_of(std::string field);
  static FieldType cell();
  static FieldType cell_of(std::string type_name);
  static FieldType named(std::string type_name);
  static FieldType address();
  static FieldType map(FieldType key, FieldType value);
  static FieldType remaining();
  static FieldType snake();

  FieldType as_nullable() const {
    FieldType res{*this};
    res.nullable = true;
    return res;
  }
  FieldType as_plain() const {
    FieldType res{*this};
    res.nullable = false;
    return res;
  }
  bool is_integer() const {
    return kind == FieldKind::Int || kind == FieldKind::Uint || kind == FieldKind::VarInt ||
           kind == FieldKind::VarUint || kind == FieldKind::UintOf;
  }
  bool is_unsigned_integer() const {
    return kind == FieldKind::Uint || kind == FieldKind::VarUint || kind == FieldKind::UintOf;
  }
  bool is_remainder() const {
    return kind == FieldKind::Remaining || kind == FieldKind::Snake;
  }
  bool uses_ref() const {
    return kind == FieldKind::Cell || kind == FieldKind::CellOf || kind == FieldKind::Map;
  }

  std::string to_string() const;
};

std::ostream& operator<<(std::ostream& os, const FieldType& type);

// Parses a type string such as "uint32", "coins", "Cell<Foo>?", "map<uint32, Bar>" or "bits(len)".
// Throws LayoutError(unknown_type) on malformed input.
FieldType parse_field_type(const std::string& str);

}  // namespace tolk
