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
#include "tolk/codec/Value.h"
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include "tolk/errors.h"

namespace tolk {

std::string Address::to_string() const {
  return std::to_string(workchain) + ":" + hash.to_hex();
}

Address Address::parse(const std::string& str) {
  auto colon = str.find(':');
  if (colon == std::string::npos || colon == 0 || str.size() - colon - 1 != 64) {
    throw std::invalid_argument("address `" + str + "` must look like <workchain>:<64 hex digits>");
  }
  Address res;
  std::size_t used = 0;
  res.workchain = std::stoi(str.substr(0, colon), &used);
  if (used != colon) {
    throw std::invalid_argument("invalid workchain in address `" + str + "`");
  }
  res.hash = BitString::parse_hex(str.substr(colon + 1));
  return res;
}

Value Value::boolean(bool value) {
  Value res;
  res.storage_ = value;
  return res;
}

Value Value::integer(long long value) {
  Value res;
  res.storage_ = value;
  return res;
}

Value Value::uint(unsigned long long value) {
  Value res;
  res.storage_ = value;
  return res;
}

Value Value::bits(BitString value) {
  Value res;
  res.storage_ = std::move(value);
  return res;
}

Value Value::cell(Ref<Cell> value) {
  Value res;
  res.storage_ = std::move(value);
  return res;
}

Value Value::record(const TypeLayout& layout, std::vector<Value> fields) {
  if (!layout.is_record()) {
    throw CodecError(ErrorCode::type_check, "`" + layout.name + "` is not a struct");
  }
  if (fields.size() != layout.fields.size()) {
    throw CodecError(ErrorCode::type_check, "`" + layout.name + "` has " + std::to_string(layout.fields.size()) +
                                                " fields, got " + std::to_string(fields.size()));
  }
  auto rec = std::make_shared<Record>();
  rec->layout = &layout;
  rec->fields = std::move(fields);
  Value res;
  res.storage_ = std::shared_ptr<const Record>(std::move(rec));
  return res;
}

Value Value::record_of(const TypeLayout& layout, std::vector<std::pair<std::string, Value>> fields) {
  std::vector<Value> ordered(layout.fields.size());
  std::vector<bool> seen(layout.fields.size(), false);
  for (auto& field : fields) {
    int idx = layout.field_index(field.first);
    if (idx < 0) {
      throw CodecError(ErrorCode::type_check, "`" + layout.name + "` has no field `" + field.first + "`");
    }
    ordered[idx] = std::move(field.second);
    seen[idx] = true;
  }
  for (std::size_t i = 0; i < seen.size(); i++) {
    if (!seen[i] && !layout.fields[i].type.nullable) {
      throw CodecError(ErrorCode::type_check,
                       "field `" + layout.fields[i].name + "` of `" + layout.name + "` is not nullable and is missing");
    }
  }
  return record(layout, std::move(ordered));
}

Value Value::address(Address value) {
  Value res;
  res.storage_ = std::move(value);
  return res;
}

Value Value::dict(Dictionary value) {
  Value res;
  res.storage_ = std::move(value);
  return res;
}

Value Value::slice(CellSlice value) {
  Value res;
  res.storage_ = std::move(value);
  return res;
}

Value Value::unmatched(const TypeLayout& union_layout, CellSlice raw) {
  auto u = std::make_shared<UnmatchedValue>();
  u->layout = &union_layout;
  u->raw = std::move(raw);
  Value res;
  res.storage_ = std::shared_ptr<const UnmatchedValue>(std::move(u));
  return res;
}

const char* Value::type_name(Type type) {
  switch (type) {
    case Type::Null:
      return "null";
    case Type::Bool:
      return "bool";
    case Type::Int:
      return "int";
    case Type::Uint:
      return "uint";
    case Type::Bits:
      return "bits";
    case Type::Cell:
      return "cell";
    case Type::Record:
      return "struct";
    case Type::Address:
      return "address";
    case Type::Dict:
      return "map";
    case Type::Slice:
      return "slice";
    case Type::Unmatched:
      return "unmatched";
  }
  return "unknown";
}

void Value::type_mismatch(const char* expected) const {
  throw CodecError(ErrorCode::type_check, std::string{"expected "} + expected + ", got " + type_name(type()));
}

bool Value::as_bool() const {
  if (type() != Type::Bool) {
    type_mismatch("bool");
  }
  return std::get<bool>(storage_);
}

long long Value::as_int() const {
  if (type() == Type::Int) {
    return std::get<long long>(storage_);
  }
  if (type() == Type::Uint) {
    auto x = std::get<unsigned long long>(storage_);
    if (x > (unsigned long long)std::numeric_limits<long long>::max()) {
      throw CodecError(ErrorCode::range_check, "integer " + std::to_string(x) + " does not fit into a signed 64-bit value");
    }
    return (long long)x;
  }
  type_mismatch("integer");
}

unsigned long long Value::as_uint() const {
  if (type() == Type::Uint) {
    return std::get<unsigned long long>(storage_);
  }
  if (type() == Type::Int) {
    auto x = std::get<long long>(storage_);
    if (x < 0) {
      throw CodecError(ErrorCode::range_check, "negative integer " + std::to_string(x) + " where unsigned is expected");
    }
    return (unsigned long long)x;
  }
  type_mismatch("integer");
}

const BitString& Value::as_bits() const {
  if (type() != Type::Bits) {
    type_mismatch("bits");
  }
  return std::get<BitString>(storage_);
}

const Ref<Cell>& Value::as_cell() const {
  if (type() != Type::Cell) {
    type_mismatch("cell");
  }
  return std::get<Ref<Cell>>(storage_);
}

const Record& Value::as_record() const {
  if (type() != Type::Record) {
    type_mismatch("struct");
  }
  return *std::get<std::shared_ptr<const Record>>(storage_);
}

const Address& Value::as_address() const {
  if (type() != Type::Address) {
    type_mismatch("address");
  }
  return std::get<Address>(storage_);
}

const Dictionary& Value::as_dict() const {
  if (type() != Type::Dict) {
    type_mismatch("map");
  }
  return std::get<Dictionary>(storage_);
}

const CellSlice& Value::as_slice() const {
  if (type() != Type::Slice) {
    type_mismatch("slice");
  }
  return std::get<CellSlice>(storage_);
}

const UnmatchedValue& Value::as_unmatched() const {
  if (type() != Type::Unmatched) {
    type_mismatch("unmatched union value");
  }
  return *std::get<std::shared_ptr<const UnmatchedValue>>(storage_);
}

const Value& Value::operator[](const std::string& field) const {
  return as_record().get(field);
}

const Value& Record::get(const std::string& name) const {
  int idx = layout->field_index(name);
  if (idx < 0) {
    throw CodecError(ErrorCode::type_check, "`" + layout->name + "` has no field `" + name + "`");
  }
  return fields[idx];
}

bool Value::operator==(const Value& other) const {
  if (is_integer() && other.is_integer()) {
    if (type() == other.type()) {
      return type() == Type::Int ? std::get<long long>(storage_) == std::get<long long>(other.storage_)
                                 : std::get<unsigned long long>(storage_) == std::get<unsigned long long>(other.storage_);
    }
    const Value& s = type() == Type::Int ? *this : other;
    const Value& u = type() == Type::Int ? other : *this;
    long long x = std::get<long long>(s.storage_);
    return x >= 0 && (unsigned long long)x == std::get<unsigned long long>(u.storage_);
  }
  if (type() != other.type()) {
    return false;
  }
  switch (type()) {
    case Type::Null:
      return true;
    case Type::Bool:
      return as_bool() == other.as_bool();
    case Type::Bits:
      return as_bits() == other.as_bits();
    case Type::Cell:
      return as_cell()->equals(*other.as_cell());
    case Type::Record: {
      const Record& a = as_record();
      const Record& b = other.as_record();
      return a.layout == b.layout && a.fields == b.fields;
    }
    case Type::Address:
      return as_address() == other.as_address();
    case Type::Dict:
      return as_dict() == other.as_dict();
    case Type::Slice:
      return as_slice().contents_equal(other.as_slice());
    case Type::Unmatched:
      return as_unmatched().layout == other.as_unmatched().layout &&
             as_unmatched().raw.contents_equal(other.as_unmatched().raw);
    default:
      return false;
  }
}

void Value::show(std::ostream& os) const {
  switch (type()) {
    case Type::Null:
      os << "null";
      break;
    case Type::Bool:
      os << (as_bool() ? "true" : "false");
      break;
    case Type::Int:
      os << std::get<long long>(storage_);
      break;
    case Type::Uint:
      os << std::get<unsigned long long>(storage_);
      break;
    case Type::Bits:
      os << as_bits();
      break;
    case Type::Cell:
      os << "C{" << as_cell()->get_hash_hex() << "}";
      break;
    case Type::Record: {
      const Record& rec = as_record();
      os << rec.layout->name << " {";
      for (std::size_t i = 0; i < rec.fields.size(); i++) {
        os << (i ? ", " : " ") << rec.layout->fields[i].name << ": " << rec.fields[i];
      }
      os << " }";
      break;
    }
    case Type::Address:
      os << as_address().to_string();
      break;
    case Type::Dict:
      os << as_dict();
      break;
    case Type::Slice:
      os << "CS{x{" << as_slice().to_hex() << "}";
      if (as_slice().size_refs()) {
        os << "+" << as_slice().size_refs() << "R";
      }
      os << "}";
      break;
    case Type::Unmatched:
      os << as_unmatched().layout->name << " unmatched x{" << as_unmatched().raw.to_hex() << "}";
      break;
  }
}

std::string Value::to_string() const {
  std::ostringstream os;
  show(os);
  return os.str();
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
  value.show(os);
  return os;
}

}  // namespace tolk
