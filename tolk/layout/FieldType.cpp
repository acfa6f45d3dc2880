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
#include "tolk/layout/FieldType.h"
#include <cctype>
#include <ostream>
#include "tolk/errors.h"

namespace tolk {

FieldType FieldType::int_type(unsigned bits) {
  FieldType res;
  res.kind = FieldKind::Int;
  res.width = bits;
  return res;
}

FieldType FieldType::uint_type(unsigned bits) {
  FieldType res;
  res.kind = FieldKind::Uint;
  res.width = bits;
  return res;
}

FieldType FieldType::bool_type() {
  return FieldType{};
}

FieldType FieldType::varint(unsigned len_bits) {
  FieldType res;
  res.kind = FieldKind::VarInt;
  res.width = len_bits;
  return res;
}

FieldType FieldType::varuint(unsigned len_bits) {
  FieldType res;
  res.kind = FieldKind::VarUint;
  res.width = len_bits;
  return res;
}

FieldType FieldType::coins() {
  return varuint(coins_len_bits);
}

FieldType FieldType::bits(unsigned bits) {
  FieldType res;
  res.kind = FieldKind::Bits;
  res.width = bits;
  return res;
}

FieldType FieldType::uint_of(std::string field) {
  FieldType res;
  res.kind = FieldKind::UintOf;
  res.ref_name = std::move(field);
  return res;
}

FieldType FieldType::bits_of(std::string field) {
  FieldType res;
  res.kind = FieldKind::BitsOf;
  res.ref_name = std::move(field);
  return res;
}

FieldType FieldType::cell() {
  FieldType res;
  res.kind = FieldKind::Cell;
  return res;
}

FieldType FieldType::cell_of(std::string type_name) {
  FieldType res;
  res.kind = FieldKind::CellOf;
  res.ref_name = std::move(type_name);
  return res;
}

FieldType FieldType::named(std::string type_name) {
  FieldType res;
  res.kind = FieldKind::Named;
  res.ref_name = std::move(type_name);
  return res;
}

FieldType FieldType::address() {
  FieldType res;
  res.kind = FieldKind::Address;
  res.width = address_bits;
  return res;
}

FieldType FieldType::map(FieldType key, FieldType value) {
  FieldType res;
  res.kind = FieldKind::Map;
  res.key = std::make_shared<const FieldType>(std::move(key));
  res.value = std::make_shared<const FieldType>(std::move(value));
  return res;
}

FieldType FieldType::remaining() {
  FieldType res;
  res.kind = FieldKind::Remaining;
  return res;
}

FieldType FieldType::snake() {
  FieldType res;
  res.kind = FieldKind::Snake;
  return res;
}

std::string FieldType::to_string() const {
  std::string res;
  switch (kind) {
    case FieldKind::Int:
      res = "int" + std::to_string(width);
      break;
    case FieldKind::Uint:
      res = "uint" + std::to_string(width);
      break;
    case FieldKind::Bool:
      res = "bool";
      break;
    case FieldKind::VarInt:
      res = "varint" + std::to_string(1u << width);
      break;
    case FieldKind::VarUint:
      res = width == coins_len_bits ? "coins" : "varuint" + std::to_string(1u << width);
      break;
    case FieldKind::Bits:
      res = "bits" + std::to_string(width);
      break;
    case FieldKind::UintOf:
      res = "uint(" + ref_name + ")";
      break;
    case FieldKind::BitsOf:
      res = "bits(" + ref_name + ")";
      break;
    case FieldKind::Cell:
      res = "cell";
      break;
    case FieldKind::CellOf:
      res = "Cell<" + ref_name + ">";
      break;
    case FieldKind::Named:
    case FieldKind::Struct:
    case FieldKind::Union:
    case FieldKind::Enum:
      res = ref_name;
      break;
    case FieldKind::Address:
      res = "address";
      break;
    case FieldKind::Map:
      res = "map<" + key->to_string() + ", " + value->to_string() + ">";
      break;
    case FieldKind::Remaining:
      res = "remaining";
      break;
    case FieldKind::Snake:
      res = "snake";
      break;
  }
  if (nullable) {
    res += '?';
  }
  return res;
}

std::ostream& operator<<(std::ostream& os, const FieldType& type) {
  return os << type.to_string();
}

namespace {

class TypeParser {
 public:
  explicit TypeParser(const std::string& str) : str_(str) {
  }

  FieldType parse() {
    FieldType res = parse_type();
    skip_ws();
    if (pos_ != str_.size()) {
      error("unexpected trailing characters");
    }
    return res;
  }

 private:
  const std::string& str_;
  std::size_t pos_{0};

  [[noreturn]] void error(const std::string& msg) const {
    throw LayoutError(ErrorCode::unknown_type, str_, "cannot parse type expression: " + msg + " at position " +
                                                         std::to_string(pos_));
  }

  void skip_ws() {
    while (pos_ < str_.size() && std::isspace((unsigned char)str_[pos_])) {
      ++pos_;
    }
  }

  bool eat(char c) {
    skip_ws();
    if (pos_ < str_.size() && str_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  void expect(char c) {
    if (!eat(c)) {
      error(std::string{"expected `"} + c + "`");
    }
  }

  std::string ident() {
    skip_ws();
    std::size_t start = pos_;
    while (pos_ < str_.size() && (std::isalnum((unsigned char)str_[pos_]) || str_[pos_] == '_')) {
      ++pos_;
    }
    if (start == pos_ || std::isdigit((unsigned char)str_[start])) {
      error("expected identifier");
    }
    return str_.substr(start, pos_ - start);
  }

  // "uint32" -> 32 for prefix "uint"; -1 if name is not prefix+digits
  static int width_suffix(const std::string& name, const std::string& prefix) {
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) || name.size() > prefix.size() + 5) {
      return -1;
    }
    for (std::size_t i = prefix.size(); i < name.size(); i++) {
      if (!std::isdigit((unsigned char)name[i])) {
        return -1;
      }
    }
    return std::stoi(name.substr(prefix.size()));
  }

  FieldType parse_base() {
    std::string name = ident();
    if (name == "map") {
      expect('<');
      FieldType key = parse_type();
      expect(',');
      FieldType value = parse_type();
      expect('>');
      return FieldType::map(std::move(key), std::move(value));
    }
    if (name == "Cell" || name == "cell") {
      if (name == "Cell" && eat('<')) {
        std::string inner = ident();
        expect('>');
        return FieldType::cell_of(inner);
      }
      return FieldType::cell();
    }
    if ((name == "uint" || name == "bits") && eat('(')) {
      std::string field = ident();
      expect(')');
      return name == "uint" ? FieldType::uint_of(field) : FieldType::bits_of(field);
    }
    if (name == "bool") {
      return FieldType::bool_type();
    }
    if (name == "coins") {
      return FieldType::coins();
    }
    if (name == "address") {
      return FieldType::address();
    }
    if (name == "remaining") {
      return FieldType::remaining();
    }
    if (name == "snake") {
      return FieldType::snake();
    }
    int w;
    if ((w = width_suffix(name, "varuint")) >= 0 || (w = width_suffix(name, "varint")) >= 0) {
      bool is_unsigned = name[3] == 'u';
      unsigned len_bits;
      if (w == 16) {
        len_bits = 4;
      } else if (w == 32) {
        len_bits = 5;
      } else {
        error("only varint16, varint32, varuint16 and varuint32 are supported");
      }
      return is_unsigned ? FieldType::varuint(len_bits) : FieldType::varint(len_bits);
    }
    if ((w = width_suffix(name, "uint")) >= 0) {
      return FieldType::uint_type((unsigned)w);
    }
    if ((w = width_suffix(name, "int")) >= 0) {
      return FieldType::int_type((unsigned)w);
    }
    if ((w = width_suffix(name, "bits")) >= 0) {
      return FieldType::bits((unsigned)w);
    }
    return FieldType::named(name);
  }

  FieldType parse_type() {
    FieldType res = parse_base();
    if (eat('?')) {
      res.nullable = true;
    }
    return res;
  }
};

}  // namespace

FieldType parse_field_type(const std::string& str) {
  return TypeParser{str}.parse();
}

}  // namespace tolk
