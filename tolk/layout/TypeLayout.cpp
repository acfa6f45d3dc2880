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
#include "tolk/layout/TypeLayout.h"
#include <ostream>
#include "tolk/errors.h"

namespace tolk {

int TypeLayout::field_index(const std::string& field_name) const {
  for (std::size_t i = 0; i < fields.size(); i++) {
    if (fields[i].name == field_name) {
      return (int)i;
    }
  }
  return -1;
}

const FieldLayout& TypeLayout::field(const std::string& field_name) const {
  int idx = field_index(field_name);
  if (idx < 0) {
    throw LayoutError(ErrorCode::unknown_type, name, "no field `" + field_name + "`");
  }
  return fields[idx];
}

int TypeLayout::variant_index(const std::string& type_name) const {
  for (std::size_t i = 0; i < variants.size(); i++) {
    if (variants[i].layout->name == type_name) {
      return (int)i;
    }
  }
  return -1;
}

int TypeLayout::variant_index(const TypeLayout* variant) const {
  for (std::size_t i = 0; i < variants.size(); i++) {
    if (variants[i].layout == variant) {
      return (int)i;
    }
  }
  return -1;
}

const EnumMember* TypeLayout::find_member(long long value) const {
  for (const auto& m : members) {
    if (m.value == value) {
      return &m;
    }
  }
  return nullptr;
}

const EnumMember* TypeLayout::find_member(const std::string& member_name) const {
  for (const auto& m : members) {
    if (m.name == member_name) {
      return &m;
    }
  }
  return nullptr;
}

void TypeLayout::show(std::ostream& os) const {
  switch (kind) {
    case Kind::Record:
      os << "struct ";
      if (opcode) {
        os << "(" << *opcode << ") ";
      }
      os << name << " " << size << " {";
      for (const auto& f : fields) {
        os << " " << f.name << ": " << f.type << " " << f.size << ";";
      }
      os << " }";
      break;
    case Kind::Union:
      os << "union " << name << " " << size << " =";
      for (const auto& v : variants) {
        os << " " << v.discriminant << ":" << v.layout->name;
      }
      if (policy.on_unmatched == UnmatchedPolicy::Fallback) {
        os << " else fallback";
      } else {
        os << " else throw " << policy.exit_code;
      }
      break;
    case Kind::Enum:
      os << "enum " << name << " : " << (enum_signed ? "int" : "uint") << enum_bits << " {";
      for (const auto& m : members) {
        os << " " << m.name << " = " << m.value << ";";
      }
      os << " }";
      break;
  }
}

std::ostream& operator<<(std::ostream& os, const TypeLayout& layout) {
  layout.show(os);
  return os;
}

}  // namespace tolk
