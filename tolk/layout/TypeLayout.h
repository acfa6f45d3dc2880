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
#include <optional>
#include <string>
#include <vector>
#include "tolk/layout/DiscriminantTrie.h"
#include "tolk/layout/FieldType.h"
#include "tolk/layout/PackSize.h"

namespace tolk {

enum class UnmatchedPolicy { Error, Fallback };

struct UnionPolicy {
  static constexpr int default_exit_code = 63;

  UnmatchedPolicy on_unmatched{UnmatchedPolicy::Error};
  int exit_code{default_exit_code};
};

struct FieldLayout {
  std::string name;
  FieldType type;
  PackSize size;
};

struct VariantLayout {
  const TypeLayout* layout{nullptr};
  Opcode discriminant;
  // the discriminant was assigned by the union, the record itself carries no opcode
  bool assigned{false};
};

struct EnumMember {
  std::string name;
  long long value{0};
};

// Canonical encoding of a registered type. Built by LayoutRegistry, immutable afterwards.
struct TypeLayout {
  enum class Kind { Record, Union, Enum };

  std::string name;
  Kind kind{Kind::Record};
  PackSize size;

  // Record
  std::optional<Opcode> opcode;
  std::vector<FieldLayout> fields;

  // Union
  std::vector<VariantLayout> variants;
  UnionPolicy policy;
  DiscriminantTrie trie;

  // Enum
  unsigned enum_bits{0};
  bool enum_signed{false};
  std::vector<EnumMember> members;

  bool is_record() const {
    return kind == Kind::Record;
  }
  bool is_union() const {
    return kind == Kind::Union;
  }
  bool is_enum() const {
    return kind == Kind::Enum;
  }

  int field_index(const std::string& field_name) const;
  // throws LayoutError(unknown_type)
  const FieldLayout& field(const std::string& field_name) const;
  int variant_index(const std::string& type_name) const;
  int variant_index(const TypeLayout* variant) const;
  const EnumMember* find_member(long long value) const;
  const EnumMember* find_member(const std::string& member_name) const;

  void show(std::ostream& os) const;
};

std::ostream& operator<<(std::ostream& os, const TypeLayout& layout);

}  // namespace tolk
