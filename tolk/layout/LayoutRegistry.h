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
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tolk/layout/TypeLayout.h"

namespace tolk {

struct FieldDecl {
  std::string name;
  FieldType type;
};

struct VariantDecl {
  std::string type_name;
  // discriminant assigned by the union; must agree with the record's own opcode if it has one
  std::optional<Opcode> discriminant;
};

// Owner of every TypeLayout of one compilation/execution unit.
// Types are registered in dependency order: a referenced type must already be present.
// Layout references handed out stay valid for the registry's lifetime, unless rollback() drops their type.
class LayoutRegistry {
 public:
  explicit LayoutRegistry(CellLimits limits = CellLimits::canonical());
  LayoutRegistry(const LayoutRegistry&) = delete;
  LayoutRegistry& operator=(const LayoutRegistry&) = delete;

  const TypeLayout& register_record(const std::string& name, std::vector<FieldDecl> fields,
                                    std::optional<Opcode> opcode = {});
  const TypeLayout& register_union(const std::string& name, std::vector<VariantDecl> variants,
                                   UnionPolicy policy = {});
  const TypeLayout& register_enum(const std::string& name, unsigned bits, bool is_signed,
                                  std::vector<EnumMember> members);

  // throws LayoutError(unknown_type)
  const TypeLayout& layout_of(const std::string& name) const;
  const TypeLayout* find(const std::string& name) const;
  bool contains(const std::string& name) const {
    return find(name) != nullptr;
  }
  const CellLimits& limits() const {
    return limits_;
  }
  // in registration order
  const std::vector<std::string>& type_names() const {
    return order_;
  }
  // drops every type registered after the first `count` ones
  void rollback(std::size_t count);

  // resolves a standalone type (a map key or value); dynamic widths are not allowed there
  FieldType resolve_type(const FieldType& type) const;
  // bounds of the encoding of a resolved type
  PackSize field_size(const FieldType& type) const;

  void show(std::ostream& os) const;

 private:
  CellLimits limits_;
  std::map<std::string, std::unique_ptr<TypeLayout>> layouts_;
  std::vector<std::string> order_;

  void check_new_name(const std::string& name) const;
  FieldType resolve(const std::string& owner, const std::string& field_name, const FieldType& type,
                    const std::vector<FieldLayout>* preceding) const;
  const TypeLayout& add(std::unique_ptr<TypeLayout> layout);
};

}  // namespace tolk
