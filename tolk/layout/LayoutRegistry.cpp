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
#include "tolk/layout/LayoutRegistry.h"
#include <ostream>
#include <set>
#include <sstream>
#include "td/utils/logging.h"
#include "tolk/errors.h"

namespace tolk {

namespace {

std::string field_ctx(const std::string& field_name) {
  return field_name.empty() ? std::string{} : "field `" + field_name + "`: ";
}

bool fits_signed(long long value, unsigned bits) {
  if (bits >= 64) {
    return true;
  }
  long long bound = 1LL << (bits - 1);
  return value >= -bound && value < bound;
}

bool fits_unsigned(long long value, unsigned bits) {
  return value >= 0 && (bits >= 64 || !((unsigned long long)value >> bits));
}

unsigned ceil_log2(std::size_t n) {
  unsigned res = 0;
  while (((std::size_t)1 << res) < n) {
    ++res;
  }
  return res;
}

}  // namespace

LayoutRegistry::LayoutRegistry(CellLimits limits) : limits_(limits) {
}

const TypeLayout* LayoutRegistry::find(const std::string& name) const {
  auto it = layouts_.find(name);
  return it == layouts_.end() ? nullptr : it->second.get();
}

const TypeLayout& LayoutRegistry::layout_of(const std::string& name) const {
  auto layout = find(name);
  if (!layout) {
    throw LayoutError(ErrorCode::unknown_type, name, "type is not registered");
  }
  return *layout;
}

void LayoutRegistry::check_new_name(const std::string& name) const {
  if (name.empty()) {
    throw LayoutError(ErrorCode::type_check, name, "type name must not be empty");
  }
  if (contains(name)) {
    throw LayoutError(ErrorCode::type_check, name, "type is already registered");
  }
}

const TypeLayout& LayoutRegistry::add(std::unique_ptr<TypeLayout> layout) {
  if (!layout->size.min_fits(limits_)) {
    std::ostringstream os;
    os << "smallest encoding " << layout->size << " does not fit into a node of " << limits_.max_bits << " bits and "
       << limits_.max_refs << " refs";
    throw LayoutError(ErrorCode::size_exceeded, layout->name, os.str());
  }
  std::ostringstream descr;
  layout->show(descr);
  LOG(DEBUG) << "registered " << descr.str();
  auto& res = *layout;
  order_.push_back(layout->name);
  layouts_.emplace(layout->name, std::move(layout));
  return res;
}

void LayoutRegistry::rollback(std::size_t count) {
  while (order_.size() > count) {
    LOG(DEBUG) << "dropping `" << order_.back() << "`";
    layouts_.erase(order_.back());
    order_.pop_back();
  }
}

FieldType LayoutRegistry::resolve(const std::string& owner, const std::string& field_name, const FieldType& type,
                                  const std::vector<FieldLayout>* preceding) const {
  FieldType res{type};
  auto width_error = [&](const std::string& msg) {
    return LayoutError(ErrorCode::ambiguous_width, owner, field_ctx(field_name) + msg);
  };
  switch (type.kind) {
    case FieldKind::Int:
    case FieldKind::Uint:
      if (type.width < 1 || type.width > 64) {
        throw width_error("integer width of `" + type.to_string() + "` must be between 1 and 64");
      }
      break;
    case FieldKind::Bits:
      if (type.width < 1 || type.width > limits_.max_bits) {
        throw width_error("`" + type.to_string() + "` must be between 1 and " + std::to_string(limits_.max_bits) +
                          " bits wide");
      }
      break;
    case FieldKind::VarInt:
    case FieldKind::VarUint:
      if (type.width != 4 && type.width != 5) {
        throw width_error("length prefix of a variable-width integer must be 4 or 5 bits");
      }
      break;
    case FieldKind::UintOf:
    case FieldKind::BitsOf: {
      if (!preceding) {
        throw width_error("`" + type.to_string() + "` is only allowed directly in a struct");
      }
      int idx = -1;
      for (std::size_t i = 0; i < preceding->size(); i++) {
        if ((*preceding)[i].name == type.ref_name) {
          idx = (int)i;
        }
      }
      if (idx < 0) {
        throw width_error("width field `" + type.ref_name + "` must be declared before `" + type.to_string() + "`");
      }
      const FieldType& wt = (*preceding)[idx].type;
      if (!wt.is_unsigned_integer() || wt.nullable) {
        throw width_error("width field `" + type.ref_name + "` must be a non-nullable unsigned integer, not `" +
                          wt.to_string() + "`");
      }
      res.width_field_idx = idx;
      break;
    }
    case FieldKind::Cell:
      break;
    case FieldKind::CellOf: {
      auto layout = find(type.ref_name);
      if (!layout) {
        throw LayoutError(ErrorCode::unknown_type, owner, field_ctx(field_name) + "unknown type `" + type.ref_name + "`");
      }
      if (layout->is_enum()) {
        throw LayoutError(ErrorCode::type_check, owner,
                          field_ctx(field_name) + "`Cell<" + type.ref_name + ">` needs a struct or a union");
      }
      res.layout = layout;
      break;
    }
    case FieldKind::Named:
    case FieldKind::Struct:
    case FieldKind::Union:
    case FieldKind::Enum: {
      auto layout = find(type.ref_name);
      if (!layout) {
        throw LayoutError(ErrorCode::unknown_type, owner, field_ctx(field_name) + "unknown type `" + type.ref_name + "`");
      }
      res.layout = layout;
      res.kind = layout->is_record() ? FieldKind::Struct : (layout->is_union() ? FieldKind::Union : FieldKind::Enum);
      break;
    }
    case FieldKind::Address:
      res.width = FieldType::address_bits;
      break;
    case FieldKind::Map: {
      FieldType key = resolve(owner, field_name, *type.key, nullptr);
      if ((key.kind != FieldKind::Int && key.kind != FieldKind::Uint && key.kind != FieldKind::Bits) || key.nullable) {
        throw width_error("map key `" + key.to_string() + "` must be a fixed-width integer or bitsN");
      }
      res.key = std::make_shared<const FieldType>(std::move(key));
      res.value = std::make_shared<const FieldType>(resolve(owner, field_name, *type.value, nullptr));
      break;
    }
    case FieldKind::Remaining:
    case FieldKind::Snake:
      if (type.nullable) {
        throw width_error("`" + type.to_string() + "` cannot be nullable");
      }
      break;
  }
  return res;
}

FieldType LayoutRegistry::resolve_type(const FieldType& type) const {
  return resolve(type.to_string(), "", type, nullptr);
}

PackSize LayoutRegistry::field_size(const FieldType& type) const {
  PackSize base;
  switch (type.kind) {
    case FieldKind::Int:
    case FieldKind::Uint:
    case FieldKind::Bits:
    case FieldKind::Address:
      base = PackSize::fixed(type.width);
      break;
    case FieldKind::Bool:
      base = PackSize::fixed(1);
      break;
    case FieldKind::VarInt:
    case FieldKind::VarUint:
      base = PackSize::range(type.width, type.width + 8 * ((1u << type.width) - 1));
      break;
    case FieldKind::UintOf:
      base = PackSize::range(0, 64);
      break;
    case FieldKind::BitsOf:
      base = PackSize::range(0, limits_.max_bits);
      break;
    case FieldKind::Cell:
    case FieldKind::CellOf:
      base = PackSize::fixed(0, 1);
      break;
    case FieldKind::Named:
      base = layout_of(type.ref_name).size;
      break;
    case FieldKind::Struct:
    case FieldKind::Union:
    case FieldKind::Enum:
      base = type.layout->size;
      break;
    case FieldKind::Map:
      base = PackSize::range(1, 1, 0, 1);
      break;
    case FieldKind::Remaining:
    case FieldKind::Snake:
      base = PackSize::any();
      break;
  }
  if (type.nullable) {
    return PackSize::range(1, 1) + PackSize::range(0, base.max_bits, 0, base.max_refs);
  }
  return base;
}

const TypeLayout& LayoutRegistry::register_record(const std::string& name, std::vector<FieldDecl> fields,
                                                  std::optional<Opcode> opcode) {
  check_new_name(name);
  auto layout = std::make_unique<TypeLayout>();
  layout->name = name;
  layout->kind = TypeLayout::Kind::Record;
  if (opcode) {
    if (!opcode->fits()) {
      throw LayoutError(ErrorCode::ambiguous_width, name,
                        "opcode value does not fit into " + std::to_string(opcode->bits) + " bits");
    }
    layout->opcode = opcode;
    layout->size = PackSize::fixed(opcode->bits);
  }
  std::set<std::string> names;
  for (std::size_t i = 0; i < fields.size(); i++) {
    auto& decl = fields[i];
    if (decl.name.empty() || !names.insert(decl.name).second) {
      throw LayoutError(ErrorCode::type_check, name, "field name `" + decl.name + "` is empty or duplicated");
    }
    FieldType type = resolve(name, decl.name, decl.type, &layout->fields);
    if (type.is_remainder() && i + 1 != fields.size()) {
      throw LayoutError(ErrorCode::ambiguous_width, name,
                        field_ctx(decl.name) + "`" + type.to_string() + "` must be the last field");
    }
    PackSize size = field_size(type);
    layout->size += size;
    layout->fields.push_back(FieldLayout{decl.name, std::move(type), size});
  }
  return add(std::move(layout));
}

const TypeLayout& LayoutRegistry::register_union(const std::string& name, std::vector<VariantDecl> variants,
                                                 UnionPolicy policy) {
  check_new_name(name);
  if (variants.empty()) {
    throw LayoutError(ErrorCode::type_check, name, "union has no variants");
  }
  auto layout = std::make_unique<TypeLayout>();
  layout->name = name;
  layout->kind = TypeLayout::Kind::Union;
  layout->policy = policy;

  std::size_t with_prefix = 0;
  for (auto& decl : variants) {
    auto variant = find(decl.type_name);
    if (!variant) {
      throw LayoutError(ErrorCode::unknown_type, name, "unknown variant type `" + decl.type_name + "`");
    }
    if (!variant->is_record()) {
      throw LayoutError(ErrorCode::type_check, name, "variant `" + decl.type_name + "` must be a struct");
    }
    if (layout->variant_index(variant) >= 0) {
      throw LayoutError(ErrorCode::ambiguous_discriminant, name, "variant `" + decl.type_name + "` is listed twice");
    }
    VariantLayout v;
    v.layout = variant;
    if (decl.discriminant && variant->opcode && *decl.discriminant != *variant->opcode) {
      throw LayoutError(ErrorCode::ambiguous_discriminant, name,
                        "discriminant " + decl.discriminant->to_string() + " of variant `" + decl.type_name +
                            "` differs from its opcode " + variant->opcode->to_string());
    }
    if (variant->opcode) {
      v.discriminant = *variant->opcode;
      ++with_prefix;
    } else if (decl.discriminant) {
      if (!decl.discriminant->fits()) {
        throw LayoutError(ErrorCode::ambiguous_width, name,
                          "discriminant of variant `" + decl.type_name + "` does not fit its width");
      }
      v.discriminant = *decl.discriminant;
      v.assigned = true;
      ++with_prefix;
    }
    layout->variants.push_back(v);
  }

  if (!with_prefix) {
    // sequential prefixes of ceil(log2(n)) bits, in declaration order
    unsigned bits = ceil_log2(layout->variants.size());
    for (std::size_t i = 0; i < layout->variants.size(); i++) {
      layout->variants[i].discriminant = Opcode{i, bits};
      layout->variants[i].assigned = true;
    }
    LOG(INFO) << "union `" << name << "`: auto-generated " << bits << "-bit prefixes for " << layout->variants.size()
              << " variants";
  } else if (with_prefix != layout->variants.size()) {
    throw LayoutError(ErrorCode::ambiguous_discriminant, name,
                      "either every variant must have a discriminant or none of them");
  }

  for (std::size_t i = 0; i < layout->variants.size(); i++) {
    const auto& v = layout->variants[i];
    int other = layout->trie.insert(v.discriminant, (int)i);
    if (other >= 0) {
      const auto& o = layout->variants[other];
      throw LayoutError(ErrorCode::ambiguous_discriminant, name,
                        "discriminant " + v.discriminant.to_string() + " of `" + v.layout->name + "` collides with " +
                            o.discriminant.to_string() + " of `" + o.layout->name + "`");
    }
    PackSize size = (v.assigned ? PackSize::fixed(v.discriminant.bits) : PackSize{}) + v.layout->size;
    if (i == 0) {
      layout->size = size;
    } else {
      layout->size |= size;
    }
  }
  return add(std::move(layout));
}

const TypeLayout& LayoutRegistry::register_enum(const std::string& name, unsigned bits, bool is_signed,
                                                std::vector<EnumMember> members) {
  check_new_name(name);
  if (bits < 1 || bits > 64) {
    throw LayoutError(ErrorCode::ambiguous_width, name, "enum width must be between 1 and 64 bits");
  }
  std::set<std::string> names;
  std::set<long long> values;
  for (const auto& m : members) {
    if (m.name.empty() || !names.insert(m.name).second) {
      throw LayoutError(ErrorCode::type_check, name, "member name `" + m.name + "` is empty or duplicated");
    }
    if (!values.insert(m.value).second) {
      throw LayoutError(ErrorCode::ambiguous_discriminant, name,
                        "member `" + m.name + "` repeats value " + std::to_string(m.value));
    }
    if (!(is_signed ? fits_signed(m.value, bits) : fits_unsigned(m.value, bits))) {
      throw LayoutError(ErrorCode::range_check, name,
                        "member `" + m.name + "` does not fit into " + std::string{is_signed ? "int" : "uint"} +
                            std::to_string(bits));
    }
  }
  auto layout = std::make_unique<TypeLayout>();
  layout->name = name;
  layout->kind = TypeLayout::Kind::Enum;
  layout->enum_bits = bits;
  layout->enum_signed = is_signed;
  layout->members = std::move(members);
  layout->size = PackSize::fixed(bits);
  return add(std::move(layout));
}

void LayoutRegistry::show(std::ostream& os) const {
  for (const auto& name : order_) {
    os << *layouts_.at(name) << std::endl;
  }
}

}  // namespace tolk
