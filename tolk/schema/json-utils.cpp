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
#include "tolk/schema/json-utils.h"
#include <stdexcept>
#include "tolk/cells/boc.h"
#include "tolk/dict/Map.h"
#include "tolk/errors.h"

namespace tolk {

namespace {

json boc_json(const Ref<Cell>& cell) {
  return json{{"boc", boc_to_base64(cell)}};
}

Ref<Cell> cell_from_json(const json& obj) {
  auto r_cell = boc_from_base64(obj.at("boc").get<std::string>());
  if (r_cell.is_error()) {
    throw CodecError(ErrorCode::type_check, "invalid bag of cells: " + r_cell.error().message().str());
  }
  return r_cell.move_as_ok();
}

std::string bits_json(const BitString& bits) {
  return "x{" + bits.to_hex() + "}";
}

json integer_json(const Value& value) {
  if (value.type() == Value::Type::Int) {
    return value.as_int();
  }
  return value.as_uint();
}

long long signed_from_json(const json& obj) {
  if (obj.is_string()) {
    return std::stoll(obj.get<std::string>());
  }
  return obj.get<long long>();
}

unsigned long long unsigned_from_json(const json& obj) {
  if (obj.is_string()) {
    return std::stoull(obj.get<std::string>());
  }
  return obj.get<unsigned long long>();
}

Value layout_from_json(const Codec& codec, const json& obj, const TypeLayout& layout) {
  switch (layout.kind) {
    case TypeLayout::Kind::Record: {
      if (obj.contains("$type") && obj.at("$type").get<std::string>() != layout.name) {
        throw CodecError(ErrorCode::type_check,
                         "expected `" + layout.name + "`, got `" + obj.at("$type").get<std::string>() + "`");
      }
      std::vector<Value> fields;
      fields.reserve(layout.fields.size());
      for (const auto& field : layout.fields) {
        if (!obj.contains(field.name)) {
          if (!field.type.nullable) {
            throw CodecError(ErrorCode::type_check, "field `" + field.name + "` of `" + layout.name + "` is missing");
          }
          fields.emplace_back();
          continue;
        }
        try {
          fields.push_back(field_from_json(codec, obj.at(field.name), field.type));
        } catch (CodecError& err) {
          err.prepend_path(field.name);
          throw;
        }
      }
      return Value::record(layout, std::move(fields));
    }
    case TypeLayout::Kind::Union: {
      if (obj.contains("$unmatched")) {
        return Value::unmatched(layout, CellSlice{cell_from_json(json{{"boc", obj.at("$unmatched")}})});
      }
      auto type_name = obj.at("$type").get<std::string>();
      int idx = layout.variant_index(type_name);
      if (idx < 0) {
        throw CodecError(ErrorCode::type_check, "`" + type_name + "` is not a variant of `" + layout.name + "`");
      }
      return layout_from_json(codec, obj, *layout.variants[idx].layout);
    }
    case TypeLayout::Kind::Enum:
      break;
  }
  long long x = 0;
  if (obj.is_string()) {
    auto member = layout.find_member(obj.get<std::string>());
    if (!member) {
      throw CodecError(ErrorCode::range_check,
                       "`" + obj.get<std::string>() + "` is not a member of enum `" + layout.name + "`");
    }
    x = member->value;
  } else {
    x = obj.get<long long>();
  }
  return layout.enum_signed ? Value::integer(x) : Value::uint((unsigned long long)x);
}

}  // namespace

json value_to_json(const Codec& codec, const Value& value, const TypeLayout& layout) {
  switch (layout.kind) {
    case TypeLayout::Kind::Record: {
      const Record& rec = value.as_record();
      json obj;
      obj["$type"] = rec.layout->name;
      for (std::size_t i = 0; i < rec.fields.size(); i++) {
        const FieldLayout& field = rec.layout->fields[i];
        obj[field.name] = field_to_json(codec, rec.fields[i], field.type);
      }
      return obj;
    }
    case TypeLayout::Kind::Union:
      if (value.type() == Value::Type::Unmatched) {
        return json{{"$type", layout.name}, {"$unmatched", boc_to_base64(value.as_unmatched().raw.to_cell())}};
      }
      return value_to_json(codec, value, *value.as_record().layout);
    case TypeLayout::Kind::Enum:
      break;
  }
  auto member = layout.find_member(value.as_int());
  if (member) {
    return member->name;
  }
  return integer_json(value);
}

json field_to_json(const Codec& codec, const Value& value, const FieldType& type) {
  if (value.is_null()) {
    return nullptr;
  }
  switch (type.kind) {
    case FieldKind::Int:
    case FieldKind::Uint:
    case FieldKind::VarInt:
    case FieldKind::VarUint:
    case FieldKind::UintOf:
      return integer_json(value);
    case FieldKind::Bool:
      return value.as_bool();
    case FieldKind::Bits:
    case FieldKind::BitsOf:
    case FieldKind::Snake:
      return bits_json(value.as_bits());
    case FieldKind::Cell:
      return boc_json(value.as_cell());
    case FieldKind::CellOf:
      if (value.type() == Value::Type::Cell) {
        return boc_json(value.as_cell());
      }
      return value_to_json(codec, value, *type.layout);
    case FieldKind::Struct:
    case FieldKind::Union:
    case FieldKind::Enum:
      return value_to_json(codec, value, *type.layout);
    case FieldKind::Address:
      return value.as_address().to_string();
    case FieldKind::Map: {
      json items = json::array();
      Map::from_field(codec, type, value).for_each([&](const Value& key, const Value& item) {
        items.push_back({{"key", field_to_json(codec, key, *type.key)}, {"value", field_to_json(codec, item, *type.value)}});
      });
      return items;
    }
    case FieldKind::Remaining:
      if (value.type() == Value::Type::Bits) {
        return bits_json(value.as_bits());
      }
      return boc_json(value.as_slice().to_cell());
    case FieldKind::Named:
      break;
  }
  throw CodecError(ErrorCode::unknown_type, "`" + type.to_string() + "` was not resolved by the registry");
}

Value field_from_json(const Codec& codec, const json& obj, const FieldType& type) {
  if (obj.is_null()) {
    return Value::null();
  }
  switch (type.kind) {
    case FieldKind::Int:
    case FieldKind::VarInt:
      return Value::integer(signed_from_json(obj));
    case FieldKind::Uint:
    case FieldKind::VarUint:
    case FieldKind::UintOf:
      return Value::uint(unsigned_from_json(obj));
    case FieldKind::Bool:
      return Value::boolean(obj.get<bool>());
    case FieldKind::Bits:
    case FieldKind::BitsOf:
    case FieldKind::Snake:
      return Value::bits(BitString::parse(obj.get<std::string>()));
    case FieldKind::Cell:
      return Value::cell(cell_from_json(obj));
    case FieldKind::CellOf:
      if (obj.is_object() && obj.contains("boc")) {
        return Value::cell(cell_from_json(obj));
      }
      return layout_from_json(codec, obj, *type.layout);
    case FieldKind::Struct:
    case FieldKind::Union:
    case FieldKind::Enum:
      return layout_from_json(codec, obj, *type.layout);
    case FieldKind::Address:
      return Value::address(Address::parse(obj.get<std::string>()));
    case FieldKind::Map: {
      Map map{codec, *type.key, *type.value};
      for (const auto& item : obj) {
        map = map.set(field_from_json(codec, item.at("key"), *type.key),
                      field_from_json(codec, item.at("value"), *type.value));
      }
      return map.to_value();
    }
    case FieldKind::Remaining:
      if (obj.is_string()) {
        return Value::bits(BitString::parse(obj.get<std::string>()));
      }
      return Value::slice(CellSlice{cell_from_json(obj)});
    case FieldKind::Named:
      break;
  }
  throw CodecError(ErrorCode::unknown_type, "`" + type.to_string() + "` was not resolved by the registry");
}

td::Result<Value> value_from_json(const Codec& codec, const json& obj, const TypeLayout& layout) {
  try {
    return layout_from_json(codec, obj, layout);
  } catch (const Error& e) {
    return td::Status::Error(e.what());
  } catch (const json::exception& e) {
    return td::Status::Error(std::string{"malformed value: "} + e.what());
  } catch (const std::invalid_argument& e) {
    return td::Status::Error(e.what());
  } catch (const std::out_of_range& e) {
    return td::Status::Error(e.what());
  }
}

}  // namespace tolk
