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
#include "tolk/schema/Schema.h"
#include <stdexcept>
#include "td/utils/logging.h"
#include "tolk/errors.h"

namespace tolk {

namespace {

std::vector<FieldDecl> parse_fields(const json& decl) {
  std::vector<FieldDecl> fields;
  if (!decl.contains("fields")) {
    return fields;
  }
  for (const auto& field : decl.at("fields")) {
    fields.push_back(FieldDecl{field.at("name").get<std::string>(),
                               parse_field_type(field.at("type").get<std::string>())});
  }
  return fields;
}

std::optional<Opcode> parse_opcode(const json& decl, const char* key) {
  if (!decl.contains(key) || decl.at(key).is_null()) {
    return {};
  }
  return Opcode::parse(decl.at(key).get<std::string>());
}

std::vector<VariantDecl> parse_variants(const json& decl) {
  std::vector<VariantDecl> variants;
  for (const auto& variant : decl.at("variants")) {
    if (variant.is_string()) {
      variants.push_back(VariantDecl{variant.get<std::string>(), {}});
    } else {
      variants.push_back(VariantDecl{variant.at("type").get<std::string>(), parse_opcode(variant, "prefix")});
    }
  }
  return variants;
}

td::Result<UnionPolicy> parse_policy(const json& decl) {
  UnionPolicy policy;
  auto on_unmatched = decl.value("on_unmatched", std::string{"error"});
  if (on_unmatched == "fallback") {
    policy.on_unmatched = UnmatchedPolicy::Fallback;
  } else if (on_unmatched != "error") {
    return td::Status::Error("on_unmatched must be \"error\" or \"fallback\", not \"" + on_unmatched + "\"");
  }
  policy.exit_code = decl.value("exit_code", UnionPolicy::default_exit_code);
  return policy;
}

std::vector<EnumMember> parse_members(const json& decl) {
  std::vector<EnumMember> members;
  for (const auto& member : decl.at("members")) {
    members.push_back(EnumMember{member.at("name").get<std::string>(), member.at("value").get<long long>()});
  }
  return members;
}

td::Status register_decl(const json& decl, LayoutRegistry& registry) {
  auto name = decl.at("name").get<std::string>();
  auto kind = decl.value("kind", std::string{"struct"});
  if (kind == "struct") {
    registry.register_record(name, parse_fields(decl), parse_opcode(decl, "opcode"));
  } else if (kind == "union") {
    TRY_RESULT(policy, parse_policy(decl));
    registry.register_union(name, parse_variants(decl), policy);
  } else if (kind == "enum") {
    registry.register_enum(name, decl.at("bits").get<unsigned>(), decl.value("signed", false), parse_members(decl));
  } else {
    return td::Status::Error("type `" + name + "` has unknown kind \"" + kind + "\"");
  }
  return td::Status::OK();
}

td::Status register_decls(const json& types, LayoutRegistry& registry) {
  for (const auto& decl : types) {
    try {
      TRY_STATUS(register_decl(decl, registry));
    } catch (const Error& e) {
      return td::Status::Error(e.what());
    } catch (const json::exception& e) {
      return td::Status::Error(std::string{"malformed type declaration: "} + e.what());
    } catch (const std::invalid_argument& e) {
      return td::Status::Error(e.what());
    }
  }
  return td::Status::OK();
}

}  // namespace

td::Result<json> parse_json(td::Slice text) {
  try {
    return json::parse(text.begin(), text.end());
  } catch (const json::exception& e) {
    return td::Status::Error(std::string{"malformed JSON: "} + e.what());
  }
}

td::Result<CellLimits> parse_limits(const json& schema) {
  CellLimits limits = CellLimits::canonical();
  if (!schema.is_object() || !schema.contains("limits")) {
    return limits;
  }
  try {
    const auto& obj = schema.at("limits");
    limits.max_bits = obj.value("max_bits", limits.max_bits);
    limits.max_refs = obj.value("max_refs", limits.max_refs);
  } catch (const json::exception& e) {
    return td::Status::Error(std::string{"malformed limits: "} + e.what());
  }
  if (!limits.max_bits) {
    return td::Status::Error("max_bits must be positive");
  }
  return limits;
}

td::Status load_schema(const json& schema, LayoutRegistry& registry) {
  if (!schema.is_object() || !schema.contains("types") || !schema.at("types").is_array()) {
    return td::Status::Error("schema must be an object with a \"types\" array");
  }
  TRY_RESULT(limits, parse_limits(schema));
  if (!(limits == registry.limits())) {
    return td::Status::Error("schema limits differ from the limits of the registry");
  }
  std::size_t known = registry.type_names().size();
  auto status = register_decls(schema.at("types"), registry);
  if (status.is_error()) {
    LOG(WARNING) << "schema rejected, dropping " << registry.type_names().size() - known << " new types";
    registry.rollback(known);
    return status;
  }
  LOG(DEBUG) << "schema loaded, " << registry.type_names().size() << " types";
  return td::Status::OK();
}

td::Result<std::unique_ptr<LayoutRegistry>> create_registry(const json& schema) {
  TRY_RESULT(limits, parse_limits(schema));
  auto registry = std::make_unique<LayoutRegistry>(limits);
  TRY_STATUS(load_schema(schema, *registry));
  return std::move(registry);
}

json schema_to_json(const LayoutRegistry& registry) {
  json types = json::array();
  for (const auto& name : registry.type_names()) {
    const TypeLayout& layout = registry.layout_of(name);
    json decl;
    decl["name"] = name;
    switch (layout.kind) {
      case TypeLayout::Kind::Record: {
        decl["kind"] = "struct";
        if (layout.opcode) {
          decl["opcode"] = layout.opcode->to_string();
        }
        json fields = json::array();
        for (const auto& field : layout.fields) {
          fields.push_back({{"name", field.name}, {"type", field.type.to_string()}});
        }
        decl["fields"] = std::move(fields);
        break;
      }
      case TypeLayout::Kind::Union: {
        decl["kind"] = "union";
        json variants = json::array();
        for (const auto& variant : layout.variants) {
          if (variant.assigned) {
            variants.push_back({{"type", variant.layout->name}, {"prefix", variant.discriminant.to_string()}});
          } else {
            variants.push_back(variant.layout->name);
          }
        }
        decl["variants"] = std::move(variants);
        decl["on_unmatched"] = layout.policy.on_unmatched == UnmatchedPolicy::Fallback ? "fallback" : "error";
        decl["exit_code"] = layout.policy.exit_code;
        break;
      }
      case TypeLayout::Kind::Enum: {
        decl["kind"] = "enum";
        decl["bits"] = layout.enum_bits;
        decl["signed"] = layout.enum_signed;
        json members = json::array();
        for (const auto& member : layout.members) {
          members.push_back({{"name", member.name}, {"value", member.value}});
        }
        decl["members"] = std::move(members);
        break;
      }
    }
    types.push_back(std::move(decl));
  }
  return json{{"limits", {{"max_bits", registry.limits().max_bits}, {"max_refs", registry.limits().max_refs}}},
              {"types", std::move(types)}};
}

}  // namespace tolk
