// Copyright 2023 Disintar LLP / andrey@head-labs.com

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>
#include "td/utils/logging.h"
#include "tolk/dispatch/MatchTable.h"
#include "tolk/schema/Schema.h"
#include "tolk/schema/json-utils.h"
#include "PyCodec.h"

namespace {

tolk::json parse_or_throw(const std::string& text) {
  auto r_json = tolk::parse_json(text);
  if (r_json.is_error()) {
    throw std::invalid_argument(r_json.error().message().str());
  }
  return r_json.move_as_ok();
}

const tolk::Ref<tolk::Cell>& checked(const PyCell& cell) {
  if (cell.is_null()) {
    throw std::invalid_argument("Cell is null");
  }
  return cell.my_cell;
}

tolk::UnpackOptions unpack_options(bool assert_end_after_reading, int throw_if_opcode_does_not_match) {
  tolk::UnpackOptions options;
  options.assert_end_after_reading = assert_end_after_reading;
  options.throw_if_opcode_does_not_match = throw_if_opcode_does_not_match;
  return options;
}

}  // namespace

PyRegistry::PyRegistry(unsigned max_bits, unsigned max_refs)
    : my_registry(std::make_shared<tolk::LayoutRegistry>(tolk::CellLimits{max_bits, max_refs})) {
}

PyRegistry PyRegistry::from_schema(const std::string& schema) {
  auto r_registry = tolk::create_registry(parse_or_throw(schema));
  if (r_registry.is_error()) {
    LOG(ERROR) << "Can't load schema: " << r_registry.error().message().str();
    throw std::invalid_argument(r_registry.error().message().str());
  }
  return PyRegistry(std::shared_ptr<tolk::LayoutRegistry>(r_registry.move_as_ok()));
}

void PyRegistry::load_schema(const std::string& schema) {
  auto status = tolk::load_schema(parse_or_throw(schema), *my_registry);
  if (status.is_error()) {
    LOG(ERROR) << "Can't load schema: " << status.message().str();
    throw std::invalid_argument(status.message().str());
  }
}

std::string PyRegistry::to_schema() const {
  return tolk::schema_to_json(*my_registry).dump();
}

void PyRegistry::register_record(const std::string& name,
                                 const std::vector<std::pair<std::string, std::string>>& fields,
                                 const std::optional<std::string>& opcode) {
  std::vector<tolk::FieldDecl> decls;
  for (const auto& field : fields) {
    decls.push_back(tolk::FieldDecl{field.first, tolk::parse_field_type(field.second)});
  }
  std::optional<tolk::Opcode> op;
  if (opcode) {
    op = tolk::Opcode::parse(*opcode);
  }
  my_registry->register_record(name, std::move(decls), op);
}

void PyRegistry::register_union(const std::string& name,
                                const std::vector<std::tuple<std::string, std::optional<std::string>>>& variants,
                                const std::string& on_unmatched, int exit_code) {
  std::vector<tolk::VariantDecl> decls;
  for (const auto& variant : variants) {
    tolk::VariantDecl decl{std::get<0>(variant), {}};
    if (std::get<1>(variant)) {
      decl.discriminant = tolk::Opcode::parse(*std::get<1>(variant));
    }
    decls.push_back(std::move(decl));
  }
  tolk::UnionPolicy policy;
  if (on_unmatched == "fallback") {
    policy.on_unmatched = tolk::UnmatchedPolicy::Fallback;
  } else if (on_unmatched != "error") {
    throw std::invalid_argument("on_unmatched must be \"error\" or \"fallback\"");
  }
  policy.exit_code = exit_code;
  my_registry->register_union(name, std::move(decls), policy);
}

void PyRegistry::register_enum(const std::string& name, unsigned bits, bool is_signed,
                               const std::vector<std::pair<std::string, long long>>& members) {
  std::vector<tolk::EnumMember> decls;
  for (const auto& member : members) {
    decls.push_back(tolk::EnumMember{member.first, member.second});
  }
  my_registry->register_enum(name, bits, is_signed, std::move(decls));
}

std::string PyRegistry::layout_of(const std::string& name) const {
  std::stringstream os;
  my_registry->layout_of(name).show(os);
  return os.str();
}

bool PyRegistry::contains(const std::string& name) const {
  return my_registry->contains(name);
}

std::vector<std::string> PyRegistry::type_names() const {
  return my_registry->type_names();
}

std::string PyLazyValue::type_name() const {
  return my_value.get_layout().name;
}

std::string PyLazyValue::get(const std::string& field) {
  const tolk::Value& value = my_value.get(field);
  return tolk::field_to_json(*codec_, value, my_value.get_layout().field(field).type).dump();
}

bool PyLazyValue::is_cached(const std::string& field) const {
  int idx = my_value.get_layout().field_index(field);
  return idx >= 0 && my_value.is_cached(idx);
}

std::string PyLazyValue::to_json() {
  return tolk::value_to_json(*codec_, my_value.to_value(), my_value.get_layout()).dump();
}

PyCell PyLazyValue::rest() {
  return PyCell(my_value.rest().to_cell());
}

std::string PyUnionView::state() const {
  return tolk::get_state_name(my_view->state());
}

void PyUnionView::open() {
  my_view->open();
}

void PyUnionView::close() {
  my_view->close();
}

std::optional<std::string> PyUnionView::variant() const {
  if (!my_view->is_matched()) {
    return {};
  }
  return my_view->variant_layout().name;
}

unsigned PyUnionView::discriminant_depth() const {
  return my_view->discriminant_depth();
}

std::string PyUnionView::get(const std::string& field) {
  const tolk::Value& value = my_view->get(field);
  return tolk::field_to_json(*codec_, value, my_view->variant_layout().field(field).type).dump();
}

std::string PyUnionView::to_json() {
  return tolk::value_to_json(*codec_, my_view->to_value(), my_view->get_union_layout()).dump();
}

PyCell PyUnionView::raw() const {
  return PyCell(my_view->raw().to_cell());
}

tolk::Value PyMap::key_from_json(const std::string& key) const {
  return tolk::field_from_json(*codec_, parse_or_throw(key), my_map.key_type());
}

tolk::Value PyMap::value_from_json(const std::string& value) const {
  return tolk::field_from_json(*codec_, parse_or_throw(value), my_map.value_type());
}

std::optional<std::tuple<std::string, std::string>> PyMap::entry(const tolk::MapEntry& e) const {
  if (!e) {
    return {};
  }
  return std::make_tuple(tolk::field_to_json(*codec_, e.key, my_map.key_type()).dump(),
                         tolk::field_to_json(*codec_, e.value, my_map.value_type()).dump());
}

std::optional<std::string> PyMap::get(const std::string& key) const {
  auto found = my_map.get(key_from_json(key));
  if (!found) {
    return {};
  }
  return tolk::field_to_json(*codec_, found.value, my_map.value_type()).dump();
}

PyMap PyMap::set(const std::string& key, const std::string& value) const {
  return with(my_map.set(key_from_json(key), value_from_json(value)));
}

std::tuple<PyMap, bool> PyMap::set_if_absent(const std::string& key, const std::string& value) const {
  auto res = my_map.set_if_absent(key_from_json(key), value_from_json(value));
  return std::make_tuple(with(std::move(res.first)), res.second);
}

std::tuple<PyMap, bool> PyMap::set_if_present(const std::string& key, const std::string& value) const {
  auto res = my_map.set_if_present(key_from_json(key), value_from_json(value));
  return std::make_tuple(with(std::move(res.first)), res.second);
}

std::tuple<PyMap, bool> PyMap::remove(const std::string& key) const {
  auto res = my_map.remove(key_from_json(key));
  return std::make_tuple(with(std::move(res.first)), res.second);
}

std::optional<std::tuple<std::string, std::string>> PyMap::first() const {
  return entry(my_map.first());
}

std::optional<std::tuple<std::string, std::string>> PyMap::last() const {
  return entry(my_map.last());
}

std::optional<std::tuple<std::string, std::string>> PyMap::next(const std::string& key) const {
  return entry(my_map.next(key_from_json(key)));
}

std::optional<std::tuple<std::string, std::string>> PyMap::prev(const std::string& key) const {
  return entry(my_map.prev(key_from_json(key)));
}

std::optional<std::tuple<std::string, std::string>> PyMap::next_or_equal(const std::string& key) const {
  return entry(my_map.next_or_equal(key_from_json(key)));
}

std::optional<std::tuple<std::string, std::string>> PyMap::prev_or_equal(const std::string& key) const {
  return entry(my_map.prev_or_equal(key_from_json(key)));
}

std::size_t PyMap::size() const {
  return my_map.size();
}

bool PyMap::is_empty() const {
  return my_map.is_empty();
}

PyCell PyMap::get_pycell() const {
  return PyCell(my_map.dict().get_root_cell());
}

std::string PyMap::to_json() const {
  tolk::FieldType map_type = tolk::FieldType::map(my_map.key_type(), my_map.value_type());
  return tolk::field_to_json(*codec_, my_map.to_value(), map_type).dump();
}

PyCodec::PyCodec(const PyRegistry& registry) : registry_(registry.my_registry) {
  // lazy values and views may outlive this object, the codec keeps the registry
  auto owner = registry_;
  codec_ = std::shared_ptr<const tolk::Codec>(new tolk::Codec(*owner),
                                              [owner](const tolk::Codec* codec) { delete codec; });
}

PyCell PyCodec::encode(const std::string& type_name, const std::string& value, bool skip_bits_n_validation) const {
  const tolk::TypeLayout& layout = registry_->layout_of(type_name);
  auto r_value = tolk::value_from_json(*codec_, parse_or_throw(value), layout);
  if (r_value.is_error()) {
    throw std::invalid_argument(r_value.error().message().str());
  }
  tolk::PackOptions options;
  options.skip_bits_n_validation = skip_bits_n_validation;
  return PyCell(codec_->encode(r_value.ok(), layout, options));
}

std::string PyCodec::decode(const PyCell& cell, const std::string& type_name, bool assert_end_after_reading,
                            int throw_if_opcode_does_not_match) const {
  const tolk::TypeLayout& layout = registry_->layout_of(type_name);
  auto value = codec_->decode_eager(checked(cell), layout,
                                    unpack_options(assert_end_after_reading, throw_if_opcode_does_not_match));
  return tolk::value_to_json(*codec_, value, layout).dump();
}

PyLazyValue PyCodec::decode_lazy(const PyCell& cell, const std::string& type_name, bool assert_end_after_reading,
                                 int throw_if_opcode_does_not_match) const {
  return PyLazyValue(codec_, codec_->decode_lazy(checked(cell), type_name,
                                                 unpack_options(assert_end_after_reading,
                                                                throw_if_opcode_does_not_match)));
}

PyUnionView PyCodec::open_lazy_union(const PyCell& cell, const std::string& type_name, bool assert_end_after_reading,
                                     int throw_if_opcode_does_not_match) const {
  auto view = std::make_shared<tolk::UnionView>(
      tolk::open_lazy_union(*codec_, checked(cell), registry_->layout_of(type_name),
                            unpack_options(assert_end_after_reading, throw_if_opcode_does_not_match)));
  return PyUnionView(codec_, std::move(view));
}

py::object PyCodec::match(const PyCell& cell, const std::string& type_name, const py::dict& arms,
                          const std::optional<py::function>& otherwise) const {
  PyUnionView view = open_lazy_union(cell, type_name);
  tolk::MatchTable<py::object> table{view.get_view()->get_union_layout()};
  for (const auto& arm : arms) {
    auto f = arm.second.cast<py::function>();
    table.on(arm.first.cast<std::string>(), [view, f](tolk::UnionView&) -> py::object { return f(view); });
  }
  if (otherwise) {
    auto f = *otherwise;
    table.otherwise([view, f](tolk::UnionView&) -> py::object { return f(view); });
  }
  return table(*view.get_view());
}

PyMap PyCodec::new_map(const std::string& key_type, const std::string& value_type,
                       const std::optional<PyCell>& root) const {
  tolk::Dictionary dict;
  if (root && !root->is_null()) {
    tolk::FieldType resolved = registry_->resolve_type(tolk::parse_field_type(key_type));
    dict = tolk::Dictionary{root->my_cell, resolved.width};
  }
  return PyMap(codec_, tolk::Map(*codec_, tolk::parse_field_type(key_type), tolk::parse_field_type(value_type),
                                 std::move(dict)));
}
