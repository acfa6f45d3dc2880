// Copyright 2023 Disintar LLP / andrey@head-labs.com

#include <pybind11/pybind11.h>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include "tolk/codec/Codec.h"
#include "tolk/codec/LazyValue.h"
#include "tolk/dict/Map.h"
#include "tolk/dispatch/UnionView.h"
#include "PyCell.h"

namespace py = pybind11;

#ifndef TOLK_PYCODEC_H
#define TOLK_PYCODEC_H

// Values cross the boundary as JSON text in the form of tolk/schema/json-utils.h.

class PyRegistry {
 public:
  std::shared_ptr<tolk::LayoutRegistry> my_registry;

  explicit PyRegistry(unsigned max_bits = 1023, unsigned max_refs = 4);
  static PyRegistry from_schema(const std::string& schema);

  void load_schema(const std::string& schema);
  std::string to_schema() const;
  void register_record(const std::string& name, const std::vector<std::pair<std::string, std::string>>& fields,
                       const std::optional<std::string>& opcode);
  void register_union(const std::string& name,
                      const std::vector<std::tuple<std::string, std::optional<std::string>>>& variants,
                      const std::string& on_unmatched, int exit_code);
  void register_enum(const std::string& name, unsigned bits, bool is_signed,
                     const std::vector<std::pair<std::string, long long>>& members);
  std::string layout_of(const std::string& name) const;
  bool contains(const std::string& name) const;
  std::vector<std::string> type_names() const;

 private:
  explicit PyRegistry(std::shared_ptr<tolk::LayoutRegistry> registry) : my_registry(std::move(registry)) {
  }
};

class PyLazyValue {
 public:
  PyLazyValue(std::shared_ptr<const tolk::Codec> codec, tolk::LazyValue value)
      : codec_(std::move(codec)), my_value(std::move(value)) {
  }

  std::string type_name() const;
  std::string get(const std::string& field);
  bool is_cached(const std::string& field) const;
  std::string to_json();
  PyCell rest();

 private:
  std::shared_ptr<const tolk::Codec> codec_;
  tolk::LazyValue my_value;
};

class PyUnionView {
 public:
  PyUnionView(std::shared_ptr<const tolk::Codec> codec, std::shared_ptr<tolk::UnionView> view)
      : codec_(std::move(codec)), my_view(std::move(view)) {
  }

  std::string state() const;
  void open();
  void close();
  // None when no variant matched
  std::optional<std::string> variant() const;
  unsigned discriminant_depth() const;
  std::string get(const std::string& field);
  std::string to_json();
  PyCell raw() const;

  const std::shared_ptr<tolk::UnionView>& get_view() const {
    return my_view;
  }

 private:
  std::shared_ptr<const tolk::Codec> codec_;
  std::shared_ptr<tolk::UnionView> my_view;
};

// map<K, V> with keys and values as JSON text; every modification returns a new PyMap
class PyMap {
 public:
  PyMap(std::shared_ptr<const tolk::Codec> codec, tolk::Map map) : codec_(std::move(codec)), my_map(std::move(map)) {
  }

  std::optional<std::string> get(const std::string& key) const;
  PyMap set(const std::string& key, const std::string& value) const;
  std::tuple<PyMap, bool> set_if_absent(const std::string& key, const std::string& value) const;
  std::tuple<PyMap, bool> set_if_present(const std::string& key, const std::string& value) const;
  std::tuple<PyMap, bool> remove(const std::string& key) const;
  std::optional<std::tuple<std::string, std::string>> first() const;
  std::optional<std::tuple<std::string, std::string>> last() const;
  std::optional<std::tuple<std::string, std::string>> next(const std::string& key) const;
  std::optional<std::tuple<std::string, std::string>> prev(const std::string& key) const;
  std::optional<std::tuple<std::string, std::string>> next_or_equal(const std::string& key) const;
  std::optional<std::tuple<std::string, std::string>> prev_or_equal(const std::string& key) const;
  std::size_t size() const;
  bool is_empty() const;
  PyCell get_pycell() const;
  std::string to_json() const;

 private:
  std::shared_ptr<const tolk::Codec> codec_;
  tolk::Map my_map;

  tolk::Value key_from_json(const std::string& key) const;
  tolk::Value value_from_json(const std::string& value) const;
  std::optional<std::tuple<std::string, std::string>> entry(const tolk::MapEntry& e) const;
  PyMap with(tolk::Map map) const {
    return PyMap(codec_, std::move(map));
  }
};

class PyCodec {
 public:
  explicit PyCodec(const PyRegistry& registry);

  PyCell encode(const std::string& type_name, const std::string& value, bool skip_bits_n_validation = false) const;
  std::string decode(const PyCell& cell, const std::string& type_name, bool assert_end_after_reading = false,
                     int throw_if_opcode_does_not_match = 63) const;
  PyLazyValue decode_lazy(const PyCell& cell, const std::string& type_name, bool assert_end_after_reading = false,
                          int throw_if_opcode_does_not_match = 63) const;
  PyUnionView open_lazy_union(const PyCell& cell, const std::string& type_name, bool assert_end_after_reading = false,
                              int throw_if_opcode_does_not_match = 63) const;
  // arms maps variant names to callables taking a PyUnionView; the view is closed after the call
  py::object match(const PyCell& cell, const std::string& type_name, const py::dict& arms,
                   const std::optional<py::function>& otherwise) const;
  PyMap new_map(const std::string& key_type, const std::string& value_type, const std::optional<PyCell>& root) const;

 private:
  std::shared_ptr<tolk::LayoutRegistry> registry_;
  std::shared_ptr<const tolk::Codec> codec_;
};

#endif  //TOLK_PYCODEC_H
