// Copyright 2023 Disintar LLP / andrey@head-labs.com

#include <pybind11/pybind11.h>
#include <sstream>
#include <string>
#include "tolk/cells/boc.h"
#include "PyDict.h"

namespace {

tolk::Dictionary::SetMode get_mode(const std::string& s) {
  if (s == "add") {
    return tolk::Dictionary::SetMode::Add;
  } else if (s == "replace") {
    return tolk::Dictionary::SetMode::Replace;
  } else {
    return tolk::Dictionary::SetMode::Set;
  }
}

}  // namespace

PyDict::PyDict(unsigned key_len_, bool sgnd_, const std::optional<PyCell>& root)
    : my_dict(key_len_), key_len(key_len_), sgnd(sgnd_) {
  if (root && !root->is_null()) {
    my_dict = tolk::Dictionary{root->my_cell, key_len};
  }
}

tolk::BitString PyDict::parse_key(const std::string& key) const {
  if (key_len > 64) {
    auto bits = tolk::BitString::parse(key);
    if (bits.size() != key_len) {
      throw std::invalid_argument("Key must have " + std::to_string(key_len) + " bits");
    }
    return bits;
  }
  std::size_t used = 0;
  tolk::CellBuilder cb;
  bool ok = sgnd ? cb.store_long_rchk_bool(std::stoll(key, &used), key_len)
                 : cb.store_ulong_rchk_bool(std::stoull(key, &used), key_len);
  if (!ok || used != key.size()) {
    throw std::invalid_argument("Key " + key + " does not fit into " + (sgnd ? "int" : "uint") +
                                std::to_string(key_len));
  }
  return tolk::BitString{cb.get_data(), 0, key_len};
}

std::string PyDict::key_to_string(const tolk::BitString& key) const {
  if (key_len > 64) {
    return "0b" + key.to_binary();
  }
  return sgnd ? std::to_string(key.to_long()) : std::to_string(key.to_ulong());
}

std::tuple<std::string, PyCellSlice> PyDict::entry(const tolk::Dictionary::Entry& e) const {
  return std::make_tuple(key_to_string(e.first), PyCellSlice(e.second));
}

PyDict* PyDict::set(const std::string& key, const PyCellSlice& value, const std::string& mode) {
  my_dict = my_dict.set(parse_key(key), value.my_cell_slice, get_mode(mode));
  return this;
}

PyDict* PyDict::set_ref(const std::string& key, const PyCell& value, const std::string& mode) {
  if (value.is_null()) {
    throw std::invalid_argument("Cell is null");
  }
  my_dict = my_dict.set_ref(parse_key(key), value.my_cell, get_mode(mode));
  return this;
}

PyDict* PyDict::set_builder(const std::string& key, const PyCellBuilder& value, const std::string& mode) {
  my_dict = my_dict.set_builder(parse_key(key), value.my_builder, get_mode(mode));
  return this;
}

std::optional<PyCellSlice> PyDict::lookup(const std::string& key) const {
  auto value = my_dict.lookup(parse_key(key));
  if (!value) {
    return {};
  }
  return PyCellSlice(std::move(*value));
}

std::optional<PyCellSlice> PyDict::lookup_delete(const std::string& key) {
  std::optional<tolk::CellSlice> old;
  my_dict = my_dict.lookup_delete(parse_key(key), &old);
  if (!old) {
    return {};
  }
  return PyCellSlice(std::move(*old));
}

std::optional<std::tuple<std::string, PyCellSlice>> PyDict::get_minmax_key(bool fetch_max) const {
  auto found = my_dict.get_minmax_key(fetch_max, sgnd);
  if (!found) {
    return {};
  }
  return entry(*found);
}

std::optional<std::tuple<std::string, PyCellSlice>> PyDict::lookup_nearest_key(const std::string& key,
                                                                               bool fetch_next, bool allow_eq) const {
  auto found = my_dict.lookup_nearest_key(parse_key(key), fetch_next, allow_eq, sgnd);
  if (!found) {
    return {};
  }
  return entry(*found);
}

void PyDict::map(const py::function& f) const {
  my_dict.for_each(
      [&](const tolk::BitString& key, const tolk::CellSlice& value) { f(key_to_string(key), PyCellSlice(value)); },
      sgnd);
}

std::size_t PyDict::size() const {
  return my_dict.size();
}

bool PyDict::is_empty() const {
  return my_dict.is_empty();
}

PyCell PyDict::get_pycell() const {
  return PyCell(my_dict.get_root_cell());
}

std::string PyDict::to_boc() const {
  if (my_dict.is_empty()) {
    throw std::invalid_argument("Dictionary is empty");
  }
  return tolk::boc_to_base64(my_dict.get_root_cell());
}

std::string PyDict::toString() const {
  std::stringstream os;
  os << "<Dictionary [" << key_len << "] key bits, [" << (my_dict.is_empty() ? 0 : my_dict.size()) << "] items>";
  return os.str();
}

std::string PyDict::dump() const {
  std::stringstream os;
  my_dict.show(os);
  return os.str();
}
