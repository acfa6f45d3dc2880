// Copyright 2023 Disintar LLP / andrey@head-labs.com

#include <pybind11/pybind11.h>
#include <optional>
#include <string>
#include <tuple>
#include "tolk/dict/Dictionary.h"
#include "PyCell.h"
#include "PyCellBuilder.h"
#include "PyCellSlice.h"

namespace py = pybind11;

#ifndef TOLK_PYDICT_H
#define TOLK_PYDICT_H

// Keys are decimal strings for key_len <= 64, bit string literals ("0b..", "x{..}") otherwise.
// The wrapped Dictionary is persistent; modifying calls rebind my_dict and return this.
class PyDict {
 public:
  tolk::Dictionary my_dict;
  unsigned key_len;
  bool sgnd;

  explicit PyDict(unsigned key_len_, bool sgnd_ = false, const std::optional<PyCell>& root = {});
  ~PyDict() = default;

  PyDict* set(const std::string& key, const PyCellSlice& value, const std::string& mode = "set");
  PyDict* set_ref(const std::string& key, const PyCell& value, const std::string& mode = "set");
  PyDict* set_builder(const std::string& key, const PyCellBuilder& value, const std::string& mode = "set");
  std::optional<PyCellSlice> lookup(const std::string& key) const;
  std::optional<PyCellSlice> lookup_delete(const std::string& key);
  std::optional<std::tuple<std::string, PyCellSlice>> get_minmax_key(bool fetch_max = false) const;
  std::optional<std::tuple<std::string, PyCellSlice>> lookup_nearest_key(const std::string& key, bool fetch_next = true,
                                                                         bool allow_eq = false) const;
  void map(const py::function& f) const;
  std::size_t size() const;
  bool is_empty() const;
  PyCell get_pycell() const;
  std::string to_boc() const;
  std::string toString() const;
  std::string dump() const;

 private:
  tolk::BitString parse_key(const std::string& key) const;
  std::string key_to_string(const tolk::BitString& key) const;
  std::tuple<std::string, PyCellSlice> entry(const tolk::Dictionary::Entry& e) const;
};

#endif  //TOLK_PYDICT_H
