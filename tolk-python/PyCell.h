// Copyright 2023 Disintar LLP / andrey@head-labs.com

#include <pybind11/pybind11.h>
#include <stdexcept>
#include <string>
#include "tolk/cells/Cell.h"

namespace py = pybind11;

#ifndef TOLK_PYCELL_H
#define TOLK_PYCELL_H

class PyCell {
 public:
  tolk::Ref<tolk::Cell> my_cell;

  // constructor
  explicit PyCell(tolk::Ref<tolk::Cell> cell) : my_cell(std::move(cell)) {
  }

  explicit PyCell() = default;
  ~PyCell() = default;
  std::string get_hash() const;
  int get_depth() const;
  unsigned bits() const;
  unsigned refs() const;
  std::string toString() const;
  std::string dump() const;
  std::string to_boc() const;
  PyCell copy() const;
  bool is_null() const;
  bool equals(const PyCell& other) const;

  static void dummy_set() {
    throw std::invalid_argument("Not settable");
  }
};

PyCell parse_string_to_cell(const std::string& base64string);

#endif  //TOLK_PYCELL_H
