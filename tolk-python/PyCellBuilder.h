// Copyright 2023 Disintar LLP / andrey@head-labs.com

#include <pybind11/pybind11.h>
#include <string>
#include "tolk/cells/CellBuilder.h"
#include "PyCell.h"
#include "PyCellSlice.h"

namespace py = pybind11;

#ifndef TOLK_PYCELLBUILDER_H
#define TOLK_PYCELLBUILDER_H

class PyCellBuilder {
 public:
  tolk::CellBuilder my_builder;

  explicit PyCellBuilder(unsigned max_bits = 1023, unsigned max_refs = 4)
      : my_builder(tolk::CellLimits{max_bits, max_refs}) {
  }
  ~PyCellBuilder() = default;

  PyCellBuilder* store_uint(unsigned long long value, unsigned bits);
  PyCellBuilder* store_int(long long value, unsigned bits);
  PyCellBuilder* store_bool(bool value);
  PyCellBuilder* store_var_uint(unsigned long long value, unsigned len_bits);
  PyCellBuilder* store_var_int(long long value, unsigned len_bits);
  PyCellBuilder* store_coins(unsigned long long value);
  PyCellBuilder* store_zeroes(unsigned bits);
  PyCellBuilder* store_ones(unsigned bits);
  PyCellBuilder* store_bitstring(const std::string& bits);
  PyCellBuilder* store_address(const std::string& addr);
  PyCellBuilder* store_ref(const PyCell& cell);
  PyCellBuilder* store_slice(const PyCellSlice& cs);
  PyCellBuilder* store_builder(const PyCellBuilder& cb);

  unsigned bits() const;
  unsigned refs() const;
  unsigned remaining_bits() const;
  unsigned remaining_refs() const;
  PyCell get_cell() const;
  std::string dump() const;
  std::string toString() const;
  std::string to_boc() const;

  static void dummy_set() {
    throw std::invalid_argument("Not settable");
  }
};

#endif  //TOLK_PYCELLBUILDER_H
