// Copyright 2023 Disintar LLP / andrey@head-labs.com

#include <pybind11/pybind11.h>
#include <string>
#include "tolk/cells/CellSlice.h"
#include "PyCell.h"

namespace py = pybind11;

#ifndef TOLK_PYCELLSLICE_H
#define TOLK_PYCELLSLICE_H

class PyCellSlice {
 public:
  tolk::CellSlice my_cell_slice;

  // constructor
  explicit PyCellSlice(tolk::Ref<tolk::Cell> cell) : my_cell_slice(std::move(cell)) {
  }
  explicit PyCellSlice(tolk::CellSlice cs) : my_cell_slice(std::move(cs)) {
  }

  explicit PyCellSlice() = default;
  ~PyCellSlice() = default;

  unsigned bits() const;
  unsigned refs() const;
  std::string toString() const;
  std::string dump() const;
  std::string to_boc() const;
  std::string to_bitstring() const;
  PyCellSlice copy() const;

  unsigned long long load_uint(unsigned n);
  unsigned long long preload_uint(unsigned n) const;
  long long load_int(unsigned n);
  long long preload_int(unsigned n) const;
  bool load_bool();
  unsigned long long load_var_uint(unsigned len_bits);
  long long load_var_int(unsigned len_bits);
  std::string load_bitstring(unsigned n);
  std::string preload_bitstring(unsigned n) const;
  std::string load_address();
  PyCell load_ref();
  PyCell preload_ref(unsigned offset = 0) const;
  PyCellSlice load_subslice(unsigned bits, unsigned refs = 0);
  PyCellSlice* skip_bits(unsigned bits);
  PyCellSlice* skip_refs(unsigned refs);
  bool begins_with(unsigned bits, unsigned long long value) const;
  bool begins_with_bitstring(const std::string& bits) const;
  int bit_at(unsigned i) const;
  bool empty_ext() const;

  static void dummy_set() {
    throw std::invalid_argument("Not settable");
  }
};

#endif  //TOLK_PYCELLSLICE_H
