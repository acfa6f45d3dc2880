// Copyright 2023 Disintar LLP / andrey@head-labs.com

#include <pybind11/pybind11.h>
#include <sstream>
#include <string>
#include "tolk/cells/boc.h"
#include "tolk/codec/Value.h"
#include "PyCellBuilder.h"

PyCellBuilder* PyCellBuilder::store_uint(unsigned long long value, unsigned bits) {
  if (!my_builder.store_ulong_rchk_bool(value, bits)) {
    throw std::invalid_argument("Value " + std::to_string(value) + " does not fit into uint" + std::to_string(bits) +
                                " or the builder is full");
  }
  return this;
}

PyCellBuilder* PyCellBuilder::store_int(long long value, unsigned bits) {
  if (!my_builder.store_long_rchk_bool(value, bits)) {
    throw std::invalid_argument("Value " + std::to_string(value) + " does not fit into int" + std::to_string(bits) +
                                " or the builder is full");
  }
  return this;
}

PyCellBuilder* PyCellBuilder::store_bool(bool value) {
  my_builder.store_bool(value);
  return this;
}

PyCellBuilder* PyCellBuilder::store_var_uint(unsigned long long value, unsigned len_bits) {
  if (!my_builder.store_var_uint_bool(value, len_bits)) {
    throw std::invalid_argument("Can't store var_uint " + std::to_string(value));
  }
  return this;
}

PyCellBuilder* PyCellBuilder::store_var_int(long long value, unsigned len_bits) {
  if (!my_builder.store_var_int_bool(value, len_bits)) {
    throw std::invalid_argument("Can't store var_int " + std::to_string(value));
  }
  return this;
}

PyCellBuilder* PyCellBuilder::store_coins(unsigned long long value) {
  return store_var_uint(value, 4);
}

PyCellBuilder* PyCellBuilder::store_zeroes(unsigned bits) {
  my_builder.store_zeroes(bits);
  return this;
}

PyCellBuilder* PyCellBuilder::store_ones(unsigned bits) {
  my_builder.store_ones(bits);
  return this;
}

PyCellBuilder* PyCellBuilder::store_bitstring(const std::string& bits) {
  my_builder.store_bits(tolk::BitString::parse(bits));
  return this;
}

PyCellBuilder* PyCellBuilder::store_address(const std::string& addr) {
  auto parsed = tolk::Address::parse(addr);
  if (!my_builder.can_extend_by(3 + 8 + 256)) {
    throw tolk::CellBuilder::CellWriteError{};
  }
  my_builder.store_ulong(4, 3).store_long(parsed.workchain, 8).store_bits(parsed.hash);
  return this;
}

PyCellBuilder* PyCellBuilder::store_ref(const PyCell& cell) {
  if (cell.is_null()) {
    throw std::invalid_argument("Cell is null");
  }
  my_builder.store_ref(cell.my_cell);
  return this;
}

PyCellBuilder* PyCellBuilder::store_slice(const PyCellSlice& cs) {
  my_builder.append_cellslice(cs.my_cell_slice);
  return this;
}

PyCellBuilder* PyCellBuilder::store_builder(const PyCellBuilder& cb) {
  my_builder.append_builder(cb.my_builder);
  return this;
}

unsigned PyCellBuilder::bits() const {
  return my_builder.size();
}

unsigned PyCellBuilder::refs() const {
  return my_builder.size_refs();
}

unsigned PyCellBuilder::remaining_bits() const {
  return my_builder.remaining_bits();
}

unsigned PyCellBuilder::remaining_refs() const {
  return my_builder.remaining_refs();
}

PyCell PyCellBuilder::get_cell() const {
  return PyCell(my_builder.finalize_copy());
}

std::string PyCellBuilder::dump() const {
  std::stringstream os;
  my_builder.dump(os);
  return os.str();
}

std::string PyCellBuilder::toString() const {
  std::stringstream os;
  os << "<CellBuilder [" << my_builder.size() << "] bits, [" << my_builder.size_refs() << "] refs>";
  return os.str();
}

std::string PyCellBuilder::to_boc() const {
  return tolk::boc_to_base64(my_builder.finalize_copy());
}
