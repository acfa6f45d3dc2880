// Copyright 2023 Disintar LLP / andrey@head-labs.com

#include <pybind11/pybind11.h>
#include <sstream>
#include <string>
#include "tolk/cells/boc.h"
#include "tolk/codec/Value.h"
#include "PyCellSlice.h"

namespace {

void ensure_bits(const tolk::CellSlice& cs, unsigned n) {
  if (!cs.have(n)) {
    throw std::invalid_argument("Not enough bits in cell slice");
  }
}

void ensure_refs(const tolk::CellSlice& cs, unsigned n) {
  if (!cs.have_refs(n)) {
    throw std::invalid_argument("Not enough refs in cell slice");
  }
}

void ensure_int_width(unsigned n) {
  if (n > 64) {
    throw std::invalid_argument("Integers wider than 64 bits are not supported");
  }
}

}  // namespace

unsigned PyCellSlice::bits() const {
  return my_cell_slice.size();
}

unsigned PyCellSlice::refs() const {
  return my_cell_slice.size_refs();
}

std::string PyCellSlice::toString() const {
  std::stringstream os;
  os << "<CellSlice [" << my_cell_slice.size() << "] bits, [" << my_cell_slice.size_refs() << "] refs>";
  return os.str();
}

std::string PyCellSlice::dump() const {
  std::stringstream os;
  my_cell_slice.print_rec(os);
  return os.str();
}

std::string PyCellSlice::to_boc() const {
  return tolk::boc_to_base64(my_cell_slice.to_cell());
}

std::string PyCellSlice::to_bitstring() const {
  return my_cell_slice.to_binary();
}

PyCellSlice PyCellSlice::copy() const {
  return PyCellSlice(my_cell_slice);
}

unsigned long long PyCellSlice::load_uint(unsigned n) {
  ensure_int_width(n);
  ensure_bits(my_cell_slice, n);
  return my_cell_slice.fetch_ulong(n);
}

unsigned long long PyCellSlice::preload_uint(unsigned n) const {
  ensure_int_width(n);
  ensure_bits(my_cell_slice, n);
  return my_cell_slice.prefetch_ulong(n);
}

long long PyCellSlice::load_int(unsigned n) {
  ensure_int_width(n);
  ensure_bits(my_cell_slice, n);
  return my_cell_slice.fetch_long(n);
}

long long PyCellSlice::preload_int(unsigned n) const {
  ensure_int_width(n);
  ensure_bits(my_cell_slice, n);
  return my_cell_slice.prefetch_long(n);
}

bool PyCellSlice::load_bool() {
  ensure_bits(my_cell_slice, 1);
  return my_cell_slice.fetch_bool();
}

unsigned long long PyCellSlice::load_var_uint(unsigned len_bits) {
  return my_cell_slice.fetch_var_uint(len_bits);
}

long long PyCellSlice::load_var_int(unsigned len_bits) {
  return my_cell_slice.fetch_var_int(len_bits);
}

std::string PyCellSlice::load_bitstring(unsigned n) {
  ensure_bits(my_cell_slice, n);
  return my_cell_slice.fetch_bits(n).to_binary();
}

std::string PyCellSlice::preload_bitstring(unsigned n) const {
  ensure_bits(my_cell_slice, n);
  return my_cell_slice.prefetch_bits(n).to_binary();
}

std::string PyCellSlice::load_address() {
  ensure_bits(my_cell_slice, 3 + 8 + 256);
  if (!my_cell_slice.begins_with_skip(3, 4)) {
    throw std::invalid_argument("Not an internal address");
  }
  tolk::Address addr;
  addr.workchain = (int)my_cell_slice.fetch_long(8);
  addr.hash = my_cell_slice.fetch_bits(256);
  return addr.to_string();
}

PyCell PyCellSlice::load_ref() {
  ensure_refs(my_cell_slice, 1);
  return PyCell(my_cell_slice.fetch_ref());
}

PyCell PyCellSlice::preload_ref(unsigned offset) const {
  ensure_refs(my_cell_slice, offset + 1);
  return PyCell(my_cell_slice.prefetch_ref(offset));
}

PyCellSlice PyCellSlice::load_subslice(unsigned bits, unsigned refs) {
  ensure_bits(my_cell_slice, bits);
  ensure_refs(my_cell_slice, refs);
  return PyCellSlice(my_cell_slice.fetch_subslice(bits, refs));
}

PyCellSlice* PyCellSlice::skip_bits(unsigned bits) {
  ensure_bits(my_cell_slice, bits);
  my_cell_slice.skip(bits);
  return this;
}

PyCellSlice* PyCellSlice::skip_refs(unsigned refs) {
  ensure_refs(my_cell_slice, refs);
  my_cell_slice.skip(0, refs);
  return this;
}

bool PyCellSlice::begins_with(unsigned bits, unsigned long long value) const {
  return my_cell_slice.begins_with(bits, value);
}

bool PyCellSlice::begins_with_bitstring(const std::string& bits) const {
  return my_cell_slice.begins_with(tolk::BitString::parse(bits));
}

int PyCellSlice::bit_at(unsigned i) const {
  ensure_bits(my_cell_slice, i + 1);
  return my_cell_slice.bit_at(i);
}

bool PyCellSlice::empty_ext() const {
  return my_cell_slice.empty_ext();
}
