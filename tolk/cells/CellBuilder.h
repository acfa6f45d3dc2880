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
#pragma once
#include <iosfwd>
#include <vector>
#include "tolk/cells/Cell.h"

namespace tolk {

class CellSlice;

// Mutable accumulator of bits and refs; finalize() produces an immutable Cell.
// Every store_*_bool() leaves the builder untouched and returns false when the value does not fit,
// the throwing counterparts raise CellWriteError instead.
class CellBuilder {
 public:
  struct CellWriteError {};

  explicit CellBuilder(CellLimits limits = CellLimits::canonical());

  unsigned size() const {
    return bits_;
  }
  unsigned size_refs() const {
    return (unsigned)refs_.size();
  }
  unsigned remaining_bits() const {
    return limits_.max_bits - bits_;
  }
  unsigned remaining_refs() const {
    return limits_.max_refs - size_refs();
  }
  const CellLimits& limits() const {
    return limits_;
  }
  const unsigned char* get_data() const {
    return data_.data();
  }
  bool can_extend_by(unsigned bits, unsigned refs = 0) const {
    return bits <= remaining_bits() && refs <= remaining_refs();
  }

  bool store_ulong_bool(unsigned long long value, unsigned bits);
  bool store_long_bool(long long value, unsigned bits);
  // range-checked versions: the value must fit into `bits` as unsigned/signed integer
  bool store_ulong_rchk_bool(unsigned long long value, unsigned bits);
  bool store_long_rchk_bool(long long value, unsigned bits);
  bool store_bool_bool(bool value) {
    return store_ulong_bool(value ? 1 : 0, 1);
  }
  bool store_zeroes_bool(unsigned bits);
  bool store_ones_bool(unsigned bits);
  bool store_bits_bool(const unsigned char* data, unsigned offs, unsigned bits);
  bool store_bits_bool(const BitString& bs) {
    return store_bits_bool(bs.data(), 0, bs.size());
  }
  bool store_ref_bool(Ref<Cell> cell);
  bool append_cellslice_bool(const CellSlice& cs);
  bool append_builder_bool(const CellBuilder& cb);
  // length-prefixed integer: `len_bits` of byte length, then that many bytes
  bool store_var_uint_bool(unsigned long long value, unsigned len_bits);
  bool store_var_int_bool(long long value, unsigned len_bits);

  CellBuilder& store_ulong(unsigned long long value, unsigned bits);
  CellBuilder& store_long(long long value, unsigned bits);
  CellBuilder& store_bool(bool value);
  CellBuilder& store_zeroes(unsigned bits);
  CellBuilder& store_ones(unsigned bits);
  CellBuilder& store_bits(const BitString& bs);
  CellBuilder& store_ref(Ref<Cell> cell);
  CellBuilder& append_cellslice(const CellSlice& cs);
  CellBuilder& append_builder(const CellBuilder& cb);

  // consumes the builder state
  Ref<Cell> finalize();
  Ref<Cell> finalize_copy() const;

  void dump(std::ostream& os) const;

  static unsigned var_uint_byte_len(unsigned long long value);
  static unsigned var_int_byte_len(long long value);

 private:
  CellLimits limits_;
  unsigned bits_{0};
  std::vector<unsigned char> data_;
  std::vector<Ref<Cell>> refs_;
};

}  // namespace tolk
