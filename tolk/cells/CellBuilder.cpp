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
#include "tolk/cells/CellBuilder.h"
#include <algorithm>
#include <ostream>
#include "tolk/cells/CellSlice.h"

namespace tolk {

namespace {

unsigned bit_length(unsigned long long x) {
  unsigned res = 0;
  while (x) {
    ++res;
    x >>= 1;
  }
  return res;
}

}  // namespace

CellBuilder::CellBuilder(CellLimits limits) : limits_(limits), data_((limits.max_bits + 7) / 8, 0) {
}

unsigned CellBuilder::var_uint_byte_len(unsigned long long value) {
  return (bit_length(value) + 7) >> 3;
}

unsigned CellBuilder::var_int_byte_len(long long value) {
  if (!value) {
    return 0;
  }
  unsigned bits = value >= 0 ? bit_length((unsigned long long)value) + 1 : bit_length(~(unsigned long long)value) + 1;
  return (bits + 7) >> 3;
}

bool CellBuilder::store_ulong_bool(unsigned long long value, unsigned bits) {
  if (!can_extend_by(bits)) {
    return false;
  }
  bitstring::bits_store_ulong(data_.data(), bits_, value, bits);
  bits_ += bits;
  return true;
}

bool CellBuilder::store_long_bool(long long value, unsigned bits) {
  if (!can_extend_by(bits)) {
    return false;
  }
  for (unsigned i = 0; i < bits; i++) {
    unsigned shift = bits - 1 - i;
    bitstring::set_bit(data_.data(), bits_ + i, shift < 64 ? (int)((value >> shift) & 1) : (value < 0));
  }
  bits_ += bits;
  return true;
}

bool CellBuilder::store_ulong_rchk_bool(unsigned long long value, unsigned bits) {
  if (bits < 64 && (value >> bits) != 0) {
    return false;
  }
  return store_ulong_bool(value, bits);
}

bool CellBuilder::store_long_rchk_bool(long long value, unsigned bits) {
  if (!bits) {
    return !value && store_ulong_bool(0, 0);
  }
  if (bits < 64) {
    long long bound = 1LL << (bits - 1);
    if (value < -bound || value >= bound) {
      return false;
    }
  }
  return store_long_bool(value, bits);
}

bool CellBuilder::store_zeroes_bool(unsigned bits) {
  if (!can_extend_by(bits)) {
    return false;
  }
  bitstring::bits_memset(data_.data(), bits_, false, bits);
  bits_ += bits;
  return true;
}

bool CellBuilder::store_ones_bool(unsigned bits) {
  if (!can_extend_by(bits)) {
    return false;
  }
  bitstring::bits_memset(data_.data(), bits_, true, bits);
  bits_ += bits;
  return true;
}

bool CellBuilder::store_bits_bool(const unsigned char* data, unsigned offs, unsigned bits) {
  if (!can_extend_by(bits)) {
    return false;
  }
  bitstring::bits_memcpy(data_.data(), bits_, data, offs, bits);
  bits_ += bits;
  return true;
}

bool CellBuilder::store_ref_bool(Ref<Cell> cell) {
  if (!cell || !can_extend_by(0, 1)) {
    return false;
  }
  refs_.push_back(std::move(cell));
  return true;
}

bool CellBuilder::append_cellslice_bool(const CellSlice& cs) {
  if (!can_extend_by(cs.size(), cs.size_refs())) {
    return false;
  }
  if (cs.size()) {
    store_bits_bool(cs.data(), cs.cur_pos(), cs.size());
  }
  for (unsigned i = 0; i < cs.size_refs(); i++) {
    refs_.push_back(cs.prefetch_ref(i));
  }
  return true;
}

bool CellBuilder::append_builder_bool(const CellBuilder& cb) {
  if (!can_extend_by(cb.size(), cb.size_refs())) {
    return false;
  }
  store_bits_bool(cb.data_.data(), 0, cb.size());
  refs_.insert(refs_.end(), cb.refs_.begin(), cb.refs_.end());
  return true;
}

bool CellBuilder::store_var_uint_bool(unsigned long long value, unsigned len_bits) {
  unsigned len = var_uint_byte_len(value);
  if (len_bits < 32 && len >= (1u << len_bits)) {
    return false;
  }
  if (!can_extend_by(len_bits + len * 8)) {
    return false;
  }
  return store_ulong_bool(len, len_bits) && store_ulong_bool(value, len * 8);
}

bool CellBuilder::store_var_int_bool(long long value, unsigned len_bits) {
  unsigned len = var_int_byte_len(value);
  if (len_bits < 32 && len >= (1u << len_bits)) {
    return false;
  }
  if (!can_extend_by(len_bits + len * 8)) {
    return false;
  }
  return store_ulong_bool(len, len_bits) && store_long_bool(value, len * 8);
}

CellBuilder& CellBuilder::store_ulong(unsigned long long value, unsigned bits) {
  if (!store_ulong_bool(value, bits)) {
    throw CellWriteError{};
  }
  return *this;
}

CellBuilder& CellBuilder::store_long(long long value, unsigned bits) {
  if (!store_long_bool(value, bits)) {
    throw CellWriteError{};
  }
  return *this;
}

CellBuilder& CellBuilder::store_bool(bool value) {
  if (!store_bool_bool(value)) {
    throw CellWriteError{};
  }
  return *this;
}

CellBuilder& CellBuilder::store_zeroes(unsigned bits) {
  if (!store_zeroes_bool(bits)) {
    throw CellWriteError{};
  }
  return *this;
}

CellBuilder& CellBuilder::store_ones(unsigned bits) {
  if (!store_ones_bool(bits)) {
    throw CellWriteError{};
  }
  return *this;
}

CellBuilder& CellBuilder::store_bits(const BitString& bs) {
  if (!store_bits_bool(bs)) {
    throw CellWriteError{};
  }
  return *this;
}

CellBuilder& CellBuilder::store_ref(Ref<Cell> cell) {
  if (!store_ref_bool(std::move(cell))) {
    throw CellWriteError{};
  }
  return *this;
}

CellBuilder& CellBuilder::append_cellslice(const CellSlice& cs) {
  if (!append_cellslice_bool(cs)) {
    throw CellWriteError{};
  }
  return *this;
}

CellBuilder& CellBuilder::append_builder(const CellBuilder& cb) {
  if (!append_builder_bool(cb)) {
    throw CellWriteError{};
  }
  return *this;
}

Ref<Cell> CellBuilder::finalize() {
  auto cell = Cell::create(data_.data(), bits_, std::move(refs_));
  bits_ = 0;
  refs_.clear();
  std::fill(data_.begin(), data_.end(), 0);
  return cell;
}

Ref<Cell> CellBuilder::finalize_copy() const {
  return Cell::create(data_.data(), bits_, refs_);
}

void CellBuilder::dump(std::ostream& os) const {
  os << "x{" << bitstring::bits_to_hex(data_.data(), 0, bits_) << "}";
  if (!refs_.empty()) {
    os << " +" << refs_.size() << "R";
  }
  os << std::endl;
}

}  // namespace tolk
