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
#include "tolk/cells/CellSlice.h"
#include <ostream>
#include "tolk/cells/CellBuilder.h"

namespace tolk {

CellSlice::CellSlice(Ref<Cell> cell) : cell_(std::move(cell)) {
  if (cell_) {
    bits_en_ = cell_->size();
    refs_en_ = cell_->size_refs();
  }
}

CellSlice::CellSlice(const CellSlice& cs, unsigned bits, unsigned refs) : CellSlice(cs) {
  cs.ensure(bits, refs);
  bits_en_ = bits_st_ + bits;
  refs_en_ = refs_st_ + refs;
}

const unsigned char* CellSlice::data() const {
  return cell_ ? cell_->get_data() : nullptr;
}

void CellSlice::ensure(unsigned bits, unsigned refs) const {
  if (!have(bits, refs)) {
    CellReadError err;
    err.missing_bits = bits > size() ? bits - size() : 0;
    err.missing_refs = refs > size_refs() ? refs - size_refs() : 0;
    throw err;
  }
}

int CellSlice::bit_at(unsigned i) const {
  ensure(i + 1);
  return cell_->bit_at(bits_st_ + i);
}

unsigned long long CellSlice::prefetch_ulong(unsigned bits) const {
  if (bits > 64) {
    throw CellReadError{};
  }
  ensure(bits);
  return bits ? bitstring::bits_load_ulong(data(), bits_st_, bits) : 0;
}

unsigned long long CellSlice::fetch_ulong(unsigned bits) {
  auto res = prefetch_ulong(bits);
  bits_st_ += bits;
  return res;
}

long long CellSlice::prefetch_long(unsigned bits) const {
  unsigned long long x = prefetch_ulong(bits);
  if (bits && bits < 64 && (x >> (bits - 1)) & 1) {
    x |= ~0ULL << bits;
  }
  return (long long)x;
}

long long CellSlice::fetch_long(unsigned bits) {
  auto res = prefetch_long(bits);
  bits_st_ += bits;
  return res;
}

bool CellSlice::fetch_bool() {
  return fetch_ulong(1) != 0;
}

BitString CellSlice::prefetch_bits(unsigned bits) const {
  ensure(bits);
  return BitString(data(), bits_st_, bits);
}

BitString CellSlice::fetch_bits(unsigned bits) {
  auto res = prefetch_bits(bits);
  bits_st_ += bits;
  return res;
}

unsigned long long CellSlice::fetch_var_uint(unsigned len_bits) {
  CellSlice save{*this};
  unsigned len = (unsigned)fetch_ulong(len_bits);
  if (len > 8 || !have(len * 8)) {
    CellReadError err{len > 8 ? 0 : len * 8 - size(), 0};
    *this = save;
    throw err;
  }
  return fetch_ulong(len * 8);
}

long long CellSlice::fetch_var_int(unsigned len_bits) {
  CellSlice save{*this};
  unsigned len = (unsigned)fetch_ulong(len_bits);
  if (len > 8 || !have(len * 8)) {
    CellReadError err{len > 8 ? 0 : len * 8 - size(), 0};
    *this = save;
    throw err;
  }
  return fetch_long(len * 8);
}

Ref<Cell> CellSlice::prefetch_ref(unsigned idx) const {
  ensure(0, idx + 1);
  return cell_->get_ref(refs_st_ + idx);
}

Ref<Cell> CellSlice::fetch_ref() {
  auto res = prefetch_ref(0);
  ++refs_st_;
  return res;
}

bool CellSlice::advance(unsigned bits) {
  return advance_ext(bits, 0);
}

bool CellSlice::advance_refs(unsigned refs) {
  return advance_ext(0, refs);
}

bool CellSlice::advance_ext(unsigned bits, unsigned refs) {
  if (!have(bits, refs)) {
    return false;
  }
  bits_st_ += bits;
  refs_st_ += refs;
  return true;
}

void CellSlice::skip(unsigned bits, unsigned refs) {
  ensure(bits, refs);
  bits_st_ += bits;
  refs_st_ += refs;
}

bool CellSlice::begins_with(unsigned bits, unsigned long long value) const {
  return have(bits) && (!bits || bitstring::bits_load_ulong(data(), bits_st_, bits) == value);
}

bool CellSlice::begins_with(const BitString& prefix) const {
  return have(prefix.size()) &&
         (prefix.empty() || !bitstring::bits_memcmp(data(), bits_st_, prefix.data(), 0, prefix.size()));
}

bool CellSlice::begins_with_skip(unsigned bits, unsigned long long value) {
  return begins_with(bits, value) && advance(bits);
}

bool CellSlice::begins_with_skip(const BitString& prefix) {
  return begins_with(prefix) && advance(prefix.size());
}

CellSlice CellSlice::prefetch_subslice(unsigned bits, unsigned refs) const {
  return CellSlice{*this, bits, refs};
}

CellSlice CellSlice::fetch_subslice(unsigned bits, unsigned refs) {
  CellSlice res{*this, bits, refs};
  bits_st_ += bits;
  refs_st_ += refs;
  return res;
}

Ref<Cell> CellSlice::to_cell() const {
  // sized to the window, which never exceeds the cell it was cut from under any limits profile
  CellBuilder cb{CellLimits{size(), size_refs()}};
  cb.append_cellslice(*this);
  return cb.finalize();
}

bool CellSlice::contents_equal(const CellSlice& other) const {
  if (size() != other.size() || size_refs() != other.size_refs()) {
    return false;
  }
  if (size() && bitstring::bits_memcmp(data(), bits_st_, other.data(), other.bits_st_, size())) {
    return false;
  }
  for (unsigned i = 0; i < size_refs(); i++) {
    if (!prefetch_ref(i)->equals(*other.prefetch_ref(i))) {
      return false;
    }
  }
  return true;
}

std::string CellSlice::to_binary() const {
  return size() ? bitstring::bits_to_binary(data(), bits_st_, size()) : std::string{};
}

std::string CellSlice::to_hex() const {
  return size() ? bitstring::bits_to_hex(data(), bits_st_, size()) : std::string{};
}

void CellSlice::dump(std::ostream& os) const {
  os << "x{" << to_hex() << "}";
  if (size_refs()) {
    os << " +" << size_refs() << "R";
  }
  os << std::endl;
}

void CellSlice::print_rec(std::ostream& os, int indent) const {
  for (int i = 0; i < indent; i++) {
    os << ' ';
  }
  os << "x{" << to_hex() << "}" << std::endl;
  for (unsigned i = 0; i < size_refs(); i++) {
    CellSlice{prefetch_ref(i)}.print_rec(os, indent + 1);
  }
}

void print_cell_rec(std::ostream& os, const Ref<Cell>& cell, int indent) {
  CellSlice{cell}.print_rec(os, indent);
}

}  // namespace tolk
