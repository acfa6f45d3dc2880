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
#include "tolk/cells/Cell.h"
#include <algorithm>
#include "td/utils/crypto.h"
#include "td/utils/Slice.h"

namespace tolk {

Cell::Cell(const unsigned char* data, unsigned bits, std::vector<Ref<Cell>> refs)
    : bits_(bits), data_((bits + 7) / 8, 0), refs_(std::move(refs)) {
  bitstring::bits_memcpy(data_.data(), 0, data, 0, bits);
  for (const auto& ref : refs_) {
    depth_ = std::max(depth_, ref->get_depth() + 1);
  }
  compute_hash();
}

Ref<Cell> Cell::create(const unsigned char* data, unsigned bits, std::vector<Ref<Cell>> refs) {
  return std::make_shared<const Cell>(data, bits, std::move(refs));
}

unsigned char Cell::get_d1() const {
  return (unsigned char)(refs_.size() & 0xff);
}

unsigned char Cell::get_d2() const {
  return (unsigned char)(((bits_ >> 3) + ((bits_ + 7) >> 3)) & 0xff);
}

std::string Cell::serialized_data() const {
  std::string res((bits_ + 7) >> 3, '\0');
  for (std::size_t i = 0; i < res.size(); i++) {
    res[i] = (char)data_[i];
  }
  if (bits_ & 7) {
    // completion tag
    unsigned char tag = (unsigned char)(0x80 >> (bits_ & 7));
    res.back() = (char)(((unsigned char)res.back() & (unsigned char)~(tag - 1)) | tag);
  }
  return res;
}

void Cell::compute_hash() {
  std::string repr;
  repr.push_back((char)get_d1());
  repr.push_back((char)get_d2());
  repr += serialized_data();
  for (const auto& ref : refs_) {
    unsigned d = ref->get_depth();
    repr.push_back((char)((d >> 8) & 0xff));
    repr.push_back((char)(d & 0xff));
  }
  for (const auto& ref : refs_) {
    const Hash& h = ref->get_hash();
    repr.append(reinterpret_cast<const char*>(h.data()), h.size());
  }
  td::sha256(td::Slice(repr), td::MutableSlice(reinterpret_cast<char*>(hash_.data()), hash_.size()));
}

std::string Cell::get_hash_hex() const {
  static const char hex_digits[] = "0123456789ABCDEF";
  std::string res;
  for (unsigned char c : hash_) {
    res.push_back(hex_digits[c >> 4]);
    res.push_back(hex_digits[c & 15]);
  }
  return res;
}

}  // namespace tolk
