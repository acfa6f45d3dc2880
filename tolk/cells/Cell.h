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
#include <array>
#include <memory>
#include <string>
#include <vector>
#include "tolk/common/bitstring.h"

namespace tolk {

template <class T>
using Ref = std::shared_ptr<const T>;

// Shape bounds of a single cell. The canonical profile is 1023 data bits and 4 refs;
// hosts with other node shapes construct builders with their own limits.
struct CellLimits {
  unsigned max_bits{1023};
  unsigned max_refs{4};

  static constexpr CellLimits canonical() {
    return CellLimits{1023, 4};
  }
  bool operator==(const CellLimits& other) const {
    return max_bits == other.max_bits && max_refs == other.max_refs;
  }
  bool operator!=(const CellLimits& other) const {
    return !(*this == other);
  }
};

class Cell {
 public:
  static constexpr unsigned max_bits = 1023;
  static constexpr unsigned max_refs = 4;
  static constexpr unsigned hash_bytes = 32;
  using Hash = std::array<unsigned char, hash_bytes>;

  // cells are created by CellBuilder::finalize() or the bag-of-cells reader
  static Ref<Cell> create(const unsigned char* data, unsigned bits, std::vector<Ref<Cell>> refs);

  unsigned size() const {
    return bits_;
  }
  unsigned size_refs() const {
    return (unsigned)refs_.size();
  }
  const unsigned char* get_data() const {
    return data_.data();
  }
  const Ref<Cell>& get_ref(unsigned idx) const {
    return refs_.at(idx);
  }
  int bit_at(unsigned idx) const {
    return bitstring::get_bit(data_.data(), idx);
  }
  unsigned get_depth() const {
    return depth_;
  }
  const Hash& get_hash() const {
    return hash_;
  }
  std::string get_hash_hex() const;
  std::string to_hex() const {
    return bitstring::bits_to_hex(data_.data(), 0, bits_);
  }
  bool equals(const Cell& other) const {
    return hash_ == other.hash_;
  }

  // d1 and d2 descriptor bytes of the standard cell representation
  unsigned char get_d1() const;
  unsigned char get_d2() const;
  // data bytes padded with the completion tag, as used by hashing and serialization
  std::string serialized_data() const;

  Cell(const unsigned char* data, unsigned bits, std::vector<Ref<Cell>> refs);

 private:
  unsigned bits_;
  std::vector<unsigned char> data_;
  std::vector<Ref<Cell>> refs_;
  unsigned depth_{0};
  Hash hash_;

  void compute_hash();
};

}  // namespace tolk
