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
#include "tolk/cells/Cell.h"

namespace tolk {

// Bounds on the number of data bits and refs a value occupies in its node.
// Upper bounds saturate at `infinity`.
struct PackSize {
  static constexpr unsigned infinity = 0xffff;

  unsigned min_bits{0};
  unsigned max_bits{0};
  unsigned min_refs{0};
  unsigned max_refs{0};

  static PackSize fixed(unsigned bits, unsigned refs = 0) {
    return PackSize{bits, bits, refs, refs};
  }
  static PackSize range(unsigned min_bits, unsigned max_bits, unsigned min_refs = 0, unsigned max_refs = 0) {
    return PackSize{min_bits, max_bits, min_refs, max_refs};
  }
  static PackSize any() {
    return PackSize{0, infinity, 0, infinity};
  }

  bool is_fixed() const {
    return min_bits == max_bits && min_refs == max_refs;
  }
  // the smallest possible encoding fits into a node
  bool min_fits(const CellLimits& limits) const {
    return min_bits <= limits.max_bits && min_refs <= limits.max_refs;
  }
  // every possible encoding fits into a node
  bool max_fits(const CellLimits& limits) const {
    return max_bits <= limits.max_bits && max_refs <= limits.max_refs;
  }

  PackSize& operator+=(const PackSize& other);
  // alternatives: either this or other
  PackSize& operator|=(const PackSize& other);
  PackSize operator+(const PackSize& other) const {
    PackSize res{*this};
    return res += other;
  }
  bool operator==(const PackSize& other) const {
    return min_bits == other.min_bits && max_bits == other.max_bits && min_refs == other.min_refs &&
           max_refs == other.max_refs;
  }

  void show(std::ostream& os) const;
};

std::ostream& operator<<(std::ostream& os, const PackSize& size);

}  // namespace tolk
