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
#include "tolk/layout/PackSize.h"
#include <algorithm>
#include <ostream>

namespace tolk {

namespace {

unsigned sat_add(unsigned x, unsigned y) {
  return std::min(x + y, PackSize::infinity);
}

}  // namespace

PackSize& PackSize::operator+=(const PackSize& other) {
  min_bits = sat_add(min_bits, other.min_bits);
  max_bits = sat_add(max_bits, other.max_bits);
  min_refs = sat_add(min_refs, other.min_refs);
  max_refs = sat_add(max_refs, other.max_refs);
  return *this;
}

PackSize& PackSize::operator|=(const PackSize& other) {
  min_bits = std::min(min_bits, other.min_bits);
  max_bits = std::max(max_bits, other.max_bits);
  min_refs = std::min(min_refs, other.min_refs);
  max_refs = std::max(max_refs, other.max_refs);
  return *this;
}

void PackSize::show(std::ostream& os) const {
  if (is_fixed()) {
    os << '=' << min_bits;
    if (min_refs) {
      os << "+" << min_refs << "R";
    }
    return;
  }
  os << min_bits;
  if (min_refs) {
    os << "+" << min_refs << "R";
  }
  os << "..";
  if (max_bits >= infinity && max_refs >= infinity) {
    os << "infty";
    return;
  }
  if (max_bits >= infinity) {
    os << "infty";
  } else {
    os << max_bits;
  }
  if (max_refs) {
    os << "+";
    if (max_refs >= infinity) {
      os << "infty";
    } else {
      os << max_refs;
    }
    os << "R";
  }
}

std::ostream& operator<<(std::ostream& os, const PackSize& size) {
  size.show(os);
  return os;
}

}  // namespace tolk
