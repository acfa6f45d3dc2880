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
#include <memory>
#include <string>
#include "tolk/common/bitstring.h"

namespace tolk {

class CellSlice;

// Fixed bit prefix of a record or union variant, at most 64 bits wide.
struct Opcode {
  unsigned long long value{0};
  unsigned bits{0};

  bool fits() const {
    return bits <= 64 && (bits == 64 || !(value >> bits));
  }
  int bit_at(unsigned i) const {
    return (int)((value >> (bits - 1 - i)) & 1);
  }
  BitString to_bits() const {
    return BitString::from_ulong(value, bits);
  }
  bool operator==(const Opcode& other) const {
    return value == other.value && bits == other.bits;
  }
  bool operator!=(const Opcode& other) const {
    return !(*this == other);
  }
  // "0x0f8a7ea5" for nibble-aligned widths, "0b101" otherwise
  std::string to_string() const;
  // inverse of to_string(); throws std::invalid_argument
  static Opcode parse(const std::string& str);
};

std::ostream& operator<<(std::ostream& os, const Opcode& opcode);

// Binary trie over variant discriminants. Each leaf carries the index of the variant whose
// discriminant ends there; the set of discriminants must stay prefix-free.
class DiscriminantTrie {
 public:
  struct Match {
    int variant{-1};
    // bits inspected while walking the trie
    unsigned depth{0};
    // the slice ended before a leaf or a dead end was reached
    bool truncated{false};
    // when truncated: bits still needed to reach the nearest discriminant below the last inspected node
    unsigned missing_bits{0};
  };

  // returns the index of a conflicting variant (equal discriminant or one being a prefix of the other), or -1
  int insert(const Opcode& discriminant, int variant);
  // walks the trie with prefetches only; never inspects bits past the deepest discriminant on the taken path
  Match lookup(const CellSlice& cs) const;
  unsigned max_depth() const {
    return max_depth_;
  }
  bool empty() const {
    return !root_;
  }
  void show(std::ostream& os) const;

 private:
  struct BinNode {
    int tag{-1};
    std::unique_ptr<BinNode> left, right;
  };
  std::unique_ptr<BinNode> root_;
  unsigned max_depth_{0};

  static int any_tag(const BinNode* node);
  static unsigned min_leaf_depth(const BinNode* node);
  static void show_node(std::ostream& os, const BinNode* node, const std::string& pfx);
};

}  // namespace tolk
