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
#include "tolk/layout/DiscriminantTrie.h"
#include <algorithm>
#include <initializer_list>
#include <ostream>
#include <stdexcept>
#include "tolk/cells/CellSlice.h"

namespace tolk {

std::string Opcode::to_string() const {
  static const char hex_digits[] = "0123456789abcdef";
  std::string res;
  if (bits && !(bits & 3)) {
    res = "0x";
    for (unsigned i = bits; i > 0; i -= 4) {
      res.push_back(hex_digits[(value >> (i - 4)) & 15]);
    }
  } else {
    res = "0b";
    for (unsigned i = 0; i < bits; i++) {
      res.push_back((char)('0' + bit_at(i)));
    }
  }
  return res;
}

Opcode Opcode::parse(const std::string& str) {
  Opcode res;
  if (str.size() < 2 || str[0] != '0' || (str[1] != 'x' && str[1] != 'b')) {
    throw std::invalid_argument("opcode `" + str + "` must start with 0x or 0b");
  }
  bool hex = str[1] == 'x';
  for (std::size_t i = 2; i < str.size(); i++) {
    int c = str[i], d;
    if (c >= '0' && c <= '9') {
      d = c - '0';
    } else if (hex && c >= 'a' && c <= 'f') {
      d = c - 'a' + 10;
    } else if (hex && c >= 'A' && c <= 'F') {
      d = c - 'A' + 10;
    } else {
      throw std::invalid_argument("invalid digit in opcode `" + str + "`");
    }
    if (!hex && d > 1) {
      throw std::invalid_argument("invalid digit in opcode `" + str + "`");
    }
    unsigned w = hex ? 4 : 1;
    if (res.bits + w > 64) {
      throw std::invalid_argument("opcode `" + str + "` is wider than 64 bits");
    }
    res.value = (res.value << w) | (unsigned)d;
    res.bits += w;
  }
  return res;
}

std::ostream& operator<<(std::ostream& os, const Opcode& opcode) {
  return os << opcode.to_string();
}

int DiscriminantTrie::any_tag(const BinNode* node) {
  if (!node) {
    return -1;
  }
  if (node->tag >= 0) {
    return node->tag;
  }
  int t = any_tag(node->left.get());
  return t >= 0 ? t : any_tag(node->right.get());
}

unsigned DiscriminantTrie::min_leaf_depth(const BinNode* node) {
  if (node->tag >= 0) {
    return 0;
  }
  unsigned res = ~0u;
  for (const BinNode* child : {node->left.get(), node->right.get()}) {
    if (child) {
      res = std::min(res, min_leaf_depth(child) + 1);
    }
  }
  return res;
}

int DiscriminantTrie::insert(const Opcode& discriminant, int variant) {
  if (!root_) {
    root_ = std::make_unique<BinNode>();
  }
  BinNode* node = root_.get();
  for (unsigned i = 0; i < discriminant.bits; i++) {
    if (node->tag >= 0) {
      // an existing discriminant is a prefix of the new one
      return node->tag;
    }
    auto& next = discriminant.bit_at(i) ? node->right : node->left;
    if (!next) {
      next = std::make_unique<BinNode>();
    }
    node = next.get();
  }
  if (node->tag >= 0) {
    return node->tag;
  }
  if (node->left || node->right) {
    // the new discriminant is a prefix of an existing one
    return any_tag(node);
  }
  node->tag = variant;
  max_depth_ = std::max(max_depth_, discriminant.bits);
  return -1;
}

DiscriminantTrie::Match DiscriminantTrie::lookup(const CellSlice& cs) const {
  Match res;
  const BinNode* node = root_.get();
  while (node) {
    if (node->tag >= 0) {
      res.variant = node->tag;
      return res;
    }
    if (!cs.have(res.depth + 1)) {
      res.truncated = true;
      res.missing_bits = res.depth + min_leaf_depth(node) - cs.size();
      return res;
    }
    node = cs.bit_at(res.depth) ? node->right.get() : node->left.get();
    ++res.depth;
  }
  return res;
}

void DiscriminantTrie::show_node(std::ostream& os, const BinNode* node, const std::string& pfx) {
  if (!node) {
    return;
  }
  if (node->tag >= 0) {
    os << (pfx.empty() ? std::string{"<empty>"} : pfx) << " -> " << node->tag << std::endl;
  }
  show_node(os, node->left.get(), pfx + '0');
  show_node(os, node->right.get(), pfx + '1');
}

void DiscriminantTrie::show(std::ostream& os) const {
  show_node(os, root_.get(), "");
}

}  // namespace tolk
