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
#include "tolk/dict/Dictionary.h"
#include <ostream>
#include "tolk/errors.h"

namespace tolk {

namespace dict {

namespace {

// bits needed to store a label length in 0..max_len
unsigned len_bits(unsigned max_len) {
  unsigned res = 0;
  while (max_len >> res) {
    ++res;
  }
  return res;
}

bool all_same(const BitString& label) {
  for (unsigned i = 1; i < label.size(); i++) {
    if (label[i] != label[0]) {
      return false;
    }
  }
  return true;
}

}  // namespace

void store_label(CellBuilder& cb, const BitString& label, unsigned max_len) {
  unsigned len = label.size();
  unsigned k = len_bits(max_len);
  if (len > 1 && k < 2 * len - 1 && all_same(label)) {
    // hml_same$11 v:Bit n:(#<= m)
    cb.store_ulong(6 + label[0], 3).store_ulong(len, k);
  } else if (k < len) {
    // hml_long$10 n:(#<= m) s:(n * Bit)
    cb.store_ulong(2, 2).store_ulong(len, k).store_bits(label);
  } else {
    // hml_short$0 len:(Unary ~n) s:(n * Bit)
    cb.store_zeroes(1).store_ones(len).store_zeroes(1).store_bits(label);
  }
}

BitString fetch_label(CellSlice& cs, unsigned max_len) {
  unsigned k = len_bits(max_len);
  if (!cs.fetch_bool()) {
    unsigned len = 0;
    while (cs.fetch_bool()) {
      if (++len > max_len) {
        throw CodecError(ErrorCode::type_check, "dictionary label is longer than the remaining key");
      }
    }
    return cs.fetch_bits(len);
  }
  bool same = cs.fetch_bool();
  if (same) {
    int v = cs.fetch_bool() ? 1 : 0;
    auto len = (unsigned)cs.fetch_ulong(k);
    if (len > max_len) {
      throw CodecError(ErrorCode::type_check, "dictionary label is longer than the remaining key");
    }
    BitString res(len);
    for (unsigned i = 0; i < len; i++) {
      res.set(i, v);
    }
    return res;
  }
  auto len = (unsigned)cs.fetch_ulong(k);
  if (len > max_len) {
    throw CodecError(ErrorCode::type_check, "dictionary label is longer than the remaining key");
  }
  return cs.fetch_bits(len);
}

}  // namespace dict

namespace {

struct Node {
  BitString label;
  // what follows the label: the value of a leaf, or the two refs of a fork
  CellSlice body;
};

Node parse_node(const Ref<Cell>& cell, unsigned m) {
  try {
    CellSlice cs{cell};
    Node node;
    node.label = dict::fetch_label(cs, m);
    if (node.label.size() < m && !cs.have_refs(2)) {
      throw CodecError(ErrorCode::truncated_data, "dictionary fork without two refs", 0, 2 - cs.size_refs());
    }
    node.body = cs;
    return node;
  } catch (CellSlice::CellReadError& err) {
    throw CodecError(ErrorCode::truncated_data, "malformed dictionary node", err.missing_bits, err.missing_refs);
  }
}

[[noreturn]] void leaf_overflow() {
  throw CodecError(ErrorCode::size_exceeded, "dictionary entry does not fit into a cell");
}

Ref<Cell> make_leaf(const CellLimits& limits, const BitString& label, unsigned m, const CellSlice& value) {
  try {
    CellBuilder cb{limits};
    dict::store_label(cb, label, m);
    cb.append_cellslice(value);
    return cb.finalize();
  } catch (CellBuilder::CellWriteError&) {
    leaf_overflow();
  }
}

Ref<Cell> make_fork(const CellLimits& limits, const BitString& label, unsigned m, Ref<Cell> left,
                    Ref<Cell> right) {
  try {
    CellBuilder cb{limits};
    dict::store_label(cb, label, m);
    cb.store_ref(std::move(left)).store_ref(std::move(right));
    return cb.finalize();
  } catch (CellBuilder::CellWriteError&) {
    leaf_overflow();
  }
}

// the same node under a different label (its key prefix got longer or shorter)
Ref<Cell> relabel(const CellLimits& limits, const Node& node, const BitString& label, unsigned m) {
  try {
    CellBuilder cb{limits};
    dict::store_label(cb, label, m);
    cb.append_cellslice(node.body);
    return cb.finalize();
  } catch (CellBuilder::CellWriteError&) {
    leaf_overflow();
  }
}

unsigned common_prefix(const BitString& label, const BitString& key, unsigned pos) {
  unsigned same = 0;
  if (label.size()) {
    bitstring::bits_memcmp(label.data(), 0, key.data(), pos, label.size(), &same);
  }
  return same;
}

Ref<Cell> set_rec(const CellLimits& limits, const Ref<Cell>& cell, unsigned m, const BitString& key, unsigned pos,
                  const CellSlice& value, Dictionary::SetMode mode, bool& changed) {
  if (!cell) {
    if (mode == Dictionary::SetMode::Replace) {
      return cell;
    }
    changed = true;
    return make_leaf(limits, key.substr(pos, m), m, value);
  }
  Node node = parse_node(cell, m);
  unsigned ln = node.label.size();
  unsigned same = common_prefix(node.label, key, pos);
  if (same == ln) {
    if (ln == m) {
      if (mode == Dictionary::SetMode::Add) {
        return cell;
      }
      changed = true;
      return make_leaf(limits, node.label, m, value);
    }
    int b = key[pos + ln];
    auto child = set_rec(limits, node.body.prefetch_ref(b), m - ln - 1, key, pos + ln + 1, value, mode, changed);
    if (!changed) {
      return cell;
    }
    return b ? make_fork(limits, node.label, m, node.body.prefetch_ref(0), child)
             : make_fork(limits, node.label, m, child, node.body.prefetch_ref(1));
  }
  if (mode == Dictionary::SetMode::Replace) {
    return cell;
  }
  changed = true;
  unsigned cm = m - same - 1;
  auto old_child = relabel(limits, node, node.label.substr(same + 1, ln - same - 1), cm);
  auto new_leaf = make_leaf(limits, key.substr(pos + same + 1, cm), cm, value);
  auto common = node.label.substr(0, same);
  return key[pos + same] ? make_fork(limits, common, m, old_child, new_leaf)
                         : make_fork(limits, common, m, new_leaf, old_child);
}

// returns false if the key is absent; otherwise `res` is the new subtree (null when it became empty)
bool delete_rec(const CellLimits& limits, const Ref<Cell>& cell, unsigned m, const BitString& key, unsigned pos,
                Ref<Cell>& res, std::optional<CellSlice>* old_value) {
  Node node = parse_node(cell, m);
  unsigned ln = node.label.size();
  if (common_prefix(node.label, key, pos) != ln) {
    return false;
  }
  if (ln == m) {
    if (old_value) {
      *old_value = node.body;
    }
    res = nullptr;
    return true;
  }
  int b = key[pos + ln];
  Ref<Cell> child;
  if (!delete_rec(limits, node.body.prefetch_ref(b), m - ln - 1, key, pos + ln + 1, child, old_value)) {
    return false;
  }
  if (child) {
    res = b ? make_fork(limits, node.label, m, node.body.prefetch_ref(0), child)
            : make_fork(limits, node.label, m, child, node.body.prefetch_ref(1));
    return true;
  }
  // the fork collapses into its remaining child
  Node other = parse_node(node.body.prefetch_ref(1 - b), m - ln - 1);
  BitString merged = node.label;
  merged.push_back(1 - b).append(other.label);
  res = relabel(limits, other, merged, m);
  return true;
}

int effective_bit(int bit, unsigned pos, bool invert_first) {
  return invert_first && !pos ? bit ^ 1 : bit;
}

CellSlice extreme(Ref<Cell> cell, unsigned m, unsigned pos, bool fetch_max, bool invert_first, BitString& acc) {
  while (true) {
    Node node = parse_node(cell, m);
    unsigned ln = node.label.size();
    acc.append(node.label);
    if (ln == m) {
      return node.body;
    }
    unsigned p = pos + ln;
    int c = effective_bit(fetch_max ? 1 : 0, p, invert_first);
    acc.push_back(c);
    cell = node.body.prefetch_ref(c);
    pos = p + 1;
    m -= ln + 1;
  }
}

std::optional<CellSlice> nearest(const Ref<Cell>& cell, unsigned m, unsigned pos, const BitString& key, bool fetch_next,
                                 bool allow_eq, bool invert_first, BitString& acc) {
  Node node = parse_node(cell, m);
  unsigned ln = node.label.size();
  for (unsigned i = 0; i < ln; i++) {
    int kb = key[pos + i], lb = node.label[i];
    if (kb != lb) {
      // the whole subtree lies on one side of key
      bool greater = effective_bit(lb, pos + i, invert_first) > effective_bit(kb, pos + i, invert_first);
      if (greater != fetch_next) {
        return {};
      }
      return extreme(cell, m, pos, !fetch_next, invert_first, acc);
    }
  }
  if (ln == m) {
    if (!allow_eq) {
      return {};
    }
    acc.append(node.label);
    return node.body;
  }
  unsigned p = pos + ln;
  int kb = key[p];
  BitString sub = acc;
  sub.append(node.label).push_back(kb);
  auto res = nearest(node.body.prefetch_ref(kb), m - ln - 1, p + 1, key, fetch_next, allow_eq, invert_first, sub);
  if (res) {
    acc = std::move(sub);
    return res;
  }
  int sib = kb ^ 1;
  bool sib_greater = effective_bit(sib, p, invert_first) > effective_bit(kb, p, invert_first);
  if (sib_greater != fetch_next) {
    return {};
  }
  acc.append(node.label).push_back(sib);
  return extreme(node.body.prefetch_ref(sib), m - ln - 1, p + 1, !fetch_next, invert_first, acc);
}

void visit(const Ref<Cell>& cell, unsigned m, unsigned pos, bool invert_first, const BitString& acc,
           const std::function<void(const BitString&, const CellSlice&)>& func) {
  Node node = parse_node(cell, m);
  unsigned ln = node.label.size();
  BitString key = acc;
  key.append(node.label);
  if (ln == m) {
    func(key, node.body);
    return;
  }
  unsigned p = pos + ln;
  int first = effective_bit(0, p, invert_first);
  for (int c : {first, first ^ 1}) {
    BitString sub = key;
    sub.push_back(c);
    visit(node.body.prefetch_ref(c), m - ln - 1, p + 1, invert_first, sub, func);
  }
}

}  // namespace

void Dictionary::check_key(const BitString& key) const {
  if (key.size() != key_bits_) {
    throw CodecError(ErrorCode::type_check, "dictionary key has " + std::to_string(key.size()) + " bits instead of " +
                                                std::to_string(key_bits_));
  }
}

std::optional<CellSlice> Dictionary::lookup(const BitString& key) const {
  check_key(key);
  Ref<Cell> cell = root_;
  unsigned pos = 0, m = key_bits_;
  while (cell) {
    Node node = parse_node(cell, m);
    unsigned ln = node.label.size();
    if (common_prefix(node.label, key, pos) != ln) {
      return {};
    }
    if (ln == m) {
      return node.body;
    }
    cell = node.body.prefetch_ref(key[pos + ln]);
    pos += ln + 1;
    m -= ln + 1;
  }
  return {};
}

Dictionary Dictionary::set(const BitString& key, const CellSlice& value, SetMode mode, bool* changed) const {
  check_key(key);
  bool ok = false;
  auto root = set_rec(limits_, root_, key_bits_, key, 0, value, mode, ok);
  if (changed) {
    *changed = ok;
  }
  return Dictionary{ok ? root : root_, key_bits_, limits_};
}

Dictionary Dictionary::set_builder(const BitString& key, const CellBuilder& value, SetMode mode, bool* changed) const {
  return set(key, CellSlice{value.finalize_copy()}, mode, changed);
}

Dictionary Dictionary::set_ref(const BitString& key, Ref<Cell> value, SetMode mode, bool* changed) const {
  CellBuilder cb{limits_};
  cb.store_ref(std::move(value));
  return set_builder(key, cb, mode, changed);
}

Dictionary Dictionary::lookup_delete(const BitString& key, std::optional<CellSlice>* old_value) const {
  check_key(key);
  if (old_value) {
    old_value->reset();
  }
  if (!root_) {
    return *this;
  }
  Ref<Cell> root;
  if (!delete_rec(limits_, root_, key_bits_, key, 0, root, old_value)) {
    return *this;
  }
  return Dictionary{root, key_bits_, limits_};
}

std::optional<Dictionary::Entry> Dictionary::get_minmax_key(bool fetch_max, bool invert_first) const {
  if (!root_) {
    return {};
  }
  BitString key;
  auto value = extreme(root_, key_bits_, 0, fetch_max, invert_first, key);
  return Entry{std::move(key), std::move(value)};
}

std::optional<Dictionary::Entry> Dictionary::lookup_nearest_key(const BitString& key, bool fetch_next, bool allow_eq,
                                                                bool invert_first) const {
  check_key(key);
  if (!root_) {
    return {};
  }
  BitString found;
  auto value = nearest(root_, key_bits_, 0, key, fetch_next, allow_eq, invert_first, found);
  if (!value) {
    return {};
  }
  return Entry{std::move(found), std::move(*value)};
}

void Dictionary::for_each(const std::function<void(const BitString&, const CellSlice&)>& func,
                          bool invert_first) const {
  if (root_) {
    visit(root_, key_bits_, 0, invert_first, BitString{}, func);
  }
}

std::size_t Dictionary::size() const {
  std::size_t res = 0;
  for_each([&res](const BitString&, const CellSlice&) { ++res; });
  return res;
}

bool Dictionary::append_to(CellBuilder& cb) const {
  if (!root_) {
    return cb.store_bool_bool(false);
  }
  return cb.can_extend_by(1, 1) && cb.store_bool_bool(true) && cb.store_ref_bool(root_);
}

Dictionary Dictionary::fetch_from(CellSlice& cs, unsigned key_bits, CellLimits limits) {
  if (!cs.fetch_bool()) {
    return Dictionary{key_bits, limits};
  }
  return Dictionary{cs.fetch_ref(), key_bits, limits};
}

bool Dictionary::operator==(const Dictionary& other) const {
  if (key_bits_ != other.key_bits_ || is_empty() != other.is_empty()) {
    return false;
  }
  return is_empty() || root_->equals(*other.root_);
}

void Dictionary::show(std::ostream& os) const {
  os << "dict" << key_bits_ << " {";
  for_each([&os](const BitString& key, const CellSlice& value) {
    os << " " << key << ": x{" << value.to_hex() << "}";
    if (value.size_refs()) {
      os << "+" << value.size_refs() << "R";
    }
    os << ";";
  });
  os << " }";
}

std::ostream& operator<<(std::ostream& os, const Dictionary& dict) {
  dict.show(os);
  return os;
}

}  // namespace tolk
