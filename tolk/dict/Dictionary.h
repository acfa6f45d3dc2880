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
#include <functional>
#include <iosfwd>
#include <optional>
#include <utility>
#include "tolk/cells/CellBuilder.h"
#include "tolk/cells/CellSlice.h"

namespace tolk {

// Persistent binary radix trie with fixed-width keys, stored in cells as a TON HashmapE:
// edges carry hml_short / hml_long / hml_same labels, forks keep two refs, leaves keep the value slice.
// Every modifying operation returns a new Dictionary; the receiver is never changed.
// Nodes are built under the dictionary's cell limits; an entry that does not fit raises SizeExceeded.
class Dictionary {
 public:
  enum class SetMode { Set, Replace, Add };
  using Entry = std::pair<BitString, CellSlice>;

  explicit Dictionary(unsigned key_bits = 0, CellLimits limits = CellLimits::canonical())
      : key_bits_(key_bits), limits_(limits) {
  }
  Dictionary(Ref<Cell> root, unsigned key_bits, CellLimits limits = CellLimits::canonical())
      : root_(std::move(root)), key_bits_(key_bits), limits_(limits) {
  }

  unsigned key_bits() const {
    return key_bits_;
  }
  const CellLimits& limits() const {
    return limits_;
  }
  const Ref<Cell>& get_root_cell() const {
    return root_;
  }
  bool is_empty() const {
    return !root_;
  }

  std::optional<CellSlice> lookup(const BitString& key) const;
  // *changed is set to whether the key was written under `mode`
  Dictionary set(const BitString& key, const CellSlice& value, SetMode mode = SetMode::Set,
                 bool* changed = nullptr) const;
  Dictionary set_builder(const BitString& key, const CellBuilder& value, SetMode mode = SetMode::Set,
                         bool* changed = nullptr) const;
  Dictionary set_ref(const BitString& key, Ref<Cell> value, SetMode mode = SetMode::Set,
                     bool* changed = nullptr) const;
  // removes key; *old_value receives the removed value if there was one
  Dictionary lookup_delete(const BitString& key, std::optional<CellSlice>* old_value = nullptr) const;

  // smallest (or largest) key; invert_first orders keys as signed integers
  std::optional<Entry> get_minmax_key(bool fetch_max = false, bool invert_first = false) const;
  // nearest key strictly after (fetch_next) or before `key`, or equal to it when allow_eq
  std::optional<Entry> lookup_nearest_key(const BitString& key, bool fetch_next = true, bool allow_eq = false,
                                          bool invert_first = false) const;

  // visits entries in increasing key order
  void for_each(const std::function<void(const BitString&, const CellSlice&)>& func, bool invert_first = false) const;
  std::size_t size() const;

  // HashmapE form: 0, or 1 followed by a ref to the root
  bool append_to(CellBuilder& cb) const;
  static Dictionary fetch_from(CellSlice& cs, unsigned key_bits, CellLimits limits = CellLimits::canonical());

  bool operator==(const Dictionary& other) const;
  bool operator!=(const Dictionary& other) const {
    return !(*this == other);
  }

  void show(std::ostream& os) const;

 private:
  Ref<Cell> root_;
  unsigned key_bits_;
  CellLimits limits_;

  void check_key(const BitString& key) const;
};

std::ostream& operator<<(std::ostream& os, const Dictionary& dict);

namespace dict {

// label helpers shared with the tests
void store_label(CellBuilder& cb, const BitString& label, unsigned max_len);
BitString fetch_label(CellSlice& cs, unsigned max_len);

}  // namespace dict

}  // namespace tolk
