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
#include <string>
#include "tolk/cells/Cell.h"

namespace tolk {

// Read cursor over a window [bits_st, bits_en) x [refs_st, refs_en) of a cell.
// fetch_* consume from the front of the window, prefetch_* only look.
class CellSlice {
 public:
  struct CellReadError {
    unsigned missing_bits{0};
    unsigned missing_refs{0};
  };

  CellSlice() = default;
  explicit CellSlice(Ref<Cell> cell);
  // the first `bits` bits and `refs` refs of cs
  CellSlice(const CellSlice& cs, unsigned bits, unsigned refs);

  unsigned size() const {
    return bits_en_ - bits_st_;
  }
  unsigned size_refs() const {
    return refs_en_ - refs_st_;
  }
  bool empty() const {
    return !size();
  }
  bool empty_ext() const {
    return !size() && !size_refs();
  }
  bool have(unsigned bits) const {
    return bits <= size();
  }
  bool have(unsigned bits, unsigned refs) const {
    return bits <= size() && refs <= size_refs();
  }
  bool have_refs(unsigned refs = 1) const {
    return refs <= size_refs();
  }
  // underlying cell data and the absolute bit position of the cursor in it
  const unsigned char* data() const;
  unsigned cur_pos() const {
    return bits_st_;
  }
  unsigned cur_ref() const {
    return refs_st_;
  }
  const Ref<Cell>& get_base_cell() const {
    return cell_;
  }

  int bit_at(unsigned i) const;
  unsigned long long prefetch_ulong(unsigned bits) const;
  unsigned long long fetch_ulong(unsigned bits);
  long long prefetch_long(unsigned bits) const;
  long long fetch_long(unsigned bits);
  bool fetch_bool();
  BitString prefetch_bits(unsigned bits) const;
  BitString fetch_bits(unsigned bits);
  unsigned long long fetch_var_uint(unsigned len_bits);
  long long fetch_var_int(unsigned len_bits);
  Ref<Cell> prefetch_ref(unsigned idx = 0) const;
  Ref<Cell> fetch_ref();

  bool advance(unsigned bits);
  bool advance_refs(unsigned refs);
  bool advance_ext(unsigned bits, unsigned refs);
  void skip(unsigned bits, unsigned refs = 0);

  bool begins_with(unsigned bits, unsigned long long value) const;
  bool begins_with(const BitString& prefix) const;
  bool begins_with_skip(unsigned bits, unsigned long long value);
  bool begins_with_skip(const BitString& prefix);

  CellSlice prefetch_subslice(unsigned bits, unsigned refs = 0) const;
  CellSlice fetch_subslice(unsigned bits, unsigned refs = 0);
  // number of bits consumed by this slice since `start` was copied from it
  unsigned bits_since(const CellSlice& start) const {
    return bits_st_ - start.bits_st_;
  }
  unsigned refs_since(const CellSlice& start) const {
    return refs_st_ - start.refs_st_;
  }

  // materializes the window as a standalone cell
  Ref<Cell> to_cell() const;
  bool contents_equal(const CellSlice& other) const;

  std::string to_binary() const;
  std::string to_hex() const;
  void dump(std::ostream& os) const;
  void print_rec(std::ostream& os, int indent = 0) const;

 private:
  Ref<Cell> cell_;
  unsigned bits_st_{0};
  unsigned bits_en_{0};
  unsigned refs_st_{0};
  unsigned refs_en_{0};

  void ensure(unsigned bits, unsigned refs = 0) const;
};

// print_rec of a whole cell tree
void print_cell_rec(std::ostream& os, const Ref<Cell>& cell, int indent = 0);

}  // namespace tolk
