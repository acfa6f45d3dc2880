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
#include "tolk/codec/LazyValue.h"

namespace tolk {

// Lazily opened union value. Once a variant is selected the view reads like a LazyValue of
// the variant's record; before that, and after close(), field access fails.
// A plain record may be opened too, as a union whose only variant is the record itself.
class UnionView : public LazyValue {
 public:
  enum class State { Unopened, DiscriminantRead, VariantSelected, FieldsBeingAccessed, Closed };

  UnionView(const Codec& codec, const TypeLayout& layout, CellSlice cs, UnpackOptions options);

  // reads the discriminant and selects the variant; no-op unless Unopened
  void open();
  void close() {
    state_ = State::Closed;
  }

  State state() const {
    return state_;
  }
  const TypeLayout& get_union_layout() const {
    return *union_layout_;
  }
  bool is_matched() const {
    return variant_ >= 0;
  }
  // -1 when no discriminant matched
  int variant_index() const {
    return variant_;
  }
  // throws CodecError(unmatched_variant) when no variant matched
  const TypeLayout& variant_layout() const;
  // bits inspected to choose the variant
  unsigned discriminant_depth() const {
    return depth_;
  }
  // the data from the discriminant on, as it was when the view was opened
  const CellSlice& raw() const {
    return raw_;
  }
  int exit_code() const;

  const Value& get(std::size_t idx);
  const Value& get(const std::string& name);
  // the selected variant's record, or an unmatched value
  Value to_value();

  // UnmatchedVariant with the exit code, or TruncatedData if the discriminant was cut short
  [[noreturn]] void fail_unmatched() const;

 private:
  const Codec* codec_;
  const TypeLayout* union_layout_;
  UnpackOptions options_;
  CellSlice raw_;
  State state_{State::Unopened};
  int variant_{-1};
  unsigned depth_{0};
  // nonzero when the data ended inside the discriminant
  unsigned missing_bits_{0};

  void check_readable();
};

UnionView open_lazy_union(const Codec& codec, const Ref<Cell>& cell, const TypeLayout& layout,
                          const UnpackOptions& options = {});
UnionView open_lazy_union(const Codec& codec, const CellSlice& cs, const TypeLayout& layout,
                          const UnpackOptions& options = {});

const char* get_state_name(UnionView::State state);
std::ostream& operator<<(std::ostream& os, UnionView::State state);

// arms of a match over a union, or over a single record with an opcode
std::size_t match_arm_count(const TypeLayout& layout);
// throws LayoutError(unknown_type) if variant_name is not a variant of layout
int match_arm_index(const TypeLayout& layout, const std::string& variant_name);

}  // namespace tolk
