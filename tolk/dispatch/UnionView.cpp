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
#include "tolk/dispatch/UnionView.h"
#include <ostream>
#include "td/utils/logging.h"
#include "tolk/errors.h"

namespace tolk {

UnionView::UnionView(const Codec& codec, const TypeLayout& layout, CellSlice cs, UnpackOptions options)
    : codec_(&codec), union_layout_(&layout), options_(options), raw_(std::move(cs)) {
  if (layout.is_enum()) {
    throw CodecError(ErrorCode::type_check, "enum `" + layout.name + "` cannot be matched by variant");
  }
  // until a variant is selected the view exposes no fields
  static const TypeLayout unselected{};
  bind(codec, unselected, raw_, options);
}

void UnionView::open() {
  if (state_ != State::Unopened) {
    return;
  }
  CellSlice body = raw_;
  const TypeLayout* record = nullptr;
  state_ = State::DiscriminantRead;
  if (union_layout_->is_union()) {
    auto match = union_layout_->trie.lookup(body);
    depth_ = match.depth;
    variant_ = match.variant;
    missing_bits_ = match.variant < 0 && match.truncated ? match.missing_bits : 0;
    if (variant_ < 0) {
      LOG(DEBUG) << "union `" << union_layout_->name << "`: no variant after " << depth_ << " bits";
      return;
    }
    const VariantLayout& variant = union_layout_->variants[variant_];
    if (variant.assigned) {
      body.skip(variant.discriminant.bits);
    }
    record = variant.layout;
  } else {
    unsigned bits = union_layout_->opcode ? union_layout_->opcode->bits : 0;
    if (!body.have(bits)) {
      depth_ = body.size();
      missing_bits_ = bits - body.size();
      return;
    }
    depth_ = bits;
    if (bits && !body.begins_with(bits, union_layout_->opcode->value)) {
      return;
    }
    variant_ = 0;
    record = union_layout_;
  }
  codec_->check_opcode(body, *record, options_);
  bind(*codec_, *record, body, options_);
  state_ = State::VariantSelected;
}

const TypeLayout& UnionView::variant_layout() const {
  if (!is_matched()) {
    fail_unmatched();
  }
  return get_layout();
}

int UnionView::exit_code() const {
  return union_layout_->is_union() ? union_layout_->policy.exit_code : options_.throw_if_opcode_does_not_match;
}

void UnionView::fail_unmatched() const {
  if (missing_bits_) {
    throw CodecError(ErrorCode::truncated_data,
                     "not enough data for the discriminant of `" + union_layout_->name + "`", missing_bits_, 0u);
  }
  if (is_matched()) {
    throw CodecError(ErrorCode::unmatched_variant,
                     "no arm handles `" + get_layout().name + "` of `" + union_layout_->name + "`", exit_code());
  }
  if (union_layout_->is_record()) {
    throw CodecError(ErrorCode::opcode_mismatch, "opcode of `" + union_layout_->name + "` does not match",
                     exit_code());
  }
  throw CodecError(ErrorCode::unmatched_variant, "no variant of `" + union_layout_->name + "` matches the data",
                   exit_code());
}

void UnionView::check_readable() {
  open();
  if (state_ == State::Closed) {
    throw CodecError(ErrorCode::type_check, "view of `" + union_layout_->name + "` is closed");
  }
  if (!is_matched()) {
    fail_unmatched();
  }
  state_ = State::FieldsBeingAccessed;
}

const Value& UnionView::get(std::size_t idx) {
  check_readable();
  return LazyValue::get(idx);
}

const Value& UnionView::get(const std::string& name) {
  check_readable();
  return LazyValue::get(name);
}

Value UnionView::to_value() {
  open();
  if (state_ == State::Closed) {
    throw CodecError(ErrorCode::type_check, "view of `" + union_layout_->name + "` is closed");
  }
  if (!is_matched() && union_layout_->is_union() && !missing_bits_ &&
      union_layout_->policy.on_unmatched == UnmatchedPolicy::Fallback) {
    return Value::unmatched(*union_layout_, raw_);
  }
  check_readable();
  return LazyValue::to_value();
}

UnionView open_lazy_union(const Codec& codec, const CellSlice& cs, const TypeLayout& layout,
                          const UnpackOptions& options) {
  UnionView view{codec, layout, cs, options};
  view.open();
  return view;
}

UnionView open_lazy_union(const Codec& codec, const Ref<Cell>& cell, const TypeLayout& layout,
                          const UnpackOptions& options) {
  if (!cell) {
    throw CodecError(ErrorCode::truncated_data, "no cell to open `" + layout.name + "` from", 0u, 1u);
  }
  return open_lazy_union(codec, CellSlice{cell}, layout, options);
}

const char* get_state_name(UnionView::State state) {
  switch (state) {
    case UnionView::State::Unopened:
      return "Unopened";
    case UnionView::State::DiscriminantRead:
      return "DiscriminantRead";
    case UnionView::State::VariantSelected:
      return "VariantSelected";
    case UnionView::State::FieldsBeingAccessed:
      return "FieldsBeingAccessed";
    case UnionView::State::Closed:
      return "Closed";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, UnionView::State state) {
  return os << get_state_name(state);
}

std::size_t match_arm_count(const TypeLayout& layout) {
  return layout.is_union() ? layout.variants.size() : 1;
}

int match_arm_index(const TypeLayout& layout, const std::string& variant_name) {
  int idx = -1;
  if (layout.is_union()) {
    idx = layout.variant_index(variant_name);
  } else if (layout.is_record() && layout.name == variant_name) {
    idx = 0;
  }
  if (idx < 0) {
    throw LayoutError(ErrorCode::unknown_type, layout.name, "`" + variant_name + "` is not a variant");
  }
  return idx;
}

}  // namespace tolk
