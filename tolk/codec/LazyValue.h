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
#include <optional>
#include <string>
#include <vector>
#include "tolk/codec/Codec.h"

namespace tolk {

// A record whose fields are decoded on first access.
//
// Two pieces of state are kept apart: positions_ holds the cursor at the start of every field
// located so far (it only grows, field by field, by skipping), and cache_ holds the values of
// the fields actually read. Skipping a field never fills the cache, reading a field twice
// never touches the data again.
class LazyValue {
 public:
  LazyValue(const Codec& codec, const TypeLayout& layout, CellSlice body, UnpackOptions options) {
    bind(codec, layout, std::move(body), options);
  }

  const TypeLayout& get_layout() const {
    return *layout_;
  }
  std::size_t size() const {
    return layout_->fields.size();
  }

  // throws CodecError(type_check) for an unknown field
  const Value& get(std::size_t idx);
  const Value& get(const std::string& name);
  bool is_cached(std::size_t idx) const {
    return idx < cache_.size() && cache_[idx].has_value();
  }
  // start positions found so far, the record start included
  std::size_t positions_known() const {
    return positions_.size();
  }
  // bit offset of field idx from the first field
  unsigned offset_of(std::size_t idx);
  // the record's data past its last field
  CellSlice rest();
  // all fields, as decode_eager would return them, with the end check of the options
  Value to_value();

 protected:
  LazyValue() = default;
  void bind(const Codec& codec, const TypeLayout& layout, CellSlice body, UnpackOptions options);

 private:
  const Codec* codec_{nullptr};
  const TypeLayout* layout_{nullptr};
  UnpackOptions options_;
  std::vector<CellSlice> positions_;
  std::vector<std::optional<Value>> cache_;

  void locate(std::size_t idx);
  unsigned long long width_of(int idx);
  WidthResolver resolver();
};

}  // namespace tolk
