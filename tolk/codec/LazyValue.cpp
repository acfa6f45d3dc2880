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
#include "tolk/codec/LazyValue.h"
#include "tolk/errors.h"

namespace tolk {

void LazyValue::bind(const Codec& codec, const TypeLayout& layout, CellSlice body, UnpackOptions options) {
  codec_ = &codec;
  layout_ = &layout;
  options_ = options;
  positions_.clear();
  positions_.push_back(std::move(body));
  cache_.assign(layout.fields.size(), std::nullopt);
}

WidthResolver LazyValue::resolver() {
  return [this](int idx) { return width_of(idx); };
}

// width fields precede the fields using them, so their start is always located
unsigned long long LazyValue::width_of(int idx) {
  if (cache_[idx]) {
    return cache_[idx]->as_uint();
  }
  CellSlice at = positions_[idx];
  return codec_->unpack_field(at, layout_->fields[idx].type, resolver(), options_).as_uint();
}

void LazyValue::locate(std::size_t idx) {
  while (positions_.size() <= idx) {
    std::size_t i = positions_.size() - 1;
    const FieldLayout& field = layout_->fields[i];
    CellSlice cs = positions_[i];
    try {
      codec_->skip_field(cs, field.type, resolver(), options_);
    } catch (CodecError& err) {
      err.prepend_path(field.name);
      throw;
    }
    positions_.push_back(std::move(cs));
  }
}

const Value& LazyValue::get(std::size_t idx) {
  if (idx >= size()) {
    throw CodecError(ErrorCode::type_check,
                     "`" + layout_->name + "` has no field #" + std::to_string(idx));
  }
  if (cache_[idx]) {
    return *cache_[idx];
  }
  locate(idx);
  const FieldLayout& field = layout_->fields[idx];
  CellSlice cs = positions_[idx];
  Value value;
  try {
    value = codec_->unpack_field(cs, field.type, resolver(), options_);
  } catch (CodecError& err) {
    err.prepend_path(field.name);
    throw;
  }
  if (positions_.size() == idx + 1) {
    positions_.push_back(std::move(cs));
  }
  cache_[idx] = std::move(value);
  return *cache_[idx];
}

const Value& LazyValue::get(const std::string& name) {
  int idx = layout_->field_index(name);
  if (idx < 0) {
    throw CodecError(ErrorCode::type_check, "`" + layout_->name + "` has no field `" + name + "`");
  }
  return get((std::size_t)idx);
}

unsigned LazyValue::offset_of(std::size_t idx) {
  if (idx > size()) {
    throw CodecError(ErrorCode::type_check,
                     "`" + layout_->name + "` has no field #" + std::to_string(idx));
  }
  locate(idx);
  return positions_[idx].bits_since(positions_[0]);
}

CellSlice LazyValue::rest() {
  locate(size());
  return positions_[size()];
}

Value LazyValue::to_value() {
  std::vector<Value> fields;
  fields.reserve(size());
  for (std::size_t i = 0; i < size(); i++) {
    fields.push_back(get(i));
  }
  codec_->check_end(rest(), *layout_, options_);
  return Value::record(*layout_, std::move(fields));
}

}  // namespace tolk
