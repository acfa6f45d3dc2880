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
#include <string>
#include "tolk/cells/CellBuilder.h"
#include "tolk/cells/CellSlice.h"
#include "tolk/codec/Value.h"
#include "tolk/layout/LayoutRegistry.h"

namespace tolk {

class LazyValue;

struct PackOptions {
  // store bitsN / bits(f) values of any length as they are
  bool skip_bits_n_validation{false};
};

struct UnpackOptions {
  // fail with TrailingData if the top-level node has unread bits or refs after decoding
  bool assert_end_after_reading{false};
  // exit code of an opcode mismatch
  int throw_if_opcode_does_not_match{63};
};

// value of an earlier field of the same record, by field index; used by uint(f) and bits(f)
using WidthResolver = std::function<unsigned long long(int)>;

// Encodes and decodes Values according to the layouts of one registry.
// The codec keeps no per-call state; any number of calls may share one instance.
class Codec {
 public:
  explicit Codec(const LayoutRegistry& registry) : registry_(registry) {
  }

  const LayoutRegistry& registry() const {
    return registry_;
  }

  Ref<Cell> encode(const Value& value, const TypeLayout& layout, const PackOptions& options = {}) const;
  Ref<Cell> encode(const Value& value, const std::string& type_name, const PackOptions& options = {}) const {
    return encode(value, registry_.layout_of(type_name), options);
  }
  // reads every field up front
  Value decode_eager(const Ref<Cell>& cell, const TypeLayout& layout, const UnpackOptions& options = {}) const;
  Value decode_eager(const Ref<Cell>& cell, const std::string& type_name, const UnpackOptions& options = {}) const {
    return decode_eager(cell, registry_.layout_of(type_name), options);
  }
  // checks the opcode now, reads fields on first access; records only
  LazyValue decode_lazy(const Ref<Cell>& cell, const TypeLayout& layout, const UnpackOptions& options = {}) const;
  LazyValue decode_lazy(const Ref<Cell>& cell, const std::string& type_name,
                        const UnpackOptions& options = {}) const;

  // a whole record, union or enum, inline
  void pack_type(CellBuilder& cb, const Value& value, const TypeLayout& layout, const PackOptions& options) const;
  Value unpack_type(CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const;
  void skip_type(CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const;

  // one field; CellWriteError / CellReadError come out as CodecError
  void pack_field(CellBuilder& cb, const FieldType& type, const Value& value, const WidthResolver& widths,
                  const PackOptions& options) const;
  Value unpack_field(CellSlice& cs, const FieldType& type, const WidthResolver& widths,
                     const UnpackOptions& options) const;
  void skip_field(CellSlice& cs, const FieldType& type, const WidthResolver& widths,
                  const UnpackOptions& options) const;

  // consumes the record opcode, if any
  void check_opcode(CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const;
  // the top-level end check of assert_end_after_reading
  void check_end(const CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const;

 private:
  const LayoutRegistry& registry_;

  void pack_record(CellBuilder& cb, const Value& value, const TypeLayout& layout, const PackOptions& options) const;
  void pack_union(CellBuilder& cb, const Value& value, const TypeLayout& layout, const PackOptions& options) const;
  void pack_enum(CellBuilder& cb, const Value& value, const TypeLayout& layout) const;
  Value unpack_record(CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const;
  Value unpack_union(CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const;
  Value unpack_enum(CellSlice& cs, const TypeLayout& layout) const;
};

// index of the variant whose discriminant starts cs, or -1; missing_bits is set to the shortfall
// when cs ends inside a discriminant, and to 0 otherwise
int find_variant(const TypeLayout& union_layout, const CellSlice& cs, unsigned* missing_bits = nullptr);

}  // namespace tolk
