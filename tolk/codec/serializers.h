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
#include "tolk/codec/Codec.h"

namespace tolk {

// Per-kind packing of a non-nullable field. The presence bit of T? is handled by Codec::pack_field.
// Low-level cell errors propagate unchanged; Codec translates them.
class ISerializer {
 public:
  virtual ~ISerializer() = default;

  virtual void pack(const Codec& codec, CellBuilder& cb, const FieldType& type, const Value& value,
                    const WidthResolver& widths, const PackOptions& options) const = 0;
  virtual Value unpack(const Codec& codec, CellSlice& cs, const FieldType& type, const WidthResolver& widths,
                       const UnpackOptions& options) const = 0;
  // reads only what is needed to find the end of the field
  virtual void skip(const Codec& codec, CellSlice& cs, const FieldType& type, const WidthResolver& widths,
                    const UnpackOptions& options) const = 0;
};

const ISerializer& get_serializer(FieldKind kind);

// chained-ref continuation of a bit string that does not fit the current node
void store_snake(CellBuilder& cb, const BitString& data, unsigned offs);
BitString load_snake(CellSlice& cs);

}  // namespace tolk
