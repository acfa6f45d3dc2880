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
#include "tolk/schema/Schema.h"

namespace tolk {

// JSON form of values:
//   integers -> numbers, bool -> true/false, null -> null
//   bitsN / snake -> "x{HEX}" (with the `_` completion tag when not nibble-aligned)
//   address -> "0:HEX64", enum -> member name
//   cell, Cell<T> stored as raw cell, remaining -> {"boc": base64}
//   struct -> {"$type": name, field: ...}, unmatched union data -> {"$type": union, "$unmatched": base64 boc}
//   map -> [{"key": ..., "value": ...}, ...] in key order
json value_to_json(const Codec& codec, const Value& value, const TypeLayout& layout);
json field_to_json(const Codec& codec, const Value& value, const FieldType& type);

td::Result<Value> value_from_json(const Codec& codec, const json& obj, const TypeLayout& layout);
// throws CodecError(type_check) or json::exception
Value field_from_json(const Codec& codec, const json& obj, const FieldType& type);

}  // namespace tolk
