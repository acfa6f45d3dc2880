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
#include <utility>
#include "tolk/codec/Codec.h"
#include "tolk/dict/Dictionary.h"

namespace tolk {

struct MapEntry {
  bool found{false};
  Value key;
  Value value;

  explicit operator bool() const {
    return found;
  }
};

// map<K, V> over a Dictionary: keys are intN / uintN / bitsN, values go through the codec.
// Persistent like the Dictionary underneath: modifications return a new Map.
// Signed keys iterate in numeric order.
class Map {
 public:
  // key and value types are resolved against the codec's registry;
  // throws LayoutError for a key that is not a fixed-width integer or bit string
  Map(const Codec& codec, const FieldType& key_type, const FieldType& value_type);
  Map(const Codec& codec, const FieldType& key_type, const FieldType& value_type, Dictionary dict);
  // the map stored in a record field of type map<K, V>
  static Map from_field(const Codec& codec, const FieldType& map_type, const Value& value);

  const Dictionary& dict() const {
    return dict_;
  }
  Value to_value() const {
    return Value::dict(dict_);
  }
  bool is_empty() const {
    return dict_.is_empty();
  }
  std::size_t size() const {
    return dict_.size();
  }
  const FieldType& key_type() const {
    return key_type_;
  }
  const FieldType& value_type() const {
    return value_type_;
  }

  MapEntry get(const Value& key) const;
  Map set(const Value& key, const Value& value) const;
  // second is true if the map changed
  std::pair<Map, bool> set_if_absent(const Value& key, const Value& value) const;
  std::pair<Map, bool> set_if_present(const Value& key, const Value& value) const;
  std::pair<Map, bool> remove(const Value& key) const;

  MapEntry first() const;
  MapEntry last() const;
  MapEntry next(const Value& key) const;
  MapEntry prev(const Value& key) const;
  MapEntry next_or_equal(const Value& key) const;
  MapEntry prev_or_equal(const Value& key) const;

  void for_each(const std::function<void(const Value&, const Value&)>& func) const;

  bool operator==(const Map& other) const {
    return dict_ == other.dict_;
  }

 private:
  const Codec* codec_;
  FieldType key_type_;
  FieldType value_type_;
  Dictionary dict_;

  Map with(Dictionary dict) const {
    return Map{*codec_, key_type_, value_type_, std::move(dict), true};
  }
  Map(const Codec& codec, FieldType key_type, FieldType value_type, Dictionary dict, bool resolved);

  bool signed_keys() const {
    return key_type_.kind == FieldKind::Int;
  }
  BitString pack_key(const Value& key) const;
  Value unpack_key(const BitString& key) const;
  CellSlice pack_value(const Value& value) const;
  Value unpack_value(CellSlice cs) const;
  MapEntry entry(const std::optional<Dictionary::Entry>& found) const;
  std::pair<Map, bool> set_mode(const Value& key, const Value& value, Dictionary::SetMode mode) const;
  MapEntry nearest(const Value& key, bool fetch_next, bool allow_eq) const;
};

}  // namespace tolk
