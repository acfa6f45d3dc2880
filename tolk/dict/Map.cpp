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
#include "tolk/dict/Map.h"
#include "tolk/errors.h"

namespace tolk {

namespace {

const WidthResolver no_widths = [](int) -> unsigned long long {
  throw CodecError(ErrorCode::ambiguous_width, "dynamic widths are not available in map keys and values");
};

}  // namespace

Map::Map(const Codec& codec, const FieldType& key_type, const FieldType& value_type)
    : Map(codec, key_type, value_type, Dictionary{}) {
}

Map::Map(const Codec& codec, const FieldType& key_type, const FieldType& value_type, Dictionary dict)
    : codec_(&codec) {
  FieldType resolved = codec.registry().resolve_type(FieldType::map(key_type, value_type));
  key_type_ = *resolved.key;
  value_type_ = *resolved.value;
  if (!dict.is_empty() && dict.key_bits() != key_type_.width) {
    throw CodecError(ErrorCode::type_check, "dictionary with " + std::to_string(dict.key_bits()) +
                                                "-bit keys used as `" + resolved.to_string() + "`");
  }
  // new nodes follow the limits of the registry, whatever the dictionary was built with
  dict_ = Dictionary{dict.get_root_cell(), key_type_.width, codec.registry().limits()};
}

Map::Map(const Codec& codec, FieldType key_type, FieldType value_type, Dictionary dict, bool)
    : codec_(&codec), key_type_(std::move(key_type)), value_type_(std::move(value_type)), dict_(std::move(dict)) {
}

Map Map::from_field(const Codec& codec, const FieldType& map_type, const Value& value) {
  if (map_type.kind != FieldKind::Map) {
    throw CodecError(ErrorCode::type_check, "`" + map_type.to_string() + "` is not a map type");
  }
  Dictionary dict = value.is_null() ? Dictionary{} : value.as_dict();
  return Map{codec, *map_type.key, *map_type.value, std::move(dict)};
}

BitString Map::pack_key(const Value& key) const {
  CellBuilder cb{codec_->registry().limits()};
  try {
    codec_->pack_field(cb, key_type_, key, no_widths, {});
  } catch (CodecError& err) {
    err.prepend_path("key");
    throw;
  }
  return BitString{cb.get_data(), 0, cb.size()};
}

Value Map::unpack_key(const BitString& key) const {
  switch (key_type_.kind) {
    case FieldKind::Int:
      return Value::integer(key.to_long());
    case FieldKind::Uint:
      return Value::uint(key.to_ulong());
    default:
      return Value::bits(key);
  }
}

CellSlice Map::pack_value(const Value& value) const {
  CellBuilder cb{codec_->registry().limits()};
  try {
    codec_->pack_field(cb, value_type_, value, no_widths, {});
  } catch (CodecError& err) {
    err.prepend_path("value");
    throw;
  }
  return CellSlice{cb.finalize()};
}

Value Map::unpack_value(CellSlice cs) const {
  try {
    return codec_->unpack_field(cs, value_type_, no_widths, {});
  } catch (CodecError& err) {
    err.prepend_path("value");
    throw;
  }
}

MapEntry Map::entry(const std::optional<Dictionary::Entry>& found) const {
  MapEntry res;
  if (found) {
    res.found = true;
    res.key = unpack_key(found->first);
    res.value = unpack_value(found->second);
  }
  return res;
}

MapEntry Map::get(const Value& key) const {
  BitString k = pack_key(key);
  auto value = dict_.lookup(k);
  MapEntry res;
  if (value) {
    res.found = true;
    res.key = key;
    res.value = unpack_value(std::move(*value));
  }
  return res;
}

std::pair<Map, bool> Map::set_mode(const Value& key, const Value& value, Dictionary::SetMode mode) const {
  bool changed = false;
  Dictionary dict = dict_.set(pack_key(key), pack_value(value), mode, &changed);
  return {with(std::move(dict)), changed};
}

Map Map::set(const Value& key, const Value& value) const {
  return set_mode(key, value, Dictionary::SetMode::Set).first;
}

std::pair<Map, bool> Map::set_if_absent(const Value& key, const Value& value) const {
  return set_mode(key, value, Dictionary::SetMode::Add);
}

std::pair<Map, bool> Map::set_if_present(const Value& key, const Value& value) const {
  return set_mode(key, value, Dictionary::SetMode::Replace);
}

std::pair<Map, bool> Map::remove(const Value& key) const {
  std::optional<CellSlice> old;
  Dictionary dict = dict_.lookup_delete(pack_key(key), &old);
  return {with(std::move(dict)), old.has_value()};
}

MapEntry Map::first() const {
  return entry(dict_.get_minmax_key(false, signed_keys()));
}

MapEntry Map::last() const {
  return entry(dict_.get_minmax_key(true, signed_keys()));
}

MapEntry Map::nearest(const Value& key, bool fetch_next, bool allow_eq) const {
  return entry(dict_.lookup_nearest_key(pack_key(key), fetch_next, allow_eq, signed_keys()));
}

MapEntry Map::next(const Value& key) const {
  return nearest(key, true, false);
}

MapEntry Map::prev(const Value& key) const {
  return nearest(key, false, false);
}

MapEntry Map::next_or_equal(const Value& key) const {
  return nearest(key, true, true);
}

MapEntry Map::prev_or_equal(const Value& key) const {
  return nearest(key, false, true);
}

void Map::for_each(const std::function<void(const Value&, const Value&)>& func) const {
  dict_.for_each(
      [&](const BitString& key, const CellSlice& value) { func(unpack_key(key), unpack_value(value)); },
      signed_keys());
}

}  // namespace tolk
