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
#include "tolk/codec/Codec.h"
#include "td/utils/logging.h"
#include "tolk/codec/LazyValue.h"
#include "tolk/codec/serializers.h"
#include "tolk/errors.h"

namespace tolk {

namespace {

template <class F>
void store_checked(CellBuilder& cb, const std::string& what, F&& store) {
  try {
    store();
  } catch (CellBuilder::CellWriteError&) {
    throw CodecError(ErrorCode::size_exceeded, what + " does not fit into the node (" +
                                                   std::to_string(cb.remaining_bits()) + " bits and " +
                                                   std::to_string(cb.remaining_refs()) + " refs left)");
  }
}

std::string describe_value(const Value& value) {
  if (value.type() == Value::Type::Record) {
    return "`" + value.as_record().layout->name + "`";
  }
  return Value::type_name(value.type());
}

}  // namespace

int find_variant(const TypeLayout& union_layout, const CellSlice& cs, unsigned* missing_bits) {
  auto match = union_layout.trie.lookup(cs);
  if (missing_bits) {
    *missing_bits = match.variant < 0 && match.truncated ? match.missing_bits : 0;
  }
  return match.variant;
}

/*
 *
 *   ENCODING
 *
 */

Ref<Cell> Codec::encode(const Value& value, const TypeLayout& layout, const PackOptions& options) const {
  CellBuilder cb{registry_.limits()};
  pack_type(cb, value, layout, options);
  return cb.finalize();
}

void Codec::pack_type(CellBuilder& cb, const Value& value, const TypeLayout& layout,
                      const PackOptions& options) const {
  switch (layout.kind) {
    case TypeLayout::Kind::Record:
      pack_record(cb, value, layout, options);
      break;
    case TypeLayout::Kind::Union:
      pack_union(cb, value, layout, options);
      break;
    case TypeLayout::Kind::Enum:
      pack_enum(cb, value, layout);
      break;
  }
}

void Codec::pack_record(CellBuilder& cb, const Value& value, const TypeLayout& layout,
                        const PackOptions& options) const {
  if (value.type() != Value::Type::Record || value.as_record().layout != &layout) {
    throw CodecError(ErrorCode::type_check, "expected a value of `" + layout.name + "`, got " + describe_value(value));
  }
  const Record& rec = value.as_record();
  if (layout.opcode && layout.opcode->bits) {
    store_checked(cb, "opcode of `" + layout.name + "`",
                  [&] { cb.store_ulong(layout.opcode->value, layout.opcode->bits); });
  }
  WidthResolver widths = [&rec](int idx) { return rec.fields[idx].as_uint(); };
  for (std::size_t i = 0; i < layout.fields.size(); i++) {
    const FieldLayout& field = layout.fields[i];
    try {
      pack_field(cb, field.type, rec.fields[i], widths, options);
    } catch (CodecError& err) {
      err.prepend_path(field.name);
      throw;
    }
  }
}

void Codec::pack_union(CellBuilder& cb, const Value& value, const TypeLayout& layout,
                       const PackOptions& options) const {
  if (value.type() == Value::Type::Unmatched) {
    const UnmatchedValue& raw = value.as_unmatched();
    if (raw.layout != &layout) {
      throw CodecError(ErrorCode::type_check,
                       "unmatched value of `" + raw.layout->name + "` stored as `" + layout.name + "`");
    }
    store_checked(cb, "unmatched `" + layout.name + "`", [&] { cb.append_cellslice(raw.raw); });
    return;
  }
  if (value.type() != Value::Type::Record) {
    throw CodecError(ErrorCode::type_check, "expected a variant of `" + layout.name + "`, got " + describe_value(value));
  }
  int idx = layout.variant_index(value.as_record().layout);
  if (idx < 0) {
    throw CodecError(ErrorCode::type_check, describe_value(value) + " is not a variant of `" + layout.name + "`");
  }
  const VariantLayout& variant = layout.variants[idx];
  if (variant.assigned && variant.discriminant.bits) {
    store_checked(cb, "discriminant of `" + variant.layout->name + "`",
                  [&] { cb.store_ulong(variant.discriminant.value, variant.discriminant.bits); });
  }
  pack_record(cb, value, *variant.layout, options);
}

void Codec::pack_enum(CellBuilder& cb, const Value& value, const TypeLayout& layout) const {
  long long x = value.as_int();
  if (!layout.find_member(x)) {
    throw CodecError(ErrorCode::range_check, std::to_string(x) + " is not a member of enum `" + layout.name + "`");
  }
  store_checked(cb, "enum `" + layout.name + "`", [&] {
    if (layout.enum_signed) {
      cb.store_long(x, layout.enum_bits);
    } else {
      cb.store_ulong((unsigned long long)x, layout.enum_bits);
    }
  });
}

void Codec::pack_field(CellBuilder& cb, const FieldType& type, const Value& value, const WidthResolver& widths,
                       const PackOptions& options) const {
  store_checked(cb, "`" + type.to_string() + "`", [&] {
    if (type.nullable) {
      cb.store_bool(!value.is_null());
      if (value.is_null()) {
        return;
      }
    } else if (value.is_null()) {
      throw CodecError(ErrorCode::type_check, "null is not a value of `" + type.to_string() + "`");
    }
    get_serializer(type.kind).pack(*this, cb, type, value, widths, options);
  });
}

/*
 *
 *   DECODING
 *
 */

Value Codec::decode_eager(const Ref<Cell>& cell, const TypeLayout& layout, const UnpackOptions& options) const {
  if (!cell) {
    throw CodecError(ErrorCode::truncated_data, "no cell to decode `" + layout.name + "` from", 0u, 1u);
  }
  CellSlice cs{cell};
  Value res = unpack_type(cs, layout, options);
  check_end(cs, layout, options);
  return res;
}

LazyValue Codec::decode_lazy(const Ref<Cell>& cell, const TypeLayout& layout, const UnpackOptions& options) const {
  if (!layout.is_record()) {
    throw CodecError(ErrorCode::type_check,
                     "`" + layout.name + "` is not a struct, unions are opened with open_lazy_union");
  }
  if (!cell) {
    throw CodecError(ErrorCode::truncated_data, "no cell to decode `" + layout.name + "` from", 0u, 1u);
  }
  CellSlice cs{cell};
  check_opcode(cs, layout, options);
  return LazyValue{*this, layout, cs, options};
}

LazyValue Codec::decode_lazy(const Ref<Cell>& cell, const std::string& type_name,
                             const UnpackOptions& options) const {
  return decode_lazy(cell, registry_.layout_of(type_name), options);
}

void Codec::check_opcode(CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const {
  if (!layout.opcode || !layout.opcode->bits) {
    return;
  }
  const Opcode& opcode = *layout.opcode;
  if (!cs.have(opcode.bits)) {
    throw CodecError(ErrorCode::truncated_data,
                     "not enough data for opcode " + opcode.to_string() + " of `" + layout.name + "`",
                     opcode.bits - cs.size(), 0u);
  }
  if (!cs.begins_with_skip(opcode.bits, opcode.value)) {
    Opcode found{cs.prefetch_ulong(opcode.bits), opcode.bits};
    throw CodecError(ErrorCode::opcode_mismatch,
                     "expected opcode " + opcode.to_string() + " of `" + layout.name + "`, found " + found.to_string(),
                     options.throw_if_opcode_does_not_match);
  }
}

void Codec::check_end(const CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const {
  if (options.assert_end_after_reading && !cs.empty_ext()) {
    throw CodecError(ErrorCode::trailing_data, std::to_string(cs.size()) + " bits and " +
                                                   std::to_string(cs.size_refs()) + " refs left after `" +
                                                   layout.name + "`");
  }
}

Value Codec::unpack_type(CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const {
  switch (layout.kind) {
    case TypeLayout::Kind::Record:
      return unpack_record(cs, layout, options);
    case TypeLayout::Kind::Union:
      return unpack_union(cs, layout, options);
    case TypeLayout::Kind::Enum:
      break;
  }
  return unpack_enum(cs, layout);
}

Value Codec::unpack_record(CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const {
  check_opcode(cs, layout, options);
  std::vector<Value> fields;
  fields.reserve(layout.fields.size());
  WidthResolver widths = [&fields](int idx) { return fields[idx].as_uint(); };
  for (const FieldLayout& field : layout.fields) {
    try {
      fields.push_back(unpack_field(cs, field.type, widths, options));
    } catch (CodecError& err) {
      err.prepend_path(field.name);
      throw;
    }
  }
  return Value::record(layout, std::move(fields));
}

Value Codec::unpack_union(CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const {
  unsigned missing_bits = 0;
  int idx = find_variant(layout, cs, &missing_bits);
  if (idx < 0) {
    // a cut-short discriminant is an error even under the fallback policy
    if (missing_bits) {
      throw CodecError(ErrorCode::truncated_data, "not enough data for the discriminant of `" + layout.name + "`",
                       missing_bits, 0u);
    }
    if (layout.policy.on_unmatched == UnmatchedPolicy::Fallback) {
      LOG(WARNING) << "union `" << layout.name << "`: no variant matches, keeping " << cs.size() << " bits and "
                   << cs.size_refs() << " refs unmatched";
      return Value::unmatched(layout, cs.fetch_subslice(cs.size(), cs.size_refs()));
    }
    throw CodecError(ErrorCode::unmatched_variant, "no variant of `" + layout.name + "` matches the data",
                     layout.policy.exit_code);
  }
  const VariantLayout& variant = layout.variants[idx];
  if (variant.assigned) {
    cs.skip(variant.discriminant.bits);
  }
  return unpack_record(cs, *variant.layout, options);
}

Value Codec::unpack_enum(CellSlice& cs, const TypeLayout& layout) const {
  if (!cs.have(layout.enum_bits)) {
    throw CodecError(ErrorCode::truncated_data, "not enough data for enum `" + layout.name + "`",
                     layout.enum_bits - cs.size(), 0u);
  }
  long long x = layout.enum_signed ? cs.fetch_long(layout.enum_bits) : (long long)cs.fetch_ulong(layout.enum_bits);
  if (!layout.find_member(x)) {
    throw CodecError(ErrorCode::range_check, std::to_string(x) + " is not a member of enum `" + layout.name + "`");
  }
  return layout.enum_signed ? Value::integer(x) : Value::uint((unsigned long long)x);
}

Value Codec::unpack_field(CellSlice& cs, const FieldType& type, const WidthResolver& widths,
                          const UnpackOptions& options) const {
  try {
    if (type.nullable && !cs.fetch_bool()) {
      return Value::null();
    }
    return get_serializer(type.kind).unpack(*this, cs, type, widths, options);
  } catch (CellSlice::CellReadError& err) {
    throw CodecError(ErrorCode::truncated_data, "not enough data for `" + type.to_string() + "`", err.missing_bits,
                     err.missing_refs);
  }
}

/*
 *
 *   SKIPPING
 *
 */

void Codec::skip_type(CellSlice& cs, const TypeLayout& layout, const UnpackOptions& options) const {
  if (layout.is_enum()) {
    if (!cs.advance(layout.enum_bits)) {
      throw CodecError(ErrorCode::truncated_data, "not enough data for enum `" + layout.name + "`",
                       layout.enum_bits - cs.size(), 0u);
    }
    return;
  }
  const TypeLayout* record = &layout;
  if (layout.is_union()) {
    int idx = find_variant(layout, cs);
    if (idx < 0) {
      // either an unmatched fallback that takes the rest, or the same error unpacking would give
      unpack_union(cs, layout, options);
      return;
    }
    const VariantLayout& variant = layout.variants[idx];
    if (variant.assigned) {
      cs.skip(variant.discriminant.bits);
    }
    record = variant.layout;
  }
  check_opcode(cs, *record, options);
  // widths of uint(f) / bits(f) are read back from the start of the width field
  std::vector<CellSlice> starts;
  starts.reserve(record->fields.size());
  WidthResolver widths;
  widths = [&](int idx) {
    CellSlice at = starts[idx];
    return unpack_field(at, record->fields[idx].type, widths, options).as_uint();
  };
  for (const FieldLayout& field : record->fields) {
    starts.push_back(cs);
    try {
      skip_field(cs, field.type, widths, options);
    } catch (CodecError& err) {
      err.prepend_path(field.name);
      throw;
    }
  }
}

void Codec::skip_field(CellSlice& cs, const FieldType& type, const WidthResolver& widths,
                       const UnpackOptions& options) const {
  try {
    if (type.nullable && !cs.fetch_bool()) {
      return;
    }
    get_serializer(type.kind).skip(*this, cs, type, widths, options);
  } catch (CellSlice::CellReadError& err) {
    throw CodecError(ErrorCode::truncated_data, "not enough data for `" + type.to_string() + "`", err.missing_bits,
                     err.missing_refs);
  }
}

}  // namespace tolk
