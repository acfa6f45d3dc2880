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
#include "tolk/codec/serializers.h"
#include "tolk/errors.h"

namespace tolk {

namespace {

bool int_fits(long long x, unsigned bits) {
  if (bits >= 64) {
    return true;
  }
  long long bound = 1LL << (bits - 1);
  return x >= -bound && x < bound;
}

bool uint_fits(unsigned long long x, unsigned bits) {
  return bits >= 64 || !(x >> bits);
}

unsigned dynamic_width(const FieldType& type, const WidthResolver& widths, unsigned limit) {
  unsigned long long w = widths(type.width_field_idx);
  if (w > limit) {
    throw CodecError(ErrorCode::range_check, "width " + std::to_string(w) + " of `" + type.to_string() +
                                                 "` exceeds " + std::to_string(limit) + " bits");
  }
  return (unsigned)w;
}

void check_bits_length(const FieldType& type, const BitString& bs, unsigned width, const PackOptions& options) {
  if (!options.skip_bits_n_validation && bs.size() != width) {
    throw CodecError(ErrorCode::range_check, "`" + type.to_string() + "` needs exactly " + std::to_string(width) +
                                                 " bits, got " + std::to_string(bs.size()));
  }
}

/*
 *
 *   FIXED-WIDTH INTEGERS
 *
 */

class S_IntN final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType& type, const Value& value, const WidthResolver&,
            const PackOptions&) const override {
    long long x = value.as_int();
    if (!int_fits(x, type.width)) {
      throw CodecError(ErrorCode::range_check,
                       "integer " + std::to_string(x) + " does not fit into `" + type.to_string() + "`");
    }
    cb.store_long(x, type.width);
  }
  Value unpack(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver&,
               const UnpackOptions&) const override {
    return Value::integer(cs.fetch_long(type.width));
  }
  void skip(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver&,
            const UnpackOptions&) const override {
    cs.skip(type.width);
  }
};

class S_UintN final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType& type, const Value& value, const WidthResolver&,
            const PackOptions&) const override {
    store(cb, type, value.as_uint(), type.width);
  }
  Value unpack(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver&,
               const UnpackOptions&) const override {
    return Value::uint(cs.fetch_ulong(type.width));
  }
  void skip(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver&,
            const UnpackOptions&) const override {
    cs.skip(type.width);
  }

  static void store(CellBuilder& cb, const FieldType& type, unsigned long long x, unsigned bits) {
    if (!uint_fits(x, bits)) {
      throw CodecError(ErrorCode::range_check, "integer " + std::to_string(x) + " does not fit into `" +
                                                   type.to_string() + "` of " + std::to_string(bits) + " bits");
    }
    if (bits) {
      cb.store_ulong(x, bits);
    }
  }
};

class S_Bool final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType&, const Value& value, const WidthResolver&,
            const PackOptions&) const override {
    cb.store_bool(value.as_bool());
  }
  Value unpack(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
               const UnpackOptions&) const override {
    return Value::boolean(cs.fetch_bool());
  }
  void skip(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
            const UnpackOptions&) const override {
    cs.skip(1);
  }
};

/*
 *
 *   VARIABLE-WIDTH INTEGERS (coins and friends)
 *
 */

// len:(## width) value:(uint len*8), the payload must fit into 64 bits
void check_var_len(const CellSlice& cs, const FieldType& type) {
  unsigned len = (unsigned)cs.prefetch_ulong(type.width);
  if (len > 8) {
    throw CodecError(ErrorCode::range_check,
                     "`" + type.to_string() + "` value of " + std::to_string(len) + " bytes is wider than 64 bits");
  }
}

void skip_var(CellSlice& cs, const FieldType& type) {
  unsigned len = (unsigned)cs.fetch_ulong(type.width);
  cs.skip(len * 8);
}

class S_VarInt final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType& type, const Value& value, const WidthResolver&,
            const PackOptions&) const override {
    if (!cb.store_var_int_bool(value.as_int(), type.width)) {
      throw CellBuilder::CellWriteError{};
    }
  }
  Value unpack(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver&,
               const UnpackOptions&) const override {
    check_var_len(cs, type);
    return Value::integer(cs.fetch_var_int(type.width));
  }
  void skip(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver&,
            const UnpackOptions&) const override {
    skip_var(cs, type);
  }
};

class S_VarUint final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType& type, const Value& value, const WidthResolver&,
            const PackOptions&) const override {
    if (!cb.store_var_uint_bool(value.as_uint(), type.width)) {
      throw CellBuilder::CellWriteError{};
    }
  }
  Value unpack(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver&,
               const UnpackOptions&) const override {
    check_var_len(cs, type);
    return Value::uint(cs.fetch_var_uint(type.width));
  }
  void skip(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver&,
            const UnpackOptions&) const override {
    skip_var(cs, type);
  }
};

/*
 *
 *   BIT STRINGS
 *
 */

class S_BitsN final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType& type, const Value& value, const WidthResolver&,
            const PackOptions& options) const override {
    const BitString& bs = value.as_bits();
    check_bits_length(type, bs, type.width, options);
    cb.store_bits(bs);
  }
  Value unpack(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver&,
               const UnpackOptions&) const override {
    return Value::bits(cs.fetch_bits(type.width));
  }
  void skip(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver&,
            const UnpackOptions&) const override {
    cs.skip(type.width);
  }
};

class S_UintOf final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType& type, const Value& value, const WidthResolver& widths,
            const PackOptions&) const override {
    S_UintN::store(cb, type, value.as_uint(), dynamic_width(type, widths, 64));
  }
  Value unpack(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver& widths,
               const UnpackOptions&) const override {
    unsigned bits = dynamic_width(type, widths, 64);
    return Value::uint(bits ? cs.fetch_ulong(bits) : 0);
  }
  void skip(const Codec&, CellSlice& cs, const FieldType& type, const WidthResolver& widths,
            const UnpackOptions&) const override {
    cs.skip(dynamic_width(type, widths, 64));
  }
};

class S_BitsOf final : public ISerializer {
 public:
  void pack(const Codec& codec, CellBuilder& cb, const FieldType& type, const Value& value,
            const WidthResolver& widths, const PackOptions& options) const override {
    unsigned bits = dynamic_width(type, widths, codec.registry().limits().max_bits);
    const BitString& bs = value.as_bits();
    check_bits_length(type, bs, bits, options);
    cb.store_bits(bs);
  }
  Value unpack(const Codec& codec, CellSlice& cs, const FieldType& type, const WidthResolver& widths,
               const UnpackOptions&) const override {
    return Value::bits(cs.fetch_bits(read_width(codec, cs, type, widths)));
  }
  void skip(const Codec& codec, CellSlice& cs, const FieldType& type, const WidthResolver& widths,
            const UnpackOptions&) const override {
    cs.skip(read_width(codec, cs, type, widths));
  }

 private:
  // a width read from data that no node could hold is a shortfall, not a range error
  static unsigned read_width(const Codec& codec, const CellSlice& cs, const FieldType& type,
                             const WidthResolver& widths) {
    unsigned long long w = widths(type.width_field_idx);
    if (w > codec.registry().limits().max_bits) {
      throw CodecError(ErrorCode::truncated_data,
                       "`" + type.to_string() + "` declares " + std::to_string(w) + " bits, more than a node holds",
                       (unsigned)(codec.registry().limits().max_bits + 1 - cs.size()), 0u);
    }
    return (unsigned)w;
  }
};

/*
 *
 *   REFERENCES
 *
 */

class S_Cell final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType&, const Value& value, const WidthResolver&,
            const PackOptions&) const override {
    cb.store_ref(value.as_cell());
  }
  Value unpack(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
               const UnpackOptions&) const override {
    return Value::cell(cs.fetch_ref());
  }
  void skip(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
            const UnpackOptions&) const override {
    cs.skip(0, 1);
  }
};

// Cell<T>: T packed into a node of its own; an already built cell is stored as is
class S_CellOf final : public ISerializer {
 public:
  void pack(const Codec& codec, CellBuilder& cb, const FieldType& type, const Value& value, const WidthResolver&,
            const PackOptions& options) const override {
    if (!cb.can_extend_by(0, 1)) {
      throw CellBuilder::CellWriteError{};
    }
    if (value.type() == Value::Type::Cell) {
      cb.store_ref(value.as_cell());
    } else {
      cb.store_ref(codec.encode(value, *type.layout, options));
    }
  }
  Value unpack(const Codec& codec, CellSlice& cs, const FieldType& type, const WidthResolver&,
               const UnpackOptions& options) const override {
    return codec.decode_eager(cs.fetch_ref(), *type.layout, options);
  }
  void skip(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
            const UnpackOptions&) const override {
    cs.skip(0, 1);
  }
};

class S_Map final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType& type, const Value& value, const WidthResolver&,
            const PackOptions&) const override {
    const Dictionary& dict = value.as_dict();
    if (!dict.is_empty() && dict.key_bits() != type.key->width) {
      throw CodecError(ErrorCode::type_check, "dictionary with " + std::to_string(dict.key_bits()) +
                                                  "-bit keys stored into `" + type.to_string() + "`");
    }
    if (!dict.append_to(cb)) {
      throw CellBuilder::CellWriteError{};
    }
  }
  Value unpack(const Codec& codec, CellSlice& cs, const FieldType& type, const WidthResolver&,
               const UnpackOptions&) const override {
    return Value::dict(Dictionary::fetch_from(cs, type.key->width, codec.registry().limits()));
  }
  void skip(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
            const UnpackOptions&) const override {
    if (cs.fetch_bool()) {
      cs.skip(0, 1);
    }
  }
};

/*
 *
 *   INLINE TYPES
 *
 */

class S_Inline final : public ISerializer {
 public:
  void pack(const Codec& codec, CellBuilder& cb, const FieldType& type, const Value& value, const WidthResolver&,
            const PackOptions& options) const override {
    codec.pack_type(cb, value, *type.layout, options);
  }
  Value unpack(const Codec& codec, CellSlice& cs, const FieldType& type, const WidthResolver&,
               const UnpackOptions& options) const override {
    return codec.unpack_type(cs, *type.layout, options);
  }
  void skip(const Codec& codec, CellSlice& cs, const FieldType& type, const WidthResolver&,
            const UnpackOptions& options) const override {
    codec.skip_type(cs, *type.layout, options);
  }
};

// addr_std$10 anycast:(Maybe Anycast)=0 workchain_id:int8 address:bits256
class S_Address final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType&, const Value& value, const WidthResolver&,
            const PackOptions&) const override {
    const Address& addr = value.as_address();
    if (!int_fits(addr.workchain, 8)) {
      throw CodecError(ErrorCode::range_check, "workchain " + std::to_string(addr.workchain) + " does not fit into int8");
    }
    if (addr.hash.size() != 256) {
      throw CodecError(ErrorCode::range_check, "address hash must be 256 bits, got " + std::to_string(addr.hash.size()));
    }
    if (!cb.can_extend_by(FieldType::address_bits)) {
      throw CellBuilder::CellWriteError{};
    }
    cb.store_ulong(4, 3).store_long(addr.workchain, 8).store_bits(addr.hash);
  }
  Value unpack(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
               const UnpackOptions&) const override {
    if (!cs.have(FieldType::address_bits)) {
      throw CellSlice::CellReadError{FieldType::address_bits - cs.size(), 0};
    }
    unsigned tag = (unsigned)cs.prefetch_ulong(3);
    if (tag != 4) {
      throw CodecError(ErrorCode::type_check, "only internal addresses without anycast are supported, prefix is " +
                                                  Opcode{tag, 3}.to_string());
    }
    cs.skip(3);
    Address addr;
    addr.workchain = (int)cs.fetch_long(8);
    addr.hash = cs.fetch_bits(256);
    return Value::address(std::move(addr));
  }
  void skip(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
            const UnpackOptions&) const override {
    cs.skip(FieldType::address_bits);
  }
};

/*
 *
 *   REMAINDERS
 *
 */

class S_Remaining final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType&, const Value& value, const WidthResolver&,
            const PackOptions&) const override {
    switch (value.type()) {
      case Value::Type::Bits:
        cb.store_bits(value.as_bits());
        break;
      case Value::Type::Cell:
        cb.append_cellslice(CellSlice{value.as_cell()});
        break;
      default:
        cb.append_cellslice(value.as_slice());
    }
  }
  Value unpack(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
               const UnpackOptions&) const override {
    return Value::slice(cs.fetch_subslice(cs.size(), cs.size_refs()));
  }
  void skip(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
            const UnpackOptions&) const override {
    cs.skip(cs.size(), cs.size_refs());
  }
};

class S_Snake final : public ISerializer {
 public:
  void pack(const Codec&, CellBuilder& cb, const FieldType&, const Value& value, const WidthResolver&,
            const PackOptions&) const override {
    store_snake(cb, value.as_bits(), 0);
  }
  Value unpack(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
               const UnpackOptions&) const override {
    return Value::bits(load_snake(cs));
  }
  void skip(const Codec&, CellSlice& cs, const FieldType&, const WidthResolver&,
            const UnpackOptions&) const override {
    cs.skip(cs.size(), cs.size_refs());
  }
};

}  // namespace

void store_snake(CellBuilder& cb, const BitString& data, unsigned offs) {
  unsigned rest = data.size() - offs;
  if (rest <= cb.remaining_bits()) {
    if (!cb.store_bits_bool(data.data(), offs, rest)) {
      throw CellBuilder::CellWriteError{};
    }
    return;
  }
  if (!cb.remaining_refs() || !cb.limits().max_bits) {
    throw CodecError(ErrorCode::size_exceeded, "snake data needs a continuation ref, the node has no free slot",
                     rest - cb.remaining_bits(), 1u);
  }
  unsigned chunk = cb.remaining_bits();
  CellBuilder next{cb.limits()};
  store_snake(next, data, offs + chunk);
  if (!cb.store_bits_bool(data.data(), offs, chunk)) {
    throw CellBuilder::CellWriteError{};
  }
  cb.store_ref(next.finalize());
}

BitString load_snake(CellSlice& cs) {
  BitString res = cs.fetch_bits(cs.size());
  if (!cs.have_refs()) {
    return res;
  }
  CellSlice next{cs.fetch_ref()};
  while (true) {
    res.append(next.fetch_bits(next.size()));
    if (!next.have_refs()) {
      break;
    }
    next = CellSlice{next.prefetch_ref(0)};
  }
  return res;
}

const ISerializer& get_serializer(FieldKind kind) {
  static const S_IntN int_n{};
  static const S_UintN uint_n{};
  static const S_Bool bool_s{};
  static const S_VarInt var_int{};
  static const S_VarUint var_uint{};
  static const S_BitsN bits_n{};
  static const S_UintOf uint_of{};
  static const S_BitsOf bits_of{};
  static const S_Cell cell{};
  static const S_CellOf cell_of{};
  static const S_Map map{};
  static const S_Inline inline_type{};
  static const S_Address address{};
  static const S_Remaining remaining{};
  static const S_Snake snake{};

  switch (kind) {
    case FieldKind::Int:
      return int_n;
    case FieldKind::Uint:
      return uint_n;
    case FieldKind::Bool:
      return bool_s;
    case FieldKind::VarInt:
      return var_int;
    case FieldKind::VarUint:
      return var_uint;
    case FieldKind::Bits:
      return bits_n;
    case FieldKind::UintOf:
      return uint_of;
    case FieldKind::BitsOf:
      return bits_of;
    case FieldKind::Cell:
      return cell;
    case FieldKind::CellOf:
      return cell_of;
    case FieldKind::Map:
      return map;
    case FieldKind::Struct:
    case FieldKind::Union:
    case FieldKind::Enum:
      return inline_type;
    case FieldKind::Address:
      return address;
    case FieldKind::Remaining:
      return remaining;
    case FieldKind::Snake:
      return snake;
    case FieldKind::Named:
      break;
  }
  throw CodecError(ErrorCode::unknown_type, "type reference was not resolved by the registry");
}

}  // namespace tolk
