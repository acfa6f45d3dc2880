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
#include <gtest/gtest.h>
#include "test-common.h"
#include "tolk/codec/Codec.h"
#include "tolk/codec/LazyValue.h"
#include "tolk/dispatch/UnionView.h"

namespace tolk {
namespace {

class LazyTest : public ::testing::Test {
 protected:
  LayoutRegistry registry;
  Codec codec{registry};

  const TypeLayout& transfer() {
    registry.register_record("Body", fields({{"text", "snake"}}));
    return registry.register_record("Transfer",
                                    fields({{"query_id", "uint64"},
                                            {"amount", "coins"},
                                            {"to", "address"},
                                            {"note", "Cell<Body>?"},
                                            {"n", "uint8"},
                                            {"tag", "bits(n)"},
                                            {"flag", "bool"}}),
                                    Opcode::parse("0x0f8a7ea5"));
  }

  Value transfer_value(const TypeLayout& layout) {
    Address to;
    to.hash = BitString::parse_hex(std::string(64, '3'));
    auto note = Value::record_of(registry.layout_of("Body"), {{"text", Value::bits(BitString::parse("x{74657374}"))}});
    return Value::record_of(layout, {{"query_id", Value::uint(42)},
                                     {"amount", Value::uint(5000)},
                                     {"to", Value::address(to)},
                                     {"note", note},
                                     {"n", Value::uint(5)},
                                     {"tag", Value::bits(BitString::parse("0b10110"))},
                                     {"flag", Value::boolean(true)}});
  }
};

TEST_F(LazyTest, AgreesWithEagerDecoding) {
  auto& layout = transfer();
  auto value = transfer_value(layout);
  auto cell = codec.encode(value, layout);
  auto lazy = codec.decode_lazy(cell, layout);
  EXPECT_EQ(lazy.get("flag"), value["flag"]);
  EXPECT_EQ(lazy.get("tag"), value["tag"]);
  EXPECT_EQ(lazy.get("query_id"), value["query_id"]);
  EXPECT_EQ(lazy.to_value(), codec.decode_eager(cell, layout));
  EXPECT_EQ(lazy.to_value(), value);
}

TEST_F(LazyTest, CachedReadsAreStable) {
  auto& layout = transfer();
  auto lazy = codec.decode_lazy(codec.encode(transfer_value(layout), layout), "Transfer");
  EXPECT_FALSE(lazy.is_cached(1));
  const Value& first = lazy.get("amount");
  EXPECT_TRUE(lazy.is_cached(1));
  const Value& second = lazy.get(1);
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(second.as_uint(), 5000u);
}

TEST_F(LazyTest, SkippingDoesNotCache) {
  auto& layout = transfer();
  auto lazy = codec.decode_lazy(codec.encode(transfer_value(layout), layout), layout);
  EXPECT_EQ(lazy.positions_known(), 1u);
  EXPECT_TRUE(lazy.get("flag").as_bool());
  EXPECT_EQ(lazy.positions_known(), layout.fields.size() + 1);
  for (std::size_t i = 0; i + 1 < layout.fields.size(); i++) {
    EXPECT_FALSE(lazy.is_cached(i)) << layout.fields[i].name;
  }
  EXPECT_TRUE(lazy.is_cached(layout.fields.size() - 1));
}

TEST_F(LazyTest, FieldOffsets) {
  auto& layout = transfer();
  auto lazy = codec.decode_lazy(codec.encode(transfer_value(layout), layout), layout);
  EXPECT_EQ(lazy.offset_of(0), 0u);
  EXPECT_EQ(lazy.offset_of(1), 64u);
  // 5000 needs two bytes
  EXPECT_EQ(lazy.offset_of(2), 64u + 4u + 16u);
  EXPECT_EQ(lazy.offset_of(3), 84u + 267u);
  EXPECT_EQ(lazy.offset_of(4), 351u + 1u);
  EXPECT_EQ(lazy.offset_of(6), 352u + 8u + 5u);
  EXPECT_EQ(lazy.offset_of(7), 366u);
  EXPECT_TRUE(lazy.rest().empty_ext());
}

TEST_F(LazyTest, DynamicWidthWithoutReadingTheWidthField) {
  auto& layout = transfer();
  auto lazy = codec.decode_lazy(codec.encode(transfer_value(layout), layout), layout);
  EXPECT_EQ(lazy.get("tag").as_bits().to_binary(), "10110");
  EXPECT_FALSE(lazy.is_cached(4));
}

TEST_F(LazyTest, OpcodeCheckedWhenOpened) {
  auto& layout = transfer();
  CellBuilder cb;
  cb.store_ulong(0xdeadbeef, 32).store_zeroes(64);
  try {
    codec.decode_lazy(cb.finalize(), layout);
    FAIL() << "expected OpcodePrefixMismatch";
  } catch (const CodecError& err) {
    EXPECT_EQ(err.get_code(), ErrorCode::opcode_mismatch);
    EXPECT_EQ(err.get_exit_code(), 63);
  }
}

TEST_F(LazyTest, TruncationSurfacesOnAccess) {
  auto& layout = registry.register_record("Pair", fields({{"a", "uint32"}, {"b", "uint16"}}));
  CellBuilder cb;
  cb.store_ulong(7, 32).store_ulong(1, 8);
  auto lazy = codec.decode_lazy(cb.finalize(), layout);
  EXPECT_EQ(lazy.get("a").as_uint(), 7u);
  try {
    lazy.get("b");
    FAIL() << "expected TruncatedData";
  } catch (const CodecError& err) {
    EXPECT_EQ(err.get_code(), ErrorCode::truncated_data);
    EXPECT_EQ(err.get_path(), "b");
    EXPECT_EQ(err.get_missing_bits(), 8u);
  }
  EXPECT_FALSE(lazy.is_cached(1));
}

TEST_F(LazyTest, TruncationWhileSkipping) {
  auto& layout = registry.register_record("Pair", fields({{"a", "uint32"}, {"b", "uint16"}, {"c", "bool"}}));
  auto lazy = codec.decode_lazy(cell_from_binary(std::string(40, '1')), layout);
  try {
    lazy.get("c");
    FAIL() << "expected TruncatedData";
  } catch (const CodecError& err) {
    EXPECT_EQ(err.get_code(), ErrorCode::truncated_data);
    EXPECT_EQ(err.get_path(), "b");
  }
}

TEST_F(LazyTest, TrailingDataInToValue) {
  auto& layout = registry.register_record("Byte", fields({{"x", "uint8"}}));
  auto cell = cell_from_binary("00000010" "1");
  UnpackOptions strict;
  strict.assert_end_after_reading = true;
  auto lazy = codec.decode_lazy(cell, layout, strict);
  EXPECT_EQ(lazy.get("x").as_uint(), 2u);
  EXPECT_EQ(lazy.rest().size(), 1u);
  EXPECT_CODEC_ERROR(lazy.to_value(), ErrorCode::trailing_data);
  EXPECT_EQ(codec.decode_lazy(cell, layout).to_value()["x"].as_uint(), 2u);
}

TEST_F(LazyTest, UnknownField) {
  auto& layout = registry.register_record("Byte", fields({{"x", "uint8"}}));
  auto lazy = codec.decode_lazy(cell_from_binary("00000010"), layout);
  EXPECT_CODEC_ERROR(lazy.get("y"), ErrorCode::type_check);
  EXPECT_CODEC_ERROR(lazy.get(1), ErrorCode::type_check);
}

TEST_F(LazyTest, UnionsAreNotRecords) {
  registry.register_record("A", fields({{"x", "uint8"}}));
  registry.register_record("B", fields({{"y", "uint8"}}));
  auto& u = registry.register_union("U", {VariantDecl{"A", {}}, VariantDecl{"B", {}}});
  EXPECT_CODEC_ERROR(codec.decode_lazy(cell_from_binary("000000001"), u), ErrorCode::type_check);
}

TEST_F(LazyTest, ZeroWidthOpcodeConsumesNothing) {
  auto& layout = registry.register_record("Plain", fields({{"x", "uint8"}, {"y", "uint8"}}), Opcode{0, 0});
  EXPECT_EQ(layout.size.min_bits, 16u);
  auto value = Value::record_of(layout, {{"x", Value::uint(3)}, {"y", Value::uint(4)}});
  auto cell = codec.encode(value, layout);
  EXPECT_EQ(cell_to_binary(cell), "00000011" "00000100");
  EXPECT_EQ(codec.decode_eager(cell, layout), value);

  auto lazy = codec.decode_lazy(cell, layout);
  EXPECT_EQ(lazy.rest().size(), 0u);
  EXPECT_EQ(lazy.offset_of(2), 16u);
  EXPECT_EQ(lazy.get("x").as_uint(), 3u);
  EXPECT_EQ(lazy.to_value(), value);

  auto& u = registry.register_union("OnlyPlain", {VariantDecl{"Plain", {}}});
  auto view = open_lazy_union(codec, cell, u);
  ASSERT_TRUE(view.is_matched());
  EXPECT_EQ(view.discriminant_depth(), 0u);
  EXPECT_EQ(view.get("y").as_uint(), 4u);
  EXPECT_EQ(codec.decode_eager(cell, u), value);
}

TEST_F(LazyTest, FallbackUnionAgreesWithEagerDecode) {
  registry.register_record("A", fields({{"x", "uint8"}}));
  registry.register_record("B", fields({{"y", "uint8"}}));
  UnionPolicy policy;
  policy.on_unmatched = UnmatchedPolicy::Fallback;
  auto& u = registry.register_union("U", {VariantDecl{"A", Opcode{0x01, 8}}, VariantDecl{"B", Opcode{0x02, 8}}},
                                    policy);

  auto matched = cell_from_binary("00000010" "00001001");
  EXPECT_EQ(open_lazy_union(codec, matched, u).to_value(), codec.decode_eager(matched, u));

  auto unmatched = cell_from_binary("00000011" "00001001");
  auto eager = codec.decode_eager(unmatched, u);
  ASSERT_EQ(eager.type(), Value::Type::Unmatched);
  EXPECT_EQ(open_lazy_union(codec, unmatched, u).to_value(), eager);

  auto truncated = cell_from_binary("0000");
  try {
    codec.decode_eager(truncated, u);
    FAIL() << "expected TruncatedData";
  } catch (const CodecError& err) {
    EXPECT_EQ(err.get_code(), ErrorCode::truncated_data);
    EXPECT_EQ(err.get_missing_bits(), 4u);
  }
  try {
    open_lazy_union(codec, truncated, u).to_value();
    FAIL() << "expected TruncatedData";
  } catch (const CodecError& err) {
    EXPECT_EQ(err.get_code(), ErrorCode::truncated_data);
    EXPECT_EQ(err.get_missing_bits(), 4u);
  }

  // a union field is skipped the same way it is decoded
  auto& holder = registry.register_record("Holder", fields({{"u", "U"}, {"tail", "bool"}}));
  auto lazy = codec.decode_lazy(truncated, holder);
  EXPECT_CODEC_ERROR(lazy.get("tail"), ErrorCode::truncated_data);
}

}  // namespace
}  // namespace tolk
