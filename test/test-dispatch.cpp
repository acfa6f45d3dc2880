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
#include <stdexcept>
#include <string>
#include "test-common.h"
#include "tolk/codec/Codec.h"
#include "tolk/dispatch/MatchTable.h"
#include "tolk/dispatch/UnionView.h"

namespace tolk {
namespace {

class DispatchTest : public ::testing::Test {
 protected:
  LayoutRegistry registry;
  Codec codec{registry};

  // V1 and V2 selected by 8-bit prefixes 0x01 / 0x02
  const TypeLayout& two_variants(UnionPolicy policy = {}) {
    registry.register_record("V1", fields({{"a", "uint16"}}));
    registry.register_record("V2", fields({{"x", "uint8"}}));
    return registry.register_union("U", {VariantDecl{"V1", Opcode{0x01, 8}}, VariantDecl{"V2", Opcode{0x02, 8}}},
                                   policy);
  }
};

TEST_F(DispatchTest, SelectsVariantByPrefix) {
  auto& u = two_variants();
  auto view = open_lazy_union(codec, cell_from_binary("00000010" "00001001"), u);
  EXPECT_EQ(view.state(), UnionView::State::VariantSelected);
  ASSERT_TRUE(view.is_matched());
  EXPECT_EQ(view.variant_index(), 1);
  EXPECT_EQ(view.variant_layout().name, "V2");
  EXPECT_EQ(view.discriminant_depth(), 8u);
  EXPECT_EQ(view.get("x").as_uint(), 9u);
  EXPECT_EQ(view.state(), UnionView::State::FieldsBeingAccessed);
  EXPECT_EQ(view.to_value(), codec.decode_eager(cell_from_binary("00000010" "00001001"), u));
  view.close();
  EXPECT_EQ(view.state(), UnionView::State::Closed);
  EXPECT_CODEC_ERROR(view.get("x"), ErrorCode::type_check);
  EXPECT_CODEC_ERROR(view.to_value(), ErrorCode::type_check);
}

TEST_F(DispatchTest, ViewOverSlice) {
  auto& u = two_variants();
  CellSlice cs{cell_from_binary("1111" "00000001" "0000000000000011")};
  cs.skip(4);
  auto view = open_lazy_union(codec, cs, u);
  EXPECT_EQ(view.variant_layout().name, "V1");
  EXPECT_EQ(view.get(0).as_uint(), 3u);
  EXPECT_EQ(view.raw().size(), 24u);
}

TEST_F(DispatchTest, OpenIsLazyUntilCalled) {
  auto& u = two_variants();
  UnionView view{codec, u, CellSlice{cell_from_binary("00000001" "0000000000000001")}, {}};
  EXPECT_EQ(view.state(), UnionView::State::Unopened);
  EXPECT_EQ(view.discriminant_depth(), 0u);
  view.open();
  EXPECT_EQ(view.state(), UnionView::State::VariantSelected);
  view.open();
  EXPECT_EQ(view.state(), UnionView::State::VariantSelected);
  EXPECT_EQ(get_state_name(view.state()), std::string{"VariantSelected"});
}

TEST_F(DispatchTest, AutoPrefixesDisambiguate) {
  registry.register_record("A", fields({{"x", "uint8"}}));
  registry.register_record("B", fields({{"y", "bool"}}));
  registry.register_record("C", {});
  auto& u = registry.register_union("ABC", {VariantDecl{"A", {}}, VariantDecl{"B", {}}, VariantDecl{"C", {}}});

  auto& c = registry.layout_of("C");
  auto cell = codec.encode(Value::record(c, {}), u);
  EXPECT_EQ(cell_to_binary(cell), "10");
  auto view = open_lazy_union(codec, cell, u);
  EXPECT_EQ(view.variant_layout().name, "C");
  EXPECT_EQ(view.discriminant_depth(), 2u);

  auto b = open_lazy_union(codec, cell_from_binary("01" "1"), u);
  EXPECT_EQ(b.variant_layout().name, "B");
  EXPECT_TRUE(b.get("y").as_bool());
}

TEST_F(DispatchTest, UnmatchedCarriesExitCode) {
  auto& u = two_variants();
  auto view = open_lazy_union(codec, cell_from_binary("00000011" "00000000"), u);
  EXPECT_EQ(view.state(), UnionView::State::DiscriminantRead);
  EXPECT_FALSE(view.is_matched());
  EXPECT_EQ(view.variant_index(), -1);
  EXPECT_EQ(view.exit_code(), 63);
  try {
    view.get("x");
    FAIL() << "expected UnmatchedVariant";
  } catch (const CodecError& err) {
    EXPECT_EQ(err.get_code(), ErrorCode::unmatched_variant);
    EXPECT_EQ(err.get_exit_code(), 63);
  }
  EXPECT_CODEC_ERROR(view.variant_layout(), ErrorCode::unmatched_variant);
}

TEST_F(DispatchTest, CustomExitCode) {
  UnionPolicy policy;
  policy.exit_code = 0xffff;
  auto& u = two_variants(policy);
  auto view = open_lazy_union(codec, cell_from_binary("11111111"), u);
  try {
    view.to_value();
    FAIL() << "expected UnmatchedVariant";
  } catch (const CodecError& err) {
    EXPECT_EQ(err.get_code(), ErrorCode::unmatched_variant);
    EXPECT_EQ(err.get_exit_code(), 0xffff);
  }
}

TEST_F(DispatchTest, TruncatedDiscriminant) {
  auto& u = two_variants();
  auto view = open_lazy_union(codec, cell_from_binary("0000"), u);
  EXPECT_FALSE(view.is_matched());
  EXPECT_CODEC_ERROR(view.get(0), ErrorCode::truncated_data);
  EXPECT_CODEC_ERROR(view.to_value(), ErrorCode::truncated_data);
}

TEST_F(DispatchTest, FallbackViewKeepsRawData) {
  UnionPolicy policy;
  policy.on_unmatched = UnmatchedPolicy::Fallback;
  auto& u = two_variants(policy);
  auto cell = cell_from_binary("00000100" "101");
  auto value = open_lazy_union(codec, cell, u).to_value();
  ASSERT_EQ(value.type(), Value::Type::Unmatched);
  EXPECT_EQ(value.as_unmatched().raw.to_binary(), "00000100101");
  EXPECT_EQ(value, codec.decode_eager(cell, u));
}

TEST_F(DispatchTest, MatchRunsTheArmOfTheVariant) {
  auto& u = two_variants();
  MatchTable<std::string> table{u};
  table.on("V1", [](UnionView& v) { return "V1:" + std::to_string(v.get("a").as_uint()); })
      .on("V2", [](UnionView& v) { return "V2:" + std::to_string(v.get("x").as_uint()); });
  EXPECT_FALSE(table.has_else());
  EXPECT_EQ(match(codec, cell_from_binary("00000010" "00001001"), table), "V2:9");
  EXPECT_EQ(match(codec, cell_from_binary("00000001" "0000000100000000"), table), "V1:256");
  EXPECT_CODEC_ERROR(match(codec, cell_from_binary("00000000" "00000000"), table), ErrorCode::unmatched_variant);
}

TEST_F(DispatchTest, ElseArmCatchesTheRest) {
  auto& u = two_variants();
  MatchTable<int> table{u};
  table.on("V1", [](UnionView&) { return 1; }).otherwise([](UnionView& v) {
    return v.is_matched() ? 2 : -(int)v.discriminant_depth();
  });
  EXPECT_EQ(match(codec, cell_from_binary("00000001" "0000000000000000"), table), 1);
  EXPECT_EQ(match(codec, cell_from_binary("00000010" "00000000"), table), 2);
  EXPECT_EQ(match(codec, cell_from_binary("00000011"), table), -8);
  EXPECT_EQ(match(codec, cell_from_binary("1"), table), -1);
}

TEST_F(DispatchTest, MissingArmWithoutElse) {
  UnionPolicy policy;
  policy.exit_code = 100;
  auto& u = two_variants(policy);
  MatchTable<int> table{u};
  table.on("V1", [](UnionView&) { return 1; });
  try {
    match(codec, cell_from_binary("00000010" "00000000"), table);
    FAIL() << "expected UnmatchedVariant";
  } catch (const CodecError& err) {
    EXPECT_EQ(err.get_code(), ErrorCode::unmatched_variant);
    EXPECT_EQ(err.get_exit_code(), 100);
  }
}

TEST_F(DispatchTest, ArmsAreChecked) {
  auto& u = two_variants();
  MatchTable<int> table{u};
  table.on("V1", [](UnionView&) { return 1; });
  EXPECT_LAYOUT_ERROR(table.on("V1", [](UnionView&) { return 2; }), ErrorCode::ambiguous_discriminant);
  EXPECT_LAYOUT_ERROR(table.on("V3", [](UnionView&) { return 3; }), ErrorCode::unknown_type);
  table.otherwise([](UnionView&) { return 0; });
  EXPECT_LAYOUT_ERROR(table.otherwise([](UnionView&) { return 0; }), ErrorCode::ambiguous_discriminant);
}

TEST_F(DispatchTest, ViewIsClosedAfterTheArm) {
  auto& u = two_variants();
  MatchTable<int> table{u};
  table.on("V2", [](UnionView& v) -> int { throw std::runtime_error("arm failed " + v.get_layout().name); });
  auto view = open_lazy_union(codec, cell_from_binary("00000010" "00000001"), u);
  EXPECT_THROW(table(view), std::runtime_error);
  EXPECT_EQ(view.state(), UnionView::State::Closed);
  EXPECT_CODEC_ERROR(view.get("x"), ErrorCode::type_check);

  MatchTable<unsigned long long> reader{u};
  reader.otherwise([](UnionView& v) { return v.get(0).as_uint(); });
  auto other = open_lazy_union(codec, cell_from_binary("00000010" "00000001"), u);
  EXPECT_EQ(reader(other), 1u);
  EXPECT_EQ(other.state(), UnionView::State::Closed);
}

TEST_F(DispatchTest, TableOfAnotherUnion) {
  auto& u = two_variants();
  registry.register_record("W", {});
  auto& other = registry.register_union("Other", {VariantDecl{"W", Opcode{0x1, 1}}});
  MatchTable<int> table{other};
  table.otherwise([](UnionView&) { return 0; });
  auto view = open_lazy_union(codec, cell_from_binary("00000010" "00000001"), u);
  EXPECT_CODEC_ERROR(table(view), ErrorCode::type_check);
}

TEST_F(DispatchTest, RecordWithOpcodeMatchesAsSingleArm) {
  auto& transfer = registry.register_record("Transfer", fields({{"amount", "uint16"}}), Opcode{0x0f, 8});
  EXPECT_EQ(match_arm_count(transfer), 1u);
  MatchTable<unsigned long long> table{transfer};
  table.on("Transfer", [](UnionView& v) { return v.get("amount").as_uint(); });
  EXPECT_EQ(match(codec, cell_from_binary("00001111" "0000000000000101"), table), 5u);

  UnpackOptions options;
  options.throw_if_opcode_does_not_match = 0xffff;
  try {
    match(codec, cell_from_binary("00001110" "0000000000000101"), table, options);
    FAIL() << "expected OpcodePrefixMismatch";
  } catch (const CodecError& err) {
    EXPECT_EQ(err.get_code(), ErrorCode::opcode_mismatch);
    EXPECT_EQ(err.get_exit_code(), 0xffff);
  }
  EXPECT_CODEC_ERROR(match(codec, cell_from_binary("0000"), table), ErrorCode::truncated_data);
}

TEST_F(DispatchTest, EnumsCannotBeOpened) {
  auto& e = registry.register_enum("E", 2, false, {{"A", 0}, {"B", 1}});
  EXPECT_CODEC_ERROR(open_lazy_union(codec, cell_from_binary("00"), e), ErrorCode::type_check);
}

}  // namespace
}  // namespace tolk
