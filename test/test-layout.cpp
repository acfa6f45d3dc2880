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
#include <sstream>
#include "test-common.h"
#include "tolk/cells/CellSlice.h"
#include "tolk/layout/LayoutRegistry.h"

namespace tolk {
namespace {

TEST(FieldTypeParser, ParsesTolkTypes) {
  EXPECT_EQ(parse_field_type("uint32").kind, FieldKind::Uint);
  EXPECT_EQ(parse_field_type("uint32").width, 32u);
  EXPECT_EQ(parse_field_type("int7").kind, FieldKind::Int);
  EXPECT_EQ(parse_field_type("coins").to_string(), "coins");
  EXPECT_EQ(parse_field_type("varint32").width, 5u);
  EXPECT_EQ(parse_field_type("bits(len)").ref_name, "len");
  EXPECT_TRUE(parse_field_type("Cell<Foo>?").nullable);
  EXPECT_EQ(parse_field_type("map< uint32 , Cell<Foo>? >").to_string(), "map<uint32, Cell<Foo>?>");
  EXPECT_EQ(parse_field_type("Transfer").kind, FieldKind::Named);
}

TEST(FieldTypeParser, RejectsMalformedTypes) {
  EXPECT_LAYOUT_ERROR(parse_field_type("map<uint32"), ErrorCode::unknown_type);
  EXPECT_LAYOUT_ERROR(parse_field_type("uint32 x"), ErrorCode::unknown_type);
  EXPECT_LAYOUT_ERROR(parse_field_type("varuint64"), ErrorCode::unknown_type);
  EXPECT_LAYOUT_ERROR(parse_field_type(""), ErrorCode::unknown_type);
}

TEST(Opcode, ParseAndPrint) {
  auto op = Opcode::parse("0x0f8a7ea5");
  EXPECT_EQ(op.bits, 32u);
  EXPECT_EQ(op.value, 0x0f8a7ea5u);
  EXPECT_EQ(op.to_string(), "0x0f8a7ea5");
  EXPECT_EQ(Opcode::parse("0b101").to_string(), "0b101");
  EXPECT_THROW(Opcode::parse("12"), std::invalid_argument);
  EXPECT_THROW(Opcode::parse("0b102"), std::invalid_argument);
}

TEST(LayoutRegistry, RecordSize) {
  LayoutRegistry registry;
  auto& point = registry.register_record("Point", fields({{"a", "uint32"}, {"b", "bool"}}));
  EXPECT_EQ(point.size, PackSize::fixed(33));
  auto& msg = registry.register_record("Msg", fields({{"amount", "coins"}, {"body", "Cell<Point>?"}}),
                                       Opcode::parse("0x01"));
  EXPECT_EQ(msg.size.min_bits, 8u + 4u + 1u);
  EXPECT_EQ(msg.size.max_bits, 8u + 124u + 1u);
  EXPECT_EQ(msg.size.max_refs, 1u);
  EXPECT_EQ(&registry.layout_of("Point"), &point);
  EXPECT_EQ(registry.type_names(), (std::vector<std::string>{"Point", "Msg"}));
}

TEST(LayoutRegistry, UnknownType) {
  LayoutRegistry registry;
  EXPECT_LAYOUT_ERROR(registry.layout_of("Nope"), ErrorCode::unknown_type);
  EXPECT_LAYOUT_ERROR(registry.register_record("A", fields({{"x", "Nope"}})), ErrorCode::unknown_type);
  EXPECT_LAYOUT_ERROR(registry.register_record("B", fields({{"x", "Cell<Nope>"}})), ErrorCode::unknown_type);
  EXPECT_LAYOUT_ERROR(registry.register_union("U", {VariantDecl{"Nope", {}}}), ErrorCode::unknown_type);
  EXPECT_FALSE(registry.contains("A"));
}

TEST(LayoutRegistry, AmbiguousWidth) {
  LayoutRegistry registry;
  EXPECT_LAYOUT_ERROR(registry.register_record("A", fields({{"data", "bits(n)"}, {"n", "uint10"}})),
                      ErrorCode::ambiguous_width);
  EXPECT_LAYOUT_ERROR(registry.register_record("B", fields({{"n", "int10"}, {"data", "bits(n)"}})),
                      ErrorCode::ambiguous_width);
  EXPECT_LAYOUT_ERROR(registry.register_record("C", fields({{"x", "uint0"}})), ErrorCode::ambiguous_width);
  EXPECT_LAYOUT_ERROR(registry.register_record("D", fields({{"x", "uint65"}})), ErrorCode::ambiguous_width);
  EXPECT_LAYOUT_ERROR(registry.register_record("E", fields({{"rest", "remaining"}, {"x", "bool"}})),
                      ErrorCode::ambiguous_width);
  EXPECT_LAYOUT_ERROR(registry.register_record("F", fields({{"m", "map<coins, bool>"}})),
                      ErrorCode::ambiguous_width);
  EXPECT_LAYOUT_ERROR(registry.register_record("G", fields({{"x", "bits1024"}})), ErrorCode::ambiguous_width);
  EXPECT_NO_THROW(registry.register_record("H", fields({{"n", "uint10"}, {"data", "bits(n)"}})));
}

TEST(LayoutRegistry, RecordLargerThanNode) {
  LayoutRegistry registry;
  EXPECT_LAYOUT_ERROR(registry.register_record("Big", fields({{"a", "bits1000"}, {"b", "bits24"}})),
                      ErrorCode::size_exceeded);
  EXPECT_NO_THROW(registry.register_record("Full", fields({{"a", "bits1000"}, {"b", "bits23"}})));
  LayoutRegistry small{CellLimits{64, 1}};
  EXPECT_LAYOUT_ERROR(small.register_record("Refs", fields({{"a", "cell"}, {"b", "cell"}})),
                      ErrorCode::size_exceeded);
}

TEST(LayoutRegistry, DuplicateNames) {
  LayoutRegistry registry;
  registry.register_record("A", fields({{"x", "bool"}}));
  EXPECT_LAYOUT_ERROR(registry.register_record("A", {}), ErrorCode::type_check);
  EXPECT_LAYOUT_ERROR(registry.register_record("B", fields({{"x", "bool"}, {"x", "bool"}})), ErrorCode::type_check);
}

TEST(LayoutRegistry, SameDiscriminantTwice) {
  LayoutRegistry registry;
  registry.register_record("A", fields({{"x", "uint8"}}));
  registry.register_record("B", fields({{"y", "uint8"}}));
  EXPECT_LAYOUT_ERROR(registry.register_union("U", {VariantDecl{"A", Opcode{0xAB, 8}}, VariantDecl{"B", Opcode{0xAB, 8}}}),
                      ErrorCode::ambiguous_discriminant);
  EXPECT_FALSE(registry.contains("U"));
}

TEST(LayoutRegistry, PrefixDiscriminant) {
  LayoutRegistry registry;
  registry.register_record("A", {});
  registry.register_record("B", {});
  EXPECT_LAYOUT_ERROR(registry.register_union("U", {VariantDecl{"A", Opcode{1, 1}}, VariantDecl{"B", Opcode{2, 2}}}),
                      ErrorCode::ambiguous_discriminant);
  registry.register_record("C", {}, Opcode{0x10, 8});
  registry.register_record("D", {}, Opcode{0x1, 4});
  EXPECT_LAYOUT_ERROR(registry.register_union("V", {VariantDecl{"C", {}}, VariantDecl{"D", {}}}),
                      ErrorCode::ambiguous_discriminant);
}

TEST(LayoutRegistry, MixedPrefixes) {
  LayoutRegistry registry;
  registry.register_record("A", {}, Opcode{1, 8});
  registry.register_record("B", {});
  EXPECT_LAYOUT_ERROR(registry.register_union("U", {VariantDecl{"A", {}}, VariantDecl{"B", {}}}),
                      ErrorCode::ambiguous_discriminant);
  EXPECT_LAYOUT_ERROR(registry.register_union("V", {VariantDecl{"A", Opcode{2, 8}}}),
                      ErrorCode::ambiguous_discriminant);
  EXPECT_LAYOUT_ERROR(registry.register_union("W", {VariantDecl{"A", {}}, VariantDecl{"A", {}}}),
                      ErrorCode::ambiguous_discriminant);
}

TEST(LayoutRegistry, AutoPrefixes) {
  LayoutRegistry registry;
  registry.register_record("A", fields({{"x", "uint8"}}));
  registry.register_record("B", fields({{"y", "uint16"}}));
  registry.register_record("C", {});
  auto& u = registry.register_union("U", {VariantDecl{"A", {}}, VariantDecl{"B", {}}, VariantDecl{"C", {}}});
  ASSERT_EQ(u.variants.size(), 3u);
  for (unsigned i = 0; i < 3; i++) {
    EXPECT_TRUE(u.variants[i].assigned);
    EXPECT_EQ(u.variants[i].discriminant, (Opcode{i, 2}));
  }
  EXPECT_EQ(u.size.min_bits, 2u);
  EXPECT_EQ(u.size.max_bits, 18u);
  EXPECT_EQ(u.trie.max_depth(), 2u);
}

TEST(LayoutRegistry, TrieReadsOnlyWhatItNeeds) {
  LayoutRegistry registry;
  registry.register_record("Short", {});
  registry.register_record("Long1", {});
  registry.register_record("Long2", {});
  auto& u = registry.register_union("U", {VariantDecl{"Short", Opcode{0, 1}}, VariantDecl{"Long1", Opcode{0x80, 8}},
                                          VariantDecl{"Long2", Opcode{0x81, 8}}});
  CellSlice short_cs{cell_from_binary("0")};
  auto match = u.trie.lookup(short_cs);
  EXPECT_EQ(match.variant, 0);
  EXPECT_EQ(match.depth, 1u);
  CellSlice long_cs{cell_from_binary("10000001")};
  match = u.trie.lookup(long_cs);
  EXPECT_EQ(match.variant, 2);
  EXPECT_EQ(match.depth, 8u);
  CellSlice cut{cell_from_binary("1000")};
  match = u.trie.lookup(cut);
  EXPECT_EQ(match.variant, -1);
  EXPECT_TRUE(match.truncated);
  CellSlice miss{cell_from_binary("11")};
  match = u.trie.lookup(miss);
  EXPECT_EQ(match.variant, -1);
  EXPECT_FALSE(match.truncated);
  EXPECT_EQ(match.depth, 2u);
}

TEST(LayoutRegistry, VariantOpcodeMustAgree) {
  LayoutRegistry registry;
  registry.register_record("A", {}, Opcode{0x12, 8});
  EXPECT_LAYOUT_ERROR(registry.register_union("U", {VariantDecl{"A", Opcode{0x13, 8}}}),
                      ErrorCode::ambiguous_discriminant);
  EXPECT_NO_THROW(registry.register_union("V", {VariantDecl{"A", Opcode{0x12, 8}}}));
}

TEST(LayoutRegistry, Enums) {
  LayoutRegistry registry;
  auto& mode = registry.register_enum("Mode", 2, false, {{"Off", 0}, {"On", 1}, {"Auto", 3}});
  EXPECT_EQ(mode.size, PackSize::fixed(2));
  EXPECT_EQ(mode.find_member("Auto")->value, 3);
  EXPECT_EQ(mode.find_member(2), nullptr);
  EXPECT_LAYOUT_ERROR(registry.register_enum("E1", 2, false, {{"A", 0}, {"B", 0}}), ErrorCode::ambiguous_discriminant);
  EXPECT_LAYOUT_ERROR(registry.register_enum("E2", 2, false, {{"A", 4}}), ErrorCode::range_check);
  EXPECT_LAYOUT_ERROR(registry.register_enum("E3", 2, true, {{"A", -3}}), ErrorCode::range_check);
  EXPECT_LAYOUT_ERROR(registry.register_enum("E4", 0, false, {}), ErrorCode::ambiguous_width);
  EXPECT_LAYOUT_ERROR(registry.register_record("R", fields({{"x", "Cell<Mode>"}})), ErrorCode::type_check);
}

TEST(LayoutRegistry, Show) {
  LayoutRegistry registry;
  registry.register_record("Point", fields({{"a", "uint32"}, {"b", "bool"}}), Opcode{0x7, 4});
  std::ostringstream os;
  registry.show(os);
  EXPECT_NE(os.str().find("Point"), std::string::npos);
}

}  // namespace
}  // namespace tolk
