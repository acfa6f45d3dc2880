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
#include "tolk/cells/CellBuilder.h"
#include "tolk/cells/CellSlice.h"
#include "tolk/cells/boc.h"

namespace tolk {
namespace {

TEST(BitString, ParseAndPrint) {
  auto bs = BitString::parse("x{A5_}");
  EXPECT_EQ(bs.size(), 7u);
  EXPECT_EQ(bs.to_binary(), "1010010");
  EXPECT_EQ(bs.to_hex(), "A5_");
  EXPECT_EQ(BitString::parse("0b101").to_binary(), "101");
  EXPECT_EQ(BitString::parse("0x0F").to_ulong(), 15u);
  EXPECT_THROW(BitString::parse("012"), std::invalid_argument);
}

TEST(BitString, IntegerConversions) {
  EXPECT_EQ(BitString::from_ulong(5, 4).to_binary(), "0101");
  EXPECT_EQ(BitString::from_long(-1, 3).to_binary(), "111");
  EXPECT_EQ(BitString::from_long(-3, 8).to_long(), -3);
  auto bs = BitString::from_ulong(1, 2);
  bs.append(BitString::from_ulong(3, 2));
  EXPECT_EQ(bs.to_binary(), "0111");
  EXPECT_EQ(bs.substr(1, 2).to_binary(), "11");
  EXPECT_TRUE(BitString::parse("01").is_prefix_of(bs));
}

TEST(CellBuilder, StoresBitsAndRefs) {
  CellBuilder cb;
  cb.store_ulong(7, 32).store_bool(true);
  EXPECT_EQ(cb.size(), 33u);
  EXPECT_EQ(cb.remaining_bits(), 1023u - 33u);
  auto child = CellBuilder{}.store_ulong(1, 1).finalize();
  cb.store_ref(child);
  auto cell = cb.finalize();
  EXPECT_EQ(cell->size(), 33u);
  EXPECT_EQ(cell->size_refs(), 1u);
  EXPECT_EQ(cell->get_depth(), 1u);
  EXPECT_EQ(cell->get_ref(0)->size(), 1u);
}

TEST(CellBuilder, RangeCheckedStores) {
  CellBuilder cb;
  EXPECT_FALSE(cb.store_ulong_rchk_bool(256, 8));
  EXPECT_FALSE(cb.store_long_rchk_bool(-129, 8));
  EXPECT_TRUE(cb.store_long_rchk_bool(-128, 8));
  EXPECT_EQ(cb.size(), 8u);
}

TEST(CellBuilder, OverflowLeavesBuilderUntouched) {
  CellBuilder cb;
  cb.store_zeroes(1020);
  EXPECT_FALSE(cb.store_ulong_bool(0, 4));
  EXPECT_EQ(cb.size(), 1020u);
  EXPECT_THROW(cb.store_ones(4), CellBuilder::CellWriteError);
  EXPECT_NO_THROW(cb.store_ones(3));
  EXPECT_EQ(cb.remaining_bits(), 0u);
}

TEST(CellBuilder, CustomLimits) {
  CellBuilder cb{CellLimits{16, 1}};
  EXPECT_TRUE(cb.store_ulong_bool(0xffff, 16));
  EXPECT_FALSE(cb.store_bool_bool(false));
  auto leaf = CellBuilder{}.finalize();
  EXPECT_TRUE(cb.store_ref_bool(leaf));
  EXPECT_FALSE(cb.store_ref_bool(leaf));
}

TEST(CellBuilder, VarUint) {
  CellBuilder cb;
  EXPECT_TRUE(cb.store_var_uint_bool(1000, 4));
  EXPECT_EQ(cb.size(), 4u + 16u);
  CellSlice cs{cb.finalize()};
  EXPECT_EQ(cs.fetch_var_uint(4), 1000u);
  EXPECT_TRUE(cs.empty());
}

TEST(CellSlice, FetchAndPrefetch) {
  CellBuilder cb;
  cb.store_ulong(0xAB, 8).store_long(-2, 5).store_bool(false);
  CellSlice cs{cb.finalize()};
  EXPECT_EQ(cs.prefetch_ulong(8), 0xABu);
  EXPECT_TRUE(cs.begins_with(4, 0xA));
  EXPECT_TRUE(cs.begins_with_skip(8, 0xAB));
  EXPECT_EQ(cs.fetch_long(5), -2);
  EXPECT_FALSE(cs.fetch_bool());
  EXPECT_TRUE(cs.empty_ext());
}

TEST(CellSlice, ReadErrorCarriesShortfall) {
  CellSlice cs{CellBuilder{}.store_ulong(3, 4).finalize()};
  try {
    cs.fetch_ulong(10);
    FAIL() << "expected CellReadError";
  } catch (const CellSlice::CellReadError& err) {
    EXPECT_EQ(err.missing_bits, 6u);
    EXPECT_EQ(err.missing_refs, 0u);
  }
  EXPECT_FALSE(cs.advance(5));
  EXPECT_EQ(cs.size(), 4u);
  EXPECT_THROW(cs.fetch_ref(), CellSlice::CellReadError);
}

TEST(CellSlice, SubsliceAndToCell) {
  CellBuilder cb;
  cb.store_ulong(0x5, 4).store_ulong(0x3, 4).store_ref(CellBuilder{}.finalize());
  CellSlice cs{cb.finalize()};
  CellSlice start = cs;
  auto head = cs.fetch_subslice(4);
  EXPECT_EQ(head.to_binary(), "0101");
  EXPECT_EQ(cs.bits_since(start), 4u);
  auto tail = cs.to_cell();
  EXPECT_EQ(tail->size(), 4u);
  EXPECT_EQ(tail->size_refs(), 1u);
  EXPECT_TRUE(CellSlice{tail}.contents_equal(cs));
}

TEST(CellSlice, ToCellKeepsWideWindows) {
  CellBuilder cb{CellLimits{2048, 4}};
  cb.store_ones(1500).store_ref(CellBuilder{}.finalize());
  CellSlice cs{cb.finalize()};
  cs.skip(100);
  auto copy = cs.to_cell();
  EXPECT_EQ(copy->size(), 1400u);
  EXPECT_EQ(copy->size_refs(), 1u);
  EXPECT_TRUE(CellSlice{copy}.contents_equal(cs));
}

TEST(Cell, EmptyCellHash) {
  auto cell = CellBuilder{}.finalize();
  EXPECT_EQ(cell->get_hash_hex(), "96A296D224F285C67BEE93C30F8A309157F0DAA35DC5B87E410B78630A09CFC7");
}

TEST(Cell, HashDependsOnContents) {
  auto a = CellBuilder{}.store_ulong(1, 8).finalize();
  auto b = CellBuilder{}.store_ulong(1, 8).finalize();
  auto c = CellBuilder{}.store_ulong(1, 9).finalize();
  EXPECT_TRUE(a->equals(*b));
  EXPECT_FALSE(a->equals(*c));
}

TEST(BagOfCells, RoundTrip) {
  CellBuilder inner;
  inner.store_ulong(0xdeadbeef, 32);
  auto leaf = inner.finalize();
  CellBuilder cb;
  cb.store_ulong(5, 7).store_ref(leaf).store_ref(leaf);
  auto root = cb.finalize();
  for (int mode : {0, (int)BagOfCells::WithCRC32C, (int)(BagOfCells::WithIndex | BagOfCells::WithCRC32C)}) {
    auto r_boc = std_boc_serialize(root, mode);
    ASSERT_TRUE(r_boc.is_ok());
    auto r_cell = std_boc_deserialize(r_boc.ok());
    ASSERT_TRUE(r_cell.is_ok()) << r_cell.error().message().str();
    EXPECT_TRUE(r_cell.ok()->equals(*root));
  }
  auto r_root = boc_from_base64(boc_to_base64(root));
  ASSERT_TRUE(r_root.is_ok());
  EXPECT_EQ(r_root.ok()->get_hash_hex(), root->get_hash_hex());
}

TEST(BagOfCells, RejectsGarbage) {
  EXPECT_TRUE(std_boc_deserialize(td::Slice("not a bag of cells")).is_error());
  EXPECT_TRUE(boc_from_base64(td::Slice("@@@")).is_error());
}

TEST(BagOfCells, DetectsCorruptedChecksum) {
  auto root = CellBuilder{}.store_ulong(42, 16).finalize();
  auto r_boc = std_boc_serialize(root, BagOfCells::WithCRC32C);
  ASSERT_TRUE(r_boc.is_ok());
  std::string data = r_boc.move_as_ok();
  data[data.size() - 6] ^= 1;
  EXPECT_TRUE(std_boc_deserialize(data).is_error());
}

}  // namespace
}  // namespace tolk
