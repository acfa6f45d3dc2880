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
#include <algorithm>
#include <map>
#include <random>
#include "test-common.h"
#include "tolk/codec/Codec.h"
#include "tolk/dict/Dictionary.h"
#include "tolk/dict/Map.h"

namespace tolk {
namespace {

class MapTest : public ::testing::Test {
 protected:
  LayoutRegistry registry;
  Codec codec{registry};

  Map uint_map(const char* key = "uint32", const char* value = "uint32") {
    return Map{codec, parse_field_type(key), parse_field_type(value)};
  }
  Map with_keys(std::initializer_list<unsigned long long> keys) {
    Map map = uint_map();
    for (auto k : keys) {
      map = map.set(Value::uint(k), Value::uint(k * 10));
    }
    return map;
  }
};

TEST_F(MapTest, NearestKeys) {
  Map map = with_keys({1, 3, 5});
  auto next = map.next(Value::uint(3));
  ASSERT_TRUE(next);
  EXPECT_EQ(next.key.as_uint(), 5u);
  EXPECT_EQ(next.value.as_uint(), 50u);
  auto same = map.next_or_equal(Value::uint(3));
  ASSERT_TRUE(same);
  EXPECT_EQ(same.key.as_uint(), 3u);
  EXPECT_FALSE(map.next(Value::uint(5)));
  EXPECT_EQ(map.next(Value::uint(0)).key.as_uint(), 1u);
  EXPECT_EQ(map.next_or_equal(Value::uint(4)).key.as_uint(), 5u);

  EXPECT_EQ(map.prev(Value::uint(3)).key.as_uint(), 1u);
  EXPECT_EQ(map.prev_or_equal(Value::uint(3)).key.as_uint(), 3u);
  EXPECT_EQ(map.prev_or_equal(Value::uint(4)).key.as_uint(), 3u);
  EXPECT_FALSE(map.prev(Value::uint(1)));
  EXPECT_EQ(map.prev(Value::uint(0xffffffff)).key.as_uint(), 5u);

  EXPECT_EQ(map.first().key.as_uint(), 1u);
  EXPECT_EQ(map.last().key.as_uint(), 5u);
}

TEST_F(MapTest, EmptyMap) {
  Map map = uint_map();
  EXPECT_TRUE(map.is_empty());
  EXPECT_EQ(map.size(), 0u);
  EXPECT_FALSE(map.get(Value::uint(1)));
  EXPECT_FALSE(map.first());
  EXPECT_FALSE(map.last());
  EXPECT_FALSE(map.next(Value::uint(1)));
  EXPECT_FALSE(map.prev_or_equal(Value::uint(1)));
  auto removed = map.remove(Value::uint(1));
  EXPECT_FALSE(removed.second);
  EXPECT_TRUE(removed.first.is_empty());
}

TEST_F(MapTest, Persistence) {
  Map empty = uint_map();
  Map one = empty.set(Value::uint(7), Value::uint(70));
  Map two = one.set(Value::uint(8), Value::uint(80));
  Map changed = two.set(Value::uint(7), Value::uint(71));
  EXPECT_TRUE(empty.is_empty());
  EXPECT_EQ(one.size(), 1u);
  EXPECT_EQ(two.size(), 2u);
  EXPECT_EQ(two.get(Value::uint(7)).value.as_uint(), 70u);
  EXPECT_EQ(changed.get(Value::uint(7)).value.as_uint(), 71u);
  Map back = changed.remove(Value::uint(8)).first.set(Value::uint(7), Value::uint(70));
  EXPECT_TRUE(back == one);
  EXPECT_EQ(back.dict().get_root_cell()->get_hash_hex(), one.dict().get_root_cell()->get_hash_hex());
}

TEST_F(MapTest, ConditionalWrites) {
  Map map = with_keys({1});
  auto added = map.set_if_absent(Value::uint(1), Value::uint(99));
  EXPECT_FALSE(added.second);
  EXPECT_EQ(added.first.get(Value::uint(1)).value.as_uint(), 10u);
  added = map.set_if_absent(Value::uint(2), Value::uint(20));
  EXPECT_TRUE(added.second);
  EXPECT_EQ(added.first.size(), 2u);

  auto replaced = map.set_if_present(Value::uint(2), Value::uint(20));
  EXPECT_FALSE(replaced.second);
  EXPECT_FALSE(replaced.first.get(Value::uint(2)));
  replaced = map.set_if_present(Value::uint(1), Value::uint(11));
  EXPECT_TRUE(replaced.second);
  EXPECT_EQ(replaced.first.get(Value::uint(1)).value.as_uint(), 11u);

  auto removed = added.first.remove(Value::uint(1));
  EXPECT_TRUE(removed.second);
  EXPECT_EQ(removed.first.size(), 1u);
  EXPECT_FALSE(removed.first.get(Value::uint(1)));
  EXPECT_EQ(added.first.size(), 2u);
}

TEST_F(MapTest, IteratesInKeyOrder) {
  Map map = with_keys({900, 3, 77, 0, 4000000000ULL});
  std::vector<unsigned long long> keys;
  map.for_each([&](const Value& key, const Value& value) {
    EXPECT_EQ(value.as_uint(), key.as_uint() * 10);
    keys.push_back(key.as_uint());
  });
  EXPECT_EQ(keys, (std::vector<unsigned long long>{0, 3, 77, 900, 4000000000ULL}));
}

TEST_F(MapTest, SignedKeysInNumericOrder) {
  Map map = uint_map("int8", "bool");
  for (long long k : {5, -1, 0, -128, 127, -7}) {
    map = map.set(Value::integer(k), Value::boolean(k < 0));
  }
  std::vector<long long> keys;
  map.for_each([&](const Value& key, const Value&) { keys.push_back(key.as_int()); });
  EXPECT_EQ(keys, (std::vector<long long>{-128, -7, -1, 0, 5, 127}));
  EXPECT_EQ(map.first().key.as_int(), -128);
  EXPECT_EQ(map.last().key.as_int(), 127);
  EXPECT_EQ(map.next(Value::integer(-1)).key.as_int(), 0);
  EXPECT_EQ(map.prev(Value::integer(0)).key.as_int(), -1);
  EXPECT_EQ(map.prev_or_equal(Value::integer(-2)).key.as_int(), -7);
  EXPECT_TRUE(map.get(Value::integer(-7)).value.as_bool());
}

TEST_F(MapTest, BitsKeys) {
  Map map = uint_map("bits4", "uint8");
  map = map.set(Value::bits(BitString::parse("0b1010")), Value::uint(1));
  auto found = map.first();
  ASSERT_TRUE(found);
  EXPECT_EQ(found.key.as_bits().to_binary(), "1010");
}

TEST_F(MapTest, RecordValues) {
  auto& point = registry.register_record("Point", fields({{"x", "int16"}, {"y", "int16"}}));
  Map map = uint_map("uint8", "Point");
  auto p = Value::record_of(point, {{"x", Value::integer(-3)}, {"y", Value::integer(4)}});
  map = map.set(Value::uint(1), p);
  EXPECT_EQ(map.get(Value::uint(1)).value, p);
  EXPECT_CODEC_ERROR(map.set(Value::uint(2), Value::uint(1)), ErrorCode::type_check);
}

TEST_F(MapTest, KeyChecks) {
  Map map = uint_map("uint16", "uint8");
  try {
    map.set(Value::uint(70000), Value::uint(1));
    FAIL() << "expected a range error";
  } catch (const CodecError& err) {
    EXPECT_EQ(err.get_code(), ErrorCode::range_check);
    EXPECT_EQ(err.get_path(), "key");
  }
  EXPECT_CODEC_ERROR(map.get(Value::integer(-1)), ErrorCode::range_check);
  EXPECT_LAYOUT_ERROR(uint_map("coins", "uint8"), ErrorCode::ambiguous_width);
  EXPECT_LAYOUT_ERROR(uint_map("uint8", "Missing"), ErrorCode::unknown_type);
}

TEST_F(MapTest, StoredInRecords) {
  auto& layout = registry.register_record("Balances", fields({{"owner", "uint8"}, {"items", "map<uint16, coins>"}}));
  Map empty{codec, parse_field_type("uint16"), parse_field_type("coins")};
  auto none = Value::record_of(layout, {{"owner", Value::uint(1)}, {"items", empty.to_value()}});
  auto cell = codec.encode(none, layout);
  EXPECT_EQ(cell_to_binary(cell), "00000001" "0");
  EXPECT_EQ(cell->size_refs(), 0u);

  Map items = empty.set(Value::uint(10), Value::uint(1000)).set(Value::uint(20), Value::uint(2000));
  auto some = Value::record_of(layout, {{"owner", Value::uint(1)}, {"items", items.to_value()}});
  cell = codec.encode(some, layout);
  EXPECT_EQ(cell->size(), 9u);
  EXPECT_EQ(cell->size_refs(), 1u);
  auto decoded = codec.decode_eager(cell, layout);
  auto map = Map::from_field(codec, layout.field("items").type, decoded["items"]);
  EXPECT_EQ(map.size(), 2u);
  EXPECT_EQ(map.get(Value::uint(20)).value.as_uint(), 2000u);
  EXPECT_EQ(decoded, some);
}

TEST_F(MapTest, AgreesWithStdMap) {
  std::mt19937 rnd(239);
  std::uniform_int_distribution<int> key_dist(0, 255);
  std::uniform_int_distribution<int> op_dist(0, 3);
  Map map = uint_map("uint8", "uint16");
  std::map<unsigned, unsigned> expected;
  for (int i = 0; i < 2000; i++) {
    unsigned k = (unsigned)key_dist(rnd);
    unsigned v = (unsigned)i & 0xffff;
    switch (op_dist(rnd)) {
      case 0:
        map = map.set(Value::uint(k), Value::uint(v));
        expected[k] = v;
        break;
      case 1: {
        auto res = map.remove(Value::uint(k));
        EXPECT_EQ(res.second, expected.erase(k) > 0);
        map = res.first;
        break;
      }
      case 2: {
        auto res = map.next(Value::uint(k));
        auto it = expected.upper_bound(k);
        ASSERT_EQ((bool)res, it != expected.end()) << "next(" << k << ")";
        if (res) {
          EXPECT_EQ(res.key.as_uint(), it->first);
          EXPECT_EQ(res.value.as_uint(), it->second);
        }
        break;
      }
      default: {
        auto res = map.prev_or_equal(Value::uint(k));
        auto it = expected.upper_bound(k);
        bool exists = it != expected.begin();
        ASSERT_EQ((bool)res, exists) << "prev_or_equal(" << k << ")";
        if (exists) {
          --it;
          EXPECT_EQ(res.key.as_uint(), it->first);
        }
      }
    }
  }
  EXPECT_EQ(map.size(), expected.size());
}

unsigned max_node_bits(const Ref<Cell>& cell) {
  unsigned res = cell->size();
  for (unsigned i = 0; i < cell->size_refs(); i++) {
    res = std::max(res, max_node_bits(cell->get_ref(i)));
  }
  return res;
}

TEST(MapLimits, NodesFollowTheRegistryLimits) {
  LayoutRegistry registry{CellLimits{40, 2}};
  Codec codec{registry};

  Map wide{codec, parse_field_type("uint32"), parse_field_type("uint32")};
  EXPECT_EQ(wide.dict().limits(), registry.limits());
  // a 32-bit key label next to a 32-bit value does not fit into 40 bits
  EXPECT_CODEC_ERROR(wide.set(Value::uint(7), Value::uint(9)), ErrorCode::size_exceeded);

  Map narrow{codec, parse_field_type("uint8"), parse_field_type("uint8")};
  for (unsigned long long k : {1, 2, 200, 77}) {
    narrow = narrow.set(Value::uint(k), Value::uint(k + 1));
  }
  EXPECT_EQ(narrow.size(), 4u);
  EXPECT_LE(max_node_bits(narrow.dict().get_root_cell()), 40u);
  EXPECT_EQ(narrow.get(Value::uint(200)).value.as_uint(), 201u);
  auto removed = narrow.remove(Value::uint(2));
  EXPECT_TRUE(removed.second);
  EXPECT_EQ(removed.first.dict().limits(), registry.limits());
  EXPECT_LE(max_node_bits(removed.first.dict().get_root_cell()), 40u);

  // a dictionary built elsewhere is rebound to the registry's limits
  Dictionary canonical{8};
  canonical = canonical.set(BitString::from_ulong(5, 8), CellSlice{CellBuilder{}.store_ulong(6, 8).finalize()});
  Map adopted{codec, parse_field_type("uint8"), parse_field_type("uint8"), canonical};
  EXPECT_EQ(adopted.dict().limits(), registry.limits());
  EXPECT_EQ(adopted.get(Value::uint(5)).value.as_uint(), 6u);
}

TEST(Dictionary, RejectsEntriesOverItsLimits) {
  Dictionary dict{8, CellLimits{24, 2}};
  CellBuilder value;
  value.store_ulong(3, 8);
  auto small = dict.set_builder(BitString::from_ulong(1, 8), value);
  EXPECT_EQ(small.limits(), dict.limits());
  value.store_ulong(0, 8);
  EXPECT_CODEC_ERROR(dict.set_builder(BitString::from_ulong(1, 8), value), ErrorCode::size_exceeded);
}

TEST(Dictionary, RawAccess) {
  Dictionary dict{16};
  CellBuilder cb;
  cb.store_ulong(0xabcd, 16);
  bool changed = false;
  auto one = dict.set_builder(BitString::from_ulong(5, 16), cb, Dictionary::SetMode::Add, &changed);
  EXPECT_TRUE(changed);
  auto value = one.lookup(BitString::from_ulong(5, 16));
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(value->prefetch_ulong(16), 0xabcdu);
  EXPECT_FALSE(one.lookup(BitString::from_ulong(6, 16)).has_value());
  EXPECT_TRUE(dict.is_empty());

  auto with_ref = one.set_ref(BitString::from_ulong(6, 16), cell_from_binary("1"));
  auto ref_value = with_ref.lookup(BitString::from_ulong(6, 16));
  ASSERT_TRUE(ref_value.has_value());
  EXPECT_EQ(ref_value->size_refs(), 1u);

  std::optional<CellSlice> old;
  auto removed = with_ref.lookup_delete(BitString::from_ulong(5, 16), &old);
  ASSERT_TRUE(old.has_value());
  EXPECT_EQ(old->prefetch_ulong(16), 0xabcdu);
  EXPECT_EQ(removed.size(), 1u);
  EXPECT_CODEC_ERROR(dict.lookup(BitString::from_ulong(5, 8)), ErrorCode::type_check);
}

TEST(Dictionary, StoreAndFetch) {
  Dictionary dict{8};
  for (unsigned k : {1u, 2u, 200u}) {
    CellBuilder cb;
    cb.store_bool(k > 100);
    dict = dict.set_builder(BitString::from_ulong(k, 8), cb);
  }
  CellBuilder cb;
  ASSERT_TRUE(dict.append_to(cb));
  cb.store_ulong(3, 2);
  CellSlice cs{cb.finalize()};
  auto fetched = Dictionary::fetch_from(cs, 8);
  EXPECT_TRUE(fetched == dict);
  EXPECT_EQ(cs.fetch_ulong(2), 3u);
  EXPECT_EQ(fetched.size(), 3u);
  auto max = fetched.get_minmax_key(true);
  ASSERT_TRUE(max.has_value());
  EXPECT_EQ(max->first.to_ulong(), 200u);

  CellBuilder empty;
  ASSERT_TRUE(Dictionary{8}.append_to(empty));
  EXPECT_EQ(empty.size(), 1u);
  EXPECT_EQ(empty.size_refs(), 0u);
}

TEST(Dictionary, Labels) {
  struct Case {
    const char* label;
    unsigned max_len;
    unsigned encoded_bits;
  };
  // hml_short, hml_same, hml_long and an empty label
  for (const Case& c : {Case{"1", 16, 4}, Case{"0000000", 16, 8}, Case{"1010101010", 16, 17}, Case{"", 8, 2}}) {
    BitString label = BitString::parse_binary(c.label);
    CellBuilder cb;
    dict::store_label(cb, label, c.max_len);
    EXPECT_EQ(cb.size(), c.encoded_bits) << c.label;
    CellSlice cs{cb.finalize()};
    EXPECT_EQ(dict::fetch_label(cs, c.max_len), label) << c.label;
    EXPECT_TRUE(cs.empty());
  }
}

TEST(Dictionary, RejectsOverlongLabel) {
  CellBuilder cb;
  cb.store_ulong(0, 1).store_ones(9).store_zeroes(1).store_zeroes(9);
  CellSlice cs{cb.finalize()};
  EXPECT_CODEC_ERROR(dict::fetch_label(cs, 8), ErrorCode::type_check);
}

}  // namespace
}  // namespace tolk
