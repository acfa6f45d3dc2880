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
#include "tolk/cells/boc.h"
#include <algorithm>
#include <map>
#include <vector>
#include "td/utils/base64.h"
#include "td/utils/crypto.h"

namespace tolk {

namespace {

struct CellInfo {
  Ref<Cell> cell;
  std::vector<unsigned> ref_idx;
};

class BocWriter {
 public:
  void add_root(const Ref<Cell>& root) {
    visit(root);
  }

  // reverse post-order: every cell precedes the cells it references
  std::vector<CellInfo> finish() {
    std::reverse(order_.begin(), order_.end());
    std::map<Cell::Hash, unsigned> idx;
    for (unsigned i = 0; i < order_.size(); i++) {
      idx[order_[i]->get_hash()] = i;
    }
    std::vector<CellInfo> res;
    for (auto& cell : order_) {
      CellInfo info{cell, {}};
      for (unsigned j = 0; j < cell->size_refs(); j++) {
        info.ref_idx.push_back(idx.at(cell->get_ref(j)->get_hash()));
      }
      res.push_back(std::move(info));
    }
    return res;
  }

 private:
  std::map<Cell::Hash, bool> seen_;
  std::vector<Ref<Cell>> order_;

  void visit(const Ref<Cell>& cell) {
    if (!seen_.emplace(cell->get_hash(), true).second) {
      return;
    }
    for (unsigned i = cell->size_refs(); i > 0; i--) {
      visit(cell->get_ref(i - 1));
    }
    order_.push_back(cell);
  }
};

unsigned bytes_for(unsigned long long value) {
  unsigned res = 1;
  while (res < 8 && (value >> (res * 8))) {
    ++res;
  }
  return res;
}

void store_uint(std::string& out, unsigned long long value, unsigned bytes) {
  for (unsigned i = bytes; i > 0; i--) {
    out.push_back((char)((value >> ((i - 1) * 8)) & 0xff));
  }
}

class BocReader {
 public:
  explicit BocReader(td::Slice data) : data_(data) {
  }
  bool have(std::size_t bytes) const {
    return pos_ + bytes <= data_.size();
  }
  unsigned long long read_uint(unsigned bytes) {
    unsigned long long res = 0;
    for (unsigned i = 0; i < bytes; i++) {
      res = (res << 8) | data_.ubegin()[pos_++];
    }
    return res;
  }
  const unsigned char* cur() const {
    return data_.ubegin() + pos_;
  }
  void skip(std::size_t bytes) {
    pos_ += bytes;
  }
  std::size_t pos() const {
    return pos_;
  }

 private:
  td::Slice data_;
  std::size_t pos_{0};
};

}  // namespace

td::Result<std::string> std_boc_serialize(const Ref<Cell>& root, int mode) {
  if (!root) {
    return td::Status::Error("cannot serialize a null cell");
  }
  BocWriter writer;
  writer.add_root(root);
  auto cells = writer.finish();
  unsigned size_bytes = bytes_for(cells.size());

  std::string body;
  std::vector<unsigned long long> offsets;
  for (auto& info : cells) {
    body.push_back((char)info.cell->get_d1());
    body.push_back((char)info.cell->get_d2());
    body += info.cell->serialized_data();
    for (unsigned idx : info.ref_idx) {
      store_uint(body, idx, size_bytes);
    }
    offsets.push_back(body.size());
  }
  unsigned off_bytes = bytes_for(body.size());
  bool with_index = mode & BagOfCells::WithIndex;
  bool with_crc = mode & BagOfCells::WithCRC32C;

  std::string res;
  store_uint(res, BagOfCells::boc_generic_magic, 4);
  res.push_back((char)((with_index ? 0x80 : 0) | (with_crc ? 0x40 : 0) | size_bytes));
  res.push_back((char)off_bytes);
  store_uint(res, cells.size(), size_bytes);
  store_uint(res, 1, size_bytes);
  store_uint(res, 0, size_bytes);
  store_uint(res, body.size(), off_bytes);
  store_uint(res, 0, size_bytes);
  if (with_index) {
    for (auto offs : offsets) {
      store_uint(res, offs, off_bytes);
    }
  }
  res += body;
  if (with_crc) {
    td::uint32 crc = td::crc32c(td::Slice(res));
    for (int i = 0; i < 4; i++) {
      res.push_back((char)((crc >> (8 * i)) & 0xff));
    }
  }
  return res;
}

td::Result<Ref<Cell>> std_boc_deserialize(td::Slice data) {
  BocReader reader(data);
  if (!reader.have(6) || reader.read_uint(4) != BagOfCells::boc_generic_magic) {
    return td::Status::Error("invalid bag-of-cells magic");
  }
  unsigned flags = (unsigned)reader.read_uint(1);
  bool with_index = flags & 0x80;
  bool with_crc = flags & 0x40;
  bool with_cache = flags & 0x20;
  unsigned size_bytes = flags & 7;
  unsigned off_bytes = (unsigned)reader.read_uint(1);
  if (size_bytes < 1 || size_bytes > 4 || off_bytes < 1 || off_bytes > 8 || (with_cache && !with_index)) {
    return td::Status::Error("invalid bag-of-cells header");
  }
  if (!reader.have(size_bytes * 3 + off_bytes)) {
    return td::Status::Error("bag-of-cells header is truncated");
  }
  auto cell_count = (std::size_t)reader.read_uint(size_bytes);
  auto root_count = (std::size_t)reader.read_uint(size_bytes);
  auto absent_count = (std::size_t)reader.read_uint(size_bytes);
  auto total_size = (std::size_t)reader.read_uint(off_bytes);
  if (root_count < 1 || root_count > cell_count || absent_count > 0) {
    return td::Status::Error("unsupported bag-of-cells root or absent cell count");
  }
  if (!reader.have(root_count * size_bytes)) {
    return td::Status::Error("bag-of-cells root list is truncated");
  }
  auto root_idx = (std::size_t)reader.read_uint(size_bytes);
  reader.skip((root_count - 1) * size_bytes);
  if (with_index) {
    if (!reader.have(cell_count * off_bytes)) {
      return td::Status::Error("bag-of-cells index is truncated");
    }
    reader.skip(cell_count * off_bytes);
  }
  if (!reader.have(total_size + (with_crc ? 4 : 0))) {
    return td::Status::Error("bag-of-cells data is truncated");
  }
  if (with_crc) {
    std::size_t crc_pos = reader.pos() + total_size;
    td::uint32 expected = td::crc32c(data.substr(0, crc_pos));
    td::uint32 got = 0;
    for (int i = 0; i < 4; i++) {
      got |= (td::uint32)data.ubegin()[crc_pos + i] << (8 * i);
    }
    if (expected != got) {
      return td::Status::Error("bag-of-cells crc32c mismatch");
    }
  }

  struct RawCell {
    unsigned bits;
    const unsigned char* data;
    std::vector<std::size_t> refs;
  };
  std::vector<RawCell> raw;
  std::size_t body_end = reader.pos() + total_size;
  for (std::size_t i = 0; i < cell_count; i++) {
    if (reader.pos() + 2 > body_end) {
      return td::Status::Error("bag-of-cells cell descriptor is truncated");
    }
    unsigned d1 = (unsigned)reader.read_uint(1);
    unsigned d2 = (unsigned)reader.read_uint(1);
    unsigned refs = d1 & 7;
    if (refs > Cell::max_refs || (d1 & 8)) {
      return td::Status::Error("unsupported cell descriptor in bag-of-cells");
    }
    unsigned bytes = (d2 + 1) >> 1;
    if (reader.pos() + bytes + refs * size_bytes > body_end) {
      return td::Status::Error("bag-of-cells cell data is truncated");
    }
    RawCell rc{bytes * 8, reader.cur(), {}};
    if (d2 & 1) {
      // strip the completion tag
      unsigned char last = reader.cur()[bytes - 1];
      if (!last) {
        return td::Status::Error("bag-of-cells cell has an invalid completion tag");
      }
      unsigned trailing = 0;
      while (!((last >> trailing) & 1)) {
        ++trailing;
      }
      rc.bits -= trailing + 1;
    }
    reader.skip(bytes);
    for (unsigned j = 0; j < refs; j++) {
      auto idx = (std::size_t)reader.read_uint(size_bytes);
      if (idx <= i || idx >= cell_count) {
        return td::Status::Error("bag-of-cells cell references are not topologically ordered");
      }
      rc.refs.push_back(idx);
    }
    raw.push_back(std::move(rc));
  }
  if (root_idx >= cell_count) {
    return td::Status::Error("bag-of-cells root index out of range");
  }

  std::vector<Ref<Cell>> built(cell_count);
  for (std::size_t i = cell_count; i > 0; i--) {
    auto& rc = raw[i - 1];
    std::vector<Ref<Cell>> refs;
    for (auto idx : rc.refs) {
      refs.push_back(built[idx]);
    }
    built[i - 1] = Cell::create(rc.data, rc.bits, std::move(refs));
  }
  return built[root_idx];
}

std::string boc_to_base64(const Ref<Cell>& root) {
  return td::base64_encode(std_boc_serialize(root, BagOfCells::WithCRC32C).move_as_ok());
}

td::Result<Ref<Cell>> boc_from_base64(td::Slice base64) {
  TRY_RESULT(decoded, td::base64_decode(base64));
  return std_boc_deserialize(td::Slice(decoded));
}

}  // namespace tolk
