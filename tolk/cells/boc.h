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
#include <string>
#include "td/utils/Slice.h"
#include "td/utils/Status.h"
#include "tolk/cells/Cell.h"

namespace tolk {

// Single-root bag of cells in the standard serialization (magic b5ee9c72).
struct BagOfCells {
  enum Mode { WithIndex = 1, WithCRC32C = 2 };
  static constexpr unsigned boc_generic_magic = 0xb5ee9c72;
};

td::Result<std::string> std_boc_serialize(const Ref<Cell>& root, int mode = 0);
td::Result<Ref<Cell>> std_boc_deserialize(td::Slice data);

std::string boc_to_base64(const Ref<Cell>& root);
td::Result<Ref<Cell>> boc_from_base64(td::Slice base64);

}  // namespace tolk
