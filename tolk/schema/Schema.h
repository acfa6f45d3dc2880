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
#include <memory>
#include <nlohmann/json.hpp>
#include "td/utils/Slice.h"
#include "td/utils/Status.h"
#include "tolk/layout/LayoutRegistry.h"

namespace tolk {

using json = nlohmann::json;

/*
 * Schema document:
 *
 *   {
 *     "limits": {"max_bits": 1023, "max_refs": 4},
 *     "types": [
 *       {"kind": "struct", "name": "Transfer", "opcode": "0x0f8a7ea5",
 *        "fields": [{"name": "query_id", "type": "uint64"}, {"name": "amount", "type": "coins"}]},
 *       {"kind": "enum", "name": "Mode", "bits": 2, "signed": false,
 *        "members": [{"name": "Off", "value": 0}, {"name": "On", "value": 1}]},
 *       {"kind": "union", "name": "Msg", "variants": ["Transfer", {"type": "Burn", "prefix": "0b01"}],
 *        "on_unmatched": "error", "exit_code": 63}
 *     ]
 *   }
 *
 * Types are registered in document order.
 */

td::Result<json> parse_json(td::Slice text);
// "limits" of the document, canonical limits if absent
td::Result<CellLimits> parse_limits(const json& schema);
// registers every type of the document, or none of them: on failure the types this call
// registered are dropped again and the registry is left as it was
td::Status load_schema(const json& schema, LayoutRegistry& registry);
td::Result<std::unique_ptr<LayoutRegistry>> create_registry(const json& schema);
// inverse of load_schema
json schema_to_json(const LayoutRegistry& registry);

}  // namespace tolk
