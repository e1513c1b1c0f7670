//
// CTwin - Confidential Tunnel-Boring-Machine Telemetry Ledger
// Copyright (C) 2026 CTwin contributors
//
// This file is part of CTwin.
//
// CTwin is free software: you can redistribute it and/or modify
// it under the terms of the GNU Affero General Public License as
// published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version.
//
// CTwin is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Affero General Public License for more details.
//
// You should have received a copy of the GNU Affero General Public License
// along with CTwin.  If not, see <http://www.gnu.org/licenses/>.
//

#include <ctwin/ledger/types.hpp>
#include <ctwin/utils/utils.hpp>

namespace ctwin {
namespace ledger {

const std::array<CiphertextKind, kRecordFieldCount> kRecordFieldKinds
    = {{CiphertextKind::Scalar,
        CiphertextKind::Scalar,
        CiphertextKind::Scalar,
        CiphertextKind::Text}};

bool is_valid_kind(uint8_t kind)
{
    return kind >= static_cast<uint8_t>(CiphertextKind::Scalar)
           && kind <= static_cast<uint8_t>(CiphertextKind::Counter);
}

std::string to_string(CiphertextKind kind)
{
    switch (kind) {
    case CiphertextKind::Scalar:
        return "scalar";
    case CiphertextKind::Text:
        return "text";
    case CiphertextKind::Counter:
        return "counter";
    }
    return "unknown";
}

std::string to_string(const CiphertextHandle& handle)
{
    return to_string(handle.kind) + ":" + utility::hex_string(handle.id);
}

std::string to_string(RecordStatus status)
{
    switch (status) {
    case RecordStatus::Sealed:
        return "sealed";
    case RecordStatus::RevealPending:
        return "reveal-pending";
    case RecordStatus::Revealed:
        return "revealed";
    }
    return "unknown";
}

RevealTarget RevealTarget::record(record_id_type id)
{
    RevealTarget t;
    t.kind      = Kind::Record;
    t.record_id = id;
    return t;
}

RevealTarget RevealTarget::counter(const category_key_type& key)
{
    RevealTarget t;
    t.kind         = Kind::Counter;
    t.category_key = key;
    return t;
}

std::string to_string(const RevealTarget& target)
{
    if (target.is_record()) {
        return "record #" + std::to_string(target.record_id);
    }
    return "counter " + utility::hex_string(target.category_key);
}

} // namespace ledger
} // namespace ctwin
