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

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ctwin {
namespace ledger {

constexpr size_t kHandleSize      = 32;
constexpr size_t kCategoryKeySize = 32;

using handle_id_type    = std::array<uint8_t, kHandleSize>;
using category_key_type = std::array<uint8_t, kCategoryKeySize>;

using record_id_type  = uint64_t;
using request_id_type = uint64_t;

constexpr record_id_type  kInvalidRecordId  = 0;
constexpr request_id_type kInvalidRequestId = 0;

// What the encrypted value behind a handle is supposed to decrypt to
enum class CiphertextKind : uint8_t
{
    Scalar  = 1, // decimal number, possibly signed or fractional
    Text    = 2, // arbitrary string
    Counter = 3, // unsigned 64 bits integer
};

bool        is_valid_kind(uint8_t kind);
std::string to_string(CiphertextKind kind);

struct CiphertextHandle
{
    handle_id_type id{};
    CiphertextKind kind{CiphertextKind::Scalar};

    CiphertextHandle() = default;
    CiphertextHandle(const handle_id_type& i, CiphertextKind k)
        : id(i), kind(k)
    {
    }

    bool operator==(const CiphertextHandle& h) const
    {
        return id == h.id && kind == h.kind;
    }
    bool operator!=(const CiphertextHandle& h) const
    {
        return !(*this == h);
    }
};

std::string to_string(const CiphertextHandle& handle);

// Fields of a telemetry record, in submission order
enum RecordField : size_t
{
    kPositionField = 0,
    kTorqueField   = 1,
    kSpeedField    = 2,
    kSoilTypeField = 3,
};
constexpr size_t kRecordFieldCount = 4;

using record_fields_type = std::array<CiphertextHandle, kRecordFieldCount>;

// Kinds expected for each field of a record
extern const std::array<CiphertextKind, kRecordFieldCount> kRecordFieldKinds;

enum class RecordStatus : uint8_t
{
    Sealed        = 0,
    RevealPending = 1,
    Revealed      = 2,
};

std::string to_string(RecordStatus status);

struct EncryptedRecord
{
    record_id_type     id{kInvalidRecordId};
    record_fields_type fields;
    uint64_t           submitted_at{0};
    std::string        submitter;
    RecordStatus       status{RecordStatus::Sealed};
};

struct DecryptedRecord
{
    std::vector<std::string> cleartext;
    bool                     revealed{false};
};

struct RevealTarget
{
    enum class Kind : uint8_t
    {
        Record  = 1,
        Counter = 2,
    };

    Kind              kind{Kind::Record};
    record_id_type    record_id{kInvalidRecordId};
    category_key_type category_key{};

    static RevealTarget record(record_id_type id);
    static RevealTarget counter(const category_key_type& key);

    bool is_record() const
    {
        return kind == Kind::Record;
    }
};

std::string to_string(const RevealTarget& target);

struct DecryptionRequest
{
    request_id_type               request_id{kInvalidRequestId};
    RevealTarget                  target;
    std::vector<CiphertextHandle> ciphertexts;
};

// Running encrypted tally of the revealed records of one category
struct AggregateCounter
{
    std::string      category;
    CiphertextHandle handle;

    // last value reported by the oracle, if any
    bool            revealed{false};
    uint64_t        revealed_value{0};
    request_id_type revealed_by{kInvalidRequestId};
};

} // namespace ledger
} // namespace ctwin
