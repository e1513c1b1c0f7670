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

#include <ctwin/ledger/serialization.hpp>
#include <ctwin/utils/logger.hpp>

#include <algorithm>
#include <string>
#include <iterator>

namespace ctwin {
namespace ledger {

const char* kRecordPrefix       = "r/";
const char* kDecryptedPrefix    = "d/";
const char* kRequestPrefix      = "q/";
const char* kCounterPrefix      = "c/";
const char* kRequestSequenceKey = "m/request_sequence";

namespace {

void append_int(std::string& out, uint64_t v, size_t width)
{
    for (size_t i = 0; i < width; i++) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

bool read_int(std::string::const_iterator&       begin,
              const std::string::const_iterator& end,
              size_t                             width,
              uint64_t&                          v)
{
    if (std::distance(begin, end) < static_cast<std::ptrdiff_t>(width)) {
        return false;
    }
    v = 0;
    for (size_t i = 0; i < width; i++, ++begin) {
        v |= static_cast<uint64_t>(static_cast<uint8_t>(*begin)) << (8 * i);
    }
    return true;
}

void append_string(std::string& out, const std::string& s)
{
    append_int(out, s.size(), 4);
    out += s;
}

bool read_string(std::string::const_iterator&       begin,
                 const std::string::const_iterator& end,
                 std::string&                       s)
{
    uint64_t length;
    if (!read_int(begin, end, 4, length)) {
        return false;
    }
    if (std::distance(begin, end) < static_cast<std::ptrdiff_t>(length)) {
        return false;
    }
    s.assign(begin, begin + static_cast<std::ptrdiff_t>(length));
    begin += static_cast<std::ptrdiff_t>(length);
    return true;
}

template<size_t N>
bool read_array(std::string::const_iterator&       begin,
                const std::string::const_iterator& end,
                std::array<uint8_t, N>&            a)
{
    if (std::distance(begin, end) < static_cast<std::ptrdiff_t>(N)) {
        return false;
    }
    std::copy(begin, begin + N, a.begin());
    begin += N;
    return true;
}

std::string big_endian_u64(uint64_t v)
{
    std::string out(8, '\0');
    for (size_t i = 0; i < 8; i++) {
        out[7 - i] = static_cast<char>((v >> (8 * i)) & 0xFF);
    }
    return out;
}

} // namespace

std::string serialization<CiphertextHandle>::serialize(
    const CiphertextHandle& handle)
{
    std::string out(handle.id.begin(), handle.id.end());
    out.push_back(static_cast<char>(handle.kind));
    return out;
}

bool serialization<CiphertextHandle>::deserialize(
    std::string::const_iterator&       begin,
    const std::string::const_iterator& end,
    CiphertextHandle&                  out)
{
    uint64_t kind;
    if (!read_array(begin, end, out.id) || !read_int(begin, end, 1, kind)) {
        return false;
    }
    if (!is_valid_kind(static_cast<uint8_t>(kind))) {
        logger::logger()->error("Invalid ciphertext kind when deserializing: "
                                + std::to_string(kind));
        return false;
    }
    out.kind = static_cast<CiphertextKind>(kind);
    return true;
}

std::string serialization<EncryptedRecord>::serialize(
    const EncryptedRecord& record)
{
    serialization<CiphertextHandle> handle_ser;

    std::string out;
    append_int(out, record.id, 8);
    for (const auto& field : record.fields) {
        out += handle_ser.serialize(field);
    }
    append_int(out, record.submitted_at, 8);
    append_string(out, record.submitter);
    append_int(out, static_cast<uint64_t>(record.status), 1);
    return out;
}

bool serialization<EncryptedRecord>::deserialize(
    std::string::const_iterator&       begin,
    const std::string::const_iterator& end,
    EncryptedRecord&                   out)
{
    serialization<CiphertextHandle> handle_deser;

    if (!read_int(begin, end, 8, out.id)) {
        return false;
    }
    for (auto& field : out.fields) {
        if (!handle_deser.deserialize(begin, end, field)) {
            return false;
        }
    }
    uint64_t status;
    if (!read_int(begin, end, 8, out.submitted_at)
        || !read_string(begin, end, out.submitter)
        || !read_int(begin, end, 1, status)) {
        return false;
    }
    if (status > static_cast<uint64_t>(RecordStatus::Revealed)) {
        return false;
    }
    out.status = static_cast<RecordStatus>(status);
    return true;
}

std::string serialization<DecryptedRecord>::serialize(
    const DecryptedRecord& record)
{
    std::string out;
    append_int(out, record.revealed ? 1 : 0, 1);
    append_int(out, record.cleartext.size(), 4);
    for (const auto& s : record.cleartext) {
        append_string(out, s);
    }
    return out;
}

bool serialization<DecryptedRecord>::deserialize(
    std::string::const_iterator&       begin,
    const std::string::const_iterator& end,
    DecryptedRecord&                   out)
{
    uint64_t revealed;
    uint64_t count;
    if (!read_int(begin, end, 1, revealed) || !read_int(begin, end, 4, count)) {
        return false;
    }
    out.revealed = (revealed != 0);
    out.cleartext.clear();
    for (uint64_t i = 0; i < count; i++) {
        std::string s;
        if (!read_string(begin, end, s)) {
            return false;
        }
        out.cleartext.push_back(std::move(s));
    }
    return true;
}

std::string serialization<DecryptionRequest>::serialize(
    const DecryptionRequest& request)
{
    serialization<CiphertextHandle> handle_ser;

    std::string out;
    append_int(out, request.request_id, 8);
    append_int(out, static_cast<uint64_t>(request.target.kind), 1);
    append_int(out, request.target.record_id, 8);
    out.append(request.target.category_key.begin(),
               request.target.category_key.end());
    append_int(out, request.ciphertexts.size(), 4);
    for (const auto& ct : request.ciphertexts) {
        out += handle_ser.serialize(ct);
    }
    return out;
}

bool serialization<DecryptionRequest>::deserialize(
    std::string::const_iterator&       begin,
    const std::string::const_iterator& end,
    DecryptionRequest&                 out)
{
    serialization<CiphertextHandle> handle_deser;

    uint64_t kind;
    uint64_t count;
    if (!read_int(begin, end, 8, out.request_id)
        || !read_int(begin, end, 1, kind)
        || !read_int(begin, end, 8, out.target.record_id)
        || !read_array(begin, end, out.target.category_key)
        || !read_int(begin, end, 4, count)) {
        return false;
    }
    if (kind != static_cast<uint64_t>(RevealTarget::Kind::Record)
        && kind != static_cast<uint64_t>(RevealTarget::Kind::Counter)) {
        return false;
    }
    out.target.kind = static_cast<RevealTarget::Kind>(kind);

    out.ciphertexts.clear();
    for (uint64_t i = 0; i < count; i++) {
        CiphertextHandle ct;
        if (!handle_deser.deserialize(begin, end, ct)) {
            return false;
        }
        out.ciphertexts.push_back(ct);
    }
    return true;
}

std::string serialization<AggregateCounter>::serialize(
    const AggregateCounter& counter)
{
    serialization<CiphertextHandle> handle_ser;

    std::string out;
    append_string(out, counter.category);
    out += handle_ser.serialize(counter.handle);
    append_int(out, counter.revealed ? 1 : 0, 1);
    append_int(out, counter.revealed_value, 8);
    append_int(out, counter.revealed_by, 8);
    return out;
}

bool serialization<AggregateCounter>::deserialize(
    std::string::const_iterator&       begin,
    const std::string::const_iterator& end,
    AggregateCounter&                  out)
{
    serialization<CiphertextHandle> handle_deser;

    uint64_t revealed;
    if (!read_string(begin, end, out.category)
        || !handle_deser.deserialize(begin, end, out.handle)
        || !read_int(begin, end, 1, revealed)
        || !read_int(begin, end, 8, out.revealed_value)
        || !read_int(begin, end, 8, out.revealed_by)) {
        return false;
    }
    out.revealed = (revealed != 0);
    return true;
}

std::string record_key(record_id_type id)
{
    return kRecordPrefix + big_endian_u64(id);
}

std::string decrypted_key(record_id_type id)
{
    return kDecryptedPrefix + big_endian_u64(id);
}

std::string request_key(request_id_type id)
{
    return kRequestPrefix + big_endian_u64(id);
}

std::string counter_key(const std::string& category)
{
    return kCounterPrefix + category;
}

bool id_from_key(const std::string& key, const char* prefix, uint64_t& id)
{
    const size_t prefix_length = std::char_traits<char>::length(prefix);
    if (key.size() != prefix_length + 8
        || key.compare(0, prefix_length, prefix) != 0) {
        return false;
    }
    id = 0;
    for (size_t i = prefix_length; i < key.size(); i++) {
        id = (id << 8) | static_cast<uint8_t>(key[i]);
    }
    return true;
}

std::string encode_u64(uint64_t v)
{
    std::string out;
    append_int(out, v, 8);
    return out;
}

bool decode_u64(const std::string& data, uint64_t& v)
{
    auto it = data.cbegin();
    return read_int(it, data.cend(), 8, v) && it == data.cend();
}

} // namespace ledger
} // namespace ctwin
