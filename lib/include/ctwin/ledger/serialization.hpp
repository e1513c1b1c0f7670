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

#include <ctwin/ledger/types.hpp>

#include <string>

namespace ctwin {
namespace ledger {

// Binary encoding of the ledger tables. Integers are little endian, strings
// and lists are prefixed by their 32 bits length.
template<class T>
struct serialization
{
    std::string serialize(const T&);
    bool        deserialize(std::string::const_iterator&       begin,
                            const std::string::const_iterator& end,
                            T&                                 out);
};

template<>
struct serialization<CiphertextHandle>
{
    std::string serialize(const CiphertextHandle& handle);
    bool        deserialize(std::string::const_iterator&       begin,
                            const std::string::const_iterator& end,
                            CiphertextHandle&                  out);
};

template<>
struct serialization<EncryptedRecord>
{
    std::string serialize(const EncryptedRecord& record);
    bool        deserialize(std::string::const_iterator&       begin,
                            const std::string::const_iterator& end,
                            EncryptedRecord&                   out);
};

template<>
struct serialization<DecryptedRecord>
{
    std::string serialize(const DecryptedRecord& record);
    bool        deserialize(std::string::const_iterator&       begin,
                            const std::string::const_iterator& end,
                            DecryptedRecord&                   out);
};

template<>
struct serialization<DecryptionRequest>
{
    std::string serialize(const DecryptionRequest& request);
    bool        deserialize(std::string::const_iterator&       begin,
                            const std::string::const_iterator& end,
                            DecryptionRequest&                 out);
};

template<>
struct serialization<AggregateCounter>
{
    std::string serialize(const AggregateCounter& counter);
    bool        deserialize(std::string::const_iterator&       begin,
                            const std::string::const_iterator& end,
                            AggregateCounter&                  out);
};

// Decodes a whole value, failing if bytes are left over
template<class T>
bool decode_value(const std::string& data, T& out)
{
    serialization<T> deser;
    auto             it = data.cbegin();
    return deser.deserialize(it, data.cend(), out) && it == data.cend();
}

template<class T>
std::string encode_value(const T& value)
{
    serialization<T> ser;
    return ser.serialize(value);
}

// Database keys. Numeric ids are big endian so that a prefix scan visits them
// in increasing order.
extern const char* kRecordPrefix;
extern const char* kDecryptedPrefix;
extern const char* kRequestPrefix;
extern const char* kCounterPrefix;
extern const char* kRequestSequenceKey;

std::string record_key(record_id_type id);
std::string decrypted_key(record_id_type id);
std::string request_key(request_id_type id);
std::string counter_key(const std::string& category);

// Inverse of record_key, decrypted_key and request_key
bool id_from_key(const std::string& key, const char* prefix, uint64_t& id);

std::string encode_u64(uint64_t v);
bool        decode_u64(const std::string& data, uint64_t& v);

} // namespace ledger
} // namespace ctwin
