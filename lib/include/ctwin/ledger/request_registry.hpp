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
#include <ctwin/utils/rocksdb_wrapper.hpp>

#include <rocksdb/write_batch.h>

#include <map>
#include <vector>

namespace ctwin {
namespace ledger {

// Outstanding decryption requests, keyed by their request id.
//
// Ids come from a single persistent sequence shared by record and counter
// reveals; the target is kept in the entry, so two requests can never be
// confused whatever their target. An entry is removed when its callback is
// consumed and its id is never handed out again.
class DecryptionRequestRegistry
{
public:
    explicit DecryptionRequestRegistry(const utility::RocksDBStore& db);

    DecryptionRequestRegistry(const DecryptionRequestRegistry&) = delete;
    DecryptionRequestRegistry& operator=(const DecryptionRequestRegistry&)
        = delete;

    request_id_type mint(const RevealTarget&           target,
                         std::vector<CiphertextHandle> ciphertexts,
                         rocksdb::WriteBatch&          batch);

    // nullptr if the request was never minted or was already consumed
    const DecryptionRequest* find(request_id_type request_id) const;

    void retire(request_id_type request_id, rocksdb::WriteBatch& batch);

    // Outstanding request targeting the record, if any
    bool pending_for_record(record_id_type   id,
                            request_id_type& request_id) const;

    std::vector<DecryptionRequest> pending() const;

    size_t pending_count() const
    {
        return pending_.size();
    }

    request_id_type last_request_id() const
    {
        return last_request_id_;
    }

    void reload(const utility::RocksDBStore& db);

private:
    std::map<request_id_type, DecryptionRequest> pending_;
    std::map<record_id_type, request_id_type>    pending_records_;

    request_id_type last_request_id_{kInvalidRequestId};
};

} // namespace ledger
} // namespace ctwin
