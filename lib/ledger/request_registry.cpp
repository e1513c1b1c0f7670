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

#include <ctwin/ledger/errors.hpp>
#include <ctwin/ledger/request_registry.hpp>
#include <ctwin/ledger/serialization.hpp>
#include <ctwin/utils/logger.hpp>
#include <ctwin/utils/utils.hpp>

#include <limits>
#include <stdexcept>

namespace ctwin {
namespace ledger {

DecryptionRequestRegistry::DecryptionRequestRegistry(
    const utility::RocksDBStore& db)
{
    reload(db);
}

void DecryptionRequestRegistry::reload(const utility::RocksDBStore& db)
{
    pending_.clear();
    pending_records_.clear();
    last_request_id_ = kInvalidRequestId;

    std::string sequence;
    if (db.get(kRequestSequenceKey, sequence)
        && !decode_u64(sequence, last_request_id_)) {
        throw std::runtime_error("Corrupted request sequence");
    }

    db.scan(kRequestPrefix,
            [this](const std::string& key, const std::string& value) {
                DecryptionRequest request;
                if (!decode_value(value, request)) {
                    throw std::runtime_error("Corrupted request entry: key "
                                             + utility::hex_string(key));
                }
                if (request.request_id > last_request_id_) {
                    throw std::runtime_error(
                        "Request #" + std::to_string(request.request_id)
                        + " is ahead of the request sequence");
                }
                if (request.target.is_record()) {
                    pending_records_[request.target.record_id]
                        = request.request_id;
                }
                pending_.emplace(request.request_id, std::move(request));
            });

    logger::logger()->debug("Loaded {} pending decryption requests",
                            pending_.size());
}

request_id_type DecryptionRequestRegistry::mint(
    const RevealTarget&           target,
    std::vector<CiphertextHandle> ciphertexts,
    rocksdb::WriteBatch&          batch)
{
    if (last_request_id_ == std::numeric_limits<request_id_type>::max()) {
        /* LCOV_EXCL_START */
        throw LedgerError(ErrorCode::ResourceExhausted,
                          "request identifier space exhausted");
        /* LCOV_EXCL_STOP */
    }

    DecryptionRequest request;
    request.request_id  = last_request_id_ + 1;
    request.target      = target;
    request.ciphertexts = std::move(ciphertexts);

    batch.Put(kRequestSequenceKey, encode_u64(request.request_id));
    batch.Put(request_key(request.request_id), encode_value(request));

    last_request_id_ = request.request_id;
    if (target.is_record()) {
        pending_records_[target.record_id] = request.request_id;
    }
    pending_.emplace(request.request_id, std::move(request));

    return last_request_id_;
}

const DecryptionRequest* DecryptionRequestRegistry::find(
    request_id_type request_id) const
{
    auto it = pending_.find(request_id);
    if (it == pending_.end()) {
        return nullptr;
    }
    return &it->second;
}

void DecryptionRequestRegistry::retire(request_id_type      request_id,
                                       rocksdb::WriteBatch& batch)
{
    auto it = pending_.find(request_id);
    if (it == pending_.end()) {
        throw LedgerError(ErrorCode::UnknownRequest,
                          "request #" + std::to_string(request_id)
                              + " is not outstanding");
    }

    if (it->second.target.is_record()) {
        pending_records_.erase(it->second.target.record_id);
    }
    pending_.erase(it);

    batch.Delete(request_key(request_id));
}

bool DecryptionRequestRegistry::pending_for_record(
    record_id_type   id,
    request_id_type& request_id) const
{
    auto it = pending_records_.find(id);
    if (it == pending_records_.end()) {
        return false;
    }
    request_id = it->second;
    return true;
}

std::vector<DecryptionRequest> DecryptionRequestRegistry::pending() const
{
    std::vector<DecryptionRequest> requests;
    requests.reserve(pending_.size());
    for (const auto& entry : pending_) {
        requests.push_back(entry.second);
    }
    return requests;
}

} // namespace ledger
} // namespace ctwin
