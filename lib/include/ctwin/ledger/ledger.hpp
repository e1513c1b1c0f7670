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

#include <ctwin/ledger/attestation.hpp>
#include <ctwin/ledger/capabilities.hpp>
#include <ctwin/ledger/counter_module.hpp>
#include <ctwin/ledger/errors.hpp>
#include <ctwin/ledger/record_store.hpp>
#include <ctwin/ledger/request_registry.hpp>
#include <ctwin/ledger/types.hpp>
#include <ctwin/utils/rocksdb_wrapper.hpp>

#include <sse/crypto/key.hpp>

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace ctwin {
namespace ledger {

// Decides whether caller may run an operator command (submission and reveal
// requests). The default policy lets everybody through.
using AccessPolicy = std::function<bool(const std::string& caller)>;

// Confidential ledger of TBM telemetry records.
//
// All commands are serialized by a single mutex: each one runs atomically,
// and its updates reach the database in a single write batch. The oracle and
// the observer are called after the command committed and released the lock,
// so they may call back into the ledger.
//
// Record lifecycle: Sealed -> RevealPending -> Revealed. There is no timeout
// on RevealPending: a request whose answer never comes stays pending until
// redispatch_pending() sends it again.
class ConfidentialLedger
{
public:
    ConfidentialLedger(const std::string&                      db_path,
                       DecryptionOracle&                       oracle,
                       HomomorphicEvaluator&                   evaluator,
                       sse::crypto::Key<kAttestationKeySize>&& oracle_key);

    ConfidentialLedger(const ConfidentialLedger&) = delete;
    ConfidentialLedger& operator=(const ConfidentialLedger&) = delete;

    void set_observer(LedgerObserver* observer);
    void set_access_policy(AccessPolicy policy);
    // Seconds since the Unix epoch
    void set_clock(std::function<uint64_t()> clock);

    record_id_type submit_record(const record_fields_type& fields,
                                 const std::string&        caller = "");

    request_id_type request_record_reveal(record_id_type     id,
                                          const std::string& caller = "");
    request_id_type request_counter_reveal(const std::string& category,
                                           const std::string& caller = "");

    // Oracle callback
    void complete_reveal(request_id_type                 request_id,
                         const std::vector<std::string>& cleartexts,
                         const std::string&              proof);

    DecryptedRecord  get_decrypted_record(record_id_type id) const;
    bool             get_record(record_id_type id, EncryptedRecord& record) const;
    CiphertextHandle get_counter_handle(const std::string& category) const;
    bool get_counter_reveal(const std::string& category, uint64_t& value) const;

    // Consistent snapshots, taken under a single lock
    bool get_record(record_id_type   id,
                    EncryptedRecord& record,
                    DecryptedRecord& decrypted) const;
    // Throws LedgerError(UnknownCategory)
    AggregateCounter get_counter(const std::string& category) const;

    size_t                         record_count() const;
    std::vector<std::string>       categories() const;
    std::vector<DecryptionRequest> pending_requests() const;

    // Sends every outstanding request to the oracle again. Returns the number
    // of requests sent.
    size_t redispatch_pending();

    bool is_available() const;

    void flush();

private:
    void check_available() const;
    void check_operator(const std::string& caller, const char* command) const;

    void commit(rocksdb::WriteBatch& batch);
    void rollback();

    void dispatch(request_id_type                      request_id,
                  const std::vector<CiphertextHandle>& ciphertexts);

    mutable std::mutex mtx_;

    utility::RocksDBStore db_;

    DecryptionOracle&     oracle_;
    DecryptionAttestation attestation_;

    EncryptedRecordStore      records_;
    DecryptionRequestRegistry requests_;
    AggregateCounterModule    counters_;

    LedgerObserver*           observer_;
    AccessPolicy              access_policy_;
    std::function<uint64_t()> clock_;

    bool available_;
};

// Checks that every field of a submitted record has the kind the reveal will
// decode it with. Throws LedgerError(MalformedRecord).
void check_record_fields(const record_fields_type& fields);

// Checks the cleartexts returned for request against the kinds of its
// ciphertexts. Throws LedgerError(MalformedCleartext).
void check_cleartexts(const DecryptionRequest&        request,
                      const std::vector<std::string>& cleartexts);

bool is_decimal_number(const std::string& s);
bool parse_counter_value(const std::string& s, uint64_t& value);

} // namespace ledger
} // namespace ctwin
