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

#include <ctwin/ledger/ledger.hpp>
#include <ctwin/utils/logger.hpp>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>

namespace ctwin {
namespace ledger {

namespace {
uint64_t system_clock_seconds()
{
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}
} // namespace

ConfidentialLedger::ConfidentialLedger(
    const std::string&                      db_path,
    DecryptionOracle&                       oracle,
    HomomorphicEvaluator&                   evaluator,
    sse::crypto::Key<kAttestationKeySize>&& oracle_key)
    : db_(db_path), oracle_(oracle), attestation_(std::move(oracle_key)),
      records_(db_), requests_(db_), counters_(db_, evaluator),
      observer_(nullptr),
      access_policy_([](const std::string& /*caller*/) { return true; }),
      clock_(system_clock_seconds), available_(true)
{
    logger::logger()->info("Ledger opened: {} records, {} categories, {} "
                           "pending decryption requests",
                           records_.size(),
                           counters_.categories().size(),
                           requests_.pending_count());
}

void ConfidentialLedger::set_observer(LedgerObserver* observer)
{
    std::lock_guard<std::mutex> lock(mtx_);
    observer_ = observer;
}

void ConfidentialLedger::set_access_policy(AccessPolicy policy)
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (policy) {
        access_policy_ = std::move(policy);
    } else {
        access_policy_ = [](const std::string& /*caller*/) { return true; };
    }
}

void ConfidentialLedger::set_clock(std::function<uint64_t()> clock)
{
    std::lock_guard<std::mutex> lock(mtx_);
    clock_ = std::move(clock);
}

void ConfidentialLedger::check_available() const
{
    if (!available_) {
        throw LedgerError(ErrorCode::Unavailable,
                          "the ledger storage failed, restart required");
    }
}

void ConfidentialLedger::check_operator(const std::string& caller,
                                        const char*        command) const
{
    if (!access_policy_(caller)) {
        logger::logger()->warn("{}: caller '{}' is not an operator",
                               command,
                               caller);
        throw LedgerError(ErrorCode::Unauthorized,
                          "'" + caller + "' may not run " + command);
    }
}

void ConfidentialLedger::commit(rocksdb::WriteBatch& batch)
{
    if (!db_.write(batch)) {
        logger::logger()->critical(
            "Unable to commit a ledger update, the ledger is now unavailable");
        available_ = false;
        rollback();
        throw LedgerError(ErrorCode::Unavailable, "unable to commit update");
    }
}

void ConfidentialLedger::rollback()
{
    try {
        records_.reload(db_);
        requests_.reload(db_);
        counters_.reload(db_);
    } catch (const std::exception& err) {
        logger::logger()->critical("Unable to reload the ledger state: "
                                   + std::string(err.what()));
        available_ = false;
    }
}

void ConfidentialLedger::dispatch(
    request_id_type                      request_id,
    const std::vector<CiphertextHandle>& ciphertexts)
{
    // The request is committed at this point: if the oracle cannot be
    // reached, it stays pending and redispatch_pending() will retry it.
    try {
        oracle_.request_decryption(request_id, ciphertexts);
    } catch (const std::exception& err) {
        logger::logger()->error("Unable to reach the decryption oracle for "
                                "request #{}: {}",
                                request_id,
                                err.what());
    }
}

record_id_type ConfidentialLedger::submit_record(
    const record_fields_type& fields,
    const std::string&        caller)
{
    record_id_type  id;
    uint64_t        submitted_at;
    LedgerObserver* observer;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        check_available();
        check_operator(caller, "submit_record");
        check_record_fields(fields);

        submitted_at = clock_();

        rocksdb::WriteBatch batch;
        try {
            id = records_.submit(fields, submitted_at, caller, batch);
        } catch (const std::exception&) {
            rollback();
            throw;
        }
        commit(batch);

        observer = observer_;
    }

    logger::logger()->info("Record #{} submitted at {}", id, submitted_at);

    if (observer) {
        observer->on_record_submitted(id, submitted_at);
    }
    return id;
}

request_id_type ConfidentialLedger::request_record_reveal(
    record_id_type     id,
    const std::string& caller)
{
    request_id_type               request_id;
    std::vector<CiphertextHandle> ciphertexts;
    LedgerObserver*               observer;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        check_available();
        check_operator(caller, "request_record_reveal");

        EncryptedRecord record;
        if (!records_.get(id, record)) {
            throw LedgerError(ErrorCode::UnknownRecord,
                              "no record #" + std::to_string(id));
        }

        if (record.status != RecordStatus::Sealed) {
            request_id_type outstanding = kInvalidRequestId;
            if (requests_.pending_for_record(id, outstanding)) {
                logger::logger()->warn(
                    "Record #{} already has the outstanding request #{}",
                    id,
                    outstanding);
            }
            throw LedgerError(ErrorCode::AlreadyRevealed,
                              "record #" + std::to_string(id) + " is "
                                  + to_string(record.status));
        }

        ciphertexts.assign(record.fields.begin(), record.fields.end());

        rocksdb::WriteBatch batch;
        try {
            request_id
                = requests_.mint(RevealTarget::record(id), ciphertexts, batch);
            records_.mark_reveal_pending(id, batch);
        } catch (const std::exception&) {
            rollback();
            throw;
        }
        commit(batch);

        observer = observer_;
    }

    logger::logger()->info("Reveal of record #{} requested: request #{}",
                           id,
                           request_id);

    dispatch(request_id, ciphertexts);

    if (observer) {
        observer->on_reveal_requested(request_id, RevealTarget::record(id), "");
    }
    return request_id;
}

request_id_type ConfidentialLedger::request_counter_reveal(
    const std::string& category,
    const std::string& caller)
{
    request_id_type               request_id;
    std::vector<CiphertextHandle> ciphertexts;
    RevealTarget                  target;
    LedgerObserver*               observer;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        check_available();
        check_operator(caller, "request_counter_reveal");

        // throws UnknownCategory
        ciphertexts.push_back(counters_.current_handle(category));
        target = RevealTarget::counter(
            AggregateCounterModule::category_key(category));

        rocksdb::WriteBatch batch;
        try {
            request_id = requests_.mint(target, ciphertexts, batch);
        } catch (const std::exception&) {
            rollback();
            throw;
        }
        commit(batch);

        observer = observer_;
    }

    logger::logger()->info("Reveal of counter '{}' requested: request #{}",
                           category,
                           request_id);

    dispatch(request_id, ciphertexts);

    if (observer) {
        observer->on_reveal_requested(request_id, target, category);
    }
    return request_id;
}

void ConfidentialLedger::complete_reveal(
    request_id_type                 request_id,
    const std::vector<std::string>& cleartexts,
    const std::string&              proof)
{
    DecryptionRequest request;
    std::string       category;
    uint64_t          counter_value = 0;
    bool              counter_set   = false;
    LedgerObserver*   observer;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        check_available();

        const DecryptionRequest* found = requests_.find(request_id);
        if (found == nullptr) {
            logger::logger()->warn("Callback for unknown request #{}",
                                   request_id);
            throw LedgerError(ErrorCode::UnknownRequest,
                              "request #" + std::to_string(request_id)
                                  + " is not outstanding");
        }
        request = *found;

        if (request.target.is_record()) {
            if (records_.is_revealed(request.target.record_id)) {
                throw LedgerError(ErrorCode::AlreadyRevealed,
                                  "record #"
                                      + std::to_string(request.target.record_id)
                                      + " was already revealed");
            }
        } else if (!counters_.find_category(request.target.category_key,
                                            category)) {
            throw LedgerError(ErrorCode::UnknownCategory,
                              "no category matches "
                                  + to_string(request.target));
        }

        // Nothing may be touched before the proof is checked
        if (!attestation_.verify(
                request_id, request.ciphertexts, cleartexts, proof)) {
            logger::logger()->error("Invalid decryption proof for request #{}",
                                    request_id);
            throw LedgerError(ErrorCode::InvalidProof,
                              "proof rejected for request #"
                                  + std::to_string(request_id));
        }

        check_cleartexts(request, cleartexts);
        if (!request.target.is_record()
            && !parse_counter_value(cleartexts.front(), counter_value)) {
            throw LedgerError(ErrorCode::MalformedCleartext,
                              "counter value '" + cleartexts.front()
                                  + "' is not an unsigned integer");
        }

        rocksdb::WriteBatch batch;
        try {
            requests_.retire(request_id, batch);

            if (request.target.is_record()) {
                category = cleartexts[kSoilTypeField];

                counters_.init_if_absent(category, batch);
                counters_.increment(category, batch);
                records_.mark_revealed(
                    request.target.record_id, cleartexts, batch);
            } else {
                counter_set = counters_.record_reveal(
                    category, request_id, counter_value, batch);
            }
        } catch (const std::exception&) {
            rollback();
            throw;
        }
        commit(batch);

        observer = observer_;
    }

    if (request.target.is_record()) {
        logger::logger()->info("Record #{} revealed (request #{}), counter "
                               "'{}' incremented",
                               request.target.record_id,
                               request_id,
                               category);
        if (observer) {
            observer->on_record_decrypted(request.target.record_id);
        }
    } else {
        logger::logger()->info("Counter '{}' revealed (request #{}): {}",
                               category,
                               request_id,
                               counter_value);
        // A value older than the stored one was consumed but dropped:
        // observers only hear about the value the ledger keeps.
        if (observer && counter_set) {
            observer->on_counter_decrypted(category, counter_value);
        }
    }
}

DecryptedRecord ConfidentialLedger::get_decrypted_record(
    record_id_type id) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return records_.decrypted(id);
}

bool ConfidentialLedger::get_record(record_id_type   id,
                                    EncryptedRecord& record) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return records_.get(id, record);
}

bool ConfidentialLedger::get_record(record_id_type   id,
                                    EncryptedRecord& record,
                                    DecryptedRecord& decrypted) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (!records_.get(id, record)) {
        return false;
    }
    decrypted = records_.decrypted(id);
    return true;
}

AggregateCounter ConfidentialLedger::get_counter(
    const std::string& category) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    AggregateCounter            counter;
    if (!counters_.get(category, counter)) {
        throw LedgerError(ErrorCode::UnknownCategory,
                          "no counter for category '" + category + "'");
    }
    return counter;
}

CiphertextHandle ConfidentialLedger::get_counter_handle(
    const std::string& category) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return counters_.current_handle(category);
}

bool ConfidentialLedger::get_counter_reveal(const std::string& category,
                                            uint64_t&          value) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return counters_.revealed_value(category, value);
}

size_t ConfidentialLedger::record_count() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return records_.size();
}

std::vector<std::string> ConfidentialLedger::categories() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return counters_.categories();
}

std::vector<DecryptionRequest> ConfidentialLedger::pending_requests() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return requests_.pending();
}

size_t ConfidentialLedger::redispatch_pending()
{
    std::vector<DecryptionRequest> pending;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        check_available();
        pending = requests_.pending();
    }

    for (const auto& request : pending) {
        logger::logger()->debug("Dispatching request #{} again",
                                request.request_id);
        dispatch(request.request_id, request.ciphertexts);
    }
    return pending.size();
}

bool ConfidentialLedger::is_available() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return available_;
}

void ConfidentialLedger::flush()
{
    std::lock_guard<std::mutex> lock(mtx_);
    db_.flush();
}

bool is_decimal_number(const std::string& s)
{
    size_t i = 0;
    if (i < s.size() && s[i] == '-') {
        i++;
    }

    size_t int_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        i++;
        int_digits++;
    }
    if (int_digits == 0) {
        return false;
    }
    if (i == s.size()) {
        return true;
    }
    if (s[i] != '.') {
        return false;
    }
    i++;

    size_t frac_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        i++;
        frac_digits++;
    }
    return frac_digits > 0 && i == s.size();
}

bool parse_counter_value(const std::string& s, uint64_t& value)
{
    if (s.empty() || s.size() > 20) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    errno                = 0;
    unsigned long long v = std::strtoull(s.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        return false;
    }
    value = static_cast<uint64_t>(v);
    return true;
}

void check_record_fields(const record_fields_type& fields)
{
    for (size_t i = 0; i < kRecordFieldCount; i++) {
        if (fields[i].kind != kRecordFieldKinds[i]) {
            throw LedgerError(ErrorCode::MalformedRecord,
                              "field " + std::to_string(i) + " is "
                                  + to_string(fields[i]) + ", expected a "
                                  + to_string(kRecordFieldKinds[i])
                                  + " handle");
        }
    }
}

void check_cleartexts(const DecryptionRequest&        request,
                      const std::vector<std::string>& cleartexts)
{
    if (cleartexts.size() != request.ciphertexts.size()) {
        throw LedgerError(ErrorCode::MalformedCleartext,
                          "expected " + std::to_string(request.ciphertexts.size())
                              + " cleartexts, got "
                              + std::to_string(cleartexts.size()));
    }

    for (size_t i = 0; i < cleartexts.size(); i++) {
        bool     valid = true;
        uint64_t value;

        switch (request.ciphertexts[i].kind) {
        case CiphertextKind::Scalar:
            valid = is_decimal_number(cleartexts[i]);
            break;
        case CiphertextKind::Counter:
            valid = parse_counter_value(cleartexts[i], value);
            break;
        case CiphertextKind::Text:
            break;
        }

        if (!valid) {
            throw LedgerError(ErrorCode::MalformedCleartext,
                              "cleartext " + std::to_string(i) + " ('"
                                  + cleartexts[i] + "') does not decode "
                                  + to_string(request.ciphertexts[i]));
        }
    }
}

} // namespace ledger
} // namespace ctwin
