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

#include "ledger_server_runner_private.hpp"

#include "ledger_net_types.hpp"

#include <ctwin/runners/ledger_server_runner.hpp>
#include <ctwin/utils/logger.hpp>
#include <ctwin/utils/utils.hpp>

#include <sse/crypto/random.hpp>
#include <sse/crypto/utils.hpp>

#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <stdexcept>

namespace ctwin {
namespace ledger {

const char* LedgerImpl::kLedgerDbFile  = "ledger.db";
const char* LedgerImpl::kOracleKeyFile = "oracle.key";

static std::array<uint8_t, kAttestationKeySize> load_oracle_key(
    const std::string& path,
    bool               create_if_missing)
{
    std::array<uint8_t, kAttestationKeySize> key;

    if (!utility::is_file(path)) {
        if (!create_if_missing) {
            throw std::runtime_error(path + ": missing oracle key file");
        }

        logger::logger()->info("Generating a new oracle attestation key in "
                               + path);
        key = sse::crypto::random_bytes<uint8_t, kAttestationKeySize>();

        if (!utility::write_file(path, std::string(key.begin(), key.end()))) {
            throw std::runtime_error(path
                                     + ": unable to write the oracle key");
        }
        return key;
    }

    std::string content = utility::read_file(path);
    if (content.size() != key.size()) {
        throw std::runtime_error(
            "Invalid oracle key size: " + std::to_string(content.size())
            + " bytes instead of " + std::to_string(key.size()));
    }
    std::copy(content.begin(), content.end(), key.begin());
    return key;
}

LedgerImpl::LedgerImpl(const std::string& storage_path,
                       const std::string& oracle_key_path)
{
    if (utility::exists(storage_path) && !utility::is_directory(storage_path)) {
        // there should be nothing else than a directory at path
        throw std::runtime_error(storage_path + ": not a directory");
    }
    if (!utility::exists(storage_path)
        && !utility::create_directory(storage_path,
                                      static_cast<mode_t>(0700))) {
        throw std::runtime_error(storage_path
                                 + ": unable to create directory");
    }

    std::array<uint8_t, kAttestationKeySize> key;
    if (oracle_key_path.empty()) {
        key = load_oracle_key(storage_path + "/" + kOracleKeyFile, true);
    } else {
        key = load_oracle_key(oracle_key_path, false);
    }

    ledger_.reset(new ConfidentialLedger(
        storage_path + "/" + kLedgerDbFile,
        oracle_,
        evaluator_,
        sse::crypto::Key<kAttestationKeySize>(key.data())));

    // requests left pending by a previous run go back to the oracle queue
    size_t n = ledger_->redispatch_pending();
    if (n > 0) {
        logger::logger()->info("{} pending decryption requests queued again",
                               n);
    }
}

ConfidentialLedger& LedgerImpl::ledger()
{
    return *ledger_;
}

grpc::Status LedgerImpl::submit_record(__attribute__((unused))
                                       grpc::ServerContext*       context,
                                       const SubmitRecordMessage* mes,
                                       SubmitRecordReply*         reply)
{
    logger::logger()->trace("Submitting record");

    if (static_cast<size_t>(mes->fields_size()) != kRecordFieldCount) {
        return grpc::Status(grpc::INVALID_ARGUMENT,
                            "A record has exactly "
                                + std::to_string(kRecordFieldCount)
                                + " fields");
    }

    record_fields_type fields;
    for (size_t i = 0; i < kRecordFieldCount; i++) {
        if (!message_to_handle(mes->fields(static_cast<int>(i)), fields[i])) {
            return grpc::Status(grpc::INVALID_ARGUMENT,
                                "Invalid ciphertext handle for field "
                                    + std::to_string(i));
        }
    }

    try {
        reply->set_record_id(ledger_->submit_record(fields, mes->caller()));
    } catch (const LedgerError& err) {
        return error_to_status(err);
    } catch (const std::exception& err) {
        logger::logger()->error("Submission failed: "
                                + std::string(err.what()));
        return grpc::Status(grpc::INTERNAL, err.what());
    }

    return grpc::Status::OK;
}

grpc::Status LedgerImpl::request_record_reveal(
    __attribute__((unused)) grpc::ServerContext* context,
    const RecordRevealMessage*                   mes,
    RevealRequestReply*                          reply)
{
    try {
        reply->set_request_id(
            ledger_->request_record_reveal(mes->record_id(), mes->caller()));
    } catch (const LedgerError& err) {
        return error_to_status(err);
    } catch (const std::exception& err) {
        logger::logger()->error("Record reveal request failed: "
                                + std::string(err.what()));
        return grpc::Status(grpc::INTERNAL, err.what());
    }

    return grpc::Status::OK;
}

grpc::Status LedgerImpl::request_counter_reveal(
    __attribute__((unused)) grpc::ServerContext* context,
    const CounterRevealMessage*                  mes,
    RevealRequestReply*                          reply)
{
    try {
        reply->set_request_id(
            ledger_->request_counter_reveal(mes->category(), mes->caller()));
    } catch (const LedgerError& err) {
        return error_to_status(err);
    } catch (const std::exception& err) {
        logger::logger()->error("Counter reveal request failed: "
                                + std::string(err.what()));
        return grpc::Status(grpc::INTERNAL, err.what());
    }

    return grpc::Status::OK;
}

grpc::Status LedgerImpl::complete_reveal(__attribute__((unused))
                                         grpc::ServerContext*         context,
                                         const RevealCallbackMessage* mes,
                                         __attribute__((unused))
                                         google::protobuf::Empty* e)
{
    std::vector<std::string> cleartexts(mes->cleartexts().begin(),
                                        mes->cleartexts().end());

    try {
        ledger_->complete_reveal(mes->request_id(), cleartexts, mes->proof());
    } catch (const LedgerError& err) {
        return error_to_status(err);
    } catch (const std::exception& err) {
        logger::logger()->error("Oracle callback failed: "
                                + std::string(err.what()));
        return grpc::Status(grpc::INTERNAL, err.what());
    }

    return grpc::Status::OK;
}

grpc::Status LedgerImpl::get_decrypted_record(
    __attribute__((unused)) grpc::ServerContext* context,
    const RecordQueryMessage*                    mes,
    DecryptedRecordReply*                        reply)
{
    EncryptedRecord record;
    DecryptedRecord decrypted;
    if (!ledger_->get_record(mes->record_id(), record, decrypted)) {
        reply->set_exists(false);
        reply->set_revealed(false);
        return grpc::Status::OK;
    }

    reply->set_exists(true);
    reply->set_status(static_cast<uint32_t>(record.status));
    reply->set_submitted_at(record.submitted_at);
    reply->set_revealed(decrypted.revealed);
    for (const auto& clear : decrypted.cleartext) {
        reply->add_cleartexts(clear);
    }

    return grpc::Status::OK;
}

grpc::Status LedgerImpl::get_counter(__attribute__((unused))
                                     grpc::ServerContext*       context,
                                     const CounterQueryMessage* mes,
                                     CounterReply*              reply)
{
    AggregateCounter counter;
    try {
        counter = ledger_->get_counter(mes->category());
    } catch (const LedgerError& err) {
        return error_to_status(err);
    }

    handle_to_message(counter.handle, reply->mutable_handle());
    reply->set_revealed(counter.revealed);
    reply->set_revealed_value(counter.revealed_value);

    return grpc::Status::OK;
}

grpc::Status LedgerImpl::decryption_jobs(
    __attribute__((unused)) grpc::ServerContext* context,
    const DecryptionJobsQuery*                   mes,
    grpc::ServerWriter<DecryptionJobMessage>*    writer)
{
    if (mes->wait_ms() > 0) {
        oracle_.wait_for_jobs(std::chrono::milliseconds(mes->wait_ms()));
    }
    std::vector<DecryptionJob> jobs = oracle_.drain(mes->max_jobs());

    logger::logger()->trace("Sending {} decryption jobs", jobs.size());

    for (const auto& job : jobs) {
        DecryptionJobMessage job_mes;
        job_mes.set_request_id(job.request_id);
        for (const auto& ct : job.ciphertexts) {
            handle_to_message(ct, job_mes.add_ciphertexts());
        }
        writer->Write(job_mes);
    }

    return grpc::Status::OK;
}

grpc::Status LedgerImpl::availability(__attribute__((unused))
                                      grpc::ServerContext* context,
                                      __attribute__((unused))
                                      const google::protobuf::Empty* e,
                                      AvailabilityReply*             reply)
{
    reply->set_available(ledger_->is_available());
    reply->set_record_count(ledger_->record_count());
    reply->set_pending_requests(ledger_->pending_requests().size());

    return grpc::Status::OK;
}

LedgerServerRunner::LedgerServerRunner(const std::string& server_address,
                                       const std::string& storage_path,
                                       const std::string& oracle_key_path)
{
    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());

    service_.reset(new LedgerImpl(storage_path, oracle_key_path));

    builder.RegisterService(service_.get());
    server_ = builder.BuildAndStart();

    if (!server_) {
        throw std::runtime_error("Unable to start the server on "
                                 + server_address);
    }
    logger::logger()->info("Ledger server listening on " + server_address);
}

LedgerServerRunner::LedgerServerRunner(grpc::ServerBuilder& builder,
                                       const std::string&   storage_path,
                                       const std::string&   oracle_key_path)
{
    service_.reset(new LedgerImpl(storage_path, oracle_key_path));

    builder.RegisterService(service_.get());
    server_ = builder.BuildAndStart();
}

// as we forward-declare LedgerImpl, we cannot use the default destructor
// NOLINTNEXTLINE(modernize-use-equals-default)
LedgerServerRunner::~LedgerServerRunner()
{
}

ConfidentialLedger& LedgerServerRunner::ledger()
{
    return service_->ledger();
}

void LedgerServerRunner::wait()
{
    server_->Wait();
}

void LedgerServerRunner::shutdown()
{
    server_->Shutdown();
}

} // namespace ledger
} // namespace ctwin
