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

#include "protos/ledger.grpc.pb.h"

#define CTWIN_LEDGER_CLIENT_RUNNER_CPP
#include "ledger_net_types.hpp"

#include <ctwin/runners/ledger_client_runner.hpp>
#include <ctwin/utils/logger.hpp>

#include <google/protobuf/empty.pb.h>

#include <grpcpp/grpcpp.h>

#include <stdexcept>

namespace ctwin {
namespace ledger {

// De-activate clang-tidy because of a false positive in gRPC
// NOLINTNEXTLINE(clang-analyzer-core.CallAndMessage)
LedgerClientRunner::LedgerClientRunner(
    const std::shared_ptr<grpc::Channel>& channel,
    std::string                           caller)
    : stub_(ledger::Ledger::NewStub(channel)), caller_(std::move(caller))
{
}

// as we forward-declare Ledger::Stub, we cannot use the default destructor
// NOLINTNEXTLINE(modernize-use-equals-default)
LedgerClientRunner::~LedgerClientRunner()
{
}

record_id_type LedgerClientRunner::submit_record(
    const record_fields_type& fields) const
{
    grpc::ClientContext context;
    SubmitRecordMessage message;
    SubmitRecordReply   reply;

    for (const auto& field : fields) {
        handle_to_message(field, message.add_fields());
    }
    message.set_caller(caller_);

    grpc::Status status = stub_->submit_record(&context, message, &reply);
    if (!status.ok()) {
        logger::logger()->error("Submission failed: "
                                + status.error_message());
        throw_status(status, "submit_record");
    }

    logger::logger()->trace("Record #{} submitted", reply.record_id());
    return reply.record_id();
}

request_id_type LedgerClientRunner::request_record_reveal(
    record_id_type id) const
{
    grpc::ClientContext context;
    RecordRevealMessage message;
    RevealRequestReply  reply;

    message.set_record_id(id);
    message.set_caller(caller_);

    grpc::Status status
        = stub_->request_record_reveal(&context, message, &reply);
    if (!status.ok()) {
        throw_status(status, "request_record_reveal");
    }
    return reply.request_id();
}

request_id_type LedgerClientRunner::request_counter_reveal(
    const std::string& category) const
{
    grpc::ClientContext  context;
    CounterRevealMessage message;
    RevealRequestReply   reply;

    message.set_category(category);
    message.set_caller(caller_);

    grpc::Status status
        = stub_->request_counter_reveal(&context, message, &reply);
    if (!status.ok()) {
        throw_status(status, "request_counter_reveal");
    }
    return reply.request_id();
}

void LedgerClientRunner::complete_reveal(
    request_id_type                 request_id,
    const std::vector<std::string>& cleartexts,
    const std::string&              proof) const
{
    grpc::ClientContext     context;
    RevealCallbackMessage   message;
    google::protobuf::Empty e;

    message.set_request_id(request_id);
    for (const auto& clear : cleartexts) {
        message.add_cleartexts(clear);
    }
    message.set_proof(proof);

    grpc::Status status = stub_->complete_reveal(&context, message, &e);
    if (!status.ok()) {
        logger::logger()->warn("Callback for request #{} rejected: {}",
                               request_id,
                               status.error_message());
        throw_status(status, "complete_reveal");
    }
}

RecordView LedgerClientRunner::get_record(record_id_type id) const
{
    grpc::ClientContext  context;
    RecordQueryMessage   message;
    DecryptedRecordReply reply;

    message.set_record_id(id);

    grpc::Status status
        = stub_->get_decrypted_record(&context, message, &reply);
    if (!status.ok()) {
        throw_status(status, "get_decrypted_record");
    }

    RecordView view;
    view.exists = reply.exists();
    if (reply.status() > static_cast<uint32_t>(RecordStatus::Revealed)) {
        throw std::runtime_error("Invalid record status in server reply");
    }
    view.status             = static_cast<RecordStatus>(reply.status());
    view.submitted_at       = reply.submitted_at();
    view.decrypted.revealed = reply.revealed();
    view.decrypted.cleartext.assign(reply.cleartexts().begin(),
                                    reply.cleartexts().end());
    return view;
}

CounterView LedgerClientRunner::get_counter(const std::string& category) const
{
    grpc::ClientContext context;
    CounterQueryMessage message;
    CounterReply        reply;

    message.set_category(category);

    grpc::Status status = stub_->get_counter(&context, message, &reply);
    if (!status.ok()) {
        throw_status(status, "get_counter");
    }

    CounterView view;
    if (!message_to_handle(reply.handle(), view.handle)) {
        throw std::runtime_error("Invalid counter handle in server reply");
    }
    view.revealed       = reply.revealed();
    view.revealed_value = reply.revealed_value();
    return view;
}

std::vector<DecryptionJob> LedgerClientRunner::decryption_jobs(
    uint32_t max_jobs,
    uint32_t wait_ms) const
{
    grpc::ClientContext  context;
    DecryptionJobsQuery  message;
    DecryptionJobMessage job_mes;

    message.set_max_jobs(max_jobs);
    message.set_wait_ms(wait_ms);

    std::unique_ptr<grpc::ClientReader<DecryptionJobMessage>> reader(
        stub_->decryption_jobs(&context, message));

    std::vector<DecryptionJob> jobs;
    while (reader->Read(&job_mes)) {
        DecryptionJob job;
        job.request_id = job_mes.request_id();
        for (const auto& ct_mes : job_mes.ciphertexts()) {
            CiphertextHandle ct;
            if (!message_to_handle(ct_mes, ct)) {
                throw std::runtime_error(
                    "Invalid ciphertext handle in decryption job #"
                    + std::to_string(job.request_id));
            }
            job.ciphertexts.push_back(ct);
        }
        jobs.push_back(std::move(job));
    }

    grpc::Status status = reader->Finish();
    if (!status.ok()) {
        throw_status(status, "decryption_jobs");
    }
    return jobs;
}

LedgerAvailability LedgerClientRunner::availability() const
{
    grpc::ClientContext     context;
    google::protobuf::Empty e;
    AvailabilityReply       reply;

    grpc::Status status = stub_->availability(&context, e, &reply);
    if (!status.ok()) {
        throw_status(status, "availability");
    }

    LedgerAvailability result;
    result.available        = reply.available();
    result.record_count     = reply.record_count();
    result.pending_requests = reply.pending_requests();
    return result;
}

} // namespace ledger
} // namespace ctwin
