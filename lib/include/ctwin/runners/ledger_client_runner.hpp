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

#include <ctwin/ledger/queued_oracle.hpp>
#include <ctwin/ledger/types.hpp>

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>
#include <vector>

namespace ctwin {
namespace ledger {

// Forward declaration of some GRPC types

// Because Stub is a nested class, we need to use a trick to forward-declare it
// See https://stackoverflow.com/a/50619244
#ifndef CTWIN_LEDGER_CLIENT_RUNNER_CPP
namespace Ledger {
class Stub;
} // namespace Ledger
#endif

struct RecordView
{
    bool            exists{false};
    RecordStatus    status{RecordStatus::Sealed};
    uint64_t        submitted_at{0};
    DecryptedRecord decrypted;
};

struct CounterView
{
    CiphertextHandle handle;
    bool             revealed{false};
    uint64_t         revealed_value{0};
};

struct LedgerAvailability
{
    bool     available{false};
    uint64_t record_count{0};
    uint64_t pending_requests{0};
};

// Remote access to a ledger server. Ledger rejections are thrown back as
// LedgerError, transport failures as std::runtime_error.
class LedgerClientRunner
{
public:
    explicit LedgerClientRunner(const std::shared_ptr<grpc::Channel>& channel,
                                std::string caller = "");
    ~LedgerClientRunner();

    record_id_type submit_record(const record_fields_type& fields) const;

    request_id_type request_record_reveal(record_id_type id) const;
    request_id_type request_counter_reveal(const std::string& category) const;

    void complete_reveal(request_id_type                 request_id,
                         const std::vector<std::string>& cleartexts,
                         const std::string&              proof) const;

    RecordView  get_record(record_id_type id) const;
    CounterView get_counter(const std::string& category) const;

    // Up to max_jobs (0: all) queued decryption jobs. If none is queued,
    // the server waits up to wait_ms for one.
    std::vector<DecryptionJob> decryption_jobs(uint32_t max_jobs = 0,
                                               uint32_t wait_ms  = 0) const;

    LedgerAvailability availability() const;

private:
    std::unique_ptr<ledger::Ledger::Stub> stub_;
    std::string                           caller_;
};

} // namespace ledger
} // namespace ctwin
