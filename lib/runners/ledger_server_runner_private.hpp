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

#include "protos/ledger.grpc.pb.h"

#include <ctwin/ledger/ledger.hpp>
#include <ctwin/ledger/queued_oracle.hpp>
#include <ctwin/ledger/symbolic_evaluator.hpp>

#include <google/protobuf/empty.pb.h> // For ::google::protobuf::Empty

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

namespace ctwin {
namespace ledger {

class LedgerImpl final : public ledger::Ledger::Service
{
public:
    LedgerImpl(const std::string& storage_path,
               const std::string& oracle_key_path);

    grpc::Status submit_record(grpc::ServerContext*       context,
                               const SubmitRecordMessage* mes,
                               SubmitRecordReply*         reply) override;

    grpc::Status request_record_reveal(grpc::ServerContext*       context,
                                       const RecordRevealMessage* mes,
                                       RevealRequestReply* reply) override;

    grpc::Status request_counter_reveal(grpc::ServerContext*        context,
                                        const CounterRevealMessage* mes,
                                        RevealRequestReply* reply) override;

    grpc::Status complete_reveal(grpc::ServerContext*         context,
                                 const RevealCallbackMessage* mes,
                                 google::protobuf::Empty*     e) override;

    grpc::Status get_decrypted_record(grpc::ServerContext*      context,
                                      const RecordQueryMessage* mes,
                                      DecryptedRecordReply* reply) override;

    grpc::Status get_counter(grpc::ServerContext*       context,
                             const CounterQueryMessage* mes,
                             CounterReply*              reply) override;

    grpc::Status decryption_jobs(
        grpc::ServerContext*                        context,
        const DecryptionJobsQuery*                  mes,
        grpc::ServerWriter<DecryptionJobMessage>*   writer) override;

    grpc::Status availability(grpc::ServerContext*           context,
                              const google::protobuf::Empty* e,
                              AvailabilityReply*             reply) override;

    ConfidentialLedger& ledger();

    static const char* kLedgerDbFile;
    static const char* kOracleKeyFile;

private:
    QueuedDecryptionOracle              oracle_;
    SymbolicEvaluator                   evaluator_;
    std::unique_ptr<ConfidentialLedger> ledger_;
};

} // namespace ledger
} // namespace ctwin
