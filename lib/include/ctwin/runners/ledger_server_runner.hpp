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

#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

namespace ctwin {
namespace ledger {

class LedgerImpl;
class ConfidentialLedger;

class LedgerServerRunner
{
public:
    LedgerServerRunner()                          = delete;
    LedgerServerRunner(const LedgerServerRunner&) = delete;
    LedgerServerRunner(LedgerServerRunner&&)      = default;

    // The ledger lives in storage_path, created if needed. The attestation
    // key shared with the decryption service is read from oracle_key_path,
    // or from storage_path/oracle.key (generated on first start) if empty.
    LedgerServerRunner(const std::string& server_address,
                       const std::string& storage_path,
                       const std::string& oracle_key_path = "");
    LedgerServerRunner(grpc::ServerBuilder& builder,
                       const std::string&   storage_path,
                       const std::string&   oracle_key_path = "");

    // as we forward-declare LedgerImpl, we cannot use the default destructor
    ~LedgerServerRunner();

    ConfidentialLedger& ledger();

    void wait();
    void shutdown();

private:
    std::unique_ptr<LedgerImpl>   service_;
    std::unique_ptr<grpc::Server> server_;
};

} // namespace ledger
} // namespace ctwin
