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

#include "protos/ledger.pb.h"

#include <ctwin/ledger/errors.hpp>
#include <ctwin/ledger/types.hpp>

#include <grpcpp/grpcpp.h>

namespace ctwin {
namespace ledger {

void handle_to_message(const CiphertextHandle& handle,
                       CiphertextHandleMessage* mes);

// Returns false if the id has the wrong size or the kind is unknown
bool message_to_handle(const CiphertextHandleMessage& mes,
                       CiphertextHandle&              handle);

grpc::Status error_to_status(const LedgerError& err);

// Rethrows the ledger error carried by a failed status, or a
// std::runtime_error if the failure did not come from the ledger
void throw_status(const grpc::Status& status, const std::string& operation);

} // namespace ledger
} // namespace ctwin
