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

#include "ledger_net_types.hpp"

#include <ctwin/utils/logger.hpp>

#include <algorithm>
#include <stdexcept>

namespace ctwin {
namespace ledger {

void handle_to_message(const CiphertextHandle& handle,
                       CiphertextHandleMessage* mes)
{
    mes->set_id(std::string(handle.id.begin(), handle.id.end()));
    mes->set_kind(static_cast<uint32_t>(handle.kind));
}

bool message_to_handle(const CiphertextHandleMessage& mes,
                       CiphertextHandle&              handle)
{
    if (mes.id().size() != kHandleSize || mes.kind() > 0xFF
        || !is_valid_kind(static_cast<uint8_t>(mes.kind()))) {
        return false;
    }
    std::copy(mes.id().begin(), mes.id().end(), handle.id.begin());
    handle.kind = static_cast<CiphertextKind>(mes.kind());
    return true;
}

grpc::Status error_to_status(const LedgerError& err)
{
    grpc::StatusCode code = grpc::UNKNOWN;

    if (err.is_fatal()) {
        logger::logger()->critical(err.what());
    } else {
        logger::logger()->debug(err.what());
    }

    switch (err.code()) {
    case ErrorCode::AlreadyRevealed:
        code = grpc::FAILED_PRECONDITION;
        break;
    case ErrorCode::UnknownRecord:
    case ErrorCode::UnknownRequest:
    case ErrorCode::UnknownCategory:
        code = grpc::NOT_FOUND;
        break;
    case ErrorCode::InvalidProof:
        code = grpc::UNAUTHENTICATED;
        break;
    case ErrorCode::MalformedCleartext:
    case ErrorCode::MalformedRecord:
        code = grpc::INVALID_ARGUMENT;
        break;
    case ErrorCode::Unauthorized:
        code = grpc::PERMISSION_DENIED;
        break;
    case ErrorCode::ResourceExhausted:
        code = grpc::RESOURCE_EXHAUSTED;
        break;
    case ErrorCode::Unavailable:
        code = grpc::UNAVAILABLE;
        break;
    }

    return grpc::Status(code, err.what(), error_code_name(err.code()));
}

void throw_status(const grpc::Status& status, const std::string& operation)
{
    ErrorCode code;
    if (parse_error_code(status.error_details(), code)) {
        std::string message = status.error_message();
        std::string prefix  = status.error_details() + ": ";

        // the server sends what() of the error, which already holds its name
        if (message.compare(0, prefix.size(), prefix) == 0) {
            message.erase(0, prefix.size());
        }
        throw LedgerError(code, message);
    }
    throw std::runtime_error(operation + " failed: " + status.error_message());
}

} // namespace ledger
} // namespace ctwin
