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

#include <array>

namespace ctwin {
namespace ledger {

namespace {
const std::array<ErrorCode, 10> kAllCodes = {{ErrorCode::AlreadyRevealed,
                                             ErrorCode::UnknownRecord,
                                             ErrorCode::UnknownRequest,
                                             ErrorCode::UnknownCategory,
                                             ErrorCode::InvalidProof,
                                             ErrorCode::MalformedCleartext,
                                             ErrorCode::MalformedRecord,
                                             ErrorCode::Unauthorized,
                                             ErrorCode::ResourceExhausted,
                                             ErrorCode::Unavailable}};
} // namespace

const char* error_code_name(ErrorCode code)
{
    switch (code) {
    case ErrorCode::AlreadyRevealed:
        return "AlreadyRevealed";
    case ErrorCode::UnknownRecord:
        return "UnknownRecord";
    case ErrorCode::UnknownRequest:
        return "UnknownRequest";
    case ErrorCode::UnknownCategory:
        return "UnknownCategory";
    case ErrorCode::InvalidProof:
        return "InvalidProof";
    case ErrorCode::MalformedCleartext:
        return "MalformedCleartext";
    case ErrorCode::MalformedRecord:
        return "MalformedRecord";
    case ErrorCode::Unauthorized:
        return "Unauthorized";
    case ErrorCode::ResourceExhausted:
        return "ResourceExhausted";
    case ErrorCode::Unavailable:
        return "Unavailable";
    }
    return "Unknown";
}

bool parse_error_code(const std::string& name, ErrorCode& code)
{
    for (ErrorCode c : kAllCodes) {
        if (name == error_code_name(c)) {
            code = c;
            return true;
        }
    }
    return false;
}

LedgerError::LedgerError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(error_code_name(code)) + ": " + message),
      code_(code)
{
}

bool LedgerError::is_fatal() const
{
    return code_ == ErrorCode::ResourceExhausted
           || code_ == ErrorCode::Unavailable;
}

} // namespace ledger
} // namespace ctwin
