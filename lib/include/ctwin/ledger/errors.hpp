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

#include <stdexcept>
#include <string>

namespace ctwin {
namespace ledger {

enum class ErrorCode
{
    AlreadyRevealed,
    UnknownRecord,
    UnknownRequest,
    UnknownCategory,
    InvalidProof,
    MalformedCleartext,
    MalformedRecord,
    Unauthorized,
    ResourceExhausted,
    Unavailable,
};

const char* error_code_name(ErrorCode code);
bool        parse_error_code(const std::string& name, ErrorCode& code);

// Rejection of a ledger command. Apart from ResourceExhausted and
// Unavailable, a LedgerError leaves the ledger untouched and the caller may
// retry with corrected inputs.
class LedgerError : public std::runtime_error
{
public:
    LedgerError(ErrorCode code, const std::string& message);

    ErrorCode code() const
    {
        return code_;
    }

    bool is_fatal() const;

private:
    ErrorCode code_;
};

} // namespace ledger
} // namespace ctwin
