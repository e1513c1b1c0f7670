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

#include <ctwin/ledger/types.hpp>

#include <string>
#include <vector>

namespace ctwin {
namespace ledger {

// Out-of-process decryption service. The call must not block on the
// decryption: the answer comes back later through
// ConfidentialLedger::complete_reveal, correlated by request_id.
class DecryptionOracle
{
public:
    virtual ~DecryptionOracle() = default;

    virtual void request_decryption(
        request_id_type                      request_id,
        const std::vector<CiphertextHandle>& ciphertexts)
        = 0;
};

// External homomorphic computation capability
class HomomorphicEvaluator
{
public:
    virtual ~HomomorphicEvaluator() = default;

    // Encryption of a public constant
    virtual CiphertextHandle trivial_encrypt(uint64_t value) = 0;

    // Encrypted addition of a public constant
    virtual CiphertextHandle add_constant(const CiphertextHandle& ct,
                                          uint64_t                value)
        = 0;
};

// One-way notifications of the ledger's state transitions. Called after the
// transition is committed, without any ledger lock held.
class LedgerObserver
{
public:
    virtual ~LedgerObserver() = default;

    virtual void on_record_submitted(record_id_type /*id*/,
                                     uint64_t /*submitted_at*/)
    {
    }
    virtual void on_reveal_requested(request_id_type /*request_id*/,
                                     const RevealTarget& /*target*/,
                                     const std::string& /*category*/)
    {
    }
    virtual void on_record_decrypted(record_id_type /*id*/)
    {
    }
    virtual void on_counter_decrypted(const std::string& /*category*/,
                                      uint64_t /*value*/)
    {
    }
};

} // namespace ledger
} // namespace ctwin
