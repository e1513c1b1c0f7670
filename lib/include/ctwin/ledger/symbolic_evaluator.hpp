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

#include <ctwin/ledger/capabilities.hpp>

#include <string>

namespace ctwin {
namespace ledger {

// Evaluator that does not touch any ciphertext: the handle of a result is
// the hash of the operation and of its operands, and the actual computation
// is left to the coprocessor that holds the ciphertexts (and feeds the
// decryption oracle). Identical computations yield identical handles.
class SymbolicEvaluator : public HomomorphicEvaluator
{
public:
    CiphertextHandle trivial_encrypt(uint64_t value) override;
    CiphertextHandle add_constant(const CiphertextHandle& ct,
                                  uint64_t                value) override;

    static handle_id_type derive_handle(const std::string& operation,
                                        const std::string& operands);
};

} // namespace ledger
} // namespace ctwin
