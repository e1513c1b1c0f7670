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

#include <sse/crypto/key.hpp>
#include <sse/crypto/prf.hpp>

#include <array>
#include <string>
#include <vector>

namespace ctwin {
namespace ledger {

constexpr size_t kProofSize          = 32;
constexpr size_t kAttestationKeySize = 32;

using proof_type = std::array<uint8_t, kProofSize>;

// Proof that a list of cleartexts is the decryption of the ciphertexts of a
// given request. The proof is a PRF tag, keyed with the key shared between
// the ledger and the authorized decryption service, over the request id,
// the ciphertext handles and the cleartexts.
class DecryptionAttestation
{
public:
    explicit DecryptionAttestation(
        sse::crypto::Key<kAttestationKeySize>&& key);

    proof_type sign(request_id_type                      request_id,
                    const std::vector<CiphertextHandle>& ciphertexts,
                    const std::vector<std::string>&      cleartexts) const;

    // Constant time with respect to the proof content
    bool verify(request_id_type                      request_id,
                const std::vector<CiphertextHandle>& ciphertexts,
                const std::vector<std::string>&      cleartexts,
                const std::string&                   proof) const;

    static std::string transcript(
        request_id_type                      request_id,
        const std::vector<CiphertextHandle>& ciphertexts,
        const std::vector<std::string>&      cleartexts);

private:
    sse::crypto::Prf<kProofSize> prf_;
};

std::string proof_to_string(const proof_type& proof);

} // namespace ledger
} // namespace ctwin
