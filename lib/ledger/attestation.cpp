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

#include <ctwin/ledger/attestation.hpp>
#include <ctwin/ledger/serialization.hpp>

namespace ctwin {
namespace ledger {

namespace {
constexpr auto kTranscriptDomain = "ctwin.decryption.v1";

void append_length(std::string& out, size_t length)
{
    for (size_t i = 0; i < 4; i++) {
        out.push_back(static_cast<char>((length >> (8 * i)) & 0xFF));
    }
}
} // namespace

DecryptionAttestation::DecryptionAttestation(
    sse::crypto::Key<kAttestationKeySize>&& key)
    : prf_(std::move(key))
{
}

std::string DecryptionAttestation::transcript(
    request_id_type                      request_id,
    const std::vector<CiphertextHandle>& ciphertexts,
    const std::vector<std::string>&      cleartexts)
{
    serialization<CiphertextHandle> handle_ser;

    std::string out(kTranscriptDomain);
    out += encode_u64(request_id);

    append_length(out, ciphertexts.size());
    for (const auto& ct : ciphertexts) {
        out += handle_ser.serialize(ct);
    }

    append_length(out, cleartexts.size());
    for (const auto& clear : cleartexts) {
        append_length(out, clear.size());
        out += clear;
    }
    return out;
}

proof_type DecryptionAttestation::sign(
    request_id_type                      request_id,
    const std::vector<CiphertextHandle>& ciphertexts,
    const std::vector<std::string>&      cleartexts) const
{
    return prf_.prf(transcript(request_id, ciphertexts, cleartexts));
}

bool DecryptionAttestation::verify(
    request_id_type                      request_id,
    const std::vector<CiphertextHandle>& ciphertexts,
    const std::vector<std::string>&      cleartexts,
    const std::string&                   proof) const
{
    if (proof.size() != kProofSize) {
        return false;
    }

    proof_type expected = sign(request_id, ciphertexts, cleartexts);

    uint8_t diff = 0;
    for (size_t i = 0; i < kProofSize; i++) {
        diff |= static_cast<uint8_t>(expected[i]
                                     ^ static_cast<uint8_t>(proof[i]));
    }
    return diff == 0;
}

std::string proof_to_string(const proof_type& proof)
{
    return std::string(proof.begin(), proof.end());
}

} // namespace ledger
} // namespace ctwin
