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

#include <ctwin/ledger/serialization.hpp>
#include <ctwin/ledger/symbolic_evaluator.hpp>
#include <ctwin/utils/logger.hpp>

#include <sse/crypto/hash.hpp>

#include <algorithm>

namespace ctwin {
namespace ledger {

handle_id_type SymbolicEvaluator::derive_handle(const std::string& operation,
                                                const std::string& operands)
{
    std::string digest = sse::crypto::Hash::hash(operation + "/" + operands);

    handle_id_type id;
    std::copy(digest.begin(), digest.begin() + kHandleSize, id.begin());
    return id;
}

CiphertextHandle SymbolicEvaluator::trivial_encrypt(uint64_t value)
{
    CiphertextHandle result(derive_handle("trivial", encode_u64(value)),
                            CiphertextKind::Counter);

    logger::logger()->trace("trivial_encrypt({}) -> {}",
                            value,
                            to_string(result));
    return result;
}

CiphertextHandle SymbolicEvaluator::add_constant(const CiphertextHandle& ct,
                                                 uint64_t value)
{
    serialization<CiphertextHandle> ser;

    CiphertextHandle result(
        derive_handle("add", ser.serialize(ct) + encode_u64(value)), ct.kind);

    logger::logger()->trace(
        "add({}, {}) -> {}", to_string(ct), value, to_string(result));
    return result;
}

} // namespace ledger
} // namespace ctwin
