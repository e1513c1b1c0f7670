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

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace ctwin {
namespace ledger {

// What the decryption service gets to see of a request
struct DecryptionJob
{
    request_id_type               request_id{kInvalidRequestId};
    std::vector<CiphertextHandle> ciphertexts;
};

// Oracle endpoint for a decryption service running in another process: the
// jobs are queued here until the service pulls them (see the decryption_jobs
// RPC).
class QueuedDecryptionOracle : public DecryptionOracle
{
public:
    void request_decryption(
        request_id_type                      request_id,
        const std::vector<CiphertextHandle>& ciphertexts) override;

    // Removes and returns up to max_jobs queued jobs (all of them if 0)
    std::vector<DecryptionJob> drain(size_t max_jobs = 0);

    // Returns false if the queue is still empty after timeout
    bool wait_for_jobs(std::chrono::milliseconds timeout);

    size_t size() const;

private:
    mutable std::mutex        mtx_;
    std::condition_variable   cv_;
    std::deque<DecryptionJob> jobs_;
};

} // namespace ledger
} // namespace ctwin
