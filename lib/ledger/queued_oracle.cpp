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

#include <ctwin/ledger/queued_oracle.hpp>
#include <ctwin/utils/logger.hpp>

namespace ctwin {
namespace ledger {

void QueuedDecryptionOracle::request_decryption(
    request_id_type                      request_id,
    const std::vector<CiphertextHandle>& ciphertexts)
{
    {
        std::lock_guard<std::mutex> lock(mtx_);

        DecryptionJob job;
        job.request_id  = request_id;
        job.ciphertexts = ciphertexts;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_all();

    logger::logger()->trace("Decryption job #{} queued", request_id);
}

std::vector<DecryptionJob> QueuedDecryptionOracle::drain(size_t max_jobs)
{
    std::lock_guard<std::mutex> lock(mtx_);

    size_t n = jobs_.size();
    if (max_jobs != 0 && max_jobs < n) {
        n = max_jobs;
    }

    std::vector<DecryptionJob> result;
    result.reserve(n);
    for (size_t i = 0; i < n; i++) {
        result.push_back(std::move(jobs_.front()));
        jobs_.pop_front();
    }
    return result;
}

bool QueuedDecryptionOracle::wait_for_jobs(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mtx_);
    return cv_.wait_for(lock, timeout, [this] { return !jobs_.empty(); });
}

size_t QueuedDecryptionOracle::size() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return jobs_.size();
}

} // namespace ledger
} // namespace ctwin
