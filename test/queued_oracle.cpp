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

#include "utility.hpp"

#include <ctwin/ledger/errors.hpp>
#include <ctwin/ledger/queued_oracle.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace ctwin {
namespace ledger {
namespace test {

static std::vector<CiphertextHandle> job_ciphertexts(uint8_t seed)
{
    return {ctwin::test::make_handle(seed, CiphertextKind::Counter)};
}

TEST(queued_oracle, drain)
{
    QueuedDecryptionOracle oracle;

    EXPECT_EQ(oracle.size(), 0);
    EXPECT_TRUE(oracle.drain().empty());

    for (uint8_t i = 1; i <= 5; i++) {
        oracle.request_decryption(i, job_ciphertexts(i));
    }
    EXPECT_EQ(oracle.size(), 5);

    std::vector<DecryptionJob> jobs = oracle.drain(2);
    ASSERT_EQ(jobs.size(), 2);
    EXPECT_EQ(jobs[0].request_id, 1);
    EXPECT_EQ(jobs[1].request_id, 2);
    EXPECT_EQ(jobs[1].ciphertexts, job_ciphertexts(2));
    EXPECT_EQ(oracle.size(), 3);

    // 0 takes everything left, in submission order
    jobs = oracle.drain();
    ASSERT_EQ(jobs.size(), 3);
    EXPECT_EQ(jobs[0].request_id, 3);
    EXPECT_EQ(jobs[2].request_id, 5);
    EXPECT_EQ(oracle.size(), 0);
}

TEST(queued_oracle, wait_for_jobs)
{
    QueuedDecryptionOracle oracle;

    EXPECT_FALSE(oracle.wait_for_jobs(std::chrono::milliseconds(10)));

    std::thread producer([&oracle]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        oracle.request_decryption(42, job_ciphertexts(42));
    });

    EXPECT_TRUE(oracle.wait_for_jobs(std::chrono::seconds(10)));
    producer.join();

    std::vector<DecryptionJob> jobs = oracle.drain();
    ASSERT_EQ(jobs.size(), 1);
    EXPECT_EQ(jobs[0].request_id, 42);

    // already queued jobs do not wait
    oracle.request_decryption(43, job_ciphertexts(43));
    EXPECT_TRUE(oracle.wait_for_jobs(std::chrono::milliseconds(0)));
}

TEST(ledger_errors, codes)
{
    LedgerError err(ErrorCode::InvalidProof, "proof rejected");
    EXPECT_EQ(err.code(), ErrorCode::InvalidProof);
    EXPECT_EQ(std::string(err.what()), "InvalidProof: proof rejected");
    EXPECT_FALSE(err.is_fatal());

    EXPECT_TRUE(LedgerError(ErrorCode::ResourceExhausted, "").is_fatal());
    EXPECT_TRUE(LedgerError(ErrorCode::Unavailable, "").is_fatal());

    ErrorCode code = ErrorCode::AlreadyRevealed;
    ASSERT_TRUE(parse_error_code("MalformedCleartext", code));
    EXPECT_EQ(code, ErrorCode::MalformedCleartext);
    ASSERT_TRUE(parse_error_code("MalformedRecord", code));
    EXPECT_EQ(code, ErrorCode::MalformedRecord);
    EXPECT_FALSE(LedgerError(ErrorCode::MalformedRecord, "").is_fatal());
    EXPECT_FALSE(parse_error_code("malformedcleartext", code));
    EXPECT_FALSE(parse_error_code("", code));
}

} // namespace test
} // namespace ledger
} // namespace ctwin
