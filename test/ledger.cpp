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
#include <ctwin/ledger/ledger.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace ctwin {
namespace ledger {
namespace test {

#define CTWIN_LEDGER_TEST_DIR "ledger_test"

constexpr auto ledger_test_dir     = CTWIN_LEDGER_TEST_DIR;
constexpr auto ledger_test_db_path = CTWIN_LEDGER_TEST_DIR "/ledger.db";

constexpr uint64_t kTestTime = 1700000000;

class ConfidentialLedgerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ctwin::test::cleanup_directory(ledger_test_dir);

        ledger_.reset(new ConfidentialLedger(ledger_test_db_path,
                                             oracle_,
                                             evaluator_,
                                             ctwin::test::test_oracle_key()));
        ledger_->set_observer(&observer_);
        ledger_->set_clock([]() { return kTestTime; });
    }

    // Answers call the way the authorized decryption service would
    void deliver(const ctwin::test::OracleCall& call,
                 const std::vector<std::string>& cleartexts)
    {
        ledger_->complete_reveal(
            call.request_id,
            cleartexts,
            ctwin::test::sign_decryption(
                call.request_id, call.ciphertexts, cleartexts));
    }

    // Submits a record and runs its whole reveal
    record_id_type reveal_new_record(uint8_t                         seed,
                                     const std::vector<std::string>& cleartexts)
    {
        record_id_type id = ledger_->submit_record(ctwin::test::make_fields(seed));
        ledger_->request_record_reveal(id);
        deliver(oracle_.calls.back(), cleartexts);
        return id;
    }

    // Cleartext the decryption service finds behind a counter handle
    std::string counter_cleartext(const ctwin::test::OracleCall& call) const
    {
        return std::to_string(evaluator_.value_of(call.ciphertexts.at(0)));
    }

    uint64_t counter_value(const std::string& category) const
    {
        return evaluator_.value_of(ledger_->get_counter_handle(category));
    }

    RecordStatus status(record_id_type id) const
    {
        EncryptedRecord record;
        EXPECT_TRUE(ledger_->get_record(id, record));
        return record.status;
    }

    ctwin::test::RecordingOracle        oracle_;
    ctwin::test::ThrowingEvaluator      evaluator_;
    ctwin::test::RecordingObserver      observer_;
    std::unique_ptr<ConfidentialLedger> ledger_;
};

const std::vector<std::string> kHardRecord = {"12.3", "450", "8.2", "hard"};
const std::vector<std::string> kSoftRecord = {"-3.75", "120", "0.5", "soft"};

TEST_F(ConfidentialLedgerTest, submission)
{
    record_id_type a = ledger_->submit_record(ctwin::test::make_fields(1), "op");
    record_id_type b = ledger_->submit_record(ctwin::test::make_fields(2), "op");

    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 2);
    EXPECT_EQ(ledger_->record_count(), 2);

    EncryptedRecord record;
    ASSERT_TRUE(ledger_->get_record(a, record));
    EXPECT_EQ(record.fields, ctwin::test::make_fields(1));
    EXPECT_EQ(record.submitted_at, kTestTime);
    EXPECT_EQ(record.submitter, "op");
    EXPECT_EQ(record.status, RecordStatus::Sealed);

    DecryptedRecord decrypted = ledger_->get_decrypted_record(a);
    EXPECT_FALSE(decrypted.revealed);
    EXPECT_TRUE(decrypted.cleartext.empty());

    EXPECT_EQ(observer_.submitted, std::vector<record_id_type>({a, b}));
    EXPECT_TRUE(oracle_.calls.empty());
}

TEST_F(ConfidentialLedgerTest, mistyped_fields)
{
    // the soil type must be a text, the measurements must be scalars
    record_fields_type soil_as_scalar   = ctwin::test::make_fields(1);
    soil_as_scalar[kSoilTypeField].kind = CiphertextKind::Scalar;

    record_fields_type all_text = ctwin::test::make_fields(2);
    for (auto& field : all_text) {
        field.kind = CiphertextKind::Text;
    }

    record_fields_type counter_torque = ctwin::test::make_fields(3);
    counter_torque[kTorqueField].kind = CiphertextKind::Counter;

    for (const auto& fields : {soil_as_scalar, all_text, counter_torque}) {
        ctwin::test::expect_ledger_error(ErrorCode::MalformedRecord, [&]() {
            ledger_->submit_record(fields, "op");
        });
    }

    EXPECT_EQ(ledger_->record_count(), 0);
    EXPECT_TRUE(observer_.submitted.empty());

    // no identifier was consumed
    EXPECT_EQ(ledger_->submit_record(ctwin::test::make_fields(1)), 1);
}

TEST_F(ConfidentialLedgerTest, hard_soil_reveal)
{
    record_id_type a = ledger_->submit_record(ctwin::test::make_fields(1));

    request_id_type request_id = ledger_->request_record_reveal(a);
    EXPECT_EQ(status(a), RecordStatus::RevealPending);

    ASSERT_EQ(oracle_.calls.size(), 1);
    EXPECT_EQ(oracle_.calls[0].request_id, request_id);
    const auto fields = ctwin::test::make_fields(1);
    EXPECT_EQ(oracle_.calls[0].ciphertexts,
              std::vector<CiphertextHandle>(fields.begin(), fields.end()));

    deliver(oracle_.calls[0], kHardRecord);

    DecryptedRecord decrypted = ledger_->get_decrypted_record(a);
    EXPECT_TRUE(decrypted.revealed);
    EXPECT_EQ(decrypted.cleartext, kHardRecord);
    EXPECT_EQ(status(a), RecordStatus::Revealed);
    EXPECT_TRUE(ledger_->pending_requests().empty());

    EXPECT_EQ(counter_value("hard"), 1);
    EXPECT_EQ(ledger_->categories(), std::vector<std::string>({"hard"}));

    // reveal the counter, then add one more hard record
    ledger_->request_counter_reveal("hard");
    deliver(oracle_.calls.back(), {counter_cleartext(oracle_.calls.back())});

    uint64_t before = 0;
    ASSERT_TRUE(ledger_->get_counter_reveal("hard", before));
    EXPECT_EQ(before, 1);

    reveal_new_record(2, {"13.1", "452", "8.0", "hard"});

    ledger_->request_counter_reveal("hard");
    deliver(oracle_.calls.back(), {counter_cleartext(oracle_.calls.back())});

    uint64_t after = 0;
    ASSERT_TRUE(ledger_->get_counter_reveal("hard", after));
    EXPECT_EQ(after, before + 1);

    EXPECT_EQ(observer_.decrypted, std::vector<record_id_type>({a, 2}));
    ASSERT_EQ(observer_.counters.size(), 2);
    EXPECT_EQ(observer_.counters[1].first, "hard");
    EXPECT_EQ(observer_.counters[1].second, 2);
}

TEST_F(ConfidentialLedgerTest, double_reveal_request)
{
    record_id_type a = ledger_->submit_record(ctwin::test::make_fields(1));

    request_id_type request_id = ledger_->request_record_reveal(a);
    ctwin::test::expect_ledger_error(ErrorCode::AlreadyRevealed, [&]() {
        ledger_->request_record_reveal(a);
    });

    std::vector<DecryptionRequest> pending = ledger_->pending_requests();
    ASSERT_EQ(pending.size(), 1);
    EXPECT_EQ(pending[0].request_id, request_id);
    EXPECT_EQ(oracle_.calls.size(), 1);
    EXPECT_EQ(observer_.requested.size(), 1);

    deliver(oracle_.calls[0], kHardRecord);

    // and once revealed
    ctwin::test::expect_ledger_error(ErrorCode::AlreadyRevealed, [&]() {
        ledger_->request_record_reveal(a);
    });
    EXPECT_EQ(oracle_.calls.size(), 1);
}

TEST_F(ConfidentialLedgerTest, unknown_record)
{
    ctwin::test::expect_ledger_error(ErrorCode::UnknownRecord, [&]() {
        ledger_->request_record_reveal(1);
    });
    ctwin::test::expect_ledger_error(ErrorCode::UnknownRecord, [&]() {
        ledger_->request_record_reveal(kInvalidRecordId);
    });
    EXPECT_TRUE(ledger_->pending_requests().empty());

    DecryptedRecord decrypted = ledger_->get_decrypted_record(1);
    EXPECT_FALSE(decrypted.revealed);
    EXPECT_TRUE(decrypted.cleartext.empty());
}

TEST_F(ConfidentialLedgerTest, unknown_request)
{
    record_id_type a = ledger_->submit_record(ctwin::test::make_fields(1));
    ledger_->request_record_reveal(a);

    const std::vector<CiphertextHandle> cts = oracle_.calls[0].ciphertexts;

    ctwin::test::expect_ledger_error(ErrorCode::UnknownRequest, [&]() {
        ledger_->complete_reveal(
            99, kHardRecord, ctwin::test::sign_decryption(99, cts, kHardRecord));
    });

    EXPECT_EQ(status(a), RecordStatus::RevealPending);
    EXPECT_FALSE(ledger_->get_decrypted_record(a).revealed);
    EXPECT_TRUE(ledger_->categories().empty());
    EXPECT_EQ(ledger_->pending_requests().size(), 1);
    EXPECT_TRUE(observer_.decrypted.empty());
}

TEST_F(ConfidentialLedgerTest, unknown_category)
{
    ctwin::test::expect_ledger_error(ErrorCode::UnknownCategory, [&]() {
        ledger_->request_counter_reveal("granite");
    });

    reveal_new_record(1, kHardRecord);

    ctwin::test::expect_ledger_error(ErrorCode::UnknownCategory, [&]() {
        ledger_->request_counter_reveal("Hard");
    });
    ctwin::test::expect_ledger_error(ErrorCode::UnknownCategory, [&]() {
        ledger_->get_counter_handle("granite");
    });

    uint64_t value;
    EXPECT_FALSE(ledger_->get_counter_reveal("granite", value));
    EXPECT_FALSE(ledger_->get_counter_reveal("hard", value));
    EXPECT_TRUE(ledger_->pending_requests().empty());
}

TEST_F(ConfidentialLedgerTest, invalid_proof)
{
    record_id_type a = ledger_->submit_record(ctwin::test::make_fields(1));
    reveal_new_record(2, kSoftRecord);
    ledger_->request_record_reveal(a);

    const ctwin::test::OracleCall call = oracle_.calls.back();
    const CiphertextHandle        soft = ledger_->get_counter_handle("soft");

    // signed for other cleartexts
    std::string proof = ctwin::test::sign_decryption(
        call.request_id, call.ciphertexts, kSoftRecord);
    ctwin::test::expect_ledger_error(ErrorCode::InvalidProof, [&]() {
        ledger_->complete_reveal(call.request_id, kHardRecord, proof);
    });

    // signed for another request
    proof = ctwin::test::sign_decryption(
        call.request_id + 1, call.ciphertexts, kHardRecord);
    ctwin::test::expect_ledger_error(ErrorCode::InvalidProof, [&]() {
        ledger_->complete_reveal(call.request_id, kHardRecord, proof);
    });

    ctwin::test::expect_ledger_error(ErrorCode::InvalidProof, [&]() {
        ledger_->complete_reveal(call.request_id, kHardRecord, "");
    });

    // nothing moved
    EXPECT_EQ(status(a), RecordStatus::RevealPending);
    DecryptedRecord decrypted = ledger_->get_decrypted_record(a);
    EXPECT_FALSE(decrypted.revealed);
    EXPECT_TRUE(decrypted.cleartext.empty());
    EXPECT_EQ(ledger_->categories(), std::vector<std::string>({"soft"}));
    EXPECT_EQ(ledger_->get_counter_handle("soft"), soft);
    EXPECT_EQ(ledger_->pending_requests().size(), 1);
    EXPECT_EQ(observer_.decrypted.size(), 1);

    // the request is still open for a well signed answer
    deliver(call, kHardRecord);
    EXPECT_EQ(ledger_->get_decrypted_record(a).cleartext, kHardRecord);
    EXPECT_EQ(counter_value("hard"), 1);
}

TEST_F(ConfidentialLedgerTest, malformed_cleartext)
{
    record_id_type a = ledger_->submit_record(ctwin::test::make_fields(1));
    ledger_->request_record_reveal(a);
    const ctwin::test::OracleCall call = oracle_.calls.back();

    const std::vector<std::vector<std::string>> malformed = {
        {"12.3", "450", "8.2"},
        {"12.3", "450", "8.2", "hard", "extra"},
        {"twelve", "450", "8.2", "hard"},
        {"12.", "450", "8.2", "hard"},
        {"12.3", "4e2", "8.2", "hard"},
        {"", "450", "8.2", "hard"},
    };

    for (const auto& cleartexts : malformed) {
        ctwin::test::expect_ledger_error(ErrorCode::MalformedCleartext,
                                         [&]() { deliver(call, cleartexts); });
    }

    EXPECT_EQ(status(a), RecordStatus::RevealPending);
    EXPECT_FALSE(ledger_->get_decrypted_record(a).revealed);
    EXPECT_TRUE(ledger_->categories().empty());
    EXPECT_EQ(ledger_->pending_requests().size(), 1);

    // the soil type is free text
    deliver(call, {"-0.5", "450", "8", "mixed: clay/sand"});
    EXPECT_EQ(counter_value("mixed: clay/sand"), 1);
}

TEST_F(ConfidentialLedgerTest, malformed_counter_value)
{
    reveal_new_record(1, kHardRecord);
    ledger_->request_counter_reveal("hard");
    const ctwin::test::OracleCall call = oracle_.calls.back();

    for (const std::string value :
         {"1.0", "-1", "", "18446744073709551616", "0x1"}) {
        ctwin::test::expect_ledger_error(ErrorCode::MalformedCleartext,
                                         [&]() { deliver(call, {value}); });
    }

    uint64_t revealed;
    EXPECT_FALSE(ledger_->get_counter_reveal("hard", revealed));

    deliver(call, {"1"});
    ASSERT_TRUE(ledger_->get_counter_reveal("hard", revealed));
    EXPECT_EQ(revealed, 1);
}

TEST_F(ConfidentialLedgerTest, replayed_callback)
{
    record_id_type a = ledger_->submit_record(ctwin::test::make_fields(1));
    ledger_->request_record_reveal(a);
    const ctwin::test::OracleCall call = oracle_.calls.back();

    deliver(call, kHardRecord);

    ctwin::test::expect_ledger_error(ErrorCode::UnknownRequest,
                                     [&]() { deliver(call, kHardRecord); });
    ctwin::test::expect_ledger_error(ErrorCode::UnknownRequest,
                                     [&]() { deliver(call, kSoftRecord); });

    EXPECT_EQ(ledger_->get_decrypted_record(a).cleartext, kHardRecord);
    EXPECT_EQ(counter_value("hard"), 1);
    EXPECT_EQ(ledger_->categories(), std::vector<std::string>({"hard"}));
    EXPECT_EQ(observer_.decrypted.size(), 1);
}

TEST_F(ConfidentialLedgerTest, counter_matches_revealed_records)
{
    std::vector<record_id_type> ids;
    for (uint8_t i = 0; i < 5; i++) {
        ids.push_back(ledger_->submit_record(ctwin::test::make_fields(i)));
        ledger_->request_record_reveal(ids.back());
    }
    const std::vector<ctwin::test::OracleCall> calls = oracle_.calls;

    // callbacks come back in any order
    deliver(calls[3], kHardRecord);
    deliver(calls[0], kSoftRecord);
    deliver(calls[4], kHardRecord);
    deliver(calls[1], kHardRecord);

    EXPECT_EQ(counter_value("hard"), 3);
    EXPECT_EQ(counter_value("soft"), 1);

    ledger_->request_counter_reveal("hard");
    deliver(oracle_.calls.back(), {counter_cleartext(oracle_.calls.back())});

    uint64_t value = 0;
    ASSERT_TRUE(ledger_->get_counter_reveal("hard", value));
    EXPECT_EQ(value, 3);

    EXPECT_EQ(status(ids[2]), RecordStatus::RevealPending);
}

TEST_F(ConfidentialLedgerTest, out_of_order_counter_reveals)
{
    reveal_new_record(1, kHardRecord);
    ledger_->request_counter_reveal("hard");
    const ctwin::test::OracleCall first = oracle_.calls.back();

    reveal_new_record(2, kHardRecord);
    ledger_->request_counter_reveal("hard");
    const ctwin::test::OracleCall second = oracle_.calls.back();

    EXPECT_NE(first.ciphertexts, second.ciphertexts);

    deliver(second, {counter_cleartext(second)});
    deliver(first, {counter_cleartext(first)});

    uint64_t value = 0;
    ASSERT_TRUE(ledger_->get_counter_reveal("hard", value));
    EXPECT_EQ(value, 2);

    // the stale answer was consumed without being published
    EXPECT_TRUE(ledger_->pending_requests().empty());
    ASSERT_EQ(observer_.counters.size(), 1);
    EXPECT_EQ(observer_.counters[0].second, 2);
}

TEST_F(ConfidentialLedgerTest, evaluator_failure_rolls_back)
{
    record_id_type  a          = ledger_->submit_record(ctwin::test::make_fields(1));
    request_id_type request_id = ledger_->request_record_reveal(a);
    const ctwin::test::OracleCall call = oracle_.calls.back();

    evaluator_.failing = true;
    EXPECT_THROW(deliver(call, kHardRecord), std::runtime_error);

    // the callback left no trace
    ASSERT_EQ(ledger_->pending_requests().size(), 1);
    EXPECT_EQ(ledger_->pending_requests()[0].request_id, request_id);
    EXPECT_EQ(status(a), RecordStatus::RevealPending);
    EXPECT_FALSE(ledger_->get_decrypted_record(a).revealed);
    EXPECT_TRUE(ledger_->categories().empty());
    EXPECT_TRUE(observer_.decrypted.empty());
    EXPECT_TRUE(ledger_->is_available());

    // the same answer goes through once the evaluator works
    evaluator_.failing = false;
    deliver(call, kHardRecord);

    EXPECT_EQ(status(a), RecordStatus::Revealed);
    EXPECT_EQ(ledger_->categories(), std::vector<std::string>({"hard"}));
    EXPECT_EQ(counter_value("hard"), 1);
    EXPECT_TRUE(ledger_->pending_requests().empty());
    EXPECT_EQ(observer_.decrypted, std::vector<record_id_type>({a}));
}

TEST_F(ConfidentialLedgerTest, snapshot_queries)
{
    record_id_type a = ledger_->submit_record(ctwin::test::make_fields(1));

    EncryptedRecord record;
    DecryptedRecord decrypted;
    EXPECT_FALSE(ledger_->get_record(a + 1, record, decrypted));

    ledger_->request_record_reveal(a);
    ASSERT_TRUE(ledger_->get_record(a, record, decrypted));
    EXPECT_EQ(record.status, RecordStatus::RevealPending);
    EXPECT_FALSE(decrypted.revealed);

    deliver(oracle_.calls.back(), kHardRecord);
    ASSERT_TRUE(ledger_->get_record(a, record, decrypted));
    EXPECT_EQ(record.status, RecordStatus::Revealed);
    EXPECT_TRUE(decrypted.revealed);
    EXPECT_EQ(decrypted.cleartext, kHardRecord);

    ctwin::test::expect_ledger_error(ErrorCode::UnknownCategory,
                                     [&]() { ledger_->get_counter("soft"); });

    AggregateCounter counter = ledger_->get_counter("hard");
    EXPECT_EQ(counter.category, "hard");
    EXPECT_EQ(counter.handle, ledger_->get_counter_handle("hard"));
    EXPECT_FALSE(counter.revealed);

    ledger_->request_counter_reveal("hard");
    const ctwin::test::OracleCall call = oracle_.calls.back();
    deliver(call, {counter_cleartext(call)});

    counter = ledger_->get_counter("hard");
    EXPECT_TRUE(counter.revealed);
    EXPECT_EQ(counter.revealed_value, 1);
    EXPECT_EQ(counter.revealed_by, call.request_id);
}

TEST_F(ConfidentialLedgerTest, request_ids_are_never_reused)
{
    record_id_type a = ledger_->submit_record(ctwin::test::make_fields(1));
    record_id_type b = ledger_->submit_record(ctwin::test::make_fields(2));

    request_id_type r1 = ledger_->request_record_reveal(a);
    deliver(oracle_.calls.back(), kHardRecord);

    request_id_type r2 = ledger_->request_counter_reveal("hard");
    request_id_type r3 = ledger_->request_record_reveal(b);

    EXPECT_LT(r1, r2);
    EXPECT_LT(r2, r3);

    // the counter request id cannot complete the record reveal
    const ctwin::test::OracleCall record_call = oracle_.calls.back();
    ctwin::test::expect_ledger_error(ErrorCode::InvalidProof, [&]() {
        ledger_->complete_reveal(
            r2,
            kSoftRecord,
            ctwin::test::sign_decryption(
                r2, record_call.ciphertexts, kSoftRecord));
    });
    EXPECT_EQ(status(b), RecordStatus::RevealPending);
}

TEST_F(ConfidentialLedgerTest, access_policy)
{
    ledger_->set_access_policy(
        [](const std::string& caller) { return caller == "operator"; });

    ctwin::test::expect_ledger_error(ErrorCode::Unauthorized, [&]() {
        ledger_->submit_record(ctwin::test::make_fields(1), "intruder");
    });
    EXPECT_EQ(ledger_->record_count(), 0);

    record_id_type a
        = ledger_->submit_record(ctwin::test::make_fields(1), "operator");

    ctwin::test::expect_ledger_error(ErrorCode::Unauthorized, [&]() {
        ledger_->request_record_reveal(a, "intruder");
    });
    EXPECT_EQ(status(a), RecordStatus::Sealed);
    EXPECT_TRUE(oracle_.calls.empty());

    ledger_->request_record_reveal(a, "operator");

    // the callback is authenticated by its proof, not by the policy
    deliver(oracle_.calls.back(), kHardRecord);

    ctwin::test::expect_ledger_error(ErrorCode::Unauthorized, [&]() {
        ledger_->request_counter_reveal("hard", "intruder");
    });

    ledger_->set_access_policy(nullptr);
    EXPECT_NO_THROW(ledger_->request_counter_reveal("hard", "anyone"));
}

TEST_F(ConfidentialLedgerTest, unreachable_oracle)
{
    record_id_type a = ledger_->submit_record(ctwin::test::make_fields(1));

    oracle_.unreachable = true;
    request_id_type request_id = ledger_->request_record_reveal(a);

    // the request is committed anyway
    EXPECT_EQ(status(a), RecordStatus::RevealPending);
    EXPECT_TRUE(oracle_.calls.empty());
    EXPECT_EQ(ledger_->pending_requests().size(), 1);

    oracle_.unreachable = false;
    EXPECT_EQ(ledger_->redispatch_pending(), 1);
    ASSERT_EQ(oracle_.calls.size(), 1);
    EXPECT_EQ(oracle_.calls[0].request_id, request_id);

    deliver(oracle_.calls[0], kSoftRecord);
    EXPECT_TRUE(ledger_->get_decrypted_record(a).revealed);
    EXPECT_EQ(ledger_->redispatch_pending(), 0);
    EXPECT_TRUE(ledger_->is_available());
}

TEST(ledger_cleartexts, decimal_numbers)
{
    EXPECT_TRUE(is_decimal_number("0"));
    EXPECT_TRUE(is_decimal_number("450"));
    EXPECT_TRUE(is_decimal_number("-12.30"));
    EXPECT_TRUE(is_decimal_number("0.001"));

    EXPECT_FALSE(is_decimal_number(""));
    EXPECT_FALSE(is_decimal_number("-"));
    EXPECT_FALSE(is_decimal_number(".5"));
    EXPECT_FALSE(is_decimal_number("5."));
    EXPECT_FALSE(is_decimal_number("+5"));
    EXPECT_FALSE(is_decimal_number("1e3"));
    EXPECT_FALSE(is_decimal_number(" 1"));
    EXPECT_FALSE(is_decimal_number("1.2.3"));
}

TEST(ledger_cleartexts, counter_values)
{
    uint64_t value = 0;
    EXPECT_TRUE(parse_counter_value("0", value));
    EXPECT_EQ(value, 0);
    EXPECT_TRUE(parse_counter_value("18446744073709551615", value));
    EXPECT_EQ(value, 18446744073709551615ULL);

    EXPECT_FALSE(parse_counter_value("18446744073709551616", value));
    EXPECT_FALSE(parse_counter_value("-1", value));
    EXPECT_FALSE(parse_counter_value("", value));
    EXPECT_FALSE(parse_counter_value("1.0", value));
}

} // namespace test
} // namespace ledger
} // namespace ctwin
