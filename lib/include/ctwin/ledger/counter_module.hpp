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
#include <ctwin/ledger/types.hpp>
#include <ctwin/utils/rocksdb_wrapper.hpp>

#include <rocksdb/write_batch.h>

#include <map>
#include <string>
#include <vector>

namespace ctwin {
namespace ledger {

// Encrypted per-category tallies of the revealed records.
//
// Category strings are used verbatim: no normalization, "Hard" and "hard" are
// two categories. Reveal requests only carry the hash of the category
// (category_key), which find_category maps back to the string.
class AggregateCounterModule
{
public:
    AggregateCounterModule(const utility::RocksDBStore& db,
                           HomomorphicEvaluator&        evaluator);

    AggregateCounterModule(const AggregateCounterModule&) = delete;
    AggregateCounterModule& operator=(const AggregateCounterModule&) = delete;

    static category_key_type category_key(const std::string& category);

    bool contains(const std::string& category) const;

    // Returns true if the counter was created by this call
    bool init_if_absent(const std::string&   category,
                        rocksdb::WriteBatch& batch);

    // Encrypted +1. The counter must have been initialized.
    void increment(const std::string& category, rocksdb::WriteBatch& batch);

    // Throws LedgerError(UnknownCategory) if the category has no counter
    CiphertextHandle current_handle(const std::string& category) const;

    bool get(const std::string& category, AggregateCounter& counter) const;

    bool find_category(const category_key_type& key,
                       std::string&             category) const;

    // Stores the value the oracle reported for request_id. A value coming
    // from an older request than the one already stored is dropped, so that
    // successive reveals never go backwards. Returns true if stored.
    bool record_reveal(const std::string&   category,
                       request_id_type      request_id,
                       uint64_t             value,
                       rocksdb::WriteBatch& batch);

    bool revealed_value(const std::string& category, uint64_t& value) const;

    std::vector<std::string> categories() const;

    void reload(const utility::RocksDBStore& db);

private:
    AggregateCounter& at(const std::string& category);

    HomomorphicEvaluator& evaluator_;

    std::map<std::string, AggregateCounter> counters_;
    std::map<category_key_type, std::string> categories_by_key_;
};

} // namespace ledger
} // namespace ctwin
