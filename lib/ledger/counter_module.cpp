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

#include <ctwin/ledger/counter_module.hpp>
#include <ctwin/ledger/errors.hpp>
#include <ctwin/ledger/serialization.hpp>
#include <ctwin/utils/logger.hpp>
#include <ctwin/utils/utils.hpp>

#include <sse/crypto/hash.hpp>

#include <algorithm>
#include <stdexcept>

namespace ctwin {
namespace ledger {

AggregateCounterModule::AggregateCounterModule(
    const utility::RocksDBStore& db,
    HomomorphicEvaluator&        evaluator)
    : evaluator_(evaluator)
{
    reload(db);
}

void AggregateCounterModule::reload(const utility::RocksDBStore& db)
{
    counters_.clear();
    categories_by_key_.clear();

    db.scan(kCounterPrefix,
            [this](const std::string& key, const std::string& value) {
                AggregateCounter counter;
                if (!decode_value(value, counter)
                    || key != counter_key(counter.category)) {
                    throw std::runtime_error("Corrupted counter entry: key "
                                             + utility::hex_string(key));
                }
                categories_by_key_[category_key(counter.category)]
                    = counter.category;
                counters_.emplace(counter.category, std::move(counter));
            });

    logger::logger()->debug("Loaded {} category counters", counters_.size());
}

category_key_type AggregateCounterModule::category_key(
    const std::string& category)
{
    std::string digest = sse::crypto::Hash::hash(category);

    category_key_type key;
    std::copy(digest.begin(), digest.begin() + kCategoryKeySize, key.begin());
    return key;
}

bool AggregateCounterModule::contains(const std::string& category) const
{
    return counters_.find(category) != counters_.end();
}

bool AggregateCounterModule::init_if_absent(const std::string&   category,
                                            rocksdb::WriteBatch& batch)
{
    if (contains(category)) {
        return false;
    }

    AggregateCounter counter;
    counter.category = category;
    counter.handle   = evaluator_.trivial_encrypt(0);

    batch.Put(counter_key(category), encode_value(counter));

    categories_by_key_[category_key(category)] = category;
    counters_.emplace(category, std::move(counter));

    logger::logger()->debug("New category counter: " + category);

    return true;
}

void AggregateCounterModule::increment(const std::string&   category,
                                       rocksdb::WriteBatch& batch)
{
    AggregateCounter& counter = at(category);

    CiphertextHandle next = evaluator_.add_constant(counter.handle, 1);
    counter.handle        = next;

    batch.Put(counter_key(category), encode_value(counter));
}

CiphertextHandle AggregateCounterModule::current_handle(
    const std::string& category) const
{
    auto it = counters_.find(category);
    if (it == counters_.end()) {
        throw LedgerError(ErrorCode::UnknownCategory,
                          "no counter for category '" + category + "'");
    }
    return it->second.handle;
}

bool AggregateCounterModule::get(const std::string& category,
                                 AggregateCounter&  counter) const
{
    auto it = counters_.find(category);
    if (it == counters_.end()) {
        return false;
    }
    counter = it->second;
    return true;
}

bool AggregateCounterModule::find_category(const category_key_type& key,
                                           std::string& category) const
{
    auto it = categories_by_key_.find(key);
    if (it == categories_by_key_.end()) {
        return false;
    }
    category = it->second;
    return true;
}

bool AggregateCounterModule::record_reveal(const std::string&   category,
                                           request_id_type      request_id,
                                           uint64_t             value,
                                           rocksdb::WriteBatch& batch)
{
    AggregateCounter& counter = at(category);

    if (counter.revealed && counter.revealed_by > request_id) {
        logger::logger()->info(
            "Counter '{}': dropping value of request #{}, request #{} was "
            "revealed already",
            category,
            request_id,
            counter.revealed_by);
        return false;
    }

    counter.revealed       = true;
    counter.revealed_value = value;
    counter.revealed_by    = request_id;

    batch.Put(counter_key(category), encode_value(counter));
    return true;
}

bool AggregateCounterModule::revealed_value(const std::string& category,
                                            uint64_t&          value) const
{
    auto it = counters_.find(category);
    if (it == counters_.end() || !it->second.revealed) {
        return false;
    }
    value = it->second.revealed_value;
    return true;
}

std::vector<std::string> AggregateCounterModule::categories() const
{
    std::vector<std::string> result;
    result.reserve(counters_.size());
    for (const auto& entry : counters_) {
        result.push_back(entry.first);
    }
    return result;
}

AggregateCounter& AggregateCounterModule::at(const std::string& category)
{
    auto it = counters_.find(category);
    if (it == counters_.end()) {
        throw LedgerError(ErrorCode::UnknownCategory,
                          "no counter for category '" + category + "'");
    }
    return it->second;
}

} // namespace ledger
} // namespace ctwin
