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

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

#include <cstdint>
#include <functional>
#include <string>

namespace ctwin {
namespace utility {

// Thin owner of a RocksDB instance holding the ledger tables.
// Every table shares the same keyspace, separated by key prefixes.
class RocksDBStore
{
public:
    RocksDBStore() = delete;
    explicit RocksDBStore(const std::string& path);
    ~RocksDBStore();

    RocksDBStore(const RocksDBStore&) = delete;
    RocksDBStore& operator=(const RocksDBStore&) = delete;

    // Returns false if key is absent. Any other read failure throws
    // std::runtime_error.
    bool get(const std::string& key, std::string& data) const;

    // Applies all the updates of the batch atomically
    bool write(rocksdb::WriteBatch& batch);

    // Calls visitor on every (key, value) pair whose key starts with prefix,
    // in ascending key order
    void scan(const std::string& prefix,
              const std::function<void(const std::string&, const std::string&)>&
                  visitor) const;

    void flush(bool blocking = true);

private:
    rocksdb::DB* db_;
};

} // namespace utility
} // namespace ctwin
