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

#include <ctwin/utils/logger.hpp>
#include <ctwin/utils/rocksdb_wrapper.hpp>
#include <ctwin/utils/utils.hpp>

#include <rocksdb/iterator.h>

#include <memory>
#include <stdexcept>

namespace ctwin {
namespace utility {

RocksDBStore::RocksDBStore(const std::string& path) : db_(nullptr)
{
    rocksdb::Options options;
    options.create_if_missing = true;

    options.table_cache_numshardbits = 4;
    options.max_open_files           = -1;

    options.compression            = rocksdb::kNoCompression;
    options.bottommost_compression = rocksdb::kDisableCompressionOption;

    options.compaction_style = rocksdb::kCompactionStyleLevel;
    options.info_log_level   = rocksdb::InfoLogLevel::WARN_LEVEL;

    options.max_background_compactions = 4;
    options.write_buffer_size          = 67108864; // 64 MB

    rocksdb::Status status = rocksdb::DB::Open(options, path, &db_);

    /* LCOV_EXCL_START */
    if (!status.ok()) {
        logger::logger()->critical("Unable to open the database:\n "
                                   + status.ToString());
        db_ = nullptr;

        throw std::runtime_error("Unable to open the database located at "
                                 + path);
    }
    /* LCOV_EXCL_STOP */
}

RocksDBStore::~RocksDBStore()
{
    delete db_;
}

bool RocksDBStore::get(const std::string& key, std::string& data) const
{
    rocksdb::Status s = db_->Get(rocksdb::ReadOptions(), key, &data);

    if (s.IsNotFound()) {
        return false;
    }

    /* LCOV_EXCL_START */
    if (!s.ok()) {
        logger::logger()->error("Unable to read key " + hex_string(key)
                                + "\nRocksdb status: " + s.ToString());
        throw std::runtime_error("Database read failed: " + s.ToString());
    }
    /* LCOV_EXCL_STOP */

    return true;
}

bool RocksDBStore::write(rocksdb::WriteBatch& batch)
{
    rocksdb::WriteOptions options;
    options.sync = true;

    rocksdb::Status s = db_->Write(options, &batch);

    /* LCOV_EXCL_START */
    if (!s.ok()) {
        logger::logger()->error("Unable to write batch of "
                                + std::to_string(batch.Count())
                                + " updates\nRocksdb status: " + s.ToString());
    }
    /* LCOV_EXCL_STOP */

    return s.ok();
}

void RocksDBStore::scan(
    const std::string& prefix,
    const std::function<void(const std::string&, const std::string&)>& visitor)
    const
{
    std::unique_ptr<rocksdb::Iterator> it(
        db_->NewIterator(rocksdb::ReadOptions()));

    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix);
         it->Next()) {
        visitor(it->key().ToString(), it->value().ToString());
    }

    /* LCOV_EXCL_START */
    if (!it->status().ok()) {
        logger::logger()->error("Error when scanning the database: "
                                + it->status().ToString());
        throw std::runtime_error("Database scan failed: "
                                 + it->status().ToString());
    }
    /* LCOV_EXCL_STOP */
}

void RocksDBStore::flush(bool blocking)
{
    rocksdb::FlushOptions options;

    options.wait = blocking;

    rocksdb::Status s = db_->Flush(options);

    /* LCOV_EXCL_START */
    if (!s.ok()) {
        logger::logger()->error("DB Flush failed: " + s.ToString());
    }
    /* LCOV_EXCL_STOP */
}

} // namespace utility
} // namespace ctwin
