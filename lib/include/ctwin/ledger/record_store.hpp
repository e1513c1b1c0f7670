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

#include <ctwin/ledger/types.hpp>
#include <ctwin/utils/rocksdb_wrapper.hpp>

#include <rocksdb/write_batch.h>

#include <string>
#include <vector>

namespace ctwin {
namespace ledger {

// Append-only table of the encrypted telemetry records. Record i is stored
// at index i-1, together with its (possibly still empty) decrypted
// projection.
//
// Mutations are applied in memory and staged in the caller's batch; the
// caller owns the commit of the batch.
class EncryptedRecordStore
{
public:
    explicit EncryptedRecordStore(const utility::RocksDBStore& db);

    EncryptedRecordStore(const EncryptedRecordStore&) = delete;
    EncryptedRecordStore& operator=(const EncryptedRecordStore&) = delete;

    // Throws LedgerError(ResourceExhausted) once the id space is used up
    record_id_type next_id() const;

    record_id_type submit(const record_fields_type& fields,
                          uint64_t                  submitted_at,
                          const std::string&        submitter,
                          rocksdb::WriteBatch&      batch);

    bool contains(record_id_type id) const;
    bool get(record_id_type id, EncryptedRecord& record) const;

    // Empty, non-revealed projection for unknown ids
    DecryptedRecord decrypted(record_id_type id) const;
    bool            is_revealed(record_id_type id) const;

    // Sealed -> RevealPending
    void mark_reveal_pending(record_id_type id, rocksdb::WriteBatch& batch);

    // RevealPending -> Revealed, and stores the cleartexts
    void mark_revealed(record_id_type           id,
                       std::vector<std::string> cleartext,
                       rocksdb::WriteBatch&     batch);

    size_t size() const
    {
        return records_.size();
    }

    // Drops the in-memory tables and reads them back from the database
    void reload(const utility::RocksDBStore& db);

private:
    EncryptedRecord&       at(record_id_type id);
    const EncryptedRecord& at(record_id_type id) const;

    std::vector<EncryptedRecord> records_;
    std::vector<DecryptedRecord> decrypted_;
};

} // namespace ledger
} // namespace ctwin
