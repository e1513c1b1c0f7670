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

#include <ctwin/ledger/errors.hpp>
#include <ctwin/ledger/record_store.hpp>
#include <ctwin/ledger/serialization.hpp>
#include <ctwin/utils/logger.hpp>
#include <ctwin/utils/utils.hpp>

#include <limits>
#include <stdexcept>

namespace ctwin {
namespace ledger {

EncryptedRecordStore::EncryptedRecordStore(const utility::RocksDBStore& db)
{
    reload(db);
}

void EncryptedRecordStore::reload(const utility::RocksDBStore& db)
{
    records_.clear();
    decrypted_.clear();

    db.scan(kRecordPrefix,
            [this](const std::string& key, const std::string& value) {
                EncryptedRecord record;
                if (!decode_value(value, record)) {
                    throw std::runtime_error("Corrupted record entry: key "
                                             + utility::hex_string(key));
                }
                if (record.id != records_.size() + 1) {
                    throw std::runtime_error(
                        "Non contiguous record identifiers: found "
                        + std::to_string(record.id) + " after "
                        + std::to_string(records_.size()));
                }
                records_.push_back(std::move(record));
            });

    decrypted_.resize(records_.size());

    db.scan(kDecryptedPrefix,
            [this](const std::string& key, const std::string& value) {
                DecryptedRecord record;
                if (!decode_value(value, record)) {
                    throw std::runtime_error("Corrupted decrypted entry: key "
                                             + utility::hex_string(key));
                }
                uint64_t index = kInvalidRecordId;
                id_from_key(key, kDecryptedPrefix, index);
                if (index == kInvalidRecordId || index > decrypted_.size()) {
                    throw std::runtime_error(
                        "Decrypted entry without record: "
                        + std::to_string(index));
                }
                decrypted_[index - 1] = std::move(record);
            });

    logger::logger()->debug("Loaded {} records", records_.size());
}

record_id_type EncryptedRecordStore::next_id() const
{
    if (records_.size() >= std::numeric_limits<record_id_type>::max() - 1) {
        /* LCOV_EXCL_START */
        throw LedgerError(ErrorCode::ResourceExhausted,
                          "record identifier space exhausted");
        /* LCOV_EXCL_STOP */
    }
    return static_cast<record_id_type>(records_.size()) + 1;
}

record_id_type EncryptedRecordStore::submit(const record_fields_type& fields,
                                            uint64_t           submitted_at,
                                            const std::string& submitter,
                                            rocksdb::WriteBatch& batch)
{
    EncryptedRecord record;
    record.id           = next_id();
    record.fields       = fields;
    record.submitted_at = submitted_at;
    record.submitter    = submitter;
    record.status       = RecordStatus::Sealed;

    DecryptedRecord empty;

    batch.Put(record_key(record.id), encode_value(record));
    batch.Put(decrypted_key(record.id), encode_value(empty));

    records_.push_back(std::move(record));
    decrypted_.push_back(std::move(empty));

    return records_.back().id;
}

bool EncryptedRecordStore::contains(record_id_type id) const
{
    return id != kInvalidRecordId && id <= records_.size();
}

bool EncryptedRecordStore::get(record_id_type id, EncryptedRecord& record) const
{
    if (!contains(id)) {
        return false;
    }
    record = at(id);
    return true;
}

DecryptedRecord EncryptedRecordStore::decrypted(record_id_type id) const
{
    if (!contains(id)) {
        return DecryptedRecord();
    }
    return decrypted_[id - 1];
}

bool EncryptedRecordStore::is_revealed(record_id_type id) const
{
    return contains(id) && decrypted_[id - 1].revealed;
}

void EncryptedRecordStore::mark_reveal_pending(record_id_type       id,
                                               rocksdb::WriteBatch& batch)
{
    EncryptedRecord& record = at(id);
    if (record.status != RecordStatus::Sealed) {
        throw LedgerError(ErrorCode::AlreadyRevealed,
                          "record #" + std::to_string(id) + " is "
                              + to_string(record.status));
    }
    record.status = RecordStatus::RevealPending;
    batch.Put(record_key(id), encode_value(record));
}

void EncryptedRecordStore::mark_revealed(record_id_type           id,
                                         std::vector<std::string> cleartext,
                                         rocksdb::WriteBatch&     batch)
{
    EncryptedRecord& record    = at(id);
    DecryptedRecord& decrypted = decrypted_[id - 1];

    if (decrypted.revealed || record.status == RecordStatus::Revealed) {
        throw LedgerError(ErrorCode::AlreadyRevealed,
                          "record #" + std::to_string(id)
                              + " was already revealed");
    }

    record.status       = RecordStatus::Revealed;
    decrypted.cleartext = std::move(cleartext);
    decrypted.revealed  = true;

    batch.Put(record_key(id), encode_value(record));
    batch.Put(decrypted_key(id), encode_value(decrypted));
}

EncryptedRecord& EncryptedRecordStore::at(record_id_type id)
{
    if (!contains(id)) {
        throw LedgerError(ErrorCode::UnknownRecord,
                          "no record #" + std::to_string(id));
    }
    return records_[id - 1];
}

const EncryptedRecord& EncryptedRecordStore::at(record_id_type id) const
{
    if (!contains(id)) {
        throw LedgerError(ErrorCode::UnknownRecord,
                          "no record #" + std::to_string(id));
    }
    return records_[id - 1];
}

} // namespace ledger
} // namespace ctwin
