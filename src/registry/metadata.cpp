// SOULBOUND - Soul Metadata
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/registry/metadata.h"
#include "soulbound/util/logging.h"

namespace soulbound {
namespace registry {

namespace {

constexpr char PRESENT = '\x01';

std::string OwnerKey(char prefix, const Address& owner) {
    return db::MakeKey(prefix, owner);
}

/// Get that treats NotFound as "absent" rather than an error
RegistryError ReadOptional(db::Database* db, const std::string& key,
                           std::string* value, bool* found) {
    db::Status s = db->Get(key, value);
    if (s.IsNotFound()) {
        *found = false;
        return RegistryError::OK;
    }
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::METADATA) << "Metadata read failed: " << s.ToString();
        return RegistryErrorFromStatus(s);
    }
    *found = true;
    return RegistryError::OK;
}

} // namespace

// ============================================================================
// AllowedKeySet
// ============================================================================

RegistryError AllowedKeySet::Contains(const std::string& key, bool* allowed) const {
    std::string value;
    return ReadOptional(db_, db::MakeKey(db::prefix::ALLOWED_KEY, key), &value, allowed);
}

void AllowedKeySet::StageAllow(db::WriteBatch& batch, const std::string& key) const {
    batch.Put(db::MakeKey(db::prefix::ALLOWED_KEY, key), db::Slice(&PRESENT, 1));
}

void AllowedKeySet::StageDisallow(db::WriteBatch& batch, const std::string& key) const {
    batch.Delete(db::MakeKey(db::prefix::ALLOWED_KEY, key));
}

// ============================================================================
// MetadataStore keys
// ============================================================================

std::string MetadataStore::ValueKey(const Address& owner, const std::string& key) {
    return OwnerKey(db::prefix::METADATA, owner) + key;
}

std::string MetadataStore::TrackedKey(const Address& owner, const std::string& key) {
    return OwnerKey(db::prefix::KEY_TRACKED, owner) + key;
}

std::string MetadataStore::ListKey(const Address& owner, uint64_t index) {
    std::string out = OwnerKey(db::prefix::KEY_LIST, owner);
    // Big-endian so list entries sort by index
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<char>((index >> (i * 8)) & 0xFF));
    }
    return out;
}

std::string MetadataStore::CountKey(const Address& owner) {
    return OwnerKey(db::prefix::KEY_LIST_SIZE, owner);
}

// ============================================================================
// MetadataStore
// ============================================================================

RegistryError MetadataStore::GetValue(const Address& owner, const std::string& key,
                                      Bytes* value) const {
    std::string raw;
    bool found = false;
    RegistryError err = ReadOptional(db_, ValueKey(owner, key), &raw, &found);
    if (err != RegistryError::OK) {
        return err;
    }
    value->assign(raw.begin(), raw.end());
    return RegistryError::OK;
}

RegistryError MetadataStore::GetKeyCount(const Address& owner, uint64_t* count) const {
    std::string raw;
    bool found = false;
    RegistryError err = ReadOptional(db_, CountKey(owner), &raw, &found);
    if (err != RegistryError::OK) {
        return err;
    }
    if (!found) {
        *count = 0;
        return RegistryError::OK;
    }
    if (raw.size() != 8) {
        return RegistryError::CorruptRecord;
    }
    *count = ReadLE64(reinterpret_cast<const Byte*>(raw.data()));
    return RegistryError::OK;
}

RegistryError MetadataStore::IsTracked(const Address& owner, const std::string& key,
                                       bool* tracked) const {
    std::string raw;
    return ReadOptional(db_, TrackedKey(owner, key), &raw, tracked);
}

RegistryError MetadataStore::StageSet(db::WriteBatch& batch, const Address& owner,
                                      const std::string& key, const Bytes& value) const {
    if (!value.empty()) {
        bool tracked = false;
        RegistryError err = IsTracked(owner, key, &tracked);
        if (err != RegistryError::OK) {
            return err;
        }

        if (!tracked) {
            uint64_t count = 0;
            err = GetKeyCount(owner, &count);
            if (err != RegistryError::OK) {
                return err;
            }

            std::vector<Byte> newCount;
            WriteLE64(newCount, count + 1);

            batch.Put(ListKey(owner, count), key);
            batch.Put(CountKey(owner), newCount);
            batch.Put(TrackedKey(owner, key), db::Slice(&PRESENT, 1));
        }

        batch.Put(ValueKey(owner, key), value);
    } else {
        batch.Delete(ValueKey(owner, key));
    }
    return RegistryError::OK;
}

void MetadataStore::StageDelete(db::WriteBatch& batch, const Address& owner,
                                const std::string& key) const {
    batch.Delete(ValueKey(owner, key));
}

RegistryError MetadataStore::Enumerate(const Address& owner, std::vector<std::string>* keys,
                                       std::vector<Bytes>* values) const {
    keys->clear();
    values->clear();

    uint64_t count = 0;
    RegistryError err = GetKeyCount(owner, &count);
    if (err != RegistryError::OK) {
        return err;
    }

    keys->reserve(count);
    values->reserve(count);

    for (uint64_t i = 0; i < count; ++i) {
        std::string key;
        db::Status s = db_->Get(ListKey(owner, i), &key);
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::METADATA) << "Key list entry " << i << " of "
                                                   << owner.ToString() << " unreadable: "
                                                   << s.ToString();
            keys->clear();
            values->clear();
            return s.IsNotFound() ? RegistryError::CorruptRecord : RegistryErrorFromStatus(s);
        }

        Bytes value;
        err = GetValue(owner, key, &value);
        if (err != RegistryError::OK) {
            keys->clear();
            values->clear();
            return err;
        }

        keys->push_back(std::move(key));
        values->push_back(std::move(value));
    }

    return RegistryError::OK;
}

} // namespace registry
} // namespace soulbound
