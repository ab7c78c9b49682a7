// SOULBOUND - Uniqueness Index
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/registry/uniqueness.h"
#include "soulbound/util/logging.h"

namespace soulbound {
namespace registry {

RegistryError UniquenessIndex::Lookup(const std::string& key,
                                      std::optional<Address>* owner) const {
    std::string value;
    db::Status s = db_->Get(key, &value);
    if (s.IsNotFound()) {
        owner->reset();
        return RegistryError::OK;
    }
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Uniqueness lookup failed: " << s.ToString();
        return RegistryErrorFromStatus(s);
    }
    if (value.size() != Address::SIZE) {
        return RegistryError::CorruptRecord;
    }
    *owner = Address(reinterpret_cast<const Byte*>(value.data()), value.size());
    return RegistryError::OK;
}

RegistryError UniquenessIndex::GetIdentityOwner(const IdentityFingerprint& fingerprint,
                                                std::optional<Address>* owner) const {
    return Lookup(db::MakeKey(db::prefix::IDENTITY, fingerprint), owner);
}

RegistryError UniquenessIndex::GetUuidOwner(const Uuid& uuid,
                                            std::optional<Address>* owner) const {
    return Lookup(db::MakeKey(db::prefix::UUID, uuid), owner);
}

RegistryError UniquenessIndex::ContainsIdentity(const IdentityFingerprint& fingerprint,
                                                bool* found) const {
    std::optional<Address> owner;
    RegistryError err = GetIdentityOwner(fingerprint, &owner);
    *found = owner.has_value();
    return err;
}

RegistryError UniquenessIndex::ContainsUuid(const Uuid& uuid, bool* found) const {
    std::optional<Address> owner;
    RegistryError err = GetUuidOwner(uuid, &owner);
    *found = owner.has_value();
    return err;
}

void UniquenessIndex::StageInsert(db::WriteBatch& batch,
                                  const IdentityFingerprint& fingerprint,
                                  const Uuid& uuid, const Address& owner) const {
    db::Slice ownerBytes(reinterpret_cast<const char*>(owner.data()), owner.size());
    batch.Put(db::MakeKey(db::prefix::IDENTITY, fingerprint), ownerBytes);
    batch.Put(db::MakeKey(db::prefix::UUID, uuid), ownerBytes);
}

void UniquenessIndex::StageReleaseUuid(db::WriteBatch& batch, const Uuid& uuid) const {
    batch.Delete(db::MakeKey(db::prefix::UUID, uuid));
}

void UniquenessIndex::StageReleaseIdentity(db::WriteBatch& batch,
                                           const IdentityFingerprint& fingerprint) const {
    batch.Delete(db::MakeKey(db::prefix::IDENTITY, fingerprint));
}

} // namespace registry
} // namespace soulbound
