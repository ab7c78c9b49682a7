// SOULBOUND - Uniqueness Index
// Copyright (c) 2024 SOULBOUND Developers
// MIT License
//
// Two independent uniqueness sets kept in the database: identity
// fingerprints and issued identifiers. Each entry maps back to the owner
// that holds it. Reads go straight to the database; writes are staged
// into the caller's WriteBatch so they commit together with the soul
// record they belong to.

#ifndef SOULBOUND_REGISTRY_UNIQUENESS_H
#define SOULBOUND_REGISTRY_UNIQUENESS_H

#include "soulbound/core/types.h"
#include "soulbound/db/database.h"
#include "soulbound/registry/errors.h"

#include <optional>

namespace soulbound {
namespace registry {

class UniquenessIndex {
public:
    explicit UniquenessIndex(db::Database& db) : db_(&db) {}

    // ========================================================================
    // Lookups
    // ========================================================================

    /// Sets *found; StorageFailure if the store could not be read
    RegistryError ContainsIdentity(const IdentityFingerprint& fingerprint, bool* found) const;
    RegistryError ContainsUuid(const Uuid& uuid, bool* found) const;

    /// Owner holding a fingerprint / uuid (nullopt in *owner if unused)
    RegistryError GetIdentityOwner(const IdentityFingerprint& fingerprint,
                                   std::optional<Address>* owner) const;
    RegistryError GetUuidOwner(const Uuid& uuid, std::optional<Address>* owner) const;

    // ========================================================================
    // Staged updates
    // ========================================================================

    /// Claim both a fingerprint and a uuid for owner
    void StageInsert(db::WriteBatch& batch, const IdentityFingerprint& fingerprint,
                     const Uuid& uuid, const Address& owner) const;

    void StageReleaseUuid(db::WriteBatch& batch, const Uuid& uuid) const;
    void StageReleaseIdentity(db::WriteBatch& batch,
                              const IdentityFingerprint& fingerprint) const;

private:
    RegistryError Lookup(const std::string& key, std::optional<Address>* owner) const;

    db::Database* db_;
};

} // namespace registry
} // namespace soulbound

#endif // SOULBOUND_REGISTRY_UNIQUENESS_H
