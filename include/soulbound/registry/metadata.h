// SOULBOUND - Soul Metadata
// Copyright (c) 2024 SOULBOUND Developers
// MIT License
//
// Per-owner key/value metadata gated by a global whitelist of keys.
//
// Every owner has an append-only list of the keys ever written with a
// non-empty value. The list is never pruned: clearing a value leaves its
// key in the list, so enumeration yields the key with an empty value.

#ifndef SOULBOUND_REGISTRY_METADATA_H
#define SOULBOUND_REGISTRY_METADATA_H

#include "soulbound/core/types.h"
#include "soulbound/db/database.h"
#include "soulbound/registry/errors.h"

#include <string>
#include <vector>

namespace soulbound {
namespace registry {

// ============================================================================
// Allowed Key Set
// ============================================================================

/// Global whitelist of metadata keys. Removing a key blocks further writes
/// through it but keeps the values already stored.
class AllowedKeySet {
public:
    explicit AllowedKeySet(db::Database& db) : db_(&db) {}

    RegistryError Contains(const std::string& key, bool* allowed) const;

    void StageAllow(db::WriteBatch& batch, const std::string& key) const;
    void StageDisallow(db::WriteBatch& batch, const std::string& key) const;

private:
    db::Database* db_;
};

// ============================================================================
// Metadata Store
// ============================================================================

class MetadataStore {
public:
    explicit MetadataStore(db::Database& db) : db_(&db) {}

    /// Current value; empty if never written or cleared
    RegistryError GetValue(const Address& owner, const std::string& key, Bytes* value) const;

    /// Number of keys in the owner's key list
    RegistryError GetKeyCount(const Address& owner, uint64_t* count) const;

    /// Whether key is already in the owner's key list
    RegistryError IsTracked(const Address& owner, const std::string& key, bool* tracked) const;

    /**
     * Stage an overwrite of (owner, key).
     *
     * The key is appended to the owner's key list if value is non-empty and
     * the key is not tracked yet. An empty value clears the entry.
     */
    RegistryError StageSet(db::WriteBatch& batch, const Address& owner,
                           const std::string& key, const Bytes& value) const;

    /// Stage clearing (owner, key); the key stays in the key list
    void StageDelete(db::WriteBatch& batch, const Address& owner,
                     const std::string& key) const;

    /**
     * Parallel keys and current values, in first-write order.
     * Pure read: repeated calls without writes in between return the same
     * sequences.
     */
    RegistryError Enumerate(const Address& owner, std::vector<std::string>* keys,
                            std::vector<Bytes>* values) const;

private:
    static std::string ValueKey(const Address& owner, const std::string& key);
    static std::string TrackedKey(const Address& owner, const std::string& key);
    static std::string ListKey(const Address& owner, uint64_t index);
    static std::string CountKey(const Address& owner);

    db::Database* db_;
};

} // namespace registry
} // namespace soulbound

#endif // SOULBOUND_REGISTRY_METADATA_H
