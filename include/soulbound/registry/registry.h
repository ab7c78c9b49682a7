// SOULBOUND - Soul Registry
// Copyright (c) 2024 SOULBOUND Developers
// MIT License
//
// Issues, reads and revokes soul records and their metadata.
//
// All state lives in the database owned by the registry. Each mutating
// call validates its preconditions, stages every change into one
// WriteBatch and commits it atomically, so a rejected or failed call
// leaves the store untouched. Calls are serialized by an internal mutex.
//
// Precondition order for mutating calls: authorization, pause, then the
// operation's own validation.

#ifndef SOULBOUND_REGISTRY_REGISTRY_H
#define SOULBOUND_REGISTRY_REGISTRY_H

#include "soulbound/core/types.h"
#include "soulbound/db/database.h"
#include "soulbound/registry/access.h"
#include "soulbound/registry/errors.h"
#include "soulbound/registry/identifier.h"
#include "soulbound/registry/metadata.h"
#include "soulbound/registry/options.h"
#include "soulbound/registry/soul.h"
#include "soulbound/registry/uniqueness.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace soulbound {
namespace registry {

// ============================================================================
// Events
// ============================================================================

enum class RegistryEventType {
    Mint,
    Burn,
    /// Reserved; no registry operation emits it
    Update,
    Withdrawal
};

const char* RegistryEventTypeToString(RegistryEventType type);

struct RegistryEvent {
    RegistryEventType type{RegistryEventType::Mint};

    /// Soul owner (Mint, Burn, Update)
    Address owner;

    /// Withdrawal fields
    Address initiator;
    Address destination;
    Amount amount{0};

    std::string ToString() const;
};

using EventCallback = std::function<void(const RegistryEvent&)>;

// ============================================================================
// Collaborators
// ============================================================================

/// Injected collaborators. Null members are replaced by defaults:
/// SingleAdministrator(options.administrator), an unpaused PauseSwitch and
/// no transfer service (Withdraw then fails InvalidContractInteraction).
struct RegistryCollaborators {
    std::shared_ptr<AuthorizationProvider> authorization;
    std::shared_ptr<PauseState> pause;
    std::shared_ptr<ValueTransferService> transfers;
};

// ============================================================================
// Soul Registry
// ============================================================================

class SoulRegistry {
public:
    /**
     * Create a registry over a database.
     *
     * Fails with InvalidAddress if options.baseAsset is null, or if no
     * authorization provider is supplied and options.administrator is null.
     * @return Pair of (error, registry); the registry is null on failure
     */
    static std::pair<RegistryError, std::unique_ptr<SoulRegistry>> Open(
        std::unique_ptr<db::Database> db,
        const RegistryOptions& options,
        RegistryCollaborators collaborators = RegistryCollaborators());

    ~SoulRegistry();

    SoulRegistry(const SoulRegistry&) = delete;
    SoulRegistry& operator=(const SoulRegistry&) = delete;

    // ========================================================================
    // Souls
    // ========================================================================

    /**
     * Mint a soul for owner.
     *
     * Rejections in order: Unauthorized, InvalidAddress (null owner),
     * RegistryPaused, IdentityNotUnique, EmptyUrl, SoulAlreadyExists, then
     * MaxRetriesExceeded from identifier generation.
     * On success the record, both uniqueness entries and the incremented
     * counter are committed together and a Mint event is emitted.
     *
     * @param uuidOut Receives the new soul's identifier (optional)
     */
    RegistryError Mint(const Address& caller, const Address& owner,
                       const Bytes& identity, const Bytes& url,
                       Uuid* uuidOut = nullptr);

    /**
     * Burn owner's soul. The caller must be the administrator or the owner.
     *
     * Rejections in order: UnauthorizedBurning, RegistryPaused,
     * SoulDoesNotExist. The uuid is released; the identity fingerprint is
     * released only with RegistryOptions::releaseIdentityOnBurn.
     * Metadata is kept.
     */
    RegistryError Burn(const Address& caller, const Address& owner);

    /// Read owner's soul, optionally with its full metadata enumeration
    RegistryError GetSoul(const Address& owner, bool includeMetadata, SoulView* out) const;

    /// Number of successful mints
    RegistryError GetCounter(uint64_t* counter) const;

    const Address& GetBaseAssetHandle() const { return options_.baseAsset; }

    // ========================================================================
    // Metadata
    // ========================================================================

    /// Administrator-only; not affected by pause
    RegistryError AllowKey(const Address& caller, const std::string& key);
    RegistryError DisallowKey(const Address& caller, const std::string& key);

    RegistryError IsMetadataKeyAllowed(const std::string& key, bool* allowed) const;

    /**
     * Overwrite a metadata value. Administrator-only.
     *
     * Rejections in order: Unauthorized, RegistryPaused, InvalidAddress,
     * MetadataKeyNotAllowed. The owner need not hold a live soul.
     */
    RegistryError SetMetadata(const Address& caller, const Address& owner,
                              const std::string& key, const Bytes& value);

    /// Clear a metadata value; the key stays in the owner's key list
    RegistryError DeleteMetadata(const Address& caller, const Address& owner,
                                 const std::string& key);

    /// Current value, empty if never written or cleared
    RegistryError GetMetadataValue(const Address& owner, const std::string& key,
                                   Bytes* value) const;

    /// Parallel keys and values in first-write order
    RegistryError Enumerate(const Address& owner, std::vector<std::string>* keys,
                            std::vector<Bytes>* values) const;

    // ========================================================================
    // Value Transfer
    // ========================================================================

    /**
     * Move an external asset held on the registry's behalf.
     *
     * Rejections in order: Unauthorized, TokenAmountIsZero (amount <= 0),
     * InvalidAddress (null destination), InvalidContractInteraction (no
     * transfer service, token not live, or transfer refused).
     * Emits Withdrawal on success.
     */
    RegistryError Withdraw(const Address& caller, const Address& token,
                           const Address& destination, Amount amount);

    /// Direct value transfers to the registry are always refused
    RegistryError RejectDirectTransfer(const Address& sender, Amount amount) const;

    // ========================================================================
    // Events
    // ========================================================================

    /// Register a callback for registry events. Callbacks run on the
    /// calling thread after the change is committed, outside the registry
    /// lock. Returns an id for UnsubscribeEvents.
    size_t SubscribeEvents(EventCallback callback);
    void UnsubscribeEvents(size_t id);

    // ========================================================================
    // Accessors
    // ========================================================================

    const RegistryOptions& GetOptions() const { return options_; }
    const IdentifierGenerator& GetIdentifierGenerator() const { return generator_; }

    AuthorizationProvider& GetAuthorization() { return *authorization_; }
    PauseState& GetPauseState() { return *pause_; }

    db::Database& GetDatabase() { return *db_; }

private:
    SoulRegistry(std::unique_ptr<db::Database> db, const RegistryOptions& options,
                 RegistryCollaborators collaborators);

    /// Reads without taking mutex_
    RegistryError ReadSoul(const Address& owner, std::optional<Soul>* soul) const;
    RegistryError ReadCounter(uint64_t* counter) const;

    RegistryError Commit(db::WriteBatch& batch, const char* what);
    RegistryError CheckMetadataWrite(const Address& caller, const Address& owner,
                                     const std::string& key) const;

    void Emit(const RegistryEvent& event);

    std::unique_ptr<db::Database> db_;
    RegistryOptions options_;

    std::shared_ptr<AuthorizationProvider> authorization_;
    std::shared_ptr<PauseState> pause_;
    std::shared_ptr<ValueTransferService> transfers_;

    IdentifierGenerator generator_;
    UniquenessIndex uniqueness_;
    AllowedKeySet allowedKeys_;
    MetadataStore metadata_;

    mutable std::mutex mutex_;

    std::map<size_t, EventCallback> subscribers_;
    size_t nextSubscriberId_{1};
    mutable std::mutex subscribersMutex_;
};

} // namespace registry
} // namespace soulbound

#endif // SOULBOUND_REGISTRY_REGISTRY_H
