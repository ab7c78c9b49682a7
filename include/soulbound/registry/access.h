// SOULBOUND - Access Control Collaborators
// Copyright (c) 2024 SOULBOUND Developers
// MIT License
//
// Interfaces the registry consults before mutating state, plus default
// single-administrator and pause-switch implementations. The registry
// never mutates these itself.

#ifndef SOULBOUND_REGISTRY_ACCESS_H
#define SOULBOUND_REGISTRY_ACCESS_H

#include "soulbound/core/types.h"
#include "soulbound/registry/errors.h"

#include <atomic>
#include <memory>
#include <mutex>

namespace soulbound {
namespace registry {

// ============================================================================
// Authorization
// ============================================================================

class AuthorizationProvider {
public:
    virtual ~AuthorizationProvider() = default;

    virtual bool IsAdministrator(const Address& caller) const = 0;

    /// Hand administration to newAdmin. Only the current administrator may
    /// call this.
    virtual RegistryError TransferAdministration(const Address& caller,
                                                 const Address& newAdmin) = 0;
};

/// One administrator address, replaceable by that administrator
class SingleAdministrator : public AuthorizationProvider {
public:
    explicit SingleAdministrator(const Address& admin) : admin_(admin) {}

    bool IsAdministrator(const Address& caller) const override;
    RegistryError TransferAdministration(const Address& caller,
                                         const Address& newAdmin) override;

    Address GetAdministrator() const;

private:
    Address admin_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Pause
// ============================================================================

class PauseState {
public:
    virtual ~PauseState() = default;

    virtual bool IsPaused() const = 0;

    /// Administrator-only
    virtual RegistryError Pause(const Address& caller) = 0;
    virtual RegistryError Unpause(const Address& caller) = 0;
};

/// In-memory pause flag guarded by an AuthorizationProvider
class PauseSwitch : public PauseState {
public:
    explicit PauseSwitch(std::shared_ptr<const AuthorizationProvider> auth,
                         bool paused = false)
        : auth_(std::move(auth)), paused_(paused) {}

    bool IsPaused() const override { return paused_.load(); }
    RegistryError Pause(const Address& caller) override;
    RegistryError Unpause(const Address& caller) override;

private:
    std::shared_ptr<const AuthorizationProvider> auth_;
    std::atomic<bool> paused_;
};

// ============================================================================
// Value Transfer
// ============================================================================

/**
 * External asset transfer service used by SoulRegistry::Withdraw.
 * The registry holds no value itself; it only validates the request and
 * delegates.
 */
class ValueTransferService {
public:
    virtual ~ValueTransferService() = default;

    /// True if token references a live external asset
    virtual bool IsLiveAsset(const Address& token) const = 0;

    /// Move amount of token to destination; false if the asset refused
    virtual bool Transfer(const Address& token, const Address& destination,
                          Amount amount) = 0;
};

} // namespace registry
} // namespace soulbound

#endif // SOULBOUND_REGISTRY_ACCESS_H
