// SOULBOUND - Registry Errors
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#ifndef SOULBOUND_REGISTRY_ERRORS_H
#define SOULBOUND_REGISTRY_ERRORS_H

#include <string>

namespace soulbound {

namespace db {
class Status;
}

namespace registry {

/// Outcome of a registry operation. Every non-OK value means the
/// operation had no observable effect.
enum class RegistryError {
    OK = 0,

    /// A required address (owner, destination, administrator) is null
    InvalidAddress,

    /// Token handle does not reference a live external asset
    InvalidContractInteraction,

    /// Withdrawal amount is zero (or negative)
    TokenAmountIsZero,

    /// Metadata key is not in the allowed key set
    MetadataKeyNotAllowed,

    /// Soul URL is empty
    EmptyUrl,

    /// Identity string is already bound to a soul
    IdentityNotUnique,

    /// Owner already has a live soul
    SoulAlreadyExists,

    /// Owner has no live soul
    SoulDoesNotExist,

    /// Burn caller is neither the administrator nor the owner
    UnauthorizedBurning,

    /// Caller is not the administrator
    Unauthorized,

    /// Operation is never permitted (direct transfers to the registry)
    NotPermitted,

    /// Registry is paused
    RegistryPaused,

    /// Every identifier candidate collided with a live soul
    MaxRetriesExceeded,

    /// The key/value store reported an error
    StorageFailure,

    /// A stored record could not be decoded
    CorruptRecord
};

/// Stable name of an error ("OK", "SoulDoesNotExist", ...)
const char* RegistryErrorToString(RegistryError error);

/// Map a failed storage status to a registry error (OK stays OK)
RegistryError RegistryErrorFromStatus(const db::Status& status);

inline bool IsOk(RegistryError error) { return error == RegistryError::OK; }

} // namespace registry
} // namespace soulbound

#endif // SOULBOUND_REGISTRY_ERRORS_H
