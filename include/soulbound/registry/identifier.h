// SOULBOUND - Identifier Generator
// Copyright (c) 2024 SOULBOUND Developers
// MIT License
//
// Derives soul identifiers:
//
//   uuid = SHA256(timestamp || owner || counter || registryFingerprint
//                 || chainId [|| retry])[0..16)
//
// timestamp, counter and chainId are 8-byte little-endian, owner is the
// 20-byte address, registryFingerprint is SHA256 of the base asset
// address. The retry counter (4-byte little-endian) is only hashed in
// Corrected mode; in Faithful mode every retry derives the same value.

#ifndef SOULBOUND_REGISTRY_IDENTIFIER_H
#define SOULBOUND_REGISTRY_IDENTIFIER_H

#include "soulbound/core/types.h"
#include "soulbound/registry/errors.h"

#include <cstdint>
#include <optional>
#include <string>

namespace soulbound {
namespace registry {

class UniquenessIndex;

// ============================================================================
// Identifier Mode
// ============================================================================

enum class IdentifierMode {
    /// Retries reuse the first attempt's inputs
    Faithful,

    /// Retries append the retry counter to the hash input
    Corrected
};

const char* IdentifierModeToString(IdentifierMode mode);

/// Parse "faithful" / "corrected" (case-insensitive)
std::optional<IdentifierMode> IdentifierModeFromString(const std::string& str);

// ============================================================================
// Generation Result
// ============================================================================

struct IdentifierResult {
    RegistryError error{RegistryError::OK};

    /// Valid only when error is OK
    Uuid uuid;

    /// Number of candidates derived and checked
    int attempts{0};

    bool ok() const { return error == RegistryError::OK; }
};

// ============================================================================
// Identifier Generator
// ============================================================================

class IdentifierGenerator {
public:
    /// Retries after the first collision; at most MAX_RETRIES + 1 attempts
    static constexpr int MAX_RETRIES = 2;

    IdentifierGenerator(const Address& baseAsset, uint64_t chainId,
                        IdentifierMode mode = IdentifierMode::Faithful);

    /// SHA256 of the base asset address, fixed at construction
    const Hash256& GetRegistryFingerprint() const { return registryFingerprint_; }

    uint64_t GetChainId() const { return chainId_; }
    IdentifierMode GetMode() const { return mode_; }

    /// Candidate for one attempt (retry is ignored in Faithful mode)
    Uuid Derive(const Address& owner, Timestamp timestamp, uint64_t counter,
                uint32_t retry) const;

    /**
     * Derive the first candidate not present in index.
     *
     * Fails with MaxRetriesExceeded after MAX_RETRIES + 1 colliding
     * candidates, or with the index's error if it cannot be read.
     */
    IdentifierResult Generate(const Address& owner, Timestamp timestamp,
                              uint64_t counter, const UniquenessIndex& index) const;

private:
    Hash256 registryFingerprint_;
    uint64_t chainId_;
    IdentifierMode mode_;
};

} // namespace registry
} // namespace soulbound

#endif // SOULBOUND_REGISTRY_IDENTIFIER_H
