// SOULBOUND - Soul Record
// Copyright (c) 2024 SOULBOUND Developers
// MIT License
//
// A soul binds an owner address to an identity string, a URL and a
// unique identifier. Souls cannot be transferred; they are only minted
// and burned.

#ifndef SOULBOUND_REGISTRY_SOUL_H
#define SOULBOUND_REGISTRY_SOUL_H

#include "soulbound/core/types.h"

#include <optional>
#include <string>
#include <vector>

namespace soulbound {
namespace registry {

// ============================================================================
// Soul
// ============================================================================

struct Soul {
    /// Encoding version written by ToBytes
    static constexpr Byte VERSION = 1;

    /// Largest identity or URL accepted by FromBytes
    static constexpr size_t MAX_FIELD_SIZE = 1024 * 1024;

    /// Identity string, unique across live souls
    Bytes identity;

    /// Non-empty URL
    Bytes url;

    /// Mint time (Unix seconds)
    Timestamp mintedAt{0};

    /// Last update time; equals mintedAt for every soul the registry writes
    Timestamp lastUpdate{0};

    /// Unique identifier
    Uuid uuid;

    /**
     * Encode as: version (1), mintedAt (8 LE), lastUpdate (8 LE), uuid (16),
     * identity length (4 LE), identity, url length (4 LE), url.
     */
    std::vector<Byte> ToBytes() const;

    /// Decode; nullopt if the data is truncated, oversized or has trailing bytes
    static std::optional<Soul> FromBytes(const Byte* data, size_t len);

    static std::optional<Soul> FromBytes(const std::string& data) {
        return FromBytes(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    bool operator==(const Soul& other) const {
        return identity == other.identity && url == other.url &&
               mintedAt == other.mintedAt && lastUpdate == other.lastUpdate &&
               uuid == other.uuid;
    }

    bool operator!=(const Soul& other) const { return !(*this == other); }

    /// Human-readable one-line summary
    std::string ToString() const;
};

/// SHA-256 of the identity bytes, the key of the identity uniqueness set
IdentityFingerprint ComputeIdentityFingerprint(const Bytes& identity);

// ============================================================================
// Soul View
// ============================================================================

/// A soul together with its metadata, as returned by SoulRegistry::GetSoul.
/// keys and values are parallel and in first-write order; both are empty
/// unless metadata was requested.
struct SoulView {
    Soul soul;
    std::vector<std::string> keys;
    std::vector<Bytes> values;
};

} // namespace registry
} // namespace soulbound

#endif // SOULBOUND_REGISTRY_SOUL_H
