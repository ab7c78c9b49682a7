// SOULBOUND - Core Types Header
// Copyright (c) 2024 SOULBOUND Developers
// MIT License
//
// This file defines fundamental types used throughout SOULBOUND.

#ifndef SOULBOUND_CORE_TYPES_H
#define SOULBOUND_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <optional>
#include <cstring>

namespace soulbound {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Opaque byte string
using Bytes = std::vector<Byte>;

/// Amount in smallest units of the bound asset
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

// ============================================================================
// Fixed-size Byte Values
// ============================================================================

/// Fixed-size byte value (hashes, addresses, identifiers).
/// Bytes are kept and displayed in natural order.
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null value
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (truncated or zero-padded to SIZE)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic order over the stored bytes
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex string (no prefix)
    std::string ToHex() const;

    /// Parse from hex string, with or without "0x" prefix.
    /// @throws std::invalid_argument on bad length or characters
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (20 bytes)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}
};

/// Account key (20 bytes). The all-zero address is the null key.
class Address : public Hash160 {
public:
    using Hash160::Hash160;
    Address() = default;
    explicit Address(const Hash160& h) : Hash160(h) {}

    /// Parse "0x"-prefixed or bare hex
    static Address FromHex(const std::string& hex) {
        return Address(Hash160(BaseHash<160>::FromHex(hex)));
    }

    /// Parse without throwing
    static std::optional<Address> TryFromHex(const std::string& hex);

    /// Hex with "0x" prefix
    std::string ToString() const { return "0x" + ToHex(); }
};

/// Soul identifier (128 bits)
class Uuid : public BaseHash<128> {
public:
    using BaseHash<128>::BaseHash;
    Uuid() = default;
    Uuid(const BaseHash<128>& base) : BaseHash<128>(base) {}

    static Uuid FromHex(const std::string& hex) {
        return Uuid(BaseHash<128>::FromHex(hex));
    }

    /// Canonical 8-4-4-4-12 rendering
    std::string ToString() const;
};

/// Identity string fingerprint (SHA-256 of the identity bytes)
class IdentityFingerprint : public Hash256 {
public:
    using Hash256::Hash256;
    IdentityFingerprint() = default;
    explicit IdentityFingerprint(const Hash256& h) : Hash256(h) {}
};

// ============================================================================
// Byte string helpers
// ============================================================================

inline Bytes StringToBytes(const std::string& str) {
    return Bytes(str.begin(), str.end());
}

inline std::string BytesToString(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

// ============================================================================
// Little-endian helpers
// ============================================================================

inline void WriteLE64(std::vector<Byte>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<Byte>((value >> (i * 8)) & 0xFF));
    }
}

inline uint64_t ReadLE64(const Byte* data) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[i]) << (i * 8);
    }
    return value;
}

inline void WriteLE32(std::vector<Byte>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<Byte>((value >> (i * 8)) & 0xFF));
    }
}

inline uint32_t ReadLE32(const Byte* data) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data[i]) << (i * 8);
    }
    return value;
}

} // namespace soulbound

#endif // SOULBOUND_CORE_TYPES_H
