// SOULBOUND - Core Types Implementation
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/core/types.h"
#include "soulbound/core/hex.h"

#include <stdexcept>

namespace soulbound {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for " +
                                    std::to_string(SIZE) + "-byte value");
    }

    std::vector<Byte> bytes = HexToBytes(digits);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;
template class BaseHash<128>;

// ============================================================================
// Address / Uuid
// ============================================================================

std::optional<Address> Address::TryFromHex(const std::string& hex) {
    std::string digits = StripHexPrefix(hex);
    if (digits.length() != SIZE * 2 || !IsValidHex(digits)) {
        return std::nullopt;
    }
    return FromHex(digits);
}

std::string Uuid::ToString() const {
    std::string hex = ToHex();
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" +
           hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
           hex.substr(20, 12);
}

} // namespace soulbound
