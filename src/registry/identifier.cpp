// SOULBOUND - Identifier Generator
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/registry/identifier.h"
#include "soulbound/crypto/sha256.h"
#include "soulbound/registry/uniqueness.h"
#include "soulbound/util/logging.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace soulbound {
namespace registry {

const char* IdentifierModeToString(IdentifierMode mode) {
    switch (mode) {
        case IdentifierMode::Faithful:  return "faithful";
        case IdentifierMode::Corrected: return "corrected";
        default:                        return "unknown";
    }
}

std::optional<IdentifierMode> IdentifierModeFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "faithful") return IdentifierMode::Faithful;
    if (lower == "corrected") return IdentifierMode::Corrected;
    return std::nullopt;
}

IdentifierGenerator::IdentifierGenerator(const Address& baseAsset, uint64_t chainId,
                                         IdentifierMode mode)
    : registryFingerprint_(SHA256Hash(baseAsset.data(), baseAsset.size()))
    , chainId_(chainId)
    , mode_(mode) {}

Uuid IdentifierGenerator::Derive(const Address& owner, Timestamp timestamp,
                                 uint64_t counter, uint32_t retry) const {
    std::vector<Byte> seed;
    seed.reserve(8 + Address::SIZE + 8 + Hash256::SIZE + 8 + 4);

    WriteLE64(seed, static_cast<uint64_t>(timestamp));
    seed.insert(seed.end(), owner.begin(), owner.end());
    WriteLE64(seed, counter);
    seed.insert(seed.end(), registryFingerprint_.begin(), registryFingerprint_.end());
    WriteLE64(seed, chainId_);
    if (mode_ == IdentifierMode::Corrected) {
        WriteLE32(seed, retry);
    }

    Hash256 digest = SHA256Hash(seed);
    return Uuid(digest.data(), Uuid::SIZE);
}

IdentifierResult IdentifierGenerator::Generate(const Address& owner, Timestamp timestamp,
                                               uint64_t counter,
                                               const UniquenessIndex& index) const {
    IdentifierResult result;

    for (int retry = 0; retry <= MAX_RETRIES; ++retry) {
        Uuid candidate = Derive(owner, timestamp, counter, static_cast<uint32_t>(retry));
        ++result.attempts;

        bool taken = false;
        RegistryError err = index.ContainsUuid(candidate, &taken);
        if (err != RegistryError::OK) {
            result.error = err;
            return result;
        }
        if (!taken) {
            result.uuid = candidate;
            return result;
        }

        LOG_DEBUG(util::LogCategory::REGISTRY) << "Identifier collision for "
                                               << owner.ToString() << " on attempt "
                                               << result.attempts << " ("
                                               << IdentifierModeToString(mode_) << ")";
    }

    LOG_WARN(util::LogCategory::REGISTRY) << "Identifier generation for " << owner.ToString()
                                          << " gave up after " << result.attempts
                                          << " attempts";
    result.error = RegistryError::MaxRetriesExceeded;
    return result;
}

} // namespace registry
} // namespace soulbound
