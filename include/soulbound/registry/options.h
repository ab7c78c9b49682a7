// SOULBOUND - Registry Options
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#ifndef SOULBOUND_REGISTRY_OPTIONS_H
#define SOULBOUND_REGISTRY_OPTIONS_H

#include "soulbound/core/types.h"
#include "soulbound/registry/identifier.h"

#include <optional>
#include <string>

namespace soulbound {

namespace util {
class ConfigManager;
}

namespace registry {

struct RegistryOptions {
    static constexpr uint64_t DEFAULT_CHAIN_ID = 1;

    /// Administrator for the default SingleAdministrator
    Address administrator;

    /// External asset the registry is bound to; must be non-null
    Address baseAsset;

    /// Domain/network discriminator hashed into every identifier
    uint64_t chainId{DEFAULT_CHAIN_ID};

    IdentifierMode identifierMode{IdentifierMode::Faithful};

    /// Release the identity fingerprint when a soul is burned
    bool releaseIdentityOnBurn{false};

    /**
     * Read options from configuration keys admin, baseasset, chainid,
     * identifiermode and releaseidentityonburn.
     *
     * @param error Receives a description of the first invalid key
     * @return nullopt if a key is present but malformed
     */
    static std::optional<RegistryOptions> FromConfig(const util::ConfigManager& config,
                                                     std::string* error = nullptr);
};

} // namespace registry
} // namespace soulbound

#endif // SOULBOUND_REGISTRY_OPTIONS_H
