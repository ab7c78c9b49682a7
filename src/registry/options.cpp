// SOULBOUND - Registry Options
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/registry/options.h"
#include "soulbound/util/config.h"
#include "soulbound/util/logging.h"

namespace soulbound {
namespace registry {

namespace {

bool Fail(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    LOG_WARN(util::LogCategory::CONFIG) << message;
    return false;
}

bool ReadAddress(const util::ConfigManager& config, const char* key,
                 Address* out, std::string* error) {
    auto str = config.TryGetString(key);
    if (!str) {
        return true;
    }
    auto address = Address::TryFromHex(*str);
    if (!address) {
        return Fail(error, std::string("Invalid address for ") + key + ": " + *str);
    }
    *out = *address;
    return true;
}

} // namespace

std::optional<RegistryOptions> RegistryOptions::FromConfig(const util::ConfigManager& config,
                                                           std::string* error) {
    RegistryOptions options;

    if (!ReadAddress(config, util::ConfigKeys::ADMIN, &options.administrator, error) ||
        !ReadAddress(config, util::ConfigKeys::BASEASSET, &options.baseAsset, error)) {
        return std::nullopt;
    }

    if (config.HasKey(util::ConfigKeys::CHAINID)) {
        auto chainId = config.TryGetUInt(util::ConfigKeys::CHAINID);
        if (!chainId) {
            Fail(error, "Invalid chainid: " + config.GetString(util::ConfigKeys::CHAINID, ""));
            return std::nullopt;
        }
        options.chainId = *chainId;
    }

    if (auto modeStr = config.TryGetString(util::ConfigKeys::IDENTIFIERMODE)) {
        auto mode = IdentifierModeFromString(*modeStr);
        if (!mode) {
            Fail(error, "Invalid identifiermode (expected faithful or corrected): " + *modeStr);
            return std::nullopt;
        }
        options.identifierMode = *mode;
    }

    if (config.HasKey(util::ConfigKeys::RELEASEIDENTITYONBURN)) {
        auto release = config.TryGetBool(util::ConfigKeys::RELEASEIDENTITYONBURN);
        if (!release) {
            Fail(error, "Invalid releaseidentityonburn: " +
                        config.GetString(util::ConfigKeys::RELEASEIDENTITYONBURN, ""));
            return std::nullopt;
        }
        options.releaseIdentityOnBurn = *release;
    }

    return options;
}

} // namespace registry
} // namespace soulbound
