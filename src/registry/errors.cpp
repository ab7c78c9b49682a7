// SOULBOUND - Registry Errors
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/registry/errors.h"
#include "soulbound/db/database.h"

namespace soulbound {
namespace registry {

const char* RegistryErrorToString(RegistryError error) {
    switch (error) {
        case RegistryError::OK:                         return "OK";
        case RegistryError::InvalidAddress:             return "InvalidAddress";
        case RegistryError::InvalidContractInteraction: return "InvalidContractInteraction";
        case RegistryError::TokenAmountIsZero:          return "TokenAmountIsZero";
        case RegistryError::MetadataKeyNotAllowed:      return "MetadataKeyNotAllowed";
        case RegistryError::EmptyUrl:                   return "EmptyUrl";
        case RegistryError::IdentityNotUnique:          return "IdentityNotUnique";
        case RegistryError::SoulAlreadyExists:          return "SoulAlreadyExists";
        case RegistryError::SoulDoesNotExist:           return "SoulDoesNotExist";
        case RegistryError::UnauthorizedBurning:        return "UnauthorizedBurning";
        case RegistryError::Unauthorized:               return "Unauthorized";
        case RegistryError::NotPermitted:               return "NotPermitted";
        case RegistryError::RegistryPaused:             return "RegistryPaused";
        case RegistryError::MaxRetriesExceeded:         return "MaxRetriesExceeded";
        case RegistryError::StorageFailure:             return "StorageFailure";
        case RegistryError::CorruptRecord:              return "CorruptRecord";
        default:                                        return "Unknown";
    }
}

RegistryError RegistryErrorFromStatus(const db::Status& status) {
    if (status.ok()) {
        return RegistryError::OK;
    }
    if (status.IsCorruption()) {
        return RegistryError::CorruptRecord;
    }
    return RegistryError::StorageFailure;
}

} // namespace registry
} // namespace soulbound
