// SOULBOUND - Access Control Collaborators
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/registry/access.h"
#include "soulbound/util/logging.h"

namespace soulbound {
namespace registry {

// ============================================================================
// SingleAdministrator
// ============================================================================

bool SingleAdministrator::IsAdministrator(const Address& caller) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !admin_.IsNull() && caller == admin_;
}

RegistryError SingleAdministrator::TransferAdministration(const Address& caller,
                                                          const Address& newAdmin) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (admin_.IsNull() || caller != admin_) {
        return RegistryError::Unauthorized;
    }
    if (newAdmin.IsNull()) {
        return RegistryError::InvalidAddress;
    }

    LOG_INFO(util::LogCategory::REGISTRY) << "Administration transferred from "
                                          << admin_.ToString() << " to "
                                          << newAdmin.ToString();
    admin_ = newAdmin;
    return RegistryError::OK;
}

Address SingleAdministrator::GetAdministrator() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admin_;
}

// ============================================================================
// PauseSwitch
// ============================================================================

RegistryError PauseSwitch::Pause(const Address& caller) {
    if (!auth_ || !auth_->IsAdministrator(caller)) {
        return RegistryError::Unauthorized;
    }
    if (!paused_.exchange(true)) {
        LOG_INFO(util::LogCategory::REGISTRY) << "Registry paused by " << caller.ToString();
    }
    return RegistryError::OK;
}

RegistryError PauseSwitch::Unpause(const Address& caller) {
    if (!auth_ || !auth_->IsAdministrator(caller)) {
        return RegistryError::Unauthorized;
    }
    if (paused_.exchange(false)) {
        LOG_INFO(util::LogCategory::REGISTRY) << "Registry unpaused by " << caller.ToString();
    }
    return RegistryError::OK;
}

} // namespace registry
} // namespace soulbound
