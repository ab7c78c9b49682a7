// SOULBOUND - Soul Registry
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/registry/registry.h"
#include "soulbound/core/hex.h"
#include "soulbound/util/logging.h"
#include "soulbound/util/time.h"

#include <sstream>

namespace soulbound {
namespace registry {

// ============================================================================
// Events
// ============================================================================

const char* RegistryEventTypeToString(RegistryEventType type) {
    switch (type) {
        case RegistryEventType::Mint:       return "Mint";
        case RegistryEventType::Burn:       return "Burn";
        case RegistryEventType::Update:     return "Update";
        case RegistryEventType::Withdrawal: return "Withdrawal";
        default:                            return "Unknown";
    }
}

std::string RegistryEvent::ToString() const {
    std::ostringstream oss;
    oss << RegistryEventTypeToString(type) << "(";
    if (type == RegistryEventType::Withdrawal) {
        oss << "initiator=" << initiator.ToString()
            << ", destination=" << destination.ToString()
            << ", amount=" << amount;
    } else {
        oss << "owner=" << owner.ToString();
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// Construction
// ============================================================================

std::pair<RegistryError, std::unique_ptr<SoulRegistry>> SoulRegistry::Open(
    std::unique_ptr<db::Database> db,
    const RegistryOptions& options,
    RegistryCollaborators collaborators)
{
    if (!db) {
        return {RegistryError::StorageFailure, nullptr};
    }
    if (options.baseAsset.IsNull()) {
        LOG_ERROR(util::LogCategory::REGISTRY) << "Registry base asset must not be null";
        return {RegistryError::InvalidAddress, nullptr};
    }
    if (!collaborators.authorization && options.administrator.IsNull()) {
        LOG_ERROR(util::LogCategory::REGISTRY) << "Registry administrator must not be null";
        return {RegistryError::InvalidAddress, nullptr};
    }

    std::unique_ptr<SoulRegistry> registry(
        new SoulRegistry(std::move(db), options, std::move(collaborators)));

    // Surface an unreadable store now rather than on the first mint
    uint64_t counter = 0;
    RegistryError err = registry->ReadCounter(&counter);
    if (err != RegistryError::OK) {
        return {err, nullptr};
    }

    LOG_INFO(util::LogCategory::REGISTRY)
        << "Soul registry open: base asset " << options.baseAsset.ToString()
        << ", chain " << options.chainId
        << ", identifier mode " << IdentifierModeToString(options.identifierMode)
        << ", " << counter << " souls minted";

    return {RegistryError::OK, std::move(registry)};
}

SoulRegistry::SoulRegistry(std::unique_ptr<db::Database> db, const RegistryOptions& options,
                           RegistryCollaborators collaborators)
    : db_(std::move(db))
    , options_(options)
    , authorization_(std::move(collaborators.authorization))
    , pause_(std::move(collaborators.pause))
    , transfers_(std::move(collaborators.transfers))
    , generator_(options.baseAsset, options.chainId, options.identifierMode)
    , uniqueness_(*db_)
    , allowedKeys_(*db_)
    , metadata_(*db_)
{
    if (!authorization_) {
        authorization_ = std::make_shared<SingleAdministrator>(options_.administrator);
    }
    if (!pause_) {
        pause_ = std::make_shared<PauseSwitch>(authorization_);
    }
}

SoulRegistry::~SoulRegistry() = default;

// ============================================================================
// Internal helpers
// ============================================================================

RegistryError SoulRegistry::ReadSoul(const Address& owner, std::optional<Soul>* soul) const {
    std::string raw;
    db::Status s = db_->Get(db::MakeKey(db::prefix::SOUL, owner), &raw);
    if (s.IsNotFound()) {
        soul->reset();
        return RegistryError::OK;
    }
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Reading soul of " << owner.ToString()
                                         << " failed: " << s.ToString();
        return RegistryErrorFromStatus(s);
    }

    *soul = Soul::FromBytes(raw);
    if (!soul->has_value()) {
        LOG_ERROR(util::LogCategory::REGISTRY) << "Undecodable soul record for "
                                               << owner.ToString();
        return RegistryError::CorruptRecord;
    }
    return RegistryError::OK;
}

RegistryError SoulRegistry::ReadCounter(uint64_t* counter) const {
    std::string raw;
    db::Status s = db_->Get(db::MakeKey(db::prefix::COUNTER), &raw);
    if (s.IsNotFound()) {
        *counter = 0;
        return RegistryError::OK;
    }
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Reading soul counter failed: " << s.ToString();
        return RegistryErrorFromStatus(s);
    }
    if (raw.size() != 8) {
        return RegistryError::CorruptRecord;
    }
    *counter = ReadLE64(reinterpret_cast<const Byte*>(raw.data()));
    return RegistryError::OK;
}

RegistryError SoulRegistry::Commit(db::WriteBatch& batch, const char* what) {
    db::Status s = db_->Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << what << " commit failed: " << s.ToString();
        return RegistryError::StorageFailure;
    }
    return RegistryError::OK;
}

void SoulRegistry::Emit(const RegistryEvent& event) {
    std::vector<EventCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(subscribersMutex_);
        callbacks.reserve(subscribers_.size());
        for (const auto& entry : subscribers_) {
            callbacks.push_back(entry.second);
        }
    }

    LOG_DEBUG(util::LogCategory::REGISTRY) << "Event " << event.ToString();
    for (const auto& callback : callbacks) {
        callback(event);
    }
}

// ============================================================================
// Souls
// ============================================================================

RegistryError SoulRegistry::Mint(const Address& caller, const Address& owner,
                                 const Bytes& identity, const Bytes& url, Uuid* uuidOut) {
    Uuid uuid;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!authorization_->IsAdministrator(caller)) {
            return RegistryError::Unauthorized;
        }
        if (owner.IsNull()) {
            return RegistryError::InvalidAddress;
        }
        if (pause_->IsPaused()) {
            return RegistryError::RegistryPaused;
        }

        IdentityFingerprint fingerprint = ComputeIdentityFingerprint(identity);
        bool identityTaken = false;
        RegistryError err = uniqueness_.ContainsIdentity(fingerprint, &identityTaken);
        if (err != RegistryError::OK) {
            return err;
        }
        if (identityTaken) {
            LOG_DEBUG(util::LogCategory::REGISTRY) << "Mint for " << owner.ToString()
                                                   << " rejected: identity "
                                                   << BytesToDisplay(identity) << " in use";
            return RegistryError::IdentityNotUnique;
        }

        if (url.empty()) {
            return RegistryError::EmptyUrl;
        }

        std::optional<Soul> existing;
        err = ReadSoul(owner, &existing);
        if (err != RegistryError::OK) {
            return err;
        }
        if (existing) {
            return RegistryError::SoulAlreadyExists;
        }

        uint64_t counter = 0;
        err = ReadCounter(&counter);
        if (err != RegistryError::OK) {
            return err;
        }

        Timestamp now = util::GetTime();
        IdentifierResult generated = generator_.Generate(owner, now, counter, uniqueness_);
        if (!generated.ok()) {
            return generated.error;
        }
        uuid = generated.uuid;

        Soul soul;
        soul.identity = identity;
        soul.url = url;
        soul.mintedAt = now;
        soul.lastUpdate = now;
        soul.uuid = uuid;

        std::vector<Byte> counterBytes;
        WriteLE64(counterBytes, counter + 1);

        db::WriteBatch batch;
        batch.Put(db::MakeKey(db::prefix::SOUL, owner), soul.ToBytes());
        uniqueness_.StageInsert(batch, fingerprint, uuid, owner);
        batch.Put(db::MakeKey(db::prefix::COUNTER), counterBytes);

        err = Commit(batch, "Mint");
        if (err != RegistryError::OK) {
            return err;
        }

        LOG_INFO(util::LogCategory::REGISTRY) << "Minted soul " << uuid.ToString()
                                              << " for " << owner.ToString()
                                              << " (attempts: " << generated.attempts << ")";
    }

    if (uuidOut) {
        *uuidOut = uuid;
    }

    RegistryEvent event;
    event.type = RegistryEventType::Mint;
    event.owner = owner;
    Emit(event);
    return RegistryError::OK;
}

RegistryError SoulRegistry::Burn(const Address& caller, const Address& owner) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (caller != owner && !authorization_->IsAdministrator(caller)) {
            return RegistryError::UnauthorizedBurning;
        }
        if (pause_->IsPaused()) {
            return RegistryError::RegistryPaused;
        }

        std::optional<Soul> soul;
        RegistryError err = ReadSoul(owner, &soul);
        if (err != RegistryError::OK) {
            return err;
        }
        if (!soul) {
            return RegistryError::SoulDoesNotExist;
        }

        db::WriteBatch batch;
        batch.Delete(db::MakeKey(db::prefix::SOUL, owner));
        uniqueness_.StageReleaseUuid(batch, soul->uuid);
        if (options_.releaseIdentityOnBurn) {
            uniqueness_.StageReleaseIdentity(batch, ComputeIdentityFingerprint(soul->identity));
        }

        err = Commit(batch, "Burn");
        if (err != RegistryError::OK) {
            return err;
        }

        LOG_INFO(util::LogCategory::REGISTRY) << "Burned soul " << soul->uuid.ToString()
                                              << " of " << owner.ToString()
                                              << (options_.releaseIdentityOnBurn
                                                      ? " (identity released)" : "");
    }

    RegistryEvent event;
    event.type = RegistryEventType::Burn;
    event.owner = owner;
    Emit(event);
    return RegistryError::OK;
}

RegistryError SoulRegistry::GetSoul(const Address& owner, bool includeMetadata,
                                    SoulView* out) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<Soul> soul;
    RegistryError err = ReadSoul(owner, &soul);
    if (err != RegistryError::OK) {
        return err;
    }
    if (!soul) {
        return RegistryError::SoulDoesNotExist;
    }

    SoulView view;
    view.soul = std::move(*soul);
    if (includeMetadata) {
        err = metadata_.Enumerate(owner, &view.keys, &view.values);
        if (err != RegistryError::OK) {
            return err;
        }
    }

    *out = std::move(view);
    return RegistryError::OK;
}

RegistryError SoulRegistry::GetCounter(uint64_t* counter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ReadCounter(counter);
}

// ============================================================================
// Metadata
// ============================================================================

RegistryError SoulRegistry::AllowKey(const Address& caller, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!authorization_->IsAdministrator(caller)) {
        return RegistryError::Unauthorized;
    }

    db::WriteBatch batch;
    allowedKeys_.StageAllow(batch, key);
    RegistryError err = Commit(batch, "AllowKey");
    if (err == RegistryError::OK) {
        LOG_INFO(util::LogCategory::METADATA) << "Metadata key allowed: " << key;
    }
    return err;
}

RegistryError SoulRegistry::DisallowKey(const Address& caller, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!authorization_->IsAdministrator(caller)) {
        return RegistryError::Unauthorized;
    }

    db::WriteBatch batch;
    allowedKeys_.StageDisallow(batch, key);
    RegistryError err = Commit(batch, "DisallowKey");
    if (err == RegistryError::OK) {
        LOG_INFO(util::LogCategory::METADATA) << "Metadata key disallowed: " << key;
    }
    return err;
}

RegistryError SoulRegistry::IsMetadataKeyAllowed(const std::string& key, bool* allowed) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allowedKeys_.Contains(key, allowed);
}

RegistryError SoulRegistry::CheckMetadataWrite(const Address& caller, const Address& owner,
                                               const std::string& key) const {
    if (!authorization_->IsAdministrator(caller)) {
        return RegistryError::Unauthorized;
    }
    if (pause_->IsPaused()) {
        return RegistryError::RegistryPaused;
    }
    if (owner.IsNull()) {
        return RegistryError::InvalidAddress;
    }

    bool allowed = false;
    RegistryError err = allowedKeys_.Contains(key, &allowed);
    if (err != RegistryError::OK) {
        return err;
    }
    return allowed ? RegistryError::OK : RegistryError::MetadataKeyNotAllowed;
}

RegistryError SoulRegistry::SetMetadata(const Address& caller, const Address& owner,
                                        const std::string& key, const Bytes& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    RegistryError err = CheckMetadataWrite(caller, owner, key);
    if (err != RegistryError::OK) {
        return err;
    }

    db::WriteBatch batch;
    err = metadata_.StageSet(batch, owner, key, value);
    if (err != RegistryError::OK) {
        return err;
    }

    err = Commit(batch, "SetMetadata");
    if (err == RegistryError::OK) {
        LOG_DEBUG(util::LogCategory::METADATA) << "Set " << key << " for " << owner.ToString()
                                               << " (" << value.size() << " bytes)";
    }
    return err;
}

RegistryError SoulRegistry::DeleteMetadata(const Address& caller, const Address& owner,
                                           const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    RegistryError err = CheckMetadataWrite(caller, owner, key);
    if (err != RegistryError::OK) {
        return err;
    }

    db::WriteBatch batch;
    metadata_.StageDelete(batch, owner, key);

    err = Commit(batch, "DeleteMetadata");
    if (err == RegistryError::OK) {
        LOG_DEBUG(util::LogCategory::METADATA) << "Cleared " << key << " for "
                                               << owner.ToString();
    }
    return err;
}

RegistryError SoulRegistry::GetMetadataValue(const Address& owner, const std::string& key,
                                             Bytes* value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_.GetValue(owner, key, value);
}

RegistryError SoulRegistry::Enumerate(const Address& owner, std::vector<std::string>* keys,
                                      std::vector<Bytes>* values) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_.Enumerate(owner, keys, values);
}

// ============================================================================
// Value Transfer
// ============================================================================

RegistryError SoulRegistry::Withdraw(const Address& caller, const Address& token,
                                     const Address& destination, Amount amount) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!authorization_->IsAdministrator(caller)) {
            return RegistryError::Unauthorized;
        }
        if (amount <= 0) {
            return RegistryError::TokenAmountIsZero;
        }
        if (destination.IsNull()) {
            return RegistryError::InvalidAddress;
        }
        if (!transfers_ || !transfers_->IsLiveAsset(token)) {
            return RegistryError::InvalidContractInteraction;
        }
        if (!transfers_->Transfer(token, destination, amount)) {
            LOG_WARN(util::LogCategory::REGISTRY) << "Transfer of " << amount << " "
                                                  << token.ToString() << " to "
                                                  << destination.ToString() << " refused";
            return RegistryError::InvalidContractInteraction;
        }

        LOG_INFO(util::LogCategory::REGISTRY) << "Withdrew " << amount << " "
                                              << token.ToString() << " to "
                                              << destination.ToString();
    }

    RegistryEvent event;
    event.type = RegistryEventType::Withdrawal;
    event.initiator = caller;
    event.destination = destination;
    event.amount = amount;
    Emit(event);
    return RegistryError::OK;
}

RegistryError SoulRegistry::RejectDirectTransfer(const Address& sender, Amount amount) const {
    LOG_DEBUG(util::LogCategory::REGISTRY) << "Refused direct transfer of " << amount
                                           << " from " << sender.ToString();
    return RegistryError::NotPermitted;
}

// ============================================================================
// Events
// ============================================================================

size_t SoulRegistry::SubscribeEvents(EventCallback callback) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    size_t id = nextSubscriberId_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void SoulRegistry::UnsubscribeEvents(size_t id) {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    subscribers_.erase(id);
}

} // namespace registry
} // namespace soulbound
