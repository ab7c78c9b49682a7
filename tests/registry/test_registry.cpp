// SOULBOUND - Soul Registry Tests
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include <gtest/gtest.h>

#include "soulbound/db/leveldb.h"
#include "soulbound/registry/registry.h"
#include "soulbound/util/time.h"

#include <filesystem>
#include <map>
#include <random>
#include <set>

namespace soulbound {
namespace registry {
namespace test {

namespace {

const Address ADMIN = Address::FromHex("0xad00000000000000000000000000000000000001");
const Address BASE_ASSET = Address::FromHex("0xba00000000000000000000000000000000000002");
const Address A = Address::FromHex("0x000000000000000000000000000000000000000a");
const Address B = Address::FromHex("0x000000000000000000000000000000000000000b");
const Address STRANGER = Address::FromHex("0x00000000000000000000000000000000000000ee");
const Address TOKEN = Address::FromHex("0x7000000000000000000000000000000000000007");

constexpr Timestamp NOW = 1704067200;

Bytes B_(const std::string& s) { return StringToBytes(s); }

/// Memory database whose commits can be made to fail
class FlakyDatabase : public db::MemoryDatabase {
public:
    bool failCommits{false};

protected:
    db::Status OnCommit(const db::WriteOptions&, const Map&) override {
        return failCommits ? db::Status::IOError("injected failure") : db::Status::Ok();
    }
};

class FakeTransferService : public ValueTransferService {
public:
    struct Transfer_ {
        Address token;
        Address destination;
        Amount amount;
    };

    std::set<Address> liveAssets;
    bool accept{true};
    std::vector<Transfer_> transfers;

    bool IsLiveAsset(const Address& token) const override {
        return liveAssets.count(token) > 0;
    }

    bool Transfer(const Address& token, const Address& destination, Amount amount) override {
        if (!accept) return false;
        transfers.push_back({token, destination, amount});
        return true;
    }
};

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class RegistryTest : public ::testing::Test {
protected:
    FlakyDatabase* db_{nullptr};
    std::shared_ptr<FakeTransferService> transfers_;
    std::unique_ptr<SoulRegistry> registry_;
    std::vector<RegistryEvent> events_;

    void SetUp() override {
        util::SetMockTime(NOW);
        util::EnableMockTime();
        Open(RegistryOptions());
    }

    void TearDown() override {
        registry_.reset();
        util::DisableMockTime();
    }

    void Open(RegistryOptions options) {
        options.administrator = ADMIN;
        options.baseAsset = BASE_ASSET;

        auto db = std::make_unique<FlakyDatabase>();
        db_ = db.get();
        transfers_ = std::make_shared<FakeTransferService>();

        RegistryCollaborators collaborators;
        collaborators.transfers = transfers_;

        auto [err, registry] = SoulRegistry::Open(std::move(db), options, collaborators);
        ASSERT_EQ(err, RegistryError::OK);
        registry_ = std::move(registry);

        events_.clear();
        registry_->SubscribeEvents([this](const RegistryEvent& e) { events_.push_back(e); });
    }

    /// Full copy of the stored state
    std::map<std::string, std::string> Snapshot() {
        std::map<std::string, std::string> out;
        auto it = db_->NewIterator();
        for (it->SeekToFirst(); it->Valid(); it->Next()) {
            out[it->key().ToString()] = it->value().ToString();
        }
        return out;
    }

    uint64_t Counter() {
        uint64_t counter = 0;
        EXPECT_EQ(registry_->GetCounter(&counter), RegistryError::OK);
        return counter;
    }

    RegistryError Mint(const Address& owner, const std::string& identity,
                       const std::string& url, Uuid* uuid = nullptr) {
        return registry_->Mint(ADMIN, owner, B_(identity), B_(url), uuid);
    }
};

// ============================================================================
// Construction
// ============================================================================

TEST(RegistryOpenTest, RejectsNullBaseAsset) {
    RegistryOptions options;
    options.administrator = ADMIN;
    auto [err, registry] = SoulRegistry::Open(std::make_unique<db::MemoryDatabase>(), options);
    EXPECT_EQ(err, RegistryError::InvalidAddress);
    EXPECT_EQ(registry, nullptr);
}

TEST(RegistryOpenTest, RejectsNullAdministratorWithoutProvider) {
    RegistryOptions options;
    options.baseAsset = BASE_ASSET;
    auto [err, registry] = SoulRegistry::Open(std::make_unique<db::MemoryDatabase>(), options);
    EXPECT_EQ(err, RegistryError::InvalidAddress);
}

TEST(RegistryOpenTest, AcceptsInjectedAuthorization) {
    RegistryOptions options;
    options.baseAsset = BASE_ASSET;

    RegistryCollaborators collaborators;
    collaborators.authorization = std::make_shared<SingleAdministrator>(B);

    auto [err, registry] = SoulRegistry::Open(std::make_unique<db::MemoryDatabase>(),
                                              options, collaborators);
    ASSERT_EQ(err, RegistryError::OK);
    EXPECT_TRUE(registry->GetAuthorization().IsAdministrator(B));
    EXPECT_EQ(registry->GetBaseAssetHandle(), BASE_ASSET);
}

TEST(RegistryOpenTest, RejectsMissingDatabase) {
    RegistryOptions options;
    options.administrator = ADMIN;
    options.baseAsset = BASE_ASSET;
    auto [err, registry] = SoulRegistry::Open(nullptr, options);
    EXPECT_EQ(err, RegistryError::StorageFailure);
}

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(RegistryTest, MintThenReadThenDuplicateOwner) {
    Uuid uuid;
    ASSERT_EQ(Mint(A, "alice", "https://x", &uuid), RegistryError::OK);

    SoulView view;
    ASSERT_EQ(registry_->GetSoul(A, false, &view), RegistryError::OK);
    EXPECT_EQ(BytesToString(view.soul.identity), "alice");
    EXPECT_EQ(BytesToString(view.soul.url), "https://x");
    EXPECT_EQ(view.soul.uuid, uuid);
    EXPECT_EQ(view.soul.mintedAt, NOW);
    EXPECT_EQ(view.soul.lastUpdate, NOW);
    EXPECT_TRUE(view.keys.empty());

    EXPECT_EQ(Mint(A, "alice2", "https://y"), RegistryError::SoulAlreadyExists);
}

TEST_F(RegistryTest, MetadataSetEnumerateDelete) {
    ASSERT_EQ(registry_->AllowKey(ADMIN, "K"), RegistryError::OK);
    ASSERT_EQ(registry_->SetMetadata(ADMIN, A, "K", B_("v1")), RegistryError::OK);

    std::vector<std::string> keys;
    std::vector<Bytes> values;
    ASSERT_EQ(registry_->Enumerate(A, &keys, &values), RegistryError::OK);
    ASSERT_EQ(keys, std::vector<std::string>{"K"});
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(BytesToString(values[0]), "v1");

    ASSERT_EQ(registry_->DeleteMetadata(ADMIN, A, "K"), RegistryError::OK);
    ASSERT_EQ(registry_->Enumerate(A, &keys, &values), RegistryError::OK);
    ASSERT_EQ(keys, std::vector<std::string>{"K"});
    ASSERT_EQ(values.size(), 1u);
    EXPECT_TRUE(values[0].empty());
}

TEST_F(RegistryTest, IdentityTakenByAnotherOwner) {
    ASSERT_EQ(Mint(A, "alice", "https://x"), RegistryError::OK);
    EXPECT_EQ(Mint(B, "alice", "https://z"), RegistryError::IdentityNotUnique);
}

// The identity fingerprint stays reserved after burn unless
// releaseidentityonburn is set.
TEST_F(RegistryTest, BurnKeepsIdentityReserved) {
    ASSERT_EQ(Mint(A, "alice", "https://x"), RegistryError::OK);
    ASSERT_EQ(registry_->Burn(ADMIN, A), RegistryError::OK);

    SoulView view;
    EXPECT_EQ(registry_->GetSoul(A, false, &view), RegistryError::SoulDoesNotExist);
    EXPECT_EQ(Mint(A, "alice", "https://z"), RegistryError::IdentityNotUnique);

    // A different identity can be minted for the same owner
    EXPECT_EQ(Mint(A, "alice-2", "https://z"), RegistryError::OK);
}

TEST_F(RegistryTest, BurnReleasesIdentityWhenConfigured) {
    RegistryOptions options;
    options.releaseIdentityOnBurn = true;
    Open(options);

    ASSERT_EQ(Mint(A, "alice", "https://x"), RegistryError::OK);
    ASSERT_EQ(registry_->Burn(A, A), RegistryError::OK);
    EXPECT_EQ(Mint(B, "alice", "https://z"), RegistryError::OK);
}

// ============================================================================
// Mint
// ============================================================================

TEST_F(RegistryTest, MintRejectionOrder) {
    ASSERT_EQ(Mint(A, "alice", "https://x"), RegistryError::OK);

    // Unauthorized beats every other failure
    EXPECT_EQ(registry_->Mint(STRANGER, Address(), B_("alice"), B_(""), nullptr),
              RegistryError::Unauthorized);
    EXPECT_EQ(Mint(Address(), "alice", ""), RegistryError::InvalidAddress);

    ASSERT_EQ(registry_->GetPauseState().Pause(ADMIN), RegistryError::OK);
    EXPECT_EQ(Mint(A, "alice", ""), RegistryError::RegistryPaused);
    ASSERT_EQ(registry_->GetPauseState().Unpause(ADMIN), RegistryError::OK);

    EXPECT_EQ(Mint(A, "alice", ""), RegistryError::IdentityNotUnique);
    EXPECT_EQ(Mint(A, "bob", ""), RegistryError::EmptyUrl);
    EXPECT_EQ(Mint(A, "bob", "https://b"), RegistryError::SoulAlreadyExists);
}

TEST_F(RegistryTest, MintAllowsEmptyIdentityOnce) {
    ASSERT_EQ(Mint(A, "", "https://x"), RegistryError::OK);
    EXPECT_EQ(Mint(B, "", "https://y"), RegistryError::IdentityNotUnique);
}

TEST_F(RegistryTest, CounterTracksSuccessfulMints) {
    EXPECT_EQ(Counter(), 0u);
    ASSERT_EQ(Mint(A, "alice", "https://x"), RegistryError::OK);
    EXPECT_EQ(Mint(B, "alice", "https://x"), RegistryError::IdentityNotUnique);
    ASSERT_EQ(Mint(B, "bob", "https://y"), RegistryError::OK);
    EXPECT_EQ(Counter(), 2u);

    // Burning does not decrement
    ASSERT_EQ(registry_->Burn(ADMIN, A), RegistryError::OK);
    EXPECT_EQ(Counter(), 2u);
}

TEST_F(RegistryTest, UuidUsesCounterBeforeIncrement) {
    Uuid first, second;
    ASSERT_EQ(Mint(A, "alice", "https://x", &first), RegistryError::OK);
    ASSERT_EQ(Mint(B, "bob", "https://y", &second), RegistryError::OK);

    const IdentifierGenerator& gen = registry_->GetIdentifierGenerator();
    EXPECT_EQ(first, gen.Derive(A, NOW, 0, 0));
    EXPECT_EQ(second, gen.Derive(B, NOW, 1, 0));
    EXPECT_NE(first, second);
}

TEST_F(RegistryTest, LiveSoulsHaveDistinctIdentifiers) {
    std::set<Uuid> uuids;
    for (int i = 0; i < 20; ++i) {
        Address owner = Address::FromHex("0x" + std::string(38, '0') + std::to_string(10 + i));

        Uuid uuid;
        ASSERT_EQ(Mint(owner, "id-" + std::to_string(i), "https://u", &uuid),
                  RegistryError::OK);
        uuids.insert(uuid);
    }
    EXPECT_EQ(uuids.size(), 20u);
}

// ============================================================================
// Atomicity
// ============================================================================

TEST_F(RegistryTest, RejectedMintLeavesStateUntouched) {
    ASSERT_EQ(Mint(A, "alice", "https://x"), RegistryError::OK);
    ASSERT_EQ(registry_->AllowKey(ADMIN, "K"), RegistryError::OK);
    auto before = Snapshot();

    EXPECT_EQ(Mint(B, "alice", "https://z"), RegistryError::IdentityNotUnique);
    EXPECT_EQ(Mint(A, "carol", "https://z"), RegistryError::SoulAlreadyExists);
    EXPECT_EQ(Mint(B, "carol", ""), RegistryError::EmptyUrl);

    EXPECT_EQ(Snapshot(), before);
}

TEST_F(RegistryTest, StorageFailureLeavesStateUntouched) {
    ASSERT_EQ(Mint(A, "alice", "https://x"), RegistryError::OK);
    auto before = Snapshot();
    size_t eventsBefore = events_.size();

    db_->failCommits = true;
    EXPECT_EQ(Mint(B, "bob", "https://y"), RegistryError::StorageFailure);
    EXPECT_EQ(registry_->Burn(ADMIN, A), RegistryError::StorageFailure);
    db_->failCommits = false;

    EXPECT_EQ(Snapshot(), before);
    EXPECT_EQ(events_.size(), eventsBefore);

    // Nothing was reserved by the failed mint
    EXPECT_EQ(Mint(B, "bob", "https://y"), RegistryError::OK);
}

TEST_F(RegistryTest, FaithfulCollisionFailsWithoutSideEffects) {
    Uuid candidate = registry_->GetIdentifierGenerator().Derive(A, NOW, 0, 0);
    ASSERT_TRUE(db_->Put(db::MakeKey(db::prefix::UUID, candidate),
                         db::Slice(reinterpret_cast<const char*>(B.data()), B.size())).ok());
    auto before = Snapshot();

    EXPECT_EQ(Mint(A, "alice", "https://x"), RegistryError::MaxRetriesExceeded);
    EXPECT_EQ(Snapshot(), before);
    EXPECT_EQ(Counter(), 0u);
}

TEST_F(RegistryTest, CorrectedCollisionResolves) {
    RegistryOptions options;
    options.identifierMode = IdentifierMode::Corrected;
    Open(options);

    const IdentifierGenerator& gen = registry_->GetIdentifierGenerator();
    Uuid candidate = gen.Derive(A, NOW, 0, 0);
    ASSERT_TRUE(db_->Put(db::MakeKey(db::prefix::UUID, candidate),
                         db::Slice(reinterpret_cast<const char*>(B.data()), B.size())).ok());

    Uuid uuid;
    ASSERT_EQ(Mint(A, "alice", "https://x", &uuid), RegistryError::OK);
    EXPECT_EQ(uuid, gen.Derive(A, NOW, 0, 1));
}

// ============================================================================
// Burn
// ============================================================================

TEST_F(RegistryTest, BurnAuthorization) {
    ASSERT_EQ(Mint(A, "alice", "https://x"), RegistryError::OK);
    ASSERT_EQ(Mint(B, "bob", "https://y"), RegistryError::OK);

    EXPECT_EQ(registry_->Burn(STRANGER, A), RegistryError::UnauthorizedBurning);
    EXPECT_EQ(registry_->Burn(B, A), RegistryError::UnauthorizedBurning);

    EXPECT_EQ(registry_->Burn(A, A), RegistryError::OK);
    EXPECT_EQ(registry_->Burn(ADMIN, B), RegistryError::OK);
}

TEST_F(RegistryTest, BurnRejectionOrder) {
    EXPECT_EQ(registry_->Burn(STRANGER, A), RegistryError::UnauthorizedBurning);
    EXPECT_EQ(registry_->Burn(A, A), RegistryError::SoulDoesNotExist);

    ASSERT_EQ(registry_->GetPauseState().Pause(ADMIN), RegistryError::OK);
    EXPECT_EQ(registry_->Burn(STRANGER, A), RegistryError::UnauthorizedBurning);
    EXPECT_EQ(registry_->Burn(A, A), RegistryError::RegistryPaused);
}

TEST_F(RegistryTest, BurnReleasesUuidAndKeepsMetadata) {
    Uuid uuid;
    ASSERT_EQ(Mint(A, "alice", "https://x", &uuid), RegistryError::OK);
    ASSERT_EQ(registry_->AllowKey(ADMIN, "K"), RegistryError::OK);
    ASSERT_EQ(registry_->SetMetadata(ADMIN, A, "K", B_("v")), RegistryError::OK);

    ASSERT_EQ(registry_->Burn(ADMIN, A), RegistryError::OK);

    auto state = Snapshot();
    EXPECT_EQ(state.count(db::MakeKey(db::prefix::UUID, uuid)), 0u);
    EXPECT_EQ(state.count(db::MakeKey(db::prefix::SOUL, A)), 0u);

    Bytes value;
    ASSERT_EQ(registry_->GetMetadataValue(A, "K", &value), RegistryError::OK);
    EXPECT_EQ(BytesToString(value), "v");
}

// ============================================================================
// Metadata
// ============================================================================

TEST_F(RegistryTest, GateEnforcement) {
    EXPECT_EQ(registry_->SetMetadata(ADMIN, A, "K", B_("v")),
              RegistryError::MetadataKeyNotAllowed);
    EXPECT_EQ(registry_->DeleteMetadata(ADMIN, A, "K"), RegistryError::MetadataKeyNotAllowed);

    ASSERT_EQ(registry_->AllowKey(ADMIN, "K"), RegistryError::OK);
    ASSERT_EQ(registry_->SetMetadata(ADMIN, A, "K", B_("v")), RegistryError::OK);
    ASSERT_EQ(registry_->DisallowKey(ADMIN, "K"), RegistryError::OK);

    // Disallowing blocks writes but leaves the stored value readable
    EXPECT_EQ(registry_->SetMetadata(ADMIN, A, "K", B_("w")),
              RegistryError::MetadataKeyNotAllowed);
    EXPECT_EQ(registry_->DeleteMetadata(ADMIN, A, "K"), RegistryError::MetadataKeyNotAllowed);

    Bytes value;
    ASSERT_EQ(registry_->GetMetadataValue(A, "K", &value), RegistryError::OK);
    EXPECT_EQ(BytesToString(value), "v");
}

TEST_F(RegistryTest, MetadataRejectionOrder) {
    EXPECT_EQ(registry_->SetMetadata(STRANGER, Address(), "K", B_("v")),
              RegistryError::Unauthorized);

    ASSERT_EQ(registry_->GetPauseState().Pause(ADMIN), RegistryError::OK);
    EXPECT_EQ(registry_->SetMetadata(ADMIN, Address(), "K", B_("v")),
              RegistryError::RegistryPaused);
    EXPECT_EQ(registry_->DeleteMetadata(ADMIN, Address(), "K"), RegistryError::RegistryPaused);
    ASSERT_EQ(registry_->GetPauseState().Unpause(ADMIN), RegistryError::OK);

    EXPECT_EQ(registry_->SetMetadata(ADMIN, Address(), "K", B_("v")),
              RegistryError::InvalidAddress);
    EXPECT_EQ(registry_->SetMetadata(ADMIN, A, "K", B_("v")),
              RegistryError::MetadataKeyNotAllowed);
}

TEST_F(RegistryTest, AllowedKeysAreAdminOnlyAndIgnorePause) {
    EXPECT_EQ(registry_->AllowKey(STRANGER, "K"), RegistryError::Unauthorized);
    EXPECT_EQ(registry_->DisallowKey(STRANGER, "K"), RegistryError::Unauthorized);

    ASSERT_EQ(registry_->GetPauseState().Pause(ADMIN), RegistryError::OK);
    EXPECT_EQ(registry_->AllowKey(ADMIN, "K"), RegistryError::OK);

    bool allowed = false;
    ASSERT_EQ(registry_->IsMetadataKeyAllowed("K", &allowed), RegistryError::OK);
    EXPECT_TRUE(allowed);
    ASSERT_EQ(registry_->IsMetadataKeyAllowed("other", &allowed), RegistryError::OK);
    EXPECT_FALSE(allowed);
}

TEST_F(RegistryTest, MetadataDoesNotRequireSoulOrTouchLastUpdate) {
    ASSERT_EQ(registry_->AllowKey(ADMIN, "K"), RegistryError::OK);
    EXPECT_EQ(registry_->SetMetadata(ADMIN, B, "K", B_("v")), RegistryError::OK);

    ASSERT_EQ(Mint(A, "alice", "https://x"), RegistryError::OK);
    util::AdvanceMockTime(util::Seconds{60});
    ASSERT_EQ(registry_->SetMetadata(ADMIN, A, "K", B_("v")), RegistryError::OK);

    SoulView view;
    ASSERT_EQ(registry_->GetSoul(A, true, &view), RegistryError::OK);
    EXPECT_EQ(view.soul.lastUpdate, NOW);
    ASSERT_EQ(view.keys, std::vector<std::string>{"K"});
    EXPECT_EQ(BytesToString(view.values[0]), "v");
}

TEST_F(RegistryTest, KeyListIsAppendOnly) {
    ASSERT_EQ(registry_->AllowKey(ADMIN, "a"), RegistryError::OK);
    ASSERT_EQ(registry_->AllowKey(ADMIN, "b"), RegistryError::OK);

    ASSERT_EQ(registry_->SetMetadata(ADMIN, A, "b", B_("1")), RegistryError::OK);
    ASSERT_EQ(registry_->SetMetadata(ADMIN, A, "a", B_("2")), RegistryError::OK);
    ASSERT_EQ(registry_->DeleteMetadata(ADMIN, A, "b"), RegistryError::OK);
    ASSERT_EQ(registry_->SetMetadata(ADMIN, A, "b", B_("3")), RegistryError::OK);

    std::vector<std::string> keys;
    std::vector<Bytes> values;
    ASSERT_EQ(registry_->Enumerate(A, &keys, &values), RegistryError::OK);
    EXPECT_EQ(keys, (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(BytesToString(values[0]), "3");

    std::vector<std::string> again;
    std::vector<Bytes> againValues;
    ASSERT_EQ(registry_->Enumerate(A, &again, &againValues), RegistryError::OK);
    EXPECT_EQ(again, keys);
    EXPECT_EQ(againValues, values);
}

// ============================================================================
// Value Transfer
// ============================================================================

TEST_F(RegistryTest, WithdrawRejectionOrder) {
    transfers_->liveAssets.insert(TOKEN);

    EXPECT_EQ(registry_->Withdraw(STRANGER, TOKEN, B, 0), RegistryError::Unauthorized);
    EXPECT_EQ(registry_->Withdraw(ADMIN, TOKEN, Address(), 0), RegistryError::TokenAmountIsZero);
    EXPECT_EQ(registry_->Withdraw(ADMIN, TOKEN, Address(), -5), RegistryError::TokenAmountIsZero);
    EXPECT_EQ(registry_->Withdraw(ADMIN, TOKEN, Address(), 5), RegistryError::InvalidAddress);
    EXPECT_EQ(registry_->Withdraw(ADMIN, STRANGER, B, 5),
              RegistryError::InvalidContractInteraction);

    transfers_->accept = false;
    EXPECT_EQ(registry_->Withdraw(ADMIN, TOKEN, B, 5), RegistryError::InvalidContractInteraction);
    EXPECT_TRUE(transfers_->transfers.empty());
    EXPECT_TRUE(events_.empty());
}

TEST_F(RegistryTest, WithdrawDelegatesAndEmitsEvent) {
    transfers_->liveAssets.insert(TOKEN);
    ASSERT_EQ(registry_->GetPauseState().Pause(ADMIN), RegistryError::OK);

    ASSERT_EQ(registry_->Withdraw(ADMIN, TOKEN, B, 250), RegistryError::OK);
    ASSERT_EQ(transfers_->transfers.size(), 1u);
    EXPECT_EQ(transfers_->transfers[0].token, TOKEN);
    EXPECT_EQ(transfers_->transfers[0].destination, B);
    EXPECT_EQ(transfers_->transfers[0].amount, 250);

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].type, RegistryEventType::Withdrawal);
    EXPECT_EQ(events_[0].initiator, ADMIN);
    EXPECT_EQ(events_[0].destination, B);
    EXPECT_EQ(events_[0].amount, 250);
}

TEST_F(RegistryTest, WithdrawWithoutServiceFails) {
    RegistryOptions options;
    options.administrator = ADMIN;
    options.baseAsset = BASE_ASSET;
    auto [err, registry] = SoulRegistry::Open(std::make_unique<db::MemoryDatabase>(), options);
    ASSERT_EQ(err, RegistryError::OK);
    EXPECT_EQ(registry->Withdraw(ADMIN, TOKEN, B, 1), RegistryError::InvalidContractInteraction);
}

TEST_F(RegistryTest, DirectTransfersAreRefused) {
    EXPECT_EQ(registry_->RejectDirectTransfer(A, 100), RegistryError::NotPermitted);
    EXPECT_EQ(registry_->RejectDirectTransfer(ADMIN, 0), RegistryError::NotPermitted);
}

// ============================================================================
// Access Control
// ============================================================================

TEST_F(RegistryTest, PauseRequiresAdministrator) {
    EXPECT_EQ(registry_->GetPauseState().Pause(STRANGER), RegistryError::Unauthorized);
    EXPECT_FALSE(registry_->GetPauseState().IsPaused());

    ASSERT_EQ(registry_->GetPauseState().Pause(ADMIN), RegistryError::OK);
    EXPECT_TRUE(registry_->GetPauseState().IsPaused());
    EXPECT_EQ(registry_->GetPauseState().Unpause(STRANGER), RegistryError::Unauthorized);
    EXPECT_TRUE(registry_->GetPauseState().IsPaused());
}

TEST_F(RegistryTest, AdministrationTransfer) {
    AuthorizationProvider& auth = registry_->GetAuthorization();
    EXPECT_EQ(auth.TransferAdministration(STRANGER, B), RegistryError::Unauthorized);
    EXPECT_EQ(auth.TransferAdministration(ADMIN, Address()), RegistryError::InvalidAddress);
    ASSERT_EQ(auth.TransferAdministration(ADMIN, B), RegistryError::OK);

    EXPECT_EQ(Mint(A, "alice", "https://x"), RegistryError::Unauthorized);
    EXPECT_EQ(registry_->Mint(B, A, B_("alice"), B_("https://x")), RegistryError::OK);
}

// ============================================================================
// Events
// ============================================================================

TEST_F(RegistryTest, MintAndBurnEmitEvents) {
    ASSERT_EQ(Mint(A, "alice", "https://x"), RegistryError::OK);
    EXPECT_EQ(Mint(A, "alice", "https://x"), RegistryError::IdentityNotUnique);
    ASSERT_EQ(registry_->Burn(A, A), RegistryError::OK);

    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[0].type, RegistryEventType::Mint);
    EXPECT_EQ(events_[0].owner, A);
    EXPECT_EQ(events_[1].type, RegistryEventType::Burn);
    EXPECT_EQ(events_[1].owner, A);
}

TEST_F(RegistryTest, MetadataWritesEmitNoEvents) {
    ASSERT_EQ(registry_->AllowKey(ADMIN, "K"), RegistryError::OK);
    ASSERT_EQ(registry_->SetMetadata(ADMIN, A, "K", B_("v")), RegistryError::OK);
    ASSERT_EQ(registry_->DeleteMetadata(ADMIN, A, "K"), RegistryError::OK);
    EXPECT_TRUE(events_.empty());
}

TEST_F(RegistryTest, CallbacksMayReenterRegistry) {
    uint64_t seenCounter = 0;
    size_t id = registry_->SubscribeEvents([&](const RegistryEvent&) {
        EXPECT_EQ(registry_->GetCounter(&seenCounter), RegistryError::OK);
    });

    ASSERT_EQ(Mint(A, "alice", "https://x"), RegistryError::OK);
    EXPECT_EQ(seenCounter, 1u);

    registry_->UnsubscribeEvents(id);
    ASSERT_EQ(Mint(B, "bob", "https://y"), RegistryError::OK);
    EXPECT_EQ(seenCounter, 1u);
}

TEST(RegistryEventTest, Names) {
    EXPECT_STREQ(RegistryEventTypeToString(RegistryEventType::Mint), "Mint");
    EXPECT_STREQ(RegistryEventTypeToString(RegistryEventType::Update), "Update");

    RegistryEvent event;
    event.type = RegistryEventType::Burn;
    event.owner = A;
    EXPECT_EQ(event.ToString(), "Burn(owner=" + A.ToString() + ")");
}

// ============================================================================
// Persistence
// ============================================================================

TEST(RegistryPersistenceTest, StateSurvivesReopen) {
    std::random_device rd;
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
                                ("soulbound_registry_test_" + std::to_string(rd()));

    RegistryOptions options;
    options.administrator = ADMIN;
    options.baseAsset = BASE_ASSET;

    Uuid uuid;
    {
        auto [status, db] = db::OpenDatabase(dir);
        ASSERT_TRUE(status.ok()) << status.ToString();
        auto [err, registry] = SoulRegistry::Open(std::move(db), options);
        ASSERT_EQ(err, RegistryError::OK);
        ASSERT_EQ(registry->Mint(ADMIN, A, B_("alice"), B_("https://x"), &uuid),
                  RegistryError::OK);
        ASSERT_EQ(registry->AllowKey(ADMIN, "K"), RegistryError::OK);
        ASSERT_EQ(registry->SetMetadata(ADMIN, A, "K", B_("v")), RegistryError::OK);
    }

    {
        auto [status, db] = db::OpenDatabase(dir);
        ASSERT_TRUE(status.ok()) << status.ToString();
        auto [err, registry] = SoulRegistry::Open(std::move(db), options);
        ASSERT_EQ(err, RegistryError::OK);

        SoulView view;
        ASSERT_EQ(registry->GetSoul(A, true, &view), RegistryError::OK);
        EXPECT_EQ(view.soul.uuid, uuid);
        ASSERT_EQ(view.keys, std::vector<std::string>{"K"});

        uint64_t counter = 0;
        ASSERT_EQ(registry->GetCounter(&counter), RegistryError::OK);
        EXPECT_EQ(counter, 1u);
        EXPECT_EQ(registry->Mint(ADMIN, B, B_("alice"), B_("https://y")),
                  RegistryError::IdentityNotUnique);
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

} // namespace test
} // namespace registry
} // namespace soulbound
