// SOULBOUND - Identifier Generator Tests
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include <gtest/gtest.h>

#include "soulbound/crypto/sha256.h"
#include "soulbound/db/leveldb.h"
#include "soulbound/registry/identifier.h"
#include "soulbound/registry/uniqueness.h"

namespace soulbound {
namespace registry {
namespace test {

namespace {

const Address BASE_ASSET = Address::FromHex("0x2222222222222222222222222222222222222222");
const Address OWNER = Address::FromHex("0x1111111111111111111111111111111111111111");
const Address OTHER = Address::FromHex("0x3333333333333333333333333333333333333333");
constexpr Timestamp TS = 1704067200;

}

class IdentifierTest : public ::testing::Test {
protected:
    db::MemoryDatabase db_;
    UniquenessIndex index_{db_};

    /// Occupy a uuid as if a live soul held it
    void Occupy(const Uuid& uuid) {
        db::WriteBatch batch;
        Bytes identity = StringToBytes(uuid.ToHex());
        index_.StageInsert(batch, IdentityFingerprint(SHA256Hash(identity)), uuid, OTHER);
        ASSERT_TRUE(db_.Write(&batch).ok());
    }
};

// ============================================================================
// Mode Names
// ============================================================================

TEST(IdentifierModeTest, Names) {
    EXPECT_STREQ(IdentifierModeToString(IdentifierMode::Faithful), "faithful");
    EXPECT_STREQ(IdentifierModeToString(IdentifierMode::Corrected), "corrected");
    EXPECT_TRUE(IdentifierModeFromString("FAITHFUL") == IdentifierMode::Faithful);
    EXPECT_TRUE(IdentifierModeFromString("corrected") == IdentifierMode::Corrected);
    EXPECT_FALSE(IdentifierModeFromString("random").has_value());
}

// ============================================================================
// Derivation
// ============================================================================

TEST_F(IdentifierTest, RegistryFingerprintHashesBaseAsset) {
    IdentifierGenerator gen(BASE_ASSET, 1);
    EXPECT_EQ(gen.GetRegistryFingerprint(), SHA256Hash(BASE_ASSET.data(), BASE_ASSET.size()));
    EXPECT_EQ(gen.GetChainId(), 1u);
    EXPECT_EQ(gen.GetMode(), IdentifierMode::Faithful);
}

TEST_F(IdentifierTest, DeriveMatchesDocumentedLayout) {
    IdentifierGenerator gen(BASE_ASSET, 5);

    std::vector<Byte> seed;
    WriteLE64(seed, static_cast<uint64_t>(TS));
    seed.insert(seed.end(), OWNER.begin(), OWNER.end());
    WriteLE64(seed, 7);
    Hash256 fp = SHA256Hash(BASE_ASSET.data(), BASE_ASSET.size());
    seed.insert(seed.end(), fp.begin(), fp.end());
    WriteLE64(seed, 5);

    Hash256 digest = SHA256Hash(seed);
    EXPECT_EQ(gen.Derive(OWNER, TS, 7, 0), Uuid(digest.data(), Uuid::SIZE));
}

TEST_F(IdentifierTest, InputsAffectResult) {
    IdentifierGenerator gen(BASE_ASSET, 1);
    Uuid base = gen.Derive(OWNER, TS, 0, 0);

    EXPECT_NE(base, gen.Derive(OTHER, TS, 0, 0));
    EXPECT_NE(base, gen.Derive(OWNER, TS + 1, 0, 0));
    EXPECT_NE(base, gen.Derive(OWNER, TS, 1, 0));
    EXPECT_NE(base, IdentifierGenerator(BASE_ASSET, 2).Derive(OWNER, TS, 0, 0));
    EXPECT_NE(base, IdentifierGenerator(OTHER, 1).Derive(OWNER, TS, 0, 0));
}

TEST_F(IdentifierTest, FaithfulIgnoresRetry) {
    IdentifierGenerator gen(BASE_ASSET, 1, IdentifierMode::Faithful);
    EXPECT_EQ(gen.Derive(OWNER, TS, 0, 0), gen.Derive(OWNER, TS, 0, 1));
    EXPECT_EQ(gen.Derive(OWNER, TS, 0, 0), gen.Derive(OWNER, TS, 0, 2));
}

TEST_F(IdentifierTest, CorrectedVariesWithRetry) {
    IdentifierGenerator gen(BASE_ASSET, 1, IdentifierMode::Corrected);
    EXPECT_NE(gen.Derive(OWNER, TS, 0, 0), gen.Derive(OWNER, TS, 0, 1));
    EXPECT_NE(gen.Derive(OWNER, TS, 0, 1), gen.Derive(OWNER, TS, 0, 2));
}

// ============================================================================
// Generation
// ============================================================================

TEST_F(IdentifierTest, FirstCandidateAcceptedWithoutCollision) {
    IdentifierGenerator gen(BASE_ASSET, 1);
    IdentifierResult result = gen.Generate(OWNER, TS, 0, index_);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.uuid, gen.Derive(OWNER, TS, 0, 0));
}

// Faithful mode re-derives the same candidate on every retry, so one
// collision exhausts the whole retry budget.
TEST_F(IdentifierTest, FaithfulCollisionExhaustsRetries) {
    IdentifierGenerator gen(BASE_ASSET, 1, IdentifierMode::Faithful);
    Occupy(gen.Derive(OWNER, TS, 0, 0));

    IdentifierResult result = gen.Generate(OWNER, TS, 0, index_);
    EXPECT_EQ(result.error, RegistryError::MaxRetriesExceeded);
    EXPECT_EQ(result.attempts, IdentifierGenerator::MAX_RETRIES + 1);
    EXPECT_EQ(result.attempts, 3);
}

TEST_F(IdentifierTest, CorrectedCollisionResolvesOnRetry) {
    IdentifierGenerator gen(BASE_ASSET, 1, IdentifierMode::Corrected);
    Occupy(gen.Derive(OWNER, TS, 0, 0));

    IdentifierResult result = gen.Generate(OWNER, TS, 0, index_);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(result.uuid, gen.Derive(OWNER, TS, 0, 1));
}

TEST_F(IdentifierTest, CorrectedGivesUpAfterThreeCollisions) {
    IdentifierGenerator gen(BASE_ASSET, 1, IdentifierMode::Corrected);
    for (uint32_t retry = 0; retry < 3; ++retry) {
        Occupy(gen.Derive(OWNER, TS, 0, retry));
    }

    IdentifierResult result = gen.Generate(OWNER, TS, 0, index_);
    EXPECT_EQ(result.error, RegistryError::MaxRetriesExceeded);
    EXPECT_EQ(result.attempts, 3);
}

TEST_F(IdentifierTest, CorruptIndexEntryStopsGeneration) {
    IdentifierGenerator gen(BASE_ASSET, 1);
    Uuid candidate = gen.Derive(OWNER, TS, 0, 0);
    ASSERT_TRUE(db_.Put(db::MakeKey(db::prefix::UUID, candidate), "short").ok());

    IdentifierResult result = gen.Generate(OWNER, TS, 0, index_);
    EXPECT_EQ(result.error, RegistryError::CorruptRecord);
    EXPECT_EQ(result.attempts, 1);
}

} // namespace test
} // namespace registry
} // namespace soulbound
