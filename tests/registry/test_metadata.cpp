// SOULBOUND - Metadata Store Tests
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include <gtest/gtest.h>

#include "soulbound/db/leveldb.h"
#include "soulbound/registry/metadata.h"
#include "soulbound/registry/soul.h"

namespace soulbound {
namespace registry {
namespace test {

class MetadataTest : public ::testing::Test {
protected:
    db::MemoryDatabase db_;
    AllowedKeySet allowed_{db_};
    MetadataStore store_{db_};

    Address owner_ = Address::FromHex("0x1111111111111111111111111111111111111111");
    Address other_ = Address::FromHex("0x3333333333333333333333333333333333333333");

    void Set(const Address& owner, const std::string& key, const std::string& value) {
        db::WriteBatch batch;
        ASSERT_EQ(store_.StageSet(batch, owner, key, StringToBytes(value)), RegistryError::OK);
        ASSERT_TRUE(db_.Write(&batch).ok());
    }

    void Clear(const Address& owner, const std::string& key) {
        db::WriteBatch batch;
        store_.StageDelete(batch, owner, key);
        ASSERT_TRUE(db_.Write(&batch).ok());
    }

    std::vector<std::string> Keys(const Address& owner) {
        std::vector<std::string> keys;
        std::vector<Bytes> values;
        EXPECT_EQ(store_.Enumerate(owner, &keys, &values), RegistryError::OK);
        return keys;
    }
};

// ============================================================================
// AllowedKeySet
// ============================================================================

TEST_F(MetadataTest, AllowAndDisallow) {
    bool allowed = true;
    ASSERT_EQ(allowed_.Contains("email", &allowed), RegistryError::OK);
    EXPECT_FALSE(allowed);

    db::WriteBatch batch;
    allowed_.StageAllow(batch, "email");
    ASSERT_TRUE(db_.Write(&batch).ok());
    ASSERT_EQ(allowed_.Contains("email", &allowed), RegistryError::OK);
    EXPECT_TRUE(allowed);

    // Allowing twice is harmless
    ASSERT_TRUE(db_.Write(&batch).ok());

    batch.Clear();
    allowed_.StageDisallow(batch, "email");
    ASSERT_TRUE(db_.Write(&batch).ok());
    ASSERT_EQ(allowed_.Contains("email", &allowed), RegistryError::OK);
    EXPECT_FALSE(allowed);
}

// ============================================================================
// Values
// ============================================================================

TEST_F(MetadataTest, UnwrittenValueIsEmpty) {
    Bytes value = {1, 2, 3};
    ASSERT_EQ(store_.GetValue(owner_, "email", &value), RegistryError::OK);
    EXPECT_TRUE(value.empty());

    uint64_t count = 99;
    ASSERT_EQ(store_.GetKeyCount(owner_, &count), RegistryError::OK);
    EXPECT_EQ(count, 0u);
}

TEST_F(MetadataTest, SetOverwritesValue) {
    Set(owner_, "email", "a@x");
    Set(owner_, "email", "b@x");

    Bytes value;
    ASSERT_EQ(store_.GetValue(owner_, "email", &value), RegistryError::OK);
    EXPECT_EQ(BytesToString(value), "b@x");

    uint64_t count = 0;
    ASSERT_EQ(store_.GetKeyCount(owner_, &count), RegistryError::OK);
    EXPECT_EQ(count, 1u);
}

TEST_F(MetadataTest, OwnersAreIsolated) {
    Set(owner_, "email", "a@x");

    Bytes value;
    ASSERT_EQ(store_.GetValue(other_, "email", &value), RegistryError::OK);
    EXPECT_TRUE(value.empty());
    EXPECT_TRUE(Keys(other_).empty());
}

// ============================================================================
// Key List
// ============================================================================

TEST_F(MetadataTest, KeyListKeepsFirstWriteOrder) {
    Set(owner_, "b", "1");
    Set(owner_, "a", "2");
    Set(owner_, "b", "3");
    Set(owner_, "c", "4");

    std::vector<std::string> expected = {"b", "a", "c"};
    EXPECT_EQ(Keys(owner_), expected);
}

TEST_F(MetadataTest, DeleteKeepsKeyInList) {
    Set(owner_, "email", "a@x");
    Clear(owner_, "email");

    std::vector<std::string> keys;
    std::vector<Bytes> values;
    ASSERT_EQ(store_.Enumerate(owner_, &keys, &values), RegistryError::OK);
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_EQ(keys[0], "email");
    ASSERT_EQ(values.size(), 1u);
    EXPECT_TRUE(values[0].empty());

    // Writing again does not add a second list entry
    Set(owner_, "email", "c@x");
    EXPECT_EQ(Keys(owner_).size(), 1u);
}

TEST_F(MetadataTest, EmptyWriteOfUntrackedKeyIsNotListed) {
    Set(owner_, "email", "");
    EXPECT_TRUE(Keys(owner_).empty());

    bool tracked = true;
    ASSERT_EQ(store_.IsTracked(owner_, "email", &tracked), RegistryError::OK);
    EXPECT_FALSE(tracked);
}

TEST_F(MetadataTest, EmptyWriteClearsTrackedKey) {
    Set(owner_, "email", "a@x");
    Set(owner_, "email", "");

    std::vector<std::string> keys;
    std::vector<Bytes> values;
    ASSERT_EQ(store_.Enumerate(owner_, &keys, &values), RegistryError::OK);
    ASSERT_EQ(keys.size(), 1u);
    EXPECT_TRUE(values[0].empty());
}

TEST_F(MetadataTest, EnumerationIsRepeatable) {
    Set(owner_, "a", "1");
    Set(owner_, "b", "2");

    std::vector<std::string> keys1, keys2;
    std::vector<Bytes> values1, values2;
    ASSERT_EQ(store_.Enumerate(owner_, &keys1, &values1), RegistryError::OK);
    ASSERT_EQ(store_.Enumerate(owner_, &keys2, &values2), RegistryError::OK);
    EXPECT_EQ(keys1, keys2);
    EXPECT_EQ(values1, values2);
}

TEST_F(MetadataTest, MissingListEntryIsCorrupt) {
    std::vector<Byte> count;
    WriteLE64(count, 2);
    ASSERT_TRUE(db_.Put(db::MakeKey(db::prefix::KEY_LIST_SIZE, owner_), count).ok());

    std::vector<std::string> keys = {"stale"};
    std::vector<Bytes> values = {Bytes{1}};
    EXPECT_EQ(store_.Enumerate(owner_, &keys, &values), RegistryError::CorruptRecord);
    EXPECT_TRUE(keys.empty());
    EXPECT_TRUE(values.empty());
}

} // namespace test
} // namespace registry
} // namespace soulbound
