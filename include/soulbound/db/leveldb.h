// SOULBOUND - Database Backends
// Copyright (c) 2024 SOULBOUND Developers
// MIT License
//
// LevelDB implementation of the database interface, plus the in-memory
// and flat-file backends used when LevelDB is not built in.

#ifndef SOULBOUND_DB_LEVELDB_H
#define SOULBOUND_DB_LEVELDB_H

#include "soulbound/db/database.h"

#include <iterator>
#include <map>
#include <memory>
#include <mutex>

#ifdef SOULBOUND_USE_LEVELDB
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>
#endif

namespace soulbound {
namespace db {

#ifdef SOULBOUND_USE_LEVELDB

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

/// Convert a LevelDB status into ours
Status FromLevelDBStatus(const leveldb::Status& s);

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }

    void SeekToFirst() override { iter_->SeekToFirst(); }
    void SeekToLast() override { iter_->SeekToLast(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }

    void Next() override { iter_->Next(); }
    void Prev() override { iter_->Prev(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDBStatus(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of db, cache and filter
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter);
    ~LevelDBDatabase() override;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    std::string GetStats() const override;

private:
    // Declaration order matters: db_ must close before cache and filter go
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::unique_ptr<leveldb::DB> db_;
};

#endif // SOULBOUND_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

/**
 * Map-backed database for tests and as the base of the flat-file backend.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    using Database::Get;
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    using Database::NewIterator;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// The iterator reads the snapshot current when it was created and
    /// is unaffected by later writes
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    std::string GetStats() const override;

    size_t Size() const;
    void Clear();

protected:
    using Map = std::map<std::string, std::string>;

    /// Called with the mutex held after a mutation has been applied to a
    /// copy of the map. A non-ok status makes the mutation fail.
    virtual Status OnCommit(const WriteOptions& options, const Map& data);

    /// Replaced, never modified in place, so iterators can share it
    std::shared_ptr<const Map> data_{std::make_shared<const Map>()};
    mutable std::mutex mutex_;
};

class MemoryIterator : public Iterator {
public:
    using Map = std::map<std::string, std::string>;

    explicit MemoryIterator(std::shared_ptr<const Map> snapshot)
        : snapshot_(std::move(snapshot)), data_(*snapshot_), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }

    void SeekToFirst() override { iter_ = data_.begin(); }

    void SeekToLast() override {
        iter_ = data_.empty() ? data_.end() : std::prev(data_.end());
    }

    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
    }

    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }

    void Prev() override {
        iter_ = (iter_ == data_.begin()) ? data_.end() : std::prev(iter_);
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    std::shared_ptr<const Map> snapshot_;
    const Map& data_;
    Map::const_iterator iter_;
};

// ============================================================================
// Flat-File Database
// ============================================================================

/**
 * In-memory database persisted as a single snapshot file.
 *
 * Every committed mutation rewrites the snapshot to a temporary file and
 * renames it over the old one, so a crash leaves either the previous or
 * the new state on disk.
 *
 * File layout: magic (4 bytes LE), entry count (8 bytes LE), then per
 * entry key length (4 LE), key, value length (4 LE), value.
 */
class FlatFileDatabase : public MemoryDatabase {
public:
    static constexpr uint32_t MAGIC = 0x534F554C;   // "SOUL"
    static constexpr const char* FILENAME = "registry.dat";

    /**
     * Load (or create) the snapshot stored under directory.
     * @return Pair of (status, database pointer); the pointer is null on failure
     */
    static std::pair<Status, std::unique_ptr<FlatFileDatabase>> Open(
        const std::filesystem::path& directory, const Options& options);

    const std::filesystem::path& GetPath() const { return file_; }

    std::string GetStats() const override;

protected:
    Status OnCommit(const WriteOptions& options, const Map& data) override;

private:
    explicit FlatFileDatabase(std::filesystem::path file) : file_(std::move(file)) {}

    Status Load();

    std::filesystem::path file_;
};

} // namespace db
} // namespace soulbound

#endif // SOULBOUND_DB_LEVELDB_H
