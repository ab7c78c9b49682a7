// SOULBOUND - Database Backends Implementation
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/db/leveldb.h"
#include "soulbound/util/logging.h"

#include <cstdio>
#include <sstream>
#include <system_error>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace soulbound {
namespace db {

#ifdef SOULBOUND_USE_LEVELDB

// ============================================================================
// LevelDB
// ============================================================================

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

namespace {

leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    lo.fill_cache = opts.fill_cache;
    return lo;
}

leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

} // namespace

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const leveldb::FilterPolicy* filter)
    : cache_(cache), filterPolicy_(filter), db_(db) {}

LevelDBDatabase::~LevelDBDatabase() {
    db_.reset();
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    return FromLevelDBStatus(db_->Get(MakeReadOptions(options),
                                      leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    return FromLevelDBStatus(db_->Put(MakeWriteOptions(options),
                                      leveldb::Slice(key.data(), key.size()),
                                      leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    return FromLevelDBStatus(db_->Delete(MakeWriteOptions(options),
                                         leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return FromLevelDBStatus(db_->Write(MakeWriteOptions(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(options)));
}

std::string LevelDBDatabase::GetStats() const {
    std::string stats;
    db_->GetProperty("leveldb.stats", &stats);
    return stats;
}

#endif // SOULBOUND_USE_LEVELDB

// ============================================================================
// MemoryDatabase
// ============================================================================

Status MemoryDatabase::Get(const ReadOptions& /*options*/, const Slice& key,
                           std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_->find(key.ToString());
    if (it == data_->end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    WriteBatch batch;
    batch.Put(key, value);
    return Write(options, &batch);
}

Status MemoryDatabase::Delete(const WriteOptions& options, const Slice& key) {
    WriteBatch batch;
    batch.Delete(key);
    return Write(options, &batch);
}

Status MemoryDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Apply to a copy so a failed commit leaves the map untouched
    auto next = std::make_shared<Map>(*data_);
    batch->Iterate([&next](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            (*next)[key] = *value;
        } else {
            next->erase(key);
        }
    });

    Status s = OnCommit(options, *next);
    if (!s.ok()) {
        return s;
    }
    data_ = std::move(next);
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions& /*options*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

std::string MemoryDatabase::GetStats() const {
    std::ostringstream oss;
    oss << "memory entries=" << Size();
    return oss.str();
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_->size();
}

void MemoryDatabase::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_ = std::make_shared<const Map>();
}

Status MemoryDatabase::OnCommit(const WriteOptions& /*options*/, const Map& /*data*/) {
    return Status::Ok();
}

// ============================================================================
// FlatFileDatabase
// ============================================================================

namespace {

constexpr uint32_t MAX_FIELD_SIZE = 64 * 1024 * 1024;

bool WriteU32(FILE* file, uint32_t value) {
    Byte buf[4];
    for (int i = 0; i < 4; ++i) buf[i] = static_cast<Byte>(value >> (i * 8));
    return std::fwrite(buf, 1, 4, file) == 4;
}

bool WriteU64(FILE* file, uint64_t value) {
    Byte buf[8];
    for (int i = 0; i < 8; ++i) buf[i] = static_cast<Byte>(value >> (i * 8));
    return std::fwrite(buf, 1, 8, file) == 8;
}

bool WriteField(FILE* file, const std::string& field) {
    return WriteU32(file, static_cast<uint32_t>(field.size())) &&
           std::fwrite(field.data(), 1, field.size(), file) == field.size();
}

bool ReadU32(FILE* file, uint32_t& value) {
    Byte buf[4];
    if (std::fread(buf, 1, 4, file) != 4) return false;
    value = ReadLE32(buf);
    return true;
}

bool ReadU64(FILE* file, uint64_t& value) {
    Byte buf[8];
    if (std::fread(buf, 1, 8, file) != 8) return false;
    value = ReadLE64(buf);
    return true;
}

bool ReadField(FILE* file, std::string& field) {
    uint32_t size = 0;
    if (!ReadU32(file, size) || size > MAX_FIELD_SIZE) return false;
    field.resize(size);
    return size == 0 || std::fread(&field[0], 1, size, file) == size;
}

} // namespace

std::pair<Status, std::unique_ptr<FlatFileDatabase>> FlatFileDatabase::Open(
    const std::filesystem::path& directory, const Options& options)
{
    std::unique_ptr<FlatFileDatabase> db(new FlatFileDatabase(directory / FILENAME));

    std::error_code ec;
    bool exists = std::filesystem::exists(db->file_, ec);

    if (exists && options.error_if_exists) {
        return {Status::InvalidArgument(db->file_.string() + " exists"), nullptr};
    }
    if (!exists && !options.create_if_missing) {
        return {Status::InvalidArgument(db->file_.string() + " does not exist"), nullptr};
    }

    if (exists) {
        Status s = db->Load();
        if (!s.ok()) {
            return {s, nullptr};
        }
    }

    return {Status::Ok(), std::move(db)};
}

Status FlatFileDatabase::Load() {
    FILE* file = std::fopen(file_.c_str(), "rb");
    if (!file) {
        return Status::IOError("Failed to open " + file_.string());
    }

    Map loaded;
    uint32_t magic = 0;
    uint64_t count = 0;
    Status result = Status::Ok();

    if (!ReadU32(file, magic) || magic != MAGIC) {
        result = Status::Corruption("Bad magic in " + file_.string());
    } else if (!ReadU64(file, count)) {
        result = Status::Corruption("Truncated header in " + file_.string());
    } else {
        for (uint64_t i = 0; i < count; ++i) {
            std::string key;
            std::string value;
            if (!ReadField(file, key) || !ReadField(file, value)) {
                result = Status::Corruption("Truncated entry " + std::to_string(i) +
                                            " in " + file_.string());
                break;
            }
            loaded.emplace(std::move(key), std::move(value));
        }
    }

    std::fclose(file);

    if (result.ok()) {
        std::lock_guard<std::mutex> lock(mutex_);
        data_ = std::make_shared<const Map>(std::move(loaded));
        LOG_DEBUG(util::LogCategory::DB) << "Loaded " << data_->size() << " entries from "
                                         << file_.string();
    }
    return result;
}

Status FlatFileDatabase::OnCommit(const WriteOptions& options, const Map& data) {
    std::filesystem::path tmp = file_;
    tmp += ".tmp";

    FILE* file = std::fopen(tmp.c_str(), "wb");
    if (!file) {
        return Status::IOError("Failed to create " + tmp.string());
    }

    bool ok = WriteU32(file, MAGIC) && WriteU64(file, data.size());
    for (auto it = data.begin(); ok && it != data.end(); ++it) {
        ok = WriteField(file, it->first) && WriteField(file, it->second);
    }
    ok = ok && std::fflush(file) == 0;
#ifndef _WIN32
    if (ok && options.sync) {
        ok = ::fsync(fileno(file)) == 0;
    }
#endif
    ok = (std::fclose(file) == 0) && ok;

    std::error_code ec;
    if (!ok) {
        std::filesystem::remove(tmp, ec);
        return Status::IOError("Failed to write " + tmp.string());
    }

    std::filesystem::rename(tmp, file_, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return Status::IOError("Failed to replace " + file_.string());
    }
    return Status::Ok();
}

std::string FlatFileDatabase::GetStats() const {
    std::ostringstream oss;
    oss << "flatfile " << file_.string() << " entries=" << Size();
    return oss.str();
}

} // namespace db
} // namespace soulbound
