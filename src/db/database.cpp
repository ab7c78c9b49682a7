// SOULBOUND - Database Implementation
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/db/database.h"
#include "soulbound/db/leveldb.h"
#include "soulbound/util/logging.h"

#include <system_error>

namespace soulbound {
namespace db {

// ============================================================================
// Status
// ============================================================================

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result;
    switch (code_) {
        case NOT_FOUND:        result = "NotFound: "; break;
        case CORRUPTION:       result = "Corruption: "; break;
        case NOT_SUPPORTED:    result = "NotSupported: "; break;
        case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
        case IO_ERROR:         result = "IOError: "; break;
        default:               result = "Unknown: "; break;
    }
    return result + message_;
}

// ============================================================================
// WriteBatch
// ============================================================================

bool WriteBatch::Lookup(const Slice& key, std::string* value, bool* deleted) const {
    for (auto it = operations_.rbegin(); it != operations_.rend(); ++it) {
        if (Slice(it->first) != key) {
            continue;
        }
        if (it->second) {
            if (value) *value = *it->second;
            if (deleted) *deleted = false;
        } else if (deleted) {
            *deleted = true;
        }
        return true;
    }
    return false;
}

// ============================================================================
// Database Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return {Status::IOError("cannot create " + path.string() + ": " + ec.message()),
                    nullptr};
        }
    }

#ifdef SOULBOUND_USE_LEVELDB
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        delete cache;
        delete filter;
        LOG_ERROR(util::LogCategory::DB) << "Failed to open LevelDB at " << path.string()
                                         << ": " << s.ToString();
        return {FromLevelDBStatus(s), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened LevelDB database at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, cache, filter)};
#else
    auto [status, db] = FlatFileDatabase::Open(path, options);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to open database at " << path.string()
                                         << ": " << status.ToString();
        return {status, nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Opened flat-file database " << db->GetPath().string();
    return {Status::Ok(), std::move(db)};
#endif
}

Status DestroyDatabase(const std::filesystem::path& path) {
#ifdef SOULBOUND_USE_LEVELDB
    leveldb::Status s = leveldb::DestroyDB(path.string(), leveldb::Options());
    if (!s.ok()) {
        return FromLevelDBStatus(s);
    }
    return Status::Ok();
#else
    std::error_code ec;
    std::filesystem::remove(path / FlatFileDatabase::FILENAME, ec);
    if (ec) {
        return Status::IOError(ec.message());
    }
    return Status::Ok();
#endif
}

} // namespace db
} // namespace soulbound
