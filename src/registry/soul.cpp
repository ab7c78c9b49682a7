// SOULBOUND - Soul Record
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/registry/soul.h"
#include "soulbound/core/hex.h"
#include "soulbound/crypto/sha256.h"
#include "soulbound/util/time.h"

#include <sstream>

namespace soulbound {
namespace registry {

namespace {

constexpr size_t FIXED_SIZE = 1 + 8 + 8 + Uuid::SIZE;

void WriteField(std::vector<Byte>& out, const Bytes& field) {
    WriteLE32(out, static_cast<uint32_t>(field.size()));
    out.insert(out.end(), field.begin(), field.end());
}

bool ReadField(const Byte* data, size_t len, size_t& pos, Bytes& field) {
    if (len - pos < 4) {
        return false;
    }
    uint32_t size = ReadLE32(data + pos);
    pos += 4;
    if (size > Soul::MAX_FIELD_SIZE || len - pos < size) {
        return false;
    }
    field.assign(data + pos, data + pos + size);
    pos += size;
    return true;
}

} // namespace

std::vector<Byte> Soul::ToBytes() const {
    std::vector<Byte> out;
    out.reserve(FIXED_SIZE + 8 + identity.size() + url.size());

    out.push_back(VERSION);
    WriteLE64(out, static_cast<uint64_t>(mintedAt));
    WriteLE64(out, static_cast<uint64_t>(lastUpdate));
    out.insert(out.end(), uuid.begin(), uuid.end());
    WriteField(out, identity);
    WriteField(out, url);

    return out;
}

std::optional<Soul> Soul::FromBytes(const Byte* data, size_t len) {
    if (!data || len < FIXED_SIZE || data[0] != VERSION) {
        return std::nullopt;
    }

    Soul soul;
    size_t pos = 1;
    soul.mintedAt = static_cast<Timestamp>(ReadLE64(data + pos));
    pos += 8;
    soul.lastUpdate = static_cast<Timestamp>(ReadLE64(data + pos));
    pos += 8;
    soul.uuid = Uuid(data + pos, Uuid::SIZE);
    pos += Uuid::SIZE;

    if (!ReadField(data, len, pos, soul.identity) ||
        !ReadField(data, len, pos, soul.url) ||
        pos != len) {
        return std::nullopt;
    }

    return soul;
}

std::string Soul::ToString() const {
    std::ostringstream oss;
    oss << "Soul(identity=" << BytesToDisplay(identity)
        << ", url=" << BytesToDisplay(url)
        << ", uuid=" << uuid.ToString()
        << ", mintedAt=" << util::FormatISO8601(mintedAt)
        << ", lastUpdate=" << util::FormatISO8601(lastUpdate) << ")";
    return oss.str();
}

IdentityFingerprint ComputeIdentityFingerprint(const Bytes& identity) {
    return IdentityFingerprint(SHA256Hash(identity));
}

} // namespace registry
} // namespace soulbound
