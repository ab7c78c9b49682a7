// SOULBOUND - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#include "soulbound/core/hex.h"

#include <stdexcept>

namespace soulbound {

namespace {
    constexpr char HEX_CHARS[] = "0123456789abcdef";

    int NibbleOf(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string BytesToHex(const uint8_t* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = HEX_CHARS[data[i] >> 4];
        out[2 * i + 1] = HEX_CHARS[data[i] & 0x0F];
    }
    return out;
}

std::string BytesToHex(const std::vector<uint8_t>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<uint8_t> HexToBytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have even length");
    }

    std::vector<uint8_t> out;
    out.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int hi = NibbleOf(hex[i]);
        int lo = NibbleOf(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex character");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    return out;
}

bool IsValidHex(const std::string& str) {
    if (str.empty() || str.length() % 2 != 0) {
        return false;
    }
    for (char c : str) {
        if (NibbleOf(c) < 0) return false;
    }
    return true;
}

std::string StripHexPrefix(const std::string& str) {
    if (str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        return str.substr(2);
    }
    return str;
}

std::string BytesToDisplay(const std::vector<uint8_t>& data) {
    for (uint8_t b : data) {
        if (b < 0x20 || b > 0x7E) {
            return "0x" + BytesToHex(data);
        }
    }
    return std::string(data.begin(), data.end());
}

} // namespace soulbound
