// SOULBOUND - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 SOULBOUND Developers
// MIT License

#ifndef SOULBOUND_CORE_HEX_H
#define SOULBOUND_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace soulbound {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes.
/// @throws std::invalid_argument on odd length or non-hex characters
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

/// Remove a leading "0x" / "0X" if present
std::string StripHexPrefix(const std::string& str);

/// Render bytes for display: printable ASCII as-is, otherwise 0x-hex
std::string BytesToDisplay(const std::vector<uint8_t>& data);

} // namespace soulbound

#endif // SOULBOUND_CORE_HEX_H
