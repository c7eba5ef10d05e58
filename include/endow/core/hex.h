// ENDOW - Hex Encoding/Decoding Utilities
// Copyright (c) 2026 ENDOW Developers
// MIT License

#ifndef ENDOW_CORE_HEX_H
#define ENDOW_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <stdexcept>

namespace endow {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string (no prefix)
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Convert hex string to bytes; accepts an optional "0x" prefix
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex (optional "0x" prefix, even length)
bool IsValidHex(const std::string& str);

/// Remove a leading "0x"/"0X" if present
std::string StripHexPrefix(const std::string& str);

} // namespace endow

#endif // ENDOW_CORE_HEX_H
