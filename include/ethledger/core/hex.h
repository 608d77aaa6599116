// ETHLEDGER - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 ETHLEDGER Developers
// MIT License

#ifndef ETHLEDGER_CORE_HEX_H
#define ETHLEDGER_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <array>
#include <stdexcept>

namespace ethledger {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string (no prefix)
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes. Accepts an optional 0x prefix.
/// @throws std::invalid_argument on odd length or non-hex characters
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid, non-empty, even-length hex (prefix not allowed)
bool IsValidHex(const std::string& str);

/// True if the string starts with 0x or 0X
bool IsHexPrefixed(const std::string& str);

/// Remove a leading 0x/0X if present
std::string StripHexPrefix(const std::string& str);

/// Add a leading 0x unless already present
std::string AddHexPrefix(const std::string& str);

/// Left-pad a hex string with zeros to the given number of digits
std::string PadLeftHex(const std::string& hex, size_t digits);

/// Lowercase a hex string
std::string ToLowerHex(const std::string& hex);

} // namespace ethledger

#endif // ETHLEDGER_CORE_HEX_H
