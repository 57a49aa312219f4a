// Pasifika - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 Pasifika Developers
// MIT License

#ifndef PASIFIKA_CORE_HEX_H
#define PASIFIKA_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace pasifika {

using HexByte = uint8_t;

/// Convert bytes to hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

template<size_t N>
std::string BytesToHex(const std::array<HexByte, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes (an optional 0x prefix is skipped)
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid hex
bool IsValidHex(const std::string& str);

/// Strip a leading "0x" / "0X"
std::string StripHexPrefix(const std::string& hex);

} // namespace pasifika

#endif // PASIFIKA_CORE_HEX_H
