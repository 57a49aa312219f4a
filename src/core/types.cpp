// Pasifika - Core Types Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/core/types.h"
#include "pasifika/core/hex.h"

#include <stdexcept>

namespace pasifika {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

// ============================================================================
// Parsing
// ============================================================================

Hash256 Hash256::FromHex(const std::string& hex) {
    std::vector<HexByte> bytes = HexToBytes(hex);
    if (bytes.size() != SIZE) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    return Hash256(bytes.data(), bytes.size());
}

Address Address::FromHex(const std::string& hex) {
    std::vector<HexByte> bytes = HexToBytes(hex);
    if (bytes.size() != SIZE) {
        throw std::invalid_argument("Invalid hex string length for address");
    }
    return Address(bytes.data(), bytes.size());
}

} // namespace pasifika
