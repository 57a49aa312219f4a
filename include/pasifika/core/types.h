// Pasifika - Core Types Header
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// This file defines fundamental types used throughout Pasifika.

#ifndef PASIFIKA_CORE_TYPES_H
#define PASIFIKA_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <vector>

namespace pasifika {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Duration in seconds
using Duration = int64_t;

/// Basis points (1/100 of a percent)
using BasisPoints = uint32_t;

/// 10000 bps = 100%
constexpr BasisPoints BPS_DENOMINATOR = 10000;

/// Time constants
constexpr Duration SECONDS_PER_HOUR = 3600;
constexpr Duration SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;
constexpr Duration SECONDS_PER_YEAR = 365 * SECONDS_PER_DAY;

/// Whole days in seconds
constexpr Duration Days(int64_t n) { return n * SECONDS_PER_DAY; }

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-size byte string
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }

    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    /// Iterators
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    /// Comparison operators
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to hex string (storage order)
    std::string ToHex() const;

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;

    static Hash256 FromHex(const std::string& hex);
};

/// 160-bit account address (20 bytes); all zeros is the invalid address
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;

    /// Parse "0x"-prefixed or bare 40-character hex
    static Address FromHex(const std::string& hex);

    /// Checksum-free display form ("0x" + hex)
    std::string ToString() const { return "0x" + ToHex(); }
};

/// Hash functor for unordered containers keyed by fixed-size hashes
template<typename HashType>
struct HashTypeHasher {
    size_t operator()(const HashType& h) const noexcept {
        size_t result = 0;
        std::memcpy(&result, h.data(), sizeof(result) < HashType::SIZE ? sizeof(result) : HashType::SIZE);
        return result;
    }
};

using AddressHasher = HashTypeHasher<Address>;

} // namespace pasifika

#endif // PASIFIKA_CORE_TYPES_H
