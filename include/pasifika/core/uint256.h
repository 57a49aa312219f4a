// Pasifika - 256-bit Unsigned Integer
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// Fixed-width 256-bit unsigned integer used for every monetary amount.
// Arithmetic operators are checked: overflow and underflow throw
// std::overflow_error, division by zero throws std::domain_error.

#ifndef PASIFIKA_CORE_UINT256_H
#define PASIFIKA_CORE_UINT256_H

#include "pasifika/core/types.h"

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

namespace pasifika {

// ============================================================================
// 256-bit Unsigned Integer
// ============================================================================

/// 256-bit unsigned integer represented as 4 x 64-bit limbs (little-endian)
class Uint256 {
public:
    static constexpr size_t NUM_LIMBS = 4;

    /// Limbs in little-endian order (limb[0] is least significant)
    std::array<uint64_t, NUM_LIMBS> limbs;

    /// Default constructor - zero
    constexpr Uint256() : limbs{0, 0, 0, 0} {}

    /// Construct from limbs (little-endian)
    constexpr Uint256(uint64_t l0, uint64_t l1, uint64_t l2, uint64_t l3)
        : limbs{l0, l1, l2, l3} {}

    /// Construct from single value
    explicit constexpr Uint256(uint64_t val) : limbs{val, 0, 0, 0} {}

    /// Largest representable value
    static constexpr Uint256 Max() {
        return Uint256(~0ULL, ~0ULL, ~0ULL, ~0ULL);
    }

    /// Construct from hex string (optional 0x prefix)
    static Uint256 FromHex(const std::string& hex);

    /// Parse a decimal string; throws std::invalid_argument or std::overflow_error
    static Uint256 FromDecimal(const std::string& str);

    /// Convert to hex string (64 characters)
    std::string ToHex() const;

    /// Convert to decimal string
    std::string ToString() const;

    /// Check if zero
    bool IsZero() const;

    /// True if the value fits in 64 bits
    bool FitsUint64() const { return limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0; }

    /// Low 64 bits
    uint64_t GetLow64() const { return limbs[0]; }

    /// Number of significant bits
    int BitLength() const;

    /// Bit access
    bool GetBit(int pos) const;
    void SetBit(int pos);

    /// Comparison operators
    bool operator==(const Uint256& other) const;
    bool operator!=(const Uint256& other) const;
    bool operator<(const Uint256& other) const;
    bool operator<=(const Uint256& other) const;
    bool operator>(const Uint256& other) const;
    bool operator>=(const Uint256& other) const;

    /// Shifts (bits shifted out are discarded)
    Uint256 operator<<(int shift) const;
    Uint256 operator>>(int shift) const;

    /// Checked arithmetic
    Uint256 operator+(const Uint256& other) const;
    Uint256 operator-(const Uint256& other) const;
    Uint256 operator*(const Uint256& other) const;
    Uint256 operator/(const Uint256& other) const;
    Uint256 operator%(const Uint256& other) const;

    Uint256& operator+=(const Uint256& other);
    Uint256& operator-=(const Uint256& other);
    Uint256& operator*=(const Uint256& other);
    Uint256& operator/=(const Uint256& other);

    /// Raw arithmetic reporting carry/borrow instead of throwing
    static Uint256 Add(const Uint256& a, const Uint256& b, bool& carry);
    static Uint256 Sub(const Uint256& a, const Uint256& b, bool& borrow);
    static Uint256 Mul(const Uint256& a, const Uint256& b, Uint256& high);

    /// Quotient and remainder of a / b
    static void DivMod(const Uint256& a, const Uint256& b,
                       Uint256& quotient, Uint256& remainder);

    /**
     * Compute a * b / c with a 512-bit intermediate product.
     * Throws std::overflow_error if the quotient does not fit in 256 bits.
     */
    static Uint256 MulDiv(const Uint256& a, const Uint256& b, const Uint256& c);
};

/// Stream output (decimal)
std::ostream& operator<<(std::ostream& os, const Uint256& value);

/// All monetary amounts are 256-bit
using Amount = Uint256;

/// Wei per ether (1e18)
constexpr uint64_t WEI_PER_ETHER = 1000000000000000000ULL;

/// Fixed-point precision used for reward rates
constexpr uint64_t RATE_PRECISION = WEI_PER_ETHER;

/// Amount of `n` whole ether in wei
inline Amount Ether(uint64_t n) {
    return Amount(n) * Amount(WEI_PER_ETHER);
}

/// Apply a basis-point percentage: amount * bps / 10000
inline Amount ApplyBps(const Amount& amount, uint32_t bps) {
    return Uint256::MulDiv(amount, Amount(bps), Amount(BPS_DENOMINATOR));
}

/// Format an amount in ether with up to 18 decimals
std::string FormatEther(const Amount& amount);

/**
 * Parse a wei amount ("1500") or an ether amount ("1.5 ether", "2ether").
 * Returns false on malformed input, more than 18 decimals or overflow.
 */
bool ParseAmount(const std::string& str, Amount* out);

} // namespace pasifika

#endif // PASIFIKA_CORE_UINT256_H
