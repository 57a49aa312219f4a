// Pasifika - 256-bit Unsigned Integer Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/core/uint256.h"
#include "pasifika/core/hex.h"

#include <algorithm>
#include <stdexcept>

namespace pasifika {

// ============================================================================
// Construction / Conversion
// ============================================================================

Uint256 Uint256::FromHex(const std::string& hex) {
    std::string h = StripHexPrefix(hex);
    if (h.empty() || h.size() > 64) {
        throw std::invalid_argument("Invalid hex length for Uint256");
    }

    auto hexCharToNibble = [](char c) -> uint64_t {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };

    Uint256 result;
    // Least significant nibble is the last character
    for (size_t i = 0; i < h.size(); ++i) {
        size_t nibbleIdx = h.size() - 1 - i;
        uint64_t nibble = hexCharToNibble(h[nibbleIdx]);
        result.limbs[i / 16] |= nibble << ((i % 16) * 4);
    }
    return result;
}

Uint256 Uint256::FromDecimal(const std::string& str) {
    if (str.empty()) {
        throw std::invalid_argument("Empty decimal string");
    }

    const Uint256 ten(10);
    Uint256 result;
    for (char c : str) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid decimal character");
        }
        result = result * ten + Uint256(static_cast<uint64_t>(c - '0'));
    }
    return result;
}

std::string Uint256::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(64);

    // Output from most significant limb to least
    for (int i = 3; i >= 0; --i) {
        for (int j = 56; j >= 0; j -= 8) {
            uint8_t byte = (limbs[i] >> j) & 0xFF;
            result.push_back(hexChars[byte >> 4]);
            result.push_back(hexChars[byte & 0x0F]);
        }
    }

    return result;
}

std::string Uint256::ToString() const {
    if (IsZero()) {
        return "0";
    }

    // Peel off 19 decimal digits at a time
    const Uint256 chunk(10000000000000000000ULL);
    std::string result;
    Uint256 value = *this;
    while (!value.IsZero()) {
        Uint256 q, r;
        DivMod(value, chunk, q, r);
        std::string part = std::to_string(r.GetLow64());
        if (!q.IsZero()) {
            part.insert(0, 19 - part.size(), '0');
        }
        result.insert(0, part);
        value = q;
    }
    return result;
}

bool Uint256::IsZero() const {
    return limbs[0] == 0 && limbs[1] == 0 && limbs[2] == 0 && limbs[3] == 0;
}

int Uint256::BitLength() const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] != 0) {
            return i * 64 + (64 - __builtin_clzll(limbs[i]));
        }
    }
    return 0;
}

bool Uint256::GetBit(int pos) const {
    return (limbs[pos / 64] >> (pos % 64)) & 1;
}

void Uint256::SetBit(int pos) {
    limbs[pos / 64] |= (1ULL << (pos % 64));
}

// ============================================================================
// Comparison
// ============================================================================

bool Uint256::operator==(const Uint256& other) const {
    return limbs == other.limbs;
}

bool Uint256::operator!=(const Uint256& other) const {
    return !(*this == other);
}

bool Uint256::operator<(const Uint256& other) const {
    for (int i = 3; i >= 0; --i) {
        if (limbs[i] < other.limbs[i]) return true;
        if (limbs[i] > other.limbs[i]) return false;
    }
    return false;
}

bool Uint256::operator<=(const Uint256& other) const {
    return !(other < *this);
}

bool Uint256::operator>(const Uint256& other) const {
    return other < *this;
}

bool Uint256::operator>=(const Uint256& other) const {
    return !(*this < other);
}

// ============================================================================
// Shifts
// ============================================================================

Uint256 Uint256::operator<<(int shift) const {
    if (shift <= 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;

    for (int i = 3; i >= limbShift; --i) {
        result.limbs[i] = limbs[i - limbShift] << bitShift;
        if (bitShift > 0 && i - limbShift - 1 >= 0) {
            result.limbs[i] |= limbs[i - limbShift - 1] >> (64 - bitShift);
        }
    }
    return result;
}

Uint256 Uint256::operator>>(int shift) const {
    if (shift <= 0) return *this;
    if (shift >= 256) return Uint256();

    Uint256 result;
    int limbShift = shift / 64;
    int bitShift = shift % 64;

    for (int i = 0; i + limbShift < 4; ++i) {
        result.limbs[i] = limbs[i + limbShift] >> bitShift;
        if (bitShift > 0 && i + limbShift + 1 < 4) {
            result.limbs[i] |= limbs[i + limbShift + 1] << (64 - bitShift);
        }
    }
    return result;
}

// ============================================================================
// Raw Arithmetic
// ============================================================================

Uint256 Uint256::Add(const Uint256& a, const Uint256& b, bool& carry) {
    Uint256 result;
    uint64_t c = 0;

    for (int i = 0; i < 4; ++i) {
        __uint128_t sum = static_cast<__uint128_t>(a.limbs[i]) +
                          static_cast<__uint128_t>(b.limbs[i]) + c;
        result.limbs[i] = static_cast<uint64_t>(sum);
        c = static_cast<uint64_t>(sum >> 64);
    }

    carry = (c != 0);
    return result;
}

Uint256 Uint256::Sub(const Uint256& a, const Uint256& b, bool& borrow) {
    Uint256 result;
    uint64_t bw = 0;

    for (int i = 0; i < 4; ++i) {
        __uint128_t diff = static_cast<__uint128_t>(a.limbs[i]) -
                           static_cast<__uint128_t>(b.limbs[i]) - bw;
        result.limbs[i] = static_cast<uint64_t>(diff);
        bw = static_cast<uint64_t>((diff >> 127) & 1);
    }

    borrow = (bw != 0);
    return result;
}

Uint256 Uint256::Mul(const Uint256& a, const Uint256& b, Uint256& high) {
    // Schoolbook multiplication: 256 x 256 -> 512 bits
    __uint128_t products[8] = {0};

    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
            __uint128_t prod = static_cast<__uint128_t>(a.limbs[i]) *
                               static_cast<__uint128_t>(b.limbs[j]);
            int k = i + j;
            products[k] += prod & 0xFFFFFFFFFFFFFFFFULL;
            products[k + 1] += prod >> 64;
        }
    }

    uint64_t result[8];
    __uint128_t carry = 0;
    for (int i = 0; i < 8; ++i) {
        __uint128_t sum = products[i] + carry;
        result[i] = static_cast<uint64_t>(sum);
        carry = sum >> 64;
    }

    high = Uint256(result[4], result[5], result[6], result[7]);
    return Uint256(result[0], result[1], result[2], result[3]);
}

void Uint256::DivMod(const Uint256& a, const Uint256& b,
                     Uint256& quotient, Uint256& remainder) {
    if (b.IsZero()) {
        throw std::domain_error("Uint256 division by zero");
    }

    quotient = Uint256();
    remainder = Uint256();
    if (a < b) {
        remainder = a;
        return;
    }
    if (a.FitsUint64() && b.FitsUint64()) {
        quotient = Uint256(a.limbs[0] / b.limbs[0]);
        remainder = Uint256(a.limbs[0] % b.limbs[0]);
        return;
    }

    // Restoring long division; `top` tracks the bit shifted out of the remainder
    for (int i = a.BitLength() - 1; i >= 0; --i) {
        bool top = remainder.GetBit(255);
        remainder = remainder << 1;
        if (a.GetBit(i)) {
            remainder.limbs[0] |= 1;
        }
        if (top || remainder >= b) {
            bool borrow;
            remainder = Sub(remainder, b, borrow);
            quotient.SetBit(i);
        }
    }
}

Uint256 Uint256::MulDiv(const Uint256& a, const Uint256& b, const Uint256& c) {
    if (c.IsZero()) {
        throw std::domain_error("Uint256 division by zero");
    }

    Uint256 high;
    Uint256 low = Mul(a, b, high);
    if (high.IsZero()) {
        return low / c;
    }
    if (high >= c) {
        throw std::overflow_error("Uint256 mulDiv overflow");
    }

    // 512-by-256 division; the remainder starts with the high half (< c)
    Uint256 quotient;
    Uint256 remainder = high;
    for (int i = 255; i >= 0; --i) {
        bool top = remainder.GetBit(255);
        remainder = remainder << 1;
        if (low.GetBit(i)) {
            remainder.limbs[0] |= 1;
        }
        if (top || remainder >= c) {
            bool borrow;
            remainder = Sub(remainder, c, borrow);
            quotient.SetBit(i);
        }
    }
    return quotient;
}

// ============================================================================
// Checked Operators
// ============================================================================

Uint256 Uint256::operator+(const Uint256& other) const {
    bool carry;
    Uint256 result = Add(*this, other, carry);
    if (carry) {
        throw std::overflow_error("Uint256 addition overflow");
    }
    return result;
}

Uint256 Uint256::operator-(const Uint256& other) const {
    bool borrow;
    Uint256 result = Sub(*this, other, borrow);
    if (borrow) {
        throw std::overflow_error("Uint256 subtraction underflow");
    }
    return result;
}

Uint256 Uint256::operator*(const Uint256& other) const {
    Uint256 high;
    Uint256 result = Mul(*this, other, high);
    if (!high.IsZero()) {
        throw std::overflow_error("Uint256 multiplication overflow");
    }
    return result;
}

Uint256 Uint256::operator/(const Uint256& other) const {
    Uint256 q, r;
    DivMod(*this, other, q, r);
    return q;
}

Uint256 Uint256::operator%(const Uint256& other) const {
    Uint256 q, r;
    DivMod(*this, other, q, r);
    return r;
}

Uint256& Uint256::operator+=(const Uint256& other) {
    *this = *this + other;
    return *this;
}

Uint256& Uint256::operator-=(const Uint256& other) {
    *this = *this - other;
    return *this;
}

Uint256& Uint256::operator*=(const Uint256& other) {
    *this = *this * other;
    return *this;
}

Uint256& Uint256::operator/=(const Uint256& other) {
    *this = *this / other;
    return *this;
}

std::ostream& operator<<(std::ostream& os, const Uint256& value) {
    return os << value.ToString();
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatEther(const Amount& amount) {
    Uint256 whole, frac;
    Uint256::DivMod(amount, Uint256(WEI_PER_ETHER), whole, frac);

    std::string result = whole.ToString();
    if (!frac.IsZero()) {
        std::string digits = std::to_string(frac.GetLow64());
        digits.insert(0, 18 - digits.size(), '0');
        digits.erase(digits.find_last_not_of('0') + 1);
        result += "." + digits;
    }
    return result;
}

bool ParseAmount(const std::string& str, Amount* out) {
    std::string s = str;
    auto trim = [](std::string& v) {
        size_t start = v.find_first_not_of(" \t");
        size_t end = v.find_last_not_of(" \t");
        v = start == std::string::npos ? "" : v.substr(start, end - start + 1);
    };
    trim(s);

    bool ether = false;
    const std::string suffix = "ether";
    if (s.size() > suffix.size() &&
        s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
        ether = true;
        s.erase(s.size() - suffix.size());
        trim(s);
    }
    if (s.empty()) {
        return false;
    }

    std::string whole = s;
    std::string frac;
    size_t dot = s.find('.');
    if (dot != std::string::npos) {
        if (!ether) {
            return false;
        }
        whole = s.substr(0, dot);
        frac = s.substr(dot + 1);
        if (frac.size() > 18 || (whole.empty() && frac.empty())) {
            return false;
        }
        if (whole.empty()) {
            whole = "0";
        }
    }

    try {
        Amount value = Uint256::FromDecimal(whole);
        if (ether) {
            value *= Amount(WEI_PER_ETHER);
            if (!frac.empty()) {
                frac.append(18 - frac.size(), '0');
                value += Uint256::FromDecimal(frac);
            }
        }
        *out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::overflow_error&) {
        return false;
    }
}

} // namespace pasifika
