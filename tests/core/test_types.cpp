// Pasifika - Core Types Tests
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include <gtest/gtest.h>
#include "pasifika/core/types.h"
#include "pasifika/core/hex.h"
#include "pasifika/core/status.h"

#include <stdexcept>
#include <unordered_set>

namespace pasifika {
namespace test {

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, DefaultIsNull) {
    Address a;
    EXPECT_TRUE(a.IsNull());
    EXPECT_EQ(Address::SIZE, 20);
}

TEST(AddressTest, FromHexWithAndWithoutPrefix) {
    Address a = Address::FromHex("0x00000000000000000000000000000000000000ab");
    Address b = Address::FromHex("00000000000000000000000000000000000000ab");
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a.IsNull());
    EXPECT_EQ(a[19], 0xab);
}

TEST(AddressTest, ToStringIsPrefixedHex) {
    Address a = Address::FromHex("0x00000000000000000000000000000000000000ab");
    EXPECT_EQ(a.ToString(), "0x00000000000000000000000000000000000000ab");
}

TEST(AddressTest, FromHexRejectsWrongLength) {
    EXPECT_THROW(Address::FromHex("0xabcd"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex("zz000000000000000000000000000000000000ab"),
                 std::invalid_argument);
}

TEST(AddressTest, UsableAsUnorderedKey) {
    std::unordered_set<Address, AddressHasher> set;
    Address a = Address::FromHex("0x0000000000000000000000000000000000000001");
    Address b = Address::FromHex("0x0000000000000000000000000000000000000002");
    set.insert(a);
    set.insert(b);
    set.insert(a);
    EXPECT_EQ(set.size(), 2);
}

// ============================================================================
// Time Constants
// ============================================================================

TEST(TimeConstantsTest, Days) {
    EXPECT_EQ(SECONDS_PER_DAY, 86400);
    EXPECT_EQ(Days(30), 30 * 86400);
}

// ============================================================================
// Status Tests
// ============================================================================

TEST(StatusTest, DefaultIsOk) {
    Status s;
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.ToString(), "OK");
}

TEST(StatusTest, FactoriesSetCodeAndMessage) {
    Status s = Status::InsufficientFunds("balance too low");
    EXPECT_FALSE(s.ok());
    EXPECT_TRUE(s.IsInsufficientFunds());
    EXPECT_EQ(s.message(), "balance too low");
    EXPECT_EQ(s.ToString(), "InsufficientFunds: balance too low");

    EXPECT_TRUE(Status::Reentrancy().IsReentrancy());
    EXPECT_TRUE(Status::Unauthorized().IsUnauthorized());
    EXPECT_TRUE(Status::NotFound().IsNotFound());
}

} // namespace test
} // namespace pasifika
