// Pasifika - SHA3 Identifier Hashing Tests
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include <gtest/gtest.h>
#include "pasifika/crypto/hash.h"

namespace pasifika {
namespace test {

TEST(SHA3Test, EmptyInput) {
    EXPECT_EQ(SHA3Hash("").ToHex(),
              "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(SHA3Test, Abc) {
    EXPECT_EQ(SHA3Hash("abc").ToHex(),
              "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(SHA3Test, ByteAndStringOverloadsAgree) {
    const std::string msg = "Pasifika";
    EXPECT_EQ(SHA3Hash(reinterpret_cast<const Byte*>(msg.data()), msg.size()), SHA3Hash(msg));
}

TEST(TaggedHashTest, TagSeparatesDomains) {
    EXPECT_NE(TaggedHash("fund", "Reserve"), TaggedHash("engine", "Reserve"));
    EXPECT_NE(TaggedHash("ab", "c"), TaggedHash("a", "bc"));
    EXPECT_EQ(TaggedHash("fund", "Reserve"), TaggedHash("fund", "Reserve"));
}

} // namespace test
} // namespace pasifika
