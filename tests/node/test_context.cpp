// Pasifika - Ledger Context Tests
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include <gtest/gtest.h>

#include <pasifika/node/context.h>
#include <pasifika/util/time.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace pasifika {
namespace node {
namespace {

using ledger::AuthContext;
using ledger::Capability;

class LedgerContextTest : public ::testing::Test {
protected:
    util::ScopedMockTime clock_{1700000000};
    LedgerContext ctx_;

    Address community_ = Address::FromHex("0x00000000000000000000000000000000000000c0");
    Address buyer_ = Address::FromHex("0x0000000000000000000000000000000000000001");
    Address creator_ = Address::FromHex("0x0000000000000000000000000000000000000002");

    void TearDown() override {
        ShutdownLedger(ctx_);
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/pasifika_context_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    std::vector<std::string> tempFiles_;
};

TEST_F(LedgerContextTest, EngineAddressesAreDistinctAndStable) {
    Address treasury = EngineAddress("treasury");
    EXPECT_FALSE(treasury.IsNull());
    EXPECT_EQ(treasury, EngineAddress("treasury"));
    EXPECT_NE(treasury, EngineAddress("fees"));
    EXPECT_NE(EngineAddress("transfer"), EngineAddress("staking"));
}

TEST_F(LedgerContextTest, InitializeWiresAllEngines) {
    EXPECT_FALSE(ctx_.IsReady());
    ASSERT_TRUE(InitializeLedger(ctx_, EngineParams::Default()).ok());
    ASSERT_TRUE(ctx_.IsReady());

    EXPECT_EQ(ctx_.native->Symbol(), NATIVE_SYMBOL);
    EXPECT_EQ(ctx_.token->Symbol(), TOKEN_SYMBOL);
    EXPECT_EQ(ctx_.treasury->GetAddress(), EngineAddress("treasury"));
    EXPECT_EQ(ctx_.fees->GetAddress(), EngineAddress("fees"));
    EXPECT_EQ(ctx_.transfers->GetAddress(), EngineAddress("transfer"));
    EXPECT_EQ(ctx_.staking->GetAddress(), EngineAddress("staking"));
    EXPECT_EQ(ctx_.treasury->GetFunds().size(), 5u);
}

TEST_F(LedgerContextTest, FeesAndTransfersShareTreasury) {
    EngineParams params = EngineParams::Default();
    params.fees.communityFund = community_;
    ASSERT_TRUE(InitializeLedger(ctx_, params).ok());
    ASSERT_TRUE(ctx_.native->Mint(buyer_, Ether(100)).ok());

    AuthContext market(Address::FromHex("0x0000000000000000000000000000000000000003"),
                       {Capability::Marketplace});
    ASSERT_TRUE(ctx_.fees->ProcessFee(market, buyer_, Ether(10), fees::FeeType::StandardSale,
                                      creator_, std::nullopt).ok());
    Amount platform = Amount(100000000000000000ULL);
    EXPECT_EQ(ctx_.treasury->GetTotalBalance(), platform);

    ASSERT_TRUE(ctx_.transfers->Transfer(AuthContext(buyer_), creator_, Ether(1), "").ok());
    EXPECT_EQ(ctx_.treasury->GetTotalBalance(), platform + Amount(10000000000000000ULL));
    EXPECT_EQ(ctx_.native->BalanceOf(ctx_.treasury->GetAddress()),
              ctx_.treasury->GetTotalBalance());
}

TEST_F(LedgerContextTest, StakingUsesTokenLedger) {
    ASSERT_TRUE(InitializeLedger(ctx_, EngineParams::Default()).ok());
    ASSERT_TRUE(ctx_.token->Mint(buyer_, Ether(1000)).ok());
    ASSERT_TRUE(ctx_.native->Mint(buyer_, Ether(1000)).ok());

    ASSERT_TRUE(ctx_.staking->CreateStake(AuthContext(buyer_), Ether(1000), Days(30)).ok());
    EXPECT_TRUE(ctx_.token->BalanceOf(buyer_).IsZero());
    EXPECT_EQ(ctx_.native->BalanceOf(buyer_), Ether(1000));
    EXPECT_EQ(ctx_.token->BalanceOf(ctx_.staking->GetAddress()), Ether(1000));
}

TEST_F(LedgerContextTest, InvalidParametersLeaveContextEmpty) {
    EngineParams params = EngineParams::Default();
    params.transfer.minFee = Ether(2);
    params.transfer.maxFee = Ether(1);

    EXPECT_TRUE(InitializeLedger(ctx_, params).IsInvalidArgument());
    EXPECT_FALSE(ctx_.IsReady());
    EXPECT_FALSE(ctx_.treasury);
}

TEST_F(LedgerContextTest, InitializeFromFile) {
    std::string path = CreateTempFile(
        "# Pasifika engine overrides\n"
        "[fees]\n"
        "community_fund = 0x00000000000000000000000000000000000000c0\n"
        "\n"
        "[treasury]\n"
        "funds = Development:6000, Unallocated:4000\n");

    ASSERT_TRUE(InitializeLedgerFromFile(ctx_, path).ok());
    ASSERT_TRUE(ctx_.IsReady());
    EXPECT_EQ(ctx_.fees->GetCommunityFundAddress(), community_);
    EXPECT_EQ(ctx_.treasury->GetFunds().size(), 2u);
}

TEST_F(LedgerContextTest, InitializeFromBadFile) {
    EXPECT_TRUE(InitializeLedgerFromFile(ctx_, "/nonexistent/pasifika.conf")
                    .IsInvalidArgument());

    std::string path = CreateTempFile("[transfer]\nmax_batch_size = none\n");
    EXPECT_TRUE(InitializeLedgerFromFile(ctx_, path).IsInvalidArgument());
    EXPECT_FALSE(ctx_.IsReady());
}

TEST_F(LedgerContextTest, ShutdownReleasesEngines) {
    ASSERT_TRUE(InitializeLedger(ctx_, EngineParams::Default()).ok());
    ShutdownLedger(ctx_);
    EXPECT_FALSE(ctx_.IsReady());
    EXPECT_FALSE(ctx_.fees);
    EXPECT_FALSE(ctx_.native);

    ASSERT_TRUE(InitializeLedger(ctx_, EngineParams::Default()).ok());
    EXPECT_TRUE(ctx_.IsReady());
}

} // namespace
} // namespace node
} // namespace pasifika
