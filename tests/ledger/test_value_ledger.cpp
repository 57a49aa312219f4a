// Pasifika - Host Value Ledger Tests
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include <gtest/gtest.h>

#include <pasifika/ledger/auth.h>
#include <pasifika/ledger/reentrancy.h>
#include <pasifika/ledger/value_ledger.h>

#include <array>
#include <vector>

namespace pasifika {
namespace ledger {
namespace {

// ============================================================================
// Test Fixtures
// ============================================================================

class ValueLedgerTest : public ::testing::Test {
protected:
    ValueLedger ledger_{"ETH"};
    Address alice_ = CreateTestAddress(0x01);
    Address bob_ = CreateTestAddress(0x02);
    Address carol_ = CreateTestAddress(0x03);

    static Address CreateTestAddress(Byte value) {
        std::array<Byte, 20> data{};
        data.fill(value);
        return Address(data);
    }

    void SetUp() override {
        ASSERT_TRUE(ledger_.Mint(alice_, Ether(10)).ok());
    }
};

// ============================================================================
// Balances
// ============================================================================

TEST_F(ValueLedgerTest, MintCreditsAndGrowsSupply) {
    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(10));
    EXPECT_EQ(ledger_.TotalSupply(), Ether(10));
    EXPECT_EQ(ledger_.Symbol(), "ETH");
}

TEST_F(ValueLedgerTest, MintToZeroAddressRejected) {
    EXPECT_TRUE(ledger_.Mint(Address(), Ether(1)).IsInvalidArgument());
}

TEST_F(ValueLedgerTest, MintOverflowRejected) {
    Status s = ledger_.Mint(bob_, Amount::Max());
    EXPECT_TRUE(s.IsInvalidArgument());
    EXPECT_TRUE(ledger_.BalanceOf(bob_).IsZero());
}

TEST_F(ValueLedgerTest, TransferMovesValue) {
    ASSERT_TRUE(ledger_.Transfer(alice_, bob_, Ether(3)).ok());
    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(7));
    EXPECT_EQ(ledger_.BalanceOf(bob_), Ether(3));
    EXPECT_EQ(ledger_.TotalSupply(), Ether(10));
}

TEST_F(ValueLedgerTest, TransferInsufficientFunds) {
    Status s = ledger_.Transfer(bob_, alice_, Amount(1));
    EXPECT_TRUE(s.IsInsufficientFunds());
    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(10));
}

TEST_F(ValueLedgerTest, TransferToZeroAddressRejected) {
    EXPECT_TRUE(ledger_.Transfer(alice_, Address(), Ether(1)).IsInvalidArgument());
}

TEST_F(ValueLedgerTest, ZeroTransferSkipsHook) {
    bool called = false;
    ledger_.SetReceiveHook(bob_, [&](const Address&, const Amount&) {
        called = true;
        return false;
    });
    EXPECT_TRUE(ledger_.Transfer(alice_, bob_, Amount()).ok());
    EXPECT_FALSE(called);
}

// ============================================================================
// Receive Hooks
// ============================================================================

TEST_F(ValueLedgerTest, RejectingHookUndoesCredit) {
    ledger_.SetReceiveHook(bob_, [](const Address&, const Amount&) { return false; });

    Status s = ledger_.Transfer(alice_, bob_, Ether(1));
    EXPECT_TRUE(s.IsTransferFailed());
    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(10));
    EXPECT_TRUE(ledger_.BalanceOf(bob_).IsZero());
}

TEST_F(ValueLedgerTest, HookSeesCreditedBalance) {
    Amount seen;
    ledger_.SetReceiveHook(bob_, [&](const Address& from, const Amount& amount) {
        EXPECT_EQ(from, alice_);
        EXPECT_EQ(amount, Ether(2));
        seen = ledger_.BalanceOf(bob_);
        return true;
    });
    ASSERT_TRUE(ledger_.Transfer(alice_, bob_, Ether(2)).ok());
    EXPECT_EQ(seen, Ether(2));
}

TEST_F(ValueLedgerTest, HookSideEffectsRevertWithRejection) {
    // Bob forwards to Carol, then rejects: both legs roll back
    ledger_.SetReceiveHook(bob_, [&](const Address&, const Amount& amount) {
        EXPECT_TRUE(ledger_.Transfer(bob_, carol_, amount).ok());
        return false;
    });
    EXPECT_TRUE(ledger_.Transfer(alice_, bob_, Ether(1)).IsTransferFailed());
    EXPECT_TRUE(ledger_.BalanceOf(carol_).IsZero());
    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(10));
}

TEST_F(ValueLedgerTest, ClearHook) {
    ledger_.SetReceiveHook(bob_, [](const Address&, const Amount&) { return false; });
    ledger_.ClearReceiveHook(bob_);
    EXPECT_TRUE(ledger_.Transfer(alice_, bob_, Ether(1)).ok());
}

// ============================================================================
// Checkpoints
// ============================================================================

TEST_F(ValueLedgerTest, CheckpointRollsBackUncommitted) {
    {
        ValueLedger::Checkpoint cp(ledger_);
        ASSERT_TRUE(ledger_.Transfer(alice_, bob_, Ether(4)).ok());
        ASSERT_TRUE(ledger_.Mint(carol_, Ether(1)).ok());
        EXPECT_GT(ledger_.JournalSize(), 0u);
    }
    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(10));
    EXPECT_TRUE(ledger_.BalanceOf(bob_).IsZero());
    EXPECT_TRUE(ledger_.BalanceOf(carol_).IsZero());
    EXPECT_EQ(ledger_.TotalSupply(), Ether(10));
    EXPECT_EQ(ledger_.JournalSize(), 0u);
}

TEST_F(ValueLedgerTest, CheckpointCommitKeepsChanges) {
    {
        ValueLedger::Checkpoint cp(ledger_);
        ASSERT_TRUE(ledger_.Transfer(alice_, bob_, Ether(4)).ok());
        cp.Commit();
        EXPECT_TRUE(cp.IsCommitted());
    }
    EXPECT_EQ(ledger_.BalanceOf(bob_), Ether(4));
    EXPECT_EQ(ledger_.JournalSize(), 0u);
}

TEST_F(ValueLedgerTest, NestedCommitUndoneByOuterRollback) {
    {
        ValueLedger::Checkpoint outer(ledger_);
        {
            ValueLedger::Checkpoint inner(ledger_);
            ASSERT_TRUE(ledger_.Transfer(alice_, bob_, Ether(1)).ok());
            inner.Commit();
        }
        ASSERT_TRUE(ledger_.Transfer(alice_, carol_, Ether(1)).ok());
    }
    EXPECT_TRUE(ledger_.BalanceOf(bob_).IsZero());
    EXPECT_TRUE(ledger_.BalanceOf(carol_).IsZero());
    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(10));
}

TEST_F(ValueLedgerTest, RevertRunsRegisteredUndo) {
    int books = 0;
    EXPECT_FALSE(ledger_.InCheckpoint());
    {
        ValueLedger::Checkpoint outer(ledger_);
        EXPECT_TRUE(ledger_.InCheckpoint());
        {
            ValueLedger::Checkpoint inner(ledger_);
            books = 1;
            ledger_.OnRevert([&books]() { books = 0; });
            inner.Commit();
        }
        EXPECT_EQ(books, 1);
    }
    EXPECT_EQ(books, 0);
    EXPECT_EQ(ledger_.JournalSize(), 0u);
}

TEST_F(ValueLedgerTest, CommitDropsRegisteredUndo) {
    int runs = 0;
    ledger_.OnRevert([&runs]() { ++runs; });
    {
        ValueLedger::Checkpoint cp(ledger_);
        ledger_.OnRevert([&runs]() { ++runs; });
        cp.Commit();
    }
    EXPECT_EQ(runs, 0);
}

TEST_F(ValueLedgerTest, RejectingHookRunsUndoInReverseOrder) {
    std::vector<int> order;
    ledger_.SetReceiveHook(bob_, [&](const Address&, const Amount&) {
        ledger_.OnRevert([&order]() { order.push_back(1); });
        EXPECT_TRUE(ledger_.Transfer(alice_, carol_, Ether(1)).ok());
        ledger_.OnRevert([&order]() { order.push_back(2); });
        return false;
    });

    EXPECT_TRUE(ledger_.Transfer(alice_, bob_, Ether(1)).IsTransferFailed());
    EXPECT_EQ(order, (std::vector<int>{2, 1}));
    EXPECT_TRUE(ledger_.BalanceOf(carol_).IsZero());
    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(10));
}

// ============================================================================
// Authorization and Reentrancy
// ============================================================================

TEST(AuthContextTest, GrantAndRevoke) {
    Address caller = Address::FromHex("0x00000000000000000000000000000000000000aa");
    AuthContext auth(caller, {Capability::Treasurer, Capability::Spender});

    EXPECT_EQ(auth.Caller(), caller);
    EXPECT_TRUE(auth.Has(Capability::Treasurer));
    EXPECT_FALSE(auth.Has(Capability::FeeAdmin));
    EXPECT_TRUE(auth.HasAny({Capability::FeeAdmin, Capability::Spender}));

    auth.Revoke(Capability::Spender);
    EXPECT_FALSE(auth.Has(Capability::Spender));
    auth.Grant(Capability::StakingAdmin);
    EXPECT_TRUE(auth.Has(Capability::StakingAdmin));
    EXPECT_EQ(auth.ToString(),
              "0x00000000000000000000000000000000000000aa [Treasurer,StakingAdmin]");
}

TEST(AuthContextTest, DefaultHasNothing) {
    AuthContext auth;
    EXPECT_TRUE(auth.Caller().IsNull());
    EXPECT_EQ(auth.Mask(), 0u);
}

TEST(ReentrancyGuardTest, SecondEntryRejected) {
    bool entered = false;
    {
        ReentrancyGuard outer(entered);
        EXPECT_TRUE(outer.Acquired());
        EXPECT_TRUE(entered);
        {
            ReentrancyGuard inner(entered);
            EXPECT_FALSE(inner.Acquired());
        }
        EXPECT_TRUE(entered);
    }
    EXPECT_FALSE(entered);
}

} // namespace
} // namespace ledger
} // namespace pasifika
