// Pasifika - Transfer Engine Tests
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include <gtest/gtest.h>

#include <pasifika/ledger/value_ledger.h>
#include <pasifika/transfer/transfer_engine.h>
#include <pasifika/treasury/treasury.h>
#include <pasifika/util/time.h>

#include <array>
#include <memory>
#include <stdexcept>

namespace pasifika {
namespace transfer {
namespace {

using ledger::AuthContext;
using ledger::Capability;
using util::Seconds;

// ============================================================================
// Test Fixtures
// ============================================================================

class TransferEngineTest : public ::testing::Test {
protected:
    util::ScopedMockTime clock_{1700000000};

    ledger::ValueLedger ledger_{"ETH"};
    Address treasuryAddr_ = CreateTestAddress(0xA0);
    Address engineAddr_ = CreateTestAddress(0xA2);
    treasury::TreasuryLedger treasury_{ledger_, treasuryAddr_};
    std::unique_ptr<TransferEngine> engine_;

    Address alice_ = CreateTestAddress(0x01);
    Address bob_ = CreateTestAddress(0x02);
    Address carol_ = CreateTestAddress(0x03);

    AuthContext aliceAuth_{alice_};
    AuthContext bobAuth_{bob_};
    AuthContext carolAuth_{carol_};
    AuthContext admin_{CreateTestAddress(0x10), {Capability::TransferAdmin}};

    static Address CreateTestAddress(Byte value) {
        std::array<Byte, 20> data{};
        data.fill(value);
        return Address(data);
    }

    static Amount Milli(uint64_t n) {
        return Amount(n) * Amount(1000000000000000ULL);
    }

    static Amount Micro(uint64_t n) {
        return Amount(n) * Amount(1000000000000ULL);
    }

    void SetUp() override {
        engine_ = std::make_unique<TransferEngine>(ledger_, treasury_, engineAddr_);
        ASSERT_TRUE(ledger_.Mint(alice_, Ether(200)).ok());
        ASSERT_TRUE(ledger_.Mint(bob_, Ether(10)).ok());
    }

    Amount Fee(const Address& sender, const Amount& amount) {
        Amount fee;
        EXPECT_TRUE(engine_->CalculateTransferFee(sender, amount, &fee).ok());
        return fee;
    }
};

// ============================================================================
// Fees
// ============================================================================

TEST_F(TransferEngineTest, FeeFollowsSenderTier) {
    EXPECT_EQ(Fee(alice_, Ether(1)), Milli(10));

    ASSERT_TRUE(engine_->SetMember(admin_, alice_, true).ok());
    EXPECT_EQ(Fee(alice_, Ether(1)), Milli(5));

    ASSERT_TRUE(engine_->SetNodeOperator(admin_, alice_, true).ok());
    EXPECT_EQ(Fee(alice_, Ether(1)), Micro(2500));
    EXPECT_EQ(engine_->Membership().GetTier(alice_), MemberTier::NodeOperator);

    ASSERT_TRUE(engine_->SetNodeOperator(admin_, alice_, false).ok());
    EXPECT_EQ(engine_->Membership().GetTier(alice_), MemberTier::Member);
}

TEST_F(TransferEngineTest, FeeClampedToBounds) {
    EXPECT_EQ(Fee(alice_, Milli(1)), Micro(100));
    EXPECT_EQ(Fee(alice_, Ether(20)), Milli(100));

    Amount fee;
    EXPECT_TRUE(engine_->CalculateTransferFee(alice_, Micro(100), &fee).IsInvalidArgument());
}

TEST_F(TransferEngineTest, DiscountedFeeIsNotClamped) {
    ASSERT_TRUE(engine_->SetFeeDiscount(admin_, alice_, 5000).ok());
    EXPECT_EQ(engine_->GetFeeDiscount(alice_), BasisPoints(5000));
    EXPECT_EQ(Fee(alice_, Ether(1)), Milli(5));
    EXPECT_EQ(Fee(alice_, Milli(1)), Micro(5));
    EXPECT_EQ(Fee(alice_, Ether(20)), Milli(100));
    EXPECT_EQ(Fee(alice_, Ether(40)), Milli(200));

    ASSERT_TRUE(engine_->SetFeeDiscount(admin_, alice_, 0).ok());
    EXPECT_FALSE(engine_->GetFeeDiscount(alice_).has_value());
    EXPECT_TRUE(engine_->SetFeeDiscount(admin_, alice_, 10001).IsInvalidArgument());
}

TEST_F(TransferEngineTest, ConstructorRejectsInvertedBounds) {
    TransferEngine::Config config = TransferEngine::Config::Default();
    config.minFee = Ether(1);
    config.maxFee = Milli(1);
    EXPECT_THROW(TransferEngine(ledger_, treasury_, CreateTestAddress(0xB0), config),
                 std::invalid_argument);
}

// ============================================================================
// Direct Transfers
// ============================================================================

TEST_F(TransferEngineTest, TransferCreditsPendingAndTreasury) {
    uint64_t id = 99;
    ASSERT_TRUE(engine_->Transfer(aliceAuth_, bob_, Ether(1), "rent", &id).ok());
    EXPECT_EQ(id, 0u);

    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(199));
    EXPECT_EQ(engine_->GetPendingWithdrawal(bob_), Milli(990));
    EXPECT_EQ(ledger_.BalanceOf(engineAddr_), Milli(990));
    EXPECT_EQ(treasury_.GetTotalBalance(), Milli(10));
    EXPECT_EQ(engine_->GetDailyUsage(alice_), Ether(1));

    auto record = engine_->GetTransferRecord(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->memo, "rent");
    EXPECT_EQ(record->fee, Milli(10));
    EXPECT_EQ(record->netAmount, Milli(990));
    EXPECT_FALSE(record->scheduleId.has_value());
}

TEST_F(TransferEngineTest, TransferValidation) {
    EXPECT_TRUE(engine_->Transfer(aliceAuth_, Address(), Ether(1), "").IsInvalidArgument());
    EXPECT_TRUE(engine_->Transfer(aliceAuth_, bob_, Amount(), "").IsInvalidArgument());
    EXPECT_TRUE(engine_->Transfer(carolAuth_, bob_, Ether(1), "").IsInsufficientFunds());
    EXPECT_FALSE(engine_->GetTransferRecord(0).has_value());
}

TEST_F(TransferEngineTest, DailyLimitResetsAfterWindow) {
    ASSERT_TRUE(engine_->Transfer(aliceAuth_, bob_, Ether(60), "").ok());
    EXPECT_TRUE(engine_->Transfer(aliceAuth_, bob_, Ether(50), "").IsFailedPrecondition());
    EXPECT_EQ(engine_->GetDailyUsage(alice_), Ether(60));

    clock_.Advance(Seconds(SECONDS_PER_DAY - 1));
    EXPECT_TRUE(engine_->Transfer(aliceAuth_, bob_, Ether(50), "").IsFailedPrecondition());

    clock_.Advance(Seconds(1));
    EXPECT_TRUE(engine_->GetDailyUsage(alice_).IsZero());
    EXPECT_TRUE(engine_->Transfer(aliceAuth_, bob_, Ether(50), "").ok());
    EXPECT_EQ(engine_->GetDailyUsage(alice_), Ether(50));
}

TEST_F(TransferEngineTest, ZeroDailyLimitDisablesCap) {
    ASSERT_TRUE(engine_->SetDailyLimit(admin_, Amount()).ok());
    EXPECT_TRUE(engine_->Transfer(aliceAuth_, bob_, Ether(150), "").ok());
}

TEST_F(TransferEngineTest, FailedCollectionRestoresState) {
    ledger_.SetReceiveHook(engineAddr_, [](const Address&, const Amount&) { return false; });

    EXPECT_TRUE(engine_->Transfer(aliceAuth_, bob_, Ether(1), "").IsTransferFailed());
    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(200));
    EXPECT_TRUE(engine_->GetPendingWithdrawal(bob_).IsZero());
    EXPECT_TRUE(engine_->GetDailyUsage(alice_).IsZero());
    EXPECT_FALSE(engine_->GetTransferRecord(0).has_value());
    EXPECT_TRUE(treasury_.GetTotalBalance().IsZero());
}

// ============================================================================
// Batch Transfers
// ============================================================================

TEST_F(TransferEngineTest, BatchTransfer) {
    std::vector<uint64_t> ids;
    ASSERT_TRUE(engine_->BatchTransfer(aliceAuth_, {{bob_, Ether(1)}, {carol_, Ether(2)}},
                                       "payroll", &ids).ok());
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], 0u);
    EXPECT_EQ(ids[1], 1u);

    EXPECT_EQ(engine_->GetPendingWithdrawal(bob_), Milli(990));
    EXPECT_EQ(engine_->GetPendingWithdrawal(carol_), Milli(1980));
    EXPECT_EQ(treasury_.GetTotalBalance(), Milli(30));
    EXPECT_EQ(engine_->GetDailyUsage(alice_), Ether(3));
    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(197));
}

TEST_F(TransferEngineTest, BatchIsAllOrNothing) {
    EXPECT_TRUE(engine_->BatchTransfer(aliceAuth_, {}, "").IsInvalidArgument());
    EXPECT_TRUE(engine_->BatchTransfer(aliceAuth_, {{bob_, Ether(1)}, {carol_, Amount()}}, "")
                    .IsInvalidArgument());
    EXPECT_TRUE(engine_->BatchTransfer(aliceAuth_, {{bob_, Ether(1)}, {Address(), Ether(1)}}, "")
                    .IsInvalidArgument());
    EXPECT_TRUE(engine_->BatchTransfer(bobAuth_, {{alice_, Ether(6)}, {carol_, Ether(6)}}, "")
                    .IsInsufficientFunds());

    EXPECT_TRUE(engine_->GetPendingWithdrawal(bob_).IsZero());
    EXPECT_TRUE(engine_->GetPendingWithdrawal(alice_).IsZero());
    EXPECT_FALSE(engine_->GetTransferRecord(0).has_value());
}

TEST_F(TransferEngineTest, BatchSizeIsBounded) {
    std::vector<BatchEntry> entries(engine_->GetConfig().maxBatchSize + 1,
                                    BatchEntry{bob_, Milli(10)});
    EXPECT_TRUE(engine_->BatchTransfer(aliceAuth_, entries, "").IsInvalidArgument());
    entries.pop_back();
    EXPECT_TRUE(engine_->BatchTransfer(aliceAuth_, entries, "").ok());
}

// ============================================================================
// Pending Withdrawals
// ============================================================================

TEST_F(TransferEngineTest, WithdrawPending) {
    ASSERT_TRUE(engine_->Transfer(aliceAuth_, carol_, Ether(1), "").ok());

    Amount withdrawn;
    ASSERT_TRUE(engine_->WithdrawPending(carolAuth_, &withdrawn).ok());
    EXPECT_EQ(withdrawn, Milli(990));
    EXPECT_EQ(ledger_.BalanceOf(carol_), Milli(990));
    EXPECT_TRUE(engine_->GetPendingWithdrawal(carol_).IsZero());
    EXPECT_TRUE(ledger_.BalanceOf(engineAddr_).IsZero());

    EXPECT_TRUE(engine_->WithdrawPending(carolAuth_).IsFailedPrecondition());
}

TEST_F(TransferEngineTest, RejectedWithdrawalKeepsPending) {
    ASSERT_TRUE(engine_->Transfer(aliceAuth_, carol_, Ether(1), "").ok());
    ledger_.SetReceiveHook(carol_, [](const Address&, const Amount&) { return false; });

    EXPECT_TRUE(engine_->WithdrawPending(carolAuth_).IsTransferFailed());
    EXPECT_EQ(engine_->GetPendingWithdrawal(carol_), Milli(990));
}

TEST_F(TransferEngineTest, RejectedWithdrawalUndoesHookDeposit) {
    ASSERT_TRUE(engine_->Transfer(aliceAuth_, bob_, Ether(1), "").ok());
    ASSERT_EQ(treasury_.GetTotalBalance(), Milli(10));

    // Bob forwards the withdrawal to the treasury, then rejects it
    Status inner;
    ledger_.SetReceiveHook(bob_, [&](const Address&, const Amount& amount) {
        inner = treasury_.DepositFunds(bobAuth_, amount, "forward");
        return false;
    });

    EXPECT_TRUE(engine_->WithdrawPending(bobAuth_).IsTransferFailed());
    EXPECT_TRUE(inner.ok());

    EXPECT_EQ(treasury_.GetTotalBalance(), Milli(10));
    EXPECT_EQ(ledger_.BalanceOf(treasuryAddr_), treasury_.GetTotalBalance());
    EXPECT_EQ(treasury_.GetDeposits().size(), 1u);
    EXPECT_EQ(ledger_.BalanceOf(bob_), Ether(10));
    EXPECT_EQ(engine_->GetPendingWithdrawal(bob_), Milli(990));
    EXPECT_EQ(ledger_.BalanceOf(engineAddr_), Milli(990));
}

TEST_F(TransferEngineTest, RejectedHookUndoesNestedTransfer) {
    // Carol's hook books a transfer through the engine, then rejects
    Status inner;
    ledger_.SetReceiveHook(carol_, [&](const Address&, const Amount&) {
        inner = engine_->Transfer(bobAuth_, alice_, Ether(1), "nested");
        return false;
    });

    EXPECT_TRUE(ledger_.Transfer(alice_, carol_, Ether(1)).IsTransferFailed());
    EXPECT_TRUE(inner.ok());

    EXPECT_FALSE(engine_->GetTransferRecord(0).has_value());
    EXPECT_TRUE(engine_->GetPendingWithdrawal(alice_).IsZero());
    EXPECT_TRUE(engine_->GetDailyUsage(bob_).IsZero());
    EXPECT_TRUE(treasury_.GetTotalBalance().IsZero());
    EXPECT_TRUE(treasury_.GetDeposits().empty());
    EXPECT_EQ(ledger_.BalanceOf(bob_), Ether(10));
}

TEST_F(TransferEngineTest, WithdrawHookCannotReenter) {
    ASSERT_TRUE(engine_->Transfer(aliceAuth_, carol_, Ether(1), "").ok());

    Status inner;
    ledger_.SetReceiveHook(carol_, [&](const Address&, const Amount&) {
        inner = engine_->WithdrawPending(carolAuth_);
        return true;
    });

    ASSERT_TRUE(engine_->WithdrawPending(carolAuth_).ok());
    EXPECT_TRUE(inner.IsReentrancy());
    EXPECT_EQ(ledger_.BalanceOf(carol_), Milli(990));
}

// ============================================================================
// Scheduled Transfers
// ============================================================================

TEST_F(TransferEngineTest, ScheduledTransferRunsToCompletion) {
    uint64_t id;
    ASSERT_TRUE(engine_->CreateScheduledTransfer(aliceAuth_, bob_, Ether(1), Days(1), 3, &id)
                    .ok());
    EXPECT_EQ(ledger_.BalanceOf(alice_), Ether(197));
    EXPECT_EQ(treasury_.GetTotalBalance(), Milli(30));

    auto schedule = engine_->GetScheduledTransfer(id);
    ASSERT_TRUE(schedule.has_value());
    EXPECT_EQ(schedule->escrowBalance, Milli(2970));
    EXPECT_EQ(schedule->nextExecution, 1700000000 + Days(1));

    EXPECT_TRUE(engine_->ExecuteScheduledTransfer(carolAuth_, id).IsFailedPrecondition());

    for (int i = 0; i < 3; ++i) {
        clock_.Advance(Seconds(Days(1)));
        ASSERT_TRUE(engine_->ExecuteScheduledTransfer(carolAuth_, id).ok());
    }

    schedule = engine_->GetScheduledTransfer(id);
    EXPECT_FALSE(schedule->active);
    EXPECT_EQ(schedule->remainingTransfers, 0u);
    EXPECT_TRUE(schedule->escrowBalance.IsZero());
    EXPECT_EQ(engine_->GetPendingWithdrawal(bob_), Milli(2970));

    auto record = engine_->GetTransferRecord(0);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->scheduleId, id);
    EXPECT_EQ(record->memo, "scheduled");

    clock_.Advance(Seconds(Days(1)));
    EXPECT_TRUE(engine_->ExecuteScheduledTransfer(carolAuth_, id).IsFailedPrecondition());
}

TEST_F(TransferEngineTest, ScheduledTransferNotDueTwice) {
    uint64_t id;
    ASSERT_TRUE(engine_->CreateScheduledTransfer(aliceAuth_, bob_, Ether(1), Days(1), 3, &id)
                    .ok());

    auto expectUnchangedByEarlyCall = [&]() {
        auto before = engine_->GetScheduledTransfer(id);
        ASSERT_TRUE(before.has_value());
        Amount pending = engine_->GetPendingWithdrawal(bob_);

        EXPECT_TRUE(engine_->ExecuteScheduledTransfer(carolAuth_, id).IsFailedPrecondition());

        auto after = engine_->GetScheduledTransfer(id);
        ASSERT_TRUE(after.has_value());
        EXPECT_EQ(after->remainingTransfers, before->remainingTransfers);
        EXPECT_EQ(after->nextExecution, before->nextExecution);
        EXPECT_EQ(after->escrowBalance, before->escrowBalance);
        EXPECT_EQ(after->active, before->active);
        EXPECT_EQ(engine_->GetPendingWithdrawal(bob_), pending);
    };

    expectUnchangedByEarlyCall();
    EXPECT_TRUE(engine_->GetPendingWithdrawal(bob_).IsZero());

    clock_.Advance(Seconds(Days(5)));
    ASSERT_TRUE(engine_->ExecuteScheduledTransfer(carolAuth_, id).ok());
    EXPECT_EQ(engine_->GetScheduledTransfer(id)->remainingTransfers, 2u);
    EXPECT_EQ(engine_->GetScheduledTransfer(id)->nextExecution, 1700000000 + Days(6));

    expectUnchangedByEarlyCall();
    EXPECT_EQ(engine_->GetPendingWithdrawal(bob_), Milli(990));
}

TEST_F(TransferEngineTest, IndefiniteScheduleNeedsTopUp) {
    uint64_t id;
    ASSERT_TRUE(engine_->CreateScheduledTransfer(aliceAuth_, bob_, Ether(1), Days(7), 0, &id)
                    .ok());
    EXPECT_EQ(engine_->GetScheduledTransfer(id)->escrowBalance, Milli(990));

    clock_.Advance(Seconds(Days(7)));
    ASSERT_TRUE(engine_->ExecuteScheduledTransfer(carolAuth_, id).ok());
    EXPECT_TRUE(engine_->GetScheduledTransfer(id)->active);

    clock_.Advance(Seconds(Days(7)));
    EXPECT_TRUE(engine_->ExecuteScheduledTransfer(carolAuth_, id).IsFailedPrecondition());

    EXPECT_TRUE(engine_->TopUpScheduledTransfer(bobAuth_, id, 2).IsUnauthorized());
    EXPECT_TRUE(engine_->TopUpScheduledTransfer(aliceAuth_, id, 0).IsInvalidArgument());
    ASSERT_TRUE(engine_->TopUpScheduledTransfer(aliceAuth_, id, 2).ok());
    EXPECT_EQ(engine_->GetScheduledTransfer(id)->escrowBalance, Milli(1980));

    ASSERT_TRUE(engine_->ExecuteScheduledTransfer(carolAuth_, id).ok());
    EXPECT_EQ(engine_->GetPendingWithdrawal(bob_), Milli(1980));
}

TEST_F(TransferEngineTest, FiniteScheduleCannotBeToppedUp) {
    uint64_t id;
    ASSERT_TRUE(engine_->CreateScheduledTransfer(aliceAuth_, bob_, Ether(1), Days(1), 2, &id)
                    .ok());
    EXPECT_TRUE(engine_->TopUpScheduledTransfer(aliceAuth_, id, 1).IsFailedPrecondition());
    EXPECT_TRUE(engine_->TopUpScheduledTransfer(aliceAuth_, 42, 1).IsNotFound());
}

TEST_F(TransferEngineTest, CancelRefundsEscrow) {
    uint64_t id;
    ASSERT_TRUE(engine_->CreateScheduledTransfer(aliceAuth_, bob_, Ether(1), Days(1), 3, &id)
                    .ok());
    clock_.Advance(Seconds(Days(1)));
    ASSERT_TRUE(engine_->ExecuteScheduledTransfer(carolAuth_, id).ok());

    EXPECT_TRUE(engine_->CancelScheduledTransfer(carolAuth_, id).IsUnauthorized());
    ASSERT_TRUE(engine_->CancelScheduledTransfer(aliceAuth_, id).ok());

    EXPECT_EQ(engine_->GetPendingWithdrawal(alice_), Milli(1980));
    EXPECT_FALSE(engine_->GetScheduledTransfer(id)->active);
    EXPECT_TRUE(engine_->CancelScheduledTransfer(aliceAuth_, id).IsFailedPrecondition());
}

TEST_F(TransferEngineTest, AdminCanCancelSchedule) {
    uint64_t id;
    ASSERT_TRUE(engine_->CreateScheduledTransfer(aliceAuth_, bob_, Ether(1), Days(1), 1, &id)
                    .ok());
    ASSERT_TRUE(engine_->CancelScheduledTransfer(admin_, id).ok());
    EXPECT_EQ(engine_->GetPendingWithdrawal(alice_), Milli(990));
}

TEST_F(TransferEngineTest, ScheduleValidation) {
    EXPECT_TRUE(engine_->CreateScheduledTransfer(aliceAuth_, bob_, Ether(1), 0, 1)
                    .IsInvalidArgument());
    EXPECT_TRUE(engine_->CreateScheduledTransfer(aliceAuth_, Address(), Ether(1), Days(1), 1)
                    .IsInvalidArgument());
    EXPECT_TRUE(engine_->CreateScheduledTransfer(bobAuth_, alice_, Ether(4), Days(1), 3)
                    .IsInsufficientFunds());
    EXPECT_TRUE(engine_->CreateScheduledTransfer(aliceAuth_, bob_, Ether(40), Days(1), 3)
                    .IsFailedPrecondition());
    EXPECT_FALSE(engine_->GetScheduledTransfer(0).has_value());
}

TEST_F(TransferEngineTest, OversizedAmountsAreRejected) {
    Amount huge = Amount::Max() / Amount(2) + Amount(1);
    EXPECT_TRUE(engine_->CreateScheduledTransfer(aliceAuth_, bob_, huge, Days(1), 2)
                    .IsInvalidArgument());
    EXPECT_TRUE(engine_->BatchTransfer(aliceAuth_, {{bob_, huge}, {carol_, huge}}, "")
                    .IsInvalidArgument());
    EXPECT_FALSE(engine_->GetScheduledTransfer(0).has_value());
    EXPECT_FALSE(engine_->GetTransferRecord(0).has_value());

    // Funding further intervals of a very large indefinite schedule
    ASSERT_TRUE(engine_->SetDailyLimit(admin_, Amount()).ok());
    Amount quarter = Amount::Max() / Amount(4);
    ASSERT_TRUE(ledger_.Mint(carol_, quarter).ok());
    uint64_t id;
    ASSERT_TRUE(engine_->CreateScheduledTransfer(carolAuth_, bob_, quarter, Days(1), 0, &id)
                    .ok());
    EXPECT_TRUE(engine_->TopUpScheduledTransfer(carolAuth_, id, 5).IsInvalidArgument());
    EXPECT_EQ(engine_->GetScheduledTransfer(id)->escrowBalance, quarter - Milli(100));
    EXPECT_TRUE(ledger_.BalanceOf(carol_).IsZero());
}

// ============================================================================
// Community Collections
// ============================================================================

TEST_F(TransferEngineTest, CollectionLifecycle) {
    uint64_t id;
    ASSERT_TRUE(engine_->CreateCommunityCollection(carolAuth_, "new canoe", Ether(5),
                                                   1700000000 + Days(7), &id).ok());
    ASSERT_TRUE(engine_->ContributeToCollection(aliceAuth_, id, Ether(1)).ok());
    ASSERT_TRUE(engine_->ContributeToCollection(bobAuth_, id, Ether(2)).ok());

    auto collection = engine_->GetCommunityCollection(id);
    ASSERT_TRUE(collection.has_value());
    EXPECT_EQ(collection->collected, Ether(3));
    EXPECT_EQ(collection->creator, carol_);

    EXPECT_TRUE(engine_->FinalizeCommunityCollection(aliceAuth_, id).IsUnauthorized());
    ASSERT_TRUE(engine_->FinalizeCommunityCollection(carolAuth_, id).ok());

    collection = engine_->GetCommunityCollection(id);
    EXPECT_FALSE(collection->active);
    EXPECT_TRUE(collection->collected.IsZero());
    EXPECT_EQ(collection->paidOut, Ether(3));
    EXPECT_EQ(ledger_.BalanceOf(carol_), Ether(3));

    EXPECT_TRUE(engine_->ContributeToCollection(aliceAuth_, id, Ether(1)).IsFailedPrecondition());
    EXPECT_TRUE(engine_->FinalizeCommunityCollection(carolAuth_, id).IsFailedPrecondition());
}

TEST_F(TransferEngineTest, CollectionClosesAtDeadline) {
    uint64_t id;
    ASSERT_TRUE(engine_->CreateCommunityCollection(carolAuth_, "fale repairs", Ether(5),
                                                   1700000000 + Days(1), &id).ok());
    clock_.Advance(Seconds(Days(1)));
    ASSERT_TRUE(engine_->ContributeToCollection(aliceAuth_, id, Ether(1)).ok());

    clock_.Advance(Seconds(1));
    EXPECT_TRUE(engine_->ContributeToCollection(aliceAuth_, id, Ether(1)).IsFailedPrecondition());
    EXPECT_EQ(engine_->GetCommunityCollection(id)->collected, Ether(1));
}

TEST_F(TransferEngineTest, CollectionValidation) {
    EXPECT_TRUE(engine_->CreateCommunityCollection(carolAuth_, "", Ether(1), 1700000000 + 10)
                    .IsInvalidArgument());
    EXPECT_TRUE(engine_->CreateCommunityCollection(carolAuth_, "x", Amount(), 1700000000 + 10)
                    .IsInvalidArgument());
    EXPECT_TRUE(engine_->CreateCommunityCollection(carolAuth_, "x", Ether(1), 1700000000)
                    .IsInvalidArgument());
    EXPECT_TRUE(engine_->ContributeToCollection(aliceAuth_, 7, Ether(1)).IsNotFound());

    uint64_t id;
    ASSERT_TRUE(engine_->CreateCommunityCollection(carolAuth_, "x", Ether(1), 1700000000 + 10,
                                                   &id).ok());
    ASSERT_TRUE(engine_->ContributeToCollection(aliceAuth_, id, Ether(1)).ok());
    EXPECT_TRUE(engine_->ContributeToCollection(aliceAuth_, id, Amount::Max())
                    .IsInvalidArgument());
    EXPECT_EQ(engine_->GetCommunityCollection(id)->collected, Ether(1));
}

TEST_F(TransferEngineTest, AdminCollectionPayout) {
    uint64_t id;
    ASSERT_TRUE(engine_->CreateCommunityCollection(carolAuth_, "school fees", Ether(5),
                                                   1700000000 + Days(7), &id).ok());
    ASSERT_TRUE(engine_->ContributeToCollection(aliceAuth_, id, Ether(2)).ok());

    Address school = CreateTestAddress(0x20);
    EXPECT_TRUE(engine_->AdminCollectionPayout(carolAuth_, id, school, Ether(1)).IsUnauthorized());
    EXPECT_TRUE(engine_->AdminCollectionPayout(admin_, id, school, Ether(3))
                    .IsInsufficientFunds());
    ASSERT_TRUE(engine_->AdminCollectionPayout(admin_, id, school, Milli(500)).ok());

    auto collection = engine_->GetCommunityCollection(id);
    EXPECT_EQ(collection->collected, Milli(1500));
    EXPECT_EQ(collection->paidOut, Milli(500));
    EXPECT_EQ(ledger_.BalanceOf(school), Milli(500));

    ASSERT_TRUE(engine_->FinalizeCommunityCollection(carolAuth_, id).ok());
    EXPECT_EQ(ledger_.BalanceOf(carol_), Milli(1500));
    EXPECT_EQ(engine_->GetCommunityCollection(id)->paidOut, Ether(2));
}

// ============================================================================
// Administration
// ============================================================================

TEST_F(TransferEngineTest, AdminSettersRequireCapability) {
    EXPECT_TRUE(engine_->SetFeeBounds(aliceAuth_, Amount(), Ether(1)).IsUnauthorized());
    EXPECT_TRUE(engine_->SetDailyLimit(aliceAuth_, Ether(1)).IsUnauthorized());
    EXPECT_TRUE(engine_->SetFeeDiscount(aliceAuth_, alice_, 100).IsUnauthorized());
    EXPECT_TRUE(engine_->SetMember(aliceAuth_, alice_, true).IsUnauthorized());
    EXPECT_TRUE(engine_->SetNodeOperator(aliceAuth_, alice_, true).IsUnauthorized());
}

TEST_F(TransferEngineTest, SetFeeBounds) {
    EXPECT_TRUE(engine_->SetFeeBounds(admin_, Ether(1), Milli(1)).IsInvalidArgument());
    ASSERT_TRUE(engine_->SetFeeBounds(admin_, Milli(1), Milli(2)).ok());
    EXPECT_EQ(Fee(alice_, Ether(1)), Milli(2));
    EXPECT_EQ(engine_->GetConfig().minFee, Milli(1));
}

} // namespace
} // namespace transfer
} // namespace pasifika
