// Pasifika - Peer-to-Peer Transfer Engine
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// Tiered-fee value transfers between accounts.
//
// Key features:
// - Fee by sender tier (guest / member / node operator), clamped to bounds
// - Per-sender daily cap over a lazily reset 24 hour window
// - Pull payments: recipients withdraw their pending balance
// - Scheduled transfers funded into escrow at creation
// - Community collections with a single creator payout

#ifndef PASIFIKA_TRANSFER_TRANSFER_ENGINE_H
#define PASIFIKA_TRANSFER_TRANSFER_ENGINE_H

#include <pasifika/core/status.h>
#include <pasifika/core/types.h>
#include <pasifika/core/uint256.h>
#include <pasifika/ledger/auth.h>
#include <pasifika/ledger/value_ledger.h>
#include <pasifika/transfer/membership.h>
#include <pasifika/treasury/treasury.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pasifika {
namespace transfer {

// ============================================================================
// Records
// ============================================================================

/// Completed transfer (direct, batch entry or scheduled execution)
struct TransferRecord {
    uint64_t id{0};
    Address sender;
    Address recipient;
    Amount amount;
    Amount fee;
    Amount netAmount;
    std::string memo;
    Timestamp timestamp{0};

    /// Id of the scheduled transfer that produced this record, if any
    std::optional<uint64_t> scheduleId;
};

/// One recipient of a batch transfer
struct BatchEntry {
    Address recipient;
    Amount amount;
};

/**
 * Recurring transfer paid out of escrow.
 */
struct ScheduledTransfer {
    uint64_t id{0};
    Address sender;
    Address recipient;

    /// Gross amount per interval
    Amount amount;

    /// Fee per interval, paid at funding time
    Amount fee;

    /// Amount credited to the recipient per execution
    Amount netAmount;

    /// Seconds between executions
    Duration interval{0};

    /// Earliest time of the next execution
    Timestamp nextExecution{0};

    /// Executions left; 0 means indefinite
    uint32_t remainingTransfers{0};

    /// Unspent funded net amount
    Amount escrowBalance;

    bool active{false};
};

/**
 * Many-to-one fundraising pot.
 */
struct CommunityCollection {
    uint64_t id{0};
    Address creator;
    std::string purpose;
    Amount goal;

    /// Balance currently held for the collection
    Amount collected;

    /// Total paid out (admin payouts and the final payout)
    Amount paidOut;

    Timestamp deadline{0};
    Timestamp createdAt{0};

    /// Cleared by finalization
    bool active{false};
};

// ============================================================================
// Transfer Engine
// ============================================================================

class TransferEngine {
public:
    struct Config {
        BasisPoints guestFeeBps{100};
        BasisPoints memberFeeBps{50};
        BasisPoints nodeOperatorFeeBps{25};

        Amount minFee;
        Amount maxFee;

        /// Gross amount a sender may move per 24 hours; zero disables the cap
        Amount dailyLimit;

        size_t maxBatchSize{100};

        static Config Default();
    };

    TransferEngine(ledger::ValueLedger& ledger, treasury::TreasuryLedger& treasury,
                   const Address& self, const Config& config = Config::Default());

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    const Address& GetAddress() const { return self_; }

    MembershipRegistry& Membership() { return membership_; }
    const MembershipRegistry& Membership() const { return membership_; }

    /**
     * Fee for `sender` moving `amount`. Tier rate clamped to [minFee, maxFee];
     * a sender with an assigned discount pays the discounted rate unclamped.
     *
     * @return InvalidArgument if the fee would consume the whole amount
     */
    Status CalculateTransferFee(const Address& sender, const Amount& amount, Amount* fee) const;

    // ========================================================================
    // Transfers
    // ========================================================================

    /// Move `amount` from the caller; the net is credited to `recipient`'s
    /// pending balance and the fee goes to the treasury
    Status Transfer(const ledger::AuthContext& auth, const Address& recipient,
                    const Amount& amount, const std::string& memo,
                    uint64_t* transferId = nullptr);

    /// All-or-nothing transfer to several recipients
    Status BatchTransfer(const ledger::AuthContext& auth,
                         const std::vector<BatchEntry>& entries,
                         const std::string& memo,
                         std::vector<uint64_t>* transferIds = nullptr);

    /// Pay out the caller's pending balance
    Status WithdrawPending(const ledger::AuthContext& auth, Amount* withdrawn = nullptr);

    // ========================================================================
    // Scheduled Transfers
    // ========================================================================

    /**
     * Escrow `repetitions` intervals of `amount` (one interval when
     * repetitions is 0, meaning indefinite) and charge their fees up front.
     * The first execution is due one interval from now.
     */
    Status CreateScheduledTransfer(const ledger::AuthContext& auth, const Address& recipient,
                                   const Amount& amount, Duration interval,
                                   uint32_t repetitions, uint64_t* scheduleId = nullptr);

    /// Fund further intervals of an indefinite schedule (sender only)
    Status TopUpScheduledTransfer(const ledger::AuthContext& auth, uint64_t scheduleId,
                                  uint32_t intervals);

    /// Execute a due schedule; callable by any account
    Status ExecuteScheduledTransfer(const ledger::AuthContext& auth, uint64_t scheduleId);

    /// Stop a schedule and refund the escrow to the sender's pending balance
    Status CancelScheduledTransfer(const ledger::AuthContext& auth, uint64_t scheduleId);

    // ========================================================================
    // Community Collections
    // ========================================================================

    Status CreateCommunityCollection(const ledger::AuthContext& auth,
                                     const std::string& purpose, const Amount& goal,
                                     Timestamp deadline, uint64_t* collectionId = nullptr);

    Status ContributeToCollection(const ledger::AuthContext& auth, uint64_t collectionId,
                                  const Amount& amount);

    /// Close the collection and pay its balance to the creator (creator only)
    Status FinalizeCommunityCollection(const ledger::AuthContext& auth, uint64_t collectionId);

    /// Pay part of an open collection's balance to `recipient` (TransferAdmin)
    Status AdminCollectionPayout(const ledger::AuthContext& auth, uint64_t collectionId,
                                 const Address& recipient, const Amount& amount);

    // ========================================================================
    // Administration (requires TransferAdmin)
    // ========================================================================

    Status SetFeeBounds(const ledger::AuthContext& auth, const Amount& minFee,
                        const Amount& maxFee);
    Status SetDailyLimit(const ledger::AuthContext& auth, const Amount& limit);

    /// Assign a fee discount; 0 removes it
    Status SetFeeDiscount(const ledger::AuthContext& auth, const Address& account,
                          BasisPoints discountBps);

    Status SetMember(const ledger::AuthContext& auth, const Address& account, bool member);
    Status SetNodeOperator(const ledger::AuthContext& auth, const Address& account,
                           bool nodeOperator);

    // ========================================================================
    // Queries
    // ========================================================================

    Amount GetPendingWithdrawal(const Address& account) const;

    /// Gross amount sent by `account` in its current daily window
    Amount GetDailyUsage(const Address& account) const;

    std::optional<BasisPoints> GetFeeDiscount(const Address& account) const;
    std::optional<TransferRecord> GetTransferRecord(uint64_t id) const;
    std::optional<ScheduledTransfer> GetScheduledTransfer(uint64_t id) const;
    std::optional<CommunityCollection> GetCommunityCollection(uint64_t id) const;
    Config GetConfig() const;

private:
    struct DailyWindow {
        Timestamp start{0};
        Amount used;
    };

    Status FeeFor(const Address& sender, const Amount& amount, Amount* fee) const;

    /// Window for `sender` after a lazy reset at `now`
    DailyWindow CurrentWindow(const Address& sender, Timestamp now) const;

    Status CheckDailyLimit(const DailyWindow& window, const Amount& amount) const;

    /// Pull `gross` from `sender` and forward `fee` to the treasury
    Status Collect(const Address& sender, const Amount& gross, const Amount& fee);

    void CreditPending(const Address& account, const Amount& amount);
    void SetPending(const Address& account, const Amount& amount);

    /// Register a snapshot of this engine's books with the ledger's open
    /// checkpoint so a reverted outer operation restores them too
    void JournalState();

    ledger::ValueLedger& ledger_;
    treasury::TreasuryLedger& treasury_;
    Address self_;
    MembershipRegistry membership_;

    mutable std::recursive_mutex mutex_;
    bool entered_{false};

    Config config_;
    std::unordered_map<Address, BasisPoints, AddressHasher> feeDiscounts_;
    std::unordered_map<Address, DailyWindow, AddressHasher> dailyWindows_;
    std::unordered_map<Address, Amount, AddressHasher> pending_;

    std::vector<TransferRecord> records_;
    std::map<uint64_t, ScheduledTransfer> schedules_;
    std::map<uint64_t, CommunityCollection> collections_;
    uint64_t nextScheduleId_{0};
    uint64_t nextCollectionId_{0};
};

} // namespace transfer
} // namespace pasifika

#endif // PASIFIKA_TRANSFER_TRANSFER_ENGINE_H
