// Pasifika - Treasury Ledger
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// Weighted fund accounting for platform revenue.
//
// Key features:
// - Deposits apportioned across active funds by allocation (basis points)
// - Rounding remainder credited to the Unallocated fund
// - Per-fund withdrawals and a proportional profit-sharing draw
// - Fund lifecycle: create, reconfigure, deactivate (never deleted)
// - Append-only deposit and expense logs

#ifndef PASIFIKA_TREASURY_TREASURY_H
#define PASIFIKA_TREASURY_TREASURY_H

#include <pasifika/core/status.h>
#include <pasifika/core/types.h>
#include <pasifika/core/uint256.h>
#include <pasifika/ledger/auth.h>
#include <pasifika/ledger/value_ledger.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pasifika {
namespace treasury {

// ============================================================================
// Fund Types
// ============================================================================

/// Fund identifier: SHA3-256 of the fund name
using FundId = Hash256;

/// Name of the catch-all fund that absorbs rounding and swept balances
constexpr const char* UNALLOCATED_FUND_NAME = "Unallocated";

/// Derive the identifier of a named fund
FundId MakeFundId(const std::string& name);

/**
 * A named, percentage-weighted sub-ledger.
 */
struct Fund {
    /// Derived identifier
    FundId id;

    /// Display name
    std::string name;

    /// Share of each deposit (basis points)
    BasisPoints allocationBps{0};

    /// Current balance held for this fund
    Amount balance;

    /// Inactive funds receive no deposits and hold no balance
    bool active{false};

    /// Set once the fund has been created
    bool exists{false};

    /// Creation time
    Timestamp createdAt{0};
};

/// Withdrawal audit entry
struct Expense {
    uint64_t id{0};

    /// Source fund (null for a profit-sharing draw across funds)
    FundId fund;

    Address recipient;
    Address approver;
    Amount amount;
    std::string description;
    Timestamp timestamp{0};
};

/// Deposit audit entry
struct Deposit {
    uint64_t id{0};
    Address sender;
    Amount amount;
    std::string description;
    Timestamp timestamp{0};

    /// Deposited through the fee-collector path
    bool fees{false};
};

/// Entry for a bulk allocation update
struct FundAllocation {
    FundId id;
    BasisPoints allocationBps{0};
};

// ============================================================================
// Treasury Ledger
// ============================================================================

class TreasuryLedger {
public:
    struct FundSpec {
        std::string name;
        BasisPoints allocationBps;
    };

    struct Config {
        /// Initial funds; must include Unallocated and sum to 10000
        std::vector<FundSpec> funds;

        static Config Default();
    };

    /// Throws std::invalid_argument if the initial fund table is malformed
    TreasuryLedger(ledger::ValueLedger& ledger, const Address& self,
                   const Config& config = Config::Default());

    TreasuryLedger(const TreasuryLedger&) = delete;
    TreasuryLedger& operator=(const TreasuryLedger&) = delete;

    /// Account holding the treasury's value
    const Address& GetAddress() const { return self_; }

    // ========================================================================
    // Deposits
    // ========================================================================

    /// Move `amount` from the caller into the treasury and apportion it
    Status DepositFunds(const ledger::AuthContext& auth, const Amount& amount,
                        const std::string& description);

    /// Same as DepositFunds for callers holding FeeCollector
    Status DepositFees(const ledger::AuthContext& auth, const Amount& amount);

    // ========================================================================
    // Withdrawals
    // ========================================================================

    /// Spend from a single active fund (requires Spender)
    Status Withdraw(const ledger::AuthContext& auth, const FundId& fund,
                    const Address& recipient, const Amount& amount,
                    const std::string& description);

    /**
     * Profit-sharing draw (requires ProfitSharing). Takes the whole amount
     * from Unallocated when it can; otherwise drains every active fund in
     * proportion to its share of the total balance and covers the shortfall
     * from Unallocated.
     */
    Status WithdrawFunds(const ledger::AuthContext& auth, const Address& recipient,
                         const Amount& amount);

    // ========================================================================
    // Fund Management (requires Treasurer)
    // ========================================================================

    /// Create a new active fund; Unallocated absorbs the allocation change
    Status CreateFund(const ledger::AuthContext& auth, const std::string& name,
                      BasisPoints allocationBps, FundId* id = nullptr);

    /// Rename, reweight or (de)activate a fund. A renamed fund keeps its id,
    /// which stays reserved; names are unique across funds. Deactivation
    /// sweeps the balance into Unallocated.
    Status UpdateFund(const ledger::AuthContext& auth, const FundId& id,
                      const std::string& name, BasisPoints allocationBps,
                      bool active);

    /// Replace allocations in bulk; the active sum must be exactly 10000
    Status UpdateAllFundAllocations(const ledger::AuthContext& auth,
                                    const std::vector<FundAllocation>& allocations);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<Fund> GetFundDetails(const FundId& id) const;

    /// All funds in creation order
    std::vector<Fund> GetFunds() const;

    std::vector<Expense> GetExpenses() const;
    std::vector<Deposit> GetDeposits() const;

    /// Sum of allocations over active funds
    BasisPoints GetTotalAllocation() const;

    /// Sum of all fund balances
    Amount GetTotalBalance() const;

    const FundId& GetUnallocatedFundId() const { return unallocatedId_; }

private:
    using FundMap = std::unordered_map<FundId, Fund, HashTypeHasher<FundId>>;

    Status Receive(const ledger::AuthContext& auth, const Amount& amount,
                   const std::string& description, bool fees);

    /// Apportion `amount` over `funds`
    void Apportion(FundMap& funds, const Amount& amount) const;

    /// Sum of active allocations excluding Unallocated
    BasisPoints AllocatedExcludingUnallocated(const FundMap& funds) const;

    /// Set Unallocated's allocation so the active sum is 10000
    void Renormalize(FundMap& funds);

    Amount TotalBalance(const FundMap& funds) const;

    /// True if another fund is shown as `name` or owns the id derived from it
    bool NameTaken(const FundMap& funds, const std::string& name, const FundId& except) const;

    /// Register a snapshot of this engine's books with the ledger's open
    /// checkpoint so a reverted outer operation restores them too
    void JournalState();

    ledger::ValueLedger& ledger_;
    Address self_;

    mutable std::recursive_mutex mutex_;
    bool entered_{false};

    FundMap funds_;
    std::vector<FundId> order_;
    FundId unallocatedId_;

    std::vector<Expense> expenses_;
    std::vector<Deposit> deposits_;
};

} // namespace treasury
} // namespace pasifika

#endif // PASIFIKA_TREASURY_TREASURY_H
