// Pasifika - Treasury Ledger Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/treasury/treasury.h"
#include "pasifika/crypto/hash.h"
#include "pasifika/ledger/reentrancy.h"
#include "pasifika/util/logging.h"
#include "pasifika/util/time.h"

#include <algorithm>
#include <stdexcept>

namespace pasifika {
namespace treasury {

using ledger::AuthContext;
using ledger::Capability;
using ledger::ReentrancyGuard;

FundId MakeFundId(const std::string& name) {
    return SHA3Hash(name);
}

TreasuryLedger::Config TreasuryLedger::Config::Default() {
    Config config;
    config.funds = {
        {"Development", 3000},
        {"Community", 3000},
        {"Operations", 2000},
        {"Reserve", 1000},
        {UNALLOCATED_FUND_NAME, 1000},
    };
    return config;
}

TreasuryLedger::TreasuryLedger(ledger::ValueLedger& ledger, const Address& self,
                               const Config& config)
    : ledger_(ledger)
    , self_(self)
    , unallocatedId_(MakeFundId(UNALLOCATED_FUND_NAME)) {
    if (self_.IsNull()) {
        throw std::invalid_argument("treasury address is null");
    }

    uint32_t total = 0;
    Timestamp now = util::GetTime();
    for (const auto& seed : config.funds) {
        FundId id = MakeFundId(seed.name);
        if (seed.name.empty() || funds_.count(id)) {
            throw std::invalid_argument("duplicate or empty fund name: " + seed.name);
        }
        Fund fund;
        fund.id = id;
        fund.name = seed.name;
        fund.allocationBps = seed.allocationBps;
        fund.active = true;
        fund.exists = true;
        fund.createdAt = now;
        funds_.emplace(id, fund);
        order_.push_back(id);
        total += seed.allocationBps;
    }

    if (!funds_.count(unallocatedId_)) {
        throw std::invalid_argument("fund table lacks Unallocated");
    }
    if (total != BPS_DENOMINATOR) {
        throw std::invalid_argument("fund allocations must sum to 10000 bps");
    }
}

// ============================================================================
// Internal Helpers
// ============================================================================

void TreasuryLedger::Apportion(FundMap& funds, const Amount& amount) const {
    Amount distributed;
    for (const auto& id : order_) {
        Fund& fund = funds.at(id);
        if (!fund.active || id == unallocatedId_) {
            continue;
        }
        Amount share = ApplyBps(amount, fund.allocationBps);
        fund.balance += share;
        distributed += share;
    }
    // Unallocated receives its own share plus every rounding remainder
    funds.at(unallocatedId_).balance += amount - distributed;
}

BasisPoints TreasuryLedger::AllocatedExcludingUnallocated(const FundMap& funds) const {
    BasisPoints total = 0;
    for (const auto& [id, fund] : funds) {
        if (fund.active && id != unallocatedId_) {
            total += fund.allocationBps;
        }
    }
    return total;
}

void TreasuryLedger::Renormalize(FundMap& funds) {
    funds.at(unallocatedId_).allocationBps =
        BPS_DENOMINATOR - AllocatedExcludingUnallocated(funds);
}

bool TreasuryLedger::NameTaken(const FundMap& funds, const std::string& name,
                               const FundId& except) const {
    auto owner = funds.find(MakeFundId(name));
    if (owner != funds.end() && owner->second.exists && owner->first != except) {
        return true;
    }
    for (const auto& [id, fund] : funds) {
        if (id != except && fund.exists && fund.name == name) {
            return true;
        }
    }
    return false;
}

Amount TreasuryLedger::TotalBalance(const FundMap& funds) const {
    Amount total;
    for (const auto& [id, fund] : funds) {
        total += fund.balance;
    }
    return total;
}

void TreasuryLedger::JournalState() {
    if (!ledger_.InCheckpoint()) {
        return;
    }
    ledger_.OnRevert([this, funds = funds_, order = order_,
                      expenses = expenses_.size(), deposits = deposits_.size()]() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        funds_ = funds;
        order_ = order;
        expenses_.resize(expenses);
        deposits_.resize(deposits);
    });
}

// ============================================================================
// Deposits
// ============================================================================

Status TreasuryLedger::Receive(const AuthContext& auth, const Amount& amount,
                               const std::string& description, bool fees) {
    if (amount.IsZero()) {
        return Status::InvalidArgument("deposit amount is zero");
    }
    if (auth.Caller().IsNull()) {
        return Status::InvalidArgument("sender is the zero address");
    }

    FundMap updated = funds_;
    Apportion(updated, amount);

    Deposit entry;
    entry.id = deposits_.size();
    entry.sender = auth.Caller();
    entry.amount = amount;
    entry.description = description;
    entry.timestamp = util::GetTime();
    entry.fees = fees;

    FundMap previous = std::move(funds_);
    funds_ = std::move(updated);
    deposits_.push_back(entry);

    Status status = ledger_.Transfer(auth.Caller(), self_, amount);
    if (!status.ok()) {
        funds_ = std::move(previous);
        deposits_.pop_back();
        LOG_DEBUG(util::LogCategory::TREASURY) << "Deposit from " << auth.Caller().ToString()
                                               << " failed: " << status;
        return status;
    }

    LOG_INFO(util::LogCategory::TREASURY) << (fees ? "Fee deposit " : "Deposit ")
                                          << FormatEther(amount) << " from "
                                          << auth.Caller().ToString();
    return Status::Ok();
}

Status TreasuryLedger::DepositFunds(const AuthContext& auth, const Amount& amount,
                                    const std::string& description) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();
    return Receive(auth, amount, description, false);
}

Status TreasuryLedger::DepositFees(const AuthContext& auth, const Amount& amount) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();
    if (!auth.Has(Capability::FeeCollector)) {
        return Status::Unauthorized("fee collector capability required");
    }
    return Receive(auth, amount, "fees", true);
}

// ============================================================================
// Withdrawals
// ============================================================================

Status TreasuryLedger::Withdraw(const AuthContext& auth, const FundId& fundId,
                                const Address& recipient, const Amount& amount,
                                const std::string& description) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    if (!auth.Has(Capability::Spender)) {
        return Status::Unauthorized("spender capability required");
    }
    if (recipient.IsNull()) {
        return Status::InvalidArgument("recipient is the zero address");
    }
    if (amount.IsZero()) {
        return Status::InvalidArgument("withdraw amount is zero");
    }

    auto it = funds_.find(fundId);
    if (it == funds_.end() || !it->second.exists) {
        return Status::NotFound("fund does not exist");
    }
    Fund& fund = it->second;
    if (!fund.active) {
        return Status::FailedPrecondition("fund is inactive");
    }
    if (fund.balance < amount) {
        return Status::InsufficientFunds("fund balance too low");
    }

    Expense expense;
    expense.id = expenses_.size();
    expense.fund = fundId;
    expense.recipient = recipient;
    expense.approver = auth.Caller();
    expense.amount = amount;
    expense.description = description;
    expense.timestamp = util::GetTime();

    fund.balance -= amount;
    expenses_.push_back(expense);

    Status status = ledger_.Transfer(self_, recipient, amount);
    if (!status.ok()) {
        // Hooks cannot re-enter, so `fund` still refers into funds_
        fund.balance += amount;
        expenses_.pop_back();
        return status;
    }

    LOG_INFO(util::LogCategory::TREASURY) << "Withdraw " << FormatEther(amount)
                                          << " from " << fund.name << " to "
                                          << recipient.ToString();
    return Status::Ok();
}

Status TreasuryLedger::WithdrawFunds(const AuthContext& auth, const Address& recipient,
                                     const Amount& amount) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    if (!auth.Has(Capability::ProfitSharing)) {
        return Status::Unauthorized("profit sharing capability required");
    }
    if (recipient.IsNull()) {
        return Status::InvalidArgument("recipient is the zero address");
    }
    if (amount.IsZero()) {
        return Status::InvalidArgument("withdraw amount is zero");
    }

    Amount total = TotalBalance(funds_);
    if (total < amount) {
        return Status::InsufficientFunds("treasury balance too low");
    }

    FundMap updated = funds_;
    Fund& unallocated = updated.at(unallocatedId_);

    if (unallocated.balance >= amount) {
        unallocated.balance -= amount;
    } else {
        Amount remaining = amount;
        for (const auto& id : order_) {
            Fund& fund = updated.at(id);
            if (!fund.active || id == unallocatedId_ || fund.balance.IsZero()) {
                continue;
            }
            Amount take = Uint256::MulDiv(fund.balance, amount, total);
            take = std::min(take, fund.balance);
            take = std::min(take, remaining);
            fund.balance -= take;
            remaining -= take;
        }
        if (!remaining.IsZero()) {
            Amount take = std::min(remaining, unallocated.balance);
            unallocated.balance -= take;
            remaining -= take;
        }
        if (!remaining.IsZero()) {
            return Status::InsufficientFunds("proportional draw left a shortfall");
        }
    }

    Expense expense;
    expense.id = expenses_.size();
    expense.recipient = recipient;
    expense.approver = auth.Caller();
    expense.amount = amount;
    expense.description = "profit sharing";
    expense.timestamp = util::GetTime();

    FundMap previous = std::move(funds_);
    funds_ = std::move(updated);
    expenses_.push_back(expense);

    Status status = ledger_.Transfer(self_, recipient, amount);
    if (!status.ok()) {
        funds_ = std::move(previous);
        expenses_.pop_back();
        return status;
    }

    LOG_INFO(util::LogCategory::TREASURY) << "Profit-sharing draw " << FormatEther(amount)
                                          << " to " << recipient.ToString();
    return Status::Ok();
}

// ============================================================================
// Fund Management
// ============================================================================

Status TreasuryLedger::CreateFund(const AuthContext& auth, const std::string& name,
                                  BasisPoints allocationBps, FundId* id) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    if (!auth.Has(Capability::Treasurer)) {
        return Status::Unauthorized("treasurer capability required");
    }
    if (name.empty()) {
        return Status::InvalidArgument("fund name is empty");
    }

    FundId fundId = MakeFundId(name);
    if (NameTaken(funds_, name, FundId())) {
        return Status::AlreadyExists("fund already exists: " + name);
    }
    if (allocationBps > BPS_DENOMINATOR ||
        AllocatedExcludingUnallocated(funds_) + allocationBps > BPS_DENOMINATOR) {
        return Status::InvalidArgument("allocation exceeds 10000 bps");
    }

    Fund fund;
    fund.id = fundId;
    fund.name = name;
    fund.allocationBps = allocationBps;
    fund.active = true;
    fund.exists = true;
    fund.createdAt = util::GetTime();

    funds_[fundId] = fund;
    order_.push_back(fundId);
    Renormalize(funds_);

    if (id) {
        *id = fundId;
    }

    LOG_INFO(util::LogCategory::TREASURY) << "Created fund " << name << " at "
                                          << allocationBps << " bps";
    return Status::Ok();
}

Status TreasuryLedger::UpdateFund(const AuthContext& auth, const FundId& id,
                                  const std::string& name, BasisPoints allocationBps,
                                  bool active) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    if (!auth.Has(Capability::Treasurer)) {
        return Status::Unauthorized("treasurer capability required");
    }
    if (name.empty()) {
        return Status::InvalidArgument("fund name is empty");
    }

    auto it = funds_.find(id);
    if (it == funds_.end() || !it->second.exists) {
        return Status::NotFound("fund does not exist");
    }
    if (id == unallocatedId_) {
        return Status::FailedPrecondition("Unallocated fund is managed automatically");
    }
    if (allocationBps > BPS_DENOMINATOR) {
        return Status::InvalidArgument("allocation exceeds 10000 bps");
    }
    if (NameTaken(funds_, name, id)) {
        return Status::AlreadyExists("fund name in use: " + name);
    }

    FundMap updated = funds_;
    Fund& fund = updated.at(id);
    fund.name = name;
    fund.allocationBps = allocationBps;

    if (fund.active && !active) {
        updated.at(unallocatedId_).balance += fund.balance;
        fund.balance = Amount();
    }
    fund.active = active;

    if (AllocatedExcludingUnallocated(updated) > BPS_DENOMINATOR) {
        return Status::InvalidArgument("allocation exceeds 10000 bps");
    }
    Renormalize(updated);
    funds_ = std::move(updated);

    LOG_INFO(util::LogCategory::TREASURY) << "Updated fund " << name << ": "
                                          << allocationBps << " bps, "
                                          << (active ? "active" : "inactive");
    return Status::Ok();
}

Status TreasuryLedger::UpdateAllFundAllocations(const AuthContext& auth,
                                                const std::vector<FundAllocation>& allocations) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    if (!auth.Has(Capability::Treasurer)) {
        return Status::Unauthorized("treasurer capability required");
    }

    FundMap updated = funds_;
    for (const auto& entry : allocations) {
        auto it = updated.find(entry.id);
        if (it == updated.end() || !it->second.exists) {
            return Status::NotFound("fund does not exist");
        }
        if (entry.allocationBps > BPS_DENOMINATOR) {
            return Status::InvalidArgument("allocation exceeds 10000 bps");
        }
        it->second.allocationBps = entry.allocationBps;
    }

    uint32_t total = 0;
    for (const auto& [id, fund] : updated) {
        if (fund.active) {
            total += fund.allocationBps;
        }
    }
    if (total != BPS_DENOMINATOR) {
        return Status::InvalidArgument("active allocations sum to " +
                                       std::to_string(total) + " bps, expected 10000");
    }

    funds_ = std::move(updated);
    LOG_INFO(util::LogCategory::TREASURY) << "Replaced " << allocations.size()
                                          << " fund allocations";
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Fund> TreasuryLedger::GetFundDetails(const FundId& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = funds_.find(id);
    if (it == funds_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Fund> TreasuryLedger::GetFunds() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<Fund> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(funds_.at(id));
    }
    return result;
}

std::vector<Expense> TreasuryLedger::GetExpenses() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return expenses_;
}

std::vector<Deposit> TreasuryLedger::GetDeposits() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return deposits_;
}

BasisPoints TreasuryLedger::GetTotalAllocation() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    BasisPoints total = 0;
    for (const auto& [id, fund] : funds_) {
        if (fund.active) {
            total += fund.allocationBps;
        }
    }
    return total;
}

Amount TreasuryLedger::GetTotalBalance() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return TotalBalance(funds_);
}

} // namespace treasury
} // namespace pasifika
