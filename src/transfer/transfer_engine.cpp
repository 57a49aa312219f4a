// Pasifika - Peer-to-Peer Transfer Engine Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/transfer/transfer_engine.h"
#include "pasifika/ledger/reentrancy.h"
#include "pasifika/util/logging.h"
#include "pasifika/util/time.h"

#include <stdexcept>

namespace pasifika {
namespace transfer {

using ledger::AuthContext;
using ledger::Capability;
using ledger::ReentrancyGuard;

namespace {

/// a * b, or false if the product does not fit in 256 bits
bool CheckedMul(const Amount& a, const Amount& b, Amount* product) {
    Amount high;
    *product = Uint256::Mul(a, b, high);
    return high.IsZero();
}

} // namespace

TransferEngine::Config TransferEngine::Config::Default() {
    Config config;
    config.minFee = Amount(100000000000000ULL);         // 0.0001 ether
    config.maxFee = Amount(100000000000000000ULL);      // 0.1 ether
    config.dailyLimit = Ether(100);
    return config;
}

TransferEngine::TransferEngine(ledger::ValueLedger& ledger, treasury::TreasuryLedger& treasury,
                               const Address& self, const Config& config)
    : ledger_(ledger)
    , treasury_(treasury)
    , self_(self)
    , config_(config) {
    if (self_.IsNull()) {
        throw std::invalid_argument("transfer engine address is null");
    }
    if (config_.minFee > config_.maxFee) {
        throw std::invalid_argument("minimum transfer fee exceeds maximum");
    }
    if (config_.guestFeeBps > BPS_DENOMINATOR || config_.memberFeeBps > BPS_DENOMINATOR ||
        config_.nodeOperatorFeeBps > BPS_DENOMINATOR) {
        throw std::invalid_argument("transfer fee exceeds 10000 bps");
    }
}

// ============================================================================
// Internal Helpers
// ============================================================================

Status TransferEngine::FeeFor(const Address& sender, const Amount& amount, Amount* fee) const {
    BasisPoints bps = config_.guestFeeBps;
    switch (membership_.GetTier(sender)) {
        case MemberTier::NodeOperator: bps = config_.nodeOperatorFeeBps; break;
        case MemberTier::Member: bps = config_.memberFeeBps; break;
        case MemberTier::Guest: break;
    }

    Amount result = ApplyBps(amount, bps);

    auto discount = feeDiscounts_.find(sender);
    if (discount != feeDiscounts_.end()) {
        result = ApplyBps(result, BPS_DENOMINATOR - discount->second);
    } else if (result < config_.minFee) {
        result = config_.minFee;
    } else if (result > config_.maxFee) {
        result = config_.maxFee;
    }

    if (result >= amount) {
        return Status::InvalidArgument("amount does not cover the transfer fee");
    }
    *fee = result;
    return Status::Ok();
}

TransferEngine::DailyWindow TransferEngine::CurrentWindow(const Address& sender,
                                                          Timestamp now) const {
    auto it = dailyWindows_.find(sender);
    if (it == dailyWindows_.end() || now >= it->second.start + SECONDS_PER_DAY) {
        return DailyWindow{now, Amount()};
    }
    return it->second;
}

Status TransferEngine::CheckDailyLimit(const DailyWindow& window, const Amount& amount) const {
    bool carry;
    Amount total = Uint256::Add(window.used, amount, carry);
    if (config_.dailyLimit.IsZero()) {
        return carry ? Status::InvalidArgument("amount overflow") : Status::Ok();
    }
    if (carry || total > config_.dailyLimit) {
        return Status::FailedPrecondition("daily transfer limit exceeded");
    }
    return Status::Ok();
}

Status TransferEngine::Collect(const Address& sender, const Amount& gross, const Amount& fee) {
    ledger::ValueLedger::Checkpoint checkpoint(ledger_);

    Status status = ledger_.Transfer(sender, self_, gross);
    if (!status.ok()) {
        return status;
    }
    if (!fee.IsZero()) {
        AuthContext collector(self_, {Capability::FeeCollector});
        status = treasury_.DepositFees(collector, fee);
        if (!status.ok()) {
            return status;
        }
    }

    checkpoint.Commit();
    return Status::Ok();
}

void TransferEngine::CreditPending(const Address& account, const Amount& amount) {
    if (!amount.IsZero()) {
        pending_[account] += amount;
    }
}

void TransferEngine::SetPending(const Address& account, const Amount& amount) {
    if (amount.IsZero()) {
        pending_.erase(account);
    } else {
        pending_[account] = amount;
    }
}

void TransferEngine::JournalState() {
    if (!ledger_.InCheckpoint()) {
        return;
    }
    ledger_.OnRevert([this, windows = dailyWindows_, pending = pending_,
                      records = records_.size(), schedules = schedules_,
                      collections = collections_, nextSchedule = nextScheduleId_,
                      nextCollection = nextCollectionId_]() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        dailyWindows_ = windows;
        pending_ = pending;
        records_.resize(records);
        schedules_ = schedules;
        collections_ = collections;
        nextScheduleId_ = nextSchedule;
        nextCollectionId_ = nextCollection;
    });
}

Status TransferEngine::CalculateTransferFee(const Address& sender, const Amount& amount,
                                            Amount* fee) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    Amount result;
    Status status = FeeFor(sender, amount, &result);
    if (status.ok() && fee) {
        *fee = result;
    }
    return status;
}

// ============================================================================
// Transfers
// ============================================================================

Status TransferEngine::Transfer(const AuthContext& auth, const Address& recipient,
                                const Amount& amount, const std::string& memo,
                                uint64_t* transferId) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    const Address& sender = auth.Caller();
    if (sender.IsNull() || recipient.IsNull()) {
        return Status::InvalidArgument("zero address");
    }
    if (amount.IsZero()) {
        return Status::InvalidArgument("amount is zero");
    }

    Amount fee;
    Status status = FeeFor(sender, amount, &fee);
    if (!status.ok()) {
        return status;
    }

    Timestamp now = util::GetTime();
    DailyWindow window = CurrentWindow(sender, now);
    status = CheckDailyLimit(window, amount);
    if (!status.ok()) {
        return status;
    }
    if (ledger_.BalanceOf(sender) < amount) {
        return Status::InsufficientFunds("sender balance too low");
    }

    Amount net = amount - fee;

    // Effects
    auto windowIt = dailyWindows_.find(sender);
    std::optional<DailyWindow> previousWindow;
    if (windowIt != dailyWindows_.end()) {
        previousWindow = windowIt->second;
    }
    Amount previousPending = GetPendingWithdrawal(recipient);

    window.used += amount;
    dailyWindows_[sender] = window;
    CreditPending(recipient, net);

    TransferRecord record;
    record.id = records_.size();
    record.sender = sender;
    record.recipient = recipient;
    record.amount = amount;
    record.fee = fee;
    record.netAmount = net;
    record.memo = memo;
    record.timestamp = now;
    records_.push_back(record);

    // Interactions
    status = Collect(sender, amount, fee);
    if (!status.ok()) {
        records_.pop_back();
        SetPending(recipient, previousPending);
        if (previousWindow) {
            dailyWindows_[sender] = *previousWindow;
        } else {
            dailyWindows_.erase(sender);
        }
        LOG_DEBUG(util::LogCategory::TRANSFER) << "Transfer from " << sender.ToString()
                                               << " failed: " << status;
        return status;
    }

    if (transferId) {
        *transferId = record.id;
    }
    LOG_INFO(util::LogCategory::TRANSFER) << "Transfer " << FormatEther(amount) << " "
                                          << sender.ToString() << " -> "
                                          << recipient.ToString() << " (fee "
                                          << FormatEther(fee) << ")";
    return Status::Ok();
}

Status TransferEngine::BatchTransfer(const AuthContext& auth,
                                     const std::vector<BatchEntry>& entries,
                                     const std::string& memo,
                                     std::vector<uint64_t>* transferIds) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    const Address& sender = auth.Caller();
    if (sender.IsNull()) {
        return Status::InvalidArgument("sender is the zero address");
    }
    if (entries.empty()) {
        return Status::InvalidArgument("batch is empty");
    }
    if (entries.size() > config_.maxBatchSize) {
        return Status::InvalidArgument("batch exceeds " +
                                       std::to_string(config_.maxBatchSize) + " entries");
    }

    std::vector<Amount> fees;
    fees.reserve(entries.size());
    Amount total;
    Amount totalFee;
    for (const auto& entry : entries) {
        if (entry.recipient.IsNull()) {
            return Status::InvalidArgument("batch recipient is the zero address");
        }
        if (entry.amount.IsZero()) {
            return Status::InvalidArgument("batch amount is zero");
        }
        Amount fee;
        Status status = FeeFor(sender, entry.amount, &fee);
        if (!status.ok()) {
            return status;
        }
        bool carry;
        total = Uint256::Add(total, entry.amount, carry);
        if (carry) {
            return Status::InvalidArgument("amount overflow");
        }
        fees.push_back(fee);
        totalFee += fee;
    }

    Timestamp now = util::GetTime();
    DailyWindow window = CurrentWindow(sender, now);
    Status status = CheckDailyLimit(window, total);
    if (!status.ok()) {
        return status;
    }
    if (ledger_.BalanceOf(sender) < total) {
        return Status::InsufficientFunds("sender balance too low");
    }

    // Effects
    std::unordered_map<Address, Amount, AddressHasher> previousPending;
    for (const auto& entry : entries) {
        previousPending.emplace(entry.recipient, GetPendingWithdrawal(entry.recipient));
    }
    std::optional<DailyWindow> previousWindow;
    auto windowIt = dailyWindows_.find(sender);
    if (windowIt != dailyWindows_.end()) {
        previousWindow = windowIt->second;
    }
    size_t firstRecord = records_.size();

    window.used += total;
    dailyWindows_[sender] = window;
    for (size_t i = 0; i < entries.size(); ++i) {
        Amount net = entries[i].amount - fees[i];
        CreditPending(entries[i].recipient, net);

        TransferRecord record;
        record.id = records_.size();
        record.sender = sender;
        record.recipient = entries[i].recipient;
        record.amount = entries[i].amount;
        record.fee = fees[i];
        record.netAmount = net;
        record.memo = memo;
        record.timestamp = now;
        records_.push_back(record);
    }

    // Interactions
    status = Collect(sender, total, totalFee);
    if (!status.ok()) {
        records_.resize(firstRecord);
        for (const auto& [account, amount] : previousPending) {
            SetPending(account, amount);
        }
        if (previousWindow) {
            dailyWindows_[sender] = *previousWindow;
        } else {
            dailyWindows_.erase(sender);
        }
        return status;
    }

    if (transferIds) {
        transferIds->clear();
        for (size_t i = firstRecord; i < records_.size(); ++i) {
            transferIds->push_back(records_[i].id);
        }
    }
    LOG_INFO(util::LogCategory::TRANSFER) << "Batch of " << entries.size() << " transfers, "
                                          << FormatEther(total) << " from "
                                          << sender.ToString();
    return Status::Ok();
}

Status TransferEngine::WithdrawPending(const AuthContext& auth, Amount* withdrawn) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    const Address& account = auth.Caller();
    auto it = pending_.find(account);
    if (it == pending_.end() || it->second.IsZero()) {
        return Status::FailedPrecondition("no pending balance");
    }

    Amount amount = it->second;
    pending_.erase(it);

    Status status = ledger_.Transfer(self_, account, amount);
    if (!status.ok()) {
        pending_[account] = amount;
        return status;
    }

    if (withdrawn) {
        *withdrawn = amount;
    }
    LOG_INFO(util::LogCategory::TRANSFER) << account.ToString() << " withdrew "
                                          << FormatEther(amount);
    return Status::Ok();
}

// ============================================================================
// Scheduled Transfers
// ============================================================================

Status TransferEngine::CreateScheduledTransfer(const AuthContext& auth, const Address& recipient,
                                               const Amount& amount, Duration interval,
                                               uint32_t repetitions, uint64_t* scheduleId) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    const Address& sender = auth.Caller();
    if (sender.IsNull() || recipient.IsNull()) {
        return Status::InvalidArgument("zero address");
    }
    if (amount.IsZero()) {
        return Status::InvalidArgument("amount is zero");
    }
    if (interval <= 0) {
        return Status::InvalidArgument("interval must be positive");
    }

    Amount fee;
    Status status = FeeFor(sender, amount, &fee);
    if (!status.ok()) {
        return status;
    }

    Amount intervals(repetitions > 0 ? repetitions : 1);
    Amount gross;
    if (!CheckedMul(amount, intervals, &gross)) {
        return Status::InvalidArgument("amount overflow");
    }
    // fee and net are below amount, so their products fit as well
    Amount totalFee = fee * intervals;
    Amount net = amount - fee;

    Timestamp now = util::GetTime();
    DailyWindow window = CurrentWindow(sender, now);
    status = CheckDailyLimit(window, gross);
    if (!status.ok()) {
        return status;
    }
    if (ledger_.BalanceOf(sender) < gross) {
        return Status::InsufficientFunds("sender balance too low");
    }

    // Effects
    ScheduledTransfer schedule;
    schedule.id = nextScheduleId_++;
    schedule.sender = sender;
    schedule.recipient = recipient;
    schedule.amount = amount;
    schedule.fee = fee;
    schedule.netAmount = net;
    schedule.interval = interval;
    schedule.nextExecution = now + interval;
    schedule.remainingTransfers = repetitions;
    schedule.escrowBalance = net * intervals;
    schedule.active = true;
    schedules_[schedule.id] = schedule;

    std::optional<DailyWindow> previousWindow;
    auto windowIt = dailyWindows_.find(sender);
    if (windowIt != dailyWindows_.end()) {
        previousWindow = windowIt->second;
    }
    window.used += gross;
    dailyWindows_[sender] = window;

    // Interactions
    status = Collect(sender, gross, totalFee);
    if (!status.ok()) {
        schedules_.erase(schedule.id);
        --nextScheduleId_;
        if (previousWindow) {
            dailyWindows_[sender] = *previousWindow;
        } else {
            dailyWindows_.erase(sender);
        }
        return status;
    }

    if (scheduleId) {
        *scheduleId = schedule.id;
    }
    LOG_INFO(util::LogCategory::TRANSFER) << "Scheduled transfer " << schedule.id << ": "
                                          << FormatEther(amount) << " every " << interval
                                          << "s to " << recipient.ToString();
    return Status::Ok();
}

Status TransferEngine::TopUpScheduledTransfer(const AuthContext& auth, uint64_t scheduleId,
                                              uint32_t intervals) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    auto it = schedules_.find(scheduleId);
    if (it == schedules_.end()) {
        return Status::NotFound("scheduled transfer not found");
    }
    ScheduledTransfer& schedule = it->second;
    if (auth.Caller() != schedule.sender) {
        return Status::Unauthorized("only the sender can fund a schedule");
    }
    if (!schedule.active) {
        return Status::FailedPrecondition("scheduled transfer is inactive");
    }
    if (schedule.remainingTransfers != 0) {
        return Status::FailedPrecondition("only indefinite schedules can be topped up");
    }
    if (intervals == 0) {
        return Status::InvalidArgument("intervals is zero");
    }

    Amount count(intervals);
    Amount gross;
    if (!CheckedMul(schedule.amount, count, &gross)) {
        return Status::InvalidArgument("amount overflow");
    }
    Amount totalFee = schedule.fee * count;
    Amount escrow = schedule.netAmount * count;

    Timestamp now = util::GetTime();
    DailyWindow window = CurrentWindow(schedule.sender, now);
    Status status = CheckDailyLimit(window, gross);
    if (!status.ok()) {
        return status;
    }
    if (ledger_.BalanceOf(schedule.sender) < gross) {
        return Status::InsufficientFunds("sender balance too low");
    }

    std::optional<DailyWindow> previousWindow;
    auto windowIt = dailyWindows_.find(schedule.sender);
    if (windowIt != dailyWindows_.end()) {
        previousWindow = windowIt->second;
    }
    window.used += gross;
    dailyWindows_[schedule.sender] = window;
    schedule.escrowBalance += escrow;

    status = Collect(schedule.sender, gross, totalFee);
    if (!status.ok()) {
        schedule.escrowBalance -= escrow;
        if (previousWindow) {
            dailyWindows_[schedule.sender] = *previousWindow;
        } else {
            dailyWindows_.erase(schedule.sender);
        }
        return status;
    }
    return Status::Ok();
}

Status TransferEngine::ExecuteScheduledTransfer(const AuthContext& auth, uint64_t scheduleId) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    auto it = schedules_.find(scheduleId);
    if (it == schedules_.end()) {
        return Status::NotFound("scheduled transfer not found");
    }
    ScheduledTransfer& schedule = it->second;
    if (!schedule.active) {
        return Status::FailedPrecondition("scheduled transfer is inactive");
    }

    Timestamp now = util::GetTime();
    if (now < schedule.nextExecution) {
        return Status::FailedPrecondition("scheduled transfer is not due");
    }
    if (schedule.escrowBalance < schedule.netAmount) {
        return Status::FailedPrecondition("schedule escrow is exhausted");
    }

    schedule.escrowBalance -= schedule.netAmount;
    schedule.nextExecution = now + schedule.interval;
    if (schedule.remainingTransfers > 0 && --schedule.remainingTransfers == 0) {
        schedule.active = false;
    }
    CreditPending(schedule.recipient, schedule.netAmount);

    TransferRecord record;
    record.id = records_.size();
    record.sender = schedule.sender;
    record.recipient = schedule.recipient;
    record.amount = schedule.amount;
    record.fee = schedule.fee;
    record.netAmount = schedule.netAmount;
    record.memo = "scheduled";
    record.timestamp = now;
    record.scheduleId = schedule.id;
    records_.push_back(record);

    LOG_DEBUG(util::LogCategory::TRANSFER) << "Executed schedule " << schedule.id << " for "
                                           << auth.Caller().ToString() << ", "
                                           << schedule.remainingTransfers << " remaining";
    return Status::Ok();
}

Status TransferEngine::CancelScheduledTransfer(const AuthContext& auth, uint64_t scheduleId) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    auto it = schedules_.find(scheduleId);
    if (it == schedules_.end()) {
        return Status::NotFound("scheduled transfer not found");
    }
    ScheduledTransfer& schedule = it->second;
    if (auth.Caller() != schedule.sender && !auth.Has(Capability::TransferAdmin)) {
        return Status::Unauthorized("only the sender can cancel a schedule");
    }
    if (!schedule.active) {
        return Status::FailedPrecondition("scheduled transfer is inactive");
    }

    schedule.active = false;
    CreditPending(schedule.sender, schedule.escrowBalance);
    schedule.escrowBalance = Amount();

    LOG_INFO(util::LogCategory::TRANSFER) << "Cancelled schedule " << schedule.id;
    return Status::Ok();
}

// ============================================================================
// Community Collections
// ============================================================================

Status TransferEngine::CreateCommunityCollection(const AuthContext& auth,
                                                 const std::string& purpose,
                                                 const Amount& goal, Timestamp deadline,
                                                 uint64_t* collectionId) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    if (auth.Caller().IsNull()) {
        return Status::InvalidArgument("creator is the zero address");
    }
    if (purpose.empty()) {
        return Status::InvalidArgument("purpose is empty");
    }
    if (goal.IsZero()) {
        return Status::InvalidArgument("goal is zero");
    }
    Timestamp now = util::GetTime();
    if (deadline <= now) {
        return Status::InvalidArgument("deadline is in the past");
    }

    CommunityCollection collection;
    collection.id = nextCollectionId_++;
    collection.creator = auth.Caller();
    collection.purpose = purpose;
    collection.goal = goal;
    collection.deadline = deadline;
    collection.createdAt = now;
    collection.active = true;
    collections_[collection.id] = collection;

    if (collectionId) {
        *collectionId = collection.id;
    }
    LOG_INFO(util::LogCategory::TRANSFER) << "Collection " << collection.id << " \""
                                          << purpose << "\" goal " << FormatEther(goal);
    return Status::Ok();
}

Status TransferEngine::ContributeToCollection(const AuthContext& auth, uint64_t collectionId,
                                              const Amount& amount) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    auto it = collections_.find(collectionId);
    if (it == collections_.end()) {
        return Status::NotFound("collection not found");
    }
    CommunityCollection& collection = it->second;
    if (!collection.active) {
        return Status::FailedPrecondition("collection is closed");
    }
    if (util::GetTime() > collection.deadline) {
        return Status::FailedPrecondition("collection deadline has passed");
    }
    if (amount.IsZero()) {
        return Status::InvalidArgument("amount is zero");
    }
    bool carry;
    Amount collected = Uint256::Add(collection.collected, amount, carry);
    if (carry) {
        return Status::InvalidArgument("amount overflow");
    }

    collection.collected = collected;

    Status status = ledger_.Transfer(auth.Caller(), self_, amount);
    if (!status.ok()) {
        collection.collected -= amount;
        return status;
    }
    return Status::Ok();
}

Status TransferEngine::FinalizeCommunityCollection(const AuthContext& auth,
                                                   uint64_t collectionId) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    auto it = collections_.find(collectionId);
    if (it == collections_.end()) {
        return Status::NotFound("collection not found");
    }
    CommunityCollection& collection = it->second;
    if (auth.Caller() != collection.creator) {
        return Status::Unauthorized("only the creator can finalize");
    }
    if (!collection.active) {
        return Status::FailedPrecondition("collection already finalized");
    }

    Amount payout = collection.collected;
    collection.active = false;
    collection.collected = Amount();
    collection.paidOut += payout;

    Status status = ledger_.Transfer(self_, collection.creator, payout);
    if (!status.ok()) {
        collection.active = true;
        collection.collected = payout;
        collection.paidOut -= payout;
        return status;
    }

    LOG_INFO(util::LogCategory::TRANSFER) << "Collection " << collectionId << " finalized, "
                                          << FormatEther(payout) << " paid to creator";
    return Status::Ok();
}

Status TransferEngine::AdminCollectionPayout(const AuthContext& auth, uint64_t collectionId,
                                             const Address& recipient, const Amount& amount) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    if (!auth.Has(Capability::TransferAdmin)) {
        return Status::Unauthorized("transfer admin capability required");
    }
    auto it = collections_.find(collectionId);
    if (it == collections_.end()) {
        return Status::NotFound("collection not found");
    }
    CommunityCollection& collection = it->second;
    if (!collection.active) {
        return Status::FailedPrecondition("collection is closed");
    }
    if (recipient.IsNull()) {
        return Status::InvalidArgument("recipient is the zero address");
    }
    if (amount.IsZero()) {
        return Status::InvalidArgument("amount is zero");
    }
    if (amount > collection.collected) {
        return Status::InsufficientFunds("payout exceeds collected balance");
    }

    collection.collected -= amount;
    collection.paidOut += amount;

    Status status = ledger_.Transfer(self_, recipient, amount);
    if (!status.ok()) {
        collection.collected += amount;
        collection.paidOut -= amount;
        return status;
    }
    return Status::Ok();
}

// ============================================================================
// Administration
// ============================================================================

Status TransferEngine::SetFeeBounds(const AuthContext& auth, const Amount& minFee,
                                    const Amount& maxFee) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!auth.Has(Capability::TransferAdmin)) {
        return Status::Unauthorized("transfer admin capability required");
    }
    if (minFee > maxFee) {
        return Status::InvalidArgument("minimum fee exceeds maximum fee");
    }
    config_.minFee = minFee;
    config_.maxFee = maxFee;
    return Status::Ok();
}

Status TransferEngine::SetDailyLimit(const AuthContext& auth, const Amount& limit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!auth.Has(Capability::TransferAdmin)) {
        return Status::Unauthorized("transfer admin capability required");
    }
    config_.dailyLimit = limit;
    return Status::Ok();
}

Status TransferEngine::SetFeeDiscount(const AuthContext& auth, const Address& account,
                                      BasisPoints discountBps) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!auth.Has(Capability::TransferAdmin)) {
        return Status::Unauthorized("transfer admin capability required");
    }
    if (discountBps > BPS_DENOMINATOR) {
        return Status::InvalidArgument("discount exceeds 10000 bps");
    }
    if (discountBps == 0) {
        feeDiscounts_.erase(account);
    } else {
        feeDiscounts_[account] = discountBps;
    }
    return Status::Ok();
}

Status TransferEngine::SetMember(const AuthContext& auth, const Address& account, bool member) {
    if (!auth.Has(Capability::TransferAdmin)) {
        return Status::Unauthorized("transfer admin capability required");
    }
    membership_.SetMember(account, member);
    return Status::Ok();
}

Status TransferEngine::SetNodeOperator(const AuthContext& auth, const Address& account,
                                       bool nodeOperator) {
    if (!auth.Has(Capability::TransferAdmin)) {
        return Status::Unauthorized("transfer admin capability required");
    }
    membership_.SetNodeOperator(account, nodeOperator);
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

Amount TransferEngine::GetPendingWithdrawal(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = pending_.find(account);
    return it != pending_.end() ? it->second : Amount();
}

Amount TransferEngine::GetDailyUsage(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return CurrentWindow(account, util::GetTime()).used;
}

std::optional<BasisPoints> TransferEngine::GetFeeDiscount(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = feeDiscounts_.find(account);
    if (it == feeDiscounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<TransferRecord> TransferEngine::GetTransferRecord(uint64_t id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (id >= records_.size()) {
        return std::nullopt;
    }
    return records_[id];
}

std::optional<ScheduledTransfer> TransferEngine::GetScheduledTransfer(uint64_t id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = schedules_.find(id);
    if (it == schedules_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<CommunityCollection> TransferEngine::GetCommunityCollection(uint64_t id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = collections_.find(id);
    if (it == collections_.end()) {
        return std::nullopt;
    }
    return it->second;
}

TransferEngine::Config TransferEngine::GetConfig() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return config_;
}

} // namespace transfer
} // namespace pasifika
