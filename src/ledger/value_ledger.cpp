// Pasifika - Host Value Ledger Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/ledger/value_ledger.h"
#include "pasifika/util/logging.h"

namespace pasifika {
namespace ledger {

ValueLedger::ValueLedger(std::string symbol)
    : symbol_(std::move(symbol)) {}

Amount ValueLedger::BalanceOf(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : Amount();
}

Amount ValueLedger::TotalSupply() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return totalSupply_;
}

size_t ValueLedger::JournalSize() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return journal_.size();
}

bool ValueLedger::InCheckpoint() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return depth_ > 0;
}

void ValueLedger::OnRevert(std::function<void()> undo) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (depth_ > 0) {
        journal_.push_back({false, Address(), Amount(), std::move(undo)});
    }
}

Status ValueLedger::Mint(const Address& to, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (to.IsNull()) {
        return Status::InvalidArgument("mint to zero address");
    }
    bool carry;
    Amount supply = Uint256::Add(totalSupply_, amount, carry);
    if (carry) {
        return Status::InvalidArgument("total supply overflow");
    }

    SetSupply(supply);
    SetBalance(to, BalanceOf(to) + amount);

    LOG_TRACE(util::LogCategory::LEDGER) << symbol_ << " mint " << amount
                                         << " to " << to.ToString();
    return Status::Ok();
}

Status ValueLedger::Transfer(const Address& from, const Address& to, const Amount& amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    if (to.IsNull()) {
        return Status::InvalidArgument("transfer to zero address");
    }
    if (amount.IsZero()) {
        return Status::Ok();
    }

    Amount fromBalance = BalanceOf(from);
    if (fromBalance < amount) {
        return Status::InsufficientFunds(symbol_ + " balance too low");
    }

    // Hook side effects are undone together with the credit
    Checkpoint checkpoint(*this);

    SetBalance(from, fromBalance - amount);
    SetBalance(to, BalanceOf(to) + amount);

    auto hookIt = hooks_.find(to);
    if (hookIt != hooks_.end()) {
        ReceiveHook hook = hookIt->second;
        if (!hook(from, amount)) {
            LOG_DEBUG(util::LogCategory::LEDGER) << to.ToString() << " rejected "
                                                 << amount << " " << symbol_;
            return Status::TransferFailed("recipient rejected transfer");
        }
    }

    checkpoint.Commit();
    return Status::Ok();
}

void ValueLedger::SetReceiveHook(const Address& account, ReceiveHook hook) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    hooks_[account] = std::move(hook);
}

void ValueLedger::ClearReceiveHook(const Address& account) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    hooks_.erase(account);
}

// ============================================================================
// Journal
// ============================================================================

void ValueLedger::SetBalance(const Address& account, const Amount& amount) {
    if (depth_ > 0) {
        journal_.push_back({false, account, BalanceOf(account), {}});
    }
    if (amount.IsZero()) {
        balances_.erase(account);
    } else {
        balances_[account] = amount;
    }
}

void ValueLedger::SetSupply(const Amount& amount) {
    if (depth_ > 0) {
        journal_.push_back({true, Address(), totalSupply_, {}});
    }
    totalSupply_ = amount;
}

void ValueLedger::RevertTo(size_t mark) {
    while (journal_.size() > mark) {
        JournalEntry entry = std::move(journal_.back());
        journal_.pop_back();
        if (entry.undo) {
            entry.undo();
        } else if (entry.supply) {
            totalSupply_ = entry.previous;
        } else if (entry.previous.IsZero()) {
            balances_.erase(entry.account);
        } else {
            balances_[entry.account] = entry.previous;
        }
    }
}

ValueLedger::Checkpoint::Checkpoint(ValueLedger& ledger)
    : ledger_(ledger)
    , lock_(ledger.mutex_)
    , mark_(ledger.journal_.size()) {
    ++ledger_.depth_;
}

ValueLedger::Checkpoint::~Checkpoint() {
    if (!committed_) {
        ledger_.RevertTo(mark_);
    }
    if (--ledger_.depth_ == 0) {
        ledger_.journal_.clear();
    }
}

void ValueLedger::Checkpoint::Commit() {
    committed_ = true;
}

} // namespace ledger
} // namespace pasifika
