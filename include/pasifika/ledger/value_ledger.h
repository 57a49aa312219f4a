// Pasifika - Host Value Ledger
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// In-memory account balances for one asset (native value or the PSF token).
// Stands in for the host chain: engines hold their funds here and move value
// between accounts with Transfer(). A Checkpoint gives multi-leg operations
// all-or-nothing semantics.

#ifndef PASIFIKA_LEDGER_VALUE_LEDGER_H
#define PASIFIKA_LEDGER_VALUE_LEDGER_H

#include <pasifika/core/status.h>
#include <pasifika/core/types.h>
#include <pasifika/core/uint256.h>

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pasifika {
namespace ledger {

class ValueLedger {
public:
    /// Invoked after `amount` has been credited from `from`. Returning false
    /// rejects the transfer.
    using ReceiveHook = std::function<bool(const Address& from, const Amount& amount)>;

    explicit ValueLedger(std::string symbol);

    ValueLedger(const ValueLedger&) = delete;
    ValueLedger& operator=(const ValueLedger&) = delete;

    const std::string& Symbol() const { return symbol_; }

    Amount BalanceOf(const Address& account) const;
    Amount TotalSupply() const;

    /// Create new units in `to` (genesis and test funding)
    Status Mint(const Address& to, const Amount& amount);

    /**
     * Move `amount` from `from` to `to` and run the recipient's receive hook.
     * A zero amount succeeds without touching balances or hooks.
     *
     * @return InsufficientFunds, InvalidArgument (null recipient) or
     *         TransferFailed (hook rejected); balances are unchanged on failure
     */
    Status Transfer(const Address& from, const Address& to, const Amount& amount);

    void SetReceiveHook(const Address& account, ReceiveHook hook);
    void ClearReceiveHook(const Address& account);

    /// Number of balance changes recorded by open checkpoints
    size_t JournalSize() const;

    /// True while a checkpoint is open
    bool InCheckpoint() const;

    /**
     * Register `undo` with the innermost open checkpoint. It runs if that
     * checkpoint, or a parent it commits into, is reverted, interleaved with
     * the balance restores in reverse order. Engines use it to roll back
     * their own bookkeeping together with the ledger. Without an open
     * checkpoint there is nothing to revert and `undo` is dropped.
     */
    void OnRevert(std::function<void()> undo);

    /**
     * Hold the ledger lock for the duration of an engine operation. Engines
     * take it before their own mutex so that every thread acquires the
     * shared ledger first.
     */
    std::unique_lock<std::recursive_mutex> Lock() const {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    // ========================================================================
    // Checkpoint
    // ========================================================================

    /**
     * RAII transaction scope. Balance changes made while the checkpoint is
     * open are undone when it goes out of scope without Commit(). Nested
     * checkpoints commit into their parent.
     */
    class Checkpoint {
    public:
        explicit Checkpoint(ValueLedger& ledger);
        ~Checkpoint();

        Checkpoint(const Checkpoint&) = delete;
        Checkpoint& operator=(const Checkpoint&) = delete;

        void Commit();
        bool IsCommitted() const { return committed_; }

    private:
        ValueLedger& ledger_;
        std::unique_lock<std::recursive_mutex> lock_;
        size_t mark_;
        bool committed_{false};
    };

private:
    struct JournalEntry {
        bool supply;        // Entry restores total supply rather than a balance
        Address account;
        Amount previous;
        std::function<void()> undo;     // Set for engine entries
    };

    void SetBalance(const Address& account, const Amount& amount);
    void SetSupply(const Amount& amount);
    void RevertTo(size_t mark);

    std::string symbol_;
    mutable std::recursive_mutex mutex_;
    std::unordered_map<Address, Amount, AddressHasher> balances_;
    std::unordered_map<Address, ReceiveHook, AddressHasher> hooks_;
    Amount totalSupply_;

    std::vector<JournalEntry> journal_;
    int depth_{0};
};

} // namespace ledger
} // namespace pasifika

#endif // PASIFIKA_LEDGER_VALUE_LEDGER_H
