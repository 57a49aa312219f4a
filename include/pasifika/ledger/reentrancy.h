// Pasifika - Reentrancy Guard
// Copyright (c) 2024 Pasifika Developers
// MIT License

#ifndef PASIFIKA_LEDGER_REENTRANCY_H
#define PASIFIKA_LEDGER_REENTRANCY_H

namespace pasifika {
namespace ledger {

/**
 * Scope flag for an engine's guarded entry points.
 *
 * Engines hold a recursive mutex, so a receive hook running on the same
 * thread can reach the engine again while an operation is in flight. The
 * guard turns that nested entry into a rejected call.
 *
 * @code
 *   std::lock_guard<std::recursive_mutex> lock(mutex_);
 *   ReentrancyGuard guard(entered_);
 *   if (!guard.Acquired()) return Status::Reentrancy();
 * @endcode
 */
class ReentrancyGuard {
public:
    explicit ReentrancyGuard(bool& flag) : flag_(flag), acquired_(!flag) {
        if (acquired_) {
            flag_ = true;
        }
    }

    ~ReentrancyGuard() {
        if (acquired_) {
            flag_ = false;
        }
    }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    bool Acquired() const { return acquired_; }

private:
    bool& flag_;
    bool acquired_;
};

} // namespace ledger
} // namespace pasifika

#endif // PASIFIKA_LEDGER_REENTRANCY_H
