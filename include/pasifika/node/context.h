// Pasifika - Ledger Context
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// This file defines the LedgerContext structure that holds a fully wired
// set of engines: the native and PSF token ledgers, the treasury, and the
// fee, transfer and staking engines.

#ifndef PASIFIKA_NODE_CONTEXT_H
#define PASIFIKA_NODE_CONTEXT_H

#include <pasifika/core/status.h>
#include <pasifika/core/types.h>
#include <pasifika/fees/fee_engine.h>
#include <pasifika/ledger/value_ledger.h>
#include <pasifika/node/params.h>
#include <pasifika/staking/staking.h>
#include <pasifika/transfer/transfer_engine.h>
#include <pasifika/treasury/treasury.h>

#include <atomic>
#include <memory>
#include <string>

namespace pasifika {
namespace node {

/// Symbol of the native value ledger
constexpr const char* NATIVE_SYMBOL = "ETH";

/// Symbol of the staking token ledger
constexpr const char* TOKEN_SYMBOL = "PSF";

/// Deterministic account of a named engine ("treasury", "fees", ...)
Address EngineAddress(const std::string& name);

// ============================================================================
// Ledger Context - Holds all engine state
// ============================================================================

/**
 * LedgerContext owns every engine. The treasury, fee and transfer engines
 * share the native ledger; staking runs on the PSF token ledger.
 */
struct LedgerContext {
    // ========================================================================
    // Parameters
    // ========================================================================

    EngineParams params;

    // ========================================================================
    // Value Ledgers
    // ========================================================================

    std::unique_ptr<ledger::ValueLedger> native;
    std::unique_ptr<ledger::ValueLedger> token;

    // ========================================================================
    // Engines
    // ========================================================================

    std::unique_ptr<treasury::TreasuryLedger> treasury;
    std::unique_ptr<fees::FeeEngine> fees;
    std::unique_ptr<transfer::TransferEngine> transfers;
    std::unique_ptr<staking::StakingRewardEngine> staking;

    /// Whether InitializeLedger completed
    std::atomic<bool> initialized{false};

    LedgerContext() = default;
    ~LedgerContext() = default;

    LedgerContext(const LedgerContext&) = delete;
    LedgerContext& operator=(const LedgerContext&) = delete;
    LedgerContext(LedgerContext&&) = delete;
    LedgerContext& operator=(LedgerContext&&) = delete;

    bool IsReady() const {
        return initialized.load() && treasury && fees && transfers && staking;
    }
};

// ============================================================================
// Initialization
// ============================================================================

/**
 * Build all ledgers and engines from `params`.
 *
 * @return InvalidArgument if the parameters are rejected by an engine;
 *         `ctx` is left empty on failure
 */
Status InitializeLedger(LedgerContext& ctx, const EngineParams& params);

/// Load a configuration file and initialize from Default() plus its overrides
Status InitializeLedgerFromFile(LedgerContext& ctx, const std::string& configPath);

/// Release all engines (dependents before the treasury and ledgers)
void ShutdownLedger(LedgerContext& ctx);

} // namespace node
} // namespace pasifika

#endif // PASIFIKA_NODE_CONTEXT_H
