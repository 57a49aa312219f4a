// Pasifika - Ledger Context Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/node/context.h"
#include "pasifika/crypto/hash.h"
#include "pasifika/util/config.h"
#include "pasifika/util/logging.h"

#include <stdexcept>

namespace pasifika {
namespace node {

Address EngineAddress(const std::string& name) {
    Hash256 digest = TaggedHash("Pasifika/EngineAddress", name);
    return Address(digest.data(), Address::SIZE);
}

// ============================================================================
// InitializeLedger - Main initialization function
// ============================================================================

Status InitializeLedger(LedgerContext& ctx, const EngineParams& params) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Initializing ledger engines...";

    Status status = params.Validate();
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Rejected engine parameters: " << status;
        return status;
    }

    ShutdownLedger(ctx);
    ctx.params = params;

    try {
        ctx.native = std::make_unique<ledger::ValueLedger>(NATIVE_SYMBOL);
        ctx.token = std::make_unique<ledger::ValueLedger>(TOKEN_SYMBOL);

        ctx.treasury = std::make_unique<treasury::TreasuryLedger>(
            *ctx.native, EngineAddress("treasury"), params.treasury);
        ctx.fees = std::make_unique<fees::FeeEngine>(
            *ctx.native, *ctx.treasury, EngineAddress("fees"), params.fees);
        ctx.transfers = std::make_unique<transfer::TransferEngine>(
            *ctx.native, *ctx.treasury, EngineAddress("transfer"), params.transfer);
        ctx.staking = std::make_unique<staking::StakingRewardEngine>(
            *ctx.token, EngineAddress("staking"), params.staking);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Engine construction failed: " << e.what();
        ShutdownLedger(ctx);
        return Status::InvalidArgument(e.what());
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Treasury at " << ctx.treasury->GetAddress().ToString()
                                         << " with " << ctx.treasury->GetFunds().size() << " funds";
    LOG_INFO(util::LogCategory::DEFAULT) << "Fee engine at " << ctx.fees->GetAddress().ToString();
    LOG_INFO(util::LogCategory::DEFAULT) << "Transfer engine at "
                                         << ctx.transfers->GetAddress().ToString();
    LOG_INFO(util::LogCategory::DEFAULT) << "Staking engine at "
                                         << ctx.staking->GetAddress().ToString();

    ctx.initialized = true;
    return Status::Ok();
}

Status InitializeLedgerFromFile(LedgerContext& ctx, const std::string& configPath) {
    util::ConfigManager config;
    util::ConfigParseResult parsed = config.ParseFile(configPath);
    if (!parsed.success) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Failed to parse " << configPath << ":"
                                             << parsed.errorLine << ": " << parsed.errorMessage;
        return Status::InvalidArgument(parsed.errorMessage);
    }
    LOG_INFO(util::LogCategory::CONFIG) << "Loaded config from " << configPath;

    EngineParams params = EngineParams::Default();
    Status status = EngineParams::LoadFromConfig(config, &params);
    if (!status.ok()) {
        return status;
    }
    return InitializeLedger(ctx, params);
}

// ============================================================================
// ShutdownLedger
// ============================================================================

void ShutdownLedger(LedgerContext& ctx) {
    ctx.initialized = false;
    ctx.staking.reset();
    ctx.transfers.reset();
    ctx.fees.reset();
    ctx.treasury.reset();
    ctx.token.reset();
    ctx.native.reset();
}

} // namespace node
} // namespace pasifika
