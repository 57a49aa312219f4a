// Pasifika - Engine Parameters
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// Built-in parameter set for all engines and its configuration file
// overrides.
//
// Recognized keys:
//
//   [fees]
//   # base,royalty,community,platform[,active]; likewise for every fee type
//   standard_sale = 250,100,50,100
//   discount_tiers = 1ether:1000,5ether:2000,10ether:3000
//   community_fund = 0x...
//
//   [treasury]
//   funds = Development:3000,Community:3000,Operations:2000,Reserve:1000,Unallocated:1000
//
//   [transfer]
//   guest_fee_bps, member_fee_bps, node_operator_fee_bps,
//   min_fee, max_fee, daily_limit, max_batch_size
//
//   [staking]
//   base_reward_rate = 3170979198
//   # min amount,min days,multiplier bps,governance weight[,enabled]
//   tier.gold = 5000ether,90,12500,3
//   # days:bps
//   duration_bonuses = 30:100,90:500,180:1000,365:2000
//   max_stake_duration_days = 1460

#ifndef PASIFIKA_NODE_PARAMS_H
#define PASIFIKA_NODE_PARAMS_H

#include <pasifika/core/status.h>
#include <pasifika/fees/fee_engine.h>
#include <pasifika/staking/staking.h>
#include <pasifika/transfer/transfer_engine.h>
#include <pasifika/treasury/treasury.h>
#include <pasifika/util/config.h>

namespace pasifika {
namespace node {

struct EngineParams {
    fees::FeeEngine::Config fees;
    treasury::TreasuryLedger::Config treasury;
    transfer::TransferEngine::Config transfer;
    staking::StakingRewardEngine::Config staking;

    static EngineParams Default();

    /**
     * Apply overrides from `config` on top of `params`. Keys that are absent
     * keep their current value.
     *
     * @return InvalidArgument naming the offending key; `params` is left
     *         untouched on failure
     */
    static Status LoadFromConfig(const util::ConfigManager& config, EngineParams* params);

    /// Check the cross-field invariants each engine enforces at construction
    Status Validate() const;
};

} // namespace node
} // namespace pasifika

#endif // PASIFIKA_NODE_PARAMS_H
