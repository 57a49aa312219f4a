// Pasifika - Engine Parameters Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/node/params.h"
#include "pasifika/util/logging.h"

#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace pasifika {
namespace node {

// ============================================================================
// Parsing Helpers
// ============================================================================

namespace {

std::vector<std::string> Split(const std::string& str, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delim)) {
        item = util::ConfigManager::Trim(item);
        if (!item.empty()) {
            parts.push_back(item);
        }
    }
    return parts;
}

bool ParseUInt(const std::string& str, uint64_t* out) {
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        *out = std::stoull(str);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool ParseBps(const std::string& str, BasisPoints* out) {
    uint64_t value;
    if (!ParseUInt(str, &value) || value > BPS_DENOMINATOR) {
        return false;
    }
    *out = static_cast<BasisPoints>(value);
    return true;
}

bool ParseDays(const std::string& str, Duration* out) {
    uint64_t days;
    if (!ParseUInt(str, &days) ||
        days > static_cast<uint64_t>(std::numeric_limits<Duration>::max() / SECONDS_PER_DAY)) {
        return false;
    }
    *out = Days(static_cast<int64_t>(days));
    return true;
}

Status BadValue(const std::string& section, const std::string& key, const std::string& value) {
    LOG_WARN(util::LogCategory::CONFIG) << "Invalid value for " << section << "." << key
                                        << ": \"" << value << "\"";
    return Status::InvalidArgument("invalid value for " + section + "." + key);
}

// base,royalty,community,platform[,active]
bool ParseFeeProfile(const std::string& value, fees::FeeProfile* profile) {
    auto parts = Split(value, ',');
    if (parts.size() != 4 && parts.size() != 5) {
        return false;
    }
    fees::FeeProfile result;
    if (!ParseBps(parts[0], &result.baseFeeBps) || !ParseBps(parts[1], &result.royaltyBps) ||
        !ParseBps(parts[2], &result.communityFundBps) ||
        !ParseBps(parts[3], &result.platformFeeBps)) {
        return false;
    }
    if (parts.size() == 5) {
        auto active = util::ConfigManager::ParseBool(parts[4]);
        if (!active) {
            return false;
        }
        result.active = *active;
    }
    *profile = result;
    return true;
}

// min amount,min days,multiplier bps,governance weight[,enabled]
bool ParseTierRequirement(const std::string& value, staking::TierRequirement* requirement) {
    auto parts = Split(value, ',');
    if (parts.size() != 4 && parts.size() != 5) {
        return false;
    }
    staking::TierRequirement result;
    uint64_t multiplier;
    uint64_t weight;
    if (!ParseAmount(parts[0], &result.minAmount) || !ParseDays(parts[1], &result.minDuration) ||
        !ParseUInt(parts[2], &multiplier) || !ParseUInt(parts[3], &weight) ||
        multiplier > std::numeric_limits<BasisPoints>::max() ||
        weight > std::numeric_limits<uint32_t>::max()) {
        return false;
    }
    result.rewardMultiplierBps = static_cast<BasisPoints>(multiplier);
    result.governanceWeight = static_cast<uint32_t>(weight);
    result.enabled = true;
    if (parts.size() == 5) {
        auto enabled = util::ConfigManager::ParseBool(parts[4]);
        if (!enabled) {
            return false;
        }
        result.enabled = *enabled;
    }
    *requirement = result;
    return true;
}

Status LoadFees(const util::ConfigManager& config, fees::FeeEngine::Config* fees) {
    const std::string section = "fees";

    for (size_t i = 0; i < fees::NUM_FEE_TYPES; ++i) {
        const char* key = fees::FeeTypeConfigName(static_cast<fees::FeeType>(i));
        if (auto value = config.TryGetString(key, section)) {
            if (!ParseFeeProfile(*value, &fees->profiles[i])) {
                return BadValue(section, key, *value);
            }
        }
    }

    if (auto value = config.TryGetString("discount_tiers", section)) {
        std::map<Amount, BasisPoints> tiers;
        for (const auto& entry : Split(*value, ',')) {
            auto pair = Split(entry, ':');
            Amount threshold;
            BasisPoints bps;
            if (pair.size() != 2 || !ParseAmount(pair[0], &threshold) || !ParseBps(pair[1], &bps)) {
                return BadValue(section, "discount_tiers", *value);
            }
            tiers[threshold] = bps;
        }
        fees->discountTiers = tiers;
    }

    if (auto value = config.TryGetString("community_fund", section)) {
        try {
            fees->communityFund = Address::FromHex(*value);
        } catch (const std::invalid_argument&) {
            return BadValue(section, "community_fund", *value);
        }
    }
    return Status::Ok();
}

Status LoadTreasury(const util::ConfigManager& config, treasury::TreasuryLedger::Config* treasury) {
    const std::string section = "treasury";

    if (auto value = config.TryGetString("funds", section)) {
        std::vector<treasury::TreasuryLedger::FundSpec> funds;
        for (const auto& entry : Split(*value, ',')) {
            auto pair = Split(entry, ':');
            BasisPoints bps;
            if (pair.size() != 2 || !ParseBps(pair[1], &bps)) {
                return BadValue(section, "funds", *value);
            }
            funds.push_back({pair[0], bps});
        }
        treasury->funds = funds;
    }
    return Status::Ok();
}

Status LoadTransfer(const util::ConfigManager& config, transfer::TransferEngine::Config* transfer) {
    const std::string section = "transfer";

    struct BpsKey {
        const char* key;
        BasisPoints* target;
    };
    const BpsKey bpsKeys[] = {
        {"guest_fee_bps", &transfer->guestFeeBps},
        {"member_fee_bps", &transfer->memberFeeBps},
        {"node_operator_fee_bps", &transfer->nodeOperatorFeeBps},
    };
    for (const auto& entry : bpsKeys) {
        if (auto value = config.TryGetString(entry.key, section)) {
            if (!ParseBps(*value, entry.target)) {
                return BadValue(section, entry.key, *value);
            }
        }
    }

    struct AmountKey {
        const char* key;
        Amount* target;
    };
    const AmountKey amountKeys[] = {
        {"min_fee", &transfer->minFee},
        {"max_fee", &transfer->maxFee},
        {"daily_limit", &transfer->dailyLimit},
    };
    for (const auto& entry : amountKeys) {
        if (auto value = config.TryGetString(entry.key, section)) {
            if (!ParseAmount(*value, entry.target)) {
                return BadValue(section, entry.key, *value);
            }
        }
    }

    if (auto value = config.TryGetString("max_batch_size", section)) {
        uint64_t size;
        if (!ParseUInt(*value, &size) || size == 0) {
            return BadValue(section, "max_batch_size", *value);
        }
        transfer->maxBatchSize = static_cast<size_t>(size);
    }
    return Status::Ok();
}

Status LoadStaking(const util::ConfigManager& config,
                   staking::StakingRewardEngine::Config* staking) {
    const std::string section = "staking";

    if (auto value = config.TryGetString("base_reward_rate", section)) {
        if (!ParseAmount(*value, &staking->baseRewardRate)) {
            return BadValue(section, "base_reward_rate", *value);
        }
    }

    for (size_t i = 0; i < staking::NUM_STAKING_TIERS; ++i) {
        std::string key = std::string("tier.") +
                          staking::StakingTierConfigName(static_cast<staking::StakingTier>(i));
        if (auto value = config.TryGetString(key, section)) {
            if (!ParseTierRequirement(*value, &staking->tiers[i])) {
                return BadValue(section, key, *value);
            }
        }
    }

    if (auto value = config.TryGetString("duration_bonuses", section)) {
        std::map<Duration, BasisPoints> bonuses;
        for (const auto& entry : Split(*value, ',')) {
            auto pair = Split(entry, ':');
            Duration threshold;
            BasisPoints bps;
            if (pair.size() != 2 || !ParseDays(pair[0], &threshold) || threshold == 0 ||
                !ParseBps(pair[1], &bps)) {
                return BadValue(section, "duration_bonuses", *value);
            }
            bonuses[threshold] = bps;
        }
        staking->durationBonuses = bonuses;
    }

    if (auto value = config.TryGetString("max_stake_duration_days", section)) {
        if (!ParseDays(*value, &staking->maxStakeDuration) || staking->maxStakeDuration == 0) {
            return BadValue(section, "max_stake_duration_days", *value);
        }
    }
    return Status::Ok();
}

} // namespace

// ============================================================================
// EngineParams
// ============================================================================

EngineParams EngineParams::Default() {
    EngineParams params;
    params.fees = fees::FeeEngine::Config::Default();
    params.treasury = treasury::TreasuryLedger::Config::Default();
    params.transfer = transfer::TransferEngine::Config::Default();
    params.staking = staking::StakingRewardEngine::Config::Default();
    return params;
}

Status EngineParams::LoadFromConfig(const util::ConfigManager& config, EngineParams* params) {
    EngineParams result = *params;

    Status status = LoadFees(config, &result.fees);
    if (status.ok()) status = LoadTreasury(config, &result.treasury);
    if (status.ok()) status = LoadTransfer(config, &result.transfer);
    if (status.ok()) status = LoadStaking(config, &result.staking);
    if (status.ok()) status = result.Validate();
    if (!status.ok()) {
        return status;
    }

    *params = result;
    LOG_INFO(util::LogCategory::CONFIG) << "Engine parameters loaded ("
                                        << config.Size() << " config entries)";
    return Status::Ok();
}

Status EngineParams::Validate() const {
    for (size_t i = 0; i < fees::NUM_FEE_TYPES; ++i) {
        if (!fees.profiles[i].IsConsistent()) {
            return Status::InvalidArgument(std::string("inconsistent fee profile: ") +
                                           fees::FeeTypeConfigName(static_cast<fees::FeeType>(i)));
        }
    }

    uint32_t total = 0;
    bool hasUnallocated = false;
    std::set<std::string> names;
    for (const auto& fund : treasury.funds) {
        if (!names.insert(fund.name).second) {
            return Status::InvalidArgument("duplicate fund: " + fund.name);
        }
        hasUnallocated |= fund.name == treasury::UNALLOCATED_FUND_NAME;
        total += fund.allocationBps;
    }
    if (!hasUnallocated) {
        return Status::InvalidArgument("fund table lacks Unallocated");
    }
    if (total != BPS_DENOMINATOR) {
        return Status::InvalidArgument("fund allocations must sum to 10000 bps");
    }

    if (transfer.minFee > transfer.maxFee) {
        return Status::InvalidArgument("transfer min_fee exceeds max_fee");
    }
    if (staking.maxStakeDuration <= 0) {
        return Status::InvalidArgument("max_stake_duration_days must be positive");
    }
    return Status::Ok();
}

} // namespace node
} // namespace pasifika
