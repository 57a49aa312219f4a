// Pasifika - PSF Staking Module Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/staking/staking.h"
#include "pasifika/ledger/reentrancy.h"
#include "pasifika/util/logging.h"
#include "pasifika/util/time.h"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace pasifika {
namespace staking {

using ledger::AuthContext;
using ledger::Capability;
using ledger::ReentrancyGuard;

// ============================================================================
// Tier Names
// ============================================================================

const char* StakingTierToString(StakingTier tier) {
    switch (tier) {
        case StakingTier::Basic: return "Basic";
        case StakingTier::Silver: return "Silver";
        case StakingTier::Gold: return "Gold";
        case StakingTier::Platinum: return "Platinum";
        case StakingTier::Validator: return "Validator";
        case StakingTier::NodeOperator: return "NodeOperator";
        default: return "Unknown";
    }
}

const char* StakingTierConfigName(StakingTier tier) {
    switch (tier) {
        case StakingTier::Basic: return "basic";
        case StakingTier::Silver: return "silver";
        case StakingTier::Gold: return "gold";
        case StakingTier::Platinum: return "platinum";
        case StakingTier::Validator: return "validator";
        case StakingTier::NodeOperator: return "node_operator";
        default: return "unknown";
    }
}

std::optional<StakingTier> ParseStakingTier(const std::string& str) {
    for (size_t i = 0; i < NUM_STAKING_TIERS; ++i) {
        StakingTier tier = static_cast<StakingTier>(i);
        if (str == StakingTierConfigName(tier) || str == StakingTierToString(tier)) {
            return tier;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Configuration
// ============================================================================

StakingRewardEngine::Config StakingRewardEngine::Config::Default() {
    Config config;
    //                                                           amount        lock      mult  gov
    config.tiers[static_cast<size_t>(StakingTier::Basic)]        = {Ether(100),    Days(7),   10000, 1, true};
    config.tiers[static_cast<size_t>(StakingTier::Silver)]       = {Ether(1000),   Days(30),  11000, 2, true};
    config.tiers[static_cast<size_t>(StakingTier::Gold)]         = {Ether(5000),   Days(90),  12500, 3, true};
    config.tiers[static_cast<size_t>(StakingTier::Platinum)]     = {Ether(10000),  Days(180), 15000, 5, true};
    config.tiers[static_cast<size_t>(StakingTier::Validator)]    = {Ether(50000),  Days(365), 17500, 8, true};
    config.tiers[static_cast<size_t>(StakingTier::NodeOperator)] = {Ether(100000), Days(365), 20000, 10, true};

    config.durationBonuses[Days(30)] = 100;
    config.durationBonuses[Days(90)] = 500;
    config.durationBonuses[Days(180)] = 1000;
    config.durationBonuses[Days(365)] = 2000;

    // ~10% per year at RATE_PRECISION
    config.baseRewardRate = Amount(3170979198ULL);
    config.maxStakeDuration = Days(4 * 365);
    return config;
}

StakingRewardEngine::StakingRewardEngine(ledger::ValueLedger& token, const Address& self,
                                         const Config& config)
    : token_(token)
    , self_(self)
    , config_(config) {
    if (self_.IsNull()) {
        throw std::invalid_argument("staking engine address is null");
    }
    if (config_.maxStakeDuration <= 0) {
        throw std::invalid_argument("maximum stake duration must be positive");
    }
}

// ============================================================================
// Reward Math
// ============================================================================

std::optional<StakingTier> StakingRewardEngine::ClassifyTier(const Amount& amount,
                                                             Duration duration) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (size_t i = NUM_STAKING_TIERS; i-- > 0;) {
        const TierRequirement& req = config_.tiers[i];
        if (req.enabled && amount >= req.minAmount && duration >= req.minDuration) {
            return static_cast<StakingTier>(i);
        }
    }
    return std::nullopt;
}

BasisPoints StakingRewardEngine::GetDurationBonus(Duration duration) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = config_.durationBonuses.upper_bound(duration);
    if (it == config_.durationBonuses.begin()) {
        return 0;
    }
    return std::prev(it)->second;
}

Amount StakingRewardEngine::GetEffectiveRate(StakingTier tier, Duration duration) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const TierRequirement& req = config_.tiers[static_cast<size_t>(tier)];
    Amount rate = ApplyBps(config_.baseRewardRate, req.rewardMultiplierBps);
    return ApplyBps(rate, BPS_DENOMINATOR + GetDurationBonus(duration));
}

Amount StakingRewardEngine::PendingFor(const Stake& stake, Timestamp now) const {
    if (!stake.active) {
        return Amount();
    }
    Timestamp until = std::min(now, stake.endTime);
    if (until <= stake.lastClaimTime) {
        return Amount();
    }
    Amount elapsed(static_cast<uint64_t>(until - stake.lastClaimTime));
    Amount rate = GetEffectiveRate(stake.tier, stake.LockDuration());
    return Uint256::MulDiv(stake.amount, rate * elapsed, Amount(RATE_PRECISION));
}

Status StakingRewardEngine::Settle(Stake& stake, Timestamp now, Amount* reward) {
    Amount owed = PendingFor(stake, now);
    if (owed > rewardsPool_) {
        return Status::InsufficientFunds("rewards pool cannot cover accrued rewards");
    }
    rewardsPool_ -= owed;
    stake.totalClaimed += owed;
    stake.lastClaimTime = now;
    *reward = owed;
    return Status::Ok();
}

void StakingRewardEngine::JournalState() {
    if (!token_.InCheckpoint()) {
        return;
    }
    token_.OnRevert([this, stakes = stakes_, byOwner = stakesByOwner_,
                     nextStake = nextStakeId_, pool = rewardsPool_,
                     staked = totalStaked_]() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        stakes_ = stakes;
        stakesByOwner_ = byOwner;
        nextStakeId_ = nextStake;
        rewardsPool_ = pool;
        totalStaked_ = staked;
    });
}

Status StakingRewardEngine::FindOwnedStake(const AuthContext& auth, uint64_t stakeId,
                                           Stake** stake) {
    auto it = stakes_.find(stakeId);
    if (it == stakes_.end()) {
        return Status::NotFound("stake not found");
    }
    if (it->second.owner != auth.Caller()) {
        return Status::Unauthorized("not the stake owner");
    }
    if (!it->second.active) {
        return Status::FailedPrecondition("stake is no longer active");
    }
    *stake = &it->second;
    return Status::Ok();
}

// ============================================================================
// Staking
// ============================================================================

Status StakingRewardEngine::CreateStake(const AuthContext& auth, const Amount& amount,
                                        Duration duration, uint64_t* stakeId) {
    auto ledgerLock = token_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    const Address& owner = auth.Caller();
    if (owner.IsNull()) {
        return Status::InvalidArgument("staker is the zero address");
    }
    if (amount.IsZero()) {
        return Status::InvalidArgument("amount is zero");
    }
    if (duration <= 0 || duration > config_.maxStakeDuration) {
        return Status::InvalidArgument("lock duration out of range");
    }
    auto tier = ClassifyTier(amount, duration);
    if (!tier) {
        return Status::InvalidArgument("amount and duration do not meet any tier");
    }
    if (token_.BalanceOf(owner) < amount) {
        return Status::InsufficientFunds("token balance too low");
    }

    Timestamp now = util::GetTime();
    Stake stake;
    stake.id = nextStakeId_++;
    stake.owner = owner;
    stake.amount = amount;
    stake.startTime = now;
    stake.endTime = now + duration;
    stake.lastClaimTime = now;
    stake.tier = *tier;
    stake.active = true;

    stakes_[stake.id] = stake;
    stakesByOwner_[owner].push_back(stake.id);
    totalStaked_ += amount;

    Status status = token_.Transfer(owner, self_, amount);
    if (!status.ok()) {
        totalStaked_ -= amount;
        stakesByOwner_[owner].pop_back();
        if (stakesByOwner_[owner].empty()) {
            stakesByOwner_.erase(owner);
        }
        stakes_.erase(stake.id);
        --nextStakeId_;
        return status;
    }

    if (stakeId) {
        *stakeId = stake.id;
    }
    LOG_INFO(util::LogCategory::STAKING) << owner.ToString() << " staked "
                                         << FormatEther(amount) << " PSF for "
                                         << duration / SECONDS_PER_DAY << " days ("
                                         << StakingTierToString(*tier) << ")";
    return Status::Ok();
}

Status StakingRewardEngine::IncreaseStake(const AuthContext& auth, uint64_t stakeId,
                                          const Amount& amount) {
    auto ledgerLock = token_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    Stake* stake = nullptr;
    Status status = FindOwnedStake(auth, stakeId, &stake);
    if (!status.ok()) {
        return status;
    }
    if (amount.IsZero()) {
        return Status::InvalidArgument("amount is zero");
    }
    if (token_.BalanceOf(stake->owner) < amount) {
        return Status::InsufficientFunds("token balance too low");
    }

    const Stake before = *stake;
    const Amount poolBefore = rewardsPool_;

    Amount reward;
    status = Settle(*stake, util::GetTime(), &reward);
    if (!status.ok()) {
        return status;
    }
    stake->amount += amount;
    if (auto tier = ClassifyTier(stake->amount, stake->LockDuration())) {
        stake->tier = *tier;
    }
    totalStaked_ += amount;

    ledger::ValueLedger::Checkpoint checkpoint(token_);
    status = token_.Transfer(stake->owner, self_, amount);
    if (status.ok()) {
        status = token_.Transfer(self_, stake->owner, reward);
    }
    if (!status.ok()) {
        *stake = before;
        rewardsPool_ = poolBefore;
        totalStaked_ -= amount;
        return status;
    }
    checkpoint.Commit();

    LOG_INFO(util::LogCategory::STAKING) << "Stake " << stakeId << " increased by "
                                         << FormatEther(amount) << ", tier "
                                         << StakingTierToString(stake->tier);
    return Status::Ok();
}

Status StakingRewardEngine::ExtendStake(const AuthContext& auth, uint64_t stakeId,
                                        Duration additional) {
    auto ledgerLock = token_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    Stake* stake = nullptr;
    Status status = FindOwnedStake(auth, stakeId, &stake);
    if (!status.ok()) {
        return status;
    }
    if (additional <= 0) {
        return Status::InvalidArgument("extension must be positive");
    }
    if (stake->LockDuration() > config_.maxStakeDuration - additional) {
        return Status::InvalidArgument("lock duration exceeds maximum");
    }

    const Stake before = *stake;
    const Amount poolBefore = rewardsPool_;

    Amount reward;
    status = Settle(*stake, util::GetTime(), &reward);
    if (!status.ok()) {
        return status;
    }
    stake->endTime += additional;
    if (auto tier = ClassifyTier(stake->amount, stake->LockDuration())) {
        stake->tier = *tier;
    }

    status = token_.Transfer(self_, stake->owner, reward);
    if (!status.ok()) {
        *stake = before;
        rewardsPool_ = poolBefore;
        return status;
    }

    LOG_INFO(util::LogCategory::STAKING) << "Stake " << stakeId << " extended by "
                                         << additional / SECONDS_PER_DAY << " days, tier "
                                         << StakingTierToString(stake->tier);
    return Status::Ok();
}

Status StakingRewardEngine::ClaimRewards(const AuthContext& auth, uint64_t stakeId,
                                         Amount* claimed) {
    auto ledgerLock = token_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    Stake* stake = nullptr;
    Status status = FindOwnedStake(auth, stakeId, &stake);
    if (!status.ok()) {
        return status;
    }

    Timestamp now = util::GetTime();
    if (PendingFor(*stake, now).IsZero()) {
        return Status::FailedPrecondition("no rewards to claim");
    }

    const Stake before = *stake;
    const Amount poolBefore = rewardsPool_;

    Amount reward;
    status = Settle(*stake, now, &reward);
    if (!status.ok()) {
        return status;
    }

    status = token_.Transfer(self_, stake->owner, reward);
    if (!status.ok()) {
        *stake = before;
        rewardsPool_ = poolBefore;
        return status;
    }

    if (claimed) {
        *claimed = reward;
    }
    LOG_DEBUG(util::LogCategory::STAKING) << "Stake " << stakeId << " claimed "
                                          << FormatEther(reward);
    return Status::Ok();
}

Status StakingRewardEngine::Unstake(const AuthContext& auth, uint64_t stakeId,
                                    Amount* returned) {
    auto ledgerLock = token_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    Stake* stake = nullptr;
    Status status = FindOwnedStake(auth, stakeId, &stake);
    if (!status.ok()) {
        return status;
    }

    Timestamp now = util::GetTime();
    if (now < stake->endTime) {
        return Status::FailedPrecondition("stake is still locked");
    }

    const Stake before = *stake;
    const Amount poolBefore = rewardsPool_;

    Amount reward;
    status = Settle(*stake, now, &reward);
    if (!status.ok()) {
        return status;
    }
    Amount principal = stake->amount;
    stake->active = false;
    totalStaked_ -= principal;

    Amount payout = principal + reward;
    status = token_.Transfer(self_, stake->owner, payout);
    if (!status.ok()) {
        *stake = before;
        rewardsPool_ = poolBefore;
        totalStaked_ += principal;
        return status;
    }

    if (returned) {
        *returned = payout;
    }
    LOG_INFO(util::LogCategory::STAKING) << "Stake " << stakeId << " unstaked: "
                                         << FormatEther(principal) << " principal, "
                                         << FormatEther(reward) << " rewards";
    return Status::Ok();
}

// ============================================================================
// Administration
// ============================================================================

Status StakingRewardEngine::FundRewardsPool(const AuthContext& auth, const Amount& amount) {
    auto ledgerLock = token_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    if (!auth.Has(Capability::StakingAdmin)) {
        return Status::Unauthorized("staking admin capability required");
    }
    if (amount.IsZero()) {
        return Status::InvalidArgument("amount is zero");
    }

    rewardsPool_ += amount;
    Status status = token_.Transfer(auth.Caller(), self_, amount);
    if (!status.ok()) {
        rewardsPool_ -= amount;
        return status;
    }

    LOG_INFO(util::LogCategory::STAKING) << "Rewards pool funded with " << FormatEther(amount)
                                         << ", now " << FormatEther(rewardsPool_);
    return Status::Ok();
}

Status StakingRewardEngine::SetTierRequirement(const AuthContext& auth, StakingTier tier,
                                               const TierRequirement& requirement) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!auth.Has(Capability::StakingAdmin)) {
        return Status::Unauthorized("staking admin capability required");
    }
    size_t index = static_cast<size_t>(tier);
    if (index >= NUM_STAKING_TIERS) {
        return Status::InvalidArgument("unknown staking tier");
    }
    if (requirement.minDuration < 0) {
        return Status::InvalidArgument("negative minimum duration");
    }
    config_.tiers[index] = requirement;
    LOG_INFO(util::LogCategory::STAKING) << "Tier " << StakingTierToString(tier) << " set to min "
                                         << FormatEther(requirement.minAmount) << ", "
                                         << requirement.rewardMultiplierBps << " bps"
                                         << (requirement.enabled ? "" : " (disabled)");
    return Status::Ok();
}

Status StakingRewardEngine::SetDurationBonus(const AuthContext& auth, Duration minDuration,
                                             BasisPoints bonusBps) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!auth.Has(Capability::StakingAdmin)) {
        return Status::Unauthorized("staking admin capability required");
    }
    if (minDuration <= 0) {
        return Status::InvalidArgument("threshold must be positive");
    }
    if (bonusBps > BPS_DENOMINATOR) {
        return Status::InvalidArgument("bonus exceeds 10000 bps");
    }
    if (bonusBps == 0) {
        config_.durationBonuses.erase(minDuration);
    } else {
        config_.durationBonuses[minDuration] = bonusBps;
    }
    return Status::Ok();
}

Status StakingRewardEngine::SetBaseRewardRate(const AuthContext& auth, const Amount& rate) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!auth.Has(Capability::StakingAdmin)) {
        return Status::Unauthorized("staking admin capability required");
    }
    config_.baseRewardRate = rate;
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

Amount StakingRewardEngine::GetGovernanceWeight(const Address& account) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto owned = stakesByOwner_.find(account);
    if (owned == stakesByOwner_.end()) {
        return Amount();
    }

    Timestamp now = util::GetTime();
    Amount total;
    for (uint64_t id : owned->second) {
        const Stake& stake = stakes_.at(id);
        if (!stake.active) {
            continue;
        }
        Amount fraction(BPS_DENOMINATOR);
        if (now < stake.endTime && stake.LockDuration() > 0) {
            fraction = Uint256::MulDiv(Amount(static_cast<uint64_t>(stake.endTime - now)),
                                       Amount(BPS_DENOMINATOR),
                                       Amount(static_cast<uint64_t>(stake.LockDuration())));
        }
        uint32_t weight = config_.tiers[static_cast<size_t>(stake.tier)].governanceWeight;
        total += stake.amount * Amount(weight) * fraction;
    }
    return total;
}

Amount StakingRewardEngine::GetPendingRewards(uint64_t stakeId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = stakes_.find(stakeId);
    if (it == stakes_.end()) {
        return Amount();
    }
    return PendingFor(it->second, util::GetTime());
}

std::optional<Stake> StakingRewardEngine::GetStake(uint64_t stakeId) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = stakes_.find(stakeId);
    if (it == stakes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<uint64_t> StakingRewardEngine::GetStakesOf(const Address& owner) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = stakesByOwner_.find(owner);
    if (it == stakesByOwner_.end()) {
        return {};
    }
    return it->second;
}

Amount StakingRewardEngine::GetRewardsPool() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return rewardsPool_;
}

Amount StakingRewardEngine::GetTotalStaked() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return totalStaked_;
}

StakingRewardEngine::Config StakingRewardEngine::GetConfig() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return config_;
}

} // namespace staking
} // namespace pasifika
