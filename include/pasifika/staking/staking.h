// Pasifika - PSF Staking Module
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// Time-locked PSF token stakes with tiered reward rates.
//
// Key features:
// - Tier classification from stake amount and lock duration
// - Linear per-second reward accrual, capped at the stake's end time
// - Duration bonus from the highest threshold the lock meets
// - Admin-funded rewards pool; claims never exceed the pool
// - Governance weight decaying with remaining lock time

#ifndef PASIFIKA_STAKING_STAKING_H
#define PASIFIKA_STAKING_STAKING_H

#include <pasifika/core/status.h>
#include <pasifika/core/types.h>
#include <pasifika/core/uint256.h>
#include <pasifika/ledger/auth.h>
#include <pasifika/ledger/value_ledger.h>

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pasifika {
namespace staking {

// ============================================================================
// Staking Types
// ============================================================================

/// Stake classification, lowest to highest
enum class StakingTier {
    Basic = 0,
    Silver = 1,
    Gold = 2,
    Platinum = 3,
    Validator = 4,
    NodeOperator = 5,
};

constexpr size_t NUM_STAKING_TIERS = 6;

/// Convert tier to string
const char* StakingTierToString(StakingTier tier);

/// Lower-case name used in configuration keys (e.g. "node_operator")
const char* StakingTierConfigName(StakingTier tier);

/// Parse tier from its display or configuration name
std::optional<StakingTier> ParseStakingTier(const std::string& str);

/// Requirements and benefits of one tier
struct TierRequirement {
    Amount minAmount;
    Duration minDuration{0};

    /// Reward multiplier (10000 = 1x)
    BasisPoints rewardMultiplierBps{BPS_DENOMINATOR};

    /// Governance weight multiplier
    uint32_t governanceWeight{1};

    bool enabled{false};
};

struct Stake {
    uint64_t id{0};
    Address owner;
    Amount amount;
    Timestamp startTime{0};
    Timestamp endTime{0};

    /// Accrual restarts from here after every claim
    Timestamp lastClaimTime{0};

    StakingTier tier{StakingTier::Basic};
    bool active{false};
    Amount totalClaimed;

    Duration LockDuration() const { return endTime - startTime; }
};

// ============================================================================
// Staking Reward Engine
// ============================================================================

class StakingRewardEngine {
public:
    struct Config {
        std::array<TierRequirement, NUM_STAKING_TIERS> tiers;

        /// Minimum lock duration -> bonus bps
        std::map<Duration, BasisPoints> durationBonuses;

        /// Reward per staked unit per second, scaled by RATE_PRECISION
        Amount baseRewardRate;

        Duration maxStakeDuration{0};

        static Config Default();
    };

    StakingRewardEngine(ledger::ValueLedger& token, const Address& self,
                        const Config& config = Config::Default());

    StakingRewardEngine(const StakingRewardEngine&) = delete;
    StakingRewardEngine& operator=(const StakingRewardEngine&) = delete;

    const Address& GetAddress() const { return self_; }

    // ========================================================================
    // Staking
    // ========================================================================

    /**
     * Lock `amount` tokens of the caller for `duration` seconds.
     *
     * @return InvalidArgument if no enabled tier accepts the amount and duration
     */
    Status CreateStake(const ledger::AuthContext& auth, const Amount& amount,
                       Duration duration, uint64_t* stakeId = nullptr);

    /// Add tokens to an active stake. Pending rewards are paid first.
    Status IncreaseStake(const ledger::AuthContext& auth, uint64_t stakeId,
                         const Amount& amount);

    /// Push the end time out by `additional` seconds. Pending rewards are paid first.
    Status ExtendStake(const ledger::AuthContext& auth, uint64_t stakeId,
                       Duration additional);

    /// Pay rewards accrued since the last claim
    Status ClaimRewards(const ledger::AuthContext& auth, uint64_t stakeId,
                        Amount* claimed = nullptr);

    /// Return principal and final rewards once the lock has expired
    Status Unstake(const ledger::AuthContext& auth, uint64_t stakeId,
                   Amount* returned = nullptr);

    // ========================================================================
    // Administration
    // ========================================================================

    /// Move tokens from the caller into the rewards pool (StakingAdmin)
    Status FundRewardsPool(const ledger::AuthContext& auth, const Amount& amount);

    Status SetTierRequirement(const ledger::AuthContext& auth, StakingTier tier,
                              const TierRequirement& requirement);

    /// Set the bonus for locks of at least `minDuration`; 0 removes the threshold
    Status SetDurationBonus(const ledger::AuthContext& auth, Duration minDuration,
                            BasisPoints bonusBps);

    Status SetBaseRewardRate(const ledger::AuthContext& auth, const Amount& rate);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Sum of amount * tier weight * remaining-time fraction over active stakes
    Amount GetGovernanceWeight(const Address& account) const;

    Amount GetPendingRewards(uint64_t stakeId) const;

    /// Highest enabled tier met by amount and duration
    std::optional<StakingTier> ClassifyTier(const Amount& amount, Duration duration) const;

    /// Bonus of the highest threshold not above `duration`
    BasisPoints GetDurationBonus(Duration duration) const;

    /// Per-second rate for a tier and lock duration
    Amount GetEffectiveRate(StakingTier tier, Duration duration) const;

    std::optional<Stake> GetStake(uint64_t stakeId) const;
    std::vector<uint64_t> GetStakesOf(const Address& owner) const;

    Amount GetRewardsPool() const;
    Amount GetTotalStaked() const;
    Config GetConfig() const;

private:
    Amount PendingFor(const Stake& stake, Timestamp now) const;

    /// Locate a stake the caller owns and that is still active
    Status FindOwnedStake(const ledger::AuthContext& auth, uint64_t stakeId, Stake** stake);

    /// Book pending rewards as claimed; fails if the pool cannot cover them
    Status Settle(Stake& stake, Timestamp now, Amount* reward);

    /// Register a snapshot of this engine's books with the token ledger's
    /// open checkpoint so a reverted outer operation restores them too
    void JournalState();

    ledger::ValueLedger& token_;
    Address self_;

    mutable std::recursive_mutex mutex_;
    bool entered_{false};

    Config config_;
    std::map<uint64_t, Stake> stakes_;
    std::unordered_map<Address, std::vector<uint64_t>, AddressHasher> stakesByOwner_;
    uint64_t nextStakeId_{0};

    Amount rewardsPool_;
    Amount totalStaked_;
};

} // namespace staking
} // namespace pasifika

#endif // PASIFIKA_STAKING_STAKING_H
