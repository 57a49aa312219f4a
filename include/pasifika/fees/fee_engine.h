// Pasifika - Marketplace Fee Engine
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// Splits a sale amount into creator royalty, community fund share and
// platform fee according to a per-sale-type fee profile, with a volume
// discount based on the payer's lifetime spend.

#ifndef PASIFIKA_FEES_FEE_ENGINE_H
#define PASIFIKA_FEES_FEE_ENGINE_H

#include <pasifika/core/status.h>
#include <pasifika/core/types.h>
#include <pasifika/core/uint256.h>
#include <pasifika/ledger/auth.h>
#include <pasifika/ledger/value_ledger.h>
#include <pasifika/treasury/treasury.h>

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pasifika {
namespace fees {

// ============================================================================
// Fee Types
// ============================================================================

enum class FeeType : uint8_t {
    StandardSale = 0,
    Auction = 1,
    PremiumListing = 2,
    PhysicalItem = 3,
    DigitalContent = 4,
    CrossCultural = 5,
};

constexpr size_t NUM_FEE_TYPES = 6;

/// Upper bound for a profile's base fee (30%)
constexpr BasisPoints MAX_BASE_FEE_BPS = 3000;

/// Convert fee type to string
const char* FeeTypeToString(FeeType type);

/// Parse fee type from its snake_case config name ("standard_sale")
std::optional<FeeType> ParseFeeType(const std::string& str);

/// Config name of a fee type ("standard_sale")
const char* FeeTypeConfigName(FeeType type);

// ============================================================================
// Fee Profile
// ============================================================================

/**
 * Fee split for one sale type. Invariant:
 * royaltyBps + communityFundBps + platformFeeBps == baseFeeBps <= 3000.
 */
struct FeeProfile {
    BasisPoints baseFeeBps{0};
    BasisPoints royaltyBps{0};
    BasisPoints communityFundBps{0};
    BasisPoints platformFeeBps{0};
    bool active{true};

    /// Check the split invariant
    bool IsConsistent() const {
        return baseFeeBps <= MAX_BASE_FEE_BPS &&
               royaltyBps + communityFundBps + platformFeeBps == baseFeeBps;
    }
};

/// Result of a fee calculation
struct FeeBreakdown {
    Amount fee;
    Amount royalty;
    Amount communityFund;
    Amount platformFee;

    /// Volume discount applied to the base fee
    BasisPoints discountBps{0};
};

/// Immutable record of a processed fee
struct FeeTransactionRecord {
    uint64_t id{0};
    Address payer;
    Address creator;
    FeeType feeType{FeeType::StandardSale};
    Amount amount;
    Amount fee;
    Amount royalty;
    Amount communityFund;
    Amount platformFee;
    Timestamp timestamp{0};
    bool processed{false};
};

// ============================================================================
// Fee Engine
// ============================================================================

class FeeEngine {
public:
    struct Config {
        std::array<FeeProfile, NUM_FEE_TYPES> profiles;

        /// Spend threshold -> discount (bps)
        std::map<Amount, BasisPoints> discountTiers;

        /// Recipient of community fund shares
        Address communityFund;

        static Config Default();
    };

    FeeEngine(ledger::ValueLedger& ledger, treasury::TreasuryLedger& treasury,
              const Address& self, const Config& config = Config::Default());

    FeeEngine(const FeeEngine&) = delete;
    FeeEngine& operator=(const FeeEngine&) = delete;

    const Address& GetAddress() const { return self_; }

    /**
     * Compute the split of `amount` for a sale of type `type` by `payer`.
     *
     * @param communityOverride Replaces the profile's community percentage
     * @return FailedPrecondition if the profile is inactive
     */
    Status CalculateFee(const Amount& amount, FeeType type, const Address& payer,
                        std::optional<BasisPoints> communityOverride,
                        FeeBreakdown* breakdown) const;

    /**
     * Collect the fee from `payer` and distribute it: royalty to `creator`
     * (folded into the platform fee when creator is null), community share to
     * the community fund, platform fee into the treasury. Requires FeeAdmin
     * or Marketplace. All legs succeed or none do.
     */
    Status ProcessFee(const ledger::AuthContext& auth, const Address& payer,
                      const Amount& amount, FeeType type, const Address& creator,
                      std::optional<BasisPoints> communityOverride,
                      uint64_t* recordId = nullptr);

    /// ProcessFee using the community fee registered for `collectionKey`
    Status ProcessCollectionSale(const ledger::AuthContext& auth, const Address& payer,
                                 const Amount& amount, FeeType type,
                                 const Address& creator, const std::string& collectionKey,
                                 uint64_t* recordId = nullptr);

    // ========================================================================
    // Administration (requires FeeAdmin)
    // ========================================================================

    Status UpdateFeeProfile(const ledger::AuthContext& auth, FeeType type,
                            BasisPoints baseFeeBps, BasisPoints royaltyBps,
                            BasisPoints communityFundBps, BasisPoints platformFeeBps);

    Status SetFeeProfileActive(const ledger::AuthContext& auth, FeeType type, bool active);

    Status SetVolumeDiscountTier(const ledger::AuthContext& auth, const Amount& threshold,
                                 BasisPoints discountBps);

    Status RemoveVolumeDiscountTier(const ledger::AuthContext& auth, const Amount& threshold);

    Status SetCommunityFundAddress(const ledger::AuthContext& auth, const Address& fund);

    /// Register a per-collection community fee; 0 bps clears the override
    Status SetCollectionCommunityFee(const ledger::AuthContext& auth,
                                     const std::string& collectionKey,
                                     BasisPoints communityFundBps);

    // ========================================================================
    // Queries
    // ========================================================================

    FeeProfile GetFeeProfile(FeeType type) const;
    std::optional<FeeTransactionRecord> GetFeeTransaction(uint64_t id) const;
    size_t GetFeeTransactionCount() const;

    /// Cumulative amount processed for `payer`
    Amount GetPayerVolume(const Address& payer) const;

    /// Discount of the highest threshold not above the payer's volume
    BasisPoints GetVolumeDiscount(const Address& payer) const;

    std::map<Amount, BasisPoints> GetVolumeDiscountTiers() const;
    Address GetCommunityFundAddress() const;
    std::optional<BasisPoints> GetCollectionCommunityFee(const std::string& collectionKey) const;

private:
    BasisPoints DiscountFor(const Address& payer) const;

    Status Process(const ledger::AuthContext& auth, const Address& payer,
                   const Amount& amount, FeeType type, const Address& creator,
                   std::optional<BasisPoints> communityOverride, uint64_t* recordId);

    /// Register a snapshot of this engine's books with the ledger's open
    /// checkpoint so a reverted outer operation restores them too
    void JournalState();

    ledger::ValueLedger& ledger_;
    treasury::TreasuryLedger& treasury_;
    Address self_;

    mutable std::recursive_mutex mutex_;
    bool entered_{false};

    std::array<FeeProfile, NUM_FEE_TYPES> profiles_;
    std::map<Amount, BasisPoints> discountTiers_;
    Address communityFund_;
    std::unordered_map<std::string, BasisPoints> collectionFees_;

    std::unordered_map<Address, Amount, AddressHasher> payerVolume_;
    std::vector<FeeTransactionRecord> records_;
};

} // namespace fees
} // namespace pasifika

#endif // PASIFIKA_FEES_FEE_ENGINE_H
