// Pasifika - Marketplace Fee Engine Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/fees/fee_engine.h"
#include "pasifika/ledger/reentrancy.h"
#include "pasifika/util/logging.h"
#include "pasifika/util/time.h"

#include <algorithm>
#include <stdexcept>

namespace pasifika {
namespace fees {

using ledger::AuthContext;
using ledger::Capability;
using ledger::ReentrancyGuard;

// ============================================================================
// Fee Type Names
// ============================================================================

const char* FeeTypeToString(FeeType type) {
    switch (type) {
        case FeeType::StandardSale: return "StandardSale";
        case FeeType::Auction: return "Auction";
        case FeeType::PremiumListing: return "PremiumListing";
        case FeeType::PhysicalItem: return "PhysicalItem";
        case FeeType::DigitalContent: return "DigitalContent";
        case FeeType::CrossCultural: return "CrossCultural";
        default: return "Unknown";
    }
}

const char* FeeTypeConfigName(FeeType type) {
    switch (type) {
        case FeeType::StandardSale: return "standard_sale";
        case FeeType::Auction: return "auction";
        case FeeType::PremiumListing: return "premium_listing";
        case FeeType::PhysicalItem: return "physical_item";
        case FeeType::DigitalContent: return "digital_content";
        case FeeType::CrossCultural: return "cross_cultural";
        default: return "unknown";
    }
}

std::optional<FeeType> ParseFeeType(const std::string& str) {
    for (size_t i = 0; i < NUM_FEE_TYPES; ++i) {
        FeeType type = static_cast<FeeType>(i);
        if (str == FeeTypeConfigName(type) || str == FeeTypeToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Configuration
// ============================================================================

FeeEngine::Config FeeEngine::Config::Default() {
    Config config;
    //                                                 base  royalty community platform
    config.profiles[static_cast<size_t>(FeeType::StandardSale)]   = {250, 100, 50, 100, true};
    config.profiles[static_cast<size_t>(FeeType::Auction)]        = {300, 100, 50, 150, true};
    config.profiles[static_cast<size_t>(FeeType::PremiumListing)] = {500, 150, 100, 250, true};
    config.profiles[static_cast<size_t>(FeeType::PhysicalItem)]   = {200, 75, 50, 75, true};
    config.profiles[static_cast<size_t>(FeeType::DigitalContent)] = {250, 125, 50, 75, true};
    config.profiles[static_cast<size_t>(FeeType::CrossCultural)]  = {200, 50, 100, 50, true};

    config.discountTiers[Ether(1)] = 1000;
    config.discountTiers[Ether(5)] = 2000;
    config.discountTiers[Ether(10)] = 3000;
    return config;
}

FeeEngine::FeeEngine(ledger::ValueLedger& ledger, treasury::TreasuryLedger& treasury,
                     const Address& self, const Config& config)
    : ledger_(ledger)
    , treasury_(treasury)
    , self_(self)
    , profiles_(config.profiles)
    , discountTiers_(config.discountTiers)
    , communityFund_(config.communityFund) {
    if (self_.IsNull()) {
        throw std::invalid_argument("fee engine address is null");
    }
    for (size_t i = 0; i < NUM_FEE_TYPES; ++i) {
        if (!profiles_[i].IsConsistent()) {
            throw std::invalid_argument(std::string("inconsistent fee profile: ") +
                                        FeeTypeToString(static_cast<FeeType>(i)));
        }
    }
    for (const auto& [threshold, bps] : discountTiers_) {
        if (bps > BPS_DENOMINATOR) {
            throw std::invalid_argument("volume discount exceeds 10000 bps");
        }
    }
}

// ============================================================================
// Calculation
// ============================================================================

BasisPoints FeeEngine::DiscountFor(const Address& payer) const {
    auto volumeIt = payerVolume_.find(payer);
    if (volumeIt == payerVolume_.end()) {
        return 0;
    }
    const Amount& spend = volumeIt->second;

    BasisPoints best = 0;
    for (auto it = discountTiers_.begin();
         it != discountTiers_.end() && it->first <= spend; ++it) {
        best = std::max(best, it->second);
    }
    return best;
}

Status FeeEngine::CalculateFee(const Amount& amount, FeeType type, const Address& payer,
                               std::optional<BasisPoints> communityOverride,
                               FeeBreakdown* breakdown) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    size_t index = static_cast<size_t>(type);
    if (index >= NUM_FEE_TYPES) {
        return Status::InvalidArgument("unknown fee type");
    }
    const FeeProfile& profile = profiles_[index];
    if (!profile.active) {
        return Status::FailedPrecondition(std::string("fee type inactive: ") +
                                          FeeTypeToString(type));
    }
    BasisPoints communityBps = communityOverride.value_or(profile.communityFundBps);
    if (communityBps > BPS_DENOMINATOR) {
        return Status::InvalidArgument("community fee exceeds 10000 bps");
    }

    FeeBreakdown result;
    result.discountBps = DiscountFor(payer);
    result.fee = ApplyBps(amount, profile.baseFeeBps);
    if (result.discountBps > 0) {
        result.fee = ApplyBps(result.fee, BPS_DENOMINATOR - result.discountBps);
    }

    result.royalty = ApplyBps(amount, profile.royaltyBps);
    result.communityFund = ApplyBps(amount, communityBps);

    Amount distributed = result.royalty + result.communityFund;
    if (distributed > result.fee) {
        // Shares are taken off the undiscounted amount; scale them into the fee
        result.royalty = Uint256::MulDiv(result.royalty, result.fee, distributed);
        result.communityFund = result.fee - result.royalty;
        result.platformFee = Amount();
    } else {
        result.platformFee = result.fee - distributed;
    }

    if (breakdown) {
        *breakdown = result;
    }
    return Status::Ok();
}

void FeeEngine::JournalState() {
    if (!ledger_.InCheckpoint()) {
        return;
    }
    ledger_.OnRevert([this, profiles = profiles_, volume = payerVolume_,
                      records = records_.size()]() {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        profiles_ = profiles;
        payerVolume_ = volume;
        records_.resize(records);
    });
}

// ============================================================================
// Processing
// ============================================================================

Status FeeEngine::ProcessFee(const AuthContext& auth, const Address& payer,
                             const Amount& amount, FeeType type, const Address& creator,
                             std::optional<BasisPoints> communityOverride,
                             uint64_t* recordId) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();
    return Process(auth, payer, amount, type, creator, communityOverride, recordId);
}

Status FeeEngine::ProcessCollectionSale(const AuthContext& auth, const Address& payer,
                                        const Amount& amount, FeeType type,
                                        const Address& creator,
                                        const std::string& collectionKey,
                                        uint64_t* recordId) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();

    std::optional<BasisPoints> communityOverride;
    auto it = collectionFees_.find(collectionKey);
    if (it != collectionFees_.end()) {
        communityOverride = it->second;
    }
    return Process(auth, payer, amount, type, creator, communityOverride, recordId);
}

Status FeeEngine::Process(const AuthContext& auth, const Address& payer,
                          const Amount& amount, FeeType type, const Address& creator,
                          std::optional<BasisPoints> communityOverride,
                          uint64_t* recordId) {
    if (!auth.HasAny({Capability::FeeAdmin, Capability::Marketplace})) {
        return Status::Unauthorized("fee admin or marketplace capability required");
    }
    if (amount.IsZero()) {
        return Status::InvalidArgument("amount is zero");
    }
    if (payer.IsNull()) {
        return Status::InvalidArgument("payer is the zero address");
    }
    if (communityFund_.IsNull()) {
        return Status::FailedPrecondition("community fund address not set");
    }

    FeeBreakdown split;
    Status status = CalculateFee(amount, type, payer, communityOverride, &split);
    if (!status.ok()) {
        return status;
    }
    if (ledger_.BalanceOf(payer) < split.fee) {
        return Status::InsufficientFunds("payer cannot cover the fee");
    }

    Amount royalty = split.royalty;
    Amount platformFee = split.platformFee;
    if (creator.IsNull()) {
        platformFee += royalty;
        royalty = Amount();
    }

    // Effects
    FeeTransactionRecord record;
    record.id = records_.size();
    record.payer = payer;
    record.creator = creator;
    record.feeType = type;
    record.amount = amount;
    record.fee = split.fee;
    record.royalty = royalty;
    record.communityFund = split.communityFund;
    record.platformFee = platformFee;
    record.timestamp = util::GetTime();
    records_.push_back(record);

    Amount previousVolume = payerVolume_[payer];
    payerVolume_[payer] = previousVolume + amount;

    auto restore = [&]() {
        records_.pop_back();
        if (previousVolume.IsZero()) {
            payerVolume_.erase(payer);
        } else {
            payerVolume_[payer] = previousVolume;
        }
    };

    // Interactions; the checkpoint undoes earlier legs if a later one fails
    ledger::ValueLedger::Checkpoint checkpoint(ledger_);

    status = ledger_.Transfer(payer, self_, split.fee);
    if (status.ok() && !creator.IsNull()) {
        status = ledger_.Transfer(self_, creator, royalty);
    }
    if (status.ok()) {
        status = ledger_.Transfer(self_, communityFund_, split.communityFund);
    }
    if (status.ok() && !platformFee.IsZero()) {
        AuthContext collector(self_, {Capability::FeeCollector});
        status = treasury_.DepositFees(collector, platformFee);
    }

    if (!status.ok()) {
        restore();
        LOG_DEBUG(util::LogCategory::FEES) << "Fee processing for " << payer.ToString()
                                           << " rolled back: " << status;
        return status;
    }

    checkpoint.Commit();
    records_.back().processed = true;

    if (recordId) {
        *recordId = record.id;
    }

    LOG_INFO(util::LogCategory::FEES) << FeeTypeToString(type) << " fee "
                                      << FormatEther(split.fee) << " on "
                                      << FormatEther(amount) << " from " << payer.ToString()
                                      << " (discount " << split.discountBps << " bps)";
    return Status::Ok();
}

// ============================================================================
// Administration
// ============================================================================

Status FeeEngine::UpdateFeeProfile(const AuthContext& auth, FeeType type,
                                   BasisPoints baseFeeBps, BasisPoints royaltyBps,
                                   BasisPoints communityFundBps, BasisPoints platformFeeBps) {
    auto ledgerLock = ledger_.Lock();
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ReentrancyGuard guard(entered_);
    if (!guard.Acquired()) {
        return Status::Reentrancy();
    }
    JournalState();
    if (!auth.Has(Capability::FeeAdmin)) {
        return Status::Unauthorized("fee admin capability required");
    }

    size_t index = static_cast<size_t>(type);
    if (index >= NUM_FEE_TYPES) {
        return Status::InvalidArgument("unknown fee type");
    }

    FeeProfile profile = profiles_[index];
    profile.baseFeeBps = baseFeeBps;
    profile.royaltyBps = royaltyBps;
    profile.communityFundBps = communityFundBps;
    profile.platformFeeBps = platformFeeBps;
    if (baseFeeBps > MAX_BASE_FEE_BPS) {
        return Status::InvalidArgument("base fee exceeds 3000 bps");
    }
    if (!profile.IsConsistent()) {
        return Status::InvalidArgument("royalty + community + platform must equal base fee");
    }

    profiles_[index] = profile;
    LOG_INFO(util::LogCategory::FEES) << "Fee profile " << FeeTypeToString(type) << " set to "
                                      << baseFeeBps << "/" << royaltyBps << "/"
                                      << communityFundBps << "/" << platformFeeBps;
    return Status::Ok();
}

Status FeeEngine::SetFeeProfileActive(const AuthContext& auth, FeeType type, bool active) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!auth.Has(Capability::FeeAdmin)) {
        return Status::Unauthorized("fee admin capability required");
    }
    size_t index = static_cast<size_t>(type);
    if (index >= NUM_FEE_TYPES) {
        return Status::InvalidArgument("unknown fee type");
    }
    profiles_[index].active = active;
    return Status::Ok();
}

Status FeeEngine::SetVolumeDiscountTier(const AuthContext& auth, const Amount& threshold,
                                        BasisPoints discountBps) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!auth.Has(Capability::FeeAdmin)) {
        return Status::Unauthorized("fee admin capability required");
    }
    if (threshold.IsZero()) {
        return Status::InvalidArgument("threshold is zero");
    }
    if (discountBps > BPS_DENOMINATOR) {
        return Status::InvalidArgument("discount exceeds 10000 bps");
    }
    discountTiers_[threshold] = discountBps;
    return Status::Ok();
}

Status FeeEngine::RemoveVolumeDiscountTier(const AuthContext& auth, const Amount& threshold) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!auth.Has(Capability::FeeAdmin)) {
        return Status::Unauthorized("fee admin capability required");
    }
    if (discountTiers_.erase(threshold) == 0) {
        return Status::NotFound("no discount tier at threshold");
    }
    return Status::Ok();
}

Status FeeEngine::SetCommunityFundAddress(const AuthContext& auth, const Address& fund) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!auth.Has(Capability::FeeAdmin)) {
        return Status::Unauthorized("fee admin capability required");
    }
    if (fund.IsNull()) {
        return Status::InvalidArgument("community fund is the zero address");
    }
    communityFund_ = fund;
    return Status::Ok();
}

Status FeeEngine::SetCollectionCommunityFee(const AuthContext& auth,
                                            const std::string& collectionKey,
                                            BasisPoints communityFundBps) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!auth.Has(Capability::FeeAdmin)) {
        return Status::Unauthorized("fee admin capability required");
    }
    if (collectionKey.empty()) {
        return Status::InvalidArgument("collection key is empty");
    }
    if (communityFundBps > MAX_BASE_FEE_BPS) {
        return Status::InvalidArgument("community fee exceeds 3000 bps");
    }
    if (communityFundBps == 0) {
        collectionFees_.erase(collectionKey);
    } else {
        collectionFees_[collectionKey] = communityFundBps;
    }
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

FeeProfile FeeEngine::GetFeeProfile(FeeType type) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t index = static_cast<size_t>(type);
    return index < NUM_FEE_TYPES ? profiles_[index] : FeeProfile{};
}

std::optional<FeeTransactionRecord> FeeEngine::GetFeeTransaction(uint64_t id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (id >= records_.size()) {
        return std::nullopt;
    }
    return records_[id];
}

size_t FeeEngine::GetFeeTransactionCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return records_.size();
}

Amount FeeEngine::GetPayerVolume(const Address& payer) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = payerVolume_.find(payer);
    return it != payerVolume_.end() ? it->second : Amount();
}

BasisPoints FeeEngine::GetVolumeDiscount(const Address& payer) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return DiscountFor(payer);
}

std::map<Amount, BasisPoints> FeeEngine::GetVolumeDiscountTiers() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return discountTiers_;
}

Address FeeEngine::GetCommunityFundAddress() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return communityFund_;
}

std::optional<BasisPoints> FeeEngine::GetCollectionCommunityFee(
    const std::string& collectionKey) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = collectionFees_.find(collectionKey);
    if (it == collectionFees_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace fees
} // namespace pasifika
