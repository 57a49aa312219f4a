// Pasifika - Caller Authorization
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// Every engine entry point receives an AuthContext naming the calling account
// and the capabilities it has been granted. Engines check capabilities
// explicitly instead of consulting a role registry.

#ifndef PASIFIKA_LEDGER_AUTH_H
#define PASIFIKA_LEDGER_AUTH_H

#include <pasifika/core/types.h>

#include <cstdint>
#include <initializer_list>
#include <string>

namespace pasifika {
namespace ledger {

// ============================================================================
// Capabilities
// ============================================================================

enum class Capability : uint32_t {
    None = 0,

    /// Configure fee profiles, discount tiers and community fund address
    FeeAdmin = 1u << 0,

    /// Process sale fees on behalf of a payer
    Marketplace = 1u << 1,

    /// Create and reconfigure treasury funds
    Treasurer = 1u << 2,

    /// Withdraw from a named treasury fund
    Spender = 1u << 3,

    /// Deposit collected fees into the treasury
    FeeCollector = 1u << 4,

    /// Draw from the treasury for profit sharing
    ProfitSharing = 1u << 5,

    /// Configure transfer limits, fees, membership; pay out collections
    TransferAdmin = 1u << 6,

    /// Configure staking tiers, bonuses and fund the reward pool
    StakingAdmin = 1u << 7,
};

/// Convert capability to string
const char* CapabilityToString(Capability cap);

// ============================================================================
// AuthContext
// ============================================================================

class AuthContext {
public:
    AuthContext() = default;

    explicit AuthContext(const Address& caller,
                         std::initializer_list<Capability> caps = {})
        : caller_(caller) {
        for (Capability cap : caps) {
            Grant(cap);
        }
    }

    const Address& Caller() const { return caller_; }

    bool Has(Capability cap) const {
        return (mask_ & static_cast<uint32_t>(cap)) != 0;
    }

    /// True if any of the listed capabilities is held
    bool HasAny(std::initializer_list<Capability> caps) const {
        for (Capability cap : caps) {
            if (Has(cap)) return true;
        }
        return false;
    }

    void Grant(Capability cap) { mask_ |= static_cast<uint32_t>(cap); }
    void Revoke(Capability cap) { mask_ &= ~static_cast<uint32_t>(cap); }

    uint32_t Mask() const { return mask_; }

    std::string ToString() const;

private:
    Address caller_;
    uint32_t mask_{0};
};

} // namespace ledger
} // namespace pasifika

#endif // PASIFIKA_LEDGER_AUTH_H
