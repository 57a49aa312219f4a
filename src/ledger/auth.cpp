// Pasifika - Caller Authorization
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/ledger/auth.h"

#include <sstream>

namespace pasifika {
namespace ledger {

namespace {

constexpr Capability ALL_CAPABILITIES[] = {
    Capability::FeeAdmin,
    Capability::Marketplace,
    Capability::Treasurer,
    Capability::Spender,
    Capability::FeeCollector,
    Capability::ProfitSharing,
    Capability::TransferAdmin,
    Capability::StakingAdmin,
};

} // namespace

const char* CapabilityToString(Capability cap) {
    switch (cap) {
        case Capability::None: return "None";
        case Capability::FeeAdmin: return "FeeAdmin";
        case Capability::Marketplace: return "Marketplace";
        case Capability::Treasurer: return "Treasurer";
        case Capability::Spender: return "Spender";
        case Capability::FeeCollector: return "FeeCollector";
        case Capability::ProfitSharing: return "ProfitSharing";
        case Capability::TransferAdmin: return "TransferAdmin";
        case Capability::StakingAdmin: return "StakingAdmin";
        default: return "Unknown";
    }
}

std::string AuthContext::ToString() const {
    std::ostringstream oss;
    oss << caller_.ToString() << " [";
    const char* sep = "";
    for (Capability cap : ALL_CAPABILITIES) {
        if (Has(cap)) {
            oss << sep << CapabilityToString(cap);
            sep = ",";
        }
    }
    oss << "]";
    return oss.str();
}

} // namespace ledger
} // namespace pasifika
