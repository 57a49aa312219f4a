// Pasifika - Membership Registry Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/transfer/membership.h"

namespace pasifika {
namespace transfer {

const char* MemberTierToString(MemberTier tier) {
    switch (tier) {
        case MemberTier::Guest: return "Guest";
        case MemberTier::Member: return "Member";
        case MemberTier::NodeOperator: return "NodeOperator";
        default: return "Unknown";
    }
}

void MembershipRegistry::SetMember(const Address& account, bool member) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (member) {
        members_.insert(account);
    } else {
        members_.erase(account);
    }
}

void MembershipRegistry::SetNodeOperator(const Address& account, bool nodeOperator) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (nodeOperator) {
        nodeOperators_.insert(account);
    } else {
        nodeOperators_.erase(account);
    }
}

bool MembershipRegistry::IsMember(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.count(account) > 0;
}

bool MembershipRegistry::IsNodeOperator(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodeOperators_.count(account) > 0;
}

MemberTier MembershipRegistry::GetTier(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (nodeOperators_.count(account)) {
        return MemberTier::NodeOperator;
    }
    if (members_.count(account)) {
        return MemberTier::Member;
    }
    return MemberTier::Guest;
}

} // namespace transfer
} // namespace pasifika
