// Pasifika - Membership Registry
// Copyright (c) 2024 Pasifika Developers
// MIT License

#ifndef PASIFIKA_TRANSFER_MEMBERSHIP_H
#define PASIFIKA_TRANSFER_MEMBERSHIP_H

#include <pasifika/core/types.h>

#include <mutex>
#include <unordered_set>

namespace pasifika {
namespace transfer {

/// Fee tier of a transfer sender
enum class MemberTier {
    Guest,
    Member,
    NodeOperator,
};

/// Convert tier to string
const char* MemberTierToString(MemberTier tier);

/**
 * Tracks which accounts are members and which run validator nodes.
 * Node operator status takes precedence over membership.
 */
class MembershipRegistry {
public:
    void SetMember(const Address& account, bool member);
    void SetNodeOperator(const Address& account, bool nodeOperator);

    bool IsMember(const Address& account) const;
    bool IsNodeOperator(const Address& account) const;

    MemberTier GetTier(const Address& account) const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<Address, AddressHasher> members_;
    std::unordered_set<Address, AddressHasher> nodeOperators_;
};

} // namespace transfer
} // namespace pasifika

#endif // PASIFIKA_TRANSFER_MEMBERSHIP_H
