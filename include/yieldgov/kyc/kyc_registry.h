// YIELDGOV - KYC Registry
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Identity screening collaborator. The ledger only consumes the boolean
// queries; governance additionally toggles whitelist membership through an
// executed KYCWhitelistUpdate proposal.
//
// Single-address toggles are strict and fail if the account is already in
// the requested state. Batch toggles skip such accounts silently.

#ifndef YIELDGOV_KYC_KYC_REGISTRY_H
#define YIELDGOV_KYC_KYC_REGISTRY_H

#include <yieldgov/core/error.h>
#include <yieldgov/core/types.h>
#include <yieldgov/util/reentrancy.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace yieldgov {
namespace kyc {

/// Investor classification attached to a verified account
enum class KycTier {
    None,
    Basic,
    Accredited,
    Institutional
};

const char* KycTierToString(KycTier tier);

std::optional<KycTier> ParseKycTier(const std::string& str);

// ============================================================================
// Collaborator Interface
// ============================================================================

class IKycRegistry {
public:
    virtual ~IKycRegistry() = default;

    /// True unconditionally while the whitelist is disabled
    virtual bool IsWhitelisted(const Address& account) const = 0;

    /// False unconditionally while the blacklist is disabled
    virtual bool IsBlacklisted(const Address& account) const = 0;

    /// Owner or governance only; AlreadyInState if already whitelisted
    virtual GovResult AddToWhitelist(const Address& caller, const Address& account) = 0;

    /// Owner or governance only; AlreadyInState if not whitelisted
    virtual GovResult RemoveFromWhitelist(const Address& caller, const Address& account) = 0;

    /// Owner or governance only; entries already whitelisted are skipped
    virtual GovResult BatchAddToWhitelist(const Address& caller,
                                          const std::vector<Address>& accounts) = 0;

    /// Owner or governance only; entries not whitelisted are skipped
    virtual GovResult BatchRemoveFromWhitelist(const Address& caller,
                                               const std::vector<Address>& accounts) = 0;
};

// ============================================================================
// In-process Registry
// ============================================================================

class KycRegistry : public IKycRegistry {
public:
    explicit KycRegistry(const Address& owner);

    const Address& GetOwner() const { return owner_; }
    const Address& GetGovernance() const { return governance_; }

    /// Owner only
    GovResult SetGovernance(const Address& caller, const Address& governance);

    bool IsWhitelisted(const Address& account) const override;
    bool IsBlacklisted(const Address& account) const override;

    GovResult AddToWhitelist(const Address& caller, const Address& account) override;
    GovResult RemoveFromWhitelist(const Address& caller, const Address& account) override;
    GovResult BatchAddToWhitelist(const Address& caller,
                                  const std::vector<Address>& accounts) override;
    GovResult BatchRemoveFromWhitelist(const Address& caller,
                                       const std::vector<Address>& accounts) override;

    GovResult AddToBlacklist(const Address& caller, const Address& account);
    GovResult RemoveFromBlacklist(const Address& caller, const Address& account);

    GovResult SetWhitelistEnabled(const Address& caller, bool enabled);
    GovResult SetBlacklistEnabled(const Address& caller, bool enabled);
    bool IsWhitelistEnabled() const { return whitelistEnabled_; }
    bool IsBlacklistEnabled() const { return blacklistEnabled_; }

    GovResult SetTier(const Address& caller, const Address& account, KycTier tier);
    KycTier GetTier(const Address& account) const;

    size_t WhitelistSize() const { return whitelist_.size(); }

private:
    bool IsAuthorized(const Address& caller) const;

    Address owner_;
    Address governance_;
    bool whitelistEnabled_{true};
    bool blacklistEnabled_{true};

    std::unordered_set<Address> whitelist_;
    std::unordered_set<Address> blacklist_;
    std::unordered_map<Address, KycTier> tiers_;

    util::ReentrancyGuard guard_;
};

} // namespace kyc
} // namespace yieldgov

#endif // YIELDGOV_KYC_KYC_REGISTRY_H
