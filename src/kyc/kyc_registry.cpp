// YIELDGOV - KYC Registry Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/kyc/kyc_registry.h>
#include <yieldgov/util/logging.h>

#include <algorithm>
#include <cctype>

namespace yieldgov {
namespace kyc {

const char* KycTierToString(KycTier tier) {
    switch (tier) {
        case KycTier::None: return "none";
        case KycTier::Basic: return "basic";
        case KycTier::Accredited: return "accredited";
        case KycTier::Institutional: return "institutional";
        default: return "unknown";
    }
}

std::optional<KycTier> ParseKycTier(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "none") return KycTier::None;
    if (lower == "basic") return KycTier::Basic;
    if (lower == "accredited") return KycTier::Accredited;
    if (lower == "institutional") return KycTier::Institutional;
    return std::nullopt;
}

namespace {

GovResult NotAuthorized() {
    return GovResult::Fail(GovError::Unauthorized, "caller is neither owner nor governance");
}

GovResult Busy() {
    return GovResult::Fail(GovError::Reentrancy, "KYC registry call already in progress");
}

} // namespace

KycRegistry::KycRegistry(const Address& owner) : owner_(owner) {}

bool KycRegistry::IsAuthorized(const Address& caller) const {
    if (caller == owner_) {
        return true;
    }
    return !governance_.IsNull() && caller == governance_;
}

GovResult KycRegistry::SetGovernance(const Address& caller, const Address& governance) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (caller != owner_) {
        return GovResult::Fail(GovError::Unauthorized, "only the owner may set governance");
    }
    governance_ = governance;
    LOG_INFO(util::LogCategory::KYC) << "Governance set to " << governance.ToString();
    return GovResult::Ok();
}

bool KycRegistry::IsWhitelisted(const Address& account) const {
    if (!whitelistEnabled_) {
        return true;
    }
    return whitelist_.count(account) > 0;
}

bool KycRegistry::IsBlacklisted(const Address& account) const {
    if (!blacklistEnabled_) {
        return false;
    }
    return blacklist_.count(account) > 0;
}

// ============================================================================
// Whitelist
// ============================================================================

GovResult KycRegistry::AddToWhitelist(const Address& caller, const Address& account) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAuthorized(caller)) {
        return NotAuthorized();
    }
    if (account.IsNull()) {
        return GovResult::Fail(GovError::InvalidAddress, "cannot whitelist the zero address");
    }
    if (!whitelist_.insert(account).second) {
        return GovResult::Fail(GovError::AlreadyInState, "address already whitelisted");
    }
    LOG_INFO(util::LogCategory::KYC) << "Whitelisted " << account.ToString();
    return GovResult::Ok();
}

GovResult KycRegistry::RemoveFromWhitelist(const Address& caller, const Address& account) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAuthorized(caller)) {
        return NotAuthorized();
    }
    if (whitelist_.erase(account) == 0) {
        return GovResult::Fail(GovError::AlreadyInState, "address not whitelisted");
    }
    LOG_INFO(util::LogCategory::KYC) << "Removed " << account.ToString() << " from whitelist";
    return GovResult::Ok();
}

GovResult KycRegistry::BatchAddToWhitelist(const Address& caller,
                                           const std::vector<Address>& accounts) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAuthorized(caller)) {
        return NotAuthorized();
    }
    for (const auto& account : accounts) {
        if (account.IsNull()) {
            return GovResult::Fail(GovError::InvalidAddress, "cannot whitelist the zero address");
        }
    }

    size_t added = 0;
    for (const auto& account : accounts) {
        if (whitelist_.insert(account).second) {
            ++added;
        }
    }
    LogInfoF(util::LogCategory::KYC, "Batch whitelist: %zu of %zu added", added, accounts.size());
    return GovResult::Ok();
}

GovResult KycRegistry::BatchRemoveFromWhitelist(const Address& caller,
                                                const std::vector<Address>& accounts) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAuthorized(caller)) {
        return NotAuthorized();
    }
    size_t removed = 0;
    for (const auto& account : accounts) {
        removed += whitelist_.erase(account);
    }
    LogInfoF(util::LogCategory::KYC, "Batch whitelist: %zu of %zu removed", removed, accounts.size());
    return GovResult::Ok();
}

// ============================================================================
// Blacklist
// ============================================================================

GovResult KycRegistry::AddToBlacklist(const Address& caller, const Address& account) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAuthorized(caller)) {
        return NotAuthorized();
    }
    if (account.IsNull()) {
        return GovResult::Fail(GovError::InvalidAddress, "cannot blacklist the zero address");
    }
    if (!blacklist_.insert(account).second) {
        return GovResult::Fail(GovError::AlreadyInState, "address already blacklisted");
    }
    LOG_WARN(util::LogCategory::KYC) << "Blacklisted " << account.ToString();
    return GovResult::Ok();
}

GovResult KycRegistry::RemoveFromBlacklist(const Address& caller, const Address& account) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAuthorized(caller)) {
        return NotAuthorized();
    }
    if (blacklist_.erase(account) == 0) {
        return GovResult::Fail(GovError::AlreadyInState, "address not blacklisted");
    }
    LOG_INFO(util::LogCategory::KYC) << "Removed " << account.ToString() << " from blacklist";
    return GovResult::Ok();
}

// ============================================================================
// Settings
// ============================================================================

GovResult KycRegistry::SetWhitelistEnabled(const Address& caller, bool enabled) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAuthorized(caller)) {
        return NotAuthorized();
    }
    whitelistEnabled_ = enabled;
    LOG_INFO(util::LogCategory::KYC) << "Whitelist " << (enabled ? "enabled" : "disabled");
    return GovResult::Ok();
}

GovResult KycRegistry::SetBlacklistEnabled(const Address& caller, bool enabled) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAuthorized(caller)) {
        return NotAuthorized();
    }
    blacklistEnabled_ = enabled;
    LOG_INFO(util::LogCategory::KYC) << "Blacklist " << (enabled ? "enabled" : "disabled");
    return GovResult::Ok();
}

GovResult KycRegistry::SetTier(const Address& caller, const Address& account, KycTier tier) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAuthorized(caller)) {
        return NotAuthorized();
    }
    if (tier == KycTier::None) {
        tiers_.erase(account);
    } else {
        tiers_[account] = tier;
    }
    return GovResult::Ok();
}

KycTier KycRegistry::GetTier(const Address& account) const {
    auto it = tiers_.find(account);
    return it == tiers_.end() ? KycTier::None : it->second;
}

} // namespace kyc
} // namespace yieldgov
