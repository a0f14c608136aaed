// YIELDGOV - Transfer Restrictions Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/ledger/restrictions.h>

namespace yieldgov {
namespace ledger {

// ============================================================================
// Parameter Helpers
// ============================================================================

const char* RestrictionParamToString(RestrictionParam param) {
    switch (param) {
        case RestrictionParam::LockupEnd: return "LockupEnd";
        case RestrictionParam::MaxSharesPerInvestorBP: return "MaxSharesPerInvestorBP";
        case RestrictionParam::MinHoldingPeriod: return "MinHoldingPeriod";
        default: return "Unknown";
    }
}

std::optional<RestrictionParam> RestrictionParamFromId(uint64_t id) {
    if (id > MAX_RESTRICTION_PARAM_ID) {
        return std::nullopt;
    }
    return static_cast<RestrictionParam>(id);
}

GovResult ValidateRestrictionParam(RestrictionParam param, const Uint256& value,
                                   Timestamp now) {
    switch (param) {
        case RestrictionParam::LockupEnd:
            if (value != 0 && value <= Uint256(now < 0 ? 0 : now)) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "lockup end must be 0 or in the future");
            }
            if (value > Uint256(INT64_MAX)) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "lockup end out of range");
            }
            break;
        case RestrictionParam::MaxSharesPerInvestorBP:
            if (value != 0 && (value < MIN_MAX_SHARES_BP || value > BASIS_POINTS)) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "max shares per investor must be 0 or within [100, 10000] bp");
            }
            break;
        case RestrictionParam::MinHoldingPeriod:
            if (value > Uint256(MAX_HOLDING_PERIOD)) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "holding period exceeds 365 days");
            }
            break;
        default:
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "unknown restriction parameter");
    }
    return GovResult::Ok();
}

// ============================================================================
// TransferRestrictions
// ============================================================================

void TransferRestrictions::Apply(RestrictionParam param, const Uint256& value) {
    switch (param) {
        case RestrictionParam::LockupEnd:
            lockupEnd_ = value.convert_to<int64_t>();
            break;
        case RestrictionParam::MaxSharesPerInvestorBP:
            maxSharesBP_ = value.convert_to<uint64_t>();
            break;
        case RestrictionParam::MinHoldingPeriod:
            minHoldingPeriod_ = value.convert_to<int64_t>();
            break;
    }
}

void TransferRestrictions::SetWhitelisted(const Address& addr, bool listed) {
    if (listed) {
        whitelist_.insert(addr);
    } else {
        whitelist_.erase(addr);
    }
}

void TransferRestrictions::SetBlacklisted(const Address& addr, bool listed) {
    if (listed) {
        blacklist_.insert(addr);
    } else {
        blacklist_.erase(addr);
    }
}

bool TransferRestrictions::IsWhitelisted(const Address& addr) const {
    if (!whitelistEnabled_) {
        return true;
    }
    return whitelist_.count(addr) > 0;
}

bool TransferRestrictions::IsBlacklisted(const Address& addr) const {
    if (!blacklistEnabled_) {
        return false;
    }
    return blacklist_.count(addr) > 0;
}

Timestamp TransferRestrictions::LastInboundTransfer(const Address& addr) const {
    auto it = lastInbound_.find(addr);
    return it == lastInbound_.end() ? 0 : it->second;
}

void TransferRestrictions::RecordInbound(const Address& addr, Timestamp now) {
    lastInbound_[addr] = now;
}

TransferCheck TransferRestrictions::Check(const Address& from, const Address& to,
                                          const ShareCount& amount,
                                          const ShareCount& recipientBalance,
                                          const ShareCount& totalShares,
                                          Timestamp now) const {
    if (paused_) {
        return TransferCheck::Deny("transfers are paused");
    }

    if (lockupEnd_ != 0 && now < lockupEnd_) {
        return TransferCheck::Deny("lockup period active");
    }

    if (minHoldingPeriod_ != 0) {
        Timestamp last = LastInboundTransfer(from);
        if (last != 0 && now < last + minHoldingPeriod_) {
            return TransferCheck::Deny("minimum holding period not met");
        }
    }

    if (maxSharesBP_ != 0 && totalShares != 0) {
        // (balance + amount) / total > bp / 10000, compared without division
        Uint512 lhs = (Uint512(recipientBalance) + Uint512(amount)) * BASIS_POINTS;
        Uint512 rhs = Uint512(totalShares) * maxSharesBP_;
        if (lhs > rhs) {
            return TransferCheck::Deny("recipient would exceed max shares per investor");
        }
    }

    if (!IsWhitelisted(to)) {
        return TransferCheck::Deny("recipient not whitelisted");
    }

    if (IsBlacklisted(to)) {
        return TransferCheck::Deny("recipient is blacklisted");
    }

    if (IsBlacklisted(from)) {
        return TransferCheck::Deny("sender is blacklisted");
    }

    return TransferCheck::Allow();
}

} // namespace ledger
} // namespace yieldgov
