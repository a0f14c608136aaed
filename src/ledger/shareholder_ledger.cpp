// YIELDGOV - Shareholder Ledger Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/ledger/shareholder_ledger.h>
#include <yieldgov/kyc/kyc_registry.h>
#include <yieldgov/util/logging.h>
#include <yieldgov/util/time.h>

#include <algorithm>

namespace yieldgov {
namespace ledger {

namespace {

GovResult Busy() {
    return GovResult::Fail(GovError::Reentrancy, "ledger is locked by a payout in progress");
}

} // namespace

ShareholderLedger::ShareholderLedger(const Address& owner, size_t maxShareholders)
    : owner_(owner), maxShareholders_(maxShareholders) {}

ShareholderLedger::~ShareholderLedger() {
    // Observers may deregister from inside the callback
    std::vector<IBalanceObserver*> observers = observers_;
    for (IBalanceObserver* observer : observers) {
        observer->OnLedgerDestroyed(*this);
    }
}

void ShareholderLedger::AddObserver(IBalanceObserver* observer) {
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        observers_.push_back(observer);
    }
}

void ShareholderLedger::RemoveObserver(IBalanceObserver* observer) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer),
                     observers_.end());
}

void ShareholderLedger::NotifyChanging(const Address& holder) {
    ShareCount previous = BalanceOf(holder);
    for (IBalanceObserver* observer : observers_) {
        observer->OnBalanceChanging(*this, holder, previous);
    }
}

GovResult ShareholderLedger::SetGovernance(const Address& caller, const Address& governance) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (caller != owner_) {
        return GovResult::Fail(GovError::Unauthorized, "only the owner may set governance");
    }
    governance_ = governance;
    return GovResult::Ok();
}

bool ShareholderLedger::IsAdmin(const Address& caller) const {
    if (caller == owner_) {
        return true;
    }
    return !governance_.IsNull() && caller == governance_;
}

// ============================================================================
// Queries
// ============================================================================

ShareCount ShareholderLedger::BalanceOf(const Address& holder) const {
    auto it = balances_.find(holder);
    return it == balances_.end() ? ShareCount(0) : it->second;
}

bool ShareholderLedger::IsShareholder(const Address& holder) const {
    return index_.count(holder) > 0;
}

TransferCheck ShareholderLedger::CanTransfer(const Address& from, const Address& to,
                                             const ShareCount& amount) const {
    if (kyc_) {
        if (!kyc_->IsWhitelisted(to)) {
            return TransferCheck::Deny("recipient not KYC verified");
        }
        if (kyc_->IsBlacklisted(from)) {
            return TransferCheck::Deny("sender is KYC blacklisted");
        }
        if (kyc_->IsBlacklisted(to)) {
            return TransferCheck::Deny("recipient is KYC blacklisted");
        }
    }
    return restrictions_.Check(from, to, amount, BalanceOf(to), totalShares_,
                               util::GetTime());
}

// ============================================================================
// Holder List
// ============================================================================

void ShareholderLedger::AddHolder(const Address& holder) {
    index_[holder] = holders_.size();
    holders_.push_back(holder);
}

void ShareholderLedger::RemoveHolder(const Address& holder) {
    auto it = index_.find(holder);
    if (it == index_.end()) {
        return;
    }
    size_t pos = it->second;
    size_t last = holders_.size() - 1;
    if (pos != last) {
        holders_[pos] = holders_[last];
        index_[holders_[pos]] = pos;
    }
    holders_.pop_back();
    index_.erase(holder);
}

// ============================================================================
// Balance Mutations
// ============================================================================

GovResult ShareholderLedger::Update(const Address& from, const Address& to,
                                    const ShareCount& amount) {
    bool isMint = from.IsNull();
    bool isBurn = to.IsNull();

    if (isMint && isBurn) {
        return GovResult::Fail(GovError::InvalidAddress, "both sides are the zero address");
    }

    if (!isMint && BalanceOf(from) < amount) {
        return GovResult::Fail(GovError::InsufficientBalance, "balance below transfer amount");
    }

    if (!isMint && !isBurn) {
        TransferCheck check = CanTransfer(from, to, amount);
        if (!check.allowed) {
            LOG_WARN(util::LogCategory::RESTRICTION) << "TransferBlocked "
                << from.ToString() << " -> " << to.ToString()
                << " amount=" << amount << ": " << check.reason;
            return GovResult::Fail(GovError::TransferRestricted, check.reason);
        }
    }

    if (!isBurn && amount > 0 && !IsShareholder(to) &&
        holders_.size() + 1 > maxShareholders_) {
        return GovResult::Fail(GovError::ShareholderLimitExceeded,
                               "maximum shareholder count reached");
    }

    // All checks passed; mutate.
    if (amount > 0) {
        if (!isMint) {
            NotifyChanging(from);
        }
        if (!isBurn) {
            NotifyChanging(to);
        }
    }

    if (isMint) {
        totalShares_ += amount;
    } else {
        ShareCount& fromBalance = balances_[from];
        fromBalance -= amount;
        if (fromBalance == 0) {
            balances_.erase(from);
            RemoveHolder(from);
        }
    }

    if (isBurn) {
        totalShares_ -= amount;
    } else if (amount > 0) {
        if (!IsShareholder(to)) {
            AddHolder(to);
        }
        balances_[to] += amount;
    }

    if (!isBurn && restrictions_.GetMinHoldingPeriod() != 0) {
        restrictions_.RecordInbound(to, util::GetTime());
    }

    return GovResult::Ok();
}

GovResult ShareholderLedger::Mint(const Address& to, const ShareCount& amount) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (to.IsNull()) {
        return GovResult::Fail(GovError::InvalidAddress, "cannot mint to the zero address");
    }
    GovResult result = Update(Address(), to, amount);
    if (result) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "SharesMinted to=" << to.ToString()
                                             << " amount=" << amount;
    }
    return result;
}

GovResult ShareholderLedger::Burn(const Address& from, const ShareCount& amount) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (from.IsNull()) {
        return GovResult::Fail(GovError::InvalidAddress, "cannot burn from the zero address");
    }
    GovResult result = Update(from, Address(), amount);
    if (result) {
        LOG_DEBUG(util::LogCategory::LEDGER) << "SharesBurned from=" << from.ToString()
                                             << " amount=" << amount;
    }
    return result;
}

GovResult ShareholderLedger::Transfer(const Address& from, const Address& to,
                                      const ShareCount& amount) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (from.IsNull() || to.IsNull()) {
        return GovResult::Fail(GovError::InvalidAddress, "transfer endpoint is the zero address");
    }
    return Update(from, to, amount);
}

// ============================================================================
// Unclaimed Remainders
// ============================================================================

Amount ShareholderLedger::UnclaimedOf(const Address& holder) const {
    auto it = unclaimed_.find(holder);
    return it == unclaimed_.end() ? Amount(0) : it->second;
}

void ShareholderLedger::CreditUnclaimed(const Address& holder, const Amount& amount) {
    if (amount == 0) {
        return;
    }
    unclaimed_[holder] += amount;
    totalUnclaimed_ += amount;
}

Amount ShareholderLedger::TakeUnclaimed(const Address& holder) {
    auto it = unclaimed_.find(holder);
    if (it == unclaimed_.end()) {
        return 0;
    }
    Amount amount = it->second;
    unclaimed_.erase(it);
    totalUnclaimed_ -= amount;
    return amount;
}

// ============================================================================
// Restrictions
// ============================================================================

GovResult ShareholderLedger::SetRestrictionParam(const Address& caller, RestrictionParam param,
                                                 const Uint256& value) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAdmin(caller)) {
        return GovResult::Fail(GovError::Unauthorized, "caller is neither owner nor governance");
    }
    GovResult valid = ValidateRestrictionParam(param, value, util::GetTime());
    if (!valid) {
        return valid;
    }
    restrictions_.Apply(param, value);
    LOG_INFO(util::LogCategory::RESTRICTION) << "TransferRestrictionsUpdated "
        << RestrictionParamToString(param) << "=" << value;
    return GovResult::Ok();
}

GovResult ShareholderLedger::SetTransfersPaused(const Address& caller, bool paused) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAdmin(caller)) {
        return GovResult::Fail(GovError::Unauthorized, "caller is neither owner nor governance");
    }
    restrictions_.SetPaused(paused);
    LOG_INFO(util::LogCategory::RESTRICTION) << "Transfers " << (paused ? "paused" : "unpaused");
    return GovResult::Ok();
}

GovResult ShareholderLedger::SetWhitelistEnabled(const Address& caller, bool enabled) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAdmin(caller)) {
        return GovResult::Fail(GovError::Unauthorized, "caller is neither owner nor governance");
    }
    restrictions_.SetWhitelistEnabled(enabled);
    return GovResult::Ok();
}

GovResult ShareholderLedger::SetBlacklistEnabled(const Address& caller, bool enabled) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAdmin(caller)) {
        return GovResult::Fail(GovError::Unauthorized, "caller is neither owner nor governance");
    }
    restrictions_.SetBlacklistEnabled(enabled);
    return GovResult::Ok();
}

GovResult ShareholderLedger::SetWhitelisted(const Address& caller, const Address& account,
                                            bool listed) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAdmin(caller)) {
        return GovResult::Fail(GovError::Unauthorized, "caller is neither owner nor governance");
    }
    restrictions_.SetWhitelisted(account, listed);
    return GovResult::Ok();
}

GovResult ShareholderLedger::SetBlacklisted(const Address& caller, const Address& account,
                                            bool listed) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (!IsAdmin(caller)) {
        return GovResult::Fail(GovError::Unauthorized, "caller is neither owner nor governance");
    }
    restrictions_.SetBlacklisted(account, listed);
    return GovResult::Ok();
}

} // namespace ledger
} // namespace yieldgov
