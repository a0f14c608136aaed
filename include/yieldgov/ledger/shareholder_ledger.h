// YIELDGOV - Shareholder Ledger
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Ownership-token balances for one agreement.
//
// Holders are kept in an unordered list mirrored by a membership map. A
// holder joins the list when their balance becomes non-zero and leaves it
// (swap-and-pop) when it drops to exactly zero, so the list always sums to
// the total share count. The list length is capped.
//
// Holder-to-holder transfers pass the KYC collaborator (if attached) and then
// the restriction checklist. Mint and burn skip both.
//
// Observers are told each holder's balance just before it changes, which is
// enough to reconstruct any earlier balance lazily.

#ifndef YIELDGOV_LEDGER_SHAREHOLDER_LEDGER_H
#define YIELDGOV_LEDGER_SHAREHOLDER_LEDGER_H

#include <yieldgov/core/error.h>
#include <yieldgov/core/types.h>
#include <yieldgov/ledger/restrictions.h>
#include <yieldgov/util/reentrancy.h>

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace yieldgov {

namespace kyc {
class IKycRegistry;
}

namespace ledger {

/// Default cap on distinct holders per ledger
constexpr size_t DEFAULT_MAX_SHAREHOLDERS = 1000;

class ShareholderLedger;

class IBalanceObserver {
public:
    virtual ~IBalanceObserver() = default;

    /// `holder`'s balance is about to change from `previous`
    virtual void OnBalanceChanging(const ShareholderLedger& ledger, const Address& holder,
                                   const ShareCount& previous) = 0;

    /// The ledger is going away; drop any pointer to it
    virtual void OnLedgerDestroyed(const ShareholderLedger& ledger) = 0;
};

class ShareholderLedger {
public:
    /**
     * @param owner           Issuer; may change restriction parameters
     * @param maxShareholders Cap on distinct holders
     */
    explicit ShareholderLedger(const Address& owner,
                               size_t maxShareholders = DEFAULT_MAX_SHAREHOLDERS);

    ~ShareholderLedger();

    ShareholderLedger(const ShareholderLedger&) = delete;
    ShareholderLedger& operator=(const ShareholderLedger&) = delete;

    // ========================================================================
    // Wiring
    // ========================================================================

    const Address& GetOwner() const { return owner_; }
    const Address& GetGovernance() const { return governance_; }

    /// Owner only
    GovResult SetGovernance(const Address& caller, const Address& governance);

    /// Attach (or detach with nullptr) the KYC collaborator; not owned
    void SetKycRegistry(const kyc::IKycRegistry* registry) { kyc_ = registry; }
    const kyc::IKycRegistry* GetKycRegistry() const { return kyc_; }

    /// Not owned; must be removed (or notified of destruction) before it dies
    void AddObserver(IBalanceObserver* observer);
    void RemoveObserver(IBalanceObserver* observer);

    /**
     * Held by payouts to this ledger's holders so that code running inside
     * a payment cannot mutate the ledger. Mutators fail with Reentrancy
     * while it is held.
     */
    util::ReentrancyGuard& Guard() { return guard_; }

    // ========================================================================
    // Queries
    // ========================================================================

    ShareCount BalanceOf(const Address& holder) const;
    const ShareCount& TotalShares() const { return totalShares_; }
    size_t ShareholderCount() const { return holders_.size(); }
    size_t MaxShareholders() const { return maxShareholders_; }
    bool IsShareholder(const Address& holder) const;

    /// Current holders, order unspecified
    const std::vector<Address>& Shareholders() const { return holders_; }

    /// Evaluate a holder-to-holder transfer without applying it
    TransferCheck CanTransfer(const Address& from, const Address& to,
                              const ShareCount& amount) const;

    // ========================================================================
    // Balance Mutations
    // ========================================================================

    /// Issue new shares; no restriction checks
    GovResult Mint(const Address& to, const ShareCount& amount);

    /// Destroy shares; no restriction checks
    GovResult Burn(const Address& from, const ShareCount& amount);

    /// Holder-to-holder movement, gated by KYC and restrictions
    GovResult Transfer(const Address& from, const Address& to, const ShareCount& amount);

    // ========================================================================
    // Unclaimed Remainders
    // ========================================================================

    Amount UnclaimedOf(const Address& holder) const;
    const Amount& TotalUnclaimed() const { return totalUnclaimed_; }

    void CreditUnclaimed(const Address& holder, const Amount& amount);

    /// Zero the holder's unclaimed balance and return what it held
    Amount TakeUnclaimed(const Address& holder);

    // ========================================================================
    // Restrictions (owner or governance)
    // ========================================================================

    const TransferRestrictions& Restrictions() const { return restrictions_; }

    /// Validate and apply one governance-addressable parameter
    GovResult SetRestrictionParam(const Address& caller, RestrictionParam param,
                                  const Uint256& value);

    GovResult SetTransfersPaused(const Address& caller, bool paused);
    GovResult SetWhitelistEnabled(const Address& caller, bool enabled);
    GovResult SetBlacklistEnabled(const Address& caller, bool enabled);
    GovResult SetWhitelisted(const Address& caller, const Address& account, bool listed);
    GovResult SetBlacklisted(const Address& caller, const Address& account, bool listed);

private:
    bool IsAdmin(const Address& caller) const;

    GovResult Update(const Address& from, const Address& to, const ShareCount& amount);
    void NotifyChanging(const Address& holder);

    void AddHolder(const Address& holder);
    void RemoveHolder(const Address& holder);

    Address owner_;
    Address governance_;
    const kyc::IKycRegistry* kyc_{nullptr};
    size_t maxShareholders_;

    ShareCount totalShares_{0};
    std::unordered_map<Address, ShareCount> balances_;

    // Position of each holder in holders_
    std::unordered_map<Address, size_t> index_;
    std::vector<Address> holders_;

    std::unordered_map<Address, Amount> unclaimed_;
    Amount totalUnclaimed_{0};

    TransferRestrictions restrictions_;

    std::vector<IBalanceObserver*> observers_;
    util::ReentrancyGuard guard_;
};

} // namespace ledger
} // namespace yieldgov

#endif // YIELDGOV_LEDGER_SHAREHOLDER_LEDGER_H
