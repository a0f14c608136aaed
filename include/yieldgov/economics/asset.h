// YIELDGOV - Asset Transfer Primitive
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Cash movements go through IAssetTransfer, which reports failure as a
// boolean and never throws. The in-process SettlementAccounts book lets a
// recipient attach a receive hook that runs before the payment lands; the
// hook may reject the payment or call back into arbitrary code.

#ifndef YIELDGOV_ECONOMICS_ASSET_H
#define YIELDGOV_ECONOMICS_ASSET_H

#include <yieldgov/core/types.h>

#include <functional>
#include <unordered_map>

namespace yieldgov {
namespace economics {

class IAssetTransfer {
public:
    virtual ~IAssetTransfer() = default;

    /// Pay `amount` to `to`; false on any failure, nothing moved
    virtual bool Transfer(const Address& to, const Amount& amount) = 0;

    /// Funds currently available to pay out
    virtual Amount Balance() const = 0;
};

// ============================================================================
// Settlement Accounts
// ============================================================================

class SettlementAccounts {
public:
    /// Return false to reject an incoming payment
    using ReceiveHook = std::function<bool(const Address& from, const Amount& amount)>;

    SettlementAccounts() = default;

    SettlementAccounts(const SettlementAccounts&) = delete;
    SettlementAccounts& operator=(const SettlementAccounts&) = delete;

    /// Create money out of thin air (funding fixtures and depositors)
    void Credit(const Address& account, const Amount& amount);

    Amount BalanceOf(const Address& account) const;
    const Amount& TotalIssued() const { return totalIssued_; }

    /**
     * Move funds between accounts. The recipient hook runs first; the
     * balance check happens after it returns, so a hook that drains the
     * payer makes the move fail cleanly.
     */
    bool Move(const Address& from, const Address& to, const Amount& amount);

    void SetReceiveHook(const Address& account, ReceiveHook hook);
    void ClearReceiveHook(const Address& account);

private:
    std::unordered_map<Address, Amount> balances_;
    std::unordered_map<Address, ReceiveHook> hooks_;
    Amount totalIssued_{0};
};

/// Pays out of one fixed account of a SettlementAccounts book
class AccountTransfer : public IAssetTransfer {
public:
    AccountTransfer(SettlementAccounts& accounts, const Address& payer)
        : accounts_(accounts), payer_(payer) {}

    bool Transfer(const Address& to, const Amount& amount) override;

    const Address& Payer() const { return payer_; }
    Amount Balance() const override { return accounts_.BalanceOf(payer_); }

private:
    SettlementAccounts& accounts_;
    Address payer_;
};

} // namespace economics
} // namespace yieldgov

#endif // YIELDGOV_ECONOMICS_ASSET_H
