// YIELDGOV - Asset Transfer Primitive Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/economics/asset.h>
#include <yieldgov/util/logging.h>

#include <exception>

namespace yieldgov {
namespace economics {

void SettlementAccounts::Credit(const Address& account, const Amount& amount) {
    balances_[account] += amount;
    totalIssued_ += amount;
}

Amount SettlementAccounts::BalanceOf(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? Amount(0) : it->second;
}

bool SettlementAccounts::Move(const Address& from, const Address& to, const Amount& amount) {
    if (to.IsNull()) {
        return false;
    }

    auto hookIt = hooks_.find(to);
    if (hookIt != hooks_.end() && hookIt->second) {
        // Copy: the hook may replace itself while running
        ReceiveHook hook = hookIt->second;
        try {
            if (!hook(from, amount)) {
                LOG_DEBUG(util::LogCategory::DISTRIBUTION) << "Payment to " << to.ToString()
                                                           << " rejected by receiver";
                return false;
            }
        } catch (const std::exception& e) {
            LOG_WARN(util::LogCategory::DISTRIBUTION) << "Receive hook for " << to.ToString()
                                                      << " threw: " << e.what();
            return false;
        }
    }

    auto fromIt = balances_.find(from);
    if (fromIt == balances_.end() || fromIt->second < amount) {
        return false;
    }
    fromIt->second -= amount;
    balances_[to] += amount;
    return true;
}

void SettlementAccounts::SetReceiveHook(const Address& account, ReceiveHook hook) {
    hooks_[account] = std::move(hook);
}

void SettlementAccounts::ClearReceiveHook(const Address& account) {
    hooks_.erase(account);
}

bool AccountTransfer::Transfer(const Address& to, const Amount& amount) {
    return accounts_.Move(payer_, to, amount);
}

} // namespace economics
} // namespace yieldgov
