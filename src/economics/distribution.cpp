// YIELDGOV - Distribution Engine Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/economics/distribution.h>
#include <yieldgov/util/logging.h>

#include <map>

namespace yieldgov {
namespace economics {

// ============================================================================
// Planning
// ============================================================================

DistributionPlan PlanProRata(const ledger::ShareholderLedger& ledger, const Amount& amount) {
    DistributionPlan plan;
    plan.total = amount;

    const ShareCount& totalShares = ledger.TotalShares();
    const auto& holders = ledger.Shareholders();
    if (totalShares == 0 || holders.empty()) {
        plan.remainder = amount;
        return plan;
    }

    plan.allocations.reserve(holders.size());

    Amount distributed = 0;
    size_t largestIndex = 0;
    ShareCount largestBalance = 0;

    for (size_t i = 0; i < holders.size(); ++i) {
        ShareCount balance = ledger.BalanceOf(holders[i]);
        Amount share = MulDiv(amount, balance, totalShares);
        plan.allocations.push_back({holders[i], share});
        distributed += share;

        // Strict comparison keeps the first holder on ties
        if (balance > largestBalance) {
            largestBalance = balance;
            largestIndex = i;
        }
    }

    plan.remainder = amount - distributed;
    plan.remainderRecipient = holders[largestIndex];
    plan.allocations[largestIndex].amount += plan.remainder;
    return plan;
}

namespace {

GovResult LedgerBusy() {
    return GovResult::Fail(GovError::Reentrancy, "payout to this ledger already in progress");
}

GovResult RunRepayment(ledger::ShareholderLedger& ledger, IAssetTransfer& payer,
                       const Amount& amount, DistributionResult* result) {
    // Payees cannot move shares or restrictions while being paid
    util::ReentrancyScope scope(ledger.Guard());
    if (!scope.Acquired()) {
        return LedgerBusy();
    }

    if (ledger.TotalShares() == 0) {
        return GovResult::Fail(GovError::NoShareholders, "ledger has no shareholders");
    }

    DistributionPlan plan = PlanProRata(ledger, amount);

    DistributionResult local;
    local.remainder = plan.remainder;
    local.remainderRecipient = plan.remainderRecipient;

    for (const auto& alloc : plan.allocations) {
        if (alloc.amount == 0) {
            continue;
        }
        if (payer.Transfer(alloc.holder, alloc.amount)) {
            local.paid += alloc.amount;
            ++local.holdersPaid;
        } else {
            ledger.CreditUnclaimed(alloc.holder, alloc.amount);
            local.creditedUnclaimed += alloc.amount;
            ++local.holdersFailed;
            LOG_WARN(util::LogCategory::DISTRIBUTION) << "Payment to "
                << alloc.holder.ToString() << " failed, credited " << alloc.amount
                << " to unclaimed remainder";
        }
    }

    if (result) {
        *result = local;
    }
    return GovResult::Ok();
}

} // namespace

GovResult DistributeRepayment(ledger::ShareholderLedger& ledger, IAssetTransfer& payer,
                              const Amount& amount, DistributionResult* result) {
    GovResult status = RunRepayment(ledger, payer, amount, result);
    if (status) {
        LOG_INFO(util::LogCategory::DISTRIBUTION) << "RepaymentDistributed amount=" << amount
            << " holders=" << ledger.ShareholderCount();
    }
    return status;
}

GovResult DistributePartialRepayment(ledger::ShareholderLedger& ledger, IAssetTransfer& payer,
                                     const Amount& partialAmount, const Amount& fullAmount,
                                     DistributionResult* result) {
    GovResult status = RunRepayment(ledger, payer, partialAmount, result);
    if (status) {
        LOG_INFO(util::LogCategory::DISTRIBUTION) << "PartialRepaymentDistributed amount="
            << partialAmount << " of " << fullAmount;
    }
    return status;
}

// ============================================================================
// PendingDistribution
// ============================================================================

PendingDistribution::PendingDistribution(DistributionPlan plan)
    : plan_(std::move(plan)), paid_(plan_.allocations.size(), false) {
    unpaidCount_ = paid_.size();
    // Zero allocations have nothing to deliver
    for (size_t i = 0; i < paid_.size(); ++i) {
        if (plan_.allocations[i].amount == 0) {
            paid_[i] = true;
            --unpaidCount_;
        }
    }
}

Amount PendingDistribution::Outstanding() const {
    Amount outstanding = 0;
    for (size_t i = 0; i < paid_.size(); ++i) {
        if (!paid_[i]) {
            outstanding += plan_.allocations[i].amount;
        }
    }
    return outstanding;
}

GovResult PendingDistribution::Execute(IAssetTransfer& payer) {
    for (size_t i = 0; i < paid_.size(); ++i) {
        if (paid_[i]) {
            continue;
        }
        const Allocation& alloc = plan_.allocations[i];
        if (!payer.Transfer(alloc.holder, alloc.amount)) {
            LOG_ERROR(util::LogCategory::DISTRIBUTION) << "Reserve distribution aborted: payment of "
                << alloc.amount << " to " << alloc.holder.ToString() << " failed ("
                << unpaidCount_ << " payments outstanding)";
            return GovResult::Fail(GovError::DistributionAborted,
                                   "payment to " + alloc.holder.ToString() + " failed");
        }
        paid_[i] = true;
        --unpaidCount_;
    }
    return GovResult::Ok();
}

// ============================================================================
// Claims
// ============================================================================

GovResult ClaimUnclaimed(ledger::ShareholderLedger& ledger, IAssetTransfer& payer,
                         const Address& holder, Amount* claimed) {
    util::ReentrancyScope scope(ledger.Guard());
    if (!scope.Acquired()) {
        return LedgerBusy();
    }

    // Zero the balance before paying
    Amount amount = ledger.TakeUnclaimed(holder);
    if (amount == 0) {
        return GovResult::Fail(GovError::NothingToClaim, "no unclaimed remainder");
    }

    if (!payer.Transfer(holder, amount)) {
        ledger.CreditUnclaimed(holder, amount);
        return GovResult::Fail(GovError::TransferFailed, "claim payment failed");
    }

    if (claimed) {
        *claimed = amount;
    }
    LOG_INFO(util::LogCategory::DISTRIBUTION) << "Unclaimed remainder " << amount
                                              << " claimed by " << holder.ToString();
    return GovResult::Ok();
}

// ============================================================================
// Pooled Capital
// ============================================================================

Amount TotalContributed(const std::vector<Contribution>& contributions) {
    Amount sum = 0;
    for (const auto& c : contributions) {
        sum += c.amount;
    }
    return sum;
}

namespace {

GovResult MintContributions(ledger::ShareholderLedger& ledger,
                            const std::vector<Contribution>& contributions) {
    // Merge repeated contributors and validate before touching the ledger
    std::map<Address, Amount> merged;
    for (const auto& c : contributions) {
        if (c.contributor.IsNull()) {
            return GovResult::Fail(GovError::InvalidAddress, "contributor is the zero address");
        }
        if (c.amount == 0) {
            continue;
        }
        merged[c.contributor] += c.amount;
    }

    size_t newHolders = 0;
    for (const auto& [contributor, amount] : merged) {
        if (!ledger.IsShareholder(contributor)) {
            ++newHolders;
        }
    }
    if (ledger.ShareholderCount() + newHolders > ledger.MaxShareholders()) {
        return GovResult::Fail(GovError::ShareholderLimitExceeded,
                               "pooled contributors exceed maximum shareholder count");
    }

    for (const auto& [contributor, amount] : merged) {
        GovResult minted = ledger.Mint(contributor, amount);
        if (!minted) {
            return minted;
        }
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Pooled capital minted to " << merged.size()
                                        << " contributors";
    return GovResult::Ok();
}

} // namespace

GovResult MintPooledShares(ledger::ShareholderLedger& ledger,
                           const std::vector<Contribution>& contributions,
                           const Amount& requiredCapital, const Amount& tolerance) {
    Amount sum = TotalContributed(contributions);
    Amount gap = sum > requiredCapital ? Amount(sum - requiredCapital)
                                       : Amount(requiredCapital - sum);
    if (gap > tolerance) {
        return GovResult::Fail(GovError::CapitalMismatch,
                               "contributions " + ToDecimalString(sum) +
                               " outside tolerance of required capital " +
                               ToDecimalString(requiredCapital));
    }
    return MintContributions(ledger, contributions);
}

GovResult MintPooledSharesStrict(ledger::ShareholderLedger& ledger,
                                 const std::vector<Contribution>& contributions,
                                 const Amount& requiredCapital) {
    Amount sum = TotalContributed(contributions);
    if (sum != requiredCapital) {
        return GovResult::Fail(GovError::CapitalMismatch,
                               "contributions " + ToDecimalString(sum) +
                               " do not equal required capital " +
                               ToDecimalString(requiredCapital));
    }
    return MintContributions(ledger, contributions);
}

} // namespace economics
} // namespace yieldgov
