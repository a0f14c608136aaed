// YIELDGOV - Distribution Engine
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Pro-rata cash distribution over the current holders of a ledger.
//
// Every holder with balance b receives floor(A * b / S). The rounding
// remainder A - sum(floor(...)) goes entirely to the holder with the largest
// balance (the first one encountered on ties).
//
// Two failure policies coexist:
// - Repayment: a payment that fails is credited to the holder's unclaimed
//   remainder for a later pull-style claim. The call as a whole succeeds.
// - Reserve withdrawal: the first failed payment aborts the run. The plan
//   keeps track of which holders were already paid, so a retry completes the
//   remaining payments without paying anyone twice.

#ifndef YIELDGOV_ECONOMICS_DISTRIBUTION_H
#define YIELDGOV_ECONOMICS_DISTRIBUTION_H

#include <yieldgov/core/error.h>
#include <yieldgov/core/types.h>
#include <yieldgov/economics/asset.h>
#include <yieldgov/ledger/shareholder_ledger.h>

#include <vector>

namespace yieldgov {
namespace economics {

/// Default allowed gap between pooled contributions and required capital (1%)
constexpr uint64_t DEFAULT_POOLING_TOLERANCE_BP = 100;

// ============================================================================
// Planning
// ============================================================================

struct Allocation {
    Address holder;
    Amount amount{0};
};

struct DistributionPlan {
    /// One entry per holder; the remainder is already folded into its recipient
    std::vector<Allocation> allocations;

    Amount total{0};
    Amount remainder{0};
    Address remainderRecipient;

    bool Empty() const { return allocations.empty(); }
};

/// Compute the per-holder split of `amount` (empty plan if the ledger is empty)
DistributionPlan PlanProRata(const ledger::ShareholderLedger& ledger, const Amount& amount);

// ============================================================================
// Execution
// ============================================================================

struct DistributionResult {
    Amount paid{0};
    Amount creditedUnclaimed{0};
    size_t holdersPaid{0};
    size_t holdersFailed{0};
    Amount remainder{0};
    Address remainderRecipient;
};

/**
 * Repayment policy. Failed payments accrue to unclaimed remainders.
 * Fails only with NoShareholders.
 */
GovResult DistributeRepayment(ledger::ShareholderLedger& ledger, IAssetTransfer& payer,
                              const Amount& amount, DistributionResult* result = nullptr);

/**
 * Partial-payment variant. The split uses `partialAmount` alone;
 * `fullAmount` is only reported.
 */
GovResult DistributePartialRepayment(ledger::ShareholderLedger& ledger, IAssetTransfer& payer,
                                     const Amount& partialAmount, const Amount& fullAmount,
                                     DistributionResult* result = nullptr);

/// Frozen reserve-withdrawal payout with per-holder progress
class PendingDistribution {
public:
    PendingDistribution() = default;
    explicit PendingDistribution(DistributionPlan plan);

    const DistributionPlan& Plan() const { return plan_; }
    bool IsPaid(size_t index) const { return paid_.at(index); }
    bool Complete() const { return unpaidCount_ == 0; }
    size_t UnpaidCount() const { return unpaidCount_; }

    /// Amount not yet delivered
    Amount Outstanding() const;

    /**
     * Pay every unpaid allocation in order. Stops at the first failure and
     * returns DistributionAborted; entries already paid stay paid.
     */
    GovResult Execute(IAssetTransfer& payer);

private:
    DistributionPlan plan_;
    std::vector<bool> paid_;
    size_t unpaidCount_{0};
};

/**
 * Pull a holder's unclaimed remainder. If the payment fails the balance is
 * restored and TransferFailed is returned.
 */
GovResult ClaimUnclaimed(ledger::ShareholderLedger& ledger, IAssetTransfer& payer,
                         const Address& holder, Amount* claimed = nullptr);

// ============================================================================
// Pooled Capital
// ============================================================================

struct Contribution {
    Address contributor;
    Amount amount{0};
};

/// Sum of contributions
Amount TotalContributed(const std::vector<Contribution>& contributions);

/**
 * Mint shares 1:1 with each contribution. The sum must lie within
 * `tolerance` of `requiredCapital` (either side).
 */
GovResult MintPooledShares(ledger::ShareholderLedger& ledger,
                           const std::vector<Contribution>& contributions,
                           const Amount& requiredCapital, const Amount& tolerance);

/// As MintPooledShares, but the sum must equal `requiredCapital` exactly
GovResult MintPooledSharesStrict(ledger::ShareholderLedger& ledger,
                                 const std::vector<Contribution>& contributions,
                                 const Amount& requiredCapital);

} // namespace economics
} // namespace yieldgov

#endif // YIELDGOV_ECONOMICS_DISTRIBUTION_H
