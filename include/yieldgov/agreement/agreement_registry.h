// YIELDGOV - Yield Agreement Registry
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Registry of funded yield agreements. Each agreement owns the ownership
// ledger its investors hold shares in, a reserve balance held in the
// registry's custody account, and repayment terms.
//
// Rate, reserve and term setters are reserved to the configured governance
// address. Repayments are distributed pro-rata to the agreement's current
// holders; payments that fail are kept as unclaimed remainders.

#ifndef YIELDGOV_AGREEMENT_AGREEMENT_REGISTRY_H
#define YIELDGOV_AGREEMENT_AGREEMENT_REGISTRY_H

#include <yieldgov/core/error.h>
#include <yieldgov/core/types.h>
#include <yieldgov/economics/asset.h>
#include <yieldgov/economics/distribution.h>
#include <yieldgov/ledger/shareholder_ledger.h>
#include <yieldgov/util/reentrancy.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace yieldgov {

namespace kyc {
class IKycRegistry;
}

namespace agreement {

// ============================================================================
// Agreement Constants
// ============================================================================

/// Annual rate bounds (bp)
constexpr uint64_t MIN_ROI_BP = 100;
constexpr uint64_t MAX_ROI_BP = 5000;

constexpr uint32_t MONTHS_PER_YEAR = 12;

/// Term length bounds (months)
constexpr uint32_t MIN_TERM_MONTHS = 1;
constexpr uint32_t MAX_TERM_MONTHS = 360;

/// Parameter bounds
constexpr uint64_t MIN_GRACE_PERIOD_DAYS = 1;
constexpr uint64_t MAX_GRACE_PERIOD_DAYS = 90;
constexpr uint64_t MIN_DEFAULT_PENALTY_BP = 100;
constexpr uint64_t MAX_DEFAULT_PENALTY_BP = 2000;
constexpr uint64_t MIN_DEFAULT_THRESHOLD = 1;
constexpr uint64_t MAX_DEFAULT_THRESHOLD = 12;

/// Reserve allocations are capped at 20% of upfront capital
constexpr uint64_t MAX_RESERVE_BP = 2000;

/// Agreement fields addressable by an AgreementParameterUpdate proposal
enum class AgreementParam : uint8_t {
    GracePeriodDays = 0,
    DefaultPenaltyBP = 1,
    DefaultThreshold = 2,
    AllowPartialRepayments = 3,
    AllowEarlyRepayment = 4
};

constexpr uint64_t MAX_AGREEMENT_PARAM_ID = 4;

const char* AgreementParamToString(AgreementParam param);

std::optional<AgreementParam> AgreementParamFromId(uint64_t id);

/// Bounds check for a proposed agreement parameter value
GovResult ValidateAgreementParam(AgreementParam param, const Uint256& value);

// ============================================================================
// Agreement
// ============================================================================

struct AgreementTerms {
    Amount upfrontCapital{0};
    uint64_t roiBP{1000};
    uint32_t termMonths{12};
    uint64_t gracePeriodDays{30};
    uint64_t defaultPenaltyBP{500};
    uint64_t defaultThreshold{3};
    bool allowPartialRepayments{true};
    bool allowEarlyRepayment{true};
};

struct Agreement {
    AgreementId id{0};
    Address owner;
    Timestamp createdAt{0};

    Amount upfrontCapital{0};
    uint64_t roiBP{0};
    uint32_t termMonths{0};

    uint64_t gracePeriodDays{0};
    uint64_t defaultPenaltyBP{0};
    uint64_t defaultThreshold{0};
    bool allowPartialRepayments{false};
    bool allowEarlyRepayment{false};

    Amount reserveBalance{0};
    Amount totalRepaid{0};
    uint32_t repaymentsMade{0};
    bool active{true};

    /**
     * Level monthly payment amortizing the capital over termMonths at an
     * annual rate of roiBP (monthly rate roiBP / 12), rounded down. A zero
     * rate repays capital / termMonths.
     */
    Amount PeriodPayment() const;

    /// PeriodPayment * termMonths
    Amount TotalObligation() const;
};

// ============================================================================
// Collaborator Interface
// ============================================================================

class IAgreementRegistry {
public:
    virtual ~IAgreementRegistry() = default;

    /// nullptr if no such agreement
    virtual const Agreement* GetAgreement(AgreementId id) const = 0;

    /// Ledger the agreement's shares live in (nullptr if no such agreement)
    virtual const ledger::ShareholderLedger* GetLedger(AgreementId id) const = 0;
    virtual ledger::ShareholderLedger* GetLedger(AgreementId id) = 0;

    virtual GovResult SetAgreementROI(const Address& caller, AgreementId id, uint64_t roiBP) = 0;

    /// Pull `amount` through `funder` into custody and book it as reserve
    virtual GovResult AllocateReserve(const Address& caller, AgreementId id,
                                      const Amount& amount,
                                      economics::IAssetTransfer& funder) = 0;

    /// Pay `amount` of reserve out of custody to `recipient`
    virtual GovResult WithdrawReserve(const Address& caller, AgreementId id,
                                      const Amount& amount, const Address& recipient) = 0;

    virtual GovResult SetAgreementParam(const Address& caller, AgreementId id,
                                        AgreementParam param, const Uint256& value) = 0;
};

// ============================================================================
// Registry
// ============================================================================

class YieldAgreementRegistry : public IAgreementRegistry {
public:
    /**
     * @param owner   Administrator; may set the governance address
     * @param custody Account the registry holds funds in
     * @param payout  Pays out of `custody`
     */
    YieldAgreementRegistry(const Address& owner, const Address& custody,
                           economics::IAssetTransfer& payout,
                           size_t maxShareholders = ledger::DEFAULT_MAX_SHAREHOLDERS);

    YieldAgreementRegistry(const YieldAgreementRegistry&) = delete;
    YieldAgreementRegistry& operator=(const YieldAgreementRegistry&) = delete;

    const Address& GetOwner() const { return owner_; }
    const Address& GetCustody() const { return custody_; }
    const Address& GetGovernance() const { return governance_; }

    /// Owner only; also grants restriction rights on every agreement ledger
    GovResult SetGovernance(const Address& caller, const Address& governance);

    /// Attached to every current and future agreement ledger
    void SetKycRegistry(const kyc::IKycRegistry* registry);

    // ========================================================================
    // Creation
    // ========================================================================

    /**
     * Create an agreement and mint shares 1:1 to the contributors. The
     * contributions must sum to the upfront capital within
     * DEFAULT_POOLING_TOLERANCE_BP.
     */
    GovResult CreateAgreement(const Address& caller, const AgreementTerms& terms,
                              const std::vector<economics::Contribution>& contributions,
                              AgreementId& outId);

    /// As CreateAgreement, but the contributions must equal the capital exactly
    GovResult CreateAgreementStrict(const Address& caller, const AgreementTerms& terms,
                                    const std::vector<economics::Contribution>& contributions,
                                    AgreementId& outId);

    // ========================================================================
    // Queries
    // ========================================================================

    const Agreement* GetAgreement(AgreementId id) const override;
    const ledger::ShareholderLedger* GetLedger(AgreementId id) const override;
    ledger::ShareholderLedger* GetLedger(AgreementId id) override;

    size_t AgreementCount() const { return agreements_.size(); }
    AgreementId NextAgreementId() const { return nextId_; }

    // ========================================================================
    // Governance Setters
    // ========================================================================

    GovResult SetAgreementROI(const Address& caller, AgreementId id, uint64_t roiBP) override;

    GovResult AllocateReserve(const Address& caller, AgreementId id, const Amount& amount,
                              economics::IAssetTransfer& funder) override;

    GovResult WithdrawReserve(const Address& caller, AgreementId id, const Amount& amount,
                              const Address& recipient) override;

    GovResult SetAgreementParam(const Address& caller, AgreementId id,
                                AgreementParam param, const Uint256& value) override;

    // ========================================================================
    // Repayments
    // ========================================================================

    /**
     * Full period repayment pulled through `payer`, then distributed to the
     * current holders. Must be at least one period payment; more is only
     * accepted when early repayment is allowed.
     */
    GovResult MakeRepayment(economics::IAssetTransfer& payer, AgreementId id,
                            const Amount& amount,
                            economics::DistributionResult* result = nullptr);

    /// Less than one period payment; requires partial repayments to be allowed
    GovResult MakePartialRepayment(economics::IAssetTransfer& payer, AgreementId id,
                                   const Amount& amount,
                                   economics::DistributionResult* result = nullptr);

    /// Pay out `holder`'s unclaimed remainder for an agreement
    GovResult ClaimUnclaimedRemainder(const Address& holder, AgreementId id,
                                      Amount* claimed = nullptr);

private:
    struct Entry {
        Agreement agreement;
        std::unique_ptr<ledger::ShareholderLedger> ledger;
    };

    GovResult Create(const Address& caller, const AgreementTerms& terms,
                     const std::vector<economics::Contribution>& contributions,
                     bool strict, AgreementId& outId);

    GovResult RequireGovernance(const Address& caller) const;
    Entry* Find(AgreementId id);
    const Entry* Find(AgreementId id) const;

    GovResult Repay(economics::IAssetTransfer& payer, Entry& entry, const Amount& amount,
                    bool partial, economics::DistributionResult* result);

    Address owner_;
    Address custody_;
    Address governance_;
    economics::IAssetTransfer& payout_;
    size_t maxShareholders_;
    const kyc::IKycRegistry* kyc_{nullptr};

    std::map<AgreementId, Entry> agreements_;
    AgreementId nextId_{1};

    util::ReentrancyGuard guard_;
};

} // namespace agreement
} // namespace yieldgov

#endif // YIELDGOV_AGREEMENT_AGREEMENT_REGISTRY_H
