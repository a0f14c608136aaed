// YIELDGOV - Yield Agreement Registry Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/agreement/agreement_registry.h>
#include <yieldgov/util/logging.h>
#include <yieldgov/util/time.h>

namespace yieldgov {
namespace agreement {

// ============================================================================
// Parameter Helpers
// ============================================================================

const char* AgreementParamToString(AgreementParam param) {
    switch (param) {
        case AgreementParam::GracePeriodDays: return "GracePeriodDays";
        case AgreementParam::DefaultPenaltyBP: return "DefaultPenaltyBP";
        case AgreementParam::DefaultThreshold: return "DefaultThreshold";
        case AgreementParam::AllowPartialRepayments: return "AllowPartialRepayments";
        case AgreementParam::AllowEarlyRepayment: return "AllowEarlyRepayment";
        default: return "Unknown";
    }
}

std::optional<AgreementParam> AgreementParamFromId(uint64_t id) {
    if (id > MAX_AGREEMENT_PARAM_ID) {
        return std::nullopt;
    }
    return static_cast<AgreementParam>(id);
}

GovResult ValidateAgreementParam(AgreementParam param, const Uint256& value) {
    switch (param) {
        case AgreementParam::GracePeriodDays:
            if (value < MIN_GRACE_PERIOD_DAYS || value > MAX_GRACE_PERIOD_DAYS) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "grace period must be within [1, 90] days");
            }
            break;
        case AgreementParam::DefaultPenaltyBP:
            if (value < MIN_DEFAULT_PENALTY_BP || value > MAX_DEFAULT_PENALTY_BP) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "default penalty must be within [100, 2000] bp");
            }
            break;
        case AgreementParam::DefaultThreshold:
            if (value < MIN_DEFAULT_THRESHOLD || value > MAX_DEFAULT_THRESHOLD) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "default threshold must be within [1, 12] missed payments");
            }
            break;
        case AgreementParam::AllowPartialRepayments:
        case AgreementParam::AllowEarlyRepayment:
            if (value > 1) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       std::string(AgreementParamToString(param)) +
                                       " must be 0 or 1");
            }
            break;
        default:
            return GovResult::Fail(GovError::ParameterOutOfBounds, "unknown agreement parameter");
    }
    return GovResult::Ok();
}

namespace {

GovResult ValidateTerms(const AgreementTerms& terms) {
    if (terms.upfrontCapital == 0) {
        return GovResult::Fail(GovError::ParameterOutOfBounds, "upfront capital must be positive");
    }
    if (terms.roiBP < MIN_ROI_BP || terms.roiBP > MAX_ROI_BP) {
        return GovResult::Fail(GovError::ParameterOutOfBounds,
                               "ROI must be within [100, 5000] bp");
    }
    if (terms.termMonths < MIN_TERM_MONTHS || terms.termMonths > MAX_TERM_MONTHS) {
        return GovResult::Fail(GovError::ParameterOutOfBounds,
                               "term must be within [1, 360] months");
    }

    const std::pair<AgreementParam, uint64_t> fields[] = {
        {AgreementParam::GracePeriodDays, terms.gracePeriodDays},
        {AgreementParam::DefaultPenaltyBP, terms.defaultPenaltyBP},
        {AgreementParam::DefaultThreshold, terms.defaultThreshold},
    };
    for (const auto& [param, value] : fields) {
        GovResult valid = ValidateAgreementParam(param, Uint256(value));
        if (!valid) {
            return valid;
        }
    }
    return GovResult::Ok();
}

GovResult Busy() {
    return GovResult::Fail(GovError::Reentrancy, "registry call already in progress");
}

} // namespace

// ============================================================================
// Agreement
// ============================================================================

Amount Agreement::PeriodPayment() const {
    if (termMonths == 0) {
        return 0;
    }
    if (roiBP == 0) {
        return upfrontCapital / termMonths;
    }

    // P * r(1+r)^n / ((1+r)^n - 1) with r = roiBP / (12 * 10000), kept as the
    // exact fraction P * roi * a^n / (s * (a^n - s^n)) where s = 120000 and
    // a = s + roi. a^n outgrows 512 bits for long terms, hence cpp_int.
    using boost::multiprecision::cpp_int;
    const uint64_t scale = BASIS_POINTS * MONTHS_PER_YEAR;
    cpp_int grown = boost::multiprecision::pow(cpp_int(scale + roiBP), termMonths);
    cpp_int base = boost::multiprecision::pow(cpp_int(scale), termMonths);
    cpp_int payment = cpp_int(upfrontCapital) * roiBP * grown / (cpp_int(scale) * (grown - base));
    return static_cast<Amount>(payment);
}

Amount Agreement::TotalObligation() const {
    return PeriodPayment() * termMonths;
}

// ============================================================================
// Registry
// ============================================================================

YieldAgreementRegistry::YieldAgreementRegistry(const Address& owner, const Address& custody,
                                               economics::IAssetTransfer& payout,
                                               size_t maxShareholders)
    : owner_(owner), custody_(custody), payout_(payout), maxShareholders_(maxShareholders) {}

GovResult YieldAgreementRegistry::SetGovernance(const Address& caller, const Address& governance) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (caller != owner_) {
        return GovResult::Fail(GovError::Unauthorized, "only the owner may set governance");
    }
    governance_ = governance;
    for (auto& [id, entry] : agreements_) {
        GovResult set = entry.ledger->SetGovernance(entry.agreement.owner, governance);
        if (!set) {
            return set;
        }
    }
    LOG_INFO(util::LogCategory::REGISTRY) << "Governance set to " << governance.ToString();
    return GovResult::Ok();
}

void YieldAgreementRegistry::SetKycRegistry(const kyc::IKycRegistry* registry) {
    kyc_ = registry;
    for (auto& [id, entry] : agreements_) {
        entry.ledger->SetKycRegistry(registry);
    }
}

YieldAgreementRegistry::Entry* YieldAgreementRegistry::Find(AgreementId id) {
    auto it = agreements_.find(id);
    return it == agreements_.end() ? nullptr : &it->second;
}

const YieldAgreementRegistry::Entry* YieldAgreementRegistry::Find(AgreementId id) const {
    auto it = agreements_.find(id);
    return it == agreements_.end() ? nullptr : &it->second;
}

GovResult YieldAgreementRegistry::RequireGovernance(const Address& caller) const {
    if (governance_.IsNull() || caller != governance_) {
        return GovResult::Fail(GovError::Unauthorized, "caller is not governance");
    }
    return GovResult::Ok();
}

// ============================================================================
// Creation
// ============================================================================

GovResult YieldAgreementRegistry::Create(const Address& caller, const AgreementTerms& terms,
                                         const std::vector<economics::Contribution>& contributions,
                                         bool strict, AgreementId& outId) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    if (caller.IsNull()) {
        return GovResult::Fail(GovError::InvalidAddress, "creator is the zero address");
    }
    GovResult valid = ValidateTerms(terms);
    if (!valid) {
        return valid;
    }

    auto shares = std::make_unique<ledger::ShareholderLedger>(caller, maxShareholders_);
    if (!governance_.IsNull()) {
        GovResult wired = shares->SetGovernance(caller, governance_);
        if (!wired) {
            return wired;
        }
    }

    GovResult minted;
    if (strict) {
        minted = economics::MintPooledSharesStrict(*shares, contributions, terms.upfrontCapital);
    } else {
        Amount tolerance = ApplyBasisPoints(terms.upfrontCapital,
                                            economics::DEFAULT_POOLING_TOLERANCE_BP);
        minted = economics::MintPooledShares(*shares, contributions, terms.upfrontCapital,
                                             tolerance);
    }
    if (!minted) {
        return minted;
    }
    shares->SetKycRegistry(kyc_);

    Entry entry;
    entry.agreement.id = nextId_;
    entry.agreement.owner = caller;
    entry.agreement.createdAt = util::GetTime();
    entry.agreement.upfrontCapital = terms.upfrontCapital;
    entry.agreement.roiBP = terms.roiBP;
    entry.agreement.termMonths = terms.termMonths;
    entry.agreement.gracePeriodDays = terms.gracePeriodDays;
    entry.agreement.defaultPenaltyBP = terms.defaultPenaltyBP;
    entry.agreement.defaultThreshold = terms.defaultThreshold;
    entry.agreement.allowPartialRepayments = terms.allowPartialRepayments;
    entry.agreement.allowEarlyRepayment = terms.allowEarlyRepayment;
    entry.ledger = std::move(shares);

    outId = nextId_++;
    agreements_.emplace(outId, std::move(entry));

    LOG_INFO(util::LogCategory::REGISTRY) << "Agreement " << outId << " created by "
        << caller.ToString() << " capital=" << terms.upfrontCapital
        << " roi=" << terms.roiBP << "bp" << (strict ? " (strict pooling)" : "");
    return GovResult::Ok();
}

GovResult YieldAgreementRegistry::CreateAgreement(
    const Address& caller, const AgreementTerms& terms,
    const std::vector<economics::Contribution>& contributions, AgreementId& outId) {
    return Create(caller, terms, contributions, false, outId);
}

GovResult YieldAgreementRegistry::CreateAgreementStrict(
    const Address& caller, const AgreementTerms& terms,
    const std::vector<economics::Contribution>& contributions, AgreementId& outId) {
    return Create(caller, terms, contributions, true, outId);
}

// ============================================================================
// Queries
// ============================================================================

const Agreement* YieldAgreementRegistry::GetAgreement(AgreementId id) const {
    const Entry* entry = Find(id);
    return entry ? &entry->agreement : nullptr;
}

const ledger::ShareholderLedger* YieldAgreementRegistry::GetLedger(AgreementId id) const {
    const Entry* entry = Find(id);
    return entry ? entry->ledger.get() : nullptr;
}

ledger::ShareholderLedger* YieldAgreementRegistry::GetLedger(AgreementId id) {
    Entry* entry = Find(id);
    return entry ? entry->ledger.get() : nullptr;
}

// ============================================================================
// Governance Setters
// ============================================================================

GovResult YieldAgreementRegistry::SetAgreementROI(const Address& caller, AgreementId id,
                                                  uint64_t roiBP) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    GovResult auth = RequireGovernance(caller);
    if (!auth) {
        return auth;
    }
    Entry* entry = Find(id);
    if (!entry) {
        return GovResult::Fail(GovError::AgreementNotFound, "no agreement " + std::to_string(id));
    }
    if (roiBP < MIN_ROI_BP || roiBP > MAX_ROI_BP) {
        return GovResult::Fail(GovError::ParameterOutOfBounds, "ROI must be within [100, 5000] bp");
    }

    uint64_t previous = entry->agreement.roiBP;
    entry->agreement.roiBP = roiBP;
    LOG_INFO(util::LogCategory::REGISTRY) << "ROIAdjusted agreement=" << id << " "
                                          << previous << "bp -> " << roiBP << "bp";
    return GovResult::Ok();
}

GovResult YieldAgreementRegistry::AllocateReserve(const Address& caller, AgreementId id,
                                                  const Amount& amount,
                                                  economics::IAssetTransfer& funder) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    GovResult auth = RequireGovernance(caller);
    if (!auth) {
        return auth;
    }
    Entry* entry = Find(id);
    if (!entry) {
        return GovResult::Fail(GovError::AgreementNotFound, "no agreement " + std::to_string(id));
    }
    if (amount == 0) {
        return GovResult::Fail(GovError::ParameterOutOfBounds, "reserve amount must be positive");
    }

    if (!funder.Transfer(custody_, amount)) {
        return GovResult::Fail(GovError::ReserveUnavailable, "reserve funding transfer failed");
    }
    entry->agreement.reserveBalance += amount;

    LOG_INFO(util::LogCategory::REGISTRY) << "ReserveAllocated agreement=" << id
        << " amount=" << amount << " reserve=" << entry->agreement.reserveBalance;
    return GovResult::Ok();
}

GovResult YieldAgreementRegistry::WithdrawReserve(const Address& caller, AgreementId id,
                                                  const Amount& amount, const Address& recipient) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    GovResult auth = RequireGovernance(caller);
    if (!auth) {
        return auth;
    }
    Entry* entry = Find(id);
    if (!entry) {
        return GovResult::Fail(GovError::AgreementNotFound, "no agreement " + std::to_string(id));
    }
    if (amount == 0 || amount > entry->agreement.reserveBalance) {
        return GovResult::Fail(GovError::ReserveUnavailable,
                               "withdrawal exceeds reserve of " +
                               ToDecimalString(entry->agreement.reserveBalance));
    }

    // Book first; a re-entrant withdrawal must see the reduced reserve
    entry->agreement.reserveBalance -= amount;
    if (!payout_.Transfer(recipient, amount)) {
        entry->agreement.reserveBalance += amount;
        return GovResult::Fail(GovError::TransferFailed, "reserve payout failed");
    }

    LOG_INFO(util::LogCategory::REGISTRY) << "ReserveWithdrawn agreement=" << id
        << " amount=" << amount << " to " << recipient.ToString();
    return GovResult::Ok();
}

GovResult YieldAgreementRegistry::SetAgreementParam(const Address& caller, AgreementId id,
                                                    AgreementParam param, const Uint256& value) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    GovResult auth = RequireGovernance(caller);
    if (!auth) {
        return auth;
    }
    Entry* entry = Find(id);
    if (!entry) {
        return GovResult::Fail(GovError::AgreementNotFound, "no agreement " + std::to_string(id));
    }
    GovResult valid = ValidateAgreementParam(param, value);
    if (!valid) {
        return valid;
    }

    Agreement& a = entry->agreement;
    switch (param) {
        case AgreementParam::GracePeriodDays:
            a.gracePeriodDays = value.convert_to<uint64_t>();
            break;
        case AgreementParam::DefaultPenaltyBP:
            a.defaultPenaltyBP = value.convert_to<uint64_t>();
            break;
        case AgreementParam::DefaultThreshold:
            a.defaultThreshold = value.convert_to<uint64_t>();
            break;
        case AgreementParam::AllowPartialRepayments:
            a.allowPartialRepayments = (value == 1);
            break;
        case AgreementParam::AllowEarlyRepayment:
            a.allowEarlyRepayment = (value == 1);
            break;
    }

    LOG_INFO(util::LogCategory::REGISTRY) << "Agreement " << id << " "
        << AgreementParamToString(param) << "=" << value;
    return GovResult::Ok();
}

// ============================================================================
// Repayments
// ============================================================================

GovResult YieldAgreementRegistry::Repay(economics::IAssetTransfer& payer, Entry& entry,
                                        const Amount& amount, bool partial,
                                        economics::DistributionResult* result) {
    Agreement& a = entry.agreement;
    if (!a.active) {
        return GovResult::Fail(GovError::AgreementInactive,
                               "agreement " + std::to_string(a.id) + " is fully repaid");
    }

    Amount period = a.PeriodPayment();
    if (partial) {
        if (!a.allowPartialRepayments) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "partial repayments are disabled");
        }
        if (amount == 0 || amount >= period) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "partial repayment must be below the period payment of " +
                                   ToDecimalString(period));
        }
    } else {
        if (amount < period) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "repayment below period payment of " +
                                   ToDecimalString(period));
        }
        if (amount > period && !a.allowEarlyRepayment) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "early repayment is disabled");
        }
    }

    if (entry.ledger->TotalShares() == 0) {
        return GovResult::Fail(GovError::NoShareholders, "agreement has no shareholders");
    }

    if (!payer.Transfer(custody_, amount)) {
        return GovResult::Fail(GovError::TransferFailed, "repayment transfer failed");
    }

    GovResult distributed = partial
        ? economics::DistributePartialRepayment(*entry.ledger, payout_, amount, period, result)
        : economics::DistributeRepayment(*entry.ledger, payout_, amount, result);
    if (!distributed) {
        return distributed;
    }

    a.totalRepaid += amount;
    if (!partial) {
        ++a.repaymentsMade;
    }
    if (a.totalRepaid >= a.TotalObligation()) {
        a.active = false;
        LOG_INFO(util::LogCategory::REGISTRY) << "Agreement " << a.id << " fully repaid";
    }
    return GovResult::Ok();
}

GovResult YieldAgreementRegistry::MakeRepayment(economics::IAssetTransfer& payer, AgreementId id,
                                                const Amount& amount,
                                                economics::DistributionResult* result) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    Entry* entry = Find(id);
    if (!entry) {
        return GovResult::Fail(GovError::AgreementNotFound, "no agreement " + std::to_string(id));
    }
    return Repay(payer, *entry, amount, false, result);
}

GovResult YieldAgreementRegistry::MakePartialRepayment(economics::IAssetTransfer& payer,
                                                       AgreementId id, const Amount& amount,
                                                       economics::DistributionResult* result) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    Entry* entry = Find(id);
    if (!entry) {
        return GovResult::Fail(GovError::AgreementNotFound, "no agreement " + std::to_string(id));
    }
    return Repay(payer, *entry, amount, true, result);
}

GovResult YieldAgreementRegistry::ClaimUnclaimedRemainder(const Address& holder, AgreementId id,
                                                          Amount* claimed) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return Busy();
    }
    Entry* entry = Find(id);
    if (!entry) {
        return GovResult::Fail(GovError::AgreementNotFound, "no agreement " + std::to_string(id));
    }
    return economics::ClaimUnclaimed(*entry->ledger, payout_, holder, claimed);
}

} // namespace agreement
} // namespace yieldgov
