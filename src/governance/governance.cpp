// YIELDGOV - Governance Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/governance/governance.h>

#include <yieldgov/agreement/agreement_registry.h>
#include <yieldgov/kyc/kyc_registry.h>
#include <yieldgov/ledger/restrictions.h>
#include <yieldgov/ledger/shareholder_ledger.h>
#include <yieldgov/util/logging.h>
#include <yieldgov/util/time.h>

#include <stdexcept>

namespace yieldgov {
namespace governance {

// ============================================================================
// String Conversions
// ============================================================================

const char* VoteSupportToString(VoteSupport support) {
    switch (support) {
        case VoteSupport::Against: return "Against";
        case VoteSupport::For:     return "For";
        case VoteSupport::Abstain: return "Abstain";
        default:                   return "Unknown";
    }
}

const char* ProposalStateToString(ProposalState state) {
    switch (state) {
        case ProposalState::Pending:   return "Pending";
        case ProposalState::Active:    return "Active";
        case ProposalState::Succeeded: return "Succeeded";
        case ProposalState::Defeated:  return "Defeated";
        case ProposalState::Executed:  return "Executed";
        default:                       return "Unknown";
    }
}

GovResult Proposal::Payload(ProposalPayload& out) const {
    return DecodePayload(type, agreementId, targetValue, out);
}

// ============================================================================
// GovernanceController
// ============================================================================

GovernanceController::GovernanceController(const Address& self,
                                           IVotingPowerSource& power,
                                           agreement::IAgreementRegistry& registry,
                                           economics::IAssetTransfer& custody,
                                           const GovernanceConfig& config)
    : self_(self)
    , power_(power)
    , registry_(registry)
    , custody_(custody)
    , params_(config.params)
    , mode_(config.mode)
    , snapshots_(power) {
    if (self_.IsNull()) {
        throw std::invalid_argument("governance address must be non-zero");
    }
    GovResult valid = ValidateGovernanceParameters(params_);
    if (!valid) {
        throw std::invalid_argument(valid.ToString());
    }
}

// ============================================================================
// Proposal Creation
// ============================================================================

GovResult GovernanceController::CreateProposal(const Address& caller, AgreementId agreementId,
                                               ProposalType type, const Uint256& targetValue,
                                               const std::string& description,
                                               ProposalId& outId) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return GovResult::Fail(GovError::Reentrancy, "governance call in progress");
    }

    ShareCount supply = power_.TotalSupply(agreementId);
    ShareCount required = MulDiv(supply, Uint256(params_.thresholdBP), Uint256(BASIS_POINTS));
    ShareCount votingPower = power_.BalanceOf(caller, agreementId);
    if (votingPower < required) {
        return GovResult::Fail(GovError::ThresholdNotMet,
            "voting power " + ToDecimalString(votingPower) +
            " below proposal threshold " + ToDecimalString(required));
    }

    GovResult valid = ValidateProposal(agreementId, type, targetValue);
    if (!valid) {
        return valid;
    }

    return Open(caller, agreementId, type, targetValue, description, outId);
}

GovResult GovernanceController::CreateProposal(const Address& caller,
                                               const ProposalPayload& payload,
                                               const std::string& description,
                                               ProposalId& outId) {
    PackedPayload packed;
    try {
        packed = EncodePayload(payload);
    } catch (const std::invalid_argument& e) {
        return GovResult::Fail(GovError::ParameterOutOfBounds, e.what());
    }

    if (packed.type == ProposalType::KYCWhitelistUpdate) {
        const auto& update = std::get<KycWhitelistUpdate>(payload);
        return CreateKYCWhitelistProposal(caller, update.account, update.add,
                                          description, outId);
    }

    return CreateProposal(caller, packed.agreementId, packed.type, packed.targetValue,
                          description, outId);
}

GovResult GovernanceController::CreateKYCWhitelistProposal(const Address& caller,
                                                           const Address& target, bool add,
                                                           const std::string& description,
                                                           ProposalId& outId) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return GovResult::Fail(GovError::Reentrancy, "governance call in progress");
    }

    if (target.IsNull()) {
        return GovResult::Fail(GovError::ParameterOutOfBounds,
                               "KYC target address must be non-zero");
    }

    return Open(caller, 0, ProposalType::KYCWhitelistUpdate, PackKycUpdate(target, add),
                description, outId);
}

GovResult GovernanceController::ValidateProposal(AgreementId agreementId, ProposalType type,
                                                 const Uint256& targetValue) const {
    ProposalPayload payload;
    GovResult decoded = DecodePayload(type, agreementId, targetValue, payload);
    if (!decoded) {
        return decoded;
    }

    if (std::holds_alternative<RoiAdjustment>(payload)) {
        const auto& roi = std::get<RoiAdjustment>(payload);
        const agreement::Agreement* target = registry_.GetAgreement(roi.agreementId);
        if (!target) {
            return GovResult::Fail(GovError::AgreementNotFound, "agreement does not exist");
        }
        if (roi.roiBP < agreement::MIN_ROI_BP || roi.roiBP > agreement::MAX_ROI_BP) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "ROI target must be within [100, 5000] bp");
        }
        uint64_t current = target->roiBP;
        uint64_t proposed = roi.roiBP;
        uint64_t deviation = proposed > current ? proposed - current : current - proposed;
        if (deviation > MAX_ROI_DEVIATION_BP) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                "ROI change of " + std::to_string(deviation) +
                " bp exceeds maximum deviation of 500 bp");
        }
        return GovResult::Ok();
    }

    if (std::holds_alternative<ReserveAllocation>(payload)) {
        const auto& alloc = std::get<ReserveAllocation>(payload);
        const agreement::Agreement* target = registry_.GetAgreement(alloc.agreementId);
        if (!target) {
            return GovResult::Fail(GovError::AgreementNotFound, "agreement does not exist");
        }
        if (alloc.amount == 0) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "reserve allocation must be positive");
        }
        Amount cap = ApplyBasisPoints(target->upfrontCapital, agreement::MAX_RESERVE_BP);
        if (alloc.amount > cap) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                "reserve allocation exceeds 20% of upfront capital (max " +
                ToDecimalString(cap) + ")");
        }
        return GovResult::Ok();
    }

    if (std::holds_alternative<ReserveWithdrawal>(payload)) {
        const auto& withdrawal = std::get<ReserveWithdrawal>(payload);
        const agreement::Agreement* target = registry_.GetAgreement(withdrawal.agreementId);
        if (!target) {
            return GovResult::Fail(GovError::AgreementNotFound, "agreement does not exist");
        }
        if (withdrawal.amount == 0) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "reserve withdrawal must be positive");
        }
        if (withdrawal.amount > target->reserveBalance) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                "reserve withdrawal exceeds reserve balance " +
                ToDecimalString(target->reserveBalance));
        }
        return GovResult::Ok();
    }

    if (std::holds_alternative<GovernanceParamUpdate>(payload)) {
        const auto& update = std::get<GovernanceParamUpdate>(payload);
        auto param = GovernanceParamFromId(update.paramId);
        if (!param) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "governance parameter id must be <= 3");
        }
        return ValidateGovernanceParam(*param, update.value);
    }

    if (std::holds_alternative<AgreementParamUpdate>(payload)) {
        const auto& update = std::get<AgreementParamUpdate>(payload);
        auto param = agreement::AgreementParamFromId(update.paramId);
        if (!param) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "agreement parameter id must be <= 4");
        }
        GovResult bounds = agreement::ValidateAgreementParam(*param, update.value);
        if (!bounds) {
            return bounds;
        }
        if (!registry_.GetAgreement(update.agreementId)) {
            return GovResult::Fail(GovError::AgreementNotFound, "agreement does not exist");
        }
        return GovResult::Ok();
    }

    if (std::holds_alternative<RestrictionParamUpdate>(payload)) {
        const auto& update = std::get<RestrictionParamUpdate>(payload);
        auto param = ledger::RestrictionParamFromId(update.paramId);
        if (!param) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "restriction parameter id must be <= 2");
        }
        GovResult bounds = ledger::ValidateRestrictionParam(*param, update.value,
                                                            util::GetTime());
        if (!bounds) {
            return bounds;
        }
        if (!power_.LedgerFor(update.agreementId)) {
            return GovResult::Fail(GovError::AgreementNotFound,
                                   "no ledger for agreement");
        }
        return GovResult::Ok();
    }

    const auto& update = std::get<KycWhitelistUpdate>(payload);
    if (update.account.IsNull()) {
        return GovResult::Fail(GovError::ParameterOutOfBounds,
                               "KYC target address must be non-zero");
    }
    return GovResult::Ok();
}

GovResult GovernanceController::Open(const Address& caller, AgreementId agreementId,
                                     ProposalType type, const Uint256& targetValue,
                                     const std::string& description, ProposalId& outId) {
    Timestamp now = util::GetTime();

    Proposal proposal;
    proposal.id = proposalCount_ + 1;
    proposal.proposer = caller;
    proposal.agreementId = agreementId;
    proposal.type = type;
    proposal.targetValue = targetValue;
    proposal.description = description;
    proposal.createdAt = now;
    proposal.votingStart = now + params_.votingDelay;
    proposal.votingEnd = proposal.votingStart + params_.votingPeriod;

    proposalCount_ = proposal.id;
    proposals_[proposal.id] = proposal;

    if (mode_ == VotingPowerMode::Snapshot) {
        snapshots_.Open(proposal.id, agreementId);
    }

    events_.Append(EventType::ProposalCreated, now, proposal.id, caller, targetValue, 0,
                   ProposalTypeToString(type));

    LOG_INFO(util::LogCategory::GOVERNANCE)
        << "ProposalCreated id=" << proposal.id
        << " type=" << ProposalTypeToString(type)
        << " agreement=" << agreementId
        << " proposer=" << caller.ToString()
        << " votingStart=" << proposal.votingStart
        << " votingEnd=" << proposal.votingEnd;

    outId = proposal.id;
    return GovResult::Ok();
}

// ============================================================================
// Voting
// ============================================================================

GovResult GovernanceController::CastVote(const Address& caller, ProposalId proposalId,
                                         uint8_t support) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return GovResult::Fail(GovError::Reentrancy, "governance call in progress");
    }

    auto it = proposals_.find(proposalId);
    if (it == proposals_.end()) {
        return GovResult::Fail(GovError::ProposalNotFound,
                               "proposal " + std::to_string(proposalId) + " does not exist");
    }
    Proposal& proposal = it->second;

    if (support > static_cast<uint8_t>(VoteSupport::Abstain)) {
        return GovResult::Fail(GovError::InvalidVoteType,
                               "support must be 0 (against), 1 (for) or 2 (abstain)");
    }

    Timestamp now = util::GetTime();
    if (now < proposal.votingStart || now > proposal.votingEnd) {
        return GovResult::Fail(GovError::ProposalNotActive, "voting window is not open");
    }

    if (votes_.count({proposalId, caller}) > 0) {
        return GovResult::Fail(GovError::AlreadyVoted, "address has already voted");
    }

    ShareCount weight = mode_ == VotingPowerMode::Snapshot
        ? snapshots_.BalanceOf(proposalId, caller)
        : power_.BalanceOf(caller, proposal.agreementId);
    if (weight == 0) {
        return GovResult::Fail(GovError::InsufficientVotingPower, "no voting power");
    }

    votes_.insert({proposalId, caller});
    switch (static_cast<VoteSupport>(support)) {
        case VoteSupport::Against: proposal.againstVotes += weight; break;
        case VoteSupport::For:     proposal.forVotes += weight; break;
        case VoteSupport::Abstain: proposal.abstainVotes += weight; break;
    }

    events_.Append(EventType::VoteCast, now, proposalId, caller, weight, support);

    LOG_INFO(util::LogCategory::GOVERNANCE)
        << "VoteCast id=" << proposalId
        << " voter=" << caller.ToString()
        << " support=" << VoteSupportToString(static_cast<VoteSupport>(support))
        << " weight=" << weight;

    return GovResult::Ok();
}

// ============================================================================
// Execution
// ============================================================================

GovResult GovernanceController::ExecuteProposal(const Address& caller, ProposalId proposalId) {
    util::ReentrancyScope scope(guard_);
    if (!scope.Acquired()) {
        return GovResult::Fail(GovError::Reentrancy, "governance call in progress");
    }

    auto it = proposals_.find(proposalId);
    if (it == proposals_.end()) {
        return GovResult::Fail(GovError::ProposalNotFound,
                               "proposal " + std::to_string(proposalId) + " does not exist");
    }
    Proposal& proposal = it->second;

    if (proposal.executed) {
        return GovResult::Fail(GovError::ProposalAlreadyExecuted, "proposal already executed");
    }

    if (util::GetTime() <= proposal.votingEnd) {
        return GovResult::Fail(GovError::VotingNotEnded, "voting period has not ended");
    }

    // An interrupted reserve payout already passed; finish it.
    if (pending_.count(proposalId) > 0) {
        GovResult resumed = ResumeDistribution(proposal);
        if (!resumed) {
            return resumed;
        }
        MarkExecuted(proposal, caller);
        return GovResult::Ok();
    }

    bool quorumReached = false;
    bool passed = Passes(proposal, quorumReached);

    if (!quorumReached) {
        proposal.quorumReached = false;
        Defeat(proposal, caller, "quorum not reached");
        return GovResult::Ok();
    }
    if (!passed) {
        proposal.quorumReached = true;
        Defeat(proposal, caller, "majority not reached");
        return GovResult::Ok();
    }

    // A failed dispatch leaves the proposal untouched
    GovResult dispatched = Dispatch(proposal);
    if (!dispatched) {
        LOG_WARN(util::LogCategory::GOVERNANCE)
            << "Dispatch failed id=" << proposalId << ": " << dispatched.ToString();
        return dispatched;
    }

    proposal.quorumReached = true;
    MarkExecuted(proposal, caller);
    return GovResult::Ok();
}

bool GovernanceController::Passes(const Proposal& proposal, bool& quorumReached) const {
    ShareCount required = MulDiv(GetQuorumSupply(proposal.id), Uint256(params_.quorumBP),
                                 Uint256(BASIS_POINTS));
    quorumReached = proposal.TotalVotes() >= required;
    return quorumReached && proposal.forVotes > proposal.againstVotes;
}

void GovernanceController::Defeat(Proposal& proposal, const Address& caller,
                                  const std::string& why) {
    proposal.defeated = true;
    events_.Append(EventType::ProposalDefeated, util::GetTime(), proposal.id, caller,
                   proposal.TotalVotes(), 0, why);

    LOG_INFO(util::LogCategory::GOVERNANCE)
        << "ProposalDefeated id=" << proposal.id << " (" << why << ")"
        << " for=" << proposal.forVotes
        << " against=" << proposal.againstVotes
        << " abstain=" << proposal.abstainVotes;
}

void GovernanceController::MarkExecuted(Proposal& proposal, const Address& caller) {
    proposal.executed = true;
    proposal.defeated = false;
    events_.Append(EventType::ProposalExecuted, util::GetTime(), proposal.id, caller,
                   proposal.targetValue, 0, ProposalTypeToString(proposal.type));

    LOG_INFO(util::LogCategory::GOVERNANCE)
        << "ProposalExecuted id=" << proposal.id
        << " type=" << ProposalTypeToString(proposal.type);
}

// ============================================================================
// Dispatch
// ============================================================================

GovResult GovernanceController::Dispatch(Proposal& proposal) {
    ProposalPayload payload;
    GovResult decoded = proposal.Payload(payload);
    if (!decoded) {
        return decoded;
    }

    Timestamp now = util::GetTime();

    if (std::holds_alternative<RoiAdjustment>(payload)) {
        const auto& roi = std::get<RoiAdjustment>(payload);
        GovResult r = registry_.SetAgreementROI(self_, roi.agreementId, roi.roiBP);
        if (r) {
            events_.Append(EventType::ROIAdjusted, now, proposal.id, self_, Uint256(roi.roiBP));
        }
        return r;
    }

    if (std::holds_alternative<ReserveAllocation>(payload)) {
        const auto& alloc = std::get<ReserveAllocation>(payload);
        // Funds waiting on an interrupted payout are not available
        Amount balance = custody_.Balance();
        Amount reserved = ReservedForPending();
        Amount available = balance > reserved ? balance - reserved : Amount(0);
        if (available < alloc.amount) {
            return GovResult::Fail(GovError::ReserveUnavailable,
                "governance custody has " + ToDecimalString(available) +
                " available (" + ToDecimalString(reserved) + " held for pending payouts)");
        }
        GovResult r = registry_.AllocateReserve(self_, alloc.agreementId, alloc.amount, custody_);
        if (r) {
            events_.Append(EventType::ReserveAllocated, now, proposal.id, self_, alloc.amount);
        }
        return r;
    }

    if (std::holds_alternative<ReserveWithdrawal>(payload)) {
        return DispatchReserveWithdrawal(proposal, std::get<ReserveWithdrawal>(payload).amount);
    }

    if (std::holds_alternative<GovernanceParamUpdate>(payload)) {
        const auto& update = std::get<GovernanceParamUpdate>(payload);
        auto param = GovernanceParamFromId(update.paramId);
        if (!param) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "governance parameter id must be <= 3");
        }
        GovResult bounds = ValidateGovernanceParam(*param, update.value);
        if (!bounds) {
            return bounds;
        }
        params_.Apply(*param, update.value);
        events_.Append(EventType::GovernanceParameterUpdated, now, proposal.id, self_,
                       update.value, 0, GovernanceParamToString(*param));

        LOG_INFO(util::LogCategory::GOVERNANCE)
            << "GovernanceParameterUpdated " << GovernanceParamToString(*param)
            << "=" << update.value;
        return GovResult::Ok();
    }

    if (std::holds_alternative<AgreementParamUpdate>(payload)) {
        const auto& update = std::get<AgreementParamUpdate>(payload);
        auto param = agreement::AgreementParamFromId(update.paramId);
        if (!param) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "agreement parameter id must be <= 4");
        }
        GovResult r = registry_.SetAgreementParam(self_, update.agreementId, *param,
                                                  update.value);
        if (r) {
            events_.Append(EventType::AgreementParameterUpdated, now, proposal.id, self_,
                           update.value, 0, agreement::AgreementParamToString(*param));
        }
        return r;
    }

    if (std::holds_alternative<RestrictionParamUpdate>(payload)) {
        const auto& update = std::get<RestrictionParamUpdate>(payload);
        auto param = ledger::RestrictionParamFromId(update.paramId);
        if (!param) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "restriction parameter id must be <= 2");
        }
        ledger::ShareholderLedger* target = power_.LedgerFor(update.agreementId);
        if (!target) {
            return GovResult::Fail(GovError::AgreementNotFound, "no ledger for agreement");
        }
        GovResult r = target->SetRestrictionParam(self_, *param, update.value);
        if (r) {
            events_.Append(EventType::TransferRestrictionUpdated, now, proposal.id, self_,
                           update.value, 0, ledger::RestrictionParamToString(*param));
        }
        return r;
    }

    const auto& update = std::get<KycWhitelistUpdate>(payload);
    if (!kyc_) {
        return GovResult::Fail(GovError::DispatchFailed, "no KYC registry attached");
    }
    GovResult r = update.add ? kyc_->AddToWhitelist(self_, update.account)
                             : kyc_->RemoveFromWhitelist(self_, update.account);
    if (r) {
        events_.Append(EventType::KYCWhitelistUpdated, now, proposal.id, self_,
                       update.account.ToUint256(), 0, update.add ? "add" : "remove");
    }
    return r;
}

GovResult GovernanceController::DispatchReserveWithdrawal(Proposal& proposal,
                                                          const Amount& amount) {
    ledger::ShareholderLedger* holders = power_.LedgerFor(proposal.agreementId);
    if (!holders || holders->TotalShares() == 0) {
        return GovResult::Fail(GovError::NoShareholders, "agreement has no shareholders");
    }

    GovResult withdrawn = registry_.WithdrawReserve(self_, proposal.agreementId, amount, self_);
    if (!withdrawn) {
        return withdrawn;
    }

    pending_[proposal.id] = economics::PendingDistribution(
        economics::PlanProRata(*holders, amount));
    return ResumeDistribution(proposal);
}

GovResult GovernanceController::ResumeDistribution(Proposal& proposal) {
    auto it = pending_.find(proposal.id);
    economics::PendingDistribution& pending = it->second;

    GovResult r = pending.Execute(custody_);
    Timestamp now = util::GetTime();
    if (!r) {
        events_.Append(EventType::DistributionAborted, now, proposal.id, self_,
                       pending.Outstanding(), 0, r.reason);

        LOG_WARN(util::LogCategory::DISTRIBUTION)
            << "DistributionAborted proposal=" << proposal.id
            << " outstanding=" << pending.Outstanding()
            << " unpaid=" << pending.UnpaidCount();
        return r;
    }

    const economics::DistributionPlan& plan = pending.Plan();
    events_.Append(EventType::ReserveDistributedToHolders, now, proposal.id, self_,
                   plan.total, 0, std::to_string(plan.allocations.size()) + " holders");

    LOG_INFO(util::LogCategory::DISTRIBUTION)
        << "ReserveDistributedToHolders proposal=" << proposal.id
        << " amount=" << plan.total
        << " holders=" << plan.allocations.size()
        << " remainder=" << plan.remainder;

    pending_.erase(it);
    return GovResult::Ok();
}

// ============================================================================
// Queries
// ============================================================================

const Proposal* GovernanceController::GetProposal(ProposalId proposalId) const {
    auto it = proposals_.find(proposalId);
    return it != proposals_.end() ? &it->second : nullptr;
}

std::optional<ProposalState> GovernanceController::GetProposalState(ProposalId proposalId) const {
    const Proposal* proposal = GetProposal(proposalId);
    if (!proposal) {
        return std::nullopt;
    }
    if (proposal->executed) {
        return ProposalState::Executed;
    }

    Timestamp now = util::GetTime();
    if (now < proposal->votingStart) {
        return ProposalState::Pending;
    }
    if (now <= proposal->votingEnd) {
        return ProposalState::Active;
    }

    bool quorumReached = false;
    return Passes(*proposal, quorumReached) ? ProposalState::Succeeded : ProposalState::Defeated;
}

bool GovernanceController::HasVoted(ProposalId proposalId, const Address& voter) const {
    return votes_.count({proposalId, voter}) > 0;
}

ShareCount GovernanceController::GetVotingPower(ProposalId proposalId, const Address& voter) {
    const Proposal* proposal = GetProposal(proposalId);
    if (!proposal) {
        return 0;
    }
    if (mode_ == VotingPowerMode::Snapshot) {
        return snapshots_.BalanceOf(proposalId, voter);
    }
    return power_.BalanceOf(voter, proposal->agreementId);
}

ShareCount GovernanceController::GetQuorumSupply(ProposalId proposalId) const {
    const Proposal* proposal = GetProposal(proposalId);
    if (!proposal) {
        return 0;
    }
    if (mode_ == VotingPowerMode::Snapshot && snapshots_.IsOpen(proposalId)) {
        return snapshots_.TotalSupply(proposalId);
    }
    return power_.TotalSupply(proposal->agreementId);
}

Amount GovernanceController::ReservedForPending() const {
    Amount total = 0;
    for (const auto& [id, pending] : pending_) {
        total += pending.Outstanding();
    }
    return total;
}

const economics::PendingDistribution*
GovernanceController::GetPendingDistribution(ProposalId proposalId) const {
    auto it = pending_.find(proposalId);
    return it != pending_.end() ? &it->second : nullptr;
}

} // namespace governance
} // namespace yieldgov
