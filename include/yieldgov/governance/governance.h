// YIELDGOV - Governance Module
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Token-weighted governance over yield agreements.
//
// Lifecycle:
// - A holder with at least thresholdBP of the agreement's supply creates a
//   proposal. Voting opens votingDelay later and lasts votingPeriod.
// - Each address votes once (against, for or abstain) with its voting power.
// - After votingEnd anyone may execute. Quorum counts all three tallies;
//   the majority test is for > against. A proposal failing either test is
//   marked defeated without error and may be evaluated again later; only a
//   successful execution is final.
// - Execution dispatches the action into the agreement registry, the
//   ledger's restriction state, the governance parameters or the KYC
//   registry. A failed dispatch leaves the proposal unexecuted.
//
// Reserve withdrawals pay the withdrawn funds straight out to the
// agreement's holders. If one payment fails the run stops, the rest of the
// funds stay in governance custody, and a later ExecuteProposal finishes
// the remaining payments. Payments already delivered are not reversed.
// Custody funds owed to an unfinished payout are held back from reserve
// allocations.

#ifndef YIELDGOV_GOVERNANCE_GOVERNANCE_H
#define YIELDGOV_GOVERNANCE_GOVERNANCE_H

#include <yieldgov/core/error.h>
#include <yieldgov/core/types.h>
#include <yieldgov/economics/asset.h>
#include <yieldgov/economics/distribution.h>
#include <yieldgov/governance/events.h>
#include <yieldgov/governance/parameters.h>
#include <yieldgov/governance/payload.h>
#include <yieldgov/governance/voting_power.h>
#include <yieldgov/util/reentrancy.h>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace yieldgov {

namespace agreement {
class IAgreementRegistry;
}

namespace kyc {
class IKycRegistry;
}

namespace governance {

// ============================================================================
// Governance Types
// ============================================================================

enum class VoteSupport : uint8_t {
    Against = 0,
    For = 1,
    Abstain = 2
};

const char* VoteSupportToString(VoteSupport support);

/// Derived view of a proposal at a point in time
enum class ProposalState {
    /// Voting has not started
    Pending,

    /// Voting window open (inclusive of votingEnd)
    Active,

    /// Voting over; quorum and majority currently hold
    Succeeded,

    /// Voting over; quorum or majority currently fails
    Defeated,

    /// Dispatched successfully
    Executed
};

const char* ProposalStateToString(ProposalState state);

struct Proposal {
    ProposalId id{0};
    Address proposer;

    /// Target agreement, or the parameter id for GovernanceParameterUpdate
    AgreementId agreementId{0};

    ProposalType type{ProposalType::ROIAdjustment};

    /// Raw or packed value (see payload.h)
    Uint256 targetValue{0};

    std::string description;

    Timestamp createdAt{0};
    Timestamp votingStart{0};
    Timestamp votingEnd{0};

    ShareCount forVotes{0};
    ShareCount againstVotes{0};
    ShareCount abstainVotes{0};

    bool executed{false};

    /// Outcome of the last failed evaluation; does not block re-evaluation
    bool defeated{false};

    /// Cached result of the last quorum evaluation
    bool quorumReached{false};

    ShareCount TotalVotes() const { return forVotes + againstVotes + abstainVotes; }

    /// Typed view of the stored action
    GovResult Payload(ProposalPayload& out) const;
};

// ============================================================================
// Governance Controller
// ============================================================================

class GovernanceController {
public:
    /**
     * @param self     Governance address; authorizes dispatch calls and is
     *                 the custody account `custody` pays from
     * @param power    Voting power and ledger lookup
     * @param registry Agreement registry the actions apply to
     * @param custody  Pays out of governance custody
     * @param config   Throws std::invalid_argument if out of bounds
     */
    GovernanceController(const Address& self,
                         IVotingPowerSource& power,
                         agreement::IAgreementRegistry& registry,
                         economics::IAssetTransfer& custody,
                         const GovernanceConfig& config = GovernanceConfig());

    GovernanceController(const GovernanceController&) = delete;
    GovernanceController& operator=(const GovernanceController&) = delete;

    const Address& GetAddress() const { return self_; }

    /// Attach the KYC registry KYCWhitelistUpdate proposals act on (not owned)
    void SetKycRegistry(kyc::IKycRegistry* registry) { kyc_ = registry; }

    // ========================================================================
    // Proposals
    // ========================================================================

    /**
     * Create a proposal from its stored form. Requires the caller's voting
     * power on `agreementId` to reach the proposal threshold and the
     * type-specific bounds to hold.
     */
    GovResult CreateProposal(const Address& caller, AgreementId agreementId,
                             ProposalType type, const Uint256& targetValue,
                             const std::string& description, ProposalId& outId);

    /// Typed convenience over CreateProposal
    GovResult CreateProposal(const Address& caller, const ProposalPayload& payload,
                             const std::string& description, ProposalId& outId);

    /// Whitelist add/remove proposal; agreement 0, no threshold check
    GovResult CreateKYCWhitelistProposal(const Address& caller, const Address& target,
                                         bool add, const std::string& description,
                                         ProposalId& outId);

    /// support: 0 against, 1 for, 2 abstain
    GovResult CastVote(const Address& caller, ProposalId proposalId, uint8_t support);

    /// Evaluate and, if it passes, dispatch. A defeat returns Ok.
    GovResult ExecuteProposal(const Address& caller, ProposalId proposalId);

    // ========================================================================
    // Queries
    // ========================================================================

    /// nullptr if unknown
    const Proposal* GetProposal(ProposalId proposalId) const;

    std::optional<ProposalState> GetProposalState(ProposalId proposalId) const;

    bool HasVoted(ProposalId proposalId, const Address& voter) const;

    /// Number of proposals created (ids run 1..count)
    uint64_t GetProposalCount() const { return proposalCount_; }

    const GovernanceParameters& GetParameters() const { return params_; }
    VotingPowerMode GetVotingPowerMode() const { return mode_; }

    /// Voting power `voter` would vote with on a proposal right now
    ShareCount GetVotingPower(ProposalId proposalId, const Address& voter);

    /// Total supply quorum is measured against for a proposal
    ShareCount GetQuorumSupply(ProposalId proposalId) const;

    const GovernanceEventLog& GetEvents() const { return events_; }

    /// Interrupted reserve payout for a proposal, if any
    const economics::PendingDistribution* GetPendingDistribution(ProposalId proposalId) const;

    /// Custody funds owed to holders by interrupted reserve payouts
    Amount ReservedForPending() const;

private:
    GovResult ValidateProposal(AgreementId agreementId, ProposalType type,
                               const Uint256& targetValue) const;

    GovResult Open(const Address& caller, AgreementId agreementId, ProposalType type,
                   const Uint256& targetValue, const std::string& description,
                   ProposalId& outId);

    GovResult Dispatch(Proposal& proposal);
    GovResult DispatchReserveWithdrawal(Proposal& proposal, const Amount& amount);
    GovResult ResumeDistribution(Proposal& proposal);

    void Defeat(Proposal& proposal, const Address& caller, const std::string& why);
    void MarkExecuted(Proposal& proposal, const Address& caller);

    /// Quorum and majority test against current (or snapshot) supply
    bool Passes(const Proposal& proposal, bool& quorumReached) const;

    Address self_;
    IVotingPowerSource& power_;
    agreement::IAgreementRegistry& registry_;
    economics::IAssetTransfer& custody_;
    kyc::IKycRegistry* kyc_{nullptr};

    GovernanceParameters params_;
    VotingPowerMode mode_;
    VotingPowerSnapshots snapshots_;

    std::map<ProposalId, Proposal> proposals_;
    std::set<std::pair<ProposalId, Address>> votes_;
    std::map<ProposalId, economics::PendingDistribution> pending_;
    ProposalId proposalCount_{0};

    GovernanceEventLog events_;
    util::ReentrancyGuard guard_;
};

} // namespace governance
} // namespace yieldgov

#endif // YIELDGOV_GOVERNANCE_GOVERNANCE_H
