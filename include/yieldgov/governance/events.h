// YIELDGOV - Governance Event Log
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Append-only record of governance activity. Proposal state keeps only
// aggregate tallies, so the per-vote entries here are the only place a
// voter's direction is recorded.
//
// Each entry's hash is SHA-256 over its fields and the previous entry's
// hash; Verify() recomputes the chain from the start.

#ifndef YIELDGOV_GOVERNANCE_EVENTS_H
#define YIELDGOV_GOVERNANCE_EVENTS_H

#include <yieldgov/core/types.h>
#include <yieldgov/governance/voting_power.h>

#include <cstdint>
#include <string>
#include <vector>

namespace yieldgov {
namespace governance {

enum class EventType : uint8_t {
    ProposalCreated,
    VoteCast,
    ProposalExecuted,
    ProposalDefeated,
    ROIAdjusted,
    ReserveAllocated,
    ReserveDistributedToHolders,
    DistributionAborted,
    GovernanceParameterUpdated,
    AgreementParameterUpdated,
    TransferRestrictionUpdated,
    KYCWhitelistUpdated
};

const char* EventTypeToString(EventType type);

struct GovernanceEvent {
    uint64_t sequence{0};
    EventType type{EventType::ProposalCreated};
    Timestamp timestamp{0};
    ProposalId proposalId{0};

    /// Proposer, voter or executor
    Address actor;

    /// Vote weight, amount or new parameter value
    Uint256 value{0};

    /// Vote direction for VoteCast (0 against, 1 for, 2 abstain)
    uint8_t support{0};

    std::string detail;

    Hash256 prevHash;
    Hash256 hash;
};

class GovernanceEventLog {
public:
    GovernanceEventLog() = default;

    /// Stamp, chain and append an entry; returns the stored copy
    const GovernanceEvent& Append(EventType type, Timestamp timestamp, ProposalId proposalId,
                                  const Address& actor, const Uint256& value,
                                  uint8_t support = 0, const std::string& detail = "");

    const std::vector<GovernanceEvent>& Events() const { return events_; }
    size_t Size() const { return events_.size(); }

    /// Hash of the newest entry (null when empty)
    Hash256 Head() const;

    /// Entries for one proposal, in order
    std::vector<GovernanceEvent> ForProposal(ProposalId proposalId) const;

    /// Entries of one type, in order
    std::vector<GovernanceEvent> OfType(EventType type) const;

    /// Recompute every hash and link
    bool Verify() const;

    /// Digest of an entry's fields chained to its prevHash
    static Hash256 ComputeHash(const GovernanceEvent& event);

private:
    std::vector<GovernanceEvent> events_;
};

} // namespace governance
} // namespace yieldgov

#endif // YIELDGOV_GOVERNANCE_EVENTS_H
