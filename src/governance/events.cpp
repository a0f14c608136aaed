// YIELDGOV - Governance Event Log Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/governance/events.h>
#include <yieldgov/crypto/sha256.h>

namespace yieldgov {
namespace governance {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::ProposalCreated: return "ProposalCreated";
        case EventType::VoteCast: return "VoteCast";
        case EventType::ProposalExecuted: return "ProposalExecuted";
        case EventType::ProposalDefeated: return "ProposalDefeated";
        case EventType::ROIAdjusted: return "ROIAdjusted";
        case EventType::ReserveAllocated: return "ReserveAllocated";
        case EventType::ReserveDistributedToHolders: return "ReserveDistributedToHolders";
        case EventType::DistributionAborted: return "DistributionAborted";
        case EventType::GovernanceParameterUpdated: return "GovernanceParameterUpdated";
        case EventType::AgreementParameterUpdated: return "AgreementParameterUpdated";
        case EventType::TransferRestrictionUpdated: return "TransferRestrictionUpdated";
        case EventType::KYCWhitelistUpdated: return "KYCWhitelistUpdated";
        default: return "Unknown";
    }
}

Hash256 GovernanceEventLog::ComputeHash(const GovernanceEvent& event) {
    SHA256 hasher;
    hasher.Write(event.prevHash.data(), event.prevHash.size());
    hasher.WriteU64(event.sequence);
    hasher.WriteU64(static_cast<uint64_t>(event.type));
    hasher.WriteU64(static_cast<uint64_t>(event.timestamp));
    hasher.WriteU64(event.proposalId);
    hasher.Write(event.actor.data(), event.actor.size());
    hasher.WriteU256(event.value);
    hasher.WriteU64(event.support);
    hasher.WriteString(event.detail);
    return hasher.Finalize();
}

const GovernanceEvent& GovernanceEventLog::Append(EventType type, Timestamp timestamp,
                                                  ProposalId proposalId, const Address& actor,
                                                  const Uint256& value, uint8_t support,
                                                  const std::string& detail) {
    GovernanceEvent event;
    event.sequence = events_.size();
    event.type = type;
    event.timestamp = timestamp;
    event.proposalId = proposalId;
    event.actor = actor;
    event.value = value;
    event.support = support;
    event.detail = detail;
    event.prevHash = Head();
    event.hash = ComputeHash(event);

    events_.push_back(std::move(event));
    return events_.back();
}

Hash256 GovernanceEventLog::Head() const {
    if (events_.empty()) {
        return Hash256();
    }
    return events_.back().hash;
}

std::vector<GovernanceEvent> GovernanceEventLog::ForProposal(ProposalId proposalId) const {
    std::vector<GovernanceEvent> result;
    for (const auto& event : events_) {
        if (event.proposalId == proposalId) {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<GovernanceEvent> GovernanceEventLog::OfType(EventType type) const {
    std::vector<GovernanceEvent> result;
    for (const auto& event : events_) {
        if (event.type == type) {
            result.push_back(event);
        }
    }
    return result;
}

bool GovernanceEventLog::Verify() const {
    Hash256 prev;
    for (size_t i = 0; i < events_.size(); ++i) {
        const GovernanceEvent& event = events_[i];
        if (event.sequence != i || event.prevHash != prev) {
            return false;
        }
        if (ComputeHash(event) != event.hash) {
            return false;
        }
        prev = event.hash;
    }
    return true;
}

} // namespace governance
} // namespace yieldgov
