// YIELDGOV - Error Reporting Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include "yieldgov/core/error.h"

namespace yieldgov {

const char* GovErrorToString(GovError err) {
    switch (err) {
        case GovError::OK: return "OK";

        case GovError::ProposalNotFound: return "ProposalNotFound";
        case GovError::ProposalNotActive: return "ProposalNotActive";
        case GovError::ProposalAlreadyExecuted: return "ProposalAlreadyExecuted";
        case GovError::VotingNotEnded: return "VotingNotEnded";
        case GovError::AlreadyVoted: return "AlreadyVoted";
        case GovError::InvalidVoteType: return "InvalidVoteType";
        case GovError::InsufficientVotingPower: return "InsufficientVotingPower";
        case GovError::ThresholdNotMet: return "ThresholdNotMet";
        case GovError::ParameterOutOfBounds: return "ParameterOutOfBounds";
        case GovError::DispatchFailed: return "DispatchFailed";

        case GovError::DistributionAborted: return "DistributionAborted";
        case GovError::NoShareholders: return "NoShareholders";
        case GovError::NothingToClaim: return "NothingToClaim";
        case GovError::TransferFailed: return "TransferFailed";
        case GovError::CapitalMismatch: return "CapitalMismatch";

        case GovError::InvalidAddress: return "InvalidAddress";
        case GovError::InsufficientBalance: return "InsufficientBalance";
        case GovError::ShareholderLimitExceeded: return "ShareholderLimitExceeded";
        case GovError::TransferRestricted: return "TransferRestricted";

        case GovError::Unauthorized: return "Unauthorized";
        case GovError::AlreadyInState: return "AlreadyInState";
        case GovError::AgreementNotFound: return "AgreementNotFound";
        case GovError::AgreementInactive: return "AgreementInactive";
        case GovError::ReserveUnavailable: return "ReserveUnavailable";

        case GovError::Reentrancy: return "Reentrancy";
        default: return "Unknown";
    }
}

std::string GovResult::ToString() const {
    if (reason.empty()) {
        return GovErrorToString(error);
    }
    return std::string(GovErrorToString(error)) + ": " + reason;
}

} // namespace yieldgov
