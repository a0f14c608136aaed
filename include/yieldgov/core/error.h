// YIELDGOV - Error Reporting
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Every state-mutating entry point reports its outcome as a GovResult.
// A failed call leaves no state behind; the reason string names the exact
// bound or rule that was violated so callers can assert on cause.

#ifndef YIELDGOV_CORE_ERROR_H
#define YIELDGOV_CORE_ERROR_H

#include <string>

namespace yieldgov {

// ============================================================================
// Error Kinds
// ============================================================================

enum class GovError {
    OK = 0,

    // Proposal lifecycle
    ProposalNotFound,
    ProposalNotActive,
    ProposalAlreadyExecuted,
    VotingNotEnded,
    AlreadyVoted,
    InvalidVoteType,
    InsufficientVotingPower,
    ThresholdNotMet,
    ParameterOutOfBounds,
    DispatchFailed,

    // Distribution
    DistributionAborted,
    NoShareholders,
    NothingToClaim,
    TransferFailed,
    CapitalMismatch,

    // Ledger
    InvalidAddress,
    InsufficientBalance,
    ShareholderLimitExceeded,
    TransferRestricted,

    // Collaborators
    Unauthorized,
    AlreadyInState,
    AgreementNotFound,
    AgreementInactive,
    ReserveUnavailable,

    // Concurrency
    Reentrancy
};

/// Convert error kind to string
const char* GovErrorToString(GovError err);

// ============================================================================
// Result
// ============================================================================

/**
 * Outcome of a call. Mirrors the validation-result structs used across the
 * codebase: a kind plus a human-readable reason.
 */
struct GovResult {
    GovError error{GovError::OK};
    std::string reason;

    bool IsOk() const { return error == GovError::OK; }
    explicit operator bool() const { return IsOk(); }

    static GovResult Ok() {
        return {GovError::OK, ""};
    }

    static GovResult Fail(GovError err, const std::string& msg) {
        return {err, msg};
    }

    /// "Kind: reason"
    std::string ToString() const;
};

} // namespace yieldgov

#endif // YIELDGOV_CORE_ERROR_H
