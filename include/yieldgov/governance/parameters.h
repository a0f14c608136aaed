// YIELDGOV - Governance Parameters
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#ifndef YIELDGOV_GOVERNANCE_PARAMETERS_H
#define YIELDGOV_GOVERNANCE_PARAMETERS_H

#include <yieldgov/core/error.h>
#include <yieldgov/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace yieldgov {

namespace util {
class ConfigManager;
}

namespace governance {

// ============================================================================
// Governance Constants
// ============================================================================

/// Delay between creation and the start of voting
constexpr int64_t DEFAULT_VOTING_DELAY = ONE_DAY;
constexpr int64_t MIN_VOTING_DELAY = ONE_HOUR;
constexpr int64_t MAX_VOTING_DELAY = 7 * ONE_DAY;

/// Length of the voting window
constexpr int64_t DEFAULT_VOTING_PERIOD = 7 * ONE_DAY;
constexpr int64_t MIN_VOTING_PERIOD = ONE_DAY;
constexpr int64_t MAX_VOTING_PERIOD = 30 * ONE_DAY;

/// Share of total supply that must vote (bp)
constexpr uint16_t DEFAULT_QUORUM_BP = 1000;
constexpr uint16_t MIN_QUORUM_BP = 500;
constexpr uint16_t MAX_QUORUM_BP = 5000;

/// Share of total supply a proposer must hold (bp)
constexpr uint16_t DEFAULT_THRESHOLD_BP = 100;
constexpr uint16_t MIN_THRESHOLD_BP = 10;
constexpr uint16_t MAX_THRESHOLD_BP = 1000;

/// Maximum ROI change per adjustment proposal (bp)
constexpr uint64_t MAX_ROI_DEVIATION_BP = 500;

/// Fields addressable by a GovernanceParameterUpdate proposal
enum class GovernanceParam : uint8_t {
    VotingDelay = 0,
    VotingPeriod = 1,
    QuorumBP = 2,
    ThresholdBP = 3
};

constexpr uint64_t MAX_GOVERNANCE_PARAM_ID = 3;

const char* GovernanceParamToString(GovernanceParam param);

std::optional<GovernanceParam> GovernanceParamFromId(uint64_t id);

/// How voting power is read for a proposal
enum class VotingPowerMode {
    /// Current ledger balance at vote time
    Live,

    /// Total supply frozen at creation, each voter frozen on first query
    Snapshot
};

const char* VotingPowerModeToString(VotingPowerMode mode);

std::optional<VotingPowerMode> ParseVotingPowerMode(const std::string& str);

// ============================================================================
// Parameters
// ============================================================================

struct GovernanceParameters {
    int64_t votingDelay{DEFAULT_VOTING_DELAY};
    int64_t votingPeriod{DEFAULT_VOTING_PERIOD};
    uint16_t quorumBP{DEFAULT_QUORUM_BP};
    uint16_t thresholdBP{DEFAULT_THRESHOLD_BP};

    /// Write one field from an already validated value
    void Apply(GovernanceParam param, const Uint256& value);

    /// Current value of one field
    Uint256 Get(GovernanceParam param) const;
};

/// Bounds check for a single proposed value
GovResult ValidateGovernanceParam(GovernanceParam param, const Uint256& value);

/// Bounds check for every field
GovResult ValidateGovernanceParameters(const GovernanceParameters& params);

// ============================================================================
// Configuration
// ============================================================================

/**
 * Deployment settings read from a config file:
 *
 *   [governance]
 *   voting_delay = 1d
 *   voting_period = 7d
 *   quorum_bp = 1000
 *   threshold_bp = 100
 *   voting_power_mode = live
 *
 *   [ledger]
 *   max_shareholders = 1000
 */
struct GovernanceConfig {
    GovernanceParameters params;
    VotingPowerMode mode{VotingPowerMode::Live};
    size_t maxShareholders{1000};

    /// Missing keys keep their defaults; malformed or out-of-bound values fail
    static GovResult Load(const util::ConfigManager& config, GovernanceConfig& out);
};

} // namespace governance
} // namespace yieldgov

#endif // YIELDGOV_GOVERNANCE_PARAMETERS_H
