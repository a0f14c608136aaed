// YIELDGOV - Governance Parameters Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/governance/parameters.h>
#include <yieldgov/util/config.h>
#include <yieldgov/util/logging.h>
#include <yieldgov/util/time.h>

#include <algorithm>
#include <cctype>

namespace yieldgov {
namespace governance {

const char* GovernanceParamToString(GovernanceParam param) {
    switch (param) {
        case GovernanceParam::VotingDelay: return "VotingDelay";
        case GovernanceParam::VotingPeriod: return "VotingPeriod";
        case GovernanceParam::QuorumBP: return "QuorumBP";
        case GovernanceParam::ThresholdBP: return "ThresholdBP";
        default: return "Unknown";
    }
}

std::optional<GovernanceParam> GovernanceParamFromId(uint64_t id) {
    if (id > MAX_GOVERNANCE_PARAM_ID) {
        return std::nullopt;
    }
    return static_cast<GovernanceParam>(id);
}

const char* VotingPowerModeToString(VotingPowerMode mode) {
    switch (mode) {
        case VotingPowerMode::Live: return "live";
        case VotingPowerMode::Snapshot: return "snapshot";
        default: return "unknown";
    }
}

std::optional<VotingPowerMode> ParseVotingPowerMode(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "live") return VotingPowerMode::Live;
    if (lower == "snapshot") return VotingPowerMode::Snapshot;
    return std::nullopt;
}

// ============================================================================
// Parameters
// ============================================================================

void GovernanceParameters::Apply(GovernanceParam param, const Uint256& value) {
    switch (param) {
        case GovernanceParam::VotingDelay:
            votingDelay = value.convert_to<int64_t>();
            break;
        case GovernanceParam::VotingPeriod:
            votingPeriod = value.convert_to<int64_t>();
            break;
        case GovernanceParam::QuorumBP:
            quorumBP = value.convert_to<uint16_t>();
            break;
        case GovernanceParam::ThresholdBP:
            thresholdBP = value.convert_to<uint16_t>();
            break;
    }
}

Uint256 GovernanceParameters::Get(GovernanceParam param) const {
    switch (param) {
        case GovernanceParam::VotingDelay: return Uint256(votingDelay);
        case GovernanceParam::VotingPeriod: return Uint256(votingPeriod);
        case GovernanceParam::QuorumBP: return Uint256(quorumBP);
        case GovernanceParam::ThresholdBP: return Uint256(thresholdBP);
        default: return 0;
    }
}

GovResult ValidateGovernanceParam(GovernanceParam param, const Uint256& value) {
    switch (param) {
        case GovernanceParam::VotingDelay:
            if (value < MIN_VOTING_DELAY || value > MAX_VOTING_DELAY) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "voting delay must be within [1 hour, 7 days]");
            }
            break;
        case GovernanceParam::VotingPeriod:
            if (value < MIN_VOTING_PERIOD || value > MAX_VOTING_PERIOD) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "voting period must be within [1 day, 30 days]");
            }
            break;
        case GovernanceParam::QuorumBP:
            if (value < MIN_QUORUM_BP || value > MAX_QUORUM_BP) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "quorum must be within [500, 5000] bp");
            }
            break;
        case GovernanceParam::ThresholdBP:
            if (value < MIN_THRESHOLD_BP || value > MAX_THRESHOLD_BP) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "proposal threshold must be within [10, 1000] bp");
            }
            break;
        default:
            return GovResult::Fail(GovError::ParameterOutOfBounds, "unknown governance parameter");
    }
    return GovResult::Ok();
}

GovResult ValidateGovernanceParameters(const GovernanceParameters& params) {
    for (uint64_t id = 0; id <= MAX_GOVERNANCE_PARAM_ID; ++id) {
        GovernanceParam param = static_cast<GovernanceParam>(id);
        // Negative durations never fit the bounds
        if ((param == GovernanceParam::VotingDelay && params.votingDelay < 0) ||
            (param == GovernanceParam::VotingPeriod && params.votingPeriod < 0)) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   std::string(GovernanceParamToString(param)) +
                                   " must not be negative");
        }
        GovResult valid = ValidateGovernanceParam(param, params.Get(param));
        if (!valid) {
            return valid;
        }
    }
    return GovResult::Ok();
}

// ============================================================================
// Configuration
// ============================================================================

GovResult GovernanceConfig::Load(const util::ConfigManager& config, GovernanceConfig& out) {
    GovernanceConfig loaded;

    struct DurationKey {
        const char* key;
        int64_t* target;
    };
    const DurationKey durations[] = {
        {"voting_delay", &loaded.params.votingDelay},
        {"voting_period", &loaded.params.votingPeriod},
    };
    for (const auto& d : durations) {
        if (!config.HasKey(d.key, "governance")) {
            continue;
        }
        auto value = config.TryGetDuration(d.key, "governance");
        if (!value) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   std::string("governance.") + d.key + " is not a duration");
        }
        *d.target = *value;
    }

    struct BpKey {
        const char* key;
        uint16_t* target;
    };
    const BpKey bps[] = {
        {"quorum_bp", &loaded.params.quorumBP},
        {"threshold_bp", &loaded.params.thresholdBP},
    };
    for (const auto& b : bps) {
        if (!config.HasKey(b.key, "governance")) {
            continue;
        }
        auto value = config.TryGetUInt(b.key, "governance");
        if (!value || *value > BASIS_POINTS) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   std::string("governance.") + b.key +
                                   " must be a basis-point value");
        }
        *b.target = static_cast<uint16_t>(*value);
    }

    if (auto mode = config.TryGetString("voting_power_mode", "governance")) {
        auto parsed = ParseVotingPowerMode(*mode);
        if (!parsed) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "governance.voting_power_mode must be live or snapshot");
        }
        loaded.mode = *parsed;
    }

    if (config.HasKey("max_shareholders", "ledger")) {
        auto value = config.TryGetUInt("max_shareholders", "ledger");
        if (!value || *value == 0) {
            return GovResult::Fail(GovError::ParameterOutOfBounds,
                                   "ledger.max_shareholders must be a positive integer");
        }
        loaded.maxShareholders = static_cast<size_t>(*value);
    }

    GovResult valid = ValidateGovernanceParameters(loaded.params);
    if (!valid) {
        return valid;
    }

    LOG_INFO(util::LogCategory::CONFIG) << "Governance config: delay="
        << util::FormatDuration(loaded.params.votingDelay)
        << " period=" << util::FormatDuration(loaded.params.votingPeriod)
        << " quorum=" << loaded.params.quorumBP << "bp"
        << " threshold=" << loaded.params.thresholdBP << "bp"
        << " mode=" << VotingPowerModeToString(loaded.mode)
        << " maxShareholders=" << loaded.maxShareholders;

    out = loaded;
    return GovResult::Ok();
}

} // namespace governance
} // namespace yieldgov
