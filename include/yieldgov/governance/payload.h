// YIELDGOV - Proposal Payloads
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Typed proposal actions and their packed storage form.
//
// A stored proposal carries (type, agreementId, targetValue). Multi-field
// actions pack into targetValue:
//
//   GovernanceParameterUpdate   agreementId = parameter id, targetValue = value
//   AgreementParameterUpdate    targetValue = (parameterId << 128) | value
//   TransferRestrictionUpdate   targetValue = (parameterId << 128) | value
//   KYCWhitelistUpdate          targetValue = (address << 96) | addFlag,
//                               agreementId = 0
//
// Everything above the storage boundary uses ProposalPayload.

#ifndef YIELDGOV_GOVERNANCE_PAYLOAD_H
#define YIELDGOV_GOVERNANCE_PAYLOAD_H

#include <yieldgov/core/error.h>
#include <yieldgov/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace yieldgov {
namespace governance {

enum class ProposalType {
    ROIAdjustment,
    ReserveAllocation,
    ReserveWithdrawal,
    GovernanceParameterUpdate,
    AgreementParameterUpdate,
    TransferRestrictionUpdate,
    KYCWhitelistUpdate
};

const char* ProposalTypeToString(ProposalType type);

std::optional<ProposalType> ParseProposalType(const std::string& str);

// ============================================================================
// Typed Payloads
// ============================================================================

struct RoiAdjustment {
    AgreementId agreementId{0};
    uint16_t roiBP{0};
};

struct ReserveAllocation {
    AgreementId agreementId{0};
    Amount amount{0};
};

struct ReserveWithdrawal {
    AgreementId agreementId{0};
    Amount amount{0};
};

struct GovernanceParamUpdate {
    uint64_t paramId{0};
    Uint256 value{0};
};

struct AgreementParamUpdate {
    AgreementId agreementId{0};
    uint64_t paramId{0};
    Uint256 value{0};
};

struct RestrictionParamUpdate {
    AgreementId agreementId{0};
    uint64_t paramId{0};
    Uint256 value{0};
};

struct KycWhitelistUpdate {
    Address account;
    bool add{true};
};

using ProposalPayload = std::variant<RoiAdjustment,
                                     ReserveAllocation,
                                     ReserveWithdrawal,
                                     GovernanceParamUpdate,
                                     AgreementParamUpdate,
                                     RestrictionParamUpdate,
                                     KycWhitelistUpdate>;

ProposalType PayloadType(const ProposalPayload& payload);

// ============================================================================
// Packed Form
// ============================================================================

struct PackedPayload {
    ProposalType type{ProposalType::ROIAdjustment};
    AgreementId agreementId{0};
    Uint256 targetValue{0};
};

/// Low 128 bits
const Uint256& ValueMask128();

/// (paramId << 128) | value; throws std::invalid_argument if value needs more than 128 bits
Uint256 PackParam(uint64_t paramId, const Uint256& value);

/// (address << 96) | addFlag
Uint256 PackKycUpdate(const Address& account, bool add);

/// Throws std::invalid_argument for values that do not fit their packed field
PackedPayload EncodePayload(const ProposalPayload& payload);

/**
 * Unpack a stored proposal. Fails with ParameterOutOfBounds when a field
 * cannot be represented (ROI above 16 bits, parameter id above 64 bits).
 */
GovResult DecodePayload(ProposalType type, AgreementId agreementId,
                        const Uint256& targetValue, ProposalPayload& out);

} // namespace governance
} // namespace yieldgov

#endif // YIELDGOV_GOVERNANCE_PAYLOAD_H
