// YIELDGOV - Proposal Payloads Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/governance/payload.h>

#include <limits>
#include <stdexcept>

namespace yieldgov {
namespace governance {

const char* ProposalTypeToString(ProposalType type) {
    switch (type) {
        case ProposalType::ROIAdjustment: return "ROIAdjustment";
        case ProposalType::ReserveAllocation: return "ReserveAllocation";
        case ProposalType::ReserveWithdrawal: return "ReserveWithdrawal";
        case ProposalType::GovernanceParameterUpdate: return "GovernanceParameterUpdate";
        case ProposalType::AgreementParameterUpdate: return "AgreementParameterUpdate";
        case ProposalType::TransferRestrictionUpdate: return "TransferRestrictionUpdate";
        case ProposalType::KYCWhitelistUpdate: return "KYCWhitelistUpdate";
        default: return "Unknown";
    }
}

std::optional<ProposalType> ParseProposalType(const std::string& str) {
    static const ProposalType all[] = {
        ProposalType::ROIAdjustment,
        ProposalType::ReserveAllocation,
        ProposalType::ReserveWithdrawal,
        ProposalType::GovernanceParameterUpdate,
        ProposalType::AgreementParameterUpdate,
        ProposalType::TransferRestrictionUpdate,
        ProposalType::KYCWhitelistUpdate,
    };
    for (ProposalType type : all) {
        if (str == ProposalTypeToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

namespace {

constexpr unsigned PARAM_SHIFT = 128;
constexpr unsigned KYC_SHIFT = 96;

} // namespace

ProposalType PayloadType(const ProposalPayload& payload) {
    if (std::holds_alternative<RoiAdjustment>(payload)) {
        return ProposalType::ROIAdjustment;
    }
    if (std::holds_alternative<ReserveAllocation>(payload)) {
        return ProposalType::ReserveAllocation;
    }
    if (std::holds_alternative<ReserveWithdrawal>(payload)) {
        return ProposalType::ReserveWithdrawal;
    }
    if (std::holds_alternative<GovernanceParamUpdate>(payload)) {
        return ProposalType::GovernanceParameterUpdate;
    }
    if (std::holds_alternative<AgreementParamUpdate>(payload)) {
        return ProposalType::AgreementParameterUpdate;
    }
    if (std::holds_alternative<RestrictionParamUpdate>(payload)) {
        return ProposalType::TransferRestrictionUpdate;
    }
    return ProposalType::KYCWhitelistUpdate;
}

// ============================================================================
// Packing
// ============================================================================

const Uint256& ValueMask128() {
    static const Uint256 mask = (Uint256(1) << PARAM_SHIFT) - 1;
    return mask;
}

Uint256 PackParam(uint64_t paramId, const Uint256& value) {
    if (value > ValueMask128()) {
        throw std::invalid_argument("parameter value exceeds 128 bits");
    }
    return (Uint256(paramId) << PARAM_SHIFT) | value;
}

Uint256 PackKycUpdate(const Address& account, bool add) {
    return (account.ToUint256() << KYC_SHIFT) | Uint256(add ? 1 : 0);
}

PackedPayload EncodePayload(const ProposalPayload& payload) {
    PackedPayload packed;
    packed.type = PayloadType(payload);

    if (const auto* roi = std::get_if<RoiAdjustment>(&payload)) {
        packed.agreementId = roi->agreementId;
        packed.targetValue = roi->roiBP;
    } else if (const auto* alloc = std::get_if<ReserveAllocation>(&payload)) {
        packed.agreementId = alloc->agreementId;
        packed.targetValue = alloc->amount;
    } else if (const auto* withdrawal = std::get_if<ReserveWithdrawal>(&payload)) {
        packed.agreementId = withdrawal->agreementId;
        packed.targetValue = withdrawal->amount;
    } else if (const auto* gov = std::get_if<GovernanceParamUpdate>(&payload)) {
        // The agreement id slot doubles as the parameter selector
        packed.agreementId = gov->paramId;
        packed.targetValue = gov->value;
    } else if (const auto* agr = std::get_if<AgreementParamUpdate>(&payload)) {
        packed.agreementId = agr->agreementId;
        packed.targetValue = PackParam(agr->paramId, agr->value);
    } else if (const auto* restr = std::get_if<RestrictionParamUpdate>(&payload)) {
        packed.agreementId = restr->agreementId;
        packed.targetValue = PackParam(restr->paramId, restr->value);
    } else {
        const auto& kycUpdate = std::get<KycWhitelistUpdate>(payload);
        packed.agreementId = 0;
        packed.targetValue = PackKycUpdate(kycUpdate.account, kycUpdate.add);
    }

    return packed;
}

namespace {

GovResult UnpackParam(const Uint256& targetValue, uint64_t& paramId, Uint256& value) {
    Uint256 id = targetValue >> PARAM_SHIFT;
    if (id > std::numeric_limits<uint64_t>::max()) {
        return GovResult::Fail(GovError::ParameterOutOfBounds, "parameter id out of range");
    }
    paramId = id.convert_to<uint64_t>();
    value = targetValue & ValueMask128();
    return GovResult::Ok();
}

} // namespace

GovResult DecodePayload(ProposalType type, AgreementId agreementId,
                        const Uint256& targetValue, ProposalPayload& out) {
    switch (type) {
        case ProposalType::ROIAdjustment:
            if (targetValue > std::numeric_limits<uint16_t>::max()) {
                return GovResult::Fail(GovError::ParameterOutOfBounds,
                                       "ROI target must be within [100, 5000] bp");
            }
            out = RoiAdjustment{agreementId, targetValue.convert_to<uint16_t>()};
            return GovResult::Ok();

        case ProposalType::ReserveAllocation:
            out = ReserveAllocation{agreementId, targetValue};
            return GovResult::Ok();

        case ProposalType::ReserveWithdrawal:
            out = ReserveWithdrawal{agreementId, targetValue};
            return GovResult::Ok();

        case ProposalType::GovernanceParameterUpdate:
            out = GovernanceParamUpdate{agreementId, targetValue};
            return GovResult::Ok();

        case ProposalType::AgreementParameterUpdate: {
            AgreementParamUpdate p;
            p.agreementId = agreementId;
            GovResult unpacked = UnpackParam(targetValue, p.paramId, p.value);
            if (!unpacked) {
                return unpacked;
            }
            out = p;
            return GovResult::Ok();
        }

        case ProposalType::TransferRestrictionUpdate: {
            RestrictionParamUpdate p;
            p.agreementId = agreementId;
            GovResult unpacked = UnpackParam(targetValue, p.paramId, p.value);
            if (!unpacked) {
                return unpacked;
            }
            out = p;
            return GovResult::Ok();
        }

        case ProposalType::KYCWhitelistUpdate: {
            KycWhitelistUpdate p;
            p.account = Address::FromUint256((targetValue >> KYC_SHIFT) & AddressMask());
            p.add = (targetValue & 1) == 1;
            out = p;
            return GovResult::Ok();
        }
    }
    return GovResult::Fail(GovError::ParameterOutOfBounds, "unknown proposal type");
}

} // namespace governance
} // namespace yieldgov
