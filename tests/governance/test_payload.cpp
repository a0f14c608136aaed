// YIELDGOV - Proposal Payload Tests
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <gtest/gtest.h>

#include <yieldgov/governance/payload.h>

#include <limits>
#include <stdexcept>

using namespace yieldgov;
using namespace yieldgov::governance;

TEST(PayloadTest, TypeNames) {
    EXPECT_STREQ(ProposalTypeToString(ProposalType::KYCWhitelistUpdate), "KYCWhitelistUpdate");
    auto parsed = ParseProposalType("TransferRestrictionUpdate");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, ProposalType::TransferRestrictionUpdate);
    EXPECT_FALSE(ParseProposalType("roiadjustment").has_value());
}

TEST(PayloadTest, GovernanceParamUsesAgreementSlot) {
    PackedPayload packed = EncodePayload(GovernanceParamUpdate{2, 4000});
    EXPECT_EQ(packed.type, ProposalType::GovernanceParameterUpdate);
    EXPECT_EQ(packed.agreementId, 2u);
    EXPECT_EQ(packed.targetValue, 4000);
}

TEST(PayloadTest, ParamPackingLayout) {
    PackedPayload packed = EncodePayload(AgreementParamUpdate{9, 3, 1});
    EXPECT_EQ(packed.agreementId, 9u);
    EXPECT_EQ(packed.targetValue, (Uint256(3) << 128) | 1);

    // Largest value that still fits
    EXPECT_NO_THROW(PackParam(0, ValueMask128()));
    EXPECT_THROW(PackParam(0, ValueMask128() + 1), std::invalid_argument);
    EXPECT_THROW(EncodePayload(RestrictionParamUpdate{1, 0, Uint256(1) << 128}),
                 std::invalid_argument);
}

TEST(PayloadTest, KycPackingLayout) {
    Address account = Address::FromHex("0xffffffffffffffffffffffffffffffffffffffff");
    PackedPayload packed = EncodePayload(KycWhitelistUpdate{account, true});
    EXPECT_EQ(packed.agreementId, 0u);
    EXPECT_EQ(packed.targetValue & 1, 1);
    EXPECT_EQ(packed.targetValue >> 96, account.ToUint256());

    ProposalPayload decoded;
    ASSERT_TRUE(DecodePayload(ProposalType::KYCWhitelistUpdate, 0, packed.targetValue, decoded));
    const auto* kycUpdate = std::get_if<KycWhitelistUpdate>(&decoded);
    ASSERT_NE(kycUpdate, nullptr);
    EXPECT_EQ(kycUpdate->account, account);
    EXPECT_TRUE(kycUpdate->add);

    // Only the low bit is the flag
    ASSERT_TRUE(DecodePayload(ProposalType::KYCWhitelistUpdate, 0, PackKycUpdate(account, false) | 2,
                              decoded));
    EXPECT_FALSE(std::get<KycWhitelistUpdate>(decoded).add);
}

TEST(PayloadTest, DecodeRejectsOversizedRoi) {
    ProposalPayload decoded;
    GovResult r = DecodePayload(ProposalType::ROIAdjustment, 1,
                                Uint256(std::numeric_limits<uint16_t>::max()) + 1, decoded);
    EXPECT_EQ(r.error, GovError::ParameterOutOfBounds);

    ASSERT_TRUE(DecodePayload(ProposalType::ROIAdjustment, 1, 1100, decoded));
    EXPECT_EQ(std::get<RoiAdjustment>(decoded).roiBP, 1100);
    EXPECT_EQ(std::get<RoiAdjustment>(decoded).agreementId, 1u);
}

TEST(PayloadTest, DecodeRejectsOversizedParamId) {
    ProposalPayload decoded;
    Uint256 packed = Uint256(1) << 192;
    EXPECT_EQ(DecodePayload(ProposalType::AgreementParameterUpdate, 1, packed, decoded).error,
              GovError::ParameterOutOfBounds);
    EXPECT_EQ(DecodePayload(ProposalType::TransferRestrictionUpdate, 1, packed, decoded).error,
              GovError::ParameterOutOfBounds);

    Uint256 maxId = Uint256(std::numeric_limits<uint64_t>::max()) << 128;
    ASSERT_TRUE(DecodePayload(ProposalType::TransferRestrictionUpdate, 1, maxId | 7, decoded));
    const auto& restr = std::get<RestrictionParamUpdate>(decoded);
    EXPECT_EQ(restr.paramId, std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(restr.value, 7);
}

TEST(PayloadTest, PayloadTypeMatchesAlternative) {
    EXPECT_EQ(PayloadType(ReserveWithdrawal{1, 5}), ProposalType::ReserveWithdrawal);
    EXPECT_EQ(PayloadType(ReserveAllocation{1, 5}), ProposalType::ReserveAllocation);
    EXPECT_EQ(PayloadType(RestrictionParamUpdate{}), ProposalType::TransferRestrictionUpdate);
}
