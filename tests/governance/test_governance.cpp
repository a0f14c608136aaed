// YIELDGOV - Governance Controller Tests
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <gtest/gtest.h>

#include <yieldgov/agreement/agreement_registry.h>
#include <yieldgov/economics/asset.h>
#include <yieldgov/governance/governance.h>
#include <yieldgov/kyc/kyc_registry.h>
#include <yieldgov/ledger/multi_token.h>
#include <yieldgov/util/config.h>
#include <yieldgov/util/time.h>

#include <memory>
#include <stdexcept>

using namespace yieldgov;
using namespace yieldgov::governance;

namespace {

constexpr Timestamp NOW = 1700000000;

constexpr uint8_t AGAINST = 0;
constexpr uint8_t FOR = 1;
constexpr uint8_t ABSTAIN = 2;

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

/**
 * One agreement with 100000 shares: A 9000, B 1000, C 40000, D 50000.
 * Default parameters: quorum 10% (10000 shares), threshold 1% (1000 shares).
 */
class GovernanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::EnableMockTime();
        util::SetMockTime(NOW);

        ASSERT_TRUE(registry_.SetGovernance(owner_, gov_));

        agreement::AgreementTerms terms;
        terms.upfrontCapital = 100000;
        terms.roiBP = 500;
        terms.termMonths = 12;
        ASSERT_TRUE(registry_.CreateAgreementStrict(
            issuer_, terms, {{a_, 9000}, {b_, 1000}, {c_, 40000}, {d_, 50000}}, id_));

        Build(GovernanceConfig());
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    void Build(const GovernanceConfig& config) {
        controller_ = std::make_unique<GovernanceController>(gov_, power_, registry_,
                                                             govCustody_, config);
    }

    ProposalId Propose(const ProposalPayload& payload, const Address& proposer) {
        ProposalId id = 0;
        GovResult r = controller_->CreateProposal(proposer, payload, "test", id);
        EXPECT_TRUE(r) << r.ToString();
        return id;
    }

    ProposalId Propose(const ProposalPayload& payload) {
        return Propose(payload, a_);
    }

    void WarpToStart(ProposalId id) {
        util::SetMockTime(controller_->GetProposal(id)->votingStart);
    }

    void WarpPastEnd(ProposalId id) {
        util::SetMockTime(controller_->GetProposal(id)->votingEnd + 1);
    }

    /// A and B vote for: exactly the 10000-share quorum
    void PassVote(ProposalId id) {
        WarpToStart(id);
        ASSERT_TRUE(controller_->CastVote(a_, id, FOR));
        ASSERT_TRUE(controller_->CastVote(b_, id, FOR));
        WarpPastEnd(id);
    }

    /// Fund the registry's reserve for the agreement directly
    void SeedReserve(const Amount& amount) {
        accounts_.Credit(gov_, amount);
        ASSERT_TRUE(registry_.AllocateReserve(gov_, id_, amount, govCustody_));
    }

    ledger::ShareholderLedger& Shares() { return *registry_.GetLedger(id_); }

    Address owner_ = Address::FromId(0xA0);
    Address issuer_ = Address::FromId(0xA1);
    Address gov_ = Address::FromId(0x60);
    Address custody_ = Address::FromId(0xC0);
    Address outsider_ = Address::FromId(0xEE);
    Address a_ = Address::FromId(1);
    Address b_ = Address::FromId(2);
    Address c_ = Address::FromId(3);
    Address d_ = Address::FromId(4);

    economics::SettlementAccounts accounts_;
    economics::AccountTransfer payout_{accounts_, custody_};
    economics::AccountTransfer govCustody_{accounts_, gov_};
    agreement::YieldAgreementRegistry registry_{owner_, custody_, payout_};
    SingleLedgerVotingPower power_{&registry_};
    std::unique_ptr<GovernanceController> controller_;
    AgreementId id_{0};
};

// ============================================================================
// Construction and Configuration
// ============================================================================

TEST_F(GovernanceTest, ConstructorRejectsBadSetup) {
    EXPECT_THROW({ GovernanceController bad(Address(), power_, registry_, govCustody_); },
                 std::invalid_argument);

    GovernanceConfig config;
    config.params.quorumBP = 100;
    EXPECT_THROW({ GovernanceController bad(gov_, power_, registry_, govCustody_, config); },
                 std::invalid_argument);
}

TEST_F(GovernanceTest, LoadConfig) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(
        "[governance]\n"
        "voting_delay = 2h\n"
        "voting_period = 3d\n"
        "quorum_bp = 2000\n"
        "threshold_bp = 50\n"
        "voting_power_mode = snapshot\n"
        "[ledger]\n"
        "max_shareholders = 500\n").success);

    GovernanceConfig loaded;
    ASSERT_TRUE(GovernanceConfig::Load(config, loaded));
    EXPECT_EQ(loaded.params.votingDelay, 2 * ONE_HOUR);
    EXPECT_EQ(loaded.params.votingPeriod, 3 * ONE_DAY);
    EXPECT_EQ(loaded.params.quorumBP, 2000);
    EXPECT_EQ(loaded.params.thresholdBP, 50);
    EXPECT_EQ(loaded.mode, VotingPowerMode::Snapshot);
    EXPECT_EQ(loaded.maxShareholders, 500u);

    Build(loaded);
    EXPECT_EQ(controller_->GetVotingPowerMode(), VotingPowerMode::Snapshot);
    EXPECT_EQ(controller_->GetParameters().quorumBP, 2000);
}

TEST_F(GovernanceTest, LoadConfigRejectsOutOfBounds) {
    GovernanceConfig loaded;
    loaded.params.quorumBP = 1234;

    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString("[governance]\nquorum_bp = 6000\n").success);
    EXPECT_EQ(GovernanceConfig::Load(config, loaded).error, GovError::ParameterOutOfBounds);
    EXPECT_EQ(loaded.params.quorumBP, 1234);

    util::ConfigManager badMode;
    ASSERT_TRUE(badMode.ParseString("[governance]\nvoting_power_mode = frozen\n").success);
    EXPECT_EQ(GovernanceConfig::Load(badMode, loaded).error, GovError::ParameterOutOfBounds);

    util::ConfigManager badDuration;
    ASSERT_TRUE(badDuration.ParseString("[governance]\nvoting_period = soon\n").success);
    EXPECT_EQ(GovernanceConfig::Load(badDuration, loaded).error, GovError::ParameterOutOfBounds);

    util::ConfigManager empty;
    GovernanceConfig defaults;
    ASSERT_TRUE(GovernanceConfig::Load(empty, defaults));
    EXPECT_EQ(defaults.params.votingPeriod, DEFAULT_VOTING_PERIOD);
    EXPECT_EQ(defaults.mode, VotingPowerMode::Live);
}

// ============================================================================
// Proposal Creation
// ============================================================================

TEST_F(GovernanceTest, CreateSetsVotingWindow) {
    ProposalId id = Propose(RoiAdjustment{id_, 800});
    EXPECT_EQ(id, 1u);
    EXPECT_EQ(controller_->GetProposalCount(), 1u);

    const Proposal* p = controller_->GetProposal(id);
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->proposer, a_);
    EXPECT_EQ(p->createdAt, NOW);
    EXPECT_EQ(p->votingStart, NOW + DEFAULT_VOTING_DELAY);
    EXPECT_EQ(p->votingEnd, NOW + DEFAULT_VOTING_DELAY + DEFAULT_VOTING_PERIOD);
    EXPECT_EQ(p->TotalVotes(), 0);
    EXPECT_EQ(*controller_->GetProposalState(id), ProposalState::Pending);

    EXPECT_EQ(controller_->GetProposal(2), nullptr);
    EXPECT_FALSE(controller_->GetProposalState(2).has_value());
}

TEST_F(GovernanceTest, ProposalThreshold) {
    ProposalId id = 0;
    // B holds exactly 1% of supply
    EXPECT_TRUE(controller_->CreateProposal(b_, RoiAdjustment{id_, 600}, "", id));

    GovResult r = controller_->CreateProposal(outsider_, RoiAdjustment{id_, 600}, "", id);
    EXPECT_EQ(r.error, GovError::ThresholdNotMet);
    EXPECT_EQ(controller_->GetProposalCount(), 1u);
}

TEST_F(GovernanceTest, RoiBounds) {
    ProposalId id = 0;

    GovResult r = controller_->CreateProposal(a_, RoiAdjustment{id_, 1100}, "", id);
    EXPECT_EQ(r.error, GovError::ParameterOutOfBounds);
    EXPECT_EQ(r.reason, "ROI change of 600 bp exceeds maximum deviation of 500 bp");

    r = controller_->CreateProposal(a_, RoiAdjustment{id_, 99}, "", id);
    EXPECT_EQ(r.reason, "ROI target must be within [100, 5000] bp");

    // Raw form above 16 bits
    r = controller_->CreateProposal(a_, id_, ProposalType::ROIAdjustment, Uint256(70000), "", id);
    EXPECT_EQ(r.error, GovError::ParameterOutOfBounds);

    // No supply means no threshold; the missing agreement is what fails
    r = controller_->CreateProposal(a_, RoiAdjustment{id_ + 1, 600}, "", id);
    EXPECT_EQ(r.error, GovError::AgreementNotFound);

    // Exactly the maximum deviation is allowed
    EXPECT_TRUE(controller_->CreateProposal(a_, RoiAdjustment{id_, 1000}, "", id));
    EXPECT_EQ(controller_->GetProposalCount(), 1u);
}

TEST_F(GovernanceTest, ReserveBounds) {
    ProposalId id = 0;
    // 20% of 100000
    EXPECT_EQ(controller_->CreateProposal(a_, ReserveAllocation{id_, 20001}, "", id).error,
              GovError::ParameterOutOfBounds);
    EXPECT_EQ(controller_->CreateProposal(a_, ReserveAllocation{id_, 0}, "", id).error,
              GovError::ParameterOutOfBounds);
    EXPECT_TRUE(controller_->CreateProposal(a_, ReserveAllocation{id_, 20000}, "", id));

    SeedReserve(500);
    EXPECT_EQ(controller_->CreateProposal(a_, ReserveWithdrawal{id_, 501}, "", id).error,
              GovError::ParameterOutOfBounds);
    EXPECT_TRUE(controller_->CreateProposal(a_, ReserveWithdrawal{id_, 500}, "", id));
}

TEST_F(GovernanceTest, ParameterBounds) {
    ProposalId id = 0;
    GovResult r = controller_->CreateProposal(a_, GovernanceParamUpdate{1, 31 * ONE_DAY}, "", id);
    EXPECT_EQ(r.error, GovError::ParameterOutOfBounds);

    r = controller_->CreateProposal(a_, GovernanceParamUpdate{4, 1}, "", id);
    EXPECT_EQ(r.reason, "governance parameter id must be <= 3");

    r = controller_->CreateProposal(a_, AgreementParamUpdate{id_, 0, 91}, "", id);
    EXPECT_EQ(r.error, GovError::ParameterOutOfBounds);

    r = controller_->CreateProposal(a_, AgreementParamUpdate{id_, 5, 1}, "", id);
    EXPECT_EQ(r.reason, "agreement parameter id must be <= 4");

    r = controller_->CreateProposal(a_, RestrictionParamUpdate{id_, 0, NOW}, "", id);
    EXPECT_EQ(r.error, GovError::ParameterOutOfBounds);

    r = controller_->CreateProposal(a_, RestrictionParamUpdate{id_, 1, 50}, "", id);
    EXPECT_EQ(r.error, GovError::ParameterOutOfBounds);

    r = controller_->CreateProposal(a_, RestrictionParamUpdate{id_, 3, 0}, "", id);
    EXPECT_EQ(r.reason, "restriction parameter id must be <= 2");

    // Value does not fit the packed field
    r = controller_->CreateProposal(a_, RestrictionParamUpdate{id_, 2, Uint256(1) << 128}, "", id);
    EXPECT_EQ(r.error, GovError::ParameterOutOfBounds);

    EXPECT_EQ(controller_->GetProposalCount(), 0u);
}

// ============================================================================
// Voting
// ============================================================================

TEST_F(GovernanceTest, VoteErrors) {
    ProposalId id = Propose(RoiAdjustment{id_, 800});

    EXPECT_EQ(controller_->CastVote(a_, 99, FOR).error, GovError::ProposalNotFound);
    EXPECT_EQ(controller_->CastVote(a_, id, 3).error, GovError::InvalidVoteType);
    EXPECT_EQ(controller_->CastVote(a_, id, FOR).error, GovError::ProposalNotActive);

    WarpToStart(id);
    EXPECT_EQ(controller_->CastVote(outsider_, id, FOR).error, GovError::InsufficientVotingPower);
    ASSERT_TRUE(controller_->CastVote(a_, id, AGAINST));
    EXPECT_TRUE(controller_->HasVoted(id, a_));
    EXPECT_FALSE(controller_->HasVoted(id, b_));
    EXPECT_EQ(controller_->CastVote(a_, id, FOR).error, GovError::AlreadyVoted);

    const Proposal* p = controller_->GetProposal(id);
    EXPECT_EQ(p->againstVotes, 9000);
    EXPECT_EQ(p->forVotes, 0);
}

TEST_F(GovernanceTest, WindowBoundaries) {
    ProposalId id = Propose(RoiAdjustment{id_, 1000});
    const Proposal* p = controller_->GetProposal(id);

    util::SetMockTime(p->votingStart - 1);
    EXPECT_EQ(controller_->CastVote(a_, id, FOR).error, GovError::ProposalNotActive);

    util::SetMockTime(p->votingStart);
    EXPECT_EQ(*controller_->GetProposalState(id), ProposalState::Active);
    ASSERT_TRUE(controller_->CastVote(a_, id, FOR));

    // The last second of the window still accepts votes but not execution
    util::SetMockTime(p->votingEnd);
    ASSERT_TRUE(controller_->CastVote(b_, id, FOR));
    EXPECT_EQ(controller_->ExecuteProposal(outsider_, id).error, GovError::VotingNotEnded);

    util::SetMockTime(p->votingEnd + 1);
    EXPECT_EQ(controller_->CastVote(c_, id, AGAINST).error, GovError::ProposalNotActive);
    EXPECT_EQ(*controller_->GetProposalState(id), ProposalState::Succeeded);

    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_EQ(registry_.GetAgreement(id_)->roiBP, 1000u);
    EXPECT_TRUE(p->executed);
    EXPECT_EQ(*controller_->GetProposalState(id), ProposalState::Executed);

    EXPECT_EQ(controller_->ExecuteProposal(outsider_, id).error,
              GovError::ProposalAlreadyExecuted);
    EXPECT_EQ(controller_->ExecuteProposal(outsider_, 42).error, GovError::ProposalNotFound);
}

// ============================================================================
// Tally
// ============================================================================

TEST_F(GovernanceTest, QuorumBoundary) {
    ProposalId id = Propose(RoiAdjustment{id_, 800});
    WarpToStart(id);
    ASSERT_TRUE(controller_->CastVote(a_, id, FOR));
    WarpPastEnd(id);

    // 9000 of a required 10000
    EXPECT_EQ(*controller_->GetProposalState(id), ProposalState::Defeated);
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    const Proposal* p = controller_->GetProposal(id);
    EXPECT_FALSE(p->executed);
    EXPECT_TRUE(p->defeated);
    EXPECT_FALSE(p->quorumReached);
    EXPECT_EQ(registry_.GetAgreement(id_)->roiBP, 500u);

    auto defeats = controller_->GetEvents().OfType(EventType::ProposalDefeated);
    ASSERT_EQ(defeats.size(), 1u);
    EXPECT_EQ(defeats[0].detail, "quorum not reached");
}

TEST_F(GovernanceTest, QuorumMetExactly) {
    ProposalId id = Propose(RoiAdjustment{id_, 800});
    PassVote(id);
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    const Proposal* p = controller_->GetProposal(id);
    EXPECT_TRUE(p->executed);
    EXPECT_TRUE(p->quorumReached);
    EXPECT_EQ(registry_.GetAgreement(id_)->roiBP, 800u);
}

TEST_F(GovernanceTest, AbstainCountsTowardQuorumOnly) {
    ProposalId id = Propose(RoiAdjustment{id_, 800});
    WarpToStart(id);
    ASSERT_TRUE(controller_->CastVote(a_, id, FOR));
    ASSERT_TRUE(controller_->CastVote(b_, id, ABSTAIN));
    WarpPastEnd(id);

    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_TRUE(controller_->GetProposal(id)->executed);
    EXPECT_EQ(controller_->GetProposal(id)->abstainVotes, 1000);
}

TEST_F(GovernanceTest, MajorityRequired) {
    ProposalId id = Propose(RoiAdjustment{id_, 800});
    WarpToStart(id);
    ASSERT_TRUE(controller_->CastVote(a_, id, FOR));
    ASSERT_TRUE(controller_->CastVote(c_, id, AGAINST));
    WarpPastEnd(id);

    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    const Proposal* p = controller_->GetProposal(id);
    EXPECT_TRUE(p->defeated);
    EXPECT_TRUE(p->quorumReached);
    EXPECT_EQ(controller_->GetEvents().OfType(EventType::ProposalDefeated)[0].detail,
              "majority not reached");
}

TEST_F(GovernanceTest, TieIsDefeated) {
    ledger::ShareholderLedger& shares = Shares();
    ASSERT_TRUE(shares.Transfer(c_, b_, 8000));

    ProposalId id = Propose(RoiAdjustment{id_, 800});
    WarpToStart(id);
    ASSERT_TRUE(controller_->CastVote(a_, id, FOR));
    ASSERT_TRUE(controller_->CastVote(b_, id, AGAINST));
    WarpPastEnd(id);

    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_TRUE(controller_->GetProposal(id)->defeated);
}

TEST_F(GovernanceTest, DefeatedProposalCanBeReevaluated) {
    ProposalId id = Propose(RoiAdjustment{id_, 800});
    WarpToStart(id);
    ASSERT_TRUE(controller_->CastVote(a_, id, FOR));
    WarpPastEnd(id);
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    ASSERT_TRUE(controller_->GetProposal(id)->defeated);

    // Quorum is measured against live supply; halving it lets 9000 votes pass
    ASSERT_TRUE(Shares().Burn(d_, 50000));
    EXPECT_EQ(controller_->GetQuorumSupply(id), 50000);

    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    const Proposal* p = controller_->GetProposal(id);
    EXPECT_TRUE(p->executed);
    EXPECT_FALSE(p->defeated);
    EXPECT_EQ(registry_.GetAgreement(id_)->roiBP, 800u);
}

// ============================================================================
// Snapshot Mode
// ============================================================================

TEST_F(GovernanceTest, SnapshotFreezesSupplyAndWeights) {
    GovernanceConfig config;
    config.mode = VotingPowerMode::Snapshot;
    Build(config);

    ProposalId id = Propose(RoiAdjustment{id_, 800});
    EXPECT_EQ(controller_->GetVotingPower(id, a_), 9000);

    // Supply doubles after creation; A's weight was already captured
    ASSERT_TRUE(Shares().Mint(d_, 95000));
    ASSERT_TRUE(Shares().Mint(a_, 5000));
    EXPECT_EQ(controller_->GetQuorumSupply(id), 100000);
    EXPECT_EQ(controller_->GetVotingPower(id, a_), 9000);

    PassVote(id);
    EXPECT_EQ(controller_->GetProposal(id)->forVotes, 10000);
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_TRUE(controller_->GetProposal(id)->executed);
}

TEST_F(GovernanceTest, SnapshotStopsVotingTransferredShares) {
    GovernanceConfig config;
    config.mode = VotingPowerMode::Snapshot;
    Build(config);

    ProposalId id = Propose(RoiAdjustment{id_, 800});
    WarpToStart(id);
    ASSERT_TRUE(controller_->CastVote(a_, id, FOR));

    // E held nothing when the proposal opened
    Address e = Address::FromId(5);
    ASSERT_TRUE(Shares().Transfer(a_, e, 9000));
    EXPECT_EQ(controller_->GetVotingPower(id, e), 0);
    EXPECT_EQ(controller_->CastVote(e, id, FOR).error, GovError::InsufficientVotingPower);

    // C moved half its shares to B before B voted; B counts its own 1000
    ASSERT_TRUE(Shares().Transfer(c_, b_, 20000));
    ASSERT_TRUE(controller_->CastVote(b_, id, AGAINST));
    ASSERT_TRUE(controller_->CastVote(c_, id, AGAINST));

    const Proposal* p = controller_->GetProposal(id);
    EXPECT_EQ(p->forVotes, 9000);
    EXPECT_EQ(p->againstVotes, 41000);
    EXPECT_LE(p->TotalVotes(), controller_->GetQuorumSupply(id));
}

TEST_F(GovernanceTest, LiveModeFollowsSupply) {
    ProposalId id = Propose(RoiAdjustment{id_, 800});
    ASSERT_TRUE(Shares().Mint(d_, 95000));
    ASSERT_TRUE(Shares().Mint(a_, 5000));
    EXPECT_EQ(controller_->GetQuorumSupply(id), 200000);

    PassVote(id);
    EXPECT_EQ(controller_->GetProposal(id)->forVotes, 15000);
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_TRUE(controller_->GetProposal(id)->defeated);
}

// ============================================================================
// Dispatch
// ============================================================================

TEST_F(GovernanceTest, ReserveAllocationRetriesAfterFailedDispatch) {
    ProposalId id = Propose(ReserveAllocation{id_, 5000});
    PassVote(id);

    // Governance custody holds nothing yet; the failed call changes nothing
    size_t eventsBefore = controller_->GetEvents().Size();
    EXPECT_EQ(controller_->ExecuteProposal(outsider_, id).error, GovError::ReserveUnavailable);
    const Proposal* p = controller_->GetProposal(id);
    EXPECT_FALSE(p->executed);
    EXPECT_FALSE(p->defeated);
    EXPECT_FALSE(p->quorumReached);
    EXPECT_EQ(controller_->GetEvents().Size(), eventsBefore);
    EXPECT_EQ(*controller_->GetProposalState(id), ProposalState::Succeeded);

    accounts_.Credit(gov_, 5000);
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_TRUE(p->quorumReached);
    EXPECT_EQ(registry_.GetAgreement(id_)->reserveBalance, 5000);
    EXPECT_EQ(accounts_.BalanceOf(custody_), 5000);
    EXPECT_EQ(controller_->GetEvents().OfType(EventType::ReserveAllocated).size(), 1u);
}

TEST_F(GovernanceTest, ReserveWithdrawalPaysHolders) {
    SeedReserve(10000);
    ProposalId id = Propose(ReserveWithdrawal{id_, 1000});
    PassVote(id);

    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_EQ(accounts_.BalanceOf(a_), 90);
    EXPECT_EQ(accounts_.BalanceOf(b_), 10);
    EXPECT_EQ(accounts_.BalanceOf(c_), 400);
    EXPECT_EQ(accounts_.BalanceOf(d_), 500);
    EXPECT_EQ(accounts_.BalanceOf(gov_), 0);
    EXPECT_EQ(registry_.GetAgreement(id_)->reserveBalance, 9000);
    EXPECT_EQ(controller_->GetPendingDistribution(id), nullptr);

    auto payouts = controller_->GetEvents().OfType(EventType::ReserveDistributedToHolders);
    ASSERT_EQ(payouts.size(), 1u);
    EXPECT_EQ(payouts[0].value, 1000);
}

TEST_F(GovernanceTest, ReserveWithdrawalAbortsAndResumes) {
    SeedReserve(10000);
    bool acceptC = false;
    accounts_.SetReceiveHook(c_, [&](const Address&, const Amount&) { return acceptC; });

    ProposalId id = Propose(ReserveWithdrawal{id_, 1000});
    PassVote(id);

    GovResult first = controller_->ExecuteProposal(outsider_, id);
    EXPECT_EQ(first.error, GovError::DistributionAborted);
    EXPECT_FALSE(controller_->GetProposal(id)->executed);

    // Holders before C were paid and keep it; the rest waits in custody
    EXPECT_EQ(accounts_.BalanceOf(a_), 90);
    EXPECT_EQ(accounts_.BalanceOf(b_), 10);
    EXPECT_EQ(accounts_.BalanceOf(c_), 0);
    EXPECT_EQ(accounts_.BalanceOf(d_), 0);
    EXPECT_EQ(accounts_.BalanceOf(gov_), 900);
    const economics::PendingDistribution* pending = controller_->GetPendingDistribution(id);
    ASSERT_NE(pending, nullptr);
    EXPECT_EQ(pending->Outstanding(), 900);

    auto aborted = controller_->GetEvents().OfType(EventType::DistributionAborted);
    ASSERT_EQ(aborted.size(), 1u);
    EXPECT_EQ(aborted[0].value, 900);

    acceptC = true;
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_TRUE(controller_->GetProposal(id)->executed);
    EXPECT_EQ(accounts_.BalanceOf(a_), 90);
    EXPECT_EQ(accounts_.BalanceOf(c_), 400);
    EXPECT_EQ(accounts_.BalanceOf(d_), 500);
    EXPECT_EQ(accounts_.BalanceOf(gov_), 0);

    // The reserve was withdrawn once
    EXPECT_EQ(registry_.GetAgreement(id_)->reserveBalance, 9000);
    EXPECT_EQ(controller_->GetPendingDistribution(id), nullptr);
}

TEST_F(GovernanceTest, PendingPayoutFundsAreHeldBack) {
    SeedReserve(10000);
    bool acceptC = false;
    accounts_.SetReceiveHook(c_, [&](const Address&, const Amount&) { return acceptC; });

    ProposalId withdrawal = Propose(ReserveWithdrawal{id_, 1000});
    PassVote(withdrawal);
    ASSERT_EQ(controller_->ExecuteProposal(outsider_, withdrawal).error,
              GovError::DistributionAborted);
    EXPECT_EQ(accounts_.BalanceOf(gov_), 900);
    EXPECT_EQ(controller_->ReservedForPending(), 900);

    // Custody holds exactly the unpaid amount; none of it may be allocated
    ProposalId allocation = Propose(ReserveAllocation{id_, 900});
    PassVote(allocation);
    EXPECT_EQ(controller_->ExecuteProposal(outsider_, allocation).error,
              GovError::ReserveUnavailable);
    EXPECT_FALSE(controller_->GetProposal(allocation)->executed);
    EXPECT_EQ(accounts_.BalanceOf(gov_), 900);
    EXPECT_EQ(registry_.GetAgreement(id_)->reserveBalance, 9000);

    // Only funds beyond the pending payout are spendable
    accounts_.Credit(gov_, 900);
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, allocation));
    EXPECT_EQ(accounts_.BalanceOf(gov_), 900);
    EXPECT_EQ(registry_.GetAgreement(id_)->reserveBalance, 9900);

    acceptC = true;
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, withdrawal));
    EXPECT_EQ(accounts_.BalanceOf(c_), 400);
    EXPECT_EQ(accounts_.BalanceOf(d_), 500);
    EXPECT_EQ(accounts_.BalanceOf(gov_), 0);
    EXPECT_EQ(controller_->ReservedForPending(), 0);
}

TEST_F(GovernanceTest, GovernanceParameterUpdate) {
    // The parameter id doubles as the agreement whose holders vote (id 1)
    ASSERT_EQ(id_, 1u);
    ProposalId id = Propose(GovernanceParamUpdate{1, 14 * ONE_DAY});
    EXPECT_EQ(controller_->GetProposal(id)->agreementId, 1u);
    PassVote(id);

    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_EQ(controller_->GetParameters().votingPeriod, 14 * ONE_DAY);

    ProposalId next = Propose(RoiAdjustment{id_, 800});
    const Proposal* p = controller_->GetProposal(next);
    EXPECT_EQ(p->votingEnd - p->votingStart, 14 * ONE_DAY);

    auto updates = controller_->GetEvents().OfType(EventType::GovernanceParameterUpdated);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].detail, "VotingPeriod");
}

TEST_F(GovernanceTest, AgreementParameterUpdate) {
    ProposalId id = Propose(AgreementParamUpdate{id_, 0, 60});
    PassVote(id);
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_EQ(registry_.GetAgreement(id_)->gracePeriodDays, 60u);

    ProposalId flag = Propose(AgreementParamUpdate{id_, 4, 0});
    PassVote(flag);
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, flag));
    EXPECT_FALSE(registry_.GetAgreement(id_)->allowEarlyRepayment);
}

TEST_F(GovernanceTest, TransferRestrictionUpdate) {
    ProposalId id = Propose(RestrictionParamUpdate{id_, 1, 5000});
    PassVote(id);
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_EQ(Shares().Restrictions().GetMaxSharesPerInvestorBP(), 5000u);
    EXPECT_EQ(controller_->GetEvents().OfType(EventType::TransferRestrictionUpdated).size(), 1u);
}

TEST_F(GovernanceTest, ExpiredLockupFailsAtDispatch) {
    // Valid when proposed, in the past once voting is over
    ProposalId id = Propose(RestrictionParamUpdate{id_, 0, NOW + 2 * ONE_DAY});
    PassVote(id);
    EXPECT_EQ(controller_->ExecuteProposal(outsider_, id).error, GovError::ParameterOutOfBounds);
    EXPECT_FALSE(controller_->GetProposal(id)->executed);
}

// ============================================================================
// Reentrancy
// ============================================================================

TEST_F(GovernanceTest, PayoutHookCannotReenter) {
    SeedReserve(10000);
    ProposalId other = Propose(RoiAdjustment{id_, 800});
    ProposalId id = Propose(ReserveWithdrawal{id_, 1000});
    PassVote(id);

    GovResult nestedExecute;
    GovResult nestedCreate;
    accounts_.SetReceiveHook(a_, [&](const Address&, const Amount&) {
        nestedExecute = controller_->ExecuteProposal(a_, id);
        ProposalId ignored = 0;
        nestedCreate = controller_->CreateProposal(a_, RoiAdjustment{id_, 700}, "", ignored);
        return true;
    });

    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));
    EXPECT_EQ(nestedExecute.error, GovError::Reentrancy);
    EXPECT_EQ(nestedCreate.error, GovError::Reentrancy);
    EXPECT_EQ(accounts_.BalanceOf(a_), 90);
    EXPECT_EQ(controller_->GetProposalCount(), 2u);
    EXPECT_FALSE(controller_->GetProposal(other)->executed);
}

// ============================================================================
// Event Log
// ============================================================================

TEST_F(GovernanceTest, EventLogRecordsLifecycle) {
    ProposalId id = Propose(RoiAdjustment{id_, 800});
    WarpToStart(id);
    ASSERT_TRUE(controller_->CastVote(a_, id, FOR));
    ASSERT_TRUE(controller_->CastVote(b_, id, ABSTAIN));
    WarpPastEnd(id);
    ASSERT_TRUE(controller_->ExecuteProposal(outsider_, id));

    const GovernanceEventLog& log = controller_->GetEvents();
    EXPECT_TRUE(log.Verify());

    auto events = log.ForProposal(id);
    ASSERT_EQ(events.size(), 5u);
    EXPECT_EQ(events[0].type, EventType::ProposalCreated);
    EXPECT_EQ(events[0].actor, a_);
    EXPECT_EQ(events[1].type, EventType::VoteCast);
    EXPECT_EQ(events[1].value, 9000);
    EXPECT_EQ(events[1].support, FOR);
    EXPECT_EQ(events[2].support, ABSTAIN);
    EXPECT_EQ(events[3].type, EventType::ROIAdjusted);
    EXPECT_EQ(events[3].value, 800);
    EXPECT_EQ(events[4].type, EventType::ProposalExecuted);
    EXPECT_EQ(events[4].actor, outsider_);

    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_EQ(events[i].prevHash, events[i - 1].hash);
    }
}

// ============================================================================
// KYC Whitelist Proposals
// ============================================================================

/// Shared-ledger deployment; agreement 0 maps to the platform token
class KycGovernanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::EnableMockTime();
        util::SetMockTime(NOW);

        ASSERT_TRUE(shared_.Mint(PLATFORM_TOKEN, voter_, 1000));
        power_.SetTokenId(0, PLATFORM_TOKEN);
        ASSERT_TRUE(kyc_.SetGovernance(owner_, gov_));
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    ProposalId ProposeAndPass(bool add) {
        ProposalId id = 0;
        EXPECT_TRUE(controller_.CreateKYCWhitelistProposal(voter_, investor_, add, "kyc", id));
        const Proposal* p = controller_.GetProposal(id);
        util::SetMockTime(p->votingStart);
        EXPECT_TRUE(controller_.CastVote(voter_, id, FOR));
        util::SetMockTime(p->votingEnd + 1);
        return id;
    }

    static constexpr TokenId PLATFORM_TOKEN = 100;

    Address owner_ = Address::FromId(0xA0);
    Address gov_ = Address::FromId(0x60);
    Address custody_ = Address::FromId(0xC0);
    Address voter_ = Address::FromId(1);
    Address investor_ = Address::FromId(0x77);

    economics::SettlementAccounts accounts_;
    economics::AccountTransfer payout_{accounts_, custody_};
    economics::AccountTransfer govCustody_{accounts_, gov_};
    agreement::YieldAgreementRegistry registry_{owner_, custody_, payout_};
    ledger::MultiTokenLedger shared_{owner_};
    SharedLedgerVotingPower power_{&shared_};
    kyc::KycRegistry kyc_{owner_};
    GovernanceController controller_{gov_, power_, registry_, govCustody_};
};

TEST_F(KycGovernanceTest, WhitelistAddAndRemove) {
    controller_.SetKycRegistry(&kyc_);

    ProposalId add = ProposeAndPass(true);
    EXPECT_EQ(controller_.GetProposal(add)->agreementId, 0u);
    ASSERT_TRUE(controller_.ExecuteProposal(voter_, add));
    EXPECT_TRUE(kyc_.IsWhitelisted(investor_));

    ProposalId remove = ProposeAndPass(false);
    ASSERT_TRUE(controller_.ExecuteProposal(voter_, remove));
    EXPECT_FALSE(kyc_.IsWhitelisted(investor_));

    auto updates = controller_.GetEvents().OfType(EventType::KYCWhitelistUpdated);
    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0].detail, "add");
    EXPECT_EQ(updates[1].detail, "remove");
}

TEST_F(KycGovernanceTest, DispatchNeedsRegistry) {
    ProposalId id = ProposeAndPass(true);
    EXPECT_EQ(controller_.ExecuteProposal(voter_, id).error, GovError::DispatchFailed);
    EXPECT_FALSE(controller_.GetProposal(id)->executed);

    controller_.SetKycRegistry(&kyc_);
    ASSERT_TRUE(controller_.ExecuteProposal(voter_, id));
    EXPECT_TRUE(kyc_.IsWhitelisted(investor_));
}

TEST_F(KycGovernanceTest, RedundantUpdateFailsDispatch) {
    controller_.SetKycRegistry(&kyc_);
    ASSERT_TRUE(kyc_.AddToWhitelist(owner_, investor_));

    ProposalId id = ProposeAndPass(true);
    EXPECT_EQ(controller_.ExecuteProposal(voter_, id).error, GovError::AlreadyInState);
    EXPECT_FALSE(controller_.GetProposal(id)->executed);
}

TEST_F(KycGovernanceTest, NullTargetRejected) {
    ProposalId id = 0;
    GovResult r = controller_.CreateKYCWhitelistProposal(voter_, Address(), true, "", id);
    EXPECT_EQ(r.reason, "KYC target address must be non-zero");

    r = controller_.CreateProposal(voter_, KycWhitelistUpdate{Address(), true}, "", id);
    EXPECT_EQ(r.error, GovError::ParameterOutOfBounds);
    EXPECT_EQ(controller_.GetProposalCount(), 0u);
}
