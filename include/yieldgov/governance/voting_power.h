// YIELDGOV - Voting Power Sources
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Governance reads balances and total supply per agreement through
// IVotingPowerSource. Two interchangeable variants exist:
// - SingleLedgerVotingPower: each agreement has its own ledger instance,
//   found through the agreement registry.
// - SharedLedgerVotingPower: all agreements live in one MultiTokenLedger
//   under a mapped secondary token id.
// Both report 0 when the backing ledger is missing or unmapped.

#ifndef YIELDGOV_GOVERNANCE_VOTING_POWER_H
#define YIELDGOV_GOVERNANCE_VOTING_POWER_H

#include <yieldgov/core/types.h>
#include <yieldgov/ledger/shareholder_ledger.h>

#include <map>
#include <optional>
#include <set>
#include <unordered_map>

namespace yieldgov {

namespace agreement {
class IAgreementRegistry;
}

namespace ledger {
class MultiTokenLedger;
}

namespace governance {

/// Proposal identifier (0 = none)
using ProposalId = uint64_t;

class IVotingPowerSource {
public:
    virtual ~IVotingPowerSource() = default;

    virtual ShareCount BalanceOf(const Address& voter, AgreementId agreementId) const = 0;
    virtual ShareCount TotalSupply(AgreementId agreementId) const = 0;

    /// Ledger backing the agreement, used for payouts and restriction updates
    virtual ledger::ShareholderLedger* LedgerFor(AgreementId agreementId) const = 0;
};

// ============================================================================
// Variants
// ============================================================================

class SingleLedgerVotingPower : public IVotingPowerSource {
public:
    /// `registry` may be null; every query then reports 0
    explicit SingleLedgerVotingPower(agreement::IAgreementRegistry* registry)
        : registry_(registry) {}

    ShareCount BalanceOf(const Address& voter, AgreementId agreementId) const override;
    ShareCount TotalSupply(AgreementId agreementId) const override;
    ledger::ShareholderLedger* LedgerFor(AgreementId agreementId) const override;

private:
    agreement::IAgreementRegistry* registry_;
};

class SharedLedgerVotingPower : public IVotingPowerSource {
public:
    /// `shared` may be null; every query then reports 0
    explicit SharedLedgerVotingPower(ledger::MultiTokenLedger* shared)
        : shared_(shared) {}

    void SetTokenId(AgreementId agreementId, TokenId tokenId);
    void ClearTokenId(AgreementId agreementId);
    std::optional<TokenId> TokenIdFor(AgreementId agreementId) const;

    ShareCount BalanceOf(const Address& voter, AgreementId agreementId) const override;
    ShareCount TotalSupply(AgreementId agreementId) const override;
    ledger::ShareholderLedger* LedgerFor(AgreementId agreementId) const override;

private:
    ledger::MultiTokenLedger* shared_;
    std::map<AgreementId, TokenId> tokenIds_;
};

// ============================================================================
// Snapshots
// ============================================================================

/**
 * Per-proposal view of balances as they stood when the proposal was opened.
 *
 * Total supply is captured at Open(). Balances are captured copy-on-write:
 * the snapshot watches the agreement's ledger and records a holder's old
 * balance the first time it changes afterwards. A holder with no recorded
 * entry has not changed since Open(), so the live balance is the
 * snapshotted one.
 */
class VotingPowerSnapshots : public ledger::IBalanceObserver {
public:
    explicit VotingPowerSnapshots(const IVotingPowerSource& source) : source_(source) {}
    ~VotingPowerSnapshots() override;

    VotingPowerSnapshots(const VotingPowerSnapshots&) = delete;
    VotingPowerSnapshots& operator=(const VotingPowerSnapshots&) = delete;

    void Open(ProposalId proposalId, AgreementId agreementId);
    bool IsOpen(ProposalId proposalId) const;

    ShareCount TotalSupply(ProposalId proposalId) const;
    ShareCount BalanceOf(ProposalId proposalId, const Address& voter);

    /// Number of balances recorded for a proposal
    size_t CapturedCount(ProposalId proposalId) const;

    void OnBalanceChanging(const ledger::ShareholderLedger& ledger, const Address& holder,
                           const ShareCount& previous) override;
    void OnLedgerDestroyed(const ledger::ShareholderLedger& ledger) override;

private:
    struct Snapshot {
        AgreementId agreementId{0};
        ShareCount totalSupply{0};

        /// Watched ledger; null if the agreement had none at Open()
        const ledger::ShareholderLedger* ledger{nullptr};

        std::unordered_map<Address, ShareCount> balances;
    };

    const IVotingPowerSource& source_;
    std::map<ProposalId, Snapshot> snapshots_;
    std::set<ledger::ShareholderLedger*> watched_;
};

} // namespace governance
} // namespace yieldgov

#endif // YIELDGOV_GOVERNANCE_VOTING_POWER_H
