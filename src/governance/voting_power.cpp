// YIELDGOV - Voting Power Sources Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/governance/voting_power.h>
#include <yieldgov/agreement/agreement_registry.h>
#include <yieldgov/ledger/multi_token.h>

namespace yieldgov {
namespace governance {

// ============================================================================
// SingleLedgerVotingPower
// ============================================================================

ShareCount SingleLedgerVotingPower::BalanceOf(const Address& voter,
                                              AgreementId agreementId) const {
    const ledger::ShareholderLedger* ledger = LedgerFor(agreementId);
    return ledger ? ledger->BalanceOf(voter) : ShareCount(0);
}

ShareCount SingleLedgerVotingPower::TotalSupply(AgreementId agreementId) const {
    const ledger::ShareholderLedger* ledger = LedgerFor(agreementId);
    return ledger ? ledger->TotalShares() : ShareCount(0);
}

ledger::ShareholderLedger* SingleLedgerVotingPower::LedgerFor(AgreementId agreementId) const {
    if (!registry_) {
        return nullptr;
    }
    return registry_->GetLedger(agreementId);
}

// ============================================================================
// SharedLedgerVotingPower
// ============================================================================

void SharedLedgerVotingPower::SetTokenId(AgreementId agreementId, TokenId tokenId) {
    tokenIds_[agreementId] = tokenId;
}

void SharedLedgerVotingPower::ClearTokenId(AgreementId agreementId) {
    tokenIds_.erase(agreementId);
}

std::optional<TokenId> SharedLedgerVotingPower::TokenIdFor(AgreementId agreementId) const {
    auto it = tokenIds_.find(agreementId);
    if (it == tokenIds_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ShareCount SharedLedgerVotingPower::BalanceOf(const Address& voter,
                                              AgreementId agreementId) const {
    auto tokenId = TokenIdFor(agreementId);
    if (!shared_ || !tokenId) {
        return 0;
    }
    return shared_->BalanceOf(voter, *tokenId);
}

ShareCount SharedLedgerVotingPower::TotalSupply(AgreementId agreementId) const {
    auto tokenId = TokenIdFor(agreementId);
    if (!shared_ || !tokenId) {
        return 0;
    }
    return shared_->TotalSupply(*tokenId);
}

ledger::ShareholderLedger* SharedLedgerVotingPower::LedgerFor(AgreementId agreementId) const {
    auto tokenId = TokenIdFor(agreementId);
    if (!shared_ || !tokenId) {
        return nullptr;
    }
    return shared_->Ledger(*tokenId);
}

// ============================================================================
// VotingPowerSnapshots
// ============================================================================

VotingPowerSnapshots::~VotingPowerSnapshots() {
    for (ledger::ShareholderLedger* watched : watched_) {
        watched->RemoveObserver(this);
    }
}

void VotingPowerSnapshots::Open(ProposalId proposalId, AgreementId agreementId) {
    Snapshot snap;
    snap.agreementId = agreementId;
    snap.totalSupply = source_.TotalSupply(agreementId);

    ledger::ShareholderLedger* shares = source_.LedgerFor(agreementId);
    if (shares) {
        snap.ledger = shares;
        if (watched_.insert(shares).second) {
            shares->AddObserver(this);
        }
    }
    snapshots_[proposalId] = std::move(snap);
}

bool VotingPowerSnapshots::IsOpen(ProposalId proposalId) const {
    return snapshots_.count(proposalId) > 0;
}

ShareCount VotingPowerSnapshots::TotalSupply(ProposalId proposalId) const {
    auto it = snapshots_.find(proposalId);
    return it == snapshots_.end() ? ShareCount(0) : it->second.totalSupply;
}

ShareCount VotingPowerSnapshots::BalanceOf(ProposalId proposalId, const Address& voter) {
    auto it = snapshots_.find(proposalId);
    if (it == snapshots_.end()) {
        return 0;
    }
    Snapshot& snap = it->second;
    auto balIt = snap.balances.find(voter);
    if (balIt != snap.balances.end()) {
        return balIt->second;
    }

    // Unchanged since Open(); no ledger then means no holders then
    ShareCount balance = snap.ledger ? snap.ledger->BalanceOf(voter) : ShareCount(0);
    snap.balances.emplace(voter, balance);
    return balance;
}

size_t VotingPowerSnapshots::CapturedCount(ProposalId proposalId) const {
    auto it = snapshots_.find(proposalId);
    return it == snapshots_.end() ? 0 : it->second.balances.size();
}

void VotingPowerSnapshots::OnBalanceChanging(const ledger::ShareholderLedger& ledger,
                                             const Address& holder,
                                             const ShareCount& previous) {
    for (auto& [id, snap] : snapshots_) {
        if (snap.ledger == &ledger) {
            // Keeps an earlier capture
            snap.balances.emplace(holder, previous);
        }
    }
}

void VotingPowerSnapshots::OnLedgerDestroyed(const ledger::ShareholderLedger& ledger) {
    for (auto it = watched_.begin(); it != watched_.end();) {
        if (*it == &ledger) {
            it = watched_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& [id, snap] : snapshots_) {
        if (snap.ledger == &ledger) {
            snap.ledger = nullptr;
        }
    }
}

} // namespace governance
} // namespace yieldgov
