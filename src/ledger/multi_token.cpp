// YIELDGOV - Shared Multi-Agreement Ledger Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include <yieldgov/ledger/multi_token.h>
#include <yieldgov/util/logging.h>

namespace yieldgov {
namespace ledger {

MultiTokenLedger::MultiTokenLedger(const Address& owner, size_t maxShareholdersPerToken)
    : owner_(owner), maxShareholdersPerToken_(maxShareholdersPerToken) {}

ShareholderLedger& MultiTokenLedger::CreateToken(TokenId tokenId) {
    auto it = tokens_.find(tokenId);
    if (it != tokens_.end()) {
        return *it->second;
    }
    auto ledger = std::make_unique<ShareholderLedger>(owner_, maxShareholdersPerToken_);
    ShareholderLedger& ref = *ledger;
    tokens_.emplace(tokenId, std::move(ledger));
    LOG_DEBUG(util::LogCategory::LEDGER) << "Created token ledger " << tokenId;
    return ref;
}

bool MultiTokenLedger::HasToken(TokenId tokenId) const {
    return tokens_.count(tokenId) > 0;
}

std::vector<TokenId> MultiTokenLedger::GetTokenIds() const {
    std::vector<TokenId> ids;
    ids.reserve(tokens_.size());
    for (const auto& [id, ledger] : tokens_) {
        ids.push_back(id);
    }
    return ids;
}

ShareholderLedger* MultiTokenLedger::Ledger(TokenId tokenId) {
    auto it = tokens_.find(tokenId);
    return it == tokens_.end() ? nullptr : it->second.get();
}

const ShareholderLedger* MultiTokenLedger::Ledger(TokenId tokenId) const {
    auto it = tokens_.find(tokenId);
    return it == tokens_.end() ? nullptr : it->second.get();
}

ShareCount MultiTokenLedger::BalanceOf(const Address& holder, TokenId tokenId) const {
    const ShareholderLedger* ledger = Ledger(tokenId);
    return ledger ? ledger->BalanceOf(holder) : ShareCount(0);
}

ShareCount MultiTokenLedger::TotalSupply(TokenId tokenId) const {
    const ShareholderLedger* ledger = Ledger(tokenId);
    return ledger ? ledger->TotalShares() : ShareCount(0);
}

GovResult MultiTokenLedger::Mint(TokenId tokenId, const Address& to, const ShareCount& amount) {
    return CreateToken(tokenId).Mint(to, amount);
}

GovResult MultiTokenLedger::Burn(TokenId tokenId, const Address& from, const ShareCount& amount) {
    ShareholderLedger* ledger = Ledger(tokenId);
    if (!ledger) {
        return GovResult::Fail(GovError::InsufficientBalance, "unknown token id");
    }
    return ledger->Burn(from, amount);
}

GovResult MultiTokenLedger::Transfer(TokenId tokenId, const Address& from, const Address& to,
                                     const ShareCount& amount) {
    ShareholderLedger* ledger = Ledger(tokenId);
    if (!ledger) {
        return GovResult::Fail(GovError::InsufficientBalance, "unknown token id");
    }
    return ledger->Transfer(from, to, amount);
}

} // namespace ledger
} // namespace yieldgov
