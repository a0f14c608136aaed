// YIELDGOV - Shared Multi-Agreement Ledger
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// One ledger instance serving many agreements, each under its own secondary
// token id. Every token id carries an independent ShareholderLedger with its
// own holder cap and restriction state.

#ifndef YIELDGOV_LEDGER_MULTI_TOKEN_H
#define YIELDGOV_LEDGER_MULTI_TOKEN_H

#include <yieldgov/ledger/shareholder_ledger.h>

#include <map>
#include <memory>
#include <vector>

namespace yieldgov {
namespace ledger {

class MultiTokenLedger {
public:
    explicit MultiTokenLedger(const Address& owner,
                              size_t maxShareholdersPerToken = DEFAULT_MAX_SHAREHOLDERS);

    MultiTokenLedger(const MultiTokenLedger&) = delete;
    MultiTokenLedger& operator=(const MultiTokenLedger&) = delete;

    const Address& GetOwner() const { return owner_; }

    /// Create the ledger for a token id, or return the existing one
    ShareholderLedger& CreateToken(TokenId tokenId);

    bool HasToken(TokenId tokenId) const;
    std::vector<TokenId> GetTokenIds() const;

    /// nullptr if the token id was never created
    ShareholderLedger* Ledger(TokenId tokenId);
    const ShareholderLedger* Ledger(TokenId tokenId) const;

    /// 0 for unknown token ids
    ShareCount BalanceOf(const Address& holder, TokenId tokenId) const;
    ShareCount TotalSupply(TokenId tokenId) const;

    /// Creates the token ledger on first mint
    GovResult Mint(TokenId tokenId, const Address& to, const ShareCount& amount);
    GovResult Burn(TokenId tokenId, const Address& from, const ShareCount& amount);
    GovResult Transfer(TokenId tokenId, const Address& from, const Address& to,
                       const ShareCount& amount);

private:
    Address owner_;
    size_t maxShareholdersPerToken_;
    std::map<TokenId, std::unique_ptr<ShareholderLedger>> tokens_;
};

} // namespace ledger
} // namespace yieldgov

#endif // YIELDGOV_LEDGER_MULTI_TOKEN_H
