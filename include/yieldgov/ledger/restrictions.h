// YIELDGOV - Transfer Restrictions
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Mutable restriction state attached to one ownership ledger, and the
// ordered checklist every holder-to-holder movement must pass:
//
//   1. transfers not paused
//   2. lockup expired
//   3. sender held long enough since their last inbound transfer
//   4. recipient stays under the per-investor concentration cap
//   5. recipient whitelisted (whitelist enabled)
//   6. recipient not blacklisted (blacklist enabled)
//   7. sender not blacklisted (blacklist enabled)
//
// The first failing rule wins. Mint and burn never reach the checklist.

#ifndef YIELDGOV_LEDGER_RESTRICTIONS_H
#define YIELDGOV_LEDGER_RESTRICTIONS_H

#include <yieldgov/core/error.h>
#include <yieldgov/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace yieldgov {
namespace ledger {

// ============================================================================
// Constants
// ============================================================================

/// Lower bound for a non-zero concentration cap (1%)
constexpr uint64_t MIN_MAX_SHARES_BP = 100;

/// Longest configurable holding period
constexpr int64_t MAX_HOLDING_PERIOD = 365 * ONE_DAY;

/// Restriction fields addressable by a TransferRestrictionUpdate proposal
enum class RestrictionParam : uint8_t {
    LockupEnd = 0,
    MaxSharesPerInvestorBP = 1,
    MinHoldingPeriod = 2
};

constexpr uint64_t MAX_RESTRICTION_PARAM_ID = 2;

const char* RestrictionParamToString(RestrictionParam param);

/// Map a raw parameter id to a field (nullopt if out of range)
std::optional<RestrictionParam> RestrictionParamFromId(uint64_t id);

/**
 * Bounds check for a proposed restriction value.
 * Lockup must be 0 or later than now, the cap 0 or within [100, 10000] bp,
 * the holding period at most 365 days.
 */
GovResult ValidateRestrictionParam(RestrictionParam param, const Uint256& value,
                                   Timestamp now);

// ============================================================================
// Check Result
// ============================================================================

struct TransferCheck {
    bool allowed{true};
    std::string reason;

    static TransferCheck Allow() { return {true, ""}; }
    static TransferCheck Deny(const std::string& why) { return {false, why}; }
};

// ============================================================================
// Restriction State
// ============================================================================

class TransferRestrictions {
public:
    TransferRestrictions() = default;

    // Parameters (0 disables the corresponding rule)
    Timestamp GetLockupEnd() const { return lockupEnd_; }
    uint64_t GetMaxSharesPerInvestorBP() const { return maxSharesBP_; }
    int64_t GetMinHoldingPeriod() const { return minHoldingPeriod_; }
    bool IsPaused() const { return paused_; }
    bool IsWhitelistEnabled() const { return whitelistEnabled_; }
    bool IsBlacklistEnabled() const { return blacklistEnabled_; }

    void SetLockupEnd(Timestamp ts) { lockupEnd_ = ts; }
    void SetMaxSharesPerInvestorBP(uint64_t bp) { maxSharesBP_ = bp; }
    void SetMinHoldingPeriod(int64_t seconds) { minHoldingPeriod_ = seconds; }
    void SetPaused(bool paused) { paused_ = paused; }
    void SetWhitelistEnabled(bool enabled) { whitelistEnabled_ = enabled; }
    void SetBlacklistEnabled(bool enabled) { blacklistEnabled_ = enabled; }

    /// Write a field from an already validated value
    void Apply(RestrictionParam param, const Uint256& value);

    // Lists
    void SetWhitelisted(const Address& addr, bool listed);
    void SetBlacklisted(const Address& addr, bool listed);

    /// Always true while the whitelist is disabled
    bool IsWhitelisted(const Address& addr) const;

    /// Always false while the blacklist is disabled
    bool IsBlacklisted(const Address& addr) const;

    // Holding period bookkeeping
    Timestamp LastInboundTransfer(const Address& addr) const;
    void RecordInbound(const Address& addr, Timestamp now);

    /**
     * Run the checklist for a holder-to-holder movement.
     *
     * @param recipientBalance Recipient balance before the movement
     * @param totalShares      Ledger total shares (unchanged by a transfer)
     */
    TransferCheck Check(const Address& from, const Address& to,
                        const ShareCount& amount,
                        const ShareCount& recipientBalance,
                        const ShareCount& totalShares,
                        Timestamp now) const;

private:
    Timestamp lockupEnd_{0};
    uint64_t maxSharesBP_{0};
    int64_t minHoldingPeriod_{0};
    bool paused_{false};
    bool whitelistEnabled_{false};
    bool blacklistEnabled_{false};

    std::unordered_set<Address> whitelist_;
    std::unordered_set<Address> blacklist_;
    std::unordered_map<Address, Timestamp> lastInbound_;
};

} // namespace ledger
} // namespace yieldgov

#endif // YIELDGOV_LEDGER_RESTRICTIONS_H
