// YIELDGOV - Reentrancy Guard
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// Several entry points hand control to an external payment primitive that
// may run caller-controlled code before returning. The guard is held for the
// whole call; a nested entry observes it and is rejected instead of
// blocking.

#ifndef YIELDGOV_UTIL_REENTRANCY_H
#define YIELDGOV_UTIL_REENTRANCY_H

#include <atomic>

namespace yieldgov {
namespace util {

class ReentrancyGuard {
public:
    ReentrancyGuard() = default;

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    bool IsEntered() const { return entered_.load(); }

private:
    friend class ReentrancyScope;

    bool TryEnter() { return !entered_.exchange(true); }
    void Leave() { entered_.store(false); }

    std::atomic<bool> entered_{false};
};

/// RAII holder; check Acquired() before touching state
class ReentrancyScope {
public:
    explicit ReentrancyScope(ReentrancyGuard& guard)
        : guard_(guard), acquired_(guard.TryEnter()) {}

    ~ReentrancyScope() {
        if (acquired_) {
            guard_.Leave();
        }
    }

    ReentrancyScope(const ReentrancyScope&) = delete;
    ReentrancyScope& operator=(const ReentrancyScope&) = delete;

    bool Acquired() const { return acquired_; }

private:
    ReentrancyGuard& guard_;
    bool acquired_;
};

} // namespace util
} // namespace yieldgov

#endif // YIELDGOV_UTIL_REENTRANCY_H
