// YIELDGOV - Time Utilities
// Copyright (c) 2024 YIELDGOV Developers
// MIT License
//
// "Now" for every time-dependent rule (voting windows, lockups, holding
// periods) comes from GetTime(). Tests switch on mock time to drive it.

#ifndef YIELDGOV_UTIL_TIME_H
#define YIELDGOV_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace yieldgov {
namespace util {

using Seconds = std::chrono::seconds;

/// Current Unix timestamp in seconds (mock time if enabled)
int64_t GetTime();

/// Format a duration in seconds as "3d 4h 5m 6s"
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time mode, seeded with the real clock if unset
void EnableMockTime();

/// Disable mock time mode
void DisableMockTime();

/// Check if mock time is enabled
bool IsMockTimeEnabled();

/// Set mock time
void SetMockTime(int64_t timestamp);

/// Advance mock time by a number of seconds
void AdvanceMockTime(int64_t seconds);

} // namespace util
} // namespace yieldgov

#endif // YIELDGOV_UTIL_TIME_H
