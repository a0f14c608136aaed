// YIELDGOV - Time Utilities Implementation
// Copyright (c) 2024 YIELDGOV Developers
// MIT License

#include "yieldgov/util/time.h"

#include <atomic>
#include <mutex>
#include <sstream>

namespace yieldgov {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;

    int64_t WallClockSeconds() {
        return std::chrono::duration_cast<Seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return WallClockSeconds();
}

std::string FormatDuration(int64_t seconds) {
    if (seconds < 0) {
        return "-" + FormatDuration(-seconds);
    }

    int64_t days = seconds / 86400;
    int64_t hours = (seconds % 86400) / 3600;
    int64_t minutes = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (days > 0 || hours > 0) oss << hours << "h ";
    if (days > 0 || hours > 0 || minutes > 0) oss << minutes << "m ";
    oss << secs << "s";
    return oss.str();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTime.load() == 0) {
        g_mockTime.store(WallClockSeconds());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(int64_t seconds) {
    g_mockTime.fetch_add(seconds);
}

} // namespace util
} // namespace yieldgov
