// Pasifika - Time Utilities
// Copyright (c) 2024 Pasifika Developers
// MIT License
//
// Wall-clock source for the engines. Every time-dependent rule (daily limits,
// lock periods, schedules, deadlines) reads GetTime(), which tests replace
// with a mock clock.

#ifndef PASIFIKA_UTIL_TIME_H
#define PASIFIKA_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace pasifika {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::time_point<SystemClock>;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Get current Unix timestamp in milliseconds
int64_t GetTimeMillis();

/// Convert Unix timestamp to system time point
SystemTimePoint FromUnixTime(int64_t timestamp);

// ============================================================================
// Formatting
// ============================================================================

/// Format Unix timestamp as ISO 8601 (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Format duration as human-readable string (e.g., "1d 2h 3m 4s")
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time mode
void EnableMockTime();

/// Disable mock time mode
void DisableMockTime();

/// Check if mock time is enabled
bool IsMockTimeEnabled();

/// Set mock time
void SetMockTime(int64_t timestamp);

/// Advance mock time by duration
void AdvanceMockTime(Seconds duration);

/// Get mock time value
int64_t GetMockTime();

/// Enables mock time at a fixed instant for the lifetime of the object
class ScopedMockTime {
public:
    explicit ScopedMockTime(int64_t timestamp);
    ~ScopedMockTime();

    ScopedMockTime(const ScopedMockTime&) = delete;
    ScopedMockTime& operator=(const ScopedMockTime&) = delete;

    void Advance(Seconds duration) { AdvanceMockTime(duration); }

private:
    bool wasEnabled_;
    int64_t previous_;
};

} // namespace util
} // namespace pasifika

#endif // PASIFIKA_UTIL_TIME_H
