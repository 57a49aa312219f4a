// Pasifika - Time Utilities Implementation
// Copyright (c) 2024 Pasifika Developers
// MIT License

#include "pasifika/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pasifika {
namespace util {

namespace {

std::atomic<bool> g_mockTimeEnabled{false};
std::atomic<int64_t> g_mockTime{0};

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

} // namespace

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<Seconds>(
        SystemClock::now().time_since_epoch()).count();
}

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load() * 1000;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        SystemClock::now().time_since_epoch()).count();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint(Seconds(timestamp));
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(Seconds duration) {
    int64_t total = duration.count();

    if (total < 0) {
        return "-" + FormatDuration(Seconds{-total});
    }
    if (total == 0) {
        return "0s";
    }

    int64_t days = total / SECONDS_PER_DAY;
    total %= SECONDS_PER_DAY;
    int64_t hours = total / SECONDS_PER_HOUR;
    total %= SECONDS_PER_HOUR;
    int64_t minutes = total / SECONDS_PER_MINUTE;
    int64_t seconds = total % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    const char* sep = "";
    if (days > 0) { oss << days << "d"; sep = " "; }
    if (hours > 0) { oss << sep << hours << "h"; sep = " "; }
    if (minutes > 0) { oss << sep << minutes << "m"; sep = " "; }
    if (seconds > 0) { oss << sep << seconds << "s"; }
    return oss.str();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    if (!g_mockTimeEnabled.load() && g_mockTime.load() == 0) {
        g_mockTime.store(std::chrono::duration_cast<Seconds>(
            SystemClock::now().time_since_epoch()).count());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

ScopedMockTime::ScopedMockTime(int64_t timestamp)
    : wasEnabled_(g_mockTimeEnabled.load())
    , previous_(g_mockTime.load()) {
    g_mockTime.store(timestamp);
    g_mockTimeEnabled.store(true);
}

ScopedMockTime::~ScopedMockTime() {
    g_mockTime.store(previous_);
    g_mockTimeEnabled.store(wasEnabled_);
}

} // namespace util
} // namespace pasifika
