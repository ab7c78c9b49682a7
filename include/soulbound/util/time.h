// SOULBOUND - Time Utilities
// Copyright (c) 2024 SOULBOUND Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - ISO 8601 formatting
// - Mock time for testing

#ifndef SOULBOUND_UTIL_TIME_H
#define SOULBOUND_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace soulbound {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time if enabled)
int64_t GetTime();

/// Current Unix timestamp in milliseconds (mock time if enabled)
int64_t GetTimeMillis();

/// Convert Unix timestamp to system time point
SystemTimePoint FromUnixTime(int64_t timestamp);

// ============================================================================
// Time Formatting
// ============================================================================

/// Format Unix timestamp as ISO 8601 UTC (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time mode. The clock is frozen at the current time unless
/// SetMockTime was called before.
void EnableMockTime();

/// Disable mock time mode
void DisableMockTime();

bool IsMockTimeEnabled();

/// Set mock time
void SetMockTime(int64_t timestamp);

/// Advance mock time by duration
void AdvanceMockTime(Seconds duration);

/// Get mock time value
int64_t GetMockTime();

} // namespace util
} // namespace soulbound

#endif // SOULBOUND_UTIL_TIME_H
