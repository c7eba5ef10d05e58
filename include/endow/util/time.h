// ENDOW - Time Utilities
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// Wall-clock access and interruptible sleeping for the keeper loop.

#ifndef ENDOW_UTIL_TIME_H
#define ENDOW_UTIL_TIME_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace endow {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds
int64_t GetTime();

// ============================================================================
// Formatting
// ============================================================================

/// Compact duration such as "1d 2h 3m 4s"; "0s" for zero
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Sleep
// ============================================================================

/// Sleep up to duration, waking early when interrupt becomes true.
/// Returns true if interrupted.
bool SleepInterruptible(Milliseconds duration, const std::atomic<bool>& interrupt);

} // namespace util
} // namespace endow

#endif // ENDOW_UTIL_TIME_H
