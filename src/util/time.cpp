// ENDOW - Time Utilities Implementation
// Copyright (c) 2026 ENDOW Developers
// MIT License

#include "endow/util/time.h"

#include <algorithm>
#include <sstream>
#include <thread>

namespace endow {
namespace util {

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    return std::chrono::duration_cast<Seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatDuration(int64_t seconds) {
    if (seconds < 0) {
        return "-" + FormatDuration(-seconds);
    }
    if (seconds == 0) {
        return "0s";
    }
    
    int64_t days = seconds / SECONDS_PER_DAY;
    seconds %= SECONDS_PER_DAY;
    int64_t hours = seconds / SECONDS_PER_HOUR;
    seconds %= SECONDS_PER_HOUR;
    int64_t minutes = seconds / SECONDS_PER_MINUTE;
    seconds %= SECONDS_PER_MINUTE;
    
    std::ostringstream oss;
    const char* sep = "";
    if (days > 0)    { oss << sep << days << "d";    sep = " "; }
    if (hours > 0)   { oss << sep << hours << "h";   sep = " "; }
    if (minutes > 0) { oss << sep << minutes << "m"; sep = " "; }
    if (seconds > 0) { oss << sep << seconds << "s"; }
    return oss.str();
}

// ============================================================================
// Sleep
// ============================================================================

bool SleepInterruptible(Milliseconds duration, const std::atomic<bool>& interrupt) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    
    while (!interrupt.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<Milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, Milliseconds{50}));
    }
    return true;
}

} // namespace util
} // namespace endow
