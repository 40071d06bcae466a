#pragma once

#include <cstdint>
#include <string>
#include <chrono>

namespace vortex_l0 {

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using WallClock = std::chrono::system_clock;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

/// ISO-8601 UTC with milliseconds, e.g. 2025-01-31T12:00:00.000Z
std::string to_iso8601(WallClock::time_point tp);

// Memory service defaults
constexpr const char* DEFAULT_MEMORY_API_URL = "https://api.lanonasis.com";
constexpr int DEFAULT_MEMORY_TIMEOUT_MS = 30000;
constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 5000;
constexpr int DEFAULT_SEARCH_LIMIT = 5;
constexpr double DEFAULT_SEARCH_THRESHOLD = 0.65;
constexpr double DEFAULT_DUPLICATE_THRESHOLD = 0.85;
constexpr int DEFAULT_LIST_LIMIT = 10;
constexpr int DUPLICATE_MAX_PAIRS = 10;
constexpr int RECALL_LIMIT = 3;
constexpr int RELATED_LIMIT = 5;
constexpr double RECORD_PATTERN_CONFIDENCE = 0.8;

// Plugin defaults
constexpr int DEFAULT_PLUGIN_PRIORITY = 0;
constexpr int MEMORY_PLUGIN_PRIORITY = 100;

} // namespace vortex_l0
