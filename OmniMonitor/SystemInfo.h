// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// SystemInfo.h
// =================================================================
#pragma once
#include <chrono>
#include <string>

namespace omnimon {

    // True when running as Administrator (Windows) or root (POSIX)
    bool isProcessElevated();

    // ISO-8601 UTC with millisecond precision, e.g. 2025-04-01T10:00:00.123Z
    std::string formatIso8601(const std::chrono::system_clock::time_point& tp);

    std::string utcNowIso8601();

} // namespace omnimon
