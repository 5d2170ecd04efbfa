// Copyright © 2025 Cadell Richard Anderson

// MonitorError.h

#pragma once

#include <string>

namespace omnimon {

    // The single error vocabulary shared by collectors, backends and the server.
    enum class MonitorError {
        Success = 0,
        BackendUnavailable = -1,
        AccessDenied = -2,
        CounterUnavailable = -3,
        NotFound = -4,
        InvalidValue = -5,
        IOError = -6,
        BindFailed = -7,
        Unknown = -100
    };

    // Human-readable text used in per-tick error strings and log lines.
    std::string describe(MonitorError error);

} // namespace omnimon
