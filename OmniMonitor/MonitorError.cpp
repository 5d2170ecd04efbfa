// Copyright © 2025 Cadell Richard Anderson

// MonitorError.cpp

#include "MonitorError.h"

namespace omnimon {

    std::string describe(MonitorError error) {
        switch (error) {
        case MonitorError::Success:            return "success";
        case MonitorError::BackendUnavailable: return "sensor backend unavailable";
        case MonitorError::AccessDenied:       return "access denied";
        case MonitorError::CounterUnavailable: return "counter unavailable";
        case MonitorError::NotFound:           return "not found";
        case MonitorError::InvalidValue:       return "invalid value";
        case MonitorError::IOError:            return "I/O error";
        case MonitorError::BindFailed:         return "listener bind failed";
        case MonitorError::Unknown:            break;
        }
        return "unknown error";
    }

} // namespace omnimon
