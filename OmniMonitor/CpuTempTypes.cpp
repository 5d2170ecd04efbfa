// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// CpuTempTypes.cpp
// =================================================================
#include "CpuTempTypes.h"
#include <cmath>
#include <cstdio>

namespace omnimon {

    const char* to_string(CpuTempStatus status) {
        switch (status) {
        case CpuTempStatus::Ok:                    return "ok";
        case CpuTempStatus::NoSensors:             return "no_sensors";
        case CpuTempStatus::WarmingUp:             return "warming_up";
        case CpuTempStatus::NoValues:              return "no_values";
        case CpuTempStatus::WmiApprox:             return "wmi_approx";
        case CpuTempStatus::ExternalNotConfigured: return "external_not_configured";
        }
        return "no_values";
    }

    std::string formatRawSensorValue(float raw) {
        if (std::isnan(raw)) return "NaN";
        if (std::isinf(raw)) return raw > 0 ? "+Infinity" : "-Infinity";

        char buf[64] = { 0 };
        std::snprintf(buf, sizeof(buf), "%.3f", static_cast<double>(raw));
        std::string s(buf);
        // strip trailing zeros and a dangling point
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
        if (s == "-0") s = "0";
        return s;
    }

} // namespace omnimon
