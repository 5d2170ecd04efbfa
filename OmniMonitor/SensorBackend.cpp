// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// SensorBackend.cpp
// =================================================================
#include "SensorBackend.h"

#ifdef _WIN32
#include "LhmWmiSensorBackend.h"
#else
#include "HwmonSensorBackend.h"
#endif

namespace omnimon {

    const char* to_string(HardwareKind kind) {
        switch (kind) {
        case HardwareKind::Cpu:         return "Cpu";
        case HardwareKind::GpuNvidia:   return "GpuNvidia";
        case HardwareKind::GpuAmd:      return "GpuAmd";
        case HardwareKind::GpuIntel:    return "GpuIntel";
        case HardwareKind::Motherboard: return "Motherboard";
        case HardwareKind::Other:       break;
        }
        return "Other";
    }

    const char* to_string(SensorKind kind) {
        switch (kind) {
        case SensorKind::Temperature: return "Temperature";
        case SensorKind::Load:        return "Load";
        case SensorKind::Other:       break;
        }
        return "Other";
    }

    bool isGpu(HardwareKind kind) {
        return kind == HardwareKind::GpuNvidia || kind == HardwareKind::GpuAmd
            || kind == HardwareKind::GpuIntel;
    }

    std::unique_ptr<ISensorBackend> createPlatformSensorBackend() {
#ifdef _WIN32
        return std::make_unique<LhmWmiSensorBackend>();
#else
        return std::make_unique<HwmonSensorBackend>();
#endif
    }

} // namespace omnimon
