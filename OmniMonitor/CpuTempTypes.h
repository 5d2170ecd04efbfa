// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// CpuTempTypes.h
// Value types shared by the temperature pipeline and its consumers.
// =================================================================
#pragma once
#include <optional>
#include <string>

namespace omnimon {

    enum class CpuTempStatus {
        Ok,
        NoSensors,
        WarmingUp,
        NoValues,
        WmiApprox,
        ExternalNotConfigured
    };

    // "ok", "no_sensors", "warming_up", "no_values", "wmi_approx", "external_not_configured"
    const char* to_string(CpuTempStatus status);

    // Rebuilt every hardware tick, never mutated after publication
    struct CpuTempDiagnostics {
        bool isAdmin = false;
        int sensorsFound = 0;
        int sensorsWithValue = 0;
        std::optional<float> lastValidTempC;
        int ticksSinceValid = 0;
        int warmupTicksRemaining = 0;
        std::optional<std::string> selectedSensorName;
        std::optional<std::string> selectedSensorIdentifier;
        std::optional<float> selectedSensorValue;
        std::optional<std::string> derivedSensorName;
        std::optional<float> derivedSensorValue;
        std::optional<float> derivedSensorTjMax;
        std::optional<std::string> hint;
    };

    struct CpuTempResult {
        std::optional<float> tempC;
        CpuTempStatus status = CpuTempStatus::NoSensors;
        std::optional<std::string> hint;
        std::string provider = "native";
        std::optional<std::string> error;    // internal failure text; never serialized
    };

    // Latest output of the hardware loop
    struct HardwareMetrics {
        std::optional<float> cpuTempC;
        std::optional<std::string> cpuTempSource;
        CpuTempStatus cpuTempStatus = CpuTempStatus::NoSensors;
        std::optional<CpuTempDiagnostics> cpuTempDetails;
        std::optional<float> gpuUsagePercent;
        std::optional<float> gpuTempC;
    };

    struct CpuTempDebugSnapshot {
        std::optional<float> tempC;
        std::optional<std::string> source;
        CpuTempStatus status = CpuTempStatus::NoSensors;
        std::string provider;
        std::optional<std::string> hint;
        std::optional<CpuTempDiagnostics> details;
    };

    // One row of the /api/sensors listing
    struct SensorSnapshot {
        std::string hardwareName;
        std::string hardwareType;
        std::string sensorName;
        std::string sensorType;
        std::optional<float> value;
        bool hasValue = false;
        std::optional<std::string> rawValue;
        std::optional<std::string> identifier;
    };

    // NaN, +Infinity, -Infinity, otherwise up to three decimals ("0.###")
    std::string formatRawSensorValue(float raw);

} // namespace omnimon
