// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// ThermalZoneReader.h
// OS-level thermal zones: ACPI/WMI on Windows, sysfs thermal on Linux.
// =================================================================
#pragma once
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "MonitorError.h"

namespace omnimon {

    struct ThermalZoneSample {
        std::string group;                     // "WMI Thermal Zone", "Linux Thermal Zone", ...
        std::string name;
        std::optional<std::string> identifier;
        double raw = 0.0;
        bool alreadyCelsius = false;
        bool primary = true;                   // ACPI zones; the provider ignores the rest
    };

    // Converts a sample to a validated Celsius value
    std::optional<float> sampleCelsius(const ThermalZoneSample& sample);

    using ThermalZoneSource = std::function<std::expected<std::vector<ThermalZoneSample>, MonitorError>()>;

    // Concatenates every source that answers, in order. Fails with the first error
    // only when every source failed.
    std::expected<std::vector<ThermalZoneSample>, MonitorError> collectZoneSources(
        const std::vector<ThermalZoneSource>& sources);

    class IThermalZoneReader {
    public:
        virtual ~IThermalZoneReader() = default;

        // includeSecondary adds the perf-counter and probe sources used by the debug listing
        virtual std::expected<std::vector<ThermalZoneSample>, MonitorError> readZones(bool includeSecondary) = 0;
    };

    class ThermalZoneReader : public IThermalZoneReader {
    public:
        explicit ThermalZoneReader(std::filesystem::path sysfsRoot = "/sys/class/thermal");

        std::expected<std::vector<ThermalZoneSample>, MonitorError> readZones(bool includeSecondary) override;

    private:
        std::filesystem::path sysfsRoot_;
    };

} // namespace omnimon
