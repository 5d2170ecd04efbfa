// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// SensorBackend.h
// Hardware sensor source consumed by the temperature pipeline.
// =================================================================
#pragma once
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "MonitorError.h"

namespace omnimon {

    enum class HardwareKind {
        Cpu,
        GpuNvidia,
        GpuAmd,
        GpuIntel,
        Motherboard,
        Other
    };

    enum class SensorKind {
        Temperature,
        Load,
        Other
    };

    const char* to_string(HardwareKind kind);
    const char* to_string(SensorKind kind);

    bool isGpu(HardwareKind kind);

    // Named constant attached to a sensor, e.g. "TJMax" on a distance sensor
    struct SensorParameter {
        std::string name;
        float value = 0.0f;
    };

    // A snapshot of one sensor taken during enumeration. Handles are replaced
    // wholesale on rescan; live values are read back through the identifier.
    struct SensorHandle {
        std::string hardwareName;
        std::string hardwareIdentifier;
        HardwareKind hardwareKind = HardwareKind::Other;
        std::string name;
        SensorKind kind = SensorKind::Other;
        std::string typeName;            // backend's own type label for SensorKind::Other
        std::optional<float> value;
        std::string identifier;
        std::vector<SensorParameter> parameters;
    };

    // Not thread-safe; the owner serializes access.
    class ISensorBackend {
    public:
        virtual ~ISensorBackend() = default;

        virtual std::string name() const = 0;

        // Fails with BackendUnavailable or AccessDenied when the driver is blocked
        virtual std::expected<void, MonitorError> open() = 0;
        virtual bool isOpen() const = 0;
        virtual void close() = 0;

        // Refresh every sensor value
        virtual void update() = 0;

        // Every sensor of every device, sub-devices included, in discovery order
        virtual std::vector<SensorHandle> enumerate() const = 0;

        // Value as of the last update(); nullopt when absent or unknown
        virtual std::optional<float> readValue(const std::string& identifier) const = 0;

        // Backends that can switch inactive temperature sensors on advertise it here
        virtual bool supportsActivation() const { return false; }
        virtual void activateTemperatureSensors() {}
    };

    // LibreHardwareMonitor WMI on Windows, hwmon sysfs on Linux
    std::unique_ptr<ISensorBackend> createPlatformSensorBackend();

} // namespace omnimon
