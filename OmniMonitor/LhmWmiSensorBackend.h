// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// LhmWmiSensorBackend.h
// Reads sensors published by LibreHardwareMonitor under
// ROOT\LibreHardwareMonitor. Windows only.
// =================================================================
#pragma once
#ifdef _WIN32
#include <memory>
#include <string>
#include <vector>
#include "SensorBackend.h"
#include "WmiQuery.h"

namespace omnimon {

    class LhmWmiSensorBackend : public ISensorBackend {
    public:
        std::string name() const override { return "LibreHardwareMonitor"; }

        std::expected<void, MonitorError> open() override;
        bool isOpen() const override { return session_ != nullptr; }
        void close() override;
        void update() override;
        std::vector<SensorHandle> enumerate() const override;
        std::optional<float> readValue(const std::string& identifier) const override;

        static HardwareKind parseHardwareType(const std::string& type);
        static SensorKind parseSensorType(const std::string& type);

    private:
        std::unique_ptr<WmiSession> session_;
        std::vector<SensorHandle> sensors_;
    };

} // namespace omnimon
#endif // _WIN32
