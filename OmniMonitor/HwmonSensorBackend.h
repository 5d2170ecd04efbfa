// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// HwmonSensorBackend.h
// Linux hwmon sysfs tree exposed as an ISensorBackend.
// =================================================================
#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "SensorBackend.h"

namespace omnimon {

    class HwmonSensorBackend : public ISensorBackend {
    public:
        explicit HwmonSensorBackend(std::filesystem::path root = "/sys/class/hwmon");

        std::string name() const override { return "hwmon"; }

        std::expected<void, MonitorError> open() override;
        bool isOpen() const override { return open_; }
        void close() override;
        void update() override;
        std::vector<SensorHandle> enumerate() const override;
        std::optional<float> readValue(const std::string& identifier) const override;

        // coretemp/k10temp/zenpower -> Cpu, amdgpu/nouveau/nvidia/i915/xe -> GPU, rest -> Motherboard
        static HardwareKind classifyChip(const std::string& chipName);

    private:
        void scanDevice(const std::filesystem::path& devicePath, std::vector<SensorHandle>& out) const;

        std::filesystem::path root_;
        bool open_ = false;
        std::vector<SensorHandle> sensors_;
    };

} // namespace omnimon
