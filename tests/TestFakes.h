// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// TestFakes.h
// In-memory stand-ins for the sensor backend, thermal zones, system
// counters and process sampler.
// =================================================================
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "ProcessSampler.h"
#include "SensorBackend.h"
#include "SystemCounters.h"
#include "ThermalZoneReader.h"

namespace omnimon {
namespace test {

    inline SensorHandle makeSensor(const std::string& hardwareName, HardwareKind hardwareKind,
        const std::string& name, SensorKind kind, std::optional<float> value, const std::string& identifier)
    {
        SensorHandle s;
        s.hardwareName = hardwareName;
        s.hardwareIdentifier = "/" + hardwareName;
        s.hardwareKind = hardwareKind;
        s.name = name;
        s.kind = kind;
        s.typeName = kind == SensorKind::Temperature ? "Temperature" : kind == SensorKind::Load ? "Load" : "Clock";
        s.value = value;
        s.identifier = identifier;
        return s;
    }

    inline SensorHandle cpuTemp(const std::string& name, std::optional<float> value, const std::string& identifier) {
        return makeSensor("Test CPU", HardwareKind::Cpu, name, SensorKind::Temperature, value, identifier);
    }

    class FakeSensorBackend : public ISensorBackend {
    public:
        std::vector<SensorHandle> sensors;
        bool blocked = false;
        MonitorError openError = MonitorError::AccessDenied;
        bool activation = false;

        int openCalls = 0;
        int updateCalls = 0;
        int activateCalls = 0;

        std::string name() const override { return "fake"; }

        std::expected<void, MonitorError> open() override {
            ++openCalls;
            if (blocked) return std::unexpected(openError);
            open_ = true;
            return {};
        }
        bool isOpen() const override { return open_; }
        void close() override { open_ = false; }
        void update() override { ++updateCalls; }
        std::vector<SensorHandle> enumerate() const override { return sensors; }

        std::optional<float> readValue(const std::string& identifier) const override {
            for (const auto& s : sensors) {
                if (s.identifier == identifier) return s.value;
            }
            return std::nullopt;
        }

        bool supportsActivation() const override { return activation; }
        void activateTemperatureSensors() override { ++activateCalls; }

        void setValue(const std::string& identifier, std::optional<float> value) {
            for (auto& s : sensors) {
                if (s.identifier == identifier) s.value = value;
            }
        }

    private:
        bool open_ = false;
    };

    class FakeThermalZoneReader : public IThermalZoneReader {
    public:
        std::vector<ThermalZoneSample> zones;
        std::optional<MonitorError> failure;
        int reads = 0;
        bool lastIncludeSecondary = false;

        std::expected<std::vector<ThermalZoneSample>, MonitorError> readZones(bool includeSecondary) override {
            ++reads;
            lastIncludeSecondary = includeSecondary;
            if (failure) return std::unexpected(*failure);
            std::vector<ThermalZoneSample> out;
            for (const auto& z : zones) {
                if (z.primary || includeSecondary) out.push_back(z);
            }
            return out;
        }
    };

    inline ThermalZoneSample zone(const std::string& name, double raw, bool primary = true) {
        ThermalZoneSample z;
        z.group = "WMI Thermal Zone";
        z.name = name;
        z.identifier = "zone/" + name;
        z.raw = raw;
        z.primary = primary;
        return z;
    }

    class FakeSystemCounters : public ISystemCounters {
    public:
        std::optional<MonitorError> cpuInitError;
        std::optional<MonitorError> memoryInitError;
        std::optional<MonitorError> cpuReadError;
        std::optional<MonitorError> networkListError;
        double cpuPercent = 0.0;
        double availableMb = 0.0;
        std::expected<int, MonitorError> totalMb = 16384;
        std::vector<std::string> interfaces;
        std::map<std::string, NetworkRates> rates;
        int rateReads = 0;

        std::expected<void, MonitorError> initCpu() override {
            if (cpuInitError) return std::unexpected(*cpuInitError);
            return {};
        }
        std::expected<double, MonitorError> readCpuPercent() override {
            if (cpuReadError) return std::unexpected(*cpuReadError);
            return cpuPercent;
        }
        std::expected<void, MonitorError> initMemory() override {
            if (memoryInitError) return std::unexpected(*memoryInitError);
            return {};
        }
        std::expected<double, MonitorError> readAvailableMemoryMb() override { return availableMb; }
        std::expected<int, MonitorError> totalMemoryMb() override { return totalMb; }

        std::expected<std::vector<std::string>, MonitorError> listNetworkInterfaces() override {
            if (networkListError) return std::unexpected(*networkListError);
            return interfaces;
        }
        std::expected<NetworkRates, MonitorError> readNetworkRates(const std::string& iface) override {
            ++rateReads;
            auto it = rates.find(iface);
            if (it == rates.end()) return std::unexpected(MonitorError::NotFound);
            return it->second;
        }
    };

    class FakeProcessSampler : public IProcessSampler {
    public:
        std::vector<ProcessInfo> processes;
        int samples = 0;

        std::expected<std::vector<ProcessInfo>, MonitorError> sample() override {
            ++samples;
            return processes;
        }
    };

} // namespace test
} // namespace omnimon
