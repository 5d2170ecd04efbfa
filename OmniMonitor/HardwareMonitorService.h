// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// HardwareMonitorService.h
// Hardware loop: owns the sensor backend, the current selection and
// the CPU temperature state machine; publishes the latest results.
// =================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "CpuTempSensorScanner.h"
#include "CpuTempStateMachine.h"
#include "CpuTempTypes.h"
#include "SensorBackend.h"
#include "ShutdownSignal.h"
#include "ThermalZoneReader.h"

namespace omnimon {

    class HardwareMonitorService {
    public:
        using Clock = std::chrono::steady_clock;

        static constexpr std::chrono::seconds kRescanInterval{ 30 };
        static constexpr const char* kProviderName = "native";

        HardwareMonitorService(ISensorBackend& backend, IThermalZoneReader& thermalZones,
            std::chrono::milliseconds pollInterval, bool isAdmin);
        ~HardwareMonitorService();

        HardwareMonitorService(const HardwareMonitorService&) = delete;
        HardwareMonitorService& operator=(const HardwareMonitorService&) = delete;

        // Forced scan, then one tick per poll interval on a background thread
        void start();
        void stop();

        // One hardware tick; the loop passes Clock::now()
        void tick(Clock::time_point now);

        HardwareMetrics latestMetrics() const;
        CpuTempResult latestCpuTemp() const;
        CpuTempDebugSnapshot cpuTempDebugSnapshot() const;

        // CPU, motherboard and GPU sensors plus OS thermal-zone rows
        std::expected<std::vector<SensorSnapshot>, MonitorError> sensorSnapshots();

        int scanCount() const;

    private:
        bool ensureBackendOpen();
        bool shouldRescan(Clock::time_point now) const;
        void scan(Clock::time_point now);
        void publish(HardwareMetrics metrics, CpuTempResult cpuTemp);
        void monitorLoop();

        ISensorBackend& backend_;
        IThermalZoneReader& thermalZones_;
        const std::chrono::milliseconds pollInterval_;
        const bool isAdmin_;

        // backend, selection and state machine
        mutable std::mutex backendMtx;
        CpuTempStateMachine stateMachine_;
        GpuSelection gpu_;
        std::optional<Clock::time_point> lastScan_;
        std::optional<std::string> lastSelectedId_;
        std::map<std::string, float> learnedTjMax_;   // hardware identifier -> TJMax
        bool openFailureLogged_ = false;
        int scanCount_ = 0;

        mutable std::mutex publishMtx;
        std::shared_ptr<const HardwareMetrics> latest_;
        std::shared_ptr<const CpuTempResult> latestCpuTemp_;

        std::atomic<bool> isRunning;
        ShutdownSignal stopSignal_;
        std::thread monitorThread;
    };

} // namespace omnimon
