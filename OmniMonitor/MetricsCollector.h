// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// MetricsCollector.h
// The metrics loop: ticks CPU/RAM/network counters, the CPU
// temperature provider, the hardware monitor and the optional
// process list, then publishes one immutable MetricsSnapshot.
// =================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "CpuTempProvider.h"
#include "HardwareMonitorService.h"
#include "MetricsSnapshot.h"
#include "MonitorConfig.h"
#include "NetworkSeries.h"
#include "ProcessSampler.h"
#include "RuntimeStats.h"
#include "ShutdownSignal.h"
#include "SystemCounters.h"

namespace omnimon {

    class MetricsCollector {
    public:
        using Clock = std::chrono::steady_clock;

        static constexpr std::chrono::milliseconds kInterfaceSampleWindow{ 2000 };
        static constexpr const char* kSentLabel = "Bytes Sent/sec";
        static constexpr const char* kReceivedLabel = "Bytes Received/sec";

        MetricsCollector(ISystemCounters& counters, ICpuTempProvider& cpuTemp,
            const HardwareMonitorService& hardware, IProcessSampler& processes,
            RuntimeStats& stats, NetworkSeries& series, const MonitorSettings& settings);
        ~MetricsCollector();

        MetricsCollector(const MetricsCollector&) = delete;
        MetricsCollector& operator=(const MetricsCollector&) = delete;

        // initialize() and the first tick run on the loop thread
        void start();
        void stop();

        // Counter setup and active-interface selection. Errors are reported on the next tick.
        void initialize();

        // One collection pass; publishes and records runtime stats
        void tick();

        MetricsSnapshot latestSnapshot(bool includeSeries = false) const;

        // Base interval, or the no-client interval when adaptive mode is on and nobody is connected
        std::chrono::milliseconds currentInterval() const;

        std::optional<std::string> selectedInterface() const;

        void setInterfaceSampleWindow(std::chrono::milliseconds window) { sampleWindow_ = window; }

        // kbps = bytes/s * 8 / 1000, rounded, never negative; non-finite is 0
        static int toKbps(double bytesPerSecond);

    private:
        void initializeNetwork(std::vector<std::string>& errors);
        std::optional<int> readCpuPercent(std::vector<std::string>& errors);
        void readNetKbps(std::vector<std::string>& errors, MetricsSnapshot& out);
        void readRam(std::vector<std::string>& errors, MetricsSnapshot& out);
        CpuTempResult readCpuTemp(std::vector<std::string>& errors);
        void refreshTopProcesses(std::vector<std::string>& errors);
        void collectLoop();

        ISystemCounters& counters_;
        ICpuTempProvider& cpuTemp_;
        const HardwareMonitorService& hardware_;
        IProcessSampler& processes_;
        RuntimeStats& stats_;
        NetworkSeries& series_;
        const MonitorSettings settings_;
        std::chrono::milliseconds sampleWindow_ = kInterfaceSampleWindow;

        // Loop-owned collection state
        bool cpuAvailable_ = false;
        bool memoryAvailable_ = false;
        std::optional<int> totalMemoryMb_;
        std::string totalMemoryError_ = "Total RAM unavailable.";
        std::optional<std::string> interface_;
        std::vector<std::string> pendingErrors_;
        std::optional<Clock::time_point> lastProcessRefresh_;
        std::vector<ProcessInfo> topProcesses_;

        mutable std::mutex snapshotMtx;
        std::shared_ptr<const MetricsSnapshot> latest_;
        std::shared_ptr<const SeriesSnapshot> latestSeries_;   // series as of latest_
        mutable std::mutex interfaceMtx;

        std::atomic<bool> isRunning;
        ShutdownSignal stopSignal_;
        std::thread collectorThread;
    };

} // namespace omnimon
