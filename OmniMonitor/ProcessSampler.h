// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// ProcessSampler.h
// Per-process CPU/RAM usage for the "top processes" panel.
// =================================================================
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "MonitorError.h"

namespace omnimon {

    struct ProcessInfo {
        std::string name;
        int pid = 0;
        double cpuPercent = 0.0;
        double ramPercent = 0.0;
        std::optional<double> gpuPercent;     // absent where the OS exposes none
    };

    class IProcessSampler {
    public:
        virtual ~IProcessSampler() = default;

        // CPU percent is measured against the previous call; the first call reports 0
        virtual std::expected<std::vector<ProcessInfo>, MonitorError> sample() = 0;
    };

    class PlatformProcessSampler : public IProcessSampler {
    public:
        std::expected<std::vector<ProcessInfo>, MonitorError> sample() override;

    private:
        std::map<int, uint64_t> lastCpuTime_;
        std::optional<std::chrono::steady_clock::time_point> lastSample_;
    };

    // GPU%, CPU%, RAM% descending (absent GPU sorts last), then name
    std::vector<ProcessInfo> rankTopProcesses(std::vector<ProcessInfo> processes, std::size_t limit = 5);

} // namespace omnimon
