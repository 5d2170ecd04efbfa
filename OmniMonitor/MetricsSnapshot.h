// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// MetricsSnapshot.h
// The immutable per-tick result handed to HTTP and WebSocket readers,
// and its JSON rendering (camelCase, absent fields omitted).
// =================================================================
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "CpuTempTypes.h"
#include "NetworkSeries.h"
#include "ProcessSampler.h"

namespace omnimon {

    class JsonWriter;

    struct MetricsSnapshot {
        std::optional<int> cpuPercent;
        std::optional<float> cpuTempC;
        std::optional<std::string> cpuTempSource;
        CpuTempStatus cpuTempStatus = CpuTempStatus::NoSensors;
        std::string cpuTempProvider = "native";
        std::optional<std::string> cpuTempHint;
        std::optional<CpuTempDiagnostics> cpuTempDetails;
        std::optional<float> gpuUsagePercent;
        std::optional<float> gpuTempC;
        std::optional<int> ramUsagePercent;
        std::optional<int> ramUsedMb;
        std::optional<int> ramTotalMb;
        int netSendKbps = 0;
        int netReceiveKbps = 0;
        std::optional<SeriesSnapshot> series;
        std::optional<std::vector<ProcessInfo>> topProcesses;
        std::vector<std::string> errors;
    };

    void writeJson(JsonWriter& w, const CpuTempDiagnostics& d);
    void writeJson(JsonWriter& w, const MetricsSnapshot& s);

    std::string toJson(const MetricsSnapshot& s);

    // {"type":"init|metrics|series","data":{...}}
    std::string envelope(const std::string& type, const MetricsSnapshot& s);

} // namespace omnimon
