// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// MonitorApi.h
// Routes for the REST endpoints, the /ws metrics stream and the
// static dashboard files.
// =================================================================
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include "HardwareMonitorService.h"
#include "HttpServer.h"
#include "MetricsCollector.h"
#include "MonitorConfig.h"
#include "RuntimeStats.h"

namespace omnimon {

    class MonitorApi {
    public:
        static constexpr std::chrono::seconds kKeepAliveInterval{ 30 };
        static constexpr int kSeriesEvery = 5;

        MonitorApi(const MetricsCollector& collector, HardwareMonitorService& hardware,
            RuntimeStats& stats, const MonitorSettings& settings);

        HttpResponse handle(const HttpRequest& request);

        // Runs one /ws client until either side closes or the server stops
        void runWebSocket(const HttpRequest& request, WebSocketSession& session);

        static std::string contentTypeFor(const std::filesystem::path& file);

    private:
        HttpResponse health() const;
        HttpResponse metrics() const;
        HttpResponse sensors();
        HttpResponse cpuTempDebug() const;
        HttpResponse stats() const;
        HttpResponse staticFile(const std::string& path) const;
        void applyCors(const HttpRequest& request, HttpResponse& response) const;

        const MetricsCollector& collector_;
        HardwareMonitorService& hardware_;
        RuntimeStats& stats_;
        const MonitorSettings settings_;
    };

} // namespace omnimon
