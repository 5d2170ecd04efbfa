// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// main.cpp
// OmniMonitor agent: wires the hardware loop, the metrics loop and
// the HTTP/WebSocket server, then runs until SIGINT/SIGTERM.
// =================================================================
#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "CpuTempProvider.h"
#include "HardwareMonitorService.h"
#include "HttpServer.h"
#include "MetricsCollector.h"
#include "MonitorApi.h"
#include "MonitorConfig.h"
#include "NetworkSeries.h"
#include "ProcessSampler.h"
#include "RuntimeStats.h"
#include "SensorBackend.h"
#include "ShutdownSignal.h"
#include "SystemCounters.h"
#include "SystemInfo.h"
#include "ThermalZoneReader.h"

#ifdef _WIN32
#include <Windows.h>
#include "WmiQuery.h"
#else
#include <csignal>
#include <pthread.h>
#endif

using namespace omnimon;

static void printBanner() {
    std::cout << R"(
  ___                  _ __  __             _ _
 / _ \ _ __ ___  _ __ (_)  \/  | ___  _ __ (_) |_ ___  _ __
| | | | '_ ` _ \| '_ \| | |\/| |/ _ \| '_ \| | __/ _ \| '__|
| |_| | | | | | | | | | | |  | | (_) | | | | | || (_) | |
 \___/|_| |_| |_|_| |_|_|_|  |_|\___/|_| |_|_|\__\___/|_|
        OmniMonitor hardware telemetry agent v1.0
==========================================================
)" << std::endl;
}

static void printUsage() {
    std::cout << "Usage: omnimon [--config <OmniMonitor.xml>]\n"
        << "  Environment: MONITOR_PORT, MONITOR_METRICS_INTERVAL_MS, MONITOR_METRICS_INTERVAL_NOCLIENT_MS,\n"
        << "               MONITOR_HW_INTERVAL_MS, MONITOR_ALLOW_LOCAL_NETWORK_CORS, MONITOR_ADAPTIVE_NOCLIENTS,\n"
        << "               CPU_TEMP_PROVIDER, MONITOR_TOP_PROCESSES, MONITOR_TOP_PROCESSES_INTERVAL_MS,\n"
        << "               MONITOR_WEB_ROOT, OMNIMON_CONFIG" << std::endl;
}

static void printSettings(const MonitorSettings& s) {
    std::cout << "[Main] Port: " << s.port << "\n"
        << "[Main] Metrics interval: " << s.metricsIntervalMs << " ms"
        << (s.adaptiveUpdateNoClients ? " (" + std::to_string(s.metricsIntervalNoClientsMs) + " ms with no clients)" : std::string())
        << "\n"
        << "[Main] Hardware interval: " << s.hardwareIntervalMs << " ms\n"
        << "[Main] CPU temperature provider: " << to_string(s.cpuTempProvider) << "\n"
        << "[Main] Local network CORS: " << (s.allowLocalNetworkCors ? "on" : "off") << "\n"
        << "[Main] Top processes: "
        << (s.topProcessesEnabled ? "every " + std::to_string(s.topProcessesIntervalMs) + " ms" : std::string("off")) << "\n"
        << "[Main] Web root: " << s.webRoot << std::endl;
}

#ifdef _WIN32
// Console control handlers run without context
static ShutdownSignal* g_shutdown = nullptr;

static BOOL WINAPI consoleCtrlHandler(DWORD ctrlType) {
    switch (ctrlType) {
    case CTRL_C_EVENT:
    case CTRL_BREAK_EVENT:
    case CTRL_CLOSE_EVENT:
    case CTRL_SHUTDOWN_EVENT:
        if (g_shutdown) g_shutdown->request();
        return TRUE;
    default:
        return FALSE;
    }
}
#endif

int main(int argc, char* argv[]) {
    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        }
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage();
            return 0;
        }
        else {
            std::cerr << "[Main] Unknown argument: " << argv[i] << std::endl;
            printUsage();
            return 1;
        }
    }

    ShutdownSignal shutdown;

#ifdef _WIN32
    // Keeps the multithreaded apartment alive while WMI sessions outlive the threads that opened them
    ComThreadScope com;
    SetConsoleOutputCP(CP_UTF8);
    g_shutdown = &shutdown;
    SetConsoleCtrlHandler(consoleCtrlHandler, TRUE);
#else
    // Block before any thread starts so only the waiter sees the signals
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    std::thread signalWaiter([&signals, &shutdown] {
        int received = 0;
        sigwait(&signals, &received);
        std::cout << "\n[Main] Signal " << received << " received, shutting down." << std::endl;
        shutdown.request();
    });
#endif

    printBanner();

    MonitorSettings settings;
    config::load_with_fallback(settings, configPath);
    config::apply_environment_overrides(settings);
    config::normalize(settings);
    printSettings(settings);

    const bool isAdmin = isProcessElevated();
    if (!isAdmin) {
        std::cout << "[Main] Not running elevated; some sensors may report no values." << std::endl;
    }

    const auto hardwareInterval = std::chrono::milliseconds(settings.hardwareIntervalMs);

    std::unique_ptr<ISensorBackend> backend = createPlatformSensorBackend();
    ThermalZoneReader thermalZones;
    HardwareMonitorService hardware(*backend, thermalZones, hardwareInterval, isAdmin);

    std::unique_ptr<ICpuTempProvider> cpuTemp =
        createCpuTempProvider(settings.cpuTempProvider, hardware, thermalZones, hardwareInterval);

    PlatformSystemCounters counters;
    PlatformProcessSampler processes;
    RuntimeStats stats;
    NetworkSeries series;
    MetricsCollector collector(counters, *cpuTemp, hardware, processes, stats, series, settings);

    MonitorApi api(collector, hardware, stats, settings);
    HttpServer server(
        [&api](const HttpRequest& request) { return api.handle(request); },
        [&api](const HttpRequest& request, WebSocketSession& session) { api.runWebSocket(request, session); });

    // Reachable from other LAN devices
    auto bound = server.listen("0.0.0.0", settings.port);
    if (!bound) {
        std::cerr << "[Main] Cannot listen on port " << settings.port << ": "
            << describe(bound.error()) << std::endl;
#ifndef _WIN32
        // The waiter only returns on a signal
        pthread_kill(signalWaiter.native_handle(), SIGTERM);
        signalWaiter.join();
#endif
        return 1;
    }

    hardware.start();
    collector.start();
    server.start();
    std::cout << "[Main] Dashboard: http://localhost:" << server.boundPort() << "/  (Ctrl+C to stop)" << std::endl;

    shutdown.wait();

    server.stop();
    collector.stop();
    hardware.stop();

#ifndef _WIN32
    signalWaiter.join();
#else
    g_shutdown = nullptr;
#endif
    std::cout << "[Main] Goodbye." << std::endl;
    return 0;
}
