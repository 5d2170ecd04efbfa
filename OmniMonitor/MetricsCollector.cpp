// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// MetricsCollector.cpp
// =================================================================
#include "MetricsCollector.h"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace omnimon {

    MetricsCollector::MetricsCollector(ISystemCounters& counters, ICpuTempProvider& cpuTemp,
        const HardwareMonitorService& hardware, IProcessSampler& processes,
        RuntimeStats& stats, NetworkSeries& series, const MonitorSettings& settings)
        : counters_(counters), cpuTemp_(cpuTemp), hardware_(hardware), processes_(processes),
          stats_(stats), series_(series), settings_(settings), isRunning(false)
    {
        MetricsSnapshot initial;
        initial.cpuTempProvider = to_string(settings_.cpuTempProvider);
        latest_ = std::make_shared<const MetricsSnapshot>(std::move(initial));
        latestSeries_ = std::make_shared<const SeriesSnapshot>(series_.snapshot());
    }

    MetricsCollector::~MetricsCollector() {
        stop();
    }

    void MetricsCollector::start() {
        if (isRunning) {
            std::cout << "[Metrics] Collector is already running." << std::endl;
            return;
        }
        isRunning = true;
        collectorThread = std::thread(&MetricsCollector::collectLoop, this);
        std::cout << "[Metrics] Collector started (every " << settings_.metricsIntervalMs << " ms)." << std::endl;
    }

    void MetricsCollector::stop() {
        if (isRunning) {
            isRunning = false;
            stopSignal_.request();
            if (collectorThread.joinable()) {
                collectorThread.join();
            }
            std::cout << "[Metrics] Collector stopped." << std::endl;
        }
    }

    void MetricsCollector::collectLoop() {
        initialize();
        if (stopSignal_.requested()) return;

        do {
            try {
                tick();
            }
            catch (const std::exception& e) {
                std::cerr << "[Metrics] Tick failed: " << e.what() << std::endl;
            }
        } while (!stopSignal_.waitFor(currentInterval()));
    }

    // ---------------- Initialization ----------------

    void MetricsCollector::initialize() {
        std::vector<std::string> errors;

        if (auto cpu = counters_.initCpu()) {
            cpuAvailable_ = true;
        }
        else {
            errors.push_back("CPU counter unavailable: " + describe(cpu.error()));
            std::cerr << "[Metrics] CPU counter unavailable: " << describe(cpu.error()) << std::endl;
        }

        if (auto mem = counters_.initMemory()) {
            memoryAvailable_ = true;
        }
        else {
            errors.push_back("RAM counter unavailable: " + describe(mem.error()));
            std::cerr << "[Metrics] RAM counter unavailable: " << describe(mem.error()) << std::endl;
        }

        if (auto total = counters_.totalMemoryMb()) {
            totalMemoryMb_ = *total;
        }
        else {
            totalMemoryError_ = "Total physical memory read failed: " + describe(total.error());
            std::cerr << "[Metrics] " << totalMemoryError_ << std::endl;
        }

        initializeNetwork(errors);

        pendingErrors_.insert(pendingErrors_.end(), errors.begin(), errors.end());
    }

    void MetricsCollector::initializeNetwork(std::vector<std::string>& errors) {
        auto names = counters_.listNetworkInterfaces();
        if (!names) {
            errors.push_back("Network counters unavailable: " + describe(names.error()));
            std::cerr << "[Metrics] Network counters unavailable: " << describe(names.error()) << std::endl;
            return;
        }
        if (names->empty()) {
            errors.push_back("No network interfaces found.");
            return;
        }

        // Prime every interface, then compare activity over the sampling window
        std::vector<std::string> candidates;
        for (const auto& name : *names) {
            auto primed = counters_.readNetworkRates(name);
            if (!primed) {
                errors.push_back("Network counter init failed (" + name + "): " + describe(primed.error()));
                continue;
            }
            candidates.push_back(name);
        }
        if (candidates.empty()) {
            errors.push_back("No network interface counters could be created.");
            return;
        }

        if (stopSignal_.waitFor(sampleWindow_)) return;

        std::optional<std::string> best;
        double bestTotal = 0.0;
        for (const auto& name : candidates) {
            auto rates = counters_.readNetworkRates(name);
            if (!rates) continue;
            const double total = rates->bytesSentPerSec + rates->bytesReceivedPerSec;
            if (total > 0.0 && (!best || total > bestTotal)) {
                best = name;
                bestTotal = total;
            }
        }
        if (!best) {
            best = candidates.front();
            errors.push_back("No active network interface detected; using first available.");
        }

        std::cout << "[Metrics] Network interface: " << *best << std::endl;
        std::lock_guard<std::mutex> lock(interfaceMtx);
        interface_ = best;
    }

    std::optional<std::string> MetricsCollector::selectedInterface() const {
        std::lock_guard<std::mutex> lock(interfaceMtx);
        return interface_;
    }

    // ---------------- Per-tick reads ----------------

    std::optional<int> MetricsCollector::readCpuPercent(std::vector<std::string>& errors) {
        if (!cpuAvailable_) {
            errors.push_back("CPU counter not available.");
            return std::nullopt;
        }
        auto value = counters_.readCpuPercent();
        if (!value) {
            errors.push_back("CPU read failed: " + describe(value.error()));
            return std::nullopt;
        }
        return static_cast<int>(std::lround(*value));
    }

    int MetricsCollector::toKbps(double bytesPerSecond) {
        const double kbps = bytesPerSecond * 8.0 / 1000.0;
        if (!std::isfinite(kbps)) return 0;
        return static_cast<int>(std::lround(std::max(0.0, kbps)));
    }

    void MetricsCollector::readNetKbps(std::vector<std::string>& errors, MetricsSnapshot& out) {
        const std::string labels[] = { kSentLabel, kReceivedLabel };
        if (!interface_) {
            for (const auto& label : labels) errors.push_back(label + " counter not available.");
            return;
        }
        // One read per tick; the counter reports the rate since the previous read
        auto rates = counters_.readNetworkRates(*interface_);
        if (!rates) {
            for (const auto& label : labels) errors.push_back(label + " read failed: " + describe(rates.error()));
            return;
        }
        out.netSendKbps = toKbps(rates->bytesSentPerSec);
        out.netReceiveKbps = toKbps(rates->bytesReceivedPerSec);
    }

    void MetricsCollector::readRam(std::vector<std::string>& errors, MetricsSnapshot& out) {
        if (!totalMemoryMb_ || *totalMemoryMb_ <= 0) {
            errors.push_back(totalMemoryError_);
            return;
        }
        out.ramTotalMb = *totalMemoryMb_;

        if (!memoryAvailable_) {
            errors.push_back("RAM counter not available.");
            return;
        }
        auto available = counters_.readAvailableMemoryMb();
        if (!available) {
            errors.push_back("RAM read failed: " + describe(available.error()));
            return;
        }
        if (!std::isfinite(*available)) {
            errors.push_back("RAM read returned invalid value.");
            return;
        }

        const int availableMb = static_cast<int>(std::lround(std::max(0.0, *available)));
        const int usedMb = std::max(0, *totalMemoryMb_ - availableMb);
        const double percent = static_cast<double>(usedMb) / *totalMemoryMb_ * 100.0;
        out.ramUsagePercent = std::clamp(static_cast<int>(std::lround(percent)), 0, 100);
        out.ramUsedMb = usedMb;
    }

    CpuTempResult MetricsCollector::readCpuTemp(std::vector<std::string>& errors) {
        CpuTempResult result = cpuTemp_.getTemperature();
        if (result.error) {
            errors.push_back("CPU temp provider failed: " + *result.error);
        }
        return result;
    }

    void MetricsCollector::refreshTopProcesses(std::vector<std::string>& errors) {
        const auto now = Clock::now();
        if (lastProcessRefresh_
            && now - *lastProcessRefresh_ < std::chrono::milliseconds(settings_.topProcessesIntervalMs)) {
            return;
        }
        lastProcessRefresh_ = now;

        try {
            auto sampled = processes_.sample();
            if (!sampled) {
                errors.push_back("Top processes unavailable: " + describe(sampled.error()));
                topProcesses_.clear();
                return;
            }
            topProcesses_ = rankTopProcesses(std::move(*sampled));
        }
        catch (const std::exception& e) {
            errors.push_back(std::string("Top processes read failed: ") + e.what());
            topProcesses_.clear();
        }
    }

    // ---------------- Tick ----------------

    void MetricsCollector::tick() {
        const auto started = Clock::now();

        std::vector<std::string> errors;
        errors.swap(pendingErrors_);

        MetricsSnapshot next;
        next.cpuPercent = readCpuPercent(errors);
        readNetKbps(errors, next);

        const HardwareMetrics hardware = hardware_.latestMetrics();
        const CpuTempResult cpuTemp = readCpuTemp(errors);
        readRam(errors, next);

        next.cpuTempC = cpuTemp.tempC;
        next.cpuTempStatus = cpuTemp.status;
        next.cpuTempProvider = cpuTemp.provider;
        next.cpuTempHint = cpuTemp.hint;
        // Source and diagnostics describe the native pipeline only
        if (cpuTemp.provider == to_string(CpuTempProviderKind::Native)) {
            next.cpuTempSource = hardware.cpuTempSource;
            next.cpuTempDetails = hardware.cpuTempDetails;
        }
        next.gpuUsagePercent = hardware.gpuUsagePercent;
        next.gpuTempC = hardware.gpuTempC;

        if (settings_.topProcessesEnabled) {
            refreshTopProcesses(errors);
            next.topProcesses = topProcesses_;
        }
        next.errors = std::move(errors);

        // The series append happens-before the publish; both are published together
        series_.append(next.netSendKbps, next.netReceiveKbps);
        auto publishedSeries = std::make_shared<const SeriesSnapshot>(series_.snapshot());

        auto published = std::make_shared<const MetricsSnapshot>(std::move(next));
        {
            std::lock_guard<std::mutex> lock(snapshotMtx);
            latest_ = std::move(published);
            latestSeries_ = std::move(publishedSeries);
        }

        const double elapsedMs = std::chrono::duration<double, std::milli>(Clock::now() - started).count();
        stats_.recordTick(std::chrono::system_clock::now(), elapsedMs);
    }

    MetricsSnapshot MetricsCollector::latestSnapshot(bool includeSeries) const {
        std::shared_ptr<const MetricsSnapshot> current;
        std::shared_ptr<const SeriesSnapshot> currentSeries;
        {
            std::lock_guard<std::mutex> lock(snapshotMtx);
            current = latest_;
            currentSeries = latestSeries_;
        }
        MetricsSnapshot copy = *current;
        if (includeSeries) copy.series = *currentSeries;
        return copy;
    }

    std::chrono::milliseconds MetricsCollector::currentInterval() const {
        if (settings_.adaptiveUpdateNoClients && stats_.webSocketClients() == 0) {
            return std::chrono::milliseconds(settings_.metricsIntervalNoClientsMs);
        }
        return std::chrono::milliseconds(settings_.metricsIntervalMs);
    }

} // namespace omnimon
