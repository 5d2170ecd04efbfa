// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// HardwareMonitorService.cpp
// =================================================================
#include "HardwareMonitorService.h"
#include "TemperatureMath.h"
#include <iostream>

namespace omnimon {

    HardwareMonitorService::HardwareMonitorService(ISensorBackend& backend, IThermalZoneReader& thermalZones,
        std::chrono::milliseconds pollInterval, bool isAdmin)
        : backend_(backend), thermalZones_(thermalZones), pollInterval_(pollInterval), isAdmin_(isAdmin),
          isRunning(false)
    {
        HardwareMetrics initial;
        initial.cpuTempStatus = CpuTempStatus::NoSensors;
        CpuTempResult initialTemp;
        initialTemp.status = CpuTempStatus::NoSensors;
        initialTemp.provider = kProviderName;
        latest_ = std::make_shared<const HardwareMetrics>(std::move(initial));
        latestCpuTemp_ = std::make_shared<const CpuTempResult>(std::move(initialTemp));
    }

    HardwareMonitorService::~HardwareMonitorService() {
        stop();
        std::lock_guard<std::mutex> lock(backendMtx);
        if (backend_.isOpen()) backend_.close();
    }

    void HardwareMonitorService::start() {
        if (isRunning) {
            std::cout << "[Hardware] Monitor is already running." << std::endl;
            return;
        }
        {
            std::lock_guard<std::mutex> lock(backendMtx);
            if (ensureBackendOpen()) {
                scan(Clock::now());
            }
        }
        isRunning = true;
        monitorThread = std::thread(&HardwareMonitorService::monitorLoop, this);
        std::cout << "[Hardware] Monitor started (" << backend_.name() << ", every "
            << pollInterval_.count() << " ms)." << std::endl;
    }

    void HardwareMonitorService::stop() {
        if (isRunning) {
            isRunning = false;
            stopSignal_.request();
            if (monitorThread.joinable()) {
                monitorThread.join();
            }
            std::cout << "[Hardware] Monitor stopped." << std::endl;
        }
    }

    void HardwareMonitorService::monitorLoop() {
        while (!stopSignal_.waitFor(pollInterval_)) {
            try {
                tick(Clock::now());
            }
            catch (const std::exception& e) {
                std::cerr << "[Hardware] Tick failed: " << e.what() << std::endl;
            }
        }
    }

    bool HardwareMonitorService::ensureBackendOpen() {
        if (backend_.isOpen()) return true;

        auto opened = backend_.open();
        if (!opened) {
            if (!openFailureLogged_) {
                std::cerr << "[Hardware] " << backend_.name() << " unavailable: "
                    << describe(opened.error()) << ". Retrying every tick." << std::endl;
                openFailureLogged_ = true;
            }
            return false;
        }
        if (openFailureLogged_) {
            std::cout << "[Hardware] " << backend_.name() << " opened." << std::endl;
            openFailureLogged_ = false;
        }
        return true;
    }

    bool HardwareMonitorService::shouldRescan(Clock::time_point now) const {
        if (!lastScan_) return true;
        if (stateMachine_.needsRescan()) return true;
        // Missing CPU or GPU sensors are retried on the same cadence
        return now - *lastScan_ >= kRescanInterval;
    }

    void HardwareMonitorService::scan(Clock::time_point now) {
        lastScan_ = now;
        ++scanCount_;

        if (backend_.supportsActivation()) {
            backend_.activateTemperatureSensors();
        }
        backend_.update();

        std::vector<SensorHandle> sensors = backend_.enumerate();
        CpuTempSensorScanner::attachLearnedTjMax(sensors, learnedTjMax_);
        const CpuTempSelection selection = CpuTempSensorScanner::scan(sensors);
        gpu_ = CpuTempSensorScanner::selectGpu(sensors);
        stateMachine_.reset(selection);

        std::optional<std::string> selectedId;
        if (selection.primary) selectedId = selection.primary->identifier;
        if (selectedId != lastSelectedId_ || scanCount_ == 1) {
            std::cout << "[Hardware] CPU temperature sensor: "
                << (selection.primary ? selection.primary->name : std::string("none"))
                << " (" << selection.sensorsFound << " found, "
                << selection.sensorsWithValue << " with value)";
            if (selection.distanceLabel) std::cout << ", derived: " << *selection.distanceLabel;
            std::cout << std::endl;
            lastSelectedId_ = selectedId;
        }
    }

    void HardwareMonitorService::tick(Clock::time_point now) {
        HardwareMetrics metrics;
        CpuTempResult cpuTemp;
        cpuTemp.provider = kProviderName;

        {
            std::lock_guard<std::mutex> lock(backendMtx);

            if (!ensureBackendOpen()) {
                cpuTemp.status = CpuTempStatus::NoSensors;
                metrics.cpuTempStatus = CpuTempStatus::NoSensors;
                metrics.cpuTempDetails = stateMachine_.diagnostics(isAdmin_, std::nullopt);
                publish(std::move(metrics), std::move(cpuTemp));
                return;
            }

            if (shouldRescan(now)) {
                scan(now);
            }
            backend_.update();

            const CpuTempSelection& selection = stateMachine_.selection();
            std::optional<float> primaryRaw;
            std::optional<float> distanceRaw;
            if (selection.primary) primaryRaw = backend_.readValue(selection.primary->identifier);
            if (selection.distance) distanceRaw = backend_.readValue(selection.distance->identifier);

            const CpuTempTick result = stateMachine_.advance(primaryRaw, distanceRaw);

            cpuTemp.tempC = result.reading.value;
            cpuTemp.status = result.status;
            cpuTemp.hint = result.hint;

            metrics.cpuTempC = result.reading.value;
            metrics.cpuTempSource = result.reading.source;
            metrics.cpuTempStatus = result.status;
            metrics.cpuTempDetails = stateMachine_.diagnostics(isAdmin_, result.hint);
            if (gpu_.load) metrics.gpuUsagePercent = finiteOrNull(backend_.readValue(gpu_.load->identifier));
            if (gpu_.temperature) metrics.gpuTempC = finiteOrNull(backend_.readValue(gpu_.temperature->identifier));
        }

        publish(std::move(metrics), std::move(cpuTemp));
    }

    void HardwareMonitorService::publish(HardwareMetrics metrics, CpuTempResult cpuTemp) {
        auto m = std::make_shared<const HardwareMetrics>(std::move(metrics));
        auto c = std::make_shared<const CpuTempResult>(std::move(cpuTemp));
        std::lock_guard<std::mutex> lock(publishMtx);
        latest_ = std::move(m);
        latestCpuTemp_ = std::move(c);
    }

    HardwareMetrics HardwareMonitorService::latestMetrics() const {
        std::lock_guard<std::mutex> lock(publishMtx);
        return *latest_;
    }

    CpuTempResult HardwareMonitorService::latestCpuTemp() const {
        std::lock_guard<std::mutex> lock(publishMtx);
        return *latestCpuTemp_;
    }

    CpuTempDebugSnapshot HardwareMonitorService::cpuTempDebugSnapshot() const {
        std::shared_ptr<const HardwareMetrics> metrics;
        std::shared_ptr<const CpuTempResult> cpuTemp;
        {
            std::lock_guard<std::mutex> lock(publishMtx);
            metrics = latest_;
            cpuTemp = latestCpuTemp_;
        }
        CpuTempDebugSnapshot snap;
        snap.tempC = cpuTemp->tempC;
        snap.source = metrics->cpuTempSource;
        snap.status = cpuTemp->status;
        snap.provider = cpuTemp->provider;
        snap.hint = cpuTemp->hint;
        snap.details = metrics->cpuTempDetails;
        return snap;
    }

    std::expected<std::vector<SensorSnapshot>, MonitorError> HardwareMonitorService::sensorSnapshots() {
        std::vector<SensorSnapshot> rows;
        {
            std::lock_guard<std::mutex> lock(backendMtx);
            if (!ensureBackendOpen()) {
                return std::unexpected(MonitorError::BackendUnavailable);
            }
            if (backend_.supportsActivation()) {
                backend_.activateTemperatureSensors();
            }
            backend_.update();

            for (const auto& s : backend_.enumerate()) {
                const bool listed = s.hardwareKind == HardwareKind::Cpu
                    || s.hardwareKind == HardwareKind::Motherboard || isGpu(s.hardwareKind);
                if (!listed) continue;

                SensorSnapshot row;
                row.hardwareName = s.hardwareName;
                row.hardwareType = to_string(s.hardwareKind);
                row.sensorName = s.name;
                row.sensorType = s.kind == SensorKind::Other ? s.typeName : to_string(s.kind);
                row.value = finiteOrNull(s.value);
                row.hasValue = s.value.has_value();
                if (s.value) row.rawValue = formatRawSensorValue(*s.value);
                if (!s.identifier.empty()) row.identifier = s.identifier;
                rows.push_back(std::move(row));
            }
        }

        // OS thermal zones are best effort in the debug listing
        if (auto zones = thermalZones_.readZones(true)) {
            for (const auto& zone : *zones) {
                auto celsius = sampleCelsius(zone);
                if (!celsius) continue;
                SensorSnapshot row;
                row.hardwareName = zone.group;
                row.hardwareType = "ThermalZone";
                row.sensorName = zone.name;
                row.sensorType = "Temperature";
                row.value = roundToTenth(*celsius);
                row.hasValue = true;
                row.rawValue = formatRawSensorValue(*celsius);
                row.identifier = zone.identifier;
                rows.push_back(std::move(row));
            }
        }
        return rows;
    }

    int HardwareMonitorService::scanCount() const {
        std::lock_guard<std::mutex> lock(backendMtx);
        return scanCount_;
    }

} // namespace omnimon
