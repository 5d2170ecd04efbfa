// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// LhmWmiSensorBackend.cpp
// =================================================================
#ifdef _WIN32
#include "LhmWmiSensorBackend.h"
#include <cmath>
#include <iostream>
#include <map>

namespace omnimon {

    HardwareKind LhmWmiSensorBackend::parseHardwareType(const std::string& type) {
        if (type == "Cpu") return HardwareKind::Cpu;
        if (type == "GpuNvidia") return HardwareKind::GpuNvidia;
        if (type == "GpuAmd") return HardwareKind::GpuAmd;
        if (type == "GpuIntel") return HardwareKind::GpuIntel;
        if (type == "Motherboard" || type == "SuperIO") return HardwareKind::Motherboard;
        return HardwareKind::Other;
    }

    SensorKind LhmWmiSensorBackend::parseSensorType(const std::string& type) {
        if (type == "Temperature") return SensorKind::Temperature;
        if (type == "Load") return SensorKind::Load;
        return SensorKind::Other;
    }

    std::expected<void, MonitorError> LhmWmiSensorBackend::open() {
        auto session = WmiSession::connect(L"ROOT\\LibreHardwareMonitor");
        if (!session) {
            return std::unexpected(session.error());
        }
        session_ = std::move(*session);

        // An empty Hardware class means LibreHardwareMonitor is installed but not running
        auto hardwareRows = session_->query(L"SELECT Identifier FROM Hardware", { L"Identifier" });
        if (!hardwareRows || hardwareRows->empty()) {
            session_.reset();
            return std::unexpected(hardwareRows ? MonitorError::BackendUnavailable : hardwareRows.error());
        }

        update();
        return {};
    }

    void LhmWmiSensorBackend::close() {
        session_.reset();
        sensors_.clear();
    }

    void LhmWmiSensorBackend::update() {
        if (!session_) return;

        auto hardware = session_->query(
            L"SELECT Identifier, Name, HardwareType, Parent FROM Hardware",
            { L"Identifier", L"Name", L"HardwareType", L"Parent" });
        auto sensors = session_->query(
            L"SELECT Identifier, Name, SensorType, Value, Parent FROM Sensor",
            { L"Identifier", L"Name", L"SensorType", L"Value", L"Parent" });
        if (!hardware || !sensors) {
            std::cerr << "[Hardware] LibreHardwareMonitor query failed: "
                << describe(!hardware ? hardware.error() : sensors.error()) << std::endl;
            return;
        }

        struct Device { std::string name; HardwareKind kind; std::string parent; };
        std::map<std::string, Device> devices;
        for (const auto& row : *hardware) {
            Device d;
            d.name = row.text(L"Name").value_or("Unknown");
            d.kind = parseHardwareType(row.text(L"HardwareType").value_or(""));
            d.parent = row.text(L"Parent").value_or("");
            devices[row.text(L"Identifier").value_or("")] = std::move(d);
        }

        std::vector<SensorHandle> fresh;
        fresh.reserve(sensors->size());
        for (const auto& row : *sensors) {
            SensorHandle h;
            h.identifier = row.text(L"Identifier").value_or("");
            h.name = row.text(L"Name").value_or(h.identifier);
            h.typeName = row.text(L"SensorType").value_or("Other");
            h.kind = parseSensorType(h.typeName);
            if (auto v = row.number(L"Value")) {
                h.value = static_cast<float>(*v);
            }

            h.hardwareIdentifier = row.text(L"Parent").value_or("");
            auto dev = devices.find(h.hardwareIdentifier);
            if (dev != devices.end()) {
                h.hardwareName = dev->second.name;
                h.hardwareKind = dev->second.kind;
                // Sub-hardware (e.g. a SuperIO chip) inherits the group of its parent board
                if (h.hardwareKind == HardwareKind::Other && !dev->second.parent.empty()) {
                    auto parent = devices.find(dev->second.parent);
                    if (parent != devices.end()) h.hardwareKind = parent->second.kind;
                }
            }
            fresh.push_back(std::move(h));
        }
        sensors_ = std::move(fresh);
    }

    std::vector<SensorHandle> LhmWmiSensorBackend::enumerate() const {
        return sensors_;
    }

    std::optional<float> LhmWmiSensorBackend::readValue(const std::string& identifier) const {
        for (const auto& sensor : sensors_) {
            if (sensor.identifier == identifier) return sensor.value;
        }
        return std::nullopt;
    }

} // namespace omnimon
#endif // _WIN32
