// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// HwmonSensorBackend.cpp
// =================================================================
#include "HwmonSensorBackend.h"
#include <algorithm>
#include <charconv>
#include <fstream>
#include <map>

namespace omnimon {

    namespace fs = std::filesystem;

    // Generic safe sysfs reader
    static std::string readSysfsValue(const fs::path& p) {
        std::ifstream f(p);
        if (!f.is_open()) return "";
        std::string s;
        std::getline(f, s);
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
        return s;
    }

    // Integer sysfs attribute; nullopt when missing or unreadable (EIO on sleeping sensors)
    static std::optional<long long> readSysfsInt(const fs::path& p) {
        const std::string raw = readSysfsValue(p);
        if (raw.empty()) return std::nullopt;
        long long value = 0;
        auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
        if (ec != std::errc()) return std::nullopt;
        return value;
    }

    HwmonSensorBackend::HwmonSensorBackend(fs::path root) : root_(std::move(root)) {}

    HardwareKind HwmonSensorBackend::classifyChip(const std::string& chipName) {
        if (chipName == "coretemp" || chipName == "k10temp" || chipName == "zenpower"
            || chipName == "cpu_thermal") {
            return HardwareKind::Cpu;
        }
        if (chipName == "amdgpu") return HardwareKind::GpuAmd;
        if (chipName == "nouveau" || chipName == "nvidia") return HardwareKind::GpuNvidia;
        if (chipName == "i915" || chipName == "xe") return HardwareKind::GpuIntel;
        return HardwareKind::Motherboard;
    }

    std::expected<void, MonitorError> HwmonSensorBackend::open() {
        std::error_code ec;
        if (!fs::is_directory(root_, ec)) {
            return std::unexpected(MonitorError::BackendUnavailable);
        }
        fs::directory_iterator listing(root_, ec);
        if (ec) {
            return std::unexpected(ec == std::errc::permission_denied
                ? MonitorError::AccessDenied : MonitorError::IOError);
        }
        open_ = true;
        update();
        return {};
    }

    void HwmonSensorBackend::close() {
        open_ = false;
        sensors_.clear();
    }

    void HwmonSensorBackend::update() {
        if (!open_) return;

        std::vector<fs::path> devices;
        std::error_code ec;
        for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
            devices.push_back(it->path());
        }
        std::sort(devices.begin(), devices.end());

        std::vector<SensorHandle> fresh;
        for (const auto& device : devices) {
            scanDevice(device, fresh);
        }
        sensors_ = std::move(fresh);
    }

    void HwmonSensorBackend::scanDevice(const fs::path& devicePath, std::vector<SensorHandle>& out) const {
        std::string chipName = readSysfsValue(devicePath / "name");
        if (chipName.empty()) chipName = devicePath.filename().string();

        const HardwareKind kind = classifyChip(chipName);
        const std::string hardwareId = "/hwmon/" + devicePath.filename().string();

        // temp<N>_input, ordered by N
        std::map<int, fs::path> temps;
        std::error_code ec;
        for (fs::directory_iterator it(devicePath, ec), end; !ec && it != end; it.increment(ec)) {
            const std::string file = it->path().filename().string();
            if (file.rfind("temp", 0) != 0) continue;
            const auto underscore = file.find('_');
            if (underscore == std::string::npos || file.substr(underscore) != "_input") continue;
            int index = 0;
            auto [ptr, perr] = std::from_chars(file.data() + 4, file.data() + underscore, index);
            if (perr != std::errc() || ptr != file.data() + underscore) continue;
            temps.emplace(index, it->path());
        }

        for (const auto& [index, inputPath] : temps) {
            const std::string prefix = "temp" + std::to_string(index);

            SensorHandle sensor;
            sensor.hardwareName = chipName;
            sensor.hardwareIdentifier = hardwareId;
            sensor.hardwareKind = kind;
            sensor.kind = SensorKind::Temperature;
            sensor.typeName = "Temperature";
            sensor.identifier = hardwareId + "/temperature/" + std::to_string(index);

            std::string label = readSysfsValue(devicePath / (prefix + "_label"));
            sensor.name = label.empty() ? "Temp" + std::to_string(index) : label;

            if (auto milli = readSysfsInt(inputPath)) {
                sensor.value = static_cast<float>(*milli) / 1000.0f;
            }
            if (auto crit = readSysfsInt(devicePath / (prefix + "_crit"))) {
                sensor.parameters.push_back({ "TJMax", static_cast<float>(*crit) / 1000.0f });
            }
            out.push_back(std::move(sensor));
        }

        // amdgpu publishes utilisation beside the hwmon node
        if (isGpu(kind)) {
            if (auto busy = readSysfsInt(devicePath / "device" / "gpu_busy_percent")) {
                SensorHandle load;
                load.hardwareName = chipName;
                load.hardwareIdentifier = hardwareId;
                load.hardwareKind = kind;
                load.name = "GPU Core";
                load.kind = SensorKind::Load;
                load.typeName = "Load";
                load.identifier = hardwareId + "/load/0";
                load.value = static_cast<float>(*busy);
                out.push_back(std::move(load));
            }
        }
    }

    std::vector<SensorHandle> HwmonSensorBackend::enumerate() const {
        return sensors_;
    }

    std::optional<float> HwmonSensorBackend::readValue(const std::string& identifier) const {
        for (const auto& sensor : sensors_) {
            if (sensor.identifier == identifier) return sensor.value;
        }
        return std::nullopt;
    }

} // namespace omnimon
