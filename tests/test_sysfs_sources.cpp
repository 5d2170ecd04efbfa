// Copyright © 2025 Cadell Richard Anderson

/**
 * @file test_sysfs_sources.cpp
 * @brief hwmon backend and thermal zone reader over a fake sysfs tree, plus
 *        merging of thermal zone sources and /proc/net/dev parsing
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "HwmonSensorBackend.h"
#include "SystemCounters.h"
#include "ThermalZoneReader.h"

namespace omnimon {
namespace test {

namespace fs = std::filesystem;

class SysfsTest : public ::testing::Test {
protected:
    void SetUp() override {
#ifdef _WIN32
        GTEST_SKIP() << "sysfs sources are Linux only";
#endif
        root = fs::temp_directory_path()
            / (std::string("omnimon_sysfs_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        fs::create_directories(root / "hwmon");
        fs::create_directories(root / "thermal");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void put(const fs::path& file, const std::string& text) {
        fs::create_directories(file.parent_path());
        std::ofstream(file) << text << "\n";
    }

    const SensorHandle* find(const std::vector<SensorHandle>& sensors, const std::string& id) {
        auto it = std::find_if(sensors.begin(), sensors.end(),
            [&id](const SensorHandle& s) { return s.identifier == id; });
        return it == sensors.end() ? nullptr : &*it;
    }

    fs::path root;
};

TEST_F(SysfsTest, HwmonMissingRootIsUnavailable) {
    HwmonSensorBackend backend(root / "absent");
    auto opened = backend.open();
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error(), MonitorError::BackendUnavailable);
    EXPECT_FALSE(backend.isOpen());
}

TEST_F(SysfsTest, HwmonEnumeratesChips) {
    const fs::path cpu = root / "hwmon" / "hwmon0";
    put(cpu / "name", "coretemp");
    put(cpu / "temp1_input", "54000");
    put(cpu / "temp1_label", "Package id 0");
    put(cpu / "temp1_crit", "100000");
    put(cpu / "temp2_input", "51500");
    put(cpu / "temp2_label", "Core 0");

    const fs::path gpu = root / "hwmon" / "hwmon1";
    put(gpu / "name", "amdgpu");
    put(gpu / "temp1_input", "47000");
    put(gpu / "device" / "gpu_busy_percent", "23");

    const fs::path board = root / "hwmon" / "hwmon2";
    put(board / "name", "nct6775");
    put(board / "temp3_input", "");

    HwmonSensorBackend backend(root / "hwmon");
    ASSERT_TRUE(backend.open().has_value());
    const std::vector<SensorHandle> sensors = backend.enumerate();

    const SensorHandle* package = find(sensors, "/hwmon/hwmon0/temperature/1");
    ASSERT_NE(package, nullptr);
    EXPECT_EQ(package->name, "Package id 0");
    EXPECT_EQ(package->hardwareKind, HardwareKind::Cpu);
    EXPECT_EQ(package->value, std::optional<float>(54.0f));
    ASSERT_EQ(package->parameters.size(), 1u);
    EXPECT_EQ(package->parameters[0].name, "TJMax");
    EXPECT_FLOAT_EQ(package->parameters[0].value, 100.0f);

    const SensorHandle* load = find(sensors, "/hwmon/hwmon1/load/0");
    ASSERT_NE(load, nullptr);
    EXPECT_EQ(load->hardwareKind, HardwareKind::GpuAmd);
    EXPECT_EQ(load->kind, SensorKind::Load);
    EXPECT_EQ(load->value, std::optional<float>(23.0f));

    const SensorHandle* boardTemp = find(sensors, "/hwmon/hwmon2/temperature/3");
    ASSERT_NE(boardTemp, nullptr);
    EXPECT_EQ(boardTemp->name, "Temp3");
    EXPECT_EQ(boardTemp->hardwareKind, HardwareKind::Motherboard);
    EXPECT_FALSE(boardTemp->value.has_value());
}

TEST_F(SysfsTest, HwmonUpdateRefreshesValues) {
    const fs::path cpu = root / "hwmon" / "hwmon0";
    put(cpu / "name", "k10temp");
    put(cpu / "temp1_input", "60000");
    put(cpu / "temp1_label", "Tctl");

    HwmonSensorBackend backend(root / "hwmon");
    ASSERT_TRUE(backend.open().has_value());
    EXPECT_EQ(backend.readValue("/hwmon/hwmon0/temperature/1"), std::optional<float>(60.0f));

    put(cpu / "temp1_input", "62500");
    backend.update();
    EXPECT_EQ(backend.readValue("/hwmon/hwmon0/temperature/1"), std::optional<float>(62.5f));
    EXPECT_FALSE(backend.readValue("/hwmon/hwmon0/temperature/9").has_value());
}

TEST_F(SysfsTest, ChipClassification) {
    EXPECT_EQ(HwmonSensorBackend::classifyChip("coretemp"), HardwareKind::Cpu);
    EXPECT_EQ(HwmonSensorBackend::classifyChip("zenpower"), HardwareKind::Cpu);
    EXPECT_EQ(HwmonSensorBackend::classifyChip("nouveau"), HardwareKind::GpuNvidia);
    EXPECT_EQ(HwmonSensorBackend::classifyChip("i915"), HardwareKind::GpuIntel);
    EXPECT_EQ(HwmonSensorBackend::classifyChip("acpitz"), HardwareKind::Motherboard);
}

#ifndef _WIN32
TEST_F(SysfsTest, ThermalZonesAreCelsius) {
    put(root / "thermal" / "thermal_zone0" / "type", "x86_pkg_temp");
    put(root / "thermal" / "thermal_zone0" / "temp", "48000");
    put(root / "thermal" / "thermal_zone1" / "type", "acpitz");
    put(root / "thermal" / "thermal_zone1" / "temp", "not-a-number");
    put(root / "thermal" / "cooling_device0" / "type", "Fan");

    ThermalZoneReader reader(root / "thermal");
    auto zones = reader.readZones(false);
    ASSERT_TRUE(zones.has_value());
    ASSERT_EQ(zones->size(), 1u);
    EXPECT_EQ(zones->front().name, "x86_pkg_temp");
    EXPECT_EQ(zones->front().group, "Linux Thermal Zone");
    EXPECT_TRUE(zones->front().alreadyCelsius);
    EXPECT_EQ(sampleCelsius(zones->front()), std::optional<float>(48.0f));
}

TEST_F(SysfsTest, ThermalRootMissing) {
    ThermalZoneReader reader(root / "nothing");
    auto zones = reader.readZones(true);
    ASSERT_FALSE(zones.has_value());
    EXPECT_EQ(zones.error(), MonitorError::NotFound);
}
#endif

namespace {
    ThermalZoneSource answering(std::vector<std::string> names, bool primary) {
        return [names, primary]() -> std::expected<std::vector<ThermalZoneSample>, MonitorError> {
            std::vector<ThermalZoneSample> out;
            for (const auto& n : names) {
                ThermalZoneSample z;
                z.name = n;
                z.raw = 3131.5;
                z.primary = primary;
                out.push_back(z);
            }
            return out;
        };
    }

    ThermalZoneSource failing(MonitorError error) {
        return [error]() -> std::expected<std::vector<ThermalZoneSample>, MonitorError> {
            return std::unexpected(error);
        };
    }
}

TEST(ThermalZoneSources, FailedPrimarySourceKeepsSecondaryZones) {
    auto zones = collectZoneSources({
        failing(MonitorError::AccessDenied),
        answering({ "_Total" }, false),
        answering({ "CPU Zone" }, false) });

    ASSERT_TRUE(zones.has_value());
    ASSERT_EQ(zones->size(), 2u);
    EXPECT_EQ((*zones)[0].name, "_Total");
    EXPECT_EQ((*zones)[1].name, "CPU Zone");
}

TEST(ThermalZoneSources, EmptyAnswerIsNotAFailure) {
    auto zones = collectZoneSources({ answering({}, true), failing(MonitorError::NotFound) });
    ASSERT_TRUE(zones.has_value());
    EXPECT_TRUE(zones->empty());
}

TEST(ThermalZoneSources, AllSourcesFailingReportsFirstError) {
    auto zones = collectZoneSources({
        failing(MonitorError::BackendUnavailable),
        failing(MonitorError::NotFound) });
    ASSERT_FALSE(zones.has_value());
    EXPECT_EQ(zones.error(), MonitorError::BackendUnavailable);
}

TEST(ThermalZoneSources, ZonesKeepSourceOrder) {
    auto zones = collectZoneSources({ answering({ "TZ00", "TZ01" }, true), answering({ "Info" }, false) });
    ASSERT_TRUE(zones.has_value());
    ASSERT_EQ(zones->size(), 3u);
    EXPECT_TRUE((*zones)[1].primary);
    EXPECT_EQ((*zones)[1].name, "TZ01");
    EXPECT_FALSE((*zones)[2].primary);
}

TEST(ProcNetDev, InterfacesKeepFileOrder) {
    std::istringstream dev(
        "Inter-|   Receive                                                |  Transmit\n"
        " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
        "wlp3s0: 9000 10 0 0 0 0 0 0 4000 8 0 0 0 0 0 0\n"
        "    lo: 500 5 0 0 0 0 0 0 500 5 0 0 0 0 0 0\n"
        "enp0s31f6: 123456 100 0 0 0 0 0 0 65432 90 0 0 0 0 0 0\n"
        "docker0: 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0 0\n");

    const std::vector<InterfaceBytes> rows = parseProcNetDev(dev);

    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0].name, "wlp3s0");
    EXPECT_EQ(rows[1].name, "enp0s31f6");
    EXPECT_EQ(rows[2].name, "docker0");
    EXPECT_EQ(rows[1].received, 123456u);
    EXPECT_EQ(rows[1].sent, 65432u);
}

TEST(ProcNetDev, TruncatedRowIsSkipped) {
    std::istringstream dev("header\nheader\neth0: 10 1 0\nwlan0: 1 1 0 0 0 0 0 0 2 1 0 0 0 0 0 0\n");
    const std::vector<InterfaceBytes> rows = parseProcNetDev(dev);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].name, "wlan0");
}

} // namespace test
} // namespace omnimon
