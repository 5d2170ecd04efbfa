// Copyright © 2025 Cadell Richard Anderson

/**
 * @file test_cpu_temp_sensor_scanner.cpp
 * @brief Name tiers, distance-to-TJMax selection and GPU sensor choice
 */

#include <gtest/gtest.h>
#include <map>
#include "CpuTempSensorScanner.h"
#include "TestFakes.h"

namespace omnimon {
namespace test {

class CpuTempSensorScannerTest : public ::testing::Test {
protected:
    static SensorHandle distanceSensor(const std::string& name, float value, float tjMax, const std::string& id) {
        SensorHandle s = cpuTemp(name, value, id);
        s.parameters.push_back({ "TJMax", tjMax });
        return s;
    }

    std::vector<SensorHandle> sensors;
};

TEST_F(CpuTempSensorScannerTest, PackageWinsEvenWithoutValue) {
    sensors.push_back(cpuTemp("CPU Package", std::nullopt, "/cpu/t/0"));
    sensors.push_back(cpuTemp("Core #1", 55.0f, "/cpu/t/1"));

    const CpuTempSelection sel = CpuTempSensorScanner::scan(sensors);

    ASSERT_TRUE(sel.primary.has_value());
    EXPECT_EQ(sel.primary->name, "CPU Package");
    EXPECT_EQ(sel.sourceLabel, std::optional<std::string>("CPU Package"));
    EXPECT_EQ(sel.sensorsFound, 2);
    EXPECT_EQ(sel.sensorsWithValue, 1);
}

TEST_F(CpuTempSensorScannerTest, TctlBeatsCoreMaxAndCores) {
    sensors.push_back(cpuTemp("Core Max", 70.0f, "/cpu/t/0"));
    sensors.push_back(cpuTemp("Core #0", 80.0f, "/cpu/t/1"));
    sensors.push_back(cpuTemp("Core (Tctl/Tdie)", 65.0f, "/cpu/t/2"));

    const CpuTempSelection sel = CpuTempSensorScanner::scan(sensors);
    ASSERT_TRUE(sel.primary.has_value());
    EXPECT_EQ(sel.primary->identifier, "/cpu/t/2");
}

TEST_F(CpuTempSensorScannerTest, CcdIsTierThree) {
    sensors.push_back(cpuTemp("Core #0", 80.0f, "/cpu/t/0"));
    sensors.push_back(cpuTemp("CCD1 (Tdie)", 61.0f, "/cpu/t/1"));
    sensors.push_back(cpuTemp("CCDs Max", 63.0f, "/cpu/t/2"));

    // "CCD1 (Tdie)" matches tier 2 first
    EXPECT_EQ(CpuTempSensorScanner::scan(sensors).primary->identifier, "/cpu/t/1");

    sensors.erase(sensors.begin() + 1);
    EXPECT_EQ(CpuTempSensorScanner::scan(sensors).primary->identifier, "/cpu/t/2");
}

TEST_F(CpuTempSensorScannerTest, CoreTierPicksHottestValid) {
    sensors.push_back(cpuTemp("Core #0", 51.0f, "/cpu/t/0"));
    sensors.push_back(cpuTemp("Core #1", 58.0f, "/cpu/t/1"));
    sensors.push_back(cpuTemp("Core #2", 150.0f, "/cpu/t/2"));
    sensors.push_back(cpuTemp("Motherboard", 90.0f, "/cpu/t/3"));

    const CpuTempSelection sel = CpuTempSensorScanner::scan(sensors);
    EXPECT_EQ(sel.primary->identifier, "/cpu/t/1");
}

TEST_F(CpuTempSensorScannerTest, CoreTierFallsBackToFirstWhenNoneValid) {
    sensors.push_back(cpuTemp("Core #0", std::nullopt, "/cpu/t/0"));
    sensors.push_back(cpuTemp("Core #1", std::nullopt, "/cpu/t/1"));
    EXPECT_EQ(CpuTempSensorScanner::scan(sensors).primary->identifier, "/cpu/t/0");
}

TEST_F(CpuTempSensorScannerTest, LastTierUsesMotherboardSensors) {
    sensors.push_back(makeSensor("Nuvoton", HardwareKind::Motherboard, "Temperature #1",
        SensorKind::Temperature, 38.0f, "/lpc/t/0"));
    sensors.push_back(makeSensor("Nuvoton", HardwareKind::Motherboard, "Temperature #2",
        SensorKind::Temperature, 47.0f, "/lpc/t/1"));
    sensors.push_back(makeSensor("GeForce", HardwareKind::GpuNvidia, "GPU Core",
        SensorKind::Temperature, 99.0f, "/gpu/t/0"));

    const CpuTempSelection sel = CpuTempSensorScanner::scan(sensors);
    EXPECT_EQ(sel.sensorsFound, 2);
    EXPECT_EQ(sel.primary->identifier, "/lpc/t/1");
}

TEST_F(CpuTempSensorScannerTest, NoTemperatureSensors) {
    sensors.push_back(makeSensor("Test CPU", HardwareKind::Cpu, "CPU Total", SensorKind::Load, 12.0f, "/cpu/l/0"));

    const CpuTempSelection sel = CpuTempSensorScanner::scan(sensors);
    EXPECT_FALSE(sel.primary.has_value());
    EXPECT_FALSE(sel.distance.has_value());
    EXPECT_EQ(sel.sensorsFound, 0);
}

TEST_F(CpuTempSensorScannerTest, DistanceSensorPrefersCoreMax) {
    sensors.push_back(distanceSensor("Core #0 Distance to TjMax", 40.0f, 100.0f, "/cpu/t/0"));
    sensors.push_back(distanceSensor("Core Max Distance to TjMax", 35.0f, 100.0f, "/cpu/t/1"));
    sensors.push_back(cpuTemp("CPU Package", std::nullopt, "/cpu/t/2"));

    const CpuTempSelection sel = CpuTempSensorScanner::scan(sensors);
    ASSERT_TRUE(sel.distance.has_value());
    EXPECT_EQ(sel.distance->identifier, "/cpu/t/1");
    EXPECT_EQ(sel.distanceTjMax, std::optional<float>(100.0f));
    EXPECT_EQ(sel.distanceLabel, std::optional<std::string>("Core Max Distance to TjMax (TJMax 100C)"));
    EXPECT_EQ(sel.primary->name, "CPU Package");
}

TEST_F(CpuTempSensorScannerTest, DistanceSensorIsNeverPrimary) {
    sensors.push_back(distanceSensor("Core Max Distance to TjMax", 35.0f, 100.0f, "/cpu/t/0"));

    const CpuTempSelection sel = CpuTempSensorScanner::scan(sensors);
    EXPECT_FALSE(sel.primary.has_value());
    EXPECT_TRUE(sel.distance.has_value());
    EXPECT_EQ(sel.sensorsFound, 1);
}

TEST_F(CpuTempSensorScannerTest, TjMaxOutsideRangeIsIgnored) {
    sensors.push_back(distanceSensor("Core Max Distance to TjMax", 35.0f, 150.0f, "/cpu/t/0"));
    sensors.push_back(distanceSensor("Core #3 Distance to TjMax", 30.0f, 95.5f, "/cpu/t/1"));

    const CpuTempSelection sel = CpuTempSensorScanner::scan(sensors);
    ASSERT_TRUE(sel.distance.has_value());
    EXPECT_EQ(sel.distance->identifier, "/cpu/t/1");
    EXPECT_EQ(sel.distanceLabel, std::optional<std::string>("Core #3 Distance to TjMax (TJMax 95.5C)"));
}

TEST_F(CpuTempSensorScannerTest, NameMatchingIsCaseInsensitive) {
    EXPECT_TRUE(CpuTempSensorScanner::nameContains("CPU PACKAGE", "package"));
    EXPECT_TRUE(CpuTempSensorScanner::nameContains("tctl", "Tctl"));
    EXPECT_FALSE(CpuTempSensorScanner::nameContains("Core", "Package"));
}

TEST_F(CpuTempSensorScannerTest, GpuSelectionPrefersNamedSensors) {
    sensors.push_back(makeSensor("Radeon", HardwareKind::GpuAmd, "GPU Memory", SensorKind::Load, 20.0f, "/gpu/l/1"));
    sensors.push_back(makeSensor("Radeon", HardwareKind::GpuAmd, "GPU Core", SensorKind::Load, 35.0f, "/gpu/l/0"));
    sensors.push_back(makeSensor("Radeon", HardwareKind::GpuAmd, "Hot Spot", SensorKind::Temperature, 70.0f, "/gpu/t/1"));
    sensors.push_back(makeSensor("Radeon", HardwareKind::GpuAmd, "GPU Temperature", SensorKind::Temperature, 60.0f, "/gpu/t/0"));

    const GpuSelection gpu = CpuTempSensorScanner::selectGpu(sensors);
    ASSERT_TRUE(gpu.load.has_value());
    ASSERT_TRUE(gpu.temperature.has_value());
    EXPECT_EQ(gpu.load->identifier, "/gpu/l/0");
    EXPECT_EQ(gpu.temperature->identifier, "/gpu/t/0");
}

TEST_F(CpuTempSensorScannerTest, GpuSelectionFallsBackToFirst) {
    sensors.push_back(makeSensor("Arc", HardwareKind::GpuIntel, "Video Engine", SensorKind::Load, 3.0f, "/gpu/l/0"));
    sensors.push_back(makeSensor("Arc", HardwareKind::GpuIntel, "Hot Spot", SensorKind::Temperature, 50.0f, "/gpu/t/0"));

    const GpuSelection gpu = CpuTempSensorScanner::selectGpu(sensors);
    EXPECT_EQ(gpu.load->identifier, "/gpu/l/0");
    EXPECT_EQ(gpu.temperature->identifier, "/gpu/t/0");
}

TEST_F(CpuTempSensorScannerTest, NoGpu) {
    sensors.push_back(cpuTemp("CPU Package", 50.0f, "/cpu/t/0"));
    const GpuSelection gpu = CpuTempSensorScanner::selectGpu(sensors);
    EXPECT_FALSE(gpu.load.has_value());
    EXPECT_FALSE(gpu.temperature.has_value());
}

TEST_F(CpuTempSensorScannerTest, TjMaxLearnedFromPairedCoreReading) {
    sensors.push_back(cpuTemp("CPU Core #1", 58.0f, "/cpu/t/0"));
    sensors.push_back(cpuTemp("CPU Core #1 Distance to TjMax", 42.0f, "/cpu/t/1"));
    sensors.push_back(cpuTemp("CPU Core #2 Distance to TjMax", 45.0f, "/cpu/t/2"));
    std::map<std::string, float> learned;

    CpuTempSensorScanner::attachLearnedTjMax(sensors, learned);

    EXPECT_EQ(learned.at("/Test CPU"), 100.0f);
    EXPECT_EQ(CpuTempSensorScanner::tjMaxOf(sensors[1]), std::optional<float>(100.0f));
    // the device limit is shared by distance sensors without a pair
    EXPECT_EQ(CpuTempSensorScanner::tjMaxOf(sensors[2]), std::optional<float>(100.0f));
    EXPECT_TRUE(sensors[0].parameters.empty());

    const CpuTempSelection sel = CpuTempSensorScanner::scan(sensors);
    EXPECT_EQ(sel.distanceTjMax, std::optional<float>(100.0f));
    EXPECT_EQ(sel.distanceLabel, std::optional<std::string>("CPU Core #1 Distance to TjMax (TJMax 100C)"));
}

TEST_F(CpuTempSensorScannerTest, LearnedTjMaxKeepsReportedParameterAndRange) {
    sensors.push_back(cpuTemp("Core Max", 90.0f, "/cpu/t/0"));
    sensors.push_back(distanceSensor("Core Max Distance to TjMax", 5.0f, 105.0f, "/cpu/t/1"));
    sensors.push_back(makeSensor("Board", HardwareKind::Motherboard, "Temp1", SensorKind::Temperature, 80.0f, "/mb/t/0"));
    sensors.push_back(makeSensor("Board", HardwareKind::Motherboard, "Temp1 Distance to TjMax", SensorKind::Temperature,
        70.0f, "/mb/t/1"));
    std::map<std::string, float> learned;

    CpuTempSensorScanner::attachLearnedTjMax(sensors, learned);

    ASSERT_EQ(sensors[1].parameters.size(), 1u);
    EXPECT_EQ(sensors[1].parameters[0].value, 105.0f);
    // 80 + 70 is outside the TJMax range
    EXPECT_TRUE(sensors[3].parameters.empty());
    EXPECT_TRUE(learned.empty());
}

TEST_F(CpuTempSensorScannerTest, LearnedTjMaxSurvivesMissingPair) {
    std::map<std::string, float> learned{ { "/Test CPU", 95.0f } };
    sensors.push_back(cpuTemp("CPU Core #1", std::nullopt, "/cpu/t/0"));
    sensors.push_back(cpuTemp("CPU Core #1 Distance to TjMax", 30.0f, "/cpu/t/1"));

    CpuTempSensorScanner::attachLearnedTjMax(sensors, learned);

    EXPECT_EQ(CpuTempSensorScanner::tjMaxOf(sensors[1]), std::optional<float>(95.0f));
}

} // namespace test
} // namespace omnimon
