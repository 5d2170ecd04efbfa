// Copyright © 2025 Cadell Richard Anderson

/**
 * @file test_cpu_temp_provider.cpp
 * @brief Native, thermal-zone and external CPU temperature providers
 */

#include <gtest/gtest.h>
#include "CpuTempProvider.h"
#include "HardwareMonitorService.h"
#include "TestFakes.h"

namespace omnimon {
namespace test {

class CpuTempProviderTest : public ::testing::Test {
protected:
    using Clock = std::chrono::steady_clock;

    FakeSensorBackend backend;
    FakeThermalZoneReader zones;
    HardwareMonitorService hardware{ backend, zones, std::chrono::milliseconds(2000), false };
    Clock::time_point now = Clock::now();
};

TEST_F(CpuTempProviderTest, ThermalZoneTakesHottestPrimaryZone) {
    zones.zones.push_back(zone("TZ00", 3132.0));          // 40.05
    zones.zones.push_back(zone("TZ01", 3231.5));          // 50.0
    zones.zones.push_back(zone("Probe", 3631.5, false));  // ignored
    ThermalZoneCpuTempProvider provider(zones, std::chrono::milliseconds(2000), [this] { return now; });

    const CpuTempResult r = provider.getTemperature();
    EXPECT_EQ(r.status, CpuTempStatus::WmiApprox);
    EXPECT_EQ(r.provider, "thermal_zone");
    EXPECT_EQ(r.hint, std::optional<std::string>(ThermalZoneCpuTempProvider::kHint));
    ASSERT_TRUE(r.tempC.has_value());
    EXPECT_NEAR(*r.tempC, 50.0f, 0.01f);
    EXPECT_FALSE(zones.lastIncludeSecondary);
    EXPECT_EQ(provider.kind(), CpuTempProviderKind::ThermalZone);
}

TEST_F(CpuTempProviderTest, ThermalZoneCachesForOnePollInterval) {
    zones.zones.push_back(zone("TZ00", 3231.5));
    ThermalZoneCpuTempProvider provider(zones, std::chrono::milliseconds(2000), [this] { return now; });

    provider.getTemperature();
    zones.zones[0].raw = 3331.5;
    now += std::chrono::milliseconds(1500);
    const CpuTempResult cached = provider.getTemperature();
    EXPECT_EQ(zones.reads, 1);
    EXPECT_NEAR(*cached.tempC, 50.0f, 0.01f);

    now += std::chrono::milliseconds(500);
    const CpuTempResult fresh = provider.getTemperature();
    EXPECT_EQ(zones.reads, 2);
    EXPECT_NEAR(*fresh.tempC, 60.0f, 0.01f);
}

TEST_F(CpuTempProviderTest, ThermalZoneWithoutValidZonesIsAbsent) {
    zones.zones.push_back(zone("TZ00", 5000.0));
    ThermalZoneCpuTempProvider provider(zones, std::chrono::milliseconds(2000), [this] { return now; });

    const CpuTempResult r = provider.getTemperature();
    EXPECT_FALSE(r.tempC.has_value());
    EXPECT_EQ(r.status, CpuTempStatus::WmiApprox);
    EXPECT_FALSE(r.error.has_value());
}

TEST_F(CpuTempProviderTest, ThermalZoneReaderFailureKeepsStatus) {
    zones.failure = MonitorError::AccessDenied;
    ThermalZoneCpuTempProvider provider(zones, std::chrono::milliseconds(2000), [this] { return now; });

    const CpuTempResult r = provider.getTemperature();
    EXPECT_FALSE(r.tempC.has_value());
    EXPECT_EQ(r.status, CpuTempStatus::WmiApprox);
    ASSERT_TRUE(r.error.has_value());
    EXPECT_EQ(*r.error, describe(MonitorError::AccessDenied));
}

TEST_F(CpuTempProviderTest, ExternalIsNotConfigured) {
    ExternalCpuTempProvider provider;
    const CpuTempResult r = provider.getTemperature();
    EXPECT_EQ(r.status, CpuTempStatus::ExternalNotConfigured);
    EXPECT_EQ(r.provider, "external");
    EXPECT_EQ(r.hint, std::optional<std::string>(ExternalCpuTempProvider::kHint));
    EXPECT_FALSE(r.tempC.has_value());
}

TEST_F(CpuTempProviderTest, NativeReturnsHardwareResult) {
    backend.sensors.push_back(cpuTemp("CPU Package", 44.0f, "/cpu/t/0"));
    hardware.tick(now);

    NativeCpuTempProvider provider(hardware);
    const CpuTempResult r = provider.getTemperature();
    EXPECT_EQ(r.status, CpuTempStatus::Ok);
    EXPECT_EQ(r.provider, "native");
    EXPECT_EQ(r.tempC, std::optional<float>(44.0f));
}

TEST_F(CpuTempProviderTest, FactoryHonorsKind) {
    EXPECT_EQ(createCpuTempProvider(CpuTempProviderKind::Native, hardware, zones,
        std::chrono::milliseconds(2000))->kind(), CpuTempProviderKind::Native);
    EXPECT_EQ(createCpuTempProvider(CpuTempProviderKind::ThermalZone, hardware, zones,
        std::chrono::milliseconds(2000))->kind(), CpuTempProviderKind::ThermalZone);
    EXPECT_EQ(createCpuTempProvider(CpuTempProviderKind::External, hardware, zones,
        std::chrono::milliseconds(2000))->kind(), CpuTempProviderKind::External);
}

} // namespace test
} // namespace omnimon
