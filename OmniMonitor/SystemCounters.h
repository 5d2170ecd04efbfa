// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// SystemCounters.h
// CPU, memory and per-interface network counters read by the
// metrics loop. Rate counters are stateful: each read reports the
// rate since the previous read, the first read primes and reports 0.
// =================================================================
#pragma once
#include <chrono>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>
#include "MonitorError.h"

namespace omnimon {

    struct NetworkRates {
        double bytesSentPerSec = 0.0;
        double bytesReceivedPerSec = 0.0;
    };

    struct InterfaceBytes {
        std::string name;
        uint64_t sent = 0;
        uint64_t received = 0;
    };

    // Rows of /proc/net/dev in file order, loopback skipped
    std::vector<InterfaceBytes> parseProcNetDev(std::istream& in);

    class ISystemCounters {
    public:
        virtual ~ISystemCounters() = default;

        // Prime the CPU counter; failure disables CPU% for the process lifetime
        virtual std::expected<void, MonitorError> initCpu() = 0;
        virtual std::expected<double, MonitorError> readCpuPercent() = 0;

        virtual std::expected<void, MonitorError> initMemory() = 0;
        virtual std::expected<double, MonitorError> readAvailableMemoryMb() = 0;

        // Installed physical memory; read once by the caller
        virtual std::expected<int, MonitorError> totalMemoryMb() = 0;

        // Non-loopback interfaces, in OS order
        virtual std::expected<std::vector<std::string>, MonitorError> listNetworkInterfaces() = 0;
        virtual std::expected<NetworkRates, MonitorError> readNetworkRates(const std::string& iface) = 0;
    };

    // /proc on Linux, Win32 and IP Helper on Windows
    class PlatformSystemCounters : public ISystemCounters {
    public:
        std::expected<void, MonitorError> initCpu() override;
        std::expected<double, MonitorError> readCpuPercent() override;
        std::expected<void, MonitorError> initMemory() override;
        std::expected<double, MonitorError> readAvailableMemoryMb() override;
        std::expected<int, MonitorError> totalMemoryMb() override;
        std::expected<std::vector<std::string>, MonitorError> listNetworkInterfaces() override;
        std::expected<NetworkRates, MonitorError> readNetworkRates(const std::string& iface) override;

    private:
        struct CpuTimes {
            uint64_t busy = 0;
            uint64_t total = 0;
        };

        struct ByteSample {
            uint64_t sent = 0;
            uint64_t received = 0;
            std::chrono::steady_clock::time_point at;
        };

        std::expected<CpuTimes, MonitorError> readCpuTimes() const;
        // Interfaces in OS enumeration order
        std::expected<std::vector<InterfaceBytes>, MonitorError> readInterfaceBytes() const;

        bool cpuPrimed_ = false;
        CpuTimes lastCpu_;
        std::map<std::string, ByteSample> lastBytes_;
    };

} // namespace omnimon
