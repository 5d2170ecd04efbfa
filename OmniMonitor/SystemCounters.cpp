// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// SystemCounters.cpp
// =================================================================
#include "SystemCounters.h"
#include <algorithm>
#include <cmath>
#include <istream>
#include <sstream>

#ifdef _WIN32
#include <winsock2.h>
#include <Windows.h>
#include <iphlpapi.h>
#include <netioapi.h>
#pragma comment(lib, "iphlpapi.lib")
#else
#include <fstream>
#endif

namespace omnimon {

#ifdef _WIN32
    namespace {
        uint64_t fileTimeToU64(const FILETIME& ft) {
            return (static_cast<uint64_t>(ft.dwHighDateTime) << 32) | ft.dwLowDateTime;
        }

        std::string wideToUtf8(const wchar_t* wide) {
            int size = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr, nullptr);
            if (size <= 1) return {};
            std::string out(static_cast<size_t>(size - 1), '\0');
            WideCharToMultiByte(CP_UTF8, 0, wide, -1, out.data(), size, nullptr, nullptr);
            return out;
        }
    }

    std::expected<PlatformSystemCounters::CpuTimes, MonitorError> PlatformSystemCounters::readCpuTimes() const {
        FILETIME idle{}, kernel{}, user{};
        if (!GetSystemTimes(&idle, &kernel, &user)) {
            return std::unexpected(MonitorError::CounterUnavailable);
        }
        // Kernel time includes idle time
        const uint64_t total = fileTimeToU64(kernel) + fileTimeToU64(user);
        const uint64_t idleTime = fileTimeToU64(idle);
        return CpuTimes{ total >= idleTime ? total - idleTime : 0, total };
    }

    std::expected<void, MonitorError> PlatformSystemCounters::initMemory() {
        MEMORYSTATUSEX status{};
        status.dwLength = sizeof(status);
        if (!GlobalMemoryStatusEx(&status)) return std::unexpected(MonitorError::CounterUnavailable);
        return {};
    }

    std::expected<double, MonitorError> PlatformSystemCounters::readAvailableMemoryMb() {
        MEMORYSTATUSEX status{};
        status.dwLength = sizeof(status);
        if (!GlobalMemoryStatusEx(&status)) return std::unexpected(MonitorError::CounterUnavailable);
        return static_cast<double>(status.ullAvailPhys) / (1024.0 * 1024.0);
    }

    std::expected<int, MonitorError> PlatformSystemCounters::totalMemoryMb() {
        MEMORYSTATUSEX status{};
        status.dwLength = sizeof(status);
        if (!GlobalMemoryStatusEx(&status)) return std::unexpected(MonitorError::CounterUnavailable);
        const int totalMb = static_cast<int>(std::llround(static_cast<double>(status.ullTotalPhys) / (1024.0 * 1024.0)));
        if (totalMb <= 0) return std::unexpected(MonitorError::InvalidValue);
        return totalMb;
    }

    std::expected<std::vector<InterfaceBytes>, MonitorError> PlatformSystemCounters::readInterfaceBytes() const {
        PMIB_IF_TABLE2 table = nullptr;
        if (GetIfTable2(&table) != NO_ERROR || !table) {
            return std::unexpected(MonitorError::CounterUnavailable);
        }
        std::vector<InterfaceBytes> out;
        for (ULONG i = 0; i < table->NumEntries; ++i) {
            const MIB_IF_ROW2& row = table->Table[i];
            if (row.Type == IF_TYPE_SOFTWARE_LOOPBACK) continue;
            if (!row.InterfaceAndOperStatusFlags.HardwareInterface) continue;
            std::string name = wideToUtf8(row.Description);
            if (name.empty()) continue;
            // Filter-driver rows repeat the adapter description
            const bool seen = std::any_of(out.begin(), out.end(),
                [&name](const InterfaceBytes& b) { return b.name == name; });
            if (seen) continue;
            out.push_back(InterfaceBytes{ std::move(name), row.OutOctets, row.InOctets });
        }
        FreeMibTable(table);
        return out;
    }
#else
    std::expected<PlatformSystemCounters::CpuTimes, MonitorError> PlatformSystemCounters::readCpuTimes() const {
        std::ifstream stat("/proc/stat");
        if (!stat.is_open()) return std::unexpected(MonitorError::CounterUnavailable);

        std::string label;
        stat >> label;
        if (label != "cpu") return std::unexpected(MonitorError::InvalidValue);

        // user nice system idle iowait irq softirq steal
        uint64_t fields[8] = {};
        for (auto& f : fields) {
            if (!(stat >> f)) return std::unexpected(MonitorError::InvalidValue);
        }
        uint64_t total = 0;
        for (auto f : fields) total += f;
        const uint64_t idle = fields[3] + fields[4];
        return CpuTimes{ total - idle, total };
    }

    namespace {
        // Value of a "Key:   1234 kB" line in /proc/meminfo, in kB
        std::expected<uint64_t, MonitorError> readMeminfoKb(const std::string& key) {
            std::ifstream meminfo("/proc/meminfo");
            if (!meminfo.is_open()) return std::unexpected(MonitorError::CounterUnavailable);
            std::string line;
            while (std::getline(meminfo, line)) {
                if (line.rfind(key + ":", 0) != 0) continue;
                std::istringstream iss(line.substr(key.size() + 1));
                uint64_t kb = 0;
                if (!(iss >> kb)) return std::unexpected(MonitorError::InvalidValue);
                return kb;
            }
            return std::unexpected(MonitorError::NotFound);
        }
    }

    std::expected<void, MonitorError> PlatformSystemCounters::initMemory() {
        auto kb = readMeminfoKb("MemAvailable");
        if (!kb) return std::unexpected(kb.error());
        return {};
    }

    std::expected<double, MonitorError> PlatformSystemCounters::readAvailableMemoryMb() {
        auto kb = readMeminfoKb("MemAvailable");
        if (!kb) return std::unexpected(kb.error());
        return static_cast<double>(*kb) / 1024.0;
    }

    std::expected<int, MonitorError> PlatformSystemCounters::totalMemoryMb() {
        auto kb = readMeminfoKb("MemTotal");
        if (!kb) return std::unexpected(kb.error());
        const int totalMb = static_cast<int>(std::llround(static_cast<double>(*kb) / 1024.0));
        if (totalMb <= 0) return std::unexpected(MonitorError::InvalidValue);
        return totalMb;
    }

    std::expected<std::vector<InterfaceBytes>, MonitorError> PlatformSystemCounters::readInterfaceBytes() const {
        std::ifstream dev("/proc/net/dev");
        if (!dev.is_open()) return std::unexpected(MonitorError::CounterUnavailable);
        return parseProcNetDev(dev);
    }
#endif

    std::vector<InterfaceBytes> parseProcNetDev(std::istream& in) {
        std::vector<InterfaceBytes> out;
        std::string line;
        // Two header lines
        std::getline(in, line);
        std::getline(in, line);
        while (std::getline(in, line)) {
            const auto colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string name = line.substr(0, colon);
            name.erase(0, name.find_first_not_of(' '));
            if (name.empty() || name == "lo") continue;

            // rx: bytes packets errs drop fifo frame compressed multicast, then tx bytes
            std::istringstream iss(line.substr(colon + 1));
            uint64_t rx = 0, skip = 0, tx = 0;
            iss >> rx;
            for (int i = 0; i < 7; ++i) iss >> skip;
            iss >> tx;
            if (!iss) continue;
            out.push_back(InterfaceBytes{ std::move(name), tx, rx });
        }
        return out;
    }

    std::expected<void, MonitorError> PlatformSystemCounters::initCpu() {
        auto times = readCpuTimes();
        if (!times) return std::unexpected(times.error());
        lastCpu_ = *times;
        cpuPrimed_ = true;
        return {};
    }

    std::expected<double, MonitorError> PlatformSystemCounters::readCpuPercent() {
        auto times = readCpuTimes();
        if (!times) return std::unexpected(times.error());
        if (!cpuPrimed_) {
            lastCpu_ = *times;
            cpuPrimed_ = true;
            return 0.0;
        }
        const uint64_t dTotal = times->total - lastCpu_.total;
        const uint64_t dBusy = times->busy >= lastCpu_.busy ? times->busy - lastCpu_.busy : 0;
        lastCpu_ = *times;
        if (dTotal == 0) return 0.0;
        return 100.0 * static_cast<double>(dBusy) / static_cast<double>(dTotal);
    }

    std::expected<std::vector<std::string>, MonitorError> PlatformSystemCounters::listNetworkInterfaces() {
        auto bytes = readInterfaceBytes();
        if (!bytes) return std::unexpected(bytes.error());
        std::vector<std::string> names;
        names.reserve(bytes->size());
        for (const auto& b : *bytes) names.push_back(b.name);
        return names;
    }

    std::expected<NetworkRates, MonitorError> PlatformSystemCounters::readNetworkRates(const std::string& iface) {
        auto bytes = readInterfaceBytes();
        if (!bytes) return std::unexpected(bytes.error());
        auto it = std::find_if(bytes->begin(), bytes->end(),
            [&iface](const InterfaceBytes& b) { return b.name == iface; });
        if (it == bytes->end()) return std::unexpected(MonitorError::NotFound);
        const ByteSample current{ it->sent, it->received, std::chrono::steady_clock::now() };

        NetworkRates rates;
        auto prev = lastBytes_.find(iface);
        if (prev != lastBytes_.end()) {
            const double seconds = std::chrono::duration<double>(current.at - prev->second.at).count();
            // Counters that went backwards (reset, wrap) report 0 for this interval
            if (seconds > 0.0) {
                if (current.sent >= prev->second.sent)
                    rates.bytesSentPerSec = static_cast<double>(current.sent - prev->second.sent) / seconds;
                if (current.received >= prev->second.received)
                    rates.bytesReceivedPerSec = static_cast<double>(current.received - prev->second.received) / seconds;
            }
        }
        lastBytes_[iface] = current;
        return rates;
    }

} // namespace omnimon
