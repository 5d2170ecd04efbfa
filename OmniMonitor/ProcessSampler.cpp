// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// ProcessSampler.cpp
// =================================================================
#include "ProcessSampler.h"
#include <algorithm>
#include <cctype>
#include <thread>

#ifdef _WIN32
#include <Windows.h>
#include <TlHelp32.h>
#include <Psapi.h>
#pragma comment(lib, "psapi.lib")
#else
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>
#endif

namespace omnimon {

    namespace {
        struct RawProcess {
            int pid = 0;
            std::string name;
            uint64_t cpuTime = 0;      // platform units, see cpuUnitsPerSecond
            uint64_t residentBytes = 0;
        };
    }

#ifdef _WIN32
    namespace {
        // FILETIME units
        constexpr double kCpuUnitsPerSecond = 10'000'000.0;

        uint64_t toU64(const FILETIME& ft) {
            return (static_cast<uint64_t>(ft.dwHighDateTime) << 32) | ft.dwLowDateTime;
        }

        std::string narrow(const wchar_t* wide) {
            int size = WideCharToMultiByte(CP_UTF8, 0, wide, -1, nullptr, 0, nullptr, nullptr);
            if (size <= 1) return {};
            std::string out(static_cast<size_t>(size - 1), '\0');
            WideCharToMultiByte(CP_UTF8, 0, wide, -1, out.data(), size, nullptr, nullptr);
            return out;
        }

        std::expected<std::vector<RawProcess>, MonitorError> listProcesses() {
            HANDLE snap = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
            if (snap == INVALID_HANDLE_VALUE) return std::unexpected(MonitorError::AccessDenied);

            std::vector<RawProcess> out;
            PROCESSENTRY32W entry{};
            entry.dwSize = sizeof(entry);
            for (BOOL ok = Process32FirstW(snap, &entry); ok; ok = Process32NextW(snap, &entry)) {
                if (entry.th32ProcessID == 0) continue;
                HANDLE h = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, entry.th32ProcessID);
                if (!h) continue;   // protected process

                RawProcess p;
                p.pid = static_cast<int>(entry.th32ProcessID);
                p.name = narrow(entry.szExeFile);
                FILETIME created{}, exited{}, kernel{}, user{};
                if (GetProcessTimes(h, &created, &exited, &kernel, &user)) {
                    p.cpuTime = toU64(kernel) + toU64(user);
                }
                PROCESS_MEMORY_COUNTERS pmc{};
                if (GetProcessMemoryInfo(h, &pmc, sizeof(pmc))) {
                    p.residentBytes = pmc.WorkingSetSize;
                }
                CloseHandle(h);
                out.push_back(std::move(p));
            }
            CloseHandle(snap);
            return out;
        }

        uint64_t physicalMemoryBytes() {
            MEMORYSTATUSEX status{};
            status.dwLength = sizeof(status);
            return GlobalMemoryStatusEx(&status) ? status.ullTotalPhys : 0;
        }
    }
#else
    namespace {
        const double kCpuUnitsPerSecond = static_cast<double>(sysconf(_SC_CLK_TCK));

        std::expected<std::vector<RawProcess>, MonitorError> listProcesses() {
            namespace fs = std::filesystem;
            std::error_code ec;
            fs::directory_iterator it("/proc", ec);
            if (ec) return std::unexpected(MonitorError::AccessDenied);

            const uint64_t pageSize = static_cast<uint64_t>(sysconf(_SC_PAGESIZE));
            std::vector<RawProcess> out;
            for (fs::directory_iterator end; it != end; it.increment(ec)) {
                if (ec) break;
                const std::string dir = it->path().filename().string();
                if (dir.empty() || !std::all_of(dir.begin(), dir.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) continue;

                // Processes can exit mid-scan; skip any that vanish
                std::ifstream stat(it->path() / "stat");
                std::string line;
                if (!std::getline(stat, line)) continue;
                const auto open = line.find('(');
                const auto close = line.rfind(')');
                if (open == std::string::npos || close == std::string::npos || close < open) continue;

                RawProcess p;
                p.pid = std::stoi(dir);
                p.name = line.substr(open + 1, close - open - 1);

                // Fields after the comm: state(3) ... utime(14) stime(15)
                std::istringstream rest(line.substr(close + 2));
                std::string field;
                uint64_t utime = 0, stime = 0;
                for (int i = 3; i <= 15 && rest >> field; ++i) {
                    if (i == 14) utime = std::stoull(field);
                    if (i == 15) stime = std::stoull(field);
                }
                p.cpuTime = utime + stime;

                std::ifstream statm(it->path() / "statm");
                uint64_t size = 0, resident = 0;
                if (statm >> size >> resident) p.residentBytes = resident * pageSize;
                out.push_back(std::move(p));
            }
            return out;
        }

        uint64_t physicalMemoryBytes() {
            const long pages = sysconf(_SC_PHYS_PAGES);
            const long pageSize = sysconf(_SC_PAGESIZE);
            if (pages <= 0 || pageSize <= 0) return 0;
            return static_cast<uint64_t>(pages) * static_cast<uint64_t>(pageSize);
        }
    }
#endif

    std::expected<std::vector<ProcessInfo>, MonitorError> PlatformProcessSampler::sample() {
        auto raw = listProcesses();
        if (!raw) return std::unexpected(raw.error());

        const auto now = std::chrono::steady_clock::now();
        const uint64_t totalMemory = physicalMemoryBytes();
        const unsigned cores = std::max(1u, std::thread::hardware_concurrency());
        const double elapsed = lastSample_
            ? std::chrono::duration<double>(now - *lastSample_).count() : 0.0;

        std::map<int, uint64_t> cpuTimes;
        std::vector<ProcessInfo> out;
        out.reserve(raw->size());
        for (const auto& p : *raw) {
            ProcessInfo info;
            info.name = p.name;
            info.pid = p.pid;

            auto prev = lastCpuTime_.find(p.pid);
            if (elapsed > 0.0 && prev != lastCpuTime_.end() && p.cpuTime >= prev->second) {
                const double seconds = static_cast<double>(p.cpuTime - prev->second) / kCpuUnitsPerSecond;
                info.cpuPercent = std::clamp(100.0 * seconds / (elapsed * cores), 0.0, 100.0);
            }
            if (totalMemory > 0) {
                info.ramPercent = 100.0 * static_cast<double>(p.residentBytes) / static_cast<double>(totalMemory);
            }
            cpuTimes[p.pid] = p.cpuTime;
            out.push_back(std::move(info));
        }

        lastCpuTime_ = std::move(cpuTimes);
        lastSample_ = now;
        return out;
    }

    std::vector<ProcessInfo> rankTopProcesses(std::vector<ProcessInfo> processes, std::size_t limit) {
        std::sort(processes.begin(), processes.end(), [](const ProcessInfo& a, const ProcessInfo& b) {
            const double ga = a.gpuPercent.value_or(-1.0);
            const double gb = b.gpuPercent.value_or(-1.0);
            if (ga != gb) return ga > gb;
            if (a.cpuPercent != b.cpuPercent) return a.cpuPercent > b.cpuPercent;
            if (a.ramPercent != b.ramPercent) return a.ramPercent > b.ramPercent;
            return a.name < b.name;
        });
        if (processes.size() > limit) processes.resize(limit);
        return processes;
    }

} // namespace omnimon
