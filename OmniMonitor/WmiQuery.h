// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// WmiQuery.h
// Thin COM/WMI wrapper used by the LibreHardwareMonitor backend and
// the thermal-zone reader. Windows only.
// =================================================================
#pragma once
#ifdef _WIN32
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "MonitorError.h"

struct IWbemLocator;
struct IWbemServices;

namespace omnimon {

    // Joins the calling thread to the multithreaded apartment for the scope's lifetime.
    // Every COM call goes through one on the thread that makes it.
    class ComThreadScope {
    public:
        ComThreadScope();
        ~ComThreadScope();
        ComThreadScope(const ComThreadScope&) = delete;
        ComThreadScope& operator=(const ComThreadScope&) = delete;

        bool joined() const { return owned_ || changedMode_; }

    private:
        bool owned_ = false;
        bool changedMode_ = false;
    };

    // One result object, properties converted to double or UTF-8 text
    struct WmiRow {
        std::map<std::wstring, std::variant<std::monostate, double, std::string>> fields;
        std::optional<std::string> path;

        std::optional<double> number(const std::wstring& field) const;
        std::optional<std::string> text(const std::wstring& field) const;
    };

    class WmiSession {
    public:
        ~WmiSession();
        WmiSession(const WmiSession&) = delete;
        WmiSession& operator=(const WmiSession&) = delete;

        // e.g. L"ROOT\\LibreHardwareMonitor", L"ROOT\\WMI", L"ROOT\\CIMV2"
        static std::expected<std::unique_ptr<WmiSession>, MonitorError> connect(const std::wstring& wmiNamespace);

        std::expected<std::vector<WmiRow>, MonitorError> query(const std::wstring& wql,
            const std::vector<std::wstring>& properties) const;

    private:
        WmiSession() = default;

        IWbemLocator* pLoc = nullptr;
        IWbemServices* pSvc = nullptr;
    };

    std::string wide_to_utf8(const std::wstring& wide);

} // namespace omnimon
#endif // _WIN32
