// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// SystemInfo.cpp
// =================================================================
#include "SystemInfo.h"
#include <cstdio>
#include <ctime>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace omnimon {

    bool isProcessElevated() {
#ifdef _WIN32
        BOOL isMember = FALSE;
        SID_IDENTIFIER_AUTHORITY ntAuthority = SECURITY_NT_AUTHORITY;
        PSID adminGroup = nullptr;
        if (!AllocateAndInitializeSid(&ntAuthority, 2, SECURITY_BUILTIN_DOMAIN_RID,
            DOMAIN_ALIAS_RID_ADMINS, 0, 0, 0, 0, 0, 0, &adminGroup)) {
            return false;
        }
        if (!CheckTokenMembership(nullptr, adminGroup, &isMember)) {
            isMember = FALSE;
        }
        FreeSid(adminGroup);
        return isMember == TRUE;
#else
        return geteuid() == 0;
#endif
    }

    std::string formatIso8601(const std::chrono::system_clock::time_point& tp) {
        const std::time_t t = std::chrono::system_clock::to_time_t(tp);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count() % 1000;
        std::tm tm{};
#ifdef _WIN32
        gmtime_s(&tm, &t);
#else
        gmtime_r(&t, &tm);
#endif
        char buf[32] = { 0 };
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
        char out[40] = { 0 };
        std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(millis < 0 ? 0 : millis));
        return std::string(out);
    }

    std::string utcNowIso8601() {
        return formatIso8601(std::chrono::system_clock::now());
    }

} // namespace omnimon
