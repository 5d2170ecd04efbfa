// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// CorsPolicy.cpp
// =================================================================
#include "CorsPolicy.h"
#include "SocketCompat.h"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace omnimon {

    namespace {
        std::string toLower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        // Host part of "scheme://host[:port][/path]"; IPv6 brackets removed
        std::optional<std::string> originHost(std::string_view origin, std::string& scheme) {
            const auto sep = origin.find("://");
            if (sep == std::string_view::npos) return std::nullopt;
            scheme = toLower(origin.substr(0, sep));
            std::string_view rest = origin.substr(sep + 3);
            rest = rest.substr(0, rest.find_first_of("/?#"));
            if (rest.find('@') != std::string_view::npos) return std::nullopt;

            if (!rest.empty() && rest.front() == '[') {
                const auto close = rest.find(']');
                if (close == std::string_view::npos) return std::nullopt;
                return toLower(rest.substr(1, close - 1));
            }
            return toLower(rest.substr(0, rest.find(':')));
        }

        bool isPrivateIPv4(const in_addr& addr) {
            const unsigned char* b = reinterpret_cast<const unsigned char*>(&addr);
            if (b[0] == 127) return true;
            if (b[0] == 10) return true;
            if (b[0] == 172 && b[1] >= 16 && b[1] <= 31) return true;
            if (b[0] == 192 && b[1] == 168) return true;
            return false;
        }

        bool isPrivateIPv6(const in6_addr& addr) {
            const unsigned char* b = reinterpret_cast<const unsigned char*>(&addr);
            static const unsigned char loopback[16] = { 0,0,0,0, 0,0,0,0, 0,0,0,0, 0,0,0,1 };
            if (std::memcmp(b, loopback, 16) == 0) return true;
            if ((b[0] & 0xFE) == 0xFC) return true;                  // fc00::/7
            if (b[0] == 0xFE && (b[1] & 0xC0) == 0x80) return true;  // fe80::/10
            if (b[0] == 0xFE && (b[1] & 0xC0) == 0xC0) return true;  // fec0::/10
            // IPv4-mapped
            static const unsigned char mapped[12] = { 0,0,0,0, 0,0,0,0, 0,0,0xFF,0xFF };
            if (std::memcmp(b, mapped, 12) == 0) {
                in_addr v4{};
                std::memcpy(&v4, b + 12, 4);
                return isPrivateIPv4(v4);
            }
            return false;
        }
    }

    bool isLocalNetworkOrigin(std::string_view origin) {
        std::string scheme;
        auto host = originHost(origin, scheme);
        if (!host || host->empty()) return false;
        if (scheme != "http" && scheme != "https") return false;

        if (*host == "localhost") return true;

        // Zone index ("fe80::1%eth0") is not part of the address
        const std::string address = host->substr(0, host->find('%'));

        in_addr v4{};
        if (inet_pton(AF_INET, address.c_str(), &v4) == 1) return isPrivateIPv4(v4);

        in6_addr v6{};
        if (inet_pton(AF_INET6, address.c_str(), &v6) == 1) return isPrivateIPv6(v6);

        return false;
    }

    std::optional<std::string> corsAllowOrigin(const std::optional<std::string>& origin, bool allowLocalNetwork) {
        if (!allowLocalNetwork || !origin || origin->empty()) return std::nullopt;
        if (!isLocalNetworkOrigin(*origin)) return std::nullopt;
        return *origin;
    }

} // namespace omnimon
