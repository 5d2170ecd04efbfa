// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// CorsPolicy.h
// Cross-origin allow-list for dashboards served from other LAN hosts.
// =================================================================
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace omnimon {

    /**
     * True for http/https origins whose host is localhost, a loopback address,
     * an RFC 1918 private IPv4 address, or an IPv6 unique-local (fc00::/7),
     * link-local (fe80::/10) or site-local (fec0::/10) address.
     */
    bool isLocalNetworkOrigin(std::string_view origin);

    // Value for Access-Control-Allow-Origin, or nullopt to send no CORS header
    std::optional<std::string> corsAllowOrigin(const std::optional<std::string>& origin, bool allowLocalNetwork);

} // namespace omnimon
