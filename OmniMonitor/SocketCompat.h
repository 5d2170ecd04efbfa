// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// SocketCompat.h
// Winsock / BSD socket differences used by the HTTP server.
// =================================================================
#pragma once

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "Ws2_32.lib")

namespace omnimon {
    using socket_t = SOCKET;
    constexpr socket_t kInvalidSocket = INVALID_SOCKET;

    inline int closeSocket(socket_t s) { return closesocket(s); }
    inline int shutdownBoth(socket_t s) { return shutdown(s, SD_BOTH); }
    inline int lastSocketError() { return WSAGetLastError(); }
}
#else
#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace omnimon {
    using socket_t = int;
    constexpr socket_t kInvalidSocket = -1;

    inline int closeSocket(socket_t s) { return ::close(s); }
    inline int shutdownBoth(socket_t s) { return ::shutdown(s, SHUT_RDWR); }
    inline int lastSocketError() { return errno; }
}
#endif
