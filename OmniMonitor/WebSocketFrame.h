// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// WebSocketFrame.h
// RFC 6455 handshake key and frame codec.
// =================================================================
#pragma once
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include "MonitorError.h"

namespace omnimon {

    enum class WsOpcode : uint8_t {
        Continuation = 0x0,
        Text = 0x1,
        Binary = 0x2,
        Close = 0x8,
        Ping = 0x9,
        Pong = 0xA
    };

    struct WsFrame {
        bool fin = true;
        WsOpcode opcode = WsOpcode::Text;
        std::string payload;
    };

    inline constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    inline constexpr std::size_t kMaxClientPayload = 1 << 20;

    // Base64(SHA-1(key + GUID)) via OpenSSL
    std::expected<std::string, MonitorError> computeAcceptKey(std::string_view clientKey);

    // Single unmasked FIN frame, as a server sends it
    std::string encodeFrame(WsOpcode opcode, std::string_view payload);

    /**
     * Decodes the first frame in `buffer` and erases its bytes.
     * Returns nullopt while the frame is incomplete; InvalidValue on a
     * protocol violation (unmasked client frame, oversized payload).
     */
    std::expected<std::optional<WsFrame>, MonitorError> decodeFrame(std::string& buffer, bool requireMask);

} // namespace omnimon
