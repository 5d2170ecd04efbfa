// Copyright © 2025 Cadell Richard Anderson

// =================================================================
// WebSocketFrame.cpp
// =================================================================
#include "WebSocketFrame.h"
#include <openssl/evp.h>

namespace omnimon {

    std::expected<std::string, MonitorError> computeAcceptKey(std::string_view clientKey) {
        std::string input(clientKey);
        input += kWebSocketGuid;

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLen = 0;
        if (EVP_Digest(input.data(), input.size(), digest, &digestLen, EVP_sha1(), nullptr) != 1) {
            return std::unexpected(MonitorError::Unknown);
        }

        // 4 output chars per 3 input bytes, plus the terminator
        unsigned char encoded[4 * ((EVP_MAX_MD_SIZE + 2) / 3) + 1];
        const int n = EVP_EncodeBlock(encoded, digest, static_cast<int>(digestLen));
        if (n <= 0) return std::unexpected(MonitorError::Unknown);
        return std::string(reinterpret_cast<const char*>(encoded), static_cast<size_t>(n));
    }

    std::string encodeFrame(WsOpcode opcode, std::string_view payload) {
        std::string frame;
        frame.reserve(payload.size() + 10);
        frame.push_back(static_cast<char>(0x80 | static_cast<uint8_t>(opcode)));

        const uint64_t len = payload.size();
        if (len < 126) {
            frame.push_back(static_cast<char>(len));
        }
        else if (len <= 0xFFFF) {
            frame.push_back(static_cast<char>(126));
            frame.push_back(static_cast<char>((len >> 8) & 0xFF));
            frame.push_back(static_cast<char>(len & 0xFF));
        }
        else {
            frame.push_back(static_cast<char>(127));
            for (int shift = 56; shift >= 0; shift -= 8) {
                frame.push_back(static_cast<char>((len >> shift) & 0xFF));
            }
        }
        frame.append(payload);
        return frame;
    }

    std::expected<std::optional<WsFrame>, MonitorError> decodeFrame(std::string& buffer, bool requireMask) {
        if (buffer.size() < 2) return std::optional<WsFrame>{};

        const auto b0 = static_cast<uint8_t>(buffer[0]);
        const auto b1 = static_cast<uint8_t>(buffer[1]);
        const bool masked = (b1 & 0x80) != 0;
        if (requireMask && !masked) return std::unexpected(MonitorError::InvalidValue);

        size_t offset = 2;
        uint64_t len = b1 & 0x7F;
        if (len == 126) {
            if (buffer.size() < offset + 2) return std::optional<WsFrame>{};
            len = (static_cast<uint64_t>(static_cast<uint8_t>(buffer[2])) << 8)
                | static_cast<uint8_t>(buffer[3]);
            offset += 2;
        }
        else if (len == 127) {
            if (buffer.size() < offset + 8) return std::optional<WsFrame>{};
            len = 0;
            for (int i = 0; i < 8; ++i) {
                len = (len << 8) | static_cast<uint8_t>(buffer[2 + i]);
            }
            offset += 8;
        }
        if (requireMask && len > kMaxClientPayload) return std::unexpected(MonitorError::InvalidValue);

        uint8_t mask[4] = {};
        if (masked) {
            if (buffer.size() < offset + 4) return std::optional<WsFrame>{};
            for (int i = 0; i < 4; ++i) mask[i] = static_cast<uint8_t>(buffer[offset + i]);
            offset += 4;
        }
        if (buffer.size() - offset < len) return std::optional<WsFrame>{};

        WsFrame frame;
        frame.fin = (b0 & 0x80) != 0;
        frame.opcode = static_cast<WsOpcode>(b0 & 0x0F);
        frame.payload = buffer.substr(offset, static_cast<size_t>(len));
        if (masked) {
            for (size_t i = 0; i < frame.payload.size(); ++i) {
                frame.payload[i] = static_cast<char>(static_cast<uint8_t>(frame.payload[i]) ^ mask[i % 4]);
            }
        }
        buffer.erase(0, offset + static_cast<size_t>(len));
        return std::optional<WsFrame>(std::move(frame));
    }

} // namespace omnimon
