// Copyright © 2025 Cadell Richard Anderson

/**
 * @file test_websocket_frame.cpp
 * @brief Handshake accept key and frame encode/decode
 */

#include <gtest/gtest.h>
#include "ClientFrames.h"
#include "WebSocketFrame.h"

namespace omnimon {
namespace test {

TEST(WebSocketHandshakeTest, AcceptKeyMatchesRfcExample) {
    auto key = computeAcceptKey("dGhlIHNhbXBsZSBub25jZQ==");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(*key, "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

class WebSocketFrameTest : public ::testing::Test {
protected:
    std::string buffer;
};

TEST_F(WebSocketFrameTest, EncodesShortTextFrame) {
    const std::string frame = encodeFrame(WsOpcode::Text, "hi");
    ASSERT_EQ(frame.size(), 4u);
    EXPECT_EQ(static_cast<uint8_t>(frame[0]), 0x81);
    EXPECT_EQ(static_cast<uint8_t>(frame[1]), 0x02);
    EXPECT_EQ(frame.substr(2), "hi");
}

TEST_F(WebSocketFrameTest, EncodesExtendedLengths) {
    const std::string medium = encodeFrame(WsOpcode::Text, std::string(300, 'x'));
    EXPECT_EQ(static_cast<uint8_t>(medium[1]), 126);
    EXPECT_EQ(static_cast<uint8_t>(medium[2]), 0x01);
    EXPECT_EQ(static_cast<uint8_t>(medium[3]), 0x2C);
    EXPECT_EQ(medium.size(), 304u);

    const std::string large = encodeFrame(WsOpcode::Binary, std::string(70000, 'y'));
    EXPECT_EQ(static_cast<uint8_t>(large[1]), 127);
    EXPECT_EQ(large.size(), 70010u);
}

TEST_F(WebSocketFrameTest, DecodesMaskedClientFrame) {
    buffer = maskedFrame(WsOpcode::Text, "hello") + maskedFrame(WsOpcode::Ping, "p");

    auto first = decodeFrame(buffer, true);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first->has_value());
    EXPECT_TRUE((*first)->fin);
    EXPECT_EQ((*first)->opcode, WsOpcode::Text);
    EXPECT_EQ((*first)->payload, "hello");

    auto second = decodeFrame(buffer, true);
    ASSERT_TRUE(second.has_value() && second->has_value());
    EXPECT_EQ((*second)->opcode, WsOpcode::Ping);
    EXPECT_EQ((*second)->payload, "p");
    EXPECT_TRUE(buffer.empty());
}

TEST_F(WebSocketFrameTest, DecodesMediumMaskedPayload) {
    const std::string payload(1000, 'z');
    buffer = maskedFrame(WsOpcode::Text, payload);
    auto frame = decodeFrame(buffer, true);
    ASSERT_TRUE(frame.has_value() && frame->has_value());
    EXPECT_EQ((*frame)->payload, payload);
}

TEST_F(WebSocketFrameTest, IncompleteFrameLeavesBufferIntact) {
    const std::string full = maskedFrame(WsOpcode::Text, "partial");
    for (size_t cut = 0; cut < full.size(); ++cut) {
        buffer = full.substr(0, cut);
        auto frame = decodeFrame(buffer, true);
        ASSERT_TRUE(frame.has_value());
        EXPECT_FALSE(frame->has_value()) << "cut at " << cut;
        EXPECT_EQ(buffer.size(), cut);
    }
}

TEST_F(WebSocketFrameTest, UnmaskedClientFrameIsRejected) {
    buffer = encodeFrame(WsOpcode::Text, "nope");
    auto frame = decodeFrame(buffer, true);
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error(), MonitorError::InvalidValue);
}

TEST_F(WebSocketFrameTest, UnmaskedAcceptedWhenNotRequired) {
    buffer = encodeFrame(WsOpcode::Close, "");
    auto frame = decodeFrame(buffer, false);
    ASSERT_TRUE(frame.has_value() && frame->has_value());
    EXPECT_EQ((*frame)->opcode, WsOpcode::Close);
}

TEST_F(WebSocketFrameTest, OversizedClientPayloadIsRejected) {
    buffer.push_back(static_cast<char>(0x81));
    buffer.push_back(static_cast<char>(0x80 | 127));
    const uint64_t len = kMaxClientPayload + 1;
    for (int shift = 56; shift >= 0; shift -= 8) buffer.push_back(static_cast<char>((len >> shift) & 0xFF));

    auto frame = decodeFrame(buffer, true);
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error(), MonitorError::InvalidValue);
}

} // namespace test
} // namespace omnimon
