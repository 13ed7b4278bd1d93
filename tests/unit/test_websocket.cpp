#include <gtest/gtest.h>
#include "../../src/websocket.h"
#include "../../src/constants.h"

#include <sys/socket.h>
#include <unistd.h>

#include <map>
#include <string>

using namespace agentrun;

// ============================================================================
// WebSocketManager Tests - Upgrade Detection
// ============================================================================

class WebSocketManagerTest : public ::testing::Test {
protected:
    HttpRequest create_request(const std::string& upgrade,
                               const std::string& connection,
                               const std::string& key = "dGhlIHNhbXBsZSBub25jZQ==") {
        HttpRequest req;
        req.method = "GET";
        req.path = "/ws/runs/run_1";
        if (!upgrade.empty()) req.headers["Upgrade"] = upgrade;
        if (!connection.empty()) req.headers["Connection"] = connection;
        if (!key.empty()) req.headers["Sec-WebSocket-Key"] = key;
        return req;
    }
};

TEST_F(WebSocketManagerTest, DetectsValidWebSocketUpgrade) {
    // Given: Valid WebSocket upgrade headers
    auto req = create_request("websocket", "Upgrade");

    // Then: Should recognize as WebSocket upgrade
    EXPECT_TRUE(WebSocketManager::is_websocket_upgrade(req));
}

TEST_F(WebSocketManagerTest, DetectsUpgradeWithMixedCaseAndLists) {
    // Given: Mixed-case values and a comma-separated Connection list
    auto req = create_request("WebSocket", "keep-alive, Upgrade");

    // Then: Should still be recognized
    EXPECT_TRUE(WebSocketManager::is_websocket_upgrade(req));
}

TEST_F(WebSocketManagerTest, RejectsIncompleteUpgrades) {
    // Given: Requests missing one of the required headers
    // Then: None of them is an upgrade
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(create_request("", "Upgrade")));
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(create_request("websocket", "")));
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(create_request("h2c", "Upgrade")));
    EXPECT_FALSE(WebSocketManager::is_websocket_upgrade(create_request("websocket", "Upgrade", "")));
}

// ============================================================================
// WebSocketManager Tests - Handshake
// ============================================================================

TEST_F(WebSocketManagerTest, CalculatesCorrectAcceptKey) {
    // Given: Known test vector from RFC 6455
    // Then: Accept key matches
    EXPECT_EQ(WebSocketManager::accept_key("dGhlIHNhbXBsZSBub25jZQ=="),
              "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST_F(WebSocketManagerTest, CreatesValidHandshakeResponse) {
    // When: Creating handshake response
    std::string response = WebSocketManager::create_handshake_response("dGhlIHNhbXBsZSBub25jZQ==");

    // Then: 101 with upgrade headers, terminated by a blank line
    EXPECT_EQ(response.find("HTTP/1.1 101 Switching Protocols"), 0u);
    EXPECT_NE(response.find("Upgrade: websocket\r\n"), std::string::npos);
    EXPECT_NE(response.find("Connection: Upgrade\r\n"), std::string::npos);
    EXPECT_NE(response.find("Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n"),
              std::string::npos);
    EXPECT_EQ(response.substr(response.size() - 4), "\r\n\r\n");
}

// ============================================================================
// WebSocketManager Tests - Frame Creation
// ============================================================================

TEST_F(WebSocketManagerTest, CreatesSmallTextFrame) {
    // When: Framing a short message
    auto frame = WebSocketManager::create_frame(WSOpcode::TEXT, "hello");

    // Then: FIN + TEXT, unmasked 7-bit length, payload
    ASSERT_EQ(frame.size(), 7u);
    EXPECT_EQ(frame[0], 0x81);
    EXPECT_EQ(frame[1], 5);
    EXPECT_EQ(std::string(frame.begin() + 2, frame.end()), "hello");
}

TEST_F(WebSocketManagerTest, UsesExtendedLengths) {
    // Given: Payloads past the 7-bit and 16-bit limits
    auto medium = WebSocketManager::create_frame(WSOpcode::TEXT, std::string(300, 'a'));
    auto large = WebSocketManager::create_frame(WSOpcode::BINARY, std::string(70000, 'b'));

    // Then: 126 + 2 bytes, 127 + 8 bytes
    EXPECT_EQ(medium[1], 126);
    EXPECT_EQ((medium[2] << 8) | medium[3], 300);
    EXPECT_EQ(medium.size(), 4u + 300u);

    EXPECT_EQ(large[0], 0x82);
    EXPECT_EQ(large[1], 127);
    EXPECT_EQ(large.size(), 10u + 70000u);
}

// ============================================================================
// WebSocketManager Tests - Reading Client Frames
// ============================================================================

class WebSocketReadTest : public ::testing::Test {
protected:
    int fds[2] = {-1, -1};

    void SetUp() override {
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    }

    void TearDown() override {
        if (fds[0] >= 0) close(fds[0]);
        if (fds[1] >= 0) close(fds[1]);
    }

    // Client frames are always masked
    void send_client_frame(uint8_t opcode, const std::string& payload, bool fin = true) {
        const uint8_t mask[4] = {0x12, 0x34, 0x56, 0x78};
        std::string frame;
        frame.push_back(static_cast<char>((fin ? 0x80 : 0x00) | opcode));
        if (payload.size() <= 125) {
            frame.push_back(static_cast<char>(0x80 | payload.size()));
        } else {
            frame.push_back(static_cast<char>(0x80 | 126));
            frame.push_back(static_cast<char>((payload.size() >> 8) & 0xFF));
            frame.push_back(static_cast<char>(payload.size() & 0xFF));
        }
        frame.append(reinterpret_cast<const char*>(mask), 4);
        for (size_t i = 0; i < payload.size(); i++) {
            frame.push_back(static_cast<char>(payload[i] ^ mask[i % 4]));
        }
        ASSERT_TRUE(write_all(fds[1], frame));
    }

    WebSocketManager::ReadStatus read(WSFrame& frame) {
        return WebSocketManager::read_frame(fds[0], frame, std::chrono::milliseconds(500));
    }
};

TEST_F(WebSocketReadTest, UnmasksTextFrame) {
    // Given: A masked control message from a client
    send_client_frame(0x1, "{\"control\":\"ping\"}");

    // When: Reading it
    WSFrame frame;
    auto status = read(frame);

    // Then: The payload is unmasked
    ASSERT_EQ(status, WebSocketManager::ReadStatus::FRAME);
    EXPECT_EQ(frame.opcode, WSOpcode::TEXT);
    EXPECT_EQ(frame.payload, "{\"control\":\"ping\"}");
}

TEST_F(WebSocketReadTest, ReassemblesFragmentsAcrossInterleavedPing) {
    // Given: A text message in two fragments with a ping between them
    send_client_frame(0x1, "{\"control\":", false);
    send_client_frame(0x9, "p");
    send_client_frame(0x0, "\"cancel\"}", true);

    // When: Reading
    WSFrame frame;
    auto status = read(frame);

    // Then: One complete text message
    ASSERT_EQ(status, WebSocketManager::ReadStatus::FRAME);
    EXPECT_EQ(frame.opcode, WSOpcode::TEXT);
    EXPECT_EQ(frame.payload, "{\"control\":\"cancel\"}");
}

TEST_F(WebSocketReadTest, ReturnsControlFramesAsIs) {
    // Given: A ping and then a close
    send_client_frame(0x9, "hb");
    send_client_frame(0x8, std::string("\x03\xe8", 2));

    WSFrame frame;
    ASSERT_EQ(read(frame), WebSocketManager::ReadStatus::FRAME);
    EXPECT_EQ(frame.opcode, WSOpcode::PING);
    EXPECT_EQ(frame.payload, "hb");

    ASSERT_EQ(read(frame), WebSocketManager::ReadStatus::FRAME);
    EXPECT_EQ(frame.opcode, WSOpcode::CLOSE);
}

TEST_F(WebSocketReadTest, TimesOutWhenNothingArrives) {
    WSFrame frame;
    EXPECT_EQ(WebSocketManager::read_frame(fds[0], frame, std::chrono::milliseconds(50)),
              WebSocketManager::ReadStatus::TIMEOUT);
}

TEST_F(WebSocketReadTest, ReportsClosedPeer) {
    // Given: The client goes away
    close(fds[1]);
    fds[1] = -1;

    WSFrame frame;
    EXPECT_EQ(read(frame), WebSocketManager::ReadStatus::CLOSED);
}

TEST_F(WebSocketReadTest, RejectsStrayContinuation) {
    // Given: A continuation without a started message
    send_client_frame(0x0, "orphan");

    WSFrame frame;
    EXPECT_EQ(read(frame), WebSocketManager::ReadStatus::CLOSED);
}

TEST_F(WebSocketReadTest, FlagsOversizedMessages) {
    // Given: A frame header announcing more than the limit
    std::string header;
    header.push_back(static_cast<char>(0x81));
    header.push_back(static_cast<char>(0x80 | 127));
    uint64_t len = MAX_WS_FRAME_SIZE + 1;
    for (int i = 7; i >= 0; --i) {
        header.push_back(static_cast<char>((len >> (i * 8)) & 0xFF));
    }
    ASSERT_TRUE(write_all(fds[1], header));

    // Then: Rejected before any payload is read
    WSFrame frame;
    EXPECT_EQ(read(frame), WebSocketManager::ReadStatus::TOO_BIG);
}
