#pragma once

#include "http_server.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <openssl/sha.h>
#include <arpa/inet.h>

namespace agentrun {

// WebSocket frame opcodes
enum class WSOpcode : uint8_t {
    CONTINUATION = 0x0,
    TEXT = 0x1,
    BINARY = 0x2,
    CLOSE = 0x8,
    PING = 0x9,
    PONG = 0xA
};

// One decoded (and unmasked) frame
struct WSFrame {
    WSOpcode opcode = WSOpcode::TEXT;
    bool fin = true;
    std::string payload;
};

// Close status codes used by the server
constexpr uint16_t WS_CLOSE_NORMAL = 1000;
constexpr uint16_t WS_CLOSE_GOING_AWAY = 1001;
constexpr uint16_t WS_CLOSE_POLICY = 1008;
constexpr uint16_t WS_CLOSE_TOO_BIG = 1009;

// WebSocket protocol helpers (RFC 6455, server side)
class WebSocketManager {
public:
    enum class ReadStatus {
        FRAME,
        TIMEOUT,    // Nothing arrived within the wait
        CLOSED,     // Peer went away or sent garbage
        TOO_BIG     // Message exceeds MAX_WS_FRAME_SIZE
    };

    // Check if request is WebSocket upgrade
    static bool is_websocket_upgrade(const HttpRequest& req);

    // Sec-WebSocket-Accept value for a client key
    static std::string accept_key(const std::string& sec_key);

    // Perform WebSocket handshake
    static std::string create_handshake_response(const std::string& sec_key);

    static bool send_text(int client_fd, const std::string& message);
    static bool send_pong(int client_fd, const std::string& payload);
    static bool send_close(int client_fd, uint16_t code = WS_CLOSE_NORMAL,
                           const std::string& reason = "");

    // Read and decode one incoming frame. Control frames are returned as-is;
    // fragmented data frames are reassembled.
    static ReadStatus read_frame(int client_fd, WSFrame& frame, std::chrono::milliseconds wait);

    // Create WebSocket frame (server frames are never masked)
    static std::vector<uint8_t> create_frame(WSOpcode opcode, const std::string& payload);

private:
    static std::string base64_encode(const unsigned char* data, size_t len);
};

} // namespace agentrun
