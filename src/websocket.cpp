#include "websocket.h"
#include "constants.h"
#include "util.h"

#include <openssl/evp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <sstream>

namespace agentrun {

namespace {

// Reads exactly len bytes, waiting at most until deadline for each chunk
bool read_exact(int fd, uint8_t* buf, size_t len, std::chrono::steady_clock::time_point deadline) {
    size_t total = 0;
    while (total < len) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) return false;

        struct pollfd pfd = {fd, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(left));
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return false;

        ssize_t n = recv(fd, buf + total, len - total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += n;
    }
    return true;
}

bool send_frame(int client_fd, WSOpcode opcode, const std::string& payload) {
    auto frame = WebSocketManager::create_frame(opcode, payload);
    return write_all(client_fd, std::string(frame.begin(), frame.end()));
}

} // namespace

std::string WebSocketManager::base64_encode(const unsigned char* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data,
                                  static_cast<int>(len));
    out.resize(written);
    return out;
}

bool WebSocketManager::is_websocket_upgrade(const HttpRequest& req) {
    std::string upgrade = to_lower(req.header("Upgrade"));
    std::string connection = to_lower(req.header("Connection"));
    return upgrade == "websocket" && connection.find("upgrade") != std::string::npos &&
           !req.header("Sec-WebSocket-Key").empty();
}

std::string WebSocketManager::accept_key(const std::string& sec_key) {
    // WebSocket magic string
    const std::string magic = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    std::string combined = trim(sec_key) + magic;

    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(combined.c_str()), combined.length(), hash);
    return base64_encode(hash, SHA_DIGEST_LENGTH);
}

std::string WebSocketManager::create_handshake_response(const std::string& sec_key) {
    std::ostringstream response;
    response << "HTTP/1.1 101 Switching Protocols\r\n"
             << "Upgrade: websocket\r\n"
             << "Connection: Upgrade\r\n"
             << "Sec-WebSocket-Accept: " << accept_key(sec_key) << "\r\n"
             << "\r\n";
    return response.str();
}

std::vector<uint8_t> WebSocketManager::create_frame(WSOpcode opcode, const std::string& payload) {
    std::vector<uint8_t> frame;

    // First byte: FIN bit + opcode
    frame.push_back(0x80 | static_cast<uint8_t>(opcode));

    // Payload length
    size_t payload_len = payload.size();
    if (payload_len <= 125) {
        frame.push_back(static_cast<uint8_t>(payload_len));
    } else if (payload_len <= 65535) {
        frame.push_back(126);
        frame.push_back((payload_len >> 8) & 0xFF);
        frame.push_back(payload_len & 0xFF);
    } else {
        frame.push_back(127);
        for (int i = 7; i >= 0; --i) {
            frame.push_back((static_cast<uint64_t>(payload_len) >> (i * 8)) & 0xFF);
        }
    }

    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

bool WebSocketManager::send_text(int client_fd, const std::string& message) {
    return send_frame(client_fd, WSOpcode::TEXT, message);
}

bool WebSocketManager::send_pong(int client_fd, const std::string& payload) {
    return send_frame(client_fd, WSOpcode::PONG, payload.substr(0, 125));
}

bool WebSocketManager::send_close(int client_fd, uint16_t code, const std::string& reason) {
    std::string payload;
    payload.push_back(static_cast<char>((code >> 8) & 0xFF));
    payload.push_back(static_cast<char>(code & 0xFF));
    payload += reason.substr(0, 123);
    return send_frame(client_fd, WSOpcode::CLOSE, payload);
}

WebSocketManager::ReadStatus WebSocketManager::read_frame(int client_fd, WSFrame& frame,
                                                          std::chrono::milliseconds wait) {
    frame = WSFrame();
    bool first = true;

    while (true) {
        // Only the wait for a new frame may time out; a started frame gets a
        // fixed budget to arrive completely.
        if (first) {
            struct pollfd pfd = {client_fd, POLLIN, 0};
            int ready = poll(&pfd, 1, static_cast<int>(wait.count()));
            if (ready < 0 && errno != EINTR) return ReadStatus::CLOSED;
            if (ready <= 0) return ReadStatus::TIMEOUT;
        }
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);

        uint8_t header[2];
        if (!read_exact(client_fd, header, 2, deadline)) return ReadStatus::CLOSED;

        bool fin = (header[0] & 0x80) != 0;
        uint8_t opcode = header[0] & 0x0F;
        bool masked = (header[1] & 0x80) != 0;
        uint64_t payload_len = header[1] & 0x7F;

        if (payload_len == 126) {
            uint8_t len_bytes[2];
            if (!read_exact(client_fd, len_bytes, 2, deadline)) return ReadStatus::CLOSED;
            payload_len = (len_bytes[0] << 8) | len_bytes[1];
        } else if (payload_len == 127) {
            uint8_t len_bytes[8];
            if (!read_exact(client_fd, len_bytes, 8, deadline)) return ReadStatus::CLOSED;
            payload_len = 0;
            for (int i = 0; i < 8; i++) {
                payload_len = (payload_len << 8) | len_bytes[i];
            }
        }

        if (payload_len + frame.payload.size() > MAX_WS_FRAME_SIZE) {
            return ReadStatus::TOO_BIG;
        }

        uint8_t mask[4] = {0};
        if (masked && !read_exact(client_fd, mask, 4, deadline)) return ReadStatus::CLOSED;

        std::vector<uint8_t> payload(payload_len);
        if (payload_len > 0 && !read_exact(client_fd, payload.data(), payload_len, deadline)) {
            return ReadStatus::CLOSED;
        }
        if (masked) {
            for (size_t i = 0; i < payload_len; i++) {
                payload[i] ^= mask[i % 4];
            }
        }

        // Control frames may arrive between fragments and are never fragmented
        if (opcode >= 0x8) {
            WSFrame control;
            control.opcode = static_cast<WSOpcode>(opcode);
            control.payload.assign(payload.begin(), payload.end());
            if (first) {
                frame = std::move(control);
                return ReadStatus::FRAME;
            }
            if (control.opcode == WSOpcode::CLOSE) return ReadStatus::CLOSED;
            continue;       // Pings between fragments go unanswered
        }

        if (first) {
            if (opcode == static_cast<uint8_t>(WSOpcode::CONTINUATION)) return ReadStatus::CLOSED;
            frame.opcode = static_cast<WSOpcode>(opcode);
        } else if (opcode != static_cast<uint8_t>(WSOpcode::CONTINUATION)) {
            return ReadStatus::CLOSED;
        }
        frame.payload.append(payload.begin(), payload.end());
        first = false;

        if (fin) {
            frame.fin = true;
            return ReadStatus::FRAME;
        }
    }
}

} // namespace agentrun
