#include "transport.h"
#include "constants.h"
#include "errors.h"
#include "util.h"

#include <iostream>
#include <sstream>

namespace agentrun {

// ============================================================================
// SSE
// ============================================================================

SseWriter::SseWriter(int fd) : fd_(fd) {}

std::string SseWriter::response_head() {
    return "HTTP/1.1 200 OK\r\n"
           "Content-Type: text/event-stream\r\n"
           "Cache-Control: no-cache\r\n"
           "Connection: keep-alive\r\n"
           "X-Accel-Buffering: no\r\n"
           "Access-Control-Allow-Origin: *\r\n"
           "\r\n";
}

std::string SseWriter::format(const OutboundEvent& event, const ChannelCursor& cursor) {
    std::ostringstream frame;
    if (event.resumable()) {
        frame << "id: " << format_cursor(cursor) << "\n";
    }
    frame << "event: " << event.type << "\n";
    frame << "data: " << to_json(event.data) << "\n\n";
    return frame.str();
}

bool SseWriter::open() {
    return write_all(fd_, response_head());
}

bool SseWriter::write(const OutboundEvent& event, const ChannelCursor& cursor) {
    return write_all(fd_, format(event, cursor));
}

void SseWriter::close(bool overrun) {
    if (overrun) {
        Json::Value data;
        data["error"] = "connection overrun";
        // Best effort; the socket closes right after
        if (!write_all(fd_, format(OutboundEvent::notice("error", data), ChannelCursor()))) {
            std::cerr << "[Delivery] Could not notify evicted SSE client" << std::endl;
        }
    }
}

// ============================================================================
// WebSocket
// ============================================================================

WebSocketWriter::WebSocketWriter(int fd, std::string sec_key)
    : fd_(fd), sec_key_(std::move(sec_key)) {}

std::string WebSocketWriter::format(const OutboundEvent& event) {
    Json::Value frame;
    frame["type"] = event.type;
    if (event.resumable()) {
        frame["message_id"] = static_cast<Json::UInt64>(event.message_id);
        frame["channel"] = to_string(*event.channel);
    }
    frame["data"] = event.data;
    return to_json(frame);
}

bool WebSocketWriter::send(const std::string& text) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return WebSocketManager::send_text(fd_, text);
}

bool WebSocketWriter::open() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return write_all(fd_, WebSocketManager::create_handshake_response(sec_key_));
}

bool WebSocketWriter::write(const OutboundEvent& event, const ChannelCursor&) {
    return send(format(event));
}

void WebSocketWriter::close(bool overrun) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (peer_closed_) {
        // Echo the peer's close
        WebSocketManager::send_close(fd_, WS_CLOSE_NORMAL);
        return;
    }
    uint16_t code = overrun ? WS_CLOSE_POLICY : close_code_;
    WebSocketManager::send_close(fd_, code, overrun ? "connection overrun" : "");
}

void WebSocketWriter::read_loop(BackgroundTask& task, Connection& conn, ControlHandler* control) {
    WSFrame frame;

    while (!task.cancelled() && !conn.closed()) {
        auto status = WebSocketManager::read_frame(fd_, frame, std::chrono::milliseconds(DELIVERY_POLL_MS));

        if (status == WebSocketManager::ReadStatus::TIMEOUT) continue;
        if (status == WebSocketManager::ReadStatus::TOO_BIG) {
            std::cerr << "[WebSocket] Oversized message on " << conn.id() << std::endl;
            close_code_ = WS_CLOSE_TOO_BIG;
            conn.close();
            break;
        }
        if (status == WebSocketManager::ReadStatus::CLOSED) {
            conn.close();
            break;
        }

        try {
            switch (frame.opcode) {
                case WSOpcode::PING: {
                    std::lock_guard<std::mutex> lock(write_mutex_);
                    WebSocketManager::send_pong(fd_, frame.payload);
                    break;
                }
                case WSOpcode::CLOSE:
                    peer_closed_ = true;
                    conn.close();
                    return;
                case WSOpcode::TEXT:
                    if (control) {
                        conn.offer(control->handle(conn.run_id(), frame.payload));
                    }
                    break;
                case WSOpcode::BINARY: {
                    Json::Value data;
                    data["error"] = "binary frames are not supported";
                    conn.offer(OutboundEvent::notice("error", data));
                    break;
                }
                default:
                    break;
            }
        } catch (const ConnectionOverrun& e) {
            std::cerr << "[WebSocket] Evicted: " << e.what() << std::endl;
            return;
        }
    }
}

} // namespace agentrun
