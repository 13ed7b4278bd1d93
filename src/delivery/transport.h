#pragma once

#include "connection.h"
#include "control_handler.h"
#include "background_task.h"
#include "websocket.h"

#include <mutex>
#include <string>

namespace agentrun {

// Serializes outbound events onto one client socket
class StreamWriter {
public:
    virtual ~StreamWriter() = default;

    // Response head or handshake; false when the client is already gone
    virtual bool open() = 0;

    // cursor is the connection's resume point including this event
    virtual bool write(const OutboundEvent& event, const ChannelCursor& cursor) = 0;

    virtual void close(bool overrun) = 0;
};

// text/event-stream. Relay events carry an "id:" holding the full cursor so
// a browser's Last-Event-ID resumes every channel at once.
class SseWriter : public StreamWriter {
public:
    explicit SseWriter(int fd);

    bool open() override;
    bool write(const OutboundEvent& event, const ChannelCursor& cursor) override;
    void close(bool overrun) override;

    static std::string response_head();
    static std::string format(const OutboundEvent& event, const ChannelCursor& cursor);

private:
    int fd_;
};

// JSON text frames {type, message_id?, channel?, data}
class WebSocketWriter : public StreamWriter {
public:
    WebSocketWriter(int fd, std::string sec_key);

    bool open() override;
    bool write(const OutboundEvent& event, const ChannelCursor& cursor) override;
    void close(bool overrun) override;

    // Reads client frames until the client leaves or the task is cancelled.
    // Text frames go through the control handler; replies are queued on conn.
    void read_loop(BackgroundTask& task, Connection& conn, ControlHandler* control);

    static std::string format(const OutboundEvent& event);

private:
    bool send(const std::string& text);

    int fd_;
    std::string sec_key_;
    std::mutex write_mutex_;
    bool peer_closed_ = false;
    uint16_t close_code_ = WS_CLOSE_NORMAL;
};

} // namespace agentrun
