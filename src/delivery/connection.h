#pragma once

#include "models.h"

#include <json/json.h>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace agentrun {

enum class Transport {
    SSE,
    WEBSOCKET
};

std::string to_string(Transport transport);

// One message bound for a subscriber. Relay events carry their channel and
// id; connected, heartbeat and control replies carry neither.
struct OutboundEvent {
    std::string type;
    std::optional<Channel> channel;
    uint64_t message_id = 0;
    Json::Value data;

    bool resumable() const { return channel.has_value() && message_id > 0; }

    static OutboundEvent from_event(const Event& event);
    static OutboundEvent notice(const std::string& type, Json::Value data);
};

// Last-seen ids per channel, e.g. "output:12|log:3|status:1"
using ChannelCursor = std::map<Channel, uint64_t>;

std::string format_cursor(const ChannelCursor& cursor);

// Unknown channels and malformed parts are skipped
ChannelCursor parse_cursor(const std::string& text);

// A live subscriber of one run. Owns a bounded outbound queue: offer never
// blocks, and a full queue evicts the connection instead.
class Connection {
public:
    Connection(std::string run_id, Transport transport, size_t capacity,
               ChannelCursor resume_from = ChannelCursor());

    const std::string& id() const { return id_; }
    const std::string& run_id() const { return run_id_; }
    Transport transport() const { return transport_; }
    Clock::time_point created_at() const { return created_at_; }

    // Queue an event. Relay events at or below the channel's last queued id
    // are skipped as duplicates. Returns false once the connection is closed.
    // Throws ConnectionOverrun (and closes) when the queue is full.
    bool offer(OutboundEvent event);

    // Next queued event; false on timeout or when the connection is done
    bool take(OutboundEvent& event, std::chrono::milliseconds wait);

    // Record what the writer actually sent
    void mark_delivered(const OutboundEvent& event);

    void close();

    // Let queued events drain for grace, then close
    void close_after(std::chrono::milliseconds grace);

    bool closed() const;
    bool overrun() const;
    size_t queued() const;

    // Ids the pump has already queued, the resume point for the relay
    ChannelCursor queued_cursor() const;
    ChannelCursor delivered_cursor() const;
    uint64_t last_delivered(Channel channel) const;

private:
    bool expired_locked() const;

    std::string id_;
    std::string run_id_;
    Transport transport_;
    size_t capacity_;
    Clock::time_point created_at_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<OutboundEvent> queue_;
    ChannelCursor queued_;
    ChannelCursor delivered_;
    bool closed_ = false;
    bool overrun_ = false;
    std::optional<std::chrono::steady_clock::time_point> close_at_;
};

} // namespace agentrun
