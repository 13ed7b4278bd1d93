#include "connection.h"
#include "errors.h"
#include "util.h"

#include <sstream>
#include <stdexcept>

namespace agentrun {

std::string to_string(Transport transport) {
    return transport == Transport::SSE ? "sse" : "websocket";
}

OutboundEvent OutboundEvent::from_event(const Event& event) {
    OutboundEvent out;
    out.type = event.type;
    out.channel = event.channel;
    out.message_id = event.message_id;
    out.data = event.payload;
    return out;
}

OutboundEvent OutboundEvent::notice(const std::string& type, Json::Value data) {
    OutboundEvent out;
    out.type = type;
    out.data = std::move(data);
    return out;
}

std::string format_cursor(const ChannelCursor& cursor) {
    std::string out;
    for (Channel channel : {Channel::OUTPUT, Channel::LOG, Channel::STATUS}) {
        auto it = cursor.find(channel);
        if (it == cursor.end()) continue;
        if (!out.empty()) out += "|";
        out += to_string(channel) + ":" + std::to_string(it->second);
    }
    return out;
}

ChannelCursor parse_cursor(const std::string& text) {
    ChannelCursor cursor;
    std::istringstream parts(text);
    std::string part;

    while (std::getline(parts, part, '|')) {
        size_t colon = part.find(':');
        if (colon == std::string::npos) continue;

        std::string digits = trim(part.substr(colon + 1));
        if (digits.empty() || digits.size() > 19 ||
            digits.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        try {
            cursor[channel_from_string(trim(part.substr(0, colon)))] = std::stoull(digits);
        } catch (const std::invalid_argument&) {
            continue;       // Unknown channel name
        }
    }
    return cursor;
}

Connection::Connection(std::string run_id, Transport transport, size_t capacity,
                       ChannelCursor resume_from)
    : id_(generate_id("conn_")),
      run_id_(std::move(run_id)),
      transport_(transport),
      capacity_(capacity),
      created_at_(Clock::now()),
      queued_(resume_from),
      delivered_(std::move(resume_from)) {}

bool Connection::offer(OutboundEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }

    if (event.resumable()) {
        uint64_t& last = queued_[*event.channel];
        if (event.message_id <= last) {
            return true;
        }
        last = event.message_id;
    }

    if (queue_.size() >= capacity_) {
        overrun_ = true;
        closed_ = true;
        queue_.clear();
        cv_.notify_all();
        throw ConnectionOverrun("connection " + id_ + " on run " + run_id_ + " exceeded " +
                                std::to_string(capacity_) + " queued events");
    }

    queue_.push_back(std::move(event));
    cv_.notify_one();
    return true;
}

bool Connection::expired_locked() const {
    return close_at_ && std::chrono::steady_clock::now() >= *close_at_;
}

bool Connection::take(OutboundEvent& event, std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, wait, [this] { return closed_ || !queue_.empty() || expired_locked(); });

    if (expired_locked()) {
        closed_ = true;
    }
    if (closed_ || queue_.empty()) {
        return false;
    }

    event = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void Connection::mark_delivered(const OutboundEvent& event) {
    if (!event.resumable()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t& last = delivered_[*event.channel];
    if (event.message_id > last) {
        last = event.message_id;
    }
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

void Connection::close_after(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto at = std::chrono::steady_clock::now() + grace;
    if (!close_at_ || at < *close_at_) {
        close_at_ = at;
    }
    cv_.notify_all();
}

bool Connection::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ || expired_locked();
}

bool Connection::overrun() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overrun_;
}

size_t Connection::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

ChannelCursor Connection::queued_cursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_;
}

ChannelCursor Connection::delivered_cursor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

uint64_t Connection::last_delivered(Channel channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = delivered_.find(channel);
    return it == delivered_.end() ? 0 : it->second;
}

} // namespace agentrun
