#include "remote_relay.h"
#include "relay_protocol.h"
#include "errors.h"
#include "constants.h"
#include "util.h"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <iostream>

namespace agentrun {

namespace {

class RemoteSubscription : public RelaySubscription {
public:
    RemoteSubscription(int fd, std::string buffered, std::string channel)
        : fd_(fd), buffer_(std::move(buffered)), channel_(std::move(channel)) {}

    ~RemoteSubscription() override { close(); }

    bool next(std::string& message, std::chrono::milliseconds wait) override {
        auto deadline = std::chrono::steady_clock::now() + wait;

        while (true) {
            size_t nl;
            while ((nl = buffer_.find('\n')) != std::string::npos) {
                std::string line = buffer_.substr(0, nl);
                buffer_.erase(0, nl + 1);
                if (trim(line).empty()) continue;     // Keepalive

                Json::Value frame;
                if (parse_json(line, frame) && frame["message"].isString()) {
                    message = frame["message"].asString();
                    return true;
                }
            }

            if (fd_ < 0) {
                throw RelayUnavailable("subscription to " + channel_ + " closed");
            }

            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return false;

            struct pollfd pfd = {fd_, POLLIN, 0};
            int ready = poll(&pfd, 1, static_cast<int>(left.count()));
            if (ready < 0 && errno != EINTR) {
                close();
                throw RelayUnavailable("subscription to " + channel_ + " failed");
            }
            if (ready <= 0) continue;

            char chunk[PIPE_BUFFER_SIZE];
            ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                if (n < 0 && errno == EINTR) continue;
                close();
                throw RelayUnavailable("relay closed subscription to " + channel_);
            }
            buffer_.append(chunk, n);
        }
    }

    void close() override {
        if (fd_ >= 0) {
            ::shutdown(fd_, SHUT_RDWR);
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
    std::string buffer_;
    std::string channel_;
};

} // namespace

RemoteRelay::RemoteRelay(HttpClient client, std::chrono::milliseconds call_timeout)
    : client_(std::move(client)), call_timeout_(call_timeout) {}

Json::Value RemoteRelay::call(const std::string& path, const Json::Value& body,
                              std::chrono::milliseconds extra) {
    HttpClientResponse resp;
    try {
        resp = client_.request("POST", path, to_json(body), call_timeout_ + extra);
    } catch (const std::exception& e) {
        throw RelayUnavailable(e.what());
    }

    Json::Value out;
    if (resp.status_code != 200 || !parse_json(resp.body, out)) {
        throw RelayUnavailable(path + " answered " + std::to_string(resp.status_code));
    }
    return out;
}

size_t RemoteRelay::publish(const std::string& channel, const std::string& message) {
    Json::Value body;
    body["channel"] = channel;
    body["message"] = message;
    return call("/relay/publish", body).get("subscribers", 0).asUInt64();
}

std::unique_ptr<RelaySubscription> RemoteRelay::subscribe(const std::string& channel) {
    HttpClientResponse head;
    int fd;
    try {
        fd = client_.open_stream("/relay/subscribe?channel=" + url_encode(channel),
                                 call_timeout_, head);
    } catch (const std::exception& e) {
        throw RelayUnavailable(e.what());
    }
    if (head.status_code != 200) {
        ::close(fd);
        throw RelayUnavailable("subscribe answered " + std::to_string(head.status_code));
    }
    return std::make_unique<RemoteSubscription>(fd, head.body, channel);
}

uint64_t RemoteRelay::append(const std::string& channel, const Json::Value& fields,
                             size_t max_len) {
    Json::Value body;
    body["channel"] = channel;
    body["fields"] = fields;
    body["max_len"] = static_cast<Json::UInt64>(max_len);
    Json::Value out = call("/relay/append", body);
    if (!out["id"].isUInt64()) {
        throw RelayUnavailable("append returned no id");
    }
    return out["id"].asUInt64();
}

RelayBatch RemoteRelay::read(const RelayCursor& after, std::chrono::milliseconds block,
                             size_t max_count) {
    block = std::min(block, std::chrono::milliseconds(MAX_RELAY_READ_BLOCK_MS));

    Json::Value body;
    body["after"] = relay_protocol::cursor_to_json(after);
    body["block_ms"] = static_cast<Json::Int64>(block.count());
    body["count"] = static_cast<Json::UInt64>(max_count);
    return relay_protocol::batch_from_json(call("/relay/read", body, block)["entries"]);
}

void RemoteRelay::trim(const std::string& channel, size_t max_len) {
    Json::Value body;
    body["channel"] = channel;
    body["max_len"] = static_cast<Json::UInt64>(max_len);
    call("/relay/trim", body);
}

void RemoteRelay::remove(const std::vector<std::string>& channels) {
    Json::Value body;
    body["channels"] = Json::Value(Json::arrayValue);
    for (const auto& channel : channels) {
        body["channels"].append(channel);
    }
    call("/relay/delete", body);
}

bool RemoteRelay::ping() {
    try {
        HttpClientResponse resp = client_.request("GET", "/relay/ping", "", call_timeout_);
        return resp.status_code == 200;
    } catch (const std::exception& e) {
        std::cerr << "[Relay] Ping failed: " << e.what() << std::endl;
        return false;
    }
}

std::string RemoteRelay::describe() const {
    return "http://" + client_.host() + ":" + std::to_string(client_.port());
}

} // namespace agentrun
