#pragma once

#include "event_relay.h"
#include "http_client.h"

#include <chrono>

namespace agentrun {

// Client of agentrun-relayd. Every call is bounded by the call timeout
// (plus the requested block for reads) and raises RelayUnavailable.
class RemoteRelay : public EventRelay {
public:
    RemoteRelay(HttpClient client, std::chrono::milliseconds call_timeout);

    size_t publish(const std::string& channel, const std::string& message) override;
    std::unique_ptr<RelaySubscription> subscribe(const std::string& channel) override;

    uint64_t append(const std::string& channel, const Json::Value& fields,
                    size_t max_len) override;
    RelayBatch read(const RelayCursor& after, std::chrono::milliseconds block,
                    size_t max_count) override;
    void trim(const std::string& channel, size_t max_len) override;
    void remove(const std::vector<std::string>& channels) override;

    bool ping() override;
    std::string describe() const override;

private:
    Json::Value call(const std::string& path, const Json::Value& body,
                     std::chrono::milliseconds extra = std::chrono::milliseconds(0));

    HttpClient client_;
    std::chrono::milliseconds call_timeout_;
};

} // namespace agentrun
