#pragma once

#include "event_relay.h"

#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentrun {

// In-process relay. Serves single-process deployments, tests, and is the
// store behind agentrun-relayd.
class MemoryRelay : public EventRelay {
public:
    explicit MemoryRelay(size_t subscriber_queue_capacity = 1024);
    ~MemoryRelay() override;

    size_t publish(const std::string& channel, const std::string& message) override;
    std::unique_ptr<RelaySubscription> subscribe(const std::string& channel) override;

    uint64_t append(const std::string& channel, const Json::Value& fields,
                    size_t max_len) override;
    RelayBatch read(const RelayCursor& after, std::chrono::milliseconds block,
                    size_t max_count) override;
    void trim(const std::string& channel, size_t max_len) override;
    void remove(const std::vector<std::string>& channels) override;

    bool ping() override { return true; }
    std::string describe() const override { return "memory"; }

    // Wakes blocked readers and subscribers; later reads no longer block
    void shutdown();

    size_t channel_length(const std::string& channel) const;
    size_t subscriber_count(const std::string& channel) const;

    struct Subscriber;

private:
    struct Stream {
        uint64_t last_id = 0;
        std::deque<RelayEntry> entries;
    };

    RelayBatch collect(const RelayCursor& after, size_t max_count) const;

    size_t queue_capacity_;

    mutable std::mutex mutex_;
    std::condition_variable appended_;
    std::map<std::string, Stream> streams_;
    std::map<std::string, std::vector<std::weak_ptr<Subscriber>>> subscribers_;
    bool shutdown_ = false;
};

} // namespace agentrun
