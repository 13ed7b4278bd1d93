#pragma once

#include "event_relay.h"
#include "models.h"

#include <atomic>
#include <optional>
#include <string>

namespace agentrun {

// Turns run events into relay writes: a durable append on
// run:{id}:{channel} followed by a best-effort fan-out publish of the same
// entry. A relay failure is logged and counted, never thrown.
class EventPublisher {
public:
    EventPublisher(EventRelay& relay, size_t retention, bool fanout = true);

    // Assigns message_id and timestamp. Empty when the relay is unavailable.
    std::optional<uint64_t> publish(Event& event);

    std::optional<uint64_t> agent_output(const std::string& run_id, int variation_id,
                                         const std::string& content);
    std::optional<uint64_t> agent_log(const std::string& run_id, int variation_id,
                                      const Json::Value& record);
    std::optional<uint64_t> agent_error(const std::string& run_id, int variation_id,
                                        const std::string& error);
    std::optional<uint64_t> agent_complete(const std::string& run_id, int variation_id);
    std::optional<uint64_t> status_update(const std::string& run_id, int variation_id,
                                          const std::string& status,
                                          const Json::Value& extra = Json::Value());
    std::optional<uint64_t> run_complete(const std::string& run_id, RunStatus status,
                                         int completed, int failed, int cancelled);

    // Trim a finished run's channels to the retention window
    void trim_run(const std::string& run_id);

    // Delete a run's channels; false when the relay is unavailable
    bool remove_run(const std::string& run_id);

    // Channel an event type travels on
    static Channel channel_for(const std::string& type);

    uint64_t failures() const { return failures_; }
    EventRelay& relay() { return relay_; }

private:
    EventRelay& relay_;
    size_t retention_;
    bool fanout_;
    std::atomic<uint64_t> failures_{0};
};

} // namespace agentrun
