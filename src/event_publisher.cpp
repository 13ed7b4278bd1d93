#include "event_publisher.h"
#include "errors.h"
#include "util.h"

#include <iostream>

namespace agentrun {

EventPublisher::EventPublisher(EventRelay& relay, size_t retention, bool fanout)
    : relay_(relay), retention_(retention), fanout_(fanout) {}

Channel EventPublisher::channel_for(const std::string& type) {
    if (type == "agent_output") return Channel::OUTPUT;
    if (type == "agent_log") return Channel::LOG;
    return Channel::STATUS;
}

std::optional<uint64_t> EventPublisher::publish(Event& event) {
    event.channel = channel_for(event.type);
    if (event.timestamp.empty()) {
        event.timestamp = now_timestamp();
    }
    const std::string channel = channel_name(event.run_id, event.channel);

    try {
        event.message_id = relay_.append(channel, event.to_fields(), retention_);
    } catch (const RelayUnavailable& e) {
        failures_++;
        std::cerr << "[Relay] Warning: dropped " << event.type << " for run " << event.run_id
                  << " variation " << event.variation_id << ": " << e.what() << std::endl;
        return std::nullopt;
    }

    if (fanout_) {
        Json::Value live = event.to_fields();
        live["id"] = static_cast<Json::UInt64>(event.message_id);
        try {
            relay_.publish(channel, to_json(live));
        } catch (const RelayUnavailable& e) {
            failures_++;
            std::cerr << "[Relay] Warning: fan-out of " << event.type << " for run "
                      << event.run_id << " failed: " << e.what() << std::endl;
        }
    }
    return event.message_id;
}

std::optional<uint64_t> EventPublisher::agent_output(const std::string& run_id, int variation_id,
                                                     const std::string& content) {
    Event event;
    event.run_id = run_id;
    event.variation_id = variation_id;
    event.type = "agent_output";
    event.timestamp = now_timestamp();
    event.payload["variation_id"] = variation_id;
    event.payload["content"] = content;
    event.payload["timestamp"] = event.timestamp;
    return publish(event);
}

std::optional<uint64_t> EventPublisher::agent_log(const std::string& run_id, int variation_id,
                                                  const Json::Value& record) {
    Event event;
    event.run_id = run_id;
    event.variation_id = variation_id;
    event.type = "agent_log";
    event.payload = record;
    event.payload["variation_id"] = variation_id;
    return publish(event);
}

std::optional<uint64_t> EventPublisher::agent_error(const std::string& run_id, int variation_id,
                                                    const std::string& error) {
    Event event;
    event.run_id = run_id;
    event.variation_id = variation_id;
    event.type = "agent_error";
    event.timestamp = now_timestamp();
    event.payload["variation_id"] = variation_id;
    event.payload["error"] = error;
    event.payload["timestamp"] = event.timestamp;
    return publish(event);
}

std::optional<uint64_t> EventPublisher::agent_complete(const std::string& run_id, int variation_id) {
    Event event;
    event.run_id = run_id;
    event.variation_id = variation_id;
    event.type = "agent_complete";
    event.timestamp = now_timestamp();
    event.payload["variation_id"] = variation_id;
    event.payload["status"] = "completed";
    event.payload["timestamp"] = event.timestamp;
    return publish(event);
}

std::optional<uint64_t> EventPublisher::status_update(const std::string& run_id, int variation_id,
                                                      const std::string& status,
                                                      const Json::Value& extra) {
    Event event;
    event.run_id = run_id;
    event.variation_id = variation_id;
    event.type = "status_update";
    event.timestamp = now_timestamp();
    if (extra.isObject()) {
        event.payload = extra;
    }
    event.payload["status"] = status;
    if (variation_id >= 0) {
        event.payload["variation_id"] = variation_id;
    }
    event.payload["timestamp"] = event.timestamp;
    return publish(event);
}

std::optional<uint64_t> EventPublisher::run_complete(const std::string& run_id, RunStatus status,
                                                     int completed, int failed, int cancelled) {
    Event event;
    event.run_id = run_id;
    event.type = "run_complete";
    event.timestamp = now_timestamp();
    event.payload["run_id"] = run_id;
    event.payload["status"] = to_string(status);
    event.payload["completed"] = completed;
    event.payload["failed"] = failed;
    event.payload["cancelled"] = cancelled;
    event.payload["timestamp"] = event.timestamp;
    return publish(event);
}

void EventPublisher::trim_run(const std::string& run_id) {
    for (Channel channel : {Channel::OUTPUT, Channel::LOG, Channel::STATUS}) {
        try {
            relay_.trim(channel_name(run_id, channel), retention_);
        } catch (const RelayUnavailable& e) {
            std::cerr << "[Relay] Warning: trim of run " << run_id << " failed: "
                      << e.what() << std::endl;
            return;
        }
    }
}

bool EventPublisher::remove_run(const std::string& run_id) {
    try {
        relay_.remove({channel_name(run_id, Channel::OUTPUT),
                       channel_name(run_id, Channel::LOG),
                       channel_name(run_id, Channel::STATUS)});
        return true;
    } catch (const RelayUnavailable& e) {
        std::cerr << "[Relay] Warning: cleanup of run " << run_id << " failed: "
                  << e.what() << std::endl;
        return false;
    }
}

} // namespace agentrun
