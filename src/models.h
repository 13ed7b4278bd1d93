#pragma once

#include <json/json.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentrun {

using Clock = std::chrono::system_clock;

enum class RunStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED
};

enum class VariationStatus {
    PENDING,
    PROVISIONING,
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED
};

// Relay channels of one run: run:{id}:{channel}
enum class Channel {
    OUTPUT,
    LOG,
    STATUS
};

std::string to_string(RunStatus status);
std::string to_string(VariationStatus status);
std::string to_string(Channel channel);

// Throw std::invalid_argument on unknown names
RunStatus run_status_from_string(const std::string& name);
VariationStatus variation_status_from_string(const std::string& name);
Channel channel_from_string(const std::string& name);

bool is_terminal(RunStatus status);
bool is_terminal(VariationStatus status);

// Monotonic lifecycle: a variation only moves forward and never leaves a
// terminal state. Same-state "transitions" are rejected too.
bool can_transition(VariationStatus from, VariationStatus to);
bool can_transition(RunStatus from, RunStatus to);

struct Variation {
    std::string run_id;
    int index = 0;
    VariationStatus status = VariationStatus::PENDING;
    std::string sandbox_handle;
    std::optional<Clock::time_point> started_at;
    std::optional<Clock::time_point> ended_at;
    std::string error;

    Json::Value to_json() const;
};

struct Run {
    std::string id;
    std::string user_id;
    std::string repo_url;
    std::string prompt;
    int variation_count = 1;
    RunStatus status = RunStatus::PENDING;
    Json::Value agent_config;                 // Opaque, forwarded to sandboxes
    Clock::time_point created_at;
    std::optional<Clock::time_point> started_at;
    std::optional<Clock::time_point> completed_at;
    std::vector<Variation> variations;

    // Prompt is omitted unless asked for
    Json::Value to_json(bool include_prompt = false) const;
};

// Start-run request as received from a client
struct RunRequest {
    std::string repo_url;
    std::string prompt;
    int variations = 1;
    Json::Value agent_config;

    static RunRequest from_json(const Json::Value& body);
};

// One event on the wire between producers and the delivery layer
struct Event {
    std::string run_id;
    int variation_id = -1;                    // -1 for run-level events
    Channel channel = Channel::OUTPUT;
    std::string type;                         // agent_output, agent_log, ...
    Json::Value payload;
    uint64_t message_id = 0;                  // Per (run, channel); 0 = not yet assigned
    std::string timestamp;

    // Fields stored in the relay's durable stream
    Json::Value to_fields() const;
    static Event from_fields(const std::string& run_id, Channel channel,
                             uint64_t message_id, const Json::Value& fields);
};

// Relay channel naming
std::string channel_name(const std::string& run_id, Channel channel);
std::string control_channel_name(const std::string& run_id);

} // namespace agentrun
