#include "models.h"
#include "errors.h"
#include "util.h"

#include <stdexcept>

namespace agentrun {

std::string to_string(RunStatus status) {
    switch (status) {
        case RunStatus::PENDING: return "pending";
        case RunStatus::RUNNING: return "running";
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::FAILED: return "failed";
        case RunStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string to_string(VariationStatus status) {
    switch (status) {
        case VariationStatus::PENDING: return "pending";
        case VariationStatus::PROVISIONING: return "provisioning";
        case VariationStatus::RUNNING: return "running";
        case VariationStatus::COMPLETED: return "completed";
        case VariationStatus::FAILED: return "failed";
        case VariationStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string to_string(Channel channel) {
    switch (channel) {
        case Channel::OUTPUT: return "output";
        case Channel::LOG: return "log";
        case Channel::STATUS: return "status";
    }
    return "unknown";
}

RunStatus run_status_from_string(const std::string& name) {
    if (name == "pending") return RunStatus::PENDING;
    if (name == "running") return RunStatus::RUNNING;
    if (name == "completed") return RunStatus::COMPLETED;
    if (name == "failed") return RunStatus::FAILED;
    if (name == "cancelled") return RunStatus::CANCELLED;
    throw std::invalid_argument("Unknown run status: " + name);
}

VariationStatus variation_status_from_string(const std::string& name) {
    if (name == "pending") return VariationStatus::PENDING;
    if (name == "provisioning") return VariationStatus::PROVISIONING;
    if (name == "running") return VariationStatus::RUNNING;
    if (name == "completed") return VariationStatus::COMPLETED;
    if (name == "failed") return VariationStatus::FAILED;
    if (name == "cancelled") return VariationStatus::CANCELLED;
    throw std::invalid_argument("Unknown variation status: " + name);
}

Channel channel_from_string(const std::string& name) {
    if (name == "output") return Channel::OUTPUT;
    if (name == "log") return Channel::LOG;
    if (name == "status") return Channel::STATUS;
    throw std::invalid_argument("Unknown channel: " + name);
}

bool is_terminal(RunStatus status) {
    return status == RunStatus::COMPLETED || status == RunStatus::FAILED ||
           status == RunStatus::CANCELLED;
}

bool is_terminal(VariationStatus status) {
    return status == VariationStatus::COMPLETED || status == VariationStatus::FAILED ||
           status == VariationStatus::CANCELLED;
}

namespace {

int rank(VariationStatus status) {
    switch (status) {
        case VariationStatus::PENDING: return 0;
        case VariationStatus::PROVISIONING: return 1;
        case VariationStatus::RUNNING: return 2;
        default: return 3;
    }
}

int rank(RunStatus status) {
    switch (status) {
        case RunStatus::PENDING: return 0;
        case RunStatus::RUNNING: return 1;
        default: return 2;
    }
}

Json::Value optional_time(const std::optional<Clock::time_point>& tp) {
    return tp ? Json::Value(format_timestamp(*tp)) : Json::Value(Json::nullValue);
}

} // namespace

bool can_transition(VariationStatus from, VariationStatus to) {
    if (is_terminal(from)) return false;
    return rank(to) > rank(from);
}

bool can_transition(RunStatus from, RunStatus to) {
    if (is_terminal(from)) return false;
    return rank(to) > rank(from);
}

Json::Value Variation::to_json() const {
    Json::Value json;
    json["variation_id"] = index;
    json["status"] = to_string(status);
    json["sandbox_handle"] = sandbox_handle;
    json["started_at"] = optional_time(started_at);
    json["ended_at"] = optional_time(ended_at);
    json["error"] = error.empty() ? Json::Value(Json::nullValue) : Json::Value(error);
    return json;
}

Json::Value Run::to_json(bool include_prompt) const {
    Json::Value json;
    json["run_id"] = id;
    json["user_id"] = user_id;
    json["repo_url"] = repo_url;
    if (include_prompt) {
        json["prompt"] = prompt;
    }
    json["variations"] = variation_count;
    json["status"] = to_string(status);
    json["created_at"] = format_timestamp(created_at);
    json["started_at"] = optional_time(started_at);
    json["completed_at"] = optional_time(completed_at);

    Json::Value list(Json::arrayValue);
    for (const auto& v : variations) {
        list.append(v.to_json());
    }
    json["variation_states"] = list;
    return json;
}

RunRequest RunRequest::from_json(const Json::Value& body) {
    if (!body.isObject()) {
        throw ValidationError("Request body must be a JSON object", 400);
    }

    RunRequest req;
    // "github_url" is accepted for compatibility with existing clients
    const Json::Value& repo = body.isMember("repo_url") ? body["repo_url"] : body["github_url"];
    if (!repo.isString()) {
        throw ValidationError("repo_url is required");
    }
    req.repo_url = repo.asString();

    if (!body["prompt"].isString()) {
        throw ValidationError("prompt is required");
    }
    req.prompt = body["prompt"].asString();

    if (body.isMember("variations")) {
        if (!body["variations"].isInt()) {
            throw ValidationError("variations must be an integer");
        }
        req.variations = body["variations"].asInt();
    }

    if (body.isMember("agent_config")) {
        if (!body["agent_config"].isObject()) {
            throw ValidationError("agent_config must be an object");
        }
        req.agent_config = body["agent_config"];
    }
    return req;
}

Json::Value Event::to_fields() const {
    Json::Value fields;
    fields["type"] = type;
    fields["variation_id"] = variation_id;
    fields["data"] = payload;
    fields["timestamp"] = timestamp;
    return fields;
}

Event Event::from_fields(const std::string& run_id, Channel channel,
                         uint64_t message_id, const Json::Value& fields) {
    Event event;
    event.run_id = run_id;
    event.channel = channel;
    event.message_id = message_id;
    event.type = fields.get("type", "").asString();
    event.variation_id = fields.get("variation_id", -1).asInt();
    event.payload = fields["data"];
    event.timestamp = fields.get("timestamp", "").asString();
    return event;
}

std::string channel_name(const std::string& run_id, Channel channel) {
    return "run:" + run_id + ":" + to_string(channel);
}

std::string control_channel_name(const std::string& run_id) {
    return "run:" + run_id + ":control";
}

} // namespace agentrun
