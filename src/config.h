#pragma once

#include "sandbox_backend.h"
#include "constants.h"

#include <json/json.h>

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace agentrun {

struct LocalContainerSettings {
    std::string image_name = "agent-base";
    std::string image_setup_script;                     // Run once in the base image
    std::string cache_dir = "/tmp/agentrun_images";
    std::vector<std::string> entrypoint = {"agent-entrypoint"};
    std::string git = "git";
    bool isolate = true;                                // Namespaces + syscall filter
    bool allow_network = true;                          // Agents call model APIs
    int workspace_max_age_hours = 24;
};

struct ClusterJobSettings {
    std::string kubectl = "kubectl";
    std::string namespace_name = "default";
    std::string image = "agentrun-agent:latest";
    std::string service_account;
    int job_ttl_seconds = 3600;
};

struct ModuleCallSettings {
    std::string cli = "dagger";
    std::vector<std::string> args = {"call", "-m", "./agent-module", "run-agent"};
    std::string payload_dir = "/tmp/agentrun_payloads";
};

struct ServerConfig {
    // Server
    int port = DEFAULT_PORT;

    // Backend
    std::string backend = "local-container";
    LocalContainerSettings local;
    ClusterJobSettings cluster;
    ModuleCallSettings module;
    std::string error_prefix = "ERROR:";                // Backend error marker lines

    // Limits and timeouts handed to every sandbox
    ResourceLimits limits;
    int control_call_timeout_seconds = DEFAULT_CONTROL_CALL_TIMEOUT_SECONDS;
    int status_settle_seconds = DEFAULT_STATUS_SETTLE_SECONDS;
    int terminate_grace_ms = DEFAULT_TERMINATE_GRACE_MS;

    // Orchestrator
    int min_variations = DEFAULT_MIN_VARIATIONS;
    int max_variations = DEFAULT_MAX_VARIATIONS;
    size_t min_prompt_length = DEFAULT_MIN_PROMPT_LENGTH;
    size_t max_prompt_length = DEFAULT_MAX_PROMPT_LENGTH;
    int provision_attempts = DEFAULT_PROVISION_ATTEMPTS;
    int provision_backoff_ms = DEFAULT_PROVISION_BACKOFF_MS;
    int max_concurrent_runs = DEFAULT_MAX_CONCURRENT_RUNS;
    int max_concurrent_sandboxes = DEFAULT_MAX_CONCURRENT_SANDBOXES;
    std::vector<std::string> allowed_git_hosts = {"github.com"};

    // Relay: "memory" or http://host:port of agentrun-relayd
    std::string relay_url = "memory";
    int relay_call_timeout_ms = DEFAULT_RELAY_CALL_TIMEOUT_MS;
    size_t stream_retention = DEFAULT_STREAM_RETENTION;
    bool fanout_enabled = true;
    int stream_expiry_seconds = DEFAULT_STREAM_EXPIRY_SECONDS;

    // Delivery
    int heartbeat_interval_seconds = DEFAULT_HEARTBEAT_INTERVAL_SECONDS;
    size_t queue_capacity = DEFAULT_CONNECTION_QUEUE_CAPACITY;
    int close_grace_seconds = DEFAULT_CLOSE_GRACE_SECONDS;

    // Auth: empty means development mode
    std::vector<std::string> api_keys;

    // Injected into sandboxes as variables, never logged
    std::map<std::string, std::string> secrets;

    // Defaults, then --config file, then AGENTRUN_* variables, then flags.
    // Throws ConfigError.
    static ServerConfig load(int argc, char* argv[]);

    void apply_json(const Json::Value& root);
    void apply_environment();
    void apply_arguments(int argc, char* argv[]);

    void validate() const;

    std::chrono::seconds control_call_timeout() const {
        return std::chrono::seconds(control_call_timeout_seconds);
    }
};

// Reads and parses a JSON config file; throws ConfigError
Json::Value read_config_file(const std::string& path);

} // namespace agentrun
