#include "config.h"
#include "errors.h"
#include "util.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace agentrun {

namespace {

std::vector<std::string> string_list(const Json::Value& value, const std::string& key) {
    if (!value.isArray()) {
        throw ConfigError(key + " must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.isString()) {
            throw ConfigError(key + " must be an array of strings");
        }
        out.push_back(item.asString());
    }
    return out;
}

// Comma separated, blanks dropped
std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

int parse_int(const std::string& text, const std::string& key) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) throw std::invalid_argument(text);
        return value;
    } catch (const std::exception&) {
        throw ConfigError(key + " must be an integer, got '" + text + "'");
    }
}

bool parse_bool(const std::string& text) {
    std::string v = to_lower(trim(text));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

template <typename T>
void read_int(const Json::Value& section, const char* key, T& out) {
    if (!section.isMember(key)) return;
    if (!section[key].isIntegral()) {
        throw ConfigError(std::string(key) + " must be an integer");
    }
    out = static_cast<T>(section[key].asInt64());
}

void read_string(const Json::Value& section, const char* key, std::string& out) {
    if (!section.isMember(key)) return;
    if (!section[key].isString()) {
        throw ConfigError(std::string(key) + " must be a string");
    }
    out = section[key].asString();
}

void read_bool(const Json::Value& section, const char* key, bool& out) {
    if (!section.isMember(key)) return;
    if (!section[key].isBool()) {
        throw ConfigError(std::string(key) + " must be a boolean");
    }
    out = section[key].asBool();
}

void read_seconds(const Json::Value& section, const char* key, std::chrono::seconds& out) {
    long long seconds = out.count();
    read_int(section, key, seconds);
    out = std::chrono::seconds(seconds);
}

} // namespace

Json::Value read_config_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open config file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Json::Value root;
    if (!parse_json(buffer.str(), root) || !root.isObject()) {
        throw ConfigError("config file " + path + " is not a JSON object");
    }
    return root;
}

void ServerConfig::apply_json(const Json::Value& root) {
    const Json::Value& server = root["server"];
    read_int(server, "port", port);

    const Json::Value& b = root["backend"];
    read_string(b, "type", backend);
    read_string(b, "error_prefix", error_prefix);

    const Json::Value& lc = b["local_container"];
    read_string(lc, "image_name", local.image_name);
    read_string(lc, "image_setup_script", local.image_setup_script);
    read_string(lc, "cache_dir", local.cache_dir);
    read_string(lc, "git", local.git);
    read_bool(lc, "isolate", local.isolate);
    read_bool(lc, "allow_network", local.allow_network);
    read_int(lc, "workspace_max_age_hours", local.workspace_max_age_hours);
    if (lc.isMember("entrypoint")) {
        local.entrypoint = string_list(lc["entrypoint"], "entrypoint");
    }

    const Json::Value& cj = b["cluster_job"];
    read_string(cj, "kubectl", cluster.kubectl);
    read_string(cj, "namespace", cluster.namespace_name);
    read_string(cj, "image", cluster.image);
    read_string(cj, "service_account", cluster.service_account);
    read_int(cj, "job_ttl_seconds", cluster.job_ttl_seconds);

    const Json::Value& mc = b["module_call"];
    read_string(mc, "cli", module.cli);
    read_string(mc, "payload_dir", module.payload_dir);
    if (mc.isMember("args")) {
        module.args = string_list(mc["args"], "args");
    }

    const Json::Value& l = root["limits"];
    read_int(l, "memory_mb", limits.memory_mb);
    if (l.isMember("cpu_cores")) {
        if (!l["cpu_cores"].isNumeric()) throw ConfigError("cpu_cores must be a number");
        limits.cpu_cores = l["cpu_cores"].asDouble();
    }
    read_int(l, "cpu_time_sec", limits.cpu_time_sec);
    read_int(l, "max_processes", limits.max_processes);
    read_int(l, "max_open_files", limits.max_open_files);
    read_int(l, "max_file_size_mb", limits.max_file_size_mb);

    const Json::Value& t = root["timeouts"];
    read_seconds(t, "setup_seconds", limits.setup_timeout);
    read_seconds(t, "execution_seconds", limits.execution_timeout);
    read_int(t, "control_call_seconds", control_call_timeout_seconds);
    read_int(t, "status_settle_seconds", status_settle_seconds);
    read_int(t, "terminate_grace_ms", terminate_grace_ms);

    const Json::Value& o = root["orchestrator"];
    read_int(o, "min_variations", min_variations);
    read_int(o, "max_variations", max_variations);
    read_int(o, "min_prompt_length", min_prompt_length);
    read_int(o, "max_prompt_length", max_prompt_length);
    read_int(o, "provision_attempts", provision_attempts);
    read_int(o, "provision_backoff_ms", provision_backoff_ms);
    read_int(o, "max_concurrent_runs", max_concurrent_runs);
    read_int(o, "max_concurrent_sandboxes", max_concurrent_sandboxes);
    if (o.isMember("allowed_git_hosts")) {
        allowed_git_hosts = string_list(o["allowed_git_hosts"], "allowed_git_hosts");
    }

    const Json::Value& r = root["relay"];
    read_string(r, "url", relay_url);
    read_int(r, "call_timeout_ms", relay_call_timeout_ms);
    read_int(r, "retention", stream_retention);
    read_bool(r, "fanout", fanout_enabled);
    read_int(r, "expiry_seconds", stream_expiry_seconds);

    const Json::Value& d = root["delivery"];
    read_int(d, "heartbeat_interval_seconds", heartbeat_interval_seconds);
    read_int(d, "queue_capacity", queue_capacity);
    read_int(d, "close_grace_seconds", close_grace_seconds);

    const Json::Value& auth = root["auth"];
    if (auth.isMember("api_keys")) {
        api_keys = string_list(auth["api_keys"], "api_keys");
    }

    const Json::Value& secret_section = root["secrets"];
    if (!secret_section.isNull()) {
        if (!secret_section.isObject()) throw ConfigError("secrets must be an object");
        for (const auto& name : secret_section.getMemberNames()) {
            if (!secret_section[name].isString()) {
                throw ConfigError("secret " + name + " must be a string");
            }
            secrets[name] = secret_section[name].asString();
        }
    }
}

void ServerConfig::apply_environment() {
    if (const char* v = env("AGENTRUN_PORT")) port = parse_int(v, "AGENTRUN_PORT");
    if (const char* v = env("AGENTRUN_BACKEND")) backend = v;
    if (const char* v = env("AGENTRUN_RELAY_URL")) relay_url = v;
    if (const char* v = env("AGENTRUN_API_KEYS")) api_keys = split_list(v);
    if (const char* v = env("AGENTRUN_NAMESPACE")) cluster.namespace_name = v;
    if (const char* v = env("AGENTRUN_AGENT_IMAGE")) cluster.image = v;
    if (const char* v = env("AGENTRUN_KUBECTL")) cluster.kubectl = v;
    if (const char* v = env("AGENTRUN_MODULE_CLI")) module.cli = v;
    if (const char* v = env("AGENTRUN_ALLOWED_GIT_HOSTS")) allowed_git_hosts = split_list(v);
    if (const char* v = env("AGENTRUN_MAX_VARIATIONS")) {
        max_variations = parse_int(v, "AGENTRUN_MAX_VARIATIONS");
    }
    if (const char* v = env("AGENTRUN_MAX_CONCURRENT_RUNS")) {
        max_concurrent_runs = parse_int(v, "AGENTRUN_MAX_CONCURRENT_RUNS");
    }
    if (const char* v = env("AGENTRUN_HEARTBEAT_SECONDS")) {
        heartbeat_interval_seconds = parse_int(v, "AGENTRUN_HEARTBEAT_SECONDS");
    }
    if (const char* v = env("AGENTRUN_FANOUT")) fanout_enabled = parse_bool(v);

    // Well-known model credentials are forwarded when present
    for (const char* name : {"ANTHROPIC_API_KEY", "OPENAI_API_KEY", "GITHUB_TOKEN"}) {
        if (const char* v = env(name)) secrets[name] = v;
    }
}

void ServerConfig::apply_arguments(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--port" && has_value) {
            port = parse_int(argv[++i], "--port");
        } else if (arg == "--backend" && has_value) {
            backend = argv[++i];
        } else if (arg == "--relay" && has_value) {
            relay_url = argv[++i];
        } else if (arg == "--config" && has_value) {
            ++i;    // Already applied by load()
        } else {
            throw ConfigError("unknown argument " + arg);
        }
    }
}

void ServerConfig::validate() const {
    if (port <= 0 || port > 65535) {
        throw ConfigError("port out of range: " + std::to_string(port));
    }
    if (backend != "local-container" && backend != "cluster-job" && backend != "module-call") {
        throw ConfigError("unknown backend '" + backend +
                          "' (expected local-container, cluster-job or module-call)");
    }
    if (backend == "local-container" && local.entrypoint.empty()) {
        throw ConfigError("local_container.entrypoint is empty");
    }
    if (min_variations < 1 || max_variations < min_variations) {
        throw ConfigError("variation bounds must satisfy 1 <= min <= max");
    }
    if (min_prompt_length < 1 || max_prompt_length < min_prompt_length) {
        throw ConfigError("prompt bounds must satisfy 1 <= min <= max");
    }
    if (provision_attempts < 1 || provision_backoff_ms < 0) {
        throw ConfigError("provision_attempts must be >= 1 and backoff >= 0");
    }
    if (max_concurrent_runs < 1 || max_concurrent_sandboxes < max_variations) {
        throw ConfigError("max_concurrent_sandboxes must allow at least one full run");
    }
    if (limits.setup_timeout.count() <= 0 || limits.execution_timeout.count() <= 0 ||
        control_call_timeout_seconds <= 0 || status_settle_seconds < 0) {
        throw ConfigError("timeouts must be positive");
    }
    if (relay_url != "memory" && relay_url.rfind("http://", 0) != 0) {
        throw ConfigError("relay url must be 'memory' or http://host:port");
    }
    if (relay_call_timeout_ms <= 0 || stream_retention == 0) {
        throw ConfigError("relay call timeout and retention must be positive");
    }
    if (heartbeat_interval_seconds <= 0 || queue_capacity == 0 || close_grace_seconds < 0) {
        throw ConfigError("delivery settings must be positive");
    }
    if (allowed_git_hosts.empty()) {
        throw ConfigError("allowed_git_hosts is empty");
    }
}

ServerConfig ServerConfig::load(int argc, char* argv[]) {
    ServerConfig config;

    for (int i = 1; i + 1 < argc; i++) {
        if (std::string(argv[i]) == "--config") {
            std::string path = argv[i + 1];
            config.apply_json(read_config_file(path));
            std::cout << "[Config] Loaded " << path << std::endl;
        }
    }

    config.apply_environment();
    config.apply_arguments(argc, argv);
    config.validate();
    return config;
}

} // namespace agentrun
