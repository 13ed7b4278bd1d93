#pragma once

#include "constants.h"

#include <json/json.h>

#include <chrono>
#include <map>
#include <string>

namespace agentrun {

// Settings every backend shares
struct BackendOptions {
    std::map<std::string, std::string> secrets;
    std::string error_prefix = "ERROR:";
    std::chrono::milliseconds terminate_grace{2000};
    std::chrono::seconds call_timeout{60};               // One control-plane call
    std::chrono::seconds record_retention{DEFAULT_RECORD_RETENTION_SECONDS};
};

// What a sandbox receives besides its command
struct SandboxPayload {
    std::string run_id;
    int variation_id = 0;
    std::string repo_url;
    std::string prompt;
    Json::Value agent_config;
};

// Writes prompt.txt, agent_config.json and repo_url.txt (mode 0600) into
// dir, creating it with mode 0700. Throws ProvisionError.
void write_payload_files(const std::string& dir, const SandboxPayload& payload);

// AGENT_* variables pointing at the payload files, plus the secrets
std::map<std::string, std::string> payload_environment(const std::string& dir,
                                                       const SandboxPayload& payload,
                                                       const BackendOptions& options);

// Lowercase, [a-z0-9-], at most max_length; usable as a DNS label
std::string sanitize_name(const std::string& name, size_t max_length = 63);

} // namespace agentrun
