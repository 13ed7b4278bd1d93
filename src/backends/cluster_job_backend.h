#pragma once

#include "sandbox_backend.h"
#include "config.h"
#include "process.h"
#include "sandbox_payload.h"

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace agentrun {

// Runs each variation as a Kubernetes Job driven through kubectl.
// The prompt, agent config and secrets travel in a per-job Secret.
class ClusterJobBackend : public SandboxBackend {
public:
    ClusterJobBackend(const ClusterJobSettings& settings, const BackendOptions& options);

    SandboxHandle provision(const std::string& run_id,
                            int variation_id,
                            const std::string& repo_url,
                            const std::string& prompt,
                            const ResourceLimits& limits,
                            const Json::Value& agent_config) override;

    std::unique_ptr<OutputStream> stream_output(const SandboxHandle& handle) override;
    BackendStatus status(const SandboxHandle& handle) override;
    void terminate(const SandboxHandle& handle) override;

    std::string name() const override { return "cluster-job"; }
    Json::Value describe() const override;

    // Job + Secret as one kubectl List
    Json::Value build_manifest(const std::string& job_name,
                               const SandboxPayload& payload,
                               const ResourceLimits& limits) const;

    static std::string job_name(const std::string& run_id, int variation_id);

    // Stderr of a failed kubectl call that is worth retrying
    static bool is_transient_failure(const std::string& stderr_text);

    // Job status counts -> state
    static BackendStatus status_from_job(const Json::Value& job);

private:
    // Callers check the exit code; throws TimeoutError past the deadline
    CommandResult kubectl(const std::vector<std::string>& args,
                          std::chrono::seconds timeout) const;

    // Best-effort terminate for provision failure paths; logs instead of throwing
    void discard(const SandboxHandle& handle);

    ClusterJobSettings settings_;
    BackendOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, std::chrono::steady_clock::time_point> deadlines_;
};

} // namespace agentrun
