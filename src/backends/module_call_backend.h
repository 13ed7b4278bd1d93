#pragma once

#include "sandbox_backend.h"
#include "config.h"
#include "process_table.h"
#include "sandbox_payload.h"

#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace agentrun {

// Runs each variation as one call of an ephemeral module CLI (a container
// pipeline engine). No session is kept between calls and a variation is
// invoked at most once.
class ModuleCallBackend : public SandboxBackend {
public:
    ModuleCallBackend(const ModuleCallSettings& settings, const BackendOptions& options);

    SandboxHandle provision(const std::string& run_id,
                            int variation_id,
                            const std::string& repo_url,
                            const std::string& prompt,
                            const ResourceLimits& limits,
                            const Json::Value& agent_config) override;

    std::unique_ptr<OutputStream> stream_output(const SandboxHandle& handle) override;
    BackendStatus status(const SandboxHandle& handle) override;
    void terminate(const SandboxHandle& handle) override;

    std::string name() const override { return "module-call"; }
    Json::Value describe() const override;

private:
    ModuleCallSettings settings_;
    BackendOptions options_;
    ProcessTable processes_;

    mutable std::mutex mutex_;
    // run_id/variation already called, pruned after the record retention
    std::map<std::string, std::chrono::steady_clock::time_point> invoked_;
};

} // namespace agentrun
