#pragma once

#include "sandbox_backend.h"
#include "config.h"
#include "image_cache.h"
#include "process_table.h"
#include "sandbox_isolation.h"
#include "sandbox_payload.h"

#include <memory>
#include <string>

namespace agentrun {

// Runs each variation as an isolated child process in a copy of a base
// image directory built once per process.
class LocalContainerBackend : public SandboxBackend {
public:
    LocalContainerBackend(const LocalContainerSettings& settings, const BackendOptions& options);
    ~LocalContainerBackend() override;

    SandboxHandle provision(const std::string& run_id,
                            int variation_id,
                            const std::string& repo_url,
                            const std::string& prompt,
                            const ResourceLimits& limits,
                            const Json::Value& agent_config) override;

    std::unique_ptr<OutputStream> stream_output(const SandboxHandle& handle) override;
    BackendStatus status(const SandboxHandle& handle) override;
    void terminate(const SandboxHandle& handle) override;

    std::string name() const override { return "local-container"; }
    Json::Value describe() const override;

    ImageCache& image_cache() { return images_; }

private:
    void clone_repository(const std::string& repo_url, const std::string& target,
                          std::chrono::seconds timeout);

    LocalContainerSettings settings_;
    BackendOptions options_;
    ImageCache images_;
    ProcessTable processes_;
    bool namespaces_ = false;
};

} // namespace agentrun
