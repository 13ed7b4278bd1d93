#include "local_container_backend.h"
#include "process_output_stream.h"
#include "errors.h"

#include <iostream>

namespace agentrun {

LocalContainerBackend::LocalContainerBackend(const LocalContainerSettings& settings,
                                             const BackendOptions& options)
    : settings_(settings), options_(options), images_(settings.cache_dir),
      processes_(options.record_retention) {
    ImageSpec spec;
    spec.name = settings_.image_name;
    spec.setup_script = settings_.image_setup_script;
    spec.max_age_hours = settings_.workspace_max_age_hours;
    images_.register_image(spec);

    if (settings_.isolate) {
        namespaces_ = SandboxIsolation::namespaces_supported();
        if (!namespaces_) {
            std::cerr << "[LocalContainer] Warning: namespaces unavailable, "
                      << "running with rlimits and syscall filter only" << std::endl;
        }
    }

    images_.sweep(std::chrono::hours(settings_.workspace_max_age_hours));
}

LocalContainerBackend::~LocalContainerBackend() = default;

void LocalContainerBackend::clone_repository(const std::string& repo_url,
                                             const std::string& target,
                                             std::chrono::seconds timeout) {
    ProcessOptions options;
    options.argv = {settings_.git, "clone", "--depth", "1", "--", repo_url, target};
    options.env["GIT_TERMINAL_PROMPT"] = "0";

    CommandResult result;
    try {
        result = Process::run(options, timeout);
    } catch (const TimeoutError& e) {
        throw ProvisionError(std::string("clone ") + e.what());
    } catch (const std::runtime_error& e) {
        throw ProvisionError(std::string("clone: ") + e.what());
    }
    if (result.exit_code != 0) {
        std::string detail = result.output.substr(0, 500);
        throw ProvisionError("git clone exited with code " +
                             std::to_string(result.exit_code) + ": " + detail);
    }
}

SandboxHandle LocalContainerBackend::provision(const std::string& run_id,
                                               int variation_id,
                                               const std::string& repo_url,
                                               const std::string& prompt,
                                               const ResourceLimits& limits,
                                               const Json::Value& agent_config) {
    SandboxHandle handle;
    handle.id = sanitize_name("local-" + run_id + "-" + std::to_string(variation_id), 96);
    handle.run_id = run_id;
    handle.variation_id = variation_id;

    auto started = std::chrono::steady_clock::now();
    std::string workspace = images_.prepare_workspace(settings_.image_name, handle.id,
                                                      limits.setup_timeout);
    try {
        std::string working_dir = workspace;
        if (!repo_url.empty()) {
            working_dir = workspace + "/repo";
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::steady_clock::now() - started);
            auto remaining = limits.setup_timeout - elapsed;
            if (remaining.count() <= 0) {
                throw ProvisionError("setup timeout exhausted before clone");
            }
            clone_repository(repo_url, working_dir, remaining);
        }

        SandboxPayload payload{run_id, variation_id, repo_url, prompt, agent_config};
        std::string payload_dir = workspace + "/.agent";
        write_payload_files(payload_dir, payload);

        IsolationPolicy policy;
        policy.limits = limits;
        policy.namespaces = settings_.isolate && namespaces_;
        policy.allow_network = settings_.allow_network;
        policy.syscall_filter = settings_.isolate;
        auto isolation = std::make_shared<SandboxIsolation>(policy);

        ProcessOptions options;
        options.argv = settings_.entrypoint;
        options.env = payload_environment(payload_dir, payload, options_);
        options.env["AGENT_WORKSPACE"] = working_dir;
        options.working_dir = working_dir;
        options.child_setup = [isolation]() { return isolation->apply_in_child(); };

        SandboxProcess entry;
        try {
            entry.process = std::make_shared<Process>(options);
        } catch (const std::runtime_error& e) {
            throw ProvisionError(std::string("entrypoint: ") + e.what());
        }
        entry.directory = workspace;
        entry.deadline = std::chrono::steady_clock::now() + limits.execution_timeout;
        processes_.add(handle.id, std::move(entry));
    } catch (const ProvisionError&) {
        images_.release_workspace(workspace);
        throw;
    }

    std::cout << "[LocalContainer] Started " << handle.id << std::endl;
    return handle;
}

std::unique_ptr<OutputStream> LocalContainerBackend::stream_output(const SandboxHandle& handle) {
    auto entry = processes_.find(handle.id);
    if (!entry) {
        throw ExecutionError("no running sandbox " + handle.id);
    }

    ProcessOutputStream::Options options;
    options.label = "Container";
    options.error_prefix = options_.error_prefix;
    options.deadline = entry->deadline;
    options.terminate_grace = options_.terminate_grace;
    return std::make_unique<ProcessOutputStream>(entry->process, options);
}

BackendStatus LocalContainerBackend::status(const SandboxHandle& handle) {
    return processes_.status(handle.id);
}

void LocalContainerBackend::terminate(const SandboxHandle& handle) {
    auto entry = processes_.remove(handle.id, options_.terminate_grace);
    if (!entry) return;

    images_.release_workspace(entry->directory);
    std::cout << "[LocalContainer] Removed " << handle.id << std::endl;
}

Json::Value LocalContainerBackend::describe() const {
    auto stats = images_.get_stats();
    Json::Value json;
    json["image"] = settings_.image_name;
    json["isolation"] = !settings_.isolate ? "none" : (namespaces_ ? "namespaces+seccomp" : "seccomp");
    json["cached_images"] = stats.cached_images;
    json["image_uses"] = stats.total_uses;
    json["live_workspaces"] = stats.live_workspaces;
    json["running"] = static_cast<Json::UInt64>(processes_.size());
    json["finished_records"] = static_cast<Json::UInt64>(processes_.finished_count());
    return json;
}

} // namespace agentrun
