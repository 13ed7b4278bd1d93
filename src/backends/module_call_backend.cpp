#include "module_call_backend.h"
#include "process_output_stream.h"
#include "errors.h"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace agentrun {

ModuleCallBackend::ModuleCallBackend(const ModuleCallSettings& settings,
                                     const BackendOptions& options)
    : settings_(settings), options_(options), processes_(options.record_retention) {
    std::error_code ec;
    fs::create_directories(settings_.payload_dir, ec);
    if (ec) {
        std::cerr << "[ModuleCall] Warning: cannot create " << settings_.payload_dir
                  << ": " << ec.message() << std::endl;
    }
}

SandboxHandle ModuleCallBackend::provision(const std::string& run_id,
                                           int variation_id,
                                           const std::string& repo_url,
                                           const std::string& prompt,
                                           const ResourceLimits& limits,
                                           const Json::Value& agent_config) {
    std::string key = run_id + "/" + std::to_string(variation_id);
    {
        auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = invoked_.begin(); it != invoked_.end();) {
            if (now - it->second >= options_.record_retention) {
                it = invoked_.erase(it);
            } else {
                ++it;
            }
        }
        if (!invoked_.emplace(key, now).second) {
            throw ProvisionError("module already invoked for " + key);
        }
    }

    SandboxHandle handle;
    handle.id = sanitize_name("module-" + run_id + "-" + std::to_string(variation_id), 96);
    handle.run_id = run_id;
    handle.variation_id = variation_id;

    std::string payload_dir = settings_.payload_dir + "/" + handle.id;
    SandboxPayload payload{run_id, variation_id, repo_url, prompt, agent_config};
    write_payload_files(payload_dir, payload);

    ProcessOptions options;
    options.argv = {settings_.cli};
    options.argv.insert(options.argv.end(), settings_.args.begin(), settings_.args.end());
    options.env = payload_environment(payload_dir, payload, options_);
    options.env["AGENT_MEMORY_MB"] = std::to_string(limits.memory_mb);
    options.env["AGENT_EXECUTION_TIMEOUT"] = std::to_string(limits.execution_timeout.count());

    SandboxProcess entry;
    try {
        entry.process = std::make_shared<Process>(options);
    } catch (const std::runtime_error& e) {
        std::error_code ec;
        fs::remove_all(payload_dir, ec);
        throw ProvisionError(settings_.cli + ": " + e.what());
    }

    auto now = std::chrono::steady_clock::now();
    entry.directory = payload_dir;
    entry.deadline = now + limits.setup_timeout + limits.execution_timeout;
    // Engine start, image pull and clone all happen before the first line
    entry.first_output_deadline = now + limits.setup_timeout;
    processes_.add(handle.id, std::move(entry));

    std::cout << "[ModuleCall] Invoked " << settings_.cli << " for " << handle.id << std::endl;
    return handle;
}

std::unique_ptr<OutputStream> ModuleCallBackend::stream_output(const SandboxHandle& handle) {
    auto entry = processes_.find(handle.id);
    if (!entry) {
        throw ExecutionError("no module call for " + handle.id);
    }

    ProcessOutputStream::Options options;
    options.label = "Module call";
    options.error_prefix = options_.error_prefix;
    options.deadline = entry->deadline;
    options.first_output_deadline = entry->first_output_deadline;
    options.terminate_grace = options_.terminate_grace;
    return std::make_unique<ProcessOutputStream>(entry->process, options);
}

BackendStatus ModuleCallBackend::status(const SandboxHandle& handle) {
    return processes_.status(handle.id);
}

void ModuleCallBackend::terminate(const SandboxHandle& handle) {
    auto entry = processes_.remove(handle.id, options_.terminate_grace);
    if (!entry) return;

    std::error_code ec;
    fs::remove_all(entry->directory, ec);
    std::cout << "[ModuleCall] Finished " << handle.id << std::endl;
}

Json::Value ModuleCallBackend::describe() const {
    Json::Value json;
    json["cli"] = settings_.cli;
    json["running"] = static_cast<Json::UInt64>(processes_.size());
    json["finished_records"] = static_cast<Json::UInt64>(processes_.finished_count());
    std::lock_guard<std::mutex> lock(mutex_);
    json["invoked_records"] = static_cast<Json::UInt64>(invoked_.size());
    return json;
}

} // namespace agentrun
