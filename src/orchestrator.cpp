#include "orchestrator.h"
#include "log_watcher.h"
#include "errors.h"
#include "util.h"

#include <algorithm>
#include <iostream>
#include <thread>

namespace agentrun {

namespace {

constexpr std::chrono::milliseconds SUPERVISE_SLICE(DELIVERY_POLL_MS);
constexpr std::chrono::milliseconds SETTLE_POLL(500);
constexpr std::chrono::milliseconds HOUSEKEEPING_INTERVAL(1000);

// "https://host/owner/repo[.git]" with host on the allow list
bool valid_repo_url(const std::string& url, const std::vector<std::string>& hosts, std::string& reason) {
    const std::string scheme = "https://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        reason = "repo_url must be an https:// URL";
        return false;
    }
    for (char c : url) {
        if (static_cast<unsigned char>(c) <= 0x20 || c == 0x7f) {
            reason = "repo_url must not contain whitespace or control characters";
            return false;
        }
    }

    size_t host_end = url.find('/', scheme.size());
    if (host_end == std::string::npos || host_end + 1 >= url.size()) {
        reason = "repo_url must name a repository";
        return false;
    }
    std::string host = to_lower(url.substr(scheme.size(), host_end - scheme.size()));
    if (host.find('@') != std::string::npos) {
        reason = "repo_url must not carry credentials";
        return false;
    }
    size_t port = host.find(':');
    if (port != std::string::npos) {
        host = host.substr(0, port);
    }

    if (std::find(hosts.begin(), hosts.end(), host) == hosts.end()) {
        reason = "repository host " + host + " is not allowed";
        return false;
    }
    return true;
}

} // namespace

Orchestrator::Options Orchestrator::Options::from_config(const ServerConfig& config) {
    Options options;
    options.limits = config.limits;
    options.min_variations = config.min_variations;
    options.max_variations = config.max_variations;
    options.min_prompt_length = config.min_prompt_length;
    options.max_prompt_length = config.max_prompt_length;
    options.provision_attempts = config.provision_attempts;
    options.provision_backoff = std::chrono::milliseconds(config.provision_backoff_ms);
    options.max_concurrent_runs = config.max_concurrent_runs;
    options.max_concurrent_sandboxes = config.max_concurrent_sandboxes;
    options.allowed_git_hosts = config.allowed_git_hosts;
    options.status_settle = std::chrono::seconds(config.status_settle_seconds);
    options.close_grace = std::chrono::seconds(config.close_grace_seconds);
    options.stream_expiry = std::chrono::seconds(config.stream_expiry_seconds);
    return options;
}

Orchestrator::Orchestrator(SandboxBackend& backend, EventRelay& relay, EventPublisher& publisher,
                           RunStore& store, ConnectionRegistry& registry, Options options)
    : backend_(backend),
      relay_(relay),
      publisher_(publisher),
      store_(store),
      registry_(registry),
      options_(std::move(options)) {
    janitor_ = std::make_unique<BackgroundTask>("orchestrator housekeeping",
                                                [this](BackgroundTask& t) { housekeeping(t); });
}

Orchestrator::~Orchestrator() {
    shutdown();
}

// ============================================================================
// Admission
// ============================================================================

void Orchestrator::validate(const RunRequest& request) const {
    if (request.variations < options_.min_variations ||
        request.variations > options_.max_variations) {
        throw ValidationError("variations must be between " +
                              std::to_string(options_.min_variations) + " and " +
                              std::to_string(options_.max_variations));
    }

    std::string prompt = trim(request.prompt);
    if (prompt.size() < options_.min_prompt_length || prompt.empty()) {
        throw ValidationError("prompt must not be empty");
    }
    if (prompt.size() > options_.max_prompt_length) {
        throw ValidationError("prompt must be at most " +
                              std::to_string(options_.max_prompt_length) + " characters");
    }

    std::string reason;
    if (!valid_repo_url(request.repo_url, options_.allowed_git_hosts, reason)) {
        throw ValidationError(reason);
    }
}

Run Orchestrator::start_run(const RunRequest& request, const std::string& user_id) {
    validate(request);
    if (stopping_) {
        throw ValidationError("server is shutting down", 503);
    }

    auto active = std::make_shared<ActiveRun>();
    Run& run = active->run;
    run.id = generate_id("run_");
    run.user_id = user_id;
    run.repo_url = request.repo_url;
    run.prompt = trim(request.prompt);
    run.variation_count = request.variations;
    run.agent_config = request.agent_config.isNull() ? Json::Value(Json::objectValue)
                                                     : request.agent_config;
    run.created_at = Clock::now();
    for (int i = 0; i < request.variations; ++i) {
        Variation variation;
        variation.run_id = run.id;
        variation.index = i;
        run.variations.push_back(variation);
    }
    active->outcomes.assign(request.variations, VariationStatus::PENDING);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // shutdown() sets the flag before it snapshots active_ under this lock
        if (stopping_) {
            throw ValidationError("server is shutting down", 503);
        }
        size_t running = std::count_if(active_.begin(), active_.end(),
                                       [](const auto& entry) { return !entry.second->done; });
        if (running >= static_cast<size_t>(options_.max_concurrent_runs)) {
            throw ValidationError("too many active runs, try again later", 429);
        }
        if (reserved_sandboxes_ + request.variations >
            static_cast<size_t>(options_.max_concurrent_sandboxes)) {
            throw ValidationError("not enough sandbox capacity for " +
                                  std::to_string(request.variations) + " variations", 429);
        }

        store_.create(run);
        reserved_sandboxes_ += request.variations;
        active_[run.id] = active;

        // The task must not own its run: the run owns the task
        std::weak_ptr<ActiveRun> weak = active;
        active->supervisor = std::make_unique<BackgroundTask>(
            "run " + run.id, [this, weak](BackgroundTask& t) {
                if (auto self = weak.lock()) {
                    execute(self, t);
                }
            });
    }

    std::cout << "[Orchestrator] Run " << run.id << " accepted: " << run.variation_count
              << " variations of " << run.repo_url << " on " << backend_.name()
              << " for " << user_id << std::endl;
    return run;
}

// ============================================================================
// Execution
// ============================================================================

void Orchestrator::execute(const std::shared_ptr<ActiveRun>& active, BackgroundTask& task) {
    const std::string run_id = active->run.id;
    store_.update_status(run_id, RunStatus::RUNNING);

    ActiveRun* raw = active.get();
    active->control = std::make_unique<BackgroundTask>(
        "control " + run_id, [this, raw](BackgroundTask& t) { watch_control(*raw, t); });

    std::vector<std::unique_ptr<BackgroundTask>> variations;
    for (int i = 0; i < active->run.variation_count; ++i) {
        variations.push_back(std::make_unique<BackgroundTask>(
            "variation " + run_id + "/" + std::to_string(i),
            [this, raw, i](BackgroundTask& t) {
                VariationStatus status = run_variation(*raw, i, t);
                std::lock_guard<std::mutex> lock(raw->mutex);
                raw->outcomes[i] = status;
            }));
    }

    auto all_finished = [&variations]() {
        return std::all_of(variations.begin(), variations.end(),
                           [](const auto& v) { return v->finished(); });
    };
    while (!all_finished()) {
        if (!task.sleep_for(SUPERVISE_SLICE)) {
            cancel_local(*active, "server shutting down");
            break;
        }
    }
    for (auto& variation : variations) {
        variation->join();
    }
    variations.clear();

    active->control.reset();
    finish_run(*active);
}

VariationStatus Orchestrator::run_variation(ActiveRun& active, int index, BackgroundTask& task) {
    const std::string& run_id = active.run.id;
    SandboxHandle handle;
    VariationStatus status = VariationStatus::FAILED;
    std::string error;

    try {
        if (active.cancelled) {
            finish_variation(active, index, VariationStatus::CANCELLED, "");
            return VariationStatus::CANCELLED;
        }

        store_.update_variation(run_id, index, VariationStatus::PROVISIONING);
        handle = provision_with_retry(active, index, task);

        {
            std::lock_guard<std::mutex> lock(active.mutex);
            active.handles[index] = handle;
        }
        if (active.cancelled) {
            // Cancel raced with provisioning; cancel_local did not see this handle
            terminate_once(active, handle);
            finish_variation(active, index, VariationStatus::CANCELLED, "");
            return VariationStatus::CANCELLED;
        }

        store_.update_variation(run_id, index, VariationStatus::RUNNING, "", handle.id);
        Json::Value started;
        started["sandbox"] = handle.id;
        started["backend"] = backend_.name();
        publisher_.status_update(run_id, index, "variation_started", started);
        std::cout << "[Orchestrator] Run " << run_id << " variation " << index
                  << " running in " << handle.id << std::endl;

        auto stream = backend_.stream_output(handle);
        LogWatcher watcher(publisher_, run_id, index);
        LogWatcher::Result result = watcher.watch(*stream, active.cancelled);

        if (active.cancelled) {
            status = VariationStatus::CANCELLED;
        } else if (!result.errors.empty()) {
            status = VariationStatus::FAILED;
            error = result.errors.back();
        } else if (settled_success(handle, active)) {
            status = VariationStatus::COMPLETED;
        } else if (active.cancelled) {
            status = VariationStatus::CANCELLED;
        } else {
            error = "sandbox " + handle.id + " reported failure";
        }
    } catch (const ProvisionError& e) {
        error = e.what();
    } catch (const ExecutionError& e) {
        error = e.what();
    } catch (const TimeoutError& e) {
        error = e.what();
    } catch (const std::exception& e) {
        error = std::string("unexpected error: ") + e.what();
    }

    if (status == VariationStatus::FAILED && active.cancelled) {
        status = VariationStatus::CANCELLED;
        error.clear();
    }

    if (handle.valid()) {
        terminate_once(active, handle);
    }
    finish_variation(active, index, status, error);
    return status;
}

SandboxHandle Orchestrator::provision_with_retry(ActiveRun& active, int index, BackgroundTask& task) {
    const std::string& run_id = active.run.id;

    for (int attempt = 1;; ++attempt) {
        try {
            return backend_.provision(run_id, index, active.run.repo_url, active.run.prompt,
                                      options_.limits, active.run.agent_config);
        } catch (const ProvisionError& e) {
            if (!e.transient() || attempt >= options_.provision_attempts || active.cancelled) {
                throw;
            }
            std::cerr << "[Orchestrator] Run " << run_id << " variation " << index
                      << " provision attempt " << attempt << " failed, retrying: "
                      << e.what() << std::endl;
            if (!task.sleep_for(options_.provision_backoff)) {
                throw;
            }
        }
    }
}

bool Orchestrator::settled_success(const SandboxHandle& handle, const ActiveRun& active) {
    auto deadline = std::chrono::steady_clock::now() + options_.status_settle;

    while (!active.cancelled) {
        BackendStatus status;
        try {
            status = backend_.status(handle);
        } catch (const ExecutionError& e) {
            // Unknown state is never success; retry until the settle deadline
            if (std::chrono::steady_clock::now() >= deadline) {
                throw ExecutionError("status of " + handle.id + " unavailable: " + e.what());
            }
            std::cerr << "[Orchestrator] Status of " << handle.id << " unavailable, retrying: "
                      << e.what() << std::endl;
            std::this_thread::sleep_for(SETTLE_POLL);
            continue;
        }

        if (status == BackendStatus::SUCCEEDED) return true;
        if (status == BackendStatus::FAILED) return false;

        if (std::chrono::steady_clock::now() >= deadline) {
            std::cerr << "[Orchestrator] " << handle.id << " still " << to_string(status)
                      << " after its output ended; counting it as finished" << std::endl;
            return true;
        }
        std::this_thread::sleep_for(SETTLE_POLL);
    }
    return false;
}

void Orchestrator::finish_variation(ActiveRun& active, int index, VariationStatus status,
                                    const std::string& error) {
    const std::string& run_id = active.run.id;
    store_.update_variation(run_id, index, status, error);

    switch (status) {
        case VariationStatus::COMPLETED:
            publisher_.agent_complete(run_id, index);
            break;
        case VariationStatus::CANCELLED:
            publisher_.status_update(run_id, index, "cancelled");
            break;
        default:
            publisher_.agent_error(run_id, index, error.empty() ? "variation failed" : error);
            break;
    }

    std::cout << "[Orchestrator] Run " << run_id << " variation " << index << " "
              << to_string(status) << (error.empty() ? "" : ": " + error) << std::endl;
}

void Orchestrator::finish_run(ActiveRun& active) {
    const std::string& run_id = active.run.id;

    int completed = 0, failed = 0, cancelled = 0;
    {
        std::lock_guard<std::mutex> lock(active.mutex);
        for (VariationStatus status : active.outcomes) {
            if (status == VariationStatus::COMPLETED) completed++;
            else if (status == VariationStatus::CANCELLED) cancelled++;
            else failed++;
        }
    }

    RunStatus status;
    if (active.cancelled) {
        status = RunStatus::CANCELLED;
    } else {
        status = completed > 0 ? RunStatus::COMPLETED : RunStatus::FAILED;
    }

    store_.update_status(run_id, status);
    publisher_.run_complete(run_id, status, completed, failed, cancelled);
    registry_.close_run(run_id, options_.close_grace);
    publisher_.trim_run(run_id);

    std::cout << "[Orchestrator] Run " << run_id << " " << to_string(status) << ": "
              << completed << " completed, " << failed << " failed, " << cancelled
              << " cancelled" << std::endl;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        reserved_sandboxes_ -= std::min<size_t>(reserved_sandboxes_, active.run.variation_count);
        expiring_[run_id] = std::chrono::steady_clock::now() + options_.stream_expiry;
        active.done = true;
    }
    done_cv_.notify_all();
}

// ============================================================================
// Cancellation
// ============================================================================

bool Orchestrator::cancel_run(const std::string& run_id, const std::string& reason) {
    std::shared_ptr<ActiveRun> active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(run_id);
        if (it != active_.end()) {
            active = it->second;
        }
    }
    if (active) {
        if (!active->done) {
            cancel_local(*active, reason);
        }
        return true;
    }

    auto run = store_.get(run_id);
    if (!run) {
        return false;
    }
    if (is_terminal(run->status)) {
        return true;
    }

    // Executing in another process
    Json::Value command;
    command["control"] = "cancel";
    command["reason"] = reason;
    try {
        size_t reached = relay_.publish(control_channel_name(run_id), to_json(command));
        std::cout << "[Orchestrator] Forwarded cancel of run " << run_id << " to "
                  << reached << " host(s)" << std::endl;
    } catch (const RelayUnavailable& e) {
        std::cerr << "[Orchestrator] Could not forward cancel of run " << run_id << ": "
                  << e.what() << std::endl;
    }
    return true;
}

void Orchestrator::cancel_local(ActiveRun& active, const std::string& reason) {
    if (active.cancelled.exchange(true)) {
        return;
    }
    const std::string& run_id = active.run.id;
    std::cout << "[Orchestrator] Cancelling run " << run_id << ": " << reason << std::endl;

    Json::Value extra;
    extra["reason"] = reason;
    publisher_.status_update(run_id, -1, "cancelled", extra);

    std::vector<SandboxHandle> handles;
    {
        std::lock_guard<std::mutex> lock(active.mutex);
        active.cancel_reason = reason;
        for (const auto& entry : active.handles) {
            if (!active.terminated.count(entry.second.id)) {
                handles.push_back(entry.second);
            }
        }
    }

    // Tear sandboxes down concurrently; the variation tasks notice the flag
    std::vector<std::unique_ptr<BackgroundTask>> terminators;
    for (const auto& handle : handles) {
        ActiveRun* raw = &active;
        terminators.push_back(std::make_unique<BackgroundTask>(
            "terminate " + handle.id,
            [this, raw, handle](BackgroundTask&) { terminate_once(*raw, handle); }));
    }

    std::lock_guard<std::mutex> lock(active.mutex);
    for (auto& terminator : terminators) {
        active.terminators.push_back(std::move(terminator));
    }
}

void Orchestrator::terminate_once(ActiveRun& active, const SandboxHandle& handle) {
    {
        std::lock_guard<std::mutex> lock(active.mutex);
        if (!active.terminated.insert(handle.id).second) {
            return;
        }
    }

    try {
        backend_.terminate(handle);
        std::cout << "[Orchestrator] Terminated " << handle.id << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] Terminate of " << handle.id << " failed: "
                  << e.what() << std::endl;
    }
}

void Orchestrator::watch_control(ActiveRun& active, BackgroundTask& task) {
    const std::string channel = control_channel_name(active.run.id);
    std::unique_ptr<RelaySubscription> subscription;
    bool warned = false;

    while (!task.cancelled() && !active.done) {
        if (!subscription) {
            try {
                subscription = relay_.subscribe(channel);
                warned = false;
            } catch (const RelayUnavailable& e) {
                if (!warned) {
                    std::cerr << "[Orchestrator] Control channel " << channel
                              << " unavailable: " << e.what() << std::endl;
                    warned = true;
                }
                task.sleep_for(std::chrono::milliseconds(RELAY_READ_BLOCK_MS));
                continue;
            }
        }

        std::string message;
        try {
            if (!subscription->next(message, SUPERVISE_SLICE)) continue;
        } catch (const RelayUnavailable& e) {
            std::cerr << "[Orchestrator] Control channel " << channel << " lost: "
                      << e.what() << std::endl;
            subscription.reset();
            continue;
        }

        Json::Value command;
        if (parse_json(message, command) && command.isObject() &&
            command["control"].asString() == "cancel") {
            cancel_local(active, command.get("reason", "cancelled from another server").asString());
        }
    }

    if (subscription) {
        subscription->close();
    }
}

// ============================================================================
// Queries and lifecycle
// ============================================================================

Json::Value Orchestrator::run_details(const std::string& run_id) {
    auto run = store_.get(run_id);
    if (!run) {
        return Json::Value();
    }
    Json::Value details = run->to_json();

    std::shared_ptr<ActiveRun> active;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(run_id);
        if (it != active_.end()) {
            active = it->second;
        }
    }
    if (!active || active->done) {
        return details;
    }

    std::map<int, SandboxHandle> handles;
    {
        std::lock_guard<std::mutex> lock(active->mutex);
        for (const auto& entry : active->handles) {
            if (!active->terminated.count(entry.second.id)) {
                handles.insert(entry);
            }
        }
    }
    for (const auto& entry : handles) {
        std::string state;
        try {
            state = to_string(backend_.status(entry.second));
        } catch (const std::exception& e) {
            std::cerr << "[Orchestrator] Status of " << entry.second.id << " unavailable: "
                      << e.what() << std::endl;
            state = "unknown";
        }
        if (entry.first < static_cast<int>(details["variation_states"].size())) {
            details["variation_states"][entry.first]["backend_status"] = state;
        }
    }
    return details;
}

bool Orchestrator::wait_for_run(const std::string& run_id, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return done_cv_.wait_for(lock, timeout, [this, &run_id]() {
        auto it = active_.find(run_id);
        return it == active_.end() || it->second->done;
    });
}

void Orchestrator::shutdown() {
    if (stopping_.exchange(true)) {
        return;
    }

    std::vector<std::shared_ptr<ActiveRun>> runs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : active_) {
            runs.push_back(entry.second);
        }
    }

    if (!runs.empty()) {
        std::cout << "[Orchestrator] Shutting down " << runs.size() << " run(s)" << std::endl;
    }
    for (auto& active : runs) {
        if (!active->done) {
            cancel_local(*active, "server shutting down");
        }
    }
    for (auto& active : runs) {
        active->supervisor->join();
    }

    janitor_.reset();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.clear();
    }
    runs.clear();
}

void Orchestrator::housekeeping(BackgroundTask& task) {
    while (task.sleep_for(HOUSEKEEPING_INTERVAL)) {
        std::vector<std::shared_ptr<ActiveRun>> finished;
        std::vector<std::string> expired;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = active_.begin(); it != active_.end();) {
                if (it->second->done && it->second->supervisor->finished()) {
                    finished.push_back(it->second);
                    it = active_.erase(it);
                } else {
                    ++it;
                }
            }

            auto now = std::chrono::steady_clock::now();
            for (auto it = expiring_.begin(); it != expiring_.end();) {
                if (it->second <= now) {
                    expired.push_back(it->first);
                    it = expiring_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        // Joins the finished runs' tasks outside the lock
        finished.clear();

        for (const auto& run_id : expired) {
            if (publisher_.remove_run(run_id)) {
                std::cout << "[Orchestrator] Expired streams of run " << run_id << std::endl;
            }
        }
    }
}

size_t Orchestrator::active_runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(active_.begin(), active_.end(),
                         [](const auto& entry) { return !entry.second->done; });
}

size_t Orchestrator::reserved_sandboxes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_sandboxes_;
}

Json::Value Orchestrator::describe() const {
    Json::Value info;
    info["active_runs"] = static_cast<Json::UInt64>(active_runs());
    info["reserved_sandboxes"] = static_cast<Json::UInt64>(reserved_sandboxes());
    info["max_concurrent_runs"] = options_.max_concurrent_runs;
    info["max_concurrent_sandboxes"] = options_.max_concurrent_sandboxes;
    info["relay_failures"] = static_cast<Json::UInt64>(publisher_.failures());
    return info;
}

} // namespace agentrun
