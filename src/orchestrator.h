#pragma once

#include "sandbox_backend.h"
#include "event_relay.h"
#include "event_publisher.h"
#include "run_store.h"
#include "background_task.h"
#include "config.h"
#include "delivery/connection_registry.h"
#include "delivery/control_handler.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace agentrun {

// Runs N variations of one request in parallel, each in its own sandbox,
// and streams their output into the relay. A variation's failure is recorded
// at its own boundary and never touches its siblings.
class Orchestrator : public RunCanceller {
public:
    struct Options {
        ResourceLimits limits;
        int min_variations = DEFAULT_MIN_VARIATIONS;
        int max_variations = DEFAULT_MAX_VARIATIONS;
        size_t min_prompt_length = DEFAULT_MIN_PROMPT_LENGTH;
        size_t max_prompt_length = DEFAULT_MAX_PROMPT_LENGTH;
        int provision_attempts = DEFAULT_PROVISION_ATTEMPTS;
        std::chrono::milliseconds provision_backoff{DEFAULT_PROVISION_BACKOFF_MS};
        int max_concurrent_runs = DEFAULT_MAX_CONCURRENT_RUNS;
        int max_concurrent_sandboxes = DEFAULT_MAX_CONCURRENT_SANDBOXES;
        std::vector<std::string> allowed_git_hosts = {"github.com"};
        std::chrono::milliseconds status_settle{DEFAULT_STATUS_SETTLE_SECONDS * 1000};
        std::chrono::milliseconds close_grace{DEFAULT_CLOSE_GRACE_SECONDS * 1000};
        std::chrono::seconds stream_expiry{DEFAULT_STREAM_EXPIRY_SECONDS};

        static Options from_config(const ServerConfig& config);
    };

    Orchestrator(SandboxBackend& backend, EventRelay& relay, EventPublisher& publisher,
                 RunStore& store, ConnectionRegistry& registry, Options options);
    ~Orchestrator() override;

    // Rejects bad input with ValidationError before anything starts
    void validate(const RunRequest& request) const;

    // Validates, admits, records the run and starts it in the background.
    // Throws ValidationError (422 bad input, 429 over capacity).
    Run start_run(const RunRequest& request, const std::string& user_id);

    // Idempotent. Runs hosted by another process are cancelled through the
    // relay's control channel. False only for unknown runs.
    bool cancel_run(const std::string& run_id, const std::string& reason) override;

    // Run record plus live backend state of each sandbox; null when unknown
    Json::Value run_details(const std::string& run_id);

    // Blocks until the run is no longer executing here
    bool wait_for_run(const std::string& run_id, std::chrono::milliseconds timeout);

    // Cancel every active run and join all tasks
    void shutdown();

    size_t active_runs() const;
    size_t reserved_sandboxes() const;
    Json::Value describe() const;

private:
    struct ActiveRun {
        Run run;
        std::atomic<bool> cancelled{false};
        std::atomic<bool> done{false};
        std::string cancel_reason;

        std::mutex mutex;
        std::map<int, SandboxHandle> handles;            // Provisioned, by variation
        std::set<std::string> terminated;                // Handle ids already torn down
        std::vector<VariationStatus> outcomes;
        std::vector<std::unique_ptr<BackgroundTask>> terminators;

        std::unique_ptr<BackgroundTask> control;
        std::unique_ptr<BackgroundTask> supervisor;
    };

    void execute(const std::shared_ptr<ActiveRun>& active, BackgroundTask& task);
    VariationStatus run_variation(ActiveRun& active, int index, BackgroundTask& task);
    SandboxHandle provision_with_retry(ActiveRun& active, int index, BackgroundTask& task);
    bool settled_success(const SandboxHandle& handle, const ActiveRun& active);
    void finish_variation(ActiveRun& active, int index, VariationStatus status,
                          const std::string& error);
    void finish_run(ActiveRun& active);

    void cancel_local(ActiveRun& active, const std::string& reason);
    void terminate_once(ActiveRun& active, const SandboxHandle& handle);
    void watch_control(ActiveRun& active, BackgroundTask& task);

    // Joins finished runs and deletes expired streams
    void housekeeping(BackgroundTask& task);

    SandboxBackend& backend_;
    EventRelay& relay_;
    EventPublisher& publisher_;
    RunStore& store_;
    ConnectionRegistry& registry_;
    Options options_;

    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    std::map<std::string, std::shared_ptr<ActiveRun>> active_;
    std::map<std::string, std::chrono::steady_clock::time_point> expiring_;
    size_t reserved_sandboxes_ = 0;
    std::atomic<bool> stopping_{false};

    std::unique_ptr<BackgroundTask> janitor_;
};

} // namespace agentrun
