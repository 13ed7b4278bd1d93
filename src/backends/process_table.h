#pragma once

#include "sandbox_backend.h"
#include "process.h"
#include "constants.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace agentrun {

// A sandbox that is a local child process
struct SandboxProcess {
    std::shared_ptr<Process> process;
    std::string directory;                               // Removed on teardown
    std::chrono::steady_clock::time_point deadline;
    std::optional<std::chrono::steady_clock::time_point> first_output_deadline;
};

// Live sandbox processes by handle id, plus exit codes of torn-down ones
class ProcessTable {
public:
    explicit ProcessTable(std::chrono::seconds retention = std::chrono::seconds(DEFAULT_RECORD_RETENTION_SECONDS))
        : retention_(retention) {}

    void add(const std::string& id, SandboxProcess entry);

    std::optional<SandboxProcess> find(const std::string& id) const;

    // Terminates the process and forgets the entry. Empty when the id is
    // unknown or already removed.
    std::optional<SandboxProcess> remove(const std::string& id, std::chrono::milliseconds grace);

    BackendStatus status(const std::string& id) const;

    size_t size() const;
    size_t finished_count() const;

private:
    struct Finished {
        int exit_code;
        std::chrono::steady_clock::time_point at;
    };

    // Caller holds mutex_
    void prune_finished(std::chrono::steady_clock::time_point now);

    std::chrono::seconds retention_;
    mutable std::mutex mutex_;
    std::map<std::string, SandboxProcess> live_;
    std::map<std::string, Finished> finished_;
};

} // namespace agentrun
