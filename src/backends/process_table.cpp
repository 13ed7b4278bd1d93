#include "process_table.h"

namespace agentrun {

void ProcessTable::add(const std::string& id, SandboxProcess entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_.erase(id);
    prune_finished(std::chrono::steady_clock::now());
    live_[id] = std::move(entry);
}

std::optional<SandboxProcess> ProcessTable::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = live_.find(id);
    if (it == live_.end()) return std::nullopt;
    return it->second;
}

std::optional<SandboxProcess> ProcessTable::remove(const std::string& id,
                                                   std::chrono::milliseconds grace) {
    SandboxProcess entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = live_.find(id);
        if (it == live_.end()) return std::nullopt;
        entry = std::move(it->second);
        live_.erase(it);
    }

    // Outside the lock: the grace period may take a while
    entry.process->terminate(grace);
    int code = entry.process->try_wait().value_or(-1);

    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    prune_finished(now);
    finished_[id] = Finished{code, now};
    return entry;
}

BackendStatus ProcessTable::status(const std::string& id) const {
    std::shared_ptr<Process> process;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto done = finished_.find(id);
        if (done != finished_.end()) {
            return done->second.exit_code == 0 ? BackendStatus::SUCCEEDED : BackendStatus::FAILED;
        }
        auto it = live_.find(id);
        if (it == live_.end()) return BackendStatus::FAILED;
        process = it->second.process;
    }

    auto code = process->try_wait();
    if (!code) return BackendStatus::ACTIVE;
    return *code == 0 ? BackendStatus::SUCCEEDED : BackendStatus::FAILED;
}

size_t ProcessTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

size_t ProcessTable::finished_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_.size();
}

void ProcessTable::prune_finished(std::chrono::steady_clock::time_point now) {
    for (auto it = finished_.begin(); it != finished_.end();) {
        if (now - it->second.at >= retention_) {
            it = finished_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace agentrun
