#include "memory_run_store.h"

#include <stdexcept>

namespace agentrun {

std::optional<Run> MemoryRunStore::get(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryRunStore::create(const Run& run) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!runs_.emplace(run.id, run).second) {
        throw std::invalid_argument("Run already exists: " + run.id);
    }
}

bool MemoryRunStore::update_status(const std::string& run_id, RunStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end() || !can_transition(it->second.status, status)) {
        return false;
    }

    Run& run = it->second;
    run.status = status;
    if (status == RunStatus::RUNNING && !run.started_at) {
        run.started_at = Clock::now();
    }
    if (is_terminal(status)) {
        run.completed_at = Clock::now();
    }
    return true;
}

bool MemoryRunStore::update_variation(const std::string& run_id, int index,
                                      VariationStatus status, const std::string& error,
                                      const std::string& sandbox_handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = runs_.find(run_id);
    if (it == runs_.end() || index < 0 ||
        index >= static_cast<int>(it->second.variations.size())) {
        return false;
    }

    Variation& variation = it->second.variations[index];
    if (!can_transition(variation.status, status)) {
        return false;
    }

    variation.status = status;
    if (status == VariationStatus::RUNNING && !variation.started_at) {
        variation.started_at = Clock::now();
    }
    if (is_terminal(status)) {
        variation.ended_at = Clock::now();
    }
    if (!error.empty()) {
        variation.error = error;
    }
    if (!sandbox_handle.empty()) {
        variation.sandbox_handle = sandbox_handle;
    }
    return true;
}

std::vector<std::string> MemoryRunStore::active_runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : runs_) {
        if (!is_terminal(entry.second.status)) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

size_t MemoryRunStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return runs_.size();
}

} // namespace agentrun
