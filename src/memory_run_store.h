#pragma once

#include "run_store.h"

#include <mutex>
#include <unordered_map>

namespace agentrun {

class MemoryRunStore : public RunStore {
public:
    std::optional<Run> get(const std::string& run_id) const override;
    void create(const Run& run) override;
    bool update_status(const std::string& run_id, RunStatus status) override;
    bool update_variation(const std::string& run_id, int index, VariationStatus status,
                          const std::string& error = "",
                          const std::string& sandbox_handle = "") override;
    std::vector<std::string> active_runs() const override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Run> runs_;
};

} // namespace agentrun
