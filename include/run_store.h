#pragma once

#include "models.h"

#include <optional>
#include <string>
#include <vector>

namespace agentrun {

// Run/Variation persistence. The orchestrator writes statuses and
// timestamps only; everything else is fixed at create().
class RunStore {
public:
    virtual ~RunStore() = default;

    virtual std::optional<Run> get(const std::string& run_id) const = 0;

    // Throws std::invalid_argument when the id already exists
    virtual void create(const Run& run) = 0;

    // Applies a forward transition and stamps started_at/completed_at.
    // Returns false when the run is unknown or the transition is not allowed.
    virtual bool update_status(const std::string& run_id, RunStatus status) = 0;

    // Same for one variation. error and handle are recorded when non-empty.
    virtual bool update_variation(const std::string& run_id, int index,
                                  VariationStatus status,
                                  const std::string& error = "",
                                  const std::string& sandbox_handle = "") = 0;

    // Ids of runs that are not yet terminal
    virtual std::vector<std::string> active_runs() const = 0;
};

} // namespace agentrun
