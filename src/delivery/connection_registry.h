#pragma once

#include "connection.h"
#include "constants.h"

#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentrun {

// Process-wide map of run id -> open connections. Runs hash into a fixed set
// of buckets, each with its own mutex, so add/remove/close on one run are
// atomic without serializing unrelated runs.
class ConnectionRegistry {
public:
    void add(const std::shared_ptr<Connection>& connection);
    void remove(const std::shared_ptr<Connection>& connection);

    // Schedule every connection of the run to close after grace
    size_t close_run(const std::string& run_id, std::chrono::milliseconds grace);

    // Close everything now (server shutdown)
    void close_all();

    size_t count(const std::string& run_id) const;
    size_t total() const;

private:
    struct Bucket {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::vector<std::shared_ptr<Connection>>> runs;
    };

    Bucket& bucket_for(const std::string& run_id);
    const Bucket& bucket_for(const std::string& run_id) const;

    std::array<Bucket, REGISTRY_BUCKETS> buckets_;
};

} // namespace agentrun
