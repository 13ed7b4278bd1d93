#include "connection_registry.h"

#include <algorithm>
#include <functional>

namespace agentrun {

ConnectionRegistry::Bucket& ConnectionRegistry::bucket_for(const std::string& run_id) {
    return buckets_[std::hash<std::string>{}(run_id) % buckets_.size()];
}

const ConnectionRegistry::Bucket& ConnectionRegistry::bucket_for(const std::string& run_id) const {
    return buckets_[std::hash<std::string>{}(run_id) % buckets_.size()];
}

void ConnectionRegistry::add(const std::shared_ptr<Connection>& connection) {
    Bucket& bucket = bucket_for(connection->run_id());
    std::lock_guard<std::mutex> lock(bucket.mutex);
    bucket.runs[connection->run_id()].push_back(connection);
}

void ConnectionRegistry::remove(const std::shared_ptr<Connection>& connection) {
    Bucket& bucket = bucket_for(connection->run_id());
    std::lock_guard<std::mutex> lock(bucket.mutex);

    auto it = bucket.runs.find(connection->run_id());
    if (it == bucket.runs.end()) return;

    auto& list = it->second;
    list.erase(std::remove(list.begin(), list.end(), connection), list.end());
    if (list.empty()) {
        bucket.runs.erase(it);
    }
}

size_t ConnectionRegistry::close_run(const std::string& run_id, std::chrono::milliseconds grace) {
    Bucket& bucket = bucket_for(run_id);
    std::lock_guard<std::mutex> lock(bucket.mutex);

    auto it = bucket.runs.find(run_id);
    if (it == bucket.runs.end()) return 0;
    for (auto& conn : it->second) {
        conn->close_after(grace);
    }
    return it->second.size();
}

void ConnectionRegistry::close_all() {
    for (auto& bucket : buckets_) {
        std::lock_guard<std::mutex> lock(bucket.mutex);
        for (auto& entry : bucket.runs) {
            for (auto& conn : entry.second) {
                conn->close();
            }
        }
    }
}

size_t ConnectionRegistry::count(const std::string& run_id) const {
    const Bucket& bucket = bucket_for(run_id);
    std::lock_guard<std::mutex> lock(bucket.mutex);
    auto it = bucket.runs.find(run_id);
    return it == bucket.runs.end() ? 0 : it->second.size();
}

size_t ConnectionRegistry::total() const {
    size_t n = 0;
    for (const auto& bucket : buckets_) {
        std::lock_guard<std::mutex> lock(bucket.mutex);
        for (const auto& entry : bucket.runs) {
            n += entry.second.size();
        }
    }
    return n;
}

} // namespace agentrun
