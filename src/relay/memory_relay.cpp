#include "memory_relay.h"
#include "errors.h"

#include <algorithm>

namespace agentrun {

struct MemoryRelay::Subscriber {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> queue;
    size_t capacity = 0;
    bool closed = false;
};

namespace {

class MemorySubscription : public RelaySubscription {
public:
    explicit MemorySubscription(std::shared_ptr<MemoryRelay::Subscriber> state)
        : state_(std::move(state)) {}

    ~MemorySubscription() override { close(); }

    bool next(std::string& message, std::chrono::milliseconds wait) override {
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_for(lock, wait, [this]() {
            return !state_->queue.empty() || state_->closed;
        });
        if (state_->queue.empty()) return false;
        message = std::move(state_->queue.front());
        state_->queue.pop_front();
        return true;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->closed = true;
        }
        state_->cv.notify_all();
    }

private:
    std::shared_ptr<MemoryRelay::Subscriber> state_;
};

} // namespace

MemoryRelay::MemoryRelay(size_t subscriber_queue_capacity)
    : queue_capacity_(subscriber_queue_capacity) {}

MemoryRelay::~MemoryRelay() {
    shutdown();
}

size_t MemoryRelay::publish(const std::string& channel, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(channel);
    if (it == subscribers_.end()) return 0;

    size_t delivered = 0;
    auto& list = it->second;
    for (auto sub_it = list.begin(); sub_it != list.end();) {
        auto subscriber = sub_it->lock();
        if (!subscriber) {
            sub_it = list.erase(sub_it);
            continue;
        }
        {
            std::lock_guard<std::mutex> sub_lock(subscriber->mutex);
            if (!subscriber->closed) {
                // Fan-out is best effort: a full subscriber loses its oldest message
                if (subscriber->queue.size() >= subscriber->capacity) {
                    subscriber->queue.pop_front();
                }
                subscriber->queue.push_back(message);
                delivered++;
            }
        }
        subscriber->cv.notify_all();
        ++sub_it;
    }
    if (list.empty()) subscribers_.erase(it);
    return delivered;
}

std::unique_ptr<RelaySubscription> MemoryRelay::subscribe(const std::string& channel) {
    auto state = std::make_shared<Subscriber>();
    state->capacity = queue_capacity_;

    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[channel].push_back(state);
    return std::make_unique<MemorySubscription>(state);
}

uint64_t MemoryRelay::append(const std::string& channel, const Json::Value& fields,
                             size_t max_len) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Stream& stream = streams_[channel];
        id = ++stream.last_id;
        stream.entries.push_back(RelayEntry{id, fields});
        while (max_len > 0 && stream.entries.size() > max_len) {
            stream.entries.pop_front();
        }
    }
    appended_.notify_all();
    return id;
}

RelayBatch MemoryRelay::collect(const RelayCursor& after, size_t max_count) const {
    RelayBatch batch;
    for (const auto& [channel, last_seen] : after) {
        auto it = streams_.find(channel);
        if (it == streams_.end()) continue;

        const auto& entries = it->second.entries;
        auto first = std::upper_bound(entries.begin(), entries.end(), last_seen,
            [](uint64_t id, const RelayEntry& entry) { return id < entry.id; });

        std::vector<RelayEntry> out;
        for (auto e = first; e != entries.end() && out.size() < max_count; ++e) {
            out.push_back(*e);
        }
        if (!out.empty()) {
            batch[channel] = std::move(out);
        }
    }
    return batch;
}

RelayBatch MemoryRelay::read(const RelayCursor& after, std::chrono::milliseconds block,
                             size_t max_count) {
    std::unique_lock<std::mutex> lock(mutex_);
    RelayBatch batch = collect(after, max_count);
    if (!batch.empty() || block.count() <= 0) return batch;

    auto deadline = std::chrono::steady_clock::now() + block;
    while (batch.empty() && !shutdown_) {
        if (appended_.wait_until(lock, deadline) == std::cv_status::timeout) {
            return collect(after, max_count);
        }
        batch = collect(after, max_count);
    }
    return batch;
}

void MemoryRelay::trim(const std::string& channel, size_t max_len) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(channel);
    if (it == streams_.end()) return;
    while (it->second.entries.size() > max_len) {
        it->second.entries.pop_front();
    }
}

void MemoryRelay::remove(const std::vector<std::string>& channels) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Ids stay increasing for late writers, so only the entries go
    for (const auto& channel : channels) {
        auto it = streams_.find(channel);
        if (it != streams_.end()) {
            it->second.entries.clear();
        }
    }
}

void MemoryRelay::shutdown() {
    std::vector<std::shared_ptr<Subscriber>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        for (auto& [channel, list] : subscribers_) {
            for (auto& weak : list) {
                if (auto sub = weak.lock()) live.push_back(sub);
            }
        }
    }
    appended_.notify_all();
    for (auto& sub : live) {
        sub->cv.notify_all();
    }
}

size_t MemoryRelay::channel_length(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(channel);
    return it == streams_.end() ? 0 : it->second.entries.size();
}

size_t MemoryRelay::subscriber_count(const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(channel);
    if (it == subscribers_.end()) return 0;
    size_t count = 0;
    for (const auto& weak : it->second) {
        if (!weak.expired()) count++;
    }
    return count;
}

} // namespace agentrun
