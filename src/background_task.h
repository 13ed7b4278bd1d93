#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace agentrun {

// A cancellable background loop owned by the object it serves.
// The destructor cancels and joins, so a task never outlives its owner.
class BackgroundTask {
public:
    using Body = std::function<void(BackgroundTask&)>;

    BackgroundTask(std::string name, Body body);
    ~BackgroundTask();

    BackgroundTask(const BackgroundTask&) = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    // Request cancellation; wakes sleep_for()
    void cancel();

    // Wait for the body to return
    void join();

    bool cancelled() const { return cancelled_.load(); }
    bool finished() const { return finished_.load(); }
    const std::string& name() const { return name_; }

    // Sleep that returns early (false) when cancelled
    bool sleep_for(std::chrono::milliseconds duration);

private:
    std::string name_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> finished_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

} // namespace agentrun
