#include "background_task.h"

#include <exception>
#include <iostream>

namespace agentrun {

BackgroundTask::BackgroundTask(std::string name, Body body)
    : name_(std::move(name)) {
    thread_ = std::thread([this, body = std::move(body)]() {
        try {
            body(*this);
        } catch (const std::exception& e) {
            std::cerr << "[Task] " << name_ << " failed: " << e.what() << std::endl;
        }
        finished_ = true;
    });
}

BackgroundTask::~BackgroundTask() {
    cancel();
    join();
}

void BackgroundTask::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

void BackgroundTask::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool BackgroundTask::sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [this]() { return cancelled_.load(); });
    return !cancelled_.load();
}

} // namespace agentrun
