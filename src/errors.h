#pragma once

#include <stdexcept>
#include <string>

namespace agentrun {

// Sandbox failed to start. Transient failures (control plane briefly
// unreachable) may be retried with a fixed backoff; others are surfaced.
class ProvisionError : public std::runtime_error {
public:
    explicit ProvisionError(const std::string& message, bool transient = false)
        : std::runtime_error("Provision failed: " + message), transient_(transient) {}

    bool transient() const { return transient_; }

private:
    bool transient_;
};

// Non-zero exit or broken output stream. Never retried.
class ExecutionError : public std::runtime_error {
public:
    explicit ExecutionError(const std::string& message)
        : std::runtime_error(message) {}
};

// Event relay transport is down or did not answer in time.
class RelayUnavailable : public std::runtime_error {
public:
    explicit RelayUnavailable(const std::string& message)
        : std::runtime_error("Relay unavailable: " + message) {}
};

// Subscriber could not keep up with its outbound queue.
class ConnectionOverrun : public std::runtime_error {
public:
    explicit ConnectionOverrun(const std::string& message)
        : std::runtime_error("Connection overrun: " + message) {}
};

// A bounded wait was exceeded.
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& message)
        : std::runtime_error("Timed out: " + message) {}
};

// Request rejected before anything was started.
class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& message, int status_code = 422)
        : std::runtime_error(message), status_code_(status_code) {}

    int status_code() const { return status_code_; }

private:
    int status_code_;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Invalid configuration: " + message) {}
};

} // namespace agentrun
