#pragma once

#include <json/json.h>

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace agentrun {

// Job state as reported by the backend, derived from its counts
enum class BackendStatus {
    PENDING,
    ACTIVE,
    SUCCEEDED,
    FAILED
};

std::string to_string(BackendStatus status);

struct ResourceLimits {
    size_t memory_mb = 1024;                // Memory limit in MB
    double cpu_cores = 0.5;                 // Cluster cpu limit
    size_t cpu_time_sec = 1800;             // CPU time limit (local)
    size_t max_processes = 256;
    size_t max_open_files = 1024;
    size_t max_file_size_mb = 512;
    std::chrono::seconds setup_timeout{300};      // Clone + environment setup
    std::chrono::seconds execution_timeout{3600}; // Entrypoint wall time
};

// Opaque reference to one provisioned sandbox
struct SandboxHandle {
    std::string id;                         // Backend-specific name
    std::string run_id;
    int variation_id = -1;

    bool valid() const { return !id.empty(); }
};

struct OutputLine {
    enum class Kind {
        OUTPUT,     // Produced by the agent
        ERROR       // Backend error marker (abnormal exit, stream failure)
    };

    Kind kind = Kind::OUTPUT;
    std::string text;
};

// Lazy sequence of a sandbox's combined output lines
class OutputStream {
public:
    enum class Status {
        LINE,
        IDLE,       // Nothing within the wait; ask again
        END         // Process exited and all output was returned
    };

    virtual ~OutputStream() = default;

    virtual Status next(OutputLine& line, std::chrono::milliseconds wait) = 0;

    // Stop following; the sandbox itself keeps running
    virtual void close() = 0;
};

// One way of running agent sandboxes. Selected once at startup.
class SandboxBackend {
public:
    virtual ~SandboxBackend() = default;

    // Allocates an isolated environment and starts the entrypoint.
    // Prompt, config and secrets reach the sandbox as files or variables,
    // never on a command line. Throws ProvisionError.
    virtual SandboxHandle provision(const std::string& run_id,
                                    int variation_id,
                                    const std::string& repo_url,
                                    const std::string& prompt,
                                    const ResourceLimits& limits,
                                    const Json::Value& agent_config) = 0;

    // Lines in the order produced. Throws ExecutionError if the stream
    // cannot be attached at all.
    virtual std::unique_ptr<OutputStream> stream_output(const SandboxHandle& handle) = 0;

    virtual BackendStatus status(const SandboxHandle& handle) = 0;

    // Idempotent; a sandbox that is already gone counts as terminated
    virtual void terminate(const SandboxHandle& handle) = 0;

    virtual std::string name() const = 0;

    // Backend-specific health and cache details
    virtual Json::Value describe() const { return Json::Value(Json::objectValue); }
};

} // namespace agentrun
