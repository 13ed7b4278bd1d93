#include "backend_factory.h"
#include "cluster_job_backend.h"
#include "local_container_backend.h"
#include "module_call_backend.h"
#include "errors.h"

#include <iostream>

namespace agentrun {

std::string to_string(BackendStatus status) {
    switch (status) {
        case BackendStatus::PENDING: return "pending";
        case BackendStatus::ACTIVE: return "active";
        case BackendStatus::SUCCEEDED: return "succeeded";
        case BackendStatus::FAILED: return "failed";
    }
    return "unknown";
}

std::unique_ptr<SandboxBackend> create_backend(const ServerConfig& config) {
    BackendOptions options;
    options.secrets = config.secrets;
    options.error_prefix = config.error_prefix;
    options.terminate_grace = std::chrono::milliseconds(config.terminate_grace_ms);
    options.call_timeout = config.control_call_timeout();
    // Finished sandboxes stay queryable as long as their streams
    options.record_retention = std::chrono::seconds(config.stream_expiry_seconds);

    std::unique_ptr<SandboxBackend> backend;
    if (config.backend == "local-container") {
        backend = std::make_unique<LocalContainerBackend>(config.local, options);
    } else if (config.backend == "cluster-job") {
        backend = std::make_unique<ClusterJobBackend>(config.cluster, options);
    } else if (config.backend == "module-call") {
        backend = std::make_unique<ModuleCallBackend>(config.module, options);
    } else {
        throw ConfigError("unknown backend '" + config.backend + "'");
    }

    std::cout << "[Config] Sandbox backend: " << backend->name() << std::endl;
    return backend;
}

} // namespace agentrun
