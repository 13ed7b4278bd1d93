#pragma once

#include "sandbox_backend.h"
#include "config.h"

#include <memory>

namespace agentrun {

// Backend named by config.backend; throws ConfigError for unknown names
std::unique_ptr<SandboxBackend> create_backend(const ServerConfig& config);

} // namespace agentrun
