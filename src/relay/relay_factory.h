#pragma once

#include "event_relay.h"
#include "config.h"

#include <memory>

namespace agentrun {

// "memory" gives an in-process relay, http://host:port a client of
// agentrun-relayd. Throws ConfigError otherwise.
std::unique_ptr<EventRelay> create_relay(const ServerConfig& config);

} // namespace agentrun
