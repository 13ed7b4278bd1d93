#include "relay_factory.h"
#include "memory_relay.h"
#include "remote_relay.h"
#include "errors.h"

#include <iostream>
#include <stdexcept>

namespace agentrun {

std::unique_ptr<EventRelay> create_relay(const ServerConfig& config) {
    if (config.relay_url == "memory") {
        std::cout << "[Config] Event relay: in-process" << std::endl;
        return std::make_unique<MemoryRelay>(config.queue_capacity);
    }

    try {
        auto relay = std::make_unique<RemoteRelay>(
            HttpClient::from_url(config.relay_url),
            std::chrono::milliseconds(config.relay_call_timeout_ms));
        std::cout << "[Config] Event relay: " << relay->describe()
                  << (relay->ping() ? "" : " (not answering yet)") << std::endl;
        return relay;
    } catch (const std::invalid_argument& e) {
        throw ConfigError("relay url: " + std::string(e.what()));
    }
}

} // namespace agentrun
