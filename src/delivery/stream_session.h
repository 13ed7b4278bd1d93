#pragma once

#include "connection.h"
#include "connection_registry.h"
#include "transport.h"
#include "background_task.h"
#include "event_relay.h"
#include "constants.h"

#include <chrono>
#include <functional>
#include <memory>

namespace agentrun {

// Drives one subscriber connection: a relay pump reading the run's durable
// channels from the connection's cursor, a heartbeat task, an optional
// inbound reader, and the writer loop on the calling thread.
//
// The pump only queues; the writer only drains. A subscriber that stops
// reading overruns its own queue and is evicted while producers and other
// connections carry on.
class StreamSession {
public:
    struct Options {
        std::chrono::milliseconds heartbeat_interval{DEFAULT_HEARTBEAT_INTERVAL_SECONDS * 1000};
        std::chrono::milliseconds close_grace{DEFAULT_CLOSE_GRACE_SECONDS * 1000};
        std::chrono::milliseconds relay_block{RELAY_READ_BLOCK_MS};
        std::chrono::milliseconds relay_retry{RELAY_READ_BLOCK_MS};
    };

    using InboundLoop = std::function<void(BackgroundTask&, Connection&)>;

    StreamSession(EventRelay& relay, ConnectionRegistry& registry,
                  std::shared_ptr<Connection> connection, StreamWriter& writer,
                  Options options);

    // Blocks until the connection ends. All tasks are joined on return.
    void run(InboundLoop inbound = nullptr);

private:
    void pump(BackgroundTask& task);
    void heartbeat(BackgroundTask& task);
    void write_loop();

    EventRelay& relay_;
    ConnectionRegistry& registry_;
    std::shared_ptr<Connection> connection_;
    StreamWriter& writer_;
    Options options_;
};

} // namespace agentrun
