#pragma once

#include "connection.h"

#include <string>

namespace agentrun {

// Whatever can cancel a run on behalf of a subscriber (the Orchestrator)
class RunCanceller {
public:
    virtual ~RunCanceller() = default;

    // Idempotent. False only when the run is unknown.
    virtual bool cancel_run(const std::string& run_id, const std::string& reason) = 0;
};

// Inbound WebSocket commands: {"control": "cancel" | "ping"}
class ControlHandler {
public:
    explicit ControlHandler(RunCanceller& canceller);

    // Reply to queue on the same connection: control_ack, pong or error.
    // The connection stays open in every case.
    OutboundEvent handle(const std::string& run_id, const std::string& message);

private:
    RunCanceller& canceller_;
};

} // namespace agentrun
