#include "control_handler.h"
#include "util.h"

#include <iostream>

namespace agentrun {

namespace {

OutboundEvent error_reply(const std::string& message) {
    Json::Value data;
    data["error"] = message;
    data["timestamp"] = now_timestamp();
    return OutboundEvent::notice("error", data);
}

} // namespace

ControlHandler::ControlHandler(RunCanceller& canceller) : canceller_(canceller) {}

OutboundEvent ControlHandler::handle(const std::string& run_id, const std::string& message) {
    Json::Value command;
    if (!parse_json(message, command) || !command.isObject()) {
        return error_reply("control messages must be JSON objects");
    }
    if (!command["control"].isString()) {
        return error_reply("missing control command");
    }

    const std::string control = command["control"].asString();

    if (control == "ping") {
        Json::Value data;
        data["timestamp"] = now_timestamp();
        return OutboundEvent::notice("pong", data);
    }

    if (control == "cancel") {
        std::cout << "[Delivery] Cancel requested over WebSocket for run " << run_id << std::endl;
        bool accepted = canceller_.cancel_run(run_id, "cancelled by subscriber");

        Json::Value data;
        data["control"] = "cancel";
        data["run_id"] = run_id;
        data["accepted"] = accepted;
        data["timestamp"] = now_timestamp();
        return OutboundEvent::notice("control_ack", data);
    }

    return error_reply("unknown control command: " + control);
}

} // namespace agentrun
