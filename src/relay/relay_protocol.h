#pragma once

#include "event_relay.h"

#include <json/json.h>

namespace agentrun {

// JSON shapes shared by agentrun-relayd and RemoteRelay.
//   cursor: {"run:1:output": 12, ...}
//   batch:  {"run:1:output": [{"id": 13, "fields": {...}}, ...], ...}
namespace relay_protocol {

Json::Value cursor_to_json(const RelayCursor& cursor);

// Throws std::invalid_argument on a malformed cursor
RelayCursor cursor_from_json(const Json::Value& json);

Json::Value batch_to_json(const RelayBatch& batch);
RelayBatch batch_from_json(const Json::Value& json);

} // namespace relay_protocol

} // namespace agentrun
