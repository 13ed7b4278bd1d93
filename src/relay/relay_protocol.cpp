#include "relay_protocol.h"

#include <stdexcept>

namespace agentrun {
namespace relay_protocol {

namespace {

uint64_t id_from_json(const Json::Value& value) {
    if (value.isUInt64()) return value.asUInt64();
    if (value.isString()) {
        const std::string text = value.asString();
        if (!text.empty() && text.find_first_not_of("0123456789") == std::string::npos) {
            return std::stoull(text);
        }
    }
    throw std::invalid_argument("relay id must be a non-negative integer");
}

} // namespace

Json::Value cursor_to_json(const RelayCursor& cursor) {
    Json::Value json(Json::objectValue);
    for (const auto& [channel, id] : cursor) {
        json[channel] = static_cast<Json::UInt64>(id);
    }
    return json;
}

RelayCursor cursor_from_json(const Json::Value& json) {
    if (!json.isObject()) {
        throw std::invalid_argument("cursor must be an object");
    }
    RelayCursor cursor;
    for (const auto& channel : json.getMemberNames()) {
        cursor[channel] = id_from_json(json[channel]);
    }
    return cursor;
}

Json::Value batch_to_json(const RelayBatch& batch) {
    Json::Value json(Json::objectValue);
    for (const auto& [channel, entries] : batch) {
        Json::Value list(Json::arrayValue);
        for (const auto& entry : entries) {
            Json::Value item;
            item["id"] = static_cast<Json::UInt64>(entry.id);
            item["fields"] = entry.fields;
            list.append(item);
        }
        json[channel] = list;
    }
    return json;
}

RelayBatch batch_from_json(const Json::Value& json) {
    RelayBatch batch;
    if (!json.isObject()) return batch;

    for (const auto& channel : json.getMemberNames()) {
        std::vector<RelayEntry> entries;
        for (const auto& item : json[channel]) {
            entries.push_back(RelayEntry{id_from_json(item["id"]), item["fields"]});
        }
        batch[channel] = std::move(entries);
    }
    return batch;
}

} // namespace relay_protocol
} // namespace agentrun
