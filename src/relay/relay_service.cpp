#include "relay_service.h"
#include "relay_protocol.h"
#include "constants.h"
#include "util.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace agentrun {

namespace {

HttpResponse json_response(int status, const Json::Value& body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = to_json(body);
    return resp;
}

HttpResponse bad_request(const std::string& message) {
    Json::Value body;
    body["error"] = message;
    return json_response(400, body);
}

// Parsed body, or a 400 in resp
bool parse_body(const HttpRequest& req, Json::Value& body, HttpResponse& resp) {
    if (!parse_json(req.body, body) || !body.isObject()) {
        resp = bad_request("body must be a JSON object");
        return false;
    }
    return true;
}

bool require_channel(const Json::Value& body, std::string& channel, HttpResponse& resp) {
    if (!body["channel"].isString() || body["channel"].asString().empty()) {
        resp = bad_request("channel is required");
        return false;
    }
    channel = body["channel"].asString();
    return true;
}

} // namespace

RelayService::RelayService(MemoryRelay& relay) : relay_(relay) {}

void RelayService::register_routes(HttpServer& server) {
    server.route("POST", "/relay/publish", [this](const HttpRequest& r) { return handle_publish(r); });
    server.route("POST", "/relay/append", [this](const HttpRequest& r) { return handle_append(r); });
    server.route("POST", "/relay/read", [this](const HttpRequest& r) { return handle_read(r); });
    server.route("POST", "/relay/trim", [this](const HttpRequest& r) { return handle_trim(r); });
    server.route("POST", "/relay/delete", [this](const HttpRequest& r) { return handle_delete(r); });
    server.route("GET", "/relay/ping", [this](const HttpRequest& r) { return handle_ping(r); });
    server.stream_route("GET", "/relay/subscribe", [this, &server](int fd, const HttpRequest& r) {
        handle_subscribe(fd, r, server);
    });
}

HttpResponse RelayService::handle_publish(const HttpRequest& req) {
    Json::Value body;
    HttpResponse resp;
    std::string channel;
    if (!parse_body(req, body, resp) || !require_channel(body, channel, resp)) return resp;
    if (!body["message"].isString()) return bad_request("message must be a string");

    Json::Value out;
    out["subscribers"] = static_cast<Json::UInt64>(relay_.publish(channel, body["message"].asString()));
    return json_response(200, out);
}

HttpResponse RelayService::handle_append(const HttpRequest& req) {
    Json::Value body;
    HttpResponse resp;
    std::string channel;
    if (!parse_body(req, body, resp) || !require_channel(body, channel, resp)) return resp;
    if (!body["fields"].isObject()) return bad_request("fields must be an object");

    size_t max_len = DEFAULT_STREAM_RETENTION;
    if (body.isMember("max_len")) {
        if (!body["max_len"].isUInt()) return bad_request("max_len must be a positive integer");
        max_len = body["max_len"].asUInt();
    }

    Json::Value out;
    out["id"] = static_cast<Json::UInt64>(relay_.append(channel, body["fields"], max_len));
    return json_response(200, out);
}

HttpResponse RelayService::handle_read(const HttpRequest& req) {
    Json::Value body;
    HttpResponse resp;
    if (!parse_body(req, body, resp)) return resp;

    RelayCursor cursor;
    try {
        cursor = relay_protocol::cursor_from_json(body["after"]);
    } catch (const std::invalid_argument& e) {
        return bad_request(e.what());
    }

    int block_ms = std::clamp(body.get("block_ms", 0).asInt(), 0, MAX_RELAY_READ_BLOCK_MS);
    size_t count = std::clamp<size_t>(body.get("count", static_cast<Json::UInt>(MAX_RELAY_READ_COUNT)).asUInt(),
                                      1, MAX_RELAY_READ_COUNT);

    Json::Value out;
    out["entries"] = relay_protocol::batch_to_json(
        relay_.read(cursor, std::chrono::milliseconds(block_ms), count));
    return json_response(200, out);
}

HttpResponse RelayService::handle_trim(const HttpRequest& req) {
    Json::Value body;
    HttpResponse resp;
    std::string channel;
    if (!parse_body(req, body, resp) || !require_channel(body, channel, resp)) return resp;
    if (!body["max_len"].isUInt()) return bad_request("max_len must be a non-negative integer");

    relay_.trim(channel, body["max_len"].asUInt());
    Json::Value out;
    out["ok"] = true;
    return json_response(200, out);
}

HttpResponse RelayService::handle_delete(const HttpRequest& req) {
    Json::Value body;
    HttpResponse resp;
    if (!parse_body(req, body, resp)) return resp;
    if (!body["channels"].isArray()) return bad_request("channels must be an array");

    std::vector<std::string> channels;
    for (const auto& channel : body["channels"]) {
        if (!channel.isString()) return bad_request("channels must be strings");
        channels.push_back(channel.asString());
    }
    relay_.remove(channels);

    Json::Value out;
    out["deleted"] = static_cast<Json::UInt64>(channels.size());
    return json_response(200, out);
}

HttpResponse RelayService::handle_ping(const HttpRequest&) {
    Json::Value out;
    out["ok"] = true;
    return json_response(200, out);
}

void RelayService::handle_subscribe(int client_fd, const HttpRequest& req, const HttpServer& server) {
    auto it = req.query.find("channel");
    if (it == req.query.end() || it->second.empty()) {
        write_all(client_fd, HttpServer::build_response(bad_request("channel is required")));
        return;
    }
    const std::string channel = it->second;

    auto subscription = relay_.subscribe(channel);
    if (!write_all(client_fd, "HTTP/1.1 200 OK\r\n"
                              "Content-Type: application/x-ndjson\r\n"
                              "Cache-Control: no-cache\r\n"
                              "Connection: close\r\n\r\n")) {
        return;
    }

    std::cout << "[Relay] Subscriber attached to " << channel << std::endl;
    std::string message;
    while (server.running()) {
        std::string line = "\n";      // Keepalive doubles as a liveness probe
        if (subscription->next(message, std::chrono::milliseconds(RELAY_READ_BLOCK_MS))) {
            Json::Value frame;
            frame["message"] = message;
            line = to_json(frame) + "\n";
        }
        if (!write_all(client_fd, line)) break;
    }
    subscription->close();
    std::cout << "[Relay] Subscriber left " << channel << std::endl;
}

} // namespace agentrun
