#include "api.h"
#include "delivery/transport.h"
#include "websocket.h"
#include "errors.h"
#include "util.h"

#include <iostream>

namespace agentrun {

namespace {

HttpResponse json_response(int status, const Json::Value& body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = to_json(body);
    return resp;
}

bool parse_id(const std::string& text, uint64_t& id) {
    if (text.empty() || text.size() > 19 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    id = std::stoull(text);
    return true;
}

} // namespace

ApiRoutes::ApiRoutes(Orchestrator& orchestrator, RunStore& store, EventRelay& relay,
                     ConnectionRegistry& registry, SandboxBackend& backend,
                     const IdentityResolver& identity, Options options)
    : orchestrator_(orchestrator),
      store_(store),
      relay_(relay),
      registry_(registry),
      backend_(backend),
      identity_(identity),
      control_(orchestrator),
      options_(options) {}

void ApiRoutes::register_routes(HttpServer& server) {
    server.route("GET", "/health", [this](const HttpRequest& r) { return handle_health(r); });
    server.route("POST", "/api/v1/runs", [this](const HttpRequest& r) { return handle_start_run(r); });
    server.route("GET", "/api/v1/runs/*", [this](const HttpRequest& r) { return handle_get_run(r); });
    server.route("POST", "/api/v1/runs/*/cancel", [this](const HttpRequest& r) { return handle_cancel_run(r); });
    server.stream_route("GET", "/api/v1/runs/*/stream", [this](int fd, const HttpRequest& r) { handle_sse(fd, r); });
    server.stream_route("GET", "/ws/runs/*", [this](int fd, const HttpRequest& r) { handle_websocket(fd, r); });
}

HttpResponse ApiRoutes::error_response(int status, const std::string& error, const std::string& detail) {
    Json::Value body;
    body["error"] = error;
    if (!detail.empty()) {
        body["detail"] = detail;
    }
    return json_response(status, body);
}

bool ApiRoutes::authenticate(const HttpRequest& req, std::string& principal, HttpResponse& resp) const {
    auto resolved = identity_.resolve(req);
    if (!resolved) {
        resp = error_response(401, "Unauthorized", "a valid X-API-Key is required");
        return false;
    }
    principal = *resolved;
    return true;
}

ChannelCursor ApiRoutes::resume_cursor(const HttpRequest& req) {
    ChannelCursor cursor = parse_cursor(req.header("Last-Event-ID"));

    auto it = req.query.find("last_event_id");
    if (it != req.query.end()) {
        for (const auto& entry : parse_cursor(it->second)) {
            cursor[entry.first] = entry.second;
        }
    }

    const std::pair<const char*, Channel> params[] = {
        {"last_output_id", Channel::OUTPUT},
        {"last_log_id", Channel::LOG},
        {"last_status_id", Channel::STATUS},
    };
    for (const auto& param : params) {
        auto q = req.query.find(param.first);
        uint64_t id;
        if (q != req.query.end() && parse_id(q->second, id)) {
            cursor[param.second] = id;
        }
    }
    return cursor;
}

// ============================================================================
// Plain routes
// ============================================================================

HttpResponse ApiRoutes::handle_health(const HttpRequest&) {
    bool relay_ok = relay_.ping();

    Json::Value body;
    body["status"] = relay_ok ? "healthy" : "degraded";
    body["timestamp"] = now_timestamp();
    body["relay"]["url"] = relay_.describe();
    body["relay"]["reachable"] = relay_ok;
    body["backend"]["name"] = backend_.name();
    body["backend"]["details"] = backend_.describe();
    body["orchestrator"] = orchestrator_.describe();
    body["connections"] = static_cast<Json::UInt64>(registry_.total());
    return json_response(200, body);
}

HttpResponse ApiRoutes::handle_start_run(const HttpRequest& req) {
    std::string principal;
    HttpResponse resp;
    if (!authenticate(req, principal, resp)) return resp;

    Json::Value body;
    if (!parse_json(req.body, body) || !body.isObject()) {
        return error_response(400, "Invalid request", "body must be a JSON object");
    }

    Run run;
    try {
        run = orchestrator_.start_run(RunRequest::from_json(body), principal);
    } catch (const ValidationError& e) {
        return error_response(e.status_code(), "Invalid request", e.what());
    }

    Json::Value out;
    out["run_id"] = run.id;
    out["status"] = "accepted";
    out["variations"] = run.variation_count;
    out["stream_url"] = "/api/v1/runs/" + run.id + "/stream";
    out["websocket_url"] = "/ws/runs/" + run.id;
    out["status_url"] = "/api/v1/runs/" + run.id;
    out["cancel_url"] = "/api/v1/runs/" + run.id + "/cancel";
    return json_response(202, out);
}

HttpResponse ApiRoutes::handle_get_run(const HttpRequest& req) {
    std::string principal;
    HttpResponse resp;
    if (!authenticate(req, principal, resp)) return resp;

    const std::string& run_id = req.path_params.at(0);
    Json::Value details = orchestrator_.run_details(run_id);
    if (details.isNull()) {
        return error_response(404, "Run not found", run_id);
    }
    return json_response(200, details);
}

HttpResponse ApiRoutes::handle_cancel_run(const HttpRequest& req) {
    std::string principal;
    HttpResponse resp;
    if (!authenticate(req, principal, resp)) return resp;

    const std::string& run_id = req.path_params.at(0);
    if (!orchestrator_.cancel_run(run_id, "cancelled by " + principal)) {
        return error_response(404, "Run not found", run_id);
    }

    Json::Value out;
    out["run_id"] = run_id;
    out["cancel_requested"] = true;
    auto run = store_.get(run_id);
    out["status"] = run ? to_string(run->status) : "unknown";
    return json_response(200, out);
}

// ============================================================================
// Streams
// ============================================================================

bool ApiRoutes::admit_stream(int client_fd, const HttpRequest& req, std::string& run_id) {
    std::string principal;
    HttpResponse resp;
    if (!authenticate(req, principal, resp)) {
        write_all(client_fd, HttpServer::build_response(resp));
        return false;
    }

    run_id = req.path_params.at(0);
    if (!store_.get(run_id)) {
        write_all(client_fd, HttpServer::build_response(error_response(404, "Run not found", run_id)));
        return false;
    }
    return true;
}

void ApiRoutes::handle_sse(int client_fd, const HttpRequest& req) {
    std::string run_id;
    if (!admit_stream(client_fd, req, run_id)) return;

    auto connection = std::make_shared<Connection>(run_id, Transport::SSE,
                                                   options_.queue_capacity, resume_cursor(req));
    SseWriter writer(client_fd);
    StreamSession session(relay_, registry_, connection, writer, options_.session);
    session.run();
}

void ApiRoutes::handle_websocket(int client_fd, const HttpRequest& req) {
    if (!WebSocketManager::is_websocket_upgrade(req)) {
        write_all(client_fd, HttpServer::build_response(
            error_response(426, "WebSocket upgrade required")));
        return;
    }

    std::string run_id;
    if (!admit_stream(client_fd, req, run_id)) return;

    auto connection = std::make_shared<Connection>(run_id, Transport::WEBSOCKET,
                                                   options_.queue_capacity, resume_cursor(req));
    WebSocketWriter writer(client_fd, req.header("Sec-WebSocket-Key"));
    StreamSession session(relay_, registry_, connection, writer, options_.session);
    session.run([this, &writer](BackgroundTask& task, Connection& conn) {
        writer.read_loop(task, conn, &control_);
    });
}

} // namespace agentrun
