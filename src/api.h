#pragma once

#include "http_server.h"
#include "orchestrator.h"
#include "run_store.h"
#include "auth.h"
#include "event_relay.h"
#include "sandbox_backend.h"
#include "delivery/connection_registry.h"
#include "delivery/control_handler.h"
#include "delivery/stream_session.h"

namespace agentrun {

// HTTP surface of agentrun-server:
//   GET  /health
//   POST /api/v1/runs
//   GET  /api/v1/runs/{id}
//   POST /api/v1/runs/{id}/cancel
//   GET  /api/v1/runs/{id}/stream      (SSE)
//   GET  /ws/runs/{id}                 (WebSocket)
class ApiRoutes {
public:
    struct Options {
        size_t queue_capacity = DEFAULT_CONNECTION_QUEUE_CAPACITY;
        StreamSession::Options session;
    };

    ApiRoutes(Orchestrator& orchestrator, RunStore& store, EventRelay& relay,
              ConnectionRegistry& registry, SandboxBackend& backend,
              const IdentityResolver& identity, Options options);

    void register_routes(HttpServer& server);

    HttpResponse handle_health(const HttpRequest& req);
    HttpResponse handle_start_run(const HttpRequest& req);
    HttpResponse handle_get_run(const HttpRequest& req);
    HttpResponse handle_cancel_run(const HttpRequest& req);
    void handle_sse(int client_fd, const HttpRequest& req);
    void handle_websocket(int client_fd, const HttpRequest& req);

    // Resume point from Last-Event-ID / ?last_event_id= (cursor format) and
    // ?last_output_id= / ?last_log_id= / ?last_status_id=, later ones winning
    static ChannelCursor resume_cursor(const HttpRequest& req);

    static HttpResponse error_response(int status, const std::string& error,
                                       const std::string& detail = "");

private:
    // Principal, or a filled-in 401 in resp
    bool authenticate(const HttpRequest& req, std::string& principal, HttpResponse& resp) const;

    // Shared checks of both stream routes; writes the error response itself
    bool admit_stream(int client_fd, const HttpRequest& req, std::string& run_id);

    Orchestrator& orchestrator_;
    RunStore& store_;
    EventRelay& relay_;
    ConnectionRegistry& registry_;
    SandboxBackend& backend_;
    const IdentityResolver& identity_;
    ControlHandler control_;
    Options options_;
};

} // namespace agentrun
