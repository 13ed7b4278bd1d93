#pragma once

#include "memory_relay.h"
#include "http_server.h"

namespace agentrun {

// Exposes a MemoryRelay over HTTP for agentrun-relayd:
//   POST /relay/publish   {channel, message}          -> {subscribers}
//   POST /relay/append    {channel, fields, max_len}  -> {id}
//   POST /relay/read      {after, block_ms, count}    -> {entries}
//   POST /relay/trim      {channel, max_len}
//   POST /relay/delete    {channels}
//   GET  /relay/ping
//   GET  /relay/subscribe?channel=...  newline-delimited JSON until closed
class RelayService {
public:
    explicit RelayService(MemoryRelay& relay);

    void register_routes(HttpServer& server);

    HttpResponse handle_publish(const HttpRequest& req);
    HttpResponse handle_append(const HttpRequest& req);
    HttpResponse handle_read(const HttpRequest& req);
    HttpResponse handle_trim(const HttpRequest& req);
    HttpResponse handle_delete(const HttpRequest& req);
    HttpResponse handle_ping(const HttpRequest& req);
    void handle_subscribe(int client_fd, const HttpRequest& req, const HttpServer& server);

private:
    MemoryRelay& relay_;
};

} // namespace agentrun
