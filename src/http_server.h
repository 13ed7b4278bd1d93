#pragma once

#include <string>
#include <functional>
#include <map>
#include <set>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace agentrun {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;                                   // Without the query string
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::vector<std::string> path_params;               // Segments matched by '*'
    std::string body;
    std::string client_ip;

    // Case-insensitive header lookup; empty when absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Long-lived handler that owns the socket until it returns (SSE, WebSocket,
// relay subscriptions). It writes its own status line and headers.
using StreamHandlerFunc = std::function<void(int client_fd, const HttpRequest&)>;

// Minimal HTTP server, one thread per client
class HttpServer {
public:
    explicit HttpServer(int port = 8000);
    ~HttpServer();

    // Register route handlers. A path containing '*' matches exactly one
    // segment per '*'; other paths match exactly or as a prefix.
    void route(const std::string& method, const std::string& path, HandlerFunc handler);
    void stream_route(const std::string& method, const std::string& path, StreamHandlerFunc handler);

    // Start server (blocks)
    void start();

    // Stop accepting, shut down open client sockets and wait for their threads
    void stop();

    bool running() const { return running_; }

    // Actual port once listening (useful with port 0)
    int port() const { return port_; }

    size_t active_clients() const { return active_clients_; }

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string status_text(int status_code);

    // Matches path against a route pattern, capturing '*' segments
    static bool match_pattern(const std::string& pattern, const std::string& path,
                              std::vector<std::string>& params);

private:
    struct Route {
        std::string method;
        std::string pattern;
        HandlerFunc handler;
        StreamHandlerFunc stream_handler;
    };

    void handle_client(int client_fd, const std::string& client_ip);
    const Route* find_route(HttpRequest& req) const;
    bool read_request(int client_fd, std::string& raw);

    int port_;
    int server_fd_;
    std::atomic<bool> running_;
    std::vector<Route> routes_;

    mutable std::mutex clients_mutex_;
    std::condition_variable clients_cv_;
    std::set<int> client_fds_;
    std::atomic<size_t> active_clients_{0};
};

// Writes all of data; false once the peer is gone
bool write_all(int fd, const std::string& data);

} // namespace agentrun
