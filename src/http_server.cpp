#include "http_server.h"
#include "constants.h"
#include "util.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace agentrun {

namespace {

const char* PAYLOAD_TOO_LARGE =
    "HTTP/1.1 413 Payload Too Large\r\n"
    "Content-Type: application/json\r\n"
    "Content-Length: 37\r\n"
    "Connection: close\r\n\r\n"
    "{\"error\":\"Request exceeds 1MB limit\"}";

std::string error_body(const std::string& message) {
    Json::Value body;
    body["error"] = message;
    return to_json(body);
}

// Exact > wildcard > longest prefix
int match_rank(const std::string& pattern, const std::string& path) {
    if (pattern == path) return 3;
    if (pattern.find('*') != std::string::npos) return 2;
    return 1;
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) return value;
    }
    return "";
}

bool write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += n;
    }
    return true;
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_.push_back(Route{method, path, std::move(handler), nullptr});
}

void HttpServer::stream_route(const std::string& method, const std::string& path,
                              StreamHandlerFunc handler) {
    routes_.push_back(Route{method, path, nullptr, std::move(handler)});
}

void HttpServer::start() {
    // Create socket
    int server_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(server_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(server_fd);
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    // Listen
    if (listen(server_fd, LISTEN_BACKLOG) < 0) {
        close(server_fd);
        throw std::runtime_error("Failed to listen");
    }

    socklen_t addr_len = sizeof(addr);
    if (getsockname(server_fd, (struct sockaddr*)&addr, &addr_len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    server_fd_ = server_fd;
    running_ = true;
    std::cout << "[HttpServer] Listening on port " << port_ << std::endl;

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd, (struct sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_ && (errno == EINTR || errno == ECONNABORTED)) continue;
            break;
        }

        // Get client IP
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            client_fds_.insert(client_fd);
            active_clients_++;
        }

        // Handle in new thread (simple concurrency)
        std::thread([this, client_fd, client_ip]() {
            try {
                handle_client(client_fd, client_ip);
            } catch (const std::exception& e) {
                std::cerr << "[HttpServer] Client " << client_ip << ": " << e.what() << std::endl;
            }
            // Notify under the lock: stop() may destroy the server right after
            std::lock_guard<std::mutex> lock(clients_mutex_);
            client_fds_.erase(client_fd);
            close(client_fd);
            active_clients_--;
            clients_cv_.notify_all();
        }).detach();
    }
}

void HttpServer::stop() {
    bool was_running = running_.exchange(false);
    int server_fd = server_fd_;
    if (server_fd >= 0) {
        server_fd_ = -1;
        shutdown(server_fd, SHUT_RDWR);
        close(server_fd);
    }

    std::unique_lock<std::mutex> lock(clients_mutex_);
    for (int fd : client_fds_) {
        shutdown(fd, SHUT_RDWR);
    }
    clients_cv_.wait_for(lock, std::chrono::seconds(10),
                         [this]() { return active_clients_ == 0; });
    if (was_running && active_clients_ > 0) {
        std::cerr << "[HttpServer] " << active_clients_
                  << " client threads still running at shutdown" << std::endl;
    }
}

bool HttpServer::read_request(int client_fd, std::string& request_data) {
    request_data.reserve(INITIAL_HTTP_BUFFER);

    // Slow or idle clients must not pin a thread forever
    struct timeval tv;
    tv.tv_sec = 30;
    tv.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    char buffer[PIPE_BUFFER_SIZE];
    size_t header_end = std::string::npos;

    while (header_end == std::string::npos) {
        ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer));
        if (bytes_read <= 0) return false;

        if (request_data.size() + bytes_read > MAX_REQUEST_SIZE) {
            write_all(client_fd, PAYLOAD_TOO_LARGE);
            return false;
        }
        request_data.append(buffer, bytes_read);
        header_end = request_data.find("\r\n\r\n");
    }
    header_end += 4;

    HttpRequest head = parse_request(request_data.substr(0, header_end));
    std::string length_str = head.header("Content-Length");
    if (length_str.empty()) return true;

    size_t content_length = 0;
    try {
        content_length = std::stoul(length_str);
    } catch (const std::exception&) {
        return false;
    }

    size_t expected_size = header_end + content_length;
    if (expected_size > MAX_REQUEST_SIZE) {
        write_all(client_fd, PAYLOAD_TOO_LARGE);
        return false;
    }

    // Read remaining body if needed
    while (request_data.size() < expected_size) {
        ssize_t bytes_read = read(client_fd, buffer,
            std::min(sizeof(buffer), expected_size - request_data.size()));
        if (bytes_read <= 0) return false;
        request_data.append(buffer, bytes_read);
    }
    return true;
}

bool HttpServer::match_pattern(const std::string& pattern, const std::string& path,
                               std::vector<std::string>& params) {
    params.clear();
    if (pattern.find('*') == std::string::npos) {
        return path.compare(0, pattern.size(), pattern) == 0;
    }

    size_t p = 0;
    size_t s = 0;
    while (p < pattern.size() && s <= path.size()) {
        if (pattern[p] == '*') {
            size_t end = path.find('/', s);
            if (end == std::string::npos) end = path.size();
            if (end == s) return false;     // Empty segment
            params.push_back(path.substr(s, end - s));
            s = end;
            p++;
        } else {
            if (s >= path.size() || pattern[p] != path[s]) return false;
            p++;
            s++;
        }
    }
    return p == pattern.size() && s == path.size();
}

const HttpServer::Route* HttpServer::find_route(HttpRequest& req) const {
    const Route* best = nullptr;
    int best_rank = 0;
    size_t best_length = 0;
    std::vector<std::string> params;

    for (const auto& route : routes_) {
        if (route.method != req.method) continue;
        if (!match_pattern(route.pattern, req.path, params)) continue;

        int rank = match_rank(route.pattern, req.path);
        if (rank > best_rank || (rank == best_rank && route.pattern.size() > best_length)) {
            best = &route;
            best_rank = rank;
            best_length = route.pattern.size();
            req.path_params = params;
        }
    }
    return best;
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    std::string request_data;
    if (!read_request(client_fd, request_data)) return;

    // Parse request
    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    HttpResponse resp;
    const Route* route = find_route(req);
    if (!route) {
        resp.status_code = 404;
        resp.body = error_body("Not found");
    } else if (route->stream_handler) {
        try {
            route->stream_handler(client_fd, req);
        } catch (const std::exception& e) {
            // Headers may already be out; all that is left is to log and close
            std::cerr << "[HttpServer] Stream " << req.path << " failed: " << e.what() << std::endl;
        }
        return;
    } else {
        try {
            resp = route->handler(req);
        } catch (const std::exception& e) {
            std::cerr << "[HttpServer] " << req.method << " " << req.path
                      << " failed: " << e.what() << std::endl;
            resp.status_code = 500;
            resp.body = error_body(e.what());
        }
    }

    // Send response
    write_all(client_fd, build_response(resp));
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = raw.substr(0, header_end);
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);

        size_t question = target.find('?');
        if (question != std::string::npos) {
            req.query = parse_query(target.substr(question + 1));
            target = target.substr(0, question);
        }
        req.path = target;
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = line.substr(0, colon);
            req.headers[key] = trim(line.substr(colon + 1));
        }
    }

    return req;
}

std::string HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 426: return "Upgrade Required";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    // Content length
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

} // namespace agentrun
