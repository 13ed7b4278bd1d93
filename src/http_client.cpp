#include "http_client.h"
#include "errors.h"
#include "constants.h"
#include "util.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace agentrun {

namespace {

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Waits for fd readiness; throws TimeoutError at the deadline
void wait_ready(int fd, short events, std::chrono::steady_clock::time_point deadline,
                const std::string& what) {
    while (true) {
        int left = remaining_ms(deadline);
        if (left == 0) {
            throw TimeoutError(what);
        }
        struct pollfd pfd = {fd, events, 0};
        int ready = poll(&pfd, 1, left);
        if (ready > 0) return;
        if (ready < 0 && errno != EINTR) {
            throw std::runtime_error(what + ": " + strerror(errno));
        }
    }
}

// Parses "HTTP/1.1 200 OK\r\nKey: v\r\n..." (without the blank line)
void parse_head(const std::string& head, HttpClientResponse& resp) {
    std::istringstream stream(head);
    std::string line;
    std::getline(stream, line);
    if (line.compare(0, 5, "HTTP/") != 0) {
        throw std::runtime_error("malformed HTTP response");
    }
    size_t space = line.find(' ');
    try {
        resp.status_code = std::stoi(line.substr(space + 1, 3));
    } catch (const std::exception&) {
        throw std::runtime_error("malformed HTTP status line");
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            resp.headers[to_lower(line.substr(0, colon))] = trim(line.substr(colon + 1));
        }
    }
}

} // namespace

HttpClient::HttpClient(std::string host, int port) : host_(std::move(host)), port_(port) {}

HttpClient HttpClient::from_url(const std::string& url) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("expected http://host:port, got " + url);
    }
    std::string rest = url.substr(scheme.size());
    size_t slash = rest.find('/');
    if (slash != std::string::npos) rest = rest.substr(0, slash);

    size_t colon = rest.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        throw std::invalid_argument("missing port in " + url);
    }
    int port = 0;
    try {
        port = std::stoi(rest.substr(colon + 1));
    } catch (const std::exception&) {
        throw std::invalid_argument("bad port in " + url);
    }
    return HttpClient(rest.substr(0, colon), port);
}

int HttpClient::connect_socket(std::chrono::steady_clock::time_point deadline) const {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    int rc = getaddrinfo(host_.c_str(), std::to_string(port_).c_str(), &hints, &result);
    if (rc != 0 || !result) {
        throw std::runtime_error("cannot resolve " + host_ + ": " + gai_strerror(rc));
    }

    int fd = socket(result->ai_family, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (fd < 0) {
        freeaddrinfo(result);
        throw std::runtime_error(std::string("socket: ") + strerror(errno));
    }

    rc = connect(fd, result->ai_addr, result->ai_addrlen);
    freeaddrinfo(result);
    if (rc < 0 && errno != EINPROGRESS) {
        int err = errno;
        close(fd);
        throw std::runtime_error("connect " + host_ + ":" + std::to_string(port_) + ": " + strerror(err));
    }

    try {
        wait_ready(fd, POLLOUT, deadline, "connect " + host_ + ":" + std::to_string(port_));
    } catch (const std::exception&) {
        close(fd);
        throw;
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
    if (so_error != 0) {
        close(fd);
        throw std::runtime_error("connect " + host_ + ":" + std::to_string(port_) + ": " +
                                 strerror(so_error));
    }
    return fd;
}

void HttpClient::send_request(int fd, const std::string& method, const std::string& path,
                              const std::string& body,
                              std::chrono::steady_clock::time_point deadline) const {
    std::ostringstream out;
    out << method << " " << path << " HTTP/1.1\r\n"
        << "Host: " << host_ << ":" << port_ << "\r\n"
        << "Connection: close\r\n";
    if (!body.empty() || method == "POST") {
        out << "Content-Type: application/json\r\n"
            << "Content-Length: " << body.size() << "\r\n";
    }
    out << "\r\n" << body;
    std::string data = out.str();

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += n;
        } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            wait_ready(fd, POLLOUT, deadline, "send to " + host_);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            throw std::runtime_error("send to " + host_ + ": " + strerror(errno));
        }
    }
}

HttpClientResponse HttpClient::request(const std::string& method,
                                       const std::string& path,
                                       const std::string& body,
                                       std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    int fd = connect_socket(deadline);

    HttpClientResponse resp;
    try {
        send_request(fd, method, path, body, deadline);

        std::string data;
        char buffer[PIPE_BUFFER_SIZE];
        size_t header_end = std::string::npos;
        size_t expected = std::string::npos;

        while (true) {
            if (header_end == std::string::npos) {
                header_end = data.find("\r\n\r\n");
                if (header_end != std::string::npos) {
                    parse_head(data.substr(0, header_end), resp);
                    auto it = resp.headers.find("content-length");
                    if (it != resp.headers.end()) {
                        expected = header_end + 4 + std::stoul(it->second);
                    }
                }
            }
            if (expected != std::string::npos && data.size() >= expected) break;

            wait_ready(fd, POLLIN, deadline, method + " " + path);
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                throw std::runtime_error("recv from " + host_ + ": " + strerror(errno));
            }
            if (n == 0) break;
            data.append(buffer, n);
            if (data.size() > MAX_REQUEST_SIZE * 16) {
                throw std::runtime_error("response from " + host_ + " too large");
            }
        }

        if (header_end == std::string::npos) {
            throw std::runtime_error("connection closed before response from " + host_);
        }
        resp.body = data.substr(header_end + 4,
            expected == std::string::npos ? std::string::npos : expected - header_end - 4);
    } catch (const std::exception&) {
        close(fd);
        throw;
    }
    close(fd);
    return resp;
}

int HttpClient::open_stream(const std::string& path,
                            std::chrono::milliseconds timeout,
                            HttpClientResponse& head) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    int fd = connect_socket(deadline);

    try {
        send_request(fd, "GET", path, "", deadline);

        std::string data;
        char buffer[PIPE_BUFFER_SIZE];
        size_t header_end = std::string::npos;
        while (header_end == std::string::npos) {
            wait_ready(fd, POLLIN, deadline, "GET " + path);
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                throw std::runtime_error("recv from " + host_ + ": " + strerror(errno));
            }
            if (n == 0) {
                throw std::runtime_error("connection closed before response from " + host_);
            }
            data.append(buffer, n);
            header_end = data.find("\r\n\r\n");
        }
        parse_head(data.substr(0, header_end), head);
        head.body = data.substr(header_end + 4);
    } catch (const std::exception&) {
        close(fd);
        throw;
    }
    return fd;
}

} // namespace agentrun
