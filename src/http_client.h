#pragma once

#include <chrono>
#include <map>
#include <string>

namespace agentrun {

struct HttpClientResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;     // Keys lowercased
    std::string body;
};

// Blocking HTTP/1.1 client with a hard deadline per call. One connection
// per request ("Connection: close").
class HttpClient {
public:
    HttpClient(std::string host, int port);

    // Accepts http://host:port[/]; throws std::invalid_argument otherwise
    static HttpClient from_url(const std::string& url);

    // Throws TimeoutError past the deadline, std::runtime_error when the
    // server cannot be reached or answers garbage
    HttpClientResponse request(const std::string& method,
                               const std::string& path,
                               const std::string& body,
                               std::chrono::milliseconds timeout) const;

    // Sends a GET and returns the socket once the response headers are read.
    // Bytes of the body already received are left in head.body.
    int open_stream(const std::string& path,
                    std::chrono::milliseconds timeout,
                    HttpClientResponse& head) const;

    const std::string& host() const { return host_; }
    int port() const { return port_; }

private:
    int connect_socket(std::chrono::steady_clock::time_point deadline) const;
    void send_request(int fd, const std::string& method, const std::string& path,
                      const std::string& body,
                      std::chrono::steady_clock::time_point deadline) const;

    std::string host_;
    int port_;
};

} // namespace agentrun
