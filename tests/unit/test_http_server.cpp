/**
 * Unit tests for HttpServer
 *
 * Request parsing, response building and route matching. The socket side is
 * covered by the integration tests.
 */

#include <gtest/gtest.h>
#include "../../src/http_server.h"
#include "../../src/constants.h"

using namespace agentrun;

// ============================================================================
// Test Fixture
// ============================================================================

class HttpServerTest : public ::testing::Test {
protected:
    HttpResponse create_response(int status, const std::string& body) {
        HttpResponse resp;
        resp.status_code = status;
        resp.body = body;
        return resp;
    }
};

// ============================================================================
// Test Contract: Request Parsing
// ============================================================================

TEST_F(HttpServerTest, ParsesValidGetRequest) {
    // Given: A valid HTTP GET request
    std::string raw_request =
        "GET /health HTTP/1.1\r\n"
        "Host: localhost:8000\r\n"
        "User-Agent: curl/7.68.0\r\n"
        "\r\n";

    // When: Request is parsed
    HttpRequest req = HttpServer::parse_request(raw_request);

    // Then: Should extract method, path, and headers correctly
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.path, "/health");
    EXPECT_EQ(req.headers["Host"], "localhost:8000");
    EXPECT_EQ(req.headers["User-Agent"], "curl/7.68.0");
    EXPECT_TRUE(req.body.empty());
}

TEST_F(HttpServerTest, ParsesPostRequestWithBody) {
    // Given: A POST request with a JSON body
    std::string body = "{\"repo_url\":\"https://github.com/a/b\",\"prompt\":\"fix\"}";
    std::string raw_request =
        "POST /api/v1/runs HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(body.size()) + "\r\n"
        "\r\n" + body;

    // When: Request is parsed
    HttpRequest req = HttpServer::parse_request(raw_request);

    // Then: Body is everything after the blank line
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/api/v1/runs");
    EXPECT_EQ(req.body, body);
}

TEST_F(HttpServerTest, SplitsQueryStringFromPath) {
    // Given: A stream request carrying resume parameters
    std::string raw_request =
        "GET /api/v1/runs/run_1/stream?last_output_id=12&api_key=k%201 HTTP/1.1\r\n"
        "\r\n";

    // When: Request is parsed
    HttpRequest req = HttpServer::parse_request(raw_request);

    // Then: Path has no query; parameters are decoded into the query map
    EXPECT_EQ(req.path, "/api/v1/runs/run_1/stream");
    EXPECT_EQ(req.query["last_output_id"], "12");
    EXPECT_EQ(req.query["api_key"], "k 1");
}

TEST_F(HttpServerTest, HeaderLookupIsCaseInsensitive) {
    // Given: Headers in mixed case
    HttpRequest req = HttpServer::parse_request(
        "GET /ws/runs/r HTTP/1.1\r\n"
        "Sec-WebSocket-Key: abc\r\n"
        "last-event-id: output:3\r\n"
        "\r\n");

    // Then: header() finds them regardless of case, empty when absent
    EXPECT_EQ(req.header("sec-websocket-key"), "abc");
    EXPECT_EQ(req.header("Last-Event-ID"), "output:3");
    EXPECT_EQ(req.header("X-API-Key"), "");
}

// ============================================================================
// Test Contract: Response Building
// ============================================================================

TEST_F(HttpServerTest, BuildsValidHttpResponse) {
    // Given: A success response with a JSON body
    HttpResponse resp = create_response(202, "{\"status\":\"accepted\"}");

    // When: Response is serialized
    std::string raw = HttpServer::build_response(resp);

    // Then: Status line, default headers, length and body are present
    EXPECT_EQ(raw.rfind("HTTP/1.1 202 Accepted\r\n", 0), 0u);
    EXPECT_NE(raw.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Access-Control-Allow-Origin: *\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Content-Length: 21\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Connection: close\r\n\r\n{\"status\":\"accepted\"}"), std::string::npos);
}

TEST_F(HttpServerTest, HandlesEmptyResponseBody) {
    // Given: A response without a body
    HttpResponse resp = create_response(204, "");

    // When: Response is serialized
    std::string raw = HttpServer::build_response(resp);

    // Then: Content-Length is zero and the message ends after the headers
    EXPECT_NE(raw.find("Content-Length: 0\r\n"), std::string::npos);
    EXPECT_EQ(raw.substr(raw.size() - 4), "\r\n\r\n");
}

// ============================================================================
// Test Contract: Routing Logic
// ============================================================================

TEST_F(HttpServerTest, WildcardMatchesExactlyOneSegment) {
    std::vector<std::string> params;

    // Given/When: A pattern with one wildcard
    // Then: One segment matches and is captured
    EXPECT_TRUE(HttpServer::match_pattern("/api/v1/runs/*", "/api/v1/runs/run_abc", params));
    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(params[0], "run_abc");

    // Then: Deeper paths and empty segments do not match
    EXPECT_FALSE(HttpServer::match_pattern("/api/v1/runs/*", "/api/v1/runs/run_abc/stream", params));
    EXPECT_FALSE(HttpServer::match_pattern("/api/v1/runs/*", "/api/v1/runs/", params));
}

TEST_F(HttpServerTest, WildcardInTheMiddleOfAPattern) {
    std::vector<std::string> params;

    // Given: A nested route
    // Then: The middle segment is captured and the suffix must follow
    EXPECT_TRUE(HttpServer::match_pattern("/api/v1/runs/*/cancel", "/api/v1/runs/r1/cancel", params));
    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(params[0], "r1");
    EXPECT_FALSE(HttpServer::match_pattern("/api/v1/runs/*/cancel", "/api/v1/runs/r1/stream", params));
}

TEST_F(HttpServerTest, PlainPatternsMatchAsPrefix) {
    std::vector<std::string> params;

    // Given: A route without wildcards
    // Then: It matches itself and longer paths, captures nothing
    EXPECT_TRUE(HttpServer::match_pattern("/health", "/health", params));
    EXPECT_TRUE(HttpServer::match_pattern("/relay/", "/relay/read", params));
    EXPECT_TRUE(params.empty());
    EXPECT_FALSE(HttpServer::match_pattern("/health", "/status", params));
}

// ============================================================================
// Test Contract: Status Code Mappings
// ============================================================================

TEST_F(HttpServerTest, MapsStatusCodesToReasonPhrases) {
    // Given: Every status code the API answers with
    // Then: Each has its standard reason phrase
    EXPECT_EQ(HttpServer::status_text(101), "Switching Protocols");
    EXPECT_EQ(HttpServer::status_text(200), "OK");
    EXPECT_EQ(HttpServer::status_text(202), "Accepted");
    EXPECT_EQ(HttpServer::status_text(400), "Bad Request");
    EXPECT_EQ(HttpServer::status_text(401), "Unauthorized");
    EXPECT_EQ(HttpServer::status_text(404), "Not Found");
    EXPECT_EQ(HttpServer::status_text(413), "Payload Too Large");
    EXPECT_EQ(HttpServer::status_text(422), "Unprocessable Entity");
    EXPECT_EQ(HttpServer::status_text(426), "Upgrade Required");
    EXPECT_EQ(HttpServer::status_text(429), "Too Many Requests");
    EXPECT_EQ(HttpServer::status_text(500), "Internal Server Error");
    EXPECT_EQ(HttpServer::status_text(503), "Service Unavailable");
    EXPECT_EQ(HttpServer::status_text(999), "Unknown");
}

// ============================================================================
// Test Contract: Header Parsing Edge Cases
// ============================================================================

TEST_F(HttpServerTest, HandlesHeaderWithColonInValue) {
    // Given: A header whose value contains colons
    HttpRequest req = HttpServer::parse_request(
        "GET / HTTP/1.1\r\n"
        "Last-Event-ID: output:12|log:3\r\n"
        "\r\n");

    // Then: Only the first colon separates name from value
    EXPECT_EQ(req.header("Last-Event-ID"), "output:12|log:3");
}

TEST_F(HttpServerTest, IgnoresHeadersWithoutColon) {
    // Given: A malformed header line
    HttpRequest req = HttpServer::parse_request(
        "GET / HTTP/1.1\r\n"
        "NotAHeader\r\n"
        "Host: x\r\n"
        "\r\n");

    // Then: It is skipped, later headers still parse
    EXPECT_EQ(req.headers.count("NotAHeader"), 0u);
    EXPECT_EQ(req.header("Host"), "x");
}

TEST_F(HttpServerTest, HandlesGarbageRequestLine) {
    // Given: A request line without spaces
    HttpRequest req = HttpServer::parse_request("GARBAGE\r\n\r\n");

    // Then: Method and path stay empty so no route matches
    EXPECT_TRUE(req.method.empty());
    EXPECT_TRUE(req.path.empty());
}

// ============================================================================
// Test Contract: Body Handling
// ============================================================================

TEST_F(HttpServerTest, ParsesMultiLineBody) {
    // Given: A body containing CRLF sequences
    std::string body = "{\n  \"prompt\": \"line one\\nline two\"\r\n}";
    HttpRequest req = HttpServer::parse_request("POST /api/v1/runs HTTP/1.1\r\n\r\n" + body);

    // Then: The body is kept verbatim
    EXPECT_EQ(req.body, body);
}
