/**
 * HTTP Integration Tests
 *
 * Drives agentrun-server's routes over real sockets: a listening HttpServer
 * on an ephemeral port, the orchestrator behind it and a scripted backend.
 */

#include <gtest/gtest.h>
#include "../fake_backend.h"
#include "../../src/api.h"
#include "../../src/http_client.h"
#include "../../src/memory_run_store.h"
#include "../../src/relay/memory_relay.h"
#include "../../src/util.h"

#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <thread>

using namespace agentrun;
using namespace agentrun::testing;
using namespace std::chrono_literals;

// ============================================================================
// Test Fixture
// ============================================================================

class HttpIntegrationTest : public ::testing::Test {
protected:
    FakeBackend backend;
    MemoryRelay relay;
    EventPublisher publisher{relay, 1000};
    MemoryRunStore store;
    ConnectionRegistry registry;
    ApiKeyResolver identity{std::vector<std::string>{"test-key"}};
    std::unique_ptr<Orchestrator> orchestrator;
    std::unique_ptr<ApiRoutes> api;
    std::unique_ptr<HttpServer> server;
    std::thread server_thread;

    virtual Orchestrator::Options orchestrator_options() {
        Orchestrator::Options opts;
        opts.provision_backoff = 10ms;
        opts.status_settle = 100ms;
        opts.close_grace = 100ms;
        return opts;
    }

    void SetUp() override {
        backend.default_script.lines = {"hello from the agent"};
        orchestrator = std::make_unique<Orchestrator>(backend, relay, publisher, store, registry,
                                                      orchestrator_options());

        ApiRoutes::Options api_options;
        api_options.session.heartbeat_interval = 10s;
        api_options.session.close_grace = 100ms;
        api_options.session.relay_block = 50ms;
        api = std::make_unique<ApiRoutes>(*orchestrator, store, relay, registry, backend,
                                          identity, api_options);

        server = std::make_unique<HttpServer>(0);
        api->register_routes(*server);
        server_thread = std::thread([this]() { server->start(); });

        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!server->running() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(10ms);
        }
        ASSERT_TRUE(server->running()) << "server did not start";
    }

    void TearDown() override {
        orchestrator->shutdown();
        registry.close_all();
        server->stop();
        if (server_thread.joinable()) server_thread.join();
    }

    HttpClient client() const {
        return HttpClient("127.0.0.1", server->port());
    }

    HttpClientResponse get(const std::string& path) {
        return client().request("GET", path, "", 5s);
    }

    HttpClientResponse post(const std::string& path, const std::string& body) {
        return client().request("POST", path, body, 5s);
    }

    static Json::Value json(const HttpClientResponse& resp) {
        Json::Value value;
        EXPECT_TRUE(parse_json(resp.body, value)) << resp.body;
        return value;
    }

    static std::string run_body(int variations) {
        return R"({"repo_url":"https://github.com/octo/hello","prompt":"Add a README","variations":)" +
               std::to_string(variations) + "}";
    }

    // Starts a run through the API and returns its id
    std::string start(int variations = 2) {
        auto resp = post("/api/v1/runs?api_key=test-key", run_body(variations));
        EXPECT_EQ(resp.status_code, 202) << resp.body;
        return json(resp)["run_id"].asString();
    }

    std::string wait_for_status(const std::string& run_id, const std::string& wanted) {
        auto deadline = std::chrono::steady_clock::now() + 10s;
        std::string status;
        while (std::chrono::steady_clock::now() < deadline) {
            status = json(get("/api/v1/runs/" + run_id + "?api_key=test-key"))["status"].asString();
            if (status == wanted) break;
            std::this_thread::sleep_for(20ms);
        }
        return status;
    }

    // Reads a stream body until the server closes it
    static std::string read_to_close(int fd, const std::string& already, std::chrono::seconds wait = 10s) {
        std::string out = already;
        char buf[4096];
        auto deadline = std::chrono::steady_clock::now() + wait;
        while (std::chrono::steady_clock::now() < deadline) {
            struct pollfd pfd = {fd, POLLIN, 0};
            if (poll(&pfd, 1, 50) <= 0) continue;
            ssize_t n = recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            out.append(buf, n);
        }
        close(fd);
        return out;
    }
};

// ============================================================================
// Health
// ============================================================================

TEST_F(HttpIntegrationTest, HealthNeedsNoKey) {
    auto resp = get("/health");

    EXPECT_EQ(resp.status_code, 200);
    Json::Value body = json(resp);
    EXPECT_EQ(body["status"].asString(), "healthy");
    EXPECT_EQ(body["backend"]["name"].asString(), "fake");
    EXPECT_EQ(body["relay"]["url"].asString(), "memory");
    EXPECT_TRUE(body["relay"]["reachable"].asBool());
    EXPECT_EQ(resp.headers["content-type"], "application/json");
}

TEST_F(HttpIntegrationTest, UnknownRouteIs404) {
    EXPECT_EQ(get("/api/v2/everything").status_code, 404);
}

// ============================================================================
// Authentication
// ============================================================================

TEST_F(HttpIntegrationTest, RunRoutesRequireAKey) {
    EXPECT_EQ(post("/api/v1/runs", run_body(1)).status_code, 401);
    EXPECT_EQ(post("/api/v1/runs?api_key=wrong", run_body(1)).status_code, 401);
    EXPECT_EQ(get("/api/v1/runs/run_x").status_code, 401);
    EXPECT_EQ(post("/api/v1/runs/run_x/cancel", "").status_code, 401);
    EXPECT_EQ(get("/api/v1/runs/run_x/stream").status_code, 401);
    EXPECT_EQ(store.size(), 0u);
}

// ============================================================================
// Starting Runs
// ============================================================================

TEST_F(HttpIntegrationTest, StartRunIsAcceptedAndCompletes) {
    // When: Submitting a two-way run
    auto resp = post("/api/v1/runs?api_key=test-key", run_body(2));

    // Then: 202 with every follow-up URL
    ASSERT_EQ(resp.status_code, 202) << resp.body;
    Json::Value body = json(resp);
    std::string run_id = body["run_id"].asString();
    EXPECT_EQ(body["status"].asString(), "accepted");
    EXPECT_EQ(body["variations"].asInt(), 2);
    EXPECT_EQ(body["stream_url"].asString(), "/api/v1/runs/" + run_id + "/stream");
    EXPECT_EQ(body["websocket_url"].asString(), "/ws/runs/" + run_id);

    // And: The run reaches completed, owned by the key's principal
    EXPECT_EQ(wait_for_status(run_id, "completed"), "completed");
    auto stored = store.get(run_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->user_id, ApiKeyResolver::principal_for("test-key"));
}

TEST_F(HttpIntegrationTest, MalformedBodiesAre400) {
    EXPECT_EQ(post("/api/v1/runs?api_key=test-key", "{not json").status_code, 400);
    EXPECT_EQ(post("/api/v1/runs?api_key=test-key", "[1,2]").status_code, 400);
    EXPECT_EQ(post("/api/v1/runs?api_key=test-key", "").status_code, 400);
}

TEST_F(HttpIntegrationTest, InvalidRunsAre422) {
    auto resp = post("/api/v1/runs?api_key=test-key", run_body(9));
    EXPECT_EQ(resp.status_code, 422);
    EXPECT_NE(json(resp)["detail"].asString().find("variations"), std::string::npos);

    resp = post("/api/v1/runs?api_key=test-key",
                R"({"repo_url":"https://evil.example/x/y","prompt":"p","variations":1})");
    EXPECT_EQ(resp.status_code, 422);

    resp = post("/api/v1/runs?api_key=test-key",
                R"({"repo_url":"https://github.com/a/b","prompt":"   ","variations":1})");
    EXPECT_EQ(resp.status_code, 422);
    EXPECT_EQ(backend.total_provisions(), 0);
}

// ============================================================================
// Run Status and Cancel
// ============================================================================

TEST_F(HttpIntegrationTest, RunStatusShowsVariations) {
    backend.scripts[1].error = "tests failed";
    std::string run_id = start(2);
    ASSERT_EQ(wait_for_status(run_id, "completed"), "completed");

    Json::Value body = json(get("/api/v1/runs/" + run_id + "?api_key=test-key"));
    ASSERT_EQ(body["variation_states"].size(), 2u);
    EXPECT_EQ(body["variation_states"][0]["status"].asString(), "completed");
    EXPECT_EQ(body["variation_states"][1]["status"].asString(), "failed");
    EXPECT_EQ(body["variation_states"][1]["error"].asString(), "tests failed");
    EXPECT_FALSE(body.isMember("prompt"));
}

TEST_F(HttpIntegrationTest, UnknownRunIs404) {
    EXPECT_EQ(get("/api/v1/runs/run_missing?api_key=test-key").status_code, 404);
    EXPECT_EQ(post("/api/v1/runs/run_missing/cancel?api_key=test-key", "").status_code, 404);
    EXPECT_EQ(get("/api/v1/runs/run_missing/stream?api_key=test-key").status_code, 404);
}

TEST_F(HttpIntegrationTest, CancelStopsAHangingRun) {
    backend.default_script.hang = true;
    std::string run_id = start(3);
    ASSERT_EQ(wait_for_status(run_id, "running"), "running");

    auto resp = post("/api/v1/runs/" + run_id + "/cancel?api_key=test-key", "");
    ASSERT_EQ(resp.status_code, 200);
    EXPECT_TRUE(json(resp)["cancel_requested"].asBool());

    EXPECT_EQ(wait_for_status(run_id, "cancelled"), "cancelled");

    // Cancelling again is harmless
    EXPECT_EQ(post("/api/v1/runs/" + run_id + "/cancel?api_key=test-key", "").status_code, 200);
}

// ============================================================================
// Streams
// ============================================================================

TEST_F(HttpIntegrationTest, SseStreamOfFinishedRunReplaysAndCloses) {
    std::string run_id = start(1);
    ASSERT_EQ(wait_for_status(run_id, "completed"), "completed");

    HttpClientResponse head;
    int fd = client().open_stream("/api/v1/runs/" + run_id + "/stream?api_key=test-key", 5s, head);
    std::string body = read_to_close(fd, head.body);

    EXPECT_EQ(head.status_code, 200);
    EXPECT_EQ(head.headers["content-type"], "text/event-stream");
    EXPECT_NE(body.find("event: connected"), std::string::npos);
    EXPECT_NE(body.find("hello from the agent"), std::string::npos);
    EXPECT_NE(body.find("event: run_complete"), std::string::npos);
}

TEST_F(HttpIntegrationTest, WebSocketRouteNeedsAnUpgrade) {
    std::string run_id = start(1);
    EXPECT_EQ(get("/ws/runs/" + run_id + "?api_key=test-key").status_code, 426);
}

// ============================================================================
// Admission
// ============================================================================

class HttpAdmissionTest : public HttpIntegrationTest {
protected:
    Orchestrator::Options orchestrator_options() override {
        Orchestrator::Options opts = HttpIntegrationTest::orchestrator_options();
        opts.max_concurrent_runs = 1;
        return opts;
    }
};

TEST_F(HttpAdmissionTest, SecondRunIsRefusedWhileFirstRuns) {
    backend.default_script.hang = true;
    std::string first = start(1);

    auto resp = post("/api/v1/runs?api_key=test-key", run_body(1));
    EXPECT_EQ(resp.status_code, 429);

    post("/api/v1/runs/" + first + "/cancel?api_key=test-key", "");
    ASSERT_EQ(wait_for_status(first, "cancelled"), "cancelled");
    ASSERT_TRUE(orchestrator->wait_for_run(first, 5s));
    EXPECT_EQ(post("/api/v1/runs?api_key=test-key", run_body(1)).status_code, 202);
}
