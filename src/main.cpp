/*
 * agentrun-server - parallel coding-agent runs in sandboxes
 * Streams every variation's output over SSE and WebSocket
 */

#include "api.h"
#include "auth.h"
#include "config.h"
#include "errors.h"
#include "event_publisher.h"
#include "http_server.h"
#include "memory_run_store.h"
#include "orchestrator.h"
#include "backends/backend_factory.h"
#include "delivery/connection_registry.h"
#include "relay/relay_factory.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <thread>

using namespace agentrun;

int main(int argc, char* argv[]) {
    ServerConfig config;
    try {
        config = ServerConfig::load(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return 1;
    }

    // Signals are taken synchronously by one thread; every thread spawned
    // from here on inherits the mask
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "agentrun-server" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    std::unique_ptr<EventRelay> relay;
    std::unique_ptr<SandboxBackend> backend;
    try {
        relay = create_relay(config);
        backend = create_backend(config);
    } catch (const std::exception& e) {
        std::cerr << "[Config] Startup failed: " << e.what() << std::endl;
        return 1;
    }

    ApiKeyResolver identity(config.api_keys);
    if (identity.development_mode()) {
        std::cout << "[Config] No API keys configured: accepting all callers as anonymous" << std::endl;
    }
    std::cout << "------------------------------------------------" << std::endl;

    EventPublisher publisher(*relay, config.stream_retention, config.fanout_enabled);
    MemoryRunStore store;
    ConnectionRegistry registry;
    Orchestrator orchestrator(*backend, *relay, publisher, store, registry,
                              Orchestrator::Options::from_config(config));

    ApiRoutes::Options api_options;
    api_options.queue_capacity = config.queue_capacity;
    api_options.session.heartbeat_interval = std::chrono::seconds(config.heartbeat_interval_seconds);
    api_options.session.close_grace = std::chrono::seconds(config.close_grace_seconds);
    ApiRoutes api(orchestrator, store, *relay, registry, *backend, identity, api_options);

    HttpServer server(config.port);
    api.register_routes(server);

    std::atomic<bool> stopping{false};
    std::thread signal_thread([&]() {
        int signal = 0;
        sigwait(&stop_signals, &signal);
        stopping = true;
        std::cout << "\n[Server] Caught signal " << signal << ", shutting down" << std::endl;

        orchestrator.shutdown();
        registry.close_all();
        server.stop();
    });

    int status = 0;
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "[Server] " << e.what() << std::endl;
        status = 1;
    }

    if (!stopping) {
        pthread_kill(signal_thread.native_handle(), SIGTERM);
    }
    signal_thread.join();

    std::cout << "[Server] Stopped" << std::endl;
    return status;
}
