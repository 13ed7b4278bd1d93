/*
 * agentrun-relayd - shared event relay for multi-process deployments
 */

#include "constants.h"
#include "http_server.h"
#include "relay/memory_relay.h"
#include "relay/relay_service.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>

using namespace agentrun;

int main(int argc, char* argv[]) {
    int port = DEFAULT_RELAY_PORT;
    size_t queue_capacity = DEFAULT_CONNECTION_QUEUE_CAPACITY;

    if (const char* v = std::getenv("AGENTRUN_RELAY_PORT")) {
        port = std::atoi(v);
    }

    // Parse command line
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            port = std::atoi(argv[++i]);
        } else if (arg == "--queue-capacity" && i + 1 < argc) {
            queue_capacity = std::strtoul(argv[++i], nullptr, 10);
        } else {
            std::cerr << "Usage: agentrun-relayd [--port N] [--queue-capacity N]" << std::endl;
            return 1;
        }
    }
    if (port < 0 || port > 65535 || queue_capacity == 0) {
        std::cerr << "[Config] Invalid port or queue capacity" << std::endl;
        return 1;
    }

    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    MemoryRelay relay(queue_capacity);
    RelayService service(relay);
    HttpServer server(port);
    service.register_routes(server);

    std::cout << "agentrun-relayd on port " << port << std::endl;

    std::atomic<bool> stopping{false};
    std::thread signal_thread([&]() {
        int signal = 0;
        sigwait(&stop_signals, &signal);
        stopping = true;
        std::cout << "\n[Relay] Caught signal " << signal << ", shutting down" << std::endl;
        relay.shutdown();
        server.stop();
    });

    int status = 0;
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "[Relay] " << e.what() << std::endl;
        status = 1;
    }

    if (!stopping) {
        pthread_kill(signal_thread.native_handle(), SIGTERM);
    }
    signal_thread.join();
    return status;
}
