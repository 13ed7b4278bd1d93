#pragma once

#include <cstddef>  // for size_t

namespace agentrun {

// Sandbox resource limits
constexpr size_t DEFAULT_MEMORY_LIMIT_MB = 1024;                  // 1GB per variation
constexpr size_t DEFAULT_CPU_TIME_SECONDS = 1800;                 // 30 CPU minutes
constexpr size_t DEFAULT_MAX_PROCESSES = 256;                     // Agents spawn git, shells, tools
constexpr size_t DEFAULT_MAX_OPEN_FILES = 1024;
constexpr size_t DEFAULT_MAX_FILE_SIZE_MB = 512;
constexpr double DEFAULT_CPU_CORES = 0.5;                         // Cluster cpu limit

// Timeouts
constexpr int DEFAULT_SETUP_TIMEOUT_SECONDS = 300;                // Clone + environment setup
constexpr int DEFAULT_EXECUTION_TIMEOUT_SECONDS = 3600;           // Whole variation
constexpr int DEFAULT_CONTROL_CALL_TIMEOUT_SECONDS = 60;          // One kubectl/module call
constexpr int DEFAULT_STATUS_SETTLE_SECONDS = 30;                 // Wait for final job status
constexpr int DEFAULT_TERMINATE_GRACE_MS = 2000;                  // SIGTERM -> SIGKILL
constexpr int DEFAULT_RECORD_RETENTION_SECONDS = 3600;            // Exit codes of torn-down sandboxes

// Orchestrator
constexpr int DEFAULT_MIN_VARIATIONS = 1;
constexpr int DEFAULT_MAX_VARIATIONS = 5;
constexpr size_t DEFAULT_MIN_PROMPT_LENGTH = 1;
constexpr size_t DEFAULT_MAX_PROMPT_LENGTH = 2000;
constexpr int DEFAULT_PROVISION_ATTEMPTS = 3;                     // Transient failures only
constexpr int DEFAULT_PROVISION_BACKOFF_MS = 2000;                // Fixed backoff
constexpr int DEFAULT_MAX_CONCURRENT_RUNS = 10;
constexpr int DEFAULT_MAX_CONCURRENT_SANDBOXES = 20;

// Event relay
constexpr size_t DEFAULT_STREAM_RETENTION = 1000;                 // Entries kept per channel
constexpr int DEFAULT_RELAY_CALL_TIMEOUT_MS = 2000;               // Fail fast
constexpr int RELAY_READ_BLOCK_MS = 1000;                         // Long-poll slice
constexpr int MAX_RELAY_READ_BLOCK_MS = 30000;
constexpr size_t MAX_RELAY_READ_COUNT = 500;                      // Entries per read
constexpr int DEFAULT_STREAM_EXPIRY_SECONDS = 3600;               // Delete finished run streams

// Live delivery
constexpr int DEFAULT_HEARTBEAT_INTERVAL_SECONDS = 30;
constexpr size_t DEFAULT_CONNECTION_QUEUE_CAPACITY = 1024;
constexpr int DEFAULT_CLOSE_GRACE_SECONDS = 5;
constexpr int DELIVERY_POLL_MS = 250;                             // Writer/reader wake-up slice
constexpr size_t REGISTRY_BUCKETS = 16;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                      // Initial HTTP buffer
constexpr size_t MAX_REQUEST_SIZE = 1024 * 1024;                  // 1MB max request
constexpr size_t MAX_LINE_LENGTH = 64 * 1024;                     // Longer lines are split
constexpr size_t MAX_WS_FRAME_SIZE = 1024 * 1024;

// Network
constexpr int DEFAULT_PORT = 8000;                                // API server port
constexpr int DEFAULT_RELAY_PORT = 6390;                          // agentrun-relayd port
constexpr int LISTEN_BACKLOG = 128;                               // Socket listen backlog

} // namespace agentrun
