#pragma once

#include <cstddef>  // for size_t

namespace droidrun {

// Request limits
constexpr size_t MAX_REQUEST_SIZE = 32 * 1024 * 1024;            // 32MB max request (patches)
constexpr size_t MAX_RESPONSE_SIZE = 64 * 1024 * 1024;           // 64MB max response (screenshots)
constexpr size_t MAX_BUILD_OUTPUT_SIZE = 4 * 1024 * 1024;        // 4MB of build transcript kept
constexpr size_t MAX_TICKET_LENGTH = 128;

// Time limits
constexpr int DEFAULT_BUILD_TIMEOUT_SECONDS = 300;               // Worker-side watchdog per step
constexpr int RESULTS_TTL_SECONDS = 60 * 30;                     // Result records kept 30 minutes
constexpr int HOUSEKEEPING_INTERVAL_SECONDS = 60;                // Result GC / registry eviction
constexpr int REGISTRY_TTL_SECONDS = 60 * 30;                    // Terminal registry rows kept
constexpr int BALANCER_TASK_DEADLINE_SECONDS = 60 * 10;          // Running rows marked Timeout after
constexpr int WORKER_CONNECT_TIMEOUT_MS = 2000;
constexpr int WORKER_IO_TIMEOUT_MS = 10000;

// Client polling (matches the browser client)
constexpr int CLIENT_POLL_INTERVAL_MS = 3000;
constexpr int CLIENT_POLL_TIMEOUT_SECONDS = 90;
constexpr int CLIENT_MAX_TRANSPORT_FAILURES = 3;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer

// Network
constexpr int DEFAULT_WORKER_PORT = 8080;
constexpr int DEFAULT_BALANCER_PORT = 8090;
constexpr int LISTEN_BACKLOG = 64;                               // Socket listen backlog

// Disk layout
constexpr const char* RESULT_OUT_DIR = "out";
constexpr const char* RESULT_JSON_NAME = "result.json";

} // namespace droidrun
