#pragma once

#include <cstddef>  // for size_t

namespace gradebox {

// Memory limits
constexpr size_t DEFAULT_MEMORY_LIMIT_MB = 128;                  // Per-run address space
constexpr size_t MIN_MEMORY_LIMIT_MB = 16;                       // Interpreter will not start below this
constexpr size_t MAX_MEMORY_LIMIT_MB = 512;                      // Server-enforced ceiling
constexpr size_t MAX_OUTPUT_SIZE = 1024 * 1024;                  // 1MB captured per stream
constexpr size_t MAX_REQUEST_SIZE = 10 * 1024 * 1024;            // 10MB max request
constexpr size_t MAX_CONTENT_LENGTH_DIGITS = 12;                 // Longer values are over the limit anyway
constexpr size_t MAX_CODE_SIZE = 64 * 1024;                      // 64KB of source
constexpr size_t MAX_SCRATCH_FILE_SIZE = 16 * 1024 * 1024;       // RLIMIT_FSIZE inside scratch

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 10;                      // Per test case, wall clock
constexpr int MAX_TIMEOUT_SECONDS = 30;                          // Server-enforced ceiling
constexpr int SYNTAX_CHECK_TIMEOUT_SECONDS = 5;
constexpr int REQUEST_CEILING_FACTOR = 3;                        // Outer bound: 3 x timeout x tests
constexpr int REQUEST_CEILING_SLACK_SECONDS = 5;
constexpr int MAX_REQUEST_SECONDS = 300;                         // Absolute outer bound
constexpr int POLL_INTERVAL_MS = 20;                             // Runner/watcher poll slice

// Process limits
constexpr int MAX_PROCESSES_PER_RUN = 32;                        // Max threads/processes
constexpr int MAX_OPEN_FILES = 64;                               // Max file descriptors
constexpr size_t MAX_TEST_CASES = 50;
constexpr size_t MAX_HINT_LINE_LENGTH = 1000;                    // Longer source lines are cut before hint matching

// Concurrency
constexpr int MAX_CONCURRENT_EXECUTIONS = 4;                     // System-wide live sandboxes
constexpr int MAX_QUEUED_REQUESTS = 32;                          // Waiting for a slot
constexpr int QUEUE_WAIT_SECONDS = 5;                            // Then fail fast with 503
constexpr size_t MAX_STORED_SUBMISSIONS = 1000;

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer

// Network
constexpr int DEFAULT_PORT = 8083;                               // Default server port
constexpr int LISTEN_BACKLOG = 64;                               // Socket listen backlog
constexpr int CLIENT_READ_TIMEOUT_SECONDS = 30;                  // Idle client read timeout
constexpr int RETRY_AFTER_SECONDS = 2;                           // Hint sent with 503 busy

} // namespace gradebox
