#pragma once

#include <cstddef>  // for size_t

namespace calcrun {

// Source limits
constexpr size_t DEFAULT_MAX_CODE_CHARS = 12000;                  // Longest accepted snippet
constexpr size_t DEFAULT_MAX_OUTPUT_CHARS = 12000;                // Per stream, after decoding

// Time limits
constexpr double DEFAULT_TIMEOUT_SECONDS = 6.0;
constexpr double MIN_TIMEOUT_SECONDS = 0.5;
constexpr double DEFAULT_MAX_TIMEOUT_SECONDS = 20.0;

// Memory limits
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 512 * 1024 * 1024;  // 512MB address space

// Process limits
constexpr int DEFAULT_MAX_CONCURRENT_EXECUTIONS = 4;              // Live sandboxed processes

// Capture limits
constexpr size_t MAX_CAPTURE_BYTES = 10 * 1024 * 1024;            // Raw bytes kept per stream
constexpr size_t PIPE_BUFFER_SIZE = 4096;                         // Read buffer size
constexpr int POLL_INTERVAL_MS = 20;                              // Wait granularity

// Markers
constexpr const char* TRUNCATION_MARKER = "\n... [output truncated]";

} // namespace calcrun
