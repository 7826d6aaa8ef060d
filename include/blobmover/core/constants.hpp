#pragma once

#include <cstddef>
#include <cstdint>

namespace blobmover::constants {

// Chunking defaults
constexpr uint64_t DEFAULT_CHUNK_SIZE = 4 * 1024 * 1024;                 // 4MB
constexpr uint64_t DEFAULT_SINGLE_SHOT_THRESHOLD = 64 * 1024 * 1024;     // 64MB
constexpr uint64_t MAX_CHUNK_SIZE = 100 * 1024 * 1024;                   // service block limit
constexpr size_t DEFAULT_MAX_CHUNK_COUNT = 50000;                        // service block count limit
constexpr uint64_t PAGE_ALIGNMENT = 512;

// Range MD5 is only served for ranges up to 4MB
constexpr uint64_t MAX_RANGE_MD5_SIZE = 4 * 1024 * 1024;

// Concurrency
constexpr size_t DEFAULT_MAX_CONNECTIONS = 1;
constexpr size_t MAX_CONNECTIONS_LIMIT = 64;

// Retry defaults
constexpr uint32_t DEFAULT_MAX_RETRY_ATTEMPTS = 5;
constexpr int DEFAULT_RETRY_BASE_WAIT_MS = 1000;
constexpr int DEFAULT_RETRY_MAX_WAIT_MS = 30000;
constexpr double DEFAULT_RETRY_JITTER_FRACTION = 0.25;

// HTTP request defaults
constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 30000;
constexpr int DEFAULT_REQUEST_TIMEOUT_SECONDS = 300;

// Service protocol
constexpr const char* STORAGE_API_VERSION = "2020-10-02";

} // namespace blobmover::constants
