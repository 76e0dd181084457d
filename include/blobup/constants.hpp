#pragma once

#include <cstddef>
#include <cstdint>

namespace blobup::constants {

// Service defaults
constexpr const char* DEFAULT_STATE_DIR = "/var/lib/blobup";
constexpr const char* DEFAULT_SOCKET_NAME = "blobup.sock";
constexpr size_t DEFAULT_WORKER_THREADS = 32;

// Upload limits
constexpr uint64_t DEFAULT_CHUNK_SIZE = 50ULL * 1024 * 1024;                 // 50MB
constexpr uint64_t DEFAULT_MAX_FILE_SIZE = 1024ULL * 1024 * 1024 * 1024;     // 1TB

// Block id layout: base64(<upload_id>_<6-digit index>)
constexpr int BLOCK_INDEX_DIGITS = 6;
constexpr uint32_t MAX_BLOCK_INDEX = 999999;
constexpr uint64_t MAX_BLOCKS_PER_UPLOAD = uint64_t(MAX_BLOCK_INDEX) + 1;

// Azure rejects a block list longer than this
constexpr uint64_t AZURE_MAX_BLOCKS_PER_BLOB = 50000;

// Retry policy for blob backend calls
constexpr int DEFAULT_RETRY_ATTEMPTS = 3;
constexpr int DEFAULT_RETRY_BASE_DELAY_MS = 1000;

// Conditional-write retry budget for session mutations
constexpr int DEFAULT_CAS_MAX_ATTEMPTS = 32;

// Retention: matches the provider's 7-day expiry of uncommitted blocks
constexpr int64_t DEFAULT_SESSION_TTL_SECONDS = 7 * 86400;
constexpr int64_t DEFAULT_SWEEP_INTERVAL_SECONDS = 3600;

// Reporting
constexpr size_t DEFAULT_STATS_INTERVAL_SECONDS = 60;
constexpr size_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

// Request protocol
constexpr size_t MAX_REQUEST_LINE = 8192;
constexpr int CLIENT_READ_TIMEOUT_SECONDS = 300;

// Blob naming limits (Azure)
constexpr size_t MAX_BLOB_NAME_LENGTH = 1024;
constexpr size_t MAX_BLOB_NAME_SEGMENTS = 254;

// HTTP request defaults
constexpr int DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 30;
constexpr int DEFAULT_HTTP_REQUEST_TIMEOUT_SECONDS = 300;

} // namespace blobup::constants
