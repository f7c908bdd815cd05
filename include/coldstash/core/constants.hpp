#pragma once

#include <cstddef>
#include <cstdint>

namespace coldstash::constants {

// Upload defaults
constexpr uint64_t DEFAULT_UPLOAD_CHUNK_SIZE = 10 * 1024 * 1024;      // 10MB
constexpr uint64_t MIN_UPLOAD_CHUNK_SIZE = 5 * 1024 * 1024;           // S3 minimum part size
constexpr size_t DEFAULT_MAX_PARALLEL_UPLOADS = 4;
constexpr size_t MAX_PARALLEL_UPLOADS = 256;                          // two worker threads each
constexpr size_t DEFAULT_PART_CONCURRENCY = 4;
constexpr size_t DEFAULT_OUTPUT_BUFFER = 64;

// Retry defaults (seconds)
constexpr int64_t DEFAULT_MAX_BACKOFF_SECONDS = 30 * 60;               // 30 minutes
constexpr int64_t DEFAULT_MAX_RETRY_SECONDS = 12 * 60 * 60;            // 12 hours
constexpr int64_t BACKOFF_INITIAL_INTERVAL_MS = 500;
constexpr double BACKOFF_MULTIPLIER = 1.5;
constexpr double BACKOFF_RANDOMIZATION = 0.5;

// Restore defaults
constexpr int DEFAULT_RESTORE_DAYS = 3;
constexpr const char* DEFAULT_RESTORE_TIER = "Bulk";
constexpr int64_t DEFAULT_RESTORE_POLL_INTERVAL_MS = 30 * 1000;        // 30s
constexpr int64_t DEFAULT_RESTORE_MAX_POLL_INTERVAL_MS = 15 * 60 * 1000;  // 15 min
constexpr int64_t DEFAULT_RESTORE_MAX_WAIT_MS = 48LL * 60 * 60 * 1000;    // 48 hours

// Listing
constexpr int DEFAULT_LIST_PAGE_SIZE = 1000;

// S3 defaults
constexpr const char* DEFAULT_S3_REGION = "us-east-1";
constexpr size_t MD5_DIGEST_SIZE = 16;

} // namespace coldstash::constants
