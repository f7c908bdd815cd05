#pragma once

#include "coldstash/backup/upload_chain.hpp"
#include "coldstash/core/constants.hpp"
#include "coldstash/storage/backend.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace coldstash {

class MetricsExporter;

/// Configuration for one coldstash invocation.
struct BackupConfig {
    // Command and its operands (files for upload, keys for restore/delete...)
    std::string command;
    std::vector<std::string> operands;

    // Target, e.g. s3://bucket/host1/ or file:///mnt/backup
    std::string target_uri;

    // Upload tuning
    uint64_t upload_chunk_size = constants::DEFAULT_UPLOAD_CHUNK_SIZE;
    size_t max_parallel_uploads = constants::DEFAULT_MAX_PARALLEL_UPLOADS;
    std::chrono::seconds max_backoff{constants::DEFAULT_MAX_BACKOFF_SECONDS};
    std::chrono::seconds max_retry{constants::DEFAULT_MAX_RETRY_SECONDS};
    bool abort_on_error = false;

    // Provider options handed to the backend (region, endpoint, credentials,
    // storage_class, restore_* tuning...)
    std::map<std::string, std::string> params;

    // Process
    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<BackupConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in S3 credentials and region from the AWS_* environment when the
    /// target is s3 and they were not given explicitly.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    BackendConfig to_backend_config() const;
    JobInfo to_job_info(MetricsExporter* metrics = nullptr) const;
};

}  // namespace coldstash
