#include "coldstash/app/config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace coldstash {

namespace {

const char* const USAGE =
    "Usage: coldstash <command> --target <uri> [options] [operands...]\n"
    "\n"
    "Commands:\n"
    "  upload <file>...                 Upload files as volumes\n"
    "  list [prefix]                    List object names under the target\n"
    "  restore <key>...                 Make archived objects readable\n"
    "  download <key> <path>            Restore if needed, then download one object\n"
    "  delete <key>...                  Delete objects\n"
    "\n"
    "Target:\n"
    "  --target <uri>                   s3://bucket[/prefix] or file:///path\n"
    "  --config <path>                  JSON config file\n"
    "\n"
    "S3 options:\n"
    "  --region <region>                Region (default: us-east-1, or AWS_REGION env)\n"
    "  --endpoint <url>                 Custom endpoint (MinIO, Ceph RGW)\n"
    "  --path-style                     Use path-style bucket addressing\n"
    "  --no-verify-ssl                  Skip SSL verification\n"
    "  --ca-cert <path>                 CA certificate for SSL\n"
    "  --storage-class <class>          Storage class for uploads (e.g. GLACIER)\n"
    "  --restore-days <N>               Days a restored copy stays readable (default: 3)\n"
    "  --restore-tier <tier>            Bulk, Standard or Expedited (default: Bulk)\n"
    "  Credentials come from AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and\n"
    "  AWS_SESSION_TOKEN.\n"
    "\n"
    "Upload options:\n"
    "  --chunk-size-mb <N>              Multipart part size in MB (default: 10)\n"
    "  --max-parallel-uploads <N>       Concurrent uploads, 1-256 (default: 4)\n"
    "  --max-backoff-secs <N>           Longest sleep between retries (default: 1800)\n"
    "  --max-retry-secs <N>             Retry budget per volume (default: 43200)\n"
    "  --abort-on-error                 Stop uploading after the first failed volume\n"
    "\n"
    "Process:\n"
    "  --verbose                        Verbose output\n"
    "  --log-file <path>                Log file path\n"
    "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
    "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
    "  --help                           Show this help\n";

bool is_known_command(const std::string& command) {
    return command == "upload" || command == "list" || command == "restore" ||
           command == "download" || command == "delete";
}

// JSON params may be written as strings, numbers or booleans
std::string param_value(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

// std::stoull accepts "-1" and wraps it, so parse signed and range-check
uint64_t parse_positive(const std::string& value, const char* name) {
    size_t used = 0;
    long long n = std::stoll(value, &used);
    if (used != value.size() || n <= 0) {
        throw std::invalid_argument(std::string(name) + " must be a positive integer, got \"" + value + "\"");
    }
    return static_cast<uint64_t>(n);
}

uint64_t json_positive(const nlohmann::json& j, const char* key) {
    auto n = j[key].get<int64_t>();
    if (n <= 0) {
        throw std::invalid_argument(std::string(key) + " must be a positive integer, got " + j[key].dump());
    }
    return static_cast<uint64_t>(n);
}

}  // namespace

std::optional<BackupConfig> BackupConfig::from_args(int argc, char* argv[]) {
    BackupConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--target") {
                auto* v = next_arg(i, "--target");
                if (!v) return std::nullopt;
                config.target_uri = v;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--chunk-size-mb") {
                auto* v = next_arg(i, "--chunk-size-mb");
                if (!v) return std::nullopt;
                config.upload_chunk_size = parse_positive(v, "--chunk-size-mb") * 1024ULL * 1024;
            } else if (arg == "--max-parallel-uploads") {
                auto* v = next_arg(i, "--max-parallel-uploads");
                if (!v) return std::nullopt;
                config.max_parallel_uploads = parse_positive(v, "--max-parallel-uploads");
            } else if (arg == "--max-backoff-secs") {
                auto* v = next_arg(i, "--max-backoff-secs");
                if (!v) return std::nullopt;
                config.max_backoff = std::chrono::seconds(std::stoll(v));
            } else if (arg == "--max-retry-secs") {
                auto* v = next_arg(i, "--max-retry-secs");
                if (!v) return std::nullopt;
                config.max_retry = std::chrono::seconds(std::stoll(v));
            } else if (arg == "--abort-on-error") {
                config.abort_on_error = true;
            } else if (arg == "--region") {
                auto* v = next_arg(i, "--region");
                if (!v) return std::nullopt;
                config.params["region"] = v;
            } else if (arg == "--endpoint") {
                auto* v = next_arg(i, "--endpoint");
                if (!v) return std::nullopt;
                config.params["endpoint"] = v;
            } else if (arg == "--path-style") {
                config.params["use_path_style"] = "true";
            } else if (arg == "--no-verify-ssl") {
                config.params["verify_ssl"] = "false";
            } else if (arg == "--ca-cert") {
                auto* v = next_arg(i, "--ca-cert");
                if (!v) return std::nullopt;
                config.params["ca_cert_path"] = v;
            } else if (arg == "--storage-class") {
                auto* v = next_arg(i, "--storage-class");
                if (!v) return std::nullopt;
                config.params["storage_class"] = v;
            } else if (arg == "--restore-days") {
                auto* v = next_arg(i, "--restore-days");
                if (!v) return std::nullopt;
                config.params["restore_days"] = v;
            } else if (arg == "--restore-tier") {
                auto* v = next_arg(i, "--restore-tier");
                if (!v) return std::nullopt;
                config.params["restore_tier"] = v;
            } else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = parse_positive(v, "--metrics-interval");
            } else if (arg == "--help" || arg == "-h") {
                std::cerr << USAGE;
                return std::nullopt;
            } else if (arg.compare(0, 2, "--") == 0) {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            } else if (config.command.empty()) {
                config.command = arg;
            } else {
                config.operands.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool BackupConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("target")) target_uri = j["target"].get<std::string>();
        if (j.contains("chunk_size_mb"))
            upload_chunk_size = json_positive(j, "chunk_size_mb") * 1024ULL * 1024;
        if (j.contains("max_parallel_uploads"))
            max_parallel_uploads = json_positive(j, "max_parallel_uploads");
        if (j.contains("max_backoff_secs"))
            max_backoff = std::chrono::seconds(j["max_backoff_secs"].get<int64_t>());
        if (j.contains("max_retry_secs"))
            max_retry = std::chrono::seconds(j["max_retry_secs"].get<int64_t>());
        if (j.contains("abort_on_error")) abort_on_error = j["abort_on_error"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = json_positive(j, "metrics_interval");

        if (j.contains("params") && j["params"].is_object()) {
            for (auto& [key, val] : j["params"].items()) {
                params[key] = param_value(val);
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void BackupConfig::apply_defaults() {
    auto uri = TargetUri::parse(target_uri);
    if (!uri || uri->scheme != "s3") return;

    auto from_env = [&](const char* key, const char* env) {
        if (params.count(key) == 0 || params[key].empty()) {
            if (const char* v = std::getenv(env)) {
                params[key] = v;
            }
        }
    };
    from_env("access_key", "AWS_ACCESS_KEY_ID");
    from_env("secret_key", "AWS_SECRET_ACCESS_KEY");
    from_env("session_token", "AWS_SESSION_TOKEN");
    from_env("region", "AWS_REGION");
    from_env("region", "AWS_DEFAULT_REGION");
}

std::string BackupConfig::validate() const {
    if (command.empty()) return "command is required (upload, list, restore, download, delete)";
    if (!is_known_command(command)) return "unknown command: " + command;
    if (target_uri.empty()) return "target URI is required (--target)";
    if (!TargetUri::parse(target_uri)) return "malformed target URI: " + target_uri;
    if (upload_chunk_size == 0) return "chunk size must be > 0";
    if (max_parallel_uploads == 0) return "max_parallel_uploads must be > 0";
    if (max_parallel_uploads > constants::MAX_PARALLEL_UPLOADS)
        return "max_parallel_uploads must be at most " + std::to_string(constants::MAX_PARALLEL_UPLOADS);
    if (max_backoff.count() <= 0) return "max_backoff_secs must be > 0";
    if (max_retry.count() < 0) return "max_retry_secs must be >= 0";
    if (metrics_interval_secs == 0) return "metrics_interval must be > 0";

    if (command == "upload" && operands.empty()) return "upload requires at least one file";
    if ((command == "restore" || command == "delete") && operands.empty())
        return command + " requires at least one key";
    if (command == "download" && operands.size() != 2) return "download requires <key> <path>";
    if (command == "list" && operands.size() > 1) return "list takes at most one prefix";
    return {};
}

BackendConfig BackupConfig::to_backend_config() const {
    BackendConfig bc;
    bc.target_uri = target_uri;
    bc.upload_chunk_size = upload_chunk_size;
    bc.max_parallel_uploads = max_parallel_uploads;
    bc.upload_tokens = std::make_shared<TokenPool>(max_parallel_uploads);
    bc.params = params;
    return bc;
}

JobInfo BackupConfig::to_job_info(MetricsExporter* metrics) const {
    JobInfo job;
    job.max_parallel_uploads = max_parallel_uploads;
    job.max_backoff_time = std::chrono::duration_cast<std::chrono::milliseconds>(max_backoff);
    job.max_retry_time = std::chrono::duration_cast<std::chrono::milliseconds>(max_retry);
    job.failure_policy = abort_on_error ? FailurePolicy::AbortOnFirstError : FailurePolicy::DrainAll;
    job.metrics = metrics;
    return job;
}

}  // namespace coldstash
