#include "coldstash/app/config.hpp"
#include "coldstash/app/metrics.hpp"
#include "coldstash/backup/upload_chain.hpp"
#include "coldstash/core/log.hpp"
#include "coldstash/storage/backend.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace coldstash;

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool is_secret_param(const std::string& key) {
    return key.find("key") != std::string::npos || key.find("secret") != std::string::npos ||
           key.find("token") != std::string::npos || key.find("credential") != std::string::npos;
}

int run_upload(const BackupConfig& config, const std::shared_ptr<Context>& ctx,
               Backend& backend, MetricsExporter* metrics) {
    auto inputs = std::make_shared<Channel<VolumePtr>>();
    bool source_errors = false;

    for (const auto& file : config.operands) {
        std::filesystem::path path(file);
        Status status;
        auto volume = FileVolume::create(path, path.filename().string(), &status);
        if (!volume) {
            log_error("Skipping %s: %s", file.c_str(), status.to_string().c_str());
            source_errors = true;
            continue;
        }
        if (!inputs->send(volume)) break;
    }
    inputs->close();

    auto chain = run_upload_chain(ctx, inputs, backend, config.to_job_info(metrics), config.target_uri);

    size_t uploaded = 0;
    while (auto volume = chain.outputs->receive()) {
        std::cout << (*volume)->object_name() << std::endl;
        ++uploaded;
    }

    Status status = chain.join->wait();
    log_info("Uploaded %zu of %zu volume(s) to %s", uploaded, config.operands.size(),
             config.target_uri.c_str());
    if (!status.ok()) {
        log_error("Upload run failed: %s", status.to_string().c_str());
        return 1;
    }
    return source_errors ? 1 : 0;
}

int run_list(const BackupConfig& config, const std::shared_ptr<Context>& ctx, Backend& backend) {
    std::string prefix = config.operands.empty() ? "" : config.operands.front();
    auto result = backend.list(*ctx, prefix);
    if (!result.ok()) {
        log_error("List failed: %s", result.status.to_string().c_str());
        return 1;
    }
    for (const auto& name : result.names) {
        std::cout << name << std::endl;
    }
    return 0;
}

Status restore_keys(const std::vector<std::string>& keys, const std::shared_ptr<Context>& ctx,
                    Backend& backend, MetricsExporter* metrics) {
    auto start = std::chrono::steady_clock::now();
    Status status = backend.pre_download(*ctx, keys);
    if (metrics) {
        metrics->record_restore(status.ok(), std::chrono::steady_clock::now() - start);
    }
    return status;
}

int run_restore(const BackupConfig& config, const std::shared_ptr<Context>& ctx,
                Backend& backend, MetricsExporter* metrics) {
    Status status = restore_keys(config.operands, ctx, backend, metrics);
    if (!status.ok()) {
        log_error("Restore failed: %s", status.to_string().c_str());
        return 1;
    }
    log_info("%zu object(s) readable", config.operands.size());
    return 0;
}

int run_download(const BackupConfig& config, const std::shared_ptr<Context>& ctx,
                 Backend& backend, MetricsExporter* metrics) {
    const std::string& key = config.operands[0];
    std::filesystem::path dest(config.operands[1]);

    Status status = restore_keys({key}, ctx, backend, metrics);
    if (!status.ok()) {
        log_error("Restore of %s failed: %s", key.c_str(), status.to_string().c_str());
        return 1;
    }

    auto result = backend.download(*ctx, key);
    if (!result.ok()) {
        log_error("Download of %s failed: %s", key.c_str(), result.status.to_string().c_str());
        return 1;
    }

    auto tmp_path = dest;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            log_error("Cannot create %s", tmp_path.c_str());
            return 1;
        }
        out << result.stream->rdbuf();
        if (!out.good()) {
            log_error("Write to %s failed", tmp_path.c_str());
            return 1;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, dest, ec);
    if (ec) {
        log_error("Cannot rename %s: %s", tmp_path.c_str(), ec.message().c_str());
        return 1;
    }
    log_info("Downloaded %s to %s", key.c_str(), dest.c_str());
    return 0;
}

int run_delete(const BackupConfig& config, const std::shared_ptr<Context>& ctx, Backend& backend) {
    int rc = 0;
    for (const auto& key : config.operands) {
        Status status = backend.remove(*ctx, key);
        if (!status.ok()) {
            log_error("Delete of %s failed: %s", key.c_str(), status.to_string().c_str());
            rc = 1;
            if (status.code == ErrorCode::Cancelled) break;
        } else {
            log_info("Deleted %s", key.c_str());
        }
    }
    return rc;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = BackupConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        } else {
            std::cerr << "Warning: cannot open log file " << config.log_file << "\n";
        }
    }

    set_verbose_logging(config.verbose);

    log_debug("coldstash %s", config.command.c_str());
    log_debug("  target: %s", config.target_uri.c_str());
    for (auto& [k, v] : config.params) {
        // Mask secrets in log output
        log_debug("  %s: %s", k.c_str(), is_secret_param(k) ? "****" : v.c_str());
    }
    log_debug("  chunk-size: %llu MB, max-parallel-uploads: %zu",
              static_cast<unsigned long long>(config.upload_chunk_size / (1024 * 1024)),
              config.max_parallel_uploads);

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    auto ctx = Context::background();

    // Turn the signal flag into a cancellation outside signal context
    std::atomic<bool> finished{false};
    std::thread signal_watcher([&] {
        while (!finished.load()) {
            if (g_shutdown_requested) {
                log_warn("Interrupted, cancelling");
                ctx->cancel();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    std::unique_ptr<MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"command", config.command}});
        metrics->start();
    }

    int rc = 1;
    auto resolved = get_backend_for_uri(config.target_uri);
    if (!resolved.status.ok()) {
        log_error("%s", resolved.status.to_string().c_str());
    } else {
        Backend& backend = *resolved.backend;
        Status status = backend.init(*ctx, config.to_backend_config());
        if (!status.ok()) {
            log_error("Cannot initialize %s backend: %s", backend.type_name().c_str(),
                      status.to_string().c_str());
        } else {
            if (config.command == "upload") {
                rc = run_upload(config, ctx, backend, metrics.get());
            } else if (config.command == "list") {
                rc = run_list(config, ctx, backend);
            } else if (config.command == "restore") {
                rc = run_restore(config, ctx, backend, metrics.get());
            } else if (config.command == "download") {
                rc = run_download(config, ctx, backend, metrics.get());
            } else if (config.command == "delete") {
                rc = run_delete(config, ctx, backend);
            }

            status = backend.close();
            if (!status.ok()) {
                log_error("Close failed: %s", status.to_string().c_str());
                rc = 1;
            }
        }
    }

    if (metrics) {
        metrics->stop();
    }

    finished = true;
    signal_watcher.join();
    return rc;
}
