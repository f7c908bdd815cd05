#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace coldstash {

/// Backup run metrics, written as a Prometheus textfile for node_exporter.
///
/// Writes go to "<path>.tmp" first and are renamed into place, so a scrape
/// never sees a half-written file. stop() always leaves a final snapshot.
class MetricsExporter {
public:
    using Labels = std::map<std::string, std::string>;

    /// Marks one upload attempt in flight and times it until destroyed.
    class AttemptScope {
    public:
        explicit AttemptScope(MetricsExporter* metrics);
        ~AttemptScope();

        AttemptScope(const AttemptScope&) = delete;
        AttemptScope& operator=(const AttemptScope&) = delete;

    private:
        MetricsExporter* metrics_;
        std::chrono::steady_clock::time_point started_;
    };

    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const Labels& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void start();
    void stop();

    void record_upload(bool ok, uint64_t bytes);
    void record_retry();
    void record_restore(bool ok, std::chrono::duration<double> waited);

    /// Current registry contents in text exposition format.
    std::string snapshot() const;

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;
    Labels labels_;

    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* uploads_ = nullptr;
    prometheus::Family<prometheus::Counter>* restores_ = nullptr;
    prometheus::Counter* upload_bytes_ = nullptr;
    prometheus::Counter* upload_retries_ = nullptr;
    prometheus::Gauge* in_flight_ = nullptr;
    prometheus::Histogram* attempt_seconds_ = nullptr;
    prometheus::Histogram* restore_wait_seconds_ = nullptr;

    std::thread writer_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool running_ = false;
};

}  // namespace coldstash
