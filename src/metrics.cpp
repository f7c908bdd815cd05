#include "coldstash/app/metrics.hpp"
#include "coldstash/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace coldstash {

namespace {

const prometheus::Histogram::BucketBoundaries ATTEMPT_BUCKETS = {
    0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600, 1800};

// Archive restores run from minutes (expedited) to two days (bulk)
const prometheus::Histogram::BucketBoundaries RESTORE_BUCKETS = {
    1, 60, 300, 900, 3600, 4 * 3600, 12 * 3600, 24 * 3600, 48 * 3600};

const char* result_label(bool ok) { return ok ? "success" : "failure"; }

}  // namespace

// ============================================================================
// AttemptScope
// ============================================================================

MetricsExporter::AttemptScope::AttemptScope(MetricsExporter* metrics)
    : metrics_(metrics), started_(std::chrono::steady_clock::now()) {
    if (metrics_) metrics_->in_flight_->Increment();
}

MetricsExporter::AttemptScope::~AttemptScope() {
    if (!metrics_) return;
    metrics_->in_flight_->Decrement();
    std::chrono::duration<double> took = std::chrono::steady_clock::now() - started_;
    metrics_->attempt_seconds_->Observe(took.count());
}

// ============================================================================
// MetricsExporter
// ============================================================================

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const Labels& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , labels_(labels)
    , registry_(std::make_shared<prometheus::Registry>()) {
    auto counter = [this](const char* name, const char* help) -> prometheus::Family<prometheus::Counter>& {
        return prometheus::BuildCounter().Name(name).Help(help).Labels(labels_).Register(*registry_);
    };
    auto histogram = [this](const char* name, const char* help) -> prometheus::Family<prometheus::Histogram>& {
        return prometheus::BuildHistogram().Name(name).Help(help).Labels(labels_).Register(*registry_);
    };

    uploads_ = &counter("coldstash_uploads_total", "Volumes uploaded, by final result");
    restores_ = &counter("coldstash_restores_total", "Archive restore runs, by result");
    upload_bytes_ = &counter("coldstash_upload_bytes_total", "Total volume bytes durably uploaded").Add({});
    upload_retries_ = &counter("coldstash_upload_retries_total",
                               "Upload attempts retried after a transient error").Add({});

    // Pre-create both result series so they show up as zero before the first event
    uploads_->Add({{"result", "success"}});
    uploads_->Add({{"result", "failure"}});
    restores_->Add({{"result", "success"}});
    restores_->Add({{"result", "failure"}});

    in_flight_ = &prometheus::BuildGauge()
        .Name("coldstash_uploads_in_flight")
        .Help("Upload attempts currently running")
        .Labels(labels_)
        .Register(*registry_)
        .Add({});

    attempt_seconds_ = &histogram("coldstash_upload_duration_seconds",
                                  "Duration of a single upload attempt in seconds").Add({}, ATTEMPT_BUCKETS);
    restore_wait_seconds_ = &histogram("coldstash_restore_wait_seconds",
                                       "Time spent waiting for archived objects to become readable")
                                 .Add({}, RESTORE_BUCKETS);
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::record_upload(bool ok, uint64_t bytes) {
    uploads_->Add({{"result", result_label(ok)}}).Increment();
    if (ok) upload_bytes_->Increment(static_cast<double>(bytes));
}

void MetricsExporter::record_retry() {
    upload_retries_->Increment();
}

void MetricsExporter::record_restore(bool ok, std::chrono::duration<double> waited) {
    restores_->Add({{"result", result_label(ok)}}).Increment();
    restore_wait_seconds_->Observe(waited.count());
}

std::string MetricsExporter::snapshot() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void MetricsExporter::start() {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
    writer_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    {
        std::lock_guard lock(mutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (writer_.joinable()) {
        writer_.join();
    }
    write_file();
}

void MetricsExporter::writer_loop() {
    std::unique_lock lock(mutex_);
    while (running_) {
        if (wake_.wait_for(lock, write_interval_, [this] { return !running_; })) {
            break;
        }
        lock.unlock();
        write_file();
        lock.lock();
    }
}

void MetricsExporter::write_file() {
    auto staging = prom_file_path_;
    staging += ".tmp";

    {
        std::ofstream out(staging, std::ios::trunc);
        out << snapshot();
        out.close();
        if (!out) {
            log_warn("Cannot write metrics snapshot %s", staging.c_str());
            return;
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot move metrics snapshot into %s: %s", prom_file_path_.c_str(), ec.message().c_str());
        std::filesystem::remove(staging, ec);
    }
}

}  // namespace coldstash
