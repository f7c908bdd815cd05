#include "coldstash/backup/upload_chain.hpp"
#include "coldstash/app/metrics.hpp"
#include "coldstash/core/backoff.hpp"
#include "coldstash/core/log.hpp"

#include <algorithm>
#include <optional>

namespace coldstash {

// ============================================================================
// JoinHandle
// ============================================================================

JoinHandle::~JoinHandle() {
    std::lock_guard<std::mutex> lock(join_mutex_);
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

Status JoinHandle::wait() {
    {
        std::lock_guard<std::mutex> lock(join_mutex_);
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
    }
    std::lock_guard<std::mutex> lock(result_mutex_);
    return first_error_;
}

void JoinHandle::record(const Status& status) {
    std::lock_guard<std::mutex> lock(result_mutex_);
    if (first_error_.ok()) {
        first_error_ = status;
    }
}

void JoinHandle::record_cancelled(const Status& status) {
    std::lock_guard<std::mutex> lock(result_mutex_);
    if (first_error_.code != ErrorCode::Cancelled) {
        if (!first_error_.ok()) {
            log_debug("Run cancelled; superseding earlier error: %s", first_error_.to_string().c_str());
        }
        first_error_ = status;
    }
}

// ============================================================================
// UploadChainRunner
// ============================================================================

/// State shared by the workers of one run.
class UploadChainRunner {
public:
    UploadChainRunner(std::shared_ptr<Context> ctx,
                      std::shared_ptr<Channel<VolumePtr>> inputs,
                      std::shared_ptr<Channel<VolumePtr>> outputs,
                      Backend& backend,
                      const JobInfo& job,
                      std::string destination,
                      JoinHandle* join,
                      size_t worker_count)
        : ctx_(std::move(ctx))
        , run_ctx_(ctx_->child())
        , inputs_(std::move(inputs))
        , outputs_(std::move(outputs))
        , backend_(backend)
        , job_(job)
        , destination_(std::move(destination))
        , join_(join)
        , tokens_(job.max_parallel_uploads)
        , active_workers_(worker_count) {}

    void worker() {
        while (auto volume = inputs_->receive()) {
            if (*volume) {
                process(*volume);
            }
        }
        if (active_workers_.fetch_sub(1) == 1) {
            outputs_->close();
            join_->done_.store(true, std::memory_order_release);
            log_debug("Upload chain to %s drained", destination_.c_str());
        }
    }

private:
    void process(const VolumePtr& volume) {
        const std::string& name = volume->object_name();

        if (ctx_->cancelled()) {
            join_->record(Status::error(ErrorCode::Cancelled, "upload of " + name + " cancelled"));
            return;
        }
        if (aborted_.load()) {
            log_warn("Skipping %s: run aborted after an earlier failure", name.c_str());
            return;
        }

        Status status = validate_checksum(*volume);
        if (status.ok()) {
            status = upload_with_retry(*volume);
        }

        if (status.ok()) {
            log_info("Uploaded %s to %s", name.c_str(), destination_.c_str());
            if (job_.metrics) {
                job_.metrics->record_upload(true, volume->size());
            }
            if (!outputs_->send(volume)) {
                log_warn("Output channel closed, %s not forwarded", name.c_str());
            }
            return;
        }

        fail(name, status);
    }

    void fail(const std::string& name, const Status& status) {
        if (status.code == ErrorCode::Cancelled) {
            if (ctx_->cancelled()) {
                join_->record_cancelled(status);
            } else {
                // Attempt interrupted by AbortOnFirstError; the cause is already recorded
                log_warn("Upload of %s interrupted: run aborted", name.c_str());
            }
            return;
        }

        log_error("Upload of %s to %s failed: %s", name.c_str(), destination_.c_str(),
                  status.to_string().c_str());
        if (job_.metrics) {
            job_.metrics->record_upload(false, 0);
        }
        join_->record(status);

        if (job_.failure_policy == FailurePolicy::AbortOnFirstError && !aborted_.exchange(true)) {
            log_error("Aborting upload run to %s after first failure", destination_.c_str());
            run_ctx_->cancel();
        }
    }

    Status upload_with_retry(Volume& volume) {
        ExponentialBackoff::Settings settings;
        settings.initial_interval = job_.initial_backoff;
        settings.multiplier = constants::BACKOFF_MULTIPLIER;
        settings.randomization = constants::BACKOFF_RANDOMIZATION;
        settings.max_interval = job_.max_backoff_time;
        settings.max_elapsed = job_.max_retry_time;
        ExponentialBackoff backoff(settings);

        const std::string& name = volume.object_name();
        int attempt = 0;

        while (true) {
            ++attempt;
            if (!tokens_.acquire(*run_ctx_)) {
                return Status::error(ErrorCode::Cancelled, "upload of " + name + " cancelled");
            }

            Status status;
            {
                TokenGuard token(tokens_);
                log_debug("Uploading %s to %s (attempt %d)", name.c_str(), destination_.c_str(), attempt);

                MetricsExporter::AttemptScope timed(job_.metrics);
                status = backend_.upload(*run_ctx_, volume);
            }

            if (status.ok()) {
                return status;
            }
            if (run_ctx_->cancelled()) {
                return Status::error(ErrorCode::Cancelled, "upload of " + name + " cancelled");
            }
            if (!is_retryable(status)) {
                return status;
            }

            auto delay = backoff.next();
            if (!delay) {
                log_error("Giving up on %s after %d attempts in %llds", name.c_str(), attempt,
                          static_cast<long long>(backoff.elapsed().count() / 1000));
                return status;
            }

            log_warn("Upload of %s failed (attempt %d), retrying in %lldms: %s",
                     name.c_str(), attempt, static_cast<long long>(delay->count()),
                     status.to_string().c_str());
            if (job_.metrics) {
                job_.metrics->record_retry();
            }
            if (!run_ctx_->sleep_for(*delay)) {
                return Status::error(ErrorCode::Cancelled, "upload of " + name + " cancelled");
            }
        }
    }

    std::shared_ptr<Context> ctx_;
    std::shared_ptr<Context> run_ctx_;
    std::shared_ptr<Channel<VolumePtr>> inputs_;
    std::shared_ptr<Channel<VolumePtr>> outputs_;
    Backend& backend_;
    JobInfo job_;
    std::string destination_;
    JoinHandle* join_;

    TokenPool tokens_;
    std::atomic<size_t> active_workers_;
    std::atomic<bool> aborted_{false};
};

// ============================================================================
// run_upload_chain
// ============================================================================

UploadChain run_upload_chain(std::shared_ptr<Context> ctx,
                             std::shared_ptr<Channel<VolumePtr>> inputs,
                             Backend& backend,
                             const JobInfo& job,
                             const std::string& destination) {
    UploadChain chain;
    chain.outputs = std::make_shared<Channel<VolumePtr>>(job.output_buffer);
    chain.join = std::shared_ptr<JoinHandle>(new JoinHandle());

    size_t parallel = std::clamp(job.max_parallel_uploads, size_t{1}, constants::MAX_PARALLEL_UPLOADS);
    // Extra workers keep the upload slots busy while others sleep in backoff
    size_t worker_count = parallel * 2;

    JobInfo effective = job;
    effective.max_parallel_uploads = parallel;

    auto runner = std::make_shared<UploadChainRunner>(
        std::move(ctx), std::move(inputs), chain.outputs, backend, effective,
        destination, chain.join.get(), worker_count);

    log_debug("Starting upload chain to %s: %zu parallel uploads, %zu workers",
              destination.c_str(), parallel, worker_count);

    chain.join->workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        chain.join->workers_.emplace_back([runner] { runner->worker(); });
    }
    return chain;
}

} // namespace coldstash
