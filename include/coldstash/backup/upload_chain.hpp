#pragma once

#include "coldstash/core/channel.hpp"
#include "coldstash/core/constants.hpp"
#include "coldstash/core/context.hpp"
#include "coldstash/core/status.hpp"
#include "coldstash/core/token_pool.hpp"
#include "coldstash/storage/backend.hpp"
#include "coldstash/storage/volume.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace coldstash {

class MetricsExporter;

/// What happens to the rest of the run after a volume fails permanently.
enum class FailurePolicy {
    DrainAll,           // keep uploading every other volume (default)
    AbortOnFirstError,  // stop attempting; remaining inputs are drained unattempted
};

/// Limits for one upload run.
struct JobInfo {
    /// Clamped to [1, constants::MAX_PARALLEL_UPLOADS].
    size_t max_parallel_uploads = constants::DEFAULT_MAX_PARALLEL_UPLOADS;

    /// Ceiling for a single backoff sleep.
    std::chrono::milliseconds max_backoff_time{constants::DEFAULT_MAX_BACKOFF_SECONDS * 1000};

    /// Wall-clock budget for retrying one volume.
    std::chrono::milliseconds max_retry_time{constants::DEFAULT_MAX_RETRY_SECONDS * 1000};

    std::chrono::milliseconds initial_backoff{constants::BACKOFF_INITIAL_INTERVAL_MS};

    FailurePolicy failure_policy = FailurePolicy::DrainAll;

    /// Capacity of the output channel (0 = unbounded).
    size_t output_buffer = constants::DEFAULT_OUTPUT_BUFFER;

    /// Optional, not owned. Must outlive the run.
    MetricsExporter* metrics = nullptr;
};

struct UploadChain;

/// Completion handle for a running upload chain.
class JoinHandle {
public:
    ~JoinHandle();

    JoinHandle(const JoinHandle&) = delete;
    JoinHandle& operator=(const JoinHandle&) = delete;

    /// Block until every input volume was processed. Returns Cancelled if
    /// the caller's context was cancelled while volumes were still pending,
    /// even when another volume had already failed; otherwise the first
    /// permanent error, or OK. Must not be called from a pipeline worker.
    Status wait();

    bool done() const { return done_.load(std::memory_order_acquire); }

private:
    friend class UploadChainRunner;
    friend UploadChain run_upload_chain(std::shared_ptr<Context> ctx,
                                        std::shared_ptr<Channel<VolumePtr>> inputs,
                                        Backend& backend,
                                        const JobInfo& job,
                                        const std::string& destination);
    JoinHandle() = default;

    /// First error wins.
    void record(const Status& status);

    /// Caller cancellation replaces any recorded error.
    void record_cancelled(const Status& status);

    std::vector<std::thread> workers_;
    std::mutex join_mutex_;

    mutable std::mutex result_mutex_;
    Status first_error_;

    std::atomic<bool> done_{false};
};

struct UploadChain {
    std::shared_ptr<Channel<VolumePtr>> outputs;
    std::shared_ptr<JoinHandle> join;
};

/// Upload every volume received on `inputs` to `backend`.
///
/// Each successfully stored volume is forwarded on `outputs` as the same
/// pointer that was received; `outputs` is closed once `inputs` is closed
/// and drained. Transient errors are retried with randomized exponential
/// backoff; at most `job.max_parallel_uploads` attempts run at once, and a
/// volume sleeping in backoff does not hold a slot. `destination` only
/// labels log lines.
///
/// The producer must close `inputs`. `backend` must outlive the run.
UploadChain run_upload_chain(std::shared_ptr<Context> ctx,
                             std::shared_ptr<Channel<VolumePtr>> inputs,
                             Backend& backend,
                             const JobInfo& job,
                             const std::string& destination);

} // namespace coldstash
