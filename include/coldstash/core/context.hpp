#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace coldstash {

/// Cancellation signal threaded through every backend and pipeline call.
///
/// Contexts form a tree: cancelling a parent cancels all children, while a
/// child can be cancelled on its own (the pipeline uses this to stop early
/// under AbortOnFirstError without touching the caller's context).
class Context {
public:
    /// Keeps an on_cancel() callback registered until destroyed.
    class CancelSubscription {
    public:
        CancelSubscription() = default;
        CancelSubscription(const Context* ctx, uint64_t id) : ctx_(ctx), id_(id) {}
        CancelSubscription(CancelSubscription&& other) noexcept
            : ctx_(other.ctx_), id_(other.id_) { other.ctx_ = nullptr; }
        ~CancelSubscription() { reset(); }

        CancelSubscription(const CancelSubscription&) = delete;
        CancelSubscription& operator=(const CancelSubscription&) = delete;
        CancelSubscription& operator=(CancelSubscription&&) = delete;

        /// Unregister; waits for the callback if cancel() is running it.
        void reset();

    private:
        const Context* ctx_ = nullptr;
        uint64_t id_ = 0;
    };

    Context() = default;

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    static std::shared_ptr<Context> background() { return std::make_shared<Context>(); }

    /// Create a child that is cancelled together with this context.
    std::shared_ptr<Context> child();

    void cancel();

    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /// Sleep for `duration` or until cancelled. Returns false if cancelled.
    bool sleep_for(std::chrono::milliseconds duration) const;

    /// Run `callback` on the cancelling thread when this context is cancelled,
    /// or right away when it already is. The callback must not call back into
    /// this context.
    CancelSubscription on_cancel(std::function<void()> callback) const;

private:
    void add_child(const std::shared_ptr<Context>& child);
    void remove_callback(uint64_t id) const;

    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<std::weak_ptr<Context>> children_;

    mutable std::mutex callback_mutex_;
    mutable uint64_t next_callback_id_ = 1;
    mutable std::map<uint64_t, std::function<void()>> callbacks_;
};

} // namespace coldstash
