#pragma once

#include "coldstash/core/context.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace coldstash {

/// Fixed-capacity counting semaphore bounding concurrent uploads.
/// Acquisition is not FIFO.
class TokenPool {
public:
    explicit TokenPool(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity), available_(capacity_) {}

    TokenPool(const TokenPool&) = delete;
    TokenPool& operator=(const TokenPool&) = delete;

    /// Block until a token is free. Returns false if `ctx` was cancelled first.
    bool acquire(const Context& ctx) {
        // Registered before taking mutex_: cancel() holds the context's
        // callback lock while it takes ours
        auto wake = ctx.on_cancel([this] {
            std::lock_guard<std::mutex> lock(mutex_);
            cv_.notify_all();
        });
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return available_ > 0 || ctx.cancelled(); });
        if (ctx.cancelled()) return false;
        --available_;
        in_use_peak_ = std::max(in_use_peak_, capacity_ - available_);
        return true;
    }

    bool try_acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (available_ == 0) return false;
        --available_;
        in_use_peak_ = std::max(in_use_peak_, capacity_ - available_);
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (available_ < capacity_) ++available_;
        }
        cv_.notify_one();
    }

    size_t capacity() const { return capacity_; }

    size_t available() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return available_;
    }

    /// Highest number of tokens held at once since construction.
    size_t peak_in_use() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_use_peak_;
    }

private:
    const size_t capacity_;
    size_t available_;
    size_t in_use_peak_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

/// Releases a held token on scope exit.
class TokenGuard {
public:
    explicit TokenGuard(TokenPool& pool) : pool_(&pool) {}
    ~TokenGuard() {
        if (pool_) pool_->release();
    }

    TokenGuard(const TokenGuard&) = delete;
    TokenGuard& operator=(const TokenGuard&) = delete;

private:
    TokenPool* pool_;
};

} // namespace coldstash
