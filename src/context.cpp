#include "coldstash/core/context.hpp"

namespace coldstash {

std::shared_ptr<Context> Context::child() {
    auto c = std::make_shared<Context>();
    add_child(c);
    return c;
}

void Context::add_child(const std::shared_ptr<Context>& child) {
    bool already_cancelled = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        already_cancelled = cancelled();
        if (!already_cancelled) {
            children_.push_back(child);
        }
    }
    if (already_cancelled) {
        child->cancel();
    }
}

void Context::cancel() {
    std::vector<std::weak_ptr<Context>> children;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled()) return;
        cancelled_.store(true, std::memory_order_release);
        children.swap(children_);
    }
    cv_.notify_all();

    {
        // Held while running so a subscription cannot be released mid-call
        std::lock_guard<std::mutex> lock(callback_mutex_);
        for (auto& [id, callback] : callbacks_) {
            callback();
        }
        callbacks_.clear();
    }

    for (auto& weak : children) {
        if (auto c = weak.lock()) {
            c->cancel();
        }
    }
}

bool Context::sleep_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled(); });
}

Context::CancelSubscription Context::on_cancel(std::function<void()> callback) const {
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (!cancelled()) {
            uint64_t id = next_callback_id_++;
            callbacks_.emplace(id, std::move(callback));
            return CancelSubscription(this, id);
        }
    }
    callback();
    return CancelSubscription();
}

void Context::remove_callback(uint64_t id) const {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callbacks_.erase(id);
}

void Context::CancelSubscription::reset() {
    if (ctx_) {
        ctx_->remove_callback(id_);
        ctx_ = nullptr;
    }
}

} // namespace coldstash
