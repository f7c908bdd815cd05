#include "coldstash/core/backoff.hpp"

#include <algorithm>

namespace coldstash {

ExponentialBackoff::ExponentialBackoff(const Settings& settings)
    : settings_(settings)
    , current_(settings.initial_interval)
    , start_(std::chrono::steady_clock::now())
    , rng_(std::random_device{}()) {
    if (settings_.max_interval.count() <= 0) {
        settings_.max_interval = settings_.initial_interval;
    }
}

void ExponentialBackoff::reset() {
    current_ = settings_.initial_interval;
    start_ = std::chrono::steady_clock::now();
}

std::chrono::milliseconds ExponentialBackoff::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
}

std::optional<std::chrono::milliseconds> ExponentialBackoff::next() {
    if (elapsed() >= settings_.max_elapsed) {
        return std::nullopt;
    }

    double base = static_cast<double>(current_.count());
    double delta = settings_.randomization * base;
    std::uniform_real_distribution<double> dist(base - delta, base + delta);
    auto interval = std::chrono::milliseconds(static_cast<int64_t>(dist(rng_)));
    interval = std::clamp(interval, std::chrono::milliseconds(0), settings_.max_interval);

    // Never sleep past the retry budget
    auto remaining = settings_.max_elapsed - elapsed();
    if (remaining.count() <= 0) {
        return std::nullopt;
    }
    interval = std::min(interval, remaining);

    double grown = base * settings_.multiplier;
    double cap = static_cast<double>(settings_.max_interval.count());
    current_ = std::chrono::milliseconds(static_cast<int64_t>(std::min(grown, cap)));

    return interval;
}

} // namespace coldstash
