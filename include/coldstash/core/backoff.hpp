#pragma once

#include <chrono>
#include <optional>
#include <random>

namespace coldstash {

/// Randomized exponential backoff with a per-interval ceiling and an
/// overall elapsed-time budget.
///
/// Each call to next() returns the next sleep interval, or std::nullopt once
/// the elapsed time since reset() exceeds max_elapsed. Intervals grow by
/// `multiplier` and are jittered by +/- `randomization` of their value, but a
/// returned interval never exceeds max_interval.
class ExponentialBackoff {
public:
    struct Settings {
        std::chrono::milliseconds initial_interval{500};
        double multiplier = 1.5;
        double randomization = 0.5;
        std::chrono::milliseconds max_interval{30 * 60 * 1000};
        std::chrono::milliseconds max_elapsed{12 * 60 * 60 * 1000};
    };

    explicit ExponentialBackoff(const Settings& settings);

    void reset();

    std::optional<std::chrono::milliseconds> next();

    std::chrono::milliseconds elapsed() const;

    const Settings& settings() const { return settings_; }

private:
    Settings settings_;
    std::chrono::milliseconds current_;
    std::chrono::steady_clock::time_point start_;
    std::mt19937_64 rng_;
};

} // namespace coldstash
