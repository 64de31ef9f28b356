// File: src/embedding/embedding_circuit_breaker.hpp
#pragma once

#include <chrono>
#include <cstdint>

namespace aase {

/// Stops calling a failing embedding provider for a cooldown period
///
/// Opens after `open_threshold` consecutive failures. Once the cooldown
/// has elapsed one trial call is let through (half-open); a success
/// closes the breaker, a failure restarts the cooldown.
class EmbeddingCircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        Config() = default;

        /// Consecutive failures before the breaker opens
        int open_threshold{5};

        /// Time before a trial call is allowed
        std::chrono::milliseconds cooldown{30000};
    };

    EmbeddingCircuitBreaker();
    explicit EmbeddingCircuitBreaker(const Config& config);

    /// True while calls should be skipped
    bool IsOpen() const { return IsOpenAt(Clock::now()); }
    bool IsOpenAt(Clock::time_point now) const;

    void RecordSuccess();
    void RecordFailure() { RecordFailureAt(Clock::now()); }
    void RecordFailureAt(Clock::time_point now);

    int ConsecutiveFailures() const { return consecutive_failures_; }
    uint64_t TimesOpened() const { return times_opened_; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    int consecutive_failures_{0};
    uint64_t times_opened_{0};
    Clock::time_point last_failure_{};
};

} // namespace aase
