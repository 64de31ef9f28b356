// File: src/embedding/embedding_circuit_breaker.cpp
#include "embedding/embedding_circuit_breaker.hpp"

namespace aase {

EmbeddingCircuitBreaker::EmbeddingCircuitBreaker()
    : config_() {
}

EmbeddingCircuitBreaker::EmbeddingCircuitBreaker(const Config& config)
    : config_(config) {
}

bool EmbeddingCircuitBreaker::IsOpenAt(Clock::time_point now) const {
    if (consecutive_failures_ < config_.open_threshold) {
        return false;
    }
    // Half-open once the cooldown has passed
    return (now - last_failure_) < config_.cooldown;
}

void EmbeddingCircuitBreaker::RecordSuccess() {
    consecutive_failures_ = 0;
}

void EmbeddingCircuitBreaker::RecordFailureAt(Clock::time_point now) {
    // A failed half-open trial re-opens the breaker
    const bool half_open = consecutive_failures_ >= config_.open_threshold &&
                           (now - last_failure_) >= config_.cooldown;
    ++consecutive_failures_;
    last_failure_ = now;
    if (consecutive_failures_ == config_.open_threshold || half_open) {
        ++times_opened_;
    }
}

} // namespace aase
