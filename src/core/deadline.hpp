// File: src/core/deadline.hpp
#pragma once

#include <chrono>
#include <optional>

namespace aase {

/// Absolute point in time after which a decision cycle starts no new work.
///
/// Passed by value through SelectAction into strategies and the embedding
/// provider. A default-constructed Deadline never expires.
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    /// Never expires
    Deadline() = default;

    static Deadline Never() { return Deadline(); }

    static Deadline After(std::chrono::milliseconds budget) {
        return Deadline(Clock::now() + budget);
    }

    static Deadline At(Clock::time_point when) { return Deadline(when); }

    bool IsUnbounded() const { return !when_.has_value(); }

    bool Expired() const {
        return when_.has_value() && Clock::now() >= *when_;
    }

    /// Time left, or std::nullopt when unbounded
    std::optional<std::chrono::milliseconds> Remaining() const {
        if (!when_) {
            return std::nullopt;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*when_ - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    /// The earlier of this deadline and `budget` from now
    Deadline Tightened(std::chrono::milliseconds budget) const {
        auto candidate = Clock::now() + budget;
        if (when_ && *when_ < candidate) {
            return *this;
        }
        return Deadline(candidate);
    }

private:
    explicit Deadline(Clock::time_point when) : when_(when) {}

    std::optional<Clock::time_point> when_;
};

} // namespace aase
