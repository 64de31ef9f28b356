// File: src/core/types.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace aase {

// Timestamp: Microsecond-precision wall-clock time point
// Wall clock (not steady) because records are compared across restarts
// and bucketed by local hour and weekday.
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since epoch
    static Timestamp FromMicros(int64_t micros);

    // Create timestamp from a local calendar time
    // month is 1-12, day is 1-31
    static Timestamp FromLocalTime(int year, int month, int day,
                                   int hour, int minute = 0, int second = 0);

    // Default constructor creates zero timestamp (the epoch)
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since epoch
    int64_t ToMicros() const;

    // Get duration since another timestamp
    Duration operator-(const Timestamp& other) const {
        return std::chrono::duration_cast<Duration>(time_point_ - other.time_point_);
    }

    // Shift by a duration
    Timestamp operator+(Duration d) const { return Timestamp(time_point_ + d); }
    Timestamp operator-(Duration d) const { return Timestamp(time_point_ - d); }

    // Comparison operators
    bool operator<(const Timestamp& other) const { return time_point_ < other.time_point_; }
    bool operator>(const Timestamp& other) const { return time_point_ > other.time_point_; }
    bool operator<=(const Timestamp& other) const { return time_point_ <= other.time_point_; }
    bool operator>=(const Timestamp& other) const { return time_point_ >= other.time_point_; }
    bool operator==(const Timestamp& other) const { return time_point_ == other.time_point_; }
    bool operator!=(const Timestamp& other) const { return time_point_ != other.time_point_; }

    // Broken-down local time
    std::tm ToLocalTm() const;

    // Whole days elapsed from this timestamp until `later` (floored, never negative)
    int64_t WholeDaysUntil(const Timestamp& later) const;

    // ISO-8601 local time, e.g. "2026-10-19T23:05:00"
    std::string ToString() const;

    // Serialization
    void Serialize(std::ostream& out) const;
    static Timestamp Deserialize(std::istream& in);

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// ActionOutcome: Result of an executed action, persisted numerically
enum class ActionOutcome : int8_t {
    CANCELED = -1,   // User aborted the action
    FAILURE = 0,     // Action ran but did not achieve its goal
    SUCCESS = 1,     // Action completed successfully
};

// Convert ActionOutcome to string
const char* ToString(ActionOutcome outcome);

// Parse ActionOutcome from string ("success", "failure", "canceled")
ActionOutcome ParseActionOutcome(const std::string& str);

// Map a persisted integer back to an outcome
// Positive codes map to SUCCESS, negative codes to CANCELED.
ActionOutcome ActionOutcomeFromCode(int code);

// ActionParams: Open-ended key/value parameters of an action
using ActionParams = std::map<std::string, std::string>;

void SerializeParams(const ActionParams& params, std::ostream& out);
ActionParams DeserializeParams(std::istream& in);

// "{key=value, ...}"
std::string ParamsToString(const ActionParams& params);

// PredictionSource: Strategy that produced a prediction
enum class PredictionSource : uint8_t {
    REINFORCEMENT = 0,  // Value-table exploitation/exploration
    FEW_SHOT = 1,       // Semantic exemplar match
    META = 2,           // Transfer from a similar situation
    HISTORICAL = 3,     // k-NN vote over past records
    USER_TAUGHT = 4,    // Explicit user choice
};

// Convert PredictionSource to its tag ("reinforcement_learning", "few_shot", ...)
const char* ToString(PredictionSource source);

// Prediction: A proposed action with its confidence and provenance
// Transient; never persisted.
struct Prediction {
    std::string action;
    float confidence{0.0f};
    ActionParams params;
    PredictionSource source{PredictionSource::REINFORCEMENT};
    std::string reason;

    /// Set when the host should ask the user to disambiguate
    bool ask_user{false};

    /// Ranked candidates shown to the user when ask_user is set
    std::vector<Prediction> options;

    // Strategy-specific diagnostics
    std::optional<double> value;              ///< Value-table entry (reinforcement)
    bool explored{false};                     ///< Random pick (reinforcement)
    std::optional<float> meta_similarity;     ///< Situation similarity (meta)
    std::string transfer_source;              ///< Source situation (meta)
    size_t sample_size{0};                    ///< Votes for the winner (historical)

    std::string ToString() const;
};

// Clamp a confidence into [0, 1]; NaN maps to 0
float ClampConfidence(float confidence);

} // namespace aase
