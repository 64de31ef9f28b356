// File: src/core/context_snapshot.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace aase {

// TimeOfDay: Coarse bucket of the local hour
enum class TimeOfDay : uint8_t {
    MORNING = 0,     // 05:00 - 11:59
    AFTERNOON = 1,   // 12:00 - 16:59
    EVENING = 2,     // 17:00 - 20:59
    NIGHT = 3,       // 21:00 - 04:59
};

// Convert TimeOfDay to string ("morning", ...)
const char* ToString(TimeOfDay tod);

// Parse TimeOfDay from string
TimeOfDay ParseTimeOfDay(const std::string& str);

// Bucket an hour (0-23) into a TimeOfDay
TimeOfDay TimeOfDayForHour(int hour);

// Lower-case weekday name, 0 = "sunday"
const char* DayOfWeekName(int day_of_week);

/// Structured snapshot of time, device and recent-activity signals
/// at the moment a situation was detected.
///
/// Device fields are optional because not every host can read them;
/// comparisons skip a signal when either side lacks it.
struct ContextSnapshot {
    // Temporal
    Timestamp timestamp;
    int hour{0};
    int minute{0};
    int day_of_week{0};          ///< 0 = Sunday ... 6 = Saturday
    bool is_weekend{false};
    TimeOfDay time_of_day{TimeOfDay::NIGHT};

    // Device
    std::optional<int> battery_percent;
    std::optional<bool> is_charging;
    std::optional<float> memory_percent;
    std::optional<float> cpu_percent;
    std::string active_app;

    // Behavioral
    std::string situation;
    std::optional<float> detection_confidence;
    std::vector<std::string> recent_actions;

    /// Build a snapshot whose temporal fields are derived from `ts` (local time)
    static ContextSnapshot AtTime(Timestamp ts);

    /// Snapshot for the current time with no device signals
    static ContextSnapshot Now();

    /// Battery reading with the neutral default (50) when unknown
    int BatteryOrDefault() const { return battery_percent.value_or(50); }

    void Serialize(std::ostream& out) const;
    static ContextSnapshot Deserialize(std::istream& in);

    /// Binary blob for storage
    std::string ToBlob() const;
    static ContextSnapshot FromBlob(const void* data, size_t size);

    std::string ToString() const;
};

} // namespace aase
