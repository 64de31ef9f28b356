// File: src/core/context_snapshot.cpp
#include "core/context_snapshot.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <istream>
#include <ostream>

namespace aase {

// ============================================================================
// TimeOfDay
// ============================================================================

const char* ToString(TimeOfDay tod) {
    switch (tod) {
        case TimeOfDay::MORNING: return "morning";
        case TimeOfDay::AFTERNOON: return "afternoon";
        case TimeOfDay::EVENING: return "evening";
        case TimeOfDay::NIGHT: return "night";
        default: return "unknown";
    }
}

TimeOfDay ParseTimeOfDay(const std::string& str) {
    if (str == "morning") return TimeOfDay::MORNING;
    if (str == "afternoon") return TimeOfDay::AFTERNOON;
    if (str == "evening") return TimeOfDay::EVENING;
    if (str == "night") return TimeOfDay::NIGHT;
    throw std::invalid_argument("Unknown TimeOfDay: " + str);
}

TimeOfDay TimeOfDayForHour(int hour) {
    if (hour >= 5 && hour < 12) return TimeOfDay::MORNING;
    if (hour >= 12 && hour < 17) return TimeOfDay::AFTERNOON;
    if (hour >= 17 && hour < 21) return TimeOfDay::EVENING;
    return TimeOfDay::NIGHT;
}

const char* DayOfWeekName(int day_of_week) {
    static const char* kNames[] = {
        "sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"
    };
    if (day_of_week < 0 || day_of_week > 6) {
        return "unknown";
    }
    return kNames[day_of_week];
}

// ============================================================================
// Construction
// ============================================================================

ContextSnapshot ContextSnapshot::AtTime(Timestamp ts) {
    std::tm tm = ts.ToLocalTm();

    ContextSnapshot ctx;
    ctx.timestamp = ts;
    ctx.hour = tm.tm_hour;
    ctx.minute = tm.tm_min;
    ctx.day_of_week = tm.tm_wday;
    ctx.is_weekend = (tm.tm_wday == 0 || tm.tm_wday == 6);
    ctx.time_of_day = TimeOfDayForHour(tm.tm_hour);
    return ctx;
}

ContextSnapshot ContextSnapshot::Now() {
    return AtTime(Timestamp::Now());
}

// ============================================================================
// Serialization
// ============================================================================

namespace {

template <typename T>
void WritePod(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template <typename T>
T ReadPod(std::istream& in) {
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    return value;
}

template <typename T>
void WriteOptional(std::ostream& out, const std::optional<T>& value) {
    uint8_t present = value.has_value() ? 1 : 0;
    WritePod(out, present);
    if (value) {
        WritePod(out, *value);
    }
}

template <typename T>
std::optional<T> ReadOptional(std::istream& in) {
    uint8_t present = ReadPod<uint8_t>(in);
    if (!in || present == 0) {
        return std::nullopt;
    }
    return ReadPod<T>(in);
}

void WriteString(std::ostream& out, const std::string& s) {
    WritePod(out, s.length());
    out.write(s.data(), static_cast<std::streamsize>(s.length()));
}

std::string ReadString(std::istream& in) {
    size_t len = ReadPod<size_t>(in);
    if (!in) {
        return {};
    }
    std::string s(len, '\0');
    if (len > 0) {
        in.read(&s[0], static_cast<std::streamsize>(len));
    }
    return s;
}

// Format version; bump when the layout changes
constexpr uint8_t kSnapshotVersion = 1;

} // namespace

void ContextSnapshot::Serialize(std::ostream& out) const {
    WritePod(out, kSnapshotVersion);

    timestamp.Serialize(out);
    WritePod(out, static_cast<int32_t>(hour));
    WritePod(out, static_cast<int32_t>(minute));
    WritePod(out, static_cast<int32_t>(day_of_week));
    WritePod(out, static_cast<uint8_t>(is_weekend ? 1 : 0));
    WritePod(out, static_cast<uint8_t>(time_of_day));

    WriteOptional(out, battery_percent);
    WriteOptional(out, is_charging);
    WriteOptional(out, memory_percent);
    WriteOptional(out, cpu_percent);
    WriteString(out, active_app);

    WriteString(out, situation);
    WriteOptional(out, detection_confidence);

    WritePod(out, recent_actions.size());
    for (const auto& action : recent_actions) {
        WriteString(out, action);
    }
}

ContextSnapshot ContextSnapshot::Deserialize(std::istream& in) {
    ContextSnapshot ctx;

    uint8_t version = ReadPod<uint8_t>(in);
    if (!in || version != kSnapshotVersion) {
        throw std::runtime_error("Unsupported context snapshot format");
    }

    ctx.timestamp = Timestamp::Deserialize(in);
    ctx.hour = ReadPod<int32_t>(in);
    ctx.minute = ReadPod<int32_t>(in);
    ctx.day_of_week = ReadPod<int32_t>(in);
    ctx.is_weekend = ReadPod<uint8_t>(in) != 0;
    ctx.time_of_day = static_cast<TimeOfDay>(ReadPod<uint8_t>(in));

    ctx.battery_percent = ReadOptional<int>(in);
    ctx.is_charging = ReadOptional<bool>(in);
    ctx.memory_percent = ReadOptional<float>(in);
    ctx.cpu_percent = ReadOptional<float>(in);
    ctx.active_app = ReadString(in);

    ctx.situation = ReadString(in);
    ctx.detection_confidence = ReadOptional<float>(in);

    size_t count = ReadPod<size_t>(in);
    for (size_t i = 0; i < count && in; ++i) {
        ctx.recent_actions.push_back(ReadString(in));
    }

    if (!in) {
        throw std::runtime_error("Truncated context snapshot");
    }
    return ctx;
}

std::string ContextSnapshot::ToBlob() const {
    std::ostringstream oss(std::ios::binary);
    Serialize(oss);
    return oss.str();
}

ContextSnapshot ContextSnapshot::FromBlob(const void* data, size_t size) {
    std::string bytes(static_cast<const char*>(data), size);
    std::istringstream iss(bytes, std::ios::binary);
    return Deserialize(iss);
}

std::string ContextSnapshot::ToString() const {
    std::ostringstream oss;
    oss << "Context(" << timestamp.ToString()
        << ", " << aase::ToString(time_of_day)
        << ", " << DayOfWeekName(day_of_week)
        << (is_weekend ? ", weekend" : "");
    if (battery_percent) {
        oss << ", battery=" << *battery_percent << "%";
    }
    if (is_charging) {
        oss << (*is_charging ? ", charging" : ", on battery");
    }
    if (!active_app.empty()) {
        oss << ", app=" << active_app;
    }
    if (!situation.empty()) {
        oss << ", situation=" << situation;
    }
    oss << ")";
    return oss.str();
}

} // namespace aase
