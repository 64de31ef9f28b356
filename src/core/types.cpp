// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cmath>
#include <cctype>
#include <algorithm>
#include <istream>
#include <ostream>

namespace aase {

// ============================================================================
// Timestamp
// ============================================================================

Timestamp Timestamp::Now() {
    return Timestamp(ClockType::now());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<ClockType::duration>(Duration(micros))};
    return Timestamp(tp);
}

Timestamp Timestamp::FromLocalTime(int year, int month, int day,
                                   int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;

    std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        throw std::invalid_argument("Invalid local time");
    }
    return Timestamp(ClockType::from_time_t(t));
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

std::tm Timestamp::ToLocalTm() const {
    std::time_t t = ClockType::to_time_t(time_point_);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

int64_t Timestamp::WholeDaysUntil(const Timestamp& later) const {
    if (later <= *this) {
        return 0;
    }
    auto diff = later - *this;
    return std::chrono::duration_cast<std::chrono::hours>(diff).count() / 24;
}

std::string Timestamp::ToString() const {
    std::tm tm = ToLocalTm();
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

void Timestamp::Serialize(std::ostream& out) const {
    int64_t micros = ToMicros();
    out.write(reinterpret_cast<const char*>(&micros), sizeof(micros));
}

Timestamp Timestamp::Deserialize(std::istream& in) {
    int64_t micros = 0;
    in.read(reinterpret_cast<char*>(&micros), sizeof(micros));
    return FromMicros(micros);
}

// ============================================================================
// ActionOutcome
// ============================================================================

const char* ToString(ActionOutcome outcome) {
    switch (outcome) {
        case ActionOutcome::SUCCESS: return "success";
        case ActionOutcome::FAILURE: return "failure";
        case ActionOutcome::CANCELED: return "canceled";
        default: return "unknown";
    }
}

ActionOutcome ParseActionOutcome(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "success" || lower == "1") return ActionOutcome::SUCCESS;
    if (lower == "failure" || lower == "0") return ActionOutcome::FAILURE;
    if (lower == "canceled" || lower == "cancelled" || lower == "-1") return ActionOutcome::CANCELED;
    throw std::invalid_argument("Unknown ActionOutcome: " + str);
}

ActionOutcome ActionOutcomeFromCode(int code) {
    if (code > 0) return ActionOutcome::SUCCESS;
    if (code < 0) return ActionOutcome::CANCELED;
    return ActionOutcome::FAILURE;
}

// ============================================================================
// ActionParams
// ============================================================================

namespace {

void WriteString(std::ostream& out, const std::string& s) {
    size_t len = s.length();
    out.write(reinterpret_cast<const char*>(&len), sizeof(len));
    out.write(s.data(), static_cast<std::streamsize>(len));
}

std::string ReadString(std::istream& in) {
    size_t len = 0;
    in.read(reinterpret_cast<char*>(&len), sizeof(len));
    if (!in) {
        return {};
    }
    std::string s(len, '\0');
    if (len > 0) {
        in.read(&s[0], static_cast<std::streamsize>(len));
    }
    return s;
}

} // namespace

void SerializeParams(const ActionParams& params, std::ostream& out) {
    size_t size = params.size();
    out.write(reinterpret_cast<const char*>(&size), sizeof(size));

    for (const auto& [key, value] : params) {
        WriteString(out, key);
        WriteString(out, value);
    }
}

ActionParams DeserializeParams(std::istream& in) {
    size_t size = 0;
    in.read(reinterpret_cast<char*>(&size), sizeof(size));

    ActionParams result;
    for (size_t i = 0; i < size && in; ++i) {
        std::string key = ReadString(in);
        std::string value = ReadString(in);
        if (!in) {
            break;
        }
        result[key] = value;
    }
    return result;
}

std::string ParamsToString(const ActionParams& params) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << ", ";
        oss << key << "=" << value;
        first = false;
    }
    oss << "}";
    return oss.str();
}

// ============================================================================
// Prediction
// ============================================================================

const char* ToString(PredictionSource source) {
    switch (source) {
        case PredictionSource::REINFORCEMENT: return "reinforcement_learning";
        case PredictionSource::FEW_SHOT: return "few_shot";
        case PredictionSource::META: return "meta_learning";
        case PredictionSource::HISTORICAL: return "knn";
        case PredictionSource::USER_TAUGHT: return "user_taught";
        default: return "unknown";
    }
}

std::string Prediction::ToString() const {
    std::ostringstream oss;
    oss << "Prediction(" << action
        << ", confidence=" << std::fixed << std::setprecision(2) << confidence
        << ", source=" << aase::ToString(source);
    if (!params.empty()) {
        oss << ", params=" << ParamsToString(params);
    }
    if (ask_user) {
        oss << ", ask_user, options=" << options.size();
    }
    oss << ")";
    return oss.str();
}

float ClampConfidence(float confidence) {
    if (std::isnan(confidence)) {
        return 0.0f;
    }
    return std::clamp(confidence, 0.0f, 1.0f);
}

} // namespace aase
