// File: src/core/context_provider.cpp
#include "core/context_provider.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <algorithm>

namespace aase {

namespace {

std::optional<std::string> ReadFirstLine(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string line;
    if (!std::getline(file, line)) {
        return std::nullopt;
    }
    return line;
}

std::optional<long> ParseLong(const std::string& text) {
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed == 0) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

SystemContextProvider::SystemContextProvider()
    : config_() {
}

SystemContextProvider::SystemContextProvider(const Config& config)
    : config_(config) {
}

ContextSnapshot SystemContextProvider::Current(
        const std::string& situation,
        std::optional<float> detection_confidence,
        const std::vector<std::string>& recent_actions) {
    ContextSnapshot ctx = ContextSnapshot::Now();
    ctx.battery_percent = ReadBatteryPercent();
    ctx.is_charging = ReadCharging();
    ctx.memory_percent = ReadMemoryPercent();
    ctx.active_app = config_.active_app;
    ctx.situation = situation;
    ctx.detection_confidence = detection_confidence;
    ctx.recent_actions = recent_actions;
    return ctx;
}

std::optional<int> SystemContextProvider::ReadBatteryPercent() const {
    std::error_code ec;
    std::filesystem::directory_iterator it(config_.power_supply_dir, ec);
    if (ec) {
        return std::nullopt;
    }

    std::vector<std::filesystem::path> batteries;
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name.rfind("BAT", 0) == 0) {
            batteries.push_back(entry.path());
        }
    }
    std::sort(batteries.begin(), batteries.end());

    for (const auto& battery : batteries) {
        auto line = ReadFirstLine(battery / "capacity");
        if (!line) {
            continue;
        }
        auto value = ParseLong(*line);
        if (value) {
            return static_cast<int>(std::clamp(*value, 0L, 100L));
        }
    }
    return std::nullopt;
}

std::optional<bool> SystemContextProvider::ReadCharging() const {
    std::error_code ec;
    std::filesystem::directory_iterator it(config_.power_supply_dir, ec);
    if (ec) {
        return std::nullopt;
    }

    bool saw_supply = false;
    for (const auto& entry : it) {
        auto type = ReadFirstLine(entry.path() / "type");
        if (!type || *type == "Battery") {
            continue;
        }
        auto online = ReadFirstLine(entry.path() / "online");
        if (!online) {
            continue;
        }
        saw_supply = true;
        if (ParseLong(*online).value_or(0) == 1) {
            return true;
        }
    }

    if (saw_supply) {
        return false;
    }
    return std::nullopt;
}

std::optional<float> SystemContextProvider::ReadMemoryPercent() const {
    std::ifstream file(config_.meminfo_path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    long total_kb = -1;
    long available_kb = -1;
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream iss(line);
        std::string key;
        long value = 0;
        iss >> key >> value;
        if (key == "MemTotal:") {
            total_kb = value;
        } else if (key == "MemAvailable:") {
            available_kb = value;
        }
    }

    if (total_kb <= 0 || available_kb < 0) {
        return std::nullopt;
    }
    float used = static_cast<float>(total_kb - available_kb) / static_cast<float>(total_kb);
    return std::clamp(used * 100.0f, 0.0f, 100.0f);
}

} // namespace aase
