// File: src/core/context_provider.hpp
#pragma once

#include "core/context_snapshot.hpp"
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// Abstract source of context snapshots
///
/// The host normally supplies its own implementation (window focus,
/// location, ...). SystemContextProvider covers what Linux exposes
/// through sysfs and procfs.
class ContextProvider {
public:
    virtual ~ContextProvider() = default;

    /// Capture the current context
    /// @param situation Situation detected by the intent classifier
    /// @param detection_confidence Classifier confidence, if known
    /// @param recent_actions Most recent executed actions, oldest first
    virtual ContextSnapshot Current(
        const std::string& situation,
        std::optional<float> detection_confidence = std::nullopt,
        const std::vector<std::string>& recent_actions = {}) = 0;
};

/// Context provider reading the local clock, /sys/class/power_supply
/// and /proc/meminfo. Missing files leave the matching fields unset.
class SystemContextProvider : public ContextProvider {
public:
    struct Config {
        Config() = default;

        /// Root of the power supply class directory
        std::string power_supply_dir{"/sys/class/power_supply"};

        /// Path of the meminfo file
        std::string meminfo_path{"/proc/meminfo"};

        /// Application name reported as active_app
        std::string active_app;
    };

    SystemContextProvider();
    explicit SystemContextProvider(const Config& config);

    ContextSnapshot Current(
        const std::string& situation,
        std::optional<float> detection_confidence = std::nullopt,
        const std::vector<std::string>& recent_actions = {}) override;

    /// Battery capacity of the first BAT* supply
    std::optional<int> ReadBatteryPercent() const;

    /// True while any mains/USB supply reports online=1
    std::optional<bool> ReadCharging() const;

    /// Used memory as a percentage of MemTotal
    std::optional<float> ReadMemoryPercent() const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace aase
