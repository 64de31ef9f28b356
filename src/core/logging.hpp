// File: src/core/logging.hpp
#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace aase {
namespace log {

/// Name of the engine logger in the spdlog registry
inline constexpr const char* kLoggerName = "aase";

/// Engine logger (stderr, colored). Created on first use and registered
/// with spdlog so hosts can replace its sinks.
std::shared_ptr<spdlog::logger> Get();

/// Set level by name: trace, debug, info, warn, error, critical, off
/// @return false if the name is not recognised (level unchanged)
bool SetLevel(const std::string& level);

} // namespace log
} // namespace aase
