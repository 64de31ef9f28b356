// File: src/core/logging.cpp
#include "core/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace aase {
namespace log {

std::shared_ptr<spdlog::logger> Get() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (!spdlog::get(kLoggerName)) {
            auto logger = spdlog::stderr_color_mt(kLoggerName);
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            logger->set_level(spdlog::level::info);
        }
    });

    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        // Dropped from the registry by the host; fall back to the default logger
        return spdlog::default_logger();
    }
    return logger;
}

bool SetLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only accept "off" when asked for it
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    Get()->set_level(parsed);
    return true;
}

} // namespace log
} // namespace aase
