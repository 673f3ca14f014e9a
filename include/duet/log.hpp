#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace duet {
namespace log {

inline constexpr const char* kLoggerName = "duet";

/**
 * @brief Library logger. Falls back to the spdlog default logger until init() runs.
 */
inline std::shared_ptr<spdlog::logger> logger() {
    auto named = spdlog::get(kLoggerName);
    return named ? named : spdlog::default_logger();
}

/**
 * @brief Install the named console logger. Safe to call more than once.
 */
inline void init(spdlog::level::level_enum level = spdlog::level::info) {
    try {
        auto console = spdlog::get(kLoggerName);
        if (!console) {
            console = spdlog::stdout_color_mt(kLoggerName);
        }
        console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [duet] [thread %t] %v");
        console->set_level(level);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

inline void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

/// Parse "trace".."critical"/"off"; unknown names map to info.
inline spdlog::level::level_enum level_from_string(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace log
} // namespace duet

// Macros for convenient logging
#define DUET_TRACE(...) ::duet::log::logger()->trace(__VA_ARGS__)
#define DUET_DEBUG(...) ::duet::log::logger()->debug(__VA_ARGS__)
#define DUET_INFO(...)  ::duet::log::logger()->info(__VA_ARGS__)
#define DUET_WARN(...)  ::duet::log::logger()->warn(__VA_ARGS__)
#define DUET_ERROR(...) ::duet::log::logger()->error(__VA_ARGS__)
#define DUET_CRITICAL(...) ::duet::log::logger()->critical(__VA_ARGS__)
