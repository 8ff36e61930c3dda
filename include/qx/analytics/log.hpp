// QX Analytics - Diagnostics
// Level-filtered diagnostic lines on stderr

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace qx::analytics {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

inline constexpr const char* to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

std::optional<LogLevel> parse_log_level(std::string_view s) noexcept;

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

[[nodiscard]] inline bool log_enabled(LogLevel level) noexcept {
    return level != LogLevel::Off && level >= log_level();
}

void log(LogLevel level, std::string_view component, const std::string& msg);

inline void log_debug(std::string_view component, const std::string& msg) {
    if (log_enabled(LogLevel::Debug)) log(LogLevel::Debug, component, msg);
}

inline void log_info(std::string_view component, const std::string& msg) {
    if (log_enabled(LogLevel::Info)) log(LogLevel::Info, component, msg);
}

inline void log_warn(std::string_view component, const std::string& msg) {
    if (log_enabled(LogLevel::Warn)) log(LogLevel::Warn, component, msg);
}

inline void log_error(std::string_view component, const std::string& msg) {
    if (log_enabled(LogLevel::Error)) log(LogLevel::Error, component, msg);
}

}  // namespace qx::analytics
