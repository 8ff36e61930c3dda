// QX Analytics - Diagnostics Implementation

#include <qx/analytics/log.hpp>
#include <atomic>
#include <iostream>
#include <mutex>

namespace qx::analytics {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_stream_mutex;

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
    if (s == "debug" || s == "trace") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "off" || s == "none") return LogLevel::Off;
    return std::nullopt;
}

void set_log_level(LogLevel level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

void log(LogLevel level, std::string_view component, const std::string& msg) {
    if (!log_enabled(level)) return;

    std::lock_guard lock(g_stream_mutex);
    std::cerr << "[" << to_string(level) << "] " << component << ": " << msg << "\n";
}

}  // namespace qx::analytics
