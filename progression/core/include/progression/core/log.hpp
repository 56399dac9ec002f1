#pragma once

#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace progression::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Log sink interface for custom log handlers
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void log(LogLevel level, const std::string& category, const std::string& message);
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

const char* to_string(LogLevel level);

// ============================================================================
// Formatted logging
// ============================================================================

template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (level < get_log_level()) return;
    std::string message = std::format(fmt, std::forward<Args>(args)...);
    log(level, message.c_str());
}

template<typename... Args>
void log_trace(const std::string& category, std::format_string<Args...> fmt, Args&&... args) {
    if (LogLevel::Trace < get_log_level()) return;
    log(LogLevel::Trace, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_debug(const std::string& category, std::format_string<Args...> fmt, Args&&... args) {
    if (LogLevel::Debug < get_log_level()) return;
    log(LogLevel::Debug, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_info(const std::string& category, std::format_string<Args...> fmt, Args&&... args) {
    if (LogLevel::Info < get_log_level()) return;
    log(LogLevel::Info, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_warning(const std::string& category, std::format_string<Args...> fmt, Args&&... args) {
    if (LogLevel::Warn < get_log_level()) return;
    log(LogLevel::Warn, category, std::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
void log_error(const std::string& category, std::format_string<Args...> fmt, Args&&... args) {
    if (LogLevel::Error < get_log_level()) return;
    log(LogLevel::Error, category, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace progression::core
