#include <progression/core/log.hpp>
#include <cstdio>
#include <vector>
#include <mutex>
#include <atomic>
#include <algorithm>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace progression::core {

static std::atomic<LogLevel> s_log_level{LogLevel::Info};
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

static void write_output(const std::string& line) {
#ifdef _WIN32
    OutputDebugStringA(line.c_str());
    OutputDebugStringA("\n");
#endif
    std::printf("%s\n", line.c_str());
}

static void forward_to_sinks(LogLevel level, const std::string& category, const std::string& message) {
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category, message);
        }
    }
}

void log(LogLevel level, const char* message) {
    if (level < s_log_level.load()) return;
    std::string text = message ? message : "";
    write_output(text);
    forward_to_sinks(level, "", text);
}

void log(LogLevel level, const std::string& category, const std::string& message) {
    if (level < s_log_level.load()) return;
    if (category.empty()) {
        write_output(message);
    } else {
        write_output("[" + category + "] " + message);
    }
    forward_to_sinks(level, category, message);
}

void set_log_level(LogLevel level) {
    s_log_level.store(level);
}

LogLevel get_log_level() {
    return s_log_level.load();
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Fatal: return "fatal";
    }
    return "unknown";
}

} // namespace progression::core
