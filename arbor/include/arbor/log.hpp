#pragma once
// Log: leveled, tagged lines on stderr
//
// stdout carries the JSON-RPC stream, so nothing else may write there.
// Lines look like "[model_cache] Loaded model ..." as elsewhere in arbor.

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace arbor {

enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
    }
    return "info";
}

// Returns false when the name is not a known level
inline bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "error") { out = LogLevel::Error; return true; }
    if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
    if (s == "info") { out = LogLevel::Info; return true; }
    if (s == "debug") { out = LogLevel::Debug; return true; }
    return false;
}

namespace logging {

namespace detail {
inline std::atomic<int>& threshold() {
    static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
    return level;
}

inline std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}
} // namespace detail

inline void set_level(LogLevel level) {
    detail::threshold().store(static_cast<int>(level));
}

inline bool enabled(LogLevel level) {
    return static_cast<int>(level) <= detail::threshold().load();
}

inline void write(LogLevel level, const char* component, const std::string& message) {
    if (!enabled(level)) return;

    std::ostringstream line;
    line << "[" << component << "] ";
    if (level == LogLevel::Error) line << "Error: ";
    else if (level == LogLevel::Warn) line << "Warning: ";
    line << message << "\n";

    std::lock_guard<std::mutex> lock(detail::sink_mutex());
    std::cerr << line.str();
}

inline void error(const char* component, const std::string& message) {
    write(LogLevel::Error, component, message);
}

inline void warn(const char* component, const std::string& message) {
    write(LogLevel::Warn, component, message);
}

inline void info(const char* component, const std::string& message) {
    write(LogLevel::Info, component, message);
}

inline void debug(const char* component, const std::string& message) {
    write(LogLevel::Debug, component, message);
}

} // namespace logging
} // namespace arbor
