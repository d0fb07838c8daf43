#pragma once
// ServerConfig: defaults, then environment, then command line
//
// Environment:
//   ARBOR_LOAD_TIMEOUT_MS  Load timeout in milliseconds (0 = none)
//   ARBOR_LOG_LEVEL        error | warn | info | debug

#include "log.hpp"
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace arbor {

struct ServerConfig {
    std::string server_name = "arbor";
    std::chrono::milliseconds load_timeout{60000};
    LogLevel log_level = LogLevel::Info;
    std::vector<std::string> preload;  // Models loaded at startup
    bool show_help = false;
};

// Strict non-negative integer parse
inline bool parse_millis(const std::string& s, std::chrono::milliseconds& out) {
    if (s.empty() || s.size() > 12) return false;
    long long v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = std::chrono::milliseconds(v);
    return true;
}

// Returns false and fills error_msg on a bad value
inline bool apply_environment(ServerConfig& config, std::string& error_msg) {
    if (const char* v = std::getenv("ARBOR_LOAD_TIMEOUT_MS")) {
        if (!parse_millis(v, config.load_timeout)) {
            error_msg = std::string("Invalid ARBOR_LOAD_TIMEOUT_MS: ") + v;
            return false;
        }
    }
    if (const char* v = std::getenv("ARBOR_LOG_LEVEL")) {
        if (!parse_log_level(v, config.log_level)) {
            error_msg = std::string("Invalid ARBOR_LOG_LEVEL: ") + v;
            return false;
        }
    }
    return true;
}

inline bool apply_arguments(ServerConfig& config, int argc, char* argv[],
                            std::string& error_msg) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--load-timeout-ms") == 0 && i + 1 < argc) {
            const char* v = argv[++i];
            if (!parse_millis(v, config.load_timeout)) {
                error_msg = std::string("Invalid --load-timeout-ms: ") + v;
                return false;
            }
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            const char* v = argv[++i];
            if (!parse_log_level(v, config.log_level)) {
                error_msg = std::string("Invalid --log-level: ") + v;
                return false;
            }
        } else if (std::strcmp(argv[i], "--preload") == 0 && i + 1 < argc) {
            config.preload.emplace_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--name") == 0 && i + 1 < argc) {
            config.server_name = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            config.show_help = true;
        } else {
            error_msg = std::string("Unknown option: ") + argv[i];
            return false;
        }
    }
    return true;
}

} // namespace arbor
