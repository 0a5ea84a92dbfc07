/**
 * @file common.h
 * @brief Common definitions, constants and helpers
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <chrono>
#include <cstdlib>

namespace wardend {

using json = nlohmann::json;

// Version info
constexpr const char* NAME = "wardend";
constexpr const char* VERSION = "0.3.0";

// Paths
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/wardend/wardend.yaml";
constexpr const char* DEFAULT_SOCKET_PATH = "/run/wardend/wardend.sock";

// Socket configuration
constexpr int SOCKET_BACKLOG = 16;
constexpr int SOCKET_TIMEOUT_MS = 5000;
constexpr size_t MAX_MESSAGE_SIZE = 65536;

// Rate limiting
constexpr int MAX_REQUESTS_PER_SECOND = 100;

// Supervision defaults
constexpr int DEFAULT_CHECK_INTERVAL_MS = 1000;
constexpr int DEFAULT_COMMAND_TIMEOUT_MS = 3000;
constexpr int DEFAULT_GRACEFUL_TIMEOUT_SEC = 30;
constexpr int DEFAULT_MAX_RETRY = 5;
constexpr int MAX_NUMPROCESSES = 1024;  // per watcher, config and incr alike
constexpr int RELOAD_RETRY_MS = 500;    // SIGHUP reload that found the gate busy
constexpr int DEFAULT_WATCHDOG_INTERVAL_SEC = 5;

// Interval between liveness polls while waiting for processes to exit
constexpr std::chrono::milliseconds EXIT_POLL_INTERVAL{50};

// Longest wait for the kernel to release a SIGKILLed child
constexpr std::chrono::milliseconds KILL_REAP_TIMEOUT{1000};

/**
 * @brief Expand ~ to the user's home directory
 */
inline std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

} // namespace wardend
