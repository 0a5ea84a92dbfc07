/**
 * @file logger.h
 * @brief Logging with journald and stderr backends
 */

#pragma once

#include <string>
#include <mutex>

namespace wardend {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    CRITICAL = 4
};

namespace internal {
    // syslog priorities (avoid pulling in <syslog.h> macros)
    constexpr int SYSLOG_CRIT = 2;
    constexpr int SYSLOG_ERR = 3;
    constexpr int SYSLOG_WARNING = 4;
    constexpr int SYSLOG_INFO = 6;
    constexpr int SYSLOG_DEBUG = 7;
}

/**
 * @brief Process-wide logger
 *
 * Never call from a signal handler: every entry point takes a mutex.
 */
class Logger {
public:
    /**
     * @brief Initialize logging
     * @param min_level Minimum level to emit
     * @param use_journald Send to journald instead of stderr
     */
    static void init(LogLevel min_level, bool use_journald);
    
    static void shutdown();
    
    static void set_level(LogLevel level);
    static LogLevel get_level();
    
    /**
     * @brief Map a config integer (0=DEBUG .. 4=CRITICAL) to a level
     */
    static LogLevel level_from_int(int level);
    
    static void debug(const std::string& component, const std::string& message);
    static void info(const std::string& component, const std::string& message);
    static void warn(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);
    static void critical(const std::string& component, const std::string& message);
    
    static void log(LogLevel level, const std::string& component, const std::string& message);
    
    /**
     * @brief Emit one line of supervised process output
     *
     * Logged at INFO under the component "watcher:<name>". On journald the
     * watcher, pid and stream go into their own fields so `journalctl
     * WARDEND_WATCHER=web` selects one watcher's output.
     */
    static void process_output(const std::string& watcher, int pid,
                               const std::string& stream, const std::string& line);
    
private:
    static LogLevel min_level_;
    static bool use_journald_;
    static std::mutex mutex_;
    static bool initialized_;
    
    static void log_to_journald(LogLevel level, const std::string& component, const std::string& message);
    static void log_to_stderr(LogLevel level, const std::string& component, const std::string& message);
    static int level_to_priority(LogLevel level);
    static const char* level_to_string(LogLevel level);
};

} // namespace wardend

#define LOG_DEBUG(component, message) ::wardend::Logger::debug(component, message)
#define LOG_INFO(component, message) ::wardend::Logger::info(component, message)
#define LOG_WARN(component, message) ::wardend::Logger::warn(component, message)
#define LOG_ERROR(component, message) ::wardend::Logger::error(component, message)
#define LOG_CRITICAL(component, message) ::wardend::Logger::critical(component, message)
