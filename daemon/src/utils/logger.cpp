/**
 * @file logger.cpp
 * @brief Logger implementation with journald and stderr support
 */

#include "wardend/logger.h"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <systemd/sd-journal.h>

namespace wardend {

LogLevel Logger::min_level_ = LogLevel::INFO;
bool Logger::use_journald_ = true;
std::mutex Logger::mutex_;
bool Logger::initialized_ = false;

void Logger::init(LogLevel min_level, bool use_journald) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = min_level;
    use_journald_ = use_journald;
    initialized_ = true;
    
    if (!use_journald_ && min_level_ == LogLevel::DEBUG) {
        std::cerr << "[wardend] stderr logging at DEBUG" << std::endl;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_ && !use_journald_) {
        std::cerr.flush();
    }
    initialized_ = false;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

LogLevel Logger::level_from_int(int level) {
    switch (level) {
        case 0: return LogLevel::DEBUG;
        case 1: return LogLevel::INFO;
        case 2: return LogLevel::WARN;
        case 3: return LogLevel::ERROR;
        case 4: return LogLevel::CRITICAL;
        default:
            // Config validation rejects anything outside 0..4
            return level < 0 ? LogLevel::DEBUG : LogLevel::CRITICAL;
    }
}

void Logger::debug(const std::string& component, const std::string& message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(const std::string& component, const std::string& message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warn(const std::string& component, const std::string& message) {
    log(LogLevel::WARN, component, message);
}

void Logger::error(const std::string& component, const std::string& message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::critical(const std::string& component, const std::string& message) {
    log(LogLevel::CRITICAL, component, message);
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }
    
    if (use_journald_) {
        log_to_journald(level, component, message);
    } else {
        log_to_stderr(level, component, message);
    }
}

void Logger::process_output(const std::string& watcher, int pid,
                            const std::string& stream, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (static_cast<int>(LogLevel::INFO) < static_cast<int>(min_level_)) {
        return;
    }
    
    std::string component = "watcher:" + watcher;
    if (use_journald_) {
        // stderr output of a child is reported one priority higher
        int priority = stream == "stderr" ? internal::SYSLOG_WARNING : internal::SYSLOG_INFO;
        sd_journal_send(
            "MESSAGE=%s", line.c_str(),
            "PRIORITY=%d", priority,
            "SYSLOG_IDENTIFIER=wardend",
            "WARDEND_COMPONENT=%s", component.c_str(),
            "WARDEND_WATCHER=%s", watcher.c_str(),
            "WARDEND_PID=%d", pid,
            "WARDEND_STREAM=%s", stream.c_str(),
            NULL
        );
    } else {
        log_to_stderr(LogLevel::INFO, component, "[" + std::to_string(pid) + " " + stream + "] " + line);
    }
}

void Logger::log_to_journald(LogLevel level, const std::string& component, const std::string& message) {
    sd_journal_send(
        "MESSAGE=%s", message.c_str(),
        "PRIORITY=%d", level_to_priority(level),
        "SYSLOG_IDENTIFIER=wardend",
        "WARDEND_COMPONENT=%s", component.c_str(),
        NULL
    );
}

void Logger::log_to_stderr(LogLevel level, const std::string& component, const std::string& message) {
    auto now = std::time(nullptr);
    std::tm tm_buf{};
    std::tm* tm = localtime_r(&now, &tm_buf);
    
    // Format: [TIMESTAMP] [LEVEL] component: message
    if (tm) {
        std::cerr << std::put_time(tm, "[%Y-%m-%d %H:%M:%S]");
    } else {
        std::cerr << "[XXXX-XX-XX XX:XX:XX]";
    }
    std::cerr << " [" << level_to_string(level) << "]"
              << " " << component << ": "
              << message << std::endl;
}

int Logger::level_to_priority(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return internal::SYSLOG_DEBUG;
        case LogLevel::INFO: return internal::SYSLOG_INFO;
        case LogLevel::WARN: return internal::SYSLOG_WARNING;
        case LogLevel::ERROR: return internal::SYSLOG_ERR;
        case LogLevel::CRITICAL: return internal::SYSLOG_CRIT;
        default: return internal::SYSLOG_INFO;
    }
}

const char* Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

} // namespace wardend
