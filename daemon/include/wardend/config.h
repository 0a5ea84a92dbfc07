/**
 * @file config.h
 * @brief Configuration management with YAML support
 */

#pragma once

#include "wardend/common.h"
#include <string>
#include <chrono>
#include <optional>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace wardend {

/**
 * @brief A listening socket owned by a watcher
 *
 * Either @c path (Unix socket) or @c host / @c port (TCP) is set.
 */
struct SocketConfig {
    std::string name;
    std::string path;
    std::string host = "127.0.0.1";
    int port = 0;
    int backlog = SOCKET_BACKLOG;
};

/**
 * @brief Definition of one managed process group
 */
struct WatcherConfig {
    std::string name;
    std::string cmd;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    bool copy_env = true;
    std::string working_dir;
    
    int numprocesses = 1;
    bool respawn = true;
    int max_retry = DEFAULT_MAX_RETRY;  // -1 retries forever
    
    std::chrono::milliseconds graceful_timeout{DEFAULT_GRACEFUL_TIMEOUT_SEC * 1000};
    std::string stop_signal = "SIGTERM";
    std::chrono::milliseconds warmup_delay{0};
    std::chrono::seconds max_age{0};  // zero disables age-based replacement
    
    int priority = 0;          // higher starts first
    bool autostart = true;
    bool on_demand = false;    // start on first connection to one of the sockets
    bool capture_output = true;
    
    std::vector<SocketConfig> sockets;
    
    /**
     * @return Error message if invalid, empty string if valid
     */
    std::string validate() const;
};

/**
 * @brief Daemon configuration structure
 */
struct Config {
    // Socket configuration
    std::string socket_path = DEFAULT_SOCKET_PATH;
    int socket_backlog = SOCKET_BACKLOG;
    int socket_timeout_ms = SOCKET_TIMEOUT_MS;
    
    // Rate limiting
    int max_requests_per_sec = MAX_REQUESTS_PER_SECOND;
    
    // Supervision
    int check_interval_ms = DEFAULT_CHECK_INTERVAL_MS;    // reconcile period
    int command_timeout_ms = DEFAULT_COMMAND_TIMEOUT_MS;  // bounded wait on the command gate
    int watchdog_interval_sec = DEFAULT_WATCHDOG_INTERVAL_SEC;
    
    // Signal name -> action name, merged over the built-in defaults
    std::map<std::string, std::string> signals;
    
    std::vector<WatcherConfig> watchers;
    
    // Logging
    int log_level = 1;  // INFO by default (0=DEBUG, 1=INFO, 2=WARN, 3=ERROR)
    
    /**
     * @brief Load configuration from YAML file
     * @param path Path to YAML configuration file
     * @return Config if successful, std::nullopt on error
     */
    static std::optional<Config> load(const std::string& path);
    
    /**
     * @brief Parse configuration from a YAML document
     */
    static std::optional<Config> parse(const std::string& yaml);
    
    /**
     * @brief Save configuration to YAML file
     */
    bool save(const std::string& path) const;
    
    /**
     * @brief Expand all paths (~ -> home directory)
     */
    void expand_paths();
    
    /**
     * @brief Validate configuration values
     * @return Error message if invalid, empty string if valid
     */
    std::string validate() const;
    
    static Config defaults();
};

/**
 * @brief Configuration manager singleton
 */
class ConfigManager {
public:
    static ConfigManager& instance();
    
    /**
     * @brief Load configuration from file
     * @return true if successful; on failure defaults are installed
     */
    bool load(const std::string& path);
    
    /**
     * @brief Reload configuration from previously loaded path
     */
    bool reload();
    
    /**
     * @brief Parse and validate the loaded path without installing the result
     */
    std::optional<Config> read() const;
    
    /**
     * @brief Install a config obtained from read() and notify callbacks
     */
    void commit(const Config& config);
    
    /**
     * @brief Get current configuration (returns copy for thread safety)
     */
    Config get() const;
    
    const std::string& config_path() const { return config_path_; }
    
    using ChangeCallback = std::function<void(const Config&)>;
    void on_change(ChangeCallback callback);
    
    /**
     * @brief Drop callbacks and loaded state (tests)
     */
    void reset();
    
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    
private:
    ConfigManager() = default;
    
    Config config_;
    std::string config_path_;
    std::vector<ChangeCallback> callbacks_;
    mutable std::mutex mutex_;
    
    static void notify_callbacks_unlocked(const std::vector<ChangeCallback>& callbacks,
                                          const Config& config);
};

} // namespace wardend
