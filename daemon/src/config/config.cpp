/**
 * @file config.cpp
 * @brief Configuration implementation with YAML support
 */

#include "wardend/config.h"
#include "wardend/core/signal_dispatcher.h"
#include "wardend/logger.h"
#include <signal.h>
#include <fstream>
#include <set>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace wardend {

namespace {

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

SocketConfig parse_socket(const YAML::Node& node) {
    SocketConfig socket;
    if (node["name"]) socket.name = node["name"].as<std::string>();
    if (node["path"]) socket.path = node["path"].as<std::string>();
    if (node["host"]) socket.host = node["host"].as<std::string>();
    if (node["port"]) socket.port = node["port"].as<int>();
    if (node["backlog"]) socket.backlog = node["backlog"].as<int>();
    return socket;
}

WatcherConfig parse_watcher(const YAML::Node& node) {
    WatcherConfig watcher;
    if (node["name"]) watcher.name = node["name"].as<std::string>();
    if (node["cmd"]) watcher.cmd = node["cmd"].as<std::string>();
    if (node["args"]) watcher.args = node["args"].as<std::vector<std::string>>();
    if (node["env"]) watcher.env = node["env"].as<std::map<std::string, std::string>>();
    if (node["copy_env"]) watcher.copy_env = node["copy_env"].as<bool>();
    if (node["working_dir"]) watcher.working_dir = node["working_dir"].as<std::string>();
    if (node["numprocesses"]) watcher.numprocesses = node["numprocesses"].as<int>();
    if (node["respawn"]) watcher.respawn = node["respawn"].as<bool>();
    if (node["max_retry"]) watcher.max_retry = node["max_retry"].as<int>();
    if (node["graceful_timeout"]) watcher.graceful_timeout = seconds_to_ms(node["graceful_timeout"].as<double>());
    if (node["stop_signal"]) watcher.stop_signal = node["stop_signal"].as<std::string>();
    if (node["warmup_delay"]) watcher.warmup_delay = seconds_to_ms(node["warmup_delay"].as<double>());
    if (node["max_age"]) watcher.max_age = std::chrono::seconds(node["max_age"].as<int>());
    if (node["priority"]) watcher.priority = node["priority"].as<int>();
    if (node["autostart"]) watcher.autostart = node["autostart"].as<bool>();
    if (node["on_demand"]) watcher.on_demand = node["on_demand"].as<bool>();
    if (node["capture_output"]) watcher.capture_output = node["capture_output"].as<bool>();
    if (node["sockets"]) {
        for (const auto& socket : node["sockets"]) {
            watcher.sockets.push_back(parse_socket(socket));
        }
    }
    return watcher;
}

std::optional<Config> parse_node(const YAML::Node& yaml) {
    Config config;
    
    // Socket configuration
    if (yaml["socket"]) {
        auto socket = yaml["socket"];
        if (socket["path"]) config.socket_path = socket["path"].as<std::string>();
        if (socket["backlog"]) config.socket_backlog = socket["backlog"].as<int>();
        if (socket["timeout_ms"]) config.socket_timeout_ms = socket["timeout_ms"].as<int>();
    }
    
    // Rate limiting
    if (yaml["rate_limit"]) {
        auto rate = yaml["rate_limit"];
        if (rate["max_requests_per_sec"]) config.max_requests_per_sec = rate["max_requests_per_sec"].as<int>();
    }
    
    // Supervision
    if (yaml["check_interval_ms"]) config.check_interval_ms = yaml["check_interval_ms"].as<int>();
    if (yaml["command_timeout_ms"]) config.command_timeout_ms = yaml["command_timeout_ms"].as<int>();
    if (yaml["watchdog_interval_sec"]) config.watchdog_interval_sec = yaml["watchdog_interval_sec"].as<int>();
    
    if (yaml["signals"]) {
        config.signals = yaml["signals"].as<std::map<std::string, std::string>>();
    }
    
    if (yaml["watchers"]) {
        for (const auto& watcher : yaml["watchers"]) {
            config.watchers.push_back(parse_watcher(watcher));
        }
    }
    
    // Logging
    if (yaml["log_level"]) {
        config.log_level = yaml["log_level"].as<int>();
    }
    
    config.expand_paths();
    std::string error = config.validate();
    if (!error.empty()) {
        LOG_ERROR("Config", "Configuration validation failed: " + error);
        return std::nullopt;
    }
    return config;
}

} // namespace

std::string WatcherConfig::validate() const {
    if (name.empty()) {
        return "watcher name must not be empty";
    }
    if (cmd.empty()) {
        return "watcher " + name + ": cmd must not be empty";
    }
    if (numprocesses < 0) {
        return "watcher " + name + ": numprocesses must not be negative";
    }
    if (numprocesses > MAX_NUMPROCESSES) {
        return "watcher " + name + ": numprocesses must not exceed " + std::to_string(MAX_NUMPROCESSES);
    }
    if (max_retry < -1) {
        return "watcher " + name + ": max_retry must be -1 or greater";
    }
    if (graceful_timeout.count() < 0) {
        return "watcher " + name + ": graceful_timeout must not be negative";
    }
    if (!signal_from_name(stop_signal)) {
        return "watcher " + name + ": unknown stop_signal " + stop_signal;
    }
    if (on_demand && sockets.empty()) {
        return "watcher " + name + ": on_demand requires at least one socket";
    }
    for (const auto& socket : sockets) {
        if (socket.name.empty()) {
            return "watcher " + name + ": socket name must not be empty";
        }
        if (socket.path.empty() && (socket.port <= 0 || socket.port > 65535)) {
            return "watcher " + name + ": socket " + socket.name + " needs a path or a valid port";
        }
    }
    return "";
}

std::optional<Config> Config::load(const std::string& path) {
    try {
        std::string expanded_path = expand_path(path);
        
        std::ifstream file(expanded_path);
        if (!file.good()) {
            LOG_WARN("Config", "Configuration file not found: " + expanded_path);
            return std::nullopt;
        }
        
        auto config = parse_node(YAML::LoadFile(expanded_path));
        if (config) {
            LOG_INFO("Config", "Configuration loaded from " + expanded_path);
        }
        return config;
        
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Config", "YAML parse error: " + std::string(e.what()));
        return std::nullopt;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", "Error loading config: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<Config> Config::parse(const std::string& yaml) {
    try {
        return parse_node(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Config", "YAML parse error: " + std::string(e.what()));
        return std::nullopt;
    }
}

bool Config::save(const std::string& path) const {
    try {
        std::string expanded_path = expand_path(path);
        
        YAML::Emitter out;
        out << YAML::BeginMap;
        
        // Socket
        out << YAML::Key << "socket" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << socket_path;
        out << YAML::Key << "backlog" << YAML::Value << socket_backlog;
        out << YAML::Key << "timeout_ms" << YAML::Value << socket_timeout_ms;
        out << YAML::EndMap;
        
        // Rate limiting
        out << YAML::Key << "rate_limit" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_requests_per_sec" << YAML::Value << max_requests_per_sec;
        out << YAML::EndMap;
        
        out << YAML::Key << "check_interval_ms" << YAML::Value << check_interval_ms;
        out << YAML::Key << "command_timeout_ms" << YAML::Value << command_timeout_ms;
        out << YAML::Key << "watchdog_interval_sec" << YAML::Value << watchdog_interval_sec;
        
        if (!signals.empty()) {
            out << YAML::Key << "signals" << YAML::Value << signals;
        }
        
        out << YAML::Key << "watchers" << YAML::Value << YAML::BeginSeq;
        for (const auto& watcher : watchers) {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << watcher.name;
            out << YAML::Key << "cmd" << YAML::Value << watcher.cmd;
            if (!watcher.args.empty()) {
                out << YAML::Key << "args" << YAML::Value << watcher.args;
            }
            if (!watcher.env.empty()) {
                out << YAML::Key << "env" << YAML::Value << watcher.env;
            }
            out << YAML::Key << "numprocesses" << YAML::Value << watcher.numprocesses;
            out << YAML::Key << "respawn" << YAML::Value << watcher.respawn;
            out << YAML::Key << "max_retry" << YAML::Value << watcher.max_retry;
            out << YAML::Key << "graceful_timeout" << YAML::Value
                << watcher.graceful_timeout.count() / 1000.0;
            out << YAML::Key << "stop_signal" << YAML::Value << watcher.stop_signal;
            out << YAML::Key << "priority" << YAML::Value << watcher.priority;
            out << YAML::Key << "autostart" << YAML::Value << watcher.autostart;
            out << YAML::Key << "on_demand" << YAML::Value << watcher.on_demand;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
        
        // Logging
        out << YAML::Key << "log_level" << YAML::Value << log_level;
        
        out << YAML::EndMap;
        
        std::ofstream file(expanded_path);
        if (!file.good()) {
            LOG_ERROR("Config", "Cannot write to " + expanded_path);
            return false;
        }
        
        file << out.c_str();
        LOG_INFO("Config", "Configuration saved to " + expanded_path);
        return true;
        
    } catch (const std::exception& e) {
        LOG_ERROR("Config", "Error saving config: " + std::string(e.what()));
        return false;
    }
}

void Config::expand_paths() {
    socket_path = expand_path(socket_path);
    for (auto& watcher : watchers) {
        watcher.working_dir = expand_path(watcher.working_dir);
        for (auto& socket : watcher.sockets) {
            socket.path = expand_path(socket.path);
        }
    }
}

std::string Config::validate() const {
    if (socket_backlog <= 0) {
        return "socket_backlog must be positive";
    }
    if (socket_timeout_ms <= 0) {
        return "socket_timeout_ms must be positive";
    }
    if (max_requests_per_sec <= 0) {
        return "max_requests_per_sec must be positive";
    }
    if (check_interval_ms <= 0) {
        return "check_interval_ms must be positive";
    }
    if (command_timeout_ms < 0) {
        return "command_timeout_ms must not be negative";
    }
    if (log_level < 0 || log_level > 4) {
        return "log_level must be between 0 and 4";
    }
    for (const auto& entry : signals) {
        auto signum = signal_from_name(entry.first);
        if (!signum) {
            return "unknown signal " + entry.first;
        }
        if (!signal_catchable(*signum)) {
            return entry.first + " cannot be caught";
        }
        auto action = parse_signal_action(entry.second);
        if (!action) {
            return "unknown action " + entry.second + " for " + entry.first;
        }
        // Exited children are only collected on SIGCHLD or by the reconciler
        if (*signum == SIGCHLD && *action != SignalAction::REAP && *action != SignalAction::IGNORE) {
            return "SIGCHLD may only be mapped to reap or ignore";
        }
    }
    std::set<std::string> names;
    for (const auto& watcher : watchers) {
        std::string error = watcher.validate();
        if (!error.empty()) {
            return error;
        }
        if (!names.insert(watcher.name).second) {
            return "duplicate watcher name " + watcher.name;
        }
    }
    return "";  // Valid
}

Config Config::defaults() {
    return Config{};
}

// ConfigManager implementation

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::load(const std::string& path) {
    Config config_copy;
    std::vector<ChangeCallback> callbacks_copy;
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        
        auto loaded = Config::load(path);
        if (!loaded) {
            LOG_WARN("ConfigManager", "Using default configuration");
            config_ = Config::defaults();
            config_.expand_paths();
            return false;
        }
        
        config_ = *loaded;
        config_path_ = path;
        
        config_copy = config_;
        callbacks_copy = callbacks_;
    }
    
    // Invoke callbacks outside the lock to prevent deadlock
    notify_callbacks_unlocked(callbacks_copy, config_copy);
    return true;
}

bool ConfigManager::reload() {
    auto loaded = read();
    if (!loaded) {
        return false;
    }
    commit(*loaded);
    return true;
}

std::optional<Config> ConfigManager::read() const {
    std::string path_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_path_.empty()) {
            LOG_WARN("ConfigManager", "No config path set, cannot reload");
            return std::nullopt;
        }
        path_copy = config_path_;
    }
    
    auto loaded = Config::load(path_copy);
    if (!loaded) {
        LOG_ERROR("ConfigManager", "Failed to reload configuration");
    }
    return loaded;
}

void ConfigManager::commit(const Config& config) {
    std::vector<ChangeCallback> callbacks_copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = config;
        callbacks_copy = callbacks_;
    }
    
    notify_callbacks_unlocked(callbacks_copy, config);
    LOG_INFO("ConfigManager", "Configuration reloaded");
}

Config ConfigManager::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void ConfigManager::on_change(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = Config::defaults();
    config_path_.clear();
    callbacks_.clear();
}

void ConfigManager::notify_callbacks_unlocked(
    const std::vector<ChangeCallback>& callbacks,
    const Config& config) {
    for (const auto& callback : callbacks) {
        try {
            callback(config);
        } catch (const std::exception& e) {
            LOG_ERROR("ConfigManager", "Callback error: " + std::string(e.what()));
        }
    }
}

} // namespace wardend
