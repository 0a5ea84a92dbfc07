/**
 * @file protocol.h
 * @brief JSON-RPC protocol definitions for IPC
 */

#pragma once

#include "wardend/common.h"
#include <string>
#include <optional>

namespace wardend {

/**
 * @brief IPC request structure
 */
struct Request {
    std::string method;
    json params;
    std::optional<std::string> id;
    
    /**
     * @brief Parse request from JSON string
     * @param raw Raw JSON string
     * @return Request if valid, std::nullopt on parse error
     */
    static std::optional<Request> parse(const std::string& raw);
    
    /**
     * @brief Serialize to JSON string
     */
    std::string to_json() const;
};

/**
 * @brief IPC response structure
 */
struct Response {
    bool success = false;
    json result;
    std::string error;
    int error_code = 0;
    
    /**
     * @brief Serialize to JSON string
     */
    std::string to_json() const;
    
    /**
     * @brief Create success response
     */
    static Response ok(json result = json::object());
    
    /**
     * @brief Create error response
     */
    static Response err(const std::string& message, int code = -1);
};

/**
 * @brief Supported IPC methods
 */
namespace Methods {
    // Status
    constexpr const char* PING = "ping";
    constexpr const char* VERSION = "version";
    constexpr const char* STATUS = "status";
    constexpr const char* LIST = "list";
    constexpr const char* WATCHER_STATUS = "watcher.status";
    
    // Watcher commands (exclusive)
    constexpr const char* WATCHER_START = "watcher.start";
    constexpr const char* WATCHER_STOP = "watcher.stop";
    constexpr const char* WATCHER_RESTART = "watcher.restart";
    constexpr const char* WATCHER_INCR = "watcher.incr";
    constexpr const char* WATCHER_DECR = "watcher.decr";
    
    // Arbiter-wide commands (exclusive)
    constexpr const char* START = "start";
    constexpr const char* STOP = "stop";
    constexpr const char* RELOAD = "reload";
    
    // Configuration
    constexpr const char* CONFIG_GET = "config.get";
    
    // Daemon control
    constexpr const char* SHUTDOWN = "shutdown";
}

/**
 * @brief Error codes for IPC responses
 * 
 * JSON-RPC reserves -32768 to -32000 for standard errors.
 * Custom application errors use positive integers (1-999).
 */
namespace ErrorCodes {
    // JSON-RPC standard errors (reserved range: -32768 to -32000)
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    
    // Custom application errors (non-reserved range: 1-999)
    constexpr int RATE_LIMITED = 102;
    constexpr int PERMISSION_DENIED = 103;  // peer may only call read-only methods
    constexpr int CONFIG_ERROR = 104;
    constexpr int BUSY = 105;               // another exclusive command holds the gate
    constexpr int WATCHER_NOT_FOUND = 106;
    constexpr int COMMAND_FAILED = 107;
}

} // namespace wardend
