/**
 * @file handlers.h
 * @brief IPC request handlers
 */

#pragma once

#include "wardend/ipc/server.h"
#include "wardend/ipc/protocol.h"

namespace wardend {

class Arbiter;

/**
 * @brief IPC request handlers
 *
 * Exclusive commands go through the Arbiter and may fail with BUSY;
 * status queries read published snapshots only.
 */
class Handlers {
public:
    /**
     * @brief Register all handlers with IPC server
     */
    static void register_all(IPCServer& server, Arbiter& arbiter);
    
private:
    static Response handle_ping(const Request& req);
    static Response handle_version(const Request& req);
    
    // Status
    static Response handle_status(const Request& req, Arbiter& arbiter);
    static Response handle_list(const Request& req, Arbiter& arbiter);
    static Response handle_watcher_status(const Request& req, Arbiter& arbiter);
    
    // Watcher commands
    static Response handle_watcher_start(const Request& req, Arbiter& arbiter);
    static Response handle_watcher_stop(const Request& req, Arbiter& arbiter);
    static Response handle_watcher_restart(const Request& req, Arbiter& arbiter);
    static Response handle_watcher_incr(const Request& req, Arbiter& arbiter);
    static Response handle_watcher_decr(const Request& req, Arbiter& arbiter);
    
    // Arbiter-wide commands
    static Response handle_start(const Request& req, Arbiter& arbiter);
    static Response handle_stop(const Request& req, Arbiter& arbiter);
    static Response handle_reload(const Request& req);
    
    // Config handlers
    static Response handle_config_get(const Request& req);
    
    // Daemon control
    static Response handle_shutdown(const Request& req);
    
    static std::string watcher_name(const Request& req);
    static int count_param(const Request& req);
};

} // namespace wardend
