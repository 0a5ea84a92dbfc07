/**
 * @file sockets.h
 * @brief Listening sockets handed to watcher processes
 */

#pragma once

#include "wardend/config.h"
#include <string>

namespace wardend {

/**
 * @brief A bound, listening socket shared with a watcher's children
 *
 * The daemon keeps the socket open for the watcher's lifetime; children
 * inherit the descriptor and accept on it. For on-demand watchers the daemon
 * only peeks for pending connections, it never accepts.
 */
class ListenSocket {
public:
    explicit ListenSocket(SocketConfig config);
    ~ListenSocket();
    
    ListenSocket(const ListenSocket&) = delete;
    ListenSocket& operator=(const ListenSocket&) = delete;
    
    /**
     * @brief Create, bind and listen
     * @return true on success
     */
    bool bind();
    
    void close();
    
    int fd() const { return fd_; }
    const std::string& name() const { return config_.name; }
    
    /**
     * @brief Bound TCP port (useful when configured with port 0)
     */
    int port() const { return port_; }
    
    /**
     * @brief Non-blocking check for a queued connection
     */
    bool has_pending_connection() const;
    
    /**
     * @brief Environment variable announcing the descriptor to children
     */
    std::string env_name() const;
    
private:
    SocketConfig config_;
    int fd_ = -1;
    int port_ = 0;
    
    bool bind_unix();
    bool bind_tcp();
};

} // namespace wardend
