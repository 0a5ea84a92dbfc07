/**
 * @file server.h
 * @brief Unix socket IPC server
 */

#pragma once

#include "wardend/core/service.h"
#include "wardend/ipc/protocol.h"
#include <string>
#include <thread>
#include <atomic>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <sys/types.h>
#include <chrono>

namespace wardend {

/**
 * @brief Request handler function type
 */
using RequestHandler = std::function<Response(const Request&)>;

/**
 * @brief Fixed-window rate limiter for request throttling
 */
class RateLimiter {
public:
    explicit RateLimiter(int max_per_second);
    
    /**
     * @brief Check if request is allowed
     * @return true if allowed, false if rate limited
     */
    bool allow();
    
    void reset();
    
private:
    int max_per_second_;
    int count_ = 0;
    std::chrono::steady_clock::time_point window_start_;
    std::mutex mutex_;
};

/**
 * @brief Unix socket IPC server
 *
 * Connections are served one at a time on the accept thread, one request
 * per connection. Exclusive commands block this thread for at most the
 * arbiter's command timeout before answering BUSY.
 *
 * If systemd passed a listening unix socket bound to socket_path, it is
 * adopted instead of binding a new one, and left in place on stop.
 * Peers other than root and the daemon's own user may only call methods
 * marked read-only.
 */
class IPCServer : public Service {
public:
    /**
     * @param socket_path Path to Unix socket
     * @param max_requests_per_sec Rate limit for requests
     * @param backlog listen(2) backlog
     * @param timeout_ms Per-connection send/receive timeout
     */
    IPCServer(const std::string& socket_path,
              int max_requests_per_sec = MAX_REQUESTS_PER_SECOND,
              int backlog = SOCKET_BACKLOG,
              int timeout_ms = SOCKET_TIMEOUT_MS);
    ~IPCServer() override;
    
    // Service interface
    bool start() override;
    void stop() override;
    const char* name() const override { return "IPCServer"; }
    int priority() const override { return 10; }  // accept commands once watchers are up
    bool is_running() const override { return running_.load(); }
    bool is_healthy() const override;
    
    void register_handler(const std::string& method, RequestHandler handler);
    
    /**
     * @brief Allow a method for unprivileged peers
     */
    void mark_read_only(const std::string& method);
    bool is_read_only(const std::string& method) const;
    
    size_t handler_count() const;
    
    const std::string& socket_path() const { return socket_path_; }
    
    size_t connections_served() const { return connections_served_.load(); }
    size_t active_connections() const { return active_connections_.load(); }
    size_t permission_denials() const { return permission_denials_.load(); }
    
    /**
     * @brief True when the listening socket came from systemd
     */
    bool socket_adopted() const { return adopted_; }
    
private:
    std::string socket_path_;
    int backlog_;
    int timeout_ms_;
    int server_fd_ = -1;
    bool adopted_ = false;
    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> accept_thread_;
    
    std::unordered_map<std::string, RequestHandler> handlers_;
    std::unordered_set<std::string> read_only_;
    mutable std::mutex handlers_mutex_;
    
    RateLimiter rate_limiter_;
    
    std::atomic<size_t> connections_served_{0};
    std::atomic<size_t> active_connections_{0};
    std::atomic<size_t> permission_denials_{0};
    
    // Condition variable for waiting on in-flight handlers during stop()
    std::condition_variable connections_cv_;
    std::mutex connections_mutex_;
    
    bool adopt_listen_fd();
    bool create_socket();
    bool setup_permissions();
    void cleanup_socket();
    void accept_loop();
    void handle_client(int client_fd);
    static bool peer_privileged(int client_fd);
    void finish_client(int client_fd);
    Response dispatch(const Request& request);
};

} // namespace wardend
