/**
 * @file server.cpp
 * @brief Unix socket IPC server implementation
 */

#include "wardend/ipc/server.h"
#include "wardend/errors.h"
#include "wardend/logger.h"
#include <systemd/sd-daemon.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <cstring>
#include <filesystem>
#include <vector>

namespace wardend {

// RateLimiter implementation

RateLimiter::RateLimiter(int max_per_second)
    : max_per_second_(max_per_second)
    , window_start_(std::chrono::steady_clock::now()) {
}

bool RateLimiter::allow() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - window_start_);
    
    // Reset window every second
    if (elapsed.count() >= 1000) {
        count_ = 0;
        window_start_ = now;
    }
    
    if (count_ >= max_per_second_) {
        return false;
    }
    
    count_++;
    return true;
}

void RateLimiter::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    count_ = 0;
    window_start_ = std::chrono::steady_clock::now();
}

// IPCServer implementation

IPCServer::IPCServer(const std::string& socket_path, int max_requests_per_sec,
                     int backlog, int timeout_ms)
    : socket_path_(socket_path)
    , backlog_(backlog)
    , timeout_ms_(timeout_ms)
    , rate_limiter_(max_requests_per_sec) {
}

IPCServer::~IPCServer() {
    stop();
}

bool IPCServer::start() {
    if (running_) {
        return true;
    }
    
    if (!adopt_listen_fd() && !create_socket()) {
        return false;
    }
    
    running_ = true;
    accept_thread_ = std::make_unique<std::thread>([this] { accept_loop(); });
    
    LOG_INFO("IPCServer", std::string(adopted_ ? "Adopted " : "Started on ") + socket_path_);
    return true;
}

void IPCServer::stop() {
    if (!running_) {
        return;
    }
    
    running_ = false;
    
    // The accept loop polls with a timeout and sees running_ go false. An
    // adopted socket is shared with systemd and must not be shut down.
    if (server_fd_ != -1 && !adopted_) {
        shutdown(server_fd_, SHUT_RDWR);
    }
    
    if (accept_thread_ && accept_thread_->joinable()) {
        accept_thread_->join();
    }
    
    // Wait for in-flight handlers before tearing down the socket
    {
        std::unique_lock<std::mutex> lock(connections_mutex_);
        connections_cv_.wait(lock, [this] {
            return active_connections_.load() == 0;
        });
    }
    
    cleanup_socket();
    LOG_INFO("IPCServer", "Stopped");
}

bool IPCServer::is_healthy() const {
    return running_.load() && server_fd_ != -1;
}

void IPCServer::register_handler(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[method] = std::move(handler);
    LOG_DEBUG("IPCServer", "Registered handler for: " + method);
}

void IPCServer::mark_read_only(const std::string& method) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    read_only_.insert(method);
}

bool IPCServer::is_read_only(const std::string& method) const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    return read_only_.count(method) > 0;
}

size_t IPCServer::handler_count() const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    return handlers_.size();
}

bool IPCServer::adopt_listen_fd() {
    int n = sd_listen_fds(0);
    if (n <= 0) {
        return false;
    }
    
    for (int fd = SD_LISTEN_FDS_START; fd < SD_LISTEN_FDS_START + n; ++fd) {
        if (sd_is_socket_unix(fd, SOCK_STREAM, 1, socket_path_.c_str(), 0) > 0) {
            // Children must not inherit the control socket
            int flags = fcntl(fd, F_GETFD);
            if (flags == -1 || fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
                LOG_WARN("IPCServer", "Cannot set FD_CLOEXEC on adopted socket: " +
                         std::string(strerror(errno)));
            }
            server_fd_ = fd;
            adopted_ = true;
            return true;
        }
    }
    
    LOG_DEBUG("IPCServer", std::to_string(n) + " inherited fds, none bound to " + socket_path_);
    return false;
}

bool IPCServer::create_socket() {
    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ == -1) {
        LOG_ERROR("IPCServer", "Failed to create socket: " + std::string(strerror(errno)));
        return false;
    }
    
    std::error_code ec;
    if (std::filesystem::exists(socket_path_, ec)) {
        std::filesystem::remove(socket_path_, ec);
        LOG_DEBUG("IPCServer", "Removed existing socket file");
    }
    
    auto parent = std::filesystem::path(socket_path_).parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_ERROR("IPCServer", "Cannot create " + parent.string() + ": " + ec.message());
            close(server_fd_);
            server_fd_ = -1;
            return false;
        }
    }
    
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    
    // Refuse paths that would be silently truncated
    if (socket_path_.size() > sizeof(addr.sun_path) - 1) {
        LOG_ERROR("IPCServer", "Socket path too long: " + socket_path_ + " (max " + 
                  std::to_string(sizeof(addr.sun_path) - 1) + " bytes)");
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);
    
    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1) {
        LOG_ERROR("IPCServer", "Failed to bind socket: " + std::string(strerror(errno)));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    
    if (listen(server_fd_, backlog_) == -1) {
        LOG_ERROR("IPCServer", "Failed to listen: " + std::string(strerror(errno)));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    
    return setup_permissions();
}

bool IPCServer::setup_permissions() {
    // Control commands are root/owner-only
    if (chmod(socket_path_.c_str(), 0660) == -1) {
        LOG_WARN("IPCServer", "Failed to set socket permissions: " + std::string(strerror(errno)));
    }
    return true;
}

void IPCServer::cleanup_socket() {
    if (server_fd_ != -1) {
        close(server_fd_);
        server_fd_ = -1;
    }
    
    if (adopted_) {
        adopted_ = false;
        return;
    }
    
    std::error_code ec;
    if (std::filesystem::exists(socket_path_, ec)) {
        std::filesystem::remove(socket_path_, ec);
    }
}

void IPCServer::accept_loop() {
    LOG_DEBUG("IPCServer", "Accept loop started");
    
    while (running_) {
        struct pollfd pfd = {server_fd_, POLLIN, 0};
        int ready = poll(&pfd, 1, 250);
        if (ready == 0 || (ready == -1 && errno == EINTR)) {
            continue;
        }
        if (ready == -1 || (pfd.revents & (POLLERR | POLLNVAL))) {
            if (running_) {
                LOG_ERROR("IPCServer", "Listening socket failed: " + std::string(strerror(errno)));
            }
            break;
        }
        
        int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        
        if (client_fd == -1) {
            if (running_ && errno != EINTR) {
                LOG_ERROR("IPCServer", "Accept failed: " + std::string(strerror(errno)));
            }
            continue;
        }
        
        struct timeval timeout;
        timeout.tv_sec = timeout_ms_ / 1000;
        timeout.tv_usec = (timeout_ms_ % 1000) * 1000;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));
        
        handle_client(client_fd);
    }
    
    LOG_DEBUG("IPCServer", "Accept loop ended");
}

void IPCServer::handle_client(int client_fd) {
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        active_connections_++;
        connections_served_++;
    }
    
    try {
        std::vector<char> buffer(MAX_MESSAGE_SIZE);
        ssize_t bytes = recv(client_fd, buffer.data(), buffer.size(), 0);
        
        if (bytes <= 0) {
            LOG_DEBUG("IPCServer", "Client disconnected without data");
            finish_client(client_fd);
            return;
        }
        
        std::string raw_request(buffer.data(), static_cast<size_t>(bytes));
        LOG_DEBUG("IPCServer", "Received: " + raw_request);
        
        Response response;
        if (!rate_limiter_.allow()) {
            LOG_WARN("IPCServer", "Rate limit exceeded");
            response = Response::err("Rate limit exceeded", ErrorCodes::RATE_LIMITED);
        } else {
            auto request = Request::parse(raw_request);
            if (!request) {
                response = Response::err("Invalid request format", ErrorCodes::PARSE_ERROR);
            } else if (!is_read_only(request->method) && !peer_privileged(client_fd)) {
                permission_denials_++;
                LOG_WARN("IPCServer", "Unprivileged peer refused " + request->method);
                response = Response::err("Permission denied: " + request->method,
                                         ErrorCodes::PERMISSION_DENIED);
            } else {
                response = dispatch(*request);
            }
        }
        
        std::string response_str = response.to_json();
        LOG_DEBUG("IPCServer", "Sending: " + response_str);
        
        if (send(client_fd, response_str.c_str(), response_str.length(), MSG_NOSIGNAL) == -1) {
            LOG_ERROR("IPCServer", "Failed to send response: " + std::string(strerror(errno)));
        }
        
    } catch (const std::exception& e) {
        LOG_ERROR("IPCServer", "Exception handling client: " + std::string(e.what()));
        std::string response_str = Response::err(e.what(), ErrorCodes::INTERNAL_ERROR).to_json();
        if (send(client_fd, response_str.c_str(), response_str.length(), MSG_NOSIGNAL) == -1) {
            LOG_DEBUG("IPCServer", "Client gone before error reply");
        }
    }
    
    finish_client(client_fd);
}

bool IPCServer::peer_privileged(int client_fd) {
    struct ucred cred;
    socklen_t len = sizeof(cred);
    if (getsockopt(client_fd, SOL_SOCKET, SO_PEERCRED, &cred, &len) == -1) {
        LOG_WARN("IPCServer", "SO_PEERCRED failed: " + std::string(strerror(errno)));
        return false;
    }
    return cred.uid == 0 || cred.uid == geteuid();
}

void IPCServer::finish_client(int client_fd) {
    close(client_fd);
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        active_connections_--;
    }
    connections_cv_.notify_all();
}

Response IPCServer::dispatch(const Request& request) {
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(request.method);
        if (it == handlers_.end()) {
            LOG_WARN("IPCServer", "Unknown method: " + request.method);
            return Response::err("Method not found: " + request.method, ErrorCodes::METHOD_NOT_FOUND);
        }
        handler = it->second;
    }
    
    LOG_DEBUG("IPCServer", "Dispatching " + request.method);
    try {
        return handler(request);
    } catch (const GateBusy& e) {
        LOG_INFO("IPCServer", request.method + " rejected: " + e.what());
        return Response::err(e.what(), ErrorCodes::BUSY);
    } catch (const UnknownWatcher& e) {
        return Response::err(e.what(), ErrorCodes::WATCHER_NOT_FOUND);
    } catch (const json::exception& e) {
        return Response::err(std::string("Invalid params: ") + e.what(), ErrorCodes::INVALID_PARAMS);
    } catch (const WardenError& e) {
        LOG_WARN("IPCServer", request.method + " failed: " + e.what());
        return Response::err(e.what(), ErrorCodes::COMMAND_FAILED);
    } catch (const std::exception& e) {
        LOG_ERROR("IPCServer", "Handler error for " + request.method + ": " + e.what());
        return Response::err(e.what(), ErrorCodes::INTERNAL_ERROR);
    }
}

} // namespace wardend
