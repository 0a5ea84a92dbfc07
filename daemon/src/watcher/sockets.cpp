/**
 * @file sockets.cpp
 * @brief Listening socket implementation
 */

#include "wardend/watcher/sockets.h"
#include "wardend/logger.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace wardend {

ListenSocket::ListenSocket(SocketConfig config)
    : config_(std::move(config)) {
}

ListenSocket::~ListenSocket() {
    close();
}

bool ListenSocket::bind() {
    if (fd_ != -1) {
        return true;
    }
    bool ok = config_.path.empty() ? bind_tcp() : bind_unix();
    if (!ok) {
        close();
        return false;
    }
    if (listen(fd_, config_.backlog) == -1) {
        LOG_ERROR("ListenSocket", "Failed to listen on " + config_.name + ": " + std::string(strerror(errno)));
        close();
        return false;
    }
    LOG_INFO("ListenSocket", "Socket " + config_.name + " listening (fd " + std::to_string(fd_) + ")");
    return true;
}

bool ListenSocket::bind_unix() {
    fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ == -1) {
        LOG_ERROR("ListenSocket", "Failed to create socket: " + std::string(strerror(errno)));
        return false;
    }
    
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (config_.path.size() > sizeof(addr.sun_path) - 1) {
        LOG_ERROR("ListenSocket", "Socket path too long: " + config_.path);
        return false;
    }
    strncpy(addr.sun_path, config_.path.c_str(), sizeof(addr.sun_path) - 1);
    
    std::error_code ec;
    std::filesystem::remove(config_.path, ec);
    
    if (::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1) {
        LOG_ERROR("ListenSocket", "Failed to bind " + config_.path + ": " + std::string(strerror(errno)));
        return false;
    }
    return true;
}

bool ListenSocket::bind_tcp() {
    fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ == -1) {
        LOG_ERROR("ListenSocket", "Failed to create socket: " + std::string(strerror(errno)));
        return false;
    }
    
    int opt = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(config_.port));
    if (inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("ListenSocket", "Invalid host for " + config_.name + ": " + config_.host);
        return false;
    }
    
    if (::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1) {
        LOG_ERROR("ListenSocket", "Failed to bind " + config_.host + ":" + std::to_string(config_.port) +
                  ": " + std::string(strerror(errno)));
        return false;
    }
    
    socklen_t len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }
    return true;
}

void ListenSocket::close() {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
        if (!config_.path.empty()) {
            std::error_code ec;
            std::filesystem::remove(config_.path, ec);
        }
    }
}

bool ListenSocket::has_pending_connection() const {
    if (fd_ == -1) {
        return false;
    }
    struct pollfd pfd = {fd_, POLLIN, 0};
    return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN);
}

std::string ListenSocket::env_name() const {
    std::string upper = config_.name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
    });
    return "WARDEND_SOCKET_" + upper;
}

} // namespace wardend
