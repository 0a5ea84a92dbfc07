/**
 * @file stream_redirector.cpp
 * @brief Child output forwarding implementation
 */

#include "wardend/process/stream_redirector.h"
#include "wardend/logger.h"
#include <unistd.h>
#include <cerrno>
#include <utility>

namespace wardend {

// Redirection implementation

StreamRedirector::Redirection::Redirection(StreamRedirector* owner, std::vector<int> fds)
    : owner_(owner)
    , fds_(std::move(fds)) {
}

StreamRedirector::Redirection::~Redirection() {
    if (owner_ && !committed_) {
        owner_->remove_fds(fds_);
    }
}

StreamRedirector::Redirection::Redirection(Redirection&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr))
    , fds_(std::move(other.fds_))
    , committed_(other.committed_) {
}

StreamRedirector::Redirection& StreamRedirector::Redirection::operator=(Redirection&& other) noexcept {
    if (this != &other) {
        if (owner_ && !committed_) {
            owner_->remove_fds(fds_);
        }
        owner_ = std::exchange(other.owner_, nullptr);
        fds_ = std::move(other.fds_);
        committed_ = other.committed_;
    }
    return *this;
}

// StreamRedirector implementation

StreamRedirector::StreamRedirector(HandlerRegistry& registry, Sink sink)
    : registry_(registry)
    , sink_(sink ? std::move(sink) : Sink(&StreamRedirector::log_line)) {
}

StreamRedirector::~StreamRedirector() {
    std::vector<int> fds;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : streams_) {
            fds.push_back(entry.first);
        }
    }
    remove_fds(fds);
}

StreamRedirector::Redirection StreamRedirector::add_redirections(const std::string& watcher,
                                                                 const Process& process) {
    const std::pair<int, const char*> pipes[] = {
        {process.stdout_fd(), "stdout"},
        {process.stderr_fd(), "stderr"},
    };
    
    std::vector<int> registered;
    for (const auto& pipe : pipes) {
        if (pipe.first == -1) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            streams_[pipe.first] = Stream{watcher, process.pid(), pipe.second, ""};
        }
        try {
            registry_.register_fd(pipe.first, [this](int fd, uint32_t events) {
                on_readable(fd, events);
            });
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                streams_.erase(pipe.first);
            }
            remove_fds(registered);
            throw;
        }
        registered.push_back(pipe.first);
    }
    return Redirection(this, std::move(registered));
}

size_t StreamRedirector::remove_redirections(const Process& process) {
    return remove_fds({process.stdout_fd(), process.stderr_fd()});
}

size_t StreamRedirector::remove_fds(const std::vector<int>& fds) {
    size_t removed = 0;
    for (int fd : fds) {
        if (fd == -1) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = streams_.find(fd);
            if (it == streams_.end()) {
                continue;
            }
            emit_lines(it->second, true);
            streams_.erase(it);
        }
        if (registry_.unregister_fd(fd)) {
            ++removed;
        }
    }
    return removed;
}

size_t StreamRedirector::active_streams() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streams_.size();
}

void StreamRedirector::log_line(const std::string& watcher, pid_t pid,
                                const std::string& stream, const std::string& line) {
    Logger::process_output(watcher, static_cast<int>(pid), stream, line);
}

void StreamRedirector::on_readable(int fd, uint32_t events) {
    bool closed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = streams_.find(fd);
        if (it == streams_.end()) {
            // Stale binding for a stream we already dropped
            return;
        }
        
        char buffer[4096];
        for (;;) {
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                it->second.partial.append(buffer, static_cast<size_t>(n));
                continue;
            }
            if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
                closed = true;
            }
            break;
        }
        if (!closed && (events & IoEvents::ERROR) && !(events & IoEvents::READ)) {
            closed = true;
        }
        emit_lines(it->second, closed);
        if (closed) {
            streams_.erase(it);
        }
    }
    
    if (closed) {
        registry_.unregister_fd(fd);
    }
}

void StreamRedirector::emit_lines(Stream& stream, bool flush) {
    size_t start = 0;
    size_t newline;
    while ((newline = stream.partial.find('\n', start)) != std::string::npos) {
        sink_(stream.watcher, stream.pid, stream.name, stream.partial.substr(start, newline - start));
        start = newline + 1;
    }
    stream.partial.erase(0, start);
    if (flush && !stream.partial.empty()) {
        sink_(stream.watcher, stream.pid, stream.name, stream.partial);
        stream.partial.clear();
    }
}

} // namespace wardend
