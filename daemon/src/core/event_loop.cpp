/**
 * @file event_loop.cpp
 * @brief poll(2) based event loop implementation
 */

#include "wardend/core/event_loop.h"
#include "wardend/logger.h"
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>

namespace wardend {

EventLoop::EventLoop() {
    wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ == -1) {
        throw std::system_error(errno, std::generic_category(), "eventfd");
    }
}

EventLoop::~EventLoop() {
    if (wake_fd_ != -1) {
        close(wake_fd_);
        wake_fd_ = -1;
    }
}

// Descriptor bindings

void EventLoop::add_handler(int fd, IoHandler handler, uint32_t events) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bindings_.count(fd)) {
            throw std::invalid_argument("fd " + std::to_string(fd) + " added twice");
        }
        bindings_[fd] = Binding{std::move(handler), events};
    }
    wake();
}

void EventLoop::replace_handler(int fd, IoHandler handler, uint32_t events) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bindings_[fd] = Binding{std::move(handler), events};
    }
    wake();
}

void EventLoop::remove_handler(int fd) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bindings_.find(fd);
        if (it == bindings_.end()) {
            throw std::out_of_range("fd " + std::to_string(fd) + " not registered");
        }
        bindings_.erase(it);
    }
    wake();
}

bool EventLoop::has_handler(int fd) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.count(fd) > 0;
}

size_t EventLoop::handler_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_.size();
}

// Timers and callbacks

EventLoop::TimerId EventLoop::add_periodic(std::chrono::milliseconds interval, Callback callback) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("periodic interval must be positive");
    }
    return schedule(interval, interval, std::move(callback));
}

EventLoop::TimerId EventLoop::add_timeout(std::chrono::milliseconds delay, Callback callback) {
    return schedule(delay, std::chrono::milliseconds(0), std::move(callback));
}

EventLoop::TimerId EventLoop::schedule(std::chrono::milliseconds delay,
                                       std::chrono::milliseconds interval,
                                       Callback callback) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        timers_[id] = Timer{std::chrono::steady_clock::now() + delay, interval, std::move(callback)};
    }
    wake();
    return id;
}

void EventLoop::cancel_timer(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

void EventLoop::add_callback(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(callback));
    }
    wake();
}

// Loop control

void EventLoop::run() {
    loop_thread_ = std::this_thread::get_id();
    running_ = true;
    stop_requested_ = false;
    
    LOG_DEBUG("EventLoop", "Loop started");
    while (!stop_requested_.load()) {
        run_once(std::chrono::milliseconds(1000));
    }
    
    running_ = false;
    LOG_DEBUG("EventLoop", "Loop stopped");
}

void EventLoop::stop() {
    stop_requested_ = true;
    wake();
}

bool EventLoop::in_loop_thread() const {
    return loop_thread_ == std::this_thread::get_id();
}

size_t EventLoop::run_once(std::chrono::milliseconds max_wait) {
    std::vector<pollfd> fds;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fds.reserve(bindings_.size() + 1);
        fds.push_back(pollfd{wake_fd_, POLLIN, 0});
        for (const auto& entry : bindings_) {
            fds.push_back(pollfd{entry.first, static_cast<short>(entry.second.events), 0});
        }
    }
    
    int ready = poll(fds.data(), fds.size(), poll_timeout(max_wait));
    if (ready == -1 && errno != EINTR) {
        LOG_ERROR("EventLoop", "poll failed: " + std::string(strerror(errno)));
    }
    
    size_t dispatched = 0;
    if (ready > 0) {
        if (fds[0].revents & POLLIN) {
            drain_wake();
        }
        for (size_t i = 1; i < fds.size(); ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            // The binding may have been removed or replaced since the snapshot
            IoHandler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = bindings_.find(fds[i].fd);
                if (it == bindings_.end()) {
                    continue;
                }
                handler = it->second.handler;
            }
            try {
                handler(fds[i].fd, static_cast<uint32_t>(fds[i].revents));
            } catch (const std::exception& e) {
                LOG_ERROR("EventLoop", "Handler for fd " + std::to_string(fds[i].fd) +
                          " failed: " + e.what());
            }
            ++dispatched;
        }
    }
    
    dispatched += run_due_timers();
    dispatched += run_pending_callbacks();
    return dispatched;
}

int EventLoop::poll_timeout(std::chrono::milliseconds max_wait) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_.empty()) {
        return 0;
    }
    auto timeout = max_wait;
    auto now = std::chrono::steady_clock::now();
    for (const auto& entry : timers_) {
        auto until = std::chrono::duration_cast<std::chrono::milliseconds>(entry.second.due - now);
        if (until < timeout) {
            timeout = until;
        }
    }
    return timeout.count() < 0 ? 0 : static_cast<int>(timeout.count());
}

size_t EventLoop::run_due_timers() {
    auto now = std::chrono::steady_clock::now();
    std::vector<std::pair<TimerId, Callback>> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = timers_.begin(); it != timers_.end();) {
            if (it->second.due > now) {
                ++it;
                continue;
            }
            due.emplace_back(it->first, it->second.callback);
            if (it->second.interval.count() > 0) {
                it->second.due = now + it->second.interval;
                ++it;
            } else {
                it = timers_.erase(it);
            }
        }
    }
    
    for (auto& timer : due) {
        try {
            timer.second();
        } catch (const std::exception& e) {
            LOG_ERROR("EventLoop", "Timer " + std::to_string(timer.first) + " failed: " + e.what());
        }
    }
    return due.size();
}

size_t EventLoop::run_pending_callbacks() {
    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.swap(pending_);
    }
    
    for (auto& callback : callbacks) {
        try {
            callback();
        } catch (const std::exception& e) {
            LOG_ERROR("EventLoop", "Callback failed: " + std::string(e.what()));
        }
    }
    return callbacks.size();
}

void EventLoop::wake() {
    uint64_t one = 1;
    // EAGAIN means the counter is already non-zero, which wakes poll anyway
    ssize_t written = write(wake_fd_, &one, sizeof(one));
    (void)written;
}

void EventLoop::drain_wake() {
    uint64_t value;
    while (read(wake_fd_, &value, sizeof(value)) > 0) {
    }
}

} // namespace wardend
