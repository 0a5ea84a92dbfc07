/**
 * @file signal_channel.cpp
 * @brief Async-signal-safe signal ring implementation
 */

#include "wardend/core/signal_channel.h"
#include "wardend/logger.h"
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

namespace wardend {

std::atomic<SignalChannel*> SignalChannel::active_{nullptr};

SignalChannel::SignalChannel() {
    for (auto& slot : slots_) {
        slot.store(0, std::memory_order_relaxed);
    }
}

SignalChannel::~SignalChannel() {
    uninstall_all();
    close();
}

bool SignalChannel::open() {
    if (read_fd_ != -1) {
        return true;
    }
    int fds[2];
    if (pipe2(fds, O_NONBLOCK | O_CLOEXEC) == -1) {
        LOG_ERROR("SignalChannel", "Failed to create wake pipe: " + std::string(strerror(errno)));
        return false;
    }
    read_fd_ = fds[0];
    write_fd_.store(fds[1], std::memory_order_release);
    return true;
}

void SignalChannel::close() {
    int write_fd = write_fd_.exchange(-1);
    if (write_fd != -1) {
        ::close(write_fd);
    }
    if (read_fd_ != -1) {
        ::close(read_fd_);
        read_fd_ = -1;
    }
}

bool SignalChannel::install(int signum) {
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = &SignalChannel::handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    
    active_.store(this, std::memory_order_release);
    if (sigaction(signum, &sa, nullptr) == -1) {
        LOG_ERROR("SignalChannel", "sigaction(" + std::to_string(signum) + ") failed: " +
                  std::string(strerror(errno)));
        return false;
    }
    if (std::find(installed_.begin(), installed_.end(), signum) == installed_.end()) {
        installed_.push_back(signum);
    }
    return true;
}

void SignalChannel::uninstall_all() {
    for (int signum : installed_) {
        signal(signum, SIG_DFL);
    }
    installed_.clear();
    
    SignalChannel* self = this;
    active_.compare_exchange_strong(self, nullptr);
}

// Producer side: runs in signal context

void SignalChannel::handle_signal(int signum) noexcept {
    SignalChannel* channel = active_.load(std::memory_order_acquire);
    if (channel) {
        channel->push(signum);
    }
}

void SignalChannel::push(int signum) noexcept {
    const int saved_errno = errno;
    
    uint32_t head = head_.load(std::memory_order_relaxed);
    for (;;) {
        if (head - tail_.load(std::memory_order_acquire) >= CAPACITY) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            break;
        }
        if (head_.compare_exchange_weak(head, head + 1, std::memory_order_acq_rel)) {
            slots_[head % CAPACITY].store(signum, std::memory_order_release);
            break;
        }
    }
    
    int write_fd = write_fd_.load(std::memory_order_acquire);
    if (write_fd != -1) {
        const char byte = 0;
        // A full pipe already guarantees a pending wake-up
        ssize_t written = ::write(write_fd, &byte, 1);
        (void)written;
    }
    
    errno = saved_errno;
}

// Consumer side: ordinary code only

size_t SignalChannel::drain(std::vector<int>& out) {
    if (read_fd_ != -1) {
        char buffer[CAPACITY];
        while (::read(read_fd_, buffer, sizeof(buffer)) > 0) {
        }
    }
    
    size_t count = 0;
    uint32_t tail = tail_.load(std::memory_order_relaxed);
    while (tail != head_.load(std::memory_order_acquire)) {
        int signum = slots_[tail % CAPACITY].exchange(0, std::memory_order_acq_rel);
        if (signum == 0) {
            // Slot reserved but not yet written; its writer wakes us again
            break;
        }
        out.push_back(signum);
        ++tail;
        ++count;
        tail_.store(tail, std::memory_order_release);
    }
    return count;
}

size_t SignalChannel::queued() const {
    return head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire);
}

} // namespace wardend
