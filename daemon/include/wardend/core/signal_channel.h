/**
 * @file signal_channel.h
 * @brief Async-signal-safe hand-off of signal numbers to the main loop
 */

#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace wardend {

/**
 * @brief Fixed-capacity ring written by the signal handler, read by the loop
 *
 * The producer side (handle_signal / push) only performs lock-free atomic
 * operations on preallocated storage and one write(2) to a non-blocking pipe.
 * It never allocates, locks, logs, formats or throws. Everything else here is
 * consumer-side and must only run in ordinary code.
 */
class SignalChannel {
public:
    static constexpr size_t CAPACITY = 64;
    
    SignalChannel();
    ~SignalChannel();
    
    SignalChannel(const SignalChannel&) = delete;
    SignalChannel& operator=(const SignalChannel&) = delete;
    
    /**
     * @brief Create the wake pipe
     * @return true on success (idempotent)
     */
    bool open();
    
    void close();
    
    /**
     * @brief Route @p signum to this channel via sigaction(2)
     * @return false if the handler could not be installed
     */
    bool install(int signum);
    
    /**
     * @brief Restore default disposition for every installed signal
     */
    void uninstall_all();
    
    /**
     * @brief Read end of the wake pipe; readable when signals are queued
     */
    int wake_fd() const { return read_fd_; }
    
    /**
     * @brief The function registered with the OS
     */
    static void handle_signal(int signum) noexcept;
    
    /**
     * @brief Enqueue a signal number (async-signal-safe)
     */
    void push(int signum) noexcept;
    
    /**
     * @brief Move queued signal numbers into @p out, oldest first
     * @return Number of signals appended
     */
    size_t drain(std::vector<int>& out);
    
    /**
     * @brief Signals lost because the ring was full
     */
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
    
    size_t queued() const;
    
private:
    static std::atomic<SignalChannel*> active_;
    
    std::array<std::atomic<int>, CAPACITY> slots_;
    std::atomic<uint32_t> head_{0};
    std::atomic<uint32_t> tail_{0};
    std::atomic<uint64_t> dropped_{0};
    
    int read_fd_ = -1;
    std::atomic<int> write_fd_{-1};
    std::vector<int> installed_;
    
    static_assert(std::atomic<int>::is_always_lock_free, "signal slots must be lock-free");
    static_assert(std::atomic<uint32_t>::is_always_lock_free, "ring indices must be lock-free");
    static_assert(std::atomic<SignalChannel*>::is_always_lock_free, "channel pointer must be lock-free");
};

} // namespace wardend
