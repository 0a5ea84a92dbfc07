/**
 * @file event_loop.h
 * @brief poll(2) based event loop with descriptor handlers and timers
 */

#pragma once

#include <poll.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace wardend {

/**
 * @brief Event mask bits understood by IoMultiplexer
 */
namespace IoEvents {
    constexpr uint32_t READ = POLLIN;
    constexpr uint32_t WRITE = POLLOUT;
    constexpr uint32_t ERROR = POLLERR | POLLHUP | POLLNVAL;
}

/**
 * @brief Callback invoked with the ready descriptor and the returned events
 */
using IoHandler = std::function<void(int fd, uint32_t events)>;

/**
 * @brief Descriptor-to-callback binding table of an event loop
 *
 * add_handler() refuses a descriptor that is already bound and
 * remove_handler() refuses one that is not. has_handler() reports the
 * loop's own view and is what callers use to verify a removal.
 */
class IoMultiplexer {
public:
    virtual ~IoMultiplexer() = default;
    
    /**
     * @throws std::invalid_argument if @p fd is already bound
     */
    virtual void add_handler(int fd, IoHandler handler, uint32_t events) = 0;
    
    /**
     * @brief Bind @p fd, overwriting any existing binding
     */
    virtual void replace_handler(int fd, IoHandler handler, uint32_t events) = 0;
    
    /**
     * @throws std::out_of_range if @p fd is not bound
     */
    virtual void remove_handler(int fd) = 0;
    
    virtual bool has_handler(int fd) const = 0;
};

/**
 * @brief Single-threaded control loop
 *
 * All handlers, timers and posted callbacks run on the thread inside run().
 * Binding changes, add_callback() and stop() may be called from any thread;
 * they wake the loop so a pending poll() picks them up.
 */
class EventLoop : public IoMultiplexer {
public:
    using Callback = std::function<void()>;
    using TimerId = uint64_t;
    
    EventLoop();
    ~EventLoop() override;
    
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;
    
    // IoMultiplexer interface
    void add_handler(int fd, IoHandler handler, uint32_t events) override;
    void replace_handler(int fd, IoHandler handler, uint32_t events) override;
    void remove_handler(int fd) override;
    bool has_handler(int fd) const override;
    
    /**
     * @brief Run a callback every @p interval, first after one interval
     */
    TimerId add_periodic(std::chrono::milliseconds interval, Callback callback);
    
    /**
     * @brief Run a callback once after @p delay
     */
    TimerId add_timeout(std::chrono::milliseconds delay, Callback callback);
    
    void cancel_timer(TimerId id);
    
    /**
     * @brief Queue a callback for the next iteration (thread-safe)
     */
    void add_callback(Callback callback);
    
    /**
     * @brief Run until stop() is called
     */
    void run();
    
    /**
     * @brief One poll/dispatch iteration
     * @param max_wait Upper bound on the time spent in poll()
     * @return Number of handlers, timers and callbacks dispatched
     */
    size_t run_once(std::chrono::milliseconds max_wait);
    
    void stop();
    
    bool is_running() const { return running_.load(); }
    
    bool in_loop_thread() const;
    
    size_t handler_count() const;
    
private:
    struct Binding {
        IoHandler handler;
        uint32_t events;
    };
    
    struct Timer {
        std::chrono::steady_clock::time_point due;
        std::chrono::milliseconds interval;  // zero for one-shot
        Callback callback;
    };
    
    mutable std::mutex mutex_;
    std::map<int, Binding> bindings_;
    std::map<TimerId, Timer> timers_;
    std::vector<Callback> pending_;
    TimerId next_timer_id_ = 1;
    
    int wake_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread::id loop_thread_;
    
    TimerId schedule(std::chrono::milliseconds delay, std::chrono::milliseconds interval,
                     Callback callback);
    void wake();
    void drain_wake();
    int poll_timeout(std::chrono::milliseconds max_wait) const;
    size_t run_due_timers();
    size_t run_pending_callbacks();
};

} // namespace wardend
