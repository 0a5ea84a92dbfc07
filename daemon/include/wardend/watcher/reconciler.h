/**
 * @file reconciler.h
 * @brief Periodic maintenance pass over all watchers
 */

#pragma once

#include "wardend/core/event_loop.h"
#include "wardend/core/service.h"
#include "wardend/watcher/arbiter.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace wardend {

/**
 * @brief Drives Arbiter::reconcile_all() from an event loop timer
 *
 * A tick never waits for the command gate. If a command is running the
 * tick is skipped and the next one tries again.
 */
class Reconciler : public Service {
public:
    Reconciler(Arbiter& arbiter, EventLoop& loop, std::chrono::milliseconds interval);
    ~Reconciler() override;
    
    // Service interface
    bool start() override;
    void stop() override;
    const char* name() const override { return "Reconciler"; }
    int priority() const override { return 50; }
    bool is_running() const override { return running_.load(); }
    
    /**
     * @brief Run one pass now
     * @return true if the pass ran, false if skipped
     */
    bool tick();
    
    /**
     * @brief Change the period, rescheduling if running
     */
    void set_interval(std::chrono::milliseconds interval);
    std::chrono::milliseconds interval() const;
    
    uint64_t ticks() const { return ticks_.load(); }
    uint64_t skipped() const { return skipped_.load(); }
    
private:
    Arbiter& arbiter_;
    EventLoop& loop_;
    
    mutable std::mutex mutex_;
    std::chrono::milliseconds interval_;
    EventLoop::TimerId timer_ = 0;
    
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> skipped_{0};
    
    void schedule_locked();
};

} // namespace wardend
