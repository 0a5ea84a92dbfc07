/**
 * @file reconciler.cpp
 * @brief Reconciler implementation
 */

#include "wardend/watcher/reconciler.h"
#include "wardend/logger.h"

namespace wardend {

Reconciler::Reconciler(Arbiter& arbiter, EventLoop& loop, std::chrono::milliseconds interval)
    : arbiter_(arbiter)
    , loop_(loop)
    , interval_(interval) {
}

Reconciler::~Reconciler() {
    stop();
}

bool Reconciler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return true;
    }
    if (interval_.count() <= 0) {
        LOG_ERROR("Reconciler", "Check interval must be positive");
        return false;
    }
    schedule_locked();
    running_ = true;
    LOG_INFO("Reconciler", "Checking watchers every " + std::to_string(interval_.count()) + "ms");
    return true;
}

void Reconciler::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return;
    }
    loop_.cancel_timer(timer_);
    timer_ = 0;
    running_ = false;
}

bool Reconciler::tick() {
    GateToken token;
    try {
        token = arbiter_.gate().acquire("reconcile", std::chrono::milliseconds(0));
    } catch (const GateBusy& e) {
        ++skipped_;
        LOG_DEBUG("Reconciler", std::string("Skipping pass: ") + e.what());
        return false;
    }
    
    ++ticks_;
    arbiter_.reconcile_all(token);
    return true;
}

void Reconciler::set_interval(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        throw WardenError("check interval must be positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (interval == interval_) {
        return;
    }
    interval_ = interval;
    if (running_) {
        loop_.cancel_timer(timer_);
        schedule_locked();
        LOG_INFO("Reconciler", "Check interval now " + std::to_string(interval_.count()) + "ms");
    }
}

std::chrono::milliseconds Reconciler::interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interval_;
}

void Reconciler::schedule_locked() {
    timer_ = loop_.add_periodic(interval_, [this]() { tick(); });
}

} // namespace wardend
