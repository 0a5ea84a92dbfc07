/**
 * @file command_gate.cpp
 * @brief Exclusive command gate implementation
 */

#include "wardend/core/command_gate.h"
#include "wardend/errors.h"
#include "wardend/logger.h"
#include <utility>

namespace wardend {

// GateToken implementation

GateToken::GateToken(CommandGate* gate, std::string command, bool nested)
    : gate_(gate)
    , command_(std::move(command))
    , nested_(nested) {
}

GateToken::~GateToken() {
    release();
}

GateToken::GateToken(GateToken&& other) noexcept
    : gate_(std::exchange(other.gate_, nullptr))
    , command_(std::move(other.command_))
    , nested_(other.nested_) {
}

GateToken& GateToken::operator=(GateToken&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = std::exchange(other.gate_, nullptr);
        command_ = std::move(other.command_);
        nested_ = other.nested_;
    }
    return *this;
}

void GateToken::release() {
    if (gate_) {
        CommandGate* gate = std::exchange(gate_, nullptr);
        gate->release();
    }
}

// CommandGate implementation

GateToken CommandGate::acquire(const std::string& command, std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto self = std::this_thread::get_id();
    
    if (depth_ > 0 && owner_ == self) {
        // Triggered from inside the running command
        ++depth_;
        ++acquisitions_;
        LOG_DEBUG("CommandGate", "Nested " + command + " inside " + active_);
        return GateToken(this, command, true);
    }
    
    if (depth_ > 0) {
        bool freed = wait.count() > 0 &&
            released_cv_.wait_for(lock, wait, [this] { return depth_ == 0; });
        if (!freed) {
            ++busy_rejections_;
            throw GateBusy(command, active_);
        }
    }
    
    active_ = command;
    owner_ = self;
    depth_ = 1;
    ++acquisitions_;
    return GateToken(this, command, false);
}

void CommandGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (depth_ == 0) {
            return;
        }
        if (--depth_ > 0) {
            return;
        }
        active_.clear();
        owner_ = std::thread::id();
    }
    released_cv_.notify_one();
}

std::string CommandGate::active_command() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

bool CommandGate::is_held() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return depth_ > 0;
}

bool CommandGate::held_by_current_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return depth_ > 0 && owner_ == std::this_thread::get_id();
}

uint64_t CommandGate::acquisitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acquisitions_;
}

uint64_t CommandGate::busy_rejections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_rejections_;
}

} // namespace wardend
