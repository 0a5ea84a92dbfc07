/**
 * @file command_gate.h
 * @brief Exclusive command gate serializing lifecycle operations
 */

#pragma once

#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <chrono>
#include <cstdint>

namespace wardend {

class CommandGate;

/**
 * @brief Proof that the holder owns the command gate
 *
 * Move-only. The gate is free again once every token issued to the owning
 * thread has been destroyed or release()d. Watcher mutators take a `const GateToken&`, so a
 * lifecycle mutation cannot be expressed without holding one.
 */
class GateToken {
public:
    GateToken() = default;
    ~GateToken();
    
    GateToken(GateToken&& other) noexcept;
    GateToken& operator=(GateToken&& other) noexcept;
    
    GateToken(const GateToken&) = delete;
    GateToken& operator=(const GateToken&) = delete;
    
    /**
     * @brief Release early; a no-op on an empty token
     */
    void release();
    
    bool held() const { return gate_ != nullptr; }
    
    /**
     * @brief True if this token was issued to a thread already holding the gate
     */
    bool nested() const { return nested_; }
    
    /**
     * @brief Name this token was acquired under
     */
    const std::string& command() const { return command_; }
    
private:
    friend class CommandGate;
    GateToken(CommandGate* gate, std::string command, bool nested);
    
    CommandGate* gate_ = nullptr;
    std::string command_;
    bool nested_ = false;
};

/**
 * @brief Named mutual exclusion for exclusive commands
 *
 * At most one command name is active at a time. The owning thread may
 * re-acquire (nested), which is how operations triggered internally by a
 * running command go through the same gated entry points as external ones.
 * The active name stays the outermost command until it is released.
 */
class CommandGate {
public:
    CommandGate() = default;
    
    CommandGate(const CommandGate&) = delete;
    CommandGate& operator=(const CommandGate&) = delete;
    
    /**
     * @brief Acquire the gate for a command
     * @param command Name of the exclusive command
     * @param wait Maximum time to wait for the current holder; zero never blocks
     * @return Token that releases the gate on destruction
     * @throws GateBusy if another command still holds the gate after @p wait
     */
    GateToken acquire(const std::string& command,
                      std::chrono::milliseconds wait = std::chrono::milliseconds(0));
    
    /**
     * @brief Name of the running command, empty if idle
     */
    std::string active_command() const;
    
    bool is_held() const;
    
    bool held_by_current_thread() const;
    
    uint64_t acquisitions() const;
    uint64_t busy_rejections() const;
    
private:
    friend class GateToken;
    void release();
    
    mutable std::mutex mutex_;
    std::condition_variable released_cv_;
    std::string active_;
    std::thread::id owner_;
    int depth_ = 0;
    uint64_t acquisitions_ = 0;
    uint64_t busy_rejections_ = 0;
};

} // namespace wardend
