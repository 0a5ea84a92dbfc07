/**
 * @file signal_dispatcher.h
 * @brief Main-loop side of signal handling
 */

#pragma once

#include "wardend/core/signal_channel.h"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace wardend {

/**
 * @brief What the daemon does when a signal arrives
 */
enum class SignalAction {
    SHUTDOWN,
    RELOAD,
    REAP,
    RECONCILE,
    STATUS,
    IGNORE
};

const char* signal_action_name(SignalAction action);
std::optional<SignalAction> parse_signal_action(const std::string& name);

/**
 * @brief "SIGHUP" / "HUP" / "hup" -> SIGHUP
 */
std::optional<int> signal_from_name(const std::string& name);

/**
 * @brief False for SIGKILL and SIGSTOP, which sigaction(2) refuses
 */
bool signal_catchable(int signum);

/**
 * @brief SIGHUP -> "SIGHUP", unknown numbers -> "SIG<n>"
 */
std::string signal_name(int signum);

using SignalMap = std::map<int, SignalAction>;

/**
 * @brief Turns queued signal numbers into daemon actions
 *
 * Runs on the control loop, never in signal context, so it is free to log,
 * allocate and call into the rest of the daemon. Signals with no mapping are
 * logged and dropped.
 */
class SignalDispatcher {
public:
    using ActionHandler = std::function<void(int signum)>;
    
    explicit SignalDispatcher(SignalChannel& channel);
    
    /**
     * @brief SIGTERM/SIGINT/SIGQUIT shut down, SIGHUP reloads, SIGCHLD reaps,
     *        SIGUSR1 logs status
     */
    static SignalMap default_mapping();
    
    void set_mapping(SignalMap mapping);
    const SignalMap& mapping() const { return mapping_; }
    
    void on(SignalAction action, ActionHandler handler);
    
    /**
     * @brief Install the channel's handler for every mapped signal
     * @return false if any installation failed
     */
    bool install();
    
    /**
     * @brief Drain the channel and run the mapped actions
     * @return Number of signals consumed
     */
    size_t dispatch_pending();
    
    uint64_t unmapped_count() const { return unmapped_; }
    
private:
    SignalChannel& channel_;
    SignalMap mapping_;
    std::map<SignalAction, ActionHandler> handlers_;
    uint64_t unmapped_ = 0;
    uint64_t reported_drops_ = 0;
    
    void dispatch(int signum);
};

} // namespace wardend
