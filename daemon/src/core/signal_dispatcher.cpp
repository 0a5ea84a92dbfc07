/**
 * @file signal_dispatcher.cpp
 * @brief Signal action mapping and dispatch
 */

#include "wardend/core/signal_dispatcher.h"
#include "wardend/logger.h"
#include <signal.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace wardend {

namespace {

struct SignalEntry {
    int number;
    const char* name;
};

const SignalEntry SIGNAL_NAMES[] = {
    {SIGHUP, "SIGHUP"},
    {SIGINT, "SIGINT"},
    {SIGQUIT, "SIGQUIT"},
    {SIGKILL, "SIGKILL"},
    {SIGUSR1, "SIGUSR1"},
    {SIGUSR2, "SIGUSR2"},
    {SIGPIPE, "SIGPIPE"},
    {SIGALRM, "SIGALRM"},
    {SIGTERM, "SIGTERM"},
    {SIGCHLD, "SIGCHLD"},
    {SIGCONT, "SIGCONT"},
    {SIGSTOP, "SIGSTOP"},
    {SIGTSTP, "SIGTSTP"},
    {SIGTTIN, "SIGTTIN"},
    {SIGTTOU, "SIGTTOU"},
    {SIGWINCH, "SIGWINCH"},
};

const struct {
    SignalAction action;
    const char* name;
} ACTION_NAMES[] = {
    {SignalAction::SHUTDOWN, "shutdown"},
    {SignalAction::RELOAD, "reload"},
    {SignalAction::REAP, "reap"},
    {SignalAction::RECONCILE, "reconcile"},
    {SignalAction::STATUS, "status"},
    {SignalAction::IGNORE, "ignore"},
};

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

const char* signal_action_name(SignalAction action) {
    for (const auto& entry : ACTION_NAMES) {
        if (entry.action == action) {
            return entry.name;
        }
    }
    return "unknown";
}

std::optional<SignalAction> parse_signal_action(const std::string& name) {
    for (const auto& entry : ACTION_NAMES) {
        if (name == entry.name) {
            return entry.action;
        }
    }
    return std::nullopt;
}

std::optional<int> signal_from_name(const std::string& name) {
    std::string upper = to_upper(name);
    if (upper.compare(0, 3, "SIG") != 0) {
        upper = "SIG" + upper;
    }
    for (const auto& entry : SIGNAL_NAMES) {
        if (upper == entry.name) {
            return entry.number;
        }
    }
    return std::nullopt;
}

bool signal_catchable(int signum) {
    return signum != SIGKILL && signum != SIGSTOP;
}

std::string signal_name(int signum) {
    for (const auto& entry : SIGNAL_NAMES) {
        if (entry.number == signum) {
            return entry.name;
        }
    }
    return "SIG" + std::to_string(signum);
}

// SignalDispatcher implementation

SignalDispatcher::SignalDispatcher(SignalChannel& channel)
    : channel_(channel)
    , mapping_(default_mapping()) {
}

SignalMap SignalDispatcher::default_mapping() {
    return {
        {SIGTERM, SignalAction::SHUTDOWN},
        {SIGINT, SignalAction::SHUTDOWN},
        {SIGQUIT, SignalAction::SHUTDOWN},
        {SIGHUP, SignalAction::RELOAD},
        {SIGCHLD, SignalAction::REAP},
        {SIGUSR1, SignalAction::STATUS},
    };
}

void SignalDispatcher::set_mapping(SignalMap mapping) {
    mapping_ = std::move(mapping);
}

void SignalDispatcher::on(SignalAction action, ActionHandler handler) {
    handlers_[action] = std::move(handler);
}

bool SignalDispatcher::install() {
    if (!channel_.open()) {
        return false;
    }
    size_t failed = 0;
    for (const auto& entry : mapping_) {
        if (!channel_.install(entry.first)) {
            ++failed;
        }
    }
    if (failed > 0) {
        LOG_ERROR("SignalDispatcher", "Failed to install " + std::to_string(failed) + " of " +
                  std::to_string(mapping_.size()) + " signal handlers");
        return false;
    }
    LOG_DEBUG("SignalDispatcher", "Installed handlers for " + std::to_string(mapping_.size()) + " signals");
    return true;
}

size_t SignalDispatcher::dispatch_pending() {
    std::vector<int> signals;
    channel_.drain(signals);
    
    uint64_t dropped = channel_.dropped();
    if (dropped > reported_drops_) {
        LOG_WARN("SignalDispatcher", "Signal ring overflowed, " +
                 std::to_string(dropped - reported_drops_) + " signals lost");
        reported_drops_ = dropped;
    }
    
    for (int signum : signals) {
        dispatch(signum);
    }
    return signals.size();
}

void SignalDispatcher::dispatch(int signum) {
    auto it = mapping_.find(signum);
    if (it == mapping_.end()) {
        ++unmapped_;
        LOG_WARN("SignalDispatcher", "Dropping unmapped signal " + signal_name(signum));
        return;
    }
    
    SignalAction action = it->second;
    if (signum == SIGCHLD) {
        LOG_DEBUG("SignalDispatcher", "Got signal SIGCHLD");
    } else {
        LOG_INFO("SignalDispatcher", "Got signal " + signal_name(signum) +
                 " (" + signal_action_name(action) + ")");
    }
    
    if (action == SignalAction::IGNORE) {
        return;
    }
    
    auto handler = handlers_.find(action);
    if (handler == handlers_.end()) {
        LOG_WARN("SignalDispatcher", std::string("No handler for action ") + signal_action_name(action));
        return;
    }
    
    try {
        handler->second(signum);
    } catch (const std::exception& e) {
        LOG_ERROR("SignalDispatcher", "Handling " + signal_name(signum) + " failed: " + e.what());
    }
}

} // namespace wardend
