/**
 * @file arbiter.cpp
 * @brief Arbiter implementation
 */

#include "wardend/watcher/arbiter.h"
#include "wardend/logger.h"
#include <algorithm>
#include <mutex>
#include <set>
#include <thread>

namespace wardend {

namespace {

bool same_sockets(const std::vector<SocketConfig>& a, const std::vector<SocketConfig>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].name != b[i].name || a[i].path != b[i].path ||
            a[i].host != b[i].host || a[i].port != b[i].port ||
            a[i].backlog != b[i].backlog) {
            return false;
        }
    }
    return true;
}

// Running processes only pick these up on a fresh exec
bool needs_restart(const WatcherConfig& current, const WatcherConfig& next) {
    return current.cmd != next.cmd ||
           current.args != next.args ||
           current.env != next.env ||
           current.copy_env != next.copy_env ||
           current.working_dir != next.working_dir ||
           current.capture_output != next.capture_output;
}

} // namespace

json ReloadSummary::to_json() const {
    return {
        {"added", added},
        {"removed", removed},
        {"updated", updated},
        {"restarted", restarted}
    };
}

Arbiter::Arbiter(ProcessSpawner& spawner, StreamRedirector& redirector, HandlerRegistry& registry)
    : spawner_(spawner)
    , redirector_(redirector)
    , registry_(registry) {
}

Arbiter::~Arbiter() {
    std::unique_lock<std::shared_mutex> lock(watchers_mutex_);
    watchers_.clear();
}

bool Arbiter::start() {
    if (running_) {
        return true;
    }
    running_ = true;
    try {
        start_all();
    } catch (const GateBusy& e) {
        LOG_ERROR("Arbiter", std::string("Initial start failed: ") + e.what());
        running_ = false;
        return false;
    } catch (const LedgerDivergence&) {
        running_ = false;
        return false;
    }
    return true;
}

void Arbiter::stop() {
    if (!running_) {
        return;
    }
    // Shutdown must win eventually; keep waiting out whatever is running
    for (;;) {
        try {
            stop_all();
            break;
        } catch (const GateBusy& e) {
            LOG_WARN("Arbiter", std::string("Shutdown waiting: ") + e.what());
            std::this_thread::sleep_for(EXIT_POLL_INTERVAL);
        } catch (const LedgerDivergence& e) {
            LOG_ERROR("Arbiter", std::string("Shutdown incomplete: ") + e.what());
            break;
        }
    }
    running_ = false;
}

bool Arbiter::is_healthy() const {
    if (!running_) {
        return false;
    }
    for (const auto& status : statuses()) {
        if (status->degraded) {
            return false;
        }
    }
    return true;
}

void Arbiter::set_command_timeout(std::chrono::milliseconds timeout) {
    command_timeout_ms_.store(timeout.count());
}

std::chrono::milliseconds Arbiter::command_timeout() const {
    return std::chrono::milliseconds(command_timeout_ms_.load());
}

void Arbiter::set_fatal_handler(FatalHandler handler) {
    fatal_handler_ = std::move(handler);
}

// Gated commands

void Arbiter::add_watcher(const WatcherConfig& config) {
    std::string error = config.validate();
    if (!error.empty()) {
        throw WardenError("invalid watcher " + config.name + ": " + error);
    }
    
    run_exclusive("add", [&](const GateToken& token) {
        auto watcher = std::make_shared<Watcher>(config, spawner_, redirector_);
        {
            std::unique_lock<std::shared_mutex> lock(watchers_mutex_);
            for (const auto& existing : watchers_) {
                if (existing->name() == config.name) {
                    throw WardenError("watcher " + config.name + " already exists");
                }
            }
            watchers_.push_back(watcher);
        }
        watcher->bind_sockets(token);
        LOG_INFO("Arbiter", "Added watcher " + config.name);
        
        if (running_ && config.autostart && !config.on_demand) {
            start_watcher(config.name);
        }
    });
}

void Arbiter::remove_watcher(const std::string& name) {
    run_exclusive("rm", [&](const GateToken& token) {
        auto watcher = find(name);
        watcher->stop(token);
        {
            std::unique_lock<std::shared_mutex> lock(watchers_mutex_);
            watchers_.erase(std::remove(watchers_.begin(), watchers_.end(), watcher), watchers_.end());
        }
        LOG_INFO("Arbiter", "Removed watcher " + name);
    });
}

void Arbiter::start_watcher(const std::string& name) {
    run_exclusive("start", [&](const GateToken& token) {
        find(name)->start(token);
    });
}

void Arbiter::stop_watcher(const std::string& name) {
    run_exclusive("stop", [&](const GateToken& token) {
        find(name)->stop(token);
    });
}

void Arbiter::restart_watcher(const std::string& name) {
    run_exclusive("restart", [&](const GateToken& token) {
        find(name)->restart(token);
    });
}

int Arbiter::incr_watcher(const std::string& name, int count) {
    if (count < 1) {
        throw WardenError("incr count must be positive");
    }
    return run_exclusive("incr", [&](const GateToken& token) {
        auto watcher = find(name);
        int current = watcher->config(token).numprocesses;
        if (count > MAX_NUMPROCESSES - current) {
            throw WardenError("cannot incr " + name + " by " + std::to_string(count) + ": limit is " +
                              std::to_string(MAX_NUMPROCESSES) + " processes");
        }
        int desired = current + count;
        watcher->set_numprocesses(token, desired);
        return desired;
    });
}

int Arbiter::decr_watcher(const std::string& name, int count) {
    if (count < 1) {
        throw WardenError("decr count must be positive");
    }
    return run_exclusive("decr", [&](const GateToken& token) {
        auto watcher = find(name);
        int desired = std::max(0, watcher->config(token).numprocesses - count);
        watcher->set_numprocesses(token, desired);
        return desired;
    });
}

void Arbiter::start_all() {
    run_exclusive("start", [&](const GateToken& token) {
        for (const auto& watcher : by_priority(token)) {
            const auto& config = watcher->config(token);
            if (!config.autostart) {
                LOG_DEBUG("Arbiter", watcher->name() + ": autostart disabled");
                continue;
            }
            if (config.on_demand) {
                LOG_INFO("Arbiter", watcher->name() + ": waiting for first connection");
                continue;
            }
            start_watcher(watcher->name());
        }
    });
}

void Arbiter::stop_all() {
    run_exclusive("stop", [&](const GateToken& token) {
        auto ordered = by_priority(token);
        for (auto it = ordered.rbegin(); it != ordered.rend(); ++it) {
            stop_watcher((*it)->name());
        }
    });
}

ReloadSummary Arbiter::apply_config(const std::vector<WatcherConfig>& watchers) {
    for (const auto& config : watchers) {
        std::string error = config.validate();
        if (!error.empty()) {
            throw WardenError("invalid watcher " + config.name + ": " + error);
        }
    }
    
    return run_exclusive("reload", [&](const GateToken& token) {
        ReloadSummary summary;
        std::set<std::string> wanted;
        for (const auto& config : watchers) {
            wanted.insert(config.name);
        }
        
        for (const auto& name : watcher_names()) {
            if (wanted.count(name) == 0) {
                remove_watcher(name);
                summary.removed.push_back(name);
            }
        }
        
        for (const auto& config : watchers) {
            std::shared_ptr<Watcher> watcher;
            try {
                watcher = find(config.name);
            } catch (const UnknownWatcher&) {
                add_watcher(config);
                summary.added.push_back(config.name);
                continue;
            }
            
            const WatcherConfig& current = watcher->config(token);
            if (!same_sockets(current.sockets, config.sockets)) {
                // Sockets are bound once per watcher, so rebuild it
                remove_watcher(config.name);
                add_watcher(config);
                summary.restarted.push_back(config.name);
                continue;
            }
            
            bool restart = needs_restart(current, config);
            watcher->update_config(token, config);
            summary.updated.push_back(config.name);
            if (restart && watcher->state() != WatcherState::STOPPED) {
                restart_watcher(config.name);
                summary.restarted.push_back(config.name);
            }
        }
        
        LOG_INFO("Arbiter", "Configuration applied: " + summary.to_json().dump());
        return summary;
    });
}

void Arbiter::reconcile_all(const GateToken& token) {
    if (!token.held()) {
        throw WardenError("reconcile requires the command gate");
    }
    
    for (const auto& watcher : snapshot()) {
        try {
            switch (watcher->reconcile(token)) {
                case ReconcileRequest::ACTIVATE:
                    start_watcher(watcher->name());
                    break;
                case ReconcileRequest::STOP:
                    stop_watcher(watcher->name());
                    break;
                case ReconcileRequest::NONE:
                    break;
            }
        } catch (const LedgerDivergence& e) {
            if (!token.nested()) {
                on_divergence(e);
            }
            throw;
        } catch (const std::exception& e) {
            LOG_ERROR("Arbiter", watcher->name() + ": reconcile failed: " + e.what());
        }
    }
    
    size_t cleared = registry_.retry_pending();
    if (cleared > 0) {
        LOG_INFO("Arbiter", "Cleared " + std::to_string(cleared) + " pending descriptors");
    }
}

size_t Arbiter::reap_processes() {
    GateToken token;
    try {
        token = gate_.acquire("reap", std::chrono::milliseconds(0));
    } catch (const GateBusy& e) {
        // The running command or the next reconcile pass collects them
        LOG_DEBUG("Arbiter", e.what());
        return 0;
    }
    
    size_t reaped = 0;
    for (const auto& watcher : snapshot()) {
        reaped += watcher->reap(token);
    }
    return reaped;
}

// Queries

std::vector<std::shared_ptr<const WatcherStatus>> Arbiter::statuses() const {
    std::vector<std::shared_ptr<const WatcherStatus>> result;
    for (const auto& watcher : snapshot()) {
        result.push_back(watcher->status());
    }
    return result;
}

std::shared_ptr<const WatcherStatus> Arbiter::watcher_status(const std::string& name) const {
    return find(name)->status();
}

std::vector<std::string> Arbiter::watcher_names() const {
    std::vector<std::string> names;
    for (const auto& watcher : snapshot()) {
        names.push_back(watcher->name());
    }
    return names;
}

size_t Arbiter::watcher_count() const {
    std::shared_lock<std::shared_mutex> lock(watchers_mutex_);
    return watchers_.size();
}

// Internals

std::shared_ptr<Watcher> Arbiter::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(watchers_mutex_);
    for (const auto& watcher : watchers_) {
        if (watcher->name() == name) {
            return watcher;
        }
    }
    throw UnknownWatcher(name);
}

std::vector<std::shared_ptr<Watcher>> Arbiter::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(watchers_mutex_);
    return watchers_;
}

std::vector<std::shared_ptr<Watcher>> Arbiter::by_priority(const GateToken& token) const {
    auto ordered = snapshot();
    std::stable_sort(ordered.begin(), ordered.end(),
        [&token](const auto& a, const auto& b) {
            return a->config(token).priority > b->config(token).priority;
        });
    return ordered;
}

void Arbiter::on_divergence(const LedgerDivergence& error) {
    LOG_CRITICAL("Arbiter", error.what());
    if (fatal_handler_) {
        fatal_handler_(error.what());
    }
}

} // namespace wardend
