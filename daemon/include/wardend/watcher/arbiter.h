/**
 * @file arbiter.h
 * @brief Owner of all watchers and of the command gate
 */

#pragma once

#include "wardend/core/command_gate.h"
#include "wardend/core/handler_registry.h"
#include "wardend/core/service.h"
#include "wardend/errors.h"
#include "wardend/watcher/watcher.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace wardend {

/**
 * @brief Outcome of apply_config()
 */
struct ReloadSummary {
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> updated;
    std::vector<std::string> restarted;
    
    json to_json() const;
};

/**
 * @brief Serializes every lifecycle command over the set of watchers
 *
 * Each public mutator acquires the command gate under its command name,
 * waiting at most the command timeout. A call made while the same thread
 * already holds the gate nests, so start_all() or a reconcile pass reach
 * individual watchers through the same entry points as external callers.
 *
 * Read-only queries (statuses(), watcher_status()) never touch the gate.
 */
class Arbiter : public Service {
public:
    using FatalHandler = std::function<void(const std::string& reason)>;
    
    Arbiter(ProcessSpawner& spawner, StreamRedirector& redirector, HandlerRegistry& registry);
    ~Arbiter() override;
    
    Arbiter(const Arbiter&) = delete;
    Arbiter& operator=(const Arbiter&) = delete;
    
    // Service interface
    bool start() override;
    void stop() override;
    const char* name() const override { return "Arbiter"; }
    int priority() const override { return 100; }  // first up, last down
    bool is_running() const override { return running_.load(); }
    bool is_healthy() const override;
    
    CommandGate& gate() { return gate_; }
    
    /**
     * @brief Bound on how long a command waits for the one in progress
     */
    void set_command_timeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds command_timeout() const;
    
    /**
     * @brief Called when the handler ledger can no longer be trusted
     */
    void set_fatal_handler(FatalHandler handler);
    
    // Gated commands. All of them throw GateBusy when the gate stays
    // held past the command timeout, and UnknownWatcher for a bad name.
    
    void add_watcher(const WatcherConfig& config);
    void remove_watcher(const std::string& name);
    
    void start_watcher(const std::string& name);
    void stop_watcher(const std::string& name);
    void restart_watcher(const std::string& name);
    
    /**
     * @return New desired process count
     */
    int incr_watcher(const std::string& name, int count = 1);
    int decr_watcher(const std::string& name, int count = 1);
    
    /**
     * @brief Start autostart watchers, highest priority first
     */
    void start_all();
    
    /**
     * @brief Stop every watcher, lowest priority first
     */
    void stop_all();
    
    /**
     * @brief Replace the watcher set with @p watchers
     *
     * Unknown names are added, missing ones removed, and existing ones
     * updated in place. A watcher whose command line or environment
     * changed is restarted.
     */
    ReloadSummary apply_config(const std::vector<WatcherConfig>& watchers);
    
    /**
     * @brief One maintenance pass over every watcher
     *
     * A failure in one watcher is logged and does not stop the pass.
     * Finishes by retrying descriptors left pending in the registry.
     */
    void reconcile_all(const GateToken& token);
    
    /**
     * @brief Collect exited children without waiting for the gate
     * @return Processes reaped; zero if another command is running
     */
    size_t reap_processes();
    
    // Queries
    
    std::vector<std::shared_ptr<const WatcherStatus>> statuses() const;
    
    /**
     * @throws UnknownWatcher
     */
    std::shared_ptr<const WatcherStatus> watcher_status(const std::string& name) const;
    
    std::vector<std::string> watcher_names() const;
    size_t watcher_count() const;
    
private:
    ProcessSpawner& spawner_;
    StreamRedirector& redirector_;
    HandlerRegistry& registry_;
    
    CommandGate gate_;
    std::atomic<int64_t> command_timeout_ms_{DEFAULT_COMMAND_TIMEOUT_MS};
    std::atomic<bool> running_{false};
    FatalHandler fatal_handler_;
    
    mutable std::shared_mutex watchers_mutex_;
    std::vector<std::shared_ptr<Watcher>> watchers_;
    
    std::shared_ptr<Watcher> find(const std::string& name) const;
    std::vector<std::shared_ptr<Watcher>> snapshot() const;
    
    /**
     * @brief Watchers sorted by configured priority, highest first
     */
    std::vector<std::shared_ptr<Watcher>> by_priority(const GateToken& token) const;
    
    void on_divergence(const LedgerDivergence& error);
    
    template <typename Body>
    auto run_exclusive(const std::string& command, Body&& body)
        -> decltype(body(std::declval<const GateToken&>())) {
        GateToken token = gate_.acquire(command, command_timeout());
        try {
            return body(static_cast<const GateToken&>(token));
        } catch (const LedgerDivergence& e) {
            if (!token.nested()) {
                on_divergence(e);
            }
            throw;
        }
    }
};

} // namespace wardend
