/**
 * @file watcher.h
 * @brief Lifecycle of one named group of processes
 */

#pragma once

#include "wardend/common.h"
#include "wardend/config.h"
#include "wardend/core/command_gate.h"
#include "wardend/process/spawner.h"
#include "wardend/process/stream_redirector.h"
#include "wardend/watcher/sockets.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace wardend {

/**
 * @brief Watcher lifecycle states
 *
 * STOPPED -> STARTING -> RUNNING -> STOPPING -> STOPPED, with
 * RUNNING -> RECONCILING -> RUNNING during periodic maintenance.
 */
enum class WatcherState {
    STOPPED,
    STARTING,
    RUNNING,
    RECONCILING,
    STOPPING
};

const char* watcher_state_name(WatcherState state);

/**
 * @brief Immutable status snapshot, replaced on every transition
 */
struct WatcherStatus {
    std::string name;
    WatcherState state = WatcherState::STOPPED;
    int desired = 0;
    std::vector<pid_t> pids;
    size_t retiring = 0;  // signalled, not yet exited
    bool degraded = false;
    std::string last_error;
    uint64_t spawn_failures = 0;
    uint64_t respawns = 0;
    std::chrono::system_clock::time_point last_reconcile{};
    
    size_t live_processes() const { return pids.size(); }
    
    json to_json() const;
};

/**
 * @brief Follow-up the reconciler must run through the Arbiter
 */
enum class ReconcileRequest {
    NONE,
    ACTIVATE,  // on-demand watcher saw a pending connection
    STOP       // nothing left to supervise
};

/**
 * @brief A named group of processes running the same command
 *
 * Every mutator takes the GateToken of the command it runs under; only the
 * Arbiter's gated entry points create tokens. status() is safe from any
 * thread without the gate.
 */
class Watcher {
public:
    Watcher(WatcherConfig config, ProcessSpawner& spawner, StreamRedirector& redirector);
    ~Watcher();
    
    Watcher(const Watcher&) = delete;
    Watcher& operator=(const Watcher&) = delete;
    
    const std::string& name() const { return name_; }
    WatcherState state() const { return state_.load(); }
    
    /**
     * @brief Latest published snapshot (lock-free)
     */
    std::shared_ptr<const WatcherStatus> status() const;
    
    // Everything below requires the command gate
    
    const WatcherConfig& config(const GateToken&) const { return config_; }
    
    /**
     * @brief Bind the configured listening sockets
     * @return false if any socket failed to bind
     */
    bool bind_sockets(const GateToken& token);
    
    /**
     * @brief Spawn up to the desired count; no-op unless STOPPED
     */
    void start(const GateToken& token);
    
    /**
     * @brief Signal, wait up to graceful_timeout, then SIGKILL survivors;
     *        no-op when already STOPPED
     */
    void stop(const GateToken& token);
    
    void restart(const GateToken& token);
    
    /**
     * @brief Reap exited processes, replace expired ones, restore the count
     *
     * Processes retired here are signalled but not waited for; later reap()
     * calls collect them and send SIGKILL once graceful_timeout has passed.
     *
     * @return Follow-up for the caller to run through its gated entry points
     */
    ReconcileRequest reconcile(const GateToken& token);
    
    /**
     * @brief Drop processes that have exited, escalating overdue retirements
     * @return Number reaped
     */
    size_t reap(const GateToken& token);
    
    /**
     * @brief Change the desired count and converge if running
     *
     * Excess processes are retired without waiting, as in reconcile().
     */
    void set_numprocesses(const GateToken& token, int numprocesses);
    
    /**
     * @brief Apply a reloaded definition; takes effect on next spawn
     */
    void update_config(const GateToken& token, WatcherConfig config);
    
    /**
     * @brief A configured socket has a connection waiting
     */
    bool has_pending_activity(const GateToken& token) const;
    
private:
    const std::string name_;
    WatcherConfig config_;
    ProcessSpawner& spawner_;
    StreamRedirector& redirector_;
    
    std::atomic<WatcherState> state_{WatcherState::STOPPED};
    std::vector<std::unique_ptr<Process>> processes_;
    
    struct Retiring {
        std::unique_ptr<Process> process;
        std::chrono::steady_clock::time_point deadline;
        bool killed = false;
    };
    std::vector<Retiring> retiring_;
    std::vector<std::unique_ptr<ListenSocket>> sockets_;
    
    bool degraded_ = false;
    std::string last_error_;
    uint64_t spawn_failures_ = 0;
    uint64_t respawns_ = 0;
    std::chrono::system_clock::time_point last_reconcile_{};
    
    std::shared_ptr<const WatcherStatus> status_;
    
    void transition(WatcherState state);
    void publish();
    
    SpawnRequest spawn_request() const;
    
    /**
     * @brief Create one process, retrying up to max_retry times
     * @return false if the slot was abandoned
     */
    bool spawn_process(const GateToken& token);
    
    /**
     * @brief Spawn or retire processes until the live count matches
     */
    void converge(const GateToken& token);
    
    /**
     * @brief Graceful stop of @p victims with SIGKILL escalation
     *
     * Blocks up to graceful_timeout. Also finishes any retiring processes.
     */
    void terminate(std::vector<std::unique_ptr<Process>> victims);
    
    /**
     * @brief Send the stop signal and hand @p victims to sweep_retiring()
     */
    void retire(std::vector<std::unique_ptr<Process>> victims);
    
    /**
     * @brief Forget exited retirees; SIGKILL those past their deadline
     * @return Number collected
     */
    size_t sweep_retiring();
    
    void forget(Process& process);
    void fail(const std::string& message);
};

} // namespace wardend
