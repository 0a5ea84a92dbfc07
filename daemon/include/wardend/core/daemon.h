/**
 * @file daemon.h
 * @brief Main daemon class - owns the control loop and all services
 */

#pragma once

#include "wardend/core/service.h"
#include "wardend/core/event_loop.h"
#include "wardend/core/handler_registry.h"
#include "wardend/core/signal_channel.h"
#include "wardend/core/signal_dispatcher.h"
#include "wardend/process/spawner.h"
#include "wardend/process/stream_redirector.h"
#include "wardend/config.h"
#include "wardend/common.h"
#include <memory>
#include <vector>
#include <atomic>
#include <chrono>
#include <shared_mutex>
#include <string>

namespace wardend {

class Arbiter;
class Reconciler;

/**
 * @brief Main daemon coordinator
 * 
 * Singleton owning the event loop, the handler registry and the signal
 * front-end. Signals are only queued by their handlers; the loop drains
 * them and runs the mapped action as an ordinary callback.
 */
class Daemon {
public:
    /// Exit code after the handler ledger diverged from the loop
    static constexpr int EXIT_LEDGER_DIVERGED = 2;
    
    static Daemon& instance();
    
    /**
     * @brief Load configuration, build the arbiter and install signals
     * @param config_path Path to YAML configuration file
     * @return false if the signal front-end could not be set up
     */
    bool initialize(const std::string& config_path);
    
    /**
     * @brief Start services and run the loop until shutdown
     * @return Exit code (0 = success)
     */
    int run();
    
    /**
     * @brief Request graceful shutdown (thread-safe)
     */
    void request_shutdown();
    
    /**
     * @brief Shut down with EXIT_LEDGER_DIVERGED
     */
    void request_fatal_shutdown(const std::string& reason);
    
    bool is_running() const { return running_.load(); }
    bool shutdown_requested() const { return shutdown_requested_.load(); }
    
    void register_service(std::unique_ptr<Service> service);
    
    /**
     * @brief Get service by type
     * @return Pointer to service or nullptr if not found
     */
    template<typename T>
    T* get_service() {
        std::shared_lock<std::shared_mutex> lock(services_mutex_);
        for (auto& svc : services_) {
            if (auto* ptr = dynamic_cast<T*>(svc.get())) {
                return ptr;
            }
        }
        return nullptr;
    }
    
    /**
     * @brief Get current configuration (returns copy for thread safety)
     */
    Config config() const;
    
    std::chrono::seconds uptime() const;
    
    EventLoop* loop() { return loop_.get(); }
    HandlerRegistry* registry() { return registry_.get(); }
    SignalDispatcher* signals() { return dispatcher_.get(); }
    
    void notify_ready();
    void notify_stopping();
    void notify_watchdog();
    
    /**
     * @brief Reload configuration and apply it to the watchers
     *
     * The new config is installed only after the watchers accepted it, so a
     * failed or busy reload leaves the previous config in effect.
     *
     * @return false if the file could not be loaded
     * @throws GateBusy if another command kept the arbiter busy
     */
    bool reload_config();
    
    /**
     * @brief Log one line per watcher
     */
    void log_status();
    
    /**
     * @brief Tear everything down (tests only; daemon must be stopped)
     */
    void reset();
    
    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;
    
private:
    Daemon() = default;
    
    // Declaration order is teardown order in reverse: services go first
    std::unique_ptr<EventLoop> loop_;
    std::unique_ptr<HandlerRegistry> registry_;
    std::unique_ptr<StreamRedirector> redirector_;
    std::unique_ptr<ProcessSpawner> spawner_;
    std::unique_ptr<SignalChannel> channel_;
    std::unique_ptr<SignalDispatcher> dispatcher_;
    
    std::vector<std::unique_ptr<Service>> services_;
    mutable std::shared_mutex services_mutex_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> exit_code_{0};
    std::chrono::steady_clock::time_point start_time_;
    EventLoop::TimerId watchdog_timer_ = 0;
    EventLoop::TimerId reload_retry_timer_ = 0;
    
    bool setup_signals(const Config& config);
    
    /**
     * @brief SIGHUP path: a reload that finds the gate busy is retried later
     */
    void reload_from_signal();
    static SignalMap signal_mapping(const Config& config);
    
    bool start_services();
    void stop_services();
    
    /**
     * @brief Periodic health check and watchdog keepalive
     */
    void check_health();
};

} // namespace wardend
