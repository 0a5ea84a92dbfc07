/**
 * @file daemon.cpp
 * @brief Main daemon implementation
 */

#include "wardend/core/daemon.h"
#include "wardend/errors.h"
#include "wardend/logger.h"
#include "wardend/watcher/arbiter.h"
#include "wardend/watcher/reconciler.h"
#include <algorithm>
#include <cstdio>
#include <signal.h>
#include <systemd/sd-daemon.h>

namespace wardend {

Daemon& Daemon::instance() {
    static Daemon instance;
    return instance;
}

bool Daemon::initialize(const std::string& config_path) {
    LOG_INFO("Daemon", "Initializing wardend version " + std::string(VERSION));
    
    if (loop_) {
        LOG_WARN("Daemon", "Already initialized");
        return true;
    }
    
    auto& config_mgr = ConfigManager::instance();
    if (!config_mgr.load(config_path)) {
        // Not fatal: run with defaults and no watchers
        LOG_WARN("Daemon", "Using default configuration");
    }
    
    const auto config = config_mgr.get();
    Logger::set_level(Logger::level_from_int(config.log_level));
    
    loop_ = std::make_unique<EventLoop>();
    registry_ = std::make_unique<HandlerRegistry>(*loop_);
    redirector_ = std::make_unique<StreamRedirector>(*registry_);
    spawner_ = std::make_unique<PosixSpawner>();
    
    auto arbiter = std::make_unique<Arbiter>(*spawner_, *redirector_, *registry_);
    arbiter->set_command_timeout(std::chrono::milliseconds(config.command_timeout_ms));
    arbiter->set_fatal_handler([this](const std::string& reason) {
        request_fatal_shutdown(reason);
    });
    
    for (const auto& watcher : config.watchers) {
        try {
            arbiter->add_watcher(watcher);
        } catch (const WardenError& e) {
            LOG_ERROR("Daemon", std::string("Skipping watcher: ") + e.what());
        }
    }
    
    auto reconciler = std::make_unique<Reconciler>(
        *arbiter, *loop_, std::chrono::milliseconds(config.check_interval_ms));
    
    register_service(std::move(arbiter));
    register_service(std::move(reconciler));
    
    if (!setup_signals(config)) {
        LOG_ERROR("Daemon", "Failed to set up signal handling");
        return false;
    }
    
    LOG_INFO("Daemon", "Initialization complete");
    return true;
}

int Daemon::run() {
    if (!loop_) {
        LOG_ERROR("Daemon", "run() called before initialize()");
        return 1;
    }
    
    auto startup_start = std::chrono::steady_clock::now();
    LOG_INFO("Daemon", "Starting daemon");
    start_time_ = std::chrono::steady_clock::now();
    
    if (!start_services()) {
        LOG_ERROR("Daemon", "Failed to start services");
        return exit_code_.load() != 0 ? exit_code_.load() : 1;
    }
    
    running_ = true;
    
    const auto config = ConfigManager::instance().get();
    watchdog_timer_ = loop_->add_periodic(std::chrono::seconds(config.watchdog_interval_sec),
                                          [this]() { check_health(); });
    
    notify_ready();
    
    auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - startup_start);
    char buf[32];
    snprintf(buf, sizeof(buf), "%.3f", elapsed_us.count() / 1000.0);
    LOG_INFO("Daemon", "Startup completed in " + std::string(buf) + "ms");
    
    // A shutdown requested during startup must not be lost to run()
    if (!shutdown_requested_.load()) {
        loop_->run();
    }
    
    LOG_INFO("Daemon", "Shutdown requested, stopping services");
    notify_stopping();
    
    loop_->cancel_timer(watchdog_timer_);
    watchdog_timer_ = 0;
    stop_services();
    
    running_ = false;
    
    LOG_INFO("Daemon", "Daemon stopped");
    return exit_code_.load();
}

void Daemon::request_shutdown() {
    shutdown_requested_.store(true);
    if (loop_) {
        loop_->stop();
    }
}

void Daemon::request_fatal_shutdown(const std::string& reason) {
    LOG_CRITICAL("Daemon", "Fatal: " + reason);
    exit_code_.store(EXIT_LEDGER_DIVERGED);
    request_shutdown();
}

void Daemon::register_service(std::unique_ptr<Service> service) {
    LOG_DEBUG("Daemon", "Registering service: " + std::string(service->name()));
    std::unique_lock<std::shared_mutex> lock(services_mutex_);
    services_.push_back(std::move(service));
}

Config Daemon::config() const {
    return ConfigManager::instance().get();
}

std::chrono::seconds Daemon::uptime() const {
    if (start_time_ == std::chrono::steady_clock::time_point{}) {
        return std::chrono::seconds(0);
    }
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now - start_time_);
}

void Daemon::notify_ready() {
    sd_notify(0, "READY=1\nSTATUS=Supervising");
    LOG_DEBUG("Daemon", "Notified systemd: READY");
}

void Daemon::notify_stopping() {
    sd_notify(0, "STOPPING=1\nSTATUS=Shutting down");
    LOG_DEBUG("Daemon", "Notified systemd: STOPPING");
}

void Daemon::notify_watchdog() {
    sd_notify(0, "WATCHDOG=1");
}

bool Daemon::reload_config() {
    LOG_INFO("Daemon", "Reloading configuration");
    auto loaded = ConfigManager::instance().read();
    if (!loaded) {
        LOG_ERROR("Daemon", "Failed to reload configuration");
        return false;
    }
    const Config& config = *loaded;
    
    // Watchers first, nothing is installed if the gate stays busy
    if (auto* arbiter = get_service<Arbiter>()) {
        arbiter->apply_config(config.watchers);
        arbiter->set_command_timeout(std::chrono::milliseconds(config.command_timeout_ms));
    }
    
    ConfigManager::instance().commit(config);
    Logger::set_level(Logger::level_from_int(config.log_level));
    
    if (auto* reconciler = get_service<Reconciler>()) {
        reconciler->set_interval(std::chrono::milliseconds(config.check_interval_ms));
    }
    
    if (loop_ && dispatcher_) {
        SignalMap mapping = signal_mapping(config);
        loop_->add_callback([this, mapping]() {
            dispatcher_->set_mapping(mapping);
            if (!dispatcher_->install()) {
                LOG_ERROR("Daemon", "Reloaded signal mapping is only partly installed");
            }
        });
    }
    
    LOG_INFO("Daemon", "Configuration reloaded successfully");
    return true;
}

void Daemon::reload_from_signal() {
    try {
        reload_config();
    } catch (const GateBusy& e) {
        if (reload_retry_timer_ == 0) {
            LOG_WARN("Daemon", "Reload deferred " + std::to_string(RELOAD_RETRY_MS) + "ms: " + e.what());
            reload_retry_timer_ = loop_->add_timeout(std::chrono::milliseconds(RELOAD_RETRY_MS), [this]() {
                reload_retry_timer_ = 0;
                reload_from_signal();
            });
        }
        return;
    }
    
    if (reload_retry_timer_ != 0) {
        loop_->cancel_timer(reload_retry_timer_);
        reload_retry_timer_ = 0;
    }
}

void Daemon::log_status() {
    auto* arbiter = get_service<Arbiter>();
    if (!arbiter) {
        return;
    }
    std::string active = arbiter->gate().active_command();
    LOG_INFO("Daemon", "Uptime " + std::to_string(uptime().count()) + "s, " +
             std::to_string(arbiter->watcher_count()) + " watchers, command " +
             (active.empty() ? "idle" : active));
    for (const auto& status : arbiter->statuses()) {
        LOG_INFO("Daemon", status->name + ": " + watcher_state_name(status->state) + ", " +
                 std::to_string(status->live_processes()) + "/" + std::to_string(status->desired) +
                 " processes" + (status->degraded ? ", degraded: " + status->last_error : ""));
    }
}

void Daemon::reset() {
    // Only valid while stopped and with no other thread touching the daemon
    stop_services();
    
    {
        std::unique_lock<std::shared_mutex> lock(services_mutex_);
        services_.clear();
    }
    
    if (channel_) {
        if (registry_ && registry_->is_registered(channel_->wake_fd())) {
            registry_->unregister_fd(channel_->wake_fd());
        }
        channel_->uninstall_all();
        channel_->close();
    }
    dispatcher_.reset();
    channel_.reset();
    spawner_.reset();
    redirector_.reset();
    registry_.reset();
    loop_.reset();
    
    shutdown_requested_.store(false);
    running_.store(false);
    exit_code_.store(0);
    watchdog_timer_ = 0;
    reload_retry_timer_ = 0;
    start_time_ = std::chrono::steady_clock::time_point{};
    
    LOG_DEBUG("Daemon", "Daemon state reset for testing");
}

SignalMap Daemon::signal_mapping(const Config& config) {
    SignalMap mapping = SignalDispatcher::default_mapping();
    for (const auto& entry : config.signals) {
        auto signum = signal_from_name(entry.first);
        auto action = parse_signal_action(entry.second);
        if (!signum || !action) {
            // Config::validate() rejects these; keep the default if one slips through
            LOG_WARN("Daemon", "Ignoring signal mapping " + entry.first + " -> " + entry.second);
            continue;
        }
        mapping[*signum] = *action;
    }
    return mapping;
}

bool Daemon::setup_signals(const Config& config) {
    channel_ = std::make_unique<SignalChannel>();
    dispatcher_ = std::make_unique<SignalDispatcher>(*channel_);
    dispatcher_->set_mapping(signal_mapping(config));
    
    dispatcher_->on(SignalAction::SHUTDOWN, [this](int) {
        request_shutdown();
    });
    dispatcher_->on(SignalAction::RELOAD, [this](int) {
        reload_from_signal();
    });
    dispatcher_->on(SignalAction::REAP, [this](int) {
        if (auto* arbiter = get_service<Arbiter>()) {
            arbiter->reap_processes();
        }
    });
    dispatcher_->on(SignalAction::RECONCILE, [this](int) {
        if (auto* reconciler = get_service<Reconciler>()) {
            reconciler->tick();
        }
    });
    dispatcher_->on(SignalAction::STATUS, [this](int) {
        log_status();
    });
    
    // Ignore SIGPIPE (broken pipe from sockets and child pipes)
    signal(SIGPIPE, SIG_IGN);
    
    if (!dispatcher_->install()) {
        return false;
    }
    
    SignalDispatcher* dispatcher = dispatcher_.get();
    registry_->register_fd(channel_->wake_fd(), [dispatcher](int, uint32_t) {
        dispatcher->dispatch_pending();
    });
    
    LOG_DEBUG("Daemon", "Signal handlers installed");
    return true;
}

bool Daemon::start_services() {
    std::unique_lock<std::shared_mutex> lock(services_mutex_);
    
    // Higher priority first
    std::stable_sort(services_.begin(), services_.end(),
        [](const auto& a, const auto& b) {
            return a->priority() > b->priority();
        });
    
    std::vector<Service*> service_ptrs;
    for (const auto& service : services_) {
        service_ptrs.push_back(service.get());
    }
    
    // start() may take time
    lock.unlock();
    
    for (auto* service_ptr : service_ptrs) {
        LOG_INFO("Daemon", "Starting service: " + std::string(service_ptr->name()));
        
        if (!service_ptr->start()) {
            LOG_ERROR("Daemon", "Failed to start service: " + std::string(service_ptr->name()));
            stop_services();
            return false;
        }
        
        LOG_INFO("Daemon", "Service started: " + std::string(service_ptr->name()));
    }
    
    return true;
}

void Daemon::stop_services() {
    std::shared_lock<std::shared_mutex> lock(services_mutex_);
    
    std::vector<Service*> service_ptrs;
    for (auto it = services_.rbegin(); it != services_.rend(); ++it) {
        service_ptrs.push_back(it->get());
    }
    lock.unlock();
    
    // Reverse start order
    for (auto* service_ptr : service_ptrs) {
        if (service_ptr->is_running()) {
            LOG_INFO("Daemon", "Stopping service: " + std::string(service_ptr->name()));
            service_ptr->stop();
            LOG_INFO("Daemon", "Service stopped: " + std::string(service_ptr->name()));
        }
    }
}

void Daemon::check_health() {
    {
        std::shared_lock<std::shared_mutex> lock(services_mutex_);
        for (const auto& service : services_) {
            if (service->is_running() && !service->is_healthy()) {
                LOG_WARN("Daemon", "Service unhealthy: " + std::string(service->name()));
            }
        }
    }
    
    notify_watchdog();
}

} // namespace wardend
