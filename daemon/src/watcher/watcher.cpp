/**
 * @file watcher.cpp
 * @brief Watcher state machine implementation
 */

#include "wardend/watcher/watcher.h"
#include "wardend/core/signal_dispatcher.h"
#include "wardend/errors.h"
#include "wardend/logger.h"
#include <signal.h>
#include <algorithm>
#include <thread>

namespace wardend {

const char* watcher_state_name(WatcherState state) {
    switch (state) {
        case WatcherState::STOPPED: return "stopped";
        case WatcherState::STARTING: return "starting";
        case WatcherState::RUNNING: return "running";
        case WatcherState::RECONCILING: return "reconciling";
        case WatcherState::STOPPING: return "stopping";
        default: return "unknown";
    }
}

json WatcherStatus::to_json() const {
    auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(
        last_reconcile.time_since_epoch()).count();
    return {
        {"name", name},
        {"state", watcher_state_name(state)},
        {"desired", desired},
        {"processes", pids.size()},
        {"pids", pids},
        {"retiring", retiring},
        {"degraded", degraded},
        {"last_error", last_error},
        {"spawn_failures", spawn_failures},
        {"respawns", respawns},
        {"last_reconcile", since_epoch}
    };
}

// Watcher implementation

Watcher::Watcher(WatcherConfig config, ProcessSpawner& spawner, StreamRedirector& redirector)
    : name_(config.name)
    , config_(std::move(config))
    , spawner_(spawner)
    , redirector_(redirector) {
    publish();
}

Watcher::~Watcher() {
    for (auto& retiring : retiring_) {
        processes_.push_back(std::move(retiring.process));
    }
    retiring_.clear();
    for (auto& process : processes_) {
        if (process->poll()) {
            LOG_WARN("Watcher", name_ + ": killing pid " + std::to_string(process->pid()) + " on teardown");
            process->kill_now();
        }
        forget(*process);
    }
}

std::shared_ptr<const WatcherStatus> Watcher::status() const {
    return std::atomic_load(&status_);
}

bool Watcher::bind_sockets(const GateToken& /*token*/) {
    bool ok = true;
    for (const auto& socket_config : config_.sockets) {
        auto socket = std::make_unique<ListenSocket>(socket_config);
        if (!socket->bind()) {
            fail("cannot bind socket " + socket_config.name);
            ok = false;
            continue;
        }
        sockets_.push_back(std::move(socket));
    }
    publish();
    return ok;
}

void Watcher::start(const GateToken& token) {
    if (state_.load() != WatcherState::STOPPED) {
        LOG_DEBUG("Watcher", name_ + ": start ignored, already " + watcher_state_name(state_.load()));
        return;
    }
    
    LOG_INFO("Watcher", name_ + ": starting " + std::to_string(config_.numprocesses) + " processes");
    transition(WatcherState::STARTING);
    degraded_ = false;
    last_error_.clear();
    
    try {
        converge(token);
    } catch (...) {
        transition(WatcherState::RUNNING);
        throw;
    }
    
    transition(WatcherState::RUNNING);
    LOG_INFO("Watcher", name_ + ": running with " + std::to_string(processes_.size()) + " processes");
}

void Watcher::stop(const GateToken& /*token*/) {
    if (state_.load() == WatcherState::STOPPED) {
        LOG_DEBUG("Watcher", name_ + ": already stopped");
        return;
    }
    
    LOG_INFO("Watcher", name_ + ": stopping " + std::to_string(processes_.size()) + " processes");
    transition(WatcherState::STOPPING);
    
    std::vector<std::unique_ptr<Process>> victims;
    victims.swap(processes_);
    terminate(std::move(victims));
    
    transition(WatcherState::STOPPED);
    LOG_INFO("Watcher", name_ + ": stopped");
}

void Watcher::restart(const GateToken& token) {
    stop(token);
    start(token);
}

ReconcileRequest Watcher::reconcile(const GateToken& token) {
    last_reconcile_ = std::chrono::system_clock::now();
    
    WatcherState current = state_.load();
    if (current == WatcherState::STOPPED) {
        ReconcileRequest request = ReconcileRequest::NONE;
        if (config_.on_demand && has_pending_activity(token)) {
            LOG_INFO("Watcher", name_ + ": connection pending, requesting on-demand start");
            request = ReconcileRequest::ACTIVATE;
        }
        publish();
        return request;
    }
    if (current != WatcherState::RUNNING) {
        publish();
        return ReconcileRequest::NONE;
    }
    
    transition(WatcherState::RECONCILING);
    try {
        reap(token);
        
        // Replace at most one expired process per pass
        if (config_.max_age.count() > 0 && !processes_.empty()) {
            auto oldest = std::min_element(processes_.begin(), processes_.end(),
                [](const auto& a, const auto& b) { return a->started_at() < b->started_at(); });
            if ((*oldest)->age() > config_.max_age) {
                LOG_INFO("Watcher", name_ + ": pid " + std::to_string((*oldest)->pid()) +
                         " exceeded max_age, replacing");
                std::vector<std::unique_ptr<Process>> expired;
                expired.push_back(std::move(*oldest));
                processes_.erase(oldest);
                retire(std::move(expired));
            }
        }
        
        size_t before = processes_.size();
        if (config_.respawn || static_cast<int>(processes_.size()) > config_.numprocesses) {
            converge(token);
        }
        if (processes_.size() > before) {
            respawns_ += processes_.size() - before;
        }
    } catch (...) {
        transition(WatcherState::RUNNING);
        throw;
    }
    transition(WatcherState::RUNNING);
    
    if (processes_.empty() && config_.numprocesses > 0 && (!config_.respawn || degraded_)) {
        LOG_WARN("Watcher", name_ + ": no live processes left, requesting stop");
        return ReconcileRequest::STOP;
    }
    return ReconcileRequest::NONE;
}

size_t Watcher::reap(const GateToken& /*token*/) {
    size_t reaped = 0;
    for (auto it = processes_.begin(); it != processes_.end();) {
        if ((*it)->poll()) {
            ++it;
            continue;
        }
        LOG_INFO("Watcher", name_ + ": pid " + std::to_string((*it)->pid()) + " " + (*it)->describe_exit());
        forget(**it);
        it = processes_.erase(it);
        ++reaped;
    }
    if (!retiring_.empty()) {
        reaped += sweep_retiring();
    }
    if (reaped > 0) {
        publish();
    }
    return reaped;
}

void Watcher::set_numprocesses(const GateToken& token, int numprocesses) {
    if (numprocesses < 0) {
        throw WardenError("numprocesses must not be negative");
    }
    LOG_INFO("Watcher", name_ + ": numprocesses " + std::to_string(config_.numprocesses) +
             " -> " + std::to_string(numprocesses));
    config_.numprocesses = numprocesses;
    
    if (state_.load() == WatcherState::RUNNING) {
        converge(token);
    }
    publish();
}

void Watcher::update_config(const GateToken& token, WatcherConfig config) {
    // Sockets stay bound for the watcher's lifetime
    config.sockets = config_.sockets;
    config_ = std::move(config);
    
    if (state_.load() == WatcherState::RUNNING) {
        converge(token);
    }
    publish();
}

bool Watcher::has_pending_activity(const GateToken& /*token*/) const {
    for (const auto& socket : sockets_) {
        if (socket->has_pending_connection()) {
            return true;
        }
    }
    return false;
}

// Internals

void Watcher::transition(WatcherState state) {
    state_.store(state);
    publish();
}

void Watcher::publish() {
    auto status = std::make_shared<WatcherStatus>();
    status->name = name_;
    status->state = state_.load();
    status->desired = config_.numprocesses;
    for (const auto& process : processes_) {
        status->pids.push_back(process->pid());
    }
    status->retiring = retiring_.size();
    status->degraded = degraded_;
    status->last_error = last_error_;
    status->spawn_failures = spawn_failures_;
    status->respawns = respawns_;
    status->last_reconcile = last_reconcile_;
    std::atomic_store(&status_, std::shared_ptr<const WatcherStatus>(std::move(status)));
}

SpawnRequest Watcher::spawn_request() const {
    SpawnRequest request;
    request.command = config_.cmd;
    request.args = config_.args;
    request.env = config_.env;
    request.copy_env = config_.copy_env;
    request.working_dir = config_.working_dir;
    request.capture_output = config_.capture_output;
    for (const auto& socket : sockets_) {
        request.env[socket->env_name()] = std::to_string(socket->fd());
        request.inherit_fds.push_back(socket->fd());
    }
    return request;
}

bool Watcher::spawn_process(const GateToken& /*token*/) {
    // Unlimited retry is spread over reconcile passes, one attempt each
    const int attempts = config_.max_retry < 0 ? 1 : config_.max_retry + 1;
    
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        std::string error;
        try {
            std::unique_ptr<Process> process = spawner_.spawn(spawn_request());
            StreamRedirector::Redirection redirection;
            try {
                redirection = redirector_.add_redirections(name_, *process);
            } catch (const RegistrationConflict&) {
                process->kill_now();
                throw;
            }
            
            if (!process->poll()) {
                // Leaving scope releases this attempt's registrations
                throw SpawnFailure("pid " + std::to_string(process->pid()) + " " +
                                   process->describe_exit() + " during spawn");
            }
            
            redirection.commit();
            LOG_INFO("Watcher", name_ + ": spawned pid " + std::to_string(process->pid()));
            processes_.push_back(std::move(process));
            publish();
            return true;
            
        } catch (const LedgerDivergence&) {
            throw;
        } catch (const SpawnFailure& e) {
            error = e.what();
        } catch (const RegistrationConflict& e) {
            error = e.what();
        }
        
        ++spawn_failures_;
        last_error_ = error;
        LOG_WARN("Watcher", name_ + ": spawn attempt " + std::to_string(attempt) + "/" +
                 std::to_string(attempts) + " failed: " + error);
        publish();
    }
    
    if (config_.max_retry >= 0) {
        fail("giving up on process slot after " + std::to_string(attempts) + " attempts: " + last_error_);
    }
    return false;
}

void Watcher::converge(const GateToken& token) {
    const int desired = config_.numprocesses;
    
    if (static_cast<int>(processes_.size()) > desired) {
        // Retire the oldest first
        std::sort(processes_.begin(), processes_.end(),
            [](const auto& a, const auto& b) { return a->started_at() < b->started_at(); });
        size_t excess = processes_.size() - static_cast<size_t>(desired);
        std::vector<std::unique_ptr<Process>> victims;
        for (size_t i = 0; i < excess; ++i) {
            victims.push_back(std::move(processes_[i]));
        }
        processes_.erase(processes_.begin(), processes_.begin() + static_cast<long>(excess));
        retire(std::move(victims));
        publish();
        return;
    }
    
    int missing = desired - static_cast<int>(processes_.size());
    for (int slot = 0; slot < missing; ++slot) {
        if (slot > 0 && config_.warmup_delay.count() > 0) {
            std::this_thread::sleep_for(config_.warmup_delay);
        }
        spawn_process(token);
    }
}

void Watcher::terminate(std::vector<std::unique_ptr<Process>> victims) {
    const int stop_signal = signal_from_name(config_.stop_signal).value_or(SIGTERM);
    for (auto& process : victims) {
        if (process->poll()) {
            process->send_signal(stop_signal);
        }
    }
    // Retirees were signalled already
    for (auto& retiring : retiring_) {
        victims.push_back(std::move(retiring.process));
    }
    retiring_.clear();
    if (victims.empty()) {
        return;
    }
    
    auto deadline = std::chrono::steady_clock::now() + config_.graceful_timeout;
    for (;;) {
        bool any_alive = false;
        for (auto& process : victims) {
            if (process->poll()) {
                any_alive = true;
            }
        }
        if (!any_alive || std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(EXIT_POLL_INTERVAL);
    }
    
    for (auto& process : victims) {
        if (process->is_alive()) {
            LOG_WARN("Watcher", name_ + ": pid " + std::to_string(process->pid()) +
                     " ignored " + config_.stop_signal + " for " +
                     std::to_string(config_.graceful_timeout.count()) + "ms, sending SIGKILL");
            process->kill_now();
        }
        LOG_DEBUG("Watcher", name_ + ": pid " + std::to_string(process->pid()) + " " + process->describe_exit());
        forget(*process);
    }
}

void Watcher::retire(std::vector<std::unique_ptr<Process>> victims) {
    const int stop_signal = signal_from_name(config_.stop_signal).value_or(SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + config_.graceful_timeout;
    for (auto& process : victims) {
        if (process->poll()) {
            process->send_signal(stop_signal);
        }
        retiring_.push_back(Retiring{std::move(process), deadline, false});
    }
    sweep_retiring();
    publish();
}

size_t Watcher::sweep_retiring() {
    const auto now = std::chrono::steady_clock::now();
    size_t collected = 0;
    for (auto it = retiring_.begin(); it != retiring_.end();) {
        Process& process = *it->process;
        if (process.poll() && !it->killed && now >= it->deadline) {
            LOG_WARN("Watcher", name_ + ": pid " + std::to_string(process.pid()) +
                     " ignored " + config_.stop_signal + " for " +
                     std::to_string(config_.graceful_timeout.count()) + "ms, sending SIGKILL");
            it->killed = true;
            process.kill_now();
        }
        if (process.is_alive()) {
            ++it;
            continue;
        }
        LOG_DEBUG("Watcher", name_ + ": pid " + std::to_string(process.pid()) + " " + process.describe_exit());
        forget(process);
        it = retiring_.erase(it);
        ++collected;
    }
    return collected;
}

void Watcher::forget(Process& process) {
    redirector_.remove_redirections(process);
}

void Watcher::fail(const std::string& message) {
    degraded_ = true;
    last_error_ = message;
    LOG_ERROR("Watcher", name_ + ": " + message);
    publish();
}

} // namespace wardend
