/**
 * @file process.h
 * @brief A supervised child process
 */

#pragma once

#include <sys/types.h>
#include <chrono>
#include <optional>
#include <string>

namespace wardend {

/**
 * @brief One OS process owned by a Watcher
 *
 * Owns the read ends of the child's stdout/stderr pipes. poll() reaps the
 * child with waitpid(WNOHANG) on its own pid only, so exits of processes
 * belonging to other watchers are never consumed here.
 */
class Process {
public:
    Process(pid_t pid, int stdout_fd, int stderr_fd);
    virtual ~Process();
    
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    
    pid_t pid() const { return pid_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }
    
    std::chrono::steady_clock::time_point started_at() const { return started_at_; }
    std::chrono::steady_clock::duration age() const;
    
    /**
     * @brief Send a signal to the process
     * @return false if the process is already gone
     */
    virtual bool send_signal(int signum);
    
    /**
     * @brief Reap the process if it has exited
     * @return true while the process is still alive
     */
    virtual bool poll();
    
    /**
     * @brief SIGKILL and reap, waiting at most KILL_REAP_TIMEOUT
     *
     * The process stays alive() if the kernel has not released it by then.
     */
    virtual void kill_now();
    
    bool is_alive() const { return !wait_status_.has_value(); }
    
    /**
     * @brief Raw waitpid() status once reaped
     */
    std::optional<int> wait_status() const { return wait_status_; }
    
    /**
     * @brief "exited with status 1", "killed by SIGTERM", "running"
     */
    std::string describe_exit() const;
    
    void close_pipes();
    
protected:
    void mark_exited(int wait_status);
    
private:
    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    std::chrono::steady_clock::time_point started_at_;
    std::optional<int> wait_status_;
};

} // namespace wardend
