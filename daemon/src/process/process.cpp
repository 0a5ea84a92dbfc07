/**
 * @file process.cpp
 * @brief Child process handle implementation
 */

#include "wardend/process/process.h"
#include "wardend/common.h"
#include "wardend/core/signal_dispatcher.h"
#include "wardend/logger.h"
#include <sys/wait.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <thread>

namespace wardend {

Process::Process(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid)
    , stdout_fd_(stdout_fd)
    , stderr_fd_(stderr_fd)
    , started_at_(std::chrono::steady_clock::now()) {
}

Process::~Process() {
    close_pipes();
}

std::chrono::steady_clock::duration Process::age() const {
    return std::chrono::steady_clock::now() - started_at_;
}

bool Process::send_signal(int signum) {
    if (!is_alive()) {
        return false;
    }
    if (::kill(pid_, signum) == -1) {
        return errno != ESRCH;
    }
    return true;
}

bool Process::poll() {
    if (!is_alive()) {
        return false;
    }
    
    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, WNOHANG);
    } while (result == -1 && errno == EINTR);
    
    if (result == 0) {
        return true;
    }
    // ECHILD: already reaped elsewhere; the process is gone either way
    mark_exited(result == pid_ ? status : -1);
    return false;
}

void Process::kill_now() {
    if (!is_alive()) {
        return;
    }
    ::kill(pid_, SIGKILL);
    
    // A child stuck in uninterruptible sleep is left to a later poll()
    auto deadline = std::chrono::steady_clock::now() + KILL_REAP_TIMEOUT;
    while (poll()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("Process", "pid " + std::to_string(pid_) + " not reaped " +
                     std::to_string(KILL_REAP_TIMEOUT.count()) + "ms after SIGKILL");
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

std::string Process::describe_exit() const {
    if (!wait_status_) {
        return "running";
    }
    int status = *wait_status_;
    if (status == -1) {
        return "exited (status unavailable)";
    }
    if (WIFEXITED(status)) {
        return "exited with status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by " + signal_name(WTERMSIG(status));
    }
    return "exited";
}

void Process::close_pipes() {
    if (stdout_fd_ != -1) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (stderr_fd_ != -1) {
        ::close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

void Process::mark_exited(int wait_status) {
    wait_status_ = wait_status;
}

} // namespace wardend
