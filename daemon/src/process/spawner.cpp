/**
 * @file spawner.cpp
 * @brief fork/exec process creation
 */

#include "wardend/process/spawner.h"
#include "wardend/errors.h"
#include "wardend/logger.h"
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace wardend {

namespace {

class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) == -1) {
            throw SpawnFailure("pipe: " + std::string(strerror(errno)), errno);
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;
    
    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }
    
    int release_read() {
        int fd = fds_[0];
        fds_[0] = -1;
        return fd;
    }
    
    void close_read() {
        if (fds_[0] != -1) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }
    
    void close_write() {
        if (fds_[1] != -1) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }
    
private:
    int fds_[2] = {-1, -1};
};

bool is_executable(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

std::string resolve_executable(const std::string& command, const std::string& search_path) {
    if (command.find('/') != std::string::npos) {
        return command;
    }
    std::string path = search_path.empty() ? "/usr/local/bin:/usr/bin:/bin" : search_path;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string dir = path.substr(start, end - start);
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + command;
        if (is_executable(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    throw SpawnFailure("command not found: " + command, ENOENT);
}

std::vector<std::string> build_environment(const SpawnRequest& request) {
    std::map<std::string, std::string> merged;
    if (request.copy_env && environ) {
        for (char** entry = environ; *entry; ++entry) {
            std::string item(*entry);
            auto eq = item.find('=');
            if (eq != std::string::npos) {
                merged[item.substr(0, eq)] = item.substr(eq + 1);
            }
        }
    }
    for (const auto& entry : request.env) {
        merged[entry.first] = entry.second;
    }
    
    std::vector<std::string> env;
    env.reserve(merged.size());
    for (const auto& entry : merged) {
        env.push_back(entry.first + "=" + entry.second);
    }
    return env;
}

std::vector<char*> to_argv(std::vector<std::string>& strings) {
    std::vector<char*> argv;
    argv.reserve(strings.size() + 1);
    for (auto& s : strings) {
        argv.push_back(&s[0]);
    }
    argv.push_back(nullptr);
    return argv;
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags != -1) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

[[noreturn]] void child_fail(int report_fd) {
    int err = errno;
    ssize_t written = ::write(report_fd, &err, sizeof(err));
    (void)written;
    _exit(127);
}

} // namespace

std::unique_ptr<Process> PosixSpawner::spawn(const SpawnRequest& request) {
    if (request.command.empty()) {
        throw SpawnFailure("empty command", EINVAL);
    }
    
    // Everything the child touches is prepared before fork()
    std::vector<std::string> env_strings = build_environment(request);
    std::string search_path;
    for (const auto& item : env_strings) {
        if (item.compare(0, 5, "PATH=") == 0) {
            search_path = item.substr(5);
        }
    }
    std::string executable = resolve_executable(request.command, search_path);
    
    std::vector<std::string> arg_strings;
    arg_strings.push_back(request.command);
    arg_strings.insert(arg_strings.end(), request.args.begin(), request.args.end());
    std::vector<char*> argv = to_argv(arg_strings);
    std::vector<char*> envp = to_argv(env_strings);
    
    Pipe report;
    std::unique_ptr<Pipe> out;
    std::unique_ptr<Pipe> err;
    if (request.capture_output) {
        out = std::make_unique<Pipe>();
        err = std::make_unique<Pipe>();
    }
    
    pid_t pid = fork();
    if (pid == -1) {
        throw SpawnFailure("fork: " + std::string(strerror(errno)), errno);
    }
    
    if (pid == 0) {
        // Child: async-signal-safe calls only
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull != -1) {
            dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (out && (dup2(out->write_end(), STDOUT_FILENO) == -1 ||
                    dup2(err->write_end(), STDERR_FILENO) == -1)) {
            child_fail(report.write_end());
        }
        for (int fd : request.inherit_fds) {
            if (fcntl(fd, F_SETFD, 0) == -1) {
                child_fail(report.write_end());
            }
        }
        if (!request.working_dir.empty() && chdir(request.working_dir.c_str()) == -1) {
            child_fail(report.write_end());
        }
        
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);
        struct sigaction dfl;
        memset(&dfl, 0, sizeof(dfl));
        dfl.sa_handler = SIG_DFL;
        sigaction(SIGPIPE, &dfl, nullptr);
        
        execve(executable.c_str(), argv.data(), envp.data());
        child_fail(report.write_end());
    }
    
    // Parent
    report.close_write();
    if (out) {
        out->close_write();
        err->close_write();
    }
    
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(report.read_end(), &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    
    if (n > 0) {
        int status;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        throw SpawnFailure("exec " + executable + ": " + strerror(child_errno), child_errno);
    }
    
    int stdout_fd = -1;
    int stderr_fd = -1;
    if (out) {
        stdout_fd = out->release_read();
        stderr_fd = err->release_read();
        set_nonblocking(stdout_fd);
        set_nonblocking(stderr_fd);
    }
    
    LOG_DEBUG("PosixSpawner", "Spawned " + executable + " as pid " + std::to_string(pid));
    return std::make_unique<Process>(pid, stdout_fd, stderr_fd);
}

} // namespace wardend
