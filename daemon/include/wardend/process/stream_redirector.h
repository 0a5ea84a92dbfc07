/**
 * @file stream_redirector.h
 * @brief Forwards child stdout/stderr through the event loop
 */

#pragma once

#include "wardend/core/handler_registry.h"
#include "wardend/process/process.h"
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace wardend {

/**
 * @brief Reads child output pipes and hands complete lines to a sink
 *
 * Every descriptor goes through the HandlerRegistry; the redirector never
 * binds the event loop directly.
 */
class StreamRedirector {
public:
    using Sink = std::function<void(const std::string& watcher, pid_t pid,
                                    const std::string& stream, const std::string& line)>;
    
    /**
     * @brief Registrations made for one process
     *
     * Removed on destruction unless commit() was called. A spawn attempt
     * holds one of these until the process is confirmed alive, so a failed
     * attempt never leaves its descriptors bound.
     */
    class Redirection {
    public:
        Redirection() = default;
        Redirection(StreamRedirector* owner, std::vector<int> fds);
        ~Redirection();
        
        Redirection(Redirection&& other) noexcept;
        Redirection& operator=(Redirection&& other) noexcept;
        Redirection(const Redirection&) = delete;
        Redirection& operator=(const Redirection&) = delete;
        
        void commit() { committed_ = true; }
        const std::vector<int>& fds() const { return fds_; }
        
    private:
        StreamRedirector* owner_ = nullptr;
        std::vector<int> fds_;
        bool committed_ = false;
    };
    
    explicit StreamRedirector(HandlerRegistry& registry, Sink sink = Sink());
    ~StreamRedirector();
    
    StreamRedirector(const StreamRedirector&) = delete;
    StreamRedirector& operator=(const StreamRedirector&) = delete;
    
    /**
     * @brief Register the process's output pipes
     * @throws RegistrationConflict / LedgerDivergence from the registry;
     *         anything registered before the failure is rolled back
     */
    Redirection add_redirections(const std::string& watcher, const Process& process);
    
    /**
     * @brief Unregister the process's output pipes, flushing partial lines
     * @return Number of descriptors removed from the ledger
     */
    size_t remove_redirections(const Process& process);
    
    size_t active_streams() const;
    
    /**
     * @brief Default sink: log each line under "watcher:<name>"
     */
    static void log_line(const std::string& watcher, pid_t pid,
                         const std::string& stream, const std::string& line);
    
private:
    struct Stream {
        std::string watcher;
        pid_t pid;
        std::string name;
        std::string partial;
    };
    
    HandlerRegistry& registry_;
    Sink sink_;
    mutable std::mutex mutex_;
    std::map<int, Stream> streams_;
    
    size_t remove_fds(const std::vector<int>& fds);
    void on_readable(int fd, uint32_t events);
    void emit_lines(Stream& stream, bool flush);
};

} // namespace wardend
