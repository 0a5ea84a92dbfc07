/**
 * @file errors.h
 * @brief Exception taxonomy for supervision failures
 */

#pragma once

#include <stdexcept>
#include <string>

namespace wardend {

/**
 * @brief Base class for all wardend errors
 */
class WardenError : public std::runtime_error {
public:
    explicit WardenError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Another exclusive command holds the command gate
 *
 * Recoverable: callers retry later or report "busy" upstream.
 */
class GateBusy : public WardenError {
public:
    GateBusy(const std::string& requested, const std::string& active)
        : WardenError("cannot run " + requested + ": already running " + active + " command")
        , requested_(requested)
        , active_(active) {}
    
    const std::string& requested_command() const { return requested_; }
    const std::string& active_command() const { return active_; }
    
private:
    std::string requested_;
    std::string active_;
};

/**
 * @brief A process could not be created
 */
class SpawnFailure : public WardenError {
public:
    SpawnFailure(const std::string& what, int error_number = 0)
        : WardenError(what), errno_(error_number) {}
    
    int error_number() const { return errno_; }
    
private:
    int errno_;
};

/**
 * @brief A descriptor is already present in the handler ledger
 */
class RegistrationConflict : public WardenError {
public:
    explicit RegistrationConflict(int fd)
        : WardenError("fd " + std::to_string(fd) + " already registered")
        , fd_(fd) {}
    
    int fd() const { return fd_; }
    
private:
    int fd_;
};

/**
 * @brief The handler ledger and the event loop disagree and cannot be reconciled
 *
 * This is the only supervision error that is fatal to the daemon.
 */
class LedgerDivergence : public WardenError {
public:
    LedgerDivergence(int fd, const std::string& detail)
        : WardenError("handler ledger diverged from event loop on fd "
                      + std::to_string(fd) + ": " + detail)
        , fd_(fd) {}
    
    int fd() const { return fd_; }
    
private:
    int fd_;
};

/**
 * @brief A named watcher does not exist
 */
class UnknownWatcher : public WardenError {
public:
    explicit UnknownWatcher(const std::string& name)
        : WardenError("no such watcher: " + name) {}
};

} // namespace wardend
