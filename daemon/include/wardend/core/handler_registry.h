/**
 * @file handler_registry.h
 * @brief Ledger of descriptors bound to the event loop
 */

#pragma once

#include "wardend/core/event_loop.h"
#include <map>
#include <mutex>
#include <vector>

namespace wardend {

/**
 * @brief Keeps the descriptor ledger in step with an IoMultiplexer
 *
 * Invariant: the ledger has an entry for fd exactly when the loop holds a
 * binding for it. A removal that the loop rejects is only committed to the
 * ledger once has_handler() confirms the binding is gone; otherwise the entry
 * is kept as pending and the descriptor counts as occupied. Registering a
 * pending descriptor (the OS reused the number) first retries the removal and
 * falls back to overwriting the binding in place.
 */
class HandlerRegistry {
public:
    explicit HandlerRegistry(IoMultiplexer& loop);
    
    HandlerRegistry(const HandlerRegistry&) = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;
    
    /**
     * @brief Bind a handler to @p fd
     * @throws RegistrationConflict if the ledger already holds a live entry
     * @throws LedgerDivergence if the loop cannot be brought in line
     * @throws WardenError if the loop rejects a fresh descriptor
     */
    void register_fd(int fd, IoHandler handler, uint32_t events = IoEvents::READ);
    
    /**
     * @brief Remove the binding for @p fd
     * @return true if the ledger entry was removed; false if there was none
     *         or the loop still holds the binding (entry kept as pending)
     *
     * Safe to call repeatedly.
     */
    bool unregister_fd(int fd);
    
    /**
     * @brief Retry removal of every pending entry
     * @return Number of entries cleared
     */
    size_t retry_pending();
    
    bool is_registered(int fd) const;
    bool is_pending(int fd) const;
    
    size_t size() const;
    size_t pending_count() const;
    std::vector<int> descriptors() const;
    
private:
    struct Entry {
        IoHandler handler;
        uint32_t events;
        bool pending;
    };
    
    IoMultiplexer& loop_;
    mutable std::mutex mutex_;
    std::map<int, Entry> ledger_;
    
    /**
     * @brief Ask the loop to drop @p fd and verify it did
     * @return true if the loop no longer holds a binding
     */
    bool remove_and_verify(int fd);
    
    /**
     * @brief Overwrite the loop's binding and record it as live
     */
    void overwrite(int fd, IoHandler handler, uint32_t events);
};

} // namespace wardend
