/**
 * @file handler_registry.cpp
 * @brief Descriptor ledger implementation
 */

#include "wardend/core/handler_registry.h"
#include "wardend/errors.h"
#include "wardend/logger.h"
#include <string>

namespace wardend {

HandlerRegistry::HandlerRegistry(IoMultiplexer& loop)
    : loop_(loop) {
}

void HandlerRegistry::register_fd(int fd, IoHandler handler, uint32_t events) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = ledger_.find(fd);
    if (it != ledger_.end()) {
        if (!it->second.pending) {
            throw RegistrationConflict(fd);
        }
        // Descriptor number was reused while an old binding may still linger
        if (remove_and_verify(fd)) {
            LOG_DEBUG("HandlerRegistry", "Cleared pending fd " + std::to_string(fd) + " before reuse");
            ledger_.erase(it);
        } else {
            LOG_WARN("HandlerRegistry", "fd " + std::to_string(fd) +
                     " still bound in event loop, overwriting stale binding");
            overwrite(fd, std::move(handler), events);
            return;
        }
    }
    
    try {
        loop_.add_handler(fd, handler, events);
    } catch (const std::exception& e) {
        if (!loop_.has_handler(fd)) {
            throw WardenError("cannot register fd " + std::to_string(fd) + ": " + e.what());
        }
        // Loop holds a binding the ledger never recorded
        LOG_WARN("HandlerRegistry", "Event loop already bound fd " + std::to_string(fd) +
                 " (" + e.what() + "), overwriting");
        overwrite(fd, std::move(handler), events);
        return;
    }
    
    ledger_[fd] = Entry{std::move(handler), events, false};
}

bool HandlerRegistry::unregister_fd(int fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = ledger_.find(fd);
    if (it == ledger_.end()) {
        return false;
    }
    
    if (remove_and_verify(fd)) {
        ledger_.erase(it);
        return true;
    }
    
    it->second.pending = true;
    LOG_WARN("HandlerRegistry", "fd " + std::to_string(fd) +
             " still bound after removal, keeping it as pending");
    return false;
}

size_t HandlerRegistry::retry_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    size_t cleared = 0;
    for (auto it = ledger_.begin(); it != ledger_.end();) {
        if (it->second.pending && remove_and_verify(it->first)) {
            it = ledger_.erase(it);
            ++cleared;
        } else {
            ++it;
        }
    }
    return cleared;
}

bool HandlerRegistry::remove_and_verify(int fd) {
    try {
        loop_.remove_handler(fd);
    } catch (const std::exception& e) {
        LOG_WARN("HandlerRegistry", "Removing fd " + std::to_string(fd) +
                 " from event loop failed: " + e.what());
    }
    
    try {
        return !loop_.has_handler(fd);
    } catch (const std::exception& e) {
        LOG_ERROR("HandlerRegistry", "Cannot verify fd " + std::to_string(fd) + ": " + e.what());
        return false;
    }
}

void HandlerRegistry::overwrite(int fd, IoHandler handler, uint32_t events) {
    try {
        loop_.replace_handler(fd, handler, events);
    } catch (const std::exception& e) {
        throw LedgerDivergence(fd, e.what());
    }
    if (!loop_.has_handler(fd)) {
        throw LedgerDivergence(fd, "binding missing after overwrite");
    }
    ledger_[fd] = Entry{std::move(handler), events, false};
}

bool HandlerRegistry::is_registered(int fd) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.count(fd) > 0;
}

bool HandlerRegistry::is_pending(int fd) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ledger_.find(fd);
    return it != ledger_.end() && it->second.pending;
}

size_t HandlerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.size();
}

size_t HandlerRegistry::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : ledger_) {
        if (entry.second.pending) {
            ++count;
        }
    }
    return count;
}

std::vector<int> HandlerRegistry::descriptors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> fds;
    fds.reserve(ledger_.size());
    for (const auto& entry : ledger_) {
        fds.push_back(entry.first);
    }
    return fds;
}

} // namespace wardend
