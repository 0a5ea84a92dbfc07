/**
 * @file service.h
 * @brief Base interface for daemon services
 */

#pragma once

namespace wardend {

/**
 * @brief A long-lived component started and stopped by the Daemon
 *
 * Services are started in descending priority order and stopped in reverse.
 */
class Service {
public:
    virtual ~Service() = default;
    
    /**
     * @brief Start the service
     * @return true if started
     */
    virtual bool start() = 0;
    
    /**
     * @brief Stop the service (must be safe to call twice)
     */
    virtual void stop() = 0;
    
    virtual const char* name() const = 0;
    
    virtual int priority() const { return 0; }
    
    virtual bool is_running() const = 0;
    
    virtual bool is_healthy() const { return is_running(); }
};

} // namespace wardend
