/**
 * @file service.h
 * @brief Lifecycle interface for components owned by the Daemon
 */

#pragma once

#include <string>

namespace ragd {

/**
 * @brief A long-running component the Daemon starts, watches and stops
 *
 * Services start in descending priority and stop in reverse. While running,
 * the Daemon polls is_healthy() and publishes status_line() to systemd.
 */
class Service {
public:
    virtual ~Service() = default;

    /**
     * @return false if the service could not start; the Daemon then aborts
     */
    virtual bool start() = 0;

    /**
     * @brief Stop the service; must be safe to call when not running
     */
    virtual void stop() = 0;

    virtual const char* name() const = 0;

    virtual int priority() const { return 0; }

    virtual bool is_running() const = 0;

    virtual bool is_healthy() const { return is_running(); }

    /**
     * @brief Short human-readable state, e.g. "2 connections, 1 job"
     */
    virtual std::string status_line() const { return is_running() ? "running" : "stopped"; }
};

} // namespace ragd
