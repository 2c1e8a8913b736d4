/**
 * @file daemon.h
 * @brief Daemon lifecycle: services, signals and systemd notification
 */

#pragma once

#include "ragd/common.h"
#include "ragd/core/service.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace ragd {

/**
 * @brief Process-wide daemon singleton
 *
 * Services start in descending priority and stop in reverse. SIGTERM and
 * SIGINT request shutdown, SIGHUP requests a configuration reload and
 * SIGPIPE is ignored so that a vanished client never kills the process.
 */
class Daemon {
public:
    static Daemon& instance();

    /**
     * @brief Load configuration and set up logging
     * @return false if the configuration file exists but cannot be loaded
     */
    bool initialize(const std::string& config_path);

    /**
     * @brief Start services and block until shutdown is requested
     * @return Process exit code
     */
    int run();

    void register_service(std::unique_ptr<Service> service);

    template <typename T>
    T* get_service() {
        for (auto& service : services_) {
            if (auto* typed = dynamic_cast<T*>(service.get())) {
                return typed;
            }
        }
        return nullptr;
    }

    void request_shutdown();
    bool shutdown_requested() const { return shutdown_requested_.load(); }

    /**
     * @brief Reload the configuration file and apply the log level
     */
    bool reload_config();

    bool is_running() const { return running_.load(); }

    std::chrono::seconds uptime() const;

    const std::string& config_path() const { return config_path_; }

    /**
     * @brief Drop all services and clear flags
     */
    void reset();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

private:
    Daemon() = default;

    std::vector<std::unique_ptr<Service>> services_;
    std::string config_path_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> reload_requested_{false};
    SteadyTimePoint start_time_{};

    static void signal_handler(int sig);
    void setup_signals();
    bool start_services();
    void stop_services();
};

} // namespace ragd
