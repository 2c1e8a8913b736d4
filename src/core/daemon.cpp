/**
 * @file daemon.cpp
 * @brief Daemon lifecycle implementation
 */

#include "ragd/core/daemon.h"
#include "ragd/config.h"
#include "ragd/logger.h"
#include <algorithm>
#include <csignal>
#include <thread>
#include <systemd/sd-daemon.h>

namespace ragd {

Daemon& Daemon::instance() {
    static Daemon instance_;
    return instance_;
}

void Daemon::signal_handler(int sig) {
    // Only lock-free atomics here; logging happens on the main loop
    if (sig == SIGTERM || sig == SIGINT) {
        instance().shutdown_requested_ = true;
    } else if (sig == SIGHUP) {
        instance().reload_requested_ = true;
    }
}

void Daemon::setup_signals() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    struct sigaction ignore;
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ignore.sa_flags = 0;
    sigaction(SIGPIPE, &ignore, nullptr);
}

bool Daemon::initialize(const std::string& config_path) {
    config_path_ = config_path.empty() ? Config::default_path() : config_path;

    auto& manager = ConfigManager::instance();
    if (!manager.load(config_path_)) {
        LOG_ERROR("Daemon", "Failed to load configuration from " + config_path_);
        return false;
    }

    auto config = manager.get();
    Logger::init(Logger::level_from_int(config.log_level), config.log_journald);
    manager.on_change([](const Config& updated) {
        Logger::set_level(Logger::level_from_int(updated.log_level));
    });

    LOG_INFO("Daemon", std::string(NAME) + " " + VERSION + " initialized");
    return true;
}

void Daemon::register_service(std::unique_ptr<Service> service) {
    LOG_DEBUG("Daemon", std::string("Registered service ") + service->name());
    services_.push_back(std::move(service));
}

bool Daemon::start_services() {
    std::stable_sort(services_.begin(), services_.end(),
                     [](const std::unique_ptr<Service>& a, const std::unique_ptr<Service>& b) {
                         return a->priority() > b->priority();
                     });

    for (auto& service : services_) {
        LOG_INFO("Daemon", std::string("Starting ") + service->name());
        if (!service->start()) {
            LOG_ERROR("Daemon", std::string("Failed to start ") + service->name());
            return false;
        }
    }
    return true;
}

void Daemon::stop_services() {
    for (auto it = services_.rbegin(); it != services_.rend(); ++it) {
        if ((*it)->is_running()) {
            LOG_INFO("Daemon", std::string("Stopping ") + (*it)->name());
            (*it)->stop();
        }
    }
}

int Daemon::run() {
    setup_signals();
    start_time_ = SteadyClock::now();

    if (!start_services()) {
        stop_services();
        return 1;
    }

    running_ = true;
    sd_notify(0, "READY=1\nSTATUS=Serving requests");
    LOG_INFO("Daemon", "Ready");

    const auto health_interval = std::chrono::seconds(5);
    auto next_health_check = SteadyClock::now() + health_interval;
    while (!shutdown_requested_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (reload_requested_.exchange(false)) {
            reload_config();
        }

        if (SteadyClock::now() < next_health_check) {
            continue;
        }
        next_health_check = SteadyClock::now() + health_interval;
        std::string status;
        for (const auto& service : services_) {
            if (!service->is_healthy()) {
                LOG_WARN("Daemon", std::string(service->name()) + " reports unhealthy");
            }
            status += (status.empty() ? "" : "; ") + std::string(service->name()) + ": " + service->status_line();
        }
        sd_notify(0, ("STATUS=" + status).c_str());
    }

    LOG_INFO("Daemon", "Shutting down gracefully");
    sd_notify(0, "STOPPING=1\nSTATUS=Shutting down");

    stop_services();
    running_ = false;

    LOG_INFO("Daemon", "Shutdown complete");
    return 0;
}

void Daemon::request_shutdown() {
    shutdown_requested_ = true;
}

bool Daemon::reload_config() {
    if (ConfigManager::instance().reload()) {
        LOG_INFO("Daemon", "Configuration reloaded");
        sd_notify(0, "STATUS=Configuration reloaded");
        return true;
    }
    LOG_ERROR("Daemon", "Configuration reload failed, keeping previous settings");
    return false;
}

std::chrono::seconds Daemon::uptime() const {
    if (!running_) {
        return std::chrono::seconds(0);
    }
    return std::chrono::duration_cast<std::chrono::seconds>(SteadyClock::now() - start_time_);
}

void Daemon::reset() {
    stop_services();
    services_.clear();
    running_ = false;
    shutdown_requested_ = false;
    reload_requested_ = false;
}

} // namespace ragd
