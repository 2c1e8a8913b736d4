/**
 * @file config.h
 * @brief Configuration management for ragd
 */

#pragma once

#include "ragd/common.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ragd {

/**
 * @brief Daemon and client configuration
 */
struct Config {
    // Socket configuration; empty path means resolve_socket_path()
    std::string socket_path;
    int socket_backlog = SOCKET_BACKLOG;
    int socket_timeout_ms = SOCKET_TIMEOUT_MS;

    // Rate limiting
    int max_requests_per_sec = MAX_REQUESTS_PER_SECOND;

    // Client
    int dial_timeout_ms = DIAL_TIMEOUT_MS;
    std::vector<int> retry_schedule_ms = {250, 500, 1000};

    // Jobs
    int job_queue_capacity = static_cast<int>(DEFAULT_JOB_QUEUE_CAPACITY);

    // Network
    bool offline = true;
    std::string ollama_url = DEFAULT_OLLAMA_URL;
    std::string ollama_model = DEFAULT_OLLAMA_MODEL;
    int http_timeout_ms = DEFAULT_HTTP_TIMEOUT_MS;

    // Storage
    std::string data_dir = DEFAULT_DATA_DIR;

    // Logging
    int log_level = 1;  // 0=DEBUG, 1=INFO, 2=WARN, 3=ERROR, 4=CRITICAL
    bool log_journald = false;

    /**
     * @brief Load configuration from YAML file
     *
     * A missing file yields the defaults. Unreadable or malformed YAML,
     * or values failing validate(), yield nullopt.
     */
    static std::optional<Config> load(const std::string& path);

    /**
     * @brief Parse configuration from YAML text
     */
    static std::optional<Config> parse(const std::string& yaml);

    /**
     * @brief Save configuration to YAML file
     */
    bool save(const std::string& path) const;

    static Config defaults();

    /**
     * @brief Expand ~ in all path fields
     */
    void expand_paths();

    /**
     * @brief Validate configuration
     * @return Empty string if valid, error message otherwise
     */
    std::string validate() const;

    /**
     * @brief Config path from RAGD_CONFIG, or the system default
     */
    static std::string default_path();
};

/**
 * @brief Configuration manager singleton
 *
 * Thread-safe configuration management with change notification support.
 */
class ConfigManager {
public:
    using ChangeCallback = std::function<void(const Config&)>;

    static ConfigManager& instance();

    /**
     * @brief Load configuration from file
     * @return true if loaded; on failure the previous configuration stays
     */
    bool load(const std::string& path);

    /**
     * @brief Reload configuration from previously loaded path
     */
    bool reload();

    /**
     * @brief Get current configuration (returns copy for thread safety)
     */
    Config get() const;

    void on_change(ChangeCallback callback);

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

private:
    ConfigManager() = default;

    Config config_;
    std::string config_path_;
    mutable std::mutex mutex_;
    std::vector<ChangeCallback> callbacks_;

    /**
     * @brief Invoke callbacks outside the lock so they may call get()
     */
    void notify_callbacks_unlocked(const std::vector<ChangeCallback>& callbacks,
                                   const Config& config);
};

} // namespace ragd
