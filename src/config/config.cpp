/**
 * @file config.cpp
 * @brief YAML configuration loading and management
 */

#include "ragd/config.h"
#include "ragd/logger.h"
#include "ragd/net/offline_guard.h"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>

namespace ragd {

namespace {

template <typename T>
void read(const YAML::Node& node, const char* key, T& out) {
    if (node && node[key]) {
        out = node[key].as<T>();
    }
}

std::optional<Config> from_node(const YAML::Node& root) {
    Config config = Config::defaults();

    if (root && !root.IsNull() && !root.IsMap()) {
        LOG_ERROR("Config", "Configuration root must be a mapping");
        return std::nullopt;
    }

    auto socket = root["socket"];
    read(socket, "path", config.socket_path);
    read(socket, "backlog", config.socket_backlog);
    read(socket, "timeout_ms", config.socket_timeout_ms);

    read(root["rate_limit"], "max_requests_per_sec", config.max_requests_per_sec);

    auto client = root["client"];
    read(client, "dial_timeout_ms", config.dial_timeout_ms);
    read(client, "retry_schedule_ms", config.retry_schedule_ms);

    read(root["jobs"], "queue_capacity", config.job_queue_capacity);

    auto network = root["network"];
    read(network, "offline", config.offline);
    read(network, "ollama_url", config.ollama_url);
    read(network, "ollama_model", config.ollama_model);
    read(network, "http_timeout_ms", config.http_timeout_ms);

    if (root["data_dir"]) {
        config.data_dir = root["data_dir"].as<std::string>();
    }
    if (root["log_level"]) {
        // Either 0-4 or a level name such as "warn"
        auto level = Logger::level_from_name(root["log_level"].as<std::string>());
        config.log_level = level ? static_cast<int>(*level) : root["log_level"].as<int>();
    }
    if (root["log_journald"]) {
        config.log_journald = root["log_journald"].as<bool>();
    }

    config.expand_paths();

    std::string error = config.validate();
    if (!error.empty()) {
        LOG_ERROR("Config", "Invalid configuration: " + error);
        return std::nullopt;
    }
    return config;
}

}  // namespace

Config Config::defaults() {
    return Config{};
}

std::string Config::default_path() {
    const char* env = std::getenv(CONFIG_ENV_VAR);
    if (env && *env) {
        return expand_path(env);
    }
    return DEFAULT_CONFIG_PATH;
}

void Config::expand_paths() {
    socket_path = expand_path(socket_path);
    data_dir = expand_path(data_dir);
}

std::string Config::validate() const {
    if (socket_backlog <= 0) {
        return "socket.backlog must be positive";
    }
    if (socket_timeout_ms <= 0) {
        return "socket.timeout_ms must be positive";
    }
    if (max_requests_per_sec <= 0) {
        return "rate_limit.max_requests_per_sec must be positive";
    }
    if (dial_timeout_ms <= 0) {
        return "client.dial_timeout_ms must be positive";
    }
    if (job_queue_capacity <= 0) {
        return "jobs.queue_capacity must be positive";
    }
    if (http_timeout_ms <= 0) {
        return "network.http_timeout_ms must be positive";
    }
    if (log_level < 0 || log_level > 4) {
        return "log_level must be between 0 and 4";
    }
    if (data_dir.empty()) {
        return "data_dir must not be empty";
    }
    if (offline && !is_loopback_host(url_host(ollama_url))) {
        return "network.ollama_url must point at a loopback host while offline";
    }
    return "";
}

std::optional<Config> Config::parse(const std::string& yaml) {
    try {
        return from_node(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Config", "Failed to parse configuration: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::optional<Config> Config::load(const std::string& path) {
    std::string file = expand_path(path);
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        LOG_INFO("Config", "Config file not found: " + file + ", using defaults");
        Config config = defaults();
        config.expand_paths();
        return config;
    }

    try {
        return from_node(YAML::LoadFile(file));
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Config", "Failed to load " + file + ": " + e.what());
        return std::nullopt;
    }
}

bool Config::save(const std::string& path) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "socket" << YAML::Value << YAML::BeginMap
        << YAML::Key << "path" << YAML::Value << socket_path
        << YAML::Key << "backlog" << YAML::Value << socket_backlog
        << YAML::Key << "timeout_ms" << YAML::Value << socket_timeout_ms
        << YAML::EndMap;
    out << YAML::Key << "rate_limit" << YAML::Value << YAML::BeginMap
        << YAML::Key << "max_requests_per_sec" << YAML::Value << max_requests_per_sec
        << YAML::EndMap;
    out << YAML::Key << "client" << YAML::Value << YAML::BeginMap
        << YAML::Key << "dial_timeout_ms" << YAML::Value << dial_timeout_ms
        << YAML::Key << "retry_schedule_ms" << YAML::Value << YAML::Flow << retry_schedule_ms
        << YAML::EndMap;
    out << YAML::Key << "jobs" << YAML::Value << YAML::BeginMap
        << YAML::Key << "queue_capacity" << YAML::Value << job_queue_capacity
        << YAML::EndMap;
    out << YAML::Key << "network" << YAML::Value << YAML::BeginMap
        << YAML::Key << "offline" << YAML::Value << offline
        << YAML::Key << "ollama_url" << YAML::Value << ollama_url
        << YAML::Key << "ollama_model" << YAML::Value << ollama_model
        << YAML::Key << "http_timeout_ms" << YAML::Value << http_timeout_ms
        << YAML::EndMap;
    out << YAML::Key << "data_dir" << YAML::Value << data_dir;
    out << YAML::Key << "log_level" << YAML::Value << log_level;
    out << YAML::Key << "log_journald" << YAML::Value << log_journald;
    out << YAML::EndMap;

    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Config", "Failed to open config file for writing: " + path);
        return false;
    }
    file << out.c_str() << "\n";
    return file.good();
}

// ============================================================================
// ConfigManager
// ============================================================================

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance_;
    return instance_;
}

bool ConfigManager::load(const std::string& path) {
    auto loaded = Config::load(path);
    if (!loaded) {
        return false;
    }

    std::vector<ChangeCallback> callbacks;
    Config snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_ = *loaded;
        config_path_ = path;
        callbacks = callbacks_;
        snapshot = config_;
    }

    LOG_INFO("Config", "Configuration loaded from " + path);
    notify_callbacks_unlocked(callbacks, snapshot);
    return true;
}

bool ConfigManager::reload() {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        path = config_path_;
    }
    if (path.empty()) {
        LOG_WARN("Config", "No configuration file loaded yet");
        return false;
    }
    return load(path);
}

Config ConfigManager::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void ConfigManager::on_change(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

void ConfigManager::notify_callbacks_unlocked(const std::vector<ChangeCallback>& callbacks,
                                              const Config& config) {
    for (const auto& callback : callbacks) {
        try {
            callback(config);
        } catch (const std::exception& e) {
            LOG_ERROR("Config", "Config change callback failed: " + std::string(e.what()));
        }
    }
}

} // namespace ragd
