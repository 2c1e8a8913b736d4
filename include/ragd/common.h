/**
 * @file common.h
 * @brief Common types, constants, and utilities for ragd
 */

#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <nlohmann/json.hpp>

namespace ragd {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

// Version information
constexpr const char* VERSION = "1.0.0";
constexpr const char* NAME = "ragd";
constexpr const char* SERVER_ID = "rag-backend";
constexpr const char* DEFAULT_CLIENT_ID = "ipc-client";

// Wire protocol identification
constexpr const char* PROTOCOL_NAME = "rag-cli-ipc";
constexpr int PROTOCOL_VERSION = 1;

// Default paths
constexpr const char* DEFAULT_CONFIG_PATH = "/etc/ragd/ragd.yaml";
constexpr const char* DEFAULT_DATA_DIR = "~/.local/share/ragcli";
constexpr const char* SOCKET_ENV_VAR = "RAGCLI_SOCKET";
constexpr const char* CONFIG_ENV_VAR = "RAGD_CONFIG";
constexpr const char* SOCKET_SUBDIR = "ragcli";
constexpr const char* SOCKET_FILENAME = "backend.sock";

// Socket configuration
constexpr int SOCKET_BACKLOG = 16;
constexpr int SOCKET_TIMEOUT_MS = 5000;
constexpr int DIAL_TIMEOUT_MS = 2000;
constexpr size_t MAX_FRAME_SIZE = 16u << 20;  // 16 MiB

// Longest accepted length line, digits plus optional sign
constexpr size_t MAX_LENGTH_PREFIX_DIGITS = 20;

// Rate limiting
constexpr int MAX_REQUESTS_PER_SECOND = 100;

// Jobs
constexpr size_t DEFAULT_JOB_QUEUE_CAPACITY = 16;

// Query defaults
constexpr int DEFAULT_MAX_CONTEXT_TOKENS = 4096;

// Local services
constexpr const char* DEFAULT_OLLAMA_URL = "http://127.0.0.1:11434";
constexpr const char* DEFAULT_OLLAMA_MODEL = "llama3.1:8b";
constexpr int DEFAULT_HTTP_TIMEOUT_MS = 30000;

/**
 * @brief Expand ~ to home directory in paths
 */
inline std::string expand_path(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

/**
 * @brief Format a timestamp in ISO format (thread-safe)
 */
inline std::string to_iso(TimePoint tp) {
    auto time_t_now = Clock::to_time_t(tp);
    std::tm tm{};
    if (gmtime_r(&time_t_now, &tm) == nullptr) {
        return "";
    }
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

/**
 * @brief Get current timestamp in ISO format (thread-safe)
 */
inline std::string timestamp_iso() {
    return to_iso(Clock::now());
}

} // namespace ragd
