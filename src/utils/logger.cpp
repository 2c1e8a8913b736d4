/**
 * @file logger.cpp
 * @brief Logger implementation (journald or stderr)
 */

#include "ragd/logger.h"
#include "ragd/common.h"
#include <systemd/sd-journal.h>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace ragd {

namespace {

// syslog(3) priorities; <syslog.h> is not included because its LOG_* macros
// collide with ours
constexpr int PRIORITY_CRIT = 2;
constexpr int PRIORITY_ERR = 3;
constexpr int PRIORITY_WARNING = 4;
constexpr int PRIORITY_INFO = 6;
constexpr int PRIORITY_DEBUG = 7;

}  // namespace

LogLevel Logger::min_level_ = LogLevel::INFO;
bool Logger::use_journald_ = false;
std::mutex Logger::mutex_;
bool Logger::initialized_ = false;

void Logger::init(LogLevel min_level, bool use_journald) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = min_level;
    use_journald_ = use_journald;
    initialized_ = true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_ && !use_journald_) {
        std::cerr.flush();
    }
    initialized_ = false;
    use_journald_ = false;
    min_level_ = LogLevel::INFO;
}

void Logger::debug(const std::string& component, const std::string& message) {
    write(LogLevel::DEBUG, component, "", message);
}

void Logger::info(const std::string& component, const std::string& message) {
    write(LogLevel::INFO, component, "", message);
}

void Logger::warn(const std::string& component, const std::string& message) {
    write(LogLevel::WARN, component, "", message);
}

void Logger::error(const std::string& component, const std::string& message) {
    write(LogLevel::ERROR, component, "", message);
}

void Logger::critical(const std::string& component, const std::string& message) {
    write(LogLevel::CRITICAL, component, "", message);
}

void Logger::traced(LogLevel level, const std::string& component,
                    const std::string& trace_id, const std::string& message) {
    write(level, component, trace_id, message);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::enabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

LogLevel Logger::level_from_int(int value) {
    if (value <= 0) return LogLevel::DEBUG;
    if (value >= 4) return LogLevel::CRITICAL;
    return static_cast<LogLevel>(value);
}

std::optional<LogLevel> Logger::level_from_name(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;
    return std::nullopt;
}

void Logger::write(LogLevel level, const std::string& component,
                   const std::string& trace_id, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    if (use_journald_) {
        write_journald(level, component, trace_id, message);
    } else {
        write_stderr(level, component, trace_id, message);
    }
}

void Logger::write_journald(LogLevel level, const std::string& component,
                            const std::string& trace_id, const std::string& message) {
    if (trace_id.empty()) {
        sd_journal_send("MESSAGE=%s", message.c_str(),
                        "PRIORITY=%d", journal_priority(level),
                        "SYSLOG_IDENTIFIER=%s", NAME,
                        "RAGD_COMPONENT=%s", component.c_str(),
                        NULL);
        return;
    }
    sd_journal_send("MESSAGE=%s", message.c_str(),
                    "PRIORITY=%d", journal_priority(level),
                    "SYSLOG_IDENTIFIER=%s", NAME,
                    "RAGD_COMPONENT=%s", component.c_str(),
                    "RAGD_TRACE_ID=%s", trace_id.c_str(),
                    NULL);
}

void Logger::write_stderr(LogLevel level, const std::string& component,
                          const std::string& trace_id, const std::string& message) {
    std::cerr << timestamp_iso() << " [" << level_name(level) << "] " << component;
    if (!trace_id.empty()) {
        std::cerr << " [" << trace_id << "]";
    }
    std::cerr << ": " << message << std::endl;
}

int Logger::journal_priority(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return PRIORITY_DEBUG;
        case LogLevel::INFO: return PRIORITY_INFO;
        case LogLevel::WARN: return PRIORITY_WARNING;
        case LogLevel::ERROR: return PRIORITY_ERR;
        case LogLevel::CRITICAL: return PRIORITY_CRIT;
        default: return PRIORITY_INFO;
    }
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

} // namespace ragd
