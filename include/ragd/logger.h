/**
 * @file logger.h
 * @brief Process-wide logger writing to journald or stderr
 *
 * Every record carries a component name. Records tied to a request can
 * also carry its trace or correlation ID, which journald stores in the
 * RAGD_TRACE_ID field and stderr output prints in brackets.
 */

#pragma once

#include <mutex>
#include <optional>
#include <string>

namespace ragd {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    CRITICAL = 4
};

class Logger {
public:
    /**
     * @brief Initialize the logger
     * @param min_level Minimum level to output
     * @param use_journald Log to the systemd journal instead of stderr
     */
    static void init(LogLevel min_level = LogLevel::INFO, bool use_journald = true);

    static void shutdown();

    static void debug(const std::string& component, const std::string& message);
    static void info(const std::string& component, const std::string& message);
    static void warn(const std::string& component, const std::string& message);
    static void error(const std::string& component, const std::string& message);
    static void critical(const std::string& component, const std::string& message);

    /**
     * @brief Log a record tied to one request; an empty trace_id logs it plainly
     */
    static void traced(LogLevel level, const std::string& component,
                       const std::string& trace_id, const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

    /**
     * @brief Whether a message at this level would be emitted
     */
    static bool enabled(LogLevel level);

    /**
     * @brief Map a config integer (0-4) to a level, clamping out-of-range values
     */
    static LogLevel level_from_int(int value);

    /**
     * @brief Parse "debug", "info", "warn"/"warning", "error" or "critical", any case
     */
    static std::optional<LogLevel> level_from_name(const std::string& name);

private:
    static LogLevel min_level_;
    static bool use_journald_;
    static std::mutex mutex_;
    static bool initialized_;

    static void write(LogLevel level, const std::string& component,
                      const std::string& trace_id, const std::string& message);
    static void write_journald(LogLevel level, const std::string& component,
                               const std::string& trace_id, const std::string& message);
    static void write_stderr(LogLevel level, const std::string& component,
                             const std::string& trace_id, const std::string& message);

    static int journal_priority(LogLevel level);
    static const char* level_name(LogLevel level);
};

#define LOG_DEBUG(component, message) ragd::Logger::debug(component, message)
#define LOG_INFO(component, message) ragd::Logger::info(component, message)
#define LOG_WARN(component, message) ragd::Logger::warn(component, message)
#define LOG_ERROR(component, message) ragd::Logger::error(component, message)
#define LOG_CRITICAL(component, message) ragd::Logger::critical(component, message)
#define LOG_TRACED(level, component, trace_id, message) \
    ragd::Logger::traced(ragd::LogLevel::level, component, trace_id, message)

} // namespace ragd
