// =================================================================
// include/Switchboard/Logger.hpp
// =================================================================
// Header for comprehensive logging and audit trails.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Switchboard {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

struct RoutingDecision;

/**
 * @brief Comprehensive logging system for debugging and audit trails
 *
 * Provides structured logging with multiple output targets, log levels,
 * and specialized logging for the routing pipeline and session lifecycle.
 * Safe to call from concurrent agent tasks.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Initialize logger with configuration
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".switchboard/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Log a debug message
     * @param component Component name, usually the class emitting it
     * @param message Log message
     * @param context Additional context such as a session or agent id
     */
    void debug(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log an info message
     * @param component Component name, usually the class emitting it
     * @param message Log message
     * @param context Additional context such as a session or agent id
     */
    void info(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log a warning message
     * @param component Component name, usually the class emitting it
     * @param message Log message
     * @param context Additional context such as a session or agent id
     */
    void warning(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log an error message
     * @param component Component name, usually the class emitting it
     * @param message Log message
     * @param context Additional context such as a session or agent id
     */
    void error(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log a critical message
     * @param component Component name, usually the class emitting it
     * @param message Log message
     * @param context Additional context such as a session or agent id
     */
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of query routing
     * @param decision Analysis, scores, selection and escalation for one query
     */
    void logRoutingDecision(const RoutingDecision& decision);

    /**
     * @brief Log a per-agent state transition
     * @param session_id Owning session
     * @param agent_id Agent whose state changed
     * @param status New status name
     * @param progress Progress after the transition
     */
    void logAgentTransition(const std::string& session_id, const std::string& agent_id,
                            const std::string& status, double progress);

    /**
     * @brief Log session start
     * @param session_id Session identifier
     * @param query_text Raw query text
     * @param agent_count Number of dispatched agents
     */
    void logSessionStart(const std::string& session_id, const std::string& query_text,
                         size_t agent_count);

    /**
     * @brief Log session end
     * @param session_id Session identifier
     * @param final_state Terminal session state name
     * @param failed_agents Number of agents that ended in ERROR
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& session_id, const std::string& final_state,
                       size_t failed_agents, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Get log level name as string
     * @param level Log level
     * @return String representation
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Parse a level name ("debug", "INFO", "warn", ...)
     * @param name Level name, case-insensitive
     * @return Parsed level, INFO if unrecognized
     */
    static LogLevel getLevelFromName(const std::string& name);

    /**
     * @brief Get log level color for console output
     * @param level Log level
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    std::recursive_mutex m_mutex;

    /**
     * @brief Log an entry to all configured outputs
     * @param entry Log entry to write
     */
    void logEntry(const LogEntry& entry);

    /**
     * @brief Write entry to console if its level passes the console filter
     * @param entry Log entry
     */
    void writeToConsole(const LogEntry& entry);

    /**
     * @brief Write entry to the current log file if initialized
     * @param entry Log entry
     */
    void writeToFile(const LogEntry& entry);

    /**
     * @brief Format log entry for output
     * @param entry Log entry
     * @param include_color Whether to include color codes
     * @return Formatted string
     */
    std::string formatEntry(const LogEntry& entry, bool include_color = false);

    /**
     * @brief Rotate log files if needed
     */
    void rotateLogsIfNeeded();

    /**
     * @brief Generate timestamp string
     * @param time_point Time to format
     * @return Local time with milliseconds
     */
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);

    /**
     * @brief Ensure log directory exists
     */
    void ensureLogDirectory();

    /**
     * @brief Get new log filename
     * @return Timestamped path under the log directory
     */
    std::string generateLogFilename();
};

// Convenience macros for logging
#define SWITCHBOARD_LOG_DEBUG(component, message) \
    Switchboard::Logger::getInstance().debug(component, message)

#define SWITCHBOARD_LOG_INFO(component, message) \
    Switchboard::Logger::getInstance().info(component, message)

#define SWITCHBOARD_LOG_WARNING(component, message) \
    Switchboard::Logger::getInstance().warning(component, message)

#define SWITCHBOARD_LOG_ERROR(component, message) \
    Switchboard::Logger::getInstance().error(component, message)

#define SWITCHBOARD_LOG_CRITICAL(component, message) \
    Switchboard::Logger::getInstance().critical(component, message)

} // namespace Switchboard
