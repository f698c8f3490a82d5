// =================================================================
// src/Switchboard/Logger.cpp
// =================================================================
// Implementation for comprehensive logging system.

#include "Switchboard/Logger.hpp"
#include "Switchboard/Orchestrator.hpp"
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace Switchboard {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    m_log_dir = log_dir;
    m_max_log_size = max_log_size;
    m_max_log_files = max_log_files;
    m_current_log_size = 0;
    m_initialized = true;

    ensureLogDirectory();

    // Create initial log file
    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);

    info("Logger", "Logging system initialized", m_log_dir);
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logRoutingDecision(const RoutingDecision& decision) {
    std::ostringstream context;
    context << "Complexity: " << complexityToString(decision.analysis.complexity) << ", ";
    context << "Sentiment: " << decision.analysis.sentiment << ", ";
    context << "Recommended: " << decision.selection.recommended.size() << ", ";
    context << "Fallback: " << (decision.selection.fallback_used ? "yes" : "no") << ", ";
    context << "Escalate: " << (decision.escalation.escalate ? "yes" : "no");

    info("Router", "Routing decision computed", context.str());

    // Log the top of the ranking for debugging
    std::ostringstream ranking;
    for (size_t i = 0; i < std::min(size_t(5), decision.selection.ranked.size()); i++) {
        const auto& score = decision.selection.ranked[i];
        if (i > 0) ranking << ", ";
        ranking << score.agent_id << "=" << std::fixed << std::setprecision(1) << score.score;
        if (score.wouldTrigger()) {
            ranking << "*";
        }
    }
    if (decision.selection.ranked.size() > 5) {
        ranking << " and " << (decision.selection.ranked.size() - 5) << " more";
    }
    debug("Router", "Ranking: " + ranking.str());
}

void Logger::logAgentTransition(const std::string& session_id, const std::string& agent_id,
                                const std::string& status, double progress) {
    std::ostringstream context;
    context << "Session: " << session_id << ", ";
    context << "Progress: " << std::fixed << std::setprecision(0) << progress << "%";

    if (status == "ERROR") {
        warning("Agent", agent_id + " -> " + status, context.str());
    } else {
        debug("Agent", agent_id + " -> " + status, context.str());
    }
}

void Logger::logSessionStart(const std::string& session_id, const std::string& query_text,
                             size_t agent_count) {
    std::ostringstream context;
    context << "Session: " << session_id << ", ";
    context << "Agents: " << agent_count << ", ";
    context << "Query length: " << query_text.length() << " chars";

    info("Session", "Session started", context.str());
    debug("Session", "Query: " + query_text);
}

void Logger::logSessionEnd(const std::string& session_id, const std::string& final_state,
                           size_t failed_agents, long duration_ms) {
    std::ostringstream context;
    context << "Session: " << session_id << ", ";
    context << "State: " << final_state << ", ";
    context << "Failed agents: " << failed_agents << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (final_state == "COMPLETED" && failed_agents == 0) {
        info("Session", "Session completed successfully", context.str());
    } else if (final_state == "COMPLETED") {
        warning("Session", "Session completed with partial results", context.str());
    } else {
        error("Session", "Session failed", context.str());
    }
}

void Logger::flush() {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

LogLevel Logger::getLevelFromName(const std::string& name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), ::toupper);

    if (normalized == "DEBUG") return LogLevel::DEBUG;
    if (normalized == "WARN" || normalized == "WARNING") return LogLevel::WARNING;
    if (normalized == "ERROR") return LogLevel::ERROR;
    if (normalized == "CRIT" || normalized == "CRITICAL") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);

    if (!m_initialized) {
        // Initialize with defaults if not done yet
        initialize();
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    std::string formatted = formatEntry(entry, true);
    std::cerr << formatted << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1; // +1 for newline

    // Flush critical and error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m"; // Reset color
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;

    // Clean up old log files
    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                 [](const std::filesystem::path& a, const std::filesystem::path& b) {
                     return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                 });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }

    } catch (const std::exception& e) {
        // Log rotation failure shouldn't stop the program
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        // Fall back to current directory
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream filename;
    filename << m_log_dir << "/switchboard_";
    filename << std::put_time(&local_tm, "%Y%m%d_%H%M%S");
    filename << ".log";

    return filename.str();
}

} // namespace Switchboard
