// =================================================================
// include/Arbiter/Logger.hpp
// =================================================================
// Header for engine logging and audit-friendly diagnostics.

#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Arbiter {

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

struct DecisionTrace;
struct FirewallReport;

/**
 * @brief Process-wide logger for the routing engine
 *
 * Writes structured lines to the console and to rotating log files.
 * Safe to call from concurrent request tasks.
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
    void initialize(const std::string& log_dir = ".arbiter/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable file logging
     */
    void setFileLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the outcome of a policy load or publish
     * @param app_id Application the policy belongs to
     * @param version Policy version identifier
     * @param rule_count Number of rules in the policy
     * @param accepted Whether the policy passed validation
     * @param detail Validation error text when rejected
     */
    void logPolicyLoad(const std::string& app_id, const std::string& version,
                       size_t rule_count, bool accepted, const std::string& detail = "");

    /**
     * @brief Log the routing summary of a completed request
     * @param trace Decision trace of the request
     */
    void logRoutingDecision(const DecisionTrace& trace);

    /**
     * @brief Log a single provider invocation attempt
     * @param audit_id Audit identifier of the request
     * @param model_id Model that was invoked
     * @param attempt Attempt number on this model (1-based)
     * @param success Whether the attempt succeeded
     * @param latency_ms Attempt latency in milliseconds
     * @param error_detail Error description for failed attempts
     */
    void logInvocationAttempt(const std::string& audit_id, const std::string& model_id,
                              size_t attempt, bool success, long latency_ms,
                              const std::string& error_detail = "");

    /**
     * @brief Log the firewall result; only masked samples are written
     * @param audit_id Audit identifier of the request
     * @param report Firewall report
     */
    void logFirewallOutcome(const std::string& audit_id, const FirewallReport& report);

    /**
     * @brief Log session start (CLI driver)
     */
    void logSessionStart(const std::string& command, const std::string& detail);

    /**
     * @brief Log session end (CLI driver)
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Get log level name as string
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Parse a level name ("debug", "info", ...); unknown names map to INFO
     */
    static LogLevel parseLevel(const std::string& name);

    /**
     * @brief Get log level color for console output
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = true;
    bool m_initialized = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;
    std::recursive_mutex m_mutex;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    Arbiter::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    Arbiter::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    Arbiter::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    Arbiter::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    Arbiter::Logger::getInstance().critical(component, message)

} // namespace Arbiter
