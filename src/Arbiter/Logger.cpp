// =================================================================
// src/Arbiter/Logger.cpp
// =================================================================
// Implementation of engine logging.

#include "Arbiter/Logger.hpp"
#include "Arbiter/DecisionTrace.hpp"
#include "Arbiter/OutputFirewall.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Arbiter {

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
    m_current_log_file.reset();

    if (m_file_enabled) {
        ensureLogDirectory();
        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
    }

    info("Logger", "Logging system initialized", m_file_enabled ? m_log_dir : "console only");
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

void Logger::setFileLogging(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_file_enabled = enabled;
    if (!enabled) {
        flush();
        m_current_log_file.reset();
    }
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

void Logger::logPolicyLoad(const std::string& app_id, const std::string& version,
                           size_t rule_count, bool accepted, const std::string& detail) {
    std::ostringstream context;
    context << "App: " << app_id << ", ";
    context << "Version: " << version << ", ";
    context << "Rules: " << rule_count;

    if (accepted) {
        info("PolicyStore", "Policy published", context.str());
    } else {
        error("PolicyStore", "Policy rejected: " + detail, context.str());
    }
}

void Logger::logRoutingDecision(const DecisionTrace& trace) {
    std::ostringstream context;
    context << "Audit: " << trace.audit_id << ", ";
    context << "App: " << trace.app_id << ", ";
    context << "Rule: " << (trace.rule_id.empty() ? "-" : trace.rule_id) << ", ";
    context << "Recommended: " << (trace.recommended_model.empty() ? "-" : trace.recommended_model) << ", ";
    context << "Final: " << (trace.final_model.empty() ? "-" : trace.final_model) << ", ";
    context << "Attempts: " << trace.attempts.size() << ", ";
    context << "Cost: " << std::fixed << std::setprecision(6) << trace.cost << ", ";
    context << "Duration: " << trace.total_latency.count() << "ms";

    switch (trace.status) {
        case RequestStatus::SUCCEEDED:
            info("RoutingEngine", trace.fell_back ? "Request served after fallback" : "Request served",
                 context.str());
            break;
        case RequestStatus::DENIED:
            warning("RoutingEngine", "Request denied: " + trace.reason, context.str());
            break;
        case RequestStatus::CLIENT_CANCELLED:
            warning("RoutingEngine", "Request cancelled by client", context.str());
            break;
        case RequestStatus::FAILED:
            error("RoutingEngine", "Request failed: " + trace.reason, context.str());
            break;
    }

    if (trace.total_latency.count() > 30000) {
        warning("RoutingEngine", "Slow request detected", "Duration: " + std::to_string(trace.total_latency.count()) + "ms");
    }
}

void Logger::logInvocationAttempt(const std::string& audit_id, const std::string& model_id,
                                  size_t attempt, bool success, long latency_ms,
                                  const std::string& error_detail) {
    std::ostringstream context;
    context << "Audit: " << audit_id << ", ";
    context << "Attempt: " << attempt << ", ";
    context << "Latency: " << latency_ms << "ms";

    if (success) {
        debug("Invocation", "Model " + model_id + " succeeded", context.str());
    } else {
        warning("Invocation", "Model " + model_id + " failed: " + error_detail, context.str());
    }
}

void Logger::logFirewallOutcome(const std::string& audit_id, const FirewallReport& report) {
    std::ostringstream context;
    context << "Audit: " << audit_id << ", ";
    context << "Action: " << firewallActionToString(report.action) << ", ";
    context << "Violations: " << report.violations.size();
    if (!report.sanitizing_model.empty()) {
        context << ", Sanitizer: " << report.sanitizing_model;
    }

    LogLevel level = report.state == FirewallState::CLEAN ? LogLevel::DEBUG : LogLevel::INFO;
    if (report.degraded) {
        level = LogLevel::WARNING;
    }
    logEntry(LogEntry(level, "OutputFirewall", "Output " + firewallStateToString(report.state), context.str()));

    // Only masked samples ever reach the log
    for (const auto& violation : report.violations) {
        debug("OutputFirewall", violation.detector + " at offset " + std::to_string(violation.offset),
              violation.masked_sample);
    }
}

void Logger::logSessionStart(const std::string& command, const std::string& detail) {
    std::ostringstream context;
    context << "Command: " << command;
    if (!detail.empty()) {
        context << ", " << detail;
    }
    info("Session", "Session started", context.str());
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
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

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical" || lower == "crit") return LogLevel::CRITICAL;
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
        initialize();
    }

    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    // stdout is reserved for command output
    std::cerr << formatEntry(entry, true) << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_file_enabled || !m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1;

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
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": " << entry.message;

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
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

void Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream filename;
    filename << m_log_dir << "/arbiter_";
    filename << std::put_time(&local, "%Y%m%d_%H%M%S");
    filename << ".log";
    return filename.str();
}

} // namespace Arbiter
