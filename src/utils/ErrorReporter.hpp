#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging setup, tool startup
    Configuration,  // TOML parsing, invalid poller profiles
    Polling,        // timeouts, failures surfaced by a poll
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning,
    Error,
    Fatal
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string message;
    std::string details;
    std::string timestamp;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string msg, std::string det);
};

/**
 * @brief Thread-safe sink for application-level failures
 *
 * Every report is written to plog and kept in a bounded queue so the caller
 * (e.g. a tool's main) can decide how to surface it.
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                            const std::string& details = "");

    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");

    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");

    static bool HasPendingErrors();

    /**
     * @brief Take all queued reports, oldest first
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
