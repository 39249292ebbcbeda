#pragma once

#include <cstddef>
#include <deque>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization,   // logging, command line, engine setup
    Snapshot,         // reading or locating a save state
    Configuration,    // TOML parsing, invalid config
    Decoding,         // implausible or unreadable telemetry
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // extraction continues with less data
    Error,   // one operation failed
    Fatal    // the run is aborted
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string message;
    std::string details;
    std::string timestamp;
};

/**
 * @brief Process-wide record of problems met during one savescan run
 *
 * Every report is logged through plog when it arrives and kept in a
 * bounded queue. stdout carries only the JSON payload, so the command
 * line tool prints the queued reports to stderr before it exits.
 *
 *   ErrorReporter::ReportError(ErrorCategory::Snapshot, "Cannot read save state", provider.last_error());
 *   ...
 *   ErrorReporter::WriteSummary(std::cerr, ErrorSeverity::Warning);
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                       const std::string& details = "");

    static void ReportInfo(ErrorCategory category, const std::string& message, const std::string& details = "")
    {
        Report(category, ErrorSeverity::Info, message, details);
    }
    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "")
    {
        Report(category, ErrorSeverity::Warning, message, details);
    }
    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "")
    {
        Report(category, ErrorSeverity::Error, message, details);
    }
    static void ReportFatal(ErrorCategory category, const std::string& message, const std::string& details = "")
    {
        Report(category, ErrorSeverity::Fatal, message, details);
    }

    static bool HasPendingErrors();

    /// Queued reports, oldest first; the queue is left empty
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    static std::size_t CountAtLeast(ErrorSeverity severity);

    /**
     * @brief Print queued reports of at least min_severity, one per line
     * @return number of lines written
     */
    static std::size_t WriteSummary(std::ostream& out, ErrorSeverity min_severity);

    static void ClearErrors();

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);

    /// "[Severity] Category: message (details)"
    static std::string Format(const ErrorReport& report);

    /// Local time as "YYYY-MM-DD HH:MM:SS"
    static std::string GetTimestamp();

private:
    static constexpr std::size_t kMaxQueued = 100;

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_reports;
};

} // namespace utils
