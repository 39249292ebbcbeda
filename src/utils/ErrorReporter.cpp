#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <ostream>
#include <sstream>
#include <utility>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_reports;

namespace
{
plog::Severity ToPlog(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return plog::info;
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
        return plog::error;
    case ErrorSeverity::Fatal:
        return plog::fatal;
    }
    return plog::error;
}
} // namespace

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                           const std::string& details)
{
    ErrorReport report;
    report.category = category;
    report.severity = severity;
    report.message = message;
    report.details = details;
    report.timestamp = GetTimestamp();

    PLOG(ToPlog(severity)) << "[" << CategoryToString(category) << "] " << message
                           << (details.empty() ? "" : " | ") << details;

    std::lock_guard<std::mutex> lock(s_mutex);
    s_reports.push_back(std::move(report));
    while (s_reports.size() > kMaxQueued)
        s_reports.pop_front();
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_reports.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> out(std::make_move_iterator(s_reports.begin()),
                                 std::make_move_iterator(s_reports.end()));
    s_reports.clear();
    return out;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_reports.empty() ? ErrorReport{} : s_reports.back();
}

std::size_t ErrorReporter::CountAtLeast(ErrorSeverity severity)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::size_t count = 0;
    for (const auto& report : s_reports)
    {
        if (report.severity >= severity)
            ++count;
    }
    return count;
}

std::size_t ErrorReporter::WriteSummary(std::ostream& out, ErrorSeverity min_severity)
{
    std::size_t written = 0;
    for (const auto& report : GetPendingErrors())
    {
        if (report.severity < min_severity)
            continue;
        out << "savescan: " << Format(report) << '\n';
        ++written;
    }
    return written;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_reports.clear();
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Snapshot:
        return "Snapshot";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Decoding:
        return "Decoding";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::Format(const ErrorReport& report)
{
    std::string line = std::string("[") + SeverityToString(report.severity) + "] " +
                       CategoryToString(report.category) + ": " + report.message;
    if (!report.details.empty())
        line += " (" + report.details + ")";
    return line;
}

std::string ErrorReporter::GetTimestamp()
{
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
