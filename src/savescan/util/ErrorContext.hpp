#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace savescan
{

enum class ErrorSeverityLevel
{
    Info,
    Warning,
    Error
};

struct ErrorInfo
{
    ErrorSeverityLevel level = ErrorSeverityLevel::Info;
    std::string message;
    std::string details;
};

using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * @brief Forwards engine conditions to a host-installed callback
 *
 * The library links no logging backend. A failed capture or an unlocatable
 * layout is pushed here; without a callback the report is dropped.
 * The callback may be replaced while other threads report; it runs
 * outside the lock.
 *
 *   engine.set_error_callback([](const ErrorInfo& err) {
 *       ErrorReporter::ReportWarning(ErrorCategory::Snapshot, err.message, err.details);
 *   });
 */
class ErrorContext
{
public:
    void SetCallback(ErrorCallback callback)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(callback);
    }

    bool HasCallback() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(sink_);
    }

    void ReportError(std::string message, std::string details = {})
    {
        Emit(ErrorSeverityLevel::Error, std::move(message), std::move(details));
    }

    void ReportWarning(std::string message, std::string details = {})
    {
        Emit(ErrorSeverityLevel::Warning, std::move(message), std::move(details));
    }

private:
    void Emit(ErrorSeverityLevel level, std::string message, std::string details)
    {
        ErrorCallback sink;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink = sink_;
        }
        if (sink)
            sink(ErrorInfo{ level, std::move(message), std::move(details) });
    }

    mutable std::mutex mutex_;
    ErrorCallback sink_;
};

} // namespace savescan
