#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace utils
{

namespace
{

std::string localTime(const char* format)
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm parts{};
#ifdef _WIN32
    localtime_s(&parts, &now);
#else
    localtime_r(&now, &parts);
#endif

    std::ostringstream out;
    out << std::put_time(&parts, format);
    return out.str();
}

plog::Severity toPlog(ErrorSeverity severity)
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
    default:
        return plog::error;
    }
}

} // namespace

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_queue;
std::size_t ErrorReporter::s_dropped = 0;

ErrorReport::ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details)
    : category(cat)
    , severity(sev)
    , user_message(std::move(user_msg))
    , technical_details(std::move(tech_details))
    , timestamp(ErrorReporter::GetTimestamp())
    , is_fatal(sev == ErrorSeverity::Fatal)
{
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                                const std::string& technical_details)
{
    PLOG(toPlog(severity)) << "[" << CategoryToString(category) << "] " << user_message
                           << (technical_details.empty() ? "" : " | ") << technical_details;

    ErrorReport report(category, severity, user_message, technical_details);

    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.push_back(std::move(report));
    while (s_queue.size() > MAX_QUEUE_SIZE)
    {
        s_queue.pop_front();
        ++s_dropped;
    }
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Fatal, user_message, technical_details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    ReportError(category, ErrorSeverity::Warning, user_message, technical_details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> drained(std::make_move_iterator(s_queue.begin()),
                                     std::make_move_iterator(s_queue.end()));
    s_queue.clear();
    s_dropped = 0;
    return drained;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_queue.empty() ? ErrorReport() : s_queue.back();
}

std::size_t ErrorReporter::DroppedCount()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_dropped;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
    s_dropped = 0;
}

ErrorSummary ErrorReporter::Summarize(const std::vector<ErrorReport>& reports)
{
    ErrorSummary summary;
    for (const auto& report : reports)
    {
        switch (report.severity)
        {
        case ErrorSeverity::Warning:
            ++summary.warnings;
            break;
        case ErrorSeverity::Error:
            ++summary.errors;
            break;
        case ErrorSeverity::Fatal:
            ++summary.fatal;
            break;
        default:
            break;
        }
    }
    return summary;
}

std::string ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Input:
        return "Input";
    case ErrorCategory::Matching:
        return "Matching";
    case ErrorCategory::Evaluation:
        return "Evaluation";
    case ErrorCategory::Export:
        return "Export";
    default:
        return "Unknown";
    }
}

std::string ErrorReporter::SeverityToString(ErrorSeverity severity)
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
    default:
        return "Unknown";
    }
}

std::string ErrorReporter::GetTimestamp() { return localTime("%Y-%m-%d %H:%M:%S"); }

std::string ErrorReporter::GetDate() { return localTime("%Y-%m-%d"); }

} // namespace utils
