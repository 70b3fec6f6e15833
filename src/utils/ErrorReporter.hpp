#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization,   // logging, command line
    Configuration,    // TOML parsing, invalid thresholds
    Input,            // missing files, empty corpus or query set
    Matching,         // per-query scoring failures
    Evaluation,       // skipped algorithm/dataset pairs
    Export,           // CSV writes
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // a unit of work was skipped, the run continues
    Error,   // an operation failed, other units are unaffected
    Fatal    // the run cannot produce any result
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // What was skipped or failed
    std::string technical_details; // Index, algorithm, dataset, exception text
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

// Counts per severity over a batch of reports
struct ErrorSummary
{
    std::size_t warnings = 0;
    std::size_t errors = 0;
    std::size_t fatal = 0;

    std::size_t total() const { return warnings + errors + fatal; }
};

/**
 * @brief Process-wide collector for problems found during a run.
 *
 * Matching workers, the evaluator and the configuration layer report here
 * instead of aborting. Each report is logged through plog right away and
 * queued for the summary the command line prints at exit. The queue keeps
 * the newest MAX_QUEUE_SIZE reports; DroppedCount() tells how many older
 * ones were discarded since the last drain.
 *
 *   ErrorReporter::ReportWarning(ErrorCategory::Matching, "Query skipped",
 *                                "algorithm=dice index=17: bad input");
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    // Drains the queue, oldest report first
    static std::vector<ErrorReport> GetPendingErrors();

    // Default-constructed report when the queue is empty
    static ErrorReport GetLastError();

    static std::size_t DroppedCount();

    static void ClearErrors();

    static ErrorSummary Summarize(const std::vector<ErrorReport>& reports);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    // Local time, "YYYY-MM-DD HH:MM:SS"
    static std::string GetTimestamp();

    // Local date, "YYYY-MM-DD"; prefixes every exported file name
    static std::string GetDate();

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
    static std::size_t s_dropped;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
