#pragma once

#include <string>
#include <vector>
#include <mutex>

namespace trim::utils {

enum class ErrorCategory
{
    CommandLine,   // Unknown flags, bad arguments
    Configuration, // TOML parsing, invalid config
    Input,         // Reading a target or stdin
    Encoding,      // Content is not UTF-8 text
    Output         // Writing stdout or replacing a file
};

enum class ErrorSeverity
{
    Warning, // Degraded functionality, but continues
    Error,   // Target failed, run continues
    Fatal    // Run cannot continue
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Input;
    ErrorSeverity severity = ErrorSeverity::Error;
    std::string user_message;      // What the user sees, names the target
    std::string technical_details; // errno text, offsets and the like
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter
 *
 * Every failure in the run goes through here. Reports are logged with plog, which
 * puts them on stderr for the user, and are kept in a bounded queue so the
 * caller can inspect what went wrong after the fact.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Input, "notes.txt: target not found",
 *                              "No such file or directory");
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                              const std::string& user_message,
                              const std::string& technical_details = "");

    /**
     * @brief Get all pending errors and clear the queue
     */
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace trim::utils
