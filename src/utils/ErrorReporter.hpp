#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, startup
    Configuration,  // TOML parsing, invalid settings
    Engine,         // engine setup, sanitizer installation
    Transport,      // engine process / event stream
    Translation,    // chunk errors, LLM replies
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning,
    Error
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message
    std::string technical_details; // Details for logs
    std::string timestamp;
    bool logged = false;           // false until a log sink has taken it
};

/**
 * @brief Thread-safe error reporter
 *
 * Keeps a bounded queue of reports that the application drains for its run
 * summary. Reports made before LogManager is up (config and log directory
 * problems) are held back and written by FlushUnlogged().
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Engine,
 *                                "Engine has no sanitizer injection point",
 *                                "process");
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                       const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    // Logs the queued reports no sink has seen yet; returns how many.
    static std::size_t FlushUnlogged();

    static bool HasPendingErrors();
    static std::vector<ErrorReport> GetPendingErrors();
    static void ClearErrors();

    static const char* CategoryName(ErrorCategory category);

private:
    static void Log(const ErrorReport& report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_queue;
    static constexpr std::size_t kMaxQueueSize = 100;
};

} // namespace utils
