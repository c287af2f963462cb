#include "ErrorReporter.hpp"
#include "LogManager.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_queue;

namespace
{

std::string localTimestamp()
{
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);

    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                           const std::string& technical_details)
{
    ErrorReport report;
    report.category = category;
    report.severity = severity;
    report.user_message = user_message;
    report.technical_details = technical_details;
    report.timestamp = localTimestamp();
    report.logged = LogManager::IsInitialized();

    if (report.logged)
        Log(report);

    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.push_back(std::move(report));
    if (s_queue.size() > kMaxQueueSize)
        s_queue.erase(s_queue.begin());
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    Report(category, ErrorSeverity::Error, user_message, technical_details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    Report(category, ErrorSeverity::Warning, user_message, technical_details);
}

std::size_t ErrorReporter::FlushUnlogged()
{
    std::vector<ErrorReport> backlog;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        for (auto& report : s_queue)
        {
            if (!report.logged)
            {
                backlog.push_back(report);
                report.logged = true;
            }
        }
    }

    for (const auto& report : backlog)
        Log(report);
    return backlog.size();
}

void ErrorReporter::Log(const ErrorReport& report)
{
    std::string line = "[" + std::string(CategoryName(report.category)) + "] " + report.user_message;
    if (!report.technical_details.empty())
        line += " | " + report.technical_details;
    if (!report.logged)
        line += " (reported " + report.timestamp + ")";

    switch (report.severity)
    {
    case ErrorSeverity::Info:
        PLOG_INFO << line;
        break;
    case ErrorSeverity::Warning:
        PLOG_WARNING << line;
        break;
    case ErrorSeverity::Error:
        PLOG_ERROR << line;
        break;
    }
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> reports;
    reports.swap(s_queue);
    return reports;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
}

const char* ErrorReporter::CategoryName(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Engine:
        return "Engine";
    case ErrorCategory::Transport:
        return "Transport";
    case ErrorCategory::Translation:
        return "Translation";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

} // namespace utils
