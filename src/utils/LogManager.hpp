#pragma once

#include <cstddef>
#include <string>

#include <plog/Severity.h>

namespace utils
{

struct LogSettings
{
    int level = 4;                            // plog severity, 0 (none) .. 6 (verbose)
    bool debug = false;                       // forces verbose
    bool append = true;                       // false truncates the file first
    std::string file = "logs/run.log";
    std::size_t max_file_size = 10 * 1024 * 1024;
    int backups = 3;
    bool console = true;
};

/**
 * @brief Owns the appenders behind the default plog instance.
 *
 * plog keeps its logger for the life of the process, so the logger is bound
 * once to a switchboard appender and Initialize()/Shutdown() swap what sits
 * behind it. Reports queued by ErrorReporter before Initialize() are written
 * out when it succeeds.
 */
class LogManager
{
public:
    static bool Initialize(const LogSettings& settings);
    static void Shutdown();
    static bool IsInitialized();

    // Out-of-range levels are clamped.
    static plog::Severity ToSeverity(int level);

private:
    LogManager() = default;
};

} // namespace utils
