#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <vector>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/IAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace utils
{

namespace
{

class SwitchAppender : public plog::IAppender
{
public:
    void write(const plog::Record& record) override
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& target : targets_)
            target->write(record);
    }

    void replace(std::vector<std::unique_ptr<plog::IAppender>> targets)
    {
        std::lock_guard<std::mutex> lock(mtx_);
        targets_.swap(targets);
    }

private:
    std::mutex mtx_;
    std::vector<std::unique_ptr<plog::IAppender>> targets_;
};

SwitchAppender& switchboard()
{
    static SwitchAppender appender;
    return appender;
}

std::atomic<bool> g_initialized{ false };

} // namespace

plog::Severity LogManager::ToSeverity(int level)
{
    return static_cast<plog::Severity>(std::clamp(level, static_cast<int>(plog::none), static_cast<int>(plog::verbose)));
}

bool LogManager::Initialize(const LogSettings& settings)
{
    const std::filesystem::path file(settings.file);
    std::error_code ec;
    if (file.has_parent_path())
        std::filesystem::create_directories(file.parent_path(), ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to prepare log directory",
                                   file.parent_path().string() + ": " + ec.message());
        return false;
    }

    if (!settings.append)
    {
        std::ofstream truncate(settings.file, std::ios::trunc);
        if (!truncate)
        {
            ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to open log file", settings.file);
            return false;
        }
    }

    std::vector<std::unique_ptr<plog::IAppender>> targets;
    targets.push_back(std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
        settings.file.c_str(), settings.max_file_size, settings.backups));
    if (settings.console)
        targets.push_back(std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>());
    switchboard().replace(std::move(targets));

    const plog::Severity severity = settings.debug ? plog::verbose : ToSeverity(settings.level);
    // init() only applies the severity the first time it creates the logger.
    plog::init<0>(severity, &switchboard()).setMaxSeverity(severity);

    g_initialized.store(true);
    ErrorReporter::FlushUnlogged();
    return true;
}

void LogManager::Shutdown()
{
    if (auto* logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    switchboard().replace({});
    g_initialized.store(false);
}

bool LogManager::IsInitialized()
{
    return g_initialized.load();
}

} // namespace utils
