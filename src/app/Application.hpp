#pragma once

#include "CommandLine.hpp"

#include <memory>

class ConfigManager;
class AppSettings;

namespace job
{
struct RunConfig;
}

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool initializeLogging();
    bool initializeConfig();
    job::RunConfig buildRunConfig() const;

    int createConfig();
    int checkEngine();
    int runTranslation();
    void printErrorSummary() const;

    CliOptions options_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<AppSettings> settings_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
