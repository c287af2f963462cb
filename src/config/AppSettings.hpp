#pragma once

#include "../job/RunConfig.hpp"
#include "../utils/LogManager.hpp"

#include <string>
#include <vector>

#include <toml++/toml.h>

class ConfigManager;

struct EngineSettings
{
    std::string vendor = job::kVendorOpenAI;
    std::string command = "pdf2zh-stream";
    std::vector<std::string> args;
    bool clean_event_lines = false;
};

// Persistent settings backing the [engine], [translation], [app] and
// [global] tables.
class AppSettings
{
public:
    AppSettings() { applyDefaults(); }

    void applyDefaults();
    void registerSections(ConfigManager& config);

    // Copies persisted values into a run config; per-run fields are untouched.
    void applyTo(job::RunConfig& run) const;

    // Logging setup for the main logger; --debug on a run forces verbose.
    utils::LogSettings logSettings() const;

    EngineSettings& engine() { return engine_; }
    const EngineSettings& engine() const { return engine_; }
    job::OpenAISettings& openai() { return openai_; }
    const job::OpenAISettings& openai() const { return openai_; }

    int qps() const { return qps_; }
    void setQps(int qps) { qps_ = qps; }
    int minTextLength() const { return min_text_length_; }
    void setMinTextLength(int len) { min_text_length_ = len; }
    const std::string& customSystemPrompt() const { return custom_system_prompt_; }
    void setCustomSystemPrompt(std::string prompt) { custom_system_prompt_ = std::move(prompt); }

    bool debug() const { return debug_; }
    void setDebug(bool debug) { debug_ = debug; }
    int loggingLevel() const { return logging_level_; }
    void setLoggingLevel(int level) { logging_level_ = level; }
    bool appendLogs() const { return append_logs_; }
    void setAppendLogs(bool append) { append_logs_ = append; }

    // Writes a config file holding the defaults and a placeholder key.
    static bool writeExample(const std::string& path, std::string& error);

private:
    void readEngine(const toml::table& t);
    toml::table writeEngine() const;
    void readTranslation(const toml::table& t);
    toml::table writeTranslation() const;
    void readApp(const toml::table& t);
    toml::table writeApp() const;
    void readGlobal(const toml::table& t);
    toml::table writeGlobal() const;

    EngineSettings engine_;
    job::OpenAISettings openai_;
    int qps_ = 4;
    int min_text_length_ = 5;
    std::string custom_system_prompt_;
    bool debug_ = false;
    int logging_level_ = 4;
    bool append_logs_ = true;
};
