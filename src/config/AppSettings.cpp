#include "AppSettings.hpp"
#include "ConfigManager.hpp"

#include <plog/Log.h>

void AppSettings::applyDefaults()
{
    engine_ = EngineSettings{};
    openai_ = job::OpenAISettings{};
    qps_ = 4;
    min_text_length_ = 5;
    custom_system_prompt_.clear();
    debug_ = false;
    logging_level_ = 4;
    append_logs_ = true;
}

void AppSettings::registerSections(ConfigManager& config)
{
    config.addSection({ "engine", [this](const toml::table& t) { readEngine(t); },
                        [this] { return writeEngine(); } });
    config.addSection({ "translation", [this](const toml::table& t) { readTranslation(t); },
                        [this] { return writeTranslation(); } });
    config.addSection({ "app", [this](const toml::table& t) { readApp(t); }, [this] { return writeApp(); } });
    config.addSection({ "global", [this](const toml::table& t) { readGlobal(t); },
                        [this] { return writeGlobal(); } });
}

void AppSettings::applyTo(job::RunConfig& run) const
{
    run.vendor = engine_.vendor;
    run.openai = openai_;
    run.qps = qps_;
    run.min_text_length = min_text_length_;
    run.debug = debug_;
    if (!custom_system_prompt_.empty())
        run.custom_system_prompt = custom_system_prompt_;
    else
        run.custom_system_prompt.reset();
}

utils::LogSettings AppSettings::logSettings() const
{
    utils::LogSettings log;
    log.level = logging_level_;
    log.debug = debug_;
    log.append = append_logs_;
    return log;
}

void AppSettings::readEngine(const toml::table& t)
{
    if (auto v = t["vendor"].value<std::string>())
        engine_.vendor = *v;
    if (auto v = t["command"].value<std::string>())
        engine_.command = *v;
    if (auto v = t["clean_event_lines"].value<bool>())
        engine_.clean_event_lines = *v;
    if (auto* arr = t["args"].as_array())
    {
        engine_.args.clear();
        for (const auto& item : *arr)
        {
            if (auto s = item.value<std::string>())
                engine_.args.push_back(*s);
            else
                PLOG_WARNING << "Ignoring non-string entry in engine.args";
        }
    }

    if (auto* o = t["openai"].as_table())
    {
        if (auto v = (*o)["api_key"].value<std::string>())
            openai_.api_key = *v;
        if (auto v = (*o)["base_url"].value<std::string>())
            openai_.base_url = *v;
        if (auto v = (*o)["model"].value<std::string>())
            openai_.model = *v;
    }
}

toml::table AppSettings::writeEngine() const
{
    toml::array args;
    for (const auto& a : engine_.args)
        args.push_back(a);

    return toml::table{
        { "vendor", engine_.vendor },
        { "command", engine_.command },
        { "args", std::move(args) },
        { "clean_event_lines", engine_.clean_event_lines },
        { "openai",
          toml::table{
              { "api_key", openai_.api_key },
              { "base_url", openai_.base_url },
              { "model", openai_.model },
          } },
    };
}

void AppSettings::readTranslation(const toml::table& t)
{
    if (auto v = t["qps"].value<int>())
        qps_ = *v;
    if (auto v = t["min_text_length"].value<int>())
        min_text_length_ = *v;
    if (auto v = t["custom_system_prompt"].value<std::string>())
        custom_system_prompt_ = *v;
}

toml::table AppSettings::writeTranslation() const
{
    return toml::table{
        { "qps", qps_ },
        { "min_text_length", min_text_length_ },
        { "custom_system_prompt", custom_system_prompt_ },
    };
}

// [app.debug] holds the debug switch and the plog level (0 none .. 6 verbose).
void AppSettings::readApp(const toml::table& t)
{
    const auto* d = t["debug"].as_table();
    if (!d)
        return;
    if (auto v = (*d)["debug"].value<bool>())
        debug_ = *v;
    if (auto v = (*d)["logging_level"].value<int>())
        logging_level_ = *v;
}

toml::table AppSettings::writeApp() const
{
    return toml::table{ { "debug", toml::table{ { "debug", debug_ }, { "logging_level", logging_level_ } } } };
}

void AppSettings::readGlobal(const toml::table& t)
{
    if (auto v = t["append_logs"].value<bool>())
        append_logs_ = *v;
}

toml::table AppSettings::writeGlobal() const
{
    return toml::table{ { "append_logs", append_logs_ } };
}

bool AppSettings::writeExample(const std::string& path, std::string& error)
{
    ConfigManager config(path);
    AppSettings settings;
    settings.openai().api_key = "your-api-key-here";
    settings.registerSections(config);

    if (!config.save())
    {
        error = config.lastError();
        return false;
    }
    return true;
}
