#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

bool ConfigManager::addSection(ConfigSection section)
{
    const bool taken = std::any_of(sections_.begin(), sections_.end(),
                                   [&](const ConfigSection& s) { return s.name == section.name; });
    if (taken)
    {
        last_error_ = "section [" + section.name + "] is already registered";
        PLOG_ERROR << last_error_;
        return false;
    }
    sections_.push_back(std::move(section));
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::ifstream in(config_path_, std::ios::binary);
    if (!in)
    {
        document_ = toml::table{};
        return true;
    }

    try
    {
        document_ = toml::parse(in, config_path_);
    }
    catch (const toml::parse_error& err)
    {
        const auto line = err.source().begin.line;
        last_error_ = "config parse error: " + std::string(err.description());
        if (line > 0)
            last_error_ += " (line " + std::to_string(line) + ")";

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors, defaults stay in effect",
                                            last_error_ + "\nFile: " + config_path_);
        return false;
    }

    static const toml::table kEmpty;
    for (const auto& section : sections_)
    {
        const toml::node* node = document_.get(section.name);
        if (!node)
        {
            section.read(kEmpty);
        }
        else if (const auto* table = node->as_table())
        {
            section.read(*table);
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Ignoring [" + section.name + "]: it is not a table", config_path_);
            section.read(kEmpty);
        }
    }

    PLOG_INFO << "Loaded config from " << config_path_;
    return true;
}

bool ConfigManager::exists() const
{
    std::error_code ec;
    return fs::is_regular_file(config_path_, ec);
}

bool ConfigManager::save()
{
    last_error_.clear();

    toml::table doc = document_;
    for (const auto& section : sections_)
        doc.insert_or_assign(section.name, section.write());

    if (!writeFile(doc))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          last_error_);
        return false;
    }

    document_ = std::move(doc);
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

// Writes next to the target and renames, so readers never see half a file.
bool ConfigManager::writeFile(const toml::table& doc)
{
    const fs::path target(config_path_);
    std::error_code ec;
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
        if (ec)
        {
            last_error_ = "cannot create " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    const fs::path tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            last_error_ = "cannot open " + tmp.string() + " for writing";
            return false;
        }
        out << doc << '\n';
        if (!out.flush())
        {
            last_error_ = "write to " + tmp.string() + " failed";
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec)
    {
        last_error_ = "cannot replace " + config_path_ + ": " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}
