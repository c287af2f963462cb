#pragma once

#include <functional>
#include <string>
#include <vector>

#include <toml++/toml.h>

// One top-level table of the config document and the code that owns it.
struct ConfigSection
{
    std::string name;
    std::function<void(const toml::table& table)> read;
    std::function<toml::table()> write;
};

/**
 * @brief Loads and saves the TOML config file section by section.
 *
 * Tables no section owns are kept as read and written back unchanged, so a
 * file shared with other tools survives a save.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config/config.toml");

    // False when a section with the same name is already registered.
    bool addSection(ConfigSection section);

    // A missing file is not an error; sections keep their defaults.
    bool load();
    bool save();
    bool exists() const;

    const toml::table& document() const { return document_; }
    const std::string& path() const { return config_path_; }
    const std::string& lastError() const { return last_error_; }

private:
    bool writeFile(const toml::table& doc);

    std::string config_path_;
    std::string last_error_;
    std::vector<ConfigSection> sections_;
    toml::table document_;
};
