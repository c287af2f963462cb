#pragma once

#include <filesystem>
#include <string>

struct CliOptions
{
    std::filesystem::path input_path;
    std::filesystem::path output_dir;
    std::string config_path = "config/config.toml";
    std::string lang_in = "en";
    std::string lang_out = "zh";
    bool no_dual = false;
    bool no_mono = false;
    std::string watermark = "watermarked";
    std::string pages;
    int max_pages_per_part = 0;
    bool enhance_compatibility = false;
    bool create_config = false;
    bool check_engine = false;
};

void print_usage(const char* program_name);

// On failure `error` holds the reason; "help" means -h/--help was given.
bool parse_args(int argc, char** argv, CliOptions& options, std::string& error);
