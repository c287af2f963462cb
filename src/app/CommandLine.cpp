#include "CommandLine.hpp"

#include "../job/RunConfig.hpp"

#include <iostream>

namespace
{

bool parse_int_arg(const std::string& key, const std::string& value, int& out, std::string& error)
{
    try
    {
        std::size_t used = 0;
        out = std::stoi(value, &used);
        if (used != value.size())
        {
            error = "Invalid integer for " + key + ": " + value;
            return false;
        }
        return true;
    }
    catch (const std::exception&)
    {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

} // namespace

void print_usage(const char* program_name)
{
    std::cout
        << "Usage:\n"
        << "  " << program_name << " --input <pdf> [options]\n"
        << "  " << program_name << " --create-config [--config <toml>]\n"
        << "  " << program_name << " --check-engine [--config <toml>]\n\n"
        << "Options:\n"
        << "  -i, --input <pdf>           Source document\n"
        << "  -o, --output <dir>          Output directory (default: next to the input)\n"
        << "  -c, --config <toml>         Config file (default: config/config.toml)\n"
        << "  -li, --lang-in <lang>       Source language (default: en)\n"
        << "  -lo, --lang-out <lang>      Target language (default: zh)\n"
        << "  --no-dual                   Do not write the bilingual PDF\n"
        << "  --no-mono                   Do not write the translated-only PDF\n"
        << "  --watermark <mode>          watermarked, no_watermark or both (default: watermarked)\n"
        << "  --pages <sel>               Page selection, e.g. 1,3-5,8-\n"
        << "  --max-pages-per-part <n>    Translate in parts of n pages (default: 0, no split)\n"
        << "  --enhance-compatibility     Enable compatibility enhancements\n"
        << "  --create-config             Write an example config file and exit\n"
        << "  --check-engine              Test the translation service connection and exit\n"
        << "  -h, --help                  Show this help\n";
}

bool parse_args(int argc, char** argv, CliOptions& options, std::string& error)
{
    if (argc <= 1)
    {
        error = "No arguments provided";
        return false;
    }

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help")
        {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string
        {
            if (i + 1 >= argc)
            {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--input" || arg == "-i")
        {
            options.input_path = require_value(arg);
        }
        else if (arg == "--output" || arg == "-o")
        {
            options.output_dir = require_value(arg);
        }
        else if (arg == "--config" || arg == "-c")
        {
            options.config_path = require_value(arg);
        }
        else if (arg == "--lang-in" || arg == "-li")
        {
            options.lang_in = require_value(arg);
        }
        else if (arg == "--lang-out" || arg == "-lo")
        {
            options.lang_out = require_value(arg);
        }
        else if (arg == "--no-dual")
        {
            options.no_dual = true;
        }
        else if (arg == "--no-mono")
        {
            options.no_mono = true;
        }
        else if (arg == "--watermark")
        {
            options.watermark = require_value(arg);
        }
        else if (arg == "--pages")
        {
            options.pages = require_value(arg);
        }
        else if (arg == "--max-pages-per-part")
        {
            const std::string value = require_value(arg);
            if (!error.empty() || !parse_int_arg(arg, value, options.max_pages_per_part, error))
                return false;
        }
        else if (arg == "--enhance-compatibility")
        {
            options.enhance_compatibility = true;
        }
        else if (arg == "--create-config")
        {
            options.create_config = true;
        }
        else if (arg == "--check-engine")
        {
            options.check_engine = true;
        }
        else
        {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty())
            return false;
    }

    if (options.create_config || options.check_engine)
        return true;

    if (options.input_path.empty())
    {
        error = "--input is required";
        return false;
    }

    job::WatermarkMode mode = job::WatermarkMode::Watermarked;
    if (!job::parseWatermarkMode(options.watermark, mode))
    {
        error = "Unsupported --watermark: " + options.watermark + " (supported: watermarked, no_watermark, both)";
        return false;
    }

    if (options.max_pages_per_part < 0)
    {
        error = "--max-pages-per-part must not be negative";
        return false;
    }

    return true;
}
