#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace job
{

constexpr const char* kVendorOpenAI = "openai";

enum class WatermarkMode
{
    Watermarked = 0,
    NoWatermark = 1,
    Both = 2
};

const char* toString(WatermarkMode mode);
bool parseWatermarkMode(const std::string& text, WatermarkMode& out);

struct OpenAISettings
{
    std::string api_key;
    std::string base_url = "https://api.openai.com/v1";
    std::string model = "gpt-4o-mini";
};

struct PdfOptions
{
    bool no_dual = false;
    bool no_mono = false;
    WatermarkMode watermark_mode = WatermarkMode::Watermarked;
    std::string pages;          // empty = whole document
    int max_pages_per_part = 0; // 0 = no batching
    bool enhance_compatibility = false;
};

// Settings for one run. Built by the caller, validated once, then only read.
struct RunConfig
{
    std::filesystem::path input_path;
    std::filesystem::path output_dir;
    std::string source_lang = "en";
    std::string target_lang = "zh";

    std::string vendor = kVendorOpenAI;
    OpenAISettings openai;

    int qps = 4;
    int min_text_length = 5;
    bool debug = false;
    std::optional<std::string> custom_system_prompt;

    PdfOptions pdf;

    // Empty when the config is usable, otherwise a human-readable reason.
    std::string validate() const;

    // Engine settings document written to the engine process.
    nlohmann::json toJson() const;
};

} // namespace job
