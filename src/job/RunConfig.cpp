#include "RunConfig.hpp"
#include "PageSelection.hpp"

namespace job
{

const char* toString(WatermarkMode mode)
{
    switch (mode)
    {
    case WatermarkMode::Watermarked:
        return "watermarked";
    case WatermarkMode::NoWatermark:
        return "no_watermark";
    case WatermarkMode::Both:
        return "both";
    default:
        return "watermarked";
    }
}

bool parseWatermarkMode(const std::string& text, WatermarkMode& out)
{
    if (text == "watermarked")
        out = WatermarkMode::Watermarked;
    else if (text == "no_watermark")
        out = WatermarkMode::NoWatermark;
    else if (text == "both")
        out = WatermarkMode::Both;
    else
        return false;
    return true;
}

std::string RunConfig::validate() const
{
    if (input_path.empty())
        return "Missing input document";
    if (source_lang.empty() || target_lang.empty())
        return "Missing source or target language";

    if (vendor != kVendorOpenAI)
        return "Unsupported translation engine: " + (vendor.empty() ? std::string("<none>") : vendor);
    if (openai.api_key.empty())
        return "Missing API key";
    if (openai.base_url.empty())
        return "Missing base URL";
    if (openai.model.empty())
        return "Missing model";

    if (qps <= 0)
        return "qps must be positive, got " + std::to_string(qps);
    if (min_text_length < 0)
        return "min_text_length must not be negative";

    if (pdf.no_dual && pdf.no_mono)
        return "Both dual and mono output are disabled; nothing would be written";
    if (pdf.max_pages_per_part < 0)
        return "max_pages_per_part must not be negative";

    PageSelection pages;
    std::string page_error;
    if (!PageSelection::parse(pdf.pages, pages, page_error))
        return page_error;

    return {};
}

nlohmann::json RunConfig::toJson() const
{
    nlohmann::json basic;
    basic["input_files"] = nlohmann::json::array({ std::filesystem::absolute(input_path).string() });
    basic["debug"] = debug;

    nlohmann::json translation;
    translation["lang_in"] = source_lang;
    translation["lang_out"] = target_lang;
    translation["output"] = output_dir.string();
    translation["qps"] = qps;
    translation["min_text_length"] = min_text_length;
    translation["custom_system_prompt"] =
        custom_system_prompt ? nlohmann::json(*custom_system_prompt) : nlohmann::json(nullptr);

    nlohmann::json pdf_settings;
    pdf_settings["no_dual"] = pdf.no_dual;
    pdf_settings["no_mono"] = pdf.no_mono;
    pdf_settings["watermark_output_mode"] = toString(pdf.watermark_mode);
    pdf_settings["pages"] = pdf.pages.empty() ? nlohmann::json(nullptr) : nlohmann::json(pdf.pages);
    pdf_settings["max_pages_per_part"] =
        pdf.max_pages_per_part > 0 ? nlohmann::json(pdf.max_pages_per_part) : nlohmann::json(nullptr);
    pdf_settings["enhance_compatibility"] = pdf.enhance_compatibility;

    nlohmann::json engine;
    engine["translate_engine_type"] = "OpenAI";
    engine["openai_api_key"] = openai.api_key;
    engine["openai_base_url"] = openai.base_url;
    engine["openai_model"] = openai.model;

    return { { "basic", std::move(basic) },
             { "translation", std::move(translation) },
             { "pdf", std::move(pdf_settings) },
             { "translate_engine_settings", std::move(engine) } };
}

} // namespace job
