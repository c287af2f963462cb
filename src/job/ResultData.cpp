#include "ResultData.hpp"

#include <iomanip>
#include <sstream>

namespace job
{

namespace
{

bool readPath(const nlohmann::json& payload, const char* key, std::optional<std::string>& out, std::string& error)
{
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null())
        return true;
    if (!it->is_string())
    {
        error = std::string("field '") + key + "' must be a string, got " + it->type_name();
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool readNumber(const nlohmann::json& payload, const char* key, double& out, std::string& error)
{
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null())
        return true;
    if (!it->is_number())
    {
        error = std::string("field '") + key + "' must be a number, got " + it->type_name();
        return false;
    }
    out = it->get<double>();
    return true;
}

} // namespace

ResultData::ResultData(const TranslateResult& record)
    : original_pdf_path_(record.original_pdf_path)
    , mono_pdf_path_(record.mono_pdf_path)
    , dual_pdf_path_(record.dual_pdf_path)
    , no_watermark_mono_pdf_path_(record.no_watermark_mono_pdf_path)
    , no_watermark_dual_pdf_path_(record.no_watermark_dual_pdf_path)
    , auto_extracted_glossary_path_(record.auto_extracted_glossary_path)
    , total_seconds_(record.total_seconds)
    , peak_memory_usage_(record.peak_memory_usage)
{
}

std::string ResultData::describe() const
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (dual_pdf_path_)
        ss << "Dual PDF: " << *dual_pdf_path_ << '\n';
    if (mono_pdf_path_)
        ss << "Mono PDF: " << *mono_pdf_path_ << '\n';
    if (no_watermark_dual_pdf_path_)
        ss << "Dual PDF (no watermark): " << *no_watermark_dual_pdf_path_ << '\n';
    if (no_watermark_mono_pdf_path_)
        ss << "Mono PDF (no watermark): " << *no_watermark_mono_pdf_path_ << '\n';
    if (auto_extracted_glossary_path_)
        ss << "Glossary: " << *auto_extracted_glossary_path_ << '\n';
    ss << "Time: " << total_seconds_ << "s\n";
    ss << "Peak memory: " << peak_memory_usage_;
    return ss.str();
}

bool decodeResult(const nlohmann::json& payload, ResultData& out, std::string& error)
{
    if (!payload.is_object())
    {
        error = std::string("translate_result must be an object, got ") + payload.type_name();
        return false;
    }

    ResultData decoded;
    if (!readPath(payload, "original_pdf_path", decoded.original_pdf_path_, error) ||
        !readPath(payload, "mono_pdf_path", decoded.mono_pdf_path_, error) ||
        !readPath(payload, "dual_pdf_path", decoded.dual_pdf_path_, error) ||
        !readPath(payload, "no_watermark_mono_pdf_path", decoded.no_watermark_mono_pdf_path_, error) ||
        !readPath(payload, "no_watermark_dual_pdf_path", decoded.no_watermark_dual_pdf_path_, error) ||
        !readPath(payload, "auto_extracted_glossary_path", decoded.auto_extracted_glossary_path_, error) ||
        !readNumber(payload, "total_seconds", decoded.total_seconds_, error) ||
        !readNumber(payload, "peak_memory_usage", decoded.peak_memory_usage_, error))
    {
        return false;
    }

    out = std::move(decoded);
    return true;
}

} // namespace job
