#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace job
{

// Structured result record as the engine library hands it over.
struct TranslateResult
{
    std::optional<std::string> original_pdf_path;
    std::optional<std::string> mono_pdf_path;
    std::optional<std::string> dual_pdf_path;
    std::optional<std::string> no_watermark_mono_pdf_path;
    std::optional<std::string> no_watermark_dual_pdf_path;
    std::optional<std::string> auto_extracted_glossary_path;
    double total_seconds = 0.0;
    double peak_memory_usage = 0.0;
};

/**
 * @brief Outcome record of a finished run.
 *
 * Every artifact path is optional: an artifact the run did not produce is
 * unset, never guessed. Built once from the Finish payload and not modified.
 */
class ResultData
{
public:
    ResultData() = default;
    explicit ResultData(const TranslateResult& record);

    const std::optional<std::string>& originalPdfPath() const { return original_pdf_path_; }
    const std::optional<std::string>& monoPdfPath() const { return mono_pdf_path_; }
    const std::optional<std::string>& dualPdfPath() const { return dual_pdf_path_; }
    const std::optional<std::string>& noWatermarkMonoPdfPath() const { return no_watermark_mono_pdf_path_; }
    const std::optional<std::string>& noWatermarkDualPdfPath() const { return no_watermark_dual_pdf_path_; }
    const std::optional<std::string>& glossaryPath() const { return auto_extracted_glossary_path_; }
    double totalSeconds() const { return total_seconds_; }
    double peakMemoryUsage() const { return peak_memory_usage_; }

    std::string describe() const;

private:
    friend bool decodeResult(const nlohmann::json&, ResultData&, std::string&);

    std::optional<std::string> original_pdf_path_;
    std::optional<std::string> mono_pdf_path_;
    std::optional<std::string> dual_pdf_path_;
    std::optional<std::string> no_watermark_mono_pdf_path_;
    std::optional<std::string> no_watermark_dual_pdf_path_;
    std::optional<std::string> auto_extracted_glossary_path_;
    double total_seconds_ = 0.0;
    double peak_memory_usage_ = 0.0;
};

// Decodes the loosely-typed Finish payload.
// Schema: a JSON object; *_path fields are string or null; total_seconds and
// peak_memory_usage are number or null. Absent fields default to unset/zero,
// unknown keys are ignored. A non-object payload or a known field of the
// wrong type fails with a description in `error`.
bool decodeResult(const nlohmann::json& payload, ResultData& out, std::string& error);

} // namespace job
