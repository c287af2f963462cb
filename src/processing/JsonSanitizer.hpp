#pragma once

#include <string>
#include <string_view>

namespace processing
{

/// Repairs language-model output before a strict JSON parse.
///
/// Strips <json>...</json> and ```json ... ``` wrappers and removes the
/// control bytes 0x00-0x1F that a JSON decoder rejects, keeping tab, LF and
/// CR. Bytes >= 0x20 (including UTF-8 multi-byte sequences) are untouched.
/// Never throws.
std::string clean_json_output(std::string_view llm_output);

/// Sanitizer contract consumed by engines through their injection point.
class IJsonSanitizer
{
public:
    virtual ~IJsonSanitizer() = default;
    virtual std::string clean(const std::string& llm_output) const = 0;
};

/// Bound form of clean_json_output(); both produce identical bytes.
class ControlCharJsonSanitizer final : public IJsonSanitizer
{
public:
    std::string clean(const std::string& llm_output) const override;
};

} // namespace processing
