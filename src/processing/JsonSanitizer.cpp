#include "JsonSanitizer.hpp"

namespace processing
{

namespace
{

constexpr std::string_view kJsonOpenTag = "<json>";
constexpr std::string_view kJsonCloseTag = "</json>";
constexpr std::string_view kFenceJson = "```json";
constexpr std::string_view kFence = "```";

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && is_space(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))
        s.remove_suffix(1);
    return s;
}

bool is_disallowed_control(unsigned char c)
{
    return c < 0x20 && c != '\t' && c != '\n' && c != '\r';
}

} // namespace

std::string clean_json_output(std::string_view llm_output)
{
    std::string_view text = trim(llm_output);

    if (text.starts_with(kJsonOpenTag))
        text.remove_prefix(kJsonOpenTag.size());
    if (text.ends_with(kJsonCloseTag))
        text.remove_suffix(kJsonCloseTag.size());

    if (text.starts_with(kFenceJson))
        text.remove_prefix(kFenceJson.size());
    else if (text.starts_with(kFence))
        text.remove_prefix(kFence.size());
    if (text.ends_with(kFence))
        text.remove_suffix(kFence.size());

    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text)
    {
        if (!is_disallowed_control(static_cast<unsigned char>(c)))
            cleaned.push_back(c);
    }

    return std::string(trim(cleaned));
}

std::string ControlCharJsonSanitizer::clean(const std::string& llm_output) const
{
    return clean_json_output(llm_output);
}

} // namespace processing
