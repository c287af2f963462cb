#include "LlmOutputParser.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <charconv>
#include <cstdint>
#include <limits>
#include <string_view>

namespace processing
{

namespace
{

constexpr std::size_t kNpos = std::string::npos;

bool idInRange(std::int64_t id)
{
    return id >= std::numeric_limits<int>::min() && id <= std::numeric_limits<int>::max();
}

bool appendItem(const nlohmann::json& node, std::vector<TranslatedFragment>& out)
{
    if (!node.is_object())
        return false;

    auto id_it = node.find("id");
    auto output_it = node.find("output");
    if (id_it == node.end() || output_it == node.end())
        return false;
    if (!id_it->is_number_integer() || !output_it->is_string())
        return false;

    if (id_it->is_number_unsigned())
    {
        if (id_it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            return false;
    }
    else if (!idInRange(id_it->get<std::int64_t>()))
    {
        return false;
    }

    TranslatedFragment item;
    item.id = id_it->get<int>();
    item.output = output_it->get<std::string>();
    out.push_back(std::move(item));
    return true;
}

std::string unescapeJsonString(const std::string& body)
{
    try
    {
        return nlohmann::json::parse("\"" + body + "\"").get<std::string>();
    }
    catch (const nlohmann::json::exception&)
    {
        return body;
    }
}

std::size_t skipSpace(const std::string& text, std::size_t pos)
{
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' || text[pos] == '\r'))
        ++pos;
    return pos;
}

// Consumes `token` at pos (after optional whitespace); kNpos if absent.
std::size_t expect(const std::string& text, std::size_t pos, std::string_view token)
{
    pos = skipSpace(text, pos);
    if (text.compare(pos, token.size(), token) != 0)
        return kNpos;
    return pos + token.size();
}

// pos is just past an opening quote. Returns the index of the closing quote.
std::size_t findStringEnd(const std::string& text, std::size_t pos)
{
    while (pos < text.size())
    {
        if (text[pos] == '\\')
            pos += 2;
        else if (text[pos] == '"')
            return pos;
        else
            ++pos;
    }
    return kNpos;
}

// Tries to read `"id": N, "output": "..."` where `pos` points just past "id".
// On success fills item and returns the position after the output string.
std::size_t scrapePair(const std::string& text, std::size_t pos, TranslatedFragment& item)
{
    pos = expect(text, pos, ":");
    if (pos == kNpos)
        return kNpos;
    pos = skipSpace(text, pos);

    const std::size_t digits_begin = pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
        ++pos;
    if (pos == digits_begin)
        return kNpos;

    std::int64_t id = 0;
    const auto [ptr, ec] = std::from_chars(text.data() + digits_begin, text.data() + pos, id);
    if (ec != std::errc() || ptr != text.data() + pos || !idInRange(id))
        return kNpos;

    pos = expect(text, pos, ",");
    if (pos != kNpos)
        pos = expect(text, pos, "\"output\"");
    if (pos != kNpos)
        pos = expect(text, pos, ":");
    if (pos != kNpos)
        pos = expect(text, pos, "\"");
    if (pos == kNpos)
        return kNpos;

    const std::size_t end = findStringEnd(text, pos);
    if (end == kNpos)
        return kNpos;

    item.id = static_cast<int>(id);
    item.output = unescapeJsonString(text.substr(pos, end - pos));
    return end + 1;
}

// Linear scan for id/output pairs in text that is not valid JSON.
void scrapeItems(const std::string& text, std::vector<TranslatedFragment>& out)
{
    static constexpr std::string_view kIdKey = "\"id\"";

    std::size_t pos = 0;
    while ((pos = text.find(kIdKey, pos)) != kNpos)
    {
        pos += kIdKey.size();
        TranslatedFragment item;
        const std::size_t next = scrapePair(text, pos, item);
        if (next == kNpos)
            continue;
        out.push_back(std::move(item));
        pos = next;
    }
}

} // namespace

ParsedBatch parseBatchOutput(const std::string& llm_output, const IJsonSanitizer& sanitizer)
{
    ParsedBatch batch;
    const std::string cleaned = sanitizer.clean(llm_output);

    try
    {
        const auto json = nlohmann::json::parse(cleaned);
        if (json.is_array())
        {
            for (const auto& node : json)
            {
                if (!appendItem(node, batch.items))
                    PLOG_DEBUG << "Skipping malformed batch item: " << node.dump();
            }
        }
        else if (!appendItem(json, batch.items))
        {
            batch.error = "reply is neither an item array nor a single item";
            return batch;
        }

        batch.ok = true;
        return batch;
    }
    catch (const nlohmann::json::parse_error& ex)
    {
        batch.error = std::string("parse error: ") + ex.what();
    }

    scrapeItems(cleaned, batch.items);

    batch.used_fallback = true;
    batch.ok = !batch.items.empty();
    PLOG_WARNING << "Strict JSON decode failed, fallback recovered " << batch.items.size() << " item(s): "
                 << batch.error;
    return batch;
}

} // namespace processing
