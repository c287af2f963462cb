#pragma once

#include "JsonSanitizer.hpp"

#include <string>
#include <vector>

namespace processing
{

struct TranslatedFragment
{
    int id = 0;
    std::string output;
};

struct ParsedBatch
{
    bool ok = false;
    bool used_fallback = false;
    std::vector<TranslatedFragment> items;
    std::string error;
};

// Decodes a batch reply of the form [{"id": N, "output": "..."}, ...].
// The text goes through the sanitizer first; when strict decoding still fails
// the id/output pairs are scraped with a linear scan and used_fallback is set.
ParsedBatch parseBatchOutput(const std::string& llm_output, const IJsonSanitizer& sanitizer);

} // namespace processing
