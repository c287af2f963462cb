#pragma once

#include "../processing/JsonSanitizer.hpp"

#include <memory>

namespace engine
{

class ITranslationEngine;

// Process-wide control-character sanitizer, created on first use.
std::shared_ptr<const processing::IJsonSanitizer> sharedSanitizer();

// Hands the shared sanitizer to the engine's injection point. Best-effort:
// an engine without an injection point, or one that throws, is reported as
// a warning and keeps its native behavior. Never throws.
bool installSanitizer(ITranslationEngine& engine) noexcept;

} // namespace engine
