#pragma once

#include "JobEvent.hpp"

#include <string>

namespace job
{

// Decodes one line of the engine's JSON-lines event output.
// Blank lines, `null` and unknown event types decode to EventKind::Empty.
// Returns false (with `error` set) when the line is not a JSON object.
bool decodeEventLine(const std::string& line, JobEvent& out, std::string& error);

} // namespace job
