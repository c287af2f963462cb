#pragma once

#include "ResultData.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace job
{

enum class EventKind
{
    Empty,          // nil placeholder, skipped
    ProgressUpdate,
    ChunkError,     // non-fatal, the run continues
    Finish          // terminal
};

struct ProgressUpdate
{
    std::string stage;
    double stage_progress = 0.0;   // 0..100
    double overall_progress = 0.0; // 0..100
};

struct ChunkError
{
    std::string error_type;
    std::string message;
};

struct JobEvent
{
    EventKind kind = EventKind::Empty;
    ProgressUpdate progress;
    ChunkError error;

    // Finish payload: either the structured record or the raw mapping.
    std::optional<TranslateResult> result_record;
    nlohmann::json result_mapping;

    static JobEvent makeProgress(std::string stage, double stage_progress, double overall_progress)
    {
        JobEvent e;
        e.kind = EventKind::ProgressUpdate;
        e.progress = { std::move(stage), stage_progress, overall_progress };
        return e;
    }

    static JobEvent makeChunkError(std::string error_type, std::string message)
    {
        JobEvent e;
        e.kind = EventKind::ChunkError;
        e.error = { std::move(error_type), std::move(message) };
        return e;
    }

    static JobEvent makeFinish(TranslateResult record)
    {
        JobEvent e;
        e.kind = EventKind::Finish;
        e.result_record = std::move(record);
        return e;
    }

    static JobEvent makeFinish(nlohmann::json mapping)
    {
        JobEvent e;
        e.kind = EventKind::Finish;
        e.result_mapping = std::move(mapping);
        return e;
    }
};

} // namespace job
