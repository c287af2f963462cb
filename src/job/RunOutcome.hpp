#pragma once

#include "ResultData.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace job
{

enum class JobErrorCode
{
    None = 0,
    InputNotFound,        // source document does not exist, nothing streamed
    InvalidConfig,        // config rejected before streaming
    TransportFailure,     // the event stream raised
    IncompleteRun,        // stream ended without Finish
    Cancelled,            // caller cancelled the run
    ResultSchemaMismatch  // Finish payload had an unexpected shape
};

const char* toString(JobErrorCode code);

struct RunOutcome
{
    JobErrorCode code = JobErrorCode::None;
    std::string message;             // human-readable
    std::string cause;               // underlying error text, if any
    std::optional<ResultData> result;
    std::size_t chunk_errors = 0;

    bool ok() const { return code == JobErrorCode::None && result.has_value(); }

    static RunOutcome success(ResultData data, std::size_t chunk_errors)
    {
        RunOutcome outcome;
        outcome.result = std::move(data);
        outcome.chunk_errors = chunk_errors;
        return outcome;
    }

    static RunOutcome failure(JobErrorCode code, std::string message, std::string cause = {})
    {
        RunOutcome outcome;
        outcome.code = code;
        outcome.message = std::move(message);
        outcome.cause = std::move(cause);
        return outcome;
    }
};

} // namespace job
