#include "RunOutcome.hpp"

namespace job
{

const char* toString(JobErrorCode code)
{
    switch (code)
    {
    case JobErrorCode::None:
        return "None";
    case JobErrorCode::InputNotFound:
        return "InputNotFound";
    case JobErrorCode::InvalidConfig:
        return "InvalidConfig";
    case JobErrorCode::TransportFailure:
        return "TransportFailure";
    case JobErrorCode::IncompleteRun:
        return "IncompleteRun";
    case JobErrorCode::Cancelled:
        return "Cancelled";
    case JobErrorCode::ResultSchemaMismatch:
        return "ResultSchemaMismatch";
    default:
        return "Unknown";
    }
}

} // namespace job
