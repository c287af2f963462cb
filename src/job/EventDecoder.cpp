#include "EventDecoder.hpp"

#include <plog/Log.h>

namespace job
{

namespace
{

std::string stringField(const nlohmann::json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return {};
    if (it->is_string())
        return it->get<std::string>();
    return it->dump();
}

double numberField(const nlohmann::json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number())
        return 0.0;
    return it->get<double>();
}

bool isBlank(const std::string& line)
{
    for (char c : line)
    {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
            return false;
    }
    return true;
}

} // namespace

bool decodeEventLine(const std::string& line, JobEvent& out, std::string& error)
{
    out = JobEvent{};
    if (isBlank(line))
        return true;

    nlohmann::json obj;
    try
    {
        obj = nlohmann::json::parse(line);
    }
    catch (const nlohmann::json::parse_error& ex)
    {
        error = std::string("undecodable event line: ") + ex.what();
        return false;
    }

    if (obj.is_null())
        return true;
    if (!obj.is_object())
    {
        error = std::string("event must be a JSON object, got ") + obj.type_name();
        return false;
    }

    const std::string type = stringField(obj, "type");
    if (type == "progress_update")
    {
        out = JobEvent::makeProgress(stringField(obj, "stage"), numberField(obj, "stage_progress"),
                                     numberField(obj, "overall_progress"));
    }
    else if (type == "error")
    {
        out = JobEvent::makeChunkError(stringField(obj, "error_type"), stringField(obj, "error"));
    }
    else if (type == "finish")
    {
        auto it = obj.find("translate_result");
        out = JobEvent::makeFinish(it != obj.end() ? *it : nlohmann::json());
    }
    else
    {
        PLOG_DEBUG << "Ignoring engine event of type '" << type << "'";
    }

    return true;
}

} // namespace job
