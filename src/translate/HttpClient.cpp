#include "HttpClient.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace translate
{

namespace
{

bool equalsIgnoreCase(const std::string& a, const std::string& b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y)
                      {
                          return std::tolower(static_cast<unsigned char>(x)) ==
                                 std::tolower(static_cast<unsigned char>(y));
                      });
}

void configure(cpr::Session& session, const std::string& url, const std::vector<HttpHeader>& headers,
               const HttpOptions& options, bool json_body)
{
    session.SetUrl(cpr::Url{ url });
    session.SetConnectTimeout(cpr::ConnectTimeout{ options.connect_timeout });
    session.SetTimeout(cpr::Timeout{ options.timeout });

    cpr::Header header;
    bool has_content_type = false;
    for (const auto& h : headers)
    {
        has_content_type = has_content_type || equalsIgnoreCase(h.name, "Content-Type");
        header[h.name] = h.value;
    }
    if (json_body && !has_content_type)
        header["Content-Type"] = "application/json";
    session.SetHeader(header);

    if (options.keep_running)
    {
        // Returning false from the progress callback aborts the transfer.
        session.SetProgressCallback(cpr::ProgressCallback(
            [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool
            { return reinterpret_cast<const std::atomic<bool>*>(userdata)->load(); },
            reinterpret_cast<intptr_t>(options.keep_running)));
    }
}

HttpReply toReply(cpr::Response response)
{
    HttpReply reply;
    if (response.error)
    {
        reply.transport_error = response.error.message.empty() ? "transfer failed" : response.error.message;
        return reply;
    }
    reply.status = response.status_code;
    reply.body = std::move(response.text);
    return reply;
}

} // namespace

bool HttpReply::transient() const
{
    if (!transport_error.empty() || status == 0)
        return true;
    return status == 408 || status == 429 || status >= 500;
}

std::string HttpReply::describe() const
{
    if (!transport_error.empty())
        return "network error: " + transport_error;

    std::string detail = body.substr(0, 200);
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_object())
    {
        auto err = json.find("error");
        if (err != json.end() && err->is_object())
        {
            auto msg = err->find("message");
            if (msg != err->end() && msg->is_string())
                detail = msg->get<std::string>();
        }
    }
    return "HTTP " + std::to_string(status) + ": " + detail;
}

HttpReply postJson(const std::string& url, const std::string& body, const std::vector<HttpHeader>& headers,
                   const HttpOptions& options)
{
    cpr::Session session;
    configure(session, url, headers, options, true);
    session.SetBody(cpr::Body{ body });
    return toReply(session.Post());
}

HttpReply fetch(const std::string& url, const std::vector<HttpHeader>& headers, const HttpOptions& options)
{
    cpr::Session session;
    configure(session, url, headers, options, false);
    return toReply(session.Get());
}

} // namespace translate
