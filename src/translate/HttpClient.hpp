#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace translate
{

struct HttpHeader
{
    std::string name;
    std::string value;
};

struct HttpOptions
{
    std::chrono::milliseconds connect_timeout{ 5000 };
    std::chrono::milliseconds timeout{ 60000 };
    // Polled during the transfer; the request aborts once it reads false.
    const std::atomic<bool>* keep_running = nullptr;
};

struct HttpReply
{
    long status = 0;
    std::string body;
    std::string transport_error; // set when no HTTP status came back

    bool ok() const { return transport_error.empty() && status >= 200 && status < 300; }

    // No answer, timeout, throttling or a server fault.
    bool transient() const;

    // "HTTP 401: <message from the error body>" or "network error: ...".
    std::string describe() const;
};

// POSTs a JSON body; adds Content-Type: application/json unless a header sets it.
HttpReply postJson(const std::string& url, const std::string& body, const std::vector<HttpHeader>& headers,
                   const HttpOptions& options);

HttpReply fetch(const std::string& url, const std::vector<HttpHeader>& headers, const HttpOptions& options);

} // namespace translate
