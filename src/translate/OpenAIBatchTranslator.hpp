#pragma once

#include "../processing/JsonSanitizer.hpp"
#include "../processing/LlmOutputParser.hpp"
#include "HttpClient.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace job
{
struct RunConfig;
}

namespace translate
{

struct BatchTranslatorConfig
{
    std::string api_key;
    std::string base_url = "https://api.openai.com/v1";
    std::string model = "gpt-4o-mini";
    int qps = 4;
    int min_text_length = 5;
    int max_retries = 2;
    std::string custom_system_prompt; // empty = built-in prompt

    static BatchTranslatorConfig fromRunConfig(const job::RunConfig& run);
};

struct SourceFragment
{
    int id = 0;
    std::string text;
};

struct BatchResult
{
    bool ok = false;
    bool used_fallback = false;
    // One entry per input fragment, in input order. Untranslated fragments
    // carry their source text.
    std::vector<processing::TranslatedFragment> items;
    std::vector<int> missing_ids;
    std::string error;
};

// Translates fragments in batches through an OpenAI-compatible
// chat-completions endpoint.
class OpenAIBatchTranslator
{
public:
    using PostFn = std::function<HttpReply(const std::string& url, const std::string& body,
                                           const std::vector<HttpHeader>& headers, const HttpOptions& options)>;
    using GetFn = std::function<HttpReply(const std::string& url, const std::vector<HttpHeader>& headers,
                                          const HttpOptions& options)>;

    OpenAIBatchTranslator();
    OpenAIBatchTranslator(PostFn post, GetFn get);

    bool init(const BatchTranslatorConfig& cfg);
    bool isReady() const;
    void shutdown();

    void setOutputSanitizer(std::shared_ptr<const processing::IJsonSanitizer> sanitizer);

    BatchResult translateBatch(const std::vector<SourceFragment>& fragments, const std::string& src_lang,
                               const std::string& dst_lang);

    // Returns a message starting with "Success", "Warning" or "Error".
    std::string testConnection();

    const char* lastError() const { return last_error_.c_str(); }

    static std::string chatCompletionsUrl(const std::string& base_url);
    static std::string modelsUrl(const std::string& base_url);
    static std::string languageDisplayName(const std::string& lang);

private:
    std::string validateConfig(const BatchTranslatorConfig& cfg) const;
    std::string buildSystemPrompt(const std::string& src_lang, const std::string& dst_lang) const;
    std::vector<HttpHeader> buildHeaders() const;
    void throttle();
    HttpReply send(const std::string& body);

    PostFn post_;
    GetFn get_;
    BatchTranslatorConfig cfg_{};
    std::shared_ptr<const processing::IJsonSanitizer> sanitizer_;
    std::atomic<bool> running_{ false };
    std::string last_error_;

    std::chrono::steady_clock::time_point last_request_{};
    std::mutex rate_mtx_;
};

} // namespace translate
