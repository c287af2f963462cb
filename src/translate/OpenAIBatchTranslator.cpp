#include "OpenAIBatchTranslator.hpp"

#include "../job/RunConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <thread>
#include <unordered_map>

namespace translate
{

namespace
{

constexpr const char* kDefaultSystemPrompt =
    R"(You are a professional translator working on text extracted from a PDF document.
Translate every item from {source_lang} into {target_lang}.
The user message is a JSON array of objects {"id": <number>, "input": <text>}.
Reply with a JSON array of objects {"id": <number>, "output": <translation>} holding one entry per input id.

Guidelines:
- Keep formulas, placeholders, URLs and code unchanged.
- Stay faithful to the source; add nothing and omit nothing.
- Output the JSON array only, without explanations or markdown.)";

void replaceAll(std::string& target, const std::string& placeholder, const std::string& value)
{
    if (placeholder.empty())
        return;
    size_t pos = 0;
    while ((pos = target.find(placeholder, pos)) != std::string::npos)
    {
        target.replace(pos, placeholder.length(), value);
        pos += value.length();
    }
}

std::string trimTrailingSlashes(std::string url)
{
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    return url;
}

bool extractReplyContent(const std::string& body, std::string& content, std::string& error)
{
    try
    {
        auto json = nlohmann::json::parse(body);
        if (!json.contains("choices") || !json["choices"].is_array() || json["choices"].empty())
        {
            error = "missing choices in response";
            return false;
        }

        const auto& choice = json["choices"].at(0);
        if (!choice.contains("message") || !choice["message"].contains("content") ||
            !choice["message"]["content"].is_string())
        {
            error = "missing message content";
            return false;
        }

        content = choice["message"]["content"].get<std::string>();
        return true;
    }
    catch (const std::exception& ex)
    {
        error = std::string("parse error: ") + ex.what();
        return false;
    }
}

} // namespace

BatchTranslatorConfig BatchTranslatorConfig::fromRunConfig(const job::RunConfig& run)
{
    BatchTranslatorConfig cfg;
    cfg.api_key = run.openai.api_key;
    cfg.base_url = run.openai.base_url;
    cfg.model = run.openai.model;
    cfg.qps = run.qps;
    cfg.min_text_length = run.min_text_length;
    cfg.custom_system_prompt = run.custom_system_prompt.value_or(std::string());
    return cfg;
}

OpenAIBatchTranslator::OpenAIBatchTranslator()
    : OpenAIBatchTranslator(&translate::postJson, &translate::fetch)
{
}

OpenAIBatchTranslator::OpenAIBatchTranslator(PostFn post, GetFn get)
    : post_(std::move(post))
    , get_(std::move(get))
    , sanitizer_(std::make_shared<processing::ControlCharJsonSanitizer>())
{
}

bool OpenAIBatchTranslator::init(const BatchTranslatorConfig& cfg)
{
    shutdown();
    cfg_ = cfg;
    last_error_.clear();

    const auto validation_error = validateConfig(cfg_);
    if (!validation_error.empty())
    {
        last_error_ = validation_error;
        return false;
    }

    const auto interval = std::chrono::duration<double>(1.0 / cfg_.qps);
    last_request_ = std::chrono::steady_clock::now() -
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(interval);

    running_.store(true, std::memory_order_relaxed);
    return true;
}

bool OpenAIBatchTranslator::isReady() const
{
    return running_.load(std::memory_order_relaxed);
}

void OpenAIBatchTranslator::shutdown()
{
    running_.store(false, std::memory_order_relaxed);
}

void OpenAIBatchTranslator::setOutputSanitizer(std::shared_ptr<const processing::IJsonSanitizer> sanitizer)
{
    if (sanitizer)
        sanitizer_ = std::move(sanitizer);
}

std::string OpenAIBatchTranslator::validateConfig(const BatchTranslatorConfig& cfg) const
{
    if (cfg.api_key.empty())
        return "Missing API key";
    if (cfg.base_url.empty())
        return "Missing base URL";
    if (cfg.model.empty())
        return "Missing model";
    if (cfg.qps <= 0)
        return "qps must be positive";
    if (cfg.min_text_length < 0)
        return "min_text_length must not be negative";
    return {};
}

BatchResult OpenAIBatchTranslator::translateBatch(const std::vector<SourceFragment>& fragments,
                                                  const std::string& src_lang, const std::string& dst_lang)
{
    BatchResult result;
    result.items.reserve(fragments.size());

    std::vector<std::size_t> pending;
    nlohmann::json inputs = nlohmann::json::array();
    for (std::size_t i = 0; i < fragments.size(); ++i)
    {
        const auto& fragment = fragments[i];
        result.items.push_back({ fragment.id, fragment.text });
        if (fragment.text.size() < static_cast<std::size_t>(cfg_.min_text_length))
            continue;
        pending.push_back(i);
        inputs.push_back({ { "id", fragment.id }, { "input", fragment.text } });
    }

    auto failPending = [&](const std::string& error)
    {
        result.ok = false;
        result.error = error;
        for (std::size_t idx : pending)
            result.missing_ids.push_back(fragments[idx].id);
        last_error_ = error;
    };

    if (!isReady())
    {
        failPending("translator not ready");
        return result;
    }

    if (pending.empty())
    {
        result.ok = true;
        return result;
    }

    nlohmann::json body = nlohmann::json::object();
    body["model"] = cfg_.model;
    body["messages"] = nlohmann::json::array({
        { { "role", "system" }, { "content", buildSystemPrompt(src_lang, dst_lang) } },
        { { "role", "user" }, { "content", inputs.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) } },
    });
    body["temperature"] = 0.3;

    const std::string payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    PLOG_DEBUG << "final post body: " << payload;

    const auto response = send(payload);
    if (!response.ok())
    {
        failPending(response.describe());
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Translation, "OpenAI request failed",
                                            result.error);
        return result;
    }

    std::string content;
    std::string error;
    if (!extractReplyContent(response.body, content, error))
    {
        failPending(error);
        PLOG_WARNING << "OpenAI response parse failed: " << error;
        return result;
    }

    const auto parsed = processing::parseBatchOutput(content, *sanitizer_);
    if (!parsed.ok)
    {
        failPending(parsed.error.empty() ? std::string("reply holds no translations") : parsed.error);
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Translation, "Unusable translation reply",
                                            result.error);
        return result;
    }

    std::unordered_map<int, std::string> outputs;
    for (const auto& item : parsed.items)
        outputs.emplace(item.id, item.output);

    for (std::size_t idx : pending)
    {
        auto it = outputs.find(fragments[idx].id);
        if (it == outputs.end())
        {
            result.missing_ids.push_back(fragments[idx].id);
            continue;
        }
        result.items[idx].output = it->second;
    }

    result.ok = true;
    result.used_fallback = parsed.used_fallback;
    if (!result.missing_ids.empty())
    {
        PLOG_WARNING << "Translation reply is missing " << result.missing_ids.size() << " of " << pending.size()
                     << " fragment(s); keeping source text";
    }
    return result;
}

std::string OpenAIBatchTranslator::testConnection()
{
    if (cfg_.api_key.empty())
        return "Config Error: Missing API key";
    if (cfg_.base_url.empty())
        return "Config Error: Missing base URL";
    if (cfg_.model.empty())
        return "Config Error: Missing model";

    HttpOptions options;
    options.connect_timeout = std::chrono::milliseconds(3000);
    options.timeout = std::chrono::milliseconds(8000);
    options.keep_running = &running_;

    const auto resp = get_(modelsUrl(cfg_.base_url), buildHeaders(), options);
    if (!resp.transport_error.empty())
        return "Error: Cannot connect to base URL - " + resp.transport_error;
    if (!resp.ok())
        return "Error: Base URL returned HTTP " + std::to_string(resp.status);

    if (resp.body.find('"' + cfg_.model + '"') == std::string::npos)
        return "Warning: Model '" + cfg_.model + "' not found in available models list";

    const auto sample = translateBatch({ { 0, "Hello, world" } }, "en", "zh");
    if (!sample.ok)
        return "Error: Test translation failed - " + sample.error;
    if (!sample.missing_ids.empty())
        return "Error: Test translation failed - model reply did not follow the batch format";

    return "Success: Connection test passed, model responded correctly";
}

std::string OpenAIBatchTranslator::chatCompletionsUrl(const std::string& base_url)
{
    std::string url = trimTrailingSlashes(base_url);
    const std::string suffix = "/chat/completions";
    if (url.size() >= suffix.size() && url.compare(url.size() - suffix.size(), suffix.size(), suffix) == 0)
        return url;
    return url + suffix;
}

std::string OpenAIBatchTranslator::modelsUrl(const std::string& base_url)
{
    return trimTrailingSlashes(base_url) + "/models";
}

std::string OpenAIBatchTranslator::languageDisplayName(const std::string& lang)
{
    std::string lower;
    lower.reserve(lang.size());
    for (char c : lang)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower == "en" || lower == "en-us" || lower == "en_us")
        return "English";
    if (lower == "zh" || lower == "zh-cn" || lower == "zh-hans")
        return "Simplified Chinese";
    if (lower == "zh-tw" || lower == "zh-hant")
        return "Traditional Chinese";
    if (lower == "ja" || lower == "ja-jp")
        return "Japanese";
    if (lower == "ko")
        return "Korean";
    if (lower == "fr")
        return "French";
    if (lower == "de")
        return "German";
    return lang.empty() ? "target language" : lang;
}

std::string OpenAIBatchTranslator::buildSystemPrompt(const std::string& src_lang, const std::string& dst_lang) const
{
    std::string prompt = cfg_.custom_system_prompt.empty() ? std::string(kDefaultSystemPrompt)
                                                           : cfg_.custom_system_prompt;
    replaceAll(prompt, "{source_lang}", languageDisplayName(src_lang));
    replaceAll(prompt, "{target_lang}", languageDisplayName(dst_lang));
    return prompt;
}

std::vector<HttpHeader> OpenAIBatchTranslator::buildHeaders() const
{
    return { { "Content-Type", "application/json" }, { "Authorization", std::string("Bearer ") + cfg_.api_key } };
}

void OpenAIBatchTranslator::throttle()
{
    const auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(1.0 / cfg_.qps));

    std::chrono::steady_clock::time_point wait_until;
    {
        std::lock_guard<std::mutex> lock(rate_mtx_);
        wait_until = last_request_ + interval;
    }

    const auto now = std::chrono::steady_clock::now();
    if (wait_until > now)
        std::this_thread::sleep_for(wait_until - now);
}

HttpReply OpenAIBatchTranslator::send(const std::string& body)
{
    HttpOptions options;
    options.keep_running = &running_;

    const auto url = chatCompletionsUrl(cfg_.base_url);
    const auto headers = buildHeaders();

    HttpReply response;
    for (int attempt = 0;; ++attempt)
    {
        throttle();
        response = post_(url, body, headers, options);
        {
            std::lock_guard<std::mutex> lock(rate_mtx_);
            last_request_ = std::chrono::steady_clock::now();
        }

        if (response.ok() || !response.transient() || attempt >= cfg_.max_retries ||
            !running_.load(std::memory_order_relaxed))
            return response;

        const auto backoff = std::chrono::milliseconds(200 * (attempt + 1));
        PLOG_DEBUG << "Retrying OpenAI request in " << backoff.count() << " ms (attempt " << attempt + 1 << ")";
        std::this_thread::sleep_for(backoff);
    }
}

} // namespace translate
