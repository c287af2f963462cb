#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include "translate/OpenAIBatchTranslator.hpp"
#include "job/RunConfig.hpp"
#include "../utils/mock_http.hpp"

using namespace translate;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using test_utils::MockHttpClient;
using test_utils::MockResponses;

namespace {

const std::string kChatUrl = "https://api.example.com/v1/chat/completions";
const std::string kModelsUrl = "https://api.example.com/v1/models";

BatchTranslatorConfig testConfig() {
    BatchTranslatorConfig cfg;
    cfg.api_key = "test-key";
    cfg.base_url = "https://api.example.com/v1/";
    cfg.model = "gpt-4o-mini";
    cfg.qps = 1000;
    cfg.max_retries = 0;
    return cfg;
}

OpenAIBatchTranslator makeTranslator(MockHttpClient& http) {
    return OpenAIBatchTranslator(
        [&http](const std::string& url, const std::string& body, const std::vector<HttpHeader>& headers,
                const HttpOptions& options) { return http.post(url, body, headers, options); },
        [&http](const std::string& url, const std::vector<HttpHeader>& headers, const HttpOptions& options) {
            return http.get(url, headers, options);
        });
}

// Decodes the user message of a recorded chat request.
nlohmann::json sentInputs(const test_utils::RecordedRequest& request) {
    auto body = nlohmann::json::parse(request.body);
    return nlohmann::json::parse(body["messages"][1]["content"].get<std::string>());
}

}  // namespace

TEST_CASE("OpenAI batch translator initialization", "[translate][openai]") {
    MockHttpClient http;
    auto translator = makeTranslator(http);

    SECTION("Not ready before init") {
        REQUIRE_FALSE(translator.isReady());
    }

    SECTION("Succeeds with valid config") {
        REQUIRE(translator.init(testConfig()));
        REQUIRE(translator.isReady());
        translator.shutdown();
        REQUIRE_FALSE(translator.isReady());
    }

    SECTION("Rejects missing credentials") {
        auto cfg = testConfig();
        cfg.api_key.clear();
        REQUIRE_FALSE(translator.init(cfg));
        REQUIRE(std::string(translator.lastError()) == "Missing API key");
        REQUIRE_FALSE(translator.isReady());
    }

    SECTION("Rejects non-positive qps") {
        auto cfg = testConfig();
        cfg.qps = 0;
        REQUIRE_FALSE(translator.init(cfg));
    }

    SECTION("Config built from a run") {
        job::RunConfig run;
        run.openai.api_key = "run-key";
        run.qps = 2;
        run.min_text_length = 8;
        run.custom_system_prompt = "Custom.";
        auto cfg = BatchTranslatorConfig::fromRunConfig(run);
        REQUIRE(cfg.api_key == "run-key");
        REQUIRE(cfg.base_url == "https://api.openai.com/v1");
        REQUIRE(cfg.qps == 2);
        REQUIRE(cfg.min_text_length == 8);
        REQUIRE(cfg.custom_system_prompt == "Custom.");
    }
}

TEST_CASE("OpenAI batch translator URLs", "[translate][openai]") {
    REQUIRE(OpenAIBatchTranslator::chatCompletionsUrl("https://api.openai.com/v1") ==
            "https://api.openai.com/v1/chat/completions");
    REQUIRE(OpenAIBatchTranslator::chatCompletionsUrl("https://api.openai.com/v1//") ==
            "https://api.openai.com/v1/chat/completions");
    REQUIRE(OpenAIBatchTranslator::chatCompletionsUrl("http://localhost:8080/v1/chat/completions") ==
            "http://localhost:8080/v1/chat/completions");
    REQUIRE(OpenAIBatchTranslator::modelsUrl("https://api.openai.com/v1/") == "https://api.openai.com/v1/models");
}

TEST_CASE("OpenAI batch translation", "[translate][openai]") {
    MockHttpClient http;
    auto translator = makeTranslator(http);
    REQUIRE(translator.init(testConfig()));

    const std::vector<SourceFragment> fragments = {
        {1, "Introduction to graphs"},
        {2, "Fig."},
        {3, "Results are shown below"},
    };

    SECTION("Translates long fragments and passes short ones through") {
        http.setResponse(kChatUrl, MockResponses::openai_success(
                                       R"([{"id": 1, "output": "图的介绍"}, {"id": 3, "output": "结果如下"}])"));

        auto result = translator.translateBatch(fragments, "en", "zh");
        REQUIRE(result.ok);
        REQUIRE(result.missing_ids.empty());
        REQUIRE(result.items.size() == 3);
        REQUIRE(result.items[0].output == "图的介绍");
        REQUIRE(result.items[1].output == "Fig.");
        REQUIRE(result.items[2].output == "结果如下");

        REQUIRE(http.requests().size() == 1);
        const auto inputs = sentInputs(http.requests()[0]);
        REQUIRE(inputs.size() == 2);
        REQUIRE(inputs[0]["id"] == 1);
        REQUIRE(inputs[1]["input"] == "Results are shown below");
    }

    SECTION("Request carries model, auth and the default prompt") {
        http.setResponse(kChatUrl, MockResponses::openai_success(R"([])"));
        translator.translateBatch(fragments, "en", "zh");

        REQUIRE(http.requests().size() == 1);
        const auto& request = http.requests()[0];
        REQUIRE(request.method == "POST");
        REQUIRE(request.url == kChatUrl);

        bool has_auth = false;
        for (const auto& h : request.headers) {
            if (h.name == "Authorization" && h.value == "Bearer test-key") has_auth = true;
        }
        REQUIRE(has_auth);

        auto body = nlohmann::json::parse(request.body);
        REQUIRE(body["model"] == "gpt-4o-mini");
        REQUIRE(body["messages"][0]["role"] == "system");
        REQUIRE_THAT(body["messages"][0]["content"].get<std::string>(), ContainsSubstring("Simplified Chinese"));
        REQUIRE(body["messages"][1]["role"] == "user");
    }

    SECTION("Custom system prompt replaces the default") {
        auto cfg = testConfig();
        cfg.custom_system_prompt = "Translate {source_lang} to {target_lang} tersely.";
        REQUIRE(translator.init(cfg));
        http.setResponse(kChatUrl, MockResponses::openai_success(R"([])"));
        translator.translateBatch(fragments, "en", "ja");

        auto body = nlohmann::json::parse(http.requests().at(0).body);
        REQUIRE(body["messages"][0]["content"] == "Translate English to Japanese tersely.");
    }

    SECTION("Fragments missing from the reply keep their source text") {
        http.setResponse(kChatUrl, MockResponses::openai_success(R"([{"id": 1, "output": "图的介绍"}])"));

        auto result = translator.translateBatch(fragments, "en", "zh");
        REQUIRE(result.ok);
        REQUIRE(result.missing_ids == std::vector<int>{3});
        REQUIRE(result.items[2].output == "Results are shown below");
    }

    SECTION("Fenced reply with control characters is sanitized") {
        std::string content = "```json\n[{\"id\": 1, \"output\": \"a";
        content += '\x01';
        content += "b\"}, {\"id\": 3, \"output\": \"c\"}]\n```";
        http.setResponse(kChatUrl, MockResponses::openai_success(content));

        auto result = translator.translateBatch(fragments, "en", "zh");
        REQUIRE(result.ok);
        REQUIRE_FALSE(result.used_fallback);
        REQUIRE(result.items[0].output == "ab");
    }

    SECTION("All fragments below the minimum length need no request") {
        auto result = translator.translateBatch({{7, "OK"}, {8, "Hi"}}, "en", "zh");
        REQUIRE(result.ok);
        REQUIRE(http.requests().empty());
        REQUIRE(result.items[0].output == "OK");
    }

    SECTION("HTTP errors fail the batch") {
        http.setResponse(kChatUrl, MockResponses::openai_error_401());

        auto result = translator.translateBatch(fragments, "en", "zh");
        REQUIRE_FALSE(result.ok);
        REQUIRE_THAT(result.error, ContainsSubstring("401"));
        REQUIRE_THAT(result.error, ContainsSubstring("Invalid API key provided"));
        REQUIRE(result.missing_ids == std::vector<int>{1, 3});
        REQUIRE(result.items[0].output == "Introduction to graphs");
    }

    SECTION("Network errors fail the batch") {
        http.simulateNetworkError("Connection refused");

        auto result = translator.translateBatch(fragments, "en", "zh");
        REQUIRE_FALSE(result.ok);
        REQUIRE_THAT(result.error, ContainsSubstring("Connection refused"));
    }

    SECTION("Unparseable response body") {
        http.setResponse(kChatUrl, MockResponses::openai_invalid_json());

        auto result = translator.translateBatch(fragments, "en", "zh");
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.missing_ids.size() == 2);
    }

    SECTION("Reply without any translation") {
        http.setResponse(kChatUrl, MockResponses::openai_success("Sorry, I can't help with that."));

        auto result = translator.translateBatch(fragments, "en", "zh");
        REQUIRE_FALSE(result.ok);
    }

    SECTION("Not ready after shutdown") {
        translator.shutdown();
        auto result = translator.translateBatch(fragments, "en", "zh");
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error == "translator not ready");
        REQUIRE(http.requests().empty());
    }
}

TEST_CASE("OpenAI batch translator retries transient failures", "[translate][openai]") {
    MockHttpClient http;
    auto translator = makeTranslator(http);
    auto cfg = testConfig();
    cfg.max_retries = 1;
    REQUIRE(translator.init(cfg));

    http.queueResponse(kChatUrl, MockResponses::openai_server_error());
    http.setResponse(kChatUrl, MockResponses::openai_success(R"([{"id": 1, "output": "好"}])"));

    auto result = translator.translateBatch({{1, "Hello there"}}, "en", "zh");
    REQUIRE(result.ok);
    REQUIRE(result.items[0].output == "好");
    REQUIRE(http.requests().size() == 2);
}

TEST_CASE("OpenAI batch translator connection test", "[translate][openai]") {
    MockHttpClient http;
    auto translator = makeTranslator(http);
    REQUIRE(translator.init(testConfig()));

    SECTION("Model listed and test translation answered") {
        http.setResponse(kModelsUrl, MockResponses::openai_models({"gpt-4o-mini", "gpt-4o"}));
        http.setResponse(kChatUrl, MockResponses::openai_success(R"([{"id": 0, "output": "你好，世界"}])"));
        REQUIRE_THAT(translator.testConnection(), StartsWith("Success"));
    }

    SECTION("Model not listed") {
        http.setResponse(kModelsUrl, MockResponses::openai_models({"gpt-4o"}));
        REQUIRE_THAT(translator.testConnection(), StartsWith("Warning"));
    }

    SECTION("Unreachable endpoint") {
        http.simulateNetworkError("Could not resolve host");
        REQUIRE_THAT(translator.testConnection(), ContainsSubstring("Cannot connect"));
    }

    SECTION("Test translation reply in the wrong format") {
        http.setResponse(kModelsUrl, MockResponses::openai_models({"gpt-4o-mini"}));
        http.setResponse(kChatUrl, MockResponses::openai_success("你好，世界"));
        REQUIRE_THAT(translator.testConnection(), StartsWith("Error"));
    }
}
