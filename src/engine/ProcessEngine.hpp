#pragma once

#include "ITranslationEngine.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace translate
{
class OpenAIBatchTranslator;
}

namespace engine
{

struct TranslationBridge;

struct ProcessEngineConfig
{
    std::string command;                 // engine executable, looked up in PATH
    std::vector<std::string> args;       // extra arguments
    std::chrono::milliseconds shutdown_grace{ 2000 };

    // Strip wrappers and control bytes from event lines before decoding them.
    bool clean_event_lines = false;

    // Answers the engine's translate_request lines. Without a translator the
    // engine calls the model on its own and stdin closes after the settings.
    std::shared_ptr<translate::OpenAIBatchTranslator> translator;
};

/**
 * @brief Bridges an external engine executable.
 *
 * The run settings (RunConfig::toJson) go to the child's stdin as the first
 * line; the child reports one JSON event per stdout line. With a translator
 * attached, the child may also send
 *
 *   {"type":"translate_request","request_id":R,"lang_in":..,"lang_out":..,
 *    "fragments":[{"id":N,"text":".."}]}
 *
 * and receives one translate_response line on stdin. Model replies on that
 * path are decoded through the injected sanitizer.
 *
 * The child runs in its own process group, so terminal signals reach only
 * this process; the child is stopped through IEventStream::close().
 */
class ProcessEngine final : public ITranslationEngine
{
public:
    explicit ProcessEngine(ProcessEngineConfig config);
    ~ProcessEngine() override;

    const char* engineName() const override { return "process"; }
    std::unique_ptr<IEventStream> startStream(const job::RunConfig& config) override;

    // Returns false when no translator is attached: model output then never
    // passes through this process.
    bool setOutputSanitizer(std::shared_ptr<const processing::IJsonSanitizer> sanitizer) override;

private:
    ProcessEngineConfig cfg_;
    std::shared_ptr<TranslationBridge> bridge_;
};

} // namespace engine
