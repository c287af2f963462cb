#include "SanitizerInstaller.hpp"
#include "ITranslationEngine.hpp"

#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <mutex>

namespace engine
{

std::shared_ptr<const processing::IJsonSanitizer> sharedSanitizer()
{
    static std::once_flag once;
    static std::shared_ptr<const processing::IJsonSanitizer> instance;
    std::call_once(once, []() { instance = std::make_shared<processing::ControlCharJsonSanitizer>(); });
    return instance;
}

bool installSanitizer(ITranslationEngine& engine) noexcept
{
    try
    {
        if (engine.setOutputSanitizer(sharedSanitizer()))
        {
            PLOG_INFO << "Installed JSON output sanitizer into engine '" << engine.engineName() << "'";
            return true;
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Engine,
                                            "Engine has no sanitizer injection point; using its native cleanup",
                                            engine.engineName());
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Engine, "Failed to install JSON output sanitizer",
                                            ex.what());
    }
    return false;
}

} // namespace engine
