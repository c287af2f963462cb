#include "Application.hpp"
#include "app/Version.hpp"
#include "config/AppSettings.hpp"
#include "config/ConfigManager.hpp"
#include "engine/ProcessEngine.hpp"
#include "engine/SanitizerInstaller.hpp"
#include "job/JobController.hpp"
#include "translate/OpenAIBatchTranslator.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <csignal>
#include <iostream>
#include <thread>

namespace
{

// Async-signal-safe: only set flag
volatile std::sig_atomic_t g_interrupted = 0;

void onInterrupt(int signal)
{
    (void)signal;
    g_interrupted = 1;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application()
{
    utils::LogManager::Shutdown();
}

int Application::run()
{
    std::string error;
    if (!parse_args(argc_, argv_, options_, error))
    {
        if (error == "help")
        {
            print_usage(argv_[0]);
            return 0;
        }
        std::cerr << "Error: " << error << "\n\n";
        print_usage(argv_[0]);
        return 1;
    }

    if (options_.create_config)
        return createConfig();

    // Config first so its logging settings apply; problems found while
    // loading are queued and written once the log is open.
    const bool config_ok = initializeConfig();
    if (!initializeLogging())
    {
        std::cerr << "Error: cannot open the log file\n";
        return 1;
    }

    PLOG_INFO << "PdfTranslate " << PDFT_VERSION_STRING;

    if (!config_ok)
    {
        std::cerr << "Error: cannot load " << options_.config_path << ": " << config_->lastError() << "\n";
        printErrorSummary();
        return 1;
    }

    if (options_.check_engine)
        return checkEngine();

    return runTranslation();
}

bool Application::initializeLogging()
{
    return utils::LogManager::Initialize(settings_->logSettings());
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(options_.config_path);
    settings_ = std::make_unique<AppSettings>();
    settings_->registerSections(*config_);

    if (!config_->exists())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Config file not found, using defaults",
                                            "Run with --create-config to write " + options_.config_path);
        return true;
    }
    return config_->load();
}

job::RunConfig Application::buildRunConfig() const
{
    job::RunConfig run;
    settings_->applyTo(run);

    run.input_path = options_.input_path;
    run.output_dir = options_.output_dir;
    if (run.output_dir.empty())
    {
        run.output_dir = run.input_path.parent_path();
        if (run.output_dir.empty())
            run.output_dir = ".";
    }
    run.source_lang = options_.lang_in;
    run.target_lang = options_.lang_out;

    run.pdf.no_dual = options_.no_dual;
    run.pdf.no_mono = options_.no_mono;
    if (!job::parseWatermarkMode(options_.watermark, run.pdf.watermark_mode))
        PLOG_WARNING << "Unknown watermark mode '" << options_.watermark << "', keeping watermarked";
    run.pdf.pages = options_.pages;
    run.pdf.max_pages_per_part = options_.max_pages_per_part;
    run.pdf.enhance_compatibility = options_.enhance_compatibility;
    return run;
}

int Application::createConfig()
{
    std::string error;
    if (!AppSettings::writeExample(options_.config_path, error))
    {
        std::cerr << "Error: cannot write " << options_.config_path << ": " << error << "\n";
        return 1;
    }
    std::cout << "Wrote example config to " << options_.config_path << "\n"
              << "Set engine.openai.api_key before translating.\n";
    return 0;
}

int Application::checkEngine()
{
    const job::RunConfig run = buildRunConfig();

    translate::OpenAIBatchTranslator translator;
    translator.setOutputSanitizer(engine::sharedSanitizer());
    if (!translator.init(translate::BatchTranslatorConfig::fromRunConfig(run)))
    {
        std::cerr << "Config Error: " << translator.lastError() << "\n";
        return 1;
    }

    const std::string message = translator.testConnection();
    translator.shutdown();

    const bool ok = message.rfind("Success", 0) == 0;
    (ok ? std::cout : std::cerr) << message << "\n";
    return ok ? 0 : 1;
}

int Application::runTranslation()
{
    const job::RunConfig run = buildRunConfig();

    engine::ProcessEngineConfig engine_cfg;
    engine_cfg.command = settings_->engine().command;
    engine_cfg.args = settings_->engine().args;
    engine_cfg.clean_event_lines = settings_->engine().clean_event_lines;

    // Model calls made on the engine's behalf go through this translator.
    auto translator = std::make_shared<translate::OpenAIBatchTranslator>();
    if (translator->init(translate::BatchTranslatorConfig::fromRunConfig(run)))
        engine_cfg.translator = translator;
    else
        PLOG_WARNING << "Engine will call the model itself: " << translator->lastError();

    engine::ProcessEngine engine(std::move(engine_cfg));
    engine::installSanitizer(engine);

    job::JobController controller(engine);
    auto observer = [](const job::JobEvent& event)
    {
        if (event.kind == job::EventKind::ChunkError)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Translation,
                                                "Part of the document failed to translate",
                                                event.error.error_type + ": " + event.error.message);
        }
    };

    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);

    if (!controller.start(run, observer))
    {
        std::cerr << "Error: a translation run is already active\n";
        return 1;
    }

    bool cancel_sent = false;
    while (controller.isRunning())
    {
        if (g_interrupted && !cancel_sent)
        {
            controller.cancel();
            translator->shutdown(); // aborts a model call in flight
            cancel_sent = true;
        }
        std::this_thread::sleep_for(job::JobController::kPollInterval);
    }

    const job::RunOutcome outcome = controller.wait();
    translator->shutdown();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    printErrorSummary();

    if (!outcome.ok())
    {
        std::cerr << "Error [" << job::toString(outcome.code) << "]: " << outcome.message;
        if (!outcome.cause.empty())
            std::cerr << " (" << outcome.cause << ")";
        std::cerr << "\n";
        return 1;
    }

    std::cout << outcome.result->describe() << "\n";
    if (outcome.chunk_errors > 0)
        std::cout << outcome.chunk_errors << " part(s) reported errors, see logs/run.log\n";
    return 0;
}

void Application::printErrorSummary() const
{
    const auto reports = utils::ErrorReporter::GetPendingErrors();
    std::size_t warnings = 0;
    for (const auto& report : reports)
    {
        if (report.severity == utils::ErrorSeverity::Warning)
            ++warnings;
    }
    if (warnings > 0)
        PLOG_INFO << warnings << " warning(s) reported during this session";
}
