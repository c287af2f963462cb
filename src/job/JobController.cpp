#include "JobController.hpp"

#include "../engine/ITranslationEngine.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <iomanip>
#include <sstream>

namespace job
{

namespace
{

// Closes the stream on every exit path of a run.
class StreamGuard
{
public:
    explicit StreamGuard(engine::IEventStream& stream)
        : stream_(stream)
    {
    }

    ~StreamGuard() { stream_.close(); }

    StreamGuard(const StreamGuard&) = delete;
    StreamGuard& operator=(const StreamGuard&) = delete;

private:
    engine::IEventStream& stream_;
};

std::string formatProgress(const ProgressUpdate& p)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << "[" << p.stage << "] progress: " << p.stage_progress
       << "% | overall: " << p.overall_progress << "%";
    return ss.str();
}

const char* kindName(EventKind kind)
{
    switch (kind)
    {
    case EventKind::Empty:
        return "empty";
    case EventKind::ProgressUpdate:
        return "progress_update";
    case EventKind::ChunkError:
        return "error";
    case EventKind::Finish:
        return "finish";
    default:
        return "unknown";
    }
}

bool materializeResult(const JobEvent& event, ResultData& out, std::string& error)
{
    if (event.result_record)
    {
        out = ResultData(*event.result_record);
        return true;
    }
    return decodeResult(event.result_mapping, out, error);
}

} // namespace

JobController::JobController(engine::ITranslationEngine& engine)
    : engine_(engine)
{
}

JobController::~JobController()
{
    cancel();
    if (worker_.joinable())
        worker_.join();
}

bool JobController::start(const RunConfig& config, Observer observer)
{
    bool idle = false;
    if (!running_.compare_exchange_strong(idle, true, std::memory_order_acq_rel))
        return false;

    // Only the caller that won the exchange gets here; the previous worker
    // has already finished.
    if (worker_.joinable())
        worker_.join();

    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        last_progress_.reset();
        outcome_.reset();
    }

    cancel_requested_.store(false, std::memory_order_relaxed);
    worker_ = std::thread(&JobController::workerMain, this, config, std::move(observer));
    return true;
}

void JobController::cancel()
{
    if (running_.load(std::memory_order_acquire))
        PLOG_INFO << "Cancellation requested";
    cancel_requested_.store(true, std::memory_order_relaxed);
}

bool JobController::isRunning() const
{
    return running_.load(std::memory_order_acquire);
}

std::optional<ProgressUpdate> JobController::lastProgress() const
{
    std::lock_guard<std::mutex> lock(state_mtx_);
    return last_progress_;
}

RunOutcome JobController::wait()
{
    if (worker_.joinable())
        worker_.join();

    std::lock_guard<std::mutex> lock(state_mtx_);
    if (!outcome_)
        return RunOutcome::failure(JobErrorCode::IncompleteRun, "No run was started");
    return *outcome_;
}

RunOutcome JobController::run(const RunConfig& config, Observer observer)
{
    if (!start(config, std::move(observer)))
        return RunOutcome::failure(JobErrorCode::InvalidConfig, "A run is already active on this controller");
    return wait();
}

void JobController::workerMain(RunConfig config, Observer observer)
{
    RunOutcome outcome = execute(config, observer);

    if (outcome.ok())
    {
        PLOG_INFO << "Translation finished";
        PLOG_INFO << outcome.result->describe();
    }
    else
    {
        PLOG_ERROR << "Translation failed [" << toString(outcome.code) << "]: " << outcome.message
                   << (outcome.cause.empty() ? std::string() : " | " + outcome.cause);
    }

    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        outcome_ = std::move(outcome);
    }
    running_.store(false, std::memory_order_release);
}

RunOutcome JobController::execute(const RunConfig& config, const Observer& observer)
{
    std::error_code ec;
    if (!std::filesystem::exists(config.input_path, ec))
    {
        return RunOutcome::failure(JobErrorCode::InputNotFound,
                                   "Input document does not exist: " + config.input_path.string(),
                                   ec ? ec.message() : std::string());
    }

    const std::string config_error = config.validate();
    if (!config_error.empty())
        return RunOutcome::failure(JobErrorCode::InvalidConfig, config_error);

    PLOG_INFO << "Translating " << config.input_path.string() << " with " << engine_.engineName();
    PLOG_INFO << "Output directory: " << config.output_dir.string();
    PLOG_INFO << "Languages: " << config.source_lang << " -> " << config.target_lang;

    std::unique_ptr<engine::IEventStream> stream;
    try
    {
        stream = engine_.startStream(config);
    }
    catch (const std::exception& ex)
    {
        return RunOutcome::failure(JobErrorCode::TransportFailure, "Failed to start the engine", ex.what());
    }

    if (!stream)
        return RunOutcome::failure(JobErrorCode::TransportFailure, "Engine returned no event stream");

    StreamGuard guard(*stream);
    return drive(*stream, observer);
}

RunOutcome JobController::drive(engine::IEventStream& stream, const Observer& observer)
{
    std::size_t chunk_errors = 0;

    while (true)
    {
        if (cancel_requested_.load(std::memory_order_relaxed))
            return RunOutcome::failure(JobErrorCode::Cancelled, "Run cancelled");

        JobEvent event;
        engine::StreamStatus status = engine::StreamStatus::Idle;
        try
        {
            status = stream.next(event, kPollInterval);
        }
        catch (const std::exception& ex)
        {
            return RunOutcome::failure(JobErrorCode::TransportFailure, "Event stream failed", ex.what());
        }

        if (status == engine::StreamStatus::Idle)
            continue;
        if (status == engine::StreamStatus::Closed)
        {
            return RunOutcome::failure(JobErrorCode::IncompleteRun,
                                       "Engine stream ended without a finish event");
        }

        switch (event.kind)
        {
        case EventKind::Empty:
            break;
        case EventKind::ProgressUpdate:
            PLOG_INFO << formatProgress(event.progress);
            {
                std::lock_guard<std::mutex> lock(state_mtx_);
                last_progress_ = event.progress;
            }
            notify(observer, event);
            break;
        case EventKind::ChunkError:
            ++chunk_errors;
            PLOG_WARNING << "Engine error [" << event.error.error_type << "]: " << event.error.message;
            notify(observer, event);
            break;
        case EventKind::Finish:
        {
            ResultData data;
            std::string error;
            if (!materializeResult(event, data, error))
            {
                return RunOutcome::failure(JobErrorCode::ResultSchemaMismatch,
                                           "Finish event carried an unexpected result shape", error);
            }
            drainAfterFinish(stream);
            return RunOutcome::success(std::move(data), chunk_errors);
        }
        }
    }
}

void JobController::drainAfterFinish(engine::IEventStream& stream)
{
    try
    {
        JobEvent extra;
        while (stream.next(extra, std::chrono::milliseconds(0)) == engine::StreamStatus::Event)
        {
            if (extra.kind != EventKind::Empty)
                PLOG_WARNING << "Ignoring '" << kindName(extra.kind) << "' event received after finish";
        }
    }
    catch (const std::exception& ex)
    {
        PLOG_WARNING << "Event stream failed after finish: " << ex.what();
    }
}

void JobController::notify(const Observer& observer, const JobEvent& event)
{
    if (!observer)
        return;

    try
    {
        observer(event);
    }
    catch (const std::exception& ex)
    {
        PLOG_WARNING << "Progress observer threw: " << ex.what();
    }
}

} // namespace job
