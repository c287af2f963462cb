#pragma once

#include "JobEvent.hpp"
#include "RunConfig.hpp"
#include "RunOutcome.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace engine
{
class ITranslationEngine;
class IEventStream;
} // namespace engine

namespace job
{

/**
 * @brief Drives one translation run to completion.
 *
 * The run executes on an internal worker thread that pulls events from the
 * engine one at a time, in emission order. ProgressUpdate and ChunkError
 * events go to the observer; Finish ends the run with a ResultData. Fatal
 * conditions come back as a RunOutcome, never as an exception.
 *
 * Usage:
 *   JobController controller(engine);
 *   controller.start(config, [](const JobEvent& e) { ... });
 *   ...
 *   RunOutcome outcome = controller.wait();
 *
 * or, blocking:
 *   RunOutcome outcome = controller.run(config);
 */
class JobController
{
public:
    using Observer = std::function<void(const JobEvent&)>;

    static constexpr std::chrono::milliseconds kPollInterval{ 100 };

    explicit JobController(engine::ITranslationEngine& engine);
    ~JobController();

    JobController(const JobController&) = delete;
    JobController& operator=(const JobController&) = delete;

    // Returns false if a run is already active.
    bool start(const RunConfig& config, Observer observer = {});
    void cancel();
    bool isRunning() const;
    std::optional<ProgressUpdate> lastProgress() const;

    // Blocks until the started run ends.
    RunOutcome wait();

    // Blocking facade: start() followed by wait().
    RunOutcome run(const RunConfig& config, Observer observer = {});

private:
    void workerMain(RunConfig config, Observer observer);
    RunOutcome execute(const RunConfig& config, const Observer& observer);
    RunOutcome drive(engine::IEventStream& stream, const Observer& observer);
    void drainAfterFinish(engine::IEventStream& stream);
    void notify(const Observer& observer, const JobEvent& event);

    engine::ITranslationEngine& engine_;
    std::thread worker_;
    std::atomic<bool> running_{ false };
    std::atomic<bool> cancel_requested_{ false };

    mutable std::mutex state_mtx_;
    std::optional<ProgressUpdate> last_progress_;
    std::optional<RunOutcome> outcome_;
};

} // namespace job
