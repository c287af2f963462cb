#include <catch2/catch_test_macros.hpp>

#include "job/JobController.hpp"
#include "../utils/ScriptedEngine.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace job;
using test_utils::ScriptedEngine;

namespace {

// Creates a placeholder input document and removes it afterwards.
struct TempInput {
    std::filesystem::path path;

    TempInput() {
        static int counter = 0;
        path = std::filesystem::temp_directory_path() /
               ("pdft_controller_" + std::to_string(::getpid()) + "_" + std::to_string(++counter) + ".pdf");
        std::ofstream(path) << "%PDF-1.4\n";
    }

    ~TempInput() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

RunConfig makeConfig(const std::filesystem::path& input) {
    RunConfig cfg;
    cfg.input_path = input;
    cfg.output_dir = input.parent_path();
    cfg.openai.api_key = "test-key";
    return cfg;
}

struct RecordingObserver {
    std::vector<JobEvent> seen;

    JobController::Observer fn() {
        return [this](const JobEvent& e) { seen.push_back(e); };
    }

    std::size_t count(EventKind kind) const {
        std::size_t n = 0;
        for (const auto& e : seen) {
            if (e.kind == kind) ++n;
        }
        return n;
    }
};

}  // namespace

TEST_CASE("JobController terminal event", "[job][controller]") {
    TempInput input;
    ScriptedEngine engine;
    JobController controller(engine);

    SECTION("Structured finish record becomes the result") {
        TranslateResult record;
        record.mono_pdf_path = "/out/mono.pdf";
        record.dual_pdf_path = "/out/dual.pdf";
        record.total_seconds = 4.0;
        engine.events = {JobEvent::makeProgress("Parse PDF", 100, 50), JobEvent::makeFinish(record)};

        auto outcome = controller.run(makeConfig(input.path));
        REQUIRE(outcome.ok());
        REQUIRE(outcome.code == JobErrorCode::None);
        REQUIRE(outcome.result->monoPdfPath() == "/out/mono.pdf");
        REQUIRE(outcome.result->dualPdfPath() == "/out/dual.pdf");
        REQUIRE(outcome.result->totalSeconds() == 4.0);
        REQUIRE(engine.close_count.load() == 1);
    }

    SECTION("Loose mapping with missing optional fields") {
        engine.events = {JobEvent::makeFinish(nlohmann::json{{"mono_pdf_path", "/out/mono.pdf"}})};

        auto outcome = controller.run(makeConfig(input.path));
        REQUIRE(outcome.ok());
        REQUIRE(outcome.result->monoPdfPath() == "/out/mono.pdf");
        REQUIRE_FALSE(outcome.result->dualPdfPath().has_value());
        REQUIRE_FALSE(outcome.result->glossaryPath().has_value());
        REQUIRE(outcome.result->totalSeconds() == 0.0);
        REQUIRE(outcome.result->peakMemoryUsage() == 0.0);
    }

    SECTION("Empty events are skipped") {
        engine.events = {JobEvent{}, JobEvent{}, JobEvent::makeFinish(TranslateResult{})};
        RecordingObserver observer;

        auto outcome = controller.run(makeConfig(input.path), observer.fn());
        REQUIRE(outcome.ok());
        REQUIRE(observer.seen.empty());
    }

    SECTION("Events after finish are ignored") {
        engine.events = {JobEvent::makeProgress("Translate", 10, 10), JobEvent::makeFinish(TranslateResult{}),
                         JobEvent::makeProgress("Translate", 20, 20),
                         JobEvent::makeChunkError("Late", "after finish")};
        RecordingObserver observer;

        auto outcome = controller.run(makeConfig(input.path), observer.fn());
        REQUIRE(outcome.ok());
        REQUIRE(outcome.chunk_errors == 0);
        REQUIRE(observer.seen.size() == 1);
        REQUIRE(controller.lastProgress()->overall_progress == 10.0);
        REQUIRE(engine.close_count.load() == 1);
    }
}

TEST_CASE("JobController incomplete and failing runs", "[job][controller]") {
    TempInput input;
    ScriptedEngine engine;
    JobController controller(engine);

    SECTION("Stream ending without finish is incomplete") {
        engine.events = {JobEvent::makeProgress("Translate", 100, 100)};

        auto outcome = controller.run(makeConfig(input.path));
        REQUIRE_FALSE(outcome.ok());
        REQUIRE(outcome.code == JobErrorCode::IncompleteRun);
        REQUIRE_FALSE(outcome.result.has_value());
        REQUIRE(engine.close_count.load() == 1);
    }

    SECTION("Transport failure keeps its cause and closes the stream once") {
        engine.events = {JobEvent::makeProgress("Translate", 5, 5), JobEvent::makeFinish(TranslateResult{})};
        engine.throw_at = 1;

        auto outcome = controller.run(makeConfig(input.path));
        REQUIRE(outcome.code == JobErrorCode::TransportFailure);
        REQUIRE(outcome.cause == "connection reset");
        REQUIRE(engine.close_count.load() == 1);
    }

    SECTION("Engine that cannot start") {
        engine.fail_start = true;

        auto outcome = controller.run(makeConfig(input.path));
        REQUIRE(outcome.code == JobErrorCode::TransportFailure);
        REQUIRE(outcome.cause == "spawn failed");
        REQUIRE(engine.close_count.load() == 0);
    }

    SECTION("Malformed finish payload is a schema mismatch") {
        engine.events = {JobEvent::makeFinish(nlohmann::json{{"total_seconds", "slow"}})};

        auto outcome = controller.run(makeConfig(input.path));
        REQUIRE(outcome.code == JobErrorCode::ResultSchemaMismatch);
        REQUIRE_FALSE(outcome.cause.empty());
        REQUIRE(engine.close_count.load() == 1);
    }

    SECTION("Non-object finish payload is a schema mismatch") {
        engine.events = {JobEvent::makeFinish(nlohmann::json("done"))};

        auto outcome = controller.run(makeConfig(input.path));
        REQUIRE(outcome.code == JobErrorCode::ResultSchemaMismatch);
    }
}

TEST_CASE("JobController chunk errors are not fatal", "[job][controller]") {
    TempInput input;
    ScriptedEngine engine;
    JobController controller(engine);
    RecordingObserver observer;

    engine.events = {JobEvent::makeProgress("Translate", 30, 30),
                     JobEvent::makeChunkError("ContentFilter", "paragraph 12 rejected"),
                     JobEvent::makeProgress("Translate", 100, 90), JobEvent::makeFinish(TranslateResult{})};

    auto outcome = controller.run(makeConfig(input.path), observer.fn());
    REQUIRE(outcome.ok());
    REQUIRE(outcome.chunk_errors == 1);
    REQUIRE(observer.count(EventKind::ChunkError) == 1);
    REQUIRE(observer.count(EventKind::ProgressUpdate) == 2);

    const auto& error_event = observer.seen[1];
    REQUIRE(error_event.kind == EventKind::ChunkError);
    REQUIRE(error_event.error.error_type == "ContentFilter");
    REQUIRE(error_event.error.message == "paragraph 12 rejected");
}

TEST_CASE("JobController observer exceptions do not abort the run", "[job][controller]") {
    TempInput input;
    ScriptedEngine engine;
    JobController controller(engine);

    engine.events = {JobEvent::makeProgress("Translate", 50, 50), JobEvent::makeFinish(TranslateResult{})};

    auto outcome = controller.run(makeConfig(input.path),
                                  [](const JobEvent&) { throw std::runtime_error("observer bug"); });
    REQUIRE(outcome.ok());
}

TEST_CASE("JobController validates before streaming", "[job][controller]") {
    ScriptedEngine engine;
    JobController controller(engine);
    RecordingObserver observer;
    engine.events = {JobEvent::makeProgress("Translate", 1, 1), JobEvent::makeFinish(TranslateResult{})};

    SECTION("Missing input document") {
        auto cfg = makeConfig(std::filesystem::temp_directory_path() / "pdft_does_not_exist.pdf");

        auto outcome = controller.run(cfg, observer.fn());
        REQUIRE(outcome.code == JobErrorCode::InputNotFound);
        REQUIRE(engine.streams_started.load() == 0);
        REQUIRE(observer.seen.empty());
    }

    SECTION("Invalid config") {
        TempInput input;
        auto cfg = makeConfig(input.path);
        cfg.openai.api_key.clear();

        auto outcome = controller.run(cfg, observer.fn());
        REQUIRE(outcome.code == JobErrorCode::InvalidConfig);
        REQUIRE(engine.streams_started.load() == 0);
        REQUIRE(observer.seen.empty());
    }

    SECTION("Missing input is reported before invalid config") {
        auto cfg = makeConfig(std::filesystem::temp_directory_path() / "pdft_does_not_exist.pdf");
        cfg.vendor = "unknown";

        auto outcome = controller.run(cfg);
        REQUIRE(outcome.code == JobErrorCode::InputNotFound);
    }
}

TEST_CASE("JobController cancellation", "[job][controller]") {
    TempInput input;
    ScriptedEngine engine;
    engine.events = {JobEvent::makeProgress("Translate", 10, 10)};
    engine.idle_forever = true;

    JobController controller(engine);
    REQUIRE(controller.start(makeConfig(input.path)));
    REQUIRE_FALSE(controller.start(makeConfig(input.path)));

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    controller.cancel();

    auto outcome = controller.wait();
    REQUIRE(outcome.code == JobErrorCode::Cancelled);
    REQUIRE_FALSE(controller.isRunning());
    REQUIRE(engine.close_count.load() == 1);
}

TEST_CASE("JobController admits one run when started concurrently", "[job][controller]") {
    TempInput input;
    ScriptedEngine engine;
    engine.idle_forever = true;
    JobController controller(engine);
    const RunConfig cfg = makeConfig(input.path);

    std::atomic<int> started{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> callers;
    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            if (controller.start(cfg)) {
                ++started;
            }
        });
    }
    go.store(true);
    for (auto& t : callers) {
        t.join();
    }

    REQUIRE(started.load() == 1);
    controller.cancel();
    REQUIRE(controller.wait().code == JobErrorCode::Cancelled);
    REQUIRE(engine.streams_started.load() == 1);
}

TEST_CASE("JobController wait without a run", "[job][controller]") {
    ScriptedEngine engine;
    JobController controller(engine);

    auto outcome = controller.wait();
    REQUIRE(outcome.code == JobErrorCode::IncompleteRun);
    REQUIRE_FALSE(controller.lastProgress().has_value());
}
