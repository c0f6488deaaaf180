/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "fake_runtime.hpp"
#include "rtbridge/bridge.hpp"
#include "rtbridge/errors.hpp"
#include "rtbridge/interpreter.hpp"
#include "rtbridge/pipeline.hpp"
#include <gtest/gtest.h>
#include <climits>
#include <future>
#include <mutex>
#include <thread>

using namespace rtbridge;
using namespace rtbridge::testing;
using namespace std::chrono_literals;

namespace {

FakeObject* kwarg(FakeObject* kwargs, const std::string& key) {
    auto it = kwargs->entries.find(key);
    return it == kwargs->entries.end() ? nullptr : it->second;
}

class ForeignPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        (void)testRoot();
        resetFakeRuntime();
        interpreter_ = std::make_unique<Interpreter>(makeFakeResolver());

        const auto frameworks = uniqueDir("runtime");
        makeFakeRuntimeTree(frameworks);
        InitOptions options;
        options.locator = fakeLocatorOptions(frameworks);
        options.tempDir = uniqueDir("isolated");
        (void)interpreter_->initialize(options);

        pipeline_ = std::make_unique<ForeignPipeline>(*interpreter_, PipelineOptions{});
    }

    void TearDown() override {
        pipeline_.reset();
        interpreter_.reset();
        resetFakeRuntime();
    }

    // Installs redact.pipeline.run_redaction backed by `body`.
    void scriptRun(FakeFunction body) {
        (void)registerModule("redact.pipeline", {{"run_redaction", newFunction(std::move(body))}});
    }

    static RedactionRequest request() {
        RedactionRequest r;
        r.inputPath = "/docs/in.docx";
        r.outputPath = "/docs/out.docx";
        r.reportPath = "/docs/report.json";
        r.model = "llama3";
        return r;
    }

    PipelineResult run(std::vector<ProgressEvent>* events = nullptr, bool keepGoing = true) {
        ProgressCallback progress = [events, keepGoing](const ProgressEvent& event) {
            if (events) events->push_back(event);
            return keepGoing;
        };
        return interpreter_->withLock([&] { return pipeline_->runRedaction(request(), progress); });
    }

    std::unique_ptr<Interpreter> interpreter_;
    std::unique_ptr<ForeignPipeline> pipeline_;
};

}

TEST_F(ForeignPipelineTest, PassesRequestAsKeywordArguments) {
    FakeObject* seen = nullptr;
    scriptRun([&seen](FakeObject*, FakeObject* kwargs) {
        seen = kwargs;
        return newInt(0);
    });
    (void)run();

    ASSERT_NE(seen, nullptr);
    EXPECT_EQ(kwarg(seen, "input_path")->text, "/docs/in.docx");
    EXPECT_EQ(kwarg(seen, "output_path")->text, "/docs/out.docx");
    EXPECT_EQ(kwarg(seen, "report_path")->text, "/docs/report.json");
    EXPECT_EQ(kwarg(seen, "model_id")->text, "llama3");
    EXPECT_EQ(kwarg(seen, "mode")->text, "enhanced");
    EXPECT_EQ(kwarg(seen, "chunk_tokens")->integer, 500);
    EXPECT_EQ(kwarg(seen, "overlap")->integer, 120);
    EXPECT_EQ(kwarg(seen, "seed")->integer, 42);
    EXPECT_DOUBLE_EQ(kwarg(seen, "temperature")->real, 0.1);
    EXPECT_EQ(kwarg(seen, "debug")->kind, FakeObject::Kind::Bool);
    ASSERT_NE(kwarg(seen, "progress_callback"), nullptr);
    EXPECT_EQ(kwarg(seen, "progress_callback")->kind, FakeObject::Kind::NativeFunction);
}

TEST_F(ForeignPipelineTest, RichAndPositionalProgressWithTupleResult) {
    scriptRun([](FakeObject*, FakeObject* kwargs) -> FakeObject* {
        FakeObject* callback = kwarg(kwargs, "progress_callback");
        FakeObject* update = newObject({
            {"phase", newObject({{"value", newStr("llm_detection")}})},
            {"phase_name", newStr("LLM detection")},
            {"phase_progress", newFloat(0.5)},
            {"overall_progress", newFloat(0.25)},
            {"message", newStr("  ")},
        });
        if (!callObject(callback, {update})) return nullptr;
        if (!callObject(callback, {newInt(3), newInt(10), newStr("chunk 3")})) return nullptr;
        if (!callObject(callback, {newInt(4), newInt(10)})) return nullptr;
        return newTuple({newInt(0), newDict({{"llm", newFloat(1.5)}})});
    });

    std::vector<ProgressEvent> events;
    auto result = run(&events);

    EXPECT_EQ(result.status, 0);
    EXPECT_TRUE(result.hadTimings);
    ASSERT_EQ(events.size(), 3u);

    EXPECT_EQ(events[0].phaseIdentifier.value_or(""), "llm_detection");
    EXPECT_EQ(events[0].phaseDisplayName.value_or(""), "LLM detection");
    EXPECT_DOUBLE_EQ(events[0].phaseProgress.value_or(-1), 0.5);
    EXPECT_DOUBLE_EQ(events[0].overallProgress.value_or(-1), 0.25);
    EXPECT_FALSE(events[0].message.has_value());
    EXPECT_FALSE(events[0].chunk.has_value());

    EXPECT_EQ(events[1].chunk.value_or(-1), 3);
    EXPECT_EQ(events[1].total.value_or(-1), 10);
    EXPECT_EQ(events[1].message.value_or(""), "chunk 3");
    EXPECT_FALSE(events[1].phaseIdentifier.has_value());

    EXPECT_EQ(events[2].chunk.value_or(-1), 4);
    EXPECT_FALSE(events[2].message.has_value());
}

TEST_F(ForeignPipelineTest, BareStatusResult) {
    scriptRun([](FakeObject*, FakeObject*) { return newInt(3); });
    auto result = run();
    EXPECT_EQ(result.status, 3);
    EXPECT_FALSE(result.hadTimings);
}

TEST_F(ForeignPipelineTest, NonIntegerResultIsUnexpectedShape) {
    scriptRun([](FakeObject*, FakeObject*) { return newStr("done"); });
    try {
        (void)run();
        FAIL() << "expected UnexpectedResultShape";
    } catch (const UnexpectedResultShape& e) {
        EXPECT_NE(std::string(e.what()).find("returned done"), std::string::npos);
    }
    EXPECT_EQ(fakeState().lockDepth.load(), 0);
}

TEST_F(ForeignPipelineTest, TupleWithoutIntegerStatusIsUnexpectedShape) {
    scriptRun([](FakeObject*, FakeObject*) { return newTuple({newStr("ok")}); });
    EXPECT_THROW((void)run(), UnexpectedResultShape);
}

TEST_F(ForeignPipelineTest, OversizedCountsArePinnedToIntRange) {
    scriptRun([](FakeObject*, FakeObject* kwargs) -> FakeObject* {
        FakeObject* callback = kwarg(kwargs, "progress_callback");
        if (!callObject(callback, {newInt(5000000000L), newInt(-5000000000L)})) return nullptr;
        return newInt(0);
    });
    std::vector<ProgressEvent> events;
    (void)run(&events);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].chunk.value_or(0), INT_MAX);
    EXPECT_EQ(events[0].total.value_or(0), INT_MIN);
}

TEST_F(ForeignPipelineTest, StopFromCallbackRaisesInterruptInForeignCode) {
    FakeObject* raised = nullptr;
    scriptRun([&raised](FakeObject*, FakeObject* kwargs) -> FakeObject* {
        FakeObject* callback = kwarg(kwargs, "progress_callback");
        if (!callObject(callback, {newInt(1), newInt(10)})) {
            raised = pendingErrorType();
            return nullptr;
        }
        return newInt(0);
    });

    try {
        (void)run(nullptr, false);
        FAIL() << "expected ForeignException";
    } catch (const ForeignException& e) {
        EXPECT_TRUE(e.interrupted());
        EXPECT_EQ(e.typeName(), "KeyboardInterrupt");
    }
    EXPECT_EQ(raised, keyboardInterruptType());
    EXPECT_EQ(pendingErrorType(), nullptr);
}

TEST_F(ForeignPipelineTest, ForeignErrorCarriesTraceback) {
    scriptRun([](FakeObject*, FakeObject*) { return raiseError(valueErrorType(), "unsupported document"); });
    try {
        (void)run();
        FAIL() << "expected ForeignException";
    } catch (const ForeignException& e) {
        EXPECT_FALSE(e.interrupted());
        EXPECT_EQ(e.typeName(), "ValueError");
        EXPECT_EQ(e.message(), "unsupported document");
        EXPECT_EQ(e.traceback().rfind("Traceback (most recent call last):\n", 0), 0u);
        EXPECT_NE(e.traceback().find("ValueError: unsupported document"), std::string::npos);
    }
}

TEST_F(ForeignPipelineTest, CallbackKeptPastTheRunIsInert) {
    FakeObject* kept = nullptr;
    scriptRun([&kept](FakeObject*, FakeObject* kwargs) {
        kept = kwarg(kwargs, "progress_callback");
        return newInt(0);
    });
    std::vector<ProgressEvent> events;
    (void)run(&events);

    ASSERT_NE(kept, nullptr);
    FakeObject* result = interpreter_->withLock([&] { return callObject(kept, {newInt(1), newInt(2)}); });
    EXPECT_EQ(result, noneObject());
    EXPECT_TRUE(events.empty());
}

TEST_F(ForeignPipelineTest, ImportPipelineRequiresEntryPoint) {
    (void)registerModule("redact.pipeline", {{"scrub_metadata_only", newFunction([](FakeObject*, FakeObject*) {
                                                  return noneObject();
                                              })}});
    EXPECT_THROW(interpreter_->withLock([&] { pipeline_->importPipeline(); }), UnexpectedResultShape);
}

TEST_F(ForeignPipelineTest, EnvironmentOverlayWritesAndRemovesKeys) {
    FakeObject* environ = registerModule("os", {{"environ", newDict({{"STALE", newStr("1")}})}})->attrs["environ"];
    interpreter_->withLock([&] {
        pipeline_->prepareEnvironment({{"RTBRIDGE_MODEL_HOST", std::string("127.0.0.1:11434")},
                                       {"STALE", std::nullopt},
                                       {"NEVER_SET", std::nullopt}});
    });
    ASSERT_EQ(environ->entries.count("RTBRIDGE_MODEL_HOST"), 1u);
    EXPECT_EQ(environ->entries["RTBRIDGE_MODEL_HOST"]->text, "127.0.0.1:11434");
    EXPECT_EQ(environ->entries.count("STALE"), 0u);
    EXPECT_EQ(pendingErrorType(), nullptr);
}

TEST_F(ForeignPipelineTest, ScrubReadsSummaryAndReport) {
    (void)registerModule("redact.pipeline", {{"scrub_metadata_only", newFunction([](FakeObject*, FakeObject*) {
        FakeObject* summary = newDict({{"total_cleaned", newInt(4)},
                                       {"total_preserved", newInt(2)},
                                       {"embedded_docs_count", newInt(1)}});
        return newTuple({newBool(true), noneObject(), newDict({{"summary", summary}})});
    })}});

    auto result = interpreter_->withLock([&] { return pipeline_->scrubMetadata("/in.docx", "/out.docx", false); });
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.error.empty());
    ASSERT_TRUE(result.summary.has_value());
    EXPECT_EQ(result.summary->cleaned, 4);
    EXPECT_EQ(result.summary->preserved, 2);
    EXPECT_EQ(result.summary->embeddedDocuments, 1);
    EXPECT_NE(result.reportJson.find("\"total_cleaned\": 4"), std::string::npos);
}

TEST_F(ForeignPipelineTest, ScrubWithShortTupleReportsError) {
    (void)registerModule("redact.pipeline", {{"scrub_metadata_only", newFunction([](FakeObject*, FakeObject*) {
        return newTuple({newBool(true)});
    })}});
    auto result = interpreter_->withLock([&] { return pipeline_->scrubMetadata("/in.docx", "/out.docx", false); });
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "Unexpected result from pipeline");
}

TEST_F(ForeignPipelineTest, HtmlReportReturnsPath) {
    (void)registerModule("redact.report_html", {{"generate_report_from_json_file",
                                                 newFunction([](FakeObject*, FakeObject* kwargs) {
                                                     return newStr(kwarg(kwargs, "json_path")->text + ".html");
                                                 })}});
    auto path = interpreter_->withLock([&] { return pipeline_->generateScrubHtml("/tmp/report.json"); });
    EXPECT_EQ(path.value_or(""), "/tmp/report.json.html");
}

namespace {

// Drives the bridge with its own ForeignPipeline against the fake runtime.
class ForeignBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        (void)testRoot();
        resetFakeRuntime();
    }

    void TearDown() override { resetFakeRuntime(); }

    std::unique_ptr<Bridge> makeBridge(std::shared_ptr<MapOverrides> overrides = nullptr) {
        auto options = fakeBridgeOptions(std::make_shared<FakePipelineScript>(), std::move(overrides));
        options.pipelineFactory = nullptr;
        return std::make_unique<Bridge>(std::move(options));
    }

    static RedactionRequest request() {
        RedactionRequest r;
        r.inputPath = "/docs/in.docx";
        r.outputPath = "/docs/out.docx";
        r.reportPath = "/docs/report.json";
        return r;
    }

    // Reports progress until the host asks it to stop, like a chunk loop.
    static FakeFunction chunkLoop(std::promise<void>* started = nullptr) {
        auto once = std::make_shared<std::once_flag>();
        return [started, once](FakeObject*, FakeObject* kwargs) -> FakeObject* {
            FakeObject* callback = kwarg(kwargs, "progress_callback");
            const auto deadline = std::chrono::steady_clock::now() + 5s;
            for (long chunk = 1; std::chrono::steady_clock::now() < deadline; ++chunk) {
                if (!callObject(callback, {newInt(chunk), newInt(1000)})) {
                    return nullptr;
                }
                if (started) {
                    std::call_once(*once, [started] { started->set_value(); });
                }
                std::this_thread::sleep_for(5ms);
            }
            return newInt(0);
        };
    }
};

}

TEST_F(ForeignBridgeTest, StreamsBothProgressShapesAndSucceeds) {
    (void)registerModule("redact.pipeline", {{"run_redaction", newFunction([](FakeObject*, FakeObject* kwargs) -> FakeObject* {
        FakeObject* callback = kwarg(kwargs, "progress_callback");
        if (!callObject(callback, {newObject({{"phase", newStr("rules")}, {"overall_progress", newFloat(0.1)}})})) {
            return nullptr;
        }
        if (!callObject(callback, {newInt(1), newInt(2), newStr("first")})) return nullptr;
        if (!callObject(callback, {newInt(2), newInt(2), newStr("second")})) return nullptr;
        return newTuple({newInt(0), newDict()});
    })}});

    auto bridge = makeBridge();
    auto job = bridge->runRedactionWithProgress(request());
    std::vector<ProgressEvent> events;
    while (auto event = job.events->next()) {
        events.push_back(*event);
    }

    EXPECT_EQ(job.outcome.get().kind, OutcomeKind::Success);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].phaseIdentifier.value_or(""), "rules");
    EXPECT_EQ(events[1].message.value_or(""), "first");
    EXPECT_EQ(events[2].chunk.value_or(-1), 2);
    EXPECT_EQ(job.events->finishCalls(), 1u);
}

TEST_F(ForeignBridgeTest, ForeignErrorBecomesFailureWithTraceback) {
    (void)registerModule("redact.pipeline", {{"run_redaction", newFunction([](FakeObject*, FakeObject*) {
        return raiseError(valueErrorType(), "unsupported document");
    })}});
    auto bridge = makeBridge();
    auto outcome = bridge->runRedaction(request());
    EXPECT_EQ(outcome.kind, OutcomeKind::Failure);
    EXPECT_EQ(outcome.reason.rfind("ValueError: unsupported document\nTraceback", 0), 0u);
}

TEST_F(ForeignBridgeTest, UserCancelUnwindsChunkLoop) {
    std::promise<void> started;
    auto startedFuture = started.get_future();
    (void)registerModule("redact.pipeline", {{"run_redaction", newFunction(chunkLoop(&started))}});

    auto bridge = makeBridge();
    auto job = bridge->runRedactionWithProgress(request());
    ASSERT_EQ(startedFuture.wait_for(2s), std::future_status::ready);
    bridge->cancelCurrentOperation();

    EXPECT_EQ(job.outcome.get().kind, OutcomeKind::Cancelled);
    while (job.events->next()) {
    }
    EXPECT_EQ(job.events->finishCalls(), 1u);
}

TEST_F(ForeignBridgeTest, StepTimeoutUnwindsChunkLoop) {
    (void)registerModule("redact.pipeline", {{"run_redaction", newFunction(chunkLoop())}});
    auto bridge = makeBridge();
    auto r = request();
    r.processingStepTimeout = 0.1;

    const auto started = std::chrono::steady_clock::now();
    auto outcome = bridge->runRedaction(r);
    EXPECT_EQ(outcome.kind, OutcomeKind::Failure);
    EXPECT_EQ(outcome.reason.rfind("Step timeout: processing", 0), 0u);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 3s);
}

TEST_F(ForeignBridgeTest, VeryLargeStepOverrideLetsJobFinish) {
    auto overrides = std::make_shared<MapOverrides>();
    overrides->set("RTBRIDGE_PROCESSING_STEP_TIMEOUT", "1e12");
    (void)registerModule("redact.pipeline", {{"run_redaction", newFunction([](FakeObject*, FakeObject*) {
        std::this_thread::sleep_for(100ms);
        return newInt(0);
    })}});
    auto bridge = makeBridge(overrides);
    auto outcome = bridge->runRedaction(request());
    EXPECT_EQ(outcome.kind, OutcomeKind::Success) << outcome.reason;
}
