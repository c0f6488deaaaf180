/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/bridge.hpp"
#include "rtbridge/environment.hpp"
#include "rtbridge/errors.hpp"
#include "rtbridge/interpreter.hpp"
#include "rtbridge/logger.hpp"
#include "rtbridge/outcome.hpp"
#include "rtbridge/supervisor.hpp"
#include "rtbridge/timer.hpp"
#include "rtbridge/worker.hpp"
#include <algorithm>
#include <cstdlib>
#include <thread>

namespace rtbridge {

namespace {

using Clock = std::chrono::steady_clock;

// Host variables mirrored into the runtime before every job.
const std::vector<std::string>& syncedVariables() {
    static const std::vector<std::string> keys = {
        "RTBRIDGE_METADATA_ARGS",
        "RTBRIDGE_METADATA_PRESET",
        "RTBRIDGE_METADATA_SETTINGS_JSON",
        "RTBRIDGE_SCRUB_REPORT_PATH",
        "RTBRIDGE_METADATA_ONLY",
        "RTBRIDGE_RULE_FILTER",
        "RTBRIDGE_EXCLUDED_WORDS_PATH",
        "RTBRIDGE_SYSTEM_PROMPT_PATH",
        "RTBRIDGE_LOG_PATH"
    };
    return keys;
}

// Completes an async job exactly once: sets the outcome and closes the stream.
// A job dropped before it ran completes as abandoned.
class JobCompletion final {
public:
    JobCompletion(std::shared_ptr<ProgressStream> events, std::promise<RunOutcome> promise)
        : events_(std::move(events)), promise_(std::move(promise)) {}

    ~JobCompletion() {
        if (!done_) {
            LOG_WARN("Job abandoned before it ran");
            complete(RunOutcome::failure("job abandoned"));
        }
    }

    JobCompletion(const JobCompletion&) = delete;
    JobCompletion& operator=(const JobCompletion&) = delete;

    void complete(RunOutcome outcome) noexcept {
        if (done_) {
            return;
        }
        done_ = true;
        try {
            promise_.set_value(std::move(outcome));
        } catch (const std::future_error& e) {
            LOG_ERROR("Job outcome already set: " + std::string(e.what()));
        }
        events_->finish();
    }

    [[nodiscard]] const std::shared_ptr<ProgressStream>& events() const noexcept { return events_; }

private:
    std::shared_ptr<ProgressStream> events_;
    std::promise<RunOutcome> promise_;
    bool done_ = false;
};

// Ends the job's generation on every exit path.
class GenerationScope final {
public:
    GenerationScope(CancellationCoordinator& cancellation, CancellationPredicate predicate)
        : cancellation_(cancellation), token_(cancellation.beginGeneration()), logScope_(token_) {
        if (predicate) {
            cancellation_.setExternalPredicate(std::move(predicate));
        }
    }
    ~GenerationScope() { cancellation_.endGeneration(token_); }

    GenerationScope(const GenerationScope&) = delete;
    GenerationScope& operator=(const GenerationScope&) = delete;

    [[nodiscard]] RunToken token() const noexcept { return token_; }

private:
    CancellationCoordinator& cancellation_;
    RunToken token_;
    LogRunScope logScope_;
};

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

}

Bridge::Bridge(BridgeOptions options)
    : options_(std::move(options)) {
    setThreadName("Main");

    if (!options_.resolver) {
        options_.resolver = std::make_unique<DynamicSymbolResolver>();
    }
    if (!options_.overrides) {
        options_.overrides = std::make_shared<EnvironmentOverrides>();
    }
    tempDir_ = options_.tempDir.empty() ? defaultIsolatedTempDir() : options_.tempDir;
    timeouts_ = std::make_unique<TimeoutConfig>(options_.overrides);
    pipelineOptions_ = PipelineOptions::fromConfig(*timeouts_);

    LOG_DEBUG("========================================");
    LOG_DEBUG("rtbridge starting");
    LOG_DEBUG("Temp dir: " + tempDir_.string());
    LOG_DEBUG("Pipeline module: " + pipelineOptions_.module);
    LOG_DEBUG("Model host: " + modelHost());
    LOG_DEBUG("========================================");

    interpreter_ = std::make_unique<Interpreter>(std::move(options_.resolver));
    timers_ = std::make_unique<TimerScheduler>("Timer");
    worker_ = std::make_unique<AffinityThread>("Affinity");
    if (!timers_->start() || !worker_->start()) {
        shutdown();
        throw std::runtime_error("Failed to start bridge threads");
    }

    supervisor_ = std::make_unique<PhaseSupervisor>(*interpreter_, cancellation_, *timers_,
                                                    timeouts_->tracingEnabled());
    if (options_.pipelineFactory) {
        pipeline_ = options_.pipelineFactory(*interpreter_, pipelineOptions_);
    } else {
        pipeline_ = std::make_unique<ForeignPipeline>(*interpreter_, pipelineOptions_);
    }
    if (!pipeline_) {
        shutdown();
        throw std::runtime_error("Pipeline factory returned no pipeline");
    }

    // The interrupt task queues behind the running job, so by the time it runs
    // that generation has usually ended and the task is skipped. A running job
    // unwinds when its progress callback next returns false. Foreign code that
    // never reports progress keeps running until it returns on its own.
    cancellation_.setInterruptHook([this](RunToken token, const std::string& source) {
        const bool posted = worker_->performAsync([this, token, source] {
            if (cancellation_.isActive(token)) {
                interpreter_->interrupt();
            } else {
                LOG_DEBUG("Interrupt for finished run " + std::to_string(token) + " (" + source + ") skipped");
            }
        });
        if (!posted) {
            LOG_DEBUG("Interrupt not posted: affinity thread stopped");
        }
    });

    const auto warmup = options_.warmupModules.value_or(pipelineOptions_.warmupModules());
    const auto filter = timeouts_->value("RULE_FILTER");

    try {
        config_ = worker_->perform([&] {
            InitOptions init;
            init.locator = options_.locator ? *options_.locator : LocatorOptions::fromExecutable();
            init.tempDir = tempDir_;
            init.deadline = options_.initTimeout;
            RuntimeConfig config = interpreter_->initialize(init);

            try {
                interpreter_->warmUp(warmup);
            } catch (const ForeignException& e) {
                throw RuntimeLoadFailed("Warm-up import failed: " + std::string(e.what()));
            }

            if (filter) {
                interpreter_->withLock([&] { pipeline_->setEnvironment("RTBRIDGE_RULE_FILTER", filter); });
                LOG_DEBUG("Rule filter propagated to runtime");
            }
            return config;
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Bridge construction failed: " + std::string(e.what()));
        shutdown();
        throw;
    }

    LOG_INFO("rtbridge ready (runtime home: " + config_.home + ")");
}

Bridge::~Bridge() {
    shutdown();
}

void Bridge::shutdown() noexcept {
    try {
        if (worker_ && worker_->isRunning()) {
            // Unwind a running job at its next checkpoint instead of waiting it out.
            const RunToken token = cancellation_.currentGeneration();
            if (cancellation_.isActive(token)) {
                cancellation_.requestCancel("shutdown");
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Shutdown cancel failed: " + std::string(e.what()));
    }

    if (worker_) {
        worker_->stop();
    }
    if (timers_) {
        timers_->stop();
    }
}

bool Bridge::isRulesMode(const std::string& mode) noexcept {
    return mode == "rules" || mode == "rules-only" || mode == "strict";
}

RedactionRequest Bridge::asRulesRequest(RedactionRequest request) {
    request.mode = "strict";
    request.backend = "mock";
    request.model = "mock";
    return request;
}

std::string Bridge::modelHost() const {
    return resolveLoopbackHost(timeouts_->value("MODEL_HOST"));
}

bool Bridge::modelServiceAvailable() const {
    const auto port = portOf(modelHost()).value_or(kDefaultModelServicePort);
    const bool reachable = isPortReachable(port);
    LOG_DEBUG("Model service on port " + std::to_string(port) + (reachable ? " reachable" : " unreachable"));
    return reachable;
}

EnvironmentOverlay Bridge::buildOverlay(bool modelBacked) const {
    EnvironmentOverlay overlay;
    std::optional<std::string> filter;
    {
        std::lock_guard<std::mutex> lock(filterMutex_);
        filter = ruleFilter_;
    }

    for (const auto& key : syncedVariables()) {
        if (key == "RTBRIDGE_RULE_FILTER" && filter) {
            overlay.emplace_back(key, filter);
            continue;
        }
        overlay.emplace_back(key, options_.overrides->get(key));
    }

    if (modelBacked) {
        const std::string host = modelHost();
        overlay.emplace_back("OLLAMA_HOST", host);
        overlay.emplace_back("RTBRIDGE_MODEL_HOST", host);
        for (const char* proxy : {"HTTP_PROXY", "HTTPS_PROXY", "ALL_PROXY",
                                  "http_proxy", "https_proxy", "all_proxy"}) {
            overlay.emplace_back(proxy, std::string());
        }
        overlay.emplace_back("NO_PROXY", std::string("127.0.0.1,localhost"));
        overlay.emplace_back("no_proxy", std::string("127.0.0.1,localhost"));
    }
    overlay.emplace_back("NO_COLOR", std::string("1"));
    return overlay;
}

RunOutcome Bridge::executeRedaction(const RedactionRequest& request, JobKind kind,
                                    CancellationPredicate shouldCancel,
                                    const std::shared_ptr<ProgressStream>& events) {
    GenerationScope generation(cancellation_, std::move(shouldCancel));
    const RunToken token = generation.token();
    const auto jobStart = Clock::now();
    const bool modelBacked = !isRulesMode(request.mode);

    LOG_INFO("Job " + std::to_string(token) + " started: " + request.inputPath + " (mode=" + request.mode + ")");

    RunOutcome outcome;
    try {
        if (kind == JobKind::Rules && events) {
            const int totalSteps = 5;
            for (int step = 1; step <= totalSteps; ++step) {
                cancellation_.check();
                ProgressEvent event;
                event.chunk = step;
                event.total = totalSteps;
                event.message = step == totalSteps ? "Finalizing rules-based redaction..."
                                                   : "Applying redaction rules...";
                events->push(std::move(event));
                std::this_thread::sleep_for(options_.rulesStepInterval);
            }
        }

        if (modelBacked && options_.checkModelService && !modelServiceAvailable()) {
            LOG_ERROR("Model service not reachable at " + modelHost());
            return RunOutcome::failure("Model service not reachable at " + modelHost());
        }

        const Phase envSetup{"env_setup", timeouts_->resolve("env_setup", 300, 600)};
        const Phase imports{"imports", timeouts_->resolve("imports", 180, 600)};
        const Phase pipelineImport{"pipeline_import", timeouts_->resolve("pipeline_import", 180, 600)};

        Phase processing{"processing", {}};
        if (modelBacked) {
            const double step = timeouts_->step("processing", 600);
            processing.timeouts = timeouts_->resolve("processing", step, std::max(3600.0, step));
        } else {
            processing.timeouts = timeouts_->resolve("processing", 180, 7200);
        }
        if (request.processingStepTimeout && *request.processingStepTimeout > 0) {
            processing.timeouts.step = *request.processingStepTimeout;
        }

        supervisor_->runPhase(envSetup, token, jobStart, [&] {
            interpreter_->clearPendingInterrupts();
            pipeline_->prepareEnvironment(buildOverlay(modelBacked));
        });
        supervisor_->runPhase(imports, token, jobStart, [&] { pipeline_->importDependencies(); });
        supervisor_->runPhase(pipelineImport, token, jobStart, [&] { pipeline_->importPipeline(); });

        ProgressCallback progress = [this, events](const ProgressEvent& event) {
            if (events) {
                events->push(event);
            }
            return !cancellation_.isCancelled();
        };

        const PipelineResult result = supervisor_->runPhase(processing, token, jobStart, [&] {
            return pipeline_->runRedaction(request, progress);
        });
        if (result.hadTimings) {
            LOG_DEBUG("Pipeline returned timings");
        }
        outcome = OutcomeClassifier::fromStatus(result.status);
    } catch (...) {
        outcome = OutcomeClassifier::fromException(std::current_exception());
    }

    LOG_INFO("Job " + std::to_string(token) + " finished: " + toString(outcome.kind) +
             (outcome.reason.empty() ? "" : " (" + outcome.reason.substr(0, 200) + ")") +
             " in " + std::to_string(secondsSince(jobStart)) + "s");
    return outcome;
}

ProgressJob Bridge::submit(std::function<RunOutcome(const std::shared_ptr<ProgressStream>&)> job) {
    auto events = std::make_shared<ProgressStream>();
    std::promise<RunOutcome> promise;
    ProgressJob handle{events, promise.get_future()};

    auto completion = std::make_shared<JobCompletion>(events, std::move(promise));
    const bool queued = worker_->performAsync([completion, job = std::move(job)] {
        RunOutcome outcome;
        try {
            outcome = job(completion->events());
        } catch (...) {
            outcome = OutcomeClassifier::fromException(std::current_exception());
        }
        completion->complete(std::move(outcome));
    });
    if (!queued) {
        completion->complete(RunOutcome::failure("affinity thread stopped"));
    }
    return handle;
}

RunOutcome Bridge::runRedaction(const RedactionRequest& request, CancellationPredicate shouldCancel) {
    try {
        return worker_->perform([&] {
            return executeRedaction(request, JobKind::Redaction, std::move(shouldCancel), nullptr);
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Redaction not run: " + std::string(e.what()));
        return RunOutcome::failure(e.what());
    }
}

ProgressJob Bridge::runRedactionWithProgress(const RedactionRequest& request, CancellationPredicate shouldCancel) {
    return submit([this, request, shouldCancel](const std::shared_ptr<ProgressStream>& events) {
        return executeRedaction(request, JobKind::Redaction, shouldCancel, events);
    });
}

RunOutcome Bridge::runRules(RedactionRequest request, CancellationPredicate shouldCancel) {
    const auto rules = asRulesRequest(std::move(request));
    try {
        return worker_->perform([&] {
            return executeRedaction(rules, JobKind::Rules, std::move(shouldCancel), nullptr);
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Rules redaction not run: " + std::string(e.what()));
        return RunOutcome::failure(e.what());
    }
}

ProgressJob Bridge::runRulesWithProgress(RedactionRequest request, CancellationPredicate shouldCancel) {
    auto rules = asRulesRequest(std::move(request));
    return submit([this, rules, shouldCancel](const std::shared_ptr<ProgressStream>& events) {
        return executeRedaction(rules, JobKind::Rules, shouldCancel, events);
    });
}

ScrubResult Bridge::scrubMetadataOnly(const std::string& inputPath, const std::string& outputPath) {
    LOG_INFO("Metadata scrub: " + inputPath);
    const auto started = Clock::now();
    ScrubResult result;
    try {
        result = worker_->perform([&] {
            GenerationScope generation(cancellation_, nullptr);
            const Phase scrub{"metadata_scrub", timeouts_->resolve("metadata_scrub", 300, 600)};
            return supervisor_->runPhase(scrub, generation.token(), Clock::now(), [&] {
                interpreter_->clearPendingInterrupts();
                pipeline_->prepareEnvironment(buildOverlay(false));
                return pipeline_->scrubMetadata(inputPath, outputPath, false);
            });
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Metadata scrub error: " + std::string(e.what()));
        result = ScrubResult{};
        result.error = "Runtime error: " + std::string(e.what());
    }

    if (result.ok) {
        LOG_INFO("Metadata scrub ok in " + std::to_string(secondsSince(started)) + "s");
        if (result.summary) {
            LOG_INFO("Metadata report: cleaned=" + std::to_string(result.summary->cleaned) +
                     " preserved=" + std::to_string(result.summary->preserved) +
                     " embedded=" + std::to_string(result.summary->embeddedDocuments));
        }
    } else {
        LOG_WARN("Metadata scrub failed: " + (result.error.empty() ? std::string("unknown") : result.error));
    }
    return result;
}

std::optional<std::string> Bridge::generateScrubHtml(const std::string& jsonPath) {
    try {
        return worker_->perform([&] {
            GenerationScope generation(cancellation_, nullptr);
            const Phase report{"report_html", timeouts_->resolve("report_html", 60, 120)};
            return supervisor_->runPhase(report, generation.token(), Clock::now(), [&] {
                return pipeline_->generateScrubHtml(jsonPath);
            });
        });
    } catch (const std::exception& e) {
        LOG_ERROR("HTML report generation failed: " + std::string(e.what()));
        return std::nullopt;
    }
}

void Bridge::updateRuleFilter(const std::string& serialized) {
    {
        std::lock_guard<std::mutex> lock(filterMutex_);
        ruleFilter_ = serialized;
    }
    ::setenv("RTBRIDGE_RULE_FILTER", serialized.c_str(), 1);

    const bool posted = worker_->performAsync([this, serialized] {
        try {
            interpreter_->withLock([&] { pipeline_->setEnvironment("RTBRIDGE_RULE_FILTER", serialized); });
            LOG_DEBUG("Rule filter updated in runtime");
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to update rule filter in runtime: " + std::string(e.what()));
        }
    });
    if (!posted) {
        LOG_WARN("Rule filter not propagated: affinity thread stopped");
    }
}

void Bridge::cancelCurrentOperation(const std::string& source) {
    cancellation_.requestCancel(source);
}

void Bridge::clearCancellationRequest() {
    cancellation_.clear();
}

bool Bridge::cleanupTempDir() {
    try {
        return worker_->perform([this] { return resetIsolatedTempDir(tempDir_); });
    } catch (const std::exception& e) {
        LOG_ERROR("Temp dir cleanup not run: " + std::string(e.what()));
        return false;
    }
}

}
