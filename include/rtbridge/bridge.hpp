/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rtbridge/cancellation.hpp"
#include "rtbridge/locator.hpp"
#include "rtbridge/pipeline.hpp"
#include "rtbridge/progress.hpp"
#include "rtbridge/symbols.hpp"
#include "rtbridge/timeouts.hpp"
#include "rtbridge/types.hpp"

namespace rtbridge {

class AffinityThread;
class Interpreter;
class PhaseSupervisor;
class TimerScheduler;

using PipelineFactory = std::function<std::unique_ptr<Pipeline>(Interpreter&, const PipelineOptions&)>;

struct BridgeOptions {
    // Defaults: dlopen resolver, executable-relative layout, process environment,
    // ForeignPipeline, PipelineOptions::warmupModules().
    std::unique_ptr<SymbolResolver> resolver;
    std::optional<LocatorOptions> locator;
    std::shared_ptr<const OverrideSource> overrides;
    PipelineFactory pipelineFactory;
    std::optional<std::vector<std::string>> warmupModules;

    std::filesystem::path tempDir;
    std::chrono::duration<double> initTimeout{30.0};

    // Probe the model service before model-backed jobs.
    bool checkModelService = true;
    std::chrono::milliseconds rulesStepInterval{200};
};

struct ProgressJob {
    std::shared_ptr<ProgressStream> events;
    std::future<RunOutcome> outcome;
};

// Owns the runtime, its affinity thread and the timer thread. Jobs are
// serialised FIFO on the affinity thread; construction either yields a ready
// runtime or throws.
class Bridge final {
public:
    explicit Bridge(BridgeOptions options = {});
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;
    Bridge(Bridge&&) = delete;
    Bridge& operator=(Bridge&&) = delete;

    [[nodiscard]] RunOutcome runRedaction(const RedactionRequest& request,
                                          CancellationPredicate shouldCancel = {});
    [[nodiscard]] ProgressJob runRedactionWithProgress(const RedactionRequest& request,
                                                       CancellationPredicate shouldCancel = {});

    // Deterministic rules-only redaction through the mock backend.
    [[nodiscard]] RunOutcome runRules(RedactionRequest request, CancellationPredicate shouldCancel = {});
    [[nodiscard]] ProgressJob runRulesWithProgress(RedactionRequest request,
                                                   CancellationPredicate shouldCancel = {});

    [[nodiscard]] ScrubResult scrubMetadataOnly(const std::string& inputPath, const std::string& outputPath);
    [[nodiscard]] std::optional<std::string> generateScrubHtml(const std::string& jsonPath);

    // Host environment immediately, the runtime's os.environ asynchronously.
    void updateRuleFilter(const std::string& serialized);

    void cancelCurrentOperation(const std::string& source = "user");
    void clearCancellationRequest();

    [[nodiscard]] bool modelServiceAvailable() const;
    [[nodiscard]] std::string modelHost() const;

    bool cleanupTempDir();

    [[nodiscard]] const RuntimeConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::filesystem::path& tempDir() const noexcept { return tempDir_; }
    [[nodiscard]] RunToken currentGeneration() const { return cancellation_.currentGeneration(); }

    [[nodiscard]] static bool isRulesMode(const std::string& mode) noexcept;

private:
    enum class JobKind { Redaction, Rules };

    [[nodiscard]] RunOutcome executeRedaction(const RedactionRequest& request, JobKind kind,
                                              CancellationPredicate shouldCancel,
                                              const std::shared_ptr<ProgressStream>& events);
    [[nodiscard]] ProgressJob submit(std::function<RunOutcome(const std::shared_ptr<ProgressStream>&)> job);
    [[nodiscard]] EnvironmentOverlay buildOverlay(bool modelBacked) const;
    [[nodiscard]] static RedactionRequest asRulesRequest(RedactionRequest request);
    void shutdown() noexcept;

    BridgeOptions options_;
    std::filesystem::path tempDir_;
    std::unique_ptr<TimeoutConfig> timeouts_;
    PipelineOptions pipelineOptions_;

    CancellationCoordinator cancellation_;
    std::unique_ptr<Interpreter> interpreter_;
    std::unique_ptr<TimerScheduler> timers_;
    std::unique_ptr<AffinityThread> worker_;
    std::unique_ptr<PhaseSupervisor> supervisor_;
    std::unique_ptr<Pipeline> pipeline_;

    RuntimeConfig config_;

    mutable std::mutex filterMutex_;
    std::optional<std::string> ruleFilter_;
};

}
