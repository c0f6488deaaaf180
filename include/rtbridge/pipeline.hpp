/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "rtbridge/types.hpp"

namespace rtbridge {

class Interpreter;
class TimeoutConfig;

// Ordered key/value updates for the runtime's process environment. An absent
// value removes the key.
using EnvironmentOverlay = std::vector<std::pair<std::string, std::optional<std::string>>>;

struct PipelineResult {
    long status = 0;
    bool hadTimings = false;
};

// The foreign redaction pipeline. Every call runs on the affinity thread with
// the runtime lock held.
class Pipeline {
public:
    virtual ~Pipeline() = default;

    virtual void prepareEnvironment(const EnvironmentOverlay& overlay) = 0;
    virtual void importDependencies() = 0;
    virtual void importPipeline() = 0;

    // Throws UnexpectedResultShape when the status cannot be read.
    [[nodiscard]] virtual PipelineResult runRedaction(const RedactionRequest& request,
                                                      const ProgressCallback& progress) = 0;
    [[nodiscard]] virtual ScrubResult scrubMetadata(const std::string& inputPath,
                                                    const std::string& outputPath, bool debug) = 0;
    [[nodiscard]] virtual std::optional<std::string> generateScrubHtml(const std::string& jsonPath) = 0;

    virtual void setEnvironment(const std::string& key, const std::optional<std::string>& value) = 0;
};

struct PipelineOptions {
    std::string module = "redact.pipeline";
    std::string reportModule = "redact.report_html";
    std::vector<std::string> dependencies = {"lxml", "docx"};

    // Honors <PREFIX>_PIPELINE_MODULE; the report module follows its package.
    [[nodiscard]] static PipelineOptions fromConfig(const TimeoutConfig& config);

    // sys, os, dependencies, pipeline module.
    [[nodiscard]] std::vector<std::string> warmupModules() const;
};

class ForeignPipeline final : public Pipeline {
public:
    ForeignPipeline(Interpreter& interpreter, PipelineOptions options);

    void prepareEnvironment(const EnvironmentOverlay& overlay) override;
    void importDependencies() override;
    void importPipeline() override;
    [[nodiscard]] PipelineResult runRedaction(const RedactionRequest& request,
                                              const ProgressCallback& progress) override;
    [[nodiscard]] ScrubResult scrubMetadata(const std::string& inputPath,
                                            const std::string& outputPath, bool debug) override;
    [[nodiscard]] std::optional<std::string> generateScrubHtml(const std::string& jsonPath) override;
    void setEnvironment(const std::string& key, const std::optional<std::string>& value) override;

    [[nodiscard]] const PipelineOptions& options() const noexcept { return options_; }

private:
    Interpreter& interpreter_;
    PipelineOptions options_;
};

}
