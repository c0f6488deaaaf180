/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace rtbridge {

// Per-job generation token. Compared for equality only.
using RunToken = std::uint64_t;

enum class OutcomeKind : std::uint8_t { Success, Cancelled, Failure };

struct RunOutcome {
    OutcomeKind kind = OutcomeKind::Failure;
    std::string reason;

    [[nodiscard]] static RunOutcome success() { return {OutcomeKind::Success, ""}; }
    [[nodiscard]] static RunOutcome cancelled() { return {OutcomeKind::Cancelled, ""}; }
    [[nodiscard]] static RunOutcome failure(std::string reason) {
        return {OutcomeKind::Failure, std::move(reason)};
    }

    [[nodiscard]] bool ok() const noexcept { return kind == OutcomeKind::Success; }
    explicit operator bool() const noexcept { return ok(); }
};

[[nodiscard]] const char* toString(OutcomeKind kind) noexcept;

struct ProgressEvent {
    std::optional<std::string> phaseIdentifier;
    std::optional<std::string> phaseDisplayName;
    std::optional<double> phaseProgress;
    std::optional<double> overallProgress;
    std::optional<int> chunk;
    std::optional<int> total;
    std::optional<std::string> message;
};

// Invoked on the affinity thread for every event the foreign side emits.
// Returning false asks the foreign call to unwind at this point.
using ProgressCallback = std::function<bool(const ProgressEvent&)>;

// Caller supplied "has the user given up" check, polled at checkpoints.
using CancellationPredicate = std::function<bool()>;

struct RedactionRequest {
    std::string inputPath;
    std::string outputPath;
    std::string reportPath;
    std::string mode = "enhanced";
    std::string model;
    std::string backend = "ollama";
    int chunkTokens = 500;
    int overlap = 120;
    double temperature = 0.1;
    int seed = 42;
    bool debug = false;
    std::optional<double> processingStepTimeout;
};

struct ScrubSummary {
    long cleaned = 0;
    long preserved = 0;
    long embeddedDocuments = 0;
};

struct ScrubResult {
    bool ok = false;
    std::string error;
    std::optional<ScrubSummary> summary;
    std::string reportJson;
    explicit operator bool() const noexcept { return ok; }
};

}
