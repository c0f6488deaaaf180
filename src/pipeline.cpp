/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/pipeline.hpp"
#include "rtbridge/errors.hpp"
#include "rtbridge/interpreter.hpp"
#include "rtbridge/logger.hpp"
#include "rtbridge/timeouts.hpp"

namespace rtbridge {

PipelineOptions PipelineOptions::fromConfig(const TimeoutConfig& config) {
    PipelineOptions options;
    if (auto module = config.value("PIPELINE_MODULE")) {
        options.module = *module;
        const auto dot = module->rfind('.');
        options.reportModule = dot == std::string::npos ? "report_html" : module->substr(0, dot) + ".report_html";
    }
    return options;
}

std::vector<std::string> PipelineOptions::warmupModules() const {
    std::vector<std::string> modules = {"sys", "os"};
    modules.insert(modules.end(), dependencies.begin(), dependencies.end());
    modules.push_back(module);
    return modules;
}

ForeignPipeline::ForeignPipeline(Interpreter& interpreter, PipelineOptions options)
    : interpreter_(interpreter), options_(std::move(options)) {
    LOG_DEBUG("Pipeline module: " + options_.module + ", report module: " + options_.reportModule);
}

void ForeignPipeline::prepareEnvironment(const EnvironmentOverlay& overlay) {
    auto os = interpreter_.importModule("os");
    auto environ = interpreter_.getAttr(os, "environ");
    for (const auto& [key, value] : overlay) {
        if (value) {
            interpreter_.setMapping(environ, key, *value);
        } else {
            interpreter_.removeMapping(environ, key);
        }
    }
    LOG_DEBUG("Synced " + std::to_string(overlay.size()) + " environment key(s) into the runtime");
}

void ForeignPipeline::importDependencies() {
    for (const auto& name : options_.dependencies) {
        auto module = interpreter_.importModule(name);
        LOG_DEBUG("Imported " + name);
    }
}

void ForeignPipeline::importPipeline() {
    auto module = interpreter_.importModule(options_.module);
    if (!interpreter_.hasAttr(module, "run_redaction")) {
        throw UnexpectedResultShape(options_.module + " has no run_redaction");
    }
}

PipelineResult ForeignPipeline::runRedaction(const RedactionRequest& request, const ProgressCallback& progress) {
    auto& rt = interpreter_;
    auto module = rt.importModule(options_.module);
    auto run = rt.getAttr(module, "run_redaction");

    auto kwargs = rt.newDict();
    rt.setItem(kwargs, "input_path", rt.newString(request.inputPath));
    rt.setItem(kwargs, "output_path", rt.newString(request.outputPath));
    rt.setItem(kwargs, "report_path", rt.newString(request.reportPath));
    rt.setItem(kwargs, "mode", rt.newString(request.mode));
    rt.setItem(kwargs, "model_id", rt.newString(request.model));
    rt.setItem(kwargs, "chunk_tokens", rt.newInt(request.chunkTokens));
    rt.setItem(kwargs, "overlap", rt.newInt(request.overlap));
    rt.setItem(kwargs, "temperature", rt.newFloat(request.temperature));
    rt.setItem(kwargs, "seed", rt.newInt(request.seed));
    rt.setItem(kwargs, "debug", rt.newBool(request.debug));
    rt.setItem(kwargs, "backend", rt.newString(request.backend));

    std::optional<ForeignCallback> callback;
    if (progress) {
        callback.emplace(rt.makeProgressCallback(progress));
        rt.setItem(kwargs, "progress_callback", callback->callable());
    }

    LOG_INFO("Calling " + options_.module + ".run_redaction (mode=" + request.mode + ", backend=" +
             request.backend + ")");
    auto result = rt.call(run, {}, kwargs);

    PipelineResult outcome;
    if (rt.isTuple(result)) {
        const std::size_t size = rt.tupleSize(result.get());
        if (size == 0) {
            throw UnexpectedResultShape("run_redaction returned an empty tuple");
        }
        auto status = rt.toLong(rt.tupleItem(result.get(), 0).get());
        if (!status) {
            throw UnexpectedResultShape("run_redaction tuple does not start with an int status");
        }
        outcome.status = *status;
        outcome.hadTimings = size > 1;
        return outcome;
    }

    auto status = rt.toLong(result.get());
    if (!status) {
        throw UnexpectedResultShape("run_redaction returned " +
                                    rt.toText(result.get()).value_or("None") + " instead of an int status");
    }
    outcome.status = *status;
    return outcome;
}

ScrubResult ForeignPipeline::scrubMetadata(const std::string& inputPath, const std::string& outputPath, bool debug) {
    auto& rt = interpreter_;
    auto module = rt.importModule(options_.module);
    auto scrub = rt.getAttr(module, "scrub_metadata_only");

    auto kwargs = rt.newDict();
    rt.setItem(kwargs, "input_path", rt.newString(inputPath));
    rt.setItem(kwargs, "output_path", rt.newString(outputPath));
    rt.setItem(kwargs, "debug", rt.newBool(debug));

    auto raw = rt.call(scrub, {}, kwargs);

    ScrubResult result;
    if (!rt.isTuple(raw) || rt.tupleSize(raw.get()) < 3) {
        result.error = "Unexpected result from pipeline";
        return result;
    }

    result.ok = rt.truthy(rt.tupleItem(raw.get(), 0).get());
    auto error = rt.toText(rt.tupleItem(raw.get(), 1).get());
    if (error && *error != "None") {
        result.error = *error;
    }

    auto report = rt.tupleItem(raw.get(), 2);
    if (rt.isDict(report)) {
        auto json = rt.importModule("json");
        auto dumps = rt.getAttr(json, "dumps");
        auto text = rt.call(dumps, {report.get()});
        result.reportJson = rt.toText(text.get()).value_or("");

        auto summary = rt.dictItem(report, "summary");
        if (summary && rt.isDict(summary)) {
            ScrubSummary counts;
            counts.cleaned = rt.toLong(rt.dictItem(summary, "total_cleaned").get()).value_or(0);
            counts.preserved = rt.toLong(rt.dictItem(summary, "total_preserved").get()).value_or(0);
            counts.embeddedDocuments = rt.toLong(rt.dictItem(summary, "embedded_docs_count").get()).value_or(0);
            result.summary = counts;
        }
    }
    return result;
}

std::optional<std::string> ForeignPipeline::generateScrubHtml(const std::string& jsonPath) {
    auto& rt = interpreter_;
    auto module = rt.importModule(options_.reportModule);
    auto generate = rt.getAttr(module, "generate_report_from_json_file");

    auto kwargs = rt.newDict();
    rt.setItem(kwargs, "json_path", rt.newString(jsonPath));
    auto generated = rt.call(generate, {}, kwargs);

    auto path = rt.toText(generated.get());
    if (!path || path->empty()) {
        return std::nullopt;
    }
    return path;
}

void ForeignPipeline::setEnvironment(const std::string& key, const std::optional<std::string>& value) {
    prepareEnvironment({{key, value}});
}

}
