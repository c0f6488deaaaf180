/*
 * rtbridge - Job runner (rtbrun)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/bridge.hpp"
#include "rtbridge/errors.hpp"
#include "rtbridge/locator.hpp"
#include "rtbridge/logger.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace rtbridge;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_interrupted = 0;

void signalHandler(int signal) {
    (void)signal;
    g_interrupted = 1;
}

void printUsage(const char* progName) {
    std::cout << "rtbridge Job Runner v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " locate\n";
    std::cout << "       " << progName << " redact <input> <output> <report> [options]\n";
    std::cout << "       " << progName << " rules <input> <output> <report> [--debug]\n";
    std::cout << "       " << progName << " scrub <input> <output>\n";
    std::cout << "       " << progName << " html <report.json>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Redact options:\n";
    std::cout << "  --mode <mode>          Pipeline mode (default: enhanced)\n";
    std::cout << "  --model <id>           Model identifier\n";
    std::cout << "  --backend <name>       Model backend (default: ollama)\n";
    std::cout << "  --chunk-tokens <n>     Tokens per chunk (default: 500)\n";
    std::cout << "  --overlap <n>          Chunk overlap (default: 120)\n";
    std::cout << "  --temperature <t>      Sampling temperature (default: 0.1)\n";
    std::cout << "  --seed <n>             Sampling seed (default: 42)\n";
    std::cout << "  --step-timeout <sec>   Processing step timeout override\n";
    std::cout << "  --debug                Ask the pipeline for debug output\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  RTBRIDGE_LOG_LEVEL           Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  RTBRIDGE_LOG_FILE            Also append log lines to this file\n";
    std::cout << "  RTBRIDGE_RUNTIME_ROOT        Runtime framework directory to try first\n";
    std::cout << "  RTBRIDGE_PIPELINE_MODULE     Foreign pipeline module\n";
    std::cout << "  RTBRIDGE_MODEL_HOST          Model service host[:port]\n";
    std::cout << "  RTBRIDGE_DISABLE_PY_TIMEOUTS Disable all phase timeouts\n\n";
    std::cout << "Press Ctrl+C to cancel a running job.\n";
}

std::string formatEvent(const ProgressEvent& event) {
    std::ostringstream oss;
    if (event.phaseDisplayName || event.phaseIdentifier) {
        oss << "[" << event.phaseDisplayName.value_or(event.phaseIdentifier.value_or("")) << "] ";
    }
    if (event.overallProgress) {
        oss << std::fixed << std::setprecision(0) << (*event.overallProgress * 100.0) << "% ";
    } else if (event.chunk && event.total) {
        oss << *event.chunk << "/" << *event.total << " ";
    }
    if (event.message) {
        oss << *event.message;
    }
    return oss.str();
}

int exitCodeFor(const RunOutcome& outcome) {
    switch (outcome.kind) {
        case OutcomeKind::Success: return 0;
        case OutcomeKind::Cancelled: return 130;
        default: return 1;
    }
}

int report(const RunOutcome& outcome) {
    switch (outcome.kind) {
        case OutcomeKind::Success:
            std::cout << "Done\n";
            break;
        case OutcomeKind::Cancelled:
            std::cerr << "Cancelled\n";
            break;
        default:
            std::cerr << "Failed: " << outcome.reason << "\n";
            break;
    }
    return exitCodeFor(outcome);
}

int follow(ProgressJob job) {
    while (true) {
        auto event = job.events->nextFor(std::chrono::milliseconds(200));
        if (event) {
            std::cout << formatEvent(*event) << "\n" << std::flush;
            continue;
        }
        if (job.events->isDrained()) {
            break;
        }
    }
    return report(job.outcome.get());
}

int runLocate() {
    Locator locator(LocatorOptions::fromExecutable());
    auto config = locator.locate();
    if (!config) {
        std::cerr << "Runtime not found. Tried: " << locator.describeCandidates() << "\n";
        return 1;
    }
    std::cout << "Library: " << config->libraryPath << "\n";
    std::cout << "Home:    " << config->home << "\n";
    std::cout << "Paths:\n";
    for (const auto& path : config->searchPaths) {
        std::cout << "  " << path << "\n";
    }
    return 0;
}

std::optional<RedactionRequest> parseRedaction(int argc, char* argv[]) {
    if (argc < 5) {
        return std::nullopt;
    }

    RedactionRequest request;
    request.inputPath = argv[2];
    request.outputPath = argv[3];
    request.reportPath = argv[4];

    for (int i = 5; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        try {
            if (arg == "--debug") {
                request.debug = true;
            } else if (arg == "--mode") {
                auto v = next(); if (!v) return std::nullopt; request.mode = *v;
            } else if (arg == "--model") {
                auto v = next(); if (!v) return std::nullopt; request.model = *v;
            } else if (arg == "--backend") {
                auto v = next(); if (!v) return std::nullopt; request.backend = *v;
            } else if (arg == "--chunk-tokens") {
                auto v = next(); if (!v) return std::nullopt; request.chunkTokens = std::stoi(*v);
            } else if (arg == "--overlap") {
                auto v = next(); if (!v) return std::nullopt; request.overlap = std::stoi(*v);
            } else if (arg == "--temperature") {
                auto v = next(); if (!v) return std::nullopt; request.temperature = std::stod(*v);
            } else if (arg == "--seed") {
                auto v = next(); if (!v) return std::nullopt; request.seed = std::stoi(*v);
            } else if (arg == "--step-timeout") {
                auto v = next(); if (!v) return std::nullopt; request.processingStepTimeout = std::stod(*v);
            } else {
                std::cerr << "Error: unknown option " << arg << "\n";
                return std::nullopt;
            }
        } catch (const std::exception&) {
            std::cerr << "Error: invalid value for " << arg << "\n";
            return std::nullopt;
        }
    }
    return request;
}

int main(int argc, char* argv[]) {
    // Default to WARN for clean piping; RTBRIDGE_LOG_LEVEL overrides
    if (!std::getenv("RTBRIDGE_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    // Handle --help and --version before anything else
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = argv[1];
    if (command == "locate") {
        return runLocate();
    }

    std::optional<RedactionRequest> request;
    if (command == "redact" || command == "rules") {
        request = parseRedaction(argc, argv);
        if (!request) {
            printUsage(argv[0]);
            return 1;
        }
    } else if (command == "scrub") {
        if (argc < 4) {
            printUsage(argv[0]);
            return 1;
        }
    } else if (command == "html") {
        if (argc < 3) {
            printUsage(argv[0]);
            return 1;
        }
    } else {
        std::cerr << "Error: unknown command " << command << "\n";
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    auto interrupted = [] { return g_interrupted != 0; };

    try {
        Bridge bridge;

        if (command == "redact") {
            return follow(bridge.runRedactionWithProgress(*request, interrupted));
        }
        if (command == "rules") {
            return follow(bridge.runRulesWithProgress(*request, interrupted));
        }
        if (command == "scrub") {
            auto result = bridge.scrubMetadataOnly(argv[2], argv[3]);
            if (!result) {
                std::cerr << "Failed: " << (result.error.empty() ? "unknown error" : result.error) << "\n";
                return 1;
            }
            if (result.summary) {
                std::cout << "Cleaned: " << result.summary->cleaned
                          << ", preserved: " << result.summary->preserved
                          << ", embedded documents: " << result.summary->embeddedDocuments << "\n";
            }
            return 0;
        }

        auto html = bridge.generateScrubHtml(argv[2]);
        if (!html) {
            std::cerr << "Failed to generate HTML report\n";
            return 1;
        }
        std::cout << *html << "\n";
        return 0;
    } catch (const RuntimeNotFound& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Set RTBRIDGE_RUNTIME_ROOT to the runtime framework directory.\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
