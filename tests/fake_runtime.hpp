/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "rtbridge/bridge.hpp"
#include "rtbridge/locator.hpp"
#include "rtbridge/pipeline.hpp"
#include "rtbridge/symbols.hpp"
#include "rtbridge/timeouts.hpp"

namespace rtbridge::testing {

// Name -> address table standing in for the runtime's shared library.
class FixedSymbolResolver final : public SymbolResolver {
public:
    explicit FixedSymbolResolver(std::map<std::string, void*> table,
                                 std::optional<std::string> openError = std::nullopt);

    [[nodiscard]] std::optional<std::string> open(const std::string& path) override;
    [[nodiscard]] void* resolve(const std::string& name) const override;

    [[nodiscard]] std::vector<std::string> opened() const;

private:
    std::map<std::string, void*> table_;
    std::optional<std::string> openError_;
    mutable std::mutex mutex_;
    std::vector<std::string> opened_;
};

// Counters behind the fake C entry points.
struct FakeRuntimeState {
    std::atomic<int> initialized{0};
    std::atomic<int> initializeCalls{0};
    std::atomic<int> ensureCalls{0};
    std::atomic<int> releaseCalls{0};
    std::atomic<int> lockDepth{0};
    std::atomic<int> interruptCalls{0};
    std::atomic<int> checkSignalsCalls{0};
    std::atomic<int> clearCalls{0};
    std::atomic<int> pendingSignal{0};

    std::mutex mutex;
    std::set<std::string> failingImports;
    std::vector<std::string> imports;
};

FakeRuntimeState& fakeState();
void resetFakeRuntime();

// Just enough of the runtime's object model for the bridge's ABI calls.
// Objects live for the whole test process; reference counts are not tracked.
struct FakeObject;
using FakeFunction = std::function<FakeObject*(FakeObject* args, FakeObject* kwargs)>;

struct FakeObject {
    enum class Kind { None, Module, Type, Str, Int, Bool, Float, Tuple, Dict, Function, NativeFunction, Plain };

    Kind kind = Kind::Plain;
    std::string text;
    long integer = 0;
    double real = 0.0;
    std::vector<FakeObject*> items;
    std::map<std::string, FakeObject*> entries;
    std::map<std::string, FakeObject*> attrs;
    // Any attribute resolves; used for modules tests do not script.
    bool openAttrs = false;
    FakeFunction function;
    void* method = nullptr;
    FakeObject* self = nullptr;
};

[[nodiscard]] FakeObject* newObject(std::map<std::string, FakeObject*> attrs = {});
[[nodiscard]] FakeObject* newStr(const std::string& value);
[[nodiscard]] FakeObject* newInt(long value);
[[nodiscard]] FakeObject* newBool(bool value);
[[nodiscard]] FakeObject* newFloat(double value);
[[nodiscard]] FakeObject* newTuple(std::vector<FakeObject*> items);
[[nodiscard]] FakeObject* newDict(std::map<std::string, FakeObject*> entries = {});
[[nodiscard]] FakeObject* newFunction(FakeFunction function);
[[nodiscard]] FakeObject* noneObject();

// Replaces whatever an import of `name` returned before.
FakeObject* registerModule(const std::string& name, std::map<std::string, FakeObject*> attrs = {});

// Calls a callable the way foreign code would. nullptr means an error is pending.
FakeObject* callObject(FakeObject* callable, std::vector<FakeObject*> args);

// Sets the pending error and returns nullptr, for use as `return raiseError(...)`.
FakeObject* raiseError(FakeObject* type, const std::string& message);
[[nodiscard]] FakeObject* pendingErrorType();

[[nodiscard]] FakeObject* keyboardInterruptType();
[[nodiscard]] FakeObject* valueErrorType();

[[nodiscard]] std::map<std::string, void*> fakeSymbolTable();
[[nodiscard]] std::unique_ptr<FixedSymbolResolver> makeFakeResolver(const std::set<std::string>& omit = {});

// Scratch directories live under a root captured before any test redirects TMPDIR.
[[nodiscard]] std::filesystem::path testRoot();
[[nodiscard]] std::filesystem::path uniqueDir(const std::string& prefix);

// Creates <parent>/Python.framework with Versions/<version>/lib/python<version>.
std::filesystem::path makeFakeRuntimeTree(const std::filesystem::path& parent,
                                          const std::string& version = "3.11",
                                          bool withSitePackages = true);
[[nodiscard]] LocatorOptions fakeLocatorOptions(const std::filesystem::path& frameworksParent);

// Shared between a test and the FakePipeline the bridge builds.
struct FakePipelineScript {
    std::mutex mutex;
    std::vector<std::string> calls;
    EnvironmentOverlay lastOverlay;
    std::map<std::string, std::optional<std::string>> environ;
    RedactionRequest lastRequest;

    std::function<PipelineResult(const RedactionRequest&, const ProgressCallback&)> onRun;
    std::function<void()> onImportPipeline;
    ScrubResult scrubResult;
    std::optional<std::string> htmlPath;

    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    std::atomic<int> runs{0};

    void record(const std::string& call);
    [[nodiscard]] std::vector<std::string> callLog();
    [[nodiscard]] std::optional<std::string> environValue(const std::string& key);
};

class FakePipeline final : public Pipeline {
public:
    explicit FakePipeline(std::shared_ptr<FakePipelineScript> script);

    void prepareEnvironment(const EnvironmentOverlay& overlay) override;
    void importDependencies() override;
    void importPipeline() override;
    [[nodiscard]] PipelineResult runRedaction(const RedactionRequest& request,
                                              const ProgressCallback& progress) override;
    [[nodiscard]] ScrubResult scrubMetadata(const std::string& inputPath,
                                            const std::string& outputPath, bool debug) override;
    [[nodiscard]] std::optional<std::string> generateScrubHtml(const std::string& jsonPath) override;
    void setEnvironment(const std::string& key, const std::optional<std::string>& value) override;

private:
    std::shared_ptr<FakePipelineScript> script_;
};

// Behaves like foreign code that honours the progress callback's stop request
// by raising the runtime's interrupt exception.
[[noreturn]] void raiseForeignInterrupt();

[[nodiscard]] BridgeOptions fakeBridgeOptions(std::shared_ptr<FakePipelineScript> script,
                                              std::shared_ptr<MapOverrides> overrides = nullptr,
                                              const std::set<std::string>& omitSymbols = {});

}
