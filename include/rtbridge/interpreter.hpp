/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rtbridge/errors.hpp"
#include "rtbridge/locator.hpp"
#include "rtbridge/symbols.hpp"
#include "rtbridge/types.hpp"

namespace rtbridge {

// Opaque handle for a foreign runtime object.
struct ForeignObject;

class Interpreter;

// Owns one strong reference. Must be reset or destroyed while the runtime lock is held.
class ObjectRef final {
public:
    ObjectRef() noexcept = default;
    ObjectRef(Interpreter* owner, ForeignObject* object) noexcept;
    ~ObjectRef();

    ObjectRef(const ObjectRef&) = delete;
    ObjectRef& operator=(const ObjectRef&) = delete;
    ObjectRef(ObjectRef&& other) noexcept;
    ObjectRef& operator=(ObjectRef&& other) noexcept;

    [[nodiscard]] ForeignObject* get() const noexcept { return object_; }
    [[nodiscard]] ForeignObject* release() noexcept;
    void reset() noexcept;
    explicit operator bool() const noexcept { return object_ != nullptr; }

private:
    Interpreter* owner_ = nullptr;
    ForeignObject* object_ = nullptr;
};

// Native callable handed to foreign code. Forwards every call to a
// ProgressCallback on the affinity thread; detached on destruction so a
// late call from foreign code becomes a no-op.
class ForeignCallback final {
public:
    ForeignCallback() noexcept = default;
    ForeignCallback(ObjectRef callable, std::uint64_t id) noexcept;
    ~ForeignCallback();

    ForeignCallback(const ForeignCallback&) = delete;
    ForeignCallback& operator=(const ForeignCallback&) = delete;
    ForeignCallback(ForeignCallback&& other) noexcept;
    ForeignCallback& operator=(ForeignCallback&& other) = delete;

    [[nodiscard]] const ObjectRef& callable() const noexcept { return callable_; }
    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }

private:
    ObjectRef callable_;
    std::uint64_t id_ = 0;
};

struct InitOptions {
    LocatorOptions locator;
    std::filesystem::path tempDir;
    std::chrono::duration<double> deadline{30.0};
};

// Init-once owner of the foreign runtime. The runtime is never finalised.
// Every member except isInitialized() must be called on the affinity thread.
class Interpreter final {
public:
    explicit Interpreter(std::unique_ptr<SymbolResolver> resolver);
    ~Interpreter() = default;

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;
    Interpreter(Interpreter&&) = delete;
    Interpreter& operator=(Interpreter&&) = delete;

    // Sanitise, locate, configure, load, validate, smoke test.
    RuntimeConfig initialize(const InitOptions& options);

    // Imports each module under the lock; the first failure throws.
    void warmUp(const std::vector<std::string>& modules);

    [[nodiscard]] bool isInitialized();
    [[nodiscard]] const std::optional<RuntimeConfig>& config() const noexcept { return config_; }
    [[nodiscard]] SymbolTable& symbols() noexcept { return symbols_; }

    class LockGuard final {
    public:
        explicit LockGuard(Interpreter& interpreter);
        ~LockGuard();

        LockGuard(const LockGuard&) = delete;
        LockGuard& operator=(const LockGuard&) = delete;

    private:
        Interpreter& interpreter_;
        int state_;
    };

    template <typename Body>
    auto withLock(Body&& body) -> decltype(body()) {
        LockGuard guard(*this);
        return body();
    }

    // PyErr_SetInterrupt: the running foreign code sees an interrupt at its next check.
    void interrupt();

    // Drains an interrupt left over from an earlier run. Lock must be held.
    void clearPendingInterrupts();

    // Object API. Lock must be held for all of these.
    [[nodiscard]] ObjectRef importModule(const std::string& name);
    [[nodiscard]] ObjectRef getAttr(const ObjectRef& object, const char* name);
    [[nodiscard]] bool hasAttr(const ObjectRef& object, const char* name);
    [[nodiscard]] ObjectRef call(const ObjectRef& callable, std::initializer_list<ForeignObject*> args,
                                 const ObjectRef& kwargs);
    [[nodiscard]] ObjectRef call(const ObjectRef& callable, std::initializer_list<ForeignObject*> args);

    [[nodiscard]] ObjectRef newString(const std::string& value);
    [[nodiscard]] ObjectRef newInt(long value);
    [[nodiscard]] ObjectRef newFloat(double value);
    [[nodiscard]] ObjectRef newBool(bool value);
    [[nodiscard]] ObjectRef newDict();
    [[nodiscard]] ObjectRef none();

    void setItem(const ObjectRef& dict, const char* key, const ObjectRef& value);
    // Empty ref when the key is absent.
    [[nodiscard]] ObjectRef dictItem(const ObjectRef& dict, const char* key);

    // os.environ style mapping writes; removing an absent key is not an error.
    void setMapping(const ObjectRef& mapping, const std::string& key, const std::string& value);
    void removeMapping(const ObjectRef& mapping, const std::string& key);

    [[nodiscard]] bool isNone(ForeignObject* object);
    [[nodiscard]] bool isTuple(const ObjectRef& object);
    [[nodiscard]] bool isDict(const ObjectRef& object);
    [[nodiscard]] std::size_t tupleSize(ForeignObject* tuple);
    [[nodiscard]] ObjectRef tupleItem(ForeignObject* tuple, std::size_t index);

    [[nodiscard]] std::optional<long> toLong(ForeignObject* object);
    [[nodiscard]] std::optional<double> toDouble(ForeignObject* object);
    // str(object); nullopt for None or when conversion fails.
    [[nodiscard]] std::optional<std::string> toText(ForeignObject* object);
    [[nodiscard]] bool truthy(ForeignObject* object);

    // Consumes the pending foreign error.
    [[nodiscard]] ForeignException fetchError(const std::string& context);

    [[nodiscard]] ForeignCallback makeProgressCallback(ProgressCallback callback);

    void incRef(ForeignObject* object) noexcept;
    void decRef(ForeignObject* object) noexcept;

private:
    friend class LockGuard;
    friend class ForeignCallback;

    int acquire();
    void release(int state) noexcept;
    void ensureInitialized();
    void smokeTest();

    template <typename Fn>
    Fn require(const char* name);

    [[nodiscard]] ObjectRef checked(ForeignObject* result, const std::string& context);
    [[nodiscard]] std::string formatTraceback(ForeignObject* type, ForeignObject* value, ForeignObject* traceback);

    static ForeignObject* progressTrampoline(ForeignObject* self, ForeignObject* args);
    ForeignObject* dispatchProgress(ForeignObject* self, ForeignObject* args);
    [[nodiscard]] ProgressEvent parseProgress(ForeignObject* args);
    [[nodiscard]] std::optional<std::string> textAttr(ForeignObject* object, const char* name);
    [[nodiscard]] std::optional<double> numberAttr(ForeignObject* object, const char* name);
    static void detachCallback(std::uint64_t id) noexcept;

    SymbolTable symbols_;
    std::optional<RuntimeConfig> config_;
    bool formattingTraceback_ = false;
};

}
