/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/interpreter.hpp"
#include "rtbridge/environment.hpp"
#include "rtbridge/logger.hpp"
#include "rtbridge/outcome.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstddef>
#include <iomanip>
#include <limits>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>
#include <utility>

namespace rtbridge {

namespace {

using Obj = ForeignObject;
using ssize = std::ptrdiff_t;

using IntFn = int (*)();
using VoidFn = void (*)();
using GILReleaseFn = void (*)(int);
using ImportFn = Obj* (*)(const char*);
using GetAttrStringFn = Obj* (*)(Obj*, const char*);
using HasAttrStringFn = int (*)(Obj*, const char*);
using CallFn = Obj* (*)(Obj*, Obj*, Obj*);
using TupleNewFn = Obj* (*)(ssize);
using TupleSetItemFn = int (*)(Obj*, ssize, Obj*);
using TupleSizeFn = ssize (*)(Obj*);
using TupleGetItemFn = Obj* (*)(Obj*, ssize);
using IsInstanceFn = int (*)(Obj*, Obj*);
using DictNewFn = Obj* (*)();
using DictSetItemStringFn = int (*)(Obj*, const char*, Obj*);
using DictGetItemStringFn = Obj* (*)(Obj*, const char*);
using FromStringFn = Obj* (*)(const char*);
using AsUTF8Fn = const char* (*)(Obj*);
using JoinFn = Obj* (*)(Obj*, Obj*);
using FromLongFn = Obj* (*)(long);
using AsLongFn = long (*)(Obj*);
using FromDoubleFn = Obj* (*)(double);
using AsDoubleFn = double (*)(Obj*);
using UnaryFn = Obj* (*)(Obj*);
using IsTrueFn = int (*)(Obj*);
using SetItemFn = int (*)(Obj*, Obj*, Obj*);
using DelItemFn = int (*)(Obj*, Obj*);
using RefFn = void (*)(Obj*);
using OccurredFn = Obj* (*)();
using FetchFn = void (*)(Obj**, Obj**, Obj**);
using NormalizeFn = void (*)(Obj**, Obj**, Obj**);
using MatchesFn = int (*)(Obj*, Obj*);
using SetNoneFn = void (*)(Obj*);
using FromULongLongFn = Obj* (*)(unsigned long long);
using AsULongLongFn = unsigned long long (*)(Obj*);

// Layout of the runtime's method descriptor.
struct MethodDef {
    const char* name;
    Obj* (*method)(Obj*, Obj*);
    int flags;
    const char* doc;
};
constexpr int kMethVarargs = 0x0001;

using CFunctionNewFn = Obj* (*)(MethodDef*, Obj*, Obj*);

struct CallbackEntry {
    Interpreter* owner = nullptr;
    ProgressCallback callback;
};

std::mutex g_callbackMutex;
std::unordered_map<std::uint64_t, CallbackEntry> g_callbacks;
std::atomic<std::uint64_t> g_nextCallbackId{1};
std::atomic<AsULongLongFn> g_callbackIdDecoder{nullptr};
std::atomic<RefFn> g_callbackIncRef{nullptr};
std::atomic<Obj*> g_callbackNone{nullptr};

std::optional<std::string> nilIfEmptyOrNone(const std::optional<std::string>& value) {
    if (!value) {
        return std::nullopt;
    }
    const auto first = value->find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    const auto last = value->find_last_not_of(" \t\r\n");
    std::string trimmed = value->substr(first, last - first + 1);
    if (trimmed == "None") {
        return std::nullopt;
    }
    return trimmed;
}

std::string threadTag() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}

std::string formatSeconds(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << "s";
    return oss.str();
}

// Counts beyond int range are pinned to its bounds.
int clampToInt(long value) {
    return static_cast<int>(std::clamp<long>(value, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string joined;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += names[i];
    }
    return joined;
}

}

// ObjectRef

ObjectRef::ObjectRef(Interpreter* owner, ForeignObject* object) noexcept
    : owner_(owner), object_(object) {}

ObjectRef::~ObjectRef() {
    reset();
}

ObjectRef::ObjectRef(ObjectRef&& other) noexcept
    : owner_(other.owner_), object_(other.release()) {}

ObjectRef& ObjectRef::operator=(ObjectRef&& other) noexcept {
    if (this != &other) {
        reset();
        owner_ = other.owner_;
        object_ = other.release();
    }
    return *this;
}

ForeignObject* ObjectRef::release() noexcept {
    ForeignObject* object = object_;
    object_ = nullptr;
    return object;
}

void ObjectRef::reset() noexcept {
    if (object_ && owner_) {
        owner_->decRef(object_);
    }
    object_ = nullptr;
}

// ForeignCallback

ForeignCallback::ForeignCallback(ObjectRef callable, std::uint64_t id) noexcept
    : callable_(std::move(callable)), id_(id) {}

ForeignCallback::~ForeignCallback() {
    if (id_ != 0) {
        Interpreter::detachCallback(id_);
    }
}

ForeignCallback::ForeignCallback(ForeignCallback&& other) noexcept
    : callable_(std::move(other.callable_)), id_(other.id_) {
    other.id_ = 0;
}

// Interpreter

Interpreter::Interpreter(std::unique_ptr<SymbolResolver> resolver)
    : symbols_(std::move(resolver)) {}

template <typename Fn>
Fn Interpreter::require(const char* name) {
    Fn fn = symbols_.get<Fn>(name);
    if (!fn) {
        throw RuntimeLoadFailed(symbols_.missingDetail());
    }
    return fn;
}

RuntimeConfig Interpreter::initialize(const InitOptions& options) {
    if (config_) {
        return *config_;
    }

    const auto started = std::chrono::steady_clock::now();
    const double limit = options.deadline.count();
    auto checkDeadline = [&](const char* step) {
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        LOG_DEBUG(std::string("Runtime init step '") + step + "' done at " + formatSeconds(elapsed));
        if (limit > 0 && elapsed > limit) {
            throw RuntimeLoadFailed("Total timeout exceeded (" + formatSeconds(elapsed) + " > " +
                                    formatSeconds(limit) + ") during: " + step);
        }
    };

    LOG_INFO("Initializing foreign runtime...");

    sanitizeProcessEnvironment(options.tempDir.empty() ? defaultIsolatedTempDir() : options.tempDir);
    checkDeadline("sanitize_environment");

    Locator locator(options.locator);
    auto located = locator.locate();
    if (!located) {
        LOG_ERROR("Runtime not found. Tried: " + locator.describeCandidates());
        throw RuntimeNotFound(locator.describeCandidates());
    }
    checkDeadline("locate_runtime");

    applyRuntimeEnvironment(*located);
    checkDeadline("configure_environment");

    if (auto error = symbols_.open(located->libraryPath)) {
        LOG_ERROR("Failed to load runtime library " + located->libraryPath + ": " + *error +
                  " (falling back to the process symbol table)");
    }
    checkDeadline("load_library");

    auto absent = symbols_.validateRequired();
    std::sort(absent.begin(), absent.end());
    if (!absent.empty()) {
        LOG_ERROR("Missing ABI symbols: " + joinNames(absent));
    }
    checkDeadline("validate_symbols");

    smokeTest();

    // The runtime started, but without these entry points jobs cannot be interrupted.
    if (!absent.empty()) {
        throw RuntimeLoadFailed("Missing ABI symbols: " + joinNames(absent));
    }
    checkDeadline("smoke_test");

    config_ = *located;
    LOG_INFO("Foreign runtime ready: " + config_->libraryPath);
    return *config_;
}

void Interpreter::smokeTest() {
    try {
        withLock([this] {
            auto sys = importModule("sys");
            auto version = getAttr(sys, "version");
            LOG_INFO("Runtime version: " + toText(version.get()).value_or("unknown"));
        });
    } catch (const RuntimeLoadFailed&) {
        throw;
    } catch (const std::exception& e) {
        throw RuntimeLoadFailed("Runtime import test failed: " + std::string(e.what()));
    }
}

void Interpreter::warmUp(const std::vector<std::string>& modules) {
    withLock([&] {
        for (const auto& name : modules) {
            const auto started = std::chrono::steady_clock::now();
            auto module = importModule(name);
            const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            LOG_DEBUG("Warm-up import " + name + " took " + formatSeconds(elapsed));
        }
    });
    LOG_INFO("Warm-up imported " + std::to_string(modules.size()) + " module(s)");
}

bool Interpreter::isInitialized() {
    auto isInit = symbols_.get<IntFn>("Py_IsInitialized");
    return isInit && isInit() != 0;
}

void Interpreter::ensureInitialized() {
    auto isInit = require<IntFn>("Py_IsInitialized");
    if (isInit() != 0) {
        return;
    }
    auto init = require<VoidFn>("Py_Initialize");
    LOG_DEBUG("Py_Initialize on thread " + threadTag());
    init();
}

int Interpreter::acquire() {
    ensureInitialized();
    auto ensure = symbols_.get<IntFn>("PyGILState_Ensure");
    auto release = symbols_.get<GILReleaseFn>("PyGILState_Release");
    if (!ensure || !release) {
        throw RuntimeLoadFailed(symbols_.missingDetail());
    }
    LOG_TRACE("Runtime lock requested on thread " + threadTag());
    const int state = ensure();
    LOG_TRACE("Runtime lock acquired on thread " + threadTag());
    return state;
}

void Interpreter::release(int state) noexcept {
    try {
        auto release = symbols_.get<GILReleaseFn>("PyGILState_Release");
        if (release) {
            release(state);
            LOG_TRACE("Runtime lock released");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Runtime lock release failed: " + std::string(e.what()));
    }
}

Interpreter::LockGuard::LockGuard(Interpreter& interpreter)
    : interpreter_(interpreter), state_(interpreter.acquire()) {}

Interpreter::LockGuard::~LockGuard() {
    interpreter_.release(state_);
}

void Interpreter::interrupt() {
    if (!isInitialized()) {
        LOG_DEBUG("Interrupt skipped: runtime not initialized");
        return;
    }
    auto setInterrupt = symbols_.get<VoidFn>("PyErr_SetInterrupt");
    if (!setInterrupt) {
        LOG_WARN("Interrupt unavailable: PyErr_SetInterrupt missing");
        return;
    }
    setInterrupt();
    LOG_DEBUG("Interrupt posted to foreign runtime");
}

void Interpreter::clearPendingInterrupts() {
    auto checkSignals = symbols_.get<IntFn>("PyErr_CheckSignals");
    auto clear = symbols_.get<VoidFn>("PyErr_Clear");
    if (!checkSignals || !clear) {
        return;
    }
    if (checkSignals() != 0) {
        LOG_DEBUG("Cleared a pending interrupt from an earlier run");
    }
    clear();
}

void Interpreter::incRef(ForeignObject* object) noexcept {
    if (!object) return;
    try {
        if (auto fn = symbols_.get<RefFn>("Py_IncRef")) fn(object);
    } catch (const std::exception& e) {
        LOG_ERROR("Py_IncRef failed: " + std::string(e.what()));
    }
}

void Interpreter::decRef(ForeignObject* object) noexcept {
    if (!object) return;
    try {
        if (auto fn = symbols_.get<RefFn>("Py_DecRef")) fn(object);
    } catch (const std::exception& e) {
        LOG_ERROR("Py_DecRef failed: " + std::string(e.what()));
    }
}

ObjectRef Interpreter::checked(ForeignObject* result, const std::string& context) {
    if (!result) {
        throw fetchError(context);
    }
    return ObjectRef(this, result);
}

ObjectRef Interpreter::importModule(const std::string& name) {
    auto import = require<ImportFn>("PyImport_ImportModule");
    return checked(import(name.c_str()), "import " + name);
}

ObjectRef Interpreter::getAttr(const ObjectRef& object, const char* name) {
    auto getattr = require<GetAttrStringFn>("PyObject_GetAttrString");
    return checked(getattr(object.get(), name), std::string("attribute ") + name);
}

bool Interpreter::hasAttr(const ObjectRef& object, const char* name) {
    auto hasattr = require<HasAttrStringFn>("PyObject_HasAttrString");
    return object && hasattr(object.get(), name) == 1;
}

ObjectRef Interpreter::call(const ObjectRef& callable, std::initializer_list<ForeignObject*> args,
                            const ObjectRef& kwargs) {
    auto tupleNew = require<TupleNewFn>("PyTuple_New");
    auto tupleSet = require<TupleSetItemFn>("PyTuple_SetItem");
    auto callFn = require<CallFn>("PyObject_Call");

    auto tuple = checked(tupleNew(static_cast<ssize>(args.size())), "argument tuple");
    ssize index = 0;
    for (ForeignObject* arg : args) {
        ForeignObject* item = arg ? arg : none().release();
        if (arg) incRef(item);
        if (tupleSet(tuple.get(), index++, item) != 0) {
            throw fetchError("argument tuple");
        }
    }
    return checked(callFn(callable.get(), tuple.get(), kwargs ? kwargs.get() : nullptr), "call");
}

ObjectRef Interpreter::call(const ObjectRef& callable, std::initializer_list<ForeignObject*> args) {
    return call(callable, args, ObjectRef());
}

ObjectRef Interpreter::newString(const std::string& value) {
    auto fn = require<FromStringFn>("PyUnicode_FromString");
    return checked(fn(value.c_str()), "string");
}

ObjectRef Interpreter::newInt(long value) {
    auto fn = require<FromLongFn>("PyLong_FromLong");
    return checked(fn(value), "int");
}

ObjectRef Interpreter::newFloat(double value) {
    auto fn = require<FromDoubleFn>("PyFloat_FromDouble");
    return checked(fn(value), "float");
}

ObjectRef Interpreter::newBool(bool value) {
    auto fn = require<FromLongFn>("PyBool_FromLong");
    return checked(fn(value ? 1 : 0), "bool");
}

ObjectRef Interpreter::newDict() {
    auto fn = require<DictNewFn>("PyDict_New");
    return checked(fn(), "dict");
}

ObjectRef Interpreter::none() {
    auto* noneObject = reinterpret_cast<ForeignObject*>(require<void*>("_Py_NoneStruct"));
    incRef(noneObject);
    return ObjectRef(this, noneObject);
}

void Interpreter::setItem(const ObjectRef& dict, const char* key, const ObjectRef& value) {
    auto fn = require<DictSetItemStringFn>("PyDict_SetItemString");
    ForeignObject* item = value.get();
    ObjectRef fallback;
    if (!item) {
        fallback = none();
        item = fallback.get();
    }
    if (fn(dict.get(), key, item) != 0) {
        throw fetchError(std::string("dict item ") + key);
    }
}

ObjectRef Interpreter::dictItem(const ObjectRef& dict, const char* key) {
    auto fn = require<DictGetItemStringFn>("PyDict_GetItemString");
    ForeignObject* borrowed = fn(dict.get(), key);
    if (!borrowed) {
        return ObjectRef();
    }
    incRef(borrowed);
    return ObjectRef(this, borrowed);
}

void Interpreter::setMapping(const ObjectRef& mapping, const std::string& key, const std::string& value) {
    auto fn = require<SetItemFn>("PyObject_SetItem");
    auto k = newString(key);
    auto v = newString(value);
    if (fn(mapping.get(), k.get(), v.get()) != 0) {
        throw fetchError("set " + key);
    }
}

void Interpreter::removeMapping(const ObjectRef& mapping, const std::string& key) {
    auto fn = require<DelItemFn>("PyObject_DelItem");
    auto k = newString(key);
    if (fn(mapping.get(), k.get()) != 0) {
        // KeyError for an absent key.
        if (auto clear = symbols_.get<VoidFn>("PyErr_Clear")) clear();
    }
}

bool Interpreter::isNone(ForeignObject* object) {
    return object == reinterpret_cast<ForeignObject*>(require<void*>("_Py_NoneStruct"));
}

bool Interpreter::isTuple(const ObjectRef& object) {
    auto isInstance = require<IsInstanceFn>("PyObject_IsInstance");
    auto* type = reinterpret_cast<ForeignObject*>(require<void*>("PyTuple_Type"));
    return object && isInstance(object.get(), type) == 1;
}

bool Interpreter::isDict(const ObjectRef& object) {
    auto isInstance = require<IsInstanceFn>("PyObject_IsInstance");
    auto* type = reinterpret_cast<ForeignObject*>(require<void*>("PyDict_Type"));
    return object && isInstance(object.get(), type) == 1;
}

std::size_t Interpreter::tupleSize(ForeignObject* tuple) {
    auto fn = require<TupleSizeFn>("PyTuple_Size");
    const ssize size = fn(tuple);
    if (size < 0) {
        throw fetchError("tuple size");
    }
    return static_cast<std::size_t>(size);
}

ObjectRef Interpreter::tupleItem(ForeignObject* tuple, std::size_t index) {
    auto fn = require<TupleGetItemFn>("PyTuple_GetItem");
    ForeignObject* borrowed = fn(tuple, static_cast<ssize>(index));
    if (!borrowed) {
        throw fetchError("tuple item " + std::to_string(index));
    }
    incRef(borrowed);
    return ObjectRef(this, borrowed);
}

std::optional<long> Interpreter::toLong(ForeignObject* object) {
    if (!object || isNone(object)) {
        return std::nullopt;
    }
    auto asLong = require<AsLongFn>("PyLong_AsLong");
    auto occurred = require<OccurredFn>("PyErr_Occurred");
    const long value = asLong(object);
    if (value == -1 && occurred()) {
        if (auto clear = symbols_.get<VoidFn>("PyErr_Clear")) clear();
        return std::nullopt;
    }
    return value;
}

std::optional<double> Interpreter::toDouble(ForeignObject* object) {
    if (!object || isNone(object)) {
        return std::nullopt;
    }
    auto asDouble = require<AsDoubleFn>("PyFloat_AsDouble");
    auto occurred = require<OccurredFn>("PyErr_Occurred");
    const double value = asDouble(object);
    if (value == -1.0 && occurred()) {
        if (auto clear = symbols_.get<VoidFn>("PyErr_Clear")) clear();
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> Interpreter::toText(ForeignObject* object) {
    if (!object || isNone(object)) {
        return std::nullopt;
    }
    auto str = require<UnaryFn>("PyObject_Str");
    auto asUtf8 = require<AsUTF8Fn>("PyUnicode_AsUTF8");
    ObjectRef text(this, str(object));
    const char* utf8 = text ? asUtf8(text.get()) : nullptr;
    if (!utf8) {
        if (auto clear = symbols_.get<VoidFn>("PyErr_Clear")) clear();
        return std::nullopt;
    }
    return std::string(utf8);
}

bool Interpreter::truthy(ForeignObject* object) {
    if (!object) {
        return false;
    }
    auto isTrue = require<IsTrueFn>("PyObject_IsTrue");
    const int result = isTrue(object);
    if (result < 0) {
        throw fetchError("truth value");
    }
    return result == 1;
}

ForeignException Interpreter::fetchError(const std::string& context) {
    auto fetch = symbols_.get<FetchFn>("PyErr_Fetch");
    if (!fetch) {
        return ForeignException("RuntimeError", context + " failed (error details unavailable)");
    }

    ForeignObject* rawType = nullptr;
    ForeignObject* rawValue = nullptr;
    ForeignObject* rawTraceback = nullptr;
    fetch(&rawType, &rawValue, &rawTraceback);
    if (!rawType) {
        return ForeignException("RuntimeError", context + " failed without a foreign error");
    }
    if (auto normalize = symbols_.get<NormalizeFn>("PyErr_NormalizeException")) {
        normalize(&rawType, &rawValue, &rawTraceback);
    }

    ObjectRef type(this, rawType);
    ObjectRef value(this, rawValue);
    ObjectRef traceback(this, rawTraceback);

    std::string typeName = "Exception";
    if (auto getattr = symbols_.get<GetAttrStringFn>("PyObject_GetAttrString")) {
        ObjectRef name(this, getattr(type.get(), "__name__"));
        if (name) {
            typeName = toText(name.get()).value_or(typeName);
        } else if (auto clear = symbols_.get<VoidFn>("PyErr_Clear")) {
            clear();
        }
    }

    const std::string message = toText(value.get()).value_or("");

    bool interrupted = false;
    auto matches = symbols_.get<MatchesFn>("PyErr_GivenExceptionMatches");
    auto keyboardInterrupt = symbols_.get<ForeignObject**>("PyExc_KeyboardInterrupt");
    if (matches && keyboardInterrupt && *keyboardInterrupt) {
        interrupted = matches(type.get(), *keyboardInterrupt) != 0;
    }

    std::string formatted;
    try {
        formatted = formatTraceback(type.get(), value.get(), traceback.get());
    } catch (const std::exception& e) {
        LOG_DEBUG("Traceback formatting failed: " + std::string(e.what()));
        if (auto clear = symbols_.get<VoidFn>("PyErr_Clear")) clear();
    }

    LOG_DEBUG("Foreign error during " + context + ": " + typeName + ": " + message);
    return ForeignException(typeName, message, OutcomeClassifier::truncateTraceback(formatted), interrupted);
}

std::string Interpreter::formatTraceback(ForeignObject* type, ForeignObject* value, ForeignObject* traceback) {
    if (formattingTraceback_) {
        return {};
    }
    formattingTraceback_ = true;
    struct Reset {
        bool& flag;
        ~Reset() { flag = false; }
    } reset{formattingTraceback_};

    auto import = symbols_.get<ImportFn>("PyImport_ImportModule");
    auto getattr = symbols_.get<GetAttrStringFn>("PyObject_GetAttrString");
    auto join = symbols_.get<JoinFn>("PyUnicode_Join");
    auto fromString = symbols_.get<FromStringFn>("PyUnicode_FromString");
    if (!import || !getattr || !join || !fromString) {
        return {};
    }

    ObjectRef module(this, import("traceback"));
    if (!module) return {};
    ObjectRef formatter(this, getattr(module.get(), "format_exception"));
    if (!formatter) return {};

    ObjectRef lines = call(formatter, {type, value, traceback});
    ObjectRef separator(this, fromString(""));
    if (!separator) return {};
    ObjectRef text(this, join(separator.get(), lines.get()));
    if (!text) return {};
    return toText(text.get()).value_or("");
}

ForeignCallback Interpreter::makeProgressCallback(ProgressCallback callback) {
    static MethodDef progressMethod = {"rtbridge_progress", &Interpreter::progressTrampoline, kMethVarargs,
                                       "Forwards pipeline progress to the host."};

    auto newFunction = require<CFunctionNewFn>("PyCFunction_NewEx");
    auto fromId = require<FromULongLongFn>("PyLong_FromUnsignedLongLong");
    g_callbackIdDecoder.store(require<AsULongLongFn>("PyLong_AsUnsignedLongLong"));
    g_callbackIncRef.store(require<RefFn>("Py_IncRef"));
    g_callbackNone.store(reinterpret_cast<ForeignObject*>(require<void*>("_Py_NoneStruct")));

    const std::uint64_t id = g_nextCallbackId.fetch_add(1);
    ObjectRef self = checked(fromId(id), "callback id");
    ObjectRef callable = checked(newFunction(&progressMethod, self.get(), nullptr), "progress callback");

    {
        std::lock_guard<std::mutex> lock(g_callbackMutex);
        g_callbacks[id] = CallbackEntry{this, std::move(callback)};
    }
    LOG_TRACE("Progress callback " + std::to_string(id) + " registered");
    return ForeignCallback(std::move(callable), id);
}

void Interpreter::detachCallback(std::uint64_t id) noexcept {
    try {
        std::lock_guard<std::mutex> lock(g_callbackMutex);
        g_callbacks.erase(id);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to detach progress callback: " + std::string(e.what()));
    }
}

ForeignObject* Interpreter::progressTrampoline(ForeignObject* self, ForeignObject* args) {
    Interpreter* owner = nullptr;
    try {
        auto decode = g_callbackIdDecoder.load();
        if (!decode) {
            return nullptr;
        }
        const std::uint64_t id = decode(self);
        std::lock_guard<std::mutex> lock(g_callbackMutex);
        auto it = g_callbacks.find(id);
        if (it != g_callbacks.end()) {
            owner = it->second.owner;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Progress callback lookup failed: " + std::string(e.what()));
    }

    if (!owner) {
        // Detached: late calls from foreign code are ignored.
        ForeignObject* noneObject = g_callbackNone.load();
        if (auto incRef = g_callbackIncRef.load(); incRef && noneObject) {
            incRef(noneObject);
        }
        return noneObject;
    }
    return owner->dispatchProgress(self, args);
}

ForeignObject* Interpreter::dispatchProgress(ForeignObject* self, ForeignObject* args) {
    try {
        const std::uint64_t id = g_callbackIdDecoder.load()(self);
        ProgressCallback callback;
        {
            std::lock_guard<std::mutex> lock(g_callbackMutex);
            auto it = g_callbacks.find(id);
            if (it != g_callbacks.end()) {
                callback = it->second.callback;
            }
        }

        bool keepGoing = true;
        if (callback) {
            keepGoing = callback(parseProgress(args));
        }

        if (!keepGoing) {
            auto setNone = require<SetNoneFn>("PyErr_SetNone");
            auto keyboardInterrupt = require<ForeignObject**>("PyExc_KeyboardInterrupt");
            LOG_DEBUG("Progress callback raising interrupt in foreign code");
            setNone(*keyboardInterrupt);
            return nullptr;
        }
        return none().release();
    } catch (const ForeignException& e) {
        LOG_ERROR("Progress callback conversion failed: " + std::string(e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("Progress callback failed: " + std::string(e.what()));
    }

    try {
        return none().release();
    } catch (const std::exception& e) {
        LOG_ERROR("Progress callback cannot return None: " + std::string(e.what()));
        return nullptr;
    }
}

std::optional<std::string> Interpreter::textAttr(ForeignObject* object, const char* name) {
    auto hasattr = require<HasAttrStringFn>("PyObject_HasAttrString");
    auto getattr = require<GetAttrStringFn>("PyObject_GetAttrString");
    if (hasattr(object, name) != 1) {
        return std::nullopt;
    }
    ObjectRef attr(this, getattr(object, name));
    if (!attr) {
        if (auto clear = symbols_.get<VoidFn>("PyErr_Clear")) clear();
        return std::nullopt;
    }
    // Enum members report their value.
    if (hasattr(attr.get(), "value") == 1) {
        ObjectRef inner(this, getattr(attr.get(), "value"));
        if (inner) {
            return toText(inner.get());
        }
        if (auto clear = symbols_.get<VoidFn>("PyErr_Clear")) clear();
    }
    return toText(attr.get());
}

std::optional<double> Interpreter::numberAttr(ForeignObject* object, const char* name) {
    auto hasattr = require<HasAttrStringFn>("PyObject_HasAttrString");
    auto getattr = require<GetAttrStringFn>("PyObject_GetAttrString");
    if (hasattr(object, name) != 1) {
        return std::nullopt;
    }
    ObjectRef attr(this, getattr(object, name));
    if (!attr) {
        if (auto clear = symbols_.get<VoidFn>("PyErr_Clear")) clear();
        return std::nullopt;
    }
    return toDouble(attr.get());
}

ProgressEvent Interpreter::parseProgress(ForeignObject* args) {
    ProgressEvent event;
    const std::size_t count = args ? tupleSize(args) : 0;
    if (count == 0) {
        return event;
    }

    if (count == 1) {
        auto update = tupleItem(args, 0);
        event.phaseIdentifier = nilIfEmptyOrNone(textAttr(update.get(), "phase"));
        event.phaseDisplayName = nilIfEmptyOrNone(textAttr(update.get(), "phase_name"));
        event.phaseProgress = numberAttr(update.get(), "phase_progress");
        event.overallProgress = numberAttr(update.get(), "overall_progress");
        event.message = nilIfEmptyOrNone(textAttr(update.get(), "message"));
        return event;
    }

    auto chunk = tupleItem(args, 0);
    event.chunk = clampToInt(toLong(chunk.get()).value_or(0));
    auto total = tupleItem(args, 1);
    event.total = clampToInt(toLong(total.get()).value_or(0));
    if (count > 2) {
        auto message = tupleItem(args, 2);
        event.message = nilIfEmptyOrNone(toText(message.get()));
    }
    return event;
}

}
