/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/symbols.hpp"
#include "rtbridge/logger.hpp"
#include <dlfcn.h>
#include <stdexcept>

namespace rtbridge {

std::optional<std::string> DynamicSymbolResolver::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_) {
        return std::nullopt;
    }

    void* handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_GLOBAL);
    if (!handle) {
        const char* err = ::dlerror();
        return std::string(err ? err : "dlopen failed: " + path);
    }

    handle_ = handle;
    LOG_DEBUG("Runtime library opened: " + path);
    return std::nullopt;
}

void* DynamicSymbolResolver::resolve(const std::string& name) const {
    void* handle = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle = handle_;
    }

    if (handle) {
        if (void* symbol = ::dlsym(handle, name.c_str())) {
            return symbol;
        }
    }
    return ::dlsym(RTLD_DEFAULT, name.c_str());
}

SymbolTable::SymbolTable(std::unique_ptr<SymbolResolver> resolver)
    : resolver_(std::move(resolver)) {
    if (!resolver_) {
        throw std::invalid_argument("SymbolTable requires a resolver");
    }
}

std::optional<std::string> SymbolTable::open(const std::string& path) {
    return resolver_->open(path);
}

void* SymbolTable::lookup(const std::string& name) {
    void* symbol = resolver_->resolve(name);
    if (!symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (missing_.insert(name).second) {
            LOG_DEBUG("ABI symbol missing: " + name);
        }
    }
    return symbol;
}

std::vector<std::string> SymbolTable::validateRequired() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        missing_.clear();
    }

    std::vector<std::string> absent;
    for (const auto& name : requiredSymbols()) {
        if (!resolver_->resolve(name)) {
            absent.push_back(name);
        }
    }

    if (!absent.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        missing_.insert(absent.begin(), absent.end());
    }
    return absent;
}

std::vector<std::string> SymbolTable::missing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {missing_.begin(), missing_.end()};
}

std::string SymbolTable::missingDetail() const {
    auto names = missing();
    if (names.empty()) {
        return "Missing ABI symbols";
    }
    std::string detail = "Missing ABI symbols: ";
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) detail += ", ";
        detail += names[i];
    }
    return detail;
}

const std::vector<std::string>& SymbolTable::requiredSymbols() noexcept {
    static const std::vector<std::string> required = {
        "Py_IsInitialized",
        "Py_Initialize",
        "PyGILState_Ensure",
        "PyGILState_Release",
        "PyErr_SetInterrupt",
        "PyErr_CheckSignals",
        "PyErr_Clear"
    };
    return required;
}

}
