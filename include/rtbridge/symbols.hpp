/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rtbridge {

// Resolves C-ABI entry points of the foreign runtime by name.
class SymbolResolver {
public:
    virtual ~SymbolResolver() = default;

    // Registers the runtime's shared library. Returns an error message on failure.
    [[nodiscard]] virtual std::optional<std::string> open(const std::string& path) = 0;

    // Looks the name up in the registered library, else in the global process table.
    [[nodiscard]] virtual void* resolve(const std::string& name) const = 0;
};

// dlopen/dlsym backed resolver. The handle is never closed: the runtime
// cannot be finalised and re-initialised within one process.
class DynamicSymbolResolver final : public SymbolResolver {
public:
    DynamicSymbolResolver() = default;

    DynamicSymbolResolver(const DynamicSymbolResolver&) = delete;
    DynamicSymbolResolver& operator=(const DynamicSymbolResolver&) = delete;

    [[nodiscard]] std::optional<std::string> open(const std::string& path) override;
    [[nodiscard]] void* resolve(const std::string& name) const override;

private:
    mutable std::mutex mutex_;
    void* handle_ = nullptr;
};

// Owns the resolver plus the process-wide record of symbols found missing.
class SymbolTable final {
public:
    explicit SymbolTable(std::unique_ptr<SymbolResolver> resolver);

    SymbolTable(const SymbolTable&) = delete;
    SymbolTable& operator=(const SymbolTable&) = delete;

    [[nodiscard]] std::optional<std::string> open(const std::string& path);

    // Returns nullptr and records the name when the symbol cannot be found.
    [[nodiscard]] void* lookup(const std::string& name);

    template <typename Fn>
    [[nodiscard]] Fn get(const char* name) {
        return reinterpret_cast<Fn>(lookup(name));
    }

    // Resets the missing set, then checks every required entry point.
    std::vector<std::string> validateRequired();

    [[nodiscard]] std::vector<std::string> missing() const;
    [[nodiscard]] std::string missingDetail() const;

    [[nodiscard]] static const std::vector<std::string>& requiredSymbols() noexcept;

private:
    std::unique_ptr<SymbolResolver> resolver_;
    mutable std::mutex mutex_;
    std::set<std::string> missing_;
};

}
