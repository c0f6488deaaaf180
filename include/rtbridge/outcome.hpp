/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <exception>
#include <string>

#include "rtbridge/types.hpp"

namespace rtbridge {

class OutcomeClassifier final {
public:
    static constexpr std::size_t kTracebackLimit = 2000;

    [[nodiscard]] static RunOutcome fromStatus(long status);

    // Maps a job-level error to its outcome. Never throws.
    [[nodiscard]] static RunOutcome fromException(std::exception_ptr error) noexcept;

    [[nodiscard]] static std::string truncateTraceback(const std::string& traceback);
};

}
