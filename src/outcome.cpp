/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/outcome.hpp"
#include "rtbridge/errors.hpp"
#include "rtbridge/logger.hpp"

namespace rtbridge {

const char* toString(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Success:   return "Success";
        case OutcomeKind::Cancelled: return "Cancelled";
        case OutcomeKind::Failure:   return "Failure";
        default: return "Unknown";
    }
}

RunOutcome OutcomeClassifier::fromStatus(long status) {
    if (status == 0) {
        return RunOutcome::success();
    }
    return RunOutcome::failure("pipeline exited with status " + std::to_string(status));
}

RunOutcome OutcomeClassifier::fromException(std::exception_ptr error) noexcept {
    try {
        if (!error) {
            return RunOutcome::failure("unknown error");
        }
        try {
            std::rethrow_exception(error);
        } catch (const Cancelled& e) {
            LOG_INFO("Job cancelled (" + e.source() + ")");
            return RunOutcome::cancelled();
        } catch (const ForeignException& e) {
            if (e.interrupted()) {
                LOG_INFO("Foreign call interrupted; treating as cancellation");
                return RunOutcome::cancelled();
            }
            std::string reason = e.typeName() + ": " + e.message();
            if (!e.traceback().empty()) {
                reason += "\n" + truncateTraceback(e.traceback());
            }
            LOG_ERROR("Foreign exception: " + e.typeName() + ": " + e.message());
            return RunOutcome::failure(std::move(reason));
        } catch (const std::exception& e) {
            LOG_ERROR("Job failed: " + std::string(e.what()));
            return RunOutcome::failure(e.what());
        } catch (...) {
            LOG_ERROR("Job failed with unknown error");
            return RunOutcome::failure("unknown error");
        }
    } catch (const std::exception&) {
        return RunOutcome{OutcomeKind::Failure, {}};
    }
}

std::string OutcomeClassifier::truncateTraceback(const std::string& traceback) {
    if (traceback.size() <= kTracebackLimit) {
        return traceback;
    }
    return traceback.substr(0, kTracebackLimit);
}

}
