/*
 * rtbridge - Embedded Runtime Bridge
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rtbridge/errors.hpp"
#include "rtbridge/outcome.hpp"
#include <gtest/gtest.h>

using namespace rtbridge;

namespace {

template <typename E>
RunOutcome classify(E error) {
    return OutcomeClassifier::fromException(std::make_exception_ptr(std::move(error)));
}

}

TEST(OutcomeClassifierTest, StatusZeroIsSuccess) {
    auto outcome = OutcomeClassifier::fromStatus(0);
    EXPECT_TRUE(outcome.ok());
    EXPECT_TRUE(static_cast<bool>(outcome));
}

TEST(OutcomeClassifierTest, NonZeroStatusIsFailure) {
    auto outcome = OutcomeClassifier::fromStatus(3);
    EXPECT_EQ(outcome.kind, OutcomeKind::Failure);
    EXPECT_EQ(outcome.reason, "pipeline exited with status 3");
}

TEST(OutcomeClassifierTest, CancelledIsCancelled) {
    EXPECT_EQ(classify(Cancelled("user")).kind, OutcomeKind::Cancelled);
}

TEST(OutcomeClassifierTest, InterruptedForeignErrorIsCancelled) {
    EXPECT_EQ(classify(ForeignException("KeyboardInterrupt", "", "", true)).kind, OutcomeKind::Cancelled);
}

TEST(OutcomeClassifierTest, ForeignErrorCarriesTypeMessageAndTraceback) {
    auto outcome = classify(ForeignException("ValueError", "bad chunk", "Traceback...\nValueError: bad chunk\n"));
    EXPECT_EQ(outcome.kind, OutcomeKind::Failure);
    EXPECT_EQ(outcome.reason.rfind("ValueError: bad chunk\nTraceback...", 0), 0u);
}

TEST(OutcomeClassifierTest, LongTracebackIsTruncated) {
    const std::string traceback(5000, 'x');
    auto outcome = classify(ForeignException("RuntimeError", "m", traceback));
    EXPECT_EQ(outcome.reason.size(), std::string("RuntimeError: m\n").size() + OutcomeClassifier::kTracebackLimit);
}

TEST(OutcomeClassifierTest, TimeoutIsFailureNamingPhase) {
    auto outcome = classify(PhaseTimeout("processing", 2.5, 1.0, TimeoutScope::Step));
    EXPECT_EQ(outcome.kind, OutcomeKind::Failure);
    EXPECT_EQ(outcome.reason, "Step timeout: processing took 2.50s > 1.00s");
}

TEST(OutcomeClassifierTest, TotalTimeoutMessage) {
    PhaseTimeout timeout("imports", 12.0, 10.0, TimeoutScope::Total);
    EXPECT_STREQ(timeout.what(), "Total timeout exceeded (12.00s > 10.00s) during: imports");
    EXPECT_EQ(timeout.kind(), ErrorKind::PhaseTimeout);
}

TEST(OutcomeClassifierTest, PlainExceptionUsesWhat) {
    EXPECT_EQ(classify(std::runtime_error("disk full")).reason, "disk full");
}

TEST(OutcomeClassifierTest, NonStandardExceptionIsUnknown) {
    EXPECT_EQ(classify(17).reason, "unknown error");
    EXPECT_EQ(OutcomeClassifier::fromException(nullptr).reason, "unknown error");
}

TEST(OutcomeClassifierTest, KindNames) {
    EXPECT_STREQ(toString(OutcomeKind::Success), "Success");
    EXPECT_STREQ(toString(OutcomeKind::Cancelled), "Cancelled");
    EXPECT_STREQ(toString(OutcomeKind::Failure), "Failure");
}

TEST(BridgeErrorTest, MessagesAndKinds) {
    EXPECT_STREQ(RuntimeLoadFailed("Missing ABI symbols: X").what(), "Runtime load failed: Missing ABI symbols: X");
    EXPECT_EQ(RuntimeNotFound("/a; /b").attempted(), "/a; /b");
    EXPECT_STREQ(Cancelled("timeout_PROCESSING").what(), "Cancelled (source: timeout_PROCESSING)");
    EXPECT_EQ(UnexpectedResultShape("str").kind(), ErrorKind::UnexpectedResultShape);
}
