// ============================================================================
// Outcome Type Tests
// ============================================================================

#include <gtest/gtest.h>

#include <string>

#include "parmap/core/outcome.hpp"

using namespace parmap;

// ============================================================================
// Basic Outcome Tests
// ============================================================================

TEST(OutcomeTest, SuccessConstruction) {
    Outcome<int> outcome = Success(42);

    EXPECT_TRUE(outcome.IsSuccess());
    EXPECT_FALSE(outcome.IsFailure());
    EXPECT_EQ(outcome.Value(), 42);
}

TEST(OutcomeTest, FailureConstruction) {
    Outcome<int, std::string> outcome = Failure(std::string("boom"));

    EXPECT_FALSE(outcome.IsSuccess());
    EXPECT_TRUE(outcome.IsFailure());
    EXPECT_EQ(outcome.Error(), "boom");
}

TEST(OutcomeTest, FailureFromErrc) {
    Outcome<int> outcome = Failure(Errc::NotASequence);

    ASSERT_TRUE(outcome.IsFailure());
    EXPECT_EQ(outcome.Error(), Errc::NotASequence);
    EXPECT_EQ(&outcome.Error().category(), &ParmapCategory());
}

TEST(OutcomeTest, BoolConversion) {
    Outcome<int> ok = Success(1);
    Outcome<int> err = Failure(Errc::ElementTypeMismatch);

    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(OutcomeTest, ValueOr) {
    Outcome<int> ok = Success(42);
    Outcome<int> err = Failure(Errc::ElementTypeMismatch);

    EXPECT_EQ(ok.ValueOr(0), 42);
    EXPECT_EQ(err.ValueOr(0), 0);
}

TEST(OutcomeTest, HoldsErrorCodeFromAnyCategory) {
    Outcome<double> outcome = Failure(std::make_error_code(std::errc::argument_out_of_domain));

    ASSERT_TRUE(outcome.IsFailure());
    EXPECT_EQ(outcome.Error(), std::errc::argument_out_of_domain);
}

TEST(OutcomeTest, MoveOutValue) {
    Outcome<std::string> ok = Success(std::string("payload"));
    std::string taken = std::move(ok).Value();
    EXPECT_EQ(taken, "payload");
}

// ============================================================================
// Equality
// ============================================================================

TEST(OutcomeTest, Equality) {
    Outcome<int> a = Success(1);
    Outcome<int> b = Success(1);
    Outcome<int> c = Success(2);
    Outcome<int> d = Failure(Errc::NotASequence);
    Outcome<int> e = Failure(Errc::NotASequence);
    Outcome<int> f = Failure(Errc::ElementTypeMismatch);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_EQ(d, e);
    EXPECT_NE(d, f);
}

// ============================================================================
// Status (Outcome<void>)
// ============================================================================

TEST(OutcomeTest, StatusSuccess) {
    Status status = Success();
    EXPECT_TRUE(status.IsSuccess());
    EXPECT_TRUE(static_cast<bool>(status));
}

TEST(OutcomeTest, StatusFailure) {
    Status status = Failure(Errc::ThreadConfigFailed);
    ASSERT_TRUE(status.IsFailure());
    EXPECT_EQ(status.Error(), Errc::ThreadConfigFailed);
}

TEST(OutcomeTest, UnitIsEqualToItself) {
    Outcome<Unit> a = Success();
    Outcome<Unit> b = Success();
    EXPECT_EQ(a, b);
}

// ============================================================================
// Traits
// ============================================================================

TEST(OutcomeTest, IsOutcomeTrait) {
    static_assert(kIsOutcome<Outcome<int>>);
    static_assert(kIsOutcome<const Outcome<int>&>);
    static_assert(kIsOutcome<Status>);
    static_assert(!kIsOutcome<int>);
    static_assert(!kIsOutcome<std::error_code>);
    SUCCEED();
}
