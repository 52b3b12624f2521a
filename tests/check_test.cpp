// ============================================================================
// Check Tests
// ============================================================================

#include "parmap/core/check.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace parmap;

// ============================================================================
// Line Number Formatting
// ============================================================================

TEST(CheckTest, FormatLineNumberWritesDigitsBeforeEnd) {
    char buf[12];
    char* end = buf + sizeof(buf);

    char* first = detail::FormatLineNumber(4096, end);
    EXPECT_EQ(std::string(first, end), "4096");

    first = detail::FormatLineNumber(0, end);
    EXPECT_EQ(std::string(first, end), "0");

    first = detail::FormatLineNumber(4294967295u, end);
    EXPECT_EQ(std::string(first, end), "4294967295");
}

// ============================================================================
// PARMAP_CHECK
// ============================================================================

TEST(CheckTest, PassingCheckDoesNothing) {
    int evaluated = 0;
    PARMAP_CHECK(++evaluated == 1, "evaluated once");
    EXPECT_EQ(evaluated, 1);
}

TEST(CheckDeathTest, FailingCheckReportsConditionAndMessage) {
    EXPECT_DEATH(PARMAP_CHECK(1 + 1 == 3, "arithmetic is broken"),
                 "PARMAP_CHECK\\(1 \\+ 1 == 3\\) failed: arithmetic is broken");
}

TEST(CheckDeathTest, FailingCheckReportsSourceLocation) {
    EXPECT_DEATH(PARMAP_CHECK(false, "location"), "check_test\\.cpp:[0-9]+\\)");
}
