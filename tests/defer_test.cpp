// ============================================================================
// Defer Tests
// ============================================================================

#include "parmap/core/defer.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace parmap;

// ============================================================================
// Basic Defer Tests
// ============================================================================

TEST(DeferTest, RunsOnScopeExit) {
    bool executed = false;
    {
        Defer d([&] { executed = true; });
        EXPECT_FALSE(executed);
    }
    EXPECT_TRUE(executed);
}

TEST(DeferTest, RunsInReverseOrder) {
    std::string order;
    {
        Defer d1([&] { order += "1"; });
        Defer d2([&] { order += "2"; });
        Defer d3([&] { order += "3"; });
    }
    EXPECT_EQ(order, "321");
}

TEST(DeferTest, Cancel) {
    bool executed = false;
    {
        Defer d([&] { executed = true; });
        d.Cancel();
    }
    EXPECT_FALSE(executed);
}

TEST(DeferTest, MoveConstructionRunsOnce) {
    int count = 0;
    {
        Defer d1([&] { count++; });
        Defer d2(std::move(d1));
    }
    EXPECT_EQ(count, 1);
}

// ============================================================================
// PARMAP_DEFER Macro Tests
// ============================================================================

TEST(DeferTest, DeferMacro) {
    bool executed = false;
    {
        PARMAP_DEFER([&] { executed = true; });
        EXPECT_FALSE(executed);
    }
    EXPECT_TRUE(executed);
}

TEST(DeferTest, RunsOnEarlyReturn) {
    int finished = 0;
    auto body = [&](bool bail) {
        PARMAP_DEFER([&] { finished++; });
        if (bail) {
            return 1;
        }
        return 2;
    };

    EXPECT_EQ(body(true), 1);
    EXPECT_EQ(body(false), 2);
    EXPECT_EQ(finished, 2);
}
