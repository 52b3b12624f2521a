// ============================================================================
// MapOptions Tests
// ============================================================================

#include "parmap/map/options.hpp"

#include "parmap/map/invocation.hpp"

#include <gtest/gtest.h>

using namespace parmap;

// ============================================================================
// Defaults
// ============================================================================

TEST(MapOptionsTest, Defaults) {
    MapOptions options;
    EXPECT_EQ(options.num_workers, 16u);
    EXPECT_FALSE(options.use_named_arguments);
    EXPECT_EQ(options.warmup_count, 3u);
    EXPECT_TRUE(options.show_progress);
    EXPECT_EQ(options.on_error, ErrorPolicy::CollectAsEntry);
    EXPECT_EQ(options.append_mode, AppendMode::Append);
    EXPECT_TRUE(options.return_output);
    EXPECT_FALSE(options.progress_sink);
    EXPECT_EQ(options.thread_name_prefix, "parmap");
    EXPECT_FALSE(options.cpu_affinity.IsSet());
}

// ============================================================================
// Validation
// ============================================================================

TEST(MapOptionsTest, DefaultsArePositionalAndValid) {
    EXPECT_TRUE(ValidateOptions(MapOptions{}, InvocationKind::Positional));
}

TEST(MapOptionsTest, ZeroWorkersRejected) {
    MapOptions options;
    options.num_workers = 0;

    Status status = ValidateOptions(options, InvocationKind::Positional);
    ASSERT_TRUE(status.IsFailure());
    EXPECT_EQ(status.Error(), Errc::InvalidWorkerCount);
}

TEST(MapOptionsTest, SingleWorkerAccepted) {
    MapOptions options;
    options.num_workers = 1;
    EXPECT_TRUE(ValidateOptions(options, InvocationKind::Positional));
}

TEST(MapOptionsTest, NamedModeMustMatchInvocation) {
    MapOptions named;
    named.use_named_arguments = true;

    EXPECT_TRUE(ValidateOptions(named, InvocationKind::Keyworded));
    EXPECT_EQ(ValidateOptions(named, InvocationKind::Positional).Error(), Errc::InvocationMismatch);
    EXPECT_EQ(ValidateOptions(MapOptions{}, InvocationKind::Keyworded).Error(), Errc::InvocationMismatch);
}

TEST(MapOptionsTest, WorkerCountCheckedFirst) {
    MapOptions options;
    options.num_workers = 0;
    options.use_named_arguments = true;

    EXPECT_EQ(ValidateOptions(options, InvocationKind::Positional).Error(), Errc::InvalidWorkerCount);
}

// ============================================================================
// ToString
// ============================================================================

TEST(MapOptionsTest, PolicyNames) {
    EXPECT_EQ(ToString(ErrorPolicy::Raise), "Raise");
    EXPECT_EQ(ToString(ErrorPolicy::CollectAsEntry), "CollectAsEntry");
    EXPECT_EQ(ToString(ErrorPolicy::Suppress), "Suppress");
    EXPECT_EQ(ToString(AppendMode::Append), "Append");
    EXPECT_EQ(ToString(AppendMode::Extend), "Extend");
}
