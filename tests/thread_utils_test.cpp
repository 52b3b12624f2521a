// ============================================================================
// Thread Utilities Tests
// ============================================================================

#include "parmap/pool/thread_utils.hpp"

#include <gtest/gtest.h>
#include <pthread.h>
#include <sched.h>
#include <thread>

using namespace parmap;

// ============================================================================
// CpuAffinity Factory Tests
// ============================================================================

TEST(CpuAffinityTest, NoneIsNotSet) {
    auto affinity = CpuAffinity::None();
    EXPECT_FALSE(affinity.IsSet());
    EXPECT_TRUE(affinity.cpus.empty());
}

TEST(CpuAffinityTest, SingleCore) {
    auto affinity = CpuAffinity::SingleCore(3);
    EXPECT_TRUE(affinity.IsSet());
    ASSERT_EQ(affinity.cpus.size(), 1u);
    EXPECT_EQ(affinity.cpus[0], 3);
}

TEST(CpuAffinityTest, Range) {
    auto affinity = CpuAffinity::Range(2, 5);
    EXPECT_TRUE(affinity.IsSet());
    EXPECT_EQ(affinity.cpus, (std::vector<int>{2, 3, 4, 5}));
}

TEST(CpuAffinityTest, ForWorkerIsRoundRobin) {
    auto affinity = CpuAffinity::Range(4, 6);
    EXPECT_EQ(affinity.ForWorker(0), 4);
    EXPECT_EQ(affinity.ForWorker(1), 5);
    EXPECT_EQ(affinity.ForWorker(2), 6);
    EXPECT_EQ(affinity.ForWorker(3), 4);
    EXPECT_EQ(affinity.ForWorker(7), 5);
}

// ============================================================================
// SetThreadAffinity Tests
// ============================================================================

TEST(ThreadUtilsTest, SetAffinityNoneSucceeds) {
    EXPECT_TRUE(SetThreadAffinity(CpuAffinity::None()));
}

TEST(ThreadUtilsTest, SetAffinitySingleCoreOnWorkerThread) {
    bool success = false;
    bool pinned = false;

    std::thread worker([&]() {
        success = static_cast<bool>(SetThreadAffinity(CpuAffinity::SingleCore(0)));

        cpu_set_t cpuset;
        CPU_ZERO(&cpuset);
        pthread_getaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
        pinned = CPU_ISSET(0, &cpuset) && CPU_COUNT(&cpuset) == 1;
    });
    worker.join();

    EXPECT_TRUE(success);
    EXPECT_TRUE(pinned);
}

TEST(ThreadUtilsTest, SetAffinityOutOfRangeFails) {
    Status status = Success();

    std::thread worker([&]() { status = SetThreadAffinity(CpuAffinity::SingleCore(CPU_SETSIZE + 1)); });
    worker.join();

    ASSERT_TRUE(status.IsFailure());
    EXPECT_EQ(status.Error(), Errc::ThreadConfigFailed);
}

// ============================================================================
// SetThreadName Tests
// ============================================================================

TEST(ThreadUtilsTest, SetThreadName) {
    std::string observed;

    std::thread worker([&]() {
        EXPECT_TRUE(SetThreadName("test-worker"));
        observed = GetThreadName();
    });
    worker.join();

    EXPECT_EQ(observed, "test-worker");
}

TEST(ThreadUtilsTest, SetThreadNameTruncation) {
    std::string observed;

    std::thread worker([&]() {
        // Linux limits to 15 chars; truncated rather than rejected
        EXPECT_TRUE(SetThreadName("this-is-a-very-long-thread-name"));
        observed = GetThreadName();
    });
    worker.join();

    EXPECT_EQ(observed, "this-is-a-very-");
}
