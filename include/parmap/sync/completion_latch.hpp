// ============================================================================
// parmap/sync/completion_latch.hpp - Join Barrier with Per-Completion Hook
// ============================================================================
//
// CompletionLatch is a one-shot countdown: workers call CountDown() as each
// task reaches a terminal state, and one waiting thread blocks in Wait()
// until the count reaches zero.
//
// Unlike std::latch, Wait() can observe every individual completion: the
// optional callback runs on the waiting thread once per CountDown(), in the
// order completions happened. This is how the mapper reports progress
// without letting worker threads touch the progress sink.
//
// USAGE:
// ------
//   CompletionLatch latch(tasks.size());
//   for (auto& t : tasks) pool.Post([&] { t(); latch.CountDown(); });
//   latch.Wait([](size_t done, size_t total) { Report(done, total); });
//
// ============================================================================

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace parmap {

class CompletionLatch {
   public:
    using OnCompletion = std::function<void(size_t completed, size_t total)>;

    explicit CompletionLatch(size_t count) : total_(count) {}

    CompletionLatch(const CompletionLatch&) = delete;
    CompletionLatch& operator=(const CompletionLatch&) = delete;

    // Extra calls past zero are ignored
    void CountDown() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (completed_ == total_) {
            return;
        }
        ++completed_;
        // Under the lock: once Wait() returns the latch may be destroyed
        changed_.notify_all();
    }

    // Block until every count has arrived. on_completion runs without the
    // lock held, so it may be slow without stalling workers.
    void Wait(const OnCompletion& on_completion = nullptr) {
        size_t reported = 0;
        std::unique_lock<std::mutex> lock(mutex_);
        while (reported < total_) {
            changed_.wait(lock, [&] { return completed_ > reported; });
            size_t now = completed_;
            lock.unlock();
            while (reported < now) {
                ++reported;
                if (on_completion) {
                    on_completion(reported, total_);
                }
            }
            lock.lock();
        }
    }

   private:
    const size_t total_;
    size_t completed_ = 0;
    std::mutex mutex_;
    std::condition_variable changed_;
};

}  // namespace parmap
