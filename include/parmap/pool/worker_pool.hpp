// ============================================================================
// parmap/pool/worker_pool.hpp - Fixed-Size Worker Pool
// ============================================================================
//
// WorkerPool runs posted callbacks on a fixed set of threads.
//
// KEY CONCEPTS:
// -------------
// 1. BOUNDED PARALLELISM: exactly num_threads workers, so at most num_threads
//    callbacks run at once
// 2. AT-MOST-ONCE: each posted callback is popped by exactly one worker
// 3. RUN TO COMPLETION: a callback never yields its worker mid-way
// 4. SCOPED LIFETIME: the destructor drains the queue and joins every worker
//
// ParallelMap creates one pool per call and destroys it before returning.
//
// USAGE:
// ------
//   WorkerPool::Options opts;
//   opts.num_threads = 4;
//   opts.thread_name_prefix = "resize";
//   WorkerPool pool(opts);
//
//   pool.Post([] { Work(); });
//   pool.Wait();  // queue empty, nothing running
//
// ============================================================================

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "parmap/pool/thread_utils.hpp"

namespace parmap {

class WorkerPool {
   public:
    struct Options {
        // Values of 0 are raised to 1
        size_t num_threads = std::thread::hardware_concurrency();

        // Worker i is pinned to cpus[i % cpus.size()]
        CpuAffinity cpu_affinity;

        // Workers are named "prefix-0", "prefix-1", ...
        std::string thread_name_prefix = "parmap";

        Options() = default;
    };

    WorkerPool();

    explicit WorkerPool(size_t num_threads);

    explicit WorkerPool(const Options& options);

    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a callback for some worker. Posting after Shutdown() is ignored.
    void Post(std::function<void()> callback);

    // Block until the queue is empty and no callback is running
    void Wait();

    // Finish queued work, then join all workers. Idempotent.
    void Shutdown();

    size_t NumThreads() const { return workers_.size(); }

    // Workers whose name or affinity could not be applied
    size_t ThreadConfigFailures() const { return config_failures_.load(); }

   private:
    void WorkerLoop(size_t worker_index);

    void ConfigureWorker(size_t worker_index);

    Options options_;

    std::vector<std::thread> workers_;

    std::queue<std::function<void()>> work_queue_;
    std::mutex queue_mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;

    bool stopping_ = false;
    size_t active_tasks_ = 0;
    std::atomic<size_t> config_failures_{0};
};

// Index of the pool worker running the calling thread, or nullopt when the
// caller is not a pool worker.
std::optional<size_t> CurrentWorkerIndex();

}  // namespace parmap
