// ============================================================================
// WorkerPool Implementation
// ============================================================================

#include "parmap/pool/worker_pool.hpp"

namespace parmap {

namespace {

thread_local std::optional<size_t> g_worker_index;

}  // namespace

std::optional<size_t> CurrentWorkerIndex() {
    return g_worker_index;
}

// ============================================================================
// Construction / Destruction
// ============================================================================

WorkerPool::WorkerPool() : WorkerPool(Options{}) {}

WorkerPool::WorkerPool(size_t num_threads) : WorkerPool([num_threads] {
      Options options;
      options.num_threads = num_threads;
      return options;
  }()) {}

WorkerPool::WorkerPool(const Options& options) : options_(options) {
    if (options_.num_threads == 0) {
        options_.num_threads = 1;
    }

    workers_.reserve(options_.num_threads);
    for (size_t i = 0; i < options_.num_threads; ++i) {
        workers_.emplace_back([this, i] { WorkerLoop(i); });
    }
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

// ============================================================================
// Public Interface
// ============================================================================

void WorkerPool::Post(std::function<void()> callback) {
    if (!callback) return;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return;
        }
        work_queue_.push(std::move(callback));
    }
    work_available_.notify_one();
}

void WorkerPool::Wait() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_.wait(lock, [this] { return work_queue_.empty() && active_tasks_ == 0; });
}

void WorkerPool::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// ============================================================================
// Worker Thread
// ============================================================================

void WorkerPool::ConfigureWorker(size_t worker_index) {
    if (options_.cpu_affinity.IsSet()) {
        if (!SetThreadAffinity(CpuAffinity::SingleCore(options_.cpu_affinity.ForWorker(worker_index)))) {
            config_failures_++;
        }
    }
    if (!options_.thread_name_prefix.empty()) {
        if (!SetThreadName(options_.thread_name_prefix + "-" + std::to_string(worker_index))) {
            config_failures_++;
        }
    }
}

void WorkerPool::WorkerLoop(size_t worker_index) {
    g_worker_index = worker_index;
    ConfigureWorker(worker_index);

    while (true) {
        std::function<void()> callback;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !work_queue_.empty(); });

            if (work_queue_.empty()) {
                // stopping_ and nothing left to drain
                break;
            }

            callback = std::move(work_queue_.front());
            work_queue_.pop();
            // Counted under the lock so Wait() never sees an empty queue
            // with the popped callback not yet marked active.
            active_tasks_++;
        }

        callback();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_tasks_--;
        }
        idle_.notify_all();
    }

    g_worker_index.reset();
}

}  // namespace parmap
