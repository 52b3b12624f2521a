// ============================================================================
// parmap/pool/thread_utils.hpp - Worker Thread Configuration
// ============================================================================
//
// Naming and CPU pinning for pool workers. Both report failure as a Status
// carrying Errc::ThreadConfigFailed; the pool treats that as non-fatal since
// a worker that keeps its default name or placement still does correct work.
//
// USAGE:
// ------
//   SetThreadName("parmap-0");                  // visible in top, /proc
//   SetThreadAffinity(CpuAffinity::Range(0, 3));
//
// ============================================================================

#pragma once

#include <string>
#include <vector>

#include "parmap/core/outcome.hpp"

namespace parmap {

// Set of cores a thread may run on. Empty means unrestricted.
struct CpuAffinity {
    std::vector<int> cpus;

    static CpuAffinity None() { return CpuAffinity{}; }

    static CpuAffinity SingleCore(int cpu) { return CpuAffinity{{cpu}}; }

    // Inclusive range [first, last]
    static CpuAffinity Range(int first, int last) {
        CpuAffinity affinity;
        for (int i = first; i <= last; ++i) {
            affinity.cpus.push_back(i);
        }
        return affinity;
    }

    bool IsSet() const { return !cpus.empty(); }

    // Core for worker `index` under round-robin assignment. Requires IsSet().
    int ForWorker(size_t index) const { return cpus[index % cpus.size()]; }
};

// Pin the calling thread. An unset affinity is a successful no-op.
Status SetThreadAffinity(const CpuAffinity& affinity);

// Name the calling thread. Linux keeps at most 15 characters.
Status SetThreadName(const std::string& name);

// Name the calling thread currently has
std::string GetThreadName();

}  // namespace parmap
