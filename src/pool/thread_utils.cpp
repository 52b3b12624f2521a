// ============================================================================
// parmap/pool/thread_utils.cpp - Worker Thread Configuration
// ============================================================================

#include "parmap/pool/thread_utils.hpp"

#include <pthread.h>
#include <sched.h>

namespace parmap {

Status SetThreadAffinity(const CpuAffinity& affinity) {
    if (!affinity.IsSet()) {
        return Success();
    }

    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);

    for (int cpu : affinity.cpus) {
        if (cpu >= 0 && cpu < CPU_SETSIZE) {
            CPU_SET(cpu, &cpuset);
        }
    }

    if (pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) != 0) {
        return Failure(Errc::ThreadConfigFailed);
    }
    return Success();
}

Status SetThreadName(const std::string& name) {
    std::string truncated = name.substr(0, 15);
    if (pthread_setname_np(pthread_self(), truncated.c_str()) != 0) {
        return Failure(Errc::ThreadConfigFailed);
    }
    return Success();
}

std::string GetThreadName() {
    char buf[16] = {};
    if (pthread_getname_np(pthread_self(), buf, sizeof(buf)) != 0) {
        return {};
    }
    return buf;
}

}  // namespace parmap
