// ============================================================================
// parmap/map/options.hpp - Map Call Configuration
// ============================================================================
//
// MapOptions holds every scalar knob of a ParallelMap call. Defaults match
// the common case: 16 workers, 3 warm-up inputs, progress on stderr, and
// failures recorded in the output instead of failing the call.
//
// USAGE:
// ------
//   MapOptions opts;
//   opts.num_workers = 8;
//   opts.warmup_count = 0;
//   opts.on_error = ErrorPolicy::Raise;
//   opts.show_progress = false;
//
// ============================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "parmap/core/outcome.hpp"
#include "parmap/map/progress.hpp"
#include "parmap/pool/thread_utils.hpp"

namespace parmap {

enum class InvocationKind;

// What happens to a task failure after warm-up
enum class ErrorPolicy {
    Raise,           // the call fails with the first failure in input order
    CollectAsEntry,  // the failure is stored in the output in place
    Suppress,        // the failure is dropped
};

// How a successful result enters the output
enum class AppendMode {
    Append,  // one entry per result
    Extend,  // result is a sequence; one entry per element
};

struct MapOptions {
    // Degree of parallelism; 1 runs everything on the calling thread
    size_t num_workers = 16;

    // Input elements are KwArgs and the work function is Keyworded
    bool use_named_arguments = false;

    // Leading inputs run synchronously first; their failures always fail
    // the call
    size_t warmup_count = 3;

    bool show_progress = true;

    ErrorPolicy on_error = ErrorPolicy::CollectAsEntry;

    AppendMode append_mode = AppendMode::Append;

    // false: run for side effects only, no collection is built
    bool return_output = true;

    // Used when show_progress is set. Null selects a TerminalProgressSink
    // on stderr.
    std::shared_ptr<ProgressSink> progress_sink;

    std::string progress_label;

    // Worker thread configuration
    std::string thread_name_prefix = "parmap";
    CpuAffinity cpu_affinity;

    MapOptions() = default;
};

// Check preconditions before any input is touched
Status ValidateOptions(const MapOptions& options, InvocationKind kind);

std::string_view ToString(ErrorPolicy policy);
std::string_view ToString(AppendMode mode);

}  // namespace parmap
