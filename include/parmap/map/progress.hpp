// ============================================================================
// parmap/map/progress.hpp - Progress Observers
// ============================================================================
//
// A ProgressSink watches the dispatch phase of a map call. The mapper calls
// it from the calling thread only, in this order:
//
//   OnStart(total)                 total = number of dispatched tasks
//   OnProgress(completed, total)   once per finished task, completed = 1..total
//   OnFinish()                     always, also when the call fails early
//
// Warm-up inputs are not counted. A total of kUnknownTotal means the input
// is single-pass and its length is not known up front; a total of 0 is an
// empty dispatch, which gets no OnProgress calls.
//
// Progress is cosmetic: nothing a sink does affects the map result.
//
// ============================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <limits>
#include <string>
#include <string_view>

namespace parmap {

// Total reported for single-pass inputs
inline constexpr size_t kUnknownTotal = std::numeric_limits<size_t>::max();

class ProgressSink {
   public:
    virtual ~ProgressSink() = default;

    virtual void OnStart(size_t total) = 0;
    virtual void OnProgress(size_t completed, size_t total) = 0;
    virtual void OnFinish() = 0;
};

class NullProgressSink final : public ProgressSink {
   public:
    void OnStart(size_t) override {}
    void OnProgress(size_t, size_t) override {}
    void OnFinish() override {}
};

// ============================================================================
// TerminalProgressSink - single redrawn status line
// ============================================================================
//
//   squares:  40%|########            | 8/20 [00:01<00:01, 7.90it/s]
//
class TerminalProgressSink final : public ProgressSink {
   public:
    explicit TerminalProgressSink(std::string label = {}, std::FILE* out = stderr, size_t bar_width = 20);

    void OnStart(size_t total) override;
    void OnProgress(size_t completed, size_t total) override;
    void OnFinish() override;

   private:
    void Draw(size_t completed, size_t total);

    std::string label_;
    std::FILE* out_;
    size_t bar_width_;
    size_t last_completed_ = 0;
    size_t last_total_ = 0;
    bool drawn_ = false;
    std::chrono::steady_clock::time_point start_;
};

// Render one status line (no carriage return or newline)
std::string FormatProgressLine(std::string_view label, size_t completed, size_t total,
                               std::chrono::duration<double> elapsed, size_t bar_width);

}  // namespace parmap
