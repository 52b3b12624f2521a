// ============================================================================
// parmap/core/defer.hpp - Scope-Exit Actions
// ============================================================================
//
// Defer runs a callable when it goes out of scope, on every return path. The
// mapper uses it to close the progress display whether the call succeeds or
// bails out on the first failure.
//
// USAGE:
// ------
//   sink.OnStart(total);
//   PARMAP_DEFER([&] { sink.OnFinish(); });
//
// ============================================================================

#pragma once

#include <functional>
#include <utility>

namespace parmap {

class Defer {
   public:
    template <typename F>
    explicit Defer(F&& func) : action_(std::forward<F>(func)) {}

    ~Defer() {
        if (action_) {
            action_();
        }
    }

    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;

    Defer(Defer&& other) noexcept : action_(std::exchange(other.action_, nullptr)) {}
    Defer& operator=(Defer&&) = delete;

    // Drop the action without running it
    void Cancel() { action_ = nullptr; }

   private:
    std::function<void()> action_;
};

#define PARMAP_DEFER_CONCAT_IMPL(a, b) a##b
#define PARMAP_DEFER_CONCAT(a, b) PARMAP_DEFER_CONCAT_IMPL(a, b)
#define PARMAP_DEFER(lambda) ::parmap::Defer PARMAP_DEFER_CONCAT(_parmap_defer_, __LINE__){lambda}

}  // namespace parmap
