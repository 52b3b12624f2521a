// ============================================================================
// parmap/core/generator.hpp - Single-Pass Lazy Input Sequences
// ============================================================================
//
// Generator<T> produces values on demand with co_yield. It is the library's
// forward-only input: ParallelMap consumes it exactly once, so the warm-up
// phase advances it irrevocably and the remainder is buffered for dispatch.
//
// Generator models std::ranges::input_range. end() is std::default_sentinel,
// so a multi-pass algorithm cannot mistake it for a forward range, and its
// length is never known up front (progress shows a count instead of a bar).
//
// The body may not co_await. Yielded temporaries stay valid until the
// generator is resumed again, so nothing is copied on yield.
//
// USAGE:
// ------
//   Generator<int> ReadIds(Source& src) {
//       while (auto id = src.Next()) co_yield *id;
//   }
//
//   auto squares = ParallelMap(ReadIds(src), Square, options);
//
// ============================================================================

#pragma once

#include <coroutine>
#include <cstddef>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>

namespace parmap {

template <typename T>
class Generator {
   public:
    using value_type = std::remove_cvref_t<T>;
    using reference = const value_type&;

    class promise_type {
       public:
        Generator get_return_object() noexcept {
            return Generator{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        // Nothing runs until begin()
        std::suspend_always initial_suspend() noexcept { return {}; }
        std::suspend_always final_suspend() noexcept { return {}; }

        std::suspend_always yield_value(const value_type& value) noexcept {
            current_ = std::addressof(value);
            return {};
        }

        template <typename U>
        std::suspend_never await_transform(U&&) = delete;

        void return_void() noexcept {}

        // Built with -fno-exceptions; unreachable
        void unhandled_exception() noexcept { std::abort(); }

        reference Current() const noexcept { return *current_; }

       private:
        const value_type* current_ = nullptr;
    };

    using Handle = std::coroutine_handle<promise_type>;

    class Iterator {
       public:
        using iterator_concept = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = Generator::value_type;

        Iterator() noexcept = default;
        explicit Iterator(Handle handle) noexcept : handle_(handle) {}

        Iterator& operator++() {
            handle_.resume();
            return *this;
        }

        void operator++(int) { ++*this; }

        reference operator*() const noexcept { return handle_.promise().Current(); }

        friend bool operator==(const Iterator& it, std::default_sentinel_t) noexcept {
            return !it.handle_ || it.handle_.done();
        }

       private:
        Handle handle_ = nullptr;
    };

    Generator(Generator&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Generator& operator=(Generator&& other) noexcept {
        if (this != &other) {
            Reset();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    ~Generator() { Reset(); }

    // Runs to the first co_yield. Call once.
    Iterator begin() {
        if (handle_ && !handle_.done()) {
            handle_.resume();
        }
        return Iterator{handle_};
    }

    std::default_sentinel_t end() const noexcept { return std::default_sentinel; }

   private:
    explicit Generator(Handle handle) noexcept : handle_(handle) {}

    void Reset() {
        if (handle_) {
            handle_.destroy();
            handle_ = nullptr;
        }
    }

    Handle handle_ = nullptr;
};

}  // namespace parmap
