// ============================================================================
// parmap/map/accumulator.hpp - Merging Task Outcomes into the Output
// ============================================================================
//
// An Accumulator<R, Elem> decides how one task's Outcome<R> lands in the
// output Collection<Elem>. The mapper owns exactly one per call:
//
//   AppendAccumulator    one entry per task
//   ExtendAccumulator    R is a sequence; one entry per element of it
//   FunctionAccumulator  caller-supplied callable
//
// A failure outcome reaching an accumulator (error policy CollectAsEntry)
// is stored as a single failure entry by both built-in strategies.
//
// Accumulate() returns a failing Status when the value cannot be stored
// (wrong shape for the mode). The mapper routes that through the error
// policy just like a work failure.
//
// ============================================================================

#pragma once

#include <functional>
#include <memory>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

#include "parmap/core/error.hpp"
#include "parmap/core/outcome.hpp"
#include "parmap/map/options.hpp"

namespace parmap {

// Ordered output of a map call
template <typename Elem>
using Collection = std::vector<Outcome<Elem>>;

template <typename R, typename Elem = R>
class Accumulator {
   public:
    virtual ~Accumulator() = default;

    virtual Status Accumulate(Outcome<R> outcome, Collection<Elem>& output) = 0;
};

template <typename R, typename Elem = R>
class AppendAccumulator final : public Accumulator<R, Elem> {
   public:
    Status Accumulate(Outcome<R> outcome, Collection<Elem>& output) override {
        if (outcome.IsFailure()) {
            output.emplace_back(Failure(std::move(outcome).Error()));
            return Success();
        }
        if constexpr (std::is_convertible_v<R&&, Elem>) {
            output.emplace_back(Success(static_cast<Elem>(std::move(outcome).Value())));
            return Success();
        } else {
            return Failure(Errc::ElementTypeMismatch);
        }
    }
};

namespace detail {

template <typename R, typename Elem>
concept SequenceOf = std::ranges::input_range<R&> && std::is_convertible_v<std::ranges::range_reference_t<R&>, Elem>;

}  // namespace detail

template <typename R, typename Elem>
class ExtendAccumulator final : public Accumulator<R, Elem> {
   public:
    Status Accumulate(Outcome<R> outcome, Collection<Elem>& output) override {
        if (outcome.IsFailure()) {
            output.emplace_back(Failure(std::move(outcome).Error()));
            return Success();
        }
        if constexpr (detail::SequenceOf<R, Elem>) {
            R& values = outcome.Value();
            for (auto&& value : values) {
                output.emplace_back(Success(static_cast<Elem>(value)));
            }
            return Success();
        } else {
            return Failure(Errc::NotASequence);
        }
    }
};

template <typename R, typename Elem = R>
class FunctionAccumulator final : public Accumulator<R, Elem> {
   public:
    using Fn = std::function<Status(Outcome<R>, Collection<Elem>&)>;

    explicit FunctionAccumulator(Fn fn) : fn_(std::move(fn)) {}

    Status Accumulate(Outcome<R> outcome, Collection<Elem>& output) override {
        return fn_(std::move(outcome), output);
    }

   private:
    Fn fn_;
};

template <typename R, typename Elem>
std::unique_ptr<Accumulator<R, Elem>> MakeDefaultAccumulator(AppendMode mode) {
    if (mode == AppendMode::Extend) {
        return std::make_unique<ExtendAccumulator<R, Elem>>();
    }
    return std::make_unique<AppendAccumulator<R, Elem>>();
}

}  // namespace parmap
