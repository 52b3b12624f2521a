// ============================================================================
// parmap/map/parallel_map.hpp - Ordered Parallel Map
// ============================================================================
//
// ParallelMap applies a work function to every input, optionally on a pool of
// worker threads, and returns the results in input order.
//
// PHASES:
// -------
// 1. WARM-UP: the first warmup_count inputs run synchronously on the calling
//    thread. Any failure here fails the whole call, whatever the error
//    policy, before a single worker thread exists.
//
// 2. DISPATCH: with num_workers == 1 the rest run serially on the calling
//    thread. Otherwise each input becomes one task on a WorkerPool created
//    for this call; the calling thread blocks until every task has finished,
//    reporting progress as tasks complete.
//
// 3. COLLECTION: outcomes are taken in input order (never completion order)
//    and each goes through the same routine: error policy first, then the
//    accumulator. The serial path runs the routine right after each task.
//
// ORDERING:
// ---------
//   output = initial_result ++ warm-up results ++ dispatched results
//
// Each dispatched task writes only its own outcome slot. The output
// collection and the progress sink are only touched by the calling thread.
//
// USAGE:
// ------
//   MapOptions opts;
//   opts.num_workers = 4;
//   opts.on_error = ErrorPolicy::Raise;
//
//   auto squares = ParallelMap(std::vector{1, 2, 3}, [](int x) { return x * x; }, opts);
//   if (squares) {
//       for (const auto& entry : *squares.Value()) Print(entry.Value());
//   }
//
//   // Flatten, seed, or customise through the mapper directly
//   auto words = ParallelMapper<std::string, std::vector<std::string>, std::string>(
//                    Positional<std::string>(Split), opts)
//                    .WithInitialResult({Success(std::string("header"))})
//                    .Run(lines);
//
// ============================================================================

#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

#include "parmap/core/check.hpp"
#include "parmap/core/defer.hpp"
#include "parmap/core/error.hpp"
#include "parmap/core/outcome.hpp"
#include "parmap/map/accumulator.hpp"
#include "parmap/map/invocation.hpp"
#include "parmap/map/options.hpp"
#include "parmap/map/progress.hpp"
#include "parmap/pool/worker_pool.hpp"
#include "parmap/sync/completion_latch.hpp"

namespace parmap {

// Success holds the collection, or nullopt when return_output is false
template <typename Elem>
using MapResult = Outcome<std::optional<Collection<Elem>>>;

namespace detail {

template <typename Range>
using RangeIterator = decltype(std::begin(std::declval<Range&>()));

template <typename Range>
using RangeElement = std::remove_cvref_t<std::iter_reference_t<RangeIterator<Range>>>;

// Remaining inputs after warm-up. Elements of multi-pass ranges are used in
// place; anything else is copied once so tasks own stable storage.
template <typename In, typename It>
class PendingInputs {
   public:
    static constexpr bool kInPlace = std::forward_iterator<It> &&
                                     std::is_lvalue_reference_v<std::iter_reference_t<It>> &&
                                     std::is_same_v<std::remove_cvref_t<std::iter_reference_t<It>>, In>;

    template <typename Sentinel>
    PendingInputs(It first, Sentinel last) {
        for (; first != last; ++first) {
            if constexpr (kInPlace) {
                items_.push_back(std::addressof(*first));
            } else {
                items_.emplace_back(*first);
            }
        }
    }

    size_t Size() const { return items_.size(); }

    const In& operator[](size_t i) const {
        if constexpr (kInPlace) {
            return *items_[i];
        } else {
            return items_[i];
        }
    }

   private:
    std::vector<std::conditional_t<kInPlace, const In*, In>> items_;
};

}  // namespace detail

// ============================================================================
// ParallelMapper<In, R, Elem>
// ============================================================================
//
// In    input element type (KwArgs<V> for keyworded work)
// R     success type of the work function
// Elem  entry type of the output; R for Append, R's element type for Extend
//
template <typename In, typename R, typename Elem = R>
class ParallelMapper {
   public:
    ParallelMapper(Invocation<In, R> work, MapOptions options)
        : work_(std::move(work)), options_(std::move(options)) {}

    // Entries placed ahead of all mapped results
    ParallelMapper& WithInitialResult(Collection<Elem> initial) {
        initial_result_ = std::move(initial);
        return *this;
    }

    // Replaces the Append/Extend strategy selected by append_mode
    ParallelMapper& WithAccumulator(std::shared_ptr<Accumulator<R, Elem>> accumulator) {
        accumulator_ = std::move(accumulator);
        return *this;
    }

    ParallelMapper& WithAccumulator(typename FunctionAccumulator<R, Elem>::Fn fn) {
        accumulator_ = std::make_shared<FunctionAccumulator<R, Elem>>(std::move(fn));
        return *this;
    }

    const MapOptions& Options() const { return options_; }

    // Map every element of inputs. Single-pass ranges are consumed.
    template <typename Range>
    MapResult<Elem> Run(Range&& inputs) const;

   private:
    // Shared by warm-up, serial, and pooled paths
    class Collector {
       public:
        Collector(const MapOptions& options, Accumulator<R, Elem>& accumulator, Collection<Elem>& output)
            : options_(options), accumulator_(accumulator), output_(output) {}

        Status Collect(Outcome<R> outcome, ErrorPolicy policy) {
            if (outcome.IsFailure()) {
                switch (policy) {
                    case ErrorPolicy::Raise:
                        return Failure(std::move(outcome).Error());
                    case ErrorPolicy::Suppress:
                        return Success();
                    case ErrorPolicy::CollectAsEntry:
                        break;
                }
            }
            if (!options_.return_output) {
                return Success();
            }

            Status stored = accumulator_.Accumulate(std::move(outcome), output_);
            if (stored) {
                return stored;
            }

            // The value could not be stored: same policy as a work failure
            switch (policy) {
                case ErrorPolicy::Raise:
                    return stored;
                case ErrorPolicy::Suppress:
                    return Success();
                case ErrorPolicy::CollectAsEntry:
                    break;
            }
            return accumulator_.Accumulate(Failure(stored.Error()), output_);
        }

       private:
        const MapOptions& options_;
        Accumulator<R, Elem>& accumulator_;
        Collection<Elem>& output_;
    };

    template <typename It, typename Sentinel>
    Status RunSerial(It first, Sentinel last, Collector& collector, ProgressSink* sink) const;

    template <typename Pending>
    Status RunPooled(const Pending& pending, Collector& collector, ProgressSink* sink) const;

    Invocation<In, R> work_;
    MapOptions options_;
    Collection<Elem> initial_result_;
    std::shared_ptr<Accumulator<R, Elem>> accumulator_;
};

// ============================================================================
// Run
// ============================================================================

template <typename In, typename R, typename Elem>
template <typename Range>
MapResult<Elem> ParallelMapper<In, R, Elem>::Run(Range&& inputs) const {
    if (Status valid = ValidateOptions(options_, work_.Kind()); !valid) {
        return Failure(std::move(valid).Error());
    }

    // Sequence results whose items are not Elem: Extend would fail on every
    // entry, so refuse before any work runs
    if constexpr (std::ranges::input_range<R&> && !detail::SequenceOf<R, Elem>) {
        if (options_.append_mode == AppendMode::Extend && !accumulator_) {
            return Failure(Errc::ExtendElementTypeUnset);
        }
    }

    std::unique_ptr<Accumulator<R, Elem>> fallback;
    Accumulator<R, Elem>* accumulator = accumulator_.get();
    if (accumulator == nullptr) {
        fallback = MakeDefaultAccumulator<R, Elem>(options_.append_mode);
        accumulator = fallback.get();
    }

    Collection<Elem> output = initial_result_;
    Collector collector(options_, *accumulator, output);

    auto it = std::begin(inputs);
    auto last = std::end(inputs);

    // Warm-up: always fatal on failure
    for (size_t i = 0; i < options_.warmup_count && it != last; ++i, ++it) {
        if (Status status = collector.Collect(work_(*it), ErrorPolicy::Raise); !status) {
            return Failure(std::move(status).Error());
        }
    }

    std::shared_ptr<ProgressSink> sink;
    if (options_.show_progress) {
        sink = options_.progress_sink ? options_.progress_sink
                                      : std::make_shared<TerminalProgressSink>(options_.progress_label);
    }

    Status dispatched = Success();
    if (options_.num_workers == 1) {
        dispatched = RunSerial(it, last, collector, sink.get());
    } else {
        detail::PendingInputs<In, decltype(it)> pending(it, last);
        dispatched = RunPooled(pending, collector, sink.get());
    }
    if (!dispatched) {
        return Failure(std::move(dispatched).Error());
    }

    if (!options_.return_output) {
        return Success(std::optional<Collection<Elem>>{});
    }
    return Success(std::optional<Collection<Elem>>(std::move(output)));
}

// ============================================================================
// Serial dispatch
// ============================================================================

template <typename In, typename R, typename Elem>
template <typename It, typename Sentinel>
Status ParallelMapper<In, R, Elem>::RunSerial(It first, Sentinel last, Collector& collector,
                                              ProgressSink* sink) const {
    size_t total = kUnknownTotal;
    if constexpr (std::forward_iterator<It> && std::is_same_v<It, Sentinel>) {
        total = static_cast<size_t>(std::distance(first, last));
    }

    if (sink) sink->OnStart(total);
    PARMAP_DEFER([sink] {
        if (sink) sink->OnFinish();
    });

    size_t completed = 0;
    for (; first != last; ++first) {
        Outcome<R> outcome = work_(*first);
        ++completed;
        if (sink) sink->OnProgress(completed, total);

        if (Status status = collector.Collect(std::move(outcome), options_.on_error); !status) {
            return status;
        }
    }
    return Success();
}

// ============================================================================
// Pooled dispatch
// ============================================================================

template <typename In, typename R, typename Elem>
template <typename Pending>
Status ParallelMapper<In, R, Elem>::RunPooled(const Pending& pending, Collector& collector,
                                              ProgressSink* sink) const {
    const size_t total = pending.Size();
    std::vector<std::optional<Outcome<R>>> slots(total);

    if (sink) sink->OnStart(total);
    PARMAP_DEFER([sink] {
        if (sink) sink->OnFinish();
    });

    if (total > 0) {
        WorkerPool::Options pool_options;
        pool_options.num_threads = std::min(options_.num_workers, total);
        pool_options.thread_name_prefix = options_.thread_name_prefix;
        pool_options.cpu_affinity = options_.cpu_affinity;

        // Declared first so the pool is joined before the latch goes away
        CompletionLatch latch(total);
        WorkerPool pool(pool_options);

        for (size_t i = 0; i < total; ++i) {
            pool.Post([this, &pending, &slots, &latch, i] {
                slots[i].emplace(work_(pending[i]));
                latch.CountDown();
            });
        }

        latch.Wait([sink](size_t completed, size_t count) {
            if (sink) sink->OnProgress(completed, count);
        });
    }

    for (size_t i = 0; i < total; ++i) {
        PARMAP_CHECK(slots[i].has_value(), "task finished without an outcome");
        if (Status status = collector.Collect(std::move(*slots[i]), options_.on_error); !status) {
            return status;
        }
    }
    return Success();
}

// ============================================================================
// ParallelMap - deduce everything from the arguments
// ============================================================================
//
// work is either an Invocation (Positional / Keyworded) or any callable
// taking one input element. Elem defaults to the work result type; name it
// explicitly for Extend, e.g. ParallelMap<int>(rows, SplitRow, opts).
// Extend over sequence results without it fails with ExtendElementTypeUnset.
//

namespace detail {

template <typename Elem, typename Range, typename Work>
auto MakeMapper(Work&& work, const MapOptions& options) {
    auto invocation = [&] {
        if constexpr (kIsInvocation<Work>) {
            return std::forward<Work>(work);
        } else {
            return Positional<RangeElement<Range>>(std::forward<Work>(work));
        }
    }();

    using Inv = std::remove_cvref_t<decltype(invocation)>;
    using In = typename Inv::input_type;
    using R = typename Inv::result_type;
    using E = std::conditional_t<std::is_void_v<Elem>, R, Elem>;

    return ParallelMapper<In, R, E>(std::move(invocation), options);
}

}  // namespace detail

template <typename Elem = void, typename Range, typename Work>
auto ParallelMap(Range&& inputs, Work&& work, const MapOptions& options = MapOptions{}) {
    return detail::MakeMapper<Elem, Range>(std::forward<Work>(work), options).Run(std::forward<Range>(inputs));
}

// accumulator is a std::shared_ptr<Accumulator<R, Elem>> or a callable
// Status(Outcome<R>, Collection<Elem>&); it replaces append_mode.
template <typename Elem = void, typename Range, typename Work, typename Acc>
auto ParallelMap(Range&& inputs, Work&& work, const MapOptions& options, Acc&& accumulator) {
    auto mapper = detail::MakeMapper<Elem, Range>(std::forward<Work>(work), options);
    mapper.WithAccumulator(std::forward<Acc>(accumulator));
    return mapper.Run(std::forward<Range>(inputs));
}

}  // namespace parmap
