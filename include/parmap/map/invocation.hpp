// ============================================================================
// parmap/map/invocation.hpp - How a Work Function Receives Its Input
// ============================================================================
//
// Invocation<In, R> wraps a work function as a single call shape,
// Outcome<R>(const In&), fixed once before any input is processed. Two
// builders produce it:
//
//   Positional<In>(f)          f receives the input element itself
//   Keyworded<V>(names, f)     the input element is a KwArgs<V> mapping;
//                              f's parameters are looked up by name
//
// Work functions may return a plain value (always a success), an
// Outcome<R> (failure signalled through the outcome), or void (the result
// is Unit; useful when running for side effects only).
//
// USAGE:
// ------
//   auto square = Positional<int>([](int x) { return x * x; });
//
//   auto area = Keyworded<double>({"width", "height"},
//                                 [](double w, double h) { return w * h; });
//   area(KwArgs<double>{{"width", 2.0}, {"height", 3.0}});  // Success(6.0)
//
// ============================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "parmap/core/check.hpp"
#include "parmap/core/error.hpp"
#include "parmap/core/outcome.hpp"

namespace parmap {

// Named arguments for one task
template <typename V>
using KwArgs = std::map<std::string, V, std::less<>>;

enum class InvocationKind { Positional, Keyworded };

// ============================================================================
// Result-type plumbing
// ============================================================================

template <typename Ret>
struct WorkResult {
    using type = Ret;
};

template <typename R>
struct WorkResult<Outcome<R, Error>> {
    using type = R;
};

template <>
struct WorkResult<void> {
    using type = Unit;
};

// The value type a work function produces on success
template <typename Ret>
using WorkResultT = typename WorkResult<std::remove_cvref_t<Ret>>::type;

namespace detail {

// Call f and normalise whatever it returns into an Outcome
template <typename F, typename... Args>
Outcome<WorkResultT<std::invoke_result_t<F&, Args...>>> CallLifted(F& f, Args&&... args) {
    using Ret = std::invoke_result_t<F&, Args...>;
    if constexpr (std::is_void_v<Ret>) {
        std::invoke(f, std::forward<Args>(args)...);
        return Success();
    } else if constexpr (std::is_same_v<std::remove_cvref_t<Ret>, Outcome<WorkResultT<Ret>, Error>>) {
        return std::invoke(f, std::forward<Args>(args)...);
    } else {
        return Success(std::invoke(f, std::forward<Args>(args)...));
    }
}

template <typename Arg, typename V>
struct VariantHolds : std::false_type {};

template <typename Arg, typename... Ts>
struct VariantHolds<Arg, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<Arg, Ts> || ...)> {};

template <typename T>
struct IsVariant : std::false_type {};

template <typename... Ts>
struct IsVariant<std::variant<Ts...>> : std::true_type {};

// Implicit and brace-initializable, so 2.7 never reaches an int parameter
template <typename Arg, typename V>
concept ConvertsWithoutNarrowing = std::is_convertible_v<const V&, Arg> && requires(const V& v) { Arg{v}; };

// Convert one stored keyword value to a parameter type. Variant values
// must hold exactly the requested alternative.
template <typename Arg, typename V>
std::optional<Arg> ArgCast(const V& value) {
    if constexpr (IsVariant<V>::value) {
        if constexpr (VariantHolds<Arg, V>::value) {
            if (const Arg* held = std::get_if<Arg>(&value)) {
                return *held;
            }
        }
        return std::nullopt;
    } else if constexpr (ConvertsWithoutNarrowing<Arg, V>) {
        return static_cast<Arg>(value);
    } else {
        return std::nullopt;
    }
}

template <typename Sig>
struct Signature;

template <typename Ret, typename... Args>
struct Signature<std::function<Ret(Args...)>> {
    using Params = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t kArity = sizeof...(Args);
};

template <typename V, typename F, size_t... I>
auto InvokeNamed(F& f, const std::vector<std::string>& names, const KwArgs<V>& kwargs, std::index_sequence<I...>)
    -> decltype(CallLifted(f, std::declval<std::tuple_element_t<I, typename Signature<decltype(std::function{f})>::Params>>()...)) {
    using Params = typename Signature<decltype(std::function{f})>::Params;

    std::tuple<std::optional<std::tuple_element_t<I, Params>>...> resolved;
    Error error;

    auto resolve = [&]<size_t J>(std::integral_constant<size_t, J>) -> bool {
        using Arg = std::tuple_element_t<J, Params>;
        auto it = kwargs.find(names[J]);
        if (it == kwargs.end()) {
            error = Errc::MissingNamedArgument;
            return false;
        }
        std::get<J>(resolved) = ArgCast<Arg>(it->second);
        if (!std::get<J>(resolved)) {
            error = Errc::NamedArgumentTypeMismatch;
            return false;
        }
        return true;
    };

    if (!(resolve(std::integral_constant<size_t, I>{}) && ...)) {
        return Failure(error);
    }
    return CallLifted(f, std::move(*std::get<I>(resolved))...);
}

}  // namespace detail

// ============================================================================
// Invocation<In, R>
// ============================================================================
template <typename In, typename R>
class Invocation {
   public:
    using input_type = In;
    using result_type = R;
    using Fn = std::function<Outcome<R>(const In&)>;

    Invocation(InvocationKind kind, Fn fn) : kind_(kind), fn_(std::move(fn)) {}

    Outcome<R> operator()(const In& input) const { return fn_(input); }

    InvocationKind Kind() const noexcept { return kind_; }

    bool IsKeyworded() const noexcept { return kind_ == InvocationKind::Keyworded; }

   private:
    InvocationKind kind_;
    Fn fn_;
};

template <typename T>
struct IsInvocation : std::false_type {};

template <typename In, typename R>
struct IsInvocation<Invocation<In, R>> : std::true_type {};

template <typename T>
inline constexpr bool kIsInvocation = IsInvocation<std::remove_cvref_t<T>>::value;

// ============================================================================
// Builders
// ============================================================================

template <typename In, typename F>
auto Positional(F f) -> Invocation<In, WorkResultT<std::invoke_result_t<F&, const In&>>> {
    using R = WorkResultT<std::invoke_result_t<F&, const In&>>;
    return Invocation<In, R>(InvocationKind::Positional,
                             [f = std::move(f)](const In& input) mutable { return detail::CallLifted(f, input); });
}

// names[i] is the key looked up for f's i-th parameter
template <typename V, typename F>
auto Keyworded(std::vector<std::string> names, F f) {
    using Sig = detail::Signature<decltype(std::function{f})>;
    using Indices = std::make_index_sequence<Sig::kArity>;
    using R = typename decltype(detail::InvokeNamed<V>(f, names, std::declval<const KwArgs<V>&>(),
                                                        Indices{}))::value_type;

    PARMAP_CHECK(names.size() == Sig::kArity, "Keyworded: one name is required per parameter");

    return Invocation<KwArgs<V>, R>(InvocationKind::Keyworded,
                                    [f = std::move(f), names = std::move(names)](const KwArgs<V>& kwargs) mutable {
                                        return detail::InvokeNamed<V>(f, names, kwargs, Indices{});
                                    });
}

}  // namespace parmap
