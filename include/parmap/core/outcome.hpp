// ============================================================================
// parmap/core/outcome.hpp - Tagged Success/Failure Type
// ============================================================================
//
// Outcome<T, E> is the result of one unit of work: either Success(value) or
// Failure(error). Work functions return it instead of throwing, the mapper
// routes it through accumulation and error policy, and an output collection
// may hold failures as entries.
//
// USAGE:
// ------
//   Outcome<int> Divide(int a, int b) {
//       if (b == 0) return Failure(std::make_error_code(std::errc::invalid_argument));
//       return Success(a / b);
//   }
//
//   auto outcome = Divide(10, 2);
//   if (outcome) {
//       Use(outcome.Value());
//   }
//
//   Status Store(int v);  // Outcome<void>: success carries no value
//
// ============================================================================

#pragma once

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include "parmap/core/error.hpp"

namespace parmap {

template <typename T, typename E>
class Outcome;

// ============================================================================
// Success and Failure Tags
// ============================================================================

template <typename T>
struct SuccessTag {
    T value;

    template <typename U>
    explicit SuccessTag(U&& v) : value(std::forward<U>(v)) {}
};

template <typename E>
struct FailureTag {
    E error;

    template <typename U>
    explicit FailureTag(U&& e) : error(std::forward<U>(e)) {}
};

template <typename T>
SuccessTag<std::decay_t<T>> Success(T&& value) {
    return SuccessTag<std::decay_t<T>>(std::forward<T>(value));
}

template <typename E>
FailureTag<std::decay_t<E>> Failure(E&& error) {
    return FailureTag<std::decay_t<E>>(std::forward<E>(error));
}

// Library error codes are errors, not values
inline FailureTag<Error> Failure(Errc code) {
    return FailureTag<Error>(make_error_code(code));
}

struct Unit {
    bool operator==(const Unit&) const = default;
};

inline SuccessTag<Unit> Success() {
    return SuccessTag<Unit>(Unit{});
}

// ============================================================================
// Outcome<T, E>
// ============================================================================
template <typename T, typename E = Error>
class Outcome {
   public:
    using value_type = T;
    using error_type = E;

    template <typename U>
    Outcome(SuccessTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template <typename U>
    Outcome(FailureTag<U>&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    Outcome(const Outcome&) = default;
    Outcome(Outcome&&) = default;
    Outcome& operator=(const Outcome&) = default;
    Outcome& operator=(Outcome&&) = default;

    bool IsSuccess() const noexcept { return data_.index() == 0; }
    bool IsFailure() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsSuccess(); }

    // Undefined if IsFailure()
    T& Value() & { return std::get<0>(data_); }
    const T& Value() const& { return std::get<0>(data_); }
    T&& Value() && { return std::get<0>(std::move(data_)); }

    // Undefined if IsSuccess()
    E& Error() & { return std::get<1>(data_); }
    const E& Error() const& { return std::get<1>(data_); }
    E&& Error() && { return std::get<1>(std::move(data_)); }

    T ValueOr(T fallback) const {
        if (IsSuccess()) return std::get<0>(data_);
        return fallback;
    }

   private:
    std::variant<T, E> data_;
};

// ============================================================================
// Outcome<void, E>
// ============================================================================
template <typename E>
class Outcome<void, E> {
   public:
    using value_type = void;
    using error_type = E;

    Outcome(SuccessTag<Unit>&&) : error_(std::nullopt) {}

    template <typename U>
    Outcome(FailureTag<U>&& err) : error_(std::move(err.error)) {}

    bool IsSuccess() const noexcept { return !error_.has_value(); }
    bool IsFailure() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return IsSuccess(); }

    E& Error() & { return *error_; }
    const E& Error() const& { return *error_; }
    E&& Error() && { return std::move(*error_); }

   private:
    std::optional<E> error_;
};

using Status = Outcome<void, Error>;

template <typename T, typename E>
bool operator==(const Outcome<T, E>& lhs, const Outcome<T, E>& rhs) {
    if (lhs.IsSuccess() != rhs.IsSuccess()) return false;
    if (lhs.IsSuccess()) return lhs.Value() == rhs.Value();
    return lhs.Error() == rhs.Error();
}

template <typename T, typename E>
bool operator!=(const Outcome<T, E>& lhs, const Outcome<T, E>& rhs) {
    return !(lhs == rhs);
}

// ============================================================================
// Traits
// ============================================================================

template <typename T>
struct IsOutcome : std::false_type {};

template <typename T, typename E>
struct IsOutcome<Outcome<T, E>> : std::true_type {};

template <typename T>
inline constexpr bool kIsOutcome = IsOutcome<std::remove_cvref_t<T>>::value;

}  // namespace parmap
