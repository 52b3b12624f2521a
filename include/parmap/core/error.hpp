// ============================================================================
// parmap/core/error.hpp - Error Codes for parmap
// ============================================================================
//
// Every failure the library reports is a std::error_code. Conditions the
// library itself detects use the parmap error category below; failures
// produced by user work functions can use any category.
//
// USAGE:
// ------
//   Error ec = Errc::InvalidWorkerCount;
//   if (ec == Errc::InvalidWorkerCount) { /* handle */ }
//
// ============================================================================

#pragma once

#include <system_error>

namespace parmap {

enum class Errc {
    InvalidWorkerCount = 1,
    InvocationMismatch,
    MissingNamedArgument,
    NamedArgumentTypeMismatch,
    NotASequence,
    ElementTypeMismatch,
    ThreadConfigFailed,
    ExtendElementTypeUnset,
};

const std::error_category& ParmapCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

using Error = std::error_code;

}  // namespace parmap

namespace std {
template <>
struct is_error_code_enum<parmap::Errc> : true_type {};
}  // namespace std
