// ============================================================================
// parmap/core/check.hpp - Always-On Invariant Checks
// ============================================================================
//
// PARMAP_CHECK(cond, msg) guards internal invariants of the library (an
// outcome slot left empty after the join, a Keyworded name list that does not
// match the parameter count). It is never compiled out. On failure it writes
// the condition, message and source location to stderr and aborts.
//
// User-facing misconfiguration is NOT a check failure: it is reported as a
// Failure outcome carrying a parmap::Errc.
//
// ============================================================================

#pragma once

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace parmap::detail {

// Writes the decimal digits of value so they end at buf_end and returns
// where they start. Ten digits cover any 32-bit line number.
inline char* FormatLineNumber(unsigned int value, char* buf_end) {
    char* first = buf_end;
    do {
        *--first = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value != 0);
    return first;
}

// No printf-family calls: the report is assembled from fixed pieces
[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    char digits[12];
    char* const digits_end = digits + sizeof(digits);
    const char* const line = FormatLineNumber(static_cast<unsigned int>(loc.line()), digits_end);

    const char* const head[] = {"PARMAP_CHECK(", cond_str, ") failed: ", msg, "\n  in ", loc.function_name(),
                                " (", loc.file_name(), ":"};
    for (const char* piece : head) {
        std::fputs(piece, stderr);
    }
    std::fwrite(line, 1, static_cast<size_t>(digits_end - line), stderr);
    std::fputs(")\n", stderr);
    std::fflush(stderr);
    std::abort();
}

}  // namespace parmap::detail

#define PARMAP_CHECK(cond, msg)                                                       \
    do {                                                                              \
        if (!(cond)) [[unlikely]] {                                                   \
            ::parmap::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                             \
    } while (0)
