//! # compbench Common Definitions
//!
//! The harness version and the `Result<T, E>` type every fallible
//! operation returns. Failures that belong to one benchmark (a compiler
//! that crashes, an input that cannot be written) travel back as values so
//! the report can print them and move on; nothing in the harness throws
//! for an expected failure.

#ifndef COMPBENCH_COMMON_HPP
#define COMPBENCH_COMMON_HPP

#include <string>
#include <variant>

namespace compbench {

/// Printed by `compbench --version`.
constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Result
// ============================================================================

/// Success value `T` or error `E`; `T` and `E` must differ.
///
/// ```cpp
/// auto stats = bench::summarize(samples);
/// if (is_err(stats)) {
///     return unwrap_err(stats).message;
/// }
/// double mean_ms = unwrap(stats).mean * 1000.0;
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return result.index() == 0;
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return result.index() == 1;
}

/// The success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<0>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<0>(result);
}

/// The error value. Throws `std::bad_variant_access` on a success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<1>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<1>(result);
}

} // namespace compbench

#endif // COMPBENCH_COMMON_HPP
