//! # Common Definitions
//!
//! Types and helpers shared by every lspack module.
//!
//! ## Overview
//!
//! - **Version Information**: tool version constants
//! - **Result Type**: error handling without exceptions
//! - **Smart Pointers**: aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: fallible operations return `Result<T, E>`; the error
//!   side is normally `PackError` (see `common/error.hpp`)
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared

#ifndef LSPACK_COMMON_HPP
#define LSPACK_COMMON_HPP

#include <memory>
#include <string>
#include <variant>

namespace lspack {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "1.0.0";

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<BuildTarget, PackError> r = resolve_build_target(host, opts);
/// if (is_err(r)) {
///     report(unwrap_err(r));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Placeholder success value for operations that return nothing.
struct Unit {};

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on a success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

template <typename T> using Box = std::unique_ptr<T>;

template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace lspack

#endif // LSPACK_COMMON_HPP
