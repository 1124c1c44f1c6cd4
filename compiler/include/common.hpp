//! # Common Definitions
//!
//! Common types, utilities, and settings shared by every tyfix component.
//!
//! ## Overview
//!
//! - **Version Information**: Library version constants
//! - **Engine Options**: Global configuration for diagnosis runs
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Fallible operations return `Result<T, E>`; absence is
//!   `std::optional`
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared

#ifndef TYFIX_COMMON_HPP
#define TYFIX_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace tyfix {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.3.1";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 1;

// ============================================================================
// Engine Configuration
// ============================================================================

/// Default bound on the length of a coercion sequence built by the reference
/// oracle. User-defined `Deref` chains longer than this are cut off.
constexpr std::size_t DEFAULT_MAX_DEREF_DEPTH = 64;

/// Output format for printed annotations.
enum class OutputFormat {
    Text, ///< Human-readable, rustc style
    JSON, ///< One JSON object per annotation
};

/// Global engine options.
///
/// Set from the command line by the `tyfix` driver, or programmatically by an
/// embedding type checker.
///
/// # Example
///
/// ```cpp
/// EngineOptions::colors = false;
/// EngineOptions::max_deref_depth = 16;
/// ```
struct EngineOptions {
    /// Enable verbose output from the CLI.
    static inline bool verbose = false;

    /// Use ANSI colors when printing annotations.
    static inline bool colors = true;

    /// Format used by `diag::AnnotationPrinter`.
    static inline OutputFormat output_format = OutputFormat::Text;

    /// Upper bound on coercion sequence length (see `traits::ImplTable`).
    static inline std::size_t max_deref_depth = DEFAULT_MAX_DEREF_DEPTH;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<types::TypePtr, types::TypeParseError> parsed = types::parse_type("&str", names);
/// if (is_ok(parsed)) {
///     auto ty = unwrap(parsed);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

/// Converts a Result into an optional, dropping the error.
template <typename T, typename E>
[[nodiscard]] auto ok(const Result<T, E>& result) -> std::optional<T> {
    if (is_ok(result)) {
        return unwrap(result);
    }
    return std::nullopt;
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace tyfix

#endif // TYFIX_COMMON_HPP
