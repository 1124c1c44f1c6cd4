//! # Error Codes
//!
//! Stable rustc error identifiers used by the diagnostic catalogue. Each code
//! links to its entry in the Rust error index.
//!
//! | Code  | Meaning                                         |
//! |-------|-------------------------------------------------|
//! | E0004 | non-exhaustive match                            |
//! | E0054 | cast to `bool`                                  |
//! | E0057 | wrong argument count for a closure              |
//! | E0060 | too few arguments for a variadic function       |
//! | E0061 | wrong argument count for a function             |
//! | E0069 | `return;` in a function returning a value       |
//! | E0133 | unsafe operation outside `unsafe`               |
//! | E0308 | mismatched types                                |
//! | E0451 | private field in a struct literal               |
//! | E0594 | assignment to an immutable place                |
//! | E0603 | private item                                    |
//! | E0614 | dereference of a non-pointer type               |
//! | E0616 | private field access                            |
//! | E0624 | private method                                  |

#ifndef TYFIX_DIAG_ERROR_CODE_HPP
#define TYFIX_DIAG_ERROR_CODE_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tyfix::diag {

enum class ErrorCode {
    E0004,
    E0054,
    E0057,
    E0060,
    E0061,
    E0069,
    E0133,
    E0308,
    E0451,
    E0594,
    E0603,
    E0614,
    E0616,
    E0624,
};

/// `"E0308"`
[[nodiscard]] auto code(ErrorCode error) -> std::string;

/// `https://doc.rust-lang.org/error-index.html#E0308`
[[nodiscard]] auto info_url(ErrorCode error) -> std::string;

/// Every code, in numeric order.
[[nodiscard]] auto all_error_codes() -> const std::vector<ErrorCode>&;

/// Case-insensitive; surrounding whitespace is ignored.
[[nodiscard]] auto parse_error_code(std::string_view text) -> std::optional<ErrorCode>;

} // namespace tyfix::diag

#endif // TYFIX_DIAG_ERROR_CODE_HPP
