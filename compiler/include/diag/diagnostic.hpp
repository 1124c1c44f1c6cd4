//! # Diagnostic Catalogue
//!
//! Every diagnostic the engine can raise is one alternative of `Diagnostic`.
//! `prepare()` turns any of them into a uniform `PreparedAnnotation` that an
//! editor or the command line tool can display.
//!
//! | Kind                      | Code                | Header                                    |
//! |---------------------------|---------------------|-------------------------------------------|
//! | `TypeError`               | E0308               | mismatched types                          |
//! | `DerefError`              | E0614               | type `T` cannot be dereferenced           |
//! | `AccessError`             | E0603 / E0624       | <kind> `name` is private                  |
//! | `StructFieldAccessError`  | E0451 / E0616       | Field `f` of struct `S` is private        |
//! | `CastAsBoolError`         | E0054               | It is not allowed to cast to a bool.      |
//! | `ArgumentCountError`      | E0060 / E0061 / E0057 | This function takes N parameters ...    |
//! | `UnsafeError`             | E0133               | (message)                                 |
//! | `NonExhaustiveMatch`      | E0004               | Match must be exhaustive                  |
//! | `CannotAssignToImmutable` | E0594               | Cannot assign to (message)                |
//! | `ReturnMustHaveValue`     | E0069               | `return;` in a function whose return ...  |

#ifndef TYFIX_DIAG_DIAGNOSTIC_HPP
#define TYFIX_DIAG_DIAGNOSTIC_HPP

#include "diag/error_code.hpp"
#include "fix/candidate.hpp"
#include "syntax/expr_handle.hpp"
#include "traits/oracle.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tyfix::diag {

enum class Severity {
    Info,
    Warn,
    Error,
    UnknownSymbol,
};

[[nodiscard]] auto severity_to_string(Severity severity) -> const char*;

struct PreparedAnnotation {
    Severity severity;
    std::optional<ErrorCode> code;
    std::string header;
    std::string description;
    std::vector<fix::Candidate> fixes;
};

// ============================================================================
// Diagnostic kinds
// ============================================================================

/// Expected and actual types of an expression do not unify.
///
/// Create with `make_type_error` so that inference variables are rendered
/// before unification narrows them.
struct TypeError {
    const syntax::ExprHandle* expr; ///< Borrowed from the caller
    types::TypePtr expected;
    types::TypePtr actual;
    std::optional<std::string> captured_description;
};

struct DerefError {
    types::TypePtr type;
};

/// Use of a private item (`E0603`) or method (`E0624`).
struct AccessError {
    ErrorCode code;
    std::string item_kind; ///< "Function", "Struct", "Method", ...
    std::string name;
};

struct StructFieldAccessError {
    std::string field;
    std::string struct_name;
    bool in_literal; ///< Inside a struct literal: E0451, otherwise E0616
};

struct CastAsBoolError {
    std::string expr_text;
};

enum class FunctionKind {
    VariadicFunction, ///< E0060
    Function,         ///< E0061
    Closure,          ///< E0057
};

struct ArgumentCountError {
    FunctionKind function_kind;
    size_t expected;
    size_t actual;
};

struct UnsafeError {
    std::string message;
};

struct NonExhaustiveMatch {
    std::vector<std::string> missing_patterns;
};

struct CannotAssignToImmutable {
    std::string message; ///< What is immutable, e.g. "immutable borrowed content"
};

struct ReturnMustHaveValue {};

using Diagnostic =
    std::variant<TypeError, DerefError, AccessError, StructFieldAccessError, CastAsBoolError,
                 ArgumentCountError, UnsafeError, NonExhaustiveMatch, CannotAssignToImmutable,
                 ReturnMustHaveValue>;

/// Builds a `TypeError`, capturing the description now if either type still
/// contains an inference variable.
[[nodiscard]] auto make_type_error(const syntax::ExprHandle& expr, types::TypePtr expected,
                                   types::TypePtr actual) -> TypeError;

/// Error code of a diagnostic without preparing it.
[[nodiscard]] auto error_code_of(const Diagnostic& diagnostic) -> ErrorCode;

/// Builds the annotation. The oracle is consulted only for `TypeError`.
[[nodiscard]] auto prepare(const Diagnostic& diagnostic, traits::TraitOracle& oracle)
    -> PreparedAnnotation;

// ============================================================================
// Presentation
// ============================================================================

/// ``header [E0308]``, or just the header without a code.
[[nodiscard]] auto simple_header(const std::optional<ErrorCode>& code, const std::string& header)
    -> std::string;

/// `<html>header [<a href='url'>E0308</a>]<br>description</html>`, escaped.
[[nodiscard]] auto html_description(const PreparedAnnotation& annotation) -> std::string;

/// Escapes `&`, `<`, `>`, `"` and `'`.
[[nodiscard]] auto escape_html(const std::string& text) -> std::string;

} // namespace tyfix::diag

#endif // TYFIX_DIAG_DIAGNOSTIC_HPP
