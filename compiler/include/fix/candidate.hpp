//! # Candidate Fixes
//!
//! A candidate is a tagged descriptor of one way to reconcile a type
//! mismatch. It is consumed by an external code-edit layer; the engine only
//! describes it.
//!
//! | Kind                  | Payload                 | Edit of `x`                  |
//! |-----------------------|-------------------------|------------------------------|
//! | `AsCast`              | target                  | `x as f64`                   |
//! | `ConvertVia`          | trait, target, error    | `T::from(x)`, `x.to_owned()` |
//! | `ConvertAndUnpackVia` | trait, Ok type, error   | `T::try_from(x)`             |
//! | `ChangeRefToMutable`  |                         | `&mut x`                     |
//! | `ToImmutableStr`      |                         | `x.as_str()`                 |
//! | `ToMutableStr`        |                         | `x.as_mut_str()`             |
//! | `DerefRefBridge`      | target, path            | `&mut &*x`                   |
//! | `ChangeReturnType`    | function name, new type | (signature edit)             |
//! | `ChangeLetType`       | binding name, new type  | (annotation edit)            |

#ifndef TYFIX_FIX_CANDIDATE_HPP
#define TYFIX_FIX_CANDIDATE_HPP

#include "coerce/path_finder.hpp"
#include "types/type.hpp"

#include <optional>
#include <string>

namespace tyfix::fix {

enum class ConversionKind {
    AsCast,
    ConvertVia,
    ConvertAndUnpackVia,
    ChangeRefToMutable,
    ToImmutableStr,
    ToMutableStr,
    DerefRefBridge,
    ChangeReturnType,
    ChangeLetType,
};

/// Standard trait a conversion goes through.
enum class ConversionTrait {
    From,
    TryFrom,
    FromStr,
    ToOwned,
    ToString,
    Borrow,
    BorrowMut,
    AsRef,
    AsMut,
};

[[nodiscard]] auto conversion_kind_to_string(ConversionKind kind) -> const char*;
[[nodiscard]] auto conversion_trait_to_string(ConversionTrait trait) -> const char*;

struct Candidate {
    ConversionKind kind;
    std::optional<ConversionTrait> via;
    types::TypePtr target;     ///< Type the fix produces (Ok type for unpack)
    types::TypePtr error_type; ///< `Error`/`Err` of fallible conversions
    std::optional<coerce::DerefRefPath> path;
    std::string name; ///< Binding or function name for the signature fixes

    static auto as_cast(types::TypePtr target) -> Candidate;
    static auto convert_via(ConversionTrait trait, types::TypePtr target,
                            types::TypePtr error_type = nullptr) -> Candidate;
    static auto convert_and_unpack_via(ConversionTrait trait, types::TypePtr ok_type,
                                       types::TypePtr error_type) -> Candidate;
    static auto change_ref_to_mutable() -> Candidate;
    static auto to_immutable_str() -> Candidate;
    static auto to_mutable_str() -> Candidate;
    static auto deref_ref_bridge(types::TypePtr target, coerce::DerefRefPath path) -> Candidate;
    static auto change_return_type(std::string function_name, types::TypePtr new_type)
        -> Candidate;
    static auto change_let_type(std::string binding, types::TypePtr new_type) -> Candidate;
};

/// One-line quick-fix title, e.g. "Convert to `String` using `ToString` trait".
[[nodiscard]] auto describe(const Candidate& candidate) -> std::string;

/// Replacement text for the mismatched expression.
///
/// `nullopt` for fixes that edit a signature rather than the expression, and
/// for `ChangeRefToMutable` when the expression is not a `&` borrow.
[[nodiscard]] auto suggested_edit(const Candidate& candidate, const std::string& expr_text)
    -> std::optional<std::string>;

} // namespace tyfix::fix

#endif // TYFIX_FIX_CANDIDATE_HPP
