//! # Deref/Ref Path Finder
//!
//! Searches for a way to turn the actual type into the expected type by first
//! dereferencing it some number of times and then taking references:
//!
//! ```text
//! expected: &mut &i32        actual: Box<i32>
//!   peel expected:  &mut &i32 (0)  &i32 (1)  i32 (2)
//!   actual seq:     Box<i32>  i32
//!   match i32 at derefs = 1, depth 2  =>  &mut &*x
//! ```
//!
//! Synthesizing a mutable reference additionally requires a mutable place
//! reached only through mutable references.

#ifndef TYFIX_COERCE_PATH_FINDER_HPP
#define TYFIX_COERCE_PATH_FINDER_HPP

#include "syntax/expr_handle.hpp"
#include "traits/oracle.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tyfix::coerce {

/// Strip `derefs` layers via the coercion sequence, then wrap with `refs`.
///
/// `refs` lists the reference layers of the expected type outer to inner, so
/// the rebuilt type applies `refs.back()` first.
struct DerefRefPath {
    size_t derefs = 0;
    std::vector<types::Mutability> refs;

    [[nodiscard]] auto operator==(const DerefRefPath& other) const -> bool = default;
};

/// Finds the deref/ref path from `actual` to `expected`, if any.
///
/// Only `expr.is_mutable_place()` is consulted.
[[nodiscard]] auto find_deref_ref_path(const types::TypePtr& expected,
                                       const types::TypePtr& actual,
                                       const syntax::ExprHandle& expr,
                                       traits::TraitOracle& oracle)
    -> std::optional<DerefRefPath>;

/// Rebuilds the type the path produces from a coercion sequence.
///
/// Returns nullptr if the sequence is shorter than `path.derefs + 1`.
[[nodiscard]] auto apply_deref_ref_path(const std::vector<types::TypePtr>& actual_seq,
                                        const DerefRefPath& path) -> types::TypePtr;

/// Rewritten expression, e.g. `&mut &**x`.
[[nodiscard]] auto render_deref_ref_path(const DerefRefPath& path, const std::string& expr_text)
    -> std::string;

} // namespace tyfix::coerce

#endif // TYFIX_COERCE_PATH_FINDER_HPP
