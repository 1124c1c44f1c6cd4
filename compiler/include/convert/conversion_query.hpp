//! # Conversion Trait Query
//!
//! Probes the trait oracle for the standard conversions that turn the actual
//! type into the expected one and reports each applicable one as a candidate.
//!
//! ## Check order
//!
//! | Step | Condition                                          | Candidate                   |
//! |------|----------------------------------------------------|-----------------------------|
//! | 1    | both numeric (only check when it applies)          | `AsCast`                    |
//! | 2    | `Expected: From<Actual>`                           | `ConvertVia(From)`          |
//! | 3    | else `Expected: TryFrom<Actual>`                   | `ConvertVia(TryFrom)`       |
//! | 4    | actual derefs to `str`, `Expected: FromStr`        | `ConvertVia(FromStr)`       |
//! | 5    | `<Actual as ToOwned>::Owned == Expected`           | `ConvertVia(ToOwned)`       |
//! | 6    | expected `String`, actual `ToString` or numeric    | `ConvertVia(ToString)`      |
//! | 7    | else expected `&T` / `&mut T`                      | `Borrow`, `AsRef`, `&mut`.. |
//! | 8    | else expected `Result<T, E>`                       | `ConvertAndUnpackVia`       |
//! | 9    | actual `String`, expected `&str` / `&mut str`      | `ToImmutableStr`, ...       |
//! | 10   | deref/ref path exists                              | `DerefRefBridge`            |
//!
//! Candidates come back in this order, without de-duplication.

#ifndef TYFIX_CONVERT_CONVERSION_QUERY_HPP
#define TYFIX_CONVERT_CONVERSION_QUERY_HPP

#include "fix/candidate.hpp"
#include "syntax/expr_handle.hpp"
#include "traits/oracle.hpp"

#include <optional>
#include <vector>

namespace tyfix::convert {

class ConversionQuery {
public:
    /// The oracle is borrowed for the lifetime of the query.
    explicit ConversionQuery(traits::TraitOracle& oracle);

    [[nodiscard]] auto candidates(const types::TypePtr& expected, const types::TypePtr& actual,
                                  const syntax::ExprHandle& expr) -> std::vector<fix::Candidate>;

private:
    traits::TraitOracle& oracle_;

    /// `Expected: From<Actual>`
    auto from_applies(const types::TypePtr& expected, const types::TypePtr& actual) -> bool;

    /// `<Target as TryFrom<Actual>>::Error`
    auto try_from_error(const types::TypePtr& target, const types::TypePtr& actual)
        -> std::optional<types::TypePtr>;

    /// `<Target as FromStr>::Err`, only when `actual` derefs to `str`.
    auto from_str_error(const types::TypePtr& target, const types::TypePtr& actual)
        -> std::optional<types::TypePtr>;

    /// `<Actual as ToOwned>::Owned == Expected`, probing through derefs.
    auto to_owned_matches(const types::TypePtr& expected, const types::TypePtr& actual) -> bool;

    auto to_string_applies(const types::TypePtr& actual) -> bool;

    /// `Actual: Trait<referent>` for some step of the coercion sequence.
    auto referent_trait_applies(const std::optional<types::ItemId>& trait,
                                const types::TypePtr& referent, const types::TypePtr& actual)
        -> bool;

    /// Projection of `assoc`, or nullopt if the trait or the name is unknown.
    auto project(const std::optional<types::ItemId>& trait, const types::TypePtr& self_type,
                 std::vector<types::TypePtr> args, const char* assoc, bool with_deref)
        -> std::optional<types::TypePtr>;

    void add_reference_candidates(const types::TypePtr& expected, const types::TypePtr& actual,
                                  const syntax::ExprHandle& expr,
                                  std::vector<fix::Candidate>& out);
    void add_result_candidates(const types::AdtType& expected, const types::TypePtr& actual,
                               std::vector<fix::Candidate>& out);
};

} // namespace tyfix::convert

#endif // TYFIX_CONVERT_CONVERSION_QUERY_HPP
