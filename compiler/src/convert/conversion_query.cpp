//! # Conversion Trait Query Implementation

#include "convert/conversion_query.hpp"

#include "coerce/path_finder.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace tyfix::convert {

using fix::Candidate;
using fix::ConversionTrait;

ConversionQuery::ConversionQuery(traits::TraitOracle& oracle) : oracle_(oracle) {}

// ============================================================================
// Oracle probes
// ============================================================================

auto ConversionQuery::project(const std::optional<types::ItemId>& trait,
                              const types::TypePtr& self_type, std::vector<types::TypePtr> args,
                              const char* assoc, bool with_deref)
    -> std::optional<types::TypePtr> {
    if (!trait)
        return std::nullopt;

    const auto* def = oracle_.lookup_trait(*trait);
    if (def == nullptr || !def->has_assoc_type(assoc))
        return std::nullopt;

    traits::TraitRef ref{self_type, *trait, std::move(args)};
    auto result = with_deref ? oracle_.select_projection_strict_with_deref(ref, assoc)
                             : oracle_.select_projection_strict(ref, assoc);
    if (is_err(result)) {
        TYFIX_LOG_TRACE("convert", trait->name << "::" << assoc << " for `"
                                               << types::type_to_string(self_type) << "`: "
                                               << traits::selection_error_to_string(
                                                      unwrap_err(result)));
    }
    return ok(result);
}

auto ConversionQuery::from_applies(const types::TypePtr& expected, const types::TypePtr& actual)
    -> bool {
    const auto& from = oracle_.known_items().from;
    if (!from)
        return false;
    return oracle_.can_select(traits::TraitRef{expected, *from, {actual}});
}

auto ConversionQuery::try_from_error(const types::TypePtr& target, const types::TypePtr& actual)
    -> std::optional<types::TypePtr> {
    return project(oracle_.known_items().try_from, target, {actual}, "Error", false);
}

auto ConversionQuery::from_str_error(const types::TypePtr& target, const types::TypePtr& actual)
    -> std::optional<types::TypePtr> {
    auto seq = oracle_.coercion_sequence(actual);
    if (seq.empty() || !types::is_str(seq.back()))
        return std::nullopt;
    return project(oracle_.known_items().from_str, target, {}, "Err", false);
}

auto ConversionQuery::to_owned_matches(const types::TypePtr& expected,
                                       const types::TypePtr& actual) -> bool {
    auto owned = project(oracle_.known_items().to_owned, actual, {}, "Owned", true);
    return owned && types::types_equal(expected, *owned);
}

auto ConversionQuery::to_string_applies(const types::TypePtr& actual) -> bool {
    const auto& to_string = oracle_.known_items().to_string;
    if (!to_string)
        return false;
    return oracle_.can_select_with_deref(traits::TraitRef{actual, *to_string, {}});
}

auto ConversionQuery::referent_trait_applies(const std::optional<types::ItemId>& trait,
                                             const types::TypePtr& referent,
                                             const types::TypePtr& actual) -> bool {
    if (!trait)
        return false;
    return oracle_.can_select_with_deref(traits::TraitRef{actual, *trait, {referent}});
}

// ============================================================================
// Candidate collection
// ============================================================================

auto ConversionQuery::candidates(const types::TypePtr& expected, const types::TypePtr& actual,
                                 const syntax::ExprHandle& expr) -> std::vector<Candidate> {
    std::vector<Candidate> out;

    if (types::is_numeric(expected) && types::is_numeric_like(actual)) {
        out.push_back(Candidate::as_cast(expected));
        TYFIX_LOG_DEBUG("convert", "numeric mismatch, only a cast is offered");
        return out;
    }

    const auto& items = oracle_.known_items();

    if (from_applies(expected, actual)) {
        out.push_back(Candidate::convert_via(ConversionTrait::From, expected));
    } else if (auto err = try_from_error(expected, actual)) {
        out.push_back(Candidate::convert_via(ConversionTrait::TryFrom, expected, *err));
    }

    // FromStr may coexist with From<&str> or TryFrom<&str>.
    if (auto err = from_str_error(expected, actual)) {
        out.push_back(Candidate::convert_via(ConversionTrait::FromStr, expected, *err));
    }

    if (to_owned_matches(expected, actual)) {
        out.push_back(Candidate::convert_via(ConversionTrait::ToOwned, expected));
    }

    auto string_ty = items.string_type();
    bool expects_string = string_ty && types::types_equal(expected, *string_ty);
    if (expects_string && (to_string_applies(actual) || types::is_numeric_like(actual))) {
        out.push_back(Candidate::convert_via(ConversionTrait::ToString, expected));
    } else if (expected->is<types::RefType>()) {
        add_reference_candidates(expected, actual, expr, out);
    } else if (expected->is<types::AdtType>() && items.result &&
               expected->as<types::AdtType>().item == *items.result) {
        add_result_candidates(expected->as<types::AdtType>(), actual, out);
    }

    if (string_ty && types::types_equal(actual, *string_ty) && expected->is<types::RefType>()) {
        const auto& ref = expected->as<types::RefType>();
        if (types::is_str(ref.inner)) {
            out.push_back(types::is_mut(ref.mutability) ? Candidate::to_mutable_str()
                                                        : Candidate::to_immutable_str());
        }
    }

    if (auto path = coerce::find_deref_ref_path(expected, actual, expr, oracle_)) {
        out.push_back(Candidate::deref_ref_bridge(expected, std::move(*path)));
    }

    TYFIX_LOG_DEBUG("convert", out.size() << " conversion candidate(s) for `"
                                          << types::type_to_string(actual) << "` -> `"
                                          << types::type_to_string(expected) << "`");
    return out;
}

void ConversionQuery::add_reference_candidates(const types::TypePtr& expected,
                                               const types::TypePtr& actual,
                                               const syntax::ExprHandle& expr,
                                               std::vector<Candidate>& out) {
    const auto& items = oracle_.known_items();
    const auto& ref = expected->as<types::RefType>();

    if (!types::is_mut(ref.mutability)) {
        if (referent_trait_applies(items.borrow, ref.inner, actual)) {
            out.push_back(Candidate::convert_via(ConversionTrait::Borrow, expected));
        }
        if (referent_trait_applies(items.as_ref, ref.inner, actual)) {
            out.push_back(Candidate::convert_via(ConversionTrait::AsRef, expected));
        }
        return;
    }

    if (actual->is<types::RefType>() && !types::is_mut(actual->as<types::RefType>().mutability)) {
        out.push_back(Candidate::change_ref_to_mutable());
    }

    if (!expr.is_mutable_place()) {
        return;
    }
    auto seq = oracle_.coercion_sequence(actual);
    bool through_mut_refs = std::all_of(seq.begin(), seq.end(), [](const types::TypePtr& step) {
        return !step->is<types::RefType>() || types::is_mut(step->as<types::RefType>().mutability);
    });
    if (!through_mut_refs) {
        return;
    }

    if (referent_trait_applies(items.borrow_mut, ref.inner, actual)) {
        out.push_back(Candidate::convert_via(ConversionTrait::BorrowMut, expected));
    }
    if (referent_trait_applies(items.as_mut, ref.inner, actual)) {
        out.push_back(Candidate::convert_via(ConversionTrait::AsMut, expected));
    }
}

void ConversionQuery::add_result_candidates(const types::AdtType& expected,
                                            const types::TypePtr& actual,
                                            std::vector<Candidate>& out) {
    if (expected.type_args.size() != 2) {
        return;
    }
    const auto& ok_ty = expected.type_args[0];
    const auto& err_ty = expected.type_args[1];

    auto try_from_err = try_from_error(ok_ty, actual);
    if (try_from_err && types::types_equal(err_ty, *try_from_err)) {
        out.push_back(
            Candidate::convert_and_unpack_via(ConversionTrait::TryFrom, ok_ty, *try_from_err));
    }

    auto from_str_err = from_str_error(ok_ty, actual);
    if (from_str_err && types::types_equal(err_ty, *from_str_err)) {
        out.push_back(
            Candidate::convert_and_unpack_via(ConversionTrait::FromStr, ok_ty, *from_str_err));
    }
}

} // namespace tyfix::convert
