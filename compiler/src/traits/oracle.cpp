//! # Trait Oracle Defaults
//!
//! The deref-probing queries are expressed once on top of
//! `coercion_sequence`, so an oracle only has to answer the strict forms.

#include "traits/oracle.hpp"

#include <algorithm>

namespace tyfix::traits {

auto TraitDef::has_assoc_type(const std::string& name) const -> bool {
    return std::find(assoc_types.begin(), assoc_types.end(), name) != assoc_types.end();
}

auto selection_error_to_string(SelectionError error) -> const char* {
    switch (error) {
    case SelectionError::NoImpl:
        return "no impl";
    case SelectionError::Ambiguous:
        return "ambiguous";
    case SelectionError::NoSuchAssociatedType:
        return "no such associated type";
    case SelectionError::Cycle:
        return "cycle";
    case SelectionError::UnknownTrait:
        return "unknown trait";
    }
    return "unknown";
}

auto KnownItems::string_type() const -> std::optional<types::TypePtr> {
    if (!string)
        return std::nullopt;
    return types::make_adt(*string);
}

auto TraitOracle::can_select_with_deref(const TraitRef& ref) -> bool {
    for (const auto& step : coercion_sequence(ref.self_type)) {
        if (can_select(TraitRef{step, ref.trait, ref.args})) {
            return true;
        }
    }
    return false;
}

auto TraitOracle::select_projection_strict_with_deref(const TraitRef& ref,
                                                      const std::string& assoc)
    -> ProjectionResult {
    for (const auto& step : coercion_sequence(ref.self_type)) {
        TraitRef stepped{step, ref.trait, ref.args};
        if (can_select(stepped)) {
            return select_projection_strict(stepped, assoc);
        }
    }
    return SelectionError::NoImpl;
}

} // namespace tyfix::traits
