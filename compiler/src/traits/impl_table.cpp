//! # Impl Table Implementation
//!
//! Impl matching, selection with where-clause obligations, projection and
//! coercion sequences for the reference oracle.

#include "traits/impl_table.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace tyfix::traits {

namespace {

/// Fully qualified, identity-preserving rendering used for cache keys.
auto type_key(const types::TypePtr& type) -> std::string {
    if (!type)
        return "<null>";

    return std::visit(
        [](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, types::NumericType>) {
                return types::numeric_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, types::PrimitiveType>) {
                return types::primitive_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, types::RefType>) {
                return (types::is_mut(t.mutability) ? "&mut " : "&") + type_key(t.inner);
            } else if constexpr (std::is_same_v<T, types::AdtType>) {
                std::string key = t.item.qualified();
                if (!t.type_args.empty()) {
                    key += "<";
                    for (size_t i = 0; i < t.type_args.size(); ++i) {
                        if (i > 0)
                            key += ",";
                        key += type_key(t.type_args[i]);
                    }
                    key += ">";
                }
                return key;
            } else if constexpr (std::is_same_v<T, types::TupleType>) {
                std::string key = "(";
                for (const auto& el : t.elements) {
                    key += type_key(el) + ",";
                }
                return key + ")";
            } else if constexpr (std::is_same_v<T, types::SliceType>) {
                return "[" + type_key(t.element) + "]";
            } else if constexpr (std::is_same_v<T, types::ParamType>) {
                return "$" + t.name;
            } else if constexpr (std::is_same_v<T, types::InferType>) {
                return "?" + std::to_string(static_cast<int>(t.kind)) + "." + std::to_string(t.id);
            } else if constexpr (std::is_same_v<T, types::UnknownType>) {
                return "{unknown}";
            } else {
                return "{anon " + t.description + "}";
            }
        },
        type->kind);
}

auto match_lists(const std::vector<types::TypePtr>& patterns,
                 const std::vector<types::TypePtr>& concretes, Substitution& subst) -> bool {
    if (patterns.size() != concretes.size())
        return false;
    for (size_t i = 0; i < patterns.size(); ++i) {
        if (!match_type(patterns[i], concretes[i], subst))
            return false;
    }
    return true;
}

auto substitute_ref(const TraitRef& ref, const Substitution& subst) -> TraitRef {
    TraitRef out{types::substitute_type(ref.self_type, subst), ref.trait, {}};
    out.args.reserve(ref.args.size());
    for (const auto& arg : ref.args) {
        out.args.push_back(types::substitute_type(arg, subst));
    }
    return out;
}

} // namespace

// ============================================================================
// Matching
// ============================================================================

auto match_type(const types::TypePtr& pattern, const types::TypePtr& concrete,
                Substitution& subst) -> bool {
    if (!pattern || !concrete)
        return false;

    if (pattern->is<types::ParamType>()) {
        const auto& name = pattern->as<types::ParamType>().name;
        auto it = subst.find(name);
        if (it != subst.end()) {
            return types::types_equal(it->second, concrete);
        }
        subst.emplace(name, concrete);
        return true;
    }

    if (concrete->is<types::InferType>() && !pattern->is<types::InferType>()) {
        switch (concrete->as<types::InferType>().kind) {
        case types::InferKind::Int:
            return pattern->is<types::NumericType>() &&
                   types::is_integer(pattern->as<types::NumericType>().kind);
        case types::InferKind::Float:
            return pattern->is<types::NumericType>() &&
                   types::is_float(pattern->as<types::NumericType>().kind);
        case types::InferKind::Type:
            return true;
        }
    }

    return std::visit(
        [&](const auto& p) -> bool {
            using T = std::decay_t<decltype(p)>;

            if (!std::holds_alternative<T>(concrete->kind))
                return false;
            const auto& c = std::get<T>(concrete->kind);

            if constexpr (std::is_same_v<T, types::RefType>) {
                return p.mutability == c.mutability && match_type(p.inner, c.inner, subst);
            } else if constexpr (std::is_same_v<T, types::AdtType>) {
                return p.item == c.item && match_lists(p.type_args, c.type_args, subst);
            } else if constexpr (std::is_same_v<T, types::TupleType>) {
                return match_lists(p.elements, c.elements, subst);
            } else if constexpr (std::is_same_v<T, types::SliceType>) {
                return match_type(p.element, c.element, subst);
            } else {
                return types::types_equal(pattern, concrete);
            }
        },
        pattern->kind);
}

// ============================================================================
// ImplTable
// ============================================================================

ImplTable::ImplTable(KnownItems items) : items_(std::move(items)) {}

void ImplTable::set_known_items(KnownItems items) {
    items_ = std::move(items);
}

void ImplTable::add_trait(TraitDef def) {
    auto it = std::find_if(traits_.begin(), traits_.end(),
                           [&def](const TraitDef& t) { return t.id == def.id; });
    if (it != traits_.end()) {
        *it = std::move(def);
        return;
    }
    traits_.push_back(std::move(def));
}

void ImplTable::add_impl(ImplDef impl) {
    impls_.push_back(std::move(impl));
    cache_.clear();
}

void ImplTable::clear_cache() {
    cache_.clear();
}

auto ImplTable::known_items() const -> const KnownItems& {
    return items_;
}

auto ImplTable::lookup_trait(const types::ItemId& id) const -> const TraitDef* {
    auto it = std::find_if(traits_.begin(), traits_.end(),
                           [&id](const TraitDef& t) { return t.id == id; });
    return it != traits_.end() ? &*it : nullptr;
}

auto ImplTable::goal_key(const TraitRef& goal) const -> std::string {
    std::string key = type_key(goal.self_type) + ": " + goal.trait.qualified();
    if (!goal.args.empty()) {
        key += "<";
        for (size_t i = 0; i < goal.args.size(); ++i) {
            if (i > 0)
                key += ",";
            key += type_key(goal.args[i]);
        }
        key += ">";
    }
    return key;
}

auto ImplTable::select(const TraitRef& goal) -> SelectResult {
    if (lookup_trait(goal.trait) == nullptr) {
        return SelectionError::UnknownTrait;
    }

    auto key = goal_key(goal);
    auto cache_it = cache_.find(key);
    if (cache_it != cache_.end()) {
        return cache_it->second;
    }

    if (std::find(solving_stack_.begin(), solving_stack_.end(), key) != solving_stack_.end()) {
        TYFIX_LOG_DEBUG("traits", "cycle detected while solving " << key);
        saw_cycle_ = true;
        return SelectionError::Cycle;
    }

    bool outer_saw_cycle = saw_cycle_;
    saw_cycle_ = false;

    solving_stack_.push_back(key);
    auto result = select_uncached(goal);
    solving_stack_.pop_back();

    // Results that depended on a cycle are only valid inside that cycle.
    bool inner_saw_cycle = saw_cycle_;
    saw_cycle_ = outer_saw_cycle || inner_saw_cycle;
    if (!inner_saw_cycle) {
        cache_[key] = result;
    }

    TYFIX_LOG_TRACE("traits", key << " => "
                                  << (is_ok(result) ? "selected"
                                                    : selection_error_to_string(unwrap_err(result))));
    return result;
}

auto ImplTable::select_uncached(const TraitRef& goal) -> SelectResult {
    std::vector<ImplSelection> matches;

    for (const auto& impl : impls_) {
        if (!(impl.header.trait == goal.trait))
            continue;

        auto subst = match_impl(impl, goal);
        if (!subst)
            continue;
        if (!obligations_hold(impl, *subst))
            continue;

        matches.push_back(ImplSelection{&impl, std::move(*subst)});
    }

    if (matches.empty()) {
        return SelectionError::NoImpl;
    }
    if (matches.size() > 1) {
        return SelectionError::Ambiguous;
    }
    return std::move(matches.front());
}

auto ImplTable::match_impl(const ImplDef& impl, const TraitRef& goal) const
    -> std::optional<Substitution> {
    Substitution subst;
    if (!match_type(impl.header.self_type, goal.self_type, subst))
        return std::nullopt;
    if (!match_lists(impl.header.args, goal.args, subst))
        return std::nullopt;
    return subst;
}

auto ImplTable::obligations_hold(const ImplDef& impl, const Substitution& subst) -> bool {
    for (const auto& clause : impl.where_clauses) {
        auto obligation = substitute_ref(clause, subst);
        if (is_err(select(obligation))) {
            return false;
        }
    }
    return true;
}

auto ImplTable::can_select(const TraitRef& ref) -> bool {
    return is_ok(select(ref));
}

auto ImplTable::select_projection_strict(const TraitRef& ref, const std::string& assoc)
    -> ProjectionResult {
    const auto* def = lookup_trait(ref.trait);
    if (def == nullptr) {
        return SelectionError::UnknownTrait;
    }
    if (!def->has_assoc_type(assoc)) {
        return SelectionError::NoSuchAssociatedType;
    }

    auto selected = select(ref);
    if (is_err(selected)) {
        return unwrap_err(selected);
    }

    const auto& selection = unwrap(selected);
    auto binding = selection.impl->assoc_bindings.find(assoc);
    if (binding == selection.impl->assoc_bindings.end()) {
        return SelectionError::NoSuchAssociatedType;
    }
    return types::substitute_type(binding->second, selection.substitution);
}

// ============================================================================
// Coercion sequence
// ============================================================================

auto ImplTable::deref_target(const types::TypePtr& type) -> std::optional<types::TypePtr> {
    if (type->is<types::RefType>()) {
        return type->as<types::RefType>().inner;
    }
    if (!items_.deref) {
        return std::nullopt;
    }
    return ok(select_projection_strict(TraitRef{type, *items_.deref, {}}, "Target"));
}

auto ImplTable::coercion_sequence(const types::TypePtr& type) -> std::vector<types::TypePtr> {
    std::vector<types::TypePtr> sequence{type};
    if (!type) {
        return sequence;
    }

    const size_t max_depth = std::max<size_t>(EngineOptions::max_deref_depth, 1);
    while (true) {
        auto next = deref_target(sequence.back());
        if (!next) {
            break;
        }

        bool repeated = std::any_of(sequence.begin(), sequence.end(),
                                    [&next](const types::TypePtr& seen) {
                                        return types::types_equal(seen, *next);
                                    });
        if (repeated) {
            TYFIX_LOG_WARN("traits", "deref chain of `" << types::type_to_string(type)
                                                         << "` cycles back to `"
                                                         << types::type_to_string(*next) << "`");
            break;
        }
        if (sequence.size() >= max_depth) {
            TYFIX_LOG_WARN("traits", "deref chain of `" << types::type_to_string(type)
                                                         << "` cut off at depth " << max_depth);
            break;
        }

        sequence.push_back(std::move(*next));
    }

    TYFIX_LOG_TRACE("traits", "coercion sequence of `" << types::type_to_string(type)
                                                        << "` has " << sequence.size()
                                                        << " step(s)");
    return sequence;
}

} // namespace tyfix::traits
