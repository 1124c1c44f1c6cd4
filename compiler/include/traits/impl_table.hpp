//! # Impl Table
//!
//! In-memory trait resolver implementing `TraitOracle`. It stands in for the
//! type checker's own resolver in the `tyfix` tool and in tests.
//!
//! ## Algorithm
//!
//! 1. Match every impl of the goal's trait against the goal, binding the
//!    impl's generic parameters (`impl<T> From<T> for T`)
//! 2. Check each surviving impl's where clauses recursively
//! 3. Exactly one survivor selects; none is `NoImpl`, several `Ambiguous`
//! 4. Cycle detection via the solving stack; results are memoized
//!
//! Coercion sequences strip references and follow `Deref::Target`, bounded by
//! `EngineOptions::max_deref_depth` and cut on the first repeated type.
//!
//! An `ImplTable` keeps a cache and a solving stack, so one instance must not
//! be queried from several threads at once.
//!
//! ## Usage
//!
//! ```cpp
//! traits::ImplTable table(known);
//! table.add_trait({from_id, {"T"}, {}});
//! table.add_impl({{}, {string_ty, from_id, {types::make_ref(types::make_str())}}, {}, {}});
//! bool ok = table.can_select({string_ty, from_id, {types::make_ref(types::make_str())}});
//! ```

#ifndef TYFIX_TRAITS_IMPL_TABLE_HPP
#define TYFIX_TRAITS_IMPL_TABLE_HPP

#include "traits/oracle.hpp"

#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tyfix::traits {

/// Bindings of impl generic parameters.
using Substitution = std::unordered_map<std::string, types::TypePtr>;

/// One impl block: `impl<generics> Trait<args> for Self where ... { type A = ...; }`.
///
/// Types in `header`, `assoc_bindings` and `where_clauses` may mention the
/// generics as `ParamType`.
struct ImplDef {
    std::vector<std::string> generics;
    TraitRef header;
    std::unordered_map<std::string, types::TypePtr> assoc_bindings;
    std::vector<TraitRef> where_clauses;
};

/// The impl that satisfied a goal, with its generic bindings.
struct ImplSelection {
    const ImplDef* impl;
    Substitution substitution;
};

using SelectResult = Result<ImplSelection, SelectionError>;

/// Matches an impl-header type against a goal type, extending `subst`.
///
/// Integer and float inference variables in `concrete` match numeric types of
/// their class; a general inference variable matches anything.
[[nodiscard]] auto match_type(const types::TypePtr& pattern, const types::TypePtr& concrete,
                              Substitution& subst) -> bool;

class ImplTable : public TraitOracle {
public:
    explicit ImplTable(KnownItems items = {});

    void set_known_items(KnownItems items);
    void add_trait(TraitDef def);
    void add_impl(ImplDef impl);

    /// Select the unique impl satisfying `goal`.
    auto select(const TraitRef& goal) -> SelectResult;

    // TraitOracle
    auto can_select(const TraitRef& ref) -> bool override;
    auto select_projection_strict(const TraitRef& ref, const std::string& assoc)
        -> ProjectionResult override;
    auto coercion_sequence(const types::TypePtr& type) -> std::vector<types::TypePtr> override;
    auto known_items() const -> const KnownItems& override;
    auto lookup_trait(const types::ItemId& id) const -> const TraitDef* override;

    /// Clear the memoization cache (required after adding impls).
    void clear_cache();

    auto impl_count() const -> size_t {
        return impls_.size();
    }

private:
    KnownItems items_;
    std::vector<TraitDef> traits_;
    std::deque<ImplDef> impls_; ///< deque: selections point into it

    std::vector<std::string> solving_stack_;
    std::unordered_map<std::string, SelectResult> cache_;
    bool saw_cycle_ = false;

    auto select_uncached(const TraitRef& goal) -> SelectResult;

    /// Match the impl header against the goal; nullopt if it does not apply.
    auto match_impl(const ImplDef& impl, const TraitRef& goal) const
        -> std::optional<Substitution>;

    /// Check the impl's where clauses under `subst`.
    auto obligations_hold(const ImplDef& impl, const Substitution& subst) -> bool;

    /// One user-defined dereference step (`Deref::Target`), if any.
    auto deref_target(const types::TypePtr& type) -> std::optional<types::TypePtr>;

    /// Unique key for a goal (for caching and cycle detection).
    auto goal_key(const TraitRef& goal) const -> std::string;
};

} // namespace tyfix::traits

#endif // TYFIX_TRAITS_IMPL_TABLE_HPP
