//! # Trait Oracle Interface
//!
//! The narrow query surface through which the engine consults the external
//! trait resolver. Everything here is data shapes and an abstract class; the
//! engine never constructs trait identities itself, it asks `KnownItems`.
//!
//! ## Key Concepts
//!
//! - **TraitRef**: "does `self_type` implement `Trait<args>`?"
//! - **Projection**: "what is `<self_type as Trait<args>>::Assoc`?"
//! - **Coercion sequence**: `T`, then each type reachable by one more deref
//! - **KnownItems**: well-known std identities, present or absent

#ifndef TYFIX_TRAITS_ORACLE_HPP
#define TYFIX_TRAITS_ORACLE_HPP

#include "types/type.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tyfix::traits {

// ============================================================================
// Trait data
// ============================================================================

/// A trait obligation: `self_type: trait<args>`.
struct TraitRef {
    types::TypePtr self_type;
    types::ItemId trait;
    std::vector<types::TypePtr> args; ///< Trait type arguments (e.g., `From<&str>`).
};

/// Trait declaration as seen by the engine.
struct TraitDef {
    types::ItemId id;
    std::vector<std::string> params;      ///< Generic parameter names.
    std::vector<std::string> assoc_types; ///< Associated type names.

    [[nodiscard]] auto has_assoc_type(const std::string& name) const -> bool;
};

/// Why a selection or projection failed.
enum class SelectionError {
    NoImpl,               ///< No impl applies.
    Ambiguous,            ///< More than one impl applies.
    NoSuchAssociatedType, ///< The trait or impl has no such associated type.
    Cycle,                ///< Obligation cycle while checking where clauses.
    UnknownTrait,         ///< The trait identity is not registered.
};

[[nodiscard]] auto selection_error_to_string(SelectionError error) -> const char*;

/// Result of an associated type projection.
using ProjectionResult = Result<types::TypePtr, SelectionError>;

/// Well-known standard library items. An empty optional means the item does
/// not exist in the crate graph being checked (e.g. `no_std`).
struct KnownItems {
    std::optional<types::ItemId> from;
    std::optional<types::ItemId> try_from;
    std::optional<types::ItemId> from_str;
    std::optional<types::ItemId> to_owned;
    std::optional<types::ItemId> to_string;
    std::optional<types::ItemId> borrow;
    std::optional<types::ItemId> borrow_mut;
    std::optional<types::ItemId> as_ref;
    std::optional<types::ItemId> as_mut;
    std::optional<types::ItemId> deref;

    std::optional<types::ItemId> result; ///< `Result<T, E>`
    std::optional<types::ItemId> string; ///< `String`

    /// `String` as a type, if the item is known.
    [[nodiscard]] auto string_type() const -> std::optional<types::TypePtr>;
};

// ============================================================================
// TraitOracle
// ============================================================================

/// Trait resolution queries consumed by the engine.
///
/// Implementations must guarantee that `coercion_sequence` terminates and that
/// its first element is the queried type.
class TraitOracle {
public:
    virtual ~TraitOracle() = default;

    /// Is there exactly one applicable impl for `ref`?
    virtual auto can_select(const TraitRef& ref) -> bool = 0;

    /// Is the trait selectable for the self type or any type it derefs to?
    virtual auto can_select_with_deref(const TraitRef& ref) -> bool;

    /// Project associated type `assoc` of the selected impl.
    virtual auto select_projection_strict(const TraitRef& ref, const std::string& assoc)
        -> ProjectionResult = 0;

    /// Like `select_projection_strict`, trying each element of the self type's
    /// coercion sequence and projecting on the first one that selects.
    virtual auto select_projection_strict_with_deref(const TraitRef& ref, const std::string& assoc)
        -> ProjectionResult;

    /// `type` followed by every type reachable by successive dereference.
    virtual auto coercion_sequence(const types::TypePtr& type) -> std::vector<types::TypePtr> = 0;

    virtual auto known_items() const -> const KnownItems& = 0;

    /// Trait declaration for `id`, or null if unknown.
    virtual auto lookup_trait(const types::ItemId& id) const -> const TraitDef* = 0;
};

} // namespace tyfix::traits

#endif // TYFIX_TRAITS_ORACLE_HPP
