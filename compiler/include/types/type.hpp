//! # Type Model
//!
//! Immutable, structurally shared type trees as produced by the external type
//! checker. The engine only reads them: compares, renders and walks.
//!
//! | Variant         | Rust syntax            |
//! |-----------------|------------------------|
//! | `NumericType`   | `i32`, `u8`, `f64`     |
//! | `PrimitiveType` | `bool`, `char`, `str`  |
//! | `RefType`       | `&T`, `&mut T`         |
//! | `AdtType`       | `String`, `Vec<u8>`    |
//! | `TupleType`     | `(A, B)`               |
//! | `SliceType`     | `[T]`                  |
//! | `ParamType`     | `T` (impl headers)     |
//! | `InferType`     | `{integer}`, `_`       |
//! | `UnknownType`   | `{unknown}`            |
//! | `AnonType`      | `impl Trait`, closures |

#ifndef TYFIX_TYPES_TYPE_HPP
#define TYFIX_TYPES_TYPE_HPP

#include "common.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tyfix::types {

struct Type;
using TypePtr = std::shared_ptr<const Type>;

// ============================================================================
// Mutability
// ============================================================================

enum class Mutability {
    Immutable,
    Mutable,
};

[[nodiscard]] constexpr auto is_mut(Mutability m) -> bool {
    return m == Mutability::Mutable;
}

// ============================================================================
// Item identity
// ============================================================================

/// Identity of a nominal item (struct, enum, trait).
///
/// Two items are the same item iff their paths and names are equal. The short
/// `name` is what diagnostics print unless it collides with another item.
struct ItemId {
    std::string name; ///< Short name, e.g. "String".
    std::string path; ///< Module path, e.g. "alloc::string". May be empty.

    /// Full path, e.g. "alloc::string::String".
    [[nodiscard]] auto qualified() const -> std::string {
        return path.empty() ? name : path + "::" + name;
    }

    [[nodiscard]] auto operator==(const ItemId& other) const -> bool = default;
};

// ============================================================================
// Type variants
// ============================================================================

enum class NumericKind {
    I8,
    I16,
    I32,
    I64,
    I128,
    Isize,
    U8,
    U16,
    U32,
    U64,
    U128,
    Usize,
    F32,
    F64,
};

enum class PrimitiveKind {
    Bool,
    Char,
    Str, ///< Unsized string slice
    Unit,
    Never,
};

struct NumericType {
    NumericKind kind;
};

struct PrimitiveType {
    PrimitiveKind kind;
};

struct RefType {
    Mutability mutability;
    TypePtr inner;
};

/// Struct or enum applied to type arguments.
struct AdtType {
    ItemId item;
    std::vector<TypePtr> type_args;
};

struct TupleType {
    std::vector<TypePtr> elements;
};

struct SliceType {
    TypePtr element;
};

/// Generic parameter of an impl or trait.
struct ParamType {
    std::string name;
};

enum class InferKind {
    Int,   ///< `{integer}`
    Float, ///< `{float}`
    Type,  ///< `_`
};

/// Unresolved inference variable.
///
/// `snapshot` holds the text the variable rendered as when the diagnostic was
/// created; once unification narrows it the live type may render differently.
struct InferType {
    InferKind kind;
    uint32_t id;
    std::string snapshot;
};

/// Type the checker could not compute.
struct UnknownType {};

/// Anonymous type (closure, `impl Trait`) that cannot be written in source.
struct AnonType {
    std::string description;
};

struct Type {
    std::variant<NumericType, PrimitiveType, RefType, AdtType, TupleType, SliceType, ParamType,
                 InferType, UnknownType, AnonType>
        kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// ============================================================================
// Construction
// ============================================================================

[[nodiscard]] auto make_numeric(NumericKind kind) -> TypePtr;
[[nodiscard]] auto make_primitive(PrimitiveKind kind) -> TypePtr;
[[nodiscard]] auto make_bool() -> TypePtr;
[[nodiscard]] auto make_char() -> TypePtr;
[[nodiscard]] auto make_str() -> TypePtr;
[[nodiscard]] auto make_unit() -> TypePtr;
[[nodiscard]] auto make_never() -> TypePtr;
[[nodiscard]] auto make_i32() -> TypePtr;
[[nodiscard]] auto make_f64() -> TypePtr;
[[nodiscard]] auto make_ref(TypePtr inner, Mutability mutability = Mutability::Immutable)
    -> TypePtr;
[[nodiscard]] auto make_adt(ItemId item, std::vector<TypePtr> type_args = {}) -> TypePtr;
[[nodiscard]] auto make_tuple(std::vector<TypePtr> elements) -> TypePtr;
[[nodiscard]] auto make_slice(TypePtr element) -> TypePtr;
[[nodiscard]] auto make_param(std::string name) -> TypePtr;
[[nodiscard]] auto make_infer(InferKind kind, uint32_t id) -> TypePtr;
[[nodiscard]] auto make_unknown() -> TypePtr;
[[nodiscard]] auto make_anon(std::string description) -> TypePtr;

// ============================================================================
// Queries
// ============================================================================

/// Structural equivalence. Inference variables are equal when kind and id are.
[[nodiscard]] auto types_equal(const TypePtr& a, const TypePtr& b) -> bool;

/// True for `NumericType`.
[[nodiscard]] auto is_numeric(const TypePtr& type) -> bool;

/// True for `NumericType` and for integer/float inference variables.
[[nodiscard]] auto is_numeric_like(const TypePtr& type) -> bool;

[[nodiscard]] auto is_integer(NumericKind kind) -> bool;
[[nodiscard]] auto is_float(NumericKind kind) -> bool;

/// True if the type is `str`.
[[nodiscard]] auto is_str(const TypePtr& type) -> bool;

/// True if any node of the tree is an inference variable.
[[nodiscard]] auto contains_infer(const TypePtr& type) -> bool;

/// True if any node of the tree is an unknown or anonymous type.
[[nodiscard]] auto contains_unknown_or_anon(const TypePtr& type) -> bool;

/// Appends every ADT identity found in the tree to `out` (with duplicates).
void collect_items(const TypePtr& type, std::vector<ItemId>& out);

/// Replaces `ParamType` nodes bound in `substitutions`.
[[nodiscard]] auto substitute_type(const TypePtr& type,
                                   const std::unordered_map<std::string, TypePtr>& substitutions)
    -> TypePtr;

// ============================================================================
// Rendering
// ============================================================================

[[nodiscard]] auto numeric_kind_to_string(NumericKind kind) -> std::string;
[[nodiscard]] auto primitive_kind_to_string(PrimitiveKind kind) -> std::string;

/// Renders types in Rust syntax.
///
/// ADTs print by short name unless their identity is listed in the qualify
/// set, in which case the full path is printed.
class TypeRenderer {
public:
    TypeRenderer() = default;
    explicit TypeRenderer(std::vector<ItemId> qualify) : qualify_(std::move(qualify)) {}

    [[nodiscard]] auto render(const TypePtr& type) const -> std::string;

private:
    std::vector<ItemId> qualify_;

    [[nodiscard]] auto should_qualify(const ItemId& item) const -> bool;
    [[nodiscard]] auto render_list(const std::vector<TypePtr>& types) const -> std::string;
};

/// Shorthand for `TypeRenderer{}.render(type)`.
[[nodiscard]] auto type_to_string(const TypePtr& type) -> std::string;

} // namespace tyfix::types

#endif // TYFIX_TYPES_TYPE_HPP
