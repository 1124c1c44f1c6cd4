//! # Type Implementation
//!
//! Type construction, structural comparison, tree walks and rendering.
//!
//! ## Type Comparison
//!
//! `types_equal()` is the equivalence relation used by every component of the
//! engine: two types are equivalent when their trees have the same shape and
//! the same leaves. There is no subtyping and no unification here.
//!
//! ## Type Display
//!
//! `TypeRenderer` produces Rust syntax for diagnostics.

#include "types/type.hpp"

#include <algorithm>
#include <sstream>

namespace tyfix::types {

namespace {

auto make_type(decltype(Type::kind) kind) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = std::move(kind);
    return type;
}

auto lists_equal(const std::vector<TypePtr>& a, const std::vector<TypePtr>& b) -> bool {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!types_equal(a[i], b[i]))
            return false;
    }
    return true;
}

/// Pre-order walk; stops early when `pred` returns true.
template <typename Pred> auto any_node(const TypePtr& type, Pred&& pred) -> bool {
    if (!type)
        return false;
    if (pred(*type))
        return true;

    return std::visit(
        [&pred](const auto& t) -> bool {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, RefType>) {
                return any_node(t.inner, pred);
            } else if constexpr (std::is_same_v<T, AdtType>) {
                return std::any_of(t.type_args.begin(), t.type_args.end(),
                                   [&pred](const TypePtr& arg) { return any_node(arg, pred); });
            } else if constexpr (std::is_same_v<T, TupleType>) {
                return std::any_of(t.elements.begin(), t.elements.end(),
                                   [&pred](const TypePtr& el) { return any_node(el, pred); });
            } else if constexpr (std::is_same_v<T, SliceType>) {
                return any_node(t.element, pred);
            } else {
                return false;
            }
        },
        type->kind);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

auto make_numeric(NumericKind kind) -> TypePtr {
    return make_type(NumericType{kind});
}

auto make_primitive(PrimitiveKind kind) -> TypePtr {
    return make_type(PrimitiveType{kind});
}

auto make_bool() -> TypePtr {
    return make_primitive(PrimitiveKind::Bool);
}

auto make_char() -> TypePtr {
    return make_primitive(PrimitiveKind::Char);
}

auto make_str() -> TypePtr {
    return make_primitive(PrimitiveKind::Str);
}

auto make_unit() -> TypePtr {
    return make_primitive(PrimitiveKind::Unit);
}

auto make_never() -> TypePtr {
    return make_primitive(PrimitiveKind::Never);
}

auto make_i32() -> TypePtr {
    return make_numeric(NumericKind::I32);
}

auto make_f64() -> TypePtr {
    return make_numeric(NumericKind::F64);
}

auto make_ref(TypePtr inner, Mutability mutability) -> TypePtr {
    return make_type(RefType{mutability, std::move(inner)});
}

auto make_adt(ItemId item, std::vector<TypePtr> type_args) -> TypePtr {
    return make_type(AdtType{std::move(item), std::move(type_args)});
}

auto make_tuple(std::vector<TypePtr> elements) -> TypePtr {
    return make_type(TupleType{std::move(elements)});
}

auto make_slice(TypePtr element) -> TypePtr {
    return make_type(SliceType{std::move(element)});
}

auto make_param(std::string name) -> TypePtr {
    return make_type(ParamType{std::move(name)});
}

auto make_infer(InferKind kind, uint32_t id) -> TypePtr {
    std::string snapshot;
    switch (kind) {
    case InferKind::Int:
        snapshot = "{integer}";
        break;
    case InferKind::Float:
        snapshot = "{float}";
        break;
    case InferKind::Type:
        snapshot = "_";
        break;
    }
    return make_type(InferType{kind, id, std::move(snapshot)});
}

auto make_unknown() -> TypePtr {
    return make_type(UnknownType{});
}

auto make_anon(std::string description) -> TypePtr {
    return make_type(AnonType{std::move(description)});
}

// ============================================================================
// Queries
// ============================================================================

auto types_equal(const TypePtr& a, const TypePtr& b) -> bool {
    if (!a && !b)
        return true;
    if (!a || !b)
        return false;
    if (a == b)
        return true;

    return std::visit(
        [&b](const auto& ta) -> bool {
            using T = std::decay_t<decltype(ta)>;

            if (!std::holds_alternative<T>(b->kind))
                return false;
            const auto& tb = std::get<T>(b->kind);

            if constexpr (std::is_same_v<T, NumericType> || std::is_same_v<T, PrimitiveType>) {
                return ta.kind == tb.kind;
            } else if constexpr (std::is_same_v<T, RefType>) {
                return ta.mutability == tb.mutability && types_equal(ta.inner, tb.inner);
            } else if constexpr (std::is_same_v<T, AdtType>) {
                return ta.item == tb.item && lists_equal(ta.type_args, tb.type_args);
            } else if constexpr (std::is_same_v<T, TupleType>) {
                return lists_equal(ta.elements, tb.elements);
            } else if constexpr (std::is_same_v<T, SliceType>) {
                return types_equal(ta.element, tb.element);
            } else if constexpr (std::is_same_v<T, ParamType>) {
                return ta.name == tb.name;
            } else if constexpr (std::is_same_v<T, InferType>) {
                return ta.kind == tb.kind && ta.id == tb.id;
            } else if constexpr (std::is_same_v<T, UnknownType>) {
                return true;
            } else {
                return ta.description == tb.description;
            }
        },
        a->kind);
}

auto is_integer(NumericKind kind) -> bool {
    return !is_float(kind);
}

auto is_float(NumericKind kind) -> bool {
    return kind == NumericKind::F32 || kind == NumericKind::F64;
}

auto is_numeric(const TypePtr& type) -> bool {
    return type && type->is<NumericType>();
}

auto is_numeric_like(const TypePtr& type) -> bool {
    if (is_numeric(type))
        return true;
    if (!type || !type->is<InferType>())
        return false;
    auto kind = type->as<InferType>().kind;
    return kind == InferKind::Int || kind == InferKind::Float;
}

auto is_str(const TypePtr& type) -> bool {
    return type && type->is<PrimitiveType>() &&
           type->as<PrimitiveType>().kind == PrimitiveKind::Str;
}

auto contains_infer(const TypePtr& type) -> bool {
    return any_node(type, [](const Type& t) { return t.is<InferType>(); });
}

auto contains_unknown_or_anon(const TypePtr& type) -> bool {
    return any_node(type, [](const Type& t) { return t.is<UnknownType>() || t.is<AnonType>(); });
}

void collect_items(const TypePtr& type, std::vector<ItemId>& out) {
    // any_node never short-circuits here; the predicate only records.
    (void)any_node(type, [&out](const Type& t) {
        if (t.is<AdtType>()) {
            out.push_back(t.as<AdtType>().item);
        }
        return false;
    });
}

auto substitute_type(const TypePtr& type,
                     const std::unordered_map<std::string, TypePtr>& substitutions) -> TypePtr {
    if (!type || substitutions.empty())
        return type;

    return std::visit(
        [&](const auto& t) -> TypePtr {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, ParamType>) {
                auto it = substitutions.find(t.name);
                return it != substitutions.end() ? it->second : type;
            } else if constexpr (std::is_same_v<T, RefType>) {
                return make_ref(substitute_type(t.inner, substitutions), t.mutability);
            } else if constexpr (std::is_same_v<T, AdtType>) {
                std::vector<TypePtr> args;
                args.reserve(t.type_args.size());
                for (const auto& arg : t.type_args) {
                    args.push_back(substitute_type(arg, substitutions));
                }
                return make_adt(t.item, std::move(args));
            } else if constexpr (std::is_same_v<T, TupleType>) {
                std::vector<TypePtr> elements;
                elements.reserve(t.elements.size());
                for (const auto& el : t.elements) {
                    elements.push_back(substitute_type(el, substitutions));
                }
                return make_tuple(std::move(elements));
            } else if constexpr (std::is_same_v<T, SliceType>) {
                return make_slice(substitute_type(t.element, substitutions));
            } else {
                return type;
            }
        },
        type->kind);
}

// ============================================================================
// Rendering
// ============================================================================

auto numeric_kind_to_string(NumericKind kind) -> std::string {
    switch (kind) {
    case NumericKind::I8:
        return "i8";
    case NumericKind::I16:
        return "i16";
    case NumericKind::I32:
        return "i32";
    case NumericKind::I64:
        return "i64";
    case NumericKind::I128:
        return "i128";
    case NumericKind::Isize:
        return "isize";
    case NumericKind::U8:
        return "u8";
    case NumericKind::U16:
        return "u16";
    case NumericKind::U32:
        return "u32";
    case NumericKind::U64:
        return "u64";
    case NumericKind::U128:
        return "u128";
    case NumericKind::Usize:
        return "usize";
    case NumericKind::F32:
        return "f32";
    case NumericKind::F64:
        return "f64";
    }
    return "{numeric}";
}

auto primitive_kind_to_string(PrimitiveKind kind) -> std::string {
    switch (kind) {
    case PrimitiveKind::Bool:
        return "bool";
    case PrimitiveKind::Char:
        return "char";
    case PrimitiveKind::Str:
        return "str";
    case PrimitiveKind::Unit:
        return "()";
    case PrimitiveKind::Never:
        return "!";
    }
    return "{primitive}";
}

auto TypeRenderer::should_qualify(const ItemId& item) const -> bool {
    return std::find(qualify_.begin(), qualify_.end(), item) != qualify_.end();
}

auto TypeRenderer::render_list(const std::vector<TypePtr>& types) const -> std::string {
    std::ostringstream ss;
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0)
            ss << ", ";
        ss << render(types[i]);
    }
    return ss.str();
}

auto TypeRenderer::render(const TypePtr& type) const -> std::string {
    if (!type)
        return "<null>";

    return std::visit(
        [this](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, NumericType>) {
                return numeric_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, PrimitiveType>) {
                return primitive_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, RefType>) {
                return (is_mut(t.mutability) ? "&mut " : "&") + render(t.inner);
            } else if constexpr (std::is_same_v<T, AdtType>) {
                std::string name = should_qualify(t.item) ? t.item.qualified() : t.item.name;
                if (t.type_args.empty())
                    return name;
                return name + "<" + render_list(t.type_args) + ">";
            } else if constexpr (std::is_same_v<T, TupleType>) {
                if (t.elements.size() == 1)
                    return "(" + render(t.elements[0]) + ",)";
                return "(" + render_list(t.elements) + ")";
            } else if constexpr (std::is_same_v<T, SliceType>) {
                return "[" + render(t.element) + "]";
            } else if constexpr (std::is_same_v<T, ParamType>) {
                return t.name;
            } else if constexpr (std::is_same_v<T, InferType>) {
                return t.snapshot;
            } else if constexpr (std::is_same_v<T, UnknownType>) {
                return "{unknown}";
            } else {
                return t.description;
            }
        },
        type->kind);
}

auto type_to_string(const TypePtr& type) -> std::string {
    return TypeRenderer{}.render(type);
}

} // namespace tyfix::types
