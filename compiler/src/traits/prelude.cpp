//! # Standard Prelude
//!
//! The std impls are described by tables, grouped by trait, and expanded into
//! `ImplDef`s when a table is populated. Primitive coverage follows the std
//! documentation for the traits the engine probes; nothing else is modelled.

#include "traits/prelude.hpp"

#include "log/log.hpp"

#include <utility>

namespace tyfix::traits {

using types::ItemId;
using types::Mutability;
using types::NumericKind;
using types::TypePtr;

namespace std_items {

auto from() -> ItemId {
    return {"From", "core::convert"};
}
auto try_from() -> ItemId {
    return {"TryFrom", "core::convert"};
}
auto from_str() -> ItemId {
    return {"FromStr", "core::str"};
}
auto to_owned() -> ItemId {
    return {"ToOwned", "alloc::borrow"};
}
auto to_string() -> ItemId {
    return {"ToString", "alloc::string"};
}
auto borrow() -> ItemId {
    return {"Borrow", "core::borrow"};
}
auto borrow_mut() -> ItemId {
    return {"BorrowMut", "core::borrow"};
}
auto as_ref() -> ItemId {
    return {"AsRef", "core::convert"};
}
auto as_mut() -> ItemId {
    return {"AsMut", "core::convert"};
}
auto deref() -> ItemId {
    return {"Deref", "core::ops"};
}
auto display() -> ItemId {
    return {"Display", "core::fmt"};
}
auto clone() -> ItemId {
    return {"Clone", "core::clone"};
}

auto string() -> ItemId {
    return {"String", "alloc::string"};
}
auto result() -> ItemId {
    return {"Result", "core::result"};
}
auto option() -> ItemId {
    return {"Option", "core::option"};
}
auto vec() -> ItemId {
    return {"Vec", "alloc::vec"};
}
auto box() -> ItemId {
    return {"Box", "alloc::boxed"};
}
auto parse_int_error() -> ItemId {
    return {"ParseIntError", "core::num"};
}
auto parse_float_error() -> ItemId {
    return {"ParseFloatError", "core::num"};
}
auto parse_bool_error() -> ItemId {
    return {"ParseBoolError", "core::str"};
}
auto parse_char_error() -> ItemId {
    return {"ParseCharError", "core::char"};
}
auto try_from_int_error() -> ItemId {
    return {"TryFromIntError", "core::num"};
}
auto infallible() -> ItemId {
    return {"Infallible", "core::convert"};
}
auto io_error() -> ItemId {
    return {"Error", "std::io"};
}
auto fmt_error() -> ItemId {
    return {"Error", "core::fmt"};
}

} // namespace std_items

namespace {

const std::vector<NumericKind> INTEGER_KINDS = {
    NumericKind::I8,  NumericKind::I16,  NumericKind::I32, NumericKind::I64,
    NumericKind::I128, NumericKind::Isize, NumericKind::U8,  NumericKind::U16,
    NumericKind::U32, NumericKind::U64,  NumericKind::U128, NumericKind::Usize,
};

const std::vector<NumericKind> FLOAT_KINDS = {NumericKind::F32, NumericKind::F64};

/// Lossless numeric conversions: `impl From<first> for second`.
const std::vector<std::pair<NumericKind, NumericKind>> LOSSLESS_NUMERIC_FROM = {
    {NumericKind::U8, NumericKind::U16},    {NumericKind::U8, NumericKind::U32},
    {NumericKind::U8, NumericKind::U64},    {NumericKind::U8, NumericKind::U128},
    {NumericKind::U8, NumericKind::Usize},  {NumericKind::U8, NumericKind::I16},
    {NumericKind::U8, NumericKind::I32},    {NumericKind::U8, NumericKind::I64},
    {NumericKind::U8, NumericKind::I128},   {NumericKind::U8, NumericKind::Isize},
    {NumericKind::U16, NumericKind::U32},   {NumericKind::U16, NumericKind::U64},
    {NumericKind::U16, NumericKind::U128},  {NumericKind::U16, NumericKind::Usize},
    {NumericKind::U16, NumericKind::I32},   {NumericKind::U16, NumericKind::I64},
    {NumericKind::U16, NumericKind::I128},  {NumericKind::U32, NumericKind::U64},
    {NumericKind::U32, NumericKind::U128},  {NumericKind::U32, NumericKind::I64},
    {NumericKind::U32, NumericKind::I128},  {NumericKind::U64, NumericKind::U128},
    {NumericKind::U64, NumericKind::I128},  {NumericKind::I8, NumericKind::I16},
    {NumericKind::I8, NumericKind::I32},    {NumericKind::I8, NumericKind::I64},
    {NumericKind::I8, NumericKind::I128},   {NumericKind::I8, NumericKind::Isize},
    {NumericKind::I16, NumericKind::I32},   {NumericKind::I16, NumericKind::I64},
    {NumericKind::I16, NumericKind::I128},  {NumericKind::I16, NumericKind::Isize},
    {NumericKind::I32, NumericKind::I64},   {NumericKind::I32, NumericKind::I128},
    {NumericKind::I64, NumericKind::I128},  {NumericKind::U8, NumericKind::F32},
    {NumericKind::U8, NumericKind::F64},    {NumericKind::U16, NumericKind::F32},
    {NumericKind::U16, NumericKind::F64},   {NumericKind::U32, NumericKind::F64},
    {NumericKind::I8, NumericKind::F32},    {NumericKind::I8, NumericKind::F64},
    {NumericKind::I16, NumericKind::F32},   {NumericKind::I16, NumericKind::F64},
    {NumericKind::I32, NumericKind::F64},   {NumericKind::F32, NumericKind::F64},
};

auto param(const char* name) -> TypePtr {
    return types::make_param(name);
}

auto adt(ItemId item, std::vector<TypePtr> args = {}) -> TypePtr {
    return types::make_adt(std::move(item), std::move(args));
}

auto ref(TypePtr inner) -> TypePtr {
    return types::make_ref(std::move(inner), Mutability::Immutable);
}

auto ref_mut(TypePtr inner) -> TypePtr {
    return types::make_ref(std::move(inner), Mutability::Mutable);
}

auto is_lossless(NumericKind from, NumericKind to) -> bool {
    for (const auto& [src, dst] : LOSSLESS_NUMERIC_FROM) {
        if (src == from && dst == to)
            return true;
    }
    return false;
}

/// Shorthand for an impl without generics or where clauses.
auto simple_impl(TypePtr self_type, ItemId trait, std::vector<TypePtr> args = {},
                 std::unordered_map<std::string, TypePtr> assoc = {}) -> ImplDef {
    return ImplDef{{}, TraitRef{std::move(self_type), std::move(trait), std::move(args)},
                   std::move(assoc), {}};
}

void register_traits(ImplTable& table) {
    table.add_trait({std_items::from(), {"T"}, {}});
    table.add_trait({std_items::try_from(), {"T"}, {"Error"}});
    table.add_trait({std_items::from_str(), {}, {"Err"}});
    table.add_trait({std_items::to_owned(), {}, {"Owned"}});
    table.add_trait({std_items::to_string(), {}, {}});
    table.add_trait({std_items::borrow(), {"Borrowed"}, {}});
    table.add_trait({std_items::borrow_mut(), {"Borrowed"}, {}});
    table.add_trait({std_items::as_ref(), {"T"}, {}});
    table.add_trait({std_items::as_mut(), {"T"}, {}});
    table.add_trait({std_items::deref(), {}, {"Target"}});
    table.add_trait({std_items::display(), {}, {}});
    table.add_trait({std_items::clone(), {}, {}});
}

void register_display_and_clone(ImplTable& table) {
    std::vector<TypePtr> displayable = {types::make_bool(), types::make_char(), types::make_str(),
                                        string_type()};
    std::vector<TypePtr> cloneable = {types::make_bool(), types::make_char(), string_type()};
    for (auto kind : INTEGER_KINDS) {
        displayable.push_back(types::make_numeric(kind));
        cloneable.push_back(types::make_numeric(kind));
    }
    for (auto kind : FLOAT_KINDS) {
        displayable.push_back(types::make_numeric(kind));
        cloneable.push_back(types::make_numeric(kind));
    }

    for (const auto& ty : displayable) {
        table.add_impl(simple_impl(ty, std_items::display()));
    }
    for (const auto& ty : cloneable) {
        table.add_impl(simple_impl(ty, std_items::clone()));
    }

    // impl<T: Display> Display for &T / &mut T
    table.add_impl({{"T"},
                    {ref(param("T")), std_items::display(), {}},
                    {},
                    {{param("T"), std_items::display(), {}}}});
    table.add_impl({{"T"},
                    {ref_mut(param("T")), std_items::display(), {}},
                    {},
                    {{param("T"), std_items::display(), {}}}});

    // impl<T: Clone> Clone for Vec<T>
    table.add_impl({{"T"},
                    {adt(std_items::vec(), {param("T")}), std_items::clone(), {}},
                    {},
                    {{param("T"), std_items::clone(), {}}}});
}

void register_from(ImplTable& table) {
    // impl<T> From<T> for T
    table.add_impl({{"T"}, {param("T"), std_items::from(), {param("T")}}, {}, {}});

    for (const auto& [src, dst] : LOSSLESS_NUMERIC_FROM) {
        table.add_impl(
            simple_impl(types::make_numeric(dst), std_items::from(), {types::make_numeric(src)}));
    }

    table.add_impl(simple_impl(string_type(), std_items::from(), {ref(types::make_str())}));
    table.add_impl(simple_impl(string_type(), std_items::from(), {ref_mut(types::make_str())}));
    table.add_impl(simple_impl(string_type(), std_items::from(), {ref(string_type())}));
    table.add_impl(simple_impl(string_type(), std_items::from(), {types::make_char()}));

    // impl<T> From<T> for Box<T>, impl<T> From<Vec<T>> for Box<[T]>
    table.add_impl({{"T"},
                    {adt(std_items::box(), {param("T")}), std_items::from(), {param("T")}},
                    {},
                    {}});
    table.add_impl(
        {{"T"},
         {adt(std_items::box(), {types::make_slice(param("T"))}),
          std_items::from(),
          {adt(std_items::vec(), {param("T")})}},
         {},
         {}});
}

void register_try_from(ImplTable& table) {
    auto error = adt(std_items::try_from_int_error());
    for (auto src : INTEGER_KINDS) {
        for (auto dst : INTEGER_KINDS) {
            if (src == dst || is_lossless(src, dst))
                continue;
            table.add_impl(simple_impl(types::make_numeric(dst), std_items::try_from(),
                                       {types::make_numeric(src)}, {{"Error", error}}));
        }
    }
}

void register_from_str(ImplTable& table) {
    auto int_error = adt(std_items::parse_int_error());
    auto float_error = adt(std_items::parse_float_error());

    for (auto kind : INTEGER_KINDS) {
        table.add_impl(
            simple_impl(types::make_numeric(kind), std_items::from_str(), {}, {{"Err", int_error}}));
    }
    for (auto kind : FLOAT_KINDS) {
        table.add_impl(simple_impl(types::make_numeric(kind), std_items::from_str(), {},
                                   {{"Err", float_error}}));
    }
    table.add_impl(simple_impl(types::make_bool(), std_items::from_str(), {},
                               {{"Err", adt(std_items::parse_bool_error())}}));
    table.add_impl(simple_impl(types::make_char(), std_items::from_str(), {},
                               {{"Err", adt(std_items::parse_char_error())}}));
    table.add_impl(simple_impl(string_type(), std_items::from_str(), {},
                               {{"Err", adt(std_items::infallible())}}));
}

void register_to_owned_and_to_string(ImplTable& table) {
    table.add_impl(
        simple_impl(types::make_str(), std_items::to_owned(), {}, {{"Owned", string_type()}}));

    // impl<T: Clone> ToOwned for [T] { type Owned = Vec<T>; }
    table.add_impl({{"T"},
                    {types::make_slice(param("T")), std_items::to_owned(), {}},
                    {{"Owned", adt(std_items::vec(), {param("T")})}},
                    {{param("T"), std_items::clone(), {}}}});

    // impl<T: Clone> ToOwned for T { type Owned = T; }
    table.add_impl({{"T"},
                    {param("T"), std_items::to_owned(), {}},
                    {{"Owned", param("T")}},
                    {{param("T"), std_items::clone(), {}}}});

    // impl<T: Display> ToString for T
    table.add_impl({{"T"},
                    {param("T"), std_items::to_string(), {}},
                    {},
                    {{param("T"), std_items::display(), {}}}});
}

void register_deref(ImplTable& table) {
    table.add_impl(
        simple_impl(string_type(), std_items::deref(), {}, {{"Target", types::make_str()}}));
    table.add_impl({{"T"},
                    {adt(std_items::vec(), {param("T")}), std_items::deref(), {}},
                    {{"Target", types::make_slice(param("T"))}},
                    {}});
    table.add_impl({{"T"},
                    {adt(std_items::box(), {param("T")}), std_items::deref(), {}},
                    {{"Target", param("T")}},
                    {}});
}

void register_borrow(ImplTable& table) {
    auto vec_t = adt(std_items::vec(), {param("T")});
    auto slice_t = types::make_slice(param("T"));

    // Borrow
    table.add_impl({{"T"}, {param("T"), std_items::borrow(), {param("T")}}, {}, {}});
    table.add_impl({{"T"}, {ref(param("T")), std_items::borrow(), {param("T")}}, {}, {}});
    table.add_impl({{"T"}, {ref_mut(param("T")), std_items::borrow(), {param("T")}}, {}, {}});
    table.add_impl(simple_impl(string_type(), std_items::borrow(), {types::make_str()}));
    table.add_impl({{"T"}, {vec_t, std_items::borrow(), {slice_t}}, {}, {}});

    // BorrowMut
    table.add_impl({{"T"}, {param("T"), std_items::borrow_mut(), {param("T")}}, {}, {}});
    table.add_impl({{"T"}, {ref_mut(param("T")), std_items::borrow_mut(), {param("T")}}, {}, {}});
    table.add_impl(simple_impl(string_type(), std_items::borrow_mut(), {types::make_str()}));
    table.add_impl({{"T"}, {vec_t, std_items::borrow_mut(), {slice_t}}, {}, {}});
}

void register_as_ref(ImplTable& table) {
    auto bytes = types::make_slice(types::make_numeric(NumericKind::U8));
    auto vec_t = adt(std_items::vec(), {param("T")});
    auto slice_t = types::make_slice(param("T"));

    // AsRef
    table.add_impl(simple_impl(types::make_str(), std_items::as_ref(), {types::make_str()}));
    table.add_impl(simple_impl(types::make_str(), std_items::as_ref(), {bytes}));
    table.add_impl(simple_impl(string_type(), std_items::as_ref(), {types::make_str()}));
    table.add_impl(simple_impl(string_type(), std_items::as_ref(), {bytes}));
    table.add_impl({{"T"}, {vec_t, std_items::as_ref(), {slice_t}}, {}, {}});
    table.add_impl({{"T"}, {slice_t, std_items::as_ref(), {slice_t}}, {}, {}});
    table.add_impl(
        {{"T"}, {adt(std_items::box(), {param("T")}), std_items::as_ref(), {param("T")}}, {}, {}});
    // impl<T: AsRef<U>, U> AsRef<U> for &T / &mut T
    table.add_impl({{"T", "U"},
                    {ref(param("T")), std_items::as_ref(), {param("U")}},
                    {},
                    {{param("T"), std_items::as_ref(), {param("U")}}}});
    table.add_impl({{"T", "U"},
                    {ref_mut(param("T")), std_items::as_ref(), {param("U")}},
                    {},
                    {{param("T"), std_items::as_ref(), {param("U")}}}});

    // AsMut
    table.add_impl(simple_impl(types::make_str(), std_items::as_mut(), {types::make_str()}));
    table.add_impl(simple_impl(string_type(), std_items::as_mut(), {types::make_str()}));
    table.add_impl({{"T"}, {vec_t, std_items::as_mut(), {slice_t}}, {}, {}});
    table.add_impl({{"T"}, {slice_t, std_items::as_mut(), {slice_t}}, {}, {}});
    table.add_impl(
        {{"T"}, {adt(std_items::box(), {param("T")}), std_items::as_mut(), {param("T")}}, {}, {}});
    // impl<T: AsMut<U>, U> AsMut<U> for &mut T
    table.add_impl({{"T", "U"},
                    {ref_mut(param("T")), std_items::as_mut(), {param("U")}},
                    {},
                    {{param("T"), std_items::as_mut(), {param("U")}}}});
}

} // namespace

auto string_type() -> TypePtr {
    return adt(std_items::string());
}

auto result_type(TypePtr ok, TypePtr err) -> TypePtr {
    return adt(std_items::result(), {std::move(ok), std::move(err)});
}

auto std_known_items() -> KnownItems {
    KnownItems items;
    items.from = std_items::from();
    items.try_from = std_items::try_from();
    items.from_str = std_items::from_str();
    items.to_owned = std_items::to_owned();
    items.to_string = std_items::to_string();
    items.borrow = std_items::borrow();
    items.borrow_mut = std_items::borrow_mut();
    items.as_ref = std_items::as_ref();
    items.as_mut = std_items::as_mut();
    items.deref = std_items::deref();
    items.result = std_items::result();
    items.string = std_items::string();
    return items;
}

void register_std_prelude(ImplTable& table) {
    size_t before = table.impl_count();

    register_traits(table);
    register_display_and_clone(table);
    register_from(table);
    register_try_from(table);
    register_from_str(table);
    register_to_owned_and_to_string(table);
    register_deref(table);
    register_borrow(table);
    register_as_ref(table);

    TYFIX_LOG_DEBUG("traits", "std prelude registered " << (table.impl_count() - before)
                                                        << " impls");
}

auto std_type_names() -> types::NameTable {
    types::NameTable names;
    names.add(std_items::string(), 0);
    names.add(std_items::result(), 2);
    names.add(std_items::option(), 1);
    names.add(std_items::vec(), 1);
    names.add(std_items::box(), 1);
    names.add(std_items::parse_int_error(), 0);
    names.add(std_items::parse_float_error(), 0);
    names.add(std_items::parse_bool_error(), 0);
    names.add(std_items::parse_char_error(), 0);
    names.add(std_items::try_from_int_error(), 0);
    names.add(std_items::infallible(), 0);
    names.add(std_items::io_error(), 0);
    names.add(std_items::fmt_error(), 0);
    return names;
}

} // namespace tyfix::traits
