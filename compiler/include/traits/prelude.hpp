//! # Standard Prelude
//!
//! Registers the std conversion traits and the impls the engine probes for
//! (`From`, `TryFrom`, `FromStr`, `ToOwned`, `ToString`, `Borrow`, `AsRef`,
//! `Deref`, ...) into an `ImplTable`, and names the std types for the type
//! parser.

#ifndef TYFIX_TRAITS_PRELUDE_HPP
#define TYFIX_TRAITS_PRELUDE_HPP

#include "traits/impl_table.hpp"
#include "types/parse.hpp"

namespace tyfix::traits {

/// Identities of the std items the prelude knows about.
namespace std_items {

auto from() -> types::ItemId;
auto try_from() -> types::ItemId;
auto from_str() -> types::ItemId;
auto to_owned() -> types::ItemId;
auto to_string() -> types::ItemId;
auto borrow() -> types::ItemId;
auto borrow_mut() -> types::ItemId;
auto as_ref() -> types::ItemId;
auto as_mut() -> types::ItemId;
auto deref() -> types::ItemId;
auto display() -> types::ItemId;
auto clone() -> types::ItemId;

auto string() -> types::ItemId;
auto result() -> types::ItemId;
auto option() -> types::ItemId;
auto vec() -> types::ItemId;
auto box() -> types::ItemId;
auto parse_int_error() -> types::ItemId;
auto parse_float_error() -> types::ItemId;
auto parse_bool_error() -> types::ItemId;
auto parse_char_error() -> types::ItemId;
auto try_from_int_error() -> types::ItemId;
auto infallible() -> types::ItemId;
auto io_error() -> types::ItemId;
auto fmt_error() -> types::ItemId;

} // namespace std_items

/// KnownItems with every std identity present.
auto std_known_items() -> KnownItems;

/// Register std trait declarations and impls.
void register_std_prelude(ImplTable& table);

/// Names of every std type the prelude declares, for `types::parse_type`.
auto std_type_names() -> types::NameTable;

/// `String`
auto string_type() -> types::TypePtr;

/// `Result<ok, err>`
auto result_type(types::TypePtr ok, types::TypePtr err) -> types::TypePtr;

} // namespace tyfix::traits

#endif // TYFIX_TRAITS_PRELUDE_HPP
