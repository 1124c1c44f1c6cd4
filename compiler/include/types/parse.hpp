//! # Type Parser
//!
//! Reads Rust type syntax into the type model. Used by the command line tool
//! and by tests to build types without spelling out constructors.
//!
//! | Syntax                   | Result                         |
//! |--------------------------|--------------------------------|
//! | `i32`, `bool`, `str`     | numeric / primitive            |
//! | `&T`, `&mut T`, `&&T`    | references                     |
//! | `()`, `(A,)`, `(A, B)`   | unit / tuples                  |
//! | `[T]`                    | slice                          |
//! | `String`, `Vec<u8>`      | ADT looked up in a `NameTable` |
//! | `std::io::Error`         | ADT by qualified path          |
//! | `{integer}`, `{float}`   | inference variables            |
//! | `_`, `!`, `{unknown}`    | inference / never / unknown    |

#ifndef TYFIX_TYPES_PARSE_HPP
#define TYFIX_TYPES_PARSE_HPP

#include "types/type.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tyfix::types {

struct TypeParseError {
    std::string message;
    size_t offset; ///< Byte offset into the input
};

/// Maps short and qualified names to ADT identities.
class NameTable {
public:
    /// Registers `item` under its short name and its qualified path.
    void add(ItemId item, size_t arity);

    struct Entry {
        ItemId item;
        size_t arity;
    };

    /// Exact lookup. Fails when a short name is registered by several items.
    auto lookup(const std::string& name) const -> Result<Entry, std::string>;

    [[nodiscard]] auto size() const -> size_t {
        return items_.size();
    }

private:
    std::vector<Entry> items_;
    std::unordered_map<std::string, std::vector<size_t>> index_;
};

/// Parses one complete type. Trailing input is an error.
///
/// Inference variables get ids in the order they appear, starting at
/// `first_infer_id`.
auto parse_type(std::string_view text, const NameTable& names, uint32_t first_infer_id = 0)
    -> Result<TypePtr, TypeParseError>;

} // namespace tyfix::types

#endif // TYFIX_TYPES_PARSE_HPP
