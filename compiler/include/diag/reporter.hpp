//! # Mismatch Reporter
//!
//! Produces the "expected `X`, found `Y`" explanation of a type mismatch.
//! Items print by short name; when two different items in the pair share a
//! short name (`std::io::Error` vs `core::fmt::Error`) both print qualified.

#ifndef TYFIX_DIAG_REPORTER_HPP
#define TYFIX_DIAG_REPORTER_HPP

#include "types/type.hpp"

#include <string>
#include <vector>

namespace tyfix::diag {

class Reporter {
public:
    /// Items reachable from the given types whose short names collide.
    [[nodiscard]] static auto conflicting_names(const std::vector<types::TypePtr>& types)
        -> std::vector<types::ItemId>;

    /// ``expected `E`, found `A` ``
    [[nodiscard]] static auto expected_found(const types::TypePtr& expected,
                                             const types::TypePtr& actual) -> std::string;

    /// Renders a single type with its own collisions qualified.
    [[nodiscard]] static auto render(const types::TypePtr& type) -> std::string;
};

} // namespace tyfix::diag

#endif // TYFIX_DIAG_REPORTER_HPP
