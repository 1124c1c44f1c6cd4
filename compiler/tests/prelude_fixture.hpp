//! Shared fixture: an ImplTable loaded with the std prelude and a `ty()`
//! helper that parses Rust type syntax.

#pragma once

#include "traits/impl_table.hpp"
#include "traits/prelude.hpp"
#include "types/parse.hpp"

#include <gtest/gtest.h>
#include <string>

namespace tyfix::test {

class PreludeTest : public ::testing::Test {
protected:
    traits::ImplTable table{traits::std_known_items()};
    types::NameTable names = traits::std_type_names();
    uint32_t next_infer_ = 0;

    void SetUp() override {
        traits::register_std_prelude(table);
    }

    auto ty(const std::string& text) -> types::TypePtr {
        auto parsed = types::parse_type(text, names, next_infer_);
        next_infer_ += 16;
        if (is_err(parsed)) {
            ADD_FAILURE() << "cannot parse `" << text << "`: " << unwrap_err(parsed).message;
            return types::make_unknown();
        }
        return unwrap(parsed);
    }

    /// Declares a user ADT and makes it parseable by name.
    auto declare(const std::string& name, size_t arity = 0) -> types::ItemId {
        types::ItemId id{name, "app"};
        names.add(id, arity);
        return id;
    }
};

} // namespace tyfix::test
