//! # Type Model Tests
//!
//! Construction, structural equality, classification queries, substitution
//! and rendering (including qualification of colliding names).

#include "types/type.hpp"

#include <gtest/gtest.h>

using namespace tyfix::types;

namespace {

auto string_ty() -> TypePtr {
    return make_adt({"String", "alloc::string"});
}

} // namespace

// ============================================================================
// Equality
// ============================================================================

TEST(TypeEqualityTest, StructuralEquality) {
    EXPECT_TRUE(types_equal(make_ref(make_str()), make_ref(make_str())));
    EXPECT_FALSE(types_equal(make_ref(make_str()), make_ref(make_str(), Mutability::Mutable)));
    EXPECT_TRUE(types_equal(make_adt({"Vec", "alloc::vec"}, {make_i32()}),
                            make_adt({"Vec", "alloc::vec"}, {make_i32()})));
    EXPECT_FALSE(types_equal(make_adt({"Vec", "alloc::vec"}, {make_i32()}),
                             make_adt({"Vec", "alloc::vec"}, {make_f64()})));
}

TEST(TypeEqualityTest, ItemIdentityIncludesPath) {
    auto io = make_adt({"Error", "std::io"});
    auto fmt = make_adt({"Error", "core::fmt"});
    EXPECT_FALSE(types_equal(io, fmt));
    EXPECT_TRUE(types_equal(io, make_adt({"Error", "std::io"})));
}

TEST(TypeEqualityTest, InferVariablesCompareByKindAndId) {
    EXPECT_TRUE(types_equal(make_infer(InferKind::Int, 3), make_infer(InferKind::Int, 3)));
    EXPECT_FALSE(types_equal(make_infer(InferKind::Int, 3), make_infer(InferKind::Int, 4)));
    EXPECT_FALSE(types_equal(make_infer(InferKind::Int, 3), make_infer(InferKind::Float, 3)));
}

// ============================================================================
// Queries
// ============================================================================

TEST(TypeQueryTest, NumericClassification) {
    EXPECT_TRUE(is_numeric(make_i32()));
    EXPECT_FALSE(is_numeric(make_infer(InferKind::Int, 0)));
    EXPECT_TRUE(is_numeric_like(make_infer(InferKind::Int, 0)));
    EXPECT_TRUE(is_numeric_like(make_infer(InferKind::Float, 0)));
    EXPECT_FALSE(is_numeric_like(make_infer(InferKind::Type, 0)));
    EXPECT_FALSE(is_numeric_like(make_bool()));

    EXPECT_TRUE(is_integer(NumericKind::Usize));
    EXPECT_FALSE(is_integer(NumericKind::F32));
    EXPECT_TRUE(is_float(NumericKind::F64));
}

TEST(TypeQueryTest, ContainsInferAndUnknown) {
    auto tuple = make_tuple({make_i32(), make_ref(make_infer(InferKind::Type, 1))});
    EXPECT_TRUE(contains_infer(tuple));
    EXPECT_FALSE(contains_infer(make_ref(string_ty())));

    EXPECT_TRUE(contains_unknown_or_anon(make_slice(make_unknown())));
    EXPECT_TRUE(contains_unknown_or_anon(make_ref(make_anon("[closure@main.rs:3:13]"))));
    EXPECT_FALSE(contains_unknown_or_anon(string_ty()));
}

TEST(TypeQueryTest, IsStr) {
    EXPECT_TRUE(is_str(make_str()));
    EXPECT_FALSE(is_str(make_ref(make_str())));
    EXPECT_FALSE(is_str(string_ty()));
}

TEST(TypeQueryTest, SubstituteReplacesBoundParams) {
    auto pattern = make_adt({"Vec", "alloc::vec"}, {make_ref(make_param("T"))});
    auto result = substitute_type(pattern, {{"T", make_str()}});
    EXPECT_EQ(type_to_string(result), "Vec<&str>");

    auto untouched = substitute_type(make_param("U"), {{"T", make_str()}});
    EXPECT_EQ(type_to_string(untouched), "U");
}

TEST(TypeQueryTest, CollectItemsWalksTheTree) {
    std::vector<ItemId> items;
    collect_items(make_adt({"Result", "core::result"}, {string_ty(), make_adt({"Error", "std::io"})}),
                  items);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].name, "Result");
}

// ============================================================================
// Rendering
// ============================================================================

TEST(TypeRenderTest, RustSyntax) {
    EXPECT_EQ(type_to_string(make_ref(make_str(), Mutability::Mutable)), "&mut str");
    EXPECT_EQ(type_to_string(make_unit()), "()");
    EXPECT_EQ(type_to_string(make_never()), "!");
    EXPECT_EQ(type_to_string(make_tuple({make_i32()})), "(i32,)");
    EXPECT_EQ(type_to_string(make_tuple({make_i32(), make_bool()})), "(i32, bool)");
    EXPECT_EQ(type_to_string(make_slice(make_numeric(NumericKind::U8))), "[u8]");
    EXPECT_EQ(type_to_string(make_infer(InferKind::Int, 0)), "{integer}");
    EXPECT_EQ(type_to_string(make_infer(InferKind::Float, 0)), "{float}");
    EXPECT_EQ(type_to_string(make_unknown()), "{unknown}");
}

TEST(TypeRenderTest, QualifiesListedItemsOnly) {
    ItemId io{"Error", "std::io"};
    auto type = make_adt({"Result", "core::result"}, {make_unit(), make_adt(io)});

    EXPECT_EQ(TypeRenderer{}.render(type), "Result<(), Error>");
    EXPECT_EQ(TypeRenderer({io}).render(type), "Result<(), std::io::Error>");
}
