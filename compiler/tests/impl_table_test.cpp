//! # Impl Table Tests
//!
//! Selection over generic impls and where clauses, ambiguity, cycles,
//! projections, coercion sequences, and the std prelude contents the engine
//! relies on.

#include "prelude_fixture.hpp"

#include <gtest/gtest.h>

using namespace tyfix;
using namespace tyfix::traits;
using namespace tyfix::types;

namespace {

const ItemId SHOW{"Show", "app"};
const ItemId LOOP{"Loop", "app"};

} // namespace

// ============================================================================
// Matching
// ============================================================================

TEST(MatchTypeTest, BindsParamsConsistently) {
    Substitution subst;
    auto pattern = make_tuple({make_param("T"), make_ref(make_param("T"))});

    EXPECT_TRUE(match_type(pattern, make_tuple({make_i32(), make_ref(make_i32())}), subst));
    EXPECT_TRUE(types_equal(subst.at("T"), make_i32()));

    Substitution other;
    EXPECT_FALSE(match_type(pattern, make_tuple({make_i32(), make_ref(make_bool())}), other));
}

TEST(MatchTypeTest, InferVariablesMatchTheirClass) {
    Substitution subst;
    EXPECT_TRUE(match_type(make_numeric(NumericKind::U16), make_infer(InferKind::Int, 0), subst));
    EXPECT_FALSE(match_type(make_f64(), make_infer(InferKind::Int, 0), subst));
    EXPECT_TRUE(match_type(make_f64(), make_infer(InferKind::Float, 0), subst));
    EXPECT_TRUE(match_type(make_str(), make_infer(InferKind::Type, 0), subst));
}

TEST(MatchTypeTest, MutabilityMustAgree) {
    Substitution subst;
    EXPECT_FALSE(match_type(make_ref(make_param("T"), Mutability::Mutable), make_ref(make_str()),
                            subst));
}

// ============================================================================
// Selection
// ============================================================================

class ImplTableTest : public ::testing::Test {
protected:
    ImplTable table;

    void SetUp() override {
        table.add_trait({SHOW, {}, {"Out"}});
    }
};

TEST_F(ImplTableTest, UnknownTraitIsAnError) {
    auto result = table.select({make_i32(), LOOP, {}});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), SelectionError::UnknownTrait);
}

TEST_F(ImplTableTest, WhereClausesMustHold) {
    // impl Show for i32; impl<T: Show> Show for [T]
    table.add_impl({{}, {make_i32(), SHOW, {}}, {{"Out", make_str()}}, {}});
    table.add_impl({{"T"},
                    {make_slice(make_param("T")), SHOW, {}},
                    {{"Out", make_param("T")}},
                    {{make_param("T"), SHOW, {}}}});

    EXPECT_TRUE(table.can_select({make_slice(make_i32()), SHOW, {}}));
    EXPECT_FALSE(table.can_select({make_slice(make_bool()), SHOW, {}}));

    auto out = table.select_projection_strict({make_slice(make_i32()), SHOW, {}}, "Out");
    ASSERT_TRUE(is_ok(out));
    EXPECT_EQ(type_to_string(unwrap(out)), "i32");
}

TEST_F(ImplTableTest, TwoApplicableImplsAreAmbiguous) {
    table.add_impl({{}, {make_i32(), SHOW, {}}, {}, {}});
    table.add_impl({{"T"}, {make_param("T"), SHOW, {}}, {}, {}});

    auto result = table.select({make_i32(), SHOW, {}});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), SelectionError::Ambiguous);
    EXPECT_TRUE(table.can_select({make_bool(), SHOW, {}}));
}

TEST_F(ImplTableTest, MissingAssociatedType) {
    table.add_impl({{}, {make_i32(), SHOW, {}}, {}, {}});

    auto unbound = table.select_projection_strict({make_i32(), SHOW, {}}, "Out");
    ASSERT_TRUE(is_err(unbound));
    EXPECT_EQ(unwrap_err(unbound), SelectionError::NoSuchAssociatedType);

    auto undeclared = table.select_projection_strict({make_i32(), SHOW, {}}, "Target");
    ASSERT_TRUE(is_err(undeclared));
    EXPECT_EQ(unwrap_err(undeclared), SelectionError::NoSuchAssociatedType);
}

TEST_F(ImplTableTest, CyclicObligationsDoNotSelect) {
    // impl<T: Loop> Loop for T
    table.add_trait({LOOP, {}, {}});
    table.add_impl({{"T"}, {make_param("T"), LOOP, {}}, {}, {{make_param("T"), LOOP, {}}}});

    auto result = table.select({make_i32(), LOOP, {}});
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), SelectionError::NoImpl);
}

TEST_F(ImplTableTest, AddingAnImplInvalidatesTheCache) {
    EXPECT_FALSE(table.can_select({make_bool(), SHOW, {}}));
    table.add_impl({{}, {make_bool(), SHOW, {}}, {}, {}});
    EXPECT_TRUE(table.can_select({make_bool(), SHOW, {}}));
}

// ============================================================================
// Coercion sequences
// ============================================================================

using CoercionSequenceTest = test::PreludeTest;

TEST_F(CoercionSequenceTest, StartsWithTheQueriedType) {
    auto seq = table.coercion_sequence(ty("&Box<String>"));
    ASSERT_EQ(seq.size(), 4u);
    EXPECT_EQ(type_to_string(seq[0]), "&Box<String>");
    EXPECT_EQ(type_to_string(seq[1]), "Box<String>");
    EXPECT_EQ(type_to_string(seq[2]), "String");
    EXPECT_EQ(type_to_string(seq[3]), "str");
}

TEST_F(CoercionSequenceTest, NonDerefTypeIsItsOwnSequence) {
    auto seq = table.coercion_sequence(ty("i32"));
    ASSERT_EQ(seq.size(), 1u);
    EXPECT_EQ(type_to_string(seq[0]), "i32");
}

TEST_F(CoercionSequenceTest, StopsAtARepeatedType) {
    // struct A; struct B; A: Deref<Target = B>, B: Deref<Target = A>
    auto a = make_adt(declare("A"));
    auto b = make_adt(declare("B"));
    table.add_impl({{}, {a, std_items::deref(), {}}, {{"Target", b}}, {}});
    table.add_impl({{}, {b, std_items::deref(), {}}, {{"Target", a}}, {}});

    auto seq = table.coercion_sequence(make_ref(a));
    ASSERT_EQ(seq.size(), 3u);
    EXPECT_EQ(type_to_string(seq.back()), "B");
}

TEST_F(CoercionSequenceTest, RespectsTheDepthBound) {
    auto saved = EngineOptions::max_deref_depth;
    EngineOptions::max_deref_depth = 2;

    auto seq = table.coercion_sequence(ty("&&&i32"));
    EngineOptions::max_deref_depth = saved;

    ASSERT_EQ(seq.size(), 2u);
    EXPECT_EQ(type_to_string(seq[1]), "&&i32");
}

// ============================================================================
// Prelude
// ============================================================================

using PreludeImplTest = test::PreludeTest;

TEST_F(PreludeImplTest, LosslessFromOnly) {
    EXPECT_TRUE(table.can_select({ty("i64"), std_items::from(), {ty("i32")}}));
    EXPECT_FALSE(table.can_select({ty("i32"), std_items::from(), {ty("i64")}}));
    EXPECT_TRUE(table.can_select({ty("i32"), std_items::try_from(), {ty("i64")}}));
    EXPECT_FALSE(table.can_select({ty("i64"), std_items::try_from(), {ty("i32")}}));
}

TEST_F(PreludeImplTest, FromStrErrors) {
    auto err = table.select_projection_strict({ty("u8"), std_items::from_str(), {}}, "Err");
    ASSERT_TRUE(is_ok(err));
    EXPECT_EQ(type_to_string(unwrap(err)), "ParseIntError");

    auto float_err = table.select_projection_strict({ty("f32"), std_items::from_str(), {}}, "Err");
    ASSERT_TRUE(is_ok(float_err));
    EXPECT_EQ(type_to_string(unwrap(float_err)), "ParseFloatError");
}

TEST_F(PreludeImplTest, ToOwnedOfStrIsString) {
    auto owned = table.select_projection_strict_with_deref(
        {ty("&str"), std_items::to_owned(), {}}, "Owned");
    ASSERT_TRUE(is_ok(owned));
    EXPECT_EQ(type_to_string(unwrap(owned)), "String");

    auto vec = table.select_projection_strict({ty("[i32]"), std_items::to_owned(), {}}, "Owned");
    ASSERT_TRUE(is_ok(vec));
    EXPECT_EQ(type_to_string(unwrap(vec)), "Vec<i32>");
}

TEST_F(PreludeImplTest, ToStringThroughDisplay) {
    EXPECT_TRUE(table.can_select({ty("i32"), std_items::to_string(), {}}));
    EXPECT_TRUE(table.can_select({ty("&&str"), std_items::to_string(), {}}));
    EXPECT_FALSE(table.can_select({ty("Vec<u8>"), std_items::to_string(), {}}));
}

TEST_F(PreludeImplTest, BorrowAndAsRefOfString) {
    EXPECT_TRUE(table.can_select({ty("String"), std_items::borrow(), {ty("str")}}));
    EXPECT_TRUE(table.can_select({ty("&String"), std_items::as_ref(), {ty("str")}}));
    EXPECT_TRUE(table.can_select({ty("String"), std_items::as_ref(), {ty("[u8]")}}));
    EXPECT_FALSE(table.can_select({ty("&String"), std_items::borrow_mut(), {ty("str")}}));
}
