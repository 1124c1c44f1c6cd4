//! # Fix Synthesizer Tests
//!
//! Conversion candidates plus the signature fixes (return type, let type).

#include "fix/fix_synthesizer.hpp"
#include "prelude_fixture.hpp"
#include "syntax/expr_handle.hpp"

#include <gtest/gtest.h>

using namespace tyfix;
using fix::ConversionKind;

class FixSynthesizerTest : public test::PreludeTest {
protected:
    auto kinds(const std::vector<fix::Candidate>& candidates) -> std::vector<ConversionKind> {
        std::vector<ConversionKind> out;
        for (const auto& c : candidates) {
            out.push_back(c.kind);
        }
        return out;
    }
};

TEST_F(FixSynthesizerTest, ExplanationNamesBothTypes) {
    syntax::DetachedExpr expr("5");
    auto result = fix::FixSynthesizer(table).synthesize(ty("u64"), ty("i32"), expr);
    EXPECT_EQ(result.explanation, "expected `u64`, found `i32`");
    EXPECT_EQ(kinds(result.candidates), std::vector<ConversionKind>{ConversionKind::AsCast});
}

TEST_F(FixSynthesizerTest, ReturnTypeFixComesAfterConversions) {
    syntax::DetachedExpr expr("name");
    expr.set_return_site({"greeting", ty("&str")});

    auto candidates = fix::FixSynthesizer(table).candidates(ty("&str"), ty("String"), expr);
    ASSERT_FALSE(candidates.empty());
    EXPECT_EQ(candidates.back().kind, ConversionKind::ChangeReturnType);
    EXPECT_EQ(candidates.back().name, "greeting");
    EXPECT_EQ(types::type_to_string(candidates.back().target), "String");
}

TEST_F(FixSynthesizerTest, NoReturnTypeFixWhenAlreadyDeclared) {
    syntax::DetachedExpr expr("n");
    expr.set_return_site({"count", ty("i32")});

    auto candidates = fix::FixSynthesizer(table).candidates(ty("u8"), ty("i32"), expr);
    EXPECT_EQ(kinds(candidates), std::vector<ConversionKind>{ConversionKind::AsCast});
}

TEST_F(FixSynthesizerTest, ReturnTypeFixWithoutDeclaredType) {
    syntax::DetachedExpr expr("n");
    expr.set_return_site({"count", nullptr});

    auto candidates = fix::FixSynthesizer(table).candidates(ty("()"), ty("i32"), expr);
    EXPECT_EQ(kinds(candidates), std::vector<ConversionKind>{ConversionKind::ChangeReturnType});
}

TEST_F(FixSynthesizerTest, LetTypeFix) {
    syntax::DetachedExpr expr("\"hello\"");
    expr.set_let_binding("greeting");

    auto candidates = fix::FixSynthesizer(table).candidates(ty("String"), ty("&str"), expr);
    ASSERT_FALSE(candidates.empty());
    EXPECT_EQ(candidates.front().kind, ConversionKind::ConvertVia);
    EXPECT_EQ(candidates.back().kind, ConversionKind::ChangeLetType);
    EXPECT_EQ(fix::describe(candidates.back()), "Change type of `greeting` to `&str`");
}

TEST_F(FixSynthesizerTest, UnwritableTypesGetNoSignatureFix) {
    syntax::DetachedExpr expr("|x| x");
    expr.set_let_binding("f").set_return_site({"make", nullptr});

    auto candidates = fix::FixSynthesizer(table).candidates(
        ty("i32"), types::make_anon("[closure@src/main.rs:2:13]"), expr);
    EXPECT_TRUE(candidates.empty());

    auto unknown = fix::FixSynthesizer(table).candidates(ty("i32"), ty("{unknown}"), expr);
    EXPECT_TRUE(unknown.empty());
}

TEST_F(FixSynthesizerTest, PatternsGetOnlySignatureFixes) {
    syntax::DetachedExpr pattern("Some(x)");
    pattern.set_expression(false).set_let_binding("value");

    auto candidates = fix::FixSynthesizer(table).candidates(ty("String"), ty("&str"), pattern);
    EXPECT_EQ(kinds(candidates), std::vector<ConversionKind>{ConversionKind::ChangeLetType});
}
