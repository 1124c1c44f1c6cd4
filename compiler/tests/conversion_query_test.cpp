//! # Conversion Query Tests
//!
//! Which conversion candidates are offered for a mismatch, and in what order.

#include "convert/conversion_query.hpp"
#include "prelude_fixture.hpp"
#include "syntax/expr_handle.hpp"

#include <gtest/gtest.h>

using namespace tyfix;
using fix::Candidate;
using fix::ConversionKind;
using fix::ConversionTrait;

class ConversionQueryTest : public test::PreludeTest {
protected:
    syntax::DetachedExpr expr{"x"};

    auto query(const std::string& expected, const std::string& actual) -> std::vector<Candidate> {
        return convert::ConversionQuery(table).candidates(ty(expected), ty(actual), expr);
    }

    /// "Kind" or "Kind(Trait)" per candidate, in order.
    static auto summary(const std::vector<Candidate>& candidates) -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& c : candidates) {
            std::string s = fix::conversion_kind_to_string(c.kind);
            if (c.via) {
                s += std::string("(") + fix::conversion_trait_to_string(*c.via) + ")";
            }
            out.push_back(s);
        }
        return out;
    }

    using Summary = std::vector<std::string>;
};

// ============================================================================
// Numeric mismatches
// ============================================================================

TEST_F(ConversionQueryTest, NumericMismatchOffersOnlyACast) {
    // `From<i32> for f64` exists but the cast dominates.
    auto candidates = query("f64", "i32");
    EXPECT_EQ(summary(candidates), Summary{"AsCast"});
    EXPECT_EQ(types::type_to_string(candidates[0].target), "f64");

    EXPECT_EQ(summary(query("u8", "{integer}")), Summary{"AsCast"});
    EXPECT_EQ(summary(query("f32", "{float}")), Summary{"AsCast"});
}

TEST_F(ConversionQueryTest, NumericExpectedButNonNumericActual) {
    EXPECT_EQ(summary(query("i32", "bool")), Summary{});
}

// ============================================================================
// From / TryFrom / FromStr
// ============================================================================

TEST_F(ConversionQueryTest, StringFromStrSlice) {
    EXPECT_EQ(summary(query("String", "&str")),
              (Summary{"ConvertVia(From)", "ConvertVia(FromStr)", "ConvertVia(ToOwned)",
                       "ConvertVia(ToString)"}));
}

TEST_F(ConversionQueryTest, FromSuppressesTryFrom) {
    auto celsius = types::make_adt(declare("Celsius"));
    auto kelvin = types::make_adt(declare("Kelvin"));
    table.add_impl({{}, {celsius, traits::std_items::from(), {kelvin}}, {}, {}});
    table.add_impl({{},
                    {celsius, traits::std_items::try_from(), {kelvin}},
                    {{"Error", types::make_unit()}},
                    {}});

    EXPECT_EQ(summary(query("Celsius", "Kelvin")), Summary{"ConvertVia(From)"});
}

TEST_F(ConversionQueryTest, TryFromCarriesItsErrorType) {
    auto meters = types::make_adt(declare("Meters"));
    table.add_impl({{},
                    {meters, traits::std_items::try_from(), {types::make_f64()}},
                    {{"Error", ty("TryFromIntError")}},
                    {}});

    auto candidates = query("Meters", "f64");
    ASSERT_EQ(summary(candidates), Summary{"ConvertVia(TryFrom)"});
    EXPECT_EQ(types::type_to_string(candidates[0].error_type), "TryFromIntError");
}

TEST_F(ConversionQueryTest, FromStrIsIndependentOfTryFrom) {
    // impl TryFrom<&str> for u8 { type Error = ParseIntError; }
    table.add_impl({{},
                    {ty("u8"), traits::std_items::try_from(), {ty("&str")}},
                    {{"Error", ty("ParseIntError")}},
                    {}});

    EXPECT_EQ(summary(query("u8", "&str")),
              (Summary{"ConvertVia(TryFrom)", "ConvertVia(FromStr)"}));
}

TEST_F(ConversionQueryTest, FromStrNeedsAStrAtTheEndOfTheDerefChain) {
    EXPECT_EQ(summary(query("u8", "&String")), Summary{"ConvertVia(FromStr)"});
    EXPECT_EQ(summary(query("u8", "char")), Summary{});
}

// ============================================================================
// ToOwned / ToString
// ============================================================================

TEST_F(ConversionQueryTest, ToOwnedOfSlice) {
    EXPECT_EQ(summary(query("Vec<i32>", "&[i32]")), Summary{"ConvertVia(ToOwned)"});
}

TEST_F(ConversionQueryTest, ToStringForDisplayAndNumericLike) {
    EXPECT_EQ(summary(query("String", "i32")), Summary{"ConvertVia(ToString)"});
    // `{integer}: Display` is ambiguous, but integers always format.
    EXPECT_EQ(summary(query("String", "{integer}")), Summary{"ConvertVia(ToString)"});
    EXPECT_EQ(summary(query("String", "Vec<u8>")), Summary{});
}

// ============================================================================
// References
// ============================================================================

TEST_F(ConversionQueryTest, SharedReferenceFromString) {
    EXPECT_EQ(summary(query("&str", "String")),
              (Summary{"ConvertVia(Borrow)", "ConvertVia(AsRef)", "ToImmutableStr",
                       "DerefRefBridge"}));
}

TEST_F(ConversionQueryTest, SharedReferenceFromBox) {
    EXPECT_EQ(summary(query("&i32", "Box<i32>")),
              (Summary{"ConvertVia(Borrow)", "ConvertVia(AsRef)", "DerefRefBridge"}));
}

TEST_F(ConversionQueryTest, SharedToMutableReference) {
    EXPECT_EQ(summary(query("&mut i32", "&i32")), Summary{"ChangeRefToMutable"});
}

TEST_F(ConversionQueryTest, MutableReferenceNeedsAMutablePlace) {
    EXPECT_EQ(summary(query("&mut str", "String")), Summary{"ToMutableStr"});

    expr.set_mutable_place(true);
    EXPECT_EQ(summary(query("&mut str", "String")),
              (Summary{"ConvertVia(BorrowMut)", "ConvertVia(AsMut)", "ToMutableStr",
                       "DerefRefBridge"}));
}

TEST_F(ConversionQueryTest, BorrowMutNotOfferedThroughSharedReference) {
    expr.set_mutable_place(true);
    EXPECT_EQ(summary(query("&mut str", "&String")), Summary{"ChangeRefToMutable"});
}

// ============================================================================
// Result unpacking
// ============================================================================

TEST_F(ConversionQueryTest, ResultOfFromStr) {
    auto candidates = query("Result<u8, ParseIntError>", "&str");
    ASSERT_EQ(summary(candidates), Summary{"ConvertAndUnpackVia(FromStr)"});
    EXPECT_EQ(types::type_to_string(candidates[0].target), "u8");
    EXPECT_EQ(types::type_to_string(candidates[0].error_type), "ParseIntError");
}

TEST_F(ConversionQueryTest, ResultErrorTypeMustMatch) {
    EXPECT_EQ(summary(query("Result<u8, ParseFloatError>", "&str")), Summary{});
}

TEST_F(ConversionQueryTest, ResultOfTryFromAndFromStr) {
    table.add_impl({{},
                    {ty("u8"), traits::std_items::try_from(), {ty("&str")}},
                    {{"Error", ty("ParseIntError")}},
                    {}});

    EXPECT_EQ(summary(query("Result<u8, ParseIntError>", "&str")),
              (Summary{"ConvertAndUnpackVia(TryFrom)", "ConvertAndUnpackVia(FromStr)"}));
}

TEST_F(ConversionQueryTest, ResultOfIntegerTryFrom) {
    EXPECT_EQ(summary(query("Result<u8, TryFromIntError>", "i32")),
              Summary{"ConvertAndUnpackVia(TryFrom)"});
}

// ============================================================================
// Missing std items
// ============================================================================

TEST_F(ConversionQueryTest, NoStdItemsMeansNoTraitCandidates) {
    table.set_known_items({});
    EXPECT_EQ(summary(query("String", "&str")), Summary{});
    EXPECT_EQ(summary(query("&str", "&&str")), Summary{"DerefRefBridge"});
}
