//! # Type Parser Tests

#include "traits/prelude.hpp"
#include "types/parse.hpp"

#include <gtest/gtest.h>

using namespace tyfix;
using namespace tyfix::types;

class TypeParseTest : public ::testing::Test {
protected:
    NameTable names = traits::std_type_names();

    auto parse(const std::string& text) -> Result<TypePtr, TypeParseError> {
        return parse_type(text, names);
    }

    auto render(const std::string& text) -> std::string {
        auto parsed = parse(text);
        if (is_err(parsed)) {
            return "error: " + unwrap_err(parsed).message;
        }
        return type_to_string(unwrap(parsed));
    }
};

TEST_F(TypeParseTest, PrimitivesAndReferences) {
    EXPECT_EQ(render("i32"), "i32");
    EXPECT_EQ(render("&str"), "&str");
    EXPECT_EQ(render("&mut str"), "&mut str");
    EXPECT_EQ(render("&&mut bool"), "&&mut bool");
    EXPECT_EQ(render("  & mut  char "), "&mut char");
    EXPECT_EQ(render("!"), "!");
}

TEST_F(TypeParseTest, TuplesAndSlices) {
    EXPECT_EQ(render("()"), "()");
    EXPECT_EQ(render("(i32)"), "i32");
    EXPECT_EQ(render("(i32,)"), "(i32,)");
    EXPECT_EQ(render("(i32, &str)"), "(i32, &str)");
    EXPECT_EQ(render("[u8]"), "[u8]");
    EXPECT_EQ(render("&[&str]"), "&[&str]");
}

TEST_F(TypeParseTest, StdAdts) {
    EXPECT_EQ(render("String"), "String");
    EXPECT_EQ(render("Vec<Vec<u8>>"), "Vec<Vec<u8>>");
    EXPECT_EQ(render("Result<u8, ParseIntError>"), "Result<u8, ParseIntError>");
    EXPECT_EQ(render("alloc::string::String"), "String");
}

TEST_F(TypeParseTest, InferenceVariablesGetSequentialIds) {
    auto parsed = parse_type("(_, {integer}, {float})", names, 10);
    ASSERT_TRUE(is_ok(parsed));
    const auto& tuple = unwrap(parsed)->as<TupleType>();
    ASSERT_EQ(tuple.elements.size(), 3u);

    EXPECT_EQ(tuple.elements[0]->as<InferType>().id, 10u);
    EXPECT_EQ(tuple.elements[0]->as<InferType>().kind, InferKind::Type);
    EXPECT_EQ(tuple.elements[1]->as<InferType>().id, 11u);
    EXPECT_EQ(tuple.elements[1]->as<InferType>().kind, InferKind::Int);
    EXPECT_EQ(tuple.elements[2]->as<InferType>().kind, InferKind::Float);
}

TEST_F(TypeParseTest, UnknownType) {
    auto parsed = parse("Vec<{unknown}>");
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_TRUE(contains_unknown_or_anon(unwrap(parsed)));
}

TEST_F(TypeParseTest, AmbiguousShortNameNeedsAPath) {
    auto parsed = parse("Error");
    ASSERT_TRUE(is_err(parsed));
    EXPECT_NE(unwrap_err(parsed).message.find("ambiguous type `Error`"), std::string::npos);
    EXPECT_NE(unwrap_err(parsed).message.find("`std::io::Error`"), std::string::npos);
    EXPECT_NE(unwrap_err(parsed).message.find("`core::fmt::Error`"), std::string::npos);

    auto io = parse("std::io::Error");
    ASSERT_TRUE(is_ok(io));
    EXPECT_EQ(unwrap(io)->as<AdtType>().item.path, "std::io");
}

TEST_F(TypeParseTest, Errors) {
    EXPECT_EQ(render("Strung"), "error: unknown type `Strung`");
    EXPECT_EQ(render("Vec"), "error: `Vec` expects 1 type argument, found 0");
    EXPECT_EQ(render("Result<u8>"), "error: `Result` expects 2 type arguments, found 1");
    EXPECT_EQ(render(""), "error: expected a type");
    EXPECT_EQ(render("[u8"), "error: expected `]` after slice element type");
}

TEST_F(TypeParseTest, ErrorOffsetPointsAtTheProblem) {
    auto parsed = parse("&i32 x");
    ASSERT_TRUE(is_err(parsed));
    EXPECT_EQ(unwrap_err(parsed).offset, 5u);

    auto unknown = parse("&Strung");
    ASSERT_TRUE(is_err(unknown));
    EXPECT_EQ(unwrap_err(unknown).offset, 1u);
}

TEST(NameTableTest, LookupByShortAndQualifiedName) {
    NameTable names;
    names.add({"Meters", "units"}, 0);
    EXPECT_EQ(names.size(), 1u);

    auto short_name = names.lookup("Meters");
    ASSERT_TRUE(is_ok(short_name));
    EXPECT_EQ(unwrap(short_name).item.qualified(), "units::Meters");
    EXPECT_TRUE(is_ok(names.lookup("units::Meters")));
    EXPECT_TRUE(is_err(names.lookup("Feet")));
}
