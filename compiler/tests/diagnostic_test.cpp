//! # Diagnostic Catalogue Tests
//!
//! Headers, error codes and descriptions of every diagnostic kind, the HTML
//! rendering used by editors, and the annotation printer.

#include "diag/diagnostic.hpp"
#include "diag/printer.hpp"
#include "diag/reporter.hpp"
#include "prelude_fixture.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace tyfix;
using namespace tyfix::diag;

class DiagnosticTest : public test::PreludeTest {
protected:
    auto prepared(const Diagnostic& diagnostic) -> PreparedAnnotation {
        return prepare(diagnostic, table);
    }
};

// ============================================================================
// Type errors
// ============================================================================

TEST_F(DiagnosticTest, TypeErrorHeaderAndFixes) {
    syntax::DetachedExpr expr("\"hello\"");
    auto annotation = prepared(make_type_error(expr, ty("String"), ty("&str")));

    EXPECT_EQ(annotation.severity, Severity::Error);
    ASSERT_TRUE(annotation.code.has_value());
    EXPECT_EQ(*annotation.code, ErrorCode::E0308);
    EXPECT_EQ(annotation.header, "mismatched types");
    EXPECT_EQ(annotation.description, "expected `String`, found `&str`");
    ASSERT_FALSE(annotation.fixes.empty());
    EXPECT_EQ(fix::describe(annotation.fixes.front()), "Convert to `String` using `From` trait");
}

TEST_F(DiagnosticTest, TypeErrorWithoutExpressionHasNoFixes) {
    Diagnostic diagnostic = TypeError{nullptr, ty("String"), ty("&str"), std::nullopt};
    EXPECT_TRUE(prepared(diagnostic).fixes.empty());
}

TEST_F(DiagnosticTest, InferenceVariablesAreCapturedAtCreation) {
    syntax::DetachedExpr expr("5");
    auto error = make_type_error(expr, ty("String"), ty("{integer}"));
    ASSERT_TRUE(error.captured_description.has_value());
    EXPECT_EQ(*error.captured_description, "expected `String`, found `{integer}`");

    auto concrete = make_type_error(expr, ty("String"), ty("i32"));
    EXPECT_FALSE(concrete.captured_description.has_value());
}

TEST_F(DiagnosticTest, CapturedDescriptionWins) {
    syntax::DetachedExpr expr("x");
    auto error = make_type_error(expr, ty("String"), ty("i32"));
    error.captured_description = "expected `String`, found `{integer}`";
    EXPECT_EQ(prepared(error).description, "expected `String`, found `{integer}`");
}

TEST_F(DiagnosticTest, CollidingNamesAreQualified) {
    EXPECT_EQ(Reporter::expected_found(ty("Result<(), std::io::Error>"),
                                       ty("Result<(), core::fmt::Error>")),
              "expected `Result<(), std::io::Error>`, found `Result<(), core::fmt::Error>`");
    EXPECT_EQ(Reporter::expected_found(ty("std::io::Error"), ty("String")),
              "expected `Error`, found `String`");
}

// ============================================================================
// Other kinds
// ============================================================================

TEST_F(DiagnosticTest, DerefError) {
    auto annotation = prepared(DerefError{ty("u32")});
    EXPECT_EQ(annotation.code, ErrorCode::E0614);
    EXPECT_EQ(annotation.header, "type `u32` cannot be dereferenced");
}

TEST_F(DiagnosticTest, AccessErrors) {
    auto function = prepared(AccessError{ErrorCode::E0603, "Function", "helper"});
    EXPECT_EQ(function.code, ErrorCode::E0603);
    EXPECT_EQ(function.header, "Function `helper` is private");

    auto method = prepared(AccessError{ErrorCode::E0624, "Method", "secret"});
    EXPECT_EQ(method.code, ErrorCode::E0624);
}

TEST_F(DiagnosticTest, StructFieldAccess) {
    auto literal = prepared(StructFieldAccessError{"y", "Point", true});
    EXPECT_EQ(literal.code, ErrorCode::E0451);
    EXPECT_EQ(literal.header, "Field `y` of struct `Point` is private");

    auto access = prepared(StructFieldAccessError{"y", "Point", false});
    EXPECT_EQ(access.code, ErrorCode::E0616);
}

TEST_F(DiagnosticTest, CastAsBool) {
    auto annotation = prepared(CastAsBoolError{"count"});
    EXPECT_EQ(annotation.code, ErrorCode::E0054);
    EXPECT_EQ(annotation.header, "It is not allowed to cast to a bool.");
    EXPECT_EQ(annotation.description, "compare with zero instead: `count != 0`");
}

TEST_F(DiagnosticTest, ArgumentCountWording) {
    auto function = prepared(ArgumentCountError{FunctionKind::Function, 2, 1});
    EXPECT_EQ(function.code, ErrorCode::E0061);
    EXPECT_EQ(function.header, "This function takes 2 parameters but 1 parameter was supplied");

    auto variadic = prepared(ArgumentCountError{FunctionKind::VariadicFunction, 1, 0});
    EXPECT_EQ(variadic.code, ErrorCode::E0060);
    EXPECT_EQ(variadic.header,
              "This function takes at least 1 parameter but 0 parameters were supplied");

    auto closure = prepared(ArgumentCountError{FunctionKind::Closure, 1, 2});
    EXPECT_EQ(closure.code, ErrorCode::E0057);
}

TEST_F(DiagnosticTest, MatchAssignAndReturn) {
    auto match = prepared(NonExhaustiveMatch{{"None", "Some(_)"}});
    EXPECT_EQ(match.code, ErrorCode::E0004);
    EXPECT_EQ(match.header, "Match must be exhaustive");
    EXPECT_EQ(match.description, "patterns not covered: `None`, `Some(_)`");

    auto assign = prepared(CannotAssignToImmutable{"immutable borrowed content `*r`"});
    EXPECT_EQ(assign.code, ErrorCode::E0594);
    EXPECT_EQ(assign.header, "Cannot assign to immutable borrowed content `*r`");

    EXPECT_EQ(prepared(ReturnMustHaveValue{}).code, ErrorCode::E0069);
    EXPECT_EQ(prepared(UnsafeError{"Call to unsafe function requires unsafe block"}).code,
              ErrorCode::E0133);
}

TEST_F(DiagnosticTest, ErrorCodeWithoutPreparing) {
    EXPECT_EQ(error_code_of(StructFieldAccessError{"x", "P", true}), ErrorCode::E0451);
    EXPECT_EQ(error_code_of(ArgumentCountError{FunctionKind::Closure, 0, 1}), ErrorCode::E0057);
    EXPECT_EQ(error_code_of(ReturnMustHaveValue{}), ErrorCode::E0069);
}

// ============================================================================
// Presentation
// ============================================================================

TEST(PresentationTest, SimpleHeader) {
    EXPECT_EQ(simple_header(ErrorCode::E0308, "mismatched types"), "mismatched types [E0308]");
    EXPECT_EQ(simple_header(std::nullopt, "mismatched types"), "mismatched types");
}

TEST(PresentationTest, HtmlDescriptionIsEscaped) {
    PreparedAnnotation annotation{Severity::Error, ErrorCode::E0308, "mismatched types",
                                  "expected `Vec<u8>`, found `&'a str`", {}};
    EXPECT_EQ(html_description(annotation),
              "<html>mismatched types [<a href='https://doc.rust-lang.org/error-index.html#E0308'>"
              "E0308</a>]<br>expected `Vec&lt;u8&gt;`, found `&amp;&#39;a str`</html>");
}

TEST(PresentationTest, EscapeHtml) {
    EXPECT_EQ(escape_html("a < b && \"c\""), "a &lt; b &amp;&amp; &quot;c&quot;");
}

TEST(ErrorCodeTest, CodesAndUrls) {
    EXPECT_EQ(code(ErrorCode::E0308), "E0308");
    EXPECT_EQ(info_url(ErrorCode::E0614), "https://doc.rust-lang.org/error-index.html#E0614");
    EXPECT_EQ(all_error_codes().size(), 14u);
    EXPECT_EQ(parse_error_code(" e0308 "), ErrorCode::E0308);
    EXPECT_EQ(parse_error_code("E9999"), std::nullopt);
}

// ============================================================================
// Printer
// ============================================================================

class AnnotationPrinterTest : public DiagnosticTest {
protected:
    void TearDown() override {
        EngineOptions::output_format = OutputFormat::Text;
    }
};

TEST_F(AnnotationPrinterTest, TextOutput) {
    syntax::DetachedExpr expr("\"hello\"");
    auto annotation = prepared(make_type_error(expr, ty("&str"), ty("String")));

    std::ostringstream out;
    AnnotationPrinter printer(out);
    printer.set_color_enabled(false);
    printer.print(annotation, "s");

    EXPECT_EQ(out.str(), "error[E0308]: mismatched types\n"
                         "  --> s\n"
                         "  = note: expected `&str`, found `String`\n"
                         "  = fix[1]: Convert to `&str` using `Borrow` trait: s.borrow()\n"
                         "  = fix[2]: Convert to `&str` using `AsRef` trait: s.as_ref()\n"
                         "  = fix[3]: Convert to `&str` using `as_str` method: s.as_str()\n"
                         "  = fix[4]: Convert to `&str` using dereferences and/or references: "
                         "&*s\n"
                         "  = help: for more information, run `tyfix explain E0308`\n");
    EXPECT_EQ(printer.printed_count(), 1u);
}

TEST_F(AnnotationPrinterTest, JsonOutput) {
    EngineOptions::output_format = OutputFormat::JSON;
    auto annotation = prepared(CastAsBoolError{"n"});

    std::ostringstream out;
    AnnotationPrinter printer(out);
    printer.print(annotation);

    EXPECT_EQ(out.str(), "{\"severity\":\"error\",\"code\":\"E0054\","
                         "\"url\":\"https://doc.rust-lang.org/error-index.html#E0054\","
                         "\"header\":\"It is not allowed to cast to a bool.\","
                         "\"description\":\"compare with zero instead: `n != 0`\","
                         "\"fixes\":[]}\n");
}

TEST_F(AnnotationPrinterTest, JsonFixes) {
    EngineOptions::output_format = OutputFormat::JSON;
    syntax::DetachedExpr expr("n");
    auto annotation = prepared(make_type_error(expr, ty("u8"), ty("i32")));

    std::ostringstream out;
    AnnotationPrinter printer(out);
    printer.print(annotation, "n");

    EXPECT_NE(out.str().find("\"fixes\":[{\"kind\":\"AsCast\","
                             "\"description\":\"Add safe cast to `u8`\","
                             "\"replacement\":\"n as u8\"}]"),
              std::string::npos);
}
