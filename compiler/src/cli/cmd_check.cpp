//! # Check Command
//!
//! `tyfix check` parses an expected and an actual type, runs the engine
//! against the std prelude and prints the resulting annotation.
//!
//! ```bash
//! tyfix check --expected String --actual '&str' --text '"hello"'
//! tyfix check --expected '&mut i32' --actual i32 --text x --mutable
//! tyfix check --expected u8 --actual '&str' --return-of parse_byte:u8
//! ```

#include "cli/cli.hpp"
#include "coerce/path_finder.hpp"
#include "diag/diagnostic.hpp"
#include "diag/printer.hpp"
#include "log/log.hpp"
#include "traits/prelude.hpp"
#include "types/parse.hpp"

#include <iostream>

namespace tyfix::cli {

namespace {

/// Reads the value of `--name value` or `--name=value`.
/// Returns false when `arg` is not this option.
auto take_value(const std::vector<std::string>& args, size_t& i, const std::string& name,
                std::optional<std::string>& value, std::string& error) -> bool {
    const std::string& arg = args[i];
    if (arg == name) {
        if (i + 1 >= args.size()) {
            error = "missing value for " + name;
            return true;
        }
        value = args[++i];
        return true;
    }
    if (arg.rfind(name + "=", 0) == 0) {
        value = arg.substr(name.size() + 1);
        return true;
    }
    return false;
}

void report_parse_error(const std::string& which, const std::string& input,
                        const types::TypeParseError& error) {
    std::cerr << "error: invalid " << which << " type: " << error.message << "\n";
    std::cerr << "  | " << input << "\n";
    std::cerr << "  | " << std::string(error.offset, ' ') << "^\n";
}

} // namespace

auto parse_check_options(const std::vector<std::string>& args) -> Result<CheckOptions, std::string> {
    CheckOptions options;
    std::optional<std::string> expected;
    std::optional<std::string> actual;
    std::optional<std::string> text;
    std::optional<std::string> let_binding;
    std::optional<std::string> return_of;
    std::string error;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--mutable") {
            options.mutable_place = true;
        } else if (arg == "--pattern") {
            options.is_expression = false;
        } else if (take_value(args, i, "--expected", expected, error) ||
                   take_value(args, i, "--actual", actual, error) ||
                   take_value(args, i, "--text", text, error) ||
                   take_value(args, i, "--let", let_binding, error) ||
                   take_value(args, i, "--return-of", return_of, error)) {
            if (!error.empty()) {
                return error;
            }
        } else {
            return "unexpected argument `" + arg + "`";
        }
    }

    if (!expected) {
        return std::string("missing --expected <type>");
    }
    if (!actual) {
        return std::string("missing --actual <type>");
    }
    options.expected = *expected;
    options.actual = *actual;
    if (text) {
        options.text = *text;
    }
    options.let_binding = let_binding;

    if (return_of) {
        auto colon = return_of->find(':');
        auto function = return_of->substr(0, colon);
        if (function.empty()) {
            return std::string("missing function name in --return-of");
        }
        options.return_function = function;
        if (colon != std::string::npos) {
            options.return_type = return_of->substr(colon + 1);
        }
    }
    return options;
}

int run_check(const CheckOptions& options) {
    traits::ImplTable table(traits::std_known_items());
    traits::register_std_prelude(table);
    auto names = traits::std_type_names();

    // Disjoint inference ids so `_` on both sides stay distinct.
    auto expected = types::parse_type(options.expected, names, 0);
    if (is_err(expected)) {
        report_parse_error("expected", options.expected, unwrap_err(expected));
        return 2;
    }
    auto actual = types::parse_type(options.actual, names, 1u << 16);
    if (is_err(actual)) {
        report_parse_error("actual", options.actual, unwrap_err(actual));
        return 2;
    }

    syntax::DetachedExpr expr(options.text);
    expr.set_expression(options.is_expression).set_mutable_place(options.mutable_place);
    if (options.let_binding) {
        expr.set_let_binding(*options.let_binding);
    }
    if (options.return_function) {
        syntax::ReturnSite site{*options.return_function, nullptr};
        if (options.return_type) {
            auto declared = types::parse_type(*options.return_type, names, 1u << 17);
            if (is_err(declared)) {
                report_parse_error("return", *options.return_type, unwrap_err(declared));
                return 2;
            }
            site.declared_type = unwrap(declared);
        }
        expr.set_return_site(std::move(site));
    }

    const auto& expected_ty = unwrap(expected);
    const auto& actual_ty = unwrap(actual);
    TYFIX_LOG_INFO("cli", "checking `" << types::type_to_string(actual_ty) << "` against `"
                                       << types::type_to_string(expected_ty) << "`");

    if (types::types_equal(expected_ty, actual_ty)) {
        std::cout << "types match: `" << types::type_to_string(expected_ty) << "`\n";
        return 0;
    }

    diag::Diagnostic diagnostic = diag::make_type_error(expr, expected_ty, actual_ty);
    auto annotation = diag::prepare(diagnostic, table);

    diag::AnnotationPrinter printer(std::cout);
    printer.print(annotation, options.text);

    if (EngineOptions::verbose && EngineOptions::output_format == OutputFormat::Text) {
        auto sequence = table.coercion_sequence(actual_ty);
        std::cout << "  deref chain:";
        for (const auto& step : sequence) {
            std::cout << " `" << types::type_to_string(step) << "`";
        }
        std::cout << "\n";
        for (const auto& fix : annotation.fixes) {
            if (!fix.path) {
                continue;
            }
            auto bridged = coerce::apply_deref_ref_path(sequence, *fix.path);
            if (bridged) {
                std::cout << "  bridged type: `" << types::type_to_string(bridged) << "`\n";
            }
        }
    }
    return 1;
}

} // namespace tyfix::cli
