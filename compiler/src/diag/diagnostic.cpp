//! # Diagnostic Catalogue Implementation

#include "diag/diagnostic.hpp"

#include "diag/reporter.hpp"
#include "fix/fix_synthesizer.hpp"
#include "log/log.hpp"

#include <sstream>
#include <type_traits>

namespace tyfix::diag {

auto severity_to_string(Severity severity) -> const char* {
    switch (severity) {
    case Severity::Info:
        return "info";
    case Severity::Warn:
        return "warning";
    case Severity::Error:
        return "error";
    case Severity::UnknownSymbol:
        return "unknown symbol";
    }
    return "unknown";
}

namespace {

auto pluralize(const char* word, size_t count) -> std::string {
    return count == 1 ? std::string(word) : std::string(word) + "s";
}

auto argument_count_code(FunctionKind kind) -> ErrorCode {
    switch (kind) {
    case FunctionKind::VariadicFunction:
        return ErrorCode::E0060;
    case FunctionKind::Function:
        return ErrorCode::E0061;
    case FunctionKind::Closure:
        return ErrorCode::E0057;
    }
    return ErrorCode::E0061;
}

/// One `prepare` overload per kind, dispatched by `std::visit`.
class Preparer {
public:
    explicit Preparer(traits::TraitOracle& oracle) : oracle_(oracle) {}

    auto operator()(const TypeError& d) const -> PreparedAnnotation {
        auto description = d.captured_description
                               ? *d.captured_description
                               : Reporter::expected_found(d.expected, d.actual);
        std::vector<fix::Candidate> fixes;
        if (d.expr != nullptr) {
            fixes = fix::FixSynthesizer(oracle_).candidates(d.expected, d.actual, *d.expr);
        }
        return {Severity::Error, ErrorCode::E0308, "mismatched types", std::move(description),
                std::move(fixes)};
    }

    auto operator()(const DerefError& d) const -> PreparedAnnotation {
        return {Severity::Error,
                ErrorCode::E0614,
                "type `" + Reporter::render(d.type) + "` cannot be dereferenced",
                {},
                {}};
    }

    auto operator()(const AccessError& d) const -> PreparedAnnotation {
        return {Severity::Error, d.code, d.item_kind + " `" + d.name + "` is private", {}, {}};
    }

    auto operator()(const StructFieldAccessError& d) const -> PreparedAnnotation {
        return {Severity::Error,
                d.in_literal ? ErrorCode::E0451 : ErrorCode::E0616,
                "Field `" + d.field + "` of struct `" + d.struct_name + "` is private",
                {},
                {}};
    }

    auto operator()(const CastAsBoolError& d) const -> PreparedAnnotation {
        std::string description;
        if (!d.expr_text.empty()) {
            description = "compare with zero instead: `" + d.expr_text + " != 0`";
        }
        return {Severity::Error, ErrorCode::E0054, "It is not allowed to cast to a bool.",
                std::move(description), {}};
    }

    auto operator()(const ArgumentCountError& d) const -> PreparedAnnotation {
        std::ostringstream header;
        header << "This function takes"
               << (d.function_kind == FunctionKind::VariadicFunction ? " at least" : "") << " "
               << d.expected << " " << pluralize("parameter", d.expected) << " but " << d.actual
               << " " << pluralize("parameter", d.actual) << " "
               << (d.actual == 1 ? "was" : "were") << " supplied";
        return {Severity::Error, argument_count_code(d.function_kind), header.str(), {}, {}};
    }

    auto operator()(const UnsafeError& d) const -> PreparedAnnotation {
        return {Severity::Error, ErrorCode::E0133, d.message, {}, {}};
    }

    auto operator()(const NonExhaustiveMatch& d) const -> PreparedAnnotation {
        std::string description;
        if (!d.missing_patterns.empty()) {
            description = "patterns not covered:";
            for (size_t i = 0; i < d.missing_patterns.size(); ++i) {
                description += (i == 0 ? " `" : ", `") + d.missing_patterns[i] + "`";
            }
        }
        return {Severity::Error, ErrorCode::E0004, "Match must be exhaustive",
                std::move(description), {}};
    }

    auto operator()(const CannotAssignToImmutable& d) const -> PreparedAnnotation {
        return {Severity::Error, ErrorCode::E0594, "Cannot assign to " + d.message, {}, {}};
    }

    auto operator()(const ReturnMustHaveValue&) const -> PreparedAnnotation {
        return {Severity::Error,
                ErrorCode::E0069,
                "`return;` in a function whose return type is not `()`",
                {},
                {}};
    }

private:
    traits::TraitOracle& oracle_;
};

} // namespace

auto make_type_error(const syntax::ExprHandle& expr, types::TypePtr expected,
                     types::TypePtr actual) -> TypeError {
    TypeError error{&expr, std::move(expected), std::move(actual), std::nullopt};
    // Inference variables render differently once unification narrows them.
    if (types::contains_infer(error.expected) || types::contains_infer(error.actual)) {
        error.captured_description = Reporter::expected_found(error.expected, error.actual);
    }
    return error;
}

auto error_code_of(const Diagnostic& diagnostic) -> ErrorCode {
    return std::visit(
        [](const auto& d) -> ErrorCode {
            using T = std::decay_t<decltype(d)>;

            if constexpr (std::is_same_v<T, TypeError>) {
                return ErrorCode::E0308;
            } else if constexpr (std::is_same_v<T, DerefError>) {
                return ErrorCode::E0614;
            } else if constexpr (std::is_same_v<T, AccessError>) {
                return d.code;
            } else if constexpr (std::is_same_v<T, StructFieldAccessError>) {
                return d.in_literal ? ErrorCode::E0451 : ErrorCode::E0616;
            } else if constexpr (std::is_same_v<T, CastAsBoolError>) {
                return ErrorCode::E0054;
            } else if constexpr (std::is_same_v<T, ArgumentCountError>) {
                return argument_count_code(d.function_kind);
            } else if constexpr (std::is_same_v<T, UnsafeError>) {
                return ErrorCode::E0133;
            } else if constexpr (std::is_same_v<T, NonExhaustiveMatch>) {
                return ErrorCode::E0004;
            } else if constexpr (std::is_same_v<T, CannotAssignToImmutable>) {
                return ErrorCode::E0594;
            } else {
                return ErrorCode::E0069;
            }
        },
        diagnostic);
}

auto prepare(const Diagnostic& diagnostic, traits::TraitOracle& oracle) -> PreparedAnnotation {
    auto prepared = std::visit(Preparer(oracle), diagnostic);
    TYFIX_LOG_DEBUG("diag", simple_header(prepared.code, prepared.header) << " with "
                                                                           << prepared.fixes.size()
                                                                           << " fix(es)");
    return prepared;
}

// ============================================================================
// Presentation
// ============================================================================

auto simple_header(const std::optional<ErrorCode>& code, const std::string& header)
    -> std::string {
    if (!code)
        return header;
    return header + " [" + diag::code(*code) + "]";
}

auto escape_html(const std::string& text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            out += "&quot;";
            break;
        case '\'':
            out += "&#39;";
            break;
        default:
            out += c;
        }
    }
    return out;
}

auto html_description(const PreparedAnnotation& annotation) -> std::string {
    auto header = escape_html(annotation.header);
    if (annotation.code) {
        header += " [<a href='" + info_url(*annotation.code) + "'>" + code(*annotation.code) +
                  "</a>]";
    }
    return "<html>" + header + "<br>" + escape_html(annotation.description) + "</html>";
}

} // namespace tyfix::diag
