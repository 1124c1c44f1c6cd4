//! # Annotation Printer Implementation

#include "diag/printer.hpp"

#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace tyfix::diag {

bool terminal_supports_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

AnnotationPrinter::AnnotationPrinter(std::ostream& out) : out_(out) {
    use_colors_ = EngineOptions::colors && terminal_supports_colors();
}

void AnnotationPrinter::print(const PreparedAnnotation& annotation, const std::string& expr_text) {
    ++printed_count_;
    if (EngineOptions::output_format == OutputFormat::JSON) {
        print_json(annotation, expr_text);
        return;
    }
    print_text(annotation, expr_text);
}

const char* AnnotationPrinter::severity_color(Severity severity) const {
    switch (severity) {
    case Severity::Error:
        return Colors::BrightRed;
    case Severity::Warn:
        return Colors::BrightYellow;
    case Severity::Info:
        return Colors::BrightCyan;
    case Severity::UnknownSymbol:
        return Colors::BrightRed;
    }
    return Colors::Reset;
}

void AnnotationPrinter::print_text(const PreparedAnnotation& annotation,
                                   const std::string& expr_text) {
    // Format: error[E0308]: message
    out_ << color(Colors::Bold) << color(severity_color(annotation.severity))
         << severity_to_string(annotation.severity);
    if (annotation.code) {
        out_ << "[" << code(*annotation.code) << "]";
    }
    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << annotation.header
         << color(Colors::Reset) << "\n";

    if (!expr_text.empty()) {
        out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << expr_text << "\n";
    }

    if (!annotation.description.empty()) {
        out_ << color(Colors::BrightCyan) << "  = note" << color(Colors::Reset) << ": "
             << annotation.description << "\n";
    }

    size_t index = 1;
    for (const auto& candidate : annotation.fixes) {
        out_ << color(Colors::BrightGreen) << "  = fix[" << index++ << "]" << color(Colors::Reset)
             << ": " << fix::describe(candidate);
        if (auto edit = fix::suggested_edit(candidate, expr_text); edit && !expr_text.empty()) {
            out_ << ": " << color(Colors::BrightGreen) << *edit << color(Colors::Reset);
        }
        out_ << "\n";
    }

    if (annotation.code) {
        out_ << color(Colors::BrightGreen) << "  = help" << color(Colors::Reset)
             << ": for more information, run `tyfix explain " << code(*annotation.code) << "`\n";
    }
}

std::string AnnotationPrinter::escape_json_string(const std::string& s) {
    std::ostringstream result;
    for (char c : s) {
        switch (c) {
        case '"':
            result << "\\\"";
            break;
        case '\\':
            result << "\\\\";
            break;
        case '\b':
            result << "\\b";
            break;
        case '\f':
            result << "\\f";
            break;
        case '\n':
            result << "\\n";
            break;
        case '\r':
            result << "\\r";
            break;
        case '\t':
            result << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c);
            } else {
                result << c;
            }
            break;
        }
    }
    return result.str();
}

void AnnotationPrinter::print_json(const PreparedAnnotation& annotation,
                                   const std::string& expr_text) {
    out_ << "{";
    out_ << "\"severity\":\"" << severity_to_string(annotation.severity) << "\",";
    if (annotation.code) {
        out_ << "\"code\":\"" << code(*annotation.code) << "\",";
        out_ << "\"url\":\"" << escape_json_string(info_url(*annotation.code)) << "\",";
    } else {
        out_ << "\"code\":null,";
    }
    out_ << "\"header\":\"" << escape_json_string(annotation.header) << "\",";
    out_ << "\"description\":\"" << escape_json_string(annotation.description) << "\",";

    out_ << "\"fixes\":[";
    bool first = true;
    for (const auto& candidate : annotation.fixes) {
        if (!first)
            out_ << ",";
        first = false;
        out_ << "{";
        out_ << "\"kind\":\"" << fix::conversion_kind_to_string(candidate.kind) << "\",";
        if (candidate.via) {
            out_ << "\"trait\":\"" << fix::conversion_trait_to_string(*candidate.via) << "\",";
        }
        out_ << "\"description\":\"" << escape_json_string(fix::describe(candidate)) << "\"";
        auto edit = fix::suggested_edit(candidate, expr_text);
        if (edit && !expr_text.empty()) {
            out_ << ",\"replacement\":\"" << escape_json_string(*edit) << "\"";
        }
        out_ << "}";
    }
    out_ << "]";

    out_ << "}\n";
}

} // namespace tyfix::diag
