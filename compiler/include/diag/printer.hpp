//! # Annotation Printer
//!
//! Prints prepared annotations in rustc style, or as JSON for tools:
//!
//! ```text
//! error[E0308]: mismatched types
//!   --> "hello"
//!   = note: expected `String`, found `&str`
//!   = fix[1]: Convert to `String` using `From` trait: String::from("hello")
//!   = help: for more information, run `tyfix explain E0308`
//! ```

#ifndef TYFIX_DIAG_PRINTER_HPP
#define TYFIX_DIAG_PRINTER_HPP

#include "diag/diagnostic.hpp"

#include <iostream>
#include <string>

namespace tyfix::diag {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* Dim = "\033[2m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

/// True if stderr is a terminal that understands ANSI colors.
bool terminal_supports_colors();

class AnnotationPrinter {
public:
    explicit AnnotationPrinter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }

    /// Prints in the format selected by `EngineOptions::output_format`.
    /// `expr_text` is the mismatched expression; empty when there is none.
    void print(const PreparedAnnotation& annotation, const std::string& expr_text = {});

    size_t printed_count() const {
        return printed_count_;
    }

private:
    std::ostream& out_;
    bool use_colors_ = true;
    size_t printed_count_ = 0;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void print_text(const PreparedAnnotation& annotation, const std::string& expr_text);
    void print_json(const PreparedAnnotation& annotation, const std::string& expr_text);
    const char* severity_color(Severity severity) const;

    static std::string escape_json_string(const std::string& s);
};

} // namespace tyfix::diag

#endif // TYFIX_DIAG_PRINTER_HPP
