//! # Explain and Codes Commands
//!
//! ```bash
//! tyfix explain E0308    # Long-form explanation of a code
//! tyfix explain e 0308   # Case and whitespace are ignored
//! tyfix codes            # Every code with its documentation link
//! ```

#include "cli/cli.hpp"
#include "diag/error_code.hpp"
#include "diag/explain.hpp"
#include "diag/printer.hpp"

#include <cctype>
#include <iostream>
#include <vector>

namespace tyfix::cli {

int run_explain(const std::string& code) {
    auto parsed = diag::parse_error_code(code);
    bool colors = EngineOptions::colors && diag::terminal_supports_colors();

    if (parsed) {
        if (const auto* text = diag::explanation_for(*parsed)) {
            if (colors) {
                std::cout << diag::Colors::Bold << diag::Colors::BrightCyan;
            }
            std::cout << "Explanation for " << diag::code(*parsed);
            if (colors) {
                std::cout << diag::Colors::Reset;
            }
            std::cout << "\n";
            std::cout << *text;
            if (!text->empty() && text->back() != '\n') {
                std::cout << "\n";
            }
            std::cout << "\nSee also: " << diag::info_url(*parsed) << "\n";
            return 0;
        }
    }

    // Normalize the same way parse_error_code does, for the message.
    std::string normalized;
    for (char c : code) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            normalized += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    std::cerr << "No explanation available for error code `" << normalized << "`.\n\n";

    std::vector<std::string> known_codes;
    for (auto error : diag::all_error_codes()) {
        known_codes.push_back(diag::code(error));
    }

    auto suggestions = diag::find_similar_candidates(normalized, known_codes, 3, 2);
    if (!suggestions.empty()) {
        std::cerr << "Did you mean:\n";
        for (const auto& suggestion : suggestions) {
            std::cerr << "  tyfix explain " << suggestion << "\n";
        }
        std::cerr << "\n";
    }

    std::cerr << "Available error codes:\n ";
    for (const auto& known : known_codes) {
        std::cerr << " " << known;
    }
    std::cerr << "\n";
    return 1;
}

int run_codes() {
    for (auto error : diag::all_error_codes()) {
        std::cout << diag::code(error) << "  " << diag::info_url(error) << "\n";
    }
    return 0;
}

} // namespace tyfix::cli
