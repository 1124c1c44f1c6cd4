//! # Error Codes Implementation

#include "diag/error_code.hpp"

#include <cctype>

namespace tyfix::diag {

auto code(ErrorCode error) -> std::string {
    switch (error) {
    case ErrorCode::E0004:
        return "E0004";
    case ErrorCode::E0054:
        return "E0054";
    case ErrorCode::E0057:
        return "E0057";
    case ErrorCode::E0060:
        return "E0060";
    case ErrorCode::E0061:
        return "E0061";
    case ErrorCode::E0069:
        return "E0069";
    case ErrorCode::E0133:
        return "E0133";
    case ErrorCode::E0308:
        return "E0308";
    case ErrorCode::E0451:
        return "E0451";
    case ErrorCode::E0594:
        return "E0594";
    case ErrorCode::E0603:
        return "E0603";
    case ErrorCode::E0614:
        return "E0614";
    case ErrorCode::E0616:
        return "E0616";
    case ErrorCode::E0624:
        return "E0624";
    }
    return "E????";
}

auto info_url(ErrorCode error) -> std::string {
    return "https://doc.rust-lang.org/error-index.html#" + code(error);
}

auto all_error_codes() -> const std::vector<ErrorCode>& {
    static const std::vector<ErrorCode> codes = {
        ErrorCode::E0004, ErrorCode::E0054, ErrorCode::E0057, ErrorCode::E0060, ErrorCode::E0061,
        ErrorCode::E0069, ErrorCode::E0133, ErrorCode::E0308, ErrorCode::E0451, ErrorCode::E0594,
        ErrorCode::E0603, ErrorCode::E0614, ErrorCode::E0616, ErrorCode::E0624,
    };
    return codes;
}

auto parse_error_code(std::string_view text) -> std::optional<ErrorCode> {
    std::string normalized;
    normalized.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            normalized += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }

    for (auto error : all_error_codes()) {
        if (code(error) == normalized)
            return error;
    }
    return std::nullopt;
}

} // namespace tyfix::diag
