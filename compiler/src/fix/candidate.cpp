//! # Candidate Fixes Implementation

#include "fix/candidate.hpp"

#include <algorithm>
#include <cctype>

namespace tyfix::fix {

auto conversion_kind_to_string(ConversionKind kind) -> const char* {
    switch (kind) {
    case ConversionKind::AsCast:
        return "AsCast";
    case ConversionKind::ConvertVia:
        return "ConvertVia";
    case ConversionKind::ConvertAndUnpackVia:
        return "ConvertAndUnpackVia";
    case ConversionKind::ChangeRefToMutable:
        return "ChangeRefToMutable";
    case ConversionKind::ToImmutableStr:
        return "ToImmutableStr";
    case ConversionKind::ToMutableStr:
        return "ToMutableStr";
    case ConversionKind::DerefRefBridge:
        return "DerefRefBridge";
    case ConversionKind::ChangeReturnType:
        return "ChangeReturnType";
    case ConversionKind::ChangeLetType:
        return "ChangeLetType";
    }
    return "Unknown";
}

auto conversion_trait_to_string(ConversionTrait trait) -> const char* {
    switch (trait) {
    case ConversionTrait::From:
        return "From";
    case ConversionTrait::TryFrom:
        return "TryFrom";
    case ConversionTrait::FromStr:
        return "FromStr";
    case ConversionTrait::ToOwned:
        return "ToOwned";
    case ConversionTrait::ToString:
        return "ToString";
    case ConversionTrait::Borrow:
        return "Borrow";
    case ConversionTrait::BorrowMut:
        return "BorrowMut";
    case ConversionTrait::AsRef:
        return "AsRef";
    case ConversionTrait::AsMut:
        return "AsMut";
    }
    return "Unknown";
}

// ============================================================================
// Factories
// ============================================================================

auto Candidate::as_cast(types::TypePtr target) -> Candidate {
    return Candidate{ConversionKind::AsCast, std::nullopt, std::move(target), nullptr,
                     std::nullopt, {}};
}

auto Candidate::convert_via(ConversionTrait trait, types::TypePtr target,
                            types::TypePtr error_type) -> Candidate {
    return Candidate{ConversionKind::ConvertVia, trait, std::move(target), std::move(error_type),
                     std::nullopt, {}};
}

auto Candidate::convert_and_unpack_via(ConversionTrait trait, types::TypePtr ok_type,
                                       types::TypePtr error_type) -> Candidate {
    return Candidate{ConversionKind::ConvertAndUnpackVia, trait, std::move(ok_type),
                     std::move(error_type), std::nullopt, {}};
}

auto Candidate::change_ref_to_mutable() -> Candidate {
    return Candidate{ConversionKind::ChangeRefToMutable, std::nullopt, nullptr, nullptr,
                     std::nullopt, {}};
}

auto Candidate::to_immutable_str() -> Candidate {
    return Candidate{ConversionKind::ToImmutableStr, std::nullopt,
                     types::make_ref(types::make_str()), nullptr, std::nullopt, {}};
}

auto Candidate::to_mutable_str() -> Candidate {
    return Candidate{ConversionKind::ToMutableStr, std::nullopt,
                     types::make_ref(types::make_str(), types::Mutability::Mutable), nullptr,
                     std::nullopt, {}};
}

auto Candidate::deref_ref_bridge(types::TypePtr target, coerce::DerefRefPath path) -> Candidate {
    return Candidate{ConversionKind::DerefRefBridge, std::nullopt, std::move(target), nullptr,
                     std::move(path), {}};
}

auto Candidate::change_return_type(std::string function_name, types::TypePtr new_type)
    -> Candidate {
    return Candidate{ConversionKind::ChangeReturnType, std::nullopt, std::move(new_type), nullptr,
                     std::nullopt, std::move(function_name)};
}

auto Candidate::change_let_type(std::string binding, types::TypePtr new_type) -> Candidate {
    return Candidate{ConversionKind::ChangeLetType, std::nullopt, std::move(new_type), nullptr,
                     std::nullopt, std::move(binding)};
}

// ============================================================================
// Rendering
// ============================================================================

namespace {

auto quoted(const types::TypePtr& type) -> std::string {
    return "`" + types::type_to_string(type) + "`";
}

/// Wraps anything but a simple path or call chain in parentheses so that a
/// method call or cast binds to the whole expression.
auto as_receiver(const std::string& text) -> std::string {
    bool simple = !text.empty() && std::none_of(text.begin(), text.end(), [](char c) {
        return c == ' ' || c == '&' || c == '*' || c == '-' || c == '!';
    });
    return simple ? text : "(" + text + ")";
}

/// `T::` for plain names, `<T>::` for everything else.
auto type_qualifier(const types::TypePtr& type) -> std::string {
    auto rendered = types::type_to_string(type);
    bool plain = std::all_of(rendered.begin(), rendered.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':';
    });
    return plain ? rendered + "::" : "<" + rendered + ">::";
}

auto method_for(ConversionTrait trait) -> const char* {
    switch (trait) {
    case ConversionTrait::ToOwned:
        return "to_owned";
    case ConversionTrait::ToString:
        return "to_string";
    case ConversionTrait::Borrow:
        return "borrow";
    case ConversionTrait::BorrowMut:
        return "borrow_mut";
    case ConversionTrait::AsRef:
        return "as_ref";
    case ConversionTrait::AsMut:
        return "as_mut";
    default:
        return "";
    }
}

auto conversion_call(ConversionTrait trait, const types::TypePtr& target,
                     const std::string& expr_text) -> std::string {
    switch (trait) {
    case ConversionTrait::From:
        return type_qualifier(target) + "from(" + expr_text + ")";
    case ConversionTrait::TryFrom:
        return type_qualifier(target) + "try_from(" + expr_text + ")";
    case ConversionTrait::FromStr:
        return as_receiver(expr_text) + ".parse::<" + types::type_to_string(target) + ">()";
    default:
        return as_receiver(expr_text) + "." + method_for(trait) + "()";
    }
}

} // namespace

auto describe(const Candidate& candidate) -> std::string {
    switch (candidate.kind) {
    case ConversionKind::AsCast:
        return "Add safe cast to " + quoted(candidate.target);
    case ConversionKind::ConvertVia:
    case ConversionKind::ConvertAndUnpackVia:
        return "Convert to " + quoted(candidate.target) + " using `" +
               conversion_trait_to_string(*candidate.via) + "` trait";
    case ConversionKind::ChangeRefToMutable:
        return "Change reference to mutable";
    case ConversionKind::ToImmutableStr:
        return "Convert to `&str` using `as_str` method";
    case ConversionKind::ToMutableStr:
        return "Convert to `&mut str` using `as_mut_str` method";
    case ConversionKind::DerefRefBridge:
        return "Convert to " + quoted(candidate.target) + " using dereferences and/or references";
    case ConversionKind::ChangeReturnType:
        return "Change return type of function `" + candidate.name + "` to " +
               quoted(candidate.target);
    case ConversionKind::ChangeLetType:
        return "Change type of `" + candidate.name + "` to " + quoted(candidate.target);
    }
    return {};
}

auto suggested_edit(const Candidate& candidate, const std::string& expr_text)
    -> std::optional<std::string> {
    switch (candidate.kind) {
    case ConversionKind::AsCast:
        return as_receiver(expr_text) + " as " + types::type_to_string(candidate.target);
    case ConversionKind::ConvertVia: {
        auto call = conversion_call(*candidate.via, candidate.target, expr_text);
        // Fallible conversions unwrap when the expected type is not a Result.
        if (candidate.via == ConversionTrait::TryFrom || candidate.via == ConversionTrait::FromStr)
            call += ".unwrap()";
        return call;
    }
    case ConversionKind::ConvertAndUnpackVia:
        return conversion_call(*candidate.via, candidate.target, expr_text);
    case ConversionKind::ChangeRefToMutable:
        if (expr_text.size() > 1 && expr_text[0] == '&' && expr_text.rfind("&mut ", 0) != 0)
            return "&mut " + expr_text.substr(1);
        return std::nullopt;
    case ConversionKind::ToImmutableStr:
        return as_receiver(expr_text) + ".as_str()";
    case ConversionKind::ToMutableStr:
        return as_receiver(expr_text) + ".as_mut_str()";
    case ConversionKind::DerefRefBridge:
        return coerce::render_deref_ref_path(*candidate.path, expr_text);
    case ConversionKind::ChangeReturnType:
    case ConversionKind::ChangeLetType:
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace tyfix::fix
