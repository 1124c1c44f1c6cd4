//! # Type Parser Implementation
//!
//! Recursive descent over the raw characters; the grammar is small enough
//! that a separate token stream would only add bookkeeping.

#include "types/parse.hpp"

#include <cctype>
#include <sstream>

namespace tyfix::types {

// ============================================================================
// NameTable
// ============================================================================

void NameTable::add(ItemId item, size_t arity) {
    size_t index = items_.size();
    auto qualified = item.qualified();
    index_[item.name].push_back(index);
    if (qualified != item.name) {
        index_[qualified].push_back(index);
    }
    items_.push_back(Entry{std::move(item), arity});
}

auto NameTable::lookup(const std::string& name) const -> Result<Entry, std::string> {
    auto it = index_.find(name);
    if (it == index_.end() || it->second.empty()) {
        return "unknown type `" + name + "`";
    }
    if (it->second.size() > 1) {
        std::ostringstream msg;
        msg << "ambiguous type `" << name << "`, candidates are:";
        for (size_t idx : it->second) {
            msg << " `" << items_[idx].item.qualified() << "`";
        }
        return msg.str();
    }
    return items_[it->second.front()];
}

// ============================================================================
// Parser
// ============================================================================

namespace {

auto primitive_by_name(const std::string& name) -> TypePtr {
    static const std::unordered_map<std::string, NumericKind> numerics = {
        {"i8", NumericKind::I8},       {"i16", NumericKind::I16},   {"i32", NumericKind::I32},
        {"i64", NumericKind::I64},     {"i128", NumericKind::I128}, {"isize", NumericKind::Isize},
        {"u8", NumericKind::U8},       {"u16", NumericKind::U16},   {"u32", NumericKind::U32},
        {"u64", NumericKind::U64},     {"u128", NumericKind::U128}, {"usize", NumericKind::Usize},
        {"f32", NumericKind::F32},     {"f64", NumericKind::F64},
    };
    auto it = numerics.find(name);
    if (it != numerics.end())
        return make_numeric(it->second);

    if (name == "bool")
        return make_bool();
    if (name == "char")
        return make_char();
    if (name == "str")
        return make_str();
    return nullptr;
}

auto is_ident_start(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

auto is_ident_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

class TypeParser {
public:
    TypeParser(std::string_view text, const NameTable& names, uint32_t first_infer_id)
        : text_(text), names_(names), next_infer_id_(first_infer_id) {}

    auto parse() -> Result<TypePtr, TypeParseError> {
        auto result = parse_type();
        if (is_err(result))
            return result;
        skip_ws();
        if (pos_ < text_.size()) {
            return error("unexpected `" + std::string(1, text_[pos_]) + "` after type");
        }
        return result;
    }

private:
    std::string_view text_;
    const NameTable& names_;
    uint32_t next_infer_id_;
    size_t pos_ = 0;

    auto error(std::string message) const -> TypeParseError {
        return TypeParseError{std::move(message), pos_};
    }

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    auto peek() -> char {
        skip_ws();
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    auto eat(char c) -> bool {
        if (peek() == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    auto eat_literal(std::string_view lit) -> bool {
        skip_ws();
        if (text_.substr(pos_, lit.size()) == lit) {
            pos_ += lit.size();
            return true;
        }
        return false;
    }

    /// `mut` as a whole word.
    auto eat_keyword(std::string_view word) -> bool {
        skip_ws();
        if (text_.substr(pos_, word.size()) != word)
            return false;
        size_t end = pos_ + word.size();
        if (end < text_.size() && is_ident_char(text_[end]))
            return false;
        pos_ = end;
        return true;
    }

    auto parse_ident() -> std::string {
        skip_ws();
        size_t start = pos_;
        if (pos_ < text_.size() && is_ident_start(text_[pos_])) {
            ++pos_;
            while (pos_ < text_.size() && is_ident_char(text_[pos_])) {
                ++pos_;
            }
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    auto fresh_infer(InferKind kind) -> TypePtr {
        return make_infer(kind, next_infer_id_++);
    }

    auto parse_type() -> Result<TypePtr, TypeParseError> {
        char c = peek();

        if (c == '\0') {
            return error("expected a type");
        }

        if (eat('&')) {
            auto mutability = eat_keyword("mut") ? Mutability::Mutable : Mutability::Immutable;
            auto inner = parse_type();
            if (is_err(inner))
                return inner;
            return make_ref(unwrap(inner), mutability);
        }

        if (eat('!')) {
            return make_never();
        }

        if (c == '{') {
            if (eat_literal("{integer}"))
                return fresh_infer(InferKind::Int);
            if (eat_literal("{float}"))
                return fresh_infer(InferKind::Float);
            if (eat_literal("{unknown}"))
                return make_unknown();
            return error("expected `{integer}`, `{float}` or `{unknown}`");
        }

        if (eat('[')) {
            auto element = parse_type();
            if (is_err(element))
                return element;
            if (!eat(']'))
                return error("expected `]` after slice element type");
            return make_slice(unwrap(element));
        }

        if (eat('(')) {
            return parse_tuple_rest();
        }

        if (is_ident_start(c)) {
            return parse_path_type();
        }

        return error("unexpected `" + std::string(1, c) + "` in type");
    }

    /// After `(`: `)`, `A,)`, `A)` (parenthesized) or `A, B, ...)`.
    auto parse_tuple_rest() -> Result<TypePtr, TypeParseError> {
        if (eat(')'))
            return make_unit();

        std::vector<TypePtr> elements;
        bool trailing_comma = false;
        while (true) {
            auto element = parse_type();
            if (is_err(element))
                return element;
            elements.push_back(unwrap(element));

            trailing_comma = eat(',');
            if (eat(')'))
                break;
            if (!trailing_comma)
                return error("expected `,` or `)` in tuple type");
        }

        if (elements.size() == 1 && !trailing_comma)
            return elements.front();
        return make_tuple(std::move(elements));
    }

    auto parse_path_type() -> Result<TypePtr, TypeParseError> {
        size_t start = pos_;
        std::string path = parse_ident();
        while (eat_literal("::")) {
            auto segment = parse_ident();
            if (segment.empty())
                return error("expected identifier after `::`");
            path += "::" + segment;
        }

        if (path == "_")
            return fresh_infer(InferKind::Type);
        if (auto prim = primitive_by_name(path))
            return prim;

        auto entry = names_.lookup(path);
        if (is_err(entry)) {
            return TypeParseError{unwrap_err(entry), start};
        }

        std::vector<TypePtr> args;
        if (eat('<')) {
            while (true) {
                auto arg = parse_type();
                if (is_err(arg))
                    return arg;
                args.push_back(unwrap(arg));
                if (eat('>'))
                    break;
                if (!eat(','))
                    return error("expected `,` or `>` in type arguments");
            }
        }

        const auto& found = unwrap(entry);
        if (args.size() != found.arity) {
            std::ostringstream msg;
            msg << "`" << path << "` expects " << found.arity << " type argument"
                << (found.arity == 1 ? "" : "s") << ", found " << args.size();
            return TypeParseError{msg.str(), start};
        }
        return make_adt(found.item, std::move(args));
    }
};

} // namespace

auto parse_type(std::string_view text, const NameTable& names, uint32_t first_infer_id)
    -> Result<TypePtr, TypeParseError> {
    return TypeParser(text, names, first_infer_id).parse();
}

} // namespace tyfix::types
