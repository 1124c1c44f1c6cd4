//! # Expression Handles
//!
//! The engine never sees a syntax tree. The caller hands it an `ExprHandle`,
//! a non-owning view of the mismatched expression that answers the few
//! questions the fixes depend on. Handles are only read during one call.

#ifndef TYFIX_SYNTAX_EXPR_HANDLE_HPP
#define TYFIX_SYNTAX_EXPR_HANDLE_HPP

#include "types/type.hpp"

#include <optional>
#include <string>
#include <utility>

namespace tyfix::syntax {

/// Function whose return value the expression is.
struct ReturnSite {
    std::string function_name;
    types::TypePtr declared_type; ///< nullptr when the function declares none
};

class ExprHandle {
public:
    virtual ~ExprHandle() = default;

    /// False for patterns and other non-expression elements.
    [[nodiscard]] virtual auto is_expression() const -> bool = 0;

    /// True if the expression denotes a place that may be borrowed mutably.
    [[nodiscard]] virtual auto is_mutable_place() const -> bool = 0;

    /// Source text of the expression.
    [[nodiscard]] virtual auto text() const -> std::string = 0;

    /// Binding name when the expression initializes `let name: T = <expr>`.
    [[nodiscard]] virtual auto let_binding() const -> std::optional<std::string> = 0;

    /// Enclosing function when the expression is its tail or returned value.
    [[nodiscard]] virtual auto enclosing_return() const -> std::optional<ReturnSite> = 0;
};

/// Handle that stores its answers, for drivers without a syntax tree.
class DetachedExpr : public ExprHandle {
public:
    explicit DetachedExpr(std::string text = "expr") : text_(std::move(text)) {}

    [[nodiscard]] auto is_expression() const -> bool override {
        return is_expression_;
    }
    [[nodiscard]] auto is_mutable_place() const -> bool override {
        return mutable_place_;
    }
    [[nodiscard]] auto text() const -> std::string override {
        return text_;
    }
    [[nodiscard]] auto let_binding() const -> std::optional<std::string> override {
        return let_binding_;
    }
    [[nodiscard]] auto enclosing_return() const -> std::optional<ReturnSite> override {
        return return_site_;
    }

    auto set_expression(bool value) -> DetachedExpr& {
        is_expression_ = value;
        return *this;
    }
    auto set_mutable_place(bool value) -> DetachedExpr& {
        mutable_place_ = value;
        return *this;
    }
    auto set_let_binding(std::string name) -> DetachedExpr& {
        let_binding_ = std::move(name);
        return *this;
    }
    auto set_return_site(ReturnSite site) -> DetachedExpr& {
        return_site_ = std::move(site);
        return *this;
    }

private:
    std::string text_;
    bool is_expression_ = true;
    bool mutable_place_ = false;
    std::optional<std::string> let_binding_;
    std::optional<ReturnSite> return_site_;
};

} // namespace tyfix::syntax

#endif // TYFIX_SYNTAX_EXPR_HANDLE_HPP
