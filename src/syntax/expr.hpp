#pragma once

#include "common.hpp"

namespace syntax {

struct WhenClause {
    ExprPtr condition;
    span::Span span = span::Span::invalid();
};

struct SwitchArm {
    PatternPtr pattern;
    std::optional<WhenClause> when;
    ExprPtr result;
    span::Span span = span::Span::invalid();
};

// --- Concrete Expression Nodes ---
struct IdentifierName { Identifier name; };
struct ThisExpr {};

struct Literal {
    struct Null {
        bool operator==(const Null&) const = default;
    };
    using Value = std::variant<int64_t, bool, char, std::string, Null>;
    Value value;
};

// `expr.name`
struct MemberAccess {
    ExprPtr expr;
    Identifier name;
};

// `expr?<when_not_null>`; every member binding inside `when_not_null` reads
// from the value of `expr`.
struct ConditionalAccess {
    ExprPtr expr;
    ExprPtr when_not_null;
};

// The `.name` that directly follows a `?`.
struct MemberBinding { Identifier name; };

struct Invocation {
    ExprPtr callee;
    std::vector<ExprPtr> args;
};

struct Parenthesized { ExprPtr expr; };

struct Unary {
    enum Op { NOT, NEGATE };
    Op op;
    ExprPtr operand;
};

struct Binary {
    enum Op { EQ, NE, LT, LE, GT, GE, LOGICAL_AND, LOGICAL_OR, ADD, SUB };
    Op op;
    ExprPtr left, right;
};

// `expr is Type`
struct IsType {
    ExprPtr expr;
    TypeRef type;
};

// `expr is pattern`
struct IsPattern {
    ExprPtr expr;
    PatternPtr pattern;
};

struct SwitchExpr {
    ExprPtr governing;
    std::vector<SwitchArm> arms;
};

// --- Variant and Wrapper ---
using ExprVariant = std::variant<
    IdentifierName, ThisExpr, Literal, MemberAccess, ConditionalAccess,
    MemberBinding, Invocation, Parenthesized, Unary, Binary, IsType,
    IsPattern, SwitchExpr
>;

struct Expr {
    ExprVariant value;
    span::Span span = span::Span::invalid();
    Annotations annotations{};
    Expr(ExprVariant &&v, span::Span span = span::Span::invalid())
        : value(std::move(v)), span(span) {}
};

inline bool is_comparison(Binary::Op op) {
    switch (op) {
    case Binary::EQ:
    case Binary::NE:
    case Binary::LT:
    case Binary::LE:
    case Binary::GT:
    case Binary::GE:
        return true;
    default:
        return false;
    }
}

inline const Binary* as_logical_and(const Expr& expr) {
    auto binary = std::get_if<Binary>(&expr.value);
    return binary && binary->op == Binary::LOGICAL_AND ? binary : nullptr;
}

} // namespace syntax
