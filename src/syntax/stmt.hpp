#pragma once

#include "expr.hpp"

namespace syntax {

// `case <pattern> when <condition>:`; a null pattern is `default:`.
struct CaseLabel {
    PatternPtr pattern;
    std::optional<WhenClause> when;
    span::Span span = span::Span::invalid();

    bool is_default() const { return pattern == nullptr; }
};

struct SwitchSection {
    std::vector<CaseLabel> labels;
    std::vector<StmtPtr> statements;
    span::Span span = span::Span::invalid();
};

// --- Concrete Statement Nodes ---
struct ExprStmt { ExprPtr expr; };
struct ReturnStmt { std::optional<ExprPtr> value; };

struct IfStmt {
    ExprPtr condition;
    StmtPtr then_branch;
    std::optional<StmtPtr> else_branch;
};

struct BlockStmt { std::vector<StmtPtr> statements; };

struct SwitchStmt {
    ExprPtr governing;
    std::vector<SwitchSection> sections;
};

using StmtVariant = std::variant<ExprStmt, ReturnStmt, IfStmt, BlockStmt, SwitchStmt>;

struct Stmt {
    StmtVariant value;
    span::Span span = span::Span::invalid();
    Stmt(StmtVariant &&v, span::Span span = span::Span::invalid())
        : value(std::move(v)), span(span) {}
};

} // namespace syntax
