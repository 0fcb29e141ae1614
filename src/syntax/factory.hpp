#pragma once

#include "syntax.hpp"

#include <string>
#include <vector>

// Node constructors for building trees without spelling out variant wrappers.
// Synthesized nodes carry invalid spans; `syntax::layout` assigns real ones.
namespace syntax::make {

// --- expressions ---
ExprPtr ident(std::string name);
ExprPtr this_expr();
ExprPtr int_lit(int64_t value);
ExprPtr bool_lit(bool value);
ExprPtr char_lit(char value);
ExprPtr string_lit(std::string value);
ExprPtr null_lit();
ExprPtr member(ExprPtr expr, std::string name);
// `expr?.n0.n1...`
ExprPtr conditional(ExprPtr expr, ExprPtr when_not_null);
ExprPtr binding(std::string name);
ExprPtr call(ExprPtr callee, std::vector<ExprPtr> args = {});
ExprPtr paren(ExprPtr expr);
ExprPtr unary(Unary::Op op, ExprPtr operand);
ExprPtr logical_not(ExprPtr operand);
ExprPtr binary(Binary::Op op, ExprPtr left, ExprPtr right);
ExprPtr logical_and(ExprPtr left, ExprPtr right);
ExprPtr eq(ExprPtr left, ExprPtr right);
ExprPtr is_type(ExprPtr expr, std::string type);
ExprPtr is_pattern(ExprPtr expr, PatternPtr pattern);
ExprPtr switch_expr(ExprPtr governing, std::vector<SwitchArm> arms);

// Dotted member chain: `path("a", {"b", "c"})` is `a.b.c`.
ExprPtr path(std::string root, const std::vector<std::string>& members);

// --- designations ---
Designation single(std::string name);
Designation discard_designation();
Designation parenthesized(std::vector<Designation> variables);

// --- patterns ---
PatternPtr var_pattern(Designation designation);
PatternPtr var_pattern(std::string name);
PatternPtr declaration(std::string type, std::string name);
PatternPtr recursive(std::optional<TypeRef> type,
                     std::vector<Subpattern> properties,
                     std::optional<Designation> designation = std::nullopt);
PatternPtr recursive(RecursivePattern pattern);
PatternPtr constant(ExprPtr value);
PatternPtr relational(RelationalPattern::Op op, ExprPtr value);
PatternPtr type_pattern(std::string type);
PatternPtr not_pattern(PatternPtr pattern);
PatternPtr and_pattern(PatternPtr left, PatternPtr right);
PatternPtr or_pattern(PatternPtr left, PatternPtr right);
PatternPtr paren_pattern(PatternPtr pattern);
PatternPtr discard();

Subpattern subpattern(std::string name, PatternPtr pattern);
Subpattern positional(PatternPtr pattern);

// --- containers and statements ---
WhenClause when(ExprPtr condition);
CaseLabel case_label(PatternPtr pattern, std::optional<ExprPtr> when = std::nullopt);
CaseLabel default_label();
SwitchArm arm(PatternPtr pattern, ExprPtr result,
              std::optional<ExprPtr> when = std::nullopt);
SwitchSection section(std::vector<CaseLabel> labels, std::vector<StmtPtr> statements);

StmtPtr expr_stmt(ExprPtr expr);
StmtPtr return_stmt(std::optional<ExprPtr> value = std::nullopt);
StmtPtr if_stmt(ExprPtr condition, StmtPtr then_branch,
                std::optional<StmtPtr> else_branch = std::nullopt);
StmtPtr block(std::vector<StmtPtr> statements);
StmtPtr switch_stmt(ExprPtr governing, std::vector<SwitchSection> sections);

// Copies of a node carrying additional annotations.
ExprPtr annotate(const ExprPtr& expr, Annotations annotations);
PatternPtr annotate(const PatternPtr& pattern, Annotations annotations);

} // namespace syntax::make
