#include "factory.hpp"

#include <utility>

namespace syntax::make {

namespace {

ExprPtr make_expr(ExprVariant value) {
  return std::make_shared<const Expr>(std::move(value));
}

PatternPtr make_pattern(PatternVariant value) {
  return std::make_shared<const Pattern>(std::move(value));
}

StmtPtr make_stmt(StmtVariant value) {
  return std::make_shared<const Stmt>(std::move(value));
}

ExprPtr make_literal(Literal::Value value) {
  return make_expr(ExprVariant{std::in_place_type<Literal>,
                               Literal{std::move(value)}});
}

} // namespace

ExprPtr ident(std::string name) {
  return make_expr(IdentifierName{Identifier{std::move(name)}});
}

ExprPtr this_expr() { return make_expr(ThisExpr{}); }

ExprPtr int_lit(int64_t value) {
  return make_literal(Literal::Value{std::in_place_type<int64_t>, value});
}

ExprPtr bool_lit(bool value) {
  return make_literal(Literal::Value{std::in_place_type<bool>, value});
}

ExprPtr char_lit(char value) {
  return make_literal(Literal::Value{std::in_place_type<char>, value});
}

ExprPtr string_lit(std::string value) {
  return make_literal(
      Literal::Value{std::in_place_type<std::string>, std::move(value)});
}

ExprPtr null_lit() {
  return make_literal(Literal::Value{std::in_place_type<Literal::Null>});
}

ExprPtr member(ExprPtr expr, std::string name) {
  return make_expr(MemberAccess{std::move(expr), Identifier{std::move(name)}});
}

ExprPtr conditional(ExprPtr expr, ExprPtr when_not_null) {
  return make_expr(ConditionalAccess{std::move(expr), std::move(when_not_null)});
}

ExprPtr binding(std::string name) {
  return make_expr(MemberBinding{Identifier{std::move(name)}});
}

ExprPtr call(ExprPtr callee, std::vector<ExprPtr> args) {
  return make_expr(Invocation{std::move(callee), std::move(args)});
}

ExprPtr paren(ExprPtr expr) { return make_expr(Parenthesized{std::move(expr)}); }

ExprPtr unary(Unary::Op op, ExprPtr operand) {
  return make_expr(Unary{op, std::move(operand)});
}

ExprPtr logical_not(ExprPtr operand) {
  return unary(Unary::NOT, std::move(operand));
}

ExprPtr binary(Binary::Op op, ExprPtr left, ExprPtr right) {
  return make_expr(Binary{op, std::move(left), std::move(right)});
}

ExprPtr logical_and(ExprPtr left, ExprPtr right) {
  return binary(Binary::LOGICAL_AND, std::move(left), std::move(right));
}

ExprPtr eq(ExprPtr left, ExprPtr right) {
  return binary(Binary::EQ, std::move(left), std::move(right));
}

ExprPtr is_type(ExprPtr expr, std::string type) {
  return make_expr(IsType{std::move(expr), TypeRef{std::move(type)}});
}

ExprPtr is_pattern(ExprPtr expr, PatternPtr pattern) {
  return make_expr(IsPattern{std::move(expr), std::move(pattern)});
}

ExprPtr switch_expr(ExprPtr governing, std::vector<SwitchArm> arms) {
  return make_expr(SwitchExpr{std::move(governing), std::move(arms)});
}

ExprPtr path(std::string root, const std::vector<std::string>& members) {
  auto expr = ident(std::move(root));
  for (const auto& name : members) {
    expr = member(std::move(expr), name);
  }
  return expr;
}

Designation single(std::string name) {
  return Designation{SingleVariable{Identifier{std::move(name)}}};
}

Designation discard_designation() { return Designation{DiscardDesignation{}}; }

Designation parenthesized(std::vector<Designation> variables) {
  return Designation{ParenthesizedVariables{std::move(variables)}};
}

PatternPtr var_pattern(Designation designation) {
  return make_pattern(VarPattern{std::move(designation)});
}

PatternPtr var_pattern(std::string name) {
  return var_pattern(single(std::move(name)));
}

PatternPtr declaration(std::string type, std::string name) {
  return make_pattern(
      DeclarationPattern{TypeRef{std::move(type)}, single(std::move(name))});
}

PatternPtr recursive(std::optional<TypeRef> type,
                     std::vector<Subpattern> properties,
                     std::optional<Designation> designation) {
  RecursivePattern pattern;
  pattern.type = std::move(type);
  pattern.properties = std::move(properties);
  pattern.designation = std::move(designation);
  return recursive(std::move(pattern));
}

PatternPtr recursive(RecursivePattern pattern) {
  return make_pattern(PatternVariant{std::in_place_type<RecursivePattern>,
                                     std::move(pattern)});
}

PatternPtr constant(ExprPtr value) {
  return make_pattern(ConstantPattern{std::move(value)});
}

PatternPtr relational(RelationalPattern::Op op, ExprPtr value) {
  return make_pattern(RelationalPattern{op, std::move(value)});
}

PatternPtr type_pattern(std::string type) {
  return make_pattern(TypePattern{TypeRef{std::move(type)}});
}

PatternPtr not_pattern(PatternPtr pattern) {
  return make_pattern(NotPattern{std::move(pattern)});
}

PatternPtr and_pattern(PatternPtr left, PatternPtr right) {
  return make_pattern(BinaryPattern{BinaryPattern::AND, std::move(left),
                                    std::move(right)});
}

PatternPtr or_pattern(PatternPtr left, PatternPtr right) {
  return make_pattern(BinaryPattern{BinaryPattern::OR, std::move(left),
                                    std::move(right)});
}

PatternPtr paren_pattern(PatternPtr pattern) {
  return make_pattern(ParenthesizedPattern{std::move(pattern)});
}

PatternPtr discard() { return make_pattern(DiscardPattern{}); }

Subpattern subpattern(std::string name, PatternPtr pattern) {
  return Subpattern{Identifier{std::move(name)}, std::move(pattern)};
}

Subpattern positional(PatternPtr pattern) {
  return Subpattern{std::nullopt, std::move(pattern)};
}

WhenClause when(ExprPtr condition) { return WhenClause{std::move(condition)}; }

CaseLabel case_label(PatternPtr pattern, std::optional<ExprPtr> when) {
  CaseLabel label;
  label.pattern = std::move(pattern);
  if (when) {
    label.when = WhenClause{std::move(*when)};
  }
  return label;
}

CaseLabel default_label() { return CaseLabel{}; }

SwitchArm arm(PatternPtr pattern, ExprPtr result, std::optional<ExprPtr> when) {
  SwitchArm switch_arm;
  switch_arm.pattern = std::move(pattern);
  switch_arm.result = std::move(result);
  if (when) {
    switch_arm.when = WhenClause{std::move(*when)};
  }
  return switch_arm;
}

SwitchSection section(std::vector<CaseLabel> labels,
                      std::vector<StmtPtr> statements) {
  return SwitchSection{std::move(labels), std::move(statements)};
}

StmtPtr expr_stmt(ExprPtr expr) { return make_stmt(ExprStmt{std::move(expr)}); }

StmtPtr return_stmt(std::optional<ExprPtr> value) {
  return make_stmt(ReturnStmt{std::move(value)});
}

StmtPtr if_stmt(ExprPtr condition, StmtPtr then_branch,
                std::optional<StmtPtr> else_branch) {
  return make_stmt(IfStmt{std::move(condition), std::move(then_branch),
                          std::move(else_branch)});
}

StmtPtr block(std::vector<StmtPtr> statements) {
  return make_stmt(BlockStmt{std::move(statements)});
}

StmtPtr switch_stmt(ExprPtr governing, std::vector<SwitchSection> sections) {
  return make_stmt(SwitchStmt{std::move(governing), std::move(sections)});
}

ExprPtr annotate(const ExprPtr& expr, Annotations annotations) {
  auto copy = std::make_shared<Expr>(*expr);
  copy->annotations = copy->annotations.merged(annotations);
  return copy;
}

PatternPtr annotate(const PatternPtr& pattern, Annotations annotations) {
  auto copy = std::make_shared<Pattern>(*pattern);
  copy->annotations = copy->annotations.merged(annotations);
  return copy;
}

} // namespace syntax::make
