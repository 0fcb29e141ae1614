#include "pretty_print.hpp"

#include "utils/error.hpp"
#include "utils/helpers.hpp"

#include <cstdint>
#include <memory>
#include <utility>

namespace syntax {

namespace {

constexpr int kIndentWidth = 4;

// Binding strength, loosest first. Operands that bind looser than their
// position allows are printed in parentheses.
enum ExprPrecedence {
  PREC_LOGICAL_OR = 1,
  PREC_LOGICAL_AND,
  PREC_EQUALITY,
  PREC_RELATIONAL,
  PREC_ADDITIVE,
  PREC_SWITCH,
  PREC_UNARY,
  PREC_PRIMARY,
};

int precedence(Binary::Op op) {
  switch (op) {
  case Binary::LOGICAL_OR: return PREC_LOGICAL_OR;
  case Binary::LOGICAL_AND: return PREC_LOGICAL_AND;
  case Binary::EQ:
  case Binary::NE: return PREC_EQUALITY;
  case Binary::LT:
  case Binary::LE:
  case Binary::GT:
  case Binary::GE: return PREC_RELATIONAL;
  case Binary::ADD:
  case Binary::SUB: return PREC_ADDITIVE;
  }
  error_helper::unexpected_shape("binary operator");
}

int precedence(const Expr& expr) {
  return std::visit(Overloaded{[](const Binary& binary) { return precedence(binary.op); },
                               [](const IsType&) { return static_cast<int>(PREC_RELATIONAL); },
                               [](const IsPattern&) { return static_cast<int>(PREC_RELATIONAL); },
                               [](const SwitchExpr&) { return static_cast<int>(PREC_SWITCH); },
                               [](const Unary&) { return static_cast<int>(PREC_UNARY); },
                               [](const auto&) { return static_cast<int>(PREC_PRIMARY); }},
                    expr.value);
}

enum PatternPrecedence { PREC_PATTERN_OR = 1, PREC_PATTERN_AND, PREC_PATTERN_NOT, PREC_PATTERN_PRIMARY };

int precedence(const BinaryPattern& binary) {
  return static_cast<int>(binary.op == BinaryPattern::AND ? PREC_PATTERN_AND : PREC_PATTERN_OR);
}

int precedence(const Pattern& pattern) {
  return std::visit(
      Overloaded{[](const BinaryPattern& binary) { return precedence(binary); },
                 [](const NotPattern&) { return static_cast<int>(PREC_PATTERN_NOT); },
                 [](const auto&) { return static_cast<int>(PREC_PATTERN_PRIMARY); }},
      pattern.value);
}

// Writes source text and rebuilds every node with the span it was printed at.
class SourceWriter {
public:
  explicit SourceWriter(span::FileId file) : file_(file) {}

  std::string take_text() { return std::move(text_); }

  StmtPtr write(const StmtPtr& stmt) {
    auto start = offset();
    auto value = std::visit([this](const auto& node) { return write_stmt(node); },
                            stmt->value);
    return std::make_shared<const Stmt>(std::move(value), span_from(start));
  }

  ExprPtr write(const ExprPtr& expr) {
    auto start = offset();
    auto value = std::visit([this](const auto& node) { return write_expr(node); },
                            expr->value);
    auto result = std::make_shared<Expr>(std::move(value), span_from(start));
    result->annotations = expr->annotations;
    return result;
  }

  PatternPtr write(const PatternPtr& pattern) {
    auto start = offset();
    auto value = std::visit(
        [this](const auto& node) { return write_pattern(node); }, pattern->value);
    auto result = std::make_shared<Pattern>(std::move(value), span_from(start));
    result->annotations = pattern->annotations;
    return result;
  }

  Designation write(const Designation& designation) {
    auto start = offset();
    auto value = std::visit(
        Overloaded{
            [this](const SingleVariable& single) -> DesignationVariant {
              return SingleVariable{write(single.name)};
            },
            [this](const DiscardDesignation&) -> DesignationVariant {
              emit("_");
              return DiscardDesignation{};
            },
            [this](const ParenthesizedVariables& vars) -> DesignationVariant {
              ParenthesizedVariables result;
              emit("(");
              for (std::size_t i = 0; i < vars.variables.size(); ++i) {
                if (i > 0) emit(", ");
                result.variables.push_back(write(vars.variables[i]));
              }
              emit(")");
              return result;
            }},
        designation.value);
    return Designation{std::move(value), span_from(start)};
  }

private:
  span::FileId file_;
  std::string text_;
  int indent_level_ = 0;

  uint32_t offset() const { return static_cast<uint32_t>(text_.size()); }

  span::Span span_from(uint32_t start) const {
    return span::Span{file_, start, offset()};
  }

  void emit(const std::string& s) { text_ += s; }

  // Writes `node`, wrapped in parentheses when it binds looser than `min`.
  template <typename NodePtr>
  NodePtr write_operand(const NodePtr& node, int min) {
    if (precedence(*node) >= min) {
      return write(node);
    }
    emit("(");
    auto result = write(node);
    emit(")");
    return result;
  }

  void newline() {
    text_ += '\n';
    text_.append(static_cast<std::size_t>(indent_level_ * kIndentWidth), ' ');
  }

  Identifier write(const Identifier& id) {
    auto start = offset();
    emit(id.name);
    Identifier result{id.name};
    result.span = span_from(start);
    return result;
  }

  TypeRef write(const TypeRef& type) {
    auto start = offset();
    emit(type.name);
    TypeRef result{type.name};
    result.span = span_from(start);
    return result;
  }

  WhenClause write(const WhenClause& when) {
    auto start = offset();
    emit("when ");
    auto condition = write(when.condition);
    return WhenClause{std::move(condition), span_from(start)};
  }

  Subpattern write(const Subpattern& sub) {
    auto start = offset();
    Subpattern result;
    if (sub.name) {
      result.name = write(*sub.name);
      emit(": ");
    }
    result.pattern = write(sub.pattern);
    result.span = span_from(start);
    return result;
  }

  std::vector<Subpattern> write_subpatterns(const std::vector<Subpattern>& subs) {
    std::vector<Subpattern> result;
    for (std::size_t i = 0; i < subs.size(); ++i) {
      if (i > 0) emit(", ");
      result.push_back(write(subs[i]));
    }
    return result;
  }

  std::vector<StmtPtr> write_body(const std::vector<StmtPtr>& statements) {
    std::vector<StmtPtr> result;
    for (const auto& stmt : statements) {
      newline();
      result.push_back(write(stmt));
    }
    return result;
  }

  // --- statements ---
  StmtVariant write_stmt(const ExprStmt& stmt) {
    auto expr = write(stmt.expr);
    emit(";");
    return ExprStmt{std::move(expr)};
  }

  StmtVariant write_stmt(const ReturnStmt& stmt) {
    ReturnStmt result;
    emit("return");
    if (stmt.value) {
      emit(" ");
      result.value = write(*stmt.value);
    }
    emit(";");
    return result;
  }

  StmtVariant write_stmt(const IfStmt& stmt) {
    IfStmt result;
    emit("if (");
    result.condition = write(stmt.condition);
    emit(")");
    ++indent_level_;
    newline();
    result.then_branch = write(stmt.then_branch);
    --indent_level_;
    if (stmt.else_branch) {
      newline();
      emit("else");
      ++indent_level_;
      newline();
      result.else_branch = write(*stmt.else_branch);
      --indent_level_;
    }
    return result;
  }

  StmtVariant write_stmt(const BlockStmt& stmt) {
    BlockStmt result;
    emit("{");
    ++indent_level_;
    result.statements = write_body(stmt.statements);
    --indent_level_;
    newline();
    emit("}");
    return result;
  }

  StmtVariant write_stmt(const SwitchStmt& stmt) {
    SwitchStmt result;
    emit("switch (");
    result.governing = write(stmt.governing);
    emit(")");
    newline();
    emit("{");
    ++indent_level_;
    for (const auto& section : stmt.sections) {
      newline();
      result.sections.push_back(write(section));
    }
    --indent_level_;
    newline();
    emit("}");
    return result;
  }

  SwitchSection write(const SwitchSection& section) {
    auto start = offset();
    SwitchSection result;
    for (std::size_t i = 0; i < section.labels.size(); ++i) {
      if (i > 0) newline();
      result.labels.push_back(write(section.labels[i]));
    }
    ++indent_level_;
    result.statements = write_body(section.statements);
    --indent_level_;
    result.span = span_from(start);
    return result;
  }

  CaseLabel write(const CaseLabel& label) {
    auto start = offset();
    CaseLabel result;
    if (label.is_default()) {
      emit("default");
    } else {
      emit("case ");
      result.pattern = write(label.pattern);
    }
    if (label.when) {
      emit(" ");
      result.when = write(*label.when);
    }
    emit(":");
    result.span = span_from(start);
    return result;
  }

  SwitchArm write(const SwitchArm& arm) {
    auto start = offset();
    SwitchArm result;
    result.pattern = write(arm.pattern);
    if (arm.when) {
      emit(" ");
      result.when = write(*arm.when);
    }
    emit(" => ");
    result.result = write(arm.result);
    result.span = span_from(start);
    return result;
  }

  // --- expressions ---
  ExprVariant write_expr(const IdentifierName& expr) {
    return IdentifierName{write(expr.name)};
  }

  ExprVariant write_expr(const ThisExpr&) {
    emit("this");
    return ThisExpr{};
  }

  ExprVariant write_expr(const Literal& expr) {
    std::visit(Overloaded{[this](int64_t value) { emit(std::to_string(value)); },
                          [this](bool value) { emit(value ? "true" : "false"); },
                          [this](char value) {
                            emit("'");
                            emit(std::string(1, value));
                            emit("'");
                          },
                          [this](const std::string& value) {
                            emit("\"");
                            emit(value);
                            emit("\"");
                          },
                          [this](const Literal::Null&) { emit("null"); }},
               expr.value);
    return expr;
  }

  ExprVariant write_expr(const MemberAccess& expr) {
    auto inner = write_operand(expr.expr, PREC_PRIMARY);
    emit(".");
    return MemberAccess{std::move(inner), write(expr.name)};
  }

  ExprVariant write_expr(const ConditionalAccess& expr) {
    auto inner = write_operand(expr.expr, PREC_PRIMARY);
    emit("?");
    return ConditionalAccess{std::move(inner), write(expr.when_not_null)};
  }

  ExprVariant write_expr(const MemberBinding& expr) {
    emit(".");
    return MemberBinding{write(expr.name)};
  }

  ExprVariant write_expr(const Invocation& expr) {
    Invocation result;
    result.callee = write_operand(expr.callee, PREC_PRIMARY);
    emit("(");
    for (std::size_t i = 0; i < expr.args.size(); ++i) {
      if (i > 0) emit(", ");
      result.args.push_back(write(expr.args[i]));
    }
    emit(")");
    return result;
  }

  ExprVariant write_expr(const Parenthesized& expr) {
    emit("(");
    auto inner = write(expr.expr);
    emit(")");
    return Parenthesized{std::move(inner)};
  }

  ExprVariant write_expr(const Unary& expr) {
    emit(expr.op == Unary::NOT ? "!" : "-");
    return Unary{expr.op, write_operand(expr.operand, PREC_UNARY)};
  }

  ExprVariant write_expr(const Binary& expr) {
    // Left-associative: a right operand of equal strength needs parentheses.
    int prec = precedence(expr.op);
    auto left = write_operand(expr.left, prec);
    emit(" ");
    emit(to_string(expr.op));
    emit(" ");
    return Binary{expr.op, std::move(left), write_operand(expr.right, prec + 1)};
  }

  ExprVariant write_expr(const IsType& expr) {
    auto inner = write_operand(expr.expr, PREC_RELATIONAL);
    emit(" is ");
    return IsType{std::move(inner), write(expr.type)};
  }

  ExprVariant write_expr(const IsPattern& expr) {
    auto inner = write_operand(expr.expr, PREC_RELATIONAL);
    emit(" is ");
    return IsPattern{std::move(inner), write(expr.pattern)};
  }

  ExprVariant write_expr(const SwitchExpr& expr) {
    SwitchExpr result;
    result.governing = write_operand(expr.governing, PREC_UNARY);
    emit(" switch { ");
    for (std::size_t i = 0; i < expr.arms.size(); ++i) {
      if (i > 0) emit(", ");
      result.arms.push_back(write(expr.arms[i]));
    }
    emit(expr.arms.empty() ? "}" : " }");
    return result;
  }

  // --- patterns ---
  PatternVariant write_pattern(const VarPattern& pattern) {
    emit("var ");
    return VarPattern{write(pattern.designation)};
  }

  PatternVariant write_pattern(const DeclarationPattern& pattern) {
    auto type = write(pattern.type);
    emit(" ");
    return DeclarationPattern{std::move(type), write(pattern.designation)};
  }

  PatternVariant write_pattern(const RecursivePattern& pattern) {
    RecursivePattern result;
    bool wrote_any = false;
    if (pattern.type) {
      result.type = write(*pattern.type);
      wrote_any = true;
    }
    if (pattern.positional) {
      emit("(");
      result.positional = write_subpatterns(*pattern.positional);
      emit(")");
      wrote_any = true;
    }
    if (pattern.properties) {
      if (wrote_any) emit(" ");
      if (pattern.properties->empty()) {
        emit("{ }");
        result.properties.emplace();
      } else {
        emit("{ ");
        result.properties = write_subpatterns(*pattern.properties);
        emit(" }");
      }
      wrote_any = true;
    }
    if (pattern.designation) {
      if (wrote_any) emit(" ");
      result.designation = write(*pattern.designation);
    }
    return result;
  }

  PatternVariant write_pattern(const ConstantPattern& pattern) {
    return ConstantPattern{write(pattern.value)};
  }

  PatternVariant write_pattern(const RelationalPattern& pattern) {
    emit(to_string(pattern.op));
    emit(" ");
    return RelationalPattern{pattern.op, write(pattern.value)};
  }

  PatternVariant write_pattern(const TypePattern& pattern) {
    return TypePattern{write(pattern.type)};
  }

  PatternVariant write_pattern(const NotPattern& pattern) {
    emit("not ");
    return NotPattern{write_operand(pattern.pattern, PREC_PATTERN_NOT)};
  }

  PatternVariant write_pattern(const BinaryPattern& pattern) {
    int prec = precedence(pattern);
    auto left = write_operand(pattern.left, prec);
    emit(pattern.op == BinaryPattern::AND ? " and " : " or ");
    return BinaryPattern{pattern.op, std::move(left), write_operand(pattern.right, prec + 1)};
  }

  PatternVariant write_pattern(const ParenthesizedPattern& pattern) {
    emit("(");
    auto inner = write(pattern.pattern);
    emit(")");
    return ParenthesizedPattern{std::move(inner)};
  }

  PatternVariant write_pattern(const DiscardPattern&) {
    emit("_");
    return DiscardPattern{};
  }
};

template <typename NodePtr>
Layout<NodePtr> layout_node(const NodePtr& root, span::FileId file) {
  if (!root) {
    error_helper::invariant_violation("layout of a null tree");
  }
  SourceWriter writer(file);
  auto laid = writer.write(root);
  return Layout<NodePtr>{std::move(laid), writer.take_text()};
}

} // namespace

Layout<StmtPtr> layout(const StmtPtr& root, span::FileId file) {
  return layout_node(root, file);
}

Layout<ExprPtr> layout(const ExprPtr& root, span::FileId file) {
  return layout_node(root, file);
}

Layout<PatternPtr> layout(const PatternPtr& root, span::FileId file) {
  return layout_node(root, file);
}

std::string to_source(const StmtPtr& stmt) { return layout(stmt).text; }
std::string to_source(const ExprPtr& expr) { return layout(expr).text; }
std::string to_source(const PatternPtr& pattern) { return layout(pattern).text; }

std::string to_source(const Designation& designation) {
  SourceWriter writer(0);
  writer.write(designation);
  return writer.take_text();
}

const char* to_string(Binary::Op op) {
  switch (op) {
  case Binary::EQ: return "==";
  case Binary::NE: return "!=";
  case Binary::LT: return "<";
  case Binary::LE: return "<=";
  case Binary::GT: return ">";
  case Binary::GE: return ">=";
  case Binary::LOGICAL_AND: return "&&";
  case Binary::LOGICAL_OR: return "||";
  case Binary::ADD: return "+";
  case Binary::SUB: return "-";
  }
  return "?";
}

const char* to_string(RelationalPattern::Op op) {
  switch (op) {
  case RelationalPattern::LT: return "<";
  case RelationalPattern::LE: return "<=";
  case RelationalPattern::GT: return ">";
  case RelationalPattern::GE: return ">=";
  }
  return "?";
}

} // namespace syntax
