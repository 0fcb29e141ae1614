#include "editor.hpp"

#include "utils/error.hpp"

#include <memory>
#include <utility>

namespace syntax {

// Rebuilds nodes bottom-up. Every `rebuild` returns the input pointer when
// nothing underneath it changed, so untouched subtrees stay shared.
class EditApplier {
public:
  explicit EditApplier(const SyntaxEditor& editor) : editor_(editor) {}

  StmtPtr rebuild(const StmtPtr& stmt) const {
    if (!stmt) {
      return stmt;
    }
    bool changed = false;
    auto value = std::visit(
        [&](const auto& node) -> StmtVariant { return rebuild_node(node, changed); },
        stmt->value);
    if (!changed) {
      return stmt;
    }
    return std::make_shared<const Stmt>(std::move(value), stmt->span);
  }

  ExprPtr rebuild(const ExprPtr& expr) const {
    if (!expr) {
      return expr;
    }
    if (auto it = editor_.exprs_.find(expr.get()); it != editor_.exprs_.end()) {
      return it->second;
    }
    bool changed = false;
    auto value = std::visit(
        [&](const auto& node) -> ExprVariant { return rebuild_node(node, changed); },
        expr->value);
    if (!changed) {
      return expr;
    }
    auto result = std::make_shared<Expr>(std::move(value), expr->span);
    result->annotations = expr->annotations;
    return result;
  }

  PatternPtr rebuild(const PatternPtr& pattern) const {
    if (!pattern) {
      return pattern;
    }
    if (auto it = editor_.patterns_.find(pattern.get());
        it != editor_.patterns_.end()) {
      return it->second;
    }
    bool changed = false;
    auto value = std::visit(
        [&](const auto& node) -> PatternVariant {
          return rebuild_node(node, changed);
        },
        pattern->value);
    if (!changed) {
      return pattern;
    }
    auto result = std::make_shared<Pattern>(std::move(value), pattern->span);
    result->annotations = pattern->annotations;
    return result;
  }

private:
  const SyntaxEditor& editor_;

  template <typename Ptr>
  Ptr track(const Ptr& original, bool& changed) const {
    auto rebuilt = rebuild(original);
    if (rebuilt != original) {
      changed = true;
    }
    return rebuilt;
  }

  template <typename Ptr>
  std::vector<Ptr> track_all(const std::vector<Ptr>& originals, bool& changed) const {
    std::vector<Ptr> result;
    result.reserve(originals.size());
    for (const auto& original : originals) {
      result.push_back(track(original, changed));
    }
    return result;
  }

  std::optional<WhenClause> track(const std::optional<WhenClause>& when,
                                  bool& changed) const {
    if (!when) {
      return when;
    }
    return WhenClause{track(when->condition, changed), when->span};
  }

  std::optional<std::vector<Subpattern>>
  track(const std::optional<std::vector<Subpattern>>& subs, bool& changed) const {
    if (!subs) {
      return subs;
    }
    std::vector<Subpattern> result;
    result.reserve(subs->size());
    for (const auto& sub : *subs) {
      result.push_back(Subpattern{sub.name, track(sub.pattern, changed), sub.span});
    }
    return result;
  }

  CaseLabel track(const CaseLabel& label, bool& changed) const {
    if (auto it = editor_.labels_.find(&label); it != editor_.labels_.end()) {
      changed = true;
      return it->second;
    }
    return CaseLabel{track(label.pattern, changed), track(label.when, changed),
                     label.span};
  }

  SwitchArm track(const SwitchArm& arm, bool& changed) const {
    if (auto it = editor_.arms_.find(&arm); it != editor_.arms_.end()) {
      changed = true;
      return it->second;
    }
    SwitchArm result;
    result.pattern = track(arm.pattern, changed);
    result.when = track(arm.when, changed);
    result.result = track(arm.result, changed);
    result.span = arm.span;
    return result;
  }

  // --- statements ---
  StmtVariant rebuild_node(const ExprStmt& s, bool& changed) const {
    return ExprStmt{track(s.expr, changed)};
  }

  StmtVariant rebuild_node(const ReturnStmt& s, bool& changed) const {
    ReturnStmt result;
    if (s.value) {
      result.value = track(*s.value, changed);
    }
    return result;
  }

  StmtVariant rebuild_node(const IfStmt& s, bool& changed) const {
    IfStmt result;
    result.condition = track(s.condition, changed);
    result.then_branch = track(s.then_branch, changed);
    if (s.else_branch) {
      result.else_branch = track(*s.else_branch, changed);
    }
    return result;
  }

  StmtVariant rebuild_node(const BlockStmt& s, bool& changed) const {
    return BlockStmt{track_all(s.statements, changed)};
  }

  StmtVariant rebuild_node(const SwitchStmt& s, bool& changed) const {
    SwitchStmt result;
    result.governing = track(s.governing, changed);
    for (const auto& section : s.sections) {
      SwitchSection rebuilt;
      for (const auto& label : section.labels) {
        rebuilt.labels.push_back(track(label, changed));
      }
      rebuilt.statements = track_all(section.statements, changed);
      rebuilt.span = section.span;
      result.sections.push_back(std::move(rebuilt));
    }
    return result;
  }

  // --- expressions ---
  ExprVariant rebuild_node(const IdentifierName& e, bool&) const { return e; }
  ExprVariant rebuild_node(const ThisExpr& e, bool&) const { return e; }
  ExprVariant rebuild_node(const Literal& e, bool&) const { return e; }
  ExprVariant rebuild_node(const MemberBinding& e, bool&) const { return e; }

  ExprVariant rebuild_node(const MemberAccess& e, bool& changed) const {
    return MemberAccess{track(e.expr, changed), e.name};
  }

  ExprVariant rebuild_node(const ConditionalAccess& e, bool& changed) const {
    auto expr = track(e.expr, changed);
    return ConditionalAccess{std::move(expr), track(e.when_not_null, changed)};
  }

  ExprVariant rebuild_node(const Invocation& e, bool& changed) const {
    auto callee = track(e.callee, changed);
    return Invocation{std::move(callee), track_all(e.args, changed)};
  }

  ExprVariant rebuild_node(const Parenthesized& e, bool& changed) const {
    return Parenthesized{track(e.expr, changed)};
  }

  ExprVariant rebuild_node(const Unary& e, bool& changed) const {
    return Unary{e.op, track(e.operand, changed)};
  }

  ExprVariant rebuild_node(const Binary& e, bool& changed) const {
    auto left = track(e.left, changed);
    return Binary{e.op, std::move(left), track(e.right, changed)};
  }

  ExprVariant rebuild_node(const IsType& e, bool& changed) const {
    return IsType{track(e.expr, changed), e.type};
  }

  ExprVariant rebuild_node(const IsPattern& e, bool& changed) const {
    auto expr = track(e.expr, changed);
    return IsPattern{std::move(expr), track(e.pattern, changed)};
  }

  ExprVariant rebuild_node(const SwitchExpr& e, bool& changed) const {
    SwitchExpr result;
    result.governing = track(e.governing, changed);
    for (const auto& arm : e.arms) {
      result.arms.push_back(track(arm, changed));
    }
    return result;
  }

  // --- patterns ---
  PatternVariant rebuild_node(const VarPattern& p, bool&) const { return p; }
  PatternVariant rebuild_node(const DeclarationPattern& p, bool&) const { return p; }
  PatternVariant rebuild_node(const TypePattern& p, bool&) const { return p; }
  PatternVariant rebuild_node(const DiscardPattern& p, bool&) const { return p; }

  PatternVariant rebuild_node(const RecursivePattern& p, bool& changed) const {
    RecursivePattern result;
    result.type = p.type;
    result.positional = track(p.positional, changed);
    result.properties = track(p.properties, changed);
    result.designation = p.designation;
    return result;
  }

  PatternVariant rebuild_node(const ConstantPattern& p, bool& changed) const {
    return ConstantPattern{track(p.value, changed)};
  }

  PatternVariant rebuild_node(const RelationalPattern& p, bool& changed) const {
    return RelationalPattern{p.op, track(p.value, changed)};
  }

  PatternVariant rebuild_node(const NotPattern& p, bool& changed) const {
    return NotPattern{track(p.pattern, changed)};
  }

  PatternVariant rebuild_node(const BinaryPattern& p, bool& changed) const {
    auto left = track(p.left, changed);
    return BinaryPattern{p.op, std::move(left), track(p.right, changed)};
  }

  PatternVariant rebuild_node(const ParenthesizedPattern& p, bool& changed) const {
    return ParenthesizedPattern{track(p.pattern, changed)};
  }
};

void SyntaxEditor::replace(const Expr& target, ExprPtr replacement) {
  if (!replacement) {
    error_helper::invariant_violation("null expression replacement", target.span);
  }
  exprs_[&target] = std::move(replacement);
}

void SyntaxEditor::replace(const Pattern& target, PatternPtr replacement) {
  if (!replacement) {
    error_helper::invariant_violation("null pattern replacement", target.span);
  }
  patterns_[&target] = std::move(replacement);
}

void SyntaxEditor::replace(const CaseLabel& target, CaseLabel replacement) {
  labels_[&target] = std::move(replacement);
}

void SyntaxEditor::replace(const SwitchArm& target, SwitchArm replacement) {
  arms_[&target] = std::move(replacement);
}

bool SyntaxEditor::empty() const {
  return exprs_.empty() && patterns_.empty() && labels_.empty() && arms_.empty();
}

StmtPtr SyntaxEditor::apply(const StmtPtr& root) const {
  return EditApplier(*this).rebuild(root);
}

ExprPtr SyntaxEditor::apply(const ExprPtr& root) const {
  return EditApplier(*this).rebuild(root);
}

PatternPtr SyntaxEditor::apply(const PatternPtr& root) const {
  return EditApplier(*this).rebuild(root);
}

} // namespace syntax
