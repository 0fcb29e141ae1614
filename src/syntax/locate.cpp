#include "locate.hpp"

#include "utils/helpers.hpp"

namespace syntax {

namespace {

void add_subpatterns(std::vector<NodeRef>& out,
                     const std::optional<std::vector<Subpattern>>& subs) {
  if (!subs) {
    return;
  }
  for (const auto& sub : *subs) {
    out.emplace_back(&sub);
  }
}

void add_when(std::vector<NodeRef>& out, const std::optional<WhenClause>& when) {
  if (when) {
    out.emplace_back(&*when);
  }
}

std::vector<NodeRef> children_of_stmt(const Stmt& stmt) {
  std::vector<NodeRef> out;
  std::visit(Overloaded{
                 [&](const ExprStmt& s) { out.emplace_back(s.expr.get()); },
                 [&](const ReturnStmt& s) {
                   if (s.value) out.emplace_back(s.value->get());
                 },
                 [&](const IfStmt& s) {
                   out.emplace_back(s.condition.get());
                   out.emplace_back(s.then_branch.get());
                   if (s.else_branch) out.emplace_back(s.else_branch->get());
                 },
                 [&](const BlockStmt& s) {
                   for (const auto& child : s.statements) out.emplace_back(child.get());
                 },
                 [&](const SwitchStmt& s) {
                   out.emplace_back(s.governing.get());
                   for (const auto& section : s.sections) out.emplace_back(&section);
                 }},
             stmt.value);
  return out;
}

std::vector<NodeRef> children_of_expr(const Expr& expr) {
  std::vector<NodeRef> out;
  std::visit(Overloaded{
                 [&](const IdentifierName& e) { out.emplace_back(&e.name); },
                 [&](const ThisExpr&) {},
                 [&](const Literal&) {},
                 [&](const MemberAccess& e) {
                   out.emplace_back(e.expr.get());
                   out.emplace_back(&e.name);
                 },
                 [&](const ConditionalAccess& e) {
                   out.emplace_back(e.expr.get());
                   out.emplace_back(e.when_not_null.get());
                 },
                 [&](const MemberBinding& e) { out.emplace_back(&e.name); },
                 [&](const Invocation& e) {
                   out.emplace_back(e.callee.get());
                   for (const auto& arg : e.args) out.emplace_back(arg.get());
                 },
                 [&](const Parenthesized& e) { out.emplace_back(e.expr.get()); },
                 [&](const Unary& e) { out.emplace_back(e.operand.get()); },
                 [&](const Binary& e) {
                   out.emplace_back(e.left.get());
                   out.emplace_back(e.right.get());
                 },
                 [&](const IsType& e) {
                   out.emplace_back(e.expr.get());
                   out.emplace_back(&e.type);
                 },
                 [&](const IsPattern& e) {
                   out.emplace_back(e.expr.get());
                   out.emplace_back(e.pattern.get());
                 },
                 [&](const SwitchExpr& e) {
                   out.emplace_back(e.governing.get());
                   for (const auto& arm : e.arms) out.emplace_back(&arm);
                 }},
             expr.value);
  return out;
}

std::vector<NodeRef> children_of_pattern(const Pattern& pattern) {
  std::vector<NodeRef> out;
  std::visit(Overloaded{
                 [&](const VarPattern& p) { out.emplace_back(&p.designation); },
                 [&](const DeclarationPattern& p) {
                   out.emplace_back(&p.type);
                   out.emplace_back(&p.designation);
                 },
                 [&](const RecursivePattern& p) {
                   if (p.type) out.emplace_back(&*p.type);
                   add_subpatterns(out, p.positional);
                   add_subpatterns(out, p.properties);
                   if (p.designation) out.emplace_back(&*p.designation);
                 },
                 [&](const ConstantPattern& p) { out.emplace_back(p.value.get()); },
                 [&](const RelationalPattern& p) { out.emplace_back(p.value.get()); },
                 [&](const TypePattern& p) { out.emplace_back(&p.type); },
                 [&](const NotPattern& p) { out.emplace_back(p.pattern.get()); },
                 [&](const BinaryPattern& p) {
                   out.emplace_back(p.left.get());
                   out.emplace_back(p.right.get());
                 },
                 [&](const ParenthesizedPattern& p) {
                   out.emplace_back(p.pattern.get());
                 },
                 [&](const DiscardPattern&) {}},
             pattern.value);
  return out;
}

std::vector<NodeRef> children_of_designation(const Designation& designation) {
  std::vector<NodeRef> out;
  if (auto single = std::get_if<SingleVariable>(&designation.value)) {
    out.emplace_back(&single->name);
  } else if (auto vars = std::get_if<ParenthesizedVariables>(&designation.value)) {
    for (const auto& var : vars->variables) out.emplace_back(&var);
  }
  return out;
}

} // namespace

span::Span span_of(const NodeRef& node) {
  return std::visit([](const auto* n) { return n->span; }, node);
}

std::vector<NodeRef> children_of(const NodeRef& node) {
  return std::visit(
      Overloaded{
          [](const Stmt* n) { return children_of_stmt(*n); },
          [](const Expr* n) { return children_of_expr(*n); },
          [](const Pattern* n) { return children_of_pattern(*n); },
          [](const SwitchSection* n) {
            std::vector<NodeRef> out;
            for (const auto& label : n->labels) out.emplace_back(&label);
            for (const auto& stmt : n->statements) out.emplace_back(stmt.get());
            return out;
          },
          [](const CaseLabel* n) {
            std::vector<NodeRef> out;
            if (n->pattern) out.emplace_back(n->pattern.get());
            add_when(out, n->when);
            return out;
          },
          [](const SwitchArm* n) {
            std::vector<NodeRef> out;
            out.emplace_back(n->pattern.get());
            add_when(out, n->when);
            out.emplace_back(n->result.get());
            return out;
          },
          [](const WhenClause* n) {
            return std::vector<NodeRef>{NodeRef{n->condition.get()}};
          },
          [](const Subpattern* n) {
            std::vector<NodeRef> out;
            if (n->name) out.emplace_back(&*n->name);
            out.emplace_back(n->pattern.get());
            return out;
          },
          [](const Designation* n) { return children_of_designation(*n); },
          [](const Identifier*) { return std::vector<NodeRef>{}; },
          [](const TypeRef*) { return std::vector<NodeRef>{}; }},
      node);
}

std::optional<NodePath> find_node_at(const StmtPtr& root, uint32_t offset) {
  if (!root || !root->span.contains(offset)) {
    return std::nullopt;
  }

  NodePath path{NodeRef{root.get()}};
  bool descended = true;
  while (descended) {
    descended = false;
    for (const auto& child : children_of(path.back())) {
      if (span_of(child).contains(offset)) {
        path.push_back(child);
        descended = true;
        break;
      }
    }
  }
  return path;
}

} // namespace syntax
