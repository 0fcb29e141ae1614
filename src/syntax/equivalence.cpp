#include "equivalence.hpp"

#include "utils/helpers.hpp"

#include <type_traits>

namespace syntax {

namespace {

template <typename T, typename Eq>
bool optional_equivalent(const std::optional<T>& lhs, const std::optional<T>& rhs,
                         Eq eq) {
  if (lhs.has_value() != rhs.has_value()) {
    return false;
  }
  return !lhs || eq(*lhs, *rhs);
}

template <typename T, typename Eq>
bool list_equivalent(const std::vector<T>& lhs, const std::vector<T>& rhs, Eq eq) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (!eq(lhs[i], rhs[i])) {
      return false;
    }
  }
  return true;
}

bool when_equivalent(const WhenClause& lhs, const WhenClause& rhs) {
  return are_equivalent(lhs.condition, rhs.condition);
}

bool arm_equivalent(const SwitchArm& lhs, const SwitchArm& rhs) {
  return are_equivalent(lhs.pattern, rhs.pattern) &&
         optional_equivalent(lhs.when, rhs.when, when_equivalent) &&
         are_equivalent(lhs.result, rhs.result);
}

bool subpattern_equivalent(const Subpattern& lhs, const Subpattern& rhs) {
  return optional_equivalent(lhs.name, rhs.name,
                             [](const Identifier& a, const Identifier& b) {
                               return are_equivalent(a, b);
                             }) &&
         are_equivalent(lhs.pattern, rhs.pattern);
}

bool subpatterns_equivalent(const std::optional<std::vector<Subpattern>>& lhs,
                            const std::optional<std::vector<Subpattern>>& rhs) {
  return optional_equivalent(
      lhs, rhs, [](const std::vector<Subpattern>& a, const std::vector<Subpattern>& b) {
        return list_equivalent(a, b, subpattern_equivalent);
      });
}

struct ExprEquivalence {
  bool operator()(const IdentifierName& a, const IdentifierName& b) const {
    return are_equivalent(a.name, b.name);
  }
  bool operator()(const ThisExpr&, const ThisExpr&) const { return true; }
  bool operator()(const Literal& a, const Literal& b) const {
    return a.value == b.value;
  }
  bool operator()(const MemberAccess& a, const MemberAccess& b) const {
    return are_equivalent(a.name, b.name) && are_equivalent(a.expr, b.expr);
  }
  bool operator()(const ConditionalAccess& a, const ConditionalAccess& b) const {
    return are_equivalent(a.expr, b.expr) &&
           are_equivalent(a.when_not_null, b.when_not_null);
  }
  bool operator()(const MemberBinding& a, const MemberBinding& b) const {
    return are_equivalent(a.name, b.name);
  }
  bool operator()(const Invocation& a, const Invocation& b) const {
    return are_equivalent(a.callee, b.callee) &&
           list_equivalent(a.args, b.args, [](const ExprPtr& x, const ExprPtr& y) {
             return are_equivalent(x, y);
           });
  }
  bool operator()(const Parenthesized& a, const Parenthesized& b) const {
    return are_equivalent(a.expr, b.expr);
  }
  bool operator()(const Unary& a, const Unary& b) const {
    return a.op == b.op && are_equivalent(a.operand, b.operand);
  }
  bool operator()(const Binary& a, const Binary& b) const {
    return a.op == b.op && are_equivalent(a.left, b.left) &&
           are_equivalent(a.right, b.right);
  }
  bool operator()(const IsType& a, const IsType& b) const {
    return are_equivalent(a.type, b.type) && are_equivalent(a.expr, b.expr);
  }
  bool operator()(const IsPattern& a, const IsPattern& b) const {
    return are_equivalent(a.expr, b.expr) && are_equivalent(a.pattern, b.pattern);
  }
  bool operator()(const SwitchExpr& a, const SwitchExpr& b) const {
    return are_equivalent(a.governing, b.governing) &&
           list_equivalent(a.arms, b.arms, arm_equivalent);
  }
  template <typename A, typename B>
  bool operator()(const A&, const B&) const {
    return false;
  }
};

struct PatternEquivalence {
  bool operator()(const VarPattern& a, const VarPattern& b) const {
    return are_equivalent(a.designation, b.designation);
  }
  bool operator()(const DeclarationPattern& a, const DeclarationPattern& b) const {
    return are_equivalent(a.type, b.type) &&
           are_equivalent(a.designation, b.designation);
  }
  bool operator()(const RecursivePattern& a, const RecursivePattern& b) const {
    return optional_equivalent(a.type, b.type,
                               [](const TypeRef& x, const TypeRef& y) {
                                 return are_equivalent(x, y);
                               }) &&
           subpatterns_equivalent(a.positional, b.positional) &&
           subpatterns_equivalent(a.properties, b.properties) &&
           optional_equivalent(a.designation, b.designation,
                               [](const Designation& x, const Designation& y) {
                                 return are_equivalent(x, y);
                               });
  }
  bool operator()(const ConstantPattern& a, const ConstantPattern& b) const {
    return are_equivalent(a.value, b.value);
  }
  bool operator()(const RelationalPattern& a, const RelationalPattern& b) const {
    return a.op == b.op && are_equivalent(a.value, b.value);
  }
  bool operator()(const TypePattern& a, const TypePattern& b) const {
    return are_equivalent(a.type, b.type);
  }
  bool operator()(const NotPattern& a, const NotPattern& b) const {
    return are_equivalent(a.pattern, b.pattern);
  }
  bool operator()(const BinaryPattern& a, const BinaryPattern& b) const {
    return a.op == b.op && are_equivalent(a.left, b.left) &&
           are_equivalent(a.right, b.right);
  }
  bool operator()(const ParenthesizedPattern& a, const ParenthesizedPattern& b) const {
    return are_equivalent(a.pattern, b.pattern);
  }
  bool operator()(const DiscardPattern&, const DiscardPattern&) const { return true; }
  template <typename A, typename B>
  bool operator()(const A&, const B&) const {
    return false;
  }
};

} // namespace

bool are_equivalent(const Identifier& lhs, const Identifier& rhs) {
  return lhs.name == rhs.name;
}

bool are_equivalent(const TypeRef& lhs, const TypeRef& rhs) {
  return lhs.name == rhs.name;
}

bool are_equivalent(const Designation& lhs, const Designation& rhs) {
  return std::visit(
      Overloaded{
          [](const SingleVariable& a, const SingleVariable& b) {
            return are_equivalent(a.name, b.name);
          },
          [](const DiscardDesignation&, const DiscardDesignation&) { return true; },
          [](const ParenthesizedVariables& a, const ParenthesizedVariables& b) {
            return list_equivalent(a.variables, b.variables,
                                   [](const Designation& x, const Designation& y) {
                                     return are_equivalent(x, y);
                                   });
          },
          [](const auto&, const auto&) { return false; }},
      lhs.value, rhs.value);
}

bool are_equivalent(const Expr& lhs, const Expr& rhs) {
  return std::visit(ExprEquivalence{}, lhs.value, rhs.value);
}

bool are_equivalent(const Pattern& lhs, const Pattern& rhs) {
  return std::visit(PatternEquivalence{}, lhs.value, rhs.value);
}

bool are_equivalent(const ExprPtr& lhs, const ExprPtr& rhs) {
  if (!lhs || !rhs) {
    return lhs == rhs;
  }
  return lhs == rhs || are_equivalent(*lhs, *rhs);
}

bool are_equivalent(const PatternPtr& lhs, const PatternPtr& rhs) {
  if (!lhs || !rhs) {
    return lhs == rhs;
  }
  return lhs == rhs || are_equivalent(*lhs, *rhs);
}

} // namespace syntax
