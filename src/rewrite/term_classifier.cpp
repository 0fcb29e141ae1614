#include "term_classifier.hpp"

#include "syntax/factory.hpp"
#include "utils/error.hpp"
#include "utils/helpers.hpp"

namespace rewrite {

namespace {

// Folds only when exactly one operand is a constant; a constant on the left
// flips the reading direction.
std::optional<Term> classify_comparison(const syntax::ExprPtr& expr,
                                        const syntax::Binary& comparison,
                                        const semantic::SemanticModel& model) {
    const bool left_constant = model.constant_value(*comparison.left).has_value();
    const bool right_constant = model.constant_value(*comparison.right).has_value();
    if (left_constant == right_constant) {
        return std::nullopt;
    }
    if (left_constant) {
        return Term{comparison.right,
                    ComparisonTarget{comparison.op, comparison.left}, true, expr};
    }
    return Term{comparison.left,
                ComparisonTarget{comparison.op, comparison.right}, false, expr};
}

} // namespace

const syntax::PatternPtr& true_constant_pattern() {
    static const syntax::PatternPtr pattern =
        syntax::make::constant(syntax::make::bool_lit(true));
    return pattern;
}

const syntax::PatternPtr& false_constant_pattern() {
    static const syntax::PatternPtr pattern =
        syntax::make::constant(syntax::make::bool_lit(false));
    return pattern;
}

std::optional<Term> classify_term(const syntax::ExprPtr& expr,
                                  const semantic::SemanticModel& model,
                                  TermMode mode) {
    if (!expr) {
        error_helper::invariant_violation("classifying a null expression");
    }
    return std::visit(
        Overloaded{
            [&](const syntax::Binary& binary) -> std::optional<Term> {
                if (syntax::is_comparison(binary.op)) {
                    return classify_comparison(expr, binary, model);
                }
                if (binary.op == syntax::Binary::LOGICAL_AND) {
                    return classify_term(
                        mode == TermMode::WHEN_CLAUSE ? binary.left : binary.right,
                        model, mode);
                }
                return Term{expr, true_constant_pattern(), false, expr};
            },
            [&](const syntax::IsType& is_type) -> std::optional<Term> {
                return Term{is_type.expr, is_type.type, false, expr};
            },
            [&](const syntax::IsPattern& is_pattern) -> std::optional<Term> {
                return Term{is_pattern.expr, is_pattern.pattern, false, expr};
            },
            [&](const syntax::Unary& unary) -> std::optional<Term> {
                if (unary.op == syntax::Unary::NOT) {
                    return Term{unary.operand, false_constant_pattern(), false, expr};
                }
                return Term{expr, true_constant_pattern(), false, expr};
            },
            [&](const auto&) -> std::optional<Term> {
                return Term{expr, true_constant_pattern(), false, expr};
            }},
        expr->value);
}

} // namespace rewrite
