#include "recursive_patterns.hpp"

#include "rewrite/common_receiver.hpp"
#include "rewrite/pattern_merger.hpp"
#include "rewrite/pattern_synthesizer.hpp"
#include "rewrite/term_classifier.hpp"
#include "syntax/editor.hpp"
#include "syntax/equivalence.hpp"
#include "syntax/factory.hpp"
#include "utils/debug_context.hpp"
#include "utils/error.hpp"
#include "utils/helpers.hpp"

namespace rewrite {

namespace {

ReplacementFunction make_replacement(syntax::SyntaxEditor editor) {
    return [editor = std::move(editor)](const syntax::StmtPtr& root) {
        if (!root) {
            error_helper::invariant_violation("applying a rewrite to a null tree");
        }
        return editor.apply(root);
    };
}

// Replaces the `&&` with `replacement`, keeping the operands left of it.
ReplacementFunction replace_logical_and(const syntax::Expr& expr,
                                        const syntax::Binary& logical_and,
                                        syntax::ExprPtr replacement) {
    if (auto prefix = syntax::as_logical_and(*logical_and.left)) {
        replacement = syntax::make::logical_and(prefix->left, std::move(replacement));
    }
    syntax::SyntaxEditor editor;
    editor.replace(expr, syntax::make::annotate(replacement, syntax::kFormatAnnotation));
    return make_replacement(std::move(editor));
}

std::optional<ReplacementFunction> combine_logical_and(const syntax::Expr& expr,
                                                       const semantic::SemanticModel& model) {
    auto guard = debug::push("rewrite", "logical-and");
    const auto* logical_and = syntax::as_logical_and(expr);
    if (!logical_and) {
        error_helper::unexpected_shape("logical-and fragment that is not `&&`", expr.span);
    }

    // Only the operand adjacent to the operator may be consumed. A right-nested
    // `&&` would leave its inner left operand behind.
    if (syntax::as_logical_and(*logical_and->right)) {
        return std::nullopt;
    }
    auto left = classify_term(logical_and->left, model);
    if (!left) {
        return std::nullopt;
    }
    auto right = classify_term(logical_and->right, model);
    if (!right) {
        return std::nullopt;
    }

    // `x is P v && v.A == 1`: fold the right test into P.
    if (auto is_pattern = std::get_if<syntax::IsPattern>(&left->source->value)) {
        if (auto match = find_variable_designation(is_pattern->pattern, right->receiver, model)) {
            auto rewritten = rewrite_containing_pattern(match->containing,
                                                        create_pattern(*right), match->names);
            if (!rewritten) {
                return std::nullopt;
            }
            syntax::SyntaxEditor pattern_edit;
            pattern_edit.replace(*match->containing, *rewritten);
            return replace_logical_and(expr, *logical_and, pattern_edit.apply(left->source));
        }
    }

    auto common = resolve_common_receiver(left->receiver, right->receiver, model);
    if (!common) {
        return std::nullopt;
    }
    auto left_sub = create_subpattern(common->left_names, create_pattern(*left));
    auto right_sub = create_subpattern(common->right_names, create_pattern(*right));
    if (syntax::are_equivalent(*left_sub.name, *right_sub.name)) {
        return std::nullopt;
    }
    auto receiver = common->receiver ? common->receiver : syntax::make::this_expr();
    auto pattern = syntax::make::recursive(std::nullopt, {left_sub, right_sub});
    return replace_logical_and(expr, *logical_and, syntax::make::is_pattern(receiver, pattern));
}

struct GuardRewrite {
    syntax::PatternPtr pattern;
    std::optional<syntax::WhenClause> when;
};

// Moves the leftmost guard operand into the pattern it tests.
std::optional<GuardRewrite> combine_when_clause(const syntax::PatternPtr& pattern,
                                                const syntax::WhenClause& when,
                                                const semantic::SemanticModel& model) {
    if (!pattern) {
        return std::nullopt;
    }
    auto term = classify_term(when.condition, model, TermMode::WHEN_CLAUSE);
    if (!term) {
        return std::nullopt;
    }
    auto match = find_variable_designation(pattern, term->receiver, model);
    if (!match) {
        return std::nullopt;
    }
    auto rewritten = rewrite_containing_pattern(match->containing, create_pattern(*term),
                                                match->names);
    if (!rewritten) {
        return std::nullopt;
    }

    syntax::SyntaxEditor pattern_edit;
    pattern_edit.replace(*match->containing, *rewritten);
    GuardRewrite result{pattern_edit.apply(pattern), std::nullopt};
    if (auto remaining = remove_leftmost_operand(when.condition)) {
        result.when = syntax::WhenClause{*remaining, when.span};
    }
    return result;
}

std::optional<ReplacementFunction> rewrite_case_label(const syntax::CaseLabel& label,
                                                      const semantic::SemanticModel& model) {
    auto guard = debug::push("rewrite", "case-label");
    if (!label.when) {
        return std::nullopt;
    }
    auto combined = combine_when_clause(label.pattern, *label.when, model);
    if (!combined) {
        return std::nullopt;
    }
    syntax::SyntaxEditor editor;
    editor.replace(label, syntax::CaseLabel{combined->pattern, combined->when, label.span});
    return make_replacement(std::move(editor));
}

std::optional<ReplacementFunction> rewrite_switch_arm(const syntax::SwitchArm& arm,
                                                      const semantic::SemanticModel& model) {
    auto guard = debug::push("rewrite", "switch-arm");
    if (!arm.when) {
        return std::nullopt;
    }
    auto combined = combine_when_clause(arm.pattern, *arm.when, model);
    if (!combined) {
        return std::nullopt;
    }
    syntax::SyntaxEditor editor;
    editor.replace(arm, syntax::SwitchArm{combined->pattern, combined->when, arm.result,
                                          arm.span});
    return make_replacement(std::move(editor));
}

} // namespace

std::optional<syntax::ExprPtr> remove_leftmost_operand(const syntax::ExprPtr& condition) {
    const auto* logical_and = syntax::as_logical_and(*condition);
    if (!logical_and) {
        return std::nullopt;
    }
    if (!syntax::as_logical_and(*logical_and->left)) {
        return logical_and->right;
    }
    auto rest = remove_leftmost_operand(logical_and->left);
    if (!rest) {
        error_helper::invariant_violation("nested `&&` without a removable operand",
                                          condition->span);
    }
    return syntax::make::logical_and(*rest, logical_and->right);
}

std::optional<Fragment> fragment_at(const syntax::NodePath& path) {
    if (path.empty()) {
        return std::nullopt;
    }
    return std::visit(
        Overloaded{
            [](const syntax::Expr* expr) -> std::optional<Fragment> {
                if (syntax::as_logical_and(*expr)) {
                    return LogicalAndFragment{expr};
                }
                return std::nullopt;
            },
            [](const syntax::CaseLabel* label) -> std::optional<Fragment> {
                if (label->when) {
                    return CaseLabelFragment{label};
                }
                return std::nullopt;
            },
            [](const syntax::SwitchArm* arm) -> std::optional<Fragment> {
                if (arm->when) {
                    return SwitchArmFragment{arm};
                }
                return std::nullopt;
            },
            [&](const syntax::WhenClause*) -> std::optional<Fragment> {
                if (path.size() < 2) {
                    return std::nullopt;
                }
                const auto& parent = path[path.size() - 2];
                if (auto label = std::get_if<const syntax::CaseLabel*>(&parent)) {
                    return CaseLabelFragment{*label};
                }
                if (auto arm = std::get_if<const syntax::SwitchArm*>(&parent)) {
                    return SwitchArmFragment{*arm};
                }
                return std::nullopt;
            },
            [](const auto*) -> std::optional<Fragment> { return std::nullopt; }},
        path.back());
}

std::optional<ReplacementFunction> try_build_rewrite(const Fragment& fragment,
                                                     const semantic::SemanticModel& model) {
    return std::visit(
        Overloaded{
            [&](const LogicalAndFragment& f) { return combine_logical_and(*f.expr, model); },
            [&](const CaseLabelFragment& f) { return rewrite_case_label(*f.label, model); },
            [&](const SwitchArmFragment& f) { return rewrite_switch_arm(*f.arm, model); }},
        fragment);
}

std::optional<ReplacementFunction> try_build_rewrite(const syntax::StmtPtr& root,
                                                     span::Span selection,
                                                     const semantic::SemanticModel& model) {
    if (!root || !selection.is_empty()) {
        return std::nullopt;
    }
    auto path = syntax::find_node_at(root, selection.start);
    if (!path) {
        return std::nullopt;
    }
    auto fragment = fragment_at(*path);
    if (!fragment) {
        return std::nullopt;
    }
    return try_build_rewrite(*fragment, model);
}

} // namespace rewrite
