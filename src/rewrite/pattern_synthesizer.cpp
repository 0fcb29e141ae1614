#include "pattern_synthesizer.hpp"

#include "syntax/factory.hpp"
#include "syntax/pretty_print/pretty_print.hpp"
#include "utils/error.hpp"
#include "utils/helpers.hpp"

namespace rewrite {

namespace {

syntax::RelationalPattern::Op relational_op(syntax::Binary::Op op) {
    switch (op) {
    case syntax::Binary::LT: return syntax::RelationalPattern::LT;
    case syntax::Binary::LE: return syntax::RelationalPattern::LE;
    case syntax::Binary::GT: return syntax::RelationalPattern::GT;
    case syntax::Binary::GE: return syntax::RelationalPattern::GE;
    default:
        error_helper::unexpected_shape(std::string("relational operator ") +
                                       syntax::to_string(op));
    }
}

syntax::PatternPtr comparison_pattern(const ComparisonTarget& target, bool flipped) {
    switch (target.op) {
    case syntax::Binary::EQ:
        return syntax::make::constant(target.constant);
    case syntax::Binary::NE:
        return syntax::make::not_pattern(syntax::make::constant(target.constant));
    case syntax::Binary::LT:
    case syntax::Binary::LE:
    case syntax::Binary::GT:
    case syntax::Binary::GE: {
        auto op = relational_op(target.op);
        return syntax::make::relational(flipped ? flip(op) : op, target.constant);
    }
    default:
        error_helper::unexpected_shape(std::string("comparison operator ") +
                                       syntax::to_string(target.op));
    }
}

} // namespace

syntax::RelationalPattern::Op flip(syntax::RelationalPattern::Op op) {
    switch (op) {
    case syntax::RelationalPattern::LT: return syntax::RelationalPattern::GT;
    case syntax::RelationalPattern::LE: return syntax::RelationalPattern::GE;
    case syntax::RelationalPattern::GT: return syntax::RelationalPattern::LT;
    case syntax::RelationalPattern::GE: return syntax::RelationalPattern::LE;
    }
    error_helper::unexpected_shape("relational pattern operator");
}

syntax::PatternPtr create_pattern(const Term& term) {
    return std::visit(
        Overloaded{
            [&](const ComparisonTarget& target) {
                return comparison_pattern(target, term.flipped);
            },
            [](const syntax::TypeRef& type) {
                return syntax::make::type_pattern(type.name);
            },
            [](const syntax::PatternPtr& pattern) {
                if (!pattern) {
                    error_helper::invariant_violation("term without a pattern");
                }
                return pattern;
            }},
        term.target);
}

syntax::Subpattern create_subpattern(const std::vector<syntax::Identifier>& names,
                                     syntax::PatternPtr pattern) {
    if (names.empty()) {
        error_helper::invariant_violation("subpattern without a member name");
    }
    syntax::Subpattern sub{names.back(), std::move(pattern)};
    for (auto it = names.rbegin() + 1; it != names.rend(); ++it) {
        sub = syntax::Subpattern{*it, syntax::make::recursive(std::nullopt, {sub})};
    }
    return sub;
}

syntax::PatternPtr wrap_in_subpatterns(const std::vector<syntax::Identifier>& names,
                                       syntax::PatternPtr pattern) {
    if (names.empty()) {
        return pattern;
    }
    return syntax::make::recursive(std::nullopt, {create_subpattern(names, std::move(pattern))});
}

} // namespace rewrite
