#pragma once
#include "const.hpp"
#include "syntax/expr.hpp"
#include "utils/helpers.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace semantic::const_eval {

// Looks up a named constant (`Max`, `Color.Red`) by its dotted source name.
using NamedConstantLookup =
    std::function<std::optional<ConstVariant>(const std::string &)>;

namespace detail {

inline std::optional<int64_t> to_int_value(const ConstVariant &value) {
    if (auto int_val = std::get_if<IntConst>(&value)) {
        return int_val->value;
    }
    return std::nullopt;
}

inline bool add_overflows(int64_t lhs, int64_t rhs) {
    if (rhs > 0) {
        return lhs > std::numeric_limits<int64_t>::max() - rhs;
    }
    return lhs < std::numeric_limits<int64_t>::min() - rhs;
}

inline bool sub_overflows(int64_t lhs, int64_t rhs) {
    if (rhs < 0) {
        return lhs > std::numeric_limits<int64_t>::max() + rhs;
    }
    return lhs < std::numeric_limits<int64_t>::min() + rhs;
}

} // namespace detail

/* @brief The dotted source name of an identifier or member-access chain
 * @return `Color.Red` for `Color.Red`, nullopt for anything else
 */
inline std::optional<std::string> qualified_name(const syntax::Expr &expr) {
    if (auto id = std::get_if<syntax::IdentifierName>(&expr.value)) {
        return id->name.name;
    }
    if (auto access = std::get_if<syntax::MemberAccess>(&expr.value)) {
        if (!access->expr) {
            return std::nullopt;
        }
        if (auto prefix = qualified_name(*access->expr)) {
            return *prefix + "." + access->name.name;
        }
    }
    return std::nullopt;
}

inline ConstVariant literal_value(const syntax::Literal &literal) {
    return std::visit(
        [](const auto &value) -> ConstVariant {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, int64_t>) {
                return IntConst{value};
            } else if constexpr (std::is_same_v<T, bool>) {
                return BoolConst{value};
            } else if constexpr (std::is_same_v<T, char>) {
                return CharConst{value};
            } else if constexpr (std::is_same_v<T, std::string>) {
                return StringConst{value};
            } else {
                return NullConst{};
            }
        },
        literal.value);
}

inline std::optional<ConstVariant> eval_unary(syntax::Unary::Op op,
                                              const ConstVariant &operand) {
    switch (op) {
    case syntax::Unary::NEGATE:
        if (auto value = detail::to_int_value(operand)) {
            if (*value == std::numeric_limits<int64_t>::min()) {
                return std::nullopt;
            }
            return ConstVariant{IntConst{-*value}};
        }
        return std::nullopt;
    case syntax::Unary::NOT:
        if (auto bool_val = std::get_if<BoolConst>(&operand)) {
            return ConstVariant{BoolConst{!bool_val->value}};
        }
        return std::nullopt;
    }
    return std::nullopt;
}

inline std::optional<ConstVariant> eval_binary(syntax::Binary::Op op,
                                               const ConstVariant &lhs,
                                               const ConstVariant &rhs) {
    auto lhs_int = detail::to_int_value(lhs);
    auto rhs_int = detail::to_int_value(rhs);
    switch (op) {
    case syntax::Binary::ADD:
        if (lhs_int && rhs_int && !detail::add_overflows(*lhs_int, *rhs_int)) {
            return ConstVariant{IntConst{*lhs_int + *rhs_int}};
        }
        if (auto l = std::get_if<StringConst>(&lhs)) {
            if (auto r = std::get_if<StringConst>(&rhs)) {
                return ConstVariant{StringConst{l->value + r->value}};
            }
        }
        return std::nullopt;
    case syntax::Binary::SUB:
        if (lhs_int && rhs_int && !detail::sub_overflows(*lhs_int, *rhs_int)) {
            return ConstVariant{IntConst{*lhs_int - *rhs_int}};
        }
        return std::nullopt;
    case syntax::Binary::EQ:
        return ConstVariant{BoolConst{lhs == rhs}};
    case syntax::Binary::NE:
        return ConstVariant{BoolConst{lhs != rhs}};
    case syntax::Binary::LT:
    case syntax::Binary::LE:
    case syntax::Binary::GT:
    case syntax::Binary::GE: {
        if (!lhs_int || !rhs_int) {
            return std::nullopt;
        }
        bool result = op == syntax::Binary::LT   ? *lhs_int < *rhs_int
                      : op == syntax::Binary::LE ? *lhs_int <= *rhs_int
                      : op == syntax::Binary::GT ? *lhs_int > *rhs_int
                                                 : *lhs_int >= *rhs_int;
        return ConstVariant{BoolConst{result}};
    }
    case syntax::Binary::LOGICAL_AND:
    case syntax::Binary::LOGICAL_OR: {
        auto l = std::get_if<BoolConst>(&lhs);
        auto r = std::get_if<BoolConst>(&rhs);
        if (!l || !r) {
            return std::nullopt;
        }
        bool result = op == syntax::Binary::LOGICAL_AND ? (l->value && r->value)
                                                        : (l->value || r->value);
        return ConstVariant{BoolConst{result}};
    }
    }
    return std::nullopt;
}

/**
 * @brief Fold an expression to a compile-time value
 *
 * Literals, parentheses, `-`/`!`, arithmetic and comparisons over constants
 * fold; identifiers and member-access chains fold only when `lookup` knows
 * them. Everything else (invocations, `is`, conditional access) is not constant.
 */
inline std::optional<ConstVariant> evaluate(const syntax::Expr &expr,
                                            const NamedConstantLookup &lookup) {
    return std::visit(
        Overloaded{
            [](const syntax::Literal &literal) -> std::optional<ConstVariant> {
                return literal_value(literal);
            },
            [&](const syntax::Parenthesized &paren) -> std::optional<ConstVariant> {
                return evaluate(*paren.expr, lookup);
            },
            [&](const syntax::Unary &unary) -> std::optional<ConstVariant> {
                auto operand = evaluate(*unary.operand, lookup);
                if (!operand) {
                    return std::nullopt;
                }
                return eval_unary(unary.op, *operand);
            },
            [&](const syntax::Binary &binary) -> std::optional<ConstVariant> {
                auto lhs = evaluate(*binary.left, lookup);
                if (!lhs) {
                    return std::nullopt;
                }
                auto rhs = evaluate(*binary.right, lookup);
                if (!rhs) {
                    return std::nullopt;
                }
                return eval_binary(binary.op, *lhs, *rhs);
            },
            [&](const syntax::IdentifierName &) -> std::optional<ConstVariant> {
                auto name = qualified_name(expr);
                return name && lookup ? lookup(*name) : std::nullopt;
            },
            [&](const syntax::MemberAccess &) -> std::optional<ConstVariant> {
                auto name = qualified_name(expr);
                return name && lookup ? lookup(*name) : std::nullopt;
            },
            [](const auto &) -> std::optional<ConstVariant> {
                return std::nullopt;
            }},
        expr.value);
}

} // namespace semantic::const_eval
